#pragma once

#include "astro_compute/core/types.hpp"
#include "astro_compute/image/stats.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace astro_compute::tonemap {

constexpr float kDataRangeFloor = 1e-20f;
constexpr float kClipRangeFloor = 1e-10f;

// Clamp to [0,1]; NaN maps to 0
inline float clamp01(float x) {
    return std::fmin(std::fmax(x, 0.0f), 1.0f);
}

// Midtones transfer function. mtf(x, 0.5) == x.
inline float mtf(float x, float m) {
    if (x <= 0.0f) return 0.0f;
    if (x >= 1.0f) return 1.0f;
    return (m - 1.0f) * x / ((2.0f * m - 1.0f) * x - m);
}

inline uint32_t pack_gray(uint32_t byte) {
    return byte | (byte << 8) | (byte << 16) | (255u << 24);
}

// Display byte for one raw sample. Single-precision throughout so the result
// matches the device kernel in kernel_sources.cpp.
inline uint32_t tone_map_byte(float v, const ToneMapParams& p) {
    if (std::isnan(v)) return 0u;

    const float range = std::fmax(p.data_max - p.data_min, kDataRangeFloor);
    const float norm = clamp01((v - p.data_min) / range);
    const float clip_range = std::fmax(p.highlight - p.shadow, kClipRangeFloor);
    const float clipped = clamp01((norm - p.shadow) / clip_range);
    const float scaled = std::fmin(std::fmax(mtf(clipped, p.midtone) * 255.0f, 0.0f), 255.0f);
    return static_cast<uint32_t>(std::round(scaled));
}

inline uint32_t tone_map_pixel(float v, const ToneMapParams& p) {
    return pack_gray(tone_map_byte(v, p));
}

// Writes out[i] for i in [begin, end)
void tone_map_span(const float* pixels, uint32_t* out, size_t begin, size_t end,
                   const ToneMapParams& params);

ToneMapParams make_tone_map_params(uint32_t width, uint32_t height,
                                   float data_min, float data_max,
                                   const StfParams& stf);

struct AutoStfConfig {
    double target_background = 0.25;
    double shadow_k = -2.8;
};

// Midtone m such that mtf(m_in, m) == target
double mtf_balance(double m_in, double target);

// Shadow / midtone / highlight that bring the image median to the target
// background level. Defaults when the image has no valid pixels.
StfParams auto_stf(const image::ImageStats& stats, const AutoStfConfig& config);

} // namespace astro_compute::tonemap
