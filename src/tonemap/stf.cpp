#include "astro_compute/tonemap/stf.hpp"

#include <algorithm>

namespace astro_compute::tonemap {

void tone_map_span(const float* pixels, uint32_t* out, size_t begin, size_t end,
                   const ToneMapParams& params) {
    for (size_t i = begin; i < end; ++i) {
        out[i] = tone_map_pixel(pixels[i], params);
    }
}

ToneMapParams make_tone_map_params(uint32_t width, uint32_t height,
                                   float data_min, float data_max,
                                   const StfParams& stf) {
    ToneMapParams p;
    p.width = width;
    p.height = height;
    p.data_min = data_min;
    p.data_max = data_max;
    p.shadow = stf.shadow;
    p.midtone = stf.midtone;
    p.highlight = stf.highlight;
    p.pad = 0.0f;
    return p;
}

double mtf_balance(double m_in, double target) {
    const double denom = 2.0 * target * m_in - target - m_in;
    if (std::fabs(denom) < 1e-15) {
        return 0.5;
    }
    const double b = (m_in * (target - 1.0)) / denom;
    return std::clamp(b, 0.0001, 0.9999);
}

StfParams auto_stf(const image::ImageStats& stats, const AutoStfConfig& config) {
    if (stats.valid_count == 0) {
        return StfParams{};
    }

    const double range = std::max(stats.max - stats.min, 1e-30);
    const double median_norm = (stats.median - stats.min) / range;
    const double sigma_norm = stats.sigma / range;

    const double shadow = std::max(median_norm + config.shadow_k * sigma_norm, 0.0);
    const double highlight = 1.0;

    const double clip_range = std::max(highlight - shadow, 1e-15);
    const double m_clipped = std::clamp((median_norm - shadow) / clip_range, 0.0, 1.0);

    double midtone = 0.5;
    if (m_clipped > 0.0 && m_clipped < 1.0) {
        midtone = mtf_balance(m_clipped, config.target_background);
    }

    StfParams out;
    out.shadow = static_cast<float>(shadow);
    out.midtone = static_cast<float>(midtone);
    out.highlight = static_cast<float>(highlight);
    return out;
}

} // namespace astro_compute::tonemap
