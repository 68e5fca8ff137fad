#pragma once

#include "astro_compute/core/types.hpp"

#include <cmath>
#include <cstdint>

namespace astro_compute::image {

// Sample usable for statistics and display: finite and above the padding level
inline bool is_valid_pixel(float v) {
    return std::isfinite(v) && v > kPaddingThreshold;
}

// Statistics over valid pixels only. All fields are zero when valid_count == 0.
struct ImageStats {
    double min = 0.0;
    double max = 0.0;
    double median = 0.0;
    double mad = 0.0;
    double sigma = 0.0;  // 1.4826 * MAD, floored at 1e-30
    double mean = 0.0;
    uint64_t valid_count = 0;
};

ImageStats compute_image_stats(const Matrix2Df& data);

} // namespace astro_compute::image
