#pragma once

#include "astro_compute/config/configuration.hpp"
#include "astro_compute/core/types.hpp"

namespace astro_compute::compute {
class ComputeDispatcher;
}

namespace astro_compute::registration {

// out(x, y) = img(x - dx, y - dy); pixels shifted in from outside are 0
Matrix2Df shift_image(const Matrix2Df& img, int dx, int dy);

// 2x2 box average, floor(w/2) x floor(h/2)
Matrix2Df downsample_2x(const Matrix2Df& img);

/**
 * Coarse-to-fine integer offset of tgt relative to ref.
 *
 * With cfg.pyramid.enabled the search runs at 1/4, 1/2 and full resolution.
 * Each level searches its own radius around twice the previous estimate,
 * using the centred ROI of that level. Levels too small to hold a ROI are
 * skipped. A level without any usable score keeps the incoming estimate.
 * Without the pyramid a single full-resolution search with cfg.max_shift
 * is made.
 *
 * The returned score is the final level's score.
 */
OffsetMatch find_offset_pyramid(compute::ComputeDispatcher& dispatcher,
                                const Matrix2Df& ref, const Matrix2Df& tgt,
                                const config::CorrelationConfig& cfg);

struct AlignmentResult {
    OffsetMatch offset;
    Matrix2Df aligned; // target resampled onto the reference grid
};

AlignmentResult align_to_reference(compute::ComputeDispatcher& dispatcher,
                                   const Matrix2Df& ref, const Matrix2Df& tgt,
                                   const config::CorrelationConfig& cfg);

} // namespace astro_compute::registration
