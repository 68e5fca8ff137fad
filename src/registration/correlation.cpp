#include "astro_compute/registration/correlation.hpp"
#include "astro_compute/core/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

namespace astro_compute::registration {

CorrelationParams make_correlation_params(uint32_t ref_width, uint32_t ref_height,
                                          uint32_t tgt_width, uint32_t tgt_height,
                                          const Roi& roi, int max_shift) {
    if (ref_width == 0 || ref_height == 0 || tgt_width == 0 || tgt_height == 0) {
        throw ValidationError("correlation images must not be empty");
    }
    if (max_shift < 0 || max_shift > kMaxSearchRadius) {
        throw ValidationError("max_shift must be in [0, " + std::to_string(kMaxSearchRadius) +
                              "], got " + std::to_string(max_shift));
    }
    if (roi.w == 0 || roi.h == 0) {
        throw ValidationError("correlation ROI must not be empty");
    }
    if (roi.x >= ref_width || roi.y >= ref_height ||
        roi.w > ref_width - roi.x || roi.h > ref_height - roi.y) {
        throw ValidationError("correlation ROI " + std::to_string(roi.x) + "," +
                              std::to_string(roi.y) + "+" + std::to_string(roi.w) + "x" +
                              std::to_string(roi.h) + " exceeds reference " +
                              std::to_string(ref_width) + "x" + std::to_string(ref_height));
    }
    // Kernels index the ROI with 32-bit linear offsets
    if (static_cast<uint64_t>(roi.w) * roi.h > std::numeric_limits<uint32_t>::max()) {
        throw ValidationError("correlation ROI " + std::to_string(roi.w) + "x" +
                              std::to_string(roi.h) + " holds more than 2^32-1 pixels");
    }

    CorrelationParams p;
    p.ref_width = ref_width;
    p.ref_height = ref_height;
    p.tgt_width = tgt_width;
    p.tgt_height = tgt_height;
    p.roi_x = roi.x;
    p.roi_y = roi.y;
    p.roi_w = roi.w;
    p.roi_h = roi.h;
    p.max_shift = max_shift;
    p.search_size = static_cast<uint32_t>(2 * max_shift + 1);
    return p;
}

Roi centered_roi(uint32_t width, uint32_t height) {
    const uint32_t cy = height / 2;
    const uint32_t cx = width / 2;
    const uint32_t region = std::max<uint32_t>(std::min(width, height) / 4, 1);

    const uint32_t y_start = cy > region ? cy - region : 0;
    const uint32_t y_end = std::min(cy + region, height);
    const uint32_t x_start = cx > region ? cx - region : 0;
    const uint32_t x_end = std::min(cx + region, width);

    Roi roi;
    roi.x = x_start;
    roi.y = y_start;
    roi.w = x_end - x_start;
    roi.h = y_end - y_start;
    return roi;
}

namespace {

inline float target_sample(const float* tgt, const CorrelationParams& p, int64_t tx, int64_t ty) {
    if (tx < 0 || ty < 0 || tx >= static_cast<int64_t>(p.tgt_width) ||
        ty >= static_cast<int64_t>(p.tgt_height)) {
        return 0.0f;
    }
    return tgt[static_cast<size_t>(ty) * p.tgt_width + static_cast<size_t>(tx)];
}

} // namespace

ShiftScore score_shift(const float* ref, const float* tgt,
                       const CorrelationParams& p, int dx, int dy) {
    double r_sum = 0.0;
    double t_sum = 0.0;
    uint64_t count = 0;

    for (uint32_t y = 0; y < p.roi_h; ++y) {
        const size_t ry = p.roi_y + y;
        const int64_t ty = static_cast<int64_t>(ry) + dy;
        for (uint32_t x = 0; x < p.roi_w; ++x) {
            const size_t rx = p.roi_x + x;
            const float rv = ref[ry * p.ref_width + rx];
            const float tv = target_sample(tgt, p, static_cast<int64_t>(rx) + dx, ty);
            if (is_valid_sample(rv) && is_valid_sample(tv)) {
                r_sum += rv;
                t_sum += tv;
                ++count;
            }
        }
    }

    if (count < kMinValidPairs) {
        return ShiftScore::rejected(ScoreStatus::INSUFFICIENT_DATA);
    }

    const double r_mean = r_sum / static_cast<double>(count);
    const double t_mean = t_sum / static_cast<double>(count);

    double cov = 0.0;
    double r_var = 0.0;
    double t_var = 0.0;
    for (uint32_t y = 0; y < p.roi_h; ++y) {
        const size_t ry = p.roi_y + y;
        const int64_t ty = static_cast<int64_t>(ry) + dy;
        for (uint32_t x = 0; x < p.roi_w; ++x) {
            const size_t rx = p.roi_x + x;
            const float rv = ref[ry * p.ref_width + rx];
            const float tv = target_sample(tgt, p, static_cast<int64_t>(rx) + dx, ty);
            if (is_valid_sample(rv) && is_valid_sample(tv)) {
                const double rd = rv - r_mean;
                const double td = tv - t_mean;
                cov += rd * td;
                r_var += rd * rd;
                t_var += td * td;
            }
        }
    }

    const double denom = std::sqrt(r_var * t_var);
    if (!(denom > kMinCorrelationDenominator) || !std::isfinite(denom)) {
        return ShiftScore::rejected(ScoreStatus::DEGENERATE_VARIANCE);
    }

    const double score = std::clamp(cov / denom, -1.0, 1.0);
    return ShiftScore::valid(static_cast<float>(score));
}

size_t select_best_index(const std::vector<ShiftScore>& grid) {
    size_t best = 0;
    for (size_t i = 1; i < grid.size(); ++i) {
        if (outranks(grid[i], grid[best])) {
            best = i;
        }
    }
    return best;
}

OffsetMatch match_from_grid(const std::vector<ShiftScore>& grid, const CorrelationParams& params) {
    if (grid.size() != params.candidate_count()) {
        throw ValidationError("score grid holds " + std::to_string(grid.size()) +
                              " entries, expected " + std::to_string(params.candidate_count()));
    }
    const size_t idx = select_best_index(grid);
    OffsetMatch m;
    m.dx = index_to_dx(idx, params);
    m.dy = index_to_dy(idx, params);
    m.score = grid[idx];
    return m;
}

OffsetMatch find_offset_sequential(const float* ref, const float* tgt,
                                   const CorrelationParams& params) {
    std::vector<ShiftScore> grid(params.candidate_count());
    for (size_t idx = 0; idx < grid.size(); ++idx) {
        grid[idx] = score_shift(ref, tgt, params, index_to_dx(idx, params), index_to_dy(idx, params));
    }
    return match_from_grid(grid, params);
}

} // namespace astro_compute::registration
