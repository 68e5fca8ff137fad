#pragma once

#include "astro_compute/core/types.hpp"

#include <cmath>
#include <cstddef>
#include <vector>

namespace astro_compute::registration {

// Largest accepted search radius; keeps search_size^2 within device limits
constexpr int kMaxSearchRadius = 1024;

// Sample predicate shared by reference and shifted target samples
inline bool is_valid_sample(float v) {
    return std::isfinite(v) && std::fabs(v) <= kMaxFiniteSample && v > kPaddingThreshold;
}

/**
 * Build and validate the kernel parameter block for one correlation search.
 * Throws ValidationError for an empty ROI, an ROI outside the reference,
 * empty images or max_shift outside [0, kMaxSearchRadius].
 */
CorrelationParams make_correlation_params(uint32_t ref_width, uint32_t ref_height,
                                          uint32_t tgt_width, uint32_t tgt_height,
                                          const Roi& roi, int max_shift);

// Square ROI centred on the image, half-size max(min(w,h)/4, 1)
Roi centered_roi(uint32_t width, uint32_t height);

// Phase 1 for a single candidate shift
ShiftScore score_shift(const float* ref, const float* tgt,
                       const CorrelationParams& params, int dx, int dy);

// True when candidate must replace incumbent during the arg-max scan.
// Valid scores beat any rejected score; equal ranks keep the incumbent.
inline bool outranks(const ShiftScore& candidate, const ShiftScore& incumbent) {
    if (!candidate.usable()) return false;
    if (!incumbent.usable()) return true;
    return candidate.value > incumbent.value;
}

// Phase 2: linear scan, earliest index wins ties. Grid must be non-empty.
size_t select_best_index(const std::vector<ShiftScore>& grid);

inline int index_to_dx(size_t idx, const CorrelationParams& p) {
    return static_cast<int>(idx % p.search_size) - p.max_shift;
}

inline int index_to_dy(size_t idx, const CorrelationParams& p) {
    return static_cast<int>(idx / p.search_size) - p.max_shift;
}

inline size_t shift_to_index(int dx, int dy, const CorrelationParams& p) {
    return static_cast<size_t>(dy + p.max_shift) * p.search_size +
           static_cast<size_t>(dx + p.max_shift);
}

OffsetMatch match_from_grid(const std::vector<ShiftScore>& grid, const CorrelationParams& params);

// Both phases on the calling thread
OffsetMatch find_offset_sequential(const float* ref, const float* tgt,
                                   const CorrelationParams& params);

} // namespace astro_compute::registration
