#pragma once

#include "astro_compute/core/types.hpp"

#include <string>

namespace astro_compute::compute {

/**
 * One execution strategy for the two kernels. Implementations receive
 * requests already validated by ComputeDispatcher: pixel pointers cover
 * width*height samples and correlation parameters satisfy
 * make_correlation_params().
 */
class ComputeBackend {
public:
    virtual ~ComputeBackend() = default;

    virtual std::string name() const = 0;
    virtual std::string device_description() const = 0;

    virtual PackedImage tone_map(const float* pixels, const ToneMapParams& params) = 0;

    virtual OffsetMatch find_offset(const float* ref, const float* tgt,
                                    const CorrelationParams& params) = 0;
};

} // namespace astro_compute::compute
