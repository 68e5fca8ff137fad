#pragma once

#include "astro_compute/compute/backend.hpp"

namespace astro_compute::compute {

// Host implementation of both kernels. Tone mapping is split into row
// chunks; correlation Phase 1 hands one candidate shift at a time to each
// worker thread and Phase 2 runs after all workers have joined.
class CpuBackend : public ComputeBackend {
public:
    // workers <= 0 selects std::thread::hardware_concurrency()
    explicit CpuBackend(int workers = 0);

    std::string name() const override { return "cpu"; }
    std::string device_description() const override;

    PackedImage tone_map(const float* pixels, const ToneMapParams& params) override;

    OffsetMatch find_offset(const float* ref, const float* tgt,
                            const CorrelationParams& params) override;

    int workers() const { return workers_; }

private:
    int workers_;
};

} // namespace astro_compute::compute
