#pragma once

#include "astro_compute/compute/backend.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace astro_compute::compute {

struct OpenClOptions {
    int platform_index = -1;   // -1 = scan all platforms
    bool gpu_only = true;      // false accepts any device type
    size_t workgroup_size = 256;
};

/**
 * OpenCL device backend. The constructor selects a device, creates the
 * context and in-order queue and builds both programs; any failure throws
 * DeviceError. Dispatch failures after construction throw DispatchError.
 *
 * Every dispatch allocates its buffers, waits on a blocking readback and
 * releases the buffers before returning.
 */
class OpenClBackend : public ComputeBackend {
public:
    explicit OpenClBackend(const OpenClOptions& options);
    ~OpenClBackend() override;

    OpenClBackend(const OpenClBackend&) = delete;
    OpenClBackend& operator=(const OpenClBackend&) = delete;

    std::string name() const override { return "opencl"; }
    std::string device_description() const override;

    PackedImage tone_map(const float* pixels, const ToneMapParams& params) override;

    OffsetMatch find_offset(const float* ref, const float* tgt,
                            const CorrelationParams& params) override;

    size_t workgroup_size() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace astro_compute::compute
