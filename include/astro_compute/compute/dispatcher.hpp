#pragma once

#include "astro_compute/compute/backend.hpp"
#include "astro_compute/config/configuration.hpp"
#include "astro_compute/core/events.hpp"
#include "astro_compute/core/types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace astro_compute::compute {

class CpuBackend;

using BackendFactory = std::function<std::unique_ptr<ComputeBackend>()>;

// Device backend requested by cfg.compute, or an empty factory for "cpu"
BackendFactory default_device_factory(const config::Config& cfg);

// True when this build contains the OpenCL backend
bool opencl_compiled();

/**
 * Single integration point for both kernels.
 *
 * The device factory runs exactly once, in the constructor. If it is empty,
 * returns nullptr or throws, the instance uses the CPU backend for its whole
 * lifetime. A device dispatch that fails later throws DispatchError to the
 * caller and also switches the instance to the CPU backend; the failed call
 * is not retried.
 *
 * cfg is validated on construction (ValidationError).
 *
 * When `log` is non-null and cfg.logging.events is set, JSON-lines events
 * are written to it.
 */
class ComputeDispatcher {
public:
    explicit ComputeDispatcher(const config::Config& cfg, std::ostream* log = nullptr);
    ComputeDispatcher(const config::Config& cfg, BackendFactory device_factory,
                      std::ostream* log = nullptr);
    ~ComputeDispatcher();

    ComputeDispatcher(const ComputeDispatcher&) = delete;
    ComputeDispatcher& operator=(const ComputeDispatcher&) = delete;

    bool using_fallback() const;
    std::string backend_name() const;
    std::string device_description() const;
    std::string fallback_reason() const;
    const std::string& session_id() const { return session_id_; }
    const config::Config& config() const { return cfg_; }

    // params.width/height must match pixels.cols()/rows()
    PackedImage tone_map(const Matrix2Df& pixels, const ToneMapParams& params);
    PackedImage tone_map(const Matrix2Df& pixels, float data_min, float data_max,
                         const StfParams& stf);

    OffsetMatch find_offset(const Matrix2Df& ref, const Matrix2Df& tgt,
                            const Roi& roi, int max_shift);

private:
    void fall_back(const std::string& from_backend, const std::string& reason);
    bool events_enabled() const { return log_ != nullptr && cfg_.logging.events; }

    template <typename Fn>
    void log_event(Fn&& fn);

    template <typename Result, typename Call>
    Result run(const std::string& kernel, const core::json& details, Call&& call);

    config::Config cfg_;
    std::ostream* log_;
    core::EventEmitter events_;
    std::string session_id_;

    // device_ stays alive until destruction; device_active_ gates its use
    std::unique_ptr<ComputeBackend> device_;
    std::unique_ptr<CpuBackend> cpu_;
    bool device_active_ = false;
    std::string fallback_reason_;
    mutable std::mutex mutex_;
    std::mutex log_mutex_;
};

} // namespace astro_compute::compute
