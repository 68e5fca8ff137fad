#include "astro_compute/compute/dispatcher.hpp"
#include "astro_compute/compute/cpu_backend.hpp"
#include "astro_compute/core/errors.hpp"
#include "astro_compute/core/utils.hpp"
#include "astro_compute/registration/correlation.hpp"
#include "astro_compute/tonemap/stf.hpp"

#ifdef ASTRO_COMPUTE_HAVE_OPENCL
#include "astro_compute/compute/opencl_backend.hpp"
#endif

#include <chrono>
#include <iostream>

namespace astro_compute::compute {

bool opencl_compiled() {
#ifdef ASTRO_COMPUTE_HAVE_OPENCL
    return true;
#else
    return false;
#endif
}

BackendFactory default_device_factory(const config::Config& cfg) {
    if (cfg.compute.backend == "cpu") {
        return {};
    }
#ifdef ASTRO_COMPUTE_HAVE_OPENCL
    OpenClOptions options;
    options.platform_index = cfg.compute.opencl.platform_index;
    options.gpu_only = cfg.compute.opencl.device_type == "gpu";
    options.workgroup_size = static_cast<size_t>(cfg.compute.opencl.workgroup_size);
    return [options]() -> std::unique_ptr<ComputeBackend> {
        return std::make_unique<OpenClBackend>(options);
    };
#else
    return []() -> std::unique_ptr<ComputeBackend> {
        throw DeviceError("built without OpenCL support");
    };
#endif
}

namespace {

const config::Config& validated(const config::Config& cfg) {
    cfg.validate();
    return cfg;
}

} // namespace

template <typename Fn>
void ComputeDispatcher::log_event(Fn&& fn) {
    if (!events_enabled()) return;
    std::lock_guard<std::mutex> lock(log_mutex_);
    fn();
}

ComputeDispatcher::ComputeDispatcher(const config::Config& cfg, std::ostream* log)
    : ComputeDispatcher(cfg, default_device_factory(cfg), log) {}

ComputeDispatcher::ComputeDispatcher(const config::Config& cfg, BackendFactory device_factory,
                                     std::ostream* log)
    : cfg_(validated(cfg)),
      log_(log),
      session_id_(core::get_session_id()),
      cpu_(std::make_unique<CpuBackend>(cfg.compute.cpu.workers)) {
    std::string reason;
    if (!device_factory) {
        reason = "device backend disabled (compute.backend=cpu)";
    } else {
        // Device probe: runs once per dispatcher, any failure is final
        try {
            device_ = device_factory();
            if (!device_) {
                reason = "device factory returned no backend";
            }
        } catch (const std::exception& e) {
            reason = e.what();
        }
    }

    if (device_) {
        device_active_ = true;
        log_event([&]() {
            events_.backend_selected(session_id_, device_->name(), device_->device_description(),
                                     *log_);
        });
        return;
    }

    fallback_reason_ = reason;
    if (device_factory) {
        std::cerr << "[COMPUTE] Device unavailable, using CPU backend: " << reason << std::endl;
        log_event([&]() {
            events_.backend_fallback(session_id_, cfg_.compute.backend, reason, *log_);
        });
    }
    log_event([&]() {
        events_.backend_selected(session_id_, cpu_->name(), cpu_->device_description(), *log_);
    });
}

ComputeDispatcher::~ComputeDispatcher() = default;

bool ComputeDispatcher::using_fallback() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !device_active_;
}

std::string ComputeDispatcher::backend_name() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_active_ ? device_->name() : cpu_->name();
}

std::string ComputeDispatcher::device_description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_active_ ? device_->device_description() : cpu_->device_description();
}

std::string ComputeDispatcher::fallback_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fallback_reason_;
}

void ComputeDispatcher::fall_back(const std::string& from_backend, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!device_active_) return;
        device_active_ = false;
        fallback_reason_ = reason;
    }
    std::cerr << "[COMPUTE] " << from_backend << " backend disabled, using CPU: " << reason
              << std::endl;
    log_event([&]() { events_.backend_fallback(session_id_, from_backend, reason, *log_); });
}

template <typename Result, typename Call>
Result ComputeDispatcher::run(const std::string& kernel, const core::json& details, Call&& call) {
    ComputeBackend* backend = nullptr;
    bool on_device = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_device = device_active_;
        backend = on_device ? device_.get() : static_cast<ComputeBackend*>(cpu_.get());
    }
    const std::string backend_name = backend->name();

    log_event([&]() { events_.dispatch_start(session_id_, kernel, backend_name, details, *log_); });
    const auto t0 = std::chrono::steady_clock::now();

    Result result;
    if (!on_device) {
        result = call(*backend);
    } else {
        try {
            result = call(*backend);
        } catch (const std::exception& e) {
            fall_back(backend_name, kernel + " dispatch failed: " + e.what());
            log_event([&]() { events_.error(session_id_, e.what(), *log_); });
            if (dynamic_cast<const DispatchError*>(&e) != nullptr) {
                throw;
            }
            throw DispatchError(kernel + ": " + e.what());
        }
    }

    const double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - t0).count();
    log_event([&]() {
        events_.dispatch_end(session_id_, kernel, backend_name, elapsed_ms, core::json::object(),
                             *log_);
    });
    return result;
}

PackedImage ComputeDispatcher::tone_map(const Matrix2Df& pixels, const ToneMapParams& params) {
    if (params.width != static_cast<uint32_t>(pixels.cols()) ||
        params.height != static_cast<uint32_t>(pixels.rows())) {
        throw ValidationError("tone map params describe " + std::to_string(params.width) + "x" +
                              std::to_string(params.height) + " but buffer is " +
                              std::to_string(pixels.cols()) + "x" + std::to_string(pixels.rows()));
    }
    if (pixels.size() == 0) {
        return {};
    }

    ToneMapParams p = params;
    p.pad = 0.0f;
    const core::json details = {
        {"width", p.width}, {"height", p.height},
        {"shadow", p.shadow}, {"midtone", p.midtone}, {"highlight", p.highlight}
    };
    return run<PackedImage>("tone_map", details, [&](ComputeBackend& b) {
        return b.tone_map(pixels.data(), p);
    });
}

PackedImage ComputeDispatcher::tone_map(const Matrix2Df& pixels, float data_min, float data_max,
                                        const StfParams& stf) {
    const ToneMapParams p = tonemap::make_tone_map_params(
        static_cast<uint32_t>(pixels.cols()), static_cast<uint32_t>(pixels.rows()),
        data_min, data_max, stf);
    return tone_map(pixels, p);
}

OffsetMatch ComputeDispatcher::find_offset(const Matrix2Df& ref, const Matrix2Df& tgt,
                                           const Roi& roi, int max_shift) {
    const CorrelationParams p = registration::make_correlation_params(
        static_cast<uint32_t>(ref.cols()), static_cast<uint32_t>(ref.rows()),
        static_cast<uint32_t>(tgt.cols()), static_cast<uint32_t>(tgt.rows()),
        roi, max_shift);

    const core::json details = {
        {"roi", {p.roi_x, p.roi_y, p.roi_w, p.roi_h}},
        {"max_shift", p.max_shift},
        {"candidates", p.candidate_count()}
    };
    OffsetMatch match = run<OffsetMatch>("correlation", details, [&](ComputeBackend& b) {
        return b.find_offset(ref.data(), tgt.data(), p);
    });
    if (!match.has_match()) {
        log_event([&]() {
            events_.warning(session_id_,
                            "no usable correlation score in search window (" +
                                score_status_to_string(match.score.status) + ")",
                            *log_);
        });
    }
    return match;
}

} // namespace astro_compute::compute
