#include "astro_compute/compute/opencl_backend.hpp"
#include "astro_compute/compute/kernel_sources.hpp"
#include "astro_compute/core/errors.hpp"
#include "astro_compute/registration/correlation.hpp"

#ifdef __APPLE__
#include <OpenCL/opencl.h>
#else
#include <CL/cl.h>
#endif

#include <cstring>
#include <iostream>
#include <mutex>
#include <type_traits>
#include <vector>

namespace astro_compute::compute {

namespace {

struct ClReleaser {
    void operator()(cl_context c) const { if (c) clReleaseContext(c); }
    void operator()(cl_command_queue q) const { if (q) clReleaseCommandQueue(q); }
    void operator()(cl_program p) const { if (p) clReleaseProgram(p); }
    void operator()(cl_kernel k) const { if (k) clReleaseKernel(k); }
    void operator()(cl_mem m) const { if (m) clReleaseMemObject(m); }
};

template <typename Handle>
using ClPtr = std::unique_ptr<std::remove_pointer_t<Handle>, ClReleaser>;

void check_device(cl_int err, const std::string& what) {
    if (err != CL_SUCCESS) {
        throw DeviceError(what, err);
    }
}

void check_dispatch(cl_int err, const std::string& what) {
    if (err != CL_SUCCESS) {
        throw DispatchError(what + " (OpenCL error " + std::to_string(err) + ")");
    }
}

std::string device_string(cl_device_id device, cl_device_info param) {
    size_t size = 0;
    if (clGetDeviceInfo(device, param, 0, nullptr, &size) != CL_SUCCESS || size == 0) {
        return "";
    }
    std::string value(size, '\0');
    if (clGetDeviceInfo(device, param, size, &value[0], nullptr) != CL_SUCCESS) {
        return "";
    }
    while (!value.empty() && value.back() == '\0') value.pop_back();
    return value;
}

cl_device_id select_device(const OpenClOptions& options, cl_platform_id& platform_out) {
    cl_uint num_platforms = 0;
    cl_int err = clGetPlatformIDs(0, nullptr, &num_platforms);
    if (err != CL_SUCCESS || num_platforms == 0) {
        throw DeviceError("no OpenCL platform available", err);
    }

    std::vector<cl_platform_id> platforms(num_platforms);
    check_device(clGetPlatformIDs(num_platforms, platforms.data(), nullptr),
                 "failed to enumerate OpenCL platforms");

    size_t first = 0;
    size_t last = platforms.size();
    if (options.platform_index >= 0) {
        if (static_cast<size_t>(options.platform_index) >= platforms.size()) {
            throw DeviceError("OpenCL platform index " + std::to_string(options.platform_index) +
                              " out of range (" + std::to_string(platforms.size()) + " platforms)");
        }
        first = static_cast<size_t>(options.platform_index);
        last = first + 1;
    }

    const cl_device_type type = options.gpu_only ? CL_DEVICE_TYPE_GPU : CL_DEVICE_TYPE_ALL;
    for (size_t i = first; i < last; ++i) {
        cl_device_id device = nullptr;
        cl_uint num_devices = 0;
        err = clGetDeviceIDs(platforms[i], type, 1, &device, &num_devices);
        if (err == CL_SUCCESS && num_devices > 0 && device != nullptr) {
            platform_out = platforms[i];
            return device;
        }
    }
    throw DeviceError(options.gpu_only ? "no OpenCL GPU device found" : "no OpenCL device found");
}

ClPtr<cl_program> build_program(cl_context context, cl_device_id device,
                                const char* source, const std::string& build_options,
                                const std::string& label) {
    cl_int err = CL_SUCCESS;
    const size_t length = std::strlen(source);
    ClPtr<cl_program> program(clCreateProgramWithSource(context, 1, &source, &length, &err));
    check_device(err, "failed to create " + label + " program");

    err = clBuildProgram(program.get(), 1, &device, build_options.c_str(), nullptr, nullptr);
    if (err != CL_SUCCESS) {
        size_t log_size = 0;
        clGetProgramBuildInfo(program.get(), device, CL_PROGRAM_BUILD_LOG, 0, nullptr, &log_size);
        std::string log(log_size, '\0');
        if (log_size > 0) {
            clGetProgramBuildInfo(program.get(), device, CL_PROGRAM_BUILD_LOG, log_size,
                                  &log[0], nullptr);
        }
        std::cerr << "[OpenCL] " << label << " build log:\n" << log << std::endl;
        throw DeviceError("failed to build " + label + " program", err);
    }
    return program;
}

ClPtr<cl_kernel> create_kernel(cl_program program, const char* name) {
    cl_int err = CL_SUCCESS;
    ClPtr<cl_kernel> kernel(clCreateKernel(program, name, &err));
    check_device(err, std::string("failed to create kernel ") + name);
    return kernel;
}

ClPtr<cl_mem> make_input_buffer(cl_context context, const void* host, size_t bytes,
                                const char* label) {
    cl_int err = CL_SUCCESS;
    ClPtr<cl_mem> mem(clCreateBuffer(context, CL_MEM_READ_ONLY | CL_MEM_COPY_HOST_PTR, bytes,
                                     const_cast<void*>(host), &err));
    check_dispatch(err, std::string("failed to allocate ") + label + " buffer");
    return mem;
}

ClPtr<cl_mem> make_output_buffer(cl_context context, cl_mem_flags flags, size_t bytes,
                                 const char* label) {
    cl_int err = CL_SUCCESS;
    ClPtr<cl_mem> mem(clCreateBuffer(context, flags, bytes, nullptr, &err));
    check_dispatch(err, std::string("failed to allocate ") + label + " buffer");
    return mem;
}

void set_mem_arg(cl_kernel kernel, cl_uint index, const ClPtr<cl_mem>& mem) {
    cl_mem handle = mem.get();
    check_dispatch(clSetKernelArg(kernel, index, sizeof(cl_mem), &handle),
                   "failed to set kernel argument " + std::to_string(index));
}

} // namespace

struct OpenClBackend::Impl {
    cl_platform_id platform = nullptr;
    cl_device_id device = nullptr;
    ClPtr<cl_context> context;
    ClPtr<cl_command_queue> queue;
    ClPtr<cl_program> tone_map_program;
    ClPtr<cl_program> correlation_program;
    ClPtr<cl_kernel> tone_map_kernel;
    ClPtr<cl_kernel> score_kernel;
    ClPtr<cl_kernel> select_kernel;
    size_t workgroup_size = 256;
    std::string description;
    std::mutex mutex;  // kernel arguments are per-kernel state
};

OpenClBackend::OpenClBackend(const OpenClOptions& options) : impl_(std::make_unique<Impl>()) {
    Impl& d = *impl_;
    d.device = select_device(options, d.platform);

    size_t max_wg = 0;
    check_device(clGetDeviceInfo(d.device, CL_DEVICE_MAX_WORK_GROUP_SIZE, sizeof(max_wg),
                                 &max_wg, nullptr),
                 "failed to query CL_DEVICE_MAX_WORK_GROUP_SIZE");
    cl_ulong local_mem = 0;
    check_device(clGetDeviceInfo(d.device, CL_DEVICE_LOCAL_MEM_SIZE, sizeof(local_mem),
                                 &local_mem, nullptr),
                 "failed to query CL_DEVICE_LOCAL_MEM_SIZE");

    if (options.workgroup_size == 0) {
        throw DeviceError("OpenCL work-group size must be positive");
    }
    // The tree reductions in both programs need a power-of-two group size
    const size_t wg = fit_workgroup_size(options.workgroup_size, max_wg, local_mem);
    if (wg != options.workgroup_size) {
        std::cerr << "[OpenCL] Work-group size " << options.workgroup_size << " reduced to " << wg
                  << std::endl;
    }
    d.workgroup_size = wg;

    cl_int err = CL_SUCCESS;
    d.context.reset(clCreateContext(nullptr, 1, &d.device, nullptr, nullptr, &err));
    check_device(err, "failed to create OpenCL context");
    d.queue.reset(clCreateCommandQueue(d.context.get(), d.device, 0, &err));
    check_device(err, "failed to create OpenCL command queue");

    std::string build_options = "-DWG_SIZE=" + std::to_string(wg);
    cl_device_fp_config fp_config = 0;
    if (clGetDeviceInfo(d.device, CL_DEVICE_SINGLE_FP_CONFIG, sizeof(fp_config), &fp_config,
                        nullptr) == CL_SUCCESS &&
        (fp_config & CL_FP_CORRECTLY_ROUNDED_DIVIDE_SQRT) != 0) {
        build_options += " -cl-fp32-correctly-rounded-divide-sqrt";
    }

    d.tone_map_program = build_program(d.context.get(), d.device, kToneMapProgramSource,
                                       build_options, "tone_map");
    d.correlation_program = build_program(d.context.get(), d.device, kCorrelationProgramSource,
                                          build_options, "correlation");
    d.tone_map_kernel = create_kernel(d.tone_map_program.get(), "tone_map");
    d.score_kernel = create_kernel(d.correlation_program.get(), "score_shifts");
    d.select_kernel = create_kernel(d.correlation_program.get(), "select_best");

    for (cl_kernel k : {d.score_kernel.get(), d.select_kernel.get()}) {
        size_t kernel_wg = 0;
        check_device(clGetKernelWorkGroupInfo(k, d.device, CL_KERNEL_WORK_GROUP_SIZE,
                                              sizeof(kernel_wg), &kernel_wg, nullptr),
                     "failed to query CL_KERNEL_WORK_GROUP_SIZE");
        if (kernel_wg < wg) {
            throw DeviceError("correlation kernels need work groups of " + std::to_string(wg) +
                              ", device allows " + std::to_string(kernel_wg));
        }
    }

    d.description = device_string(d.device, CL_DEVICE_NAME);
    const std::string version = device_string(d.device, CL_DEVICE_VERSION);
    if (!version.empty()) {
        d.description += " (" + version + ")";
    }
}

OpenClBackend::~OpenClBackend() = default;

std::string OpenClBackend::device_description() const {
    return impl_->description;
}

size_t OpenClBackend::workgroup_size() const {
    return impl_->workgroup_size;
}

PackedImage OpenClBackend::tone_map(const float* pixels, const ToneMapParams& params) {
    Impl& d = *impl_;
    std::lock_guard<std::mutex> lock(d.mutex);

    const size_t total = static_cast<size_t>(params.width) * static_cast<size_t>(params.height);
    PackedImage out(total);
    if (total == 0) return out;

    auto params_buf = make_input_buffer(d.context.get(), &params, sizeof(ToneMapParams), "params");
    auto pixel_buf = make_input_buffer(d.context.get(), pixels, total * sizeof(float), "pixel");
    auto out_buf = make_output_buffer(d.context.get(), CL_MEM_WRITE_ONLY,
                                      total * sizeof(uint32_t), "output");

    cl_kernel k = d.tone_map_kernel.get();
    set_mem_arg(k, 0, params_buf);
    set_mem_arg(k, 1, pixel_buf);
    set_mem_arg(k, 2, out_buf);

    const size_t global = ((total + d.workgroup_size - 1) / d.workgroup_size) * d.workgroup_size;
    check_dispatch(clEnqueueNDRangeKernel(d.queue.get(), k, 1, nullptr, &global, nullptr,
                                          0, nullptr, nullptr),
                   "failed to enqueue tone_map");
    check_dispatch(clEnqueueReadBuffer(d.queue.get(), out_buf.get(), CL_TRUE, 0,
                                       total * sizeof(uint32_t), out.data(), 0, nullptr, nullptr),
                   "tone_map readback failed");
    return out;
}

OffsetMatch OpenClBackend::find_offset(const float* ref, const float* tgt,
                                       const CorrelationParams& params) {
    Impl& d = *impl_;
    std::lock_guard<std::mutex> lock(d.mutex);

    const size_t ref_len = static_cast<size_t>(params.ref_width) * params.ref_height;
    const size_t tgt_len = static_cast<size_t>(params.tgt_width) * params.tgt_height;
    const size_t candidates = params.candidate_count();

    auto params_buf = make_input_buffer(d.context.get(), &params, sizeof(CorrelationParams), "params");
    auto ref_buf = make_input_buffer(d.context.get(), ref, ref_len * sizeof(float), "reference");
    auto tgt_buf = make_input_buffer(d.context.get(), tgt, tgt_len * sizeof(float), "target");
    auto score_buf = make_output_buffer(d.context.get(), CL_MEM_READ_WRITE,
                                        candidates * sizeof(float), "score");
    auto status_buf = make_output_buffer(d.context.get(), CL_MEM_READ_WRITE,
                                         candidates * sizeof(cl_uchar), "status");
    auto result_buf = make_output_buffer(d.context.get(), CL_MEM_WRITE_ONLY,
                                         sizeof(OffsetResult), "result");

    cl_kernel score = d.score_kernel.get();
    set_mem_arg(score, 0, params_buf);
    set_mem_arg(score, 1, ref_buf);
    set_mem_arg(score, 2, tgt_buf);
    set_mem_arg(score, 3, score_buf);
    set_mem_arg(score, 4, status_buf);

    cl_kernel select = d.select_kernel.get();
    set_mem_arg(select, 0, params_buf);
    set_mem_arg(select, 1, score_buf);
    set_mem_arg(select, 2, result_buf);

    const size_t local = d.workgroup_size;
    const size_t score_global = candidates * local;
    check_dispatch(clEnqueueNDRangeKernel(d.queue.get(), score, 1, nullptr, &score_global, &local,
                                          0, nullptr, nullptr),
                   "failed to enqueue score_shifts");
    // The queue is in-order: select_best starts after every score_shifts
    // work group has completed and its writes are visible.
    check_dispatch(clEnqueueNDRangeKernel(d.queue.get(), select, 1, nullptr, &local, &local,
                                          0, nullptr, nullptr),
                   "failed to enqueue select_best");

    OffsetResult result;
    check_dispatch(clEnqueueReadBuffer(d.queue.get(), result_buf.get(), CL_TRUE, 0,
                                       sizeof(OffsetResult), &result, 0, nullptr, nullptr),
                   "correlation readback failed");

    if (result.best_dx < -params.max_shift || result.best_dx > params.max_shift ||
        result.best_dy < -params.max_shift || result.best_dy > params.max_shift) {
        throw DispatchError("select_best returned shift outside the search window");
    }

    const size_t idx = registration::shift_to_index(result.best_dx, result.best_dy, params);
    cl_uchar status = 0;
    check_dispatch(clEnqueueReadBuffer(d.queue.get(), status_buf.get(), CL_TRUE, idx,
                                       sizeof(cl_uchar), &status, 0, nullptr, nullptr),
                   "status readback failed");

    OffsetMatch match;
    match.dx = result.best_dx;
    match.dy = result.best_dy;
    switch (static_cast<ScoreStatus>(status)) {
        case ScoreStatus::VALID:
            match.score = ShiftScore::valid(result.best_score);
            break;
        case ScoreStatus::INSUFFICIENT_DATA:
        case ScoreStatus::DEGENERATE_VARIANCE:
            match.score = ShiftScore::rejected(static_cast<ScoreStatus>(status));
            break;
        default:
            throw DispatchError("unknown score status " + std::to_string(status));
    }
    return match;
}

} // namespace astro_compute::compute
