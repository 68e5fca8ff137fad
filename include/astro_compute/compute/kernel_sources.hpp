#pragma once

#include <cstddef>
#include <cstdint>

namespace astro_compute::compute {

// OpenCL C programs built at runtime by OpenClBackend.
// Both expect -DWG_SIZE=<power of two> in the build options.

// Kernel "tone_map": one work item per pixel
extern const char* const kToneMapProgramSource;

// Kernels "score_shifts" (one work group per candidate shift) and
// "select_best" (single work group arg-max over the score grid)
extern const char* const kCorrelationProgramSource;

// Largest power of two <= requested that fits the device work-group limit
// and the four WG_SIZE local arrays of score_shifts. Never below 1.
size_t fit_workgroup_size(size_t requested, size_t device_max, uint64_t local_mem_bytes);

} // namespace astro_compute::compute
