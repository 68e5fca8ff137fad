#include "astro_compute/compute/kernel_sources.hpp"

#include <cstdint>

namespace astro_compute::compute {

const char* const kToneMapProgramSource = R"CLC(
typedef struct {
    uint  width;
    uint  height;
    float data_min;
    float data_max;
    float shadow;
    float midtone;
    float highlight;
    float pad;
} ToneMapParams;

inline float clamp01(float x) {
    return fmin(fmax(x, 0.0f), 1.0f);
}

inline float mtf(float x, float m) {
    if (x <= 0.0f) { return 0.0f; }
    if (x >= 1.0f) { return 1.0f; }
    return (m - 1.0f) * x / ((2.0f * m - 1.0f) * x - m);
}

__kernel void tone_map(__constant ToneMapParams* params,
                       __global const float* pixels,
                       __global uint* output)
{
    const size_t idx = get_global_id(0);
    const size_t total = (size_t)params->width * (size_t)params->height;
    if (idx >= total) { return; }

    const float raw = pixels[idx];
    uint byte_val = 0u;

    if (!isnan(raw)) {
        const float range = fmax(params->data_max - params->data_min, 1e-20f);
        const float norm = clamp01((raw - params->data_min) / range);
        const float clip_range = fmax(params->highlight - params->shadow, 1e-10f);
        const float clipped = clamp01((norm - params->shadow) / clip_range);
        const float scaled = fmin(fmax(mtf(clipped, params->midtone) * 255.0f, 0.0f), 255.0f);
        byte_val = (uint)round(scaled);
    }

    output[idx] = byte_val | (byte_val << 8) | (byte_val << 16) | (255u << 24);
}
)CLC";

const char* const kCorrelationProgramSource = R"CLC(
typedef struct {
    uint ref_width;
    uint ref_height;
    uint tgt_width;
    uint tgt_height;
    uint roi_x;
    uint roi_y;
    uint roi_w;
    uint roi_h;
    int  max_shift;
    uint search_size;
    uint pad0;
    uint pad1;
} CorrelationParams;

typedef struct {
    int   best_dx;
    int   best_dy;
    float best_score;
    uint  pad;
} OffsetResult;

#define MIN_VALID_PAIRS 10u
#define SCORE_SENTINEL (-2.0f)
#define MIN_DENOMINATOR 1e-10f

#define STATUS_VALID 0
#define STATUS_INSUFFICIENT_DATA 1
#define STATUS_DEGENERATE_VARIANCE 2

inline bool valid_sample(float v) {
    return isfinite(v) && fabs(v) <= 3.4e38f && v > 1e-7f;
}

inline float target_sample(__global const float* tgt,
                           __constant CorrelationParams* p,
                           int tx, int ty) {
    if (tx < 0 || ty < 0 || tx >= (int)p->tgt_width || ty >= (int)p->tgt_height) {
        return 0.0f;
    }
    return tgt[(size_t)ty * p->tgt_width + (size_t)tx];
}

// Compensated summation for the per-item partial sums
inline void kahan_add(float* sum, float* comp, float v) {
    const float y = v - *comp;
    const float t = *sum + y;
    *comp = (t - *sum) - y;
    *sum = t;
}

#define NO_PIVOT 0xFFFFFFFFu

// Phase 1: one work group per candidate shift. Each work item strides over
// the ROI, partial sums are tree-reduced in local memory. Samples are summed
// relative to the first valid pair of the ROI so that the means of bright or
// flat regions stay exact in single precision.
__kernel __attribute__((reqd_work_group_size(WG_SIZE, 1, 1)))
void score_shifts(__constant CorrelationParams* p,
                  __global const float* ref,
                  __global const float* tgt,
                  __global float* scores,
                  __global uchar* status)
{
    __local float s_a[WG_SIZE];
    __local float s_b[WG_SIZE];
    __local float s_c[WG_SIZE];
    __local uint  s_n[WG_SIZE];

    const uint group = get_group_id(0);
    const uint lid = get_local_id(0);
    const int dx = (int)(group % p->search_size) - p->max_shift;
    const int dy = (int)(group / p->search_size) - p->max_shift;
    const uint roi_count = p->roi_w * p->roi_h;

    // Pivot: lowest ROI index holding a valid pair
    uint first = NO_PIVOT;
    for (uint i = lid; i < roi_count; i += WG_SIZE) {
        const uint x = p->roi_x + i % p->roi_w;
        const uint y = p->roi_y + i / p->roi_w;
        const float rv = ref[(size_t)y * p->ref_width + x];
        const float tv = target_sample(tgt, p, (int)x + dx, (int)y + dy);
        if (valid_sample(rv) && valid_sample(tv)) {
            first = i;
            break;
        }
    }
    s_n[lid] = first;
    barrier(CLK_LOCAL_MEM_FENCE);
    for (uint stride = WG_SIZE / 2; stride > 0; stride >>= 1) {
        if (lid < stride) {
            s_n[lid] = min(s_n[lid], s_n[lid + stride]);
        }
        barrier(CLK_LOCAL_MEM_FENCE);
    }
    const uint pivot = s_n[0];
    // s_n is rewritten below
    barrier(CLK_LOCAL_MEM_FENCE);

    if (pivot == NO_PIVOT) {
        if (lid == 0) {
            scores[group] = SCORE_SENTINEL;
            status[group] = (uchar)STATUS_INSUFFICIENT_DATA;
        }
        return;
    }

    const uint px = p->roi_x + pivot % p->roi_w;
    const uint py = p->roi_y + pivot / p->roi_w;
    const float pr = ref[(size_t)py * p->ref_width + px];
    const float pt = target_sample(tgt, p, (int)px + dx, (int)py + dy);

    float r_sum = 0.0f, r_comp = 0.0f;
    float t_sum = 0.0f, t_comp = 0.0f;
    uint n = 0u;
    for (uint i = lid; i < roi_count; i += WG_SIZE) {
        const uint x = p->roi_x + i % p->roi_w;
        const uint y = p->roi_y + i / p->roi_w;
        const float rv = ref[(size_t)y * p->ref_width + x];
        const float tv = target_sample(tgt, p, (int)x + dx, (int)y + dy);
        if (valid_sample(rv) && valid_sample(tv)) {
            kahan_add(&r_sum, &r_comp, rv - pr);
            kahan_add(&t_sum, &t_comp, tv - pt);
            n += 1u;
        }
    }

    s_a[lid] = r_sum;
    s_b[lid] = t_sum;
    s_n[lid] = n;
    barrier(CLK_LOCAL_MEM_FENCE);

    for (uint stride = WG_SIZE / 2; stride > 0; stride >>= 1) {
        if (lid < stride) {
            s_a[lid] += s_a[lid + stride];
            s_b[lid] += s_b[lid + stride];
            s_n[lid] += s_n[lid + stride];
        }
        barrier(CLK_LOCAL_MEM_FENCE);
    }

    const uint count = s_n[0];
    if (count < MIN_VALID_PAIRS) {
        // count is uniform across the group, so every item leaves here
        if (lid == 0) {
            scores[group] = SCORE_SENTINEL;
            status[group] = (uchar)STATUS_INSUFFICIENT_DATA;
        }
        return;
    }

    // Means relative to the pivot
    const float dr = s_a[0] / (float)count;
    const float dt = s_b[0] / (float)count;
    // s_a/s_b are rewritten below
    barrier(CLK_LOCAL_MEM_FENCE);

    float cov = 0.0f, cov_comp = 0.0f;
    float var_r = 0.0f, var_r_comp = 0.0f;
    float var_t = 0.0f, var_t_comp = 0.0f;
    for (uint i = lid; i < roi_count; i += WG_SIZE) {
        const uint x = p->roi_x + i % p->roi_w;
        const uint y = p->roi_y + i / p->roi_w;
        const float rv = ref[(size_t)y * p->ref_width + x];
        const float tv = target_sample(tgt, p, (int)x + dx, (int)y + dy);
        if (valid_sample(rv) && valid_sample(tv)) {
            const float rd = (rv - pr) - dr;
            const float td = (tv - pt) - dt;
            kahan_add(&cov, &cov_comp, rd * td);
            kahan_add(&var_r, &var_r_comp, rd * rd);
            kahan_add(&var_t, &var_t_comp, td * td);
        }
    }

    s_a[lid] = cov;
    s_b[lid] = var_r;
    s_c[lid] = var_t;
    barrier(CLK_LOCAL_MEM_FENCE);

    for (uint stride = WG_SIZE / 2; stride > 0; stride >>= 1) {
        if (lid < stride) {
            s_a[lid] += s_a[lid + stride];
            s_b[lid] += s_b[lid + stride];
            s_c[lid] += s_c[lid + stride];
        }
        barrier(CLK_LOCAL_MEM_FENCE);
    }

    if (lid == 0) {
        const float denom = sqrt(s_b[0] * s_c[0]);
        const float score = s_a[0] / denom;
        if (!(denom > MIN_DENOMINATOR) || !isfinite(denom) || isnan(score)) {
            scores[group] = SCORE_SENTINEL;
            status[group] = (uchar)STATUS_DEGENERATE_VARIANCE;
        } else {
            scores[group] = clamp(score, -1.0f, 1.0f);
            status[group] = (uchar)STATUS_VALID;
        }
    }
}

// Phase 2: single work group. Each item scans a strided slice with strict
// greater-than, then (value, index) pairs are reduced preferring the lower
// index on equal values, which reproduces a sequential first-wins scan.
__kernel __attribute__((reqd_work_group_size(WG_SIZE, 1, 1)))
void select_best(__constant CorrelationParams* p,
                 __global const float* scores,
                 __global OffsetResult* result)
{
    __local float s_val[WG_SIZE];
    __local uint  s_idx[WG_SIZE];

    const uint lid = get_local_id(0);
    const uint n = p->search_size * p->search_size;

    float best = -INFINITY;
    uint best_idx = 0xFFFFFFFFu;
    for (uint i = lid; i < n; i += WG_SIZE) {
        const float v = scores[i];
        if (v > best) {
            best = v;
            best_idx = i;
        }
    }

    s_val[lid] = best;
    s_idx[lid] = best_idx;
    barrier(CLK_LOCAL_MEM_FENCE);

    for (uint stride = WG_SIZE / 2; stride > 0; stride >>= 1) {
        if (lid < stride) {
            const float ov = s_val[lid + stride];
            const uint oi = s_idx[lid + stride];
            if (ov > s_val[lid] || (ov == s_val[lid] && oi < s_idx[lid])) {
                s_val[lid] = ov;
                s_idx[lid] = oi;
            }
        }
        barrier(CLK_LOCAL_MEM_FENCE);
    }

    if (lid == 0) {
        const uint idx = s_idx[0];
        result->best_dx = (int)(idx % p->search_size) - p->max_shift;
        result->best_dy = (int)(idx / p->search_size) - p->max_shift;
        result->best_score = s_val[0];
        result->pad = 0u;
    }
}
)CLC";

size_t fit_workgroup_size(size_t requested, size_t device_max, uint64_t local_mem_bytes) {
    size_t wg = 1;
    while (wg * 2 <= requested) {
        wg *= 2;
    }
    while (wg > 1 && (wg > device_max || 4 * wg * sizeof(float) > local_mem_bytes)) {
        wg >>= 1;
    }
    return wg;
}

} // namespace astro_compute::compute
