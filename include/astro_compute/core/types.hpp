#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <string>
#include <vector>

namespace astro_compute {

// Row-major float image, width = cols(), height = rows()
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// One packed RGBA word per pixel: byte | byte<<8 | byte<<16 | 255<<24
using PackedImage = std::vector<uint32_t>;

// Samples at or below this level are padding / masked data
constexpr float kPaddingThreshold = 1e-7f;
// Largest magnitude still accepted as a finite sample
constexpr float kMaxFiniteSample = 3.4e38f;

// Correlation constants shared by host and device code
constexpr uint32_t kMinValidPairs = 10;
constexpr float kScoreSentinel = -2.0f;
constexpr float kMinCorrelationDenominator = 1e-10f;

// Host <-> kernel layouts. Field order and padding are part of the contract.

struct ToneMapParams {
    uint32_t width = 0;
    uint32_t height = 0;
    float data_min = 0.0f;
    float data_max = 1.0f;
    float shadow = 0.0f;
    float midtone = 0.5f;
    float highlight = 1.0f;
    float pad = 0.0f;
};
static_assert(sizeof(ToneMapParams) == 32, "ToneMapParams must be 32 bytes");

struct CorrelationParams {
    uint32_t ref_width = 0;
    uint32_t ref_height = 0;
    uint32_t tgt_width = 0;
    uint32_t tgt_height = 0;
    uint32_t roi_x = 0;
    uint32_t roi_y = 0;
    uint32_t roi_w = 0;
    uint32_t roi_h = 0;
    int32_t max_shift = 0;
    uint32_t search_size = 1;
    uint32_t pad0 = 0;
    uint32_t pad1 = 0;

    uint32_t candidate_count() const { return search_size * search_size; }
};
static_assert(sizeof(CorrelationParams) == 48, "CorrelationParams must be 48 bytes");

struct OffsetResult {
    int32_t best_dx = 0;
    int32_t best_dy = 0;
    float best_score = kScoreSentinel;
    uint32_t pad = 0;
};
static_assert(sizeof(OffsetResult) == 16, "OffsetResult must be 16 bytes");

// Region of interest in reference coordinates
struct Roi {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t w = 0;
    uint32_t h = 0;
};

// Screen transfer function parameters in normalized [0,1] units
struct StfParams {
    float shadow = 0.0f;
    float midtone = 0.25f;
    float highlight = 1.0f;
};

// Why a candidate shift carries no correlation value
enum class ScoreStatus : uint8_t {
    VALID = 0,
    INSUFFICIENT_DATA = 1,   // fewer than kMinValidPairs valid pairs
    DEGENERATE_VARIANCE = 2  // sqrt(var_r * var_t) <= kMinCorrelationDenominator
};

inline std::string score_status_to_string(ScoreStatus status) {
    switch (status) {
        case ScoreStatus::VALID: return "valid";
        case ScoreStatus::INSUFFICIENT_DATA: return "insufficient_data";
        case ScoreStatus::DEGENERATE_VARIANCE: return "degenerate_variance";
        default: return "unknown";
    }
}

// Tagged correlation score for one candidate shift
struct ShiftScore {
    ScoreStatus status = ScoreStatus::INSUFFICIENT_DATA;
    float value = kScoreSentinel;

    static ShiftScore valid(float v) { return {ScoreStatus::VALID, v}; }
    static ShiftScore rejected(ScoreStatus s) { return {s, kScoreSentinel}; }

    bool usable() const { return status == ScoreStatus::VALID; }

    // Value as written to the score grid / OffsetResult
    float wire_value() const { return usable() ? value : kScoreSentinel; }
};

// Winning displacement of one correlation search
struct OffsetMatch {
    int dx = 0;
    int dy = 0;
    ShiftScore score;

    bool has_match() const { return score.usable(); }

    OffsetResult to_result() const {
        OffsetResult r;
        r.best_dx = dx;
        r.best_dy = dy;
        r.best_score = score.wire_value();
        return r;
    }
};

} // namespace astro_compute
