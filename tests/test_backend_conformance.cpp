#include "astro_compute/compute/backend.hpp"
#include "astro_compute/compute/cpu_backend.hpp"
#include "astro_compute/compute/kernel_sources.hpp"
#include "astro_compute/core/errors.hpp"
#include "astro_compute/core/types.hpp"
#include "astro_compute/registration/correlation.hpp"
#include "astro_compute/tonemap/stf.hpp"

#ifdef ASTRO_COMPUTE_HAVE_OPENCL
#include "astro_compute/compute/opencl_backend.hpp"
#endif

#include <cstdlib>
#include <limits>
#include <memory>
#include <random>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace astro_compute;
using namespace astro_compute::compute;

namespace {

Matrix2Df noise_image(int w, int h, float base, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    Matrix2Df img(h, w);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            img(y, x) = base + dist(rng);
    return img;
}

CorrelationParams full_roi(const Matrix2Df& ref, const Matrix2Df& tgt, const Roi& roi,
                           int max_shift) {
    return registration::make_correlation_params(
        static_cast<uint32_t>(ref.cols()), static_cast<uint32_t>(ref.rows()),
        static_cast<uint32_t>(tgt.cols()), static_cast<uint32_t>(tgt.rows()), roi, max_shift);
}

void check_tone_map(ComputeBackend& backend) {
    const float inf = std::numeric_limits<float>::infinity();
    std::vector<float> pixels = {
        0.0f, 0.05f, 0.1f, 0.25f, 0.5f, 0.75f, 0.9f, 1.0f,
        -3.0f, 7.0f, std::numeric_limits<float>::quiet_NaN(), inf, -inf, 0.333f, 0.666f, 0.999f
    };
    ToneMapParams p;
    p.width = 4;
    p.height = 4;
    p.data_min = 0.0f;
    p.data_max = 1.0f;
    p.shadow = 0.02f;
    p.midtone = 0.2f;
    p.highlight = 0.95f;

    const PackedImage out = backend.tone_map(pixels.data(), p);
    REQUIRE(out.size() == pixels.size());
    for (size_t i = 0; i < pixels.size(); ++i) {
        const uint32_t expected = tonemap::tone_map_pixel(pixels[i], p);
        const int got_byte = static_cast<int>(out[i] & 0xFFu);
        const int want_byte = static_cast<int>(expected & 0xFFu);
        REQUIRE(std::abs(got_byte - want_byte) <= 1);
        REQUIRE((out[i] >> 24) == 255u);
        REQUIRE(((out[i] >> 8) & 0xFFu) == static_cast<uint32_t>(got_byte));
        REQUIRE(((out[i] >> 16) & 0xFFu) == static_cast<uint32_t>(got_byte));
    }
    REQUIRE(out[10] == 0xFF000000u);
    REQUIRE(out[11] == 0xFFFFFFFFu);
    REQUIRE(out[12] == 0xFF000000u);
}

void check_correlation(ComputeBackend& backend) {
    SECTION("self correlation") {
        Matrix2Df ref = noise_image(64, 64, 1.0f, 21);
        const CorrelationParams p = full_roi(ref, ref, Roi{16, 16, 32, 32}, 4);
        const OffsetMatch m = backend.find_offset(ref.data(), ref.data(), p);
        REQUIRE(m.dx == 0);
        REQUIRE(m.dy == 0);
        REQUIRE(m.has_match());
        REQUIRE(m.score.value == Catch::Approx(1.0f).margin(1e-4));
    }

    SECTION("recovers shift on a bright background") {
        Matrix2Df ref = noise_image(96, 96, 1000.0f, 22);
        Matrix2Df tgt = Matrix2Df::Constant(96, 96, 1000.5f);
        // tgt(x, y) = ref(x - 3, y + 2)
        for (int y = 0; y < 96; ++y) {
            for (int x = 0; x < 96; ++x) {
                const int xs = x - 3;
                const int ys = y + 2;
                if (xs >= 0 && ys >= 0 && xs < 96 && ys < 96) tgt(y, x) = ref(ys, xs);
            }
        }
        const CorrelationParams p = full_roi(ref, tgt, Roi{24, 24, 48, 48}, 6);
        const OffsetMatch m = backend.find_offset(ref.data(), tgt.data(), p);
        REQUIRE(m.dx == 3);
        REQUIRE(m.dy == -2);
        REQUIRE(m.has_match());
        REQUIRE(m.score.value == Catch::Approx(1.0f).margin(1e-3));
    }

    SECTION("constant images report the first candidate as degenerate") {
        Matrix2Df flat = Matrix2Df::Constant(32, 32, 5.0f);
        const CorrelationParams p = full_roi(flat, flat, Roi{8, 8, 16, 16}, 3);
        const OffsetMatch m = backend.find_offset(flat.data(), flat.data(), p);
        REQUIRE(m.dx == -3);
        REQUIRE(m.dy == -3);
        REQUIRE_FALSE(m.has_match());
        REQUIRE(m.score.status == ScoreStatus::DEGENERATE_VARIANCE);
        REQUIRE(m.to_result().best_score == kScoreSentinel);
    }

    SECTION("large flat roi stays degenerate") {
        // 1000.1f is not a binary fraction, so naive float sums drift off the mean
        Matrix2Df flat = Matrix2Df::Constant(1024, 1024, 1000.1f);
        const CorrelationParams p = full_roi(flat, flat, Roi{0, 0, 1024, 1024}, 0);
        const OffsetMatch m = backend.find_offset(flat.data(), flat.data(), p);
        REQUIRE(m.dx == 0);
        REQUIRE(m.dy == 0);
        REQUIRE_FALSE(m.has_match());
        REQUIRE(m.score.status == ScoreStatus::DEGENERATE_VARIANCE);
    }

    SECTION("equal peaks resolve to the lowest index") {
        // Period 4 along x: dx = -4, 0 and 4 all correlate perfectly at dy = 0
        std::mt19937 rng(23);
        std::uniform_real_distribution<float> dist(1.0f, 2.0f);
        Matrix2Df ref(48, 48);
        for (int y = 0; y < 48; ++y) {
            const float row[4] = {dist(rng), dist(rng), dist(rng), dist(rng)};
            for (int x = 0; x < 48; ++x) ref(y, x) = row[x % 4];
        }
        const CorrelationParams p = full_roi(ref, ref, Roi{12, 12, 24, 24}, 5);
        const OffsetMatch m = backend.find_offset(ref.data(), ref.data(), p);
        REQUIRE(m.dx == -4);
        REQUIRE(m.dy == 0);
        REQUIRE(m.has_match());
    }

    SECTION("no overlap leaves insufficient data") {
        Matrix2Df ref = noise_image(16, 16, 1.0f, 24);
        Matrix2Df blank = Matrix2Df::Zero(16, 16);
        const CorrelationParams p = full_roi(ref, blank, Roi{4, 4, 8, 8}, 2);
        const OffsetMatch m = backend.find_offset(ref.data(), blank.data(), p);
        REQUIRE(m.dx == -2);
        REQUIRE(m.dy == -2);
        REQUIRE(m.score.status == ScoreStatus::INSUFFICIENT_DATA);
    }
}

} // namespace

TEST_CASE("cpu_backend_conformance") {
    CpuBackend cpu(3);
    check_tone_map(cpu);
    check_correlation(cpu);
}

TEST_CASE("workgroup_size_is_fitted_to_a_power_of_two") {
    REQUIRE(fit_workgroup_size(256, 1024, 65536) == 256);
    REQUIRE(fit_workgroup_size(96, 1024, 65536) == 64);
    REQUIRE(fit_workgroup_size(1000, 1024, 65536) == 512);
    REQUIRE(fit_workgroup_size(256, 100, 65536) == 64);
    // four float arrays of 64 entries need 1 KiB
    REQUIRE(fit_workgroup_size(256, 1024, 1024) == 64);
    REQUIRE(fit_workgroup_size(1, 1024, 65536) == 1);
    REQUIRE(fit_workgroup_size(0, 1024, 65536) == 1);
    REQUIRE(fit_workgroup_size(256, 0, 0) == 1);
}

#ifdef ASTRO_COMPUTE_HAVE_OPENCL
TEST_CASE("opencl_backend_conformance") {
    OpenClOptions options;
    options.gpu_only = false;
    std::unique_ptr<OpenClBackend> device;
    try {
        device = std::make_unique<OpenClBackend>(options);
    } catch (const DeviceError& e) {
        WARN("no usable OpenCL device: " << e.what());
        return;
    }

    const size_t wg = device->workgroup_size();
    REQUIRE(wg >= 1);
    REQUIRE(wg <= options.workgroup_size);
    REQUIRE((wg & (wg - 1)) == 0);

    check_tone_map(*device);
    check_correlation(*device);
}

TEST_CASE("opencl_backend_fits_odd_workgroup_request") {
    OpenClOptions options;
    options.gpu_only = false;
    options.workgroup_size = 96;
    std::unique_ptr<OpenClBackend> device;
    try {
        device = std::make_unique<OpenClBackend>(options);
    } catch (const DeviceError& e) {
        WARN("no usable OpenCL device: " << e.what());
        return;
    }

    const size_t wg = device->workgroup_size();
    REQUIRE(wg <= 64);
    REQUIRE((wg & (wg - 1)) == 0);
    check_correlation(*device);
}
#endif
