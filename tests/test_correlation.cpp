#include "astro_compute/compute/cpu_backend.hpp"
#include "astro_compute/core/errors.hpp"
#include "astro_compute/core/types.hpp"
#include "astro_compute/registration/correlation.hpp"

#include <random>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace astro_compute;
using namespace astro_compute::registration;

static Matrix2Df noise_image(int w, int h, unsigned seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(1.0f, 2.0f);
    Matrix2Df img(h, w);
    for (int y = 0; y < h; ++y)
        for (int x = 0; x < w; ++x)
            img(y, x) = dist(rng);
    return img;
}

// tgt(x, y) = ref(x - sx, y - sy); pixels with no source get fresh noise
static Matrix2Df shifted_copy(const Matrix2Df& ref, int sx, int sy, unsigned seed) {
    Matrix2Df tgt = noise_image(static_cast<int>(ref.cols()), static_cast<int>(ref.rows()), seed);
    for (int y = 0; y < ref.rows(); ++y) {
        for (int x = 0; x < ref.cols(); ++x) {
            const int xs = x - sx;
            const int ys = y - sy;
            if (xs >= 0 && ys >= 0 && xs < ref.cols() && ys < ref.rows()) {
                tgt(y, x) = ref(ys, xs);
            }
        }
    }
    return tgt;
}

static CorrelationParams params_for(const Matrix2Df& ref, const Matrix2Df& tgt, int max_shift) {
    const auto w = static_cast<uint32_t>(ref.cols());
    const auto h = static_cast<uint32_t>(ref.rows());
    return make_correlation_params(w, h, static_cast<uint32_t>(tgt.cols()),
                                   static_cast<uint32_t>(tgt.rows()), centered_roi(w, h),
                                   max_shift);
}

TEST_CASE("self_correlation_peaks_at_zero") {
    Matrix2Df ref = noise_image(64, 64, 1);
    CorrelationParams p = params_for(ref, ref, 4);

    OffsetMatch m = find_offset_sequential(ref.data(), ref.data(), p);
    REQUIRE(m.dx == 0);
    REQUIRE(m.dy == 0);
    REQUIRE(m.has_match());
    REQUIRE(m.score.value == Catch::Approx(1.0f).margin(1e-5));
}

TEST_CASE("recovers_known_shift") {
    Matrix2Df ref = noise_image(64, 64, 2);
    Matrix2Df tgt = shifted_copy(ref, 3, -2, 3);
    CorrelationParams p = params_for(ref, tgt, 5);

    OffsetMatch m = find_offset_sequential(ref.data(), tgt.data(), p);
    REQUIRE(m.dx == 3);
    REQUIRE(m.dy == -2);
    REQUIRE(m.score.value == Catch::Approx(1.0f).margin(1e-5));
}

TEST_CASE("score_is_invariant_to_gain_and_offset") {
    Matrix2Df ref = noise_image(48, 48, 4);
    Matrix2Df tgt = shifted_copy(ref, -1, 2, 5);
    tgt = (tgt.array() * 2.5f + 4.0f).matrix();
    CorrelationParams p = params_for(ref, tgt, 3);

    OffsetMatch m = find_offset_sequential(ref.data(), tgt.data(), p);
    REQUIRE(m.dx == -1);
    REQUIRE(m.dy == 2);
    REQUIRE(m.score.value == Catch::Approx(1.0f).margin(1e-4));
}

TEST_CASE("anti_correlated_target_scores_minus_one") {
    Matrix2Df ref = noise_image(32, 32, 6);
    Matrix2Df tgt = (10.0f - ref.array()).matrix();
    CorrelationParams p = params_for(ref, tgt, 2);

    ShiftScore s = score_shift(ref.data(), tgt.data(), p, 0, 0);
    REQUIRE(s.usable());
    REQUIRE(s.value == Catch::Approx(-1.0f).margin(1e-5));
}

TEST_CASE("constant_images_tie_on_the_first_candidate") {
    Matrix2Df ref = Matrix2Df::Constant(32, 32, 5.0f);
    CorrelationParams p = params_for(ref, ref, 3);

    OffsetMatch m = find_offset_sequential(ref.data(), ref.data(), p);
    REQUIRE(m.dx == -3);
    REQUIRE(m.dy == -3);
    REQUIRE_FALSE(m.has_match());
    REQUIRE(m.score.status == ScoreStatus::DEGENERATE_VARIANCE);
    REQUIRE(m.to_result().best_score == kScoreSentinel);
}

TEST_CASE("small_roi_has_insufficient_pairs") {
    Matrix2Df ref = noise_image(16, 16, 7);
    CorrelationParams p = make_correlation_params(16, 16, 16, 16, Roi{4, 4, 3, 3}, 1);

    OffsetMatch m = find_offset_sequential(ref.data(), ref.data(), p);
    REQUIRE(m.dx == -1);
    REQUIRE(m.dy == -1);
    REQUIRE(m.score.status == ScoreStatus::INSUFFICIENT_DATA);
}

TEST_CASE("padding_and_out_of_bounds_samples_are_skipped") {
    Matrix2Df ref = noise_image(16, 16, 8);
    CorrelationParams p = make_correlation_params(16, 16, 16, 16, Roi{0, 0, 16, 16}, 16);

    // one column of overlap
    REQUIRE(score_shift(ref.data(), ref.data(), p, 15, 0).status != ScoreStatus::INSUFFICIENT_DATA);
    REQUIRE(score_shift(ref.data(), ref.data(), p, 16, 0).status == ScoreStatus::INSUFFICIENT_DATA);

    Matrix2Df masked = ref;
    masked.block(0, 0, 16, 15).setZero();
    ShiftScore s = score_shift(ref.data(), masked.data(), p, 0, 0);
    REQUIRE(s.usable());
    REQUIRE(s.value == Catch::Approx(1.0f).margin(1e-5));
}

TEST_CASE("selection_prefers_valid_scores_and_earliest_index") {
    std::vector<ShiftScore> grid = {
        ShiftScore::rejected(ScoreStatus::INSUFFICIENT_DATA),
        ShiftScore::valid(-0.9f),
        ShiftScore::valid(0.5f),
        ShiftScore::valid(0.5f),
        ShiftScore::rejected(ScoreStatus::DEGENERATE_VARIANCE),
    };
    REQUIRE(select_best_index(grid) == 2);

    std::vector<ShiftScore> none(4, ShiftScore::rejected(ScoreStatus::INSUFFICIENT_DATA));
    REQUIRE(select_best_index(none) == 0);

    REQUIRE(outranks(ShiftScore::valid(-1.0f), ShiftScore::rejected(ScoreStatus::INSUFFICIENT_DATA)));
    REQUIRE_FALSE(outranks(ShiftScore::valid(0.3f), ShiftScore::valid(0.3f)));
}

TEST_CASE("index_mapping_is_row_major_over_dy_then_dx") {
    CorrelationParams p = make_correlation_params(8, 8, 8, 8, Roi{0, 0, 8, 8}, 2);
    REQUIRE(p.search_size == 5);
    REQUIRE(p.candidate_count() == 25);
    REQUIRE(index_to_dx(0, p) == -2);
    REQUIRE(index_to_dy(0, p) == -2);
    REQUIRE(index_to_dx(7, p) == 0);
    REQUIRE(index_to_dy(7, p) == -1);
    REQUIRE(shift_to_index(0, -1, p) == 7);
}

TEST_CASE("invalid_search_parameters_are_rejected") {
    REQUIRE_THROWS_AS(make_correlation_params(0, 8, 8, 8, Roi{0, 0, 1, 1}, 1), ValidationError);
    REQUIRE_THROWS_AS(make_correlation_params(8, 8, 8, 8, Roi{0, 0, 0, 4}, 1), ValidationError);
    REQUIRE_THROWS_AS(make_correlation_params(8, 8, 8, 8, Roi{6, 0, 4, 4}, 1), ValidationError);
    REQUIRE_THROWS_AS(make_correlation_params(8, 8, 8, 8, Roi{0, 0, 4, 4}, -1), ValidationError);
    REQUIRE_THROWS_AS(make_correlation_params(8, 8, 8, 8, Roi{0, 0, 4, 4}, kMaxSearchRadius + 1),
                      ValidationError);
    REQUIRE_NOTHROW(make_correlation_params(8, 8, 4, 4, Roi{0, 0, 8, 8}, 0));
}

TEST_CASE("roi_larger_than_32_bit_pixel_count_is_rejected") {
    // 70000 * 70000 does not fit a 32-bit linear ROI index
    REQUIRE_THROWS_AS(make_correlation_params(70000, 70000, 70000, 70000,
                                              Roi{0, 0, 70000, 70000}, 0),
                      ValidationError);
    // 65536 * 65535 is the last row count that still fits
    REQUIRE_NOTHROW(make_correlation_params(65536, 65535, 16, 16, Roi{0, 0, 65536, 65535}, 0));
    REQUIRE_THROWS_AS(make_correlation_params(65536, 65536, 16, 16, Roi{0, 0, 65536, 65536}, 0),
                      ValidationError);
}

TEST_CASE("centered_roi_geometry") {
    Roi r = centered_roi(100, 60);
    REQUIRE(r.x == 35);
    REQUIRE(r.y == 15);
    REQUIRE(r.w == 30);
    REQUIRE(r.h == 30);

    Roi tiny = centered_roi(1, 1);
    REQUIRE(tiny.x == 0);
    REQUIRE(tiny.w == 1);
    REQUIRE(tiny.h == 1);
}

TEST_CASE("cpu_backend_matches_sequential_search") {
    Matrix2Df ref = noise_image(80, 72, 9);
    Matrix2Df tgt = shifted_copy(ref, -4, 1, 10);
    CorrelationParams p = params_for(ref, tgt, 6);

    compute::CpuBackend cpu(4);
    OffsetMatch parallel = cpu.find_offset(ref.data(), tgt.data(), p);
    OffsetMatch sequential = find_offset_sequential(ref.data(), tgt.data(), p);

    REQUIRE(parallel.dx == sequential.dx);
    REQUIRE(parallel.dy == sequential.dy);
    REQUIRE(parallel.score.value == sequential.score.value);
    REQUIRE(parallel.dx == -4);
    REQUIRE(parallel.dy == 1);
}
