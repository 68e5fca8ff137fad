#include "astro_compute/core/types.hpp"
#include "astro_compute/image/stats.hpp"
#include "astro_compute/tonemap/stf.hpp"

#include <cmath>
#include <limits>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace astro_compute;

TEST_CASE("stats_ignore_padding_and_non_finite_pixels") {
    Matrix2Df img(2, 4);
    img << 0.0f, 1.0f, 2.0f, 3.0f,
           4.0f, 5.0f, std::numeric_limits<float>::quiet_NaN(), -1.0f;

    image::ImageStats s = image::compute_image_stats(img);
    REQUIRE(s.valid_count == 5);
    REQUIRE(s.min == Catch::Approx(1.0));
    REQUIRE(s.max == Catch::Approx(5.0));
    REQUIRE(s.median == Catch::Approx(3.0));
    REQUIRE(s.mean == Catch::Approx(3.0));
    // |x - 3| = {2,1,0,1,2}
    REQUIRE(s.mad == Catch::Approx(1.0));
    REQUIRE(s.sigma == Catch::Approx(1.4826));
}

TEST_CASE("stats_of_empty_valid_set_are_zero") {
    Matrix2Df img = Matrix2Df::Zero(3, 3);
    image::ImageStats s = image::compute_image_stats(img);
    REQUIRE(s.valid_count == 0);
    REQUIRE(s.min == 0.0);
    REQUIRE(s.max == 0.0);
}

TEST_CASE("auto_stf_defaults_without_valid_pixels") {
    image::ImageStats s;
    StfParams p = tonemap::auto_stf(s, tonemap::AutoStfConfig{});
    REQUIRE(p.shadow == 0.0f);
    REQUIRE(p.midtone == 0.25f);
    REQUIRE(p.highlight == 1.0f);
}

TEST_CASE("auto_stf_brings_median_to_target_background") {
    image::ImageStats s;
    s.min = 0.0;
    s.max = 100.0;
    s.median = 10.0;
    s.sigma = 1.0;
    s.valid_count = 1000;

    tonemap::AutoStfConfig cfg;
    StfParams p = tonemap::auto_stf(s, cfg);

    REQUIRE(p.shadow == Catch::Approx(0.1 - 2.8 * 0.01).margin(1e-6));
    REQUIRE(p.highlight == 1.0f);

    const double m_clipped = (0.1 - p.shadow) / (1.0 - p.shadow);
    const float stretched = tonemap::mtf(static_cast<float>(m_clipped), p.midtone);
    REQUIRE(stretched == Catch::Approx(cfg.target_background).margin(1e-4));
}

TEST_CASE("stronger_shadow_k_clips_more") {
    image::ImageStats s;
    s.min = 0.0;
    s.max = 1.0;
    s.median = 0.2;
    s.sigma = 0.02;
    s.valid_count = 100;

    StfParams mild = tonemap::auto_stf(s, tonemap::AutoStfConfig{0.25, -2.0});
    StfParams hard = tonemap::auto_stf(s, tonemap::AutoStfConfig{0.25, -1.0});
    REQUIRE(hard.shadow > mild.shadow);
}

TEST_CASE("mtf_balance_limits") {
    REQUIRE(tonemap::mtf_balance(0.25, 0.25) == Catch::Approx(0.5));
    REQUIRE(tonemap::mtf_balance(1e-9, 0.25) >= 1e-4);
    REQUIRE(tonemap::mtf_balance(0.9999999, 0.25) <= 0.9999);
}
