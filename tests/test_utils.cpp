#include "astro_compute/core/errors.hpp"
#include "astro_compute/core/types.hpp"
#include "astro_compute/core/utils.hpp"

#include <filesystem>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;
using namespace astro_compute;

TEST_CASE("raw_f32_round_trip_keeps_row_major_order") {
    Matrix2Df img(2, 3);
    img << 1.0f, 2.0f, 3.0f,
           4.0f, 5.0f, 6.0f;

    fs::path path = fs::temp_directory_path() / ("astro_compute_raw_" + core::get_session_id() + ".f32");
    core::write_raw_f32(path, img);
    REQUIRE(fs::file_size(path) == 6 * sizeof(float));

    Matrix2Df back = core::read_raw_f32(path, 3, 2);
    REQUIRE(back == img);

    REQUIRE_THROWS_AS(core::read_raw_f32(path, 4, 2), IOError);
    REQUIRE_THROWS_AS(core::read_raw_f32(path, 0, 2), ValidationError);
    fs::remove(path);
}

TEST_CASE("string_helpers") {
    REQUIRE(core::to_lower("OpenCL") == "opencl");
    REQUIRE(core::trim("  12 \t") == "12");
    auto parts = core::split("1,2,,4", ',');
    REQUIRE(parts.size() == 4);
    REQUIRE(parts[2].empty());
}
