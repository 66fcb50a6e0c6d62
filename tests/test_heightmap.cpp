#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "map/heightmap.hpp"

using namespace hf;
using namespace hf::map;
using Catch::Matchers::WithinAbs;

TEST_CASE("Heightmap sample point queries", "[terrain]") {
    // 2x2 cells -> 3x3 samples
    //   100  200  300
    //   400  500  600
    //   700  800  900
    std::vector<i16> data = {100, 200, 300, 400, 500, 600, 700, 800, 900};
    Heightmap hm(2, 2, 1.0f, data);

    REQUIRE(hm.samples_x() == 3);
    REQUIRE(hm.samples_z() == 3);

    CHECK_THAT(hm.get_height(0, 0), WithinAbs(100.0, 0.01));
    CHECK_THAT(hm.get_height(1, 0), WithinAbs(200.0, 0.01));
    CHECK_THAT(hm.get_height(2, 0), WithinAbs(300.0, 0.01));
    CHECK_THAT(hm.get_height(0, 1), WithinAbs(400.0, 0.01));
    CHECK_THAT(hm.get_height(1, 1), WithinAbs(500.0, 0.01));
    CHECK_THAT(hm.get_height(2, 2), WithinAbs(900.0, 0.01));
    CHECK_THAT(hm.get_height_at_sample(2, 1), WithinAbs(600.0, 0.01));
}

TEST_CASE("Heightmap bilinear interpolation", "[terrain]") {
    std::vector<i16> data = {0, 100, 0, 0, 100, 0, 0, 0, 0};
    Heightmap hm(2, 2, 0.1f, data);

    CHECK_THAT(hm.get_height(1, 0), WithinAbs(10.0, 0.01));
    CHECK_THAT(hm.get_height(0.5f, 0), WithinAbs(5.0, 0.01));
    CHECK_THAT(hm.get_height(1, 0.5f), WithinAbs(10.0, 0.01));
    CHECK_THAT(hm.get_height(0.5f, 0.5f), WithinAbs(5.0, 0.01));
}

TEST_CASE("Heightmap clamps out-of-range coordinates", "[terrain]") {
    std::vector<i16> data = {10, 20, 30, 40};
    Heightmap hm(1, 1, 1.0f, data);

    CHECK_THAT(hm.get_height(-5.0f, -5.0f), WithinAbs(10.0, 0.01));
    CHECK_THAT(hm.get_height(10.0f, 10.0f), WithinAbs(40.0, 0.01));
    CHECK_THAT(hm.get_height(10.0f, -10.0f), WithinAbs(20.0, 0.01));
}

TEST_CASE("Heightmap origin and spacing", "[terrain]") {
    std::vector<i16> data = {0, 64, 128, 192};
    Heightmap hm(1, 1, 1.0f / 64.0f, data, {-10.0f, 20.0f}, 4.0f);

    CHECK_THAT(hm.get_height(-10.0f, 20.0f), WithinAbs(0.0, 1e-5));
    CHECK_THAT(hm.get_height(-6.0f, 20.0f), WithinAbs(1.0, 1e-5));
    CHECK_THAT(hm.get_height(-10.0f, 24.0f), WithinAbs(2.0, 1e-5));
    CHECK_THAT(hm.get_height(-8.0f, 22.0f), WithinAbs(1.5, 1e-5));
    CHECK_THAT(hm.surface_height(-8.0f, 22.0f), WithinAbs(1.5, 1e-5));
}

TEST_CASE("Heightmap pads short data", "[terrain]") {
    Heightmap hm(2, 1, 1.0f, {5, 5});
    CHECK_THAT(hm.get_height(0, 0), WithinAbs(5.0, 1e-5));
    CHECK_THAT(hm.get_height(2, 1), WithinAbs(0.0, 1e-5));
}

TEST_CASE("Flat heightmap", "[terrain]") {
    auto hm = Heightmap::flat(8, 8, 12.5f, {-40.0f, -40.0f}, 10.0f);
    const TerrainSampler& terrain = hm;
    for (f32 x : {-100.0f, -40.0f, 0.0f, 33.3f, 500.0f}) {
        CHECK_THAT(terrain.surface_height(x, -x), WithinAbs(12.5, 1e-5));
    }
}
