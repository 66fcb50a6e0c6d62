#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "map/flow_field.hpp"

#include <cmath>
#include <limits>

using namespace hf;
using namespace hf::map;
using Catch::Matchers::WithinAbs;

// ================================================================
// Grid & coordinate transforms
// ================================================================

TEST_CASE("FlowField construction", "[grid]") {
    FlowField f(20, 30, 2.0f, {-10.0f, -15.0f});

    CHECK(f.width() == 20);
    CHECK(f.height() == 30);
    CHECK(f.cell_size() == 2.0f);
    CHECK(f.origin() == Vector2{-10.0f, -15.0f});
    CHECK(f.cell_count() == 600);
    CHECK(f.costs().size() == 600);
    CHECK(f.integration_field().size() == 600);
    CHECK(f.directions().size() == 600);
    CHECK_FALSE(f.goal().has_value());
    CHECK(f.last_outcome() == SolveOutcome::NotSolved);

    // Fresh field: everything walkable at cost 1, nothing reached
    CHECK(f.cost(0, 0) == 1);
    CHECK(f.integration(3, 4) == FlowField::UNREACHED);
    CHECK(f.direction(3, 4) == Vector2{});
}

TEST_CASE("FlowField clamps degenerate construction parameters", "[grid]") {
    FlowField f(0, 0, -1.0f);
    CHECK(f.width() == 1);
    CHECK(f.height() == 1);
    CHECK(f.cell_size() > 0.0f);
    CHECK(f.cell_count() == 1);
}

TEST_CASE("world_to_grid floors relative to origin", "[grid]") {
    FlowField f(10, 10, 2.0f, {0.0f, 0.0f});

    CHECK(f.world_to_grid({0.0f, 0.0f, 0.0f}) == GridCoord{0, 0});
    CHECK(f.world_to_grid({5.0f, 0.0f, 7.0f}) == GridCoord{2, 3});
    CHECK(f.world_to_grid({19.99f, 0.0f, 0.1f}) == GridCoord{9, 0});

    // Not clamped: out-of-range positions map outside the grid
    CHECK(f.world_to_grid({20.0f, 0.0f, 0.0f}) == GridCoord{10, 0});
    CHECK(f.world_to_grid({-0.5f, 0.0f, -0.5f}) == GridCoord{-1, -1});

    // Y is ignored
    CHECK(f.world_to_grid({5.0f, 1000.0f, 7.0f}) == GridCoord{2, 3});
}

TEST_CASE("world_to_grid handles an offset origin", "[grid]") {
    FlowField f(10, 10, 2.0f, {-100.0f, 40.0f});
    CHECK(f.world_to_grid({-100.0f, 0.0f, 40.0f}) == GridCoord{0, 0});
    CHECK(f.world_to_grid({-91.0f, 0.0f, 59.0f}) == GridCoord{4, 9});
}

TEST_CASE("grid_to_world returns the cell centre", "[grid]") {
    FlowField f(10, 10, 2.0f, {-10.0f, 4.0f});
    Vector3 p = f.grid_to_world(0, 0);
    CHECK_THAT(p.x, WithinAbs(-9.0, 1e-5));
    CHECK_THAT(p.y, WithinAbs(0.0, 1e-5));
    CHECK_THAT(p.z, WithinAbs(5.0, 1e-5));

    p = f.grid_to_world(9, 3);
    CHECK_THAT(p.x, WithinAbs(9.0, 1e-5));
    CHECK_THAT(p.z, WithinAbs(11.0, 1e-5));
}

TEST_CASE("grid_to_world / world_to_grid round trip", "[grid]") {
    FlowField f(37, 23, 1.5f, {-20.25f, 13.5f});

    for (i32 z = 0; z < 23; ++z) {
        for (i32 x = 0; x < 37; ++x) {
            Vector3 w = f.grid_to_world(x, z);
            REQUIRE(f.world_to_grid(w) == GridCoord{x, z});
        }
    }
}

TEST_CASE("world position survives a round trip within one cell", "[grid]") {
    FlowField f(10, 10, 2.0f);
    Vector3 world{5.0f, 0.0f, 7.0f};
    GridCoord c = f.world_to_grid(world);
    Vector3 back = f.grid_to_world(c.x, c.z);
    CHECK(std::abs(back.x - world.x) < f.cell_size());
    CHECK(std::abs(back.z - world.z) < f.cell_size());
}

TEST_CASE("world_to_grid keeps non-finite input out of range", "[grid]") {
    FlowField f(10, 10, 1.0f);
    f32 inf = std::numeric_limits<f32>::infinity();
    f32 nan = std::numeric_limits<f32>::quiet_NaN();

    GridCoord a = f.world_to_grid({inf, 0.0f, -inf});
    CHECK_FALSE(f.in_bounds(a.x, a.z));
    GridCoord b = f.world_to_grid({nan, 0.0f, nan});
    CHECK_FALSE(f.in_bounds(b.x, b.z));
}

TEST_CASE("center is the middle of the addressable area", "[grid]") {
    FlowField f(10, 20, 2.0f, {-4.0f, 6.0f});
    Vector2 c = f.center();
    CHECK_THAT(c.x, WithinAbs(6.0, 1e-5));
    CHECK_THAT(c.y, WithinAbs(26.0, 1e-5));
}

TEST_CASE("Out-of-range reads are safe", "[grid]") {
    FlowField f(4, 4, 1.0f);
    CHECK_FALSE(f.is_walkable(-1, 0));
    CHECK_FALSE(f.is_walkable(0, 4));
    CHECK(f.cost(4, 0) == FlowField::BLOCKED);
    CHECK(f.integration(-1, -1) == FlowField::UNREACHED);
    CHECK(f.direction(100, 100) == Vector2{});
}

// ================================================================
// Obstacle editing
// ================================================================

TEST_CASE("set_blocked makes a cell unwalkable", "[obstacles]") {
    FlowField f(8, 8, 1.0f);
    CHECK(f.is_walkable(4, 4));
    f.set_blocked(4, 4);
    CHECK_FALSE(f.is_walkable(4, 4));
    CHECK(f.cost(4, 4) == FlowField::BLOCKED);

    // Idempotent
    f.set_blocked(4, 4);
    CHECK_FALSE(f.is_walkable(4, 4));

    // Neighbours untouched
    CHECK(f.is_walkable(3, 4));
    CHECK(f.is_walkable(4, 5));
}

TEST_CASE("set_blocked out of range is a no-op", "[obstacles]") {
    FlowField f(4, 4, 1.0f);
    f.set_blocked(-1, 2);
    f.set_blocked(4, 0);
    f.set_blocked(0, 100);
    for (u8 c : f.costs()) CHECK(c == 1);
}

TEST_CASE("set_cost clamps into the traversable range", "[obstacles]") {
    FlowField f(4, 4, 1.0f);

    f.set_cost(1, 1, 7);
    CHECK(f.cost(1, 1) == 7);

    f.set_cost(1, 1, 0);
    CHECK(f.cost(1, 1) == FlowField::MIN_COST);

    f.set_cost(1, 1, -50);
    CHECK(f.cost(1, 1) == FlowField::MIN_COST);

    f.set_cost(1, 1, 255);
    CHECK(f.cost(1, 1) == FlowField::MAX_COST);
    CHECK(f.is_walkable(1, 1));

    f.set_cost(1, 1, 100000);
    CHECK(f.cost(1, 1) == FlowField::MAX_COST);

    // Cost edits can also unblock a cell
    f.set_blocked(2, 2);
    f.set_cost(2, 2, 3);
    CHECK(f.is_walkable(2, 2));

    f.set_cost(9, 9, 5); // out of range: ignored
}

TEST_CASE("clear resets costs, solve and goal", "[obstacles]") {
    FlowField f(6, 6, 1.0f);
    f.set_blocked(2, 2);
    f.set_cost(3, 3, 40);
    f.set_goal_cell(0, 0);
    REQUIRE(f.goal().has_value());
    REQUIRE(f.integration(0, 0) == 0);

    f.clear();

    CHECK(f.is_walkable(2, 2));
    CHECK(f.cost(3, 3) == 1);
    CHECK_FALSE(f.goal().has_value());
    CHECK(f.last_outcome() == SolveOutcome::NotSolved);
    for (u16 v : f.integration_field()) CHECK(v == FlowField::UNREACHED);
    for (const auto& d : f.directions()) CHECK(d == Vector2{});
}

TEST_CASE("Obstacle edits wait for the next solve", "[obstacles]") {
    FlowField f(6, 1, 1.0f);
    f.set_goal_cell(0, 0);
    REQUIRE(f.integration(3, 0) != FlowField::UNREACHED);

    f.set_blocked(2, 0);
    // Snapshot from the previous solve is still published
    CHECK(f.integration(3, 0) != FlowField::UNREACHED);

    f.set_goal_cell(0, 0);
    CHECK(f.integration(2, 0) == FlowField::UNREACHED);
    CHECK(f.integration(3, 0) == FlowField::UNREACHED);
    CHECK(f.direction(3, 0) == Vector2{});
}

// ================================================================
// Goal handling
// ================================================================

TEST_CASE("set_goal re-centres the grid on the goal", "[goal]") {
    FlowField f(10, 10, 2.0f, {0.0f, 0.0f});
    f.set_goal({100.0f, 0.0f, 50.0f});

    REQUIRE(f.goal().has_value());
    CHECK_THAT(f.origin().x, WithinAbs(90.0, 1e-4));
    CHECK_THAT(f.origin().y, WithinAbs(40.0, 1e-4));
    CHECK(*f.goal() == GridCoord{5, 5});
    CHECK(f.integration(5, 5) == 0);

    Vector2 c = f.center();
    CHECK(std::abs(c.x - 100.0f) < f.cell_size());
    CHECK(std::abs(c.y - 50.0f) < f.cell_size());
}

TEST_CASE("set_goal_cell clamps into the grid", "[goal]") {
    FlowField f(10, 8, 1.0f);

    f.set_goal_cell(-5, 20);
    REQUIRE(f.goal().has_value());
    CHECK(*f.goal() == GridCoord{0, 7});

    f.set_goal_cell(50, -1);
    CHECK(*f.goal() == GridCoord{9, 0});
    CHECK(f.integration(9, 0) == 0);
}

TEST_CASE("set_goal_cell leaves the origin alone", "[goal]") {
    FlowField f(10, 10, 1.0f, {3.0f, -7.0f});
    f.set_goal_cell(2, 2);
    CHECK(f.origin() == Vector2{3.0f, -7.0f});
}
