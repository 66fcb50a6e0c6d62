#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sim/ai_state.hpp"

#include <string>

using namespace hf;
using namespace hf::sim;
using Catch::Matchers::WithinAbs;

TEST_CASE("Idle starts chasing inside aggro range", "[ai]") {
    CHECK(next_ai_state(AIState::Idle, 79.0f, 80.0f, 2.0f) == AIState::Chasing);
    CHECK(next_ai_state(AIState::Idle, 80.0f, 80.0f, 2.0f) == AIState::Idle);
    // Idle never jumps straight to attacking
    CHECK(next_ai_state(AIState::Idle, 0.5f, 80.0f, 2.0f) == AIState::Chasing);
}

TEST_CASE("Chasing attacks in range and gives up with hysteresis", "[ai]") {
    CHECK(next_ai_state(AIState::Chasing, 1.9f, 80.0f, 2.0f) ==
          AIState::Attacking);
    CHECK(next_ai_state(AIState::Chasing, 2.0f, 80.0f, 2.0f) ==
          AIState::Chasing);

    // Between aggro and aggro * 1.5 the chase continues
    CHECK(next_ai_state(AIState::Chasing, 100.0f, 80.0f, 2.0f) ==
          AIState::Chasing);
    CHECK(next_ai_state(AIState::Chasing, 120.0f, 80.0f, 2.0f) ==
          AIState::Chasing);
    CHECK(next_ai_state(AIState::Chasing, 121.0f, 80.0f, 2.0f) ==
          AIState::Idle);
}

TEST_CASE("Attacking resumes the chase past the hysteresis band", "[ai]") {
    CHECK(next_ai_state(AIState::Attacking, 2.5f, 80.0f, 2.0f) ==
          AIState::Attacking);
    CHECK(next_ai_state(AIState::Attacking, 3.0f, 80.0f, 2.0f) ==
          AIState::Attacking);
    CHECK(next_ai_state(AIState::Attacking, 3.1f, 80.0f, 2.0f) ==
          AIState::Chasing);
}

TEST_CASE("Boundary distance does not flap", "[ai]") {
    // Sitting just outside attack range after an attack stays put
    AIState s = AIState::Chasing;
    s = next_ai_state(s, 1.9f, 80.0f, 2.0f);
    REQUIRE(s == AIState::Attacking);
    for (int i = 0; i < 10; ++i) {
        s = next_ai_state(s, 2.1f, 80.0f, 2.0f);
        CHECK(s == AIState::Attacking);
    }
}

TEST_CASE("Fleeing and Dead are sticky", "[ai]") {
    for (f32 d : {0.0f, 1.0f, 50.0f, 1000.0f}) {
        CHECK(next_ai_state(AIState::Fleeing, d, 80.0f, 2.0f) ==
              AIState::Fleeing);
        CHECK(next_ai_state(AIState::Dead, d, 80.0f, 2.0f) == AIState::Dead);
    }
}

TEST_CASE("Attack cooldown", "[ai]") {
    AIComponent ai(80.0f, 2.0f, 1.0f);
    CHECK(ai.state == AIState::Idle);
    CHECK(ai.can_attack());

    ai.trigger_attack();
    CHECK_FALSE(ai.can_attack());
    CHECK_THAT(ai.current_cooldown, WithinAbs(1.0, 1e-6));

    ai.update_cooldown(0.4f);
    CHECK_THAT(ai.current_cooldown, WithinAbs(0.6, 1e-6));
    CHECK_FALSE(ai.can_attack());

    ai.update_cooldown(5.0f);
    CHECK(ai.current_cooldown == 0.0f);
    CHECK(ai.can_attack());
}

TEST_CASE("AI state names and movement", "[ai]") {
    CHECK(std::string(ai_state_name(AIState::Chasing)) == "Chasing");
    CHECK(std::string(ai_state_name(AIState::Dead)) == "Dead");
    CHECK(is_moving(AIState::Chasing));
    CHECK(is_moving(AIState::Fleeing));
    CHECK_FALSE(is_moving(AIState::Attacking));
    CHECK_FALSE(is_moving(AIState::Idle));
}
