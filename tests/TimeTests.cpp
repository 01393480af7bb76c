#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "ditch/core/Time.hpp"

TEST_CASE("FrameClock seeds on the first update", "[time]") {
    ditch::core::FrameClock clock;
    REQUIRE_FALSE(clock.HasStarted());

    REQUIRE(clock.Update(12.0) == 0.0f);
    REQUIRE(clock.HasStarted());

    REQUIRE(clock.Update(12.25) == Catch::Approx(0.25f));
    REQUIRE(clock.Update(12.75) == Catch::Approx(0.5f));
    REQUIRE(clock.TotalTime() == Catch::Approx(0.75));
}

TEST_CASE("FrameClock ignores timestamps that run backwards", "[time]") {
    ditch::core::FrameClock clock;
    clock.Update(5.0);

    REQUIRE(clock.Update(4.0) == 0.0f);
    REQUIRE(clock.Update(4.5) == Catch::Approx(0.5f));
}

TEST_CASE("FrameClock clamps stalls to the max delta", "[time]") {
    ditch::core::FrameClock clock(0.1);
    clock.Update(0.0);

    REQUIRE(clock.Update(3.0) == Catch::Approx(0.1f));
    REQUIRE(clock.DeltaTime() == Catch::Approx(0.1f));

    clock.SetMaxDelta(-1.0);
    REQUIRE(clock.GetMaxDelta() == 0.0);
    REQUIRE(clock.Update(5.0) == Catch::Approx(2.0f));

    clock.Reset();
    REQUIRE_FALSE(clock.HasStarted());
    REQUIRE(clock.TotalTime() == 0.0);
}
