#include <doctest/doctest.h>

#include <puppet/control/safety.hpp>

using namespace puppet;

namespace {
    constexpr dp::i64 kSecond = 1000000000;

    dp::Vector<dp::f64> filled(dp::usize n, dp::f64 v) {
        dp::Vector<dp::f64> out;
        out.assign(n, v);
        return out;
    }
} // namespace

TEST_CASE("safety: starts waiting and applies nothing") {
    dp::i64 now = 0;
    control::SafetyGate gate(1.5, 0.01, [&now] { return now; });

    CHECK(gate.state() == RobotState::WaitingToResume);
    CHECK(gate.waiting());
    CHECK_FALSE(gate.applies_actions());
    CHECK_FALSE(gate.deadline_ns().has_value());

    // Time alone never leaves WaitingToResume.
    now = 100 * kSecond;
    gate.update();
    CHECK(gate.waiting());
}

TEST_CASE("safety: resume enters cooldown until the deadline passes") {
    dp::i64 now = 5 * kSecond;
    control::SafetyGate gate(1.5, 0.01, [&now] { return now; });

    REQUIRE(gate.resume());
    CHECK(gate.in_cooldown());
    REQUIRE(gate.deadline_ns().has_value());
    CHECK(*gate.deadline_ns() == now + 1500000000);

    // A second resume while cooling down is ignored.
    CHECK_FALSE(gate.resume());

    now += 1499999999;
    gate.update();
    CHECK(gate.in_cooldown());

    now += 1;
    gate.update();
    CHECK(gate.state() == RobotState::Running);
    CHECK_FALSE(gate.deadline_ns().has_value());
}

TEST_CASE("safety: force_wait discards the cooldown from any state") {
    dp::i64 now = 0;
    control::SafetyGate gate(1.5, 0.01, [&now] { return now; });

    gate.resume();
    gate.force_wait();
    CHECK(gate.waiting());
    CHECK_FALSE(gate.deadline_ns().has_value());

    gate.resume();
    now = 2 * kSecond;
    gate.update();
    REQUIRE(gate.state() == RobotState::Running);
    gate.force_wait();
    CHECK(gate.waiting());
}

TEST_CASE("safety: cooldown clips each joint to max_delta from the measured pose") {
    dp::i64 now = 0;
    control::SafetyGate gate(1.5, 0.01, [&now] { return now; });

    dp::Vector<dp::f64> measured;
    measured.push_back(0.0);
    measured.push_back(1.0);
    measured.push_back(-0.5);

    dp::Vector<dp::f64> target;
    target.push_back(2.0);
    target.push_back(0.0);
    target.push_back(-0.495);

    // Outside cooldown the target passes through untouched.
    auto untouched = target;
    gate.clip(untouched, measured);
    CHECK(untouched[0] == doctest::Approx(2.0));

    gate.resume();
    gate.clip(target, measured);
    CHECK(target[0] == doctest::Approx(0.01));
    CHECK(target[1] == doctest::Approx(0.99));
    CHECK(target[2] == doctest::Approx(-0.495));
}

TEST_CASE("safety: clipping follows the live measured position") {
    dp::i64 now = 0;
    const dp::f64 max_delta = 0.02;
    control::SafetyGate gate(1.5, max_delta, [&now] { return now; });
    gate.resume();

    // A follower that only covers half of each commanded step creeps forward
    // without ever being asked to jump more than max_delta.
    auto measured = filled(3, 0.0);
    for (int tick = 0; tick < 50; ++tick) {
        auto target = filled(3, 1.0);
        gate.clip(target, measured);
        for (dp::usize i = 0; i < 3; ++i) {
            CHECK(target[i] - measured[i] <= max_delta + 1e-12);
            measured[i] += 0.5 * (target[i] - measured[i]);
        }
    }
    CHECK(measured[0] > 0.4);
    CHECK(measured[0] < 1.0);
}
