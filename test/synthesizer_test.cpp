#include <doctest/doctest.h>

#include <memory>

#include <puppet/control/synthesizer.hpp>
#include <puppet/topology/dual_arm_mobile.hpp>

using namespace puppet;
using topology::DualArmMobile;

namespace {
    constexpr dp::i64 kSecond = 1000000000;

    JointFeedback resting_feedback() {
        JointFeedback fb;
        for (int a = 0; a < 2; ++a) {
            ArmFeedback arm;
            arm.positions.assign(6, 0.0);
            fb.arms.push_back(arm);
        }
        return fb;
    }

    struct CountingObserver : ActionObserver {
        int frames = 0;
        dp::usize last_dim = 0;
        void on_action(const ActionFrame &frame) override {
            ++frames;
            last_dim = frame.action.size();
        }
    };
} // namespace

TEST_CASE("synthesizer: r1 action places every part") {
    auto topo = std::make_shared<DualArmMobile>();
    Config cfg;
    control::ActionSynthesizer synth(topo, cfg);
    dp::i64 now = 0;
    control::SafetyGate gate(cfg.cooldown_s, cfg.cooldown_max_delta(), [&now] { return now; });

    const auto fb = resting_feedback();
    auto cmd = topo->blank_command(fb);
    cmd.arms[0].assign(6, 0.1);
    cmd.arms[1].assign(6, 0.2);
    cmd.base[0] = 0.3;
    cmd.base[2] = -0.4;
    cmd.grippers[0][0] = 0.25;
    cmd.grippers[1][0] = 0.75;

    auto action = synth.synthesize(cmd, fb, gate, 1);
    REQUIRE(action.size() == DualArmMobile::kActionDim);

    CHECK(action[DualArmMobile::kBaseOffset] == doctest::Approx(0.3));
    CHECK(action[DualArmMobile::kBaseOffset + 2] == doctest::Approx(-0.4));

    auto torso = control::convert_to_torso_pose(cfg.default_trunk_translate, cfg.torso);
    for (dp::usize i = 0; i < DualArmMobile::kTorsoJoints; ++i) {
        CHECK(action[DualArmMobile::kTrunkOffset + i] == doctest::Approx(torso[i]));
    }

    CHECK(action[DualArmMobile::kLeftArmOffset] == doctest::Approx(0.1));
    CHECK(action[DualArmMobile::kLeftGripperOffset] == doctest::Approx(0.25));
    CHECK(action[DualArmMobile::kRightArmOffset + 5] == doctest::Approx(0.2));
    CHECK(action[DualArmMobile::kRightGripperOffset] == doctest::Approx(0.75));
}

TEST_CASE("synthesizer: trunk stays in range under extreme rates") {
    auto topo = std::make_shared<DualArmMobile>();
    Config cfg;
    control::ActionSynthesizer synth(topo, cfg);
    control::SafetyGate gate(cfg.cooldown_s, cfg.cooldown_max_delta());

    const auto fb = resting_feedback();
    auto cmd = topo->blank_command(fb);

    cmd.trunk[0] = 1e9;
    auto up = synth.synthesize(cmd, fb, gate, 1);
    CHECK(synth.trunk().translate() == doctest::Approx(0.0));
    CHECK(up[DualArmMobile::kTrunkOffset] == doctest::Approx(cfg.torso.upright[0]));

    cmd.trunk[0] = -1e9;
    auto down = synth.synthesize(cmd, fb, gate, 1);
    CHECK(synth.trunk().translate() == doctest::Approx(2.0));
    CHECK(down[DualArmMobile::kTrunkOffset] == doctest::Approx(cfg.torso.ground[0]));

    synth.reset();
    CHECK(synth.trunk().translate() == doctest::Approx(cfg.default_trunk_translate));
}

TEST_CASE("synthesizer: trunk tilt shifts each shoulder by its direction") {
    auto topo = std::make_shared<DualArmMobile>();
    Config cfg;
    control::ActionSynthesizer synth(topo, cfg);
    control::SafetyGate gate(cfg.cooldown_s, cfg.cooldown_max_delta());
    synth.trunk().set_tilt(0.2);

    const auto fb = resting_feedback();
    auto cmd = topo->blank_command(fb);
    cmd.arms[0][0] = 1.0;
    cmd.arms[1][0] = 1.0;

    auto action = synth.synthesize(cmd, fb, gate, 1);
    CHECK(action[DualArmMobile::kLeftArmOffset] == doctest::Approx(0.8));
    CHECK(action[DualArmMobile::kRightArmOffset] == doctest::Approx(1.2));
    // Only the first joint is coupled to the trunk.
    CHECK(action[DualArmMobile::kLeftArmOffset + 1] == doctest::Approx(0.0));
}

TEST_CASE("synthesizer: cooldown clips arms but not base, trunk or grippers") {
    auto topo = std::make_shared<DualArmMobile>();
    Config cfg;
    control::ActionSynthesizer synth(topo, cfg);
    dp::i64 now = 0;
    control::SafetyGate gate(cfg.cooldown_s, cfg.cooldown_max_delta(), [&now] { return now; });
    gate.resume();

    const auto fb = resting_feedback();
    auto cmd = topo->blank_command(fb);
    cmd.arms[0].assign(6, 1.0);
    cmd.arms[1].assign(6, -1.0);
    cmd.base[0] = 0.5;
    cmd.grippers[0][0] = 0.0;

    const dp::f64 max_delta = cfg.cooldown_max_delta();
    auto clipped = synth.synthesize(cmd, fb, gate, 1);
    for (dp::usize i = 0; i < DualArmMobile::kArmJoints; ++i) {
        CHECK(clipped[DualArmMobile::kLeftArmOffset + i] == doctest::Approx(max_delta));
        CHECK(clipped[DualArmMobile::kRightArmOffset + i] == doctest::Approx(-max_delta));
    }
    CHECK(clipped[DualArmMobile::kBaseOffset] == doctest::Approx(0.5));
    CHECK(clipped[DualArmMobile::kLeftGripperOffset] == doctest::Approx(0.0));

    now = 2 * kSecond;
    gate.update();
    REQUIRE(gate.state() == RobotState::Running);
    auto running = synth.synthesize(cmd, fb, gate, 1);
    CHECK(running[DualArmMobile::kLeftArmOffset] == doctest::Approx(1.0));
}

TEST_CASE("synthesizer: observers see every action") {
    auto topo = std::make_shared<DualArmMobile>();
    Config cfg;
    control::ActionSynthesizer synth(topo, cfg);
    control::SafetyGate gate(cfg.cooldown_s, cfg.cooldown_max_delta());
    CountingObserver observer;
    synth.subscribe(&observer);
    synth.subscribe(nullptr);

    const auto fb = resting_feedback();
    auto cmd = topo->blank_command(fb);
    synth.synthesize(cmd, fb, gate, 1);
    synth.synthesize(cmd, fb, gate, 1);
    CHECK(observer.frames == 2);
    CHECK(observer.last_dim == DualArmMobile::kActionDim);
}
