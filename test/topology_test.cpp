#include <doctest/doctest.h>

#include <puppet/control/command_buffer.hpp>
#include <puppet/topology/factory.hpp>

using namespace puppet;

namespace {
    ComponentRef ref(Part part, dp::u8 index) { return ComponentRef{part, index}; }

    dp::Vector<dp::f64> iota(dp::usize n, dp::f64 start = 0.0) {
        dp::Vector<dp::f64> out;
        for (dp::usize i = 0; i < n; ++i) {
            out.push_back(start + static_cast<dp::f64>(i));
        }
        return out;
    }
} // namespace

TEST_CASE("topology: r1 layout widths") {
    topology::DualArmMobile r1;
    CHECK(r1.action_dim() == 21);
    CHECK(r1.command_width() == 26);
    CHECK(r1.arm_count() == 2);
    CHECK(r1.positional());
    CHECK(r1.trunk_coupled());
    CHECK(r1.shoulder_direction(0) == doctest::Approx(-1.0));
    CHECK(r1.shoulder_direction(1) == doctest::Approx(1.0));

    REQUIRE(r1.find_slot("button_home") != nullptr);
    CHECK(r1.find_slot("button_home")->ref == ref(Part::Button, static_cast<dp::u8>(Button::Home)));
    CHECK(r1.find_slot("tail") == nullptr);
}

TEST_CASE("topology: r1 splits a full vector into every component") {
    topology::DualArmMobile r1;
    auto writes = r1.split(iota(26), dp::nullopt, 1);
    REQUIRE(writes.is_ok());

    const auto &w = writes.value();
    REQUIRE(w.size() == 13);
    CHECK(w[0].ref == ref(Part::Arm, 0));
    CHECK(w[0].values.size() == 6);
    CHECK(w[1].ref == ref(Part::Arm, 1));
    CHECK(w[1].values[0] == doctest::Approx(6.0));
    CHECK(w[2].ref == ref(Part::Base, 0));
    CHECK(w[2].values[0] == doctest::Approx(12.0));
    CHECK(w[3].ref == ref(Part::Trunk, 0));
    CHECK(w[3].values.size() == 2);
    CHECK(w[4].ref == ref(Part::Gripper, 0));
    CHECK(w[5].ref == ref(Part::Gripper, 1));
    CHECK(w[6].ref == ref(Part::Button, static_cast<dp::u8>(Button::X)));
    CHECK(w[6].values[0] == doctest::Approx(19.0));
    CHECK(w[12].ref == ref(Part::Button, static_cast<dp::u8>(Button::Right)));
}

TEST_CASE("topology: r1 accepts a prefix ending on a component boundary") {
    topology::DualArmMobile r1;
    auto arms = r1.split(iota(12), dp::nullopt, 1);
    REQUIRE(arms.is_ok());
    CHECK(arms.value().size() == 2);

    auto with_base = r1.split(iota(15), dp::Optional<std::string>(std::string("ignored")), 1);
    REQUIRE(with_base.is_ok());
    CHECK(with_base.value().size() == 3);
}

TEST_CASE("topology: r1 rejects vectors that do not fit the layout") {
    topology::DualArmMobile r1;
    for (dp::usize n : {0, 1, 7, 13, 16, 27, 40}) {
        CAPTURE(n);
        auto res = r1.split(iota(n), dp::nullopt, 1);
        REQUIRE(res.is_err());
        CHECK(kind_of(res.error()) == ErrorKind::Protocol);
    }
}

TEST_CASE("topology: arms routes by component name or active arm") {
    ArmsLayout layout;
    layout.names = {"left", "right", "third"};
    layout.joints_per_arm = 7;
    topology::ArmsOnly arms(layout);

    CHECK(arms.action_dim() == 21);
    CHECK_FALSE(arms.positional());
    CHECK_FALSE(arms.trunk_coupled());

    auto named = arms.split(iota(7), dp::Optional<std::string>(std::string("third_arm")), 0);
    REQUIRE(named.is_ok());
    REQUIRE(named.value().size() == 1);
    CHECK(named.value()[0].ref == ref(Part::Arm, 2));

    auto active = arms.split(iota(7), dp::nullopt, 1);
    REQUIRE(active.is_ok());
    CHECK(active.value()[0].ref == ref(Part::Arm, 1));

    auto unknown = arms.split(iota(7), dp::Optional<std::string>(std::string("tail")), 0);
    REQUIRE(unknown.is_err());
    CHECK(kind_of(unknown.error()) == ErrorKind::InvalidComponent);

    auto short_vec = arms.split(iota(6), dp::nullopt, 0);
    REQUIRE(short_vec.is_err());
    CHECK(kind_of(short_vec.error()) == ErrorKind::Protocol);
}

TEST_CASE("topology: arms only targets the active arm") {
    topology::ArmsOnly arms(ArmsLayout{});
    JointFeedback fb;
    auto cmd = arms.blank_command(fb);
    cmd.arms[0] = iota(6, 1.0);
    cmd.arms[1] = iota(6, 10.0);

    auto targets = arms.arm_targets(cmd, 1);
    REQUIRE(targets.size() == 2);
    CHECK(targets[0].empty());
    CHECK(targets[1][0] == doctest::Approx(10.0));
}

TEST_CASE("topology: factory selects by robot name") {
    Config cfg;
    auto r1 = topology::make(cfg);
    REQUIRE(r1.is_ok());
    CHECK(std::string(r1.value()->name()) == "r1");

    cfg.robot = "arms";
    auto arms = topology::make(cfg);
    REQUIRE(arms.is_ok());
    CHECK(std::string(arms.value()->name()) == "arms");

    cfg.robot = "quadruped";
    auto unknown = topology::make(cfg);
    REQUIRE(unknown.is_err());
    CHECK(kind_of(unknown.error()) == ErrorKind::Configuration);
}

TEST_CASE("command buffer: later writes win per component") {
    topology::DualArmMobile r1;
    control::CommandBuffer buffer;
    buffer.reset(r1.blank_command(JointFeedback{}));
    const auto gen = buffer.generation();

    auto full = r1.split(iota(26), dp::nullopt, 1);
    REQUIRE(full.is_ok());
    buffer.apply(full.value());

    auto arms_only = r1.split(iota(12, 100.0), dp::nullopt, 1);
    REQUIRE(arms_only.is_ok());
    buffer.apply(arms_only.value());

    auto cmd = buffer.snapshot();
    CHECK(buffer.generation() == gen + 2);
    CHECK(cmd.arms[0][0] == doctest::Approx(100.0));
    CHECK(cmd.arms[1][5] == doctest::Approx(111.0));
    CHECK(cmd.base[0] == doctest::Approx(12.0));
    CHECK(cmd.grippers[1][0] == doctest::Approx(18.0));
    CHECK(cmd.pressed(Button::X));
    CHECK(cmd.buttons[static_cast<dp::usize>(Button::Right)] == doctest::Approx(25.0));
}

TEST_CASE("command buffer: blank r1 command opens the grippers and holds the reset pose") {
    topology::DualArmMobile r1;
    JointFeedback fb;
    ArmFeedback left;
    left.positions = iota(6, 0.5);
    fb.arms.push_back(left);
    fb.arms.push_back(ArmFeedback{});

    auto cmd = r1.blank_command(fb);
    CHECK(cmd.arms[0][0] == doctest::Approx(0.5));
    CHECK(cmd.arms[1].size() == 6);
    CHECK(cmd.grippers[0][0] == doctest::Approx(1.0));
    CHECK(cmd.base.size() == 3);
    CHECK(cmd.trunk.size() == 2);
    CHECK_FALSE(cmd.pressed(Button::X));
}

TEST_CASE("topology: command fields are addressed by explicit part") {
    topology::DualArmMobile r1;
    auto writes = r1.split(iota(26), dp::nullopt, 1);
    REQUIRE(writes.is_ok());
    control::CommandBuffer buffer;
    JointCommand blank;
    blank.arms.resize(2);
    blank.grippers.resize(2);
    buffer.reset(blank);
    buffer.apply(writes.value());
    auto cmd = buffer.snapshot();

    CHECK(cmd.vector_at(ref(Part::Button, 0)) == nullptr);
    CHECK(cmd.button_at(ref(Part::Trunk, 0)) == nullptr);
    CHECK(cmd.vector_at(ref(Part::Arm, 2)) == nullptr);
    CHECK(cmd.button_at(ref(Part::Button, static_cast<dp::u8>(kButtonCount))) == nullptr);

    CHECK(cmd.vector_at(ref(Part::Arm, 1)) == &cmd.arms[1]);
    CHECK(cmd.vector_at(ref(Part::Gripper, 0)) == &cmd.grippers[0]);
    CHECK(cmd.vector_at(ref(Part::Base, 0)) == &cmd.base);
    CHECK(cmd.vector_at(ref(Part::Trunk, 0)) == &cmd.trunk);
    REQUIRE(cmd.button_at(ref(Part::Button, static_cast<dp::u8>(Button::Home))) != nullptr);
    CHECK(*cmd.button_at(ref(Part::Button, static_cast<dp::u8>(Button::Home))) == doctest::Approx(23.0));
    CHECK(cmd.trunk.size() == 2);
}
