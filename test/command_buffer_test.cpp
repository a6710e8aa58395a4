#include <doctest/doctest.h>

#include <atomic>
#include <thread>

#include <puppet/control/command_buffer.hpp>
#include <puppet/topology/dual_arm_mobile.hpp>

using namespace puppet;

namespace {
    dp::Vector<dp::f64> filled(dp::usize n, dp::f64 v) {
        dp::Vector<dp::f64> out;
        out.assign(n, v);
        return out;
    }

    JointCommand blank_r1() {
        JointCommand cmd;
        cmd.arms.push_back(filled(6, 0.0));
        cmd.arms.push_back(filled(6, 0.0));
        cmd.grippers.push_back(filled(1, 0.0));
        cmd.grippers.push_back(filled(1, 0.0));
        cmd.base = filled(3, 0.0);
        cmd.trunk = filled(2, 0.0);
        return cmd;
    }

    bool uniform(const dp::Vector<dp::f64> &v) {
        for (auto x : v) {
            if (x != v[0]) {
                return false;
            }
        }
        return true;
    }
} // namespace

TEST_CASE("command buffer: snapshots never see a half-applied leader frame") {
    topology::DualArmMobile r1;
    control::CommandBuffer buffer;
    buffer.reset(blank_r1());

    auto ones = r1.split(filled(26, 1.0), dp::nullopt, 1);
    auto twos = r1.split(filled(26, 2.0), dp::nullopt, 1);
    REQUIRE(ones.is_ok());
    REQUIRE(twos.is_ok());

    std::atomic<bool> done{false};
    auto writer = [&buffer, &done](const dp::Vector<topology::Write> &frame) {
        while (!done.load()) {
            buffer.apply(frame);
        }
    };
    std::thread a(writer, ones.value());
    std::thread b(writer, twos.value());

    while (buffer.generation() < 3) {
        std::this_thread::yield();
    }

    int torn = 0;
    int mixed_arms = 0;
    for (int i = 0; i < 2000; ++i) {
        const auto snap = buffer.snapshot();
        for (const auto &arm : snap.arms) {
            if (arm.size() != 6 || !uniform(arm)) {
                ++torn;
            }
        }
        // One writer's frame lands as a whole, so both arms agree.
        if (snap.arms[0][0] != snap.arms[1][0]) {
            ++mixed_arms;
        }
    }

    done.store(true);
    a.join();
    b.join();

    CHECK(torn == 0);
    CHECK(mixed_arms == 0);
    CHECK(buffer.generation() > 1);
}

TEST_CASE("command buffer: button writes land on the button and nowhere else") {
    control::CommandBuffer buffer;
    buffer.reset(blank_r1());

    dp::Vector<topology::Write> writes;
    topology::Write press;
    press.ref = ComponentRef{Part::Button, static_cast<dp::u8>(Button::Home)};
    press.values = filled(1, 1.0);
    writes.push_back(press);
    buffer.apply(writes);

    const auto snap = buffer.snapshot();
    CHECK(snap.pressed(Button::Home));
    CHECK(snap.trunk.size() == 2);
    CHECK(snap.trunk[0] == doctest::Approx(0.0));
}
