#pragma once

#include <array>
#include <string>

#include <datapod/adapters.hpp>
#include <datapod/datapod.hpp>

namespace puppet {

    /// Placeholder value for operations that succeed without producing anything.
    struct Ack {};

    enum class RobotState : dp::u8 {
        WaitingToResume = 0,
        Cooldown = 1,
        Running = 2,
    };

    inline const char *to_string(RobotState s) {
        switch (s) {
        case RobotState::WaitingToResume:
            return "waiting_to_resume";
        case RobotState::Cooldown:
            return "cooldown";
        case RobotState::Running:
            return "running";
        }
        return "unknown";
    }

    /// Leader device buttons, in the order they trail the joint values of a
    /// positional command.
    enum class Button : dp::u8 {
        X = 0,    // resume / manual checkpoint
        Y = 1,    // rollback
        B = 2,    // camera toggle
        A = 3,    // visibility toggle
        Home = 4, // reset
        Left = 5, // left light
        Right = 6 // right light
    };

    static constexpr dp::usize kButtonCount = 7;

    inline const char *button_name(Button b) {
        static constexpr std::array<const char *, kButtonCount> names = {"x", "y", "b", "a", "home", "left", "right"};
        return names[static_cast<dp::usize>(b)];
    }

    enum class Side : dp::u8 {
        Left = 0,
        Right = 1,
    };

    /// Discrete operator events delivered through the RPC event queue.
    enum class Event : dp::u8 {
        Resume = 1,
        Reset = 2,
        Stop = 3,
    };

    // =============================================================================================
    // Command record
    // =============================================================================================

    /// Which field of a JointCommand a slot of the wire layout targets.
    enum class Part : dp::u8 {
        Arm = 0,
        Gripper = 1,
        Base = 2,
        Trunk = 3,
        Button = 4,
    };

    struct ComponentRef {
        Part part = Part::Arm;
        dp::u8 index = 0;

        bool operator==(const ComponentRef &o) const { return part == o.part && index == o.index; }
    };

    /// Latest raw command from the leader.
    ///
    /// Field widths are fixed by the robot topology; Topology::blank_command()
    /// produces a correctly sized record and every write is checked against it.
    struct JointCommand {
        dp::Vector<dp::Vector<dp::f64>> arms;
        dp::Vector<dp::Vector<dp::f64>> grippers;
        dp::Vector<dp::f64> base;
        dp::Vector<dp::f64> trunk;
        std::array<dp::f64, kButtonCount> buttons{};

        /// Vector field a ref targets. Buttons are scalars and have none.
        dp::Vector<dp::f64> *vector_at(const ComponentRef &ref) {
            switch (ref.part) {
            case Part::Arm:
                return ref.index < arms.size() ? &arms[ref.index] : nullptr;
            case Part::Gripper:
                return ref.index < grippers.size() ? &grippers[ref.index] : nullptr;
            case Part::Base:
                return &base;
            case Part::Trunk:
                return &trunk;
            case Part::Button:
                return nullptr;
            }
            return nullptr;
        }

        /// Level of the button a ref targets, or nullptr for non-button refs.
        dp::f64 *button_at(const ComponentRef &ref) {
            if (ref.part != Part::Button || ref.index >= kButtonCount) {
                return nullptr;
            }
            return &buttons[ref.index];
        }

        bool pressed(Button b) const { return buttons[static_cast<dp::usize>(b)] != 0.0; }
    };

    // =============================================================================================
    // Feedback from the actuator
    // =============================================================================================

    struct ArmFeedback {
        dp::Vector<dp::f64> positions;
        dp::Vector<dp::f64> velocities;
        dp::Vector<dp::f64> gripper_positions;
        bool contact = false;
    };

    /// Measured robot state, read from the actuator once per tick.
    struct JointFeedback {
        dp::Vector<dp::f64> positions;
        dp::Vector<dp::f64> velocities;
        dp::Vector<ArmFeedback> arms;
        dp::Vector<dp::f64> torso; // empty when the robot has no trunk
        bool base_contact = false;
        bool trunk_contact = false;
    };

    /// Indices of satisfied and unsatisfied task-goal conditions.
    struct GoalStatus {
        dp::Vector<dp::u32> satisfied;
        dp::Vector<dp::u32> unsatisfied;
    };

    struct StepInfo {
        dp::Optional<GoalStatus> goal_status;
    };

    struct StepOutcome {
        JointFeedback feedback;
        dp::f64 reward = 0.0;
        bool terminated = false;
        bool truncated = false;
        StepInfo info;
    };

    // =============================================================================================
    // Observation served to the leader
    // =============================================================================================

    struct ArmObservation {
        std::string name;
        dp::Vector<dp::f64> joint_positions; // tilt offset removed
        dp::Vector<dp::f64> joint_velocities;
        dp::Vector<dp::f64> gripper_positions;
        bool contact = false;
        dp::f64 gripper_command = 0.0;
    };

    struct Observation {
        std::string active_arm;
        bool in_cooldown = false;
        bool waiting_to_resume = true;
        bool base_contact = false;
        bool trunk_contact = false;
        bool reset_joints = false;
        dp::Vector<ArmObservation> arms;
    };

    /// One named entry of the flattened observation mapping sent over the wire.
    struct NamedArray {
        std::string name;
        dp::Vector<dp::f64> values;
    };

    using ObservationMap = dp::Vector<NamedArray>;

    inline dp::Vector<dp::f64> scalar(dp::f64 v) {
        dp::Vector<dp::f64> out;
        out.push_back(v);
        return out;
    }

    inline ObservationMap flatten(const Observation &obs, dp::usize active_arm_index) {
        auto flag = [](bool b) { return scalar(b ? 1.0 : 0.0); };

        ObservationMap out;
        out.push_back({"active_arm", scalar(static_cast<dp::f64>(active_arm_index))});
        out.push_back({"in_cooldown", flag(obs.in_cooldown)});
        out.push_back({"waiting_to_resume", flag(obs.waiting_to_resume)});
        out.push_back({"base_contact", flag(obs.base_contact)});
        out.push_back({"trunk_contact", flag(obs.trunk_contact)});
        out.push_back({"reset_joints", flag(obs.reset_joints)});
        for (const auto &arm : obs.arms) {
            const std::string prefix = "arm_" + arm.name;
            out.push_back({prefix + "_joint_positions", arm.joint_positions});
            out.push_back({prefix + "_joint_velocities", arm.joint_velocities});
            out.push_back({prefix + "_gripper_positions", arm.gripper_positions});
            out.push_back({prefix + "_contact", flag(arm.contact)});
            out.push_back({arm.name + "_gripper", scalar(arm.gripper_command)});
        }
        return out;
    }

    inline const NamedArray *find(const ObservationMap &map, const std::string &name) {
        for (const auto &entry : map) {
            if (entry.name == name) {
                return &entry;
            }
        }
        return nullptr;
    }

} // namespace puppet
