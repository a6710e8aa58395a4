#pragma once

#include "puppet/topology/topology.hpp"

namespace puppet {
    namespace topology {

        /// Two 6-DOF arms on a lifting, tilting trunk over a holonomic base (R1).
        ///
        /// Leader vector (26 values):
        ///   [left_arm:6][right_arm:6][base:3][trunk:2][left_gripper:1][right_gripper:1]
        ///   [x][y][b][a][home][left][right]
        ///
        /// Action vector (21 values):
        ///   [base:3][trunk:4][left_arm:6][left_gripper:1][right_arm:6][right_gripper:1]
        class DualArmMobile : public Topology {
          public:
            static constexpr dp::usize kArmJoints = 6;
            static constexpr dp::usize kBaseDims = 3;
            static constexpr dp::usize kTrunkCmdDims = 2;
            static constexpr dp::usize kTorsoJoints = 4;

            static constexpr dp::usize kBaseOffset = 0;
            static constexpr dp::usize kTrunkOffset = kBaseOffset + kBaseDims;
            static constexpr dp::usize kLeftArmOffset = kTrunkOffset + kTorsoJoints;
            static constexpr dp::usize kLeftGripperOffset = kLeftArmOffset + kArmJoints;
            static constexpr dp::usize kRightArmOffset = kLeftGripperOffset + 1;
            static constexpr dp::usize kRightGripperOffset = kRightArmOffset + kArmJoints;
            static constexpr dp::usize kActionDim = kRightGripperOffset + 1;

            static constexpr dp::usize kLeft = 0;
            static constexpr dp::usize kRight = 1;

            DualArmMobile() {
                arm_names_ = {"left", "right"};
                slots_ = {
                    {"left_arm", {Part::Arm, kLeft}, kArmJoints},
                    {"right_arm", {Part::Arm, kRight}, kArmJoints},
                    {"base", {Part::Base, 0}, kBaseDims},
                    {"trunk", {Part::Trunk, 0}, kTrunkCmdDims},
                    {"left_gripper", {Part::Gripper, kLeft}, 1},
                    {"right_gripper", {Part::Gripper, kRight}, 1},
                };
                for (dp::usize b = 0; b < kButtonCount; ++b) {
                    slots_.push_back({std::string("button_") + button_name(static_cast<Button>(b)),
                                      {Part::Button, static_cast<dp::u8>(b)},
                                      1});
                }
            }

            const char *name() const override { return "r1"; }
            dp::usize action_dim() const override { return kActionDim; }
            bool positional() const override { return true; }
            bool trunk_coupled() const override { return true; }

            dp::f64 shoulder_direction(dp::usize arm) const override { return arm == kLeft ? -1.0 : 1.0; }

            const std::vector<std::string> &arm_names() const override { return arm_names_; }
            const std::vector<SlotSpec> &slots() const override { return slots_; }

            const SlotSpec *default_slot(dp::usize) const override { return &slots_[kRight]; }

            JointCommand blank_command(const JointFeedback &reset_state) const override {
                JointCommand cmd;
                cmd.arms.resize(2);
                cmd.grippers.resize(2);
                for (dp::usize a = 0; a < 2; ++a) {
                    if (a < reset_state.arms.size() && reset_state.arms[a].positions.size() == kArmJoints) {
                        cmd.arms[a] = reset_state.arms[a].positions;
                    } else {
                        cmd.arms[a].assign(kArmJoints, 0.0);
                    }
                    // Grippers start open.
                    cmd.grippers[a].assign(1, 1.0);
                }
                cmd.base.assign(kBaseDims, 0.0);
                cmd.trunk.assign(kTrunkCmdDims, 0.0);
                cmd.buttons.fill(0.0);
                return cmd;
            }

            dp::Vector<dp::Vector<dp::f64>> arm_targets(const JointCommand &cmd, dp::usize) const override {
                return cmd.arms;
            }

            ActionLayout layout() const override {
                ActionLayout l;
                l.arms.push_back({kLeftArmOffset, kArmJoints});
                l.arms.push_back({kRightArmOffset, kArmJoints});
                l.grippers.push_back({kLeftGripperOffset, 1});
                l.grippers.push_back({kRightGripperOffset, 1});
                l.base = {kBaseOffset, kBaseDims};
                l.trunk = {kTrunkOffset, kTorsoJoints};
                return l;
            }

            void assemble(const JointCommand &cmd, const Targets &targets, dp::Vector<dp::f64> &action) const override {
                write_slice(action, kBaseOffset, cmd.base);
                write_slice(action, kTrunkOffset, targets.torso);
                write_slice(action, kLeftArmOffset, targets.arms[kLeft]);
                write_slice(action, kLeftGripperOffset, cmd.grippers[kLeft]);
                write_slice(action, kRightArmOffset, targets.arms[kRight]);
                write_slice(action, kRightGripperOffset, cmd.grippers[kRight]);
            }

          private:
            std::vector<std::string> arm_names_;
            std::vector<SlotSpec> slots_;
        };

    } // namespace topology
} // namespace puppet
