#pragma once

#include "puppet/config.hpp"
#include "puppet/topology/topology.hpp"

namespace puppet {
    namespace topology {

        /// Fixed-base robot with one or more identical arms, driven one at a time.
        ///
        /// The leader addresses a single arm per call ("<name>_arm", or the active
        /// arm when no component is given). Only the active arm's slice of the
        /// action is written; the others stay at zero.
        class ArmsOnly : public Topology {
          public:
            explicit ArmsOnly(const ArmsLayout &cfg) : arm_names_(cfg.names), joints_(cfg.joints_per_arm) {
                for (dp::usize a = 0; a < arm_names_.size(); ++a) {
                    slots_.push_back({arm_names_[a] + "_arm", {Part::Arm, static_cast<dp::u8>(a)}, joints_});
                }
            }

            const char *name() const override { return "arms"; }
            dp::usize action_dim() const override { return joints_ * arm_names_.size(); }
            bool positional() const override { return false; }
            bool trunk_coupled() const override { return false; }
            dp::f64 shoulder_direction(dp::usize) const override { return 0.0; }

            const std::vector<std::string> &arm_names() const override { return arm_names_; }
            const std::vector<SlotSpec> &slots() const override { return slots_; }

            const SlotSpec *default_slot(dp::usize active_arm) const override { return &slots_[active_arm]; }

            JointCommand blank_command(const JointFeedback &reset_state) const override {
                JointCommand cmd;
                cmd.arms.resize(arm_names_.size());
                for (dp::usize a = 0; a < arm_names_.size(); ++a) {
                    if (a < reset_state.arms.size() && reset_state.arms[a].positions.size() == joints_) {
                        cmd.arms[a] = reset_state.arms[a].positions;
                    } else {
                        cmd.arms[a].assign(joints_, 0.0);
                    }
                }
                cmd.buttons.fill(0.0);
                return cmd;
            }

            dp::Vector<dp::Vector<dp::f64>> arm_targets(const JointCommand &cmd, dp::usize active_arm) const override {
                dp::Vector<dp::Vector<dp::f64>> out;
                out.resize(arm_names_.size());
                out[active_arm] = cmd.arms[active_arm];
                return out;
            }

            ActionLayout layout() const override {
                ActionLayout l;
                for (dp::usize a = 0; a < arm_names_.size(); ++a) {
                    l.arms.push_back({a * joints_, joints_});
                }
                return l;
            }

            void assemble(const JointCommand &, const Targets &targets, dp::Vector<dp::f64> &action) const override {
                for (dp::usize a = 0; a < targets.arms.size(); ++a) {
                    write_slice(action, a * joints_, targets.arms[a]);
                }
            }

          private:
            std::vector<std::string> arm_names_;
            dp::usize joints_;
            std::vector<SlotSpec> slots_;
        };

    } // namespace topology
} // namespace puppet
