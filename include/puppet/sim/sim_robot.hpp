#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <utility>

#include <echo/echo.hpp>

#include "puppet/collaborators.hpp"
#include "puppet/control/torso.hpp"
#include "puppet/topology/topology.hpp"

namespace puppet {
    namespace sim {

        struct SimOptions {
            /// Fraction of the remaining error closed per step for position-controlled parts.
            dp::f64 tracking_gain = 0.5;
            dp::f64 dt = 1.0 / 30.0;

            /// Arm pose after reset(); empty means all zeros.
            dp::Vector<dp::f64> reset_arm_pose;
            dp::f64 reset_trunk_translate = 0.5;
            TorsoCalibration torso;

            /// Overrides the action dimension the robot reports (0 = match the topology).
            dp::usize action_dim_override = 0;
        };

        /// Kinematic stand-in for the simulator.
        ///
        /// Position-controlled parts (arms, grippers, torso) move a fixed fraction of
        /// the way to their target each step; the base integrates its velocity
        /// command. Joint vector layout: [base:3][torso][arm, gripper]*.
        class SimRobot : public Actuator {
          public:
            struct Pose {
                dp::Vector<dp::Vector<dp::f64>> arms;
                dp::Vector<dp::f64> grippers;
                dp::Vector<dp::f64> torso;
                dp::Vector<dp::f64> base; // x, y, yaw
            };

            struct State {
                Pose pose;
                dp::u64 frames = 0;
            };

            /// Optional per-frame goal feed; returns the status to report after that frame.
            using GoalScript = std::function<dp::Optional<GoalStatus>(dp::u64 frame)>;

            SimRobot(std::shared_ptr<const topology::Topology> topo, SimOptions opts = {})
                : topo_(std::move(topo)), opts_(std::move(opts)), layout_(topo_->layout()) {
                home_ = make_home();
                state_.pose = home_;
            }

            dp::usize action_dim() const override {
                return opts_.action_dim_override ? opts_.action_dim_override : topo_->action_dim();
            }

            dp::usize num_dofs() const override {
                dp::usize n = layout_.base.width + layout_.trunk.width;
                for (dp::usize a = 0; a < layout_.arms.size(); ++a) {
                    n += layout_.arms[a].width;
                    n += a < layout_.grippers.size() ? layout_.grippers[a].width : 0;
                }
                return n;
            }

            dp::Result<StepOutcome> step(const dp::Vector<dp::f64> &action) override {
                if (closed_) {
                    return fail<StepOutcome>(ErrorKind::Collaborator, "step on closed robot");
                }
                if (action.size() != action_dim()) {
                    return fail<StepOutcome>(ErrorKind::Collaborator, "action has " + std::to_string(action.size()) +
                                                                          " values, expected " +
                                                                          std::to_string(action_dim()));
                }
                auto &pose = state_.pose;
                for (dp::usize a = 0; a < layout_.arms.size(); ++a) {
                    track(pose.arms[a], action, layout_.arms[a]);
                }
                for (dp::usize g = 0; g < layout_.grippers.size(); ++g) {
                    dp::Vector<dp::f64> gripper;
                    gripper.assign(1, pose.grippers[g]);
                    track(gripper, action, layout_.grippers[g]);
                    pose.grippers[g] = gripper[0];
                }
                track(pose.torso, action, layout_.trunk);
                for (dp::usize i = 0; i < layout_.base.width; ++i) {
                    pose.base[i] += action[layout_.base.offset + i] * opts_.dt;
                }
                ++state_.frames;
                ++steps_;
                last_action_ = action;

                StepOutcome out;
                out.feedback = feedback();
                if (goal_script_) {
                    out.info.goal_status = goal_script_(state_.frames);
                }
                return dp::Result<StepOutcome>::ok(std::move(out));
            }

            dp::Result<Ack> idle_step() override {
                if (closed_) {
                    return fail<Ack>(ErrorKind::Collaborator, "step on closed robot");
                }
                ++state_.frames;
                ++idle_steps_;
                return ok();
            }

            dp::Result<JointFeedback> reset() override {
                if (closed_) {
                    return fail<JointFeedback>(ErrorKind::Collaborator, "reset on closed robot");
                }
                state_ = State{};
                state_.pose = home_;
                ++resets_;
                return dp::Result<JointFeedback>::ok(feedback());
            }

            JointFeedback feedback() const override {
                const auto &pose = state_.pose;
                JointFeedback fb;
                fb.positions = pose.base;
                for (auto q : pose.torso) {
                    fb.positions.push_back(q);
                }
                fb.torso = pose.torso;
                fb.base_contact = base_contact_;
                for (dp::usize a = 0; a < pose.arms.size(); ++a) {
                    ArmFeedback arm;
                    arm.positions = pose.arms[a];
                    arm.velocities.assign(pose.arms[a].size(), 0.0);
                    if (a < pose.grippers.size()) {
                        arm.gripper_positions.assign(1, pose.grippers[a]);
                    }
                    arm.contact = a < arm_contact_.size() && arm_contact_[a];
                    for (auto q : arm.positions) {
                        fb.positions.push_back(q);
                    }
                    for (auto q : arm.gripper_positions) {
                        fb.positions.push_back(q);
                    }
                    fb.arms.push_back(std::move(arm));
                }
                fb.velocities.assign(fb.positions.size(), 0.0);
                return fb;
            }

            void close() override {
                if (!closed_) {
                    echo::info("sim robot closed after ", steps_, " steps");
                }
                closed_ = true;
            }

            // -- Test and recorder hooks --

            const State &state() const { return state_; }
            void restore(const State &s) { state_ = s; }

            /// Move an arm directly, as an external disturbance would.
            void set_arm(dp::usize arm, dp::Vector<dp::f64> q) { state_.pose.arms[arm] = std::move(q); }

            void set_goal_script(GoalScript script) { goal_script_ = std::move(script); }
            void set_contacts(bool base, dp::Vector<bool> arms) {
                base_contact_ = base;
                arm_contact_ = std::move(arms);
            }

            dp::u64 steps() const { return steps_; }
            dp::u64 idle_steps() const { return idle_steps_; }
            dp::u64 resets() const { return resets_; }
            bool closed() const { return closed_; }
            const dp::Vector<dp::f64> &last_action() const { return last_action_; }

          private:
            Pose make_home() const {
                Pose p;
                for (const auto &slice : layout_.arms) {
                    dp::Vector<dp::f64> q;
                    q.assign(slice.width, 0.0);
                    for (dp::usize i = 0; i < slice.width && i < opts_.reset_arm_pose.size(); ++i) {
                        q[i] = opts_.reset_arm_pose[i];
                    }
                    p.arms.push_back(std::move(q));
                }
                p.grippers.assign(layout_.grippers.size(), 1.0);
                if (layout_.trunk.width > 0) {
                    p.torso = control::convert_to_torso_pose(opts_.reset_trunk_translate, opts_.torso);
                }
                p.base.assign(layout_.base.width, 0.0);
                return p;
            }

            void track(dp::Vector<dp::f64> &q, const dp::Vector<dp::f64> &action, const topology::Slice &slice) const {
                for (dp::usize i = 0; i < slice.width && i < q.size(); ++i) {
                    q[i] += opts_.tracking_gain * (action[slice.offset + i] - q[i]);
                }
            }

            std::shared_ptr<const topology::Topology> topo_;
            SimOptions opts_;
            topology::ActionLayout layout_;
            Pose home_;
            State state_;
            GoalScript goal_script_;
            bool base_contact_ = false;
            dp::Vector<bool> arm_contact_;
            dp::u64 steps_ = 0;
            dp::u64 idle_steps_ = 0;
            dp::u64 resets_ = 0;
            dp::Vector<dp::f64> last_action_;
            bool closed_ = false;
        };

        /// Recorder over a SimRobot: checkpoints are full state copies.
        class SimRecorder : public Recorder {
          public:
            explicit SimRecorder(SimRobot &robot) : robot_(robot) {}

            dp::Result<Ack> update_checkpoint() override {
                if (saved_) {
                    return fail<Ack>(ErrorKind::Collaborator, "episode already saved");
                }
                checkpoint_ = robot_.state();
                ++checkpoints_;
                return ok();
            }

            dp::Result<Ack> rollback_to_checkpoint() override {
                if (!checkpoint_.has_value()) {
                    return fail<Ack>(ErrorKind::Collaborator, "no checkpoint to roll back to");
                }
                robot_.restore(*checkpoint_);
                ++rollbacks_;
                return ok();
            }

            dp::Result<Ack> save_data() override {
                if (saved_) {
                    return ok();
                }
                saved_ = true;
                echo::info("episode saved: ", robot_.state().frames, " frames, ", checkpoints_, " checkpoints, ",
                           rollbacks_, " rollbacks");
                return ok();
            }

            dp::u64 checkpoints() const { return checkpoints_; }
            dp::u64 rollbacks() const { return rollbacks_; }
            bool saved() const { return saved_; }
            const dp::Optional<SimRobot::State> &checkpoint() const { return checkpoint_; }

          private:
            SimRobot &robot_;
            dp::Optional<SimRobot::State> checkpoint_;
            dp::u64 checkpoints_ = 0;
            dp::u64 rollbacks_ = 0;
            bool saved_ = false;
        };

    } // namespace sim
} // namespace puppet
