#pragma once

#include <memory>
#include <utility>

#include <echo/echo.hpp>

#include "puppet/collaborators.hpp"
#include "puppet/config.hpp"
#include "puppet/control/safety.hpp"
#include "puppet/control/torso.hpp"
#include "puppet/topology/topology.hpp"

namespace puppet {
    namespace control {

        /// Builds the actuator-ready action vector from the latest command.
        ///
        /// Per arm: trunk tilt compensation on the first joint, then cooldown
        /// clipping against the measured pose. The trunk lift is integrated from the
        /// leader's rate command and mapped to torso joints. The topology places
        /// every part in the action. Observers see each action after assembly.
        class ActionSynthesizer {
          public:
            ActionSynthesizer(std::shared_ptr<const topology::Topology> topo, const Config &cfg)
                : topo_(std::move(topo)), torso_cal_(cfg.torso), dt_(cfg.tick_period_s()),
                  trunk_(cfg.default_trunk_translate) {}

            void subscribe(ActionObserver *observer) {
                if (observer) {
                    observers_.push_back(observer);
                }
            }

            void reset() { trunk_.reset(); }

            TrunkIntegrator &trunk() { return trunk_; }
            const TrunkIntegrator &trunk() const { return trunk_; }

            dp::Vector<dp::f64> synthesize(const JointCommand &cmd, const JointFeedback &fb, const SafetyGate &gate,
                                           dp::usize active_arm) {
                topology::Targets targets;
                targets.arms = topo_->arm_targets(cmd, active_arm);

                for (dp::usize a = 0; a < targets.arms.size(); ++a) {
                    auto &target = targets.arms[a];
                    if (target.empty()) {
                        continue;
                    }
                    if (topo_->trunk_coupled()) {
                        target[0] += trunk_.tilt() * topo_->shoulder_direction(a);
                    }
                    if (a < fb.arms.size()) {
                        gate.clip(target, fb.arms[a].positions);
                    }
                }

                if (topo_->trunk_coupled()) {
                    const dp::f64 rate = cmd.trunk.empty() ? 0.0 : cmd.trunk[0];
                    targets.torso = convert_to_torso_pose(trunk_.integrate(rate, dt_), torso_cal_);
                }

                dp::Vector<dp::f64> action;
                action.assign(topo_->action_dim(), 0.0);
                topo_->assemble(cmd, targets, action);

                echo::trace("synthesized action dim=", action.size(), " trunk=", trunk_.translate());

                if (!observers_.empty()) {
                    ActionFrame frame;
                    frame.action = action;
                    frame.arm_targets = targets.arms;
                    frame.feedback = &fb;
                    for (auto *obs : observers_) {
                        obs->on_action(frame);
                    }
                }
                return action;
            }

          private:
            std::shared_ptr<const topology::Topology> topo_;
            TorsoCalibration torso_cal_;
            dp::f64 dt_;
            TrunkIntegrator trunk_;
            dp::Vector<ActionObserver *> observers_;
        };

    } // namespace control
} // namespace puppet
