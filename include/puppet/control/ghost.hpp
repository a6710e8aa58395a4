#pragma once

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include "puppet/collaborators.hpp"

namespace puppet {
    namespace control {

        /// Shows an arm's ghost when the follower falls behind its command.
        ///
        /// An arm appears after its deviation has exceeded the threshold for
        /// `appear_ticks` consecutive actions and disappears as soon as it drops back.
        class GhostMonitor : public ActionObserver {
          public:
            GhostMonitor(Scene *scene, std::vector<std::string> arms, dp::f64 threshold, dp::u32 appear_ticks)
                : scene_(scene), arms_(std::move(arms)), threshold_(threshold), appear_ticks_(appear_ticks),
                  counters_(arms_.size(), 0), visible_(arms_.size(), false) {}

            void on_action(const ActionFrame &frame) override {
                if (!frame.feedback) {
                    return;
                }
                for (dp::usize a = 0; a < arms_.size() && a < frame.arm_targets.size(); ++a) {
                    const auto &target = frame.arm_targets[a];
                    if (target.empty() || a >= frame.feedback->arms.size()) {
                        continue;
                    }
                    const auto &measured = frame.feedback->arms[a].positions;
                    dp::f64 worst = 0.0;
                    for (dp::usize j = 0; j < target.size() && j < measured.size(); ++j) {
                        worst = std::max(worst, std::abs(measured[j] - target[j]));
                    }

                    if (worst > threshold_) {
                        ++counters_[a];
                        if (counters_[a] >= appear_ticks_) {
                            set(a, true);
                        }
                    } else {
                        counters_[a] = 0;
                        set(a, false);
                    }
                }
            }

            void reset() {
                for (dp::usize a = 0; a < arms_.size(); ++a) {
                    counters_[a] = 0;
                    set(a, false);
                }
            }

            bool visible(dp::usize arm) const { return visible_[arm]; }

          private:
            void set(dp::usize arm, bool visible) {
                if (visible_[arm] == visible) {
                    return;
                }
                visible_[arm] = visible;
                if (scene_) {
                    scene_->set_ghost_visible(arms_[arm], visible);
                }
            }

            Scene *scene_;
            std::vector<std::string> arms_;
            dp::f64 threshold_;
            dp::u32 appear_ticks_;
            std::vector<dp::u32> counters_;
            std::vector<bool> visible_;
        };

    } // namespace control
} // namespace puppet
