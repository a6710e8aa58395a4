#pragma once

#include <echo/echo.hpp>

#include "puppet/collaborators.hpp"
#include "puppet/config.hpp"

namespace puppet {
    namespace control {

        /// Decides when the recorder snapshots or restores the episode.
        ///
        /// Without a recorder every request is a no-op.
        class CheckpointCoordinator {
          public:
            CheckpointCoordinator(Recorder *recorder, const Config &cfg)
                : recorder_(recorder), periodic_(cfg.auto_checkpoint), every_(cfg.checkpoint_every_ticks) {}

            bool recording() const { return recorder_ != nullptr; }

            /// Count one applied tick; checkpoint when the count reaches the period.
            dp::Result<Ack> on_tick() {
                if (!periodic_ || !recorder_) {
                    return ok();
                }
                if (++ticks_ < every_) {
                    return ok();
                }
                ticks_ = 0;
                return request("periodic");
            }

            /// Checkpoint when strictly more goal conditions are satisfied than last seen.
            dp::Result<Ack> on_goal_status(const GoalStatus &status) {
                const auto satisfied = status.satisfied.size();
                const bool progressed = satisfied > prev_satisfied_;
                prev_satisfied_ = satisfied;
                if (!progressed) {
                    return ok();
                }
                return request("goal progress");
            }

            dp::Result<Ack> manual() { return request("manual"); }

            dp::Result<Ack> rollback() {
                if (!recorder_) {
                    echo::warn("rollback requested with no recorder attached");
                    return ok();
                }
                echo::info("rolling back to latest checkpoint; the leader will move on its own");
                auto res = recorder_->rollback_to_checkpoint();
                if (res.is_err()) {
                    return res;
                }
                ++rollbacks_;
                return ok();
            }

            /// Flush the episode. Called once during shutdown, before the actuator closes.
            dp::Result<Ack> finalize() {
                if (!recorder_) {
                    return ok();
                }
                echo::info("saving recorded episode");
                return recorder_->save_data();
            }

            void reset() { prev_satisfied_ = 0; }

            dp::u64 ticks() const { return ticks_; }
            dp::u64 checkpoints() const { return checkpoints_; }
            dp::u64 rollbacks() const { return rollbacks_; }

          private:
            dp::Result<Ack> request(const char *why) {
                if (!recorder_) {
                    echo::warn("checkpoint (", why, ") requested with no recorder attached");
                    return ok();
                }
                auto res = recorder_->update_checkpoint();
                if (res.is_err()) {
                    return res;
                }
                ++checkpoints_;
                echo::info("checkpoint recorded (", why, ")");
                return ok();
            }

            Recorder *recorder_;
            bool periodic_;
            dp::u64 every_;
            dp::u64 ticks_ = 0;
            dp::usize prev_satisfied_ = 0;
            dp::u64 checkpoints_ = 0;
            dp::u64 rollbacks_ = 0;
        };

    } // namespace control
} // namespace puppet
