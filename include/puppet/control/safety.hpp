#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <utility>

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include "puppet/types.hpp"

namespace puppet {
    namespace control {

        /// Monotonic clock in nanoseconds. Injectable so tests can drive time.
        using Clock = std::function<dp::i64()>;

        inline dp::i64 steady_now_ns() {
            return std::chrono::duration_cast<std::chrono::nanoseconds>(
                       std::chrono::steady_clock::now().time_since_epoch())
                .count();
        }

        /// Resume safety gate.
        ///
        ///   WaitingToResume --resume--> Cooldown --deadline--> Running
        ///          ^______________reset / rollback______________|
        ///
        /// Only Cooldown clips arm motion; WaitingToResume applies no action at all.
        class SafetyGate {
          public:
            SafetyGate(dp::f64 cooldown_s, dp::f64 max_delta, Clock clock = steady_now_ns)
                : cooldown_ns_(static_cast<dp::i64>(cooldown_s * 1e9)), max_delta_(max_delta), clock_(std::move(clock)) {}

            RobotState state() const { return state_; }
            bool waiting() const { return state_ == RobotState::WaitingToResume; }
            bool in_cooldown() const { return state_ == RobotState::Cooldown; }
            bool applies_actions() const { return state_ != RobotState::WaitingToResume; }

            dp::Optional<dp::i64> deadline_ns() const { return deadline_ns_; }
            dp::f64 max_delta() const { return max_delta_; }
            dp::i64 now() const { return clock_(); }

            /// Leave WaitingToResume. Returns false if not waiting.
            bool resume() {
                if (state_ != RobotState::WaitingToResume) {
                    return false;
                }
                deadline_ns_ = clock_() + cooldown_ns_;
                transition(RobotState::Cooldown);
                return true;
            }

            /// Called once per tick; ends the cooldown once its deadline has passed.
            void update() {
                if (state_ == RobotState::Cooldown && deadline_ns_.has_value() && clock_() >= *deadline_ns_) {
                    deadline_ns_.reset();
                    transition(RobotState::Running);
                }
            }

            /// Episode reset or rollback: back to waiting, any cooldown discarded.
            void force_wait() {
                deadline_ns_.reset();
                transition(RobotState::WaitingToResume);
            }

            /// Clip `target` so no joint moves more than max_delta away from `measured`.
            ///
            /// Recomputed from the live measured position every tick, so a follower
            /// that lags its command creeps towards the target rather than snapping.
            /// No-op outside Cooldown.
            void clip(dp::Vector<dp::f64> &target, const dp::Vector<dp::f64> &measured) const {
                if (state_ != RobotState::Cooldown) {
                    return;
                }
                const auto n = std::min(target.size(), measured.size());
                for (dp::usize i = 0; i < n; ++i) {
                    const dp::f64 delta = std::clamp(target[i] - measured[i], -max_delta_, max_delta_);
                    target[i] = measured[i] + delta;
                }
            }

          private:
            void transition(RobotState next) {
                if (next == state_) {
                    return;
                }
                echo::info("safety: ", to_string(state_), " -> ", to_string(next));
                state_ = next;
            }

            RobotState state_ = RobotState::WaitingToResume;
            dp::Optional<dp::i64> deadline_ns_;
            dp::i64 cooldown_ns_;
            dp::f64 max_delta_;
            Clock clock_;
        };

    } // namespace control
} // namespace puppet
