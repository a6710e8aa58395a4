#pragma once

#include <atomic>
#include <mutex>
#include <utility>

#include "puppet/types.hpp"

namespace puppet {
    namespace control {

        /// Read-only view of the control loop's latest state, for the RPC side.
        ///
        /// Written once per tick by the control loop, read by RPC handlers.
        class Published {
          public:
            void publish(dp::Vector<dp::f64> joint_state, ObservationMap observations) {
                std::lock_guard<std::mutex> lock(mutex_);
                joint_state_ = std::move(joint_state);
                observations_ = std::move(observations);
            }

            dp::Vector<dp::f64> joint_state() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return joint_state_;
            }

            ObservationMap observations() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return observations_;
            }

            /// Arm that untargeted commands go to on single-active-arm layouts.
            dp::usize active_arm() const { return active_arm_.load(); }
            void set_active_arm(dp::usize arm) { active_arm_.store(arm); }

          private:
            mutable std::mutex mutex_;
            dp::Vector<dp::f64> joint_state_;
            ObservationMap observations_;
            std::atomic<dp::usize> active_arm_{0};
        };

    } // namespace control
} // namespace puppet
