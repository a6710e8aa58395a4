#pragma once

#include <mutex>
#include <utility>

#include "puppet/topology/topology.hpp"
#include "puppet/types.hpp"

namespace puppet {
    namespace control {

        /// The one piece of state shared between the RPC threads and the control loop.
        ///
        /// Writers replace whole components under the lock; the control loop copies the
        /// full record once per tick. Neither side ever sees a half-written vector.
        class CommandBuffer {
          public:
            void reset(JointCommand blank) {
                std::lock_guard<std::mutex> lock(mutex_);
                cmd_ = std::move(blank);
                ++generation_;
            }

            /// Apply the writes of one leader call. Later calls win per component.
            void apply(dp::Vector<topology::Write> writes) {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto &w : writes) {
                    if (auto *level = cmd_.button_at(w.ref)) {
                        *level = w.values.empty() ? 0.0 : w.values[0];
                    } else if (auto *field = cmd_.vector_at(w.ref)) {
                        *field = std::move(w.values);
                    }
                }
                ++generation_;
            }

            JointCommand snapshot() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return cmd_;
            }

            dp::u64 generation() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return generation_;
            }

          private:
            mutable std::mutex mutex_;
            JointCommand cmd_;
            dp::u64 generation_ = 0;
        };

    } // namespace control
} // namespace puppet
