#pragma once

#include <deque>
#include <mutex>

#include "puppet/error.hpp"
#include "puppet/types.hpp"

namespace puppet {
    namespace control {

        /// Bounded FIFO of operator events, posted by the transport and drained by the
        /// control loop once per tick.
        class EventQueue {
          public:
            explicit EventQueue(dp::usize capacity) : capacity_(capacity) {}

            dp::Result<Ack> post(Event ev) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (events_.size() >= capacity_) {
                    return fail<Ack>(ErrorKind::QueueFull, std::to_string(capacity_) + " events pending");
                }
                events_.push_back(ev);
                return ok();
            }

            dp::Vector<Event> drain() {
                std::lock_guard<std::mutex> lock(mutex_);
                dp::Vector<Event> out;
                out.reserve(events_.size());
                for (auto ev : events_) {
                    out.push_back(ev);
                }
                events_.clear();
                return out;
            }

            dp::usize size() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return events_.size();
            }

            dp::usize capacity() const { return capacity_; }

          private:
            mutable std::mutex mutex_;
            std::deque<Event> events_;
            dp::usize capacity_;
        };

    } // namespace control
} // namespace puppet
