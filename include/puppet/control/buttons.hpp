#pragma once

#include <array>

#include "puppet/types.hpp"

namespace puppet {
    namespace control {

        /// Side effect requested by a button edge or an operator event.
        enum class Effect : dp::u8 {
            Resume,
            ManualCheckpoint,
            Rollback,
            NextCamera,
            ToggleVisibility,
            Reset,
            ToggleLeftLight,
            ToggleRightLight,
            Stop,
        };

        inline const char *to_string(Effect e) {
            switch (e) {
            case Effect::Resume:
                return "resume";
            case Effect::ManualCheckpoint:
                return "manual_checkpoint";
            case Effect::Rollback:
                return "rollback";
            case Effect::NextCamera:
                return "next_camera";
            case Effect::ToggleVisibility:
                return "toggle_visibility";
            case Effect::Reset:
                return "reset";
            case Effect::ToggleLeftLight:
                return "toggle_left_light";
            case Effect::ToggleRightLight:
                return "toggle_right_light";
            case Effect::Stop:
                return "stop";
            }
            return "unknown";
        }

        /// Turns button levels into press events.
        ///
        /// A button fires when it reads pressed and was released on the previous
        /// tick. The stored level is updated every tick whether or not it fired, and
        /// survives episode resets so a button held across a reset stays quiet.
        class ButtonDispatcher {
          public:
            /// Effects for this tick, in button order.
            dp::Vector<Effect> process(const JointCommand &cmd, RobotState state) {
                dp::Vector<Effect> out;

                if (edge(cmd, Button::X)) {
                    out.push_back(state == RobotState::WaitingToResume ? Effect::Resume : Effect::ManualCheckpoint);
                }
                if (edge(cmd, Button::Y)) {
                    out.push_back(Effect::Rollback);
                }
                if (edge(cmd, Button::B)) {
                    out.push_back(Effect::NextCamera);
                }
                if (edge(cmd, Button::A)) {
                    out.push_back(Effect::ToggleVisibility);
                }
                // A reset racing a cooldown-clipped motion is refused.
                if (edge(cmd, Button::Home) && state != RobotState::Cooldown) {
                    out.push_back(Effect::Reset);
                }
                if (edge(cmd, Button::Left)) {
                    out.push_back(Effect::ToggleLeftLight);
                }
                if (edge(cmd, Button::Right)) {
                    out.push_back(Effect::ToggleRightLight);
                }
                return out;
            }

            /// Effects for queued operator events; same gating as the buttons.
            static dp::Vector<Effect> translate(const dp::Vector<Event> &events, RobotState state) {
                dp::Vector<Effect> out;
                for (auto ev : events) {
                    switch (ev) {
                    case Event::Resume:
                        if (state == RobotState::WaitingToResume) {
                            out.push_back(Effect::Resume);
                        }
                        break;
                    case Event::Reset:
                        if (state != RobotState::Cooldown) {
                            out.push_back(Effect::Reset);
                        }
                        break;
                    case Event::Stop:
                        out.push_back(Effect::Stop);
                        break;
                    }
                }
                return out;
            }

            bool level(Button b) const { return levels_[static_cast<dp::usize>(b)]; }

          private:
            bool edge(const JointCommand &cmd, Button b) {
                const auto i = static_cast<dp::usize>(b);
                const bool now = cmd.pressed(b);
                const bool fired = now && !levels_[i];
                levels_[i] = now;
                return fired;
            }

            std::array<bool, kButtonCount> levels_{};
        };

    } // namespace control
} // namespace puppet
