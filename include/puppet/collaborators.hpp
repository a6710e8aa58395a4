#pragma once

#include <string>

#include <datapod/datapod.hpp>

#include "puppet/error.hpp"
#include "puppet/types.hpp"

namespace puppet {

    /// Abstract actuation interface: the simulator or the physical robot.
    ///
    /// Owned by the control loop and only ever called from its thread.
    class Actuator {
      public:
        virtual ~Actuator() = default;

        virtual dp::usize action_dim() const = 0;
        virtual dp::usize num_dofs() const = 0;

        /// Apply an action and advance one tick.
        virtual dp::Result<StepOutcome> step(const dp::Vector<dp::f64> &action) = 0;

        /// Advance the world one tick without applying a new action.
        virtual dp::Result<Ack> idle_step() = 0;

        virtual dp::Result<JointFeedback> reset() = 0;
        virtual JointFeedback feedback() const = 0;

        virtual void close() = 0;
    };

    /// Episode recorder. Checkpoint contents are opaque to the server.
    class Recorder {
      public:
        virtual ~Recorder() = default;

        virtual dp::Result<Ack> update_checkpoint() = 0;
        virtual dp::Result<Ack> rollback_to_checkpoint() = 0;
        virtual dp::Result<Ack> save_data() = 0;
    };

    /// Viewer-side toggles. Everything here is cosmetic; calls are fire-and-forget.
    class Scene {
      public:
        virtual ~Scene() = default;

        virtual void next_camera() = 0;
        virtual void toggle_visibility() = 0;
        virtual void toggle_light(Side side) = 0;
        virtual void set_ghost_visible(const std::string &arm, bool visible) = 0;
        virtual void show_reachability(bool visible) = 0;
    };

    /// A synthesized action together with the arm targets it was assembled from.
    struct ActionFrame {
        dp::Vector<dp::f64> action;
        dp::Vector<dp::Vector<dp::f64>> arm_targets;
        const JointFeedback *feedback = nullptr;
    };

    /// Subscriber to synthesized actions (ghost avatars, loggers, ...).
    class ActionObserver {
      public:
        virtual ~ActionObserver() = default;
        virtual void on_action(const ActionFrame &frame) = 0;
    };

} // namespace puppet
