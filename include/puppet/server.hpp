#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <utility>

#include <echo/echo.hpp>

#include "puppet/collaborators.hpp"
#include "puppet/config.hpp"
#include "puppet/control/buttons.hpp"
#include "puppet/control/checkpoint.hpp"
#include "puppet/control/command_buffer.hpp"
#include "puppet/control/event_queue.hpp"
#include "puppet/control/ghost.hpp"
#include "puppet/control/published.hpp"
#include "puppet/control/safety.hpp"
#include "puppet/control/synthesizer.hpp"
#include "puppet/rpc/pipe_server.hpp"
#include "puppet/rpc/service.hpp"
#include "puppet/topology/factory.hpp"

namespace puppet {

    /// External collaborators of the server. Only the actuator is mandatory; all are
    /// non-owning and must outlive the server.
    struct Collaborators {
        Actuator *actuator = nullptr;
        Recorder *recorder = nullptr;
        Scene *scene = nullptr;
    };

    /// Teleoperation control server.
    ///
    /// Owns the control loop. Each tick: publish observations, run operator events
    /// and button edges, advance the safety gate, then either idle the world
    /// (waiting to resume) or synthesize and apply an action. The RPC transport
    /// runs on its own threads and only touches the command buffer, the event
    /// queue and the published snapshot.
    class TeleopServer {
      public:
        static dp::Result<std::unique_ptr<TeleopServer>> create(const Config &cfg, Collaborators collab,
                                                                control::Clock clock = control::steady_now_ns) {
            using R = dp::Result<std::unique_ptr<TeleopServer>>;

            auto valid = cfg.validate();
            if (valid.is_err()) {
                return R::err(valid.error());
            }
            if (!collab.actuator) {
                return fail<std::unique_ptr<TeleopServer>>(ErrorKind::Configuration, "no actuator attached");
            }
            auto topo = topology::make(cfg);
            if (topo.is_err()) {
                return R::err(topo.error());
            }
            if (collab.actuator->action_dim() != topo.value()->action_dim()) {
                return fail<std::unique_ptr<TeleopServer>>(
                    ErrorKind::Configuration, std::string("topology '") + topo.value()->name() + "' needs " +
                                                  std::to_string(topo.value()->action_dim()) +
                                                  " action values, actuator takes " +
                                                  std::to_string(collab.actuator->action_dim()));
            }

            std::unique_ptr<TeleopServer> server(new TeleopServer(cfg, collab, topo.value(), std::move(clock)));
            auto reset = server->reset();
            if (reset.is_err()) {
                return R::err(reset.error());
            }
            echo::info("teleop server ready: robot=", topo.value()->name(), " dofs=", server->num_dofs_,
                       " action_dim=", topo.value()->action_dim(), " recording=", collab.recorder != nullptr);
            return R::ok(std::move(server));
        }

        ~TeleopServer() {
            auto res = shutdown();
            if (res.is_err()) {
                echo::error("shutdown: ", res.error().message.c_str());
            }
        }

        TeleopServer(const TeleopServer &) = delete;
        TeleopServer &operator=(const TeleopServer &) = delete;

        /// Bind the RPC endpoint. A bind failure is fatal for the caller.
        dp::Result<Ack> start() {
            auto res = transport_.start(cfg_.endpoint);
            if (res.is_err()) {
                echo::error("cannot start rpc transport: ", res.error().message.c_str());
            }
            return res;
        }

        /// One control-loop iteration.
        ///
        /// Effect and recorder failures do not cut the tick short: every effect
        /// runs, the gate advances and the world is stepped, and the first such
        /// failure is returned afterwards. Actuator failures end the tick at once
        /// and are flagged by actuator_fault().
        dp::Result<Ack> tick() {
            actuator_fault_ = false;
            dp::Optional<dp::Error> first_error;
            auto keep = [&first_error](const dp::Result<Ack> &res) {
                if (res.is_err() && !first_error.has_value()) {
                    first_error = res.error();
                }
            };

            const JointFeedback fb = collab_.actuator->feedback();
            const JointCommand cmd = commands_.snapshot();
            publish(fb, cmd);

            auto effects = control::ButtonDispatcher::translate(events_.drain(), gate_.state());
            for (auto e : buttons_.process(cmd, gate_.state())) {
                effects.push_back(e);
            }
            for (auto e : effects) {
                auto res = apply(e);
                if (actuator_fault_) {
                    return res;
                }
                keep(res);
            }

            gate_.update();

            if (gate_.waiting()) {
                auto idle = collab_.actuator->idle_step();
                if (idle.is_err()) {
                    actuator_fault_ = true;
                    return idle;
                }
                return finish(first_error);
            }

            // A reset or rollback in this tick leaves the gate waiting, so the
            // snapshot taken above is never applied against the new episode.
            auto action = synth_.synthesize(cmd, fb, gate_, published_.active_arm());
            auto outcome = collab_.actuator->step(action);
            if (outcome.is_err()) {
                actuator_fault_ = true;
                return dp::Result<Ack>::err(outcome.error());
            }
            last_action_ = std::move(action);
            ++applied_ticks_;

            update_reachability(cmd);

            const auto &info = outcome.value().info;
            if (info.goal_status.has_value()) {
                keep(checkpoints_.on_goal_status(*info.goal_status));
            }
            keep(checkpoints_.on_tick());
            return finish(first_error);
        }

        /// Run the loop at the configured rate until stop is requested or the
        /// actuator fails. Other tick failures are logged and the loop goes on.
        dp::Result<Ack> serve() {
            const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                std::chrono::duration<dp::f64>(cfg_.tick_period_s()));
            auto next = std::chrono::steady_clock::now();
            while (!stop_requested_.load()) {
                auto res = tick();
                if (res.is_err()) {
                    if (actuator_fault_) {
                        echo::error("control tick failed: ", res.error().message.c_str());
                        return res;
                    }
                    echo::warn("control tick: ", res.error().message.c_str());
                }
                next += period;
                std::this_thread::sleep_until(next);
            }
            return ok();
        }

        /// Start a new episode: back to waiting, command reset to the robot's reset pose.
        dp::Result<Ack> reset() {
            synth_.reset();
            gate_.force_wait();
            checkpoints_.reset();
            ghost_.reset();

            auto fb = collab_.actuator->reset();
            if (fb.is_err()) {
                actuator_fault_ = true;
                return dp::Result<Ack>::err(fb.error());
            }

            auto blank = topo_->blank_command(fb.value());
            // Held buttons stay held across the reset so they do not fire again.
            blank.buttons = commands_.snapshot().buttons;
            commands_.reset(std::move(blank));
            publish(fb.value(), commands_.snapshot());
            echo::info("episode reset; waiting for resume");
            return ok();
        }

        void request_stop() { stop_requested_.store(true); }
        bool stop_requested() const { return stop_requested_.load(); }

        /// Two-phase shutdown: stop and join the transport, then finalize recording,
        /// then release the actuator. Safe to call more than once.
        dp::Result<Ack> shutdown() {
            if (shut_down_) {
                return ok();
            }
            shut_down_ = true;
            stop_requested_.store(true);

            transport_.stop();

            auto saved = checkpoints_.finalize();
            collab_.actuator->close();
            echo::info("teleop server shut down");
            return saved;
        }

        /// Select the arm that untargeted commands drive on single-active-arm layouts.
        dp::Result<Ack> set_active_arm(dp::usize arm) {
            if (arm >= topo_->arm_count()) {
                return fail<Ack>(ErrorKind::InvalidComponent, "arm index " + std::to_string(arm));
            }
            published_.set_active_arm(arm);
            return ok();
        }

        /// Trunk tilt compensation applied to the first joint of each arm.
        void set_trunk_tilt(dp::f64 tilt) { synth_.trunk().set_tilt(tilt); }

        void subscribe(ActionObserver *observer) { synth_.subscribe(observer); }

        // -- Accessors --

        RobotState state() const { return gate_.state(); }
        /// True when the last tick ended on an actuator failure.
        bool actuator_fault() const { return actuator_fault_; }
        const control::SafetyGate &gate() const { return gate_; }
        const control::CheckpointCoordinator &checkpoints() const { return checkpoints_; }
        const control::TrunkIntegrator &trunk() const { return synth_.trunk(); }
        const topology::Topology &topology() const { return *topo_; }
        const Config &config() const { return cfg_; }

        rpc::Service &service() { return service_; }
        control::EventQueue &events() { return events_; }
        const control::Published &published() const { return published_; }
        JointCommand command() const { return commands_.snapshot(); }

        const dp::Vector<dp::f64> &last_action() const { return last_action_; }
        dp::u64 applied_ticks() const { return applied_ticks_; }
        dp::usize num_dofs() const { return num_dofs_; }

      private:
        TeleopServer(const Config &cfg, Collaborators collab, std::shared_ptr<topology::Topology> topo,
                     control::Clock clock)
            : cfg_(cfg), collab_(collab), topo_(std::move(topo)), num_dofs_(collab.actuator->num_dofs()),
              events_(cfg.event_queue_capacity), gate_(cfg.cooldown_s, cfg.cooldown_max_delta(), std::move(clock)),
              synth_(topo_, cfg), checkpoints_(collab.recorder, cfg),
              ghost_(collab.scene, topo_->arm_names(), cfg.ghost_threshold_rad, cfg.ghost_appear_ticks),
              service_(topo_, num_dofs_, commands_, events_, published_), transport_(service_) {
            if (cfg.robot == "arms") {
                published_.set_active_arm(cfg.arms.initial_active);
            } else {
                published_.set_active_arm(topo_->arm_count() - 1);
            }
            if (cfg.ghosting) {
                synth_.subscribe(&ghost_);
            }
        }

        dp::Result<Ack> apply(control::Effect e) {
            echo::debug("effect: ", control::to_string(e));
            switch (e) {
            case control::Effect::Resume:
                gate_.resume();
                return ok();
            case control::Effect::ManualCheckpoint:
                return checkpoints_.manual();
            case control::Effect::Rollback: {
                auto res = checkpoints_.rollback();
                // The restored episode cannot inherit a cooldown clamp.
                gate_.force_wait();
                if (res.is_err()) {
                    return res;
                }
                const auto fb = collab_.actuator->feedback();
                if (topo_->trunk_coupled() && !fb.torso.empty()) {
                    synth_.trunk().set_translate(control::infer_torso_pose(fb.torso, cfg_.torso));
                }
                return ok();
            }
            case control::Effect::NextCamera:
                if (collab_.scene) {
                    collab_.scene->next_camera();
                }
                return ok();
            case control::Effect::ToggleVisibility:
                if (collab_.scene) {
                    collab_.scene->toggle_visibility();
                }
                return ok();
            case control::Effect::Reset:
                // An earlier effect in the same tick may have started a cooldown.
                if (gate_.in_cooldown()) {
                    echo::info("reset ignored during cooldown");
                    return ok();
                }
                return reset();
            case control::Effect::ToggleLeftLight:
                if (collab_.scene) {
                    collab_.scene->toggle_light(Side::Left);
                }
                return ok();
            case control::Effect::ToggleRightLight:
                if (collab_.scene) {
                    collab_.scene->toggle_light(Side::Right);
                }
                return ok();
            case control::Effect::Stop:
                echo::info("stop requested");
                request_stop();
                return ok();
            }
            return ok();
        }

        static dp::Result<Ack> finish(const dp::Optional<dp::Error> &first_error) {
            if (first_error.has_value()) {
                return dp::Result<Ack>::err(*first_error);
            }
            return ok();
        }

        void publish(const JointFeedback &fb, const JointCommand &cmd) {
            const auto active = published_.active_arm();
            Observation obs;
            obs.active_arm = topo_->arm_names()[active];
            obs.in_cooldown = gate_.in_cooldown();
            obs.waiting_to_resume = gate_.waiting();
            obs.base_contact = fb.base_contact;
            obs.trunk_contact = fb.trunk_contact;
            obs.reset_joints = cmd.pressed(Button::Y);
            for (dp::usize a = 0; a < topo_->arm_count() && a < fb.arms.size(); ++a) {
                const auto &arm = fb.arms[a];
                ArmObservation o;
                o.name = topo_->arm_names()[a];
                o.joint_positions = arm.positions;
                if (topo_->trunk_coupled() && !o.joint_positions.empty()) {
                    o.joint_positions[0] -= synth_.trunk().tilt() * topo_->shoulder_direction(a);
                }
                o.joint_velocities = arm.velocities;
                o.gripper_positions = arm.gripper_positions;
                o.contact = arm.contact;
                if (a < cmd.grippers.size() && !cmd.grippers[a].empty()) {
                    o.gripper_command = cmd.grippers[a][0];
                }
                obs.arms.push_back(std::move(o));
            }
            published_.publish(fb.positions, flatten(obs, active));
        }

        void update_reachability(const JointCommand &cmd) {
            bool moving = false;
            for (auto v : cmd.base) {
                moving = moving || v != 0.0;
            }
            if (moving != base_moving_) {
                base_moving_ = moving;
                if (collab_.scene) {
                    collab_.scene->show_reachability(moving);
                }
            }
        }

        Config cfg_;
        Collaborators collab_;
        std::shared_ptr<topology::Topology> topo_;
        dp::usize num_dofs_;

        control::CommandBuffer commands_;
        control::EventQueue events_;
        control::Published published_;
        control::SafetyGate gate_;
        control::ButtonDispatcher buttons_;
        control::ActionSynthesizer synth_;
        control::CheckpointCoordinator checkpoints_;
        control::GhostMonitor ghost_;

        rpc::Service service_;
        rpc::PipeServer transport_;

        std::atomic<bool> stop_requested_{false};
        bool shut_down_ = false;
        bool actuator_fault_ = false;
        bool base_moving_ = false;
        dp::Vector<dp::f64> last_action_;
        dp::u64 applied_ticks_ = 0;
    };

} // namespace puppet
