#pragma once

#include <memory>
#include <utility>

#include <echo/echo.hpp>

#include "puppet/control/command_buffer.hpp"
#include "puppet/control/event_queue.hpp"
#include "puppet/control/published.hpp"
#include "puppet/rpc/protocol.hpp"
#include "puppet/topology/topology.hpp"

namespace puppet {
    namespace rpc {

        /// Method dispatch for the leader-facing RPC surface.
        ///
        /// Transport-agnostic: handle() takes a method id and request bytes and always
        /// returns a response message, with failures encoded in-band so the server
        /// keeps serving. Only command_joint_state and post_event touch shared state.
        class Service {
          public:
            Service(std::shared_ptr<const topology::Topology> topo, dp::usize num_dofs, control::CommandBuffer &commands,
                    control::EventQueue &events, const control::Published &published)
                : topo_(std::move(topo)), num_dofs_(num_dofs), commands_(commands), events_(events),
                  published_(published) {}

            netpipe::Message handle(uint32_t method, const netpipe::Message &req) {
                auto res = dispatch(method, req);
                if (res.is_err()) {
                    echo::warn("rpc method ", method, " rejected: ", res.error().message.c_str());
                    return respond_error(res.error());
                }
                return res.value();
            }

          private:
            dp::Result<netpipe::Message> dispatch(uint32_t method, const netpipe::Message &req) {
                switch (method) {
                case PUPPET_METHOD_NUM_DOFS:
                    return num_dofs();
                case PUPPET_METHOD_GET_JOINT_STATE:
                    return get_joint_state();
                case PUPPET_METHOD_COMMAND_JOINT_STATE:
                    return command_joint_state(req);
                case PUPPET_METHOD_GET_OBSERVATIONS:
                    return get_observations();
                case PUPPET_METHOD_FREEDRIVE_ENABLED:
                    return freedrive_enabled();
                case PUPPET_METHOD_SET_FREEDRIVE_MODE:
                    return set_freedrive_mode(req);
                case PUPPET_METHOD_POST_EVENT:
                    return post_event(req);
                default:
                    return fail<netpipe::Message>(ErrorKind::Unsupported, "method " + std::to_string(method));
                }
            }

            dp::Result<netpipe::Message> num_dofs() const {
                auto msg = respond_ok();
                write_val(msg, static_cast<uint32_t>(num_dofs_));
                return dp::Result<netpipe::Message>::ok(std::move(msg));
            }

            dp::Result<netpipe::Message> get_joint_state() const {
                auto msg = respond_ok();
                write_vector(msg, published_.joint_state());
                return dp::Result<netpipe::Message>::ok(std::move(msg));
            }

            dp::Result<netpipe::Message> command_joint_state(const netpipe::Message &req) {
                auto decoded = decode_command(req);
                if (decoded.is_err()) {
                    return dp::Result<netpipe::Message>::err(decoded.error());
                }
                const auto &cmd = decoded.value();
                auto writes = topo_->split(cmd.values, cmd.component, published_.active_arm());
                if (writes.is_err()) {
                    return dp::Result<netpipe::Message>::err(writes.error());
                }
                commands_.apply(std::move(writes.value()));
                return dp::Result<netpipe::Message>::ok(respond_ok());
            }

            dp::Result<netpipe::Message> get_observations() const {
                auto msg = respond_ok();
                write_mapping(msg, published_.observations());
                return dp::Result<netpipe::Message>::ok(std::move(msg));
            }

            dp::Result<netpipe::Message> freedrive_enabled() const {
                auto msg = respond_ok();
                write_val(msg, static_cast<uint8_t>(1));
                return dp::Result<netpipe::Message>::ok(std::move(msg));
            }

            // Compliance mode is not wired to any actuator; freedrive always reports enabled.
            dp::Result<netpipe::Message> set_freedrive_mode(const netpipe::Message &req) {
                Reader r(req);
                auto enable = r.boolean();
                if (enable.is_err()) {
                    return dp::Result<netpipe::Message>::err(enable.error());
                }
                auto done = r.finish();
                if (done.is_err()) {
                    return dp::Result<netpipe::Message>::err(done.error());
                }
                echo::debug("set_freedrive_mode(", enable.value(), ") ignored; freedrive stays enabled");
                return dp::Result<netpipe::Message>::ok(respond_ok());
            }

            dp::Result<netpipe::Message> post_event(const netpipe::Message &req) {
                auto ev = decode_event(req);
                if (ev.is_err()) {
                    return dp::Result<netpipe::Message>::err(ev.error());
                }
                auto posted = events_.post(ev.value());
                if (posted.is_err()) {
                    return dp::Result<netpipe::Message>::err(posted.error());
                }
                return dp::Result<netpipe::Message>::ok(respond_ok());
            }

            std::shared_ptr<const topology::Topology> topo_;
            dp::usize num_dofs_;
            control::CommandBuffer &commands_;
            control::EventQueue &events_;
            const control::Published &published_;
        };

    } // namespace rpc
} // namespace puppet
