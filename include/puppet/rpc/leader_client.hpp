#pragma once

#include <memory>
#include <string>

#include <netpipe/netpipe.hpp>

#include "puppet/rpc/endpoint.hpp"
#include "puppet/rpc/protocol.hpp"

namespace puppet {
    namespace rpc {

        /// Leader-side handle on a running server.
        ///
        /// Every call is synchronous; server-side rejections come back as the same
        /// ErrorKind the server produced.
        class LeaderClient {
          public:
            LeaderClient() = default;
            ~LeaderClient() { disconnect(); }

            LeaderClient(const LeaderClient &) = delete;
            LeaderClient &operator=(const LeaderClient &) = delete;

            dp::Result<Ack> connect(const std::string &endpoint, dp::i32 timeout_ms = 1000) {
                auto ep = parse_endpoint(endpoint);
                if (ep.is_err()) {
                    return dp::Result<Ack>::err(ep.error());
                }
                auto res = netpipe::Pipe::connect(ep.value());
                if (res.is_err()) {
                    return fail<Ack>(ErrorKind::Transport, "cannot connect to " + endpoint);
                }
                pipe_.emplace(std::move(res.value()));
                rpc_ = std::make_unique<netpipe::Remote<netpipe::Bidirect>>(*pipe_->stream().get(),
                                                                            /*max_concurrent=*/1,
                                                                            /*enable_metrics=*/false,
                                                                            /*recv_timeout_ms=*/100,
                                                                            /*handler_threads=*/1,
                                                                            /*max_handler_queue=*/1,
                                                                            /*handler_timeout_ms=*/0,
                                                                            /*max_incoming=*/1);
                timeout_ms_ = timeout_ms;
                return ok();
            }

            void disconnect() {
                rpc_.reset();
                if (pipe_.has_value()) {
                    pipe_->close();
                    pipe_.reset();
                }
            }

            bool is_connected() const { return pipe_.has_value() && pipe_->is_connected(); }

            dp::Result<dp::u32> num_dofs() {
                auto r = call(PUPPET_METHOD_NUM_DOFS, netpipe::Message{});
                if (r.is_err()) {
                    return dp::Result<dp::u32>::err(r.error());
                }
                auto reader = r.value();
                return reader.val<uint32_t>();
            }

            dp::Result<dp::Vector<dp::f64>> get_joint_state() {
                auto r = call(PUPPET_METHOD_GET_JOINT_STATE, netpipe::Message{});
                if (r.is_err()) {
                    return dp::Result<dp::Vector<dp::f64>>::err(r.error());
                }
                auto reader = r.value();
                return reader.vector();
            }

            dp::Result<Ack> command_joint_state(const dp::Vector<dp::f64> &values,
                                                const dp::Optional<std::string> &component = dp::nullopt) {
                CommandRequest req;
                req.values = values;
                req.component = component;
                auto r = call(PUPPET_METHOD_COMMAND_JOINT_STATE, encode_command(req));
                if (r.is_err()) {
                    return dp::Result<Ack>::err(r.error());
                }
                return ok();
            }

            dp::Result<ObservationMap> get_observations() {
                auto r = call(PUPPET_METHOD_GET_OBSERVATIONS, netpipe::Message{});
                if (r.is_err()) {
                    return dp::Result<ObservationMap>::err(r.error());
                }
                auto reader = r.value();
                return read_mapping(reader);
            }

            dp::Result<bool> freedrive_enabled() {
                auto r = call(PUPPET_METHOD_FREEDRIVE_ENABLED, netpipe::Message{});
                if (r.is_err()) {
                    return dp::Result<bool>::err(r.error());
                }
                auto reader = r.value();
                return reader.boolean();
            }

            dp::Result<Ack> set_freedrive_mode(bool enable) {
                auto r = call(PUPPET_METHOD_SET_FREEDRIVE_MODE, encode_bool(enable));
                if (r.is_err()) {
                    return dp::Result<Ack>::err(r.error());
                }
                return ok();
            }

            dp::Result<Ack> post_event(Event ev) {
                auto r = call(PUPPET_METHOD_POST_EVENT, encode_event(ev));
                if (r.is_err()) {
                    return dp::Result<Ack>::err(r.error());
                }
                return ok();
            }

          private:
            /// Round trip; returns a reader positioned after the status byte.
            ///
            /// The reader points into last_response_, which stays valid until the next call.
            dp::Result<Reader> call(uint32_t method, const netpipe::Message &req) {
                if (!rpc_ || !is_connected()) {
                    return fail<Reader>(ErrorKind::Transport, "not connected");
                }
                auto res = rpc_->call(method, req, static_cast<dp::u32>(timeout_ms_));
                if (res.is_err()) {
                    return fail<Reader>(ErrorKind::Transport, "call failed for method " + std::to_string(method));
                }
                last_response_ = std::move(res.value());
                return open_response(last_response_);
            }

            dp::Optional<netpipe::Pipe> pipe_;
            std::unique_ptr<netpipe::Remote<netpipe::Bidirect>> rpc_;
            netpipe::Message last_response_;
            dp::i32 timeout_ms_ = 1000;
        };

    } // namespace rpc
} // namespace puppet
