#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <echo/echo.hpp>
#include <netpipe/netpipe.hpp>

#include "puppet/rpc/endpoint.hpp"
#include "puppet/rpc/service.hpp"

namespace puppet {
    namespace rpc {

        /// Serves a Service over netpipe.
        ///
        /// start() binds the endpoint (a bind failure is returned, never retried) and
        /// spawns the accept thread. Each accepted leader gets its own
        /// netpipe::Remote; its handler threads call straight into the Service and
        /// never touch the control loop beyond the Service's critical sections.
        class PipeServer {
          public:
            explicit PipeServer(Service &service) : service_(service) {}
            ~PipeServer() { stop(); }

            PipeServer(const PipeServer &) = delete;
            PipeServer &operator=(const PipeServer &) = delete;

            dp::Result<Ack> start(const std::string &endpoint) {
                if (running_.load()) {
                    return ok();
                }
                auto ep = parse_endpoint(endpoint);
                if (ep.is_err()) {
                    return dp::Result<Ack>::err(ep.error());
                }
                auto res = netpipe::Pipe::listen(ep.value());
                if (res.is_err()) {
                    return fail<Ack>(ErrorKind::Transport, "cannot bind " + endpoint);
                }
                listener_.emplace(std::move(res.value()));
                stop_requested_.store(false);
                running_.store(true);
                thread_ = std::thread([this] { accept_loop(); });
                echo::info("rpc server listening on ", endpoint.c_str());
                return ok();
            }

            /// Stop accepting, drop every session, join the accept thread.
            void stop() {
                if (!running_.exchange(false)) {
                    return;
                }
                stop_requested_.store(true);
                if (thread_.joinable()) {
                    thread_.join();
                }
                {
                    std::lock_guard<std::mutex> lock(sessions_mutex_);
                    sessions_.clear();
                }
                if (listener_.has_value()) {
                    listener_->close();
                    listener_.reset();
                }
                echo::info("rpc server stopped");
            }

            bool running() const { return running_.load(); }

            dp::usize sessions() const {
                std::lock_guard<std::mutex> lock(sessions_mutex_);
                return sessions_.size();
            }

          private:
            struct Session {
                netpipe::Pipe pipe;
                std::unique_ptr<netpipe::Remote<netpipe::Bidirect>> rpc;

                explicit Session(netpipe::Pipe p) : pipe(std::move(p)) {}
                ~Session() {
                    rpc.reset();
                    pipe.close();
                }
            };

            static constexpr dp::i32 kAcceptPollMs = 100;

            void accept_loop() {
                while (!stop_requested_.load()) {
                    prune();
                    auto accepted = listener_->accept(kAcceptPollMs);
                    if (accepted.is_err()) {
                        continue;
                    }
                    auto session = std::make_unique<Session>(std::move(accepted.value()));
                    session->rpc = std::make_unique<netpipe::Remote<netpipe::Bidirect>>(
                        *session->pipe.stream().get(),
                        /*max_concurrent=*/1,
                        /*enable_metrics=*/false,
                        /*recv_timeout_ms=*/100,
                        /*handler_threads=*/1,
                        /*max_handler_queue=*/16,
                        /*handler_timeout_ms=*/0,
                        /*max_incoming=*/16);
                    for (uint32_t method = PUPPET_METHOD_FIRST; method <= PUPPET_METHOD_LAST; ++method) {
                        session->rpc->register_method(
                            method, [this, method](const netpipe::Message &msg) -> dp::Res<netpipe::Message> {
                                return dp::result::ok(service_.handle(method, msg));
                            });
                    }
                    echo::info("leader connected");
                    std::lock_guard<std::mutex> lock(sessions_mutex_);
                    sessions_.push_back(std::move(session));
                }
            }

            void prune() {
                std::lock_guard<std::mutex> lock(sessions_mutex_);
                for (auto it = sessions_.begin(); it != sessions_.end();) {
                    if (!(*it)->pipe.is_connected()) {
                        echo::info("leader disconnected");
                        it = sessions_.erase(it);
                    } else {
                        ++it;
                    }
                }
            }

            Service &service_;
            dp::Optional<netpipe::Pipe> listener_;
            std::thread thread_;
            std::atomic<bool> running_{false};
            std::atomic<bool> stop_requested_{false};
            mutable std::mutex sessions_mutex_;
            std::list<std::unique_ptr<Session>> sessions_;
        };

    } // namespace rpc
} // namespace puppet
