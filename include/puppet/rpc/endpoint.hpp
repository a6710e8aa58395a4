#pragma once

#include <cstdint>
#include <string>

#include <netpipe/netpipe.hpp>

#include "puppet/error.hpp"

namespace puppet {
    namespace rpc {

        /// Parse an endpoint string.
        ///
        ///   tcp://host:port
        ///   ipc:///path
        ///   shm://name:size
        inline dp::Result<netpipe::AnyEndpoint> parse_endpoint(const std::string &s) {
            auto number = [](const std::string &digits, uint64_t max) -> dp::Optional<uint64_t> {
                if (digits.empty() || digits.size() > 20) {
                    return dp::nullopt;
                }
                uint64_t v = 0;
                for (char c : digits) {
                    if (c < '0' || c > '9') {
                        return dp::nullopt;
                    }
                    const auto d = static_cast<uint64_t>(c - '0');
                    // Checked against `max` before every step so the value never wraps.
                    if (v > (max - d) / 10) {
                        return dp::nullopt;
                    }
                    v = v * 10 + d;
                }
                return v;
            };

            if (s.rfind("tcp://", 0) == 0) {
                auto body = s.substr(6);
                auto colon = body.rfind(':');
                if (colon == std::string::npos) {
                    return fail<netpipe::AnyEndpoint>(ErrorKind::Transport, "missing port in '" + s + "'");
                }
                auto port = number(body.substr(colon + 1), 65535);
                if (!port.has_value()) {
                    return fail<netpipe::AnyEndpoint>(ErrorKind::Transport, "invalid port in '" + s + "'");
                }
                auto host = body.substr(0, colon);
                return dp::Result<netpipe::AnyEndpoint>::ok(
                    netpipe::AnyEndpoint::tcp_endpoint(dp::String(host.c_str()), static_cast<uint16_t>(*port)));
            }
            if (s.rfind("ipc://", 0) == 0) {
                auto path = s.substr(6);
                if (path.empty()) {
                    return fail<netpipe::AnyEndpoint>(ErrorKind::Transport, "empty ipc path");
                }
                return dp::Result<netpipe::AnyEndpoint>::ok(netpipe::AnyEndpoint::ipc_endpoint(dp::String(path.c_str())));
            }
            if (s.rfind("shm://", 0) == 0) {
                auto body = s.substr(6);
                auto colon = body.rfind(':');
                if (colon == std::string::npos) {
                    return fail<netpipe::AnyEndpoint>(ErrorKind::Transport, "missing size in '" + s + "'");
                }
                auto size = number(body.substr(colon + 1), UINT32_MAX);
                if (!size.has_value()) {
                    return fail<netpipe::AnyEndpoint>(ErrorKind::Transport, "invalid size in '" + s + "'");
                }
                auto name = body.substr(0, colon);
                return dp::Result<netpipe::AnyEndpoint>::ok(
                    netpipe::AnyEndpoint::shm_endpoint(dp::String(name.c_str()), static_cast<size_t>(*size)));
            }
            return fail<netpipe::AnyEndpoint>(ErrorKind::Transport, "unsupported endpoint '" + s + "'");
        }

    } // namespace rpc
} // namespace puppet
