#pragma once

#include <cstring>
#include <string>

#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/result.hpp>

#include "puppet/types.hpp"

namespace puppet {

    /// Failure taxonomy of the server.
    ///
    /// The kind travels inside a dp::Error as a message prefix, so results can
    /// cross the RPC boundary and be classified again on the other side.
    enum class ErrorKind : dp::u8 {
        None = 0,
        Protocol = 1,         // malformed or unroutable payload; call rejected, server keeps serving
        InvalidComponent = 2, // unknown command target; call rejected, server keeps serving
        Unsupported = 3,      // unknown RPC method
        Configuration = 4,    // topology / DOF mismatch, unsupported mode; fatal at startup
        Transport = 5,        // bind / connect failure; fatal at startup
        Collaborator = 6,     // actuator or recorder failure surfaced from a tick
        QueueFull = 7,        // operator event dropped, queue at capacity
    };

    inline const char *error_prefix(ErrorKind k) {
        switch (k) {
        case ErrorKind::Protocol:
            return "protocol: ";
        case ErrorKind::InvalidComponent:
            return "invalid component: ";
        case ErrorKind::Unsupported:
            return "unsupported operation: ";
        case ErrorKind::Configuration:
            return "configuration: ";
        case ErrorKind::Transport:
            return "transport: ";
        case ErrorKind::Collaborator:
            return "collaborator: ";
        case ErrorKind::QueueFull:
            return "queue full: ";
        case ErrorKind::None:
        default:
            return "";
        }
    }

    inline dp::Error make_error(ErrorKind kind, const std::string &detail) {
        const std::string msg = std::string(error_prefix(kind)) + detail;
        return dp::Error::invalid_argument(msg.c_str());
    }

    /// Recover the kind of an error built with make_error(). Foreign errors map to Collaborator.
    inline ErrorKind kind_of(const dp::Error &err) {
        const char *msg = err.message.c_str();
        for (dp::u8 k = static_cast<dp::u8>(ErrorKind::Protocol); k <= static_cast<dp::u8>(ErrorKind::QueueFull);
             ++k) {
            const char *prefix = error_prefix(static_cast<ErrorKind>(k));
            if (std::strncmp(msg, prefix, std::strlen(prefix)) == 0) {
                return static_cast<ErrorKind>(k);
            }
        }
        return ErrorKind::Collaborator;
    }

    /// Message with the kind prefix stripped.
    inline std::string detail_of(const dp::Error &err) {
        const std::string msg = err.message.c_str();
        const std::string prefix = error_prefix(kind_of(err));
        if (msg.rfind(prefix, 0) == 0) {
            return msg.substr(prefix.size());
        }
        return msg;
    }

    template <typename T> inline dp::Result<T> fail(ErrorKind kind, const std::string &detail) {
        return dp::Result<T>::err(make_error(kind, detail));
    }

    inline dp::Result<Ack> ok() { return dp::Result<Ack>::ok(Ack{}); }

} // namespace puppet
