#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

#include <netpipe/netpipe.hpp>

#include "puppet/error.hpp"
#include "puppet/types.hpp"

namespace puppet {
    namespace rpc {

        // Method IDs shared between the server and any leader process.
        static constexpr uint32_t PUPPET_METHOD_NUM_DOFS = 1;
        static constexpr uint32_t PUPPET_METHOD_GET_JOINT_STATE = 2;
        static constexpr uint32_t PUPPET_METHOD_COMMAND_JOINT_STATE = 3;
        static constexpr uint32_t PUPPET_METHOD_GET_OBSERVATIONS = 4;
        static constexpr uint32_t PUPPET_METHOD_FREEDRIVE_ENABLED = 5;
        static constexpr uint32_t PUPPET_METHOD_SET_FREEDRIVE_MODE = 6;
        static constexpr uint32_t PUPPET_METHOD_POST_EVENT = 7;

        static constexpr uint32_t PUPPET_METHOD_FIRST = PUPPET_METHOD_NUM_DOFS;
        static constexpr uint32_t PUPPET_METHOD_LAST = PUPPET_METHOD_POST_EVENT;

        // Upper bounds that keep a corrupt length prefix from allocating gigabytes.
        static constexpr uint32_t kMaxVectorLen = 1u << 16;
        static constexpr uint32_t kMaxStringLen = 1u << 12;

        // ---------------------------------------------------------------------------
        // Wire helpers -- pack/unpack POD values into a netpipe::Message
        //
        //   vector   [n:4] { f64 } * n
        //   string   [len:4] bytes
        //   optional [present:1] value?
        //   bool     [0|1:1]
        //   mapping  [count:4] { string vector } * count
        //
        // Every response starts with [status:1]: 0 means the payload follows,
        // anything else is an ErrorKind followed by a message string.
        // ---------------------------------------------------------------------------

        template <typename T> inline void write_val(netpipe::Message &buf, const T &val) {
            const uint8_t *p = reinterpret_cast<const uint8_t *>(&val);
            for (size_t i = 0; i < sizeof(T); ++i) {
                buf.push_back(p[i]);
            }
        }

        inline void write_vector(netpipe::Message &buf, const dp::Vector<dp::f64> &v) {
            write_val(buf, static_cast<uint32_t>(v.size()));
            for (auto x : v) {
                write_val(buf, x);
            }
        }

        inline void write_string(netpipe::Message &buf, const std::string &s) {
            write_val(buf, static_cast<uint32_t>(s.size()));
            for (char c : s) {
                buf.push_back(static_cast<uint8_t>(c));
            }
        }

        /// Bounds-checked cursor over a received message.
        class Reader {
          public:
            explicit Reader(const netpipe::Message &msg) : ptr_(msg.data()), end_(msg.data() + msg.size()) {}

            template <typename T> dp::Result<T> val() {
                if (static_cast<size_t>(end_ - ptr_) < sizeof(T)) {
                    return fail<T>(ErrorKind::Protocol, "truncated payload");
                }
                T out;
                std::memcpy(&out, ptr_, sizeof(T));
                ptr_ += sizeof(T);
                return dp::Result<T>::ok(out);
            }

            dp::Result<dp::Vector<dp::f64>> vector() {
                auto n = val<uint32_t>();
                if (n.is_err()) {
                    return dp::Result<dp::Vector<dp::f64>>::err(n.error());
                }
                if (n.value() > kMaxVectorLen || remaining() < n.value() * sizeof(dp::f64)) {
                    return fail<dp::Vector<dp::f64>>(ErrorKind::Protocol, "vector length " + std::to_string(n.value()) +
                                                                              " does not fit payload");
                }
                dp::Vector<dp::f64> out;
                out.reserve(n.value());
                for (uint32_t i = 0; i < n.value(); ++i) {
                    out.push_back(val<dp::f64>().value());
                }
                return dp::Result<dp::Vector<dp::f64>>::ok(std::move(out));
            }

            dp::Result<std::string> string() {
                auto n = val<uint32_t>();
                if (n.is_err()) {
                    return dp::Result<std::string>::err(n.error());
                }
                if (n.value() > kMaxStringLen || remaining() < n.value()) {
                    return fail<std::string>(ErrorKind::Protocol, "string length " + std::to_string(n.value()) +
                                                                      " does not fit payload");
                }
                std::string out(reinterpret_cast<const char *>(ptr_), n.value());
                ptr_ += n.value();
                return dp::Result<std::string>::ok(std::move(out));
            }

            dp::Result<bool> boolean() {
                auto b = val<uint8_t>();
                if (b.is_err()) {
                    return dp::Result<bool>::err(b.error());
                }
                if (b.value() > 1) {
                    return fail<bool>(ErrorKind::Protocol, "invalid bool byte");
                }
                return dp::Result<bool>::ok(b.value() == 1);
            }

            size_t remaining() const { return static_cast<size_t>(end_ - ptr_); }

            /// Fails if bytes are left over after the last field.
            dp::Result<Ack> finish() const {
                if (ptr_ != end_) {
                    return fail<Ack>(ErrorKind::Protocol, std::to_string(remaining()) + " trailing bytes");
                }
                return ok();
            }

          private:
            const uint8_t *ptr_;
            const uint8_t *end_;
        };

        // ---------------------------------------------------------------------------
        // Requests
        // ---------------------------------------------------------------------------

        struct CommandRequest {
            dp::Vector<dp::f64> values;
            dp::Optional<std::string> component;
        };

        inline netpipe::Message encode_command(const CommandRequest &req) {
            netpipe::Message msg;
            write_vector(msg, req.values);
            write_val(msg, static_cast<uint8_t>(req.component.has_value() ? 1 : 0));
            if (req.component.has_value()) {
                write_string(msg, *req.component);
            }
            return msg;
        }

        inline dp::Result<CommandRequest> decode_command(const netpipe::Message &msg) {
            Reader r(msg);
            CommandRequest req;
            auto values = r.vector();
            if (values.is_err()) {
                return dp::Result<CommandRequest>::err(values.error());
            }
            req.values = std::move(values.value());
            auto present = r.boolean();
            if (present.is_err()) {
                return dp::Result<CommandRequest>::err(present.error());
            }
            if (present.value()) {
                auto name = r.string();
                if (name.is_err()) {
                    return dp::Result<CommandRequest>::err(name.error());
                }
                req.component = std::move(name.value());
            }
            auto done = r.finish();
            if (done.is_err()) {
                return dp::Result<CommandRequest>::err(done.error());
            }
            return dp::Result<CommandRequest>::ok(std::move(req));
        }

        inline netpipe::Message encode_bool(bool b) {
            netpipe::Message msg;
            write_val(msg, static_cast<uint8_t>(b ? 1 : 0));
            return msg;
        }

        inline netpipe::Message encode_event(Event ev) {
            netpipe::Message msg;
            write_val(msg, static_cast<uint8_t>(ev));
            return msg;
        }

        inline dp::Result<Event> decode_event(const netpipe::Message &msg) {
            Reader r(msg);
            auto code = r.val<uint8_t>();
            if (code.is_err()) {
                return dp::Result<Event>::err(code.error());
            }
            auto done = r.finish();
            if (done.is_err()) {
                return dp::Result<Event>::err(done.error());
            }
            switch (code.value()) {
            case static_cast<uint8_t>(Event::Resume):
                return dp::Result<Event>::ok(Event::Resume);
            case static_cast<uint8_t>(Event::Reset):
                return dp::Result<Event>::ok(Event::Reset);
            case static_cast<uint8_t>(Event::Stop):
                return dp::Result<Event>::ok(Event::Stop);
            default:
                return fail<Event>(ErrorKind::Protocol, "unknown event code " + std::to_string(code.value()));
            }
        }

        // ---------------------------------------------------------------------------
        // Responses
        // ---------------------------------------------------------------------------

        inline netpipe::Message respond_ok() {
            netpipe::Message msg;
            write_val(msg, static_cast<uint8_t>(ErrorKind::None));
            return msg;
        }

        inline netpipe::Message respond_error(const dp::Error &err) {
            netpipe::Message msg;
            write_val(msg, static_cast<uint8_t>(kind_of(err)));
            write_string(msg, detail_of(err));
            return msg;
        }

        inline void write_mapping(netpipe::Message &buf, const ObservationMap &map) {
            write_val(buf, static_cast<uint32_t>(map.size()));
            for (const auto &entry : map) {
                write_string(buf, entry.name);
                write_vector(buf, entry.values);
            }
        }

        /// Split a response into its payload reader, or the error it carries.
        inline dp::Result<Reader> open_response(const netpipe::Message &msg) {
            Reader r(msg);
            auto status = r.val<uint8_t>();
            if (status.is_err()) {
                return dp::Result<Reader>::err(status.error());
            }
            if (status.value() == static_cast<uint8_t>(ErrorKind::None)) {
                return dp::Result<Reader>::ok(r);
            }
            if (status.value() > static_cast<uint8_t>(ErrorKind::QueueFull)) {
                return fail<Reader>(ErrorKind::Protocol, "unknown response status");
            }
            auto detail = r.string();
            return fail<Reader>(static_cast<ErrorKind>(status.value()), detail.is_ok() ? detail.value() : "");
        }

        inline dp::Result<ObservationMap> read_mapping(Reader &r) {
            auto count = r.val<uint32_t>();
            if (count.is_err()) {
                return dp::Result<ObservationMap>::err(count.error());
            }
            if (count.value() > kMaxVectorLen) {
                return fail<ObservationMap>(ErrorKind::Protocol, "mapping too large");
            }
            ObservationMap out;
            for (uint32_t i = 0; i < count.value(); ++i) {
                auto name = r.string();
                if (name.is_err()) {
                    return dp::Result<ObservationMap>::err(name.error());
                }
                auto values = r.vector();
                if (values.is_err()) {
                    return dp::Result<ObservationMap>::err(values.error());
                }
                out.push_back({std::move(name.value()), std::move(values.value())});
            }
            return dp::Result<ObservationMap>::ok(std::move(out));
        }

    } // namespace rpc
} // namespace puppet
