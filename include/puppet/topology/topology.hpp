#pragma once

#include <string>
#include <utility>
#include <vector>

#include <datapod/datapod.hpp>

#include "puppet/error.hpp"
#include "puppet/types.hpp"

namespace puppet {
    namespace topology {

        /// One named component of the command layout.
        struct SlotSpec {
            std::string name;
            ComponentRef ref;
            dp::usize width = 0;
        };

        /// A component write produced by splitting a raw leader vector.
        struct Write {
            ComponentRef ref;
            dp::Vector<dp::f64> values;
        };

        struct Slice {
            dp::usize offset = 0;
            dp::usize width = 0;
        };

        /// Where each part sits in the action vector. Widths of zero mean "absent".
        struct ActionLayout {
            dp::Vector<Slice> arms;
            dp::Vector<Slice> grippers;
            Slice base;
            Slice trunk;
        };

        /// Arm targets and trunk pose handed to Topology::assemble().
        ///
        /// An empty target means "leave this arm at rest".
        struct Targets {
            dp::Vector<dp::Vector<dp::f64>> arms;
            dp::Vector<dp::f64> torso;
        };

        /// Kinematic layout of one robot family.
        ///
        /// Selected once at startup. Everything that differs between robots (how a
        /// raw command vector is sliced, whether the arms are coupled to a tilting
        /// trunk, where each part lands in the action vector) lives behind this
        /// interface so the control loop never branches on the robot type.
        class Topology {
          public:
            virtual ~Topology() = default;

            virtual const char *name() const = 0;
            virtual dp::usize action_dim() const = 0;

            /// True when a raw command is sliced positionally over slots() rather
            /// than routed whole to a named component.
            virtual bool positional() const = 0;

            /// True when the arms ride on a trunk whose tilt shifts their first joint
            /// and whose lift is driven by the integrating trunk controller.
            virtual bool trunk_coupled() const = 0;

            /// +1 / -1 sign applied to the trunk tilt offset for arm `i`.
            virtual dp::f64 shoulder_direction(dp::usize arm) const = 0;

            virtual const std::vector<std::string> &arm_names() const = 0;
            virtual const std::vector<SlotSpec> &slots() const = 0;

            /// Command record matching this layout, arms holding the given reset pose.
            virtual JointCommand blank_command(const JointFeedback &reset_state) const = 0;

            /// Raw arm targets for this tick, before tilt and safety clipping.
            virtual dp::Vector<dp::Vector<dp::f64>> arm_targets(const JointCommand &cmd,
                                                                 dp::usize active_arm) const = 0;

            virtual ActionLayout layout() const = 0;

            /// Write every part of the action vector. `action` is pre-sized and zeroed.
            virtual void assemble(const JointCommand &cmd, const Targets &targets,
                                  dp::Vector<dp::f64> &action) const = 0;

            dp::usize arm_count() const { return arm_names().size(); }

            dp::usize command_width() const {
                dp::usize total = 0;
                for (const auto &s : slots()) {
                    total += s.width;
                }
                return total;
            }

            const SlotSpec *find_slot(const std::string &component) const {
                for (const auto &s : slots()) {
                    if (s.name == component) {
                        return &s;
                    }
                }
                return nullptr;
            }

            /// Slot that receives an untargeted command on a non-positional layout.
            virtual const SlotSpec *default_slot(dp::usize active_arm) const = 0;

            /// Turn one leader vector into component writes.
            ///
            /// Positional layouts accept any prefix of the full layout that ends on a
            /// component boundary; the component argument is ignored for them. Other
            /// layouts route the whole vector to `component`, or to the active arm when
            /// none is named.
            dp::Result<dp::Vector<Write>> split(const dp::Vector<dp::f64> &raw, const dp::Optional<std::string> &component,
                                                dp::usize active_arm) const {
                dp::Vector<Write> out;
                if (positional()) {
                    if (raw.empty()) {
                        return fail<dp::Vector<Write>>(ErrorKind::Protocol, "empty command vector");
                    }
                    dp::usize start = 0;
                    for (const auto &s : slots()) {
                        if (start >= raw.size()) {
                            break;
                        }
                        if (start + s.width > raw.size()) {
                            return fail<dp::Vector<Write>>(ErrorKind::Protocol,
                                                           "command of " + std::to_string(raw.size()) +
                                                               " values splits component '" + s.name + "'");
                        }
                        Write w;
                        w.ref = s.ref;
                        w.values.reserve(s.width);
                        for (dp::usize i = start; i < start + s.width; ++i) {
                            w.values.push_back(raw[i]);
                        }
                        out.push_back(std::move(w));
                        start += s.width;
                    }
                    if (start < raw.size()) {
                        return fail<dp::Vector<Write>>(ErrorKind::Protocol,
                                                       "command of " + std::to_string(raw.size()) + " values exceeds layout of " +
                                                           std::to_string(command_width()));
                    }
                    return dp::Result<dp::Vector<Write>>::ok(std::move(out));
                }

                const SlotSpec *slot = nullptr;
                if (component.has_value()) {
                    slot = find_slot(*component);
                    if (!slot) {
                        return fail<dp::Vector<Write>>(ErrorKind::InvalidComponent, "'" + *component + "'");
                    }
                } else {
                    slot = default_slot(active_arm);
                }
                if (raw.size() != slot->width) {
                    return fail<dp::Vector<Write>>(ErrorKind::Protocol, "component '" + slot->name + "' takes " +
                                                                            std::to_string(slot->width) + " values, got " +
                                                                            std::to_string(raw.size()));
                }
                Write w;
                w.ref = slot->ref;
                w.values = raw;
                out.push_back(std::move(w));
                return dp::Result<dp::Vector<Write>>::ok(std::move(out));
            }
        };

        inline void write_slice(dp::Vector<dp::f64> &action, dp::usize offset, const dp::Vector<dp::f64> &values) {
            for (dp::usize i = 0; i < values.size() && offset + i < action.size(); ++i) {
                action[offset + i] = values[i];
            }
        }

    } // namespace topology
} // namespace puppet
