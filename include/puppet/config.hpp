#pragma once

#include <array>
#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

#include <datapod/datapod.hpp>

#include "puppet/error.hpp"

namespace puppet {

    enum class TrunkMode : dp::u8 {
        Integrating = 0, // trunk command is a translate rate
        Absolute = 1,    // trunk command is a pose; no longer supported
    };

    using TorsoPose = std::array<dp::f64, 4>;

    /// Torso joint positions at trunk translate 0 (upright), 1 (downward) and 2 (ground).
    struct TorsoCalibration {
        TorsoPose upright{0.45, -0.4, 0.0, 0.0};
        TorsoPose downward{1.6, -2.5, -0.94, 0.0};
        TorsoPose ground{1.735, -2.57, -2.1, 0.0};
    };

    /// Layout of the single-active-arm topology.
    struct ArmsLayout {
        std::vector<std::string> names{"left", "right"};
        dp::usize joints_per_arm = 6;
        dp::usize initial_active = 1;
    };

    struct Config {
        // Transport
        std::string endpoint = "tcp://127.0.0.1:5556";
        dp::usize event_queue_capacity = 32;

        // Robot
        std::string robot = "r1";
        ArmsLayout arms;
        dp::f64 tick_hz = 30.0;

        // Safety
        dp::f64 cooldown_s = 1.5;
        dp::f64 cooldown_speed_deg = 10.0;

        // Trunk
        TrunkMode trunk_mode = TrunkMode::Integrating;
        dp::f64 default_trunk_translate = 0.5;
        TorsoCalibration torso;

        // Recording
        bool auto_checkpoint = true;
        dp::u64 checkpoint_every_ticks = 1000;

        // Ghost mirror
        bool ghosting = true;
        dp::f64 ghost_threshold_rad = 0.1;
        dp::u32 ghost_appear_ticks = 2;

        dp::f64 tick_period_s() const { return 1.0 / tick_hz; }

        /// Largest per-tick arm joint displacement allowed during cooldown.
        dp::f64 cooldown_max_delta() const { return cooldown_speed_deg * (3.14159265358979323846 / 180.0) * tick_period_s(); }

        dp::Result<Ack> validate() const {
            if (!(tick_hz > 0.0)) {
                return fail<Ack>(ErrorKind::Configuration, "tick rate must be positive");
            }
            if (cooldown_s < 0.0) {
                return fail<Ack>(ErrorKind::Configuration, "cooldown must not be negative");
            }
            if (!(cooldown_speed_deg > 0.0)) {
                return fail<Ack>(ErrorKind::Configuration, "cooldown speed must be positive");
            }
            if (trunk_mode != TrunkMode::Integrating) {
                return fail<Ack>(ErrorKind::Configuration, "non-integrating trunk control is not supported");
            }
            if (default_trunk_translate < 0.0 || default_trunk_translate > 2.0) {
                return fail<Ack>(ErrorKind::Configuration, "default trunk translate outside [0, 2]");
            }
            if (auto_checkpoint && checkpoint_every_ticks == 0) {
                return fail<Ack>(ErrorKind::Configuration, "checkpoint period must be at least one tick");
            }
            if (event_queue_capacity == 0) {
                return fail<Ack>(ErrorKind::Configuration, "event queue needs room for one event");
            }
            if (!(torso.upright[0] < torso.downward[0] && torso.downward[0] < torso.ground[0])) {
                return fail<Ack>(ErrorKind::Configuration, "torso calibration must be monotonic in the first joint");
            }
            if (robot == "arms") {
                if (arms.names.empty() || arms.joints_per_arm == 0) {
                    return fail<Ack>(ErrorKind::Configuration, "arms topology needs at least one arm with joints");
                }
                if (arms.initial_active >= arms.names.size()) {
                    return fail<Ack>(ErrorKind::Configuration, "initial active arm out of range");
                }
            } else if (robot != "r1") {
                return fail<Ack>(ErrorKind::Configuration, "unknown robot topology '" + robot + "'");
            }
            return ok();
        }
    };

    /// Parse a finite real option value such as "30" or "1.5".
    inline dp::Result<dp::f64> parse_real(const std::string &option, const std::string &text) {
        char *end = nullptr;
        const dp::f64 v = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size() || !std::isfinite(v)) {
            return fail<dp::f64>(ErrorKind::Configuration, option + ": '" + text + "' is not a number");
        }
        return dp::Result<dp::f64>::ok(v);
    }

    /// Parse a tick count: a whole, non-negative number that fits in 64 bits.
    inline dp::Result<dp::u64> parse_ticks(const std::string &option, const std::string &text) {
        auto real = parse_real(option, text);
        if (real.is_err()) {
            return dp::Result<dp::u64>::err(real.error());
        }
        const dp::f64 v = real.value();
        // 2^64 is the first double that no longer fits.
        if (v < 0.0 || v >= 18446744073709551616.0 || std::floor(v) != v) {
            return fail<dp::u64>(ErrorKind::Configuration, option + ": '" + text + "' is not a tick count");
        }
        return dp::Result<dp::u64>::ok(static_cast<dp::u64>(v));
    }

    inline const char *to_string(TrunkMode m) { return m == TrunkMode::Integrating ? "integrating" : "absolute"; }

} // namespace puppet
