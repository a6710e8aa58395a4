#pragma once

#include <algorithm>

#include <datapod/datapod.hpp>

#include "puppet/config.hpp"

namespace puppet {
    namespace control {

        /// Torso joint positions for a trunk translate in [0, 2].
        ///
        /// Piecewise linear through the calibration poses: upright at 0, downward
        /// at 1, ground at 2. Out-of-range inputs are clamped first.
        inline dp::Vector<dp::f64> convert_to_torso_pose(dp::f64 translate, const TorsoCalibration &cal) {
            translate = std::clamp(translate, 0.0, 2.0);

            const TorsoPose *from = &cal.upright;
            const TorsoPose *to = &cal.downward;
            dp::f64 t = translate;
            if (translate > 1.0) {
                from = &cal.downward;
                to = &cal.ground;
                t = translate - 1.0;
            }

            dp::Vector<dp::f64> out;
            out.reserve(from->size());
            for (dp::usize i = 0; i < from->size(); ++i) {
                out.push_back((1.0 - t) * (*from)[i] + t * (*to)[i]);
            }
            return out;
        }

        /// Inverse of convert_to_torso_pose(), read off the first torso joint.
        inline dp::f64 infer_torso_pose(const dp::Vector<dp::f64> &torso, const TorsoCalibration &cal) {
            const dp::f64 q = torso.empty() ? cal.upright[0] : torso[0];
            if (q > cal.downward[0]) {
                return 1.0 + (q - cal.downward[0]) / (cal.ground[0] - cal.downward[0]);
            }
            return (q - cal.upright[0]) / (cal.downward[0] - cal.upright[0]);
        }

        /// Trunk lift state: the leader commands a rate, we integrate a translate.
        class TrunkIntegrator {
          public:
            explicit TrunkIntegrator(dp::f64 initial) : initial_(initial), translate_(initial) {}

            /// A positive rate lowers the trunk towards upright (translate decreases).
            dp::f64 integrate(dp::f64 rate, dp::f64 dt) {
                translate_ = std::clamp(translate_ - rate * dt, 0.0, 2.0);
                return translate_;
            }

            void reset() {
                translate_ = initial_;
                tilt_ = 0.0;
            }

            dp::f64 translate() const { return translate_; }
            void set_translate(dp::f64 t) { translate_ = std::clamp(t, 0.0, 2.0); }
            dp::f64 tilt() const { return tilt_; }
            void set_tilt(dp::f64 tilt) { tilt_ = tilt; }

          private:
            dp::f64 initial_;
            dp::f64 translate_;
            dp::f64 tilt_ = 0.0;
        };

    } // namespace control
} // namespace puppet
