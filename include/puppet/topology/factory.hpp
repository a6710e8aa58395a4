#pragma once

#include <memory>

#include "puppet/config.hpp"
#include "puppet/topology/arms_only.hpp"
#include "puppet/topology/dual_arm_mobile.hpp"

namespace puppet {
    namespace topology {

        inline dp::Result<std::shared_ptr<Topology>> make(const Config &cfg) {
            if (cfg.robot == "r1") {
                return dp::Result<std::shared_ptr<Topology>>::ok(std::make_shared<DualArmMobile>());
            }
            if (cfg.robot == "arms") {
                return dp::Result<std::shared_ptr<Topology>>::ok(std::make_shared<ArmsOnly>(cfg.arms));
            }
            return fail<std::shared_ptr<Topology>>(ErrorKind::Configuration, "unknown robot topology '" + cfg.robot + "'");
        }

    } // namespace topology
} // namespace puppet
