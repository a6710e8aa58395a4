#pragma once

// Single-include convenience header for puppet.

#include "puppet/collaborators.hpp"
#include "puppet/config.hpp"
#include "puppet/control/buttons.hpp"
#include "puppet/control/checkpoint.hpp"
#include "puppet/control/command_buffer.hpp"
#include "puppet/control/event_queue.hpp"
#include "puppet/control/ghost.hpp"
#include "puppet/control/published.hpp"
#include "puppet/control/safety.hpp"
#include "puppet/control/synthesizer.hpp"
#include "puppet/control/torso.hpp"
#include "puppet/error.hpp"
#include "puppet/rpc/endpoint.hpp"
#include "puppet/rpc/leader_client.hpp"
#include "puppet/rpc/pipe_server.hpp"
#include "puppet/rpc/protocol.hpp"
#include "puppet/rpc/service.hpp"
#include "puppet/server.hpp"
#include "puppet/sim/sim_robot.hpp"
#include "puppet/topology/arms_only.hpp"
#include "puppet/topology/dual_arm_mobile.hpp"
#include "puppet/topology/factory.hpp"
#include "puppet/topology/topology.hpp"
#include "puppet/types.hpp"
