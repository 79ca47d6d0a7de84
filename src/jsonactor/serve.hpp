#pragma once

/**
 * Everything an application needs to put an actor on the network.
 */

#include "net.hpp"
#include "rpc.hpp"

namespace jsonactor {
using net::serve;
using net::Server;
using net::ServerConfig;
using net::Transport;
using rpc::ActorHandle;
using rpc::RegistryBuilder;
} // namespace jsonactor
