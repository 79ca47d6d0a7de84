#pragma once

/**
 * @defgroup jsonactor-rpc Method Dispatch
 * @ingroup jsonactor
 */

#include "rpc/actor-handle.hpp"
#include "rpc/dispatch-error.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/json-codec.hpp"
#include "rpc/method-docs.hpp"
#include "rpc/method-registry.hpp"
