#pragma once

/**
 * @defgroup jsonactor-net Transports
 * @ingroup jsonactor
 */

#include "net/asio-execution-context.hpp"
#include "net/buffer.hpp"
#include "net/http/http-handler.hpp"
#include "net/http/http-server.hpp"
#include "net/server-config.hpp"
#include "net/server.hpp"
#include "net/tls/tls-identity.hpp"
#include "net/websockets/envelope-session.hpp"
#include "net/websockets/websocket-server.hpp"
#include "net/websockets/websocket-session.hpp"
