#pragma once

#define JSONACTOR_VERSION_MAJOR 0
#define JSONACTOR_VERSION_MINOR 1
#define JSONACTOR_VERSION_PATCH 0
#define JSONACTOR_VERSION_STRING "0.1.0"

namespace jsonactor {
/** @brief Sent in the `Server` header of every HTTP and websocket-upgrade response */
inline constexpr const char* k_server_string = "jsonactor/" JSONACTOR_VERSION_STRING;
} // namespace jsonactor
