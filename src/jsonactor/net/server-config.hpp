#pragma once

#include "jsonactor/net/tls/tls-identity.hpp"
#include "jsonactor/net/websockets/envelope-session.hpp"

#include "jsonactor/utils.hpp"

#include <optional>

namespace jsonactor::net {

enum class Transport : int { HTTP, WEBSOCKET };

constexpr std::string_view str(Transport transport) {
  switch (transport) {
  case Transport::HTTP: return "http";
  case Transport::WEBSOCKET: return "websocket";
  }
  return "<unknown case>";
}

/**
 * @brief Everything needed to start one listener.
 */
struct ServerConfig {
  string address = "0.0.0.0";
  uint16_t port = 9000; //! 0 picks any free port
  Transport transport = Transport::HTTP;
  std::optional<TlsConfig> tls = std::nullopt; //! https/wss when set
  EnvelopePolicy envelope_policy = EnvelopePolicy::STRICT; //! websocket only
  std::size_t max_body_bytes = 1024 * 1024;                //! http only
  std::size_t thread_pool_size = 0; //! 0 for one thread per core

  /** @brief The url clients connect to, eg., "wss://0.0.0.0:9000" */
  string url(uint16_t bound_port) const;
};

/**
 * @brief The parsed command line of a server binary.
 */
struct CommandLine {
  ServerConfig server = {};
  bool show_help = false;
  bool describe = false;
  std::optional<string> log_level = std::nullopt;
};

/**
 * @brief Parses the server switches.
 *
 * Exceptions
 * + `std::runtime_error` on an unknown switch, a missing or out of range value, or
 *   when only one of `--cert` and `--key` is given.
 */
CommandLine parse_command_line(int argc, char** argv);

void show_help(std::string_view exec_name);

} // namespace jsonactor::net
