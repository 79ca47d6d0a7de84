#include "stdinc.hpp"

#include "server-config.hpp"

#include <cstdio>
#include <stdexcept>

namespace jsonactor::net {

string ServerConfig::url(uint16_t bound_port) const {
  const char* scheme = (transport == Transport::HTTP) ? (tls ? "https" : "http")
                                                      : (tls ? "wss" : "ws");
  return format("{}://{}:{}", scheme, address, bound_port);
}

// ------------------------------------------------------------------------------------- show-help

void show_help(std::string_view exec_name) {
  std::printf(R"V0G0N(

   Usage: %s [OPTIONS...]

   Options:

      -p|--port <int>          Port to listen on, 0 for any free port; default is 9000.
      --address <string>       Address to listen on; default is 0.0.0.0.
      --ws                     Serve websocket connections instead of http.
      --cert <filename>        PEM certificate chain; serve https/wss. Requires --key.
      --key <filename>         PEM PKCS#8 private key. Requires --cert.
      --threads <int>          Size of the io thread pool; default is one per core.
      --lenient                Lenient handling of malformed websocket messages.
      --max-body <int>         Largest http request body, in bytes; default is 1048576.
      --log-level <string>     One of trace, debug, info, warn, err, critical, off.
      --describe               Print the method reference (markdown), and exit.
      -h|--help                Show this message.

)V0G0N",
              string{exec_name}.c_str());
}

// ---------------------------------------------------------------------------- parse-command-line

CommandLine parse_command_line(int argc, char** argv) {
  CommandLine out;
  auto& config = out.server;
  string cert_path, key_path;

  auto positive_arg = [&](int& i) {
    const string_view arg = argv[i];
    const auto value = cli::safe_arg_int(argc, argv, i);
    if (value < 0)
      throw std::runtime_error(format("expected non-negative value after argument '{}'", arg));
    return static_cast<std::size_t>(value);
  };

  for (int i = 1; i < argc; ++i) {
    const string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      out.show_help = true;
    } else if (arg == "-p" || arg == "--port") {
      const auto port = cli::safe_arg_int(argc, argv, i);
      if (port < 0 || port > std::numeric_limits<uint16_t>::max())
        throw std::runtime_error(format("port out of range: {}", port));
      config.port = static_cast<uint16_t>(port);
    } else if (arg == "--address") {
      config.address = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--ws") {
      config.transport = Transport::WEBSOCKET;
    } else if (arg == "--cert") {
      cert_path = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--key") {
      key_path = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--threads") {
      config.thread_pool_size = positive_arg(i);
    } else if (arg == "--lenient") {
      config.envelope_policy = EnvelopePolicy::LENIENT;
    } else if (arg == "--max-body") {
      config.max_body_bytes = positive_arg(i);
      if (config.max_body_bytes == 0)
        throw std::runtime_error("--max-body must be at least 1");
    } else if (arg == "--log-level") {
      out.log_level = cli::safe_arg_str(argc, argv, i);
    } else if (arg == "--describe") {
      out.describe = true;
    } else {
      throw std::runtime_error(format("unknown argument: '{}'", arg));
    }
  }

  if (cert_path.empty() != key_path.empty())
    throw std::runtime_error("--cert and --key must be given together");
  if (!cert_path.empty())
    config.tls = TlsConfig{std::move(cert_path), std::move(key_path)};

  return out;
}

} // namespace jsonactor::net
