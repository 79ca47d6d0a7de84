
// We know that `main.cpp` is going to be first in unity builds.
// Therefore, we include our precompiled header here, so that it
// is first in the unity (testcases) build.
#include "stdinc.hpp"

#include "app/calculator.hpp"

#include "jsonactor/serve.hpp"

#include <cstdio>

namespace jsonactor {

int main(int argc, char** argv) {
  net::CommandLine command_line;
  try {
    command_line = net::parse_command_line(argc, argv);
  } catch (std::runtime_error& e) {
    std::fprintf(stderr, "Error on command-line: %s\naborting...\n", e.what());
    return EXIT_FAILURE;
  }

  if (command_line.show_help) {
    net::show_help(argv[0]);
    return EXIT_SUCCESS;
  }

  if (command_line.log_level.has_value() && !logging::set_level(*command_line.log_level)) {
    std::fprintf(stderr, "Unknown log level: '%s'\naborting...\n",
                 command_line.log_level->c_str());
    return EXIT_FAILURE;
  }

  auto calculator = ActorHandle<app::Calculator>::make();

  if (command_line.describe) {
    const auto& config = command_line.server;
    const auto base_url = format("{}://localhost:{}", config.tls ? "https" : "http", config.port);
    std::fputs(rpc::describe_methods(calculator.describe(), "Calculator API", base_url).c_str(),
               stdout);
    return EXIT_SUCCESS;
  }

  serve(std::move(calculator), std::move(command_line.server));
  return EXIT_SUCCESS;
}

} // namespace jsonactor

// Don't compile in main(...) if we're doing a testcase build
#ifndef CATCH_BUILD

int main(int argc, char** argv) { return jsonactor::main(argc, argv); }

#endif
