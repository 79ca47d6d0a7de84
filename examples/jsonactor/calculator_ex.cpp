#include "stdinc.hpp"

#include "app/calculator.hpp"

#include "jsonactor/rpc.hpp"

#include <cstdio>

namespace jsonactor::example {

int calculator_main() {
  const auto calculator = rpc::ActorHandle<app::Calculator>::make();

  auto call = [&calculator](const char* label, string_view method, string_view params) {
    std::printf("%s = %s\n", label, calculator.dispatch(method, params).c_str());
  };

  std::printf("Calculator Actor Example\n");
  std::printf("========================\n");

  call("Add 10.5 + 5.2", "add", R"({"a": 10.5, "b": 5.2})");
  call("Divide 20.0 / 4.0", "divide", R"({"a": 20.0, "b": 4.0})");
  call("Divide 10.0 / 0.0", "divide", R"({"a": 10.0, "b": 0.0})");
  call("Store 7", "store", R"({"value": 7})");
  call("Memory", "get_memory", "{}");
  call("Info", "info", "{}");
  call("Unknown method", "unknown", "{}");
  call("Bad parameters", "add", R"({"a": "ten"})");

  return EXIT_SUCCESS;
}

} // namespace jsonactor::example

int main(int, char**) { return jsonactor::example::calculator_main(); }
