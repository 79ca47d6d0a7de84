#include "stdinc.hpp"

#include "calculator.hpp"

#include "jsonactor/version.hpp"

namespace jsonactor::app {

double Calculator::add(double a, double b) const { return a + b; }

double Calculator::subtract(double a, double b) const { return a - b; }

double Calculator::multiply(double a, double b) const { return a * b; }

expected<double, string> Calculator::divide(double a, double b) const {
  if (b == 0.0)
    return make_unexpected(string{"Division by zero"});
  return a / b;
}

double Calculator::get_memory() const {
  std::lock_guard lock{padlock_};
  return memory_;
}

double Calculator::store(double value) const {
  std::lock_guard lock{padlock_};
  return std::exchange(memory_, value);
}

string Calculator::clear_memory() const {
  std::lock_guard lock{padlock_};
  memory_ = 0.0;
  return "Memory cleared";
}

string Calculator::info() const { return format("JSON Calculator v{}", JSONACTOR_VERSION_STRING); }

void Calculator::expose(rpc::RegistryBuilder<Calculator>& builder) {
  builder.expose("add", &Calculator::add, {"a", "b"}, "Add two numbers")
      .expose("subtract", &Calculator::subtract, {"a", "b"}, "Subtract `b` from `a`")
      .expose("multiply", &Calculator::multiply, {"a", "b"}, "Multiply two numbers")
      .expose("divide", &Calculator::divide, {"a", "b"}, "Divide `a` by `b`")
      .expose("get_memory", &Calculator::get_memory, "Get the current memory value")
      .expose("store", &Calculator::store, {"value"},
              "Store a value in memory, returning the previous value")
      .expose("clear_memory", &Calculator::clear_memory, "Clear memory (set to 0)")
      .expose("info", &Calculator::info, "Get calculator info");
}

} // namespace jsonactor::app
