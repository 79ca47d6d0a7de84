#pragma once

#include "jsonactor/rpc.hpp"

#include <stdexcept>

namespace jsonactor::test {

/**
 * @brief An actor with one method for each interesting kind of signature.
 */
class TestActor {
private:
  string name_;
  mutable std::mutex padlock_;
  mutable int64_t counter_ = 0;

public:
  explicit TestActor(string name = "Test") : name_{std::move(name)} {}

  // Widened, so that no pair of int32 arguments overflows
  int64_t add(int32_t a, int32_t b) const { return int64_t{a} + b; }
  string greet(string name) const { return format("Hello, {}! I'm {}", name, name_); }
  string info() const { return format("Test server: {}", name_); }
  string echo(string message) const { return message; }
  string ping() const { return "pong"; }

  expected<double, string> divide(double a, double b) const {
    if (b == 0.0)
      return make_unexpected(string{"Division by zero"});
    return a / b;
  }

  int64_t get_counter() const {
    std::lock_guard lock{padlock_};
    return counter_;
  }

  int64_t increment(int64_t amount) const {
    std::lock_guard lock{padlock_};
    counter_ += amount;
    return counter_;
  }

  void reset() const {
    std::lock_guard lock{padlock_};
    counter_ = 0;
  }

  string no_params() const { return "No parameters needed"; }

  string greet_optional(std::optional<string> name) const {
    return format("Hello, {}!", name.value_or("stranger"));
  }

  vector<int32_t> sequence(int32_t count) const {
    vector<int32_t> out(static_cast<std::size_t>(std::max(count, 0)));
    std::iota(begin(out), end(out), 1);
    return out;
  }

  string bad_bytes() const { return "\xff\xfe"; }

  string fails() const { throw std::runtime_error("deliberate failure"); }

  static void expose(rpc::RegistryBuilder<TestActor>& builder) {
    builder.expose("add", &TestActor::add, {"a", "b"}, "Add two integers")
        .expose("greet", &TestActor::greet, {"name"}, "Greet someone by name")
        .expose("info", &TestActor::info)
        .expose("echo", &TestActor::echo, {"message"})
        .expose("ping", &TestActor::ping)
        .expose("divide", &TestActor::divide, {"a", "b"}, "Divide `a` by `b`")
        .expose("get_counter", &TestActor::get_counter)
        .expose("increment", &TestActor::increment, {"amount"})
        .expose("reset", &TestActor::reset)
        .expose("no_params", &TestActor::no_params)
        .expose("greet_optional", &TestActor::greet_optional, {"name"})
        .expose("sequence", &TestActor::sequence, {"count"})
        .expose("bad_bytes", &TestActor::bad_bytes)
        .expose("fails", &TestActor::fails);
  }

private:
  string private_method() const { return "unreachable"; }
};

using TestHandle = rpc::ActorHandle<TestActor>;

} // namespace jsonactor::test
