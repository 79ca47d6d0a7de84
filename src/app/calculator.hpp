#pragma once

#include "jsonactor/rpc/method-registry.hpp"

#include "jsonactor/utils.hpp"

#include <mutex>

namespace jsonactor::app {

/**
 * @brief A calculator with one memory register.
 */
class Calculator {
private:
  mutable std::mutex padlock_;
  mutable double memory_ = 0.0;

public:
  Calculator() = default;
  explicit Calculator(double memory) : memory_{memory} {}

  double add(double a, double b) const;
  double subtract(double a, double b) const;
  double multiply(double a, double b) const;

  /** @brief Fails with "Division by zero" when `b` is zero */
  expected<double, string> divide(double a, double b) const;

  double get_memory() const;

  /** @brief Store `value` in memory, returning the value it replaced */
  double store(double value) const;

  string clear_memory() const;
  string info() const;

  static void expose(rpc::RegistryBuilder<Calculator>& builder);
};

} // namespace jsonactor::app
