#pragma once

#include "dispatch-error.hpp"
#include "json-codec.hpp"

#include "jsonactor/utils.hpp"

#include <array>
#include <map>
#include <tuple>
#include <utility>

namespace jsonactor::rpc {

// ----------------------------------------------------------------------------------- MethodInfo

struct ParamInfo {
  string name;
  string type;
  string example; //!< Example JSON value, for the docs
};

/**
 * @brief Everything about an exposed method, except how to call it.
 */
struct MethodInfo {
  string name;
  vector<ParamInfo> params;
  string result_type;
  string doc;
};

template <typename Actor> class RegistryBuilder;

// ------------------------------------------------------------------------------- MethodRegistry

/**
 * @brief The immutable table of methods that may be invoked by name on an `Actor`.
 *
 * Built once per actor type by `RegistryBuilder`, from the actor's static
 * `expose(RegistryBuilder<Actor>&)` function. Only methods named there are callable;
 * every other member of the actor is unreachable by name. Lookups are exact and
 * case-sensitive.
 */
template <typename Actor> class MethodRegistry {
public:
  using InvokeType = std::function<expected<json, DispatchError>(const Actor&, const json&)>;

  struct Method : public MethodInfo {
    InvokeType invoke;
  };

private:
  std::map<string, Method, std::less<>> methods_;
  friend class RegistryBuilder<Actor>;

public:
  /** @brief The method called `name`, or nullptr */
  const Method* find(string_view name) const {
    const auto ii = methods_.find(name);
    return (ii == cend(methods_)) ? nullptr : &ii->second;
  }

  std::size_t size() const noexcept { return methods_.size(); }

  /** @brief Names of all exposed methods, sorted */
  vector<string> names() const {
    return methods_ | ranges::views::keys | ranges::to<vector<string>>();
  }

  /** @brief Descriptions of all exposed methods, sorted by name */
  vector<MethodInfo> describe() const {
    return methods_ | ranges::views::values
           | ranges::views::transform([](const Method& m) -> MethodInfo { return m; })
           | ranges::to<vector<MethodInfo>>();
  }
};

// ------------------------------------------------------------------------------ RegistryBuilder

namespace detail {
  template <typename T> T decode_param(const json& params, const string& name) {
    const auto ii = params.find(name);
    if (ii == params.end()) {
      if constexpr (is_optional_v<T>)
        return T{};
      else
        throw std::invalid_argument(format("missing field `{}`", name));
    }
    check_json_type<T>(*ii);
    return ii->template get<T>();
  }

  // Braced initialization evaluates the parameters left to right
  template <typename... Args, std::size_t... I>
  std::tuple<Args...> decode_params([[maybe_unused]] const json& params,
                                    [[maybe_unused]] const vector<string>& names,
                                    std::index_sequence<I...>) {
    return std::tuple<Args...>{decode_param<Args>(params, names[I])...};
  }
} // namespace detail

/**
 * @brief Collects the methods of `Actor` that are callable by name.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * static void expose(RegistryBuilder<Calculator>& builder) {
 *   builder.expose("add", &Calculator::add, {"a", "b"}, "Add two numbers")
 *          .expose("info", &Calculator::info);
 * }
 * ~~~~~~~~~~~~~~~~~~~~~~
 *
 * Parameters are decoded from a JSON object by name; extra fields are ignored, and
 * `std::optional` parameters may be omitted. A `void` result is sent as `null`.
 */
template <typename Actor> class RegistryBuilder {
private:
  using RegistryType = MethodRegistry<Actor>;
  using Method = typename RegistryType::Method;

  vector<Method> methods_;

public:
  template <typename R, typename... Args>
  RegistryBuilder& expose(string name, R (Actor::*fn)(Args...) const,
                          std::array<string_view, sizeof...(Args)> param_names, string doc = {});

  template <typename R>
  RegistryBuilder& expose(string name, R (Actor::*fn)() const, string doc = {}) {
    return expose<R>(std::move(name), fn, std::array<string_view, 0>{}, std::move(doc));
  }

  /**
   * @brief The finished registry.
   * Fails if two methods were exposed under the same name.
   */
  expected<shared_ptr<const RegistryType>, DispatchError> build() const;
};

template <typename Actor>
template <typename R, typename... Args>
RegistryBuilder<Actor>& RegistryBuilder<Actor>::expose(
    string name, R (Actor::*fn)(Args...) const,
    std::array<string_view, sizeof...(Args)> param_names, string doc) {
  using DecodedType = std::tuple<std::decay_t<Args>...>;

  const std::array<string, sizeof...(Args)> types = {type_name<Args>()...};
  const std::array<string, sizeof...(Args)> examples = {example_value<Args>()...};

  Method method;
  method.name = name;
  method.doc = std::move(doc);
  method.result_type = type_name<R>();

  vector<string> names;
  names.reserve(param_names.size());
  for (std::size_t i = 0; i < param_names.size(); ++i) {
    names.emplace_back(param_names[i]);
    method.params.push_back({names.back(), types[i], examples[i]});
  }

  method.invoke = [fn, name, names = std::move(names)](
                      const Actor& actor, const json& params) -> expected<json, DispatchError> {
    if (!params.is_object())
      return make_unexpected(make_dispatch_error(
          ecode::param_deserialization, name,
          format("invalid type: {}, expected an object of named parameters", params.type_name())));

    auto decoded = [&]() -> expected<DecodedType, DispatchError> {
      try {
        return detail::decode_params<std::decay_t<Args>...>(params, names,
                                                            std::index_sequence_for<Args...>{});
      } catch (std::exception& e) {
        return make_unexpected(make_dispatch_error(ecode::param_deserialization, name, e.what()));
      }
    }();
    if (!decoded)
      return make_unexpected(std::move(decoded.error()));

    auto call = [&actor, fn](auto&&... args) -> R {
      return (actor.*fn)(std::forward<decltype(args)>(args)...);
    };

    if constexpr (std::is_void_v<R>) {
      try {
        std::apply(call, std::move(*decoded));
      } catch (std::exception& e) {
        return make_unexpected(make_dispatch_error(ecode::invocation_failed, name, e.what()));
      }
      return json(nullptr);
    } else {
      std::optional<std::remove_cvref_t<R>> result;
      try {
        result.emplace(std::apply(call, std::move(*decoded)));
      } catch (std::exception& e) {
        return make_unexpected(make_dispatch_error(ecode::invocation_failed, name, e.what()));
      }

      try {
        return json(std::move(*result));
      } catch (std::exception& e) {
        return make_unexpected(make_dispatch_error(ecode::result_serialization, name, e.what()));
      }
    }
  };

  methods_.push_back(std::move(method));
  return *this;
}

template <typename Actor>
expected<shared_ptr<const MethodRegistry<Actor>>, DispatchError>
RegistryBuilder<Actor>::build() const {
  auto registry = make_shared<RegistryType>();
  for (const auto& method : methods_) {
    const auto [ii, inserted] = registry->methods_.try_emplace(method.name, method);
    if (!inserted)
      return make_unexpected(make_dispatch_error(ecode::duplicate_method, method.name,
                                                 format("Duplicate method: {}", method.name)));
  }
  return shared_ptr<const RegistryType>{std::move(registry)};
}

// --------------------------------------------------------------------------------- registry_for

/**
 * @brief The registry for `Actor`, built on first use from `Actor::expose`.
 *
 * A registry that fails to build is a programming error, and is fatal.
 */
template <typename Actor> shared_ptr<const MethodRegistry<Actor>> registry_for() {
  static const shared_ptr<const MethodRegistry<Actor>> registry = []() {
    RegistryBuilder<Actor> builder;
    Actor::expose(builder);
    auto result = builder.build();
    if (!result)
      FATAL("failed to build method registry: {}", result.error().message);
    return std::move(*result);
  }();
  return registry;
}

} // namespace jsonactor::rpc
