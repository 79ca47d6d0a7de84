#pragma once

#include "jsonactor/utils.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace jsonactor {
using json = nlohmann::json;
} // namespace jsonactor

// ---------------------------------------------------------------------------------- adl_serializer

namespace nlohmann {

/**
 * An empty optional is `null`; a `null` (or, for parameters, a missing field)
 * decodes as an empty optional.
 */
template <typename T> struct adl_serializer<std::optional<T>> {
  static void to_json(json& j, const std::optional<T>& value) {
    if (value.has_value())
      j = *value;
    else
      j = nullptr;
  }

  static void from_json(const json& j, std::optional<T>& value) {
    if (j.is_null())
      value = std::nullopt;
    else
      value = j.get<T>();
  }
};

/**
 * A result-or-error value is `{"Ok": value}` or `{"Err": error}`.
 */
template <typename T, typename E> struct adl_serializer<tl::expected<T, E>> {
  static void to_json(json& j, const tl::expected<T, E>& value) {
    j = json::object();
    if (!value.has_value())
      j["Err"] = value.error();
    else if constexpr (std::is_void_v<T>)
      j["Ok"] = nullptr;
    else
      j["Ok"] = *value;
  }

  static void from_json(const json& j, tl::expected<T, E>& value) {
    if (j.is_object() && j.contains("Err")) {
      value = tl::make_unexpected(j.at("Err").get<E>());
    } else if (j.is_object() && j.contains("Ok")) {
      if constexpr (std::is_void_v<T>)
        value = tl::expected<T, E>{};
      else
        value = j.at("Ok").get<T>();
    } else {
      throw std::invalid_argument("expected an object with an `Ok` or `Err` field");
    }
  }
};

} // namespace nlohmann

// -------------------------------------------------------------------------------- Type description

namespace jsonactor::rpc {

namespace detail {
  template <typename T> struct is_optional : std::false_type {};
  template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

  template <typename T> struct is_vector : std::false_type {};
  template <typename T, typename A> struct is_vector<std::vector<T, A>> : std::true_type {};

  template <typename T> struct is_expected : std::false_type {};
  template <typename T, typename E> struct is_expected<tl::expected<T, E>> : std::true_type {};
} // namespace detail

template <typename T>
constexpr bool is_optional_v = detail::is_optional<std::remove_cvref_t<T>>::value;

/**
 * @brief A short, human readable name for how `T` appears on the wire.
 * Used when documenting exposed methods.
 */
template <typename T> string type_name() {
  using U = std::remove_cvref_t<T>;
  if constexpr (std::is_void_v<U>) {
    return "void";
  } else if constexpr (std::is_same_v<U, bool>) {
    return "bool";
  } else if constexpr (std::is_integral_v<U>) {
    return format("{}int{}", std::is_signed_v<U> ? "" : "u", 8 * sizeof(U));
  } else if constexpr (std::is_same_v<U, float>) {
    return "float";
  } else if constexpr (std::is_floating_point_v<U>) {
    return "double";
  } else if constexpr (std::is_same_v<U, string>) {
    return "string";
  } else if constexpr (std::is_same_v<U, json>) {
    return "json";
  } else if constexpr (detail::is_optional<U>::value) {
    return format("optional<{}>", type_name<typename U::value_type>());
  } else if constexpr (detail::is_vector<U>::value) {
    return format("vector<{}>", type_name<typename U::value_type>());
  } else if constexpr (detail::is_expected<U>::value) {
    return format("expected<{}, {}>", type_name<typename U::value_type>(),
                  type_name<typename U::error_type>());
  } else {
    return "object";
  }
}

/**
 * @brief A plausible JSON value of type `T`, for example requests in the docs.
 */
template <typename T> string example_value() {
  using U = std::remove_cvref_t<T>;
  if constexpr (std::is_same_v<U, bool>) {
    return "true";
  } else if constexpr (std::is_integral_v<U>) {
    return "42";
  } else if constexpr (std::is_floating_point_v<U>) {
    return "3.14";
  } else if constexpr (std::is_same_v<U, string>) {
    return "\"example\"";
  } else if constexpr (detail::is_optional<U>::value || std::is_same_v<U, json>) {
    return "null";
  } else if constexpr (detail::is_vector<U>::value) {
    return "[]";
  } else {
    return "{}";
  }
}


// ---------------------------------------------------------------------------------- Shape checks

namespace detail {
  inline string describe_json_value(const json& j) {
    switch (j.type()) {
    case json::value_t::null: return "null";
    case json::value_t::boolean: return format("boolean `{}`", j.dump());
    case json::value_t::number_integer:
    case json::value_t::number_unsigned: return format("integer `{}`", j.dump());
    case json::value_t::number_float: return format("floating point `{}`", j.dump());
    case json::value_t::string: return "string";
    case json::value_t::array: return "sequence";
    case json::value_t::object: return "map";
    default: break;
    }
    return "value";
  }

  template <typename T> [[noreturn]] void throw_invalid(string_view what, const json& j) {
    throw std::invalid_argument(
        format("invalid {}: {}, expected {}", what, describe_json_value(j), type_name<T>()));
  }
} // namespace detail

/**
 * @brief Throws `std::invalid_argument` unless `j` has the JSON type of `T`.
 *
 * Numbers are never coerced: an integer parameter rejects booleans, floating point
 * values, and integers outside its range. Floating point parameters accept any
 * number. Optionals accept `null`, and vectors check every element.
 */
template <typename T> void check_json_type(const json& j) {
  using U = std::remove_cvref_t<T>;
  if constexpr (std::is_same_v<U, bool>) {
    if (!j.is_boolean())
      detail::throw_invalid<U>("type", j);
  } else if constexpr (std::is_integral_v<U>) {
    if (!j.is_number_integer())
      detail::throw_invalid<U>("type", j);
    const bool in_range = j.is_number_unsigned() ? std::in_range<U>(j.get<uint64_t>())
                                                 : std::in_range<U>(j.get<int64_t>());
    if (!in_range)
      detail::throw_invalid<U>("value", j);
  } else if constexpr (std::is_floating_point_v<U>) {
    if (!j.is_number())
      detail::throw_invalid<U>("type", j);
  } else if constexpr (std::is_same_v<U, string>) {
    if (!j.is_string())
      detail::throw_invalid<U>("type", j);
  } else if constexpr (detail::is_optional<U>::value) {
    if (!j.is_null())
      check_json_type<typename U::value_type>(j);
  } else if constexpr (detail::is_vector<U>::value) {
    if (!j.is_array())
      detail::throw_invalid<U>("type", j);
    for (const auto& element : j)
      check_json_type<typename U::value_type>(element);
  }
}

} // namespace jsonactor::rpc
