#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace jsonactor::net {

/** @brief Owns the payload of one websocket frame */
using BufferType = std::vector<std::byte>;

inline std::string_view to_string_view(std::span<const std::byte> payload) {
  return {reinterpret_cast<const char*>(payload.data()), payload.size()};
}

inline BufferType make_send_buffer(std::string_view ss) {
  const std::byte* data = reinterpret_cast<const std::byte*>(ss.data());
  return BufferType{data, data + ss.size()};
}

} // namespace jsonactor::net
