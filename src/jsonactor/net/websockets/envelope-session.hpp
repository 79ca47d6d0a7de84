#pragma once

#include "websocket-session.hpp"

#include "jsonactor/rpc/dispatcher.hpp"

#include "jsonactor/utils.hpp"

namespace jsonactor::net {

/**
 * @brief How forgiving the websocket adapter is of malformed messages.
 *
 * + STRICT: a message that is not JSON, or lacks `method` or `params`, gets a
 *   `{"error": ...}` object back.
 * + LENIENT: a message that is not JSON gets the string "Invalid JSON" back; a
 *   missing `method` is answered with "Unknown method: unknown" without consulting
 *   the registry, and missing `params` are taken to be `{}`.
 */
enum class EnvelopePolicy : int { STRICT, LENIENT };

constexpr std::string_view str(EnvelopePolicy policy) {
  switch (policy) {
  case EnvelopePolicy::STRICT: return "strict";
  case EnvelopePolicy::LENIENT: return "lenient";
  }
  return "<unknown case>";
}

/**
 * @brief The reply to one websocket text message `{"method": ..., "params": ...}`.
 */
string handle_envelope(const rpc::Dispatcher& dispatcher, string_view text,
                       EnvelopePolicy policy);

// --------------------------------------------------------------------------------- EnvelopeSession

/**
 * @brief Answers each text message on a websocket connection with one reply, in order.
 */
class EnvelopeSession final : public WebsocketSession {
private:
  const uint64_t id_;
  shared_ptr<const rpc::Dispatcher> dispatcher_;
  EnvelopePolicy policy_;

public:
  EnvelopeSession(uint64_t id, shared_ptr<const rpc::Dispatcher> dispatcher,
                  EnvelopePolicy policy);

  void on_connect() override;
  void on_receive(std::span<const std::byte> payload) override;
  void on_close(uint16_t code, std::string_view reason) override;
  void on_error(WebsocketOperation operation, std::error_code ec) override;
};

} // namespace jsonactor::net
