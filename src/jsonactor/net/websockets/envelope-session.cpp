#include "stdinc.hpp"

#include "envelope-session.hpp"

#include "jsonactor/rpc/json-codec.hpp"

namespace jsonactor::net {

namespace {
  // Method name reported by the lenient policy when a message has none
  constexpr std::string_view k_unknown_method = "unknown";

  string encode(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
  }

  const string& invalid_format_reply() {
    static const string reply = encode(json{
        {"error",
         "Invalid message format. Expected {\"method\": \"method_name\", \"params\": {...}}"}});
    return reply;
  }
} // namespace

// --------------------------------------------------------------------------------- handle_envelope

string handle_envelope(const rpc::Dispatcher& dispatcher, string_view text,
                       EnvelopePolicy policy) {
  json envelope;
  try {
    envelope = json::parse(text);
  } catch (json::parse_error& e) {
    if (policy == EnvelopePolicy::LENIENT)
      return encode(json("Invalid JSON"));
    return encode(json{{"error", format("JSON parse error: {}", e.what())}});
  }

  const auto method = envelope.find("method");
  const auto params = envelope.find("params");
  const bool has_method = (method != envelope.end() && method->is_string());
  const bool has_params = (params != envelope.end());

  if (policy == EnvelopePolicy::STRICT && !(has_method && has_params))
    return invalid_format_reply();

  // A missing method never reaches the registry, whatever the actor exposes
  if (!has_method)
    return rpc::encode_error(rpc::make_dispatch_error(ecode::unknown_method, k_unknown_method));

  const auto raw_params = has_params ? encode(*params) : string{"{}"};
  return dispatcher.dispatch(method->get_ref<const string&>(), raw_params);
}

// --------------------------------------------------------------------------------- EnvelopeSession

EnvelopeSession::EnvelopeSession(uint64_t id, shared_ptr<const rpc::Dispatcher> dispatcher,
                                 EnvelopePolicy policy)
    : id_{id}, dispatcher_{std::move(dispatcher)}, policy_{policy} {
  Expects(dispatcher_ != nullptr);
}

void EnvelopeSession::on_connect() { INFO("websocket connection {} opened", id_); }

void EnvelopeSession::on_receive(std::span<const std::byte> payload) {
  send_message(make_send_buffer(handle_envelope(*dispatcher_, to_string_view(payload), policy_)));
}

void EnvelopeSession::on_close(uint16_t code, std::string_view reason) {
  INFO("websocket connection {} closed, code={}, reason='{}'", id_, code, reason);
}

void EnvelopeSession::on_error(WebsocketOperation operation, std::error_code ec) {
  INFO("websocket connection {}: {} failed: {}", id_, str(operation), ec.message());
}

} // namespace jsonactor::net
