#pragma once

#include "jsonactor/utils.hpp"

#include "jsonactor/net/buffer.hpp"

namespace jsonactor::net::detail {
class WebsocketConnection;
}

namespace jsonactor::net {

enum class WebsocketOperation : int {
  HANDSHAKE, // TLS handshake
  ACCEPT,    // websocket upgrade
  READ,      // During read operation
  WRITE,     // During a write operation
};

constexpr std::string_view str(WebsocketOperation op) {
#define CASE(x)                                                                                    \
  case WebsocketOperation::x:                                                                      \
    return #x
  switch (op) {
    CASE(HANDSHAKE);
    CASE(ACCEPT);
    CASE(READ);
    CASE(WRITE);
  }
#undef CASE
  return "<unknown case>";
}

// -------------------------------------------------------------------------------- WebsocketSession

/**
 * A `WebsocketSession` is the application side of one accepted websocket connection.
 *
 * When a server upgrades a new connection, the server's `session_factory` creates a
 * `WebsocketSession` to receive its text messages and send replies. Callbacks for one
 * session are never called concurrently.
 *
 * @see WebsocketServer::Config for where to set the factory method on a websocket server.
 */
class WebsocketSession {
private:
  struct Pimpl;
  std::unique_ptr<Pimpl> pimpl_;
  friend class detail::WebsocketConnection; //! The internal websocket connection

public:
  WebsocketSession();
  virtual ~WebsocketSession();

  /**
   * @brief Queue a text message to the other end.
   * Messages are sent in the order they are queued. Sending on a connection that has
   * closed reports `WebsocketOperation::WRITE` to `on_error`.
   */
  void send_message(BufferType&& buffer);

  /**
   * @brief The websocket upgrade has completed
   */
  virtual void on_connect() {}

  /**
   * @brief A text message has arrived. Binary messages are dropped before this point.
   *
   * The payload must be consumed immediately, because the underlying buffer is reused.
   * Must not throw.
   */
  virtual void on_receive(std::span<const std::byte> payload) = 0;

  /**
   * @brief The other end closed the connection
   */
  virtual void on_close(uint16_t code, std::string_view reason) {}

  /**
   * @brief The connection failed; non-write errors end the connection
   */
  virtual void on_error(WebsocketOperation operation, std::error_code ec) {}

  /**
   * @brief A `send_message` call is finished, and the buffer is being returned.
   * If not overriden, then the buffer will be deleted normally.
   */
  virtual void on_return_buffer(BufferType&& buffer) {}
};

} // namespace jsonactor::net
