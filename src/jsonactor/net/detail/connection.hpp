#pragma once

#include "jsonactor/utils.hpp"

namespace jsonactor::net::detail {

/**
 * @brief One accepted socket, as seen by the `Listener` that accepted it.
 *
 * Implementations run on their own strand, and call the close thunk from their
 * destructor so the listener can forget them.
 */
class Connection {
public:
  using CloseThunk = any_invocable<void(Connection*)>;

  virtual ~Connection() = default;

  /** @brief Start the connection; `on_close_thunk` is called when it is destroyed */
  virtual void run(CloseThunk on_close_thunk) = 0;

  /** @brief Cancel outstanding io, which ends the connection. Threadsafe */
  virtual void cancel() = 0;
};

} // namespace jsonactor::net::detail
