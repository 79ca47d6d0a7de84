#pragma once

#include "dispatcher.hpp"
#include "method-registry.hpp"

#include "jsonactor/utils.hpp"

#include <stdexcept>

namespace jsonactor::rpc {

/**
 * @brief Sole owner of an actor until the actor is handed to a server.
 *
 * Before serving, the handle can dispatch calls directly, which is handy for tests
 * and tooling. Serving consumes the handle (`std::move(handle).into_dispatcher()`);
 * the moved-from handle no longer refers to an actor, and using it throws
 * `std::logic_error`.
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * auto handle = ActorHandle<Calculator>::make();
 * handle.dispatch("add", R"({"a": 1, "b": 2})"); // "3.0"
 * serve(std::move(handle), config);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */
template <typename Actor> class ActorHandle {
private:
  shared_ptr<const ActorDispatcher<Actor>> dispatcher_;

  const ActorDispatcher<Actor>& checked_() const {
    if (dispatcher_ == nullptr)
      throw std::logic_error{"actor has been handed to a server"};
    return *dispatcher_;
  }

public:
  explicit ActorHandle(unique_ptr<Actor> actor,
                       shared_ptr<const MethodRegistry<Actor>> registry = registry_for<Actor>())
      : dispatcher_{make_shared<ActorDispatcher<Actor>>(shared_ptr<const Actor>{std::move(actor)},
                                                        std::move(registry))} {}

  /** @brief Construct the actor in place */
  template <typename... Args> static ActorHandle make(Args&&... args) {
    return ActorHandle{make_unique<Actor>(std::forward<Args>(args)...)};
  }

  ActorHandle(const ActorHandle&) = delete;
  ActorHandle(ActorHandle&&) noexcept = default;
  ActorHandle& operator=(const ActorHandle&) = delete;
  ActorHandle& operator=(ActorHandle&&) noexcept = default;
  ~ActorHandle() = default;

  /** @brief true iff the actor has been handed over, and this handle is empty */
  bool is_served() const noexcept { return dispatcher_ == nullptr; }

  string dispatch(string_view method_name, string_view raw_json) const {
    return checked_().dispatch(method_name, raw_json);
  }

  expected<string, DispatchError> invoke(string_view method_name, string_view raw_json) const {
    return checked_().invoke(method_name, raw_json);
  }

  const Actor& actor() const { return checked_().actor(); }
  const Actor* operator->() const { return &actor(); }

  vector<MethodInfo> describe() const { return checked_().describe(); }

  /**
   * @brief Gives up the actor; the handle is empty afterwards.
   */
  shared_ptr<const Dispatcher> into_dispatcher() && {
    checked_();
    return std::move(dispatcher_);
  }
};

} // namespace jsonactor::rpc
