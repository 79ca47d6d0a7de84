#pragma once

#include "dispatch-error.hpp"
#include "json-codec.hpp"
#include "method-registry.hpp"

#include "jsonactor/utils.hpp"

namespace jsonactor::rpc {

// ------------------------------------------------------------------------------------ Dispatcher

/**
 * @brief Routes a method name and a JSON parameter object to an actor, and returns
 *        the JSON encoded result.
 *
 * This is the seam between the transports and the actor: the transports only ever
 * see a `Dispatcher`, never the actor type. Dispatching is threadsafe, and never
 * fails at this level: every error is reported as a JSON string.
 */
class Dispatcher {
public:
  virtual ~Dispatcher() = default;

  /**
   * @brief Call `method_name` with the parameters in `raw_json`.
   * @return The JSON text of the result, or the JSON string of the error message.
   */
  string dispatch(string_view method_name, string_view raw_json) const;

  /**
   * @brief Like `dispatch`, but keeps the error separate from the result.
   *
   * The parameters are parsed before the method is looked up, so malformed JSON is
   * reported even for an unknown method.
   */
  expected<string, DispatchError> invoke(string_view method_name, string_view raw_json) const;

  virtual bool has_method(string_view method_name) const = 0;
  virtual vector<string> method_names() const = 0;
  virtual vector<MethodInfo> describe() const = 0;

protected:
  virtual expected<json, DispatchError> call_(string_view method_name,
                                              const json& params) const = 0;
};

// ------------------------------------------------------------------------------- ActorDispatcher

template <typename Actor> class ActorDispatcher final : public Dispatcher {
private:
  shared_ptr<const Actor> actor_;
  shared_ptr<const MethodRegistry<Actor>> registry_;

public:
  ActorDispatcher(shared_ptr<const Actor> actor, shared_ptr<const MethodRegistry<Actor>> registry)
      : actor_{std::move(actor)}, registry_{std::move(registry)} {
    Expects(actor_ != nullptr);
    Expects(registry_ != nullptr);
  }

  const Actor& actor() const noexcept { return *actor_; }

  bool has_method(string_view method_name) const override {
    return registry_->find(method_name) != nullptr;
  }

  vector<string> method_names() const override { return registry_->names(); }

  vector<MethodInfo> describe() const override { return registry_->describe(); }

protected:
  expected<json, DispatchError> call_(string_view method_name, const json& params) const override {
    const auto* method = registry_->find(method_name);
    if (method == nullptr)
      return make_unexpected(make_dispatch_error(ecode::unknown_method, method_name));
    return method->invoke(*actor_, params);
  }
};

} // namespace jsonactor::rpc
