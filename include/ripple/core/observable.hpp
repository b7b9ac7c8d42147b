#pragma once
#include <concepts>
#include <functional>
#include <utility>
#include <ripple/core/subscription.hpp>

namespace ripple {

// Cold, push-based source. next is the only signal: there is no error or
// completion channel.
template <class T>
class observable {
public:
  using value_type = T;
  using OnNext = std::function<void(const T&)>;

  // Factory: create observable from subscribe function
  static observable create(std::function<subscription(OnNext)> impl) {
    return observable(std::move(impl));
  }

  subscription subscribe(OnNext on_next) const {
    return impl_(std::move(on_next));
  }

private:
  explicit observable(std::function<subscription(OnNext)> impl)
    : impl_(std::move(impl)) {}

  std::function<subscription(OnNext)> impl_;
};

// Anything that accepts a receiver of const T& and hands back something
// that can be unsubscribed.
template <class S, class T>
concept source_of = requires(S s, std::function<void(const T&)> fn) {
  { s.subscribe(std::move(fn)) };
};

// Anything values of T can be pushed into.
template <class O, class T>
concept observer_of = requires(const O& o, T v) {
  { o.next(std::move(v)) };
};

} // namespace ripple
