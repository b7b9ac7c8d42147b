#pragma once
#include <exception>
#include <functional>
#include <utility>
#include <type_traits>

#include <ripple/core/log.hpp>

namespace ripple {

// Move-only handle around an unsubscribe operation.
// - Copying is PROHIBITED (one registration - one owner).
// - Moving transfers the cancel right, the source becomes empty.
// - Dropping the handle does NOT cancel unless cancel_on_destruct(true) was set:
//   the registration it stands for simply stays alive.
class subscription {
public:
  using cancel_fn = std::function<void()>;

  // Creates an empty subscription.
  subscription() noexcept = default;

  explicit subscription(cancel_fn fn, bool cancel_on_dtor = false) noexcept
    : cancel_(std::move(fn)), cancel_on_dtor_(cancel_on_dtor && static_cast<bool>(cancel_)) {}

  subscription(const subscription&) = delete;
  subscription& operator=(const subscription&) = delete;

  subscription(subscription&& other) noexcept
    : cancel_(std::move(other.cancel_))
    , cancel_on_dtor_(other.cancel_on_dtor_) {
    other.cancel_ = nullptr;
    other.cancel_on_dtor_ = false;
  }

  subscription& operator=(subscription&& other) noexcept {
    if (this != &other) {
      drop();
      cancel_ = std::move(other.cancel_);
      cancel_on_dtor_ = other.cancel_on_dtor_;
      other.cancel_ = nullptr;
      other.cancel_on_dtor_ = false;
    }
    return *this;
  }

  ~subscription() { drop(); }

  // Runs the cancel function once and empties the handle. Repeated calls are no-op.
  // Whatever the cancel function throws reaches the caller.
  void unsubscribe() {
    cancel_on_dtor_ = false;
    if (!cancel_) return;
    auto fn = std::move(cancel_);
    cancel_ = nullptr;
    fn();
  }

  // Forget the cancellation; the registration stays alive.
  void release() noexcept {
    cancel_ = nullptr;
    cancel_on_dtor_ = false;
  }

  // There is an outstanding cancellation.
  explicit operator bool() const noexcept { return static_cast<bool>(cancel_); }

  void swap(subscription& other) noexcept {
    using std::swap;
    swap(cancel_, other.cancel_);
    swap(cancel_on_dtor_, other.cancel_on_dtor_);
  }

  // Whether the destructor (and move-assignment over this handle) unsubscribes.
  subscription& cancel_on_destruct(bool v) noexcept {
    cancel_on_dtor_ = v && static_cast<bool>(cancel_);
    return *this;
  }

  bool cancels_on_destruct() const noexcept { return cancel_on_dtor_; }

private:
  // Destructor path: must not throw.
  void drop() noexcept {
    if (cancel_on_dtor_ && cancel_) {
      try {
        unsubscribe();
      } catch (const std::exception& e) {
        log::get()->error("unsubscribe from destructor threw: {}", e.what());
      } catch (...) {
        log::get()->error("unsubscribe from destructor threw a non-standard exception");
      }
    }
    cancel_ = nullptr;
    cancel_on_dtor_ = false;
  }

  cancel_fn cancel_{};
  bool cancel_on_dtor_{false};
};

inline void swap(subscription& a, subscription& b) noexcept { a.swap(b); }

// Utility: make a subscription from a callable object (lambda, functor, ptr function).
template <class F,
          std::enable_if_t<std::is_invocable_v<F&>, int> = 0>
inline subscription make_subscription(F&& f, bool cancel_on_dtor = false) {
  return subscription(subscription::cancel_fn(std::forward<F>(f)), cancel_on_dtor);
}

// Utility: "empty" subscription (no-op).
inline subscription empty_subscription() noexcept {
  return subscription{};
}

} // namespace ripple
