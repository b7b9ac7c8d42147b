#pragma once
#include <vector>
#include <ripple/core/subscription.hpp>

namespace ripple {

// Owns a group of subscriptions and unsubscribes all of them at once.
// Not thread-safe, like the rest of the library.
class composite_subscription {
public:
  composite_subscription() = default;

  void add(subscription s) {
    if (cancelled_) {
      s.unsubscribe();
      return;
    }
    subs_.push_back(std::move(s));
  }

  void unsubscribe() {
    if (cancelled_) return;
    cancelled_ = true;
    std::vector<subscription> local;
    local.swap(subs_);
    for (auto& s : local) s.unsubscribe();
  }

  bool is_unsubscribed() const noexcept { return cancelled_; }
  std::size_t size() const noexcept { return subs_.size(); }

  composite_subscription(const composite_subscription&)            = delete;
  composite_subscription& operator=(const composite_subscription&) = delete;

  composite_subscription(composite_subscription&&)            = delete;
  composite_subscription& operator=(composite_subscription&&) = delete;

private:
  bool cancelled_{false};
  std::vector<subscription> subs_;
};

} // namespace ripple
