#pragma once
#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

#include <ripple/core/callback_registry.hpp>
#include <ripple/core/log.hpp>
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>

namespace ripple {

template <class T> class subject_subscription;

// subject<T>: hot source + observer<T>.
// A subject is a handle: copies share one callback registry, so a value pushed
// through any copy reaches callbacks registered through any copy.
// Single-threaded. Delivery is synchronous and in registration order; see
// callback_registry for what a callback may do to the registry mid-delivery.
template <class T>
class subject {
public:
  using value_type = T;
  using OnNext = typename observable<T>::OnNext;

  subject() : registry_(std::make_shared<callback_registry<T>>()) {}

  // Moving copies the handle, so a moved-from subject still refers to its
  // registry.
  subject(const subject&) = default;
  subject(subject&& other) noexcept : registry_(other.registry_) {}
  subject& operator=(const subject&) = default;
  subject& operator=(subject&& other) noexcept {
    registry_ = other.registry_;
    return *this;
  }

  // Fork a single-subscriber stream: the returned subject relays every value
  // the upstream produces to all of its own subscribers. The forwarding
  // registration is released, it lives as long as the upstream does.
  template <class Source>
    requires source_of<Source, T>
  static subject from_stream(Source&& stream) {
    subject broadcast;
    auto forward = std::forward<Source>(stream).subscribe(
      [relay = broadcast](const T& v){ relay.next(v); });
    if constexpr (requires { forward.release(); }) forward.release();
    log::get()->debug("subject {}: forwarding from upstream",
                      static_cast<const void*>(broadcast.registry_.get()));
    return broadcast;
  }

  // Registering the same callable twice gives two independent registrations.
  // The returned handle does not cancel when dropped.
  template <class F>
    requires std::invocable<F&, const T&>
  subject_subscription<T> subscribe(F&& fn) const {
    const callback_id id = registry_->add(OnNext(std::forward<F>(fn)));
    return subject_subscription<T>(*this, id);
  }

  // Push a value to every registered callback, in registration order.
  // An exception thrown by a callback leaves this call and the callbacks
  // after it do not see the value.
  const subject& next(T value) const {
    auto keep = registry_;
    keep->dispatch(value);
    return *this;
  }

  // Used by subject_subscription; false if the id was not registered.
  bool remove_callback(callback_id id) const { return registry_->remove(id); }

  // Unregister everything; outstanding subscriptions become no-ops.
  void clear() const noexcept { registry_->clear(); }

  std::size_t size() const noexcept { return registry_->size(); }
  bool empty() const noexcept { return registry_->empty(); }

  // Type-erased view for operator pipelines.
  observable<T> as_observable() const {
    return observable<T>::create([self = *this](OnNext on_next) {
      return self.subscribe(std::move(on_next)).to_subscription();
    });
  }

  // Handles are equal when they share a registry.
  friend bool operator==(const subject& a, const subject& b) noexcept {
    return a.registry_ == b.registry_;
  }

private:
  std::shared_ptr<callback_registry<T>> registry_;
};

// One outstanding registration on a subject. Move-only; unsubscribe() has
// effect once, after which the handle is empty.
template <class T>
class subject_subscription {
public:
  subject_subscription() noexcept = default;

  subject_subscription(subject<T> source, callback_id id) noexcept
    : source_(std::move(source)), id_(id) {}

  subject_subscription(const subject_subscription&) = delete;
  subject_subscription& operator=(const subject_subscription&) = delete;

  subject_subscription(subject_subscription&& other) noexcept
    : source_(std::move(other.source_))
    , id_(other.id_)
    , cancel_on_dtor_(other.cancel_on_dtor_) {
    other.source_.reset();
    other.cancel_on_dtor_ = false;
  }

  subject_subscription& operator=(subject_subscription&& other) noexcept {
    if (this != &other) {
      if (cancel_on_dtor_) unsubscribe();
      source_ = std::move(other.source_);
      id_ = other.id_;
      cancel_on_dtor_ = other.cancel_on_dtor_;
      other.source_.reset();
      other.cancel_on_dtor_ = false;
    }
    return *this;
  }

  ~subject_subscription() {
    if (cancel_on_dtor_) unsubscribe();
  }

  void unsubscribe() {
    cancel_on_dtor_ = false;
    if (!source_) return;
    subject<T> src = std::move(*source_);
    source_.reset();
    src.remove_callback(id_);
  }

  // Forget the registration without removing it.
  void release() noexcept {
    source_.reset();
    cancel_on_dtor_ = false;
  }

  subject_subscription& cancel_on_destruct(bool v) noexcept {
    cancel_on_dtor_ = v && source_.has_value();
    return *this;
  }

  // Move into the type-erased handle used by observable<T>.
  subscription to_subscription() && {
    if (!source_) return subscription{};
    subscription s([src = std::move(*source_), id = id_]{ src.remove_callback(id); },
                   cancel_on_dtor_);
    source_.reset();
    cancel_on_dtor_ = false;
    return s;
  }

  callback_id id() const noexcept { return id_; }

  // This handle still owns a registration it has not cancelled.
  explicit operator bool() const noexcept { return source_.has_value(); }

private:
  std::optional<subject<T>> source_;
  callback_id id_{};
  bool cancel_on_dtor_{false};
};

} // namespace ripple
