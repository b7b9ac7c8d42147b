#pragma once
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>
#include <ripple/core/composite_subscription.hpp>
#include <cstddef>
#include <memory>

namespace ripple {

// take(n): forward the first n values, then unsubscribe from upstream.
struct op_take {
  std::size_t n;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, n = n](auto on_next){
      if (n == 0) return subscription{};
      auto left = std::make_shared<std::size_t>(n);
      auto composite = std::make_shared<composite_subscription>();

      subscription sub = src.subscribe(
        [left, on_next, composite](const T& v){
          if (*left == 0) return;
          const std::size_t rem = (*left)--;
          on_next(v);
          if (rem == 1) composite->unsubscribe();
        });

      // A synchronous upstream may already have delivered n values; add()
      // cancels straight away in that case.
      composite->add(std::move(sub));
      return subscription([composite]{ composite->unsubscribe(); });
    });
  }
};

inline auto take(std::size_t n){ return op_take{n}; }

} // namespace ripple
