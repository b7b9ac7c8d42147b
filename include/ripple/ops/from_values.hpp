#pragma once
#include <ripple/core/observable.hpp>
#include <ripple/core/subscription.hpp>
#include <initializer_list>
#include <vector>

namespace ripple {

// Cold source: every subscriber gets all values, synchronously, inside subscribe().
template <class T>
inline observable<T> from_values(std::vector<T> values) {
  return observable<T>::create([values = std::move(values)](auto on_next){
    for (const auto& v : values) {
      if (on_next) on_next(v);
    }
    return subscription{};
  });
}

template <class T>
inline observable<T> from_values(std::initializer_list<T> values) {
  return from_values(std::vector<T>(values));
}

} // namespace ripple
