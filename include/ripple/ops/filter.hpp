#pragma once
#include <ripple/core/observable.hpp>
#include <utility>

namespace ripple {

template <class Pred>
struct op_filter {
  Pred p;
  template <class T>
  auto operator()(const observable<T>& src) const {
    return observable<T>::create([src, p = p](auto on_next){
      return src.subscribe([p, on_next](const T& v){ if (p(v)) on_next(v); });
    });
  }
};
template <class Pred> op_filter(Pred)->op_filter<Pred>;
template <class Pred> inline auto filter(Pred p){ return op_filter<Pred>{ std::move(p) }; }

} // namespace ripple
