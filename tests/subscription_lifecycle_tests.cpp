#include <cassert>
#include <memory>
#include <string>
#include <vector>
#include <ripple/ripple.hpp>
#include <iostream>

using namespace ripple;

int main() {
  subject<int> s;
  int got = 0;

  // Dropping the handle keeps the callback registered
  {
    auto sub = s.subscribe([&](int v){ got += v; });
  }
  assert(s.size() == 1);
  s.next(1);
  assert(got == 1 && "A dropped subscription is retained, not cancelled");
  s.clear();
  assert(s.empty());

  // Opt-in scoped cancellation
  {
    auto sub = s.subscribe([&](int v){ got += v; });
    sub.cancel_on_destruct(true);
    s.next(1);
  }
  assert(got == 2);
  assert(s.empty() && "cancel_on_destruct(true) unsubscribes in the destructor");

  // Repeated unsubscribe is a no-op
  auto once = s.subscribe([&](int v){ got += v; });
  auto other = s.subscribe([&](int){ });
  once.unsubscribe();
  once.unsubscribe();
  assert(s.size() == 1 && "The second call must not touch other registrations");

  // Moving transfers the registration
  auto first = s.subscribe([&](int v){ got += 100 * v; });
  auto moved = std::move(first);
  assert(!first && moved);
  first.unsubscribe();
  s.next(1);
  assert(got == 102 && "Unsubscribing the moved-from handle does nothing");
  moved.unsubscribe();

  // An id whose entry is already gone is ignored
  auto gone = s.subscribe([&](int){});
  const callback_id id = gone.id();
  s.clear();
  assert(!s.remove_callback(id));
  gone.unsubscribe();
  assert(s.empty());

  // Ids are never reused, so a stale id cannot remove a newer callback
  auto x = s.subscribe([](int){});
  const callback_id stale = x.id();
  x.unsubscribe();
  auto y = s.subscribe([](int){});
  assert(y.id() != stale);
  assert(!s.remove_callback(stale));
  assert(s.size() == 1);
  y.unsubscribe();

  // release() forgets without cancelling
  auto r = s.subscribe([&](int v){ got += v; });
  r.release();
  r.unsubscribe();
  assert(s.size() == 1);
  s.clear();

  // Type-erased handle
  int erased_hits = 0;
  subscription erased = s.subscribe([&](int){ ++erased_hits; }).to_subscription();
  assert(erased);
  s.next(0);
  erased.unsubscribe();
  s.next(0);
  assert(erased_hits == 1);
  assert(!erased);

  // generic subscription runs its cancel function once
  int cancels = 0;
  auto g = make_subscription([&]{ ++cancels; });
  g.unsubscribe();
  g.unsubscribe();
  assert(cancels == 1);
  {
    auto scoped = make_subscription([&]{ ++cancels; }, true);
  }
  assert(cancels == 2);
  {
    auto unscoped = make_subscription([&]{ ++cancels; });
  }
  assert(cancels == 2 && "Dropping without cancel_on_destruct keeps the registration");
  assert(!empty_subscription());

  // A removed closure may own a scoped registration on the same subject:
  // destroying it cancels that registration without upsetting the others
  {
    subject<int> t;
    std::vector<std::string> seen;
    auto owned = std::make_shared<subject_subscription<int>>();
    auto a = t.subscribe([owned, &seen](int v){ seen.push_back("A" + std::to_string(v)); });
    auto c = t.subscribe([&](int v){ seen.push_back("C" + std::to_string(v)); });
    *owned = t.subscribe([&](int v){ seen.push_back("B" + std::to_string(v)); });
    owned->cancel_on_destruct(true);
    owned.reset();
    assert(t.size() == 3);

    a.unsubscribe();
    assert(t.size() == 1 && "Destroying A's closure cancels B as well");
    t.next(1);
    assert((seen == std::vector<std::string>{"C1"}));
    c.unsubscribe();

    // clear() destroys closures the same way
    auto inner = std::make_shared<subject_subscription<int>>();
    auto outer = t.subscribe([inner](int){});
    *inner = t.subscribe([](int){});
    inner->cancel_on_destruct(true);
    inner.reset();
    auto last = t.subscribe([&](int v){ seen.push_back("L" + std::to_string(v)); });
    assert(t.size() == 3);
    t.clear();
    assert(t.empty());
    t.next(2);
    assert(seen.size() == 1);
    outer.unsubscribe();
    last.unsubscribe();
  }

  other.unsubscribe();
  std::cout << "[subscription_lifecycle_tests] OK\n";
  return 0;
}
