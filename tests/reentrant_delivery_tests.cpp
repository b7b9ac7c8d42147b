#include <cassert>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <ripple/ripple.hpp>
#include <iostream>

using namespace ripple;

int main() {
  // Subscribing from inside a callback: the newcomer waits for the next value
  {
    subject<int> s;
    std::vector<std::string> log;
    std::optional<subject_subscription<int>> late;
    auto a = s.subscribe([&](int v){
      log.push_back("A" + std::to_string(v));
      if (!late) late = s.subscribe([&](int w){ log.push_back("L" + std::to_string(w)); });
    });

    s.next(1);
    assert((log == std::vector<std::string>{"A1"}) && "Added during delivery: not part of that pass");
    s.next(2);
    assert((log == std::vector<std::string>{"A1", "A2", "L2"}));
    a.unsubscribe();
    late->unsubscribe();
  }

  // Unsubscribing a later callback from an earlier one: it is skipped in the same pass
  {
    subject<int> s;
    std::vector<std::string> log;
    subject_subscription<int> b;
    auto a = s.subscribe([&](int v){
      log.push_back("A" + std::to_string(v));
      b.unsubscribe();
    });
    b = s.subscribe([&](int v){ log.push_back("B" + std::to_string(v)); });

    s.next(1);
    assert((log == std::vector<std::string>{"A1"}) && "Removed before its turn: skipped");
    assert(s.size() == 1);
    a.unsubscribe();
  }

  // A callback may cancel itself while running
  {
    subject<int> s;
    int calls = 0;
    subject_subscription<int> self;
    self = s.subscribe([&, marker = std::string("self")](int){
      ++calls;
      assert(marker == "self" && "Captures stay valid for the whole call");
      self.unsubscribe();
    });
    auto after = s.subscribe([&](int){ calls += 10; });
    s.next(0);
    assert(calls == 11);
    s.next(0);
    assert(calls == 21);
    after.unsubscribe();
  }

  // Re-entrant next(): the inner pass completes before the outer one resumes
  {
    subject<int> s;
    std::vector<std::string> log;
    auto a = s.subscribe([&](int v){
      log.push_back("A" + std::to_string(v));
      if (v == 1) s.next(2);
    });
    auto b = s.subscribe([&](int v){ log.push_back("B" + std::to_string(v)); });
    s.next(1);
    assert((log == std::vector<std::string>{"A1", "A2", "B2", "B1"}));
    a.unsubscribe();
    b.unsubscribe();
  }

  // No fault isolation: a throwing callback stops the pass
  {
    subject<int> s;
    std::vector<std::string> log;
    auto a = s.subscribe([&](int v){
      if (v < 0) throw std::runtime_error("negative");
      log.push_back("A" + std::to_string(v));
    });
    auto b = s.subscribe([&](int v){ log.push_back("B" + std::to_string(v)); });
    bool thrown = false;
    try {
      s.next(-1);
    } catch (const std::runtime_error&) {
      thrown = true;
    }
    assert(thrown && "The exception reaches the caller of next()");
    assert(log.empty() && "Callbacks after the failing one do not run");
    s.next(3);
    assert((log == std::vector<std::string>{"A3", "B3"}) && "The subject keeps working");
    a.unsubscribe();
    b.unsubscribe();
  }

  std::cout << "[reentrant_delivery_tests] OK\n";
  return 0;
}
