#include <ripple/ripple.hpp>
#include <iostream>
#include <string>

using namespace ripple;

int main() {
  log::load_env_levels();

  subject<std::string> subj;
  auto obs = subj.as_observable()
    | map([](const std::string& s){ return "[evt] " + s; });

  auto s1 = obs.subscribe([](const std::string& s){ std::cout << "A " << s << "\n"; });
  auto s2 = obs.subscribe([](const std::string& s){ std::cout << "B " << s << "\n"; });

  subj.next("hello").next("world");

  // unsubscribe B and send another event
  s2.unsubscribe();
  subj.next("only A hears this");

  // late subscribers get no replay
  auto s3 = subj.subscribe([](const std::string& s){ std::cout << "C got: " << s << "\n"; });
  subj.next("A and C");

  s1.unsubscribe();
  s3.unsubscribe();
  return 0;
}
