#include <ripple/ripple.hpp>
#include <functional>
#include <iostream>
#include <string>

using namespace ripple;

struct FileSaved { std::string path; };

// A single-subscriber source: it only keeps the last receiver it was given.
class FileWatcher {
public:
  observable<FileSaved> events() {
    return observable<FileSaved>::create([this](auto on_next){
      sink_ = on_next;
      return subscription([this]{ sink_ = nullptr; });
    });
  }
  void saved(std::string path) { if (sink_) sink_(FileSaved{std::move(path)}); }

private:
  std::function<void(const FileSaved&)> sink_;
};

int main() {
  log::load_env_levels();

  FileWatcher watcher;
  // fork the watcher so several consumers can listen
  auto files = subject<FileSaved>::from_stream(watcher.events());

  auto ui = files.subscribe([](const FileSaved& e){
    std::cout << "[UI]     " << e.path << "\n";
  });

  auto images = (files.as_observable()
    | map([](const FileSaved& e){ return e.path; })
    | filter([](const std::string& p){ return p.size() >= 4 && p.rfind(".png") == p.size()-4; })
  ).subscribe([](const std::string& p){
    std::cout << "[PNG]    " << p << "\n";
  });

  auto first_two = (files.as_observable() | take(2)).subscribe([](const FileSaved& e){
    std::cout << "[FIRST2] " << e.path << "\n";
  });

  for (int i = 0; i < 4; ++i) {
    watcher.saved("/tmp/file" + std::to_string(i) + (i % 2 ? ".txt" : ".png"));
  }

  ui.unsubscribe();
  watcher.saved("/tmp/after_ui_left.png");

  images.unsubscribe();
  first_two.unsubscribe();
  return 0;
}
