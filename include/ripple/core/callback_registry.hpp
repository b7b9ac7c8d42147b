#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include <ripple/core/log.hpp>

namespace ripple {

// Identity of one registered callback. Issued from a per-registry counter
// starting at 1 and never reused, so a stale id cannot hit another entry.
struct callback_id {
  std::uint64_t value{0};

  explicit operator bool() const noexcept { return value != 0; }
  friend bool operator==(callback_id, callback_id) = default;
};

// Ordered collection of callbacks shared by every copy of a subject.
//
// Dispatch works on a snapshot taken when it starts: callbacks added during a
// pass wait for the next one, callbacks removed during a pass are skipped if
// their turn has not come yet. Entries are shared so a snapshot keeps a
// removed closure alive until the pass is over; closures are never copied.
template <class T>
class callback_registry {
public:
  using callback = std::function<void(const T&)>;

  callback_registry() = default;
  callback_registry(const callback_registry&) = delete;
  callback_registry& operator=(const callback_registry&) = delete;

  callback_id add(callback fn) {
    auto e = std::make_shared<entry>();
    e->id = callback_id{next_id_++};
    e->fn = std::move(fn);
    entries_.push_back(e);
    log::get()->debug("registry {}: added callback #{} ({} registered)",
                      static_cast<const void*>(this), e->id.value, entries_.size());
    return e->id;
  }

  // Removes the entry with this id. Unknown or already removed ids are ignored.
  bool remove(callback_id id) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      if ((*it)->id == id) {
        // The closure may own registrations on this registry; it is destroyed
        // only after entries_ is consistent again.
        auto victim = std::move(*it);
        entries_.erase(it);
        victim->active = false;
        log::get()->debug("registry {}: removed callback #{} ({} registered)",
                          static_cast<const void*>(this), id.value, entries_.size());
        return true;
      }
    }
    log::get()->trace("registry {}: callback #{} not registered, nothing removed",
                      static_cast<const void*>(this), id.value);
    return false;
  }

  bool contains(callback_id id) const noexcept {
    for (const auto& e : entries_)
      if (e->id == id) return true;
    return false;
  }

  void dispatch(const T& value) {
    if (entries_.empty()) return;
    const std::vector<std::shared_ptr<entry>> local = entries_;
    SPDLOG_LOGGER_TRACE(log::get(), "registry {}: delivering to {} callbacks",
                        static_cast<const void*>(this), local.size());
    for (const auto& e : local) {
      if (e->active && e->fn) e->fn(value);
    }
  }

  // Drops every entry; outstanding ids become no-ops.
  void clear() noexcept {
    auto local = std::move(entries_);
    entries_.clear();
    for (auto& e : local) e->active = false;
  }

  std::size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }

private:
  struct entry {
    callback_id id;
    callback fn;
    bool active{true};
  };

  std::vector<std::shared_ptr<entry>> entries_;
  std::uint64_t next_id_{1};
};

} // namespace ripple
