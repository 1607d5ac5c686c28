#include <dwn/core/record_lock.hpp>

namespace dwn::core {

record_lock_table::guard::guard(record_lock_table& table,
                                std::pair<std::string, std::string> key)
    : table_{table},
      key_{std::move(key)},
      lock_{table_.acquire(key_)} {}

record_lock_table::guard::~guard() {
  lock_.unlock();
  table_.release(key_);
}

std::unique_ptr<record_lock_table::guard> record_lock_table::lock(
    const std::string_view tenant,
    const std::string_view key) {
  return std::make_unique<guard>(
      *this, std::pair{std::string{tenant}, std::string{key}});
}

std::size_t record_lock_table::size() const {
  auto lock = std::scoped_lock{mutex_};
  return entries_.size();
}

std::mutex& record_lock_table::acquire(
    const std::pair<std::string, std::string>& key) {
  auto lock = std::scoped_lock{mutex_};
  auto& slot = entries_[key];
  if (!slot) {
    slot = std::make_unique<entry>();
  }
  ++slot->users;
  return slot->mutex;
}

void record_lock_table::release(
    const std::pair<std::string, std::string>& key) {
  auto lock = std::scoped_lock{mutex_};
  auto found = entries_.find(key);
  if (found == std::end(entries_)) {
    return;
  }
  if (--found->second->users == 0) {
    entries_.erase(found);
  }
}

}  // namespace dwn::core
