#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace dwn::core {

/// Per (tenant, key) mutual exclusion for the read, resolve, write and prune
/// sequence of one logical record. Entries exist only while held or waited
/// on.
class record_lock_table final {
 public:
  class guard final {
   public:
    guard(record_lock_table& table, std::pair<std::string, std::string> key);
    ~guard();

    guard(const guard&) = delete;
    guard& operator=(const guard&) = delete;

   private:
    record_lock_table& table_;
    std::pair<std::string, std::string> key_;
    std::unique_lock<std::mutex> lock_;
  };

  [[nodiscard]] std::unique_ptr<guard> lock(std::string_view tenant,
                                            std::string_view key);

  /// Number of keys currently held or waited on.
  std::size_t size() const;

 private:
  struct entry final {
    std::mutex mutex;
    std::size_t users{};
  };

  std::mutex& acquire(const std::pair<std::string, std::string>& key);
  void release(const std::pair<std::string, std::string>& key);

  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, std::unique_ptr<entry>>
      entries_;
};

}  // namespace dwn::core
