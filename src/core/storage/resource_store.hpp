#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <sys/types.h>

#include "core/model/types.hpp"

namespace rowkeep {

// One JSON document per key at <data_dir>/<key>.json. Writes go through a
// temp file + fsync + rename so readers only ever see a whole document.
class ResourceStore {
public:
  using ChangeListener = std::function<void(const std::string& key, const Document& value)>;
  using Mutator = std::function<void(Document& value)>;

  Result open(std::string_view data_dir);

  ReadOutcome read(std::string_view key);
  Document load(std::string_view key, const Document& fallback);
  Result save(std::string_view key, const Document& value, SyncMode mode = SyncMode::Mirror);

  // Read-modify-write under the key lock. A missing or corrupt document
  // starts from fallback.
  Result update(std::string_view key, const Document& fallback, const Mutator& mutate,
                SyncMode mode = SyncMode::Mirror);

  // Raw file bytes, used for snapshots.
  std::optional<std::string> read_bytes(std::string_view key);
  // Writes bytes unchanged after checking they parse.
  Result restore_bytes(std::string_view key, std::string_view bytes, SyncMode mode);

  // Called with the key lock held, in write order. Must not write the same key.
  void set_change_listener(ChangeListener listener);

  [[nodiscard]] bool exists(std::string_view key) const;
  [[nodiscard]] std::optional<std::filesystem::file_time_type> last_modified(std::string_view key) const;
  [[nodiscard]] std::string path_for(std::string_view key) const;
  [[nodiscard]] const std::string& data_dir() const { return data_dir_; }
  [[nodiscard]] bool is_open() const { return !data_dir_.empty(); }
  [[nodiscard]] StoreHealthReport health_report() const;
  // Successful writes since open; moves on every save, update and restore.
  [[nodiscard]] std::uint64_t save_count() const { return save_count_.load(); }

private:
  std::string data_dir_;
  mode_t file_mode_ = 0644;

  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> key_locks_;

  std::mutex listener_mutex_;
  ChangeListener listener_;

  std::atomic<std::uint64_t> save_count_{0};
  std::atomic<std::uint64_t> failed_save_count_{0};
  std::atomic<std::uint64_t> quarantine_count_{0};

  std::mutex& lock_for(const std::string& key);
  ReadOutcome read_unlocked(const std::string& key);
  Result write_unlocked(const std::string& key, std::string_view bytes);
  std::string quarantine_unlocked(const std::string& key);
  void notify(const std::string& key, const Document& value, SyncMode mode);
};

// Serialized form written for every document: 2-space indent plus newline.
std::string serialize_document(const Document& value);

}  // namespace rowkeep
