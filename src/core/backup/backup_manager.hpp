#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "core/model/types.hpp"
#include "core/storage/resource_catalog.hpp"
#include "core/storage/resource_store.hpp"

namespace rowkeep {

// Compressed whole-store snapshots: backup_<trigger>_<stamp>.json.zst in
// the backup directory, newest kept, oldest rotated out.
class BackupManager {
public:
  BackupManager(ResourceStore& store, const ResourceCatalog& catalog, BackupPolicy policy);
  ~BackupManager();

  BackupManager(const BackupManager&) = delete;
  BackupManager& operator=(const BackupManager&) = delete;

  // On success data holds the archive path.
  Result create_snapshot(std::string_view trigger);
  // archive may be a file name inside the backup directory or a path.
  Result restore(std::string_view archive, bool confirm);

  [[nodiscard]] std::vector<BackupInfo> list_backups() const;
  [[nodiscard]] BackupStats stats() const;
  [[nodiscard]] bool has_changes_since_last_snapshot() const;
  [[nodiscard]] const std::string& backup_dir() const { return policy_.backup_dir; }

  // One tick of the automatic schedule; skipped when nothing changed.
  Result run_scheduled();
  void start_automatic();
  void stop_automatic();

private:
  ResourceStore& store_;
  const ResourceCatalog& catalog_;
  BackupPolicy policy_;

  std::mutex operation_mutex_;
  std::string last_stamp_;
  mutable std::mutex state_mutex_;
  // Store write count when the last snapshot started reading.
  std::optional<std::uint64_t> saves_at_snapshot_;

  std::mutex schedule_mutex_;
  std::condition_variable schedule_wake_;
  std::thread scheduler_;
  bool scheduler_running_ = false;
  bool scheduler_stopping_ = false;

  Result ensure_backup_dir() const;
  Result create_locked(std::string_view trigger);
  void rotate(const std::string& keep_path);
  std::filesystem::path resolve_archive(std::string_view archive) const;
  void scheduler_loop();
};

// Decoded bundle: metadata plus raw document text per key.
struct BackupBundle {
  BackupMetadata metadata;
  std::vector<std::pair<std::string, std::string>> entries;
};

std::optional<BackupBundle> read_backup_bundle(const std::filesystem::path& archive);

}  // namespace rowkeep
