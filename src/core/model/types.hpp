#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace rowkeep {

struct Result {
  bool ok = false;
  std::string message;
  std::string data;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, std::move(msg), std::move(payload)};
  }

  static Result failure(std::string msg) {
    return {false, std::move(msg), {}};
  }
};

// Whole-document value of a resource.
using Document = nlohmann::json;

// Roster member as found on disk: a numeric actor id or an alias string.
using Identifier = std::variant<std::int64_t, std::string>;

enum class SyncMode {
  Mirror,
  Suppress,
};

enum class ReadStatus {
  Missing,
  Corrupt,
  Ok,
};

struct ReadOutcome {
  ReadStatus status = ReadStatus::Missing;
  Document value;
  std::string quarantined_path;
};

struct StoreHealthReport {
  bool healthy = false;
  std::string details;
  std::string data_dir;
  std::size_t resource_count = 0;
  std::size_t lock_count = 0;
  std::uint64_t save_count = 0;
  std::uint64_t failed_save_count = 0;
  std::uint64_t quarantine_count = 0;
  std::uintmax_t total_bytes = 0;
};

struct FixReport {
  std::vector<std::string> fixes;
  std::vector<std::string> failures;

  [[nodiscard]] bool empty() const { return fixes.empty() && failures.empty(); }
};

struct AdmissionPolicy {
  std::size_t commands_per_minute = 10;
  std::size_t commands_per_hour = 100;
  std::size_t buttons_per_minute = 5;
  std::int64_t button_burst_window_ms = 2000;
  std::size_t button_burst_limit = 3;
  std::map<std::string, std::int64_t> cooldown_seconds = {
      {"startevent", 300}, {"win", 60}, {"loss", 60}, {"block", 30}, {"unblock", 30},
  };
};

struct AdmissionDecision {
  bool allowed = false;
  std::string reason;
  std::int64_t retry_after_seconds = 0;
};

// Outcome of an actor-initiated write: a denial leaves `saved` untouched.
struct MutationResult {
  AdmissionDecision admission;
  Result saved;

  [[nodiscard]] bool ok() const { return admission.allowed && saved.ok; }
};

struct AdmissionStats {
  std::size_t commands_last_minute = 0;
  std::size_t commands_last_hour = 0;
  std::size_t buttons_last_minute = 0;
  std::map<std::string, std::int64_t> active_cooldowns;
  bool rate_limited = false;
};

struct AdmissionGlobalStats {
  std::size_t active_actors_last_hour = 0;
  std::size_t rate_limited_actors = 0;
  std::size_t commands_last_hour = 0;
  std::size_t active_cooldowns = 0;
};

struct SyncPolicy {
  std::int64_t min_interval_ms = 1000;
  std::int64_t base_backoff_ms = 1000;
  std::int64_t max_backoff_ms = 64000;
  std::int64_t max_jitter_ms = 1000;
  std::size_t max_retries = 5;
  std::size_t chunk_threshold_bytes = 32U * 1024U;
  std::size_t batch_rows = 100;
  std::int64_t reconnect_poll_ms = 5000;
  std::size_t max_pending = 256;
};

struct SyncTask {
  std::string key;
  Document snapshot;
  std::chrono::system_clock::time_point enqueued_at;
};

struct SyncStats {
  bool running = false;
  bool connected = false;
  std::size_t pending = 0;
  std::string in_flight_key;
  std::uint64_t enqueued = 0;
  std::uint64_t coalesced = 0;
  std::uint64_t pushed = 0;
  std::uint64_t dropped = 0;
  std::uint64_t retries = 0;
  std::uint64_t throttled = 0;
  std::string last_error;
};

struct BackupPolicy {
  std::string backup_dir;
  std::size_t max_backups = 30;
  std::int64_t max_age_days = 0;
  std::uintmax_t max_total_bytes = 0;
  std::int64_t interval_seconds = 6 * 60 * 60;
  int compression_level = 3;
};

struct BackupFileEntry {
  std::string key;
  std::string file_name;
  std::uintmax_t size = 0;
  std::string sha256;
};

struct BackupMetadata {
  std::string format;
  std::string timestamp;
  std::string trigger;
  std::string app_version;
  std::vector<BackupFileEntry> files;
  std::uintmax_t total_size = 0;
};

struct BackupInfo {
  std::string file_name;
  std::string path;
  std::uintmax_t size = 0;
  std::string stamp;
  std::optional<BackupMetadata> metadata;
};

struct BackupStats {
  std::size_t total_backups = 0;
  std::uintmax_t total_size = 0;
  std::string oldest_backup;
  std::string newest_backup;
  std::map<std::string, std::size_t> backups_by_trigger;
};

struct RemoteConfig {
  std::string endpoint;
  std::string token;
  long timeout_seconds = 15;
};

struct InitConfig {
  std::string data_dir;
  std::string log_dir;
  std::string log_level = "info";
  RemoteConfig remote;
  AdmissionPolicy admission;
  SyncPolicy sync;
  BackupPolicy backup;
  std::map<std::string, Document> default_overrides;
  bool start_background_workers = true;
};

struct HealthReport {
  StoreHealthReport store;
  SyncStats sync;
  BackupStats backups;
  std::size_t startup_fix_count = 0;
  bool remote_configured = false;
};

}  // namespace rowkeep
