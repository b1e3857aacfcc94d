#include "core/backup/backup_manager.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"
#include "core/util/compression.hpp"
#include "core/util/hash.hpp"
#include "core/util/logging.hpp"

namespace rowkeep {
namespace {

namespace fs = std::filesystem;

constexpr std::string_view kArchivePrefix = "backup_";
constexpr std::string_view kArchiveSuffix = ".json.zst";
constexpr std::string_view kPreRestoreTrigger = "pre-restore";

std::shared_ptr<spdlog::logger> backup_log() {
  return util::component_logger("backup");
}

std::string sanitize_trigger(std::string_view trigger) {
  std::string out;
  for (const unsigned char c : trigger) {
    if (std::isalnum(c) != 0) {
      out.push_back(static_cast<char>(std::tolower(c)));
    } else if (!out.empty() && out.back() != '-') {
      out.push_back('-');
    }
  }
  while (!out.empty() && out.back() == '-') {
    out.pop_back();
  }
  return out.empty() ? std::string{"manual"} : out;
}

// backup_<trigger>_<stamp>.json.zst -> {trigger, stamp}
std::optional<std::pair<std::string, std::string>> split_archive_name(std::string_view name) {
  if (!name.starts_with(kArchivePrefix) || !name.ends_with(kArchiveSuffix)) {
    return std::nullopt;
  }
  const std::string_view middle =
      name.substr(kArchivePrefix.size(), name.size() - kArchivePrefix.size() - kArchiveSuffix.size());
  const std::size_t split = middle.rfind('_');
  if (split == std::string_view::npos || split == 0 || split + 1 >= middle.size()) {
    return std::nullopt;
  }
  return std::pair{std::string{middle.substr(0, split)}, std::string{middle.substr(split + 1)}};
}

std::optional<std::string> read_binary(const fs::path& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return buffer.str();
}

Result write_binary(const fs::path& target, std::string_view bytes) {
  const fs::path partial = target.string() + ".partial";
  {
    std::ofstream out(partial, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
      return Result::failure("Unable to open " + partial.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      std::error_code ignored;
      fs::remove(partial, ignored);
      return Result::failure("Unable to write " + partial.string());
    }
  }

  std::error_code ec;
  fs::rename(partial, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(partial, ignored);
    return Result::failure("Unable to finalize " + target.string() + ": " + ec.message());
  }
  return Result::success("Archive written.", target.string());
}

Document metadata_to_json(const BackupMetadata& metadata) {
  Document files = Document::array();
  for (const auto& file : metadata.files) {
    files.push_back({
        {"key", file.key},
        {"file", file.file_name},
        {"size", file.size},
        {"sha256", file.sha256},
    });
  }
  return {
      {"timestamp", metadata.timestamp},
      {"trigger", metadata.trigger},
      {"app_version", metadata.app_version},
      {"files", std::move(files)},
      {"total_size", metadata.total_size},
  };
}

BackupMetadata metadata_from_json(const Document& json, std::string format) {
  BackupMetadata metadata;
  metadata.format = std::move(format);
  metadata.timestamp = json.value("timestamp", std::string{});
  metadata.trigger = json.value("trigger", std::string{});
  metadata.app_version = json.value("app_version", std::string{});
  metadata.total_size = json.value("total_size", std::uintmax_t{0});
  if (const auto files = json.find("files"); files != json.end() && files->is_array()) {
    for (const auto& file : *files) {
      if (!file.is_object()) {
        continue;
      }
      metadata.files.push_back({
          .key = file.value("key", std::string{}),
          .file_name = file.value("file", std::string{}),
          .size = file.value("size", std::uintmax_t{0}),
          .sha256 = file.value("sha256", std::string{}),
      });
    }
  }
  return metadata;
}

}  // namespace

std::optional<BackupBundle> read_backup_bundle(const fs::path& archive) {
  const auto compressed = read_binary(archive);
  if (!compressed.has_value()) {
    return std::nullopt;
  }
  const auto raw = util::zstd_decompress(*compressed);
  if (!raw.has_value()) {
    return std::nullopt;
  }

  const Document doc = Document::parse(*raw, nullptr, false);
  if (!doc.is_object()) {
    return std::nullopt;
  }
  const auto format = doc.find("format");
  const auto metadata = doc.find("metadata");
  const auto entries = doc.find("entries");
  if (format == doc.end() || !format->is_string() ||
      format->get<std::string>() != kBackupFormat || metadata == doc.end() ||
      !metadata->is_object() || entries == doc.end() || !entries->is_object()) {
    return std::nullopt;
  }

  BackupBundle bundle;
  try {
    bundle.metadata = metadata_from_json(*metadata, format->get<std::string>());
  } catch (const Document::exception& ex) {
    backup_log()->warn("malformed metadata in {}: {}", archive.filename().string(), ex.what());
    return std::nullopt;
  }
  for (auto it = entries->begin(); it != entries->end(); ++it) {
    if (!it->is_string()) {
      return std::nullopt;
    }
    bundle.entries.emplace_back(it.key(), it->get<std::string>());
  }
  return bundle;
}

BackupManager::BackupManager(ResourceStore& store, const ResourceCatalog& catalog,
                             BackupPolicy policy)
    : store_(store), catalog_(catalog), policy_(std::move(policy)) {
  if (policy_.backup_dir.empty() && store_.is_open()) {
    policy_.backup_dir = (fs::path{store_.data_dir()} / "backups").string();
  }
}

BackupManager::~BackupManager() {
  stop_automatic();
}

Result BackupManager::ensure_backup_dir() const {
  if (policy_.backup_dir.empty()) {
    return Result::failure("Backup directory is not configured.");
  }
  std::error_code ec;
  fs::create_directories(policy_.backup_dir, ec);
  if (ec) {
    return Result::failure("Failed to create backup directory: " + ec.message());
  }
  return Result::success();
}

Result BackupManager::create_snapshot(std::string_view trigger) {
  std::lock_guard lock(operation_mutex_);
  return create_locked(trigger);
}

Result BackupManager::create_locked(std::string_view trigger) {
  const Result dir = ensure_backup_dir();
  if (!dir.ok) {
    return dir;
  }

  const std::string trigger_name = sanitize_trigger(trigger);
  auto now = std::chrono::system_clock::now();
  std::string stamp = util::compact_utc_stamp(now);
  // Archive names sort by stamp, so two snapshots never share one.
  while (stamp == last_stamp_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    now = std::chrono::system_clock::now();
    stamp = util::compact_utc_stamp(now);
  }
  last_stamp_ = stamp;
  const std::string stem = std::string{kArchivePrefix} + trigger_name + "_" + stamp;

  fs::path target = fs::path{policy_.backup_dir} / (stem + std::string{kArchiveSuffix});
  std::error_code ec;
  for (int attempt = 1; fs::exists(target, ec); ++attempt) {
    target = fs::path{policy_.backup_dir} /
             (stem + "-" + std::to_string(attempt) + std::string{kArchiveSuffix});
  }

  BackupMetadata metadata{
      .format = std::string{kBackupFormat},
      .timestamp = util::iso8601_utc(now),
      .trigger = trigger_name,
      .app_version = std::string{kAppVersion},
  };
  // Taken before any read so a write racing the snapshot still counts as a change.
  const std::uint64_t saves_before = store_.save_count();
  Document entries = Document::object();
  for (const auto& schema : catalog_.schemas()) {
    auto bytes = store_.read_bytes(schema.key);
    if (!bytes.has_value()) {
      continue;
    }
    metadata.files.push_back({
        .key = schema.key,
        .file_name = schema.key + ".json",
        .size = bytes->size(),
        .sha256 = util::sha256_hex(*bytes),
    });
    metadata.total_size += bytes->size();
    entries[schema.key] = std::move(*bytes);
  }

  const Document bundle = {
      {"format", metadata.format},
      {"metadata", metadata_to_json(metadata)},
      {"entries", std::move(entries)},
  };
  const auto compressed = util::zstd_compress(
      bundle.dump(-1, ' ', false, Document::error_handler_t::replace), policy_.compression_level);
  if (!compressed.has_value()) {
    return Result::failure("Compression failed for " + target.filename().string());
  }

  const Result written = write_binary(target, *compressed);
  if (!written.ok) {
    backup_log()->error("snapshot failed: {}", written.message);
    return written;
  }

  {
    std::lock_guard state(state_mutex_);
    saves_at_snapshot_ = saves_before;
  }
  backup_log()->info("created {} ({} resources, {} bytes raw, {} bytes compressed)",
                     target.filename().string(), metadata.files.size(), metadata.total_size,
                     compressed->size());

  rotate(target.string());
  return Result::success("Snapshot created.", target.string());
}

void BackupManager::rotate(const std::string& keep_path) {
  const auto backups = list_backups();
  const auto file_now = fs::file_time_type::clock::now();
  const auto max_age = std::chrono::hours(24 * std::max<std::int64_t>(0, policy_.max_age_days));

  std::size_t kept_count = 0;
  std::uintmax_t kept_bytes = 0;
  for (const auto& info : backups) {
    if (info.path == keep_path) {
      ++kept_count;
      kept_bytes += info.size;
      continue;
    }

    std::string reason;
    std::error_code ec;
    if (policy_.max_backups > 0 && kept_count >= policy_.max_backups) {
      reason = "count limit";
    } else if (policy_.max_age_days > 0) {
      const auto written = fs::last_write_time(info.path, ec);
      if (!ec && file_now - written > max_age) {
        reason = "age limit";
      }
    }
    if (reason.empty() && policy_.max_total_bytes > 0 &&
        kept_bytes + info.size > policy_.max_total_bytes) {
      reason = "size limit";
    }

    if (reason.empty()) {
      ++kept_count;
      kept_bytes += info.size;
      continue;
    }

    fs::remove(info.path, ec);
    if (ec) {
      backup_log()->warn("could not rotate {}: {}", info.file_name, ec.message());
    } else {
      backup_log()->info("rotated out {} ({})", info.file_name, reason);
    }
  }
}

std::vector<BackupInfo> BackupManager::list_backups() const {
  std::vector<BackupInfo> out;
  std::error_code ec;
  if (policy_.backup_dir.empty() || !fs::is_directory(policy_.backup_dir, ec)) {
    return out;
  }

  for (const auto& entry : fs::directory_iterator(policy_.backup_dir, ec)) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    const std::string name = entry.path().filename().string();
    const auto parts = split_archive_name(name);
    if (!parts.has_value()) {
      continue;
    }

    BackupInfo info;
    info.file_name = name;
    info.path = entry.path().string();
    info.size = entry.file_size(ec);
    info.stamp = parts->second;
    if (auto bundle = read_backup_bundle(entry.path())) {
      info.metadata = std::move(bundle->metadata);
    } else {
      backup_log()->warn("unreadable archive {}", name);
    }
    out.push_back(std::move(info));
  }

  std::ranges::sort(out, [](const BackupInfo& a, const BackupInfo& b) {
    if (a.stamp != b.stamp) {
      return a.stamp > b.stamp;
    }
    return a.file_name > b.file_name;
  });
  return out;
}

BackupStats BackupManager::stats() const {
  BackupStats out;
  const auto backups = list_backups();
  out.total_backups = backups.size();
  for (const auto& info : backups) {
    out.total_size += info.size;
    std::string trigger;
    if (info.metadata.has_value()) {
      trigger = info.metadata->trigger;
    } else if (const auto parts = split_archive_name(info.file_name)) {
      trigger = parts->first;
    }
    ++out.backups_by_trigger[trigger.empty() ? std::string{"unknown"} : trigger];
  }
  if (!backups.empty()) {
    out.newest_backup = backups.front().file_name;
    out.oldest_backup = backups.back().file_name;
  }
  return out;
}

bool BackupManager::has_changes_since_last_snapshot() const {
  {
    std::lock_guard state(state_mutex_);
    if (saves_at_snapshot_.has_value()) {
      return store_.save_count() != *saves_at_snapshot_;
    }
  }

  // No snapshot yet in this process: compare against the newest archive on disk.
  const auto backups = list_backups();
  if (backups.empty()) {
    return true;
  }
  std::error_code ec;
  const auto newest = fs::last_write_time(backups.front().path, ec);
  if (ec) {
    return true;
  }
  return std::ranges::any_of(catalog_.schemas(), [&](const ResourceSchema& schema) {
    const auto modified = store_.last_modified(schema.key);
    return modified.has_value() && *modified >= newest;
  });
}

fs::path BackupManager::resolve_archive(std::string_view archive) const {
  const fs::path given{std::string{archive}};
  if (given.has_parent_path()) {
    return given;
  }
  return fs::path{policy_.backup_dir} / given;
}

Result BackupManager::restore(std::string_view archive, bool confirm) {
  if (!confirm) {
    backup_log()->warn("restore of {} refused: not confirmed", archive);
    return Result::failure("Restore requires explicit confirmation.");
  }

  std::lock_guard lock(operation_mutex_);
  const fs::path path = resolve_archive(archive);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return Result::failure("Backup archive not found: " + path.string());
  }

  // Loaded before the safety snapshot, whose rotation may remove it.
  const auto bundle = read_backup_bundle(path);
  if (!bundle.has_value()) {
    return Result::failure("Backup archive is unreadable: " + path.filename().string());
  }

  const Result safety = create_locked(kPreRestoreTrigger);
  if (!safety.ok) {
    backup_log()->error("restore aborted; safety snapshot failed: {}", safety.message);
    return Result::failure("Restore aborted, safety snapshot failed: " + safety.message);
  }
  backup_log()->info("restoring {} taken {} (safety snapshot {})", path.filename().string(),
                     bundle->metadata.timestamp, fs::path{safety.data}.filename().string());

  std::size_t restored = 0;
  std::vector<std::string> failed;
  for (const auto& [key, text] : bundle->entries) {
    if (catalog_.find(key) == nullptr) {
      backup_log()->warn("skipping undeclared resource {} in archive", key);
      continue;
    }

    const auto expected = std::ranges::find(bundle->metadata.files, key, &BackupFileEntry::key);
    if (expected != bundle->metadata.files.end() && !expected->sha256.empty() &&
        expected->sha256 != util::sha256_hex(text)) {
      backup_log()->error("checksum mismatch for {}; left untouched", key);
      failed.push_back(key);
      continue;
    }

    const Result written = store_.restore_bytes(key, text, SyncMode::Mirror);
    if (!written.ok) {
      backup_log()->error("failed to restore {}: {}", key, written.message);
      failed.push_back(key);
      continue;
    }
    ++restored;
    backup_log()->info("restored {}", key);
  }

  if (restored == 0 && !failed.empty()) {
    return Result::failure("Restore failed for every resource in " + path.filename().string());
  }

  std::string message = "Restored " + std::to_string(restored) + " resource(s)";
  if (!failed.empty()) {
    message += "; failed: ";
    for (std::size_t i = 0; i < failed.size(); ++i) {
      message += (i == 0 ? "" : ", ") + failed[i];
    }
  }
  message += ".";
  backup_log()->info("{}", message);
  return Result::success(message, safety.data);
}

Result BackupManager::run_scheduled() {
  if (!has_changes_since_last_snapshot()) {
    backup_log()->debug("no changes since last snapshot; skipping automatic backup");
    return Result::success("No changes since last snapshot.");
  }
  return create_snapshot("automatic");
}

void BackupManager::start_automatic() {
  std::lock_guard lock(schedule_mutex_);
  if (scheduler_running_ || policy_.interval_seconds <= 0) {
    return;
  }
  scheduler_stopping_ = false;
  scheduler_running_ = true;
  scheduler_ = std::thread(&BackupManager::scheduler_loop, this);
  backup_log()->info("automatic backups every {} s", policy_.interval_seconds);
}

void BackupManager::stop_automatic() {
  {
    std::lock_guard lock(schedule_mutex_);
    if (!scheduler_running_) {
      return;
    }
    scheduler_stopping_ = true;
  }
  schedule_wake_.notify_all();
  if (scheduler_.joinable()) {
    scheduler_.join();
  }
  std::lock_guard lock(schedule_mutex_);
  scheduler_running_ = false;
}

void BackupManager::scheduler_loop() {
  const auto interval = std::chrono::seconds(policy_.interval_seconds);
  while (true) {
    {
      std::unique_lock lock(schedule_mutex_);
      if (schedule_wake_.wait_for(lock, interval, [this] { return scheduler_stopping_; })) {
        return;
      }
    }
    const Result tick = run_scheduled();
    if (!tick.ok) {
      backup_log()->error("automatic backup failed: {}", tick.message);
    }
  }
}

}  // namespace rowkeep
