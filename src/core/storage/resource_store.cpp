#include "core/storage/resource_store.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include <sys/stat.h>
#include <unistd.h>

#include "core/storage/resource_catalog.hpp"
#include "core/util/canonical.hpp"
#include "core/util/logging.hpp"

namespace rowkeep {
namespace {

namespace fs = std::filesystem;

constexpr std::string_view kDocumentSuffix = ".json";
constexpr std::string_view kBackupSuffix = ".bak";
constexpr std::string_view kCorruptSuffix = ".corrupt";
constexpr std::string_view kWriteCheckFile = ".rowkeep-write-check";

std::shared_ptr<spdlog::logger> store_log() {
  return util::component_logger("store");
}

std::string errno_text(int errnum) {
  return std::string{std::strerror(errnum)};
}

bool write_all(int fd, std::string_view bytes) {
  std::size_t written = 0;
  while (written < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

std::optional<std::string> read_file(const fs::path& path) {
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

std::optional<Document> parse_document(std::string_view bytes) {
  Document parsed = Document::parse(bytes.begin(), bytes.end(), nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

std::string serialize_document(const Document& value) {
  return value.dump(2, ' ', false, Document::error_handler_t::replace) + "\n";
}

Result ResourceStore::open(std::string_view data_dir) {
  if (data_dir.empty()) {
    return Result::failure("Data directory is not configured.");
  }

  std::error_code ec;
  fs::create_directories(std::string{data_dir}, ec);
  if (ec) {
    return Result::failure("Failed to create data directory: " + ec.message());
  }
  if (!fs::is_directory(std::string{data_dir}, ec)) {
    return Result::failure("Data path is not a directory: " + std::string{data_dir});
  }

  const fs::path check_file = fs::path{std::string{data_dir}} / std::string{kWriteCheckFile};
  {
    std::ofstream out(check_file, std::ios::out | std::ios::trunc);
    if (!out || !(out << "ok")) {
      return Result::failure("Data directory is not writable: " + std::string{data_dir});
    }
  }
  fs::remove(check_file, ec);

  // umask can only be read by setting it.
  const mode_t mask = ::umask(0);
  ::umask(mask);
  file_mode_ = 0666 & ~mask;

  data_dir_ = std::string{data_dir};
  store_log()->info("opened data directory {}", data_dir_);
  return Result::success("Store opened.", data_dir_);
}

std::mutex& ResourceStore::lock_for(const std::string& key) {
  std::lock_guard lock(registry_mutex_);
  auto& slot = key_locks_[key];
  if (!slot) {
    slot = std::make_unique<std::mutex>();
  }
  return *slot;
}

std::string ResourceStore::path_for(std::string_view key) const {
  return (fs::path{data_dir_} / (std::string{key} + std::string{kDocumentSuffix})).string();
}

ReadOutcome ResourceStore::read(std::string_view key) {
  if (!is_valid_resource_key(key)) {
    store_log()->warn("rejected read of invalid key '{}'", key);
    return {};
  }
  const std::string owned{key};
  std::lock_guard lock(lock_for(owned));
  return read_unlocked(owned);
}

ReadOutcome ResourceStore::read_unlocked(const std::string& key) {
  ReadOutcome outcome;
  const fs::path path = path_for(key);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    outcome.status = ReadStatus::Missing;
    return outcome;
  }

  const auto bytes = read_file(path);
  if (bytes.has_value()) {
    if (auto parsed = parse_document(*bytes)) {
      outcome.status = ReadStatus::Ok;
      outcome.value = std::move(*parsed);
      return outcome;
    }
  }

  outcome.status = ReadStatus::Corrupt;
  outcome.quarantined_path = quarantine_unlocked(key);
  return outcome;
}

std::string ResourceStore::quarantine_unlocked(const std::string& key) {
  const fs::path source = path_for(key);
  const std::string base =
      source.string() + "." + util::compact_utc_stamp(std::chrono::system_clock::now());

  fs::path target = base + std::string{kCorruptSuffix};
  std::error_code ec;
  for (int attempt = 1; fs::exists(target, ec); ++attempt) {
    target = base + "-" + std::to_string(attempt) + std::string{kCorruptSuffix};
  }

  fs::rename(source, target, ec);
  if (ec) {
    store_log()->error("could not quarantine {}: {}", source.string(), ec.message());
    return {};
  }
  ++quarantine_count_;
  store_log()->warn("quarantined unreadable {} as {}", source.string(), target.filename().string());
  return target.string();
}

Document ResourceStore::load(std::string_view key, const Document& fallback) {
  ReadOutcome outcome = read(key);
  if (outcome.status == ReadStatus::Ok) {
    return std::move(outcome.value);
  }
  return fallback;
}

Result ResourceStore::save(std::string_view key, const Document& value, SyncMode mode) {
  if (!is_open()) {
    return Result::failure("Store is not open.");
  }
  if (!is_valid_resource_key(key)) {
    return Result::failure("Invalid resource key: '" + std::string{key} + "'.");
  }

  const std::string owned{key};
  const std::string bytes = serialize_document(value);
  // Notified under the key lock so listeners see writes in disk order.
  std::lock_guard lock(lock_for(owned));
  Result written = write_unlocked(owned, bytes);
  if (written.ok) {
    notify(owned, value, mode);
  }
  return written;
}

Result ResourceStore::update(std::string_view key, const Document& fallback, const Mutator& mutate,
                             SyncMode mode) {
  if (!is_open()) {
    return Result::failure("Store is not open.");
  }
  if (!is_valid_resource_key(key)) {
    return Result::failure("Invalid resource key: '" + std::string{key} + "'.");
  }

  const std::string owned{key};
  std::lock_guard lock(lock_for(owned));
  ReadOutcome current = read_unlocked(owned);
  Document value = current.status == ReadStatus::Ok ? std::move(current.value) : fallback;
  mutate(value);
  Result written = write_unlocked(owned, serialize_document(value));
  if (written.ok) {
    notify(owned, value, mode);
  }
  return written;
}

std::optional<std::string> ResourceStore::read_bytes(std::string_view key) {
  if (!is_valid_resource_key(key)) {
    return std::nullopt;
  }
  const std::string owned{key};
  std::lock_guard lock(lock_for(owned));
  return read_file(path_for(owned));
}

Result ResourceStore::restore_bytes(std::string_view key, std::string_view bytes, SyncMode mode) {
  if (!is_open()) {
    return Result::failure("Store is not open.");
  }
  if (!is_valid_resource_key(key)) {
    return Result::failure("Invalid resource key: '" + std::string{key} + "'.");
  }
  auto parsed = parse_document(bytes);
  if (!parsed.has_value()) {
    return Result::failure("Refusing to restore unparseable content for '" + std::string{key} + "'.");
  }

  const std::string owned{key};
  std::lock_guard lock(lock_for(owned));
  Result written = write_unlocked(owned, bytes);
  if (written.ok) {
    notify(owned, *parsed, mode);
  }
  return written;
}

Result ResourceStore::write_unlocked(const std::string& key, std::string_view bytes) {
  const fs::path target = path_for(key);
  std::string tmpl = target.string() + ".tmp.XXXXXX";

  const int fd = ::mkstemp(tmpl.data());
  if (fd < 0) {
    const int errnum = errno;
    ++failed_save_count_;
    store_log()->error("mkstemp failed for {}: {}", target.string(), errno_text(errnum));
    return Result::failure("Unable to create temp file for '" + key + "': " + errno_text(errnum));
  }

  // mkstemp creates 0600; keep the target's mode, or the umask default for new files.
  mode_t mode = file_mode_;
  struct stat existing {};
  if (::stat(target.c_str(), &existing) == 0) {
    mode = existing.st_mode & 07777;
  }

  if (::fchmod(fd, mode) != 0 || !write_all(fd, bytes) || ::fsync(fd) != 0) {
    const int errnum = errno;
    ::close(fd);
    ::unlink(tmpl.c_str());
    ++failed_save_count_;
    store_log()->error("write failed for {}: {}", target.string(), errno_text(errnum));
    return Result::failure("Unable to write '" + key + "': " + errno_text(errnum));
  }
  if (::close(fd) != 0) {
    const int errnum = errno;
    ::unlink(tmpl.c_str());
    ++failed_save_count_;
    return Result::failure("Unable to close temp file for '" + key + "': " + errno_text(errnum));
  }

  std::error_code ec;
  if (fs::exists(target, ec)) {
    const fs::path backup = target.string() + std::string{kBackupSuffix};
    fs::copy_file(target, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      store_log()->warn("could not refresh {}: {}", backup.filename().string(), ec.message());
    }
  }

  fs::rename(tmpl, target, ec);
  if (ec) {
    ::unlink(tmpl.c_str());
    ++failed_save_count_;
    store_log()->error("rename into {} failed: {}", target.string(), ec.message());
    return Result::failure("Unable to replace '" + key + "': " + ec.message());
  }

  ++save_count_;
  store_log()->debug("saved {} ({} bytes)", key, bytes.size());
  return Result::success("Saved " + key + ".", target.string());
}

void ResourceStore::set_change_listener(ChangeListener listener) {
  std::lock_guard lock(listener_mutex_);
  listener_ = std::move(listener);
}

void ResourceStore::notify(const std::string& key, const Document& value, SyncMode mode) {
  if (mode != SyncMode::Mirror) {
    return;
  }
  ChangeListener listener;
  {
    std::lock_guard lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(key, value);
  }
}

bool ResourceStore::exists(std::string_view key) const {
  if (!is_valid_resource_key(key)) {
    return false;
  }
  std::error_code ec;
  return fs::exists(path_for(key), ec);
}

std::optional<fs::file_time_type> ResourceStore::last_modified(std::string_view key) const {
  if (!is_valid_resource_key(key)) {
    return std::nullopt;
  }
  std::error_code ec;
  const auto stamp = fs::last_write_time(path_for(key), ec);
  if (ec) {
    return std::nullopt;
  }
  return stamp;
}

StoreHealthReport ResourceStore::health_report() const {
  StoreHealthReport report;
  report.data_dir = data_dir_;
  report.save_count = save_count_.load();
  report.failed_save_count = failed_save_count_.load();
  report.quarantine_count = quarantine_count_.load();
  {
    std::lock_guard lock(registry_mutex_);
    report.lock_count = key_locks_.size();
  }

  if (!is_open()) {
    report.details = "Store is not open.";
    return report;
  }

  std::error_code ec;
  if (!fs::is_directory(data_dir_, ec)) {
    report.details = "Data directory is missing.";
    return report;
  }

  for (const auto& entry : fs::directory_iterator(data_dir_, ec)) {
    if (!entry.is_regular_file(ec) || entry.path().extension() != kDocumentSuffix) {
      continue;
    }
    ++report.resource_count;
    report.total_bytes += entry.file_size(ec);
  }
  if (ec) {
    report.details = "Unable to scan data directory: " + ec.message();
    return report;
  }

  const int access_rc = ::access(data_dir_.c_str(), W_OK);
  report.healthy = access_rc == 0;
  report.details = report.healthy ? "Store ready." : "Data directory is not writable.";
  return report;
}

}  // namespace rowkeep
