#include "core/service/keeper_service.hpp"

#include <chrono>
#include <filesystem>
#include <utility>

#include "core/model/app_meta.hpp"
#include "core/util/logging.hpp"

namespace rowkeep {
namespace {

constexpr auto kShutdownFlushTimeout = std::chrono::seconds(5);

std::shared_ptr<spdlog::logger> service_log() {
  return util::component_logger("service");
}

}  // namespace

KeeperService::~KeeperService() {
  shutdown();
}

void KeeperService::set_alias_resolver(IntegrityValidator::AliasResolver resolver) {
  alias_resolver_ = std::move(resolver);
}

Result KeeperService::init(const InitConfig& config) {
  return init(config, make_remote_connector(config.remote));
}

Result KeeperService::init(const InitConfig& config, std::unique_ptr<IRemoteConnector> connector) {
  if (initialized_) {
    return Result::failure("Service is already initialized.");
  }
  if (config.data_dir.empty()) {
    return Result::failure("Data directory is not configured (set ROWKEEP_DATA_DIR).");
  }

  // Components left from an earlier init reference the old connector and catalog.
  store_.set_change_listener({});
  backup_.reset();
  admission_.reset();
  sync_.reset();
  connector_.reset();
  last_fix_report_ = {};

  const Result logging = util::init_logging(config.log_dir, config.log_level);
  if (!logging.ok) {
    return logging;
  }
  service_log()->info("{} {} starting", kAppDisplayName, kAppVersion);

  config_ = config;
  catalog_ = ResourceCatalog::standard();
  for (const auto& [key, value] : config_.default_overrides) {
    const Result overridden = catalog_.override_default(key, value);
    if (!overridden.ok) {
      return overridden;
    }
  }

  const Result opened = store_.open(config_.data_dir);
  if (!opened.ok) {
    service_log()->critical("cannot serve without a usable store: {}", opened.message);
    return opened;
  }

  connector_ = std::move(connector);
  if (connector_) {
    sync_ = std::make_unique<SyncEngine>(*connector_, config_.sync);
    const std::size_t pulled = sync_->bootstrap(store_, catalog_.keys());
    if (pulled > 0) {
      service_log()->info("bootstrapped {} resource(s) from mirror", pulled);
    }
    store_.set_change_listener([this](const std::string& key, const Document& value) {
      (void)sync_->enqueue(key, value);
    });
  } else {
    service_log()->info("no remote mirror configured; running local-only");
  }

  IntegrityValidator validator(store_, catalog_, alias_resolver_);
  last_fix_report_ = validator.run();

  admission_ = std::make_unique<AdmissionController>(config_.admission);

  BackupPolicy backup_policy = config_.backup;
  if (backup_policy.backup_dir.empty()) {
    backup_policy.backup_dir = (std::filesystem::path{config_.data_dir} / "backups").string();
  }
  backup_ = std::make_unique<BackupManager>(store_, catalog_, std::move(backup_policy));

  if (config_.start_background_workers) {
    if (sync_) {
      sync_->start();
    }
    backup_->start_automatic();
  }

  initialized_ = true;
  service_log()->info("ready: {} resource(s), {} startup fix(es)", catalog_.schemas().size(),
                      last_fix_report_.fixes.size());
  return Result::success("Service initialized.", config_.data_dir);
}

Document KeeperService::load(std::string_view key) {
  const Document fallback = catalog_.default_for(key);
  if (!initialized_) {
    return fallback;
  }
  return store_.load(key, fallback);
}

MutationResult KeeperService::mutate(std::string_view actor, std::string_view action,
                                     std::string_view key, const ResourceStore::Mutator& change) {
  MutationResult out;
  if (!initialized_) {
    out.admission = {.allowed = false, .reason = "Service is not initialized.", .retry_after_seconds = 0};
    out.saved = Result::failure("Service is not initialized.");
    return out;
  }

  out.admission = admission_->check(actor, action);
  if (!out.admission.allowed) {
    out.saved = Result::failure(out.admission.reason);
    return out;
  }
  out.saved = update(key, change);
  return out;
}

Result KeeperService::update(std::string_view key, const ResourceStore::Mutator& change) {
  if (!initialized_) {
    return Result::failure("Service is not initialized.");
  }
  if (catalog_.find(key) == nullptr) {
    return Result::failure("Unknown resource '" + std::string{key} + "'.");
  }
  const Result saved = store_.update(key, catalog_.default_for(key), change);
  if (!saved.ok) {
    service_log()->error("write to {} failed: {}", key, saved.message);
  }
  return saved;
}

AdmissionDecision KeeperService::check_admission(std::string_view actor, std::string_view action) {
  if (!admission_) {
    return {.allowed = false, .reason = "Service is not initialized.", .retry_after_seconds = 0};
  }
  return admission_->check(actor, action);
}

AdmissionDecision KeeperService::record_button_trigger(std::string_view actor) {
  if (!admission_) {
    return {.allowed = false, .reason = "Service is not initialized.", .retry_after_seconds = 0};
  }
  return admission_->record_button_trigger(actor);
}

AdmissionStats KeeperService::admission_stats(std::string_view actor) {
  return admission_ ? admission_->stats(actor) : AdmissionStats{};
}

AdmissionGlobalStats KeeperService::admission_global_stats() {
  return admission_ ? admission_->global_stats() : AdmissionGlobalStats{};
}

Result KeeperService::reset_admission(std::string_view actor) {
  if (!admission_) {
    return Result::failure("Service is not initialized.");
  }
  admission_->reset(actor);
  return Result::success("Admission counters reset.");
}

Result KeeperService::create_backup(std::string_view trigger) {
  if (!backup_) {
    return Result::failure("Service is not initialized.");
  }
  return backup_->create_snapshot(trigger);
}

std::vector<BackupInfo> KeeperService::list_backups() const {
  return backup_ ? backup_->list_backups() : std::vector<BackupInfo>{};
}

Result KeeperService::restore_backup(std::string_view archive, bool confirm) {
  if (!backup_) {
    return Result::failure("Service is not initialized.");
  }
  return backup_->restore(archive, confirm);
}

BackupStats KeeperService::backup_stats() const {
  return backup_ ? backup_->stats() : BackupStats{};
}

FixReport KeeperService::run_validation() {
  if (!initialized_) {
    FixReport report;
    report.failures.push_back("Service is not initialized.");
    return report;
  }
  IntegrityValidator validator(store_, catalog_, alias_resolver_);
  last_fix_report_ = validator.run();
  return last_fix_report_;
}

SyncStats KeeperService::sync_stats() const {
  return sync_ ? sync_->stats() : SyncStats{};
}

HealthReport KeeperService::health() const {
  HealthReport report;
  report.store = store_.health_report();
  report.sync = sync_stats();
  report.backups = backup_stats();
  report.startup_fix_count = last_fix_report_.fixes.size();
  report.remote_configured = connector_ != nullptr;
  return report;
}

void KeeperService::shutdown() {
  if (!initialized_) {
    return;
  }
  initialized_ = false;

  if (backup_) {
    backup_->stop_automatic();
  }
  if (sync_) {
    const SyncStats before = sync_->stats();
    if (before.running && !sync_->flush(kShutdownFlushTimeout)) {
      service_log()->warn("shutting down with {} unsynced update(s)", sync_->stats().pending);
    }
    sync_->stop();
  }
  store_.set_change_listener({});
  service_log()->info("shutdown complete");
  util::shutdown_logging();
}

}  // namespace rowkeep
