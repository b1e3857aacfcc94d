#include "core/api/core_api.hpp"

#include <utility>

namespace rowkeep {

void CoreApi::set_alias_resolver(IntegrityValidator::AliasResolver resolver) {
  service_.set_alias_resolver(std::move(resolver));
}

Result CoreApi::init(const InitConfig& config) {
  return service_.init(config);
}

Result CoreApi::init(const InitConfig& config, std::unique_ptr<IRemoteConnector> connector) {
  return service_.init(config, std::move(connector));
}

Document CoreApi::load(std::string_view key) {
  return service_.load(key);
}

MutationResult CoreApi::mutate(std::string_view actor, std::string_view action,
                               std::string_view key, const ResourceStore::Mutator& change) {
  return service_.mutate(actor, action, key, change);
}

Result CoreApi::update(std::string_view key, const ResourceStore::Mutator& change) {
  return service_.update(key, change);
}

AdmissionDecision CoreApi::check_admission(std::string_view actor, std::string_view action) {
  return service_.check_admission(actor, action);
}

AdmissionDecision CoreApi::record_button_trigger(std::string_view actor) {
  return service_.record_button_trigger(actor);
}

AdmissionStats CoreApi::admission_stats(std::string_view actor) {
  return service_.admission_stats(actor);
}

AdmissionGlobalStats CoreApi::admission_global_stats() {
  return service_.admission_global_stats();
}

Result CoreApi::reset_admission(std::string_view actor) {
  return service_.reset_admission(actor);
}

Result CoreApi::create_backup(std::string_view trigger) {
  return service_.create_backup(trigger);
}

std::vector<BackupInfo> CoreApi::list_backups() const {
  return service_.list_backups();
}

Result CoreApi::restore_backup(std::string_view archive, bool confirm) {
  return service_.restore_backup(archive, confirm);
}

BackupStats CoreApi::backup_stats() const {
  return service_.backup_stats();
}

FixReport CoreApi::run_validation() {
  return service_.run_validation();
}

const FixReport& CoreApi::last_fix_report() const {
  return service_.last_fix_report();
}

SyncStats CoreApi::sync_stats() const {
  return service_.sync_stats();
}

HealthReport CoreApi::health() const {
  return service_.health();
}

void CoreApi::shutdown() {
  service_.shutdown();
}

}  // namespace rowkeep
