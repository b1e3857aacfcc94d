#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/admission/admission_controller.hpp"
#include "core/backup/backup_manager.hpp"
#include "core/integrity/integrity_validator.hpp"
#include "core/model/types.hpp"
#include "core/storage/resource_catalog.hpp"
#include "core/storage/resource_store.hpp"
#include "core/sync/remote_connector.hpp"
#include "core/sync/sync_engine.hpp"

namespace rowkeep {

class KeeperService {
public:
  KeeperService() = default;
  ~KeeperService();

  KeeperService(const KeeperService&) = delete;
  KeeperService& operator=(const KeeperService&) = delete;

  // Must be called before init; consulted by the startup repair pass.
  void set_alias_resolver(IntegrityValidator::AliasResolver resolver);

  Result init(const InitConfig& config);
  // Uses the given connector instead of one built from config.remote.
  Result init(const InitConfig& config, std::unique_ptr<IRemoteConnector> connector);

  [[nodiscard]] Document load(std::string_view key);
  MutationResult mutate(std::string_view actor, std::string_view action, std::string_view key,
                        const ResourceStore::Mutator& change);
  // Unthrottled write for internal callers (schedulers, owner tools).
  Result update(std::string_view key, const ResourceStore::Mutator& change);

  AdmissionDecision check_admission(std::string_view actor, std::string_view action);
  AdmissionDecision record_button_trigger(std::string_view actor);
  [[nodiscard]] AdmissionStats admission_stats(std::string_view actor);
  [[nodiscard]] AdmissionGlobalStats admission_global_stats();
  Result reset_admission(std::string_view actor);

  Result create_backup(std::string_view trigger);
  [[nodiscard]] std::vector<BackupInfo> list_backups() const;
  Result restore_backup(std::string_view archive, bool confirm);
  [[nodiscard]] BackupStats backup_stats() const;

  FixReport run_validation();
  [[nodiscard]] const FixReport& last_fix_report() const { return last_fix_report_; }
  [[nodiscard]] SyncStats sync_stats() const;
  [[nodiscard]] HealthReport health() const;
  [[nodiscard]] bool initialized() const { return initialized_; }

  void shutdown();

private:
  bool initialized_ = false;
  InitConfig config_;
  ResourceCatalog catalog_ = ResourceCatalog::standard();
  ResourceStore store_;
  IntegrityValidator::AliasResolver alias_resolver_;
  FixReport last_fix_report_;

  std::unique_ptr<IRemoteConnector> connector_;
  std::unique_ptr<SyncEngine> sync_;
  std::unique_ptr<AdmissionController> admission_;
  std::unique_ptr<BackupManager> backup_;
};

}  // namespace rowkeep
