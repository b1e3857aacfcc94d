#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"
#include "core/service/keeper_service.hpp"

namespace rowkeep {

class CoreApi {
public:
  void set_alias_resolver(IntegrityValidator::AliasResolver resolver);

  Result init(const InitConfig& config);
  Result init(const InitConfig& config, std::unique_ptr<IRemoteConnector> connector);

  Document load(std::string_view key);
  MutationResult mutate(std::string_view actor, std::string_view action, std::string_view key,
                        const ResourceStore::Mutator& change);
  Result update(std::string_view key, const ResourceStore::Mutator& change);

  AdmissionDecision check_admission(std::string_view actor, std::string_view action);
  AdmissionDecision record_button_trigger(std::string_view actor);
  AdmissionStats admission_stats(std::string_view actor);
  AdmissionGlobalStats admission_global_stats();
  Result reset_admission(std::string_view actor);

  Result create_backup(std::string_view trigger);
  std::vector<BackupInfo> list_backups() const;
  Result restore_backup(std::string_view archive, bool confirm);
  BackupStats backup_stats() const;

  FixReport run_validation();
  const FixReport& last_fix_report() const;
  SyncStats sync_stats() const;
  HealthReport health() const;

  void shutdown();

private:
  KeeperService service_;
};

}  // namespace rowkeep
