#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "core/model/types.hpp"
#include "core/storage/resource_catalog.hpp"
#include "core/storage/resource_store.hpp"

namespace rowkeep {

// Startup repair pass over every declared resource. Running it twice in a
// row yields an empty report the second time.
class IntegrityValidator {
public:
  // Looks up a display alias for a numeric actor id (chat directory).
  using AliasResolver = std::function<std::optional<std::string>(std::int64_t actor_id)>;

  IntegrityValidator(ResourceStore& store, const ResourceCatalog& catalog,
                     AliasResolver resolver = {});

  FixReport run();

private:
  ResourceStore& store_;
  const ResourceCatalog& catalog_;
  AliasResolver resolver_;

  Document aliases_ = Document::object();
  bool aliases_changed_ = false;

  void check_resource(const ResourceSchema& schema, FixReport& report);
  bool repair_fields(const ResourceSchema& schema, Document& value, FixReport& report);
  bool repair_members(MemberRule rule, Document& value, const std::string& where,
                      FixReport& report);
  bool repair_roster(Document& roster, const std::string& where, FixReport& report);
  bool repair_string_values(Document& object, const std::string& where, FixReport& report);
  std::string resolve_alias(std::int64_t actor_id, const std::string& where, FixReport& report);
  void persist(const std::string& key, const Document& value, FixReport& report);
};

// Roster member as stored: numeric id, alias string, or nothing usable.
std::optional<Identifier> identifier_from(const Document& member);

void log_fix_report(const FixReport& report);

}  // namespace rowkeep
