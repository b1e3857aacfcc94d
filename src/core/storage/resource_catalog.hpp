#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace rowkeep {

namespace resource {

inline constexpr std::string_view kEvents = "events";
inline constexpr std::string_view kBlockedActors = "blocked-actors";
inline constexpr std::string_view kAliasMap = "alias-map";
inline constexpr std::string_view kAbsentActors = "absent-actors";
inline constexpr std::string_view kResults = "results";
inline constexpr std::string_view kEventHistory = "event-history";
inline constexpr std::string_view kEventTimes = "event-times";
inline constexpr std::string_view kSignupLock = "signup-lock";
inline constexpr std::string_view kPlayerStats = "player-stats";
inline constexpr std::string_view kNotificationPrefs = "notification-prefs";

}  // namespace resource

enum class ValueKind {
  Any,
  Object,
  Array,
  Boolean,
  Integer,
  String,
};

enum class MemberRule {
  None,
  // Array of identifiers; numeric ids are resolved to alias strings.
  IdentifierRoster,
  // Object whose values must be strings.
  StringValues,
};

struct FieldRule {
  std::string name;
  ValueKind kind = ValueKind::Any;
  Document default_value;
  MemberRule members = MemberRule::None;
};

struct ResourceSchema {
  std::string key;
  ValueKind kind = ValueKind::Object;
  Document default_value;
  std::vector<FieldRule> fields;
  MemberRule members = MemberRule::None;
};

class ResourceCatalog {
public:
  static ResourceCatalog standard();

  Result declare(ResourceSchema schema);
  Result override_default(std::string_view key, const Document& value);

  [[nodiscard]] const ResourceSchema* find(std::string_view key) const;
  [[nodiscard]] const std::vector<ResourceSchema>& schemas() const { return schemas_; }
  [[nodiscard]] std::vector<std::string> keys() const;
  [[nodiscard]] Document default_for(std::string_view key) const;

private:
  std::vector<ResourceSchema> schemas_;
};

[[nodiscard]] bool matches_kind(const Document& value, ValueKind kind);
[[nodiscard]] std::string_view kind_name(ValueKind kind);
[[nodiscard]] bool is_valid_resource_key(std::string_view key);

}  // namespace rowkeep
