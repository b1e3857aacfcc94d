#include "core/storage/resource_catalog.hpp"

#include <algorithm>
#include <cctype>

namespace rowkeep {
namespace {

FieldRule roster(std::string name) {
  return {
      .name = std::move(name),
      .kind = ValueKind::Array,
      .default_value = Document::array(),
      .members = MemberRule::IdentifierRoster,
  };
}

FieldRule field(std::string name, ValueKind kind, Document default_value) {
  return {
      .name = std::move(name),
      .kind = kind,
      .default_value = std::move(default_value),
      .members = MemberRule::None,
  };
}

Document default_from_fields(const std::vector<FieldRule>& fields) {
  Document out = Document::object();
  for (const auto& rule : fields) {
    out[rule.name] = rule.default_value;
  }
  return out;
}

}  // namespace

ResourceCatalog ResourceCatalog::standard() {
  ResourceCatalog catalog;

  std::vector<FieldRule> team_fields = {roster("main_team"), roster("team_2"), roster("team_3")};
  Document events_default = default_from_fields(team_fields);
  (void)catalog.declare({
      .key = std::string{resource::kEvents},
      .kind = ValueKind::Object,
      .default_value = std::move(events_default),
      .fields = std::move(team_fields),
  });

  (void)catalog.declare({
      .key = std::string{resource::kBlockedActors},
      .kind = ValueKind::Object,
      .default_value = Document::object(),
  });

  (void)catalog.declare({
      .key = std::string{resource::kAliasMap},
      .kind = ValueKind::Object,
      .default_value = Document::object(),
      .members = MemberRule::StringValues,
  });

  (void)catalog.declare({
      .key = std::string{resource::kAbsentActors},
      .kind = ValueKind::Object,
      .default_value = Document::object(),
  });

  std::vector<FieldRule> result_fields = {
      field("total_wins", ValueKind::Integer, 0),
      field("total_losses", ValueKind::Integer, 0),
      field("history", ValueKind::Array, Document::array()),
  };
  Document results_default = default_from_fields(result_fields);
  (void)catalog.declare({
      .key = std::string{resource::kResults},
      .kind = ValueKind::Object,
      .default_value = std::move(results_default),
      .fields = std::move(result_fields),
  });

  (void)catalog.declare({
      .key = std::string{resource::kEventHistory},
      .kind = ValueKind::Array,
      .default_value = Document::array(),
  });

  std::vector<FieldRule> time_fields = {
      field("main_team", ValueKind::String, "20:00 UTC Sunday"),
      field("team_2", ValueKind::String, "20:00 UTC Saturday"),
      field("team_3", ValueKind::String, "14:00 UTC Sunday"),
  };
  Document times_default = default_from_fields(time_fields);
  (void)catalog.declare({
      .key = std::string{resource::kEventTimes},
      .kind = ValueKind::Object,
      .default_value = std::move(times_default),
      .fields = std::move(time_fields),
  });

  (void)catalog.declare({
      .key = std::string{resource::kSignupLock},
      .kind = ValueKind::Boolean,
      .default_value = false,
  });

  (void)catalog.declare({
      .key = std::string{resource::kPlayerStats},
      .kind = ValueKind::Object,
      .default_value = Document::object(),
  });

  std::vector<FieldRule> pref_fields = {
      field("users", ValueKind::Object, Document::object()),
      field("default_settings", ValueKind::Object, Document::object()),
  };
  Document prefs_default = default_from_fields(pref_fields);
  (void)catalog.declare({
      .key = std::string{resource::kNotificationPrefs},
      .kind = ValueKind::Object,
      .default_value = std::move(prefs_default),
      .fields = std::move(pref_fields),
  });

  return catalog;
}

Result ResourceCatalog::declare(ResourceSchema schema) {
  if (!is_valid_resource_key(schema.key)) {
    return Result::failure("Invalid resource key: '" + schema.key + "'.");
  }
  if (!matches_kind(schema.default_value, schema.kind)) {
    return Result::failure("Default for '" + schema.key + "' is not a " +
                           std::string{kind_name(schema.kind)} + ".");
  }

  const auto existing = std::ranges::find(schemas_, schema.key, &ResourceSchema::key);
  if (existing != schemas_.end()) {
    *existing = std::move(schema);
    return Result::success("Resource schema replaced.");
  }
  schemas_.push_back(std::move(schema));
  return Result::success("Resource schema declared.");
}

Result ResourceCatalog::override_default(std::string_view key, const Document& value) {
  const auto it = std::ranges::find(schemas_, key, &ResourceSchema::key);
  if (it == schemas_.end()) {
    return Result::failure("Unknown resource '" + std::string{key} + "'.");
  }
  if (!matches_kind(value, it->kind)) {
    return Result::failure("Default override for '" + std::string{key} + "' must be a " +
                           std::string{kind_name(it->kind)} + ".");
  }
  it->default_value = value;
  return Result::success("Default overridden.");
}

const ResourceSchema* ResourceCatalog::find(std::string_view key) const {
  const auto it = std::ranges::find(schemas_, key, &ResourceSchema::key);
  return it == schemas_.end() ? nullptr : &*it;
}

std::vector<std::string> ResourceCatalog::keys() const {
  std::vector<std::string> out;
  out.reserve(schemas_.size());
  for (const auto& schema : schemas_) {
    out.push_back(schema.key);
  }
  return out;
}

Document ResourceCatalog::default_for(std::string_view key) const {
  const ResourceSchema* schema = find(key);
  return schema == nullptr ? Document{} : schema->default_value;
}

bool matches_kind(const Document& value, ValueKind kind) {
  switch (kind) {
    case ValueKind::Any:
      return !value.is_discarded();
    case ValueKind::Object:
      return value.is_object();
    case ValueKind::Array:
      return value.is_array();
    case ValueKind::Boolean:
      return value.is_boolean();
    case ValueKind::Integer:
      return value.is_number_integer();
    case ValueKind::String:
      return value.is_string();
  }
  return false;
}

std::string_view kind_name(ValueKind kind) {
  switch (kind) {
    case ValueKind::Any:
      return "value";
    case ValueKind::Object:
      return "object";
    case ValueKind::Array:
      return "list";
    case ValueKind::Boolean:
      return "boolean";
    case ValueKind::Integer:
      return "integer";
    case ValueKind::String:
      return "string";
  }
  return "value";
}

bool is_valid_resource_key(std::string_view key) {
  if (key.empty() || key.size() > 64 || key.front() == '-') {
    return false;
  }
  return std::ranges::all_of(key, [](unsigned char c) {
    return std::islower(c) != 0 || std::isdigit(c) != 0 || c == '-' || c == '_';
  });
}

}  // namespace rowkeep
