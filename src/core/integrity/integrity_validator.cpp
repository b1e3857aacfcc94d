#include "core/integrity/integrity_validator.hpp"

#include <cmath>
#include <limits>
#include <utility>
#include <vector>

#include "core/util/canonical.hpp"
#include "core/util/logging.hpp"

namespace rowkeep {
namespace {

constexpr std::size_t kMinMemberLength = 2;
constexpr std::size_t kLoggedFixLimit = 10;

std::shared_ptr<spdlog::logger> integrity_log() {
  return util::component_logger("integrity");
}

bool fits_int64(double raw) {
  return std::isfinite(raw) &&
         std::fabs(raw) < static_cast<double>(std::numeric_limits<std::int64_t>::max());
}

std::optional<std::int64_t> integral_value(const Document& value) {
  if (value.is_number_integer()) {
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    const double raw = value.get<double>();
    if (fits_int64(raw) && std::trunc(raw) == raw) {
      return static_cast<std::int64_t>(raw);
    }
  }
  return std::nullopt;
}

std::string number_text(const Document& value) {
  if (const auto integral = integral_value(value)) {
    return std::to_string(*integral);
  }
  return value.dump();
}

std::optional<Document> coerce_to(const Document& value, ValueKind kind) {
  switch (kind) {
    case ValueKind::Integer:
      if (value.is_string()) {
        if (const auto parsed = util::parse_int64(value.get<std::string>())) {
          return Document(*parsed);
        }
      }
      if (value.is_number_float()) {
        const double raw = value.get<double>();
        if (fits_int64(raw)) {
          return Document(static_cast<std::int64_t>(std::trunc(raw)));
        }
      }
      return std::nullopt;
    case ValueKind::String:
      if (value.is_number()) {
        return Document(number_text(value));
      }
      return std::nullopt;
    case ValueKind::Any:
    case ValueKind::Object:
    case ValueKind::Array:
    case ValueKind::Boolean:
      return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace

std::optional<Identifier> identifier_from(const Document& member) {
  if (member.is_string()) {
    return Identifier{util::trim_copy(member.get<std::string>())};
  }
  if (const auto id = integral_value(member)) {
    return Identifier{*id};
  }
  return std::nullopt;
}

void log_fix_report(const FixReport& report) {
  auto logger = integrity_log();
  if (report.empty()) {
    logger->info("all resources passed validation");
    return;
  }

  logger->warn("applied {} fix(es), {} failure(s)", report.fixes.size(), report.failures.size());
  for (std::size_t i = 0; i < report.fixes.size() && i < kLoggedFixLimit; ++i) {
    logger->warn("  {}", report.fixes[i]);
  }
  if (report.fixes.size() > kLoggedFixLimit) {
    logger->warn("  ... and {} more", report.fixes.size() - kLoggedFixLimit);
  }
  for (const auto& failure : report.failures) {
    logger->error("  {}", failure);
  }
}

IntegrityValidator::IntegrityValidator(ResourceStore& store, const ResourceCatalog& catalog,
                                       AliasResolver resolver)
    : store_(store), catalog_(catalog), resolver_(std::move(resolver)) {}

FixReport IntegrityValidator::run() {
  FixReport report;
  aliases_ = Document::object();
  aliases_changed_ = false;

  // Aliases are repaired first so rosters resolve against clean values.
  const ResourceSchema* alias_schema = catalog_.find(resource::kAliasMap);
  if (alias_schema != nullptr) {
    check_resource(*alias_schema, report);
    aliases_ = store_.load(resource::kAliasMap, Document::object());
    if (!aliases_.is_object()) {
      aliases_ = Document::object();
    }
  }

  for (const auto& schema : catalog_.schemas()) {
    if (&schema == alias_schema) {
      continue;
    }
    check_resource(schema, report);
  }

  if (aliases_changed_ && alias_schema != nullptr) {
    persist(alias_schema->key, aliases_, report);
  }

  log_fix_report(report);
  return report;
}

void IntegrityValidator::check_resource(const ResourceSchema& schema, FixReport& report) {
  ReadOutcome outcome = store_.read(schema.key);

  if (outcome.status == ReadStatus::Missing) {
    report.fixes.push_back(schema.key + ": created with default");
    persist(schema.key, schema.default_value, report);
    return;
  }

  if (outcome.status == ReadStatus::Corrupt) {
    std::string fix = schema.key + ": reset corrupted document";
    if (!outcome.quarantined_path.empty()) {
      fix += " (kept as " + std::filesystem::path{outcome.quarantined_path}.filename().string() + ")";
    }
    report.fixes.push_back(std::move(fix));
    persist(schema.key, schema.default_value, report);
    return;
  }

  if (!matches_kind(outcome.value, schema.kind)) {
    report.fixes.push_back(schema.key + ": expected " + std::string{kind_name(schema.kind)} +
                           ", reset to default");
    persist(schema.key, schema.default_value, report);
    return;
  }

  Document value = std::move(outcome.value);
  bool changed = repair_fields(schema, value, report);
  changed = repair_members(schema.members, value, schema.key, report) || changed;
  if (changed) {
    persist(schema.key, value, report);
  }
}

bool IntegrityValidator::repair_fields(const ResourceSchema& schema, Document& value,
                                       FixReport& report) {
  if (schema.fields.empty() || !value.is_object()) {
    return false;
  }

  bool changed = false;
  for (const auto& rule : schema.fields) {
    const std::string where = schema.key + "." + rule.name;
    auto it = value.find(rule.name);
    if (it == value.end()) {
      value[rule.name] = rule.default_value;
      report.fixes.push_back(where + ": added missing field");
      changed = true;
      continue;
    }

    if (!matches_kind(*it, rule.kind)) {
      if (auto coerced = coerce_to(*it, rule.kind)) {
        report.fixes.push_back(where + ": coerced " + it->dump() + " to " +
                               std::string{kind_name(rule.kind)});
        *it = std::move(*coerced);
      } else {
        report.fixes.push_back(where + ": expected " + std::string{kind_name(rule.kind)} +
                               ", reset to default");
        *it = rule.default_value;
      }
      changed = true;
    }

    changed = repair_members(rule.members, *it, where, report) || changed;
  }
  return changed;
}

bool IntegrityValidator::repair_members(MemberRule rule, Document& value, const std::string& where,
                                        FixReport& report) {
  switch (rule) {
    case MemberRule::None:
      return false;
    case MemberRule::IdentifierRoster:
      return value.is_array() && repair_roster(value, where, report);
    case MemberRule::StringValues:
      return value.is_object() && repair_string_values(value, where, report);
  }
  return false;
}

bool IntegrityValidator::repair_roster(Document& roster, const std::string& where,
                                       FixReport& report) {
  bool changed = false;
  Document repaired = Document::array();

  for (const auto& member : roster) {
    const auto id = identifier_from(member);
    if (!id.has_value()) {
      report.fixes.push_back(where + ": dropped invalid member " + member.dump());
      changed = true;
      continue;
    }

    std::string name;
    if (const auto* numeric = std::get_if<std::int64_t>(&*id)) {
      name = resolve_alias(*numeric, where, report);
      changed = true;
    } else {
      name = std::get<std::string>(*id);
      if (name != member.get<std::string>()) {
        report.fixes.push_back(where + ": trimmed " + member.dump());
        changed = true;
      }
    }

    if (name.size() < kMinMemberLength) {
      report.fixes.push_back(where + ": dropped too-short member " + member.dump());
      changed = true;
      continue;
    }
    repaired.push_back(std::move(name));
  }

  if (changed) {
    roster = std::move(repaired);
  }
  return changed;
}

std::string IntegrityValidator::resolve_alias(std::int64_t actor_id, const std::string& where,
                                              FixReport& report) {
  const std::string id_text = std::to_string(actor_id);

  const auto known = aliases_.find(id_text);
  if (known != aliases_.end() && known->is_string()) {
    const std::string alias = util::trim_copy(known->get<std::string>());
    if (alias.size() >= kMinMemberLength) {
      report.fixes.push_back(where + ": resolved " + id_text + " to '" + alias + "'");
      return alias;
    }
  }

  if (resolver_) {
    if (auto looked_up = resolver_(actor_id)) {
      const std::string alias = util::trim_copy(*looked_up);
      if (alias.size() >= kMinMemberLength) {
        aliases_[id_text] = alias;
        aliases_changed_ = true;
        report.fixes.push_back(where + ": resolved " + id_text + " to '" + alias +
                               "' via directory");
        return alias;
      }
    }
  }

  std::string placeholder = "User_" + id_text;
  report.fixes.push_back(where + ": unresolved id " + id_text + " replaced with " + placeholder);
  return placeholder;
}

bool IntegrityValidator::repair_string_values(Document& object, const std::string& where,
                                              FixReport& report) {
  bool changed = false;
  std::vector<std::string> dropped;

  for (auto it = object.begin(); it != object.end(); ++it) {
    if (it->is_string()) {
      continue;
    }
    if (it->is_number()) {
      report.fixes.push_back(where + "." + it.key() + ": cast " + it->dump() + " to string");
      *it = number_text(*it);
    } else {
      report.fixes.push_back(where + "." + it.key() + ": dropped non-string value");
      dropped.push_back(it.key());
    }
    changed = true;
  }

  for (const auto& key : dropped) {
    object.erase(key);
  }
  return changed;
}

void IntegrityValidator::persist(const std::string& key, const Document& value, FixReport& report) {
  const Result saved = store_.save(key, value);
  if (!saved.ok) {
    report.failures.push_back(key + ": " + saved.message);
  }
}

}  // namespace rowkeep
