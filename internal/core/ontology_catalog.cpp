#include "ontology_catalog.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <tuple>

#include "db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "ontology_seed.hpp"

namespace datagraph::core {

using namespace datagraph::graph::v1;

namespace {

graph::v1::EntityType ToProto(const db::model::EntityTypeRecord& r) {
  graph::v1::EntityType out;
  out.set_type_id(r.type_id);
  out.set_name(r.name);
  out.set_description(r.description);
  out.set_table_name(r.table_name);
  out.set_kind(r.kind);
  return out;
}

graph::v1::EntityTypeProperty ToProto(const db::model::EntityTypePropertyRecord& r) {
  graph::v1::EntityTypeProperty out;
  out.set_type_id(r.type_id);
  out.set_property_name(r.property_name);
  out.set_data_type(r.data_type);
  out.set_is_required(r.is_required);
  out.set_description(r.description);
  return out;
}

std::optional<db::model::EntityTypeRecord> FindType(const std::vector<db::model::EntityTypeRecord>& types, EntityKind kind) {
  for (const auto& type : types) {
    if (type.kind == kind) return type;
  }
  return std::nullopt;
}

// Null values count as absent.
bool MatchesDataType(const google::protobuf::Value& value, const std::string& data_type) {
  using google::protobuf::Value;
  switch (value.kind_case()) {
    case Value::kStringValue:
      return data_type == "STRING";
    case Value::kBoolValue:
      return data_type == "BOOLEAN";
    case Value::kNumberValue:
      if (data_type == "NUMBER") return true;
      if (data_type == "INTEGER") {
        const double n = value.number_value();
        return std::isfinite(n) && std::floor(n) == n;
      }
      return false;
    case Value::kStructValue:
      return data_type == "OBJECT";
    case Value::kListValue:
      return data_type == "ARRAY";
    default:
      return true;
  }
}

} // namespace

OntologyCatalog::OntologyCatalog(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

void OntologyCatalog::SeedDefaults() {
  auto tx = repository_->Begin();
  for (const auto& type : DefaultEntityTypes()) {
    ThrowIfDbError(repository_->UpsertEntityType(*tx, type), "seed entity type " + type.name);
  }
  for (const auto& property : DefaultEntityTypeProperties()) {
    ThrowIfDbError(repository_->UpsertEntityTypeProperty(*tx, property), "seed property " + property.property_name);
  }
  for (const auto& rule : DefaultRelationshipOntology()) {
    ThrowIfDbError(repository_->UpsertRelationshipOntology(*tx, rule), "seed relationship rule " + rule.relationship_type);
  }
  tx->Commit();

  DATAGRAPH_LOG_INFO("ontology seeded", {observability::IntField("entity_types", static_cast<int64_t>(DefaultEntityTypes().size())),
                                         observability::IntField("relationship_rules", static_cast<int64_t>(DefaultRelationshipOntology().size()))});
}

std::vector<EntityType> OntologyCatalog::ListEntityTypes() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListEntityTypes(*tx);
  tx->Commit();

  std::vector<EntityType> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(ToProto(r));
  }
  return out;
}

std::vector<EntityTypeProperty> OntologyCatalog::ListEntityTypeProperties(const std::string& entity_type) {
  auto tx    = repository_->Begin();
  auto types = repository_->ListEntityTypes(*tx);

  auto type = std::find_if(types.begin(), types.end(), [&](const auto& t) { return t.name == entity_type || t.table_name == entity_type; });
  if (type == types.end()) {
    tx->Commit();
    return {};
  }

  auto records = repository_->ListEntityTypeProperties(*tx, type->type_id);
  tx->Commit();

  std::sort(records.begin(), records.end(), [](const auto& lhs, const auto& rhs) { return lhs.property_name < rhs.property_name; });

  std::vector<EntityTypeProperty> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(ToProto(r));
  }
  return out;
}

std::vector<RelationshipOntologyEntry> OntologyCatalog::ListRelationshipOntology() {
  auto tx    = repository_->Begin();
  auto types = repository_->ListEntityTypes(*tx);
  auto rules = repository_->ListRelationshipOntology(*tx);
  tx->Commit();

  std::map<std::string, std::string> names;
  for (const auto& t : types) {
    names[t.type_id] = t.name;
  }

  std::vector<RelationshipOntologyEntry> out;
  out.reserve(rules.size());
  for (const auto& rule : rules) {
    RelationshipOntologyEntry entry;
    entry.set_source_type(names[rule.source_type_id]);
    entry.set_target_type(names[rule.target_type_id]);
    entry.set_relationship_type(rule.relationship_type);
    entry.set_description(rule.description);
    out.push_back(std::move(entry));
  }

  std::sort(out.begin(), out.end(), [](const auto& lhs, const auto& rhs) {
    return std::tie(lhs.source_type(), lhs.target_type(), lhs.relationship_type()) <
           std::tie(rhs.source_type(), rhs.target_type(), rhs.relationship_type());
  });
  return out;
}

std::vector<std::string> OntologyCatalog::ValidateEntity(EntityKind kind, const google::protobuf::Struct& properties) {
  auto tx   = repository_->Begin();
  auto type = FindType(repository_->ListEntityTypes(*tx), kind);
  if (!type) {
    tx->Commit();
    return {};
  }
  auto declared = repository_->ListEntityTypeProperties(*tx, type->type_id);
  tx->Commit();

  std::vector<std::string> violations;
  for (const auto& property : declared) {
    auto it = properties.fields().find(property.property_name);
    const bool present = it != properties.fields().end() && it->second.kind_case() != google::protobuf::Value::kNullValue;

    if (!present) {
      if (property.is_required) {
        violations.push_back(type->name + "." + property.property_name + " is required");
      }
      continue;
    }
    if (!MatchesDataType(it->second, property.data_type)) {
      violations.push_back(type->name + "." + property.property_name + " must be " + property.data_type);
    }
  }
  return violations;
}

bool OntologyCatalog::CheckRelationship(EntityKind source_kind, EntityKind target_kind, const std::string& relationship_type) {
  auto tx    = repository_->Begin();
  auto types = repository_->ListEntityTypes(*tx);
  auto rules = repository_->ListRelationshipOntology(*tx);
  tx->Commit();

  auto source = FindType(types, source_kind);
  auto target = FindType(types, target_kind);
  if (!source || !target) return false;

  return std::any_of(rules.begin(), rules.end(), [&](const auto& rule) {
    return rule.source_type_id == source->type_id && rule.target_type_id == target->type_id && rule.relationship_type == relationship_type;
  });
}

void OntologyCatalog::EnforceEntity(EntityKind kind, const google::protobuf::Struct& properties) {
  auto violations = ValidateEntity(kind, properties);
  if (violations.empty()) return;

  std::string message = "ontology violation:";
  for (const auto& v : violations) {
    message += " " + v + ";";
  }
  message.pop_back();
  throw util::InvalidArgument(message);
}

void OntologyCatalog::EnforceRelationship(EntityKind source_kind, EntityKind target_kind, const std::string& relationship_type) {
  if (!CheckRelationship(source_kind, target_kind, relationship_type)) {
    throw util::InvalidArgument("ontology violation: " + std::string(EntityTypeName(source_kind)) + " " + relationship_type + " " +
                                std::string(EntityTypeName(target_kind)) + " is not declared");
  }
}

} // namespace datagraph::core
