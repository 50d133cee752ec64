#pragma once

#include <string>

#include "datagraph/graph/v1/types.pb.h"

namespace datagraph::db::model {

/*
  Ontology catalog rows. Seeded once, read by callers and by the optional
  validation hook.
*/

struct EntityTypeRecord {
  std::string           type_id;
  std::string           name;
  std::string           description;
  std::string           table_name;
  graph::v1::EntityKind kind = graph::v1::ENTITY_KIND_UNSPECIFIED;
};

struct EntityTypePropertyRecord {
  std::string type_id;
  std::string property_name;
  std::string data_type;
  bool        is_required = false;
  std::string description;
};

struct RelationshipOntologyRecord {
  std::string source_type_id;
  std::string target_type_id;
  std::string relationship_type;
  std::string description;
};

} // namespace datagraph::db::model
