#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "datagraph/graph/v1/types.pb.h"

namespace datagraph::db::model {

/*
  One row of a typed entity collection.

  properties_json is JSON object text, empty when the entity has none.
  embedding is derived from name + description and never leaves the engine.
*/
struct EntityRecord {
  std::string                      id;
  graph::v1::EntityKind            kind = graph::v1::ENTITY_KIND_UNSPECIFIED;
  std::string                      name;
  std::optional<std::string>       description;
  std::string                      properties_json;
  std::vector<float>               embedding;
  uint64_t                         created_at_ms = 0;
  uint64_t                         updated_at_ms = 0;
};

// Nearest-neighbour hit, distance is cosine distance.
struct ScoredEntityRecord {
  EntityRecord record;
  double       distance = 0.0;
};

} // namespace datagraph::db::model
