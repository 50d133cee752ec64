#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace datagraph::db::model {

struct RelationshipRecord {
  std::string id;
  std::string source_id;
  std::string target_id;
  std::string relationship_type;
  std::string properties_json;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
  // Insertion order, assigned by the repository; breaks created_at_ms ties.
  uint64_t    sequence = 0;
};

// entity_id matches either endpoint. Unset filters match everything.
struct RelationshipFilter {
  std::optional<std::string> entity_id;
  std::optional<std::string> relationship_type;
  std::size_t                limit = 100;
};

} // namespace datagraph::db::model
