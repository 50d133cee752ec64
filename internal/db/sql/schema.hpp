#pragma once

#include <string>
#include <vector>

#include "datagraph/graph/v1/types.pb.h"

namespace datagraph::db::sql {

/*
  Table layout shared by the SQL backends.

  One table per entity collection, keyed by a text uuid:
    assets, processing_activities, data_elements, data_subject_types, vendors

  Relationships live in entity_relationships and reference entities by id
  only, without a foreign key, since the endpoints span five tables.
*/

// Throws std::invalid_argument for ENTITY_KIND_UNSPECIFIED.
const std::string& TableFor(graph::v1::EntityKind kind);

// Statements executed once at startup; every statement is idempotent.
const std::vector<std::string>& SqliteBootstrapSql();
const std::vector<std::string>& PostgresBootstrapSql();

} // namespace datagraph::db::sql
