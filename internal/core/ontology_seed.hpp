#pragma once

#include <vector>

#include "internal/db/model/ontology_record.hpp"

namespace datagraph::core {

// Built-in privacy ontology: the five entity types, their declared
// properties and the allowed relationship triples.
const std::vector<db::model::EntityTypeRecord>&           DefaultEntityTypes();
const std::vector<db::model::EntityTypePropertyRecord>&   DefaultEntityTypeProperties();
const std::vector<db::model::RelationshipOntologyRecord>& DefaultRelationshipOntology();

} // namespace datagraph::core
