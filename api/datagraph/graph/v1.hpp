#pragma once

#include <string_view>

#include "datagraph/graph/v1/ingest.pb.h"
#include "datagraph/graph/v1/ontology.pb.h"
#include "datagraph/graph/v1/status.pb.h"
#include "datagraph/graph/v1/types.pb.h"

#include "datagraph/graph/v1/admin_service.pb.h"
#include "datagraph/graph/v1/entity_service.pb.h"
#include "datagraph/graph/v1/ingest_service.pb.h"
#include "datagraph/graph/v1/ontology_service.pb.h"
#include "datagraph/graph/v1/relationship_service.pb.h"
#include "datagraph/graph/v1/search_service.pb.h"

namespace datagraph::graph::v1 {

inline constexpr EntityKind kAllEntityKinds[] = {
    ENTITY_KIND_ASSET, ENTITY_KIND_PROCESSING_ACTIVITY, ENTITY_KIND_DATA_ELEMENT, ENTITY_KIND_DATA_SUBJECT_TYPE, ENTITY_KIND_VENDOR,
};

// "Asset", "ProcessingActivity", ... ; empty for UNSPECIFIED.
inline std::string_view EntityTypeName(EntityKind kind) {
  switch (kind) {
    case ENTITY_KIND_ASSET:
      return "Asset";
    case ENTITY_KIND_PROCESSING_ACTIVITY:
      return "ProcessingActivity";
    case ENTITY_KIND_DATA_ELEMENT:
      return "DataElement";
    case ENTITY_KIND_DATA_SUBJECT_TYPE:
      return "DataSubjectType";
    case ENTITY_KIND_VENDOR:
      return "Vendor";
    default:
      return {};
  }
}

// Backing collection name: "Assets", "ProcessingActivities", ...
inline std::string_view CollectionName(EntityKind kind) {
  switch (kind) {
    case ENTITY_KIND_ASSET:
      return "Assets";
    case ENTITY_KIND_PROCESSING_ACTIVITY:
      return "ProcessingActivities";
    case ENTITY_KIND_DATA_ELEMENT:
      return "DataElements";
    case ENTITY_KIND_DATA_SUBJECT_TYPE:
      return "DataSubjectTypes";
    case ENTITY_KIND_VENDOR:
      return "Vendors";
    default:
      return {};
  }
}

// Accepts a type name or a collection name. UNSPECIFIED when unknown.
inline EntityKind EntityKindFromName(std::string_view name) {
  for (auto kind : kAllEntityKinds) {
    if (name == EntityTypeName(kind) || name == CollectionName(kind)) {
      return kind;
    }
  }
  return ENTITY_KIND_UNSPECIFIED;
}

} // namespace datagraph::graph::v1
