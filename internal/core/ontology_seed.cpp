#include "ontology_seed.hpp"

namespace datagraph::core {

namespace {

constexpr const char* kAssetTypeId              = "2b6291d5-f623-4a12-8b3a-59d04f145459";
constexpr const char* kProcessingActivityTypeId = "8b5f3a0a-9c9a-41f2-8c9a-4a6f9f3c1d0b";
constexpr const char* kDataElementTypeId        = "f3a2c5b1-9b1a-4e2b-8d1a-6f3b1a4e2b8d";
constexpr const char* kDataSubjectTypeTypeId    = "c5b1a4e2-8d1a-4e2b-9b1a-3b1a4e2b8d1a";
constexpr const char* kVendorTypeId             = "a4e2b8d1-6f3b-4e2b-8d1a-9b1a4e2b8d1a";

} // namespace

const std::vector<db::model::EntityTypeRecord>& DefaultEntityTypes() {
  static const std::vector<db::model::EntityTypeRecord> kTypes = {
      {kAssetTypeId, "Asset", "A system, application, or database.", "Assets", graph::v1::ENTITY_KIND_ASSET},
      {kProcessingActivityTypeId, "ProcessingActivity", "A business process that uses data.", "ProcessingActivities",
       graph::v1::ENTITY_KIND_PROCESSING_ACTIVITY},
      {kDataElementTypeId, "DataElement", "A specific category of personal data.", "DataElements", graph::v1::ENTITY_KIND_DATA_ELEMENT},
      {kDataSubjectTypeTypeId, "DataSubjectType", "A category of individual.", "DataSubjectTypes", graph::v1::ENTITY_KIND_DATA_SUBJECT_TYPE},
      {kVendorTypeId, "Vendor", "A third-party company or service.", "Vendors", graph::v1::ENTITY_KIND_VENDOR},
  };
  return kTypes;
}

const std::vector<db::model::EntityTypePropertyRecord>& DefaultEntityTypeProperties() {
  static const std::vector<db::model::EntityTypePropertyRecord> kProperties = {
      {kAssetTypeId, "hosting_location", "STRING", true, "The physical or cloud region where the asset is hosted."},
      {kAssetTypeId, "data_retention_days", "INTEGER", false, "Number of days data is retained in this asset."},
      {kVendorTypeId, "contact_email", "STRING", true, "The primary contact email for the vendor."},
      {kVendorTypeId, "dpa_signed", "BOOLEAN", false, "Indicates if a Data Processing Agreement is signed."},
      {kDataElementTypeId, "sensitivity_level", "STRING", true, "The sensitivity level of the data (e.g., Public, Confidential, Secret)."},
  };
  return kProperties;
}

const std::vector<db::model::RelationshipOntologyRecord>& DefaultRelationshipOntology() {
  static const std::vector<db::model::RelationshipOntologyRecord> kRules = {
      {kProcessingActivityTypeId, kAssetTypeId, "USES", "A process uses a system or database."},
      {kAssetTypeId, kDataElementTypeId, "CONTAINS", "A system contains a category of data."},
      {kAssetTypeId, kVendorTypeId, "TRANSFERS_DATA_TO", "A system sends data to a third-party vendor."},
      {kProcessingActivityTypeId, kVendorTypeId, "ASSISTED_BY", "A business process is assisted by a vendor."},
      {kAssetTypeId, kDataSubjectTypeTypeId, "CONTAINS", "A system contains data about a type of person."},
  };
  return kRules;
}

} // namespace datagraph::core
