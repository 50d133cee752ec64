#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/ontology_catalog.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/properties.hpp"
#include "tests/support/fakes.hpp"

namespace {

using datagraph::core::OntologyCatalog;
using datagraph::db::memory::MemoryRepository;
using datagraph::testing::Throws;
using namespace datagraph::graph::v1;
namespace util = datagraph::util;

OntologyCatalog SeededCatalog() {
  OntologyCatalog catalog(std::make_shared<MemoryRepository>());
  catalog.SeedDefaults();
  return catalog;
}

void TestEntityTypesOrderedByName() {
  auto catalog = SeededCatalog();
  auto types   = catalog.ListEntityTypes();
  assert(types.size() == 5);
  assert(types[0].name() == "Asset");
  assert(types[1].name() == "DataElement");
  assert(types[2].name() == "DataSubjectType");
  assert(types[3].name() == "ProcessingActivity");
  assert(types[4].name() == "Vendor");
  assert(types[0].table_name() == "Assets");
  assert(types[0].kind() == ENTITY_KIND_ASSET);
  assert(types[0].description() == "A system, application, or database.");
}

void TestSeedIsIdempotent() {
  auto repository = std::make_shared<MemoryRepository>();
  OntologyCatalog catalog(repository);
  catalog.SeedDefaults();
  catalog.SeedDefaults();
  assert(catalog.ListEntityTypes().size() == 5);
  assert(catalog.ListRelationshipOntology().size() == 5);
  assert(catalog.ListEntityTypeProperties("Asset").size() == 2);
}

void TestUnseededCatalogIsEmpty() {
  OntologyCatalog catalog(std::make_shared<MemoryRepository>());
  assert(catalog.ListEntityTypes().empty());
  assert(catalog.ListRelationshipOntology().empty());
  assert(catalog.ValidateEntity(ENTITY_KIND_ASSET, {}).empty());
  assert(!catalog.CheckRelationship(ENTITY_KIND_ASSET, ENTITY_KIND_DATA_ELEMENT, "CONTAINS"));
}

void TestPropertiesByTypeOrTableName() {
  auto catalog = SeededCatalog();

  auto by_type = catalog.ListEntityTypeProperties("Asset");
  assert(by_type.size() == 2);
  assert(by_type[0].property_name() == "data_retention_days");
  assert(by_type[0].data_type() == "INTEGER");
  assert(!by_type[0].is_required());
  assert(by_type[1].property_name() == "hosting_location");
  assert(by_type[1].is_required());

  auto by_table = catalog.ListEntityTypeProperties("Assets");
  assert(by_table.size() == 2);
  assert(by_table[1].property_name() == "hosting_location");

  assert(catalog.ListEntityTypeProperties("ProcessingActivity").empty());
  assert(catalog.ListEntityTypeProperties("Spaceship").empty());
}

void TestRelationshipOntologyOrder() {
  auto catalog = SeededCatalog();
  auto rules   = catalog.ListRelationshipOntology();
  assert(rules.size() == 5);
  assert(rules[0].source_type() == "Asset" && rules[0].target_type() == "DataElement" && rules[0].relationship_type() == "CONTAINS");
  assert(rules[1].source_type() == "Asset" && rules[1].target_type() == "DataSubjectType");
  assert(rules[2].source_type() == "Asset" && rules[2].target_type() == "Vendor" && rules[2].relationship_type() == "TRANSFERS_DATA_TO");
  assert(rules[3].source_type() == "ProcessingActivity" && rules[3].target_type() == "Asset" && rules[3].relationship_type() == "USES");
  assert(rules[4].source_type() == "ProcessingActivity" && rules[4].target_type() == "Vendor" && rules[4].relationship_type() == "ASSISTED_BY");
}

void TestValidateEntity() {
  auto catalog = SeededCatalog();

  assert(catalog.ValidateEntity(ENTITY_KIND_VENDOR, util::PropertiesFromJson(R"({"contact_email":"dpo@acme.io","dpa_signed":true})")).empty());

  auto missing = catalog.ValidateEntity(ENTITY_KIND_VENDOR, util::PropertiesFromJson(R"({"dpa_signed":"yes"})"));
  assert(missing.size() == 2);

  // null counts as absent
  assert(catalog.ValidateEntity(ENTITY_KIND_DATA_ELEMENT, util::PropertiesFromJson(R"({"sensitivity_level":null})")).size() == 1);

  // undeclared properties are allowed
  assert(catalog.ValidateEntity(ENTITY_KIND_DATA_ELEMENT, util::PropertiesFromJson(R"({"sensitivity_level":"Secret","extra":[1]})")).empty());

  assert(catalog.ValidateEntity(ENTITY_KIND_ASSET, util::PropertiesFromJson(R"({"hosting_location":"eu","data_retention_days":30})")).empty());
  assert(catalog.ValidateEntity(ENTITY_KIND_ASSET, util::PropertiesFromJson(R"({"hosting_location":"eu","data_retention_days":"30"})")).size() == 1);
  assert(catalog.ValidateEntity(ENTITY_KIND_ASSET, util::PropertiesFromJson(R"({"hosting_location":7})")).size() == 1);

  // no declared properties
  assert(catalog.ValidateEntity(ENTITY_KIND_PROCESSING_ACTIVITY, {}).empty());
}

void TestCheckAndEnforceRelationship() {
  auto catalog = SeededCatalog();
  assert(catalog.CheckRelationship(ENTITY_KIND_PROCESSING_ACTIVITY, ENTITY_KIND_ASSET, "USES"));
  assert(catalog.CheckRelationship(ENTITY_KIND_ASSET, ENTITY_KIND_DATA_SUBJECT_TYPE, "CONTAINS"));
  assert(!catalog.CheckRelationship(ENTITY_KIND_ASSET, ENTITY_KIND_PROCESSING_ACTIVITY, "USES"));
  assert(!catalog.CheckRelationship(ENTITY_KIND_ASSET, ENTITY_KIND_VENDOR, "uses"));

  catalog.EnforceRelationship(ENTITY_KIND_ASSET, ENTITY_KIND_VENDOR, "TRANSFERS_DATA_TO");
  assert(Throws<util::InvalidArgument>([&] { catalog.EnforceRelationship(ENTITY_KIND_VENDOR, ENTITY_KIND_ASSET, "TRANSFERS_DATA_TO"); }));
}

void TestEnforceEntityListsEveryViolation() {
  auto catalog = SeededCatalog();
  bool threw   = false;
  try {
    catalog.EnforceEntity(ENTITY_KIND_VENDOR, util::PropertiesFromJson(R"({"dpa_signed":1})"));
  } catch (const util::InvalidArgument& ex) {
    const std::string message = ex.what();
    threw = message.find("contact_email") != std::string::npos && message.find("dpa_signed") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEntityTypesOrderedByName();
  TestSeedIsIdempotent();
  TestUnseededCatalogIsEmpty();
  TestPropertiesByTypeOrTableName();
  TestRelationshipOntologyOrder();
  TestValidateEntity();
  TestCheckAndEnforceRelationship();
  TestEnforceEntityListsEveryViolation();

  std::cout << "datagraph_unit_ontology_catalog: pass\n";
  return 0;
}
