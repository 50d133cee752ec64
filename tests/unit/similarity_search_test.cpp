#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/entity_store.hpp"
#include "internal/core/similarity_search.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/embedding/hashing_embedding_provider.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fakes.hpp"

namespace {

using datagraph::core::EntityStore;
using datagraph::core::SimilaritySearch;
using datagraph::db::memory::MemoryRepository;
using datagraph::embedding::HashingEmbeddingProvider;
using datagraph::testing::Throws;
using namespace datagraph::graph::v1;
namespace util = datagraph::util;

struct Fixture {
  std::shared_ptr<MemoryRepository>         repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<HashingEmbeddingProvider> embedder   = std::make_shared<HashingEmbeddingProvider>();
  EntityStore                               entities{repository, embedder};
  SimilaritySearch                          search{repository, embedder};
};

void TestNearDuplicateRanksFirst() {
  Fixture    f;
  const auto rds = f.entities.Create(ENTITY_KIND_ASSET, "AWS RDS Database", std::nullopt, std::nullopt);
  f.entities.Create(ENTITY_KIND_ASSET, "Marketing Spreadsheet", std::nullopt, std::nullopt);
  f.entities.Create(ENTITY_KIND_ASSET, "HR Portal", std::nullopt, std::nullopt);

  auto hits = f.search.FindSimilar(ENTITY_KIND_ASSET, "AWS RDS", std::nullopt);
  assert(hits.size() == 3);
  assert(hits[0].id() == rds);
  assert(hits[0].name() == "AWS RDS Database");
  assert(hits[0].distance() < SimilaritySearch::kNearDuplicateThreshold);
  assert(hits[0].distance() <= hits[1].distance());
  assert(hits[1].distance() <= hits[2].distance());
}

void TestIdenticalTextHasZeroDistance() {
  Fixture f;
  f.entities.Create(ENTITY_KIND_ASSET, "Customer Database", std::string("Main store"), std::nullopt);

  auto hits = f.search.FindSimilar(ENTITY_KIND_ASSET, "Customer Database", std::string("Main store"));
  assert(hits.size() == 1);
  assert(hits[0].distance() < 1e-5);
  assert(hits[0].has_description() && hits[0].description() == "Main store");
}

void TestOnlyTheRequestedCollectionIsSearched() {
  Fixture f;
  f.entities.Create(ENTITY_KIND_VENDOR, "AWS RDS", std::nullopt, std::nullopt);
  assert(f.search.FindSimilar(ENTITY_KIND_ASSET, "AWS RDS", std::nullopt).empty());
  assert(f.search.FindSimilar(ENTITY_KIND_VENDOR, "AWS RDS", std::nullopt).size() == 1);
}

void TestLimitAndDefault() {
  Fixture f;
  for (int i = 0; i < 8; ++i) {
    f.entities.Create(ENTITY_KIND_DATA_ELEMENT, "Element " + std::to_string(i), std::nullopt, std::nullopt);
  }
  assert(f.search.FindSimilar(ENTITY_KIND_DATA_ELEMENT, "Element", std::nullopt).size() == SimilaritySearch::kDefaultLimit);
  assert(f.search.FindSimilar(ENTITY_KIND_DATA_ELEMENT, "Element", std::nullopt, 3).size() == 3);
  assert(f.search.FindSimilar(ENTITY_KIND_DATA_ELEMENT, "Element", std::nullopt, 0).empty());
  assert(f.search.FindSimilar(ENTITY_KIND_DATA_ELEMENT, "Element", std::nullopt, 50).size() == 8);
}

void TestTiesBreakByName() {
  Fixture f;
  f.entities.Create(ENTITY_KIND_VENDOR, "Same", std::string("b"), std::nullopt);
  f.entities.Create(ENTITY_KIND_VENDOR, "Same", std::string("b"), std::nullopt);

  auto hits = f.search.FindSimilar(ENTITY_KIND_VENDOR, "Same", std::string("b"));
  assert(hits.size() == 2);
  assert(hits[0].id() < hits[1].id());
}

void TestMismatchedDimensionsAreIgnored() {
  auto repository = std::make_shared<MemoryRepository>();
  EntityStore small(repository, std::make_shared<HashingEmbeddingProvider>(16));
  small.Create(ENTITY_KIND_ASSET, "CRM", std::nullopt, std::nullopt);

  SimilaritySearch search(repository, std::make_shared<HashingEmbeddingProvider>(32));
  assert(search.FindSimilar(ENTITY_KIND_ASSET, "CRM", std::nullopt).empty());
}

void TestProviderFailurePropagates() {
  auto embedder = std::make_shared<datagraph::testing::FakeEmbeddingProvider>();
  SimilaritySearch search(std::make_shared<MemoryRepository>(), embedder);
  embedder->fail = true;
  assert(Throws<util::UpstreamError>([&] { search.FindSimilar(ENTITY_KIND_ASSET, "x", std::nullopt); }));
  assert(Throws<util::InvalidArgument>([&] { search.FindSimilar(ENTITY_KIND_UNSPECIFIED, "x", std::nullopt); }));
}

} // namespace

int main() {
  TestNearDuplicateRanksFirst();
  TestIdenticalTextHasZeroDistance();
  TestOnlyTheRequestedCollectionIsSearched();
  TestLimitAndDefault();
  TestTiesBreakByName();
  TestMismatchedDimensionsAreIgnored();
  TestProviderFailurePropagates();

  std::cout << "datagraph_unit_similarity_search: pass\n";
  return 0;
}
