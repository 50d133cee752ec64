#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

namespace datagraph::util {

// 1 - cos(a, b), clamped to [0, 2]. nullopt when the dimensions differ or
// either vector has zero norm.
std::optional<double> CosineDistance(const std::vector<float>& a, const std::vector<float>& b);

// Scales v to unit L2 norm in place; zero vectors are left unchanged.
void Normalize(std::vector<float>& v);

// Sorts scored items by (distance, name, id) and keeps the first limit.
template <typename Scored>
void KeepNearest(std::vector<Scored>& scored, std::size_t limit) {
  std::sort(scored.begin(), scored.end(), [](const Scored& lhs, const Scored& rhs) {
    if (lhs.distance != rhs.distance) return lhs.distance < rhs.distance;
    if (lhs.record.name != rhs.record.name) return lhs.record.name < rhs.record.name;
    return lhs.record.id < rhs.record.id;
  });
  if (scored.size() > limit) {
    scored.resize(limit);
  }
}

} // namespace datagraph::util
