#pragma once

#include <string>

namespace datagraph::util {

// Entity and relationship ids: RFC4122 v4 UUIDs in canonical lowercase form,
// e.g. "3f0c9a4e-1b2d-4c5e-8f70-123456789abc".
std::string NewId();

} // namespace datagraph::util
