#pragma once

#include <exception>

#include "datagraph/graph/v1/status.pb.h"

namespace datagraph::service {

/*
  Converts internal exceptions into OperationStatus codes.
*/

graph::v1::OperationStatus ToStatus(const std::exception& e);

graph::v1::OperationStatus OkStatus();

} // namespace datagraph::service
