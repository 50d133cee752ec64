#include "status.hpp"

#include "internal/util/errors.hpp"

namespace datagraph::service {

using namespace datagraph::graph::v1;

namespace {

OperationStatus Make(StatusCode code, const char* message) {
  OperationStatus status;
  status.set_code(code);
  status.set_message(message);
  return status;
}

} // namespace

OperationStatus ToStatus(const std::exception& e) {
  using namespace datagraph::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return Make(STATUS_CODE_NOT_FOUND, e.what());
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return Make(STATUS_CODE_INVALID_ARGUMENT, e.what());
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return Make(STATUS_CODE_ALREADY_EXISTS, e.what());
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return Make(STATUS_CODE_ABORTED, e.what());
  }
  if (dynamic_cast<const NotReady*>(&e)) {
    return Make(STATUS_CODE_UNAVAILABLE, e.what());
  }
  if (dynamic_cast<const ExtractionError*>(&e)) {
    return Make(STATUS_CODE_EXTRACTION_FAILED, e.what());
  }
  if (dynamic_cast<const UpstreamError*>(&e)) {
    return Make(STATUS_CODE_UPSTREAM_FAILURE, e.what());
  }

  return Make(STATUS_CODE_INTERNAL, e.what());
}

OperationStatus OkStatus() {
  OperationStatus status;
  status.set_code(STATUS_CODE_OK);
  return status;
}

} // namespace datagraph::service
