#include "service_context.hpp"

#include "internal/util/errors.hpp"

namespace datagraph::service {

void ServiceContext::RequireReady() const {
  if (!Ready()) {
    throw util::NotReady("engine not ready: " + not_ready_reason);
  }
}

} // namespace datagraph::service
