#include "tollgate/admission-config.hpp"

#include "tollgate/configuration-error.hpp"
#include "tollgate/internal/admission-state.hpp"

namespace tollgate {

void AdmissionConfig::validate() const {
  if (maxConcurrentRequests < 1) {
    throw ConfigurationError("Maximum concurrent requests must be at least 1");
  }
  if (maxConcurrentRequests > internal::AdmissionState::kMaxCapacity) {
    throw ConfigurationError("Maximum concurrent requests must be at most {}", internal::AdmissionState::kMaxCapacity);
  }
  if (name.empty()) {
    throw ConfigurationError("Admission controller name cannot be empty");
  }
}

}  // namespace tollgate
