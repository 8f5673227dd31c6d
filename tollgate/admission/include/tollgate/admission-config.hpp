#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tollgate {

struct AdmissionConfig {
  // What happens to an exchange arriving while all slots are taken.
  enum class SaturationPolicy : uint8_t {
    // Park it in the FIFO wait queue until a slot is handed over (backpressure without blocking the caller).
    Queue,
    // Answer 503 (Service Unavailable) immediately and end the exchange.
    Reject
  };

  // Name of the controller, used in logs and stats.
  std::string name{"admission"};

  // Maximum number of exchanges processed concurrently downstream of the controller.
  // Must be at least 1 and at most 2^31 - 1. Can be changed at runtime with AdmissionController::setMaximum.
  // Default: 64.
  uint32_t maxConcurrentRequests{64};

  // Policy applied when maxConcurrentRequests exchanges are already in flight. Default: Queue.
  SaturationPolicy saturationPolicy{SaturationPolicy::Queue};

  AdmissionConfig& withName(std::string_view name) {
    this->name.assign(name);
    return *this;
  }

  AdmissionConfig& withMaxConcurrentRequests(uint32_t maxConcurrentRequests) {
    this->maxConcurrentRequests = maxConcurrentRequests;
    return *this;
  }

  AdmissionConfig& withSaturationPolicy(SaturationPolicy saturationPolicy) {
    this->saturationPolicy = saturationPolicy;
    return *this;
  }

  // Throws ConfigurationError if a field is invalid.
  void validate() const;

  bool operator==(const AdmissionConfig&) const noexcept = default;
};

}  // namespace tollgate
