#pragma once

#include <string>
#include <string_view>

namespace tollgate {

// Static description of a managed unit, given at registration.
struct UnitInfo {
  // Unique name of the unit, used in logs. Required.
  std::string name;

  // Whether the unit may continue processing an exchange asynchronously after its service method returned.
  // When false, Exchange::startAsync() is rejected for exchanges it serves. Default: true.
  bool asyncSupported{true};

  UnitInfo& withName(std::string_view name) {
    this->name.assign(name);
    return *this;
  }

  UnitInfo& withAsyncSupported(bool asyncSupported = true) {
    this->asyncSupported = asyncSupported;
    return *this;
  }

  // Throws ConfigurationError if a field is invalid.
  void validate() const;

  bool operator==(const UnitInfo&) const noexcept = default;
};

}  // namespace tollgate
