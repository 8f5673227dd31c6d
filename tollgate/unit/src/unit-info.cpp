#include "tollgate/unit-info.hpp"

#include "tollgate/configuration-error.hpp"

namespace tollgate {

void UnitInfo::validate() const {
  if (name.empty()) {
    throw ConfigurationError("Unit name cannot be empty");
  }
}

}  // namespace tollgate
