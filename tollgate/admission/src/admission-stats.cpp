#include "tollgate/admission-stats.hpp"

#include <cstdint>
#include <format>
#include <iterator>
#include <string>
#include <string_view>

namespace tollgate {

std::string AdmissionStats::json_str() const {
  std::string out;
  out.reserve(160UL);
  out.push_back('{');
  bool first = true;
  for_each_field([&out, &first](std::string_view name, uint64_t value) {
    if (!first) {
      out.push_back(',');
    } else {
      first = false;
    }
    std::format_to(std::back_inserter(out), R"("{}":{})", name, value);
  });
  out.push_back('}');
  return out;
}

}  // namespace tollgate
