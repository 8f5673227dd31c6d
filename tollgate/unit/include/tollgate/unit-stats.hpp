#pragma once

#include <cstdint>

namespace tollgate {

// Snapshot of a UnitInvoker activity. Counters are cumulative since construction.
struct UnitStats {
  template <class F>
  void for_each_field(F&& fun) const {
    fun("invocations", invocations);
    fun("temporaryFailures", temporaryFailures);
    fun("permanentFailures", permanentFailures);
    fun("rejectedUnavailable", rejectedUnavailable);
    fun("rejectedRetired", rejectedRetired);
  }

  uint64_t invocations{};          // calls to the unit service method
  uint64_t temporaryFailures{};    // invocations that reported a temporary unavailability
  uint64_t permanentFailures{};    // invocations that reported a permanent unavailability
  uint64_t rejectedUnavailable{};  // exchanges answered 503 without invocation, inside a backoff window
  uint64_t rejectedRetired{};      // exchanges answered 404 without invocation, unit permanently unavailable
};

}  // namespace tollgate
