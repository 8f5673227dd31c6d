#pragma once

#include <cstdint>
#include <string>

namespace tollgate {

// Snapshot of an AdmissionController activity. Counters are cumulative since construction.
struct AdmissionStats {
  // Flat JSON object of all counters.
  [[nodiscard]] std::string json_str() const;

  // Visit each counter as (name, uint64_t value), in json_str() order.
  template <class F>
  void for_each_field(F&& fun) const {
    fun("admitted", admitted);
    fun("queued", queued);
    fun("handedOff", handedOff);
    fun("rejected", rejected);
    fun("current", static_cast<uint64_t>(current));
    fun("maximum", static_cast<uint64_t>(maximum));
    fun("queueDepth", queueDepth);
  }

  uint64_t admitted{};   // exchanges forwarded immediately on arrival
  uint64_t queued{};     // exchanges parked because all slots were taken
  uint64_t handedOff{};  // parked exchanges resumed through the dispatcher
  uint64_t rejected{};   // exchanges answered 503 by the Reject policy or after a dispatch failure
  uint32_t current{};
  uint32_t maximum{};
  uint64_t queueDepth{};  // exchanges currently parked
};

}  // namespace tollgate
