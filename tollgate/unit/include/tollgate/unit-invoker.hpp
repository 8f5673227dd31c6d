#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "tollgate/handler.hpp"
#include "tollgate/http-status-code.hpp"
#include "tollgate/managed-unit.hpp"
#include "tollgate/timedef.hpp"
#include "tollgate/unit-stats.hpp"

namespace tollgate {

class Exchange;

// Terminal handler invoking a ManagedUnit with the RequestData / ResponseData attached to the exchange, and driving
// the unit availability from the invocation result:
//  - a permanently unavailable unit answers 404 without invocation, forever;
//  - inside a temporary unavailability window the exchange gets 503 without invocation;
//  - TemporarilyUnavailable(S) opens a window of S seconds and answers 503;
//  - PermanentlyUnavailable stops the unit, retires it and answers 404.
// The exchange is ended when process() returns, unless the unit started asynchronous processing.
// Exceptions thrown by the unit are not classified here: they propagate to the caller.
class UnitInvoker final : public Handler {
 public:
  // Throws ConfigurationError if unit is empty.
  explicit UnitInvoker(std::shared_ptr<ManagedUnit> unit, NowFunction now = SteadyClock::now);

  void process(Exchange& exchange) override;

  [[nodiscard]] ManagedUnit& managedUnit() const noexcept { return *_unit; }

  [[nodiscard]] UnitStats stats() const noexcept;

 private:
  void respond(Exchange& exchange, http::StatusCode responseCode);

  static void finish(Exchange& exchange);

  std::shared_ptr<ManagedUnit> _unit;
  NowFunction _now;

  std::atomic<uint64_t> _invocations{0};
  std::atomic<uint64_t> _temporaryFailures{0};
  std::atomic<uint64_t> _permanentFailures{0};
  std::atomic<uint64_t> _rejectedUnavailable{0};
  std::atomic<uint64_t> _rejectedRetired{0};
};

}  // namespace tollgate
