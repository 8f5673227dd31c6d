#include "tollgate/unit-invoker.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "tollgate/configuration-error.hpp"
#include "tollgate/exchange-data.hpp"
#include "tollgate/exchange.hpp"
#include "tollgate/http-status-code.hpp"
#include "tollgate/invocation-result.hpp"
#include "tollgate/log.hpp"
#include "tollgate/managed-unit.hpp"
#include "tollgate/timedef.hpp"
#include "tollgate/unit-stats.hpp"

namespace tollgate {

namespace {

// now + backoff, saturated to the latest representable time point.
SteadyTimePoint UnavailabilityDeadline(SteadyTimePoint now, std::chrono::seconds backoff) noexcept {
  const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(SteadyTimePoint::max() - now);
  if (backoff >= remaining) {
    return SteadyTimePoint::max();
  }
  return now + backoff;
}

}  // namespace

UnitInvoker::UnitInvoker(std::shared_ptr<ManagedUnit> unit, NowFunction now)
    : _unit(std::move(unit)), _now(std::move(now)) {
  if (!_unit) {
    throw ConfigurationError("Managed unit cannot be null");
  }
  if (!_now) {
    throw ConfigurationError("Time source cannot be null");
  }
}

void UnitInvoker::process(Exchange& exchange) {
  ManagedUnit& unit = *_unit;
  if (unit.isPermanentlyUnavailable()) {
    log::debug("Returning 404 for unit '{}' due to permanent unavailability", unit.info().name);
    _rejectedRetired.fetch_add(1U, std::memory_order_relaxed);
    respond(exchange, http::StatusCodeNotFound);
    return;
  }

  if (auto until = unit.unavailableUntil()) {
    if (_now() < *until) {
      log::debug("Returning 503 for unit '{}' due to temporary unavailability", unit.info().name);
      _rejectedUnavailable.fetch_add(1U, std::memory_order_relaxed);
      respond(exchange, http::StatusCodeServiceUnavailable);
      return;
    }
    // Deadline passed. Only one racer needs to clear it, the others invoke the unit anyway.
    unit.clearUnavailableUntil(*until);
  }

  if (!unit.info().asyncSupported) {
    exchange.putAttachment(kAsyncSupportedKey, false);
  }
  const RequestData& request = exchange.attachment(kRequestDataKey);
  ResponseData& response = exchange.attachment(kResponseDataKey);

  InvocationResult result;
  {
    InstanceHandle handle = unit.getInstance();
    if (!handle) {
      // Stopped after the availability check, by a concurrent permanent failure.
      _rejectedRetired.fetch_add(1U, std::memory_order_relaxed);
      respond(exchange, http::StatusCodeNotFound);
      return;
    }
    _invocations.fetch_add(1U, std::memory_order_relaxed);
    result = handle.instance().service(request, response);
  }

  switch (result.kind()) {
    case InvocationResult::Kind::Ok:
      finish(exchange);
      break;
    case InvocationResult::Kind::PermanentlyUnavailable:
      log::warn("Stopping unit '{}' due to permanent unavailability", unit.info().name);
      _permanentFailures.fetch_add(1U, std::memory_order_relaxed);
      unit.stop();
      unit.setPermanentlyUnavailable();
      respond(exchange, http::StatusCodeNotFound);
      break;
    case InvocationResult::Kind::TemporarilyUnavailable: {
      const auto backoff = result.backoff() < std::chrono::seconds{0} ? std::chrono::seconds{0} : result.backoff();
      unit.markUnavailableUntil(UnavailabilityDeadline(_now(), backoff));
      log::warn("Unit '{}' temporarily unavailable for {} s", unit.info().name, backoff.count());
      _temporaryFailures.fetch_add(1U, std::memory_order_relaxed);
      respond(exchange, http::StatusCodeServiceUnavailable);
      break;
    }
  }
}

UnitStats UnitInvoker::stats() const noexcept {
  UnitStats stats;
  stats.invocations = _invocations.load(std::memory_order_relaxed);
  stats.temporaryFailures = _temporaryFailures.load(std::memory_order_relaxed);
  stats.permanentFailures = _permanentFailures.load(std::memory_order_relaxed);
  stats.rejectedUnavailable = _rejectedUnavailable.load(std::memory_order_relaxed);
  stats.rejectedRetired = _rejectedRetired.load(std::memory_order_relaxed);
  return stats;
}

void UnitInvoker::respond(Exchange& exchange, http::StatusCode responseCode) {
  if (exchange.isResponseStarted()) {
    log::warn("Response already started, unable to answer {} for unit '{}'", responseCode, _unit->info().name);
  } else {
    exchange.setResponseCode(responseCode);
  }
  exchange.endExchange();
}

void UnitInvoker::finish(Exchange& exchange) {
  if (!exchange.isAsyncStarted()) {
    exchange.endExchange();
  }
}

}  // namespace tollgate
