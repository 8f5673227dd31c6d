#include "tollgate/admission-controller.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

#include "tollgate/admission-config.hpp"
#include "tollgate/admission-stats.hpp"
#include "tollgate/configuration-error.hpp"
#include "tollgate/dispatcher.hpp"
#include "tollgate/exchange.hpp"
#include "tollgate/handler.hpp"
#include "tollgate/http-status-code.hpp"
#include "tollgate/internal/admission-state.hpp"
#include "tollgate/log.hpp"

namespace tollgate {

namespace {

// Nodes preallocated by the wait queue. It grows beyond on demand.
constexpr std::size_t kInitialQueueCapacity = 128;

struct RefusedExchange {
  AdmissionController* controller;
  Exchange* exchange;
};

// Set while a thread is rejecting exchanges refused by a dispatcher. Ending a rejected exchange hands its slot to
// the next parked one, whose dispatch may be refused in turn: that one is appended here instead of being rejected
// from within the completion listener, so the stack depth does not grow with the queue length.
thread_local std::vector<RefusedExchange>* tRefusedExchanges = nullptr;

uint32_t ValidatedMaximum(const AdmissionConfig& config) {
  config.validate();
  return config.maxConcurrentRequests;
}

}  // namespace

AdmissionController::AdmissionController(AdmissionConfig config, HandlerPtr next,
                                         std::shared_ptr<Dispatcher> dispatcher)
    : _state(ValidatedMaximum(config)),
      _queue(kInitialQueueCapacity),
      _next(std::move(next)),
      _dispatcher(std::move(dispatcher)),
      _name(std::move(config.name)),
      _saturationPolicy(config.saturationPolicy) {
  handlerNotNull(_next.load(std::memory_order_relaxed));
  if (!_dispatcher) {
    throw ConfigurationError("Dispatcher cannot be null");
  }
  log::debug("Admission '{}' created with maximum {} concurrent requests", _name, _state.maximum());
}

AdmissionController::~AdmissionController() {
  const auto nbParked = _queueDepth.load(std::memory_order_relaxed);
  if (nbParked != 0) {
    log::warn("Admission '{}' destroyed with {} parked exchange(s) never dispatched", _name, nbParked);
  }
}

void AdmissionController::process(Exchange& exchange) {
  auto completionListener = [this](Exchange& ex, NextListener& nextListener) { onExchangeComplete(ex, nextListener); };

  if (_saturationPolicy == AdmissionConfig::SaturationPolicy::Queue) {
    // A parked exchange will own a slot as well once resumed, so the listener is needed on both paths.
    exchange.addCompletionListener(std::move(completionListener));
    if (_state.tryAdmit()) {
      _admitted.fetch_add(1U, std::memory_order_relaxed);
      executeHandler(*next(), exchange);
    } else {
      enqueue(exchange);
    }
    return;
  }

  if (!_state.tryAdmit()) {
    log::debug("Admission '{}' saturated ({} in flight), rejecting exchange", _name, _state.current());
    reject(exchange);
    return;
  }
  try {
    exchange.addCompletionListener(std::move(completionListener));
  } catch (const std::exception&) {
    _state.release();
    throw;
  }
  _admitted.fetch_add(1U, std::memory_order_relaxed);
  executeHandler(*next(), exchange);
}

uint32_t AdmissionController::setMaximum(uint32_t newMax) {
  if (newMax < 1) {
    throw ConfigurationError("Maximum concurrent requests must be at least 1");
  }
  if (newMax > internal::AdmissionState::kMaxCapacity) {
    throw ConfigurationError("Maximum concurrent requests must be at most {}", internal::AdmissionState::kMaxCapacity);
  }
  auto [previousMaximum, current] = _state.resize(newMax);
  log::info("Admission '{}' maximum concurrent requests changed from {} to {}", _name, previousMaximum, newMax);

  // More space may have opened up: process parked exchanges for a while. The count may overshoot newMax if
  // completions race with this loop, which is tolerated.
  while (current < newMax) {
    Exchange* queued = popQueued();
    if (queued == nullptr) {
      break;
    }
    current = _state.forceAdmit();
    dispatch(*queued);
  }
  return previousMaximum;
}

HandlerPtr AdmissionController::setNext(HandlerPtr next) {
  handlerNotNull(next);
  return _next.exchange(std::move(next), std::memory_order_acq_rel);
}

AdmissionStats AdmissionController::stats() const noexcept {
  AdmissionStats stats;
  stats.admitted = _admitted.load(std::memory_order_relaxed);
  stats.queued = _queued.load(std::memory_order_relaxed);
  stats.handedOff = _handedOff.load(std::memory_order_relaxed);
  stats.rejected = _rejected.load(std::memory_order_relaxed);
  stats.current = _state.current();
  stats.maximum = _state.maximum();
  stats.queueDepth = _queueDepth.load(std::memory_order_relaxed);
  return stats;
}

void AdmissionController::onExchangeComplete([[maybe_unused]] Exchange& exchange, NextListener& nextListener) {
  if (_state.releaseIfOverCapacity()) {
    // The maximum has been lowered since this exchange was admitted: free the slot instead of handing it over.
    log::trace("Admission '{}' over capacity, slot released", _name);
  } else if (Exchange* queued = popQueued(); queued != nullptr) {
    dispatch(*queued);
  } else {
    if (!_state.release()) {
      log::error("Admission '{}' completion without any slot in use", _name);
    }
    drainWhileAdmissible();
  }
  nextListener.proceed();
}

void AdmissionController::enqueue(Exchange& exchange) {
  _queueDepth.fetch_add(1U, std::memory_order_relaxed);
  if (!_queue.push(&exchange)) {
    _queueDepth.fetch_sub(1U, std::memory_order_relaxed);
    log::error("Admission '{}' unable to grow its wait queue, admitting exchange over capacity", _name);
    _state.forceAdmit();
    _admitted.fetch_add(1U, std::memory_order_relaxed);
    executeHandler(*next(), exchange);
    return;
  }
  _queued.fetch_add(1U, std::memory_order_relaxed);
  log::trace("Admission '{}' saturated, exchange parked", _name);

  drainWhileAdmissible();
}

Exchange* AdmissionController::popQueued() noexcept {
  Exchange* exchange = nullptr;
  if (_queue.pop(exchange)) {
    _queueDepth.fetch_sub(1U, std::memory_order_relaxed);
    return exchange;
  }
  return nullptr;
}

void AdmissionController::dispatch(Exchange& exchange) {
  try {
    _dispatcher->submit([this, &exchange] { resume(exchange); });
  } catch (const std::exception& ex) {
    rejectRefused(exchange, ex.what());
    return;
  }
  _handedOff.fetch_add(1U, std::memory_order_relaxed);
}

void AdmissionController::rejectRefused(Exchange& exchange, const char* reason) {
  if (tRefusedExchanges != nullptr) {
    log::debug("Admission '{}' unable to dispatch parked exchange: {}", _name, reason);
    tRefusedExchanges->push_back({this, &exchange});
    return;
  }
  log::error("Admission '{}' unable to dispatch parked exchange: {}", _name, reason);

  std::vector<RefusedExchange> refused{{this, &exchange}};
  tRefusedExchanges = &refused;
  struct ResetRefused {
    ~ResetRefused() { tRefusedExchanges = nullptr; }
  } resetRefused;

  // Ending each exchange runs its own completion listener, which passes its slot on (and may append to refused).
  for (std::size_t refusedPos = 0; refusedPos < refused.size(); ++refusedPos) {
    const RefusedExchange entry = refused[refusedPos];
    entry.controller->reject(*entry.exchange);
  }
  if (refused.size() > 1U) {
    log::error("Admission '{}' rejected {} parked exchanges refused by the dispatcher", _name, refused.size());
  }
}

void AdmissionController::resume(Exchange& exchange) { executeHandler(*next(), exchange); }

void AdmissionController::drainWhileAdmissible() {
  while (!_queue.empty() && _state.tryAdmit()) {
    Exchange* queued = popQueued();
    if (queued == nullptr) {
      // Another thread took the entry first.
      _state.release();
      continue;
    }
    dispatch(*queued);
  }
}

void AdmissionController::reject(Exchange& exchange) {
  _rejected.fetch_add(1U, std::memory_order_relaxed);
  if (!exchange.isResponseStarted()) {
    exchange.setResponseCode(http::StatusCodeServiceUnavailable);
  }
  exchange.endExchange();
}

}  // namespace tollgate
