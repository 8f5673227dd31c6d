#pragma once

#include <atomic>
#include <boost/lockfree/queue.hpp>
#include <cstdint>
#include <memory>
#include <string>

#include "tollgate/admission-config.hpp"
#include "tollgate/admission-stats.hpp"
#include "tollgate/dispatcher.hpp"
#include "tollgate/exchange.hpp"
#include "tollgate/handler.hpp"
#include "tollgate/internal/admission-state.hpp"

namespace tollgate {

// Handler bounding the number of exchanges processed concurrently by its next handler.
//
// An exchange arriving while a slot is free takes it and is forwarded immediately, on the calling thread.
// Otherwise it is parked in a lock-free FIFO wait queue and process() returns at once: the caller is never blocked.
// When an admitted exchange completes, its slot is handed over directly to the head of the queue, which is resumed
// through the Dispatcher (the in-flight count is not decremented in between, so no concurrent newcomer can steal
// the slot from a longer waiting exchange). If nobody waits, the slot is freed.
//
// No lock is taken on any path: the capacity and the in-flight count live in a single packed atomic word updated by
// compare-and-swap loops.
//
// Parked exchanges cannot be cancelled, they leave the queue only when dispatched.
// The controller and its dispatcher must outlive every exchange they process.
class AdmissionController final : public Handler {
 public:
  // Throws ConfigurationError if the configuration is invalid, or next or dispatcher is empty.
  AdmissionController(AdmissionConfig config, HandlerPtr next, std::shared_ptr<Dispatcher> dispatcher);

  AdmissionController(const AdmissionController&) = delete;
  AdmissionController(AdmissionController&&) = delete;
  AdmissionController& operator=(const AdmissionController&) = delete;
  AdmissionController& operator=(AdmissionController&&) = delete;

  ~AdmissionController() override;

  void process(Exchange& exchange) override;

  // Change the maximum number of concurrent requests and return the previous one.
  // When the maximum is raised, parked exchanges are dispatched right away as long as the in-flight count observed
  // by this call stays below newMax. This drain is best effort: concurrent completions may briefly push the count
  // above the new maximum.
  // Throws ConfigurationError if newMax is 0 or larger than 2^31 - 1.
  uint32_t setMaximum(uint32_t newMax);

  [[nodiscard]] uint32_t getMaximum() const noexcept { return _state.maximum(); }

  // Number of exchanges currently holding a slot (admitted or handed over, not completed yet).
  [[nodiscard]] uint32_t getCurrent() const noexcept { return _state.current(); }

  [[nodiscard]] uint64_t queueDepth() const noexcept { return _queueDepth.load(std::memory_order_relaxed); }

  [[nodiscard]] HandlerPtr next() const noexcept { return _next.load(std::memory_order_acquire); }

  // Atomically swap the next handler, returning the previous one. Throws ConfigurationError if next is empty.
  HandlerPtr setNext(HandlerPtr next);

  [[nodiscard]] const std::string& name() const noexcept { return _name; }

  [[nodiscard]] AdmissionConfig::SaturationPolicy saturationPolicy() const noexcept { return _saturationPolicy; }

  [[nodiscard]] AdmissionStats stats() const noexcept;

 private:
  void onExchangeComplete(Exchange& exchange, NextListener& nextListener);

  void enqueue(Exchange& exchange);

  Exchange* popQueued() noexcept;

  // Submit the continuation of a parked exchange, which already owns a slot, to the dispatcher.
  void dispatch(Exchange& exchange);

  // Resume a parked exchange, on a dispatcher thread.
  void resume(Exchange& exchange);

  // Take free slots for parked exchanges while both exist. Closes the window where an exchange is parked right
  // after the last in-flight one released its slot.
  void drainWhileAdmissible();

  void reject(Exchange& exchange);

  // Reject a parked exchange whose dispatch was refused. Rejections triggered while another one is in progress on
  // the same thread are deferred to that outer call, which ends them one after the other.
  void rejectRefused(Exchange& exchange, const char* reason);

  internal::AdmissionState _state;
  boost::lockfree::queue<Exchange*> _queue;
  std::atomic<HandlerPtr> _next;
  std::shared_ptr<Dispatcher> _dispatcher;
  std::string _name;
  AdmissionConfig::SaturationPolicy _saturationPolicy;

  std::atomic<uint64_t> _queueDepth{0};
  std::atomic<uint64_t> _admitted{0};
  std::atomic<uint64_t> _queued{0};
  std::atomic<uint64_t> _handedOff{0};
  std::atomic<uint64_t> _rejected{0};
};

}  // namespace tollgate
