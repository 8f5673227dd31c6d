#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

#include "tollgate/timedef.hpp"
#include "tollgate/unit-info.hpp"
#include "tollgate/unit.hpp"

namespace tollgate {

// Scoped access to the instance of a ManagedUnit. The instance is released when the handle is destroyed (or
// release() is called), on every exit path.
// An empty handle (operator bool returning false) means that the unit is stopped.
class InstanceHandle {
 public:
  InstanceHandle() noexcept = default;

  InstanceHandle(const InstanceHandle&) = delete;
  InstanceHandle& operator=(const InstanceHandle&) = delete;

  InstanceHandle(InstanceHandle&& other) noexcept
      : _instance(std::move(other._instance)), _nbActive(std::exchange(other._nbActive, nullptr)) {}

  InstanceHandle& operator=(InstanceHandle&& other) noexcept {
    if (this != &other) [[likely]] {
      release();
      _instance = std::move(other._instance);
      _nbActive = std::exchange(other._nbActive, nullptr);
    }
    return *this;
  }

  ~InstanceHandle() { release(); }

  [[nodiscard]] Unit& instance() const noexcept { return *_instance; }

  explicit operator bool() const noexcept { return static_cast<bool>(_instance); }

  void release() noexcept {
    if (_nbActive != nullptr) {
      _nbActive->fetch_sub(1, std::memory_order_acq_rel);
      _nbActive = nullptr;
    }
    _instance.reset();
  }

 private:
  friend class ManagedUnit;

  InstanceHandle(std::shared_ptr<Unit> instance, std::atomic<int64_t>& nbActive) noexcept
      : _instance(std::move(instance)), _nbActive(&nbActive) {
    _nbActive->fetch_add(1, std::memory_order_acq_rel);
  }

  std::shared_ptr<Unit> _instance;
  std::atomic<int64_t>* _nbActive{nullptr};
};

// A registered unit with its availability lifecycle.
//
// The instance is created and initialized lazily on first use. Availability is either Available, temporarily
// unavailable until a deadline, or permanently unavailable (terminal). Availability fields are lock-free atomics
// mutated by UnitInvoker; the creation lock is only taken on the instance creation slow path.
class ManagedUnit {
 public:
  enum class State : uint8_t { Available, TemporarilyUnavailable, PermanentlyUnavailable };

  struct Availability {
    State state{State::Available};
    SteadyTimePoint until;  // only meaningful for TemporarilyUnavailable
  };

  // Throws ConfigurationError if info is invalid or factory is empty.
  ManagedUnit(UnitInfo info, UnitFactory factory);

  ManagedUnit(const ManagedUnit&) = delete;
  ManagedUnit(ManagedUnit&&) = delete;
  ManagedUnit& operator=(const ManagedUnit&) = delete;
  ManagedUnit& operator=(ManagedUnit&&) = delete;

  ~ManagedUnit();

  [[nodiscard]] const UnitInfo& info() const noexcept { return _info; }

  // Get a scoped handle on the instance, creating and initializing it first if needed.
  // Returns an empty handle if the unit is stopped. Exceptions from the factory or init() propagate.
  InstanceHandle getInstance();

  // Destroy the instance (if it was created) and refuse to hand out instances from now on. Idempotent.
  void stop();

  [[nodiscard]] bool isStopped() const noexcept { return _stopped.load(std::memory_order_acquire); }

  // Number of instance handles currently held.
  [[nodiscard]] int64_t nbActiveHandles() const noexcept { return _nbActiveHandles.load(std::memory_order_acquire); }

  [[nodiscard]] bool isPermanentlyUnavailable() const noexcept {
    return _permanentlyUnavailable.load(std::memory_order_acquire);
  }

  // Irreversible.
  void setPermanentlyUnavailable() noexcept { _permanentlyUnavailable.store(true, std::memory_order_release); }

  // Deadline of the current temporary unavailability, if any (it may already be expired).
  [[nodiscard]] std::optional<SteadyTimePoint> unavailableUntil() const noexcept;

  // Clear the temporary unavailability, only if it is still expectedDeadline. Returns true if this call cleared it.
  bool clearUnavailableUntil(SteadyTimePoint expectedDeadline) noexcept;

  // Make the unit temporarily unavailable until deadline. A later deadline already set concurrently is kept.
  void markUnavailableUntil(SteadyTimePoint deadline) noexcept;

  [[nodiscard]] Availability availability(SteadyTimePoint now) const noexcept;

 private:
  UnitInfo _info;
  UnitFactory _factory;
  std::atomic<std::shared_ptr<Unit>> _instance;
  std::mutex _creationMutex;
  std::atomic<int64_t> _nbActiveHandles{0};
  // Temporary unavailability deadline in steady clock ticks, 0 when available.
  std::atomic<SteadyDuration::rep> _unavailableUntil{0};
  std::atomic<bool> _permanentlyUnavailable{false};
  std::atomic<bool> _stopped{false};
};

}  // namespace tollgate
