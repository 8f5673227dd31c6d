#include "tollgate/managed-unit.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

#include "tollgate/configuration-error.hpp"
#include "tollgate/log.hpp"
#include "tollgate/timedef.hpp"
#include "tollgate/unit-info.hpp"
#include "tollgate/unit.hpp"

namespace tollgate {

namespace {

// 0 is reserved for "no deadline".
SteadyDuration::rep ToTicks(SteadyTimePoint tp) noexcept {
  const auto ticks = tp.time_since_epoch().count();
  return ticks == 0 ? 1 : ticks;
}

SteadyTimePoint FromTicks(SteadyDuration::rep ticks) noexcept { return SteadyTimePoint(SteadyDuration(ticks)); }

}  // namespace

ManagedUnit::ManagedUnit(UnitInfo info, UnitFactory factory) : _info(std::move(info)), _factory(std::move(factory)) {
  _info.validate();
  if (!_factory) {
    throw ConfigurationError("Unit '{}' has no instance factory", _info.name);
  }
}

ManagedUnit::~ManagedUnit() {
  if (!isStopped()) {
    stop();
  }
}

InstanceHandle ManagedUnit::getInstance() {
  if (isStopped()) {
    return {};
  }
  std::shared_ptr<Unit> instance = _instance.load(std::memory_order_acquire);
  if (!instance) {
    std::lock_guard lock(_creationMutex);
    if (isStopped()) {
      return {};
    }
    instance = _instance.load(std::memory_order_acquire);
    if (!instance) {
      instance = _factory();
      if (!instance) {
        throw std::logic_error("Unit factory returned no instance");
      }
      instance->init();
      _instance.store(instance, std::memory_order_release);
      log::debug("Unit '{}' instance initialized", _info.name);
    }
  }
  return {std::move(instance), _nbActiveHandles};
}

void ManagedUnit::stop() {
  std::lock_guard lock(_creationMutex);
  if (_stopped.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  std::shared_ptr<Unit> instance = _instance.exchange(nullptr, std::memory_order_acq_rel);
  if (instance) {
    instance->destroy();
    log::info("Unit '{}' stopped", _info.name);
  }
}

std::optional<SteadyTimePoint> ManagedUnit::unavailableUntil() const noexcept {
  const auto ticks = _unavailableUntil.load(std::memory_order_acquire);
  if (ticks == 0) {
    return std::nullopt;
  }
  return FromTicks(ticks);
}

bool ManagedUnit::clearUnavailableUntil(SteadyTimePoint expectedDeadline) noexcept {
  auto expected = ToTicks(expectedDeadline);
  return _unavailableUntil.compare_exchange_strong(expected, 0, std::memory_order_acq_rel);
}

void ManagedUnit::markUnavailableUntil(SteadyTimePoint deadline) noexcept {
  const auto newTicks = ToTicks(deadline);
  auto oldTicks = _unavailableUntil.load(std::memory_order_acquire);
  do {
    if (oldTicks != 0 && oldTicks >= newTicks) {
      return;
    }
  } while (!_unavailableUntil.compare_exchange_weak(oldTicks, newTicks, std::memory_order_acq_rel,
                                                    std::memory_order_acquire));
}

ManagedUnit::Availability ManagedUnit::availability(SteadyTimePoint now) const noexcept {
  if (isPermanentlyUnavailable()) {
    return {State::PermanentlyUnavailable, {}};
  }
  auto until = unavailableUntil();
  if (until && now < *until) {
    return {State::TemporarilyUnavailable, *until};
  }
  return {};
}

}  // namespace tollgate
