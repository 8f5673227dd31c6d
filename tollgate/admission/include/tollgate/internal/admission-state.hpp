#pragma once

#include <atomic>
#include <cstdint>

namespace tollgate::internal {

// Admission capacity and in-flight count packed in a single atomic word, so that both are always updated together
// by one compare-and-swap. Upper 32 bits hold the maximum, lower 31 bits the current count.
// All mutations are lock-free retry loops, none of them blocks.
class AdmissionState {
 public:
  static constexpr uint32_t kMaxCapacity = (uint32_t{1} << 31) - 1U;

  struct Resize {
    uint32_t previousMaximum;
    uint32_t current;
  };

  explicit AdmissionState(uint32_t maximum) noexcept : _state(Pack(maximum, 0)) {}

  // Take one slot if current < maximum. Returns false when saturated.
  bool tryAdmit() noexcept {
    uint64_t oldVal = _state.load(std::memory_order_acquire);
    do {
      if (Current(oldVal) >= Maximum(oldVal)) {
        return false;
      }
    } while (!_state.compare_exchange_weak(oldVal, oldVal + 1U, std::memory_order_acq_rel,
                                           std::memory_order_acquire));
    return true;
  }

  // Take one slot regardless of the maximum. Returns the new current count.
  uint32_t forceAdmit() noexcept { return Current(_state.fetch_add(1U, std::memory_order_acq_rel)) + 1U; }

  // Give back one slot. Returns false (leaving the state untouched) if no slot was taken.
  bool release() noexcept {
    uint64_t oldVal = _state.load(std::memory_order_acquire);
    do {
      if (Current(oldVal) == 0) {
        return false;
      }
    } while (!_state.compare_exchange_weak(oldVal, oldVal - 1U, std::memory_order_acq_rel,
                                           std::memory_order_acquire));
    return true;
  }

  // Give back one slot only if current exceeds the maximum (after the maximum has been lowered).
  bool releaseIfOverCapacity() noexcept {
    uint64_t oldVal = _state.load(std::memory_order_acquire);
    do {
      if (Current(oldVal) <= Maximum(oldVal)) {
        return false;
      }
    } while (!_state.compare_exchange_weak(oldVal, oldVal - 1U, std::memory_order_acq_rel,
                                           std::memory_order_acquire));
    return true;
  }

  // Replace the maximum, keeping the current count.
  Resize resize(uint32_t newMaximum) noexcept {
    uint64_t oldVal = _state.load(std::memory_order_acquire);
    while (!_state.compare_exchange_weak(oldVal, Pack(newMaximum, Current(oldVal)), std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
    }
    return {Maximum(oldVal), Current(oldVal)};
  }

  [[nodiscard]] uint32_t maximum() const noexcept { return Maximum(_state.load(std::memory_order_acquire)); }

  [[nodiscard]] uint32_t current() const noexcept { return Current(_state.load(std::memory_order_acquire)); }

 private:
  static constexpr int kMaximumShift = 32;
  static constexpr uint64_t kCurrentMask = kMaxCapacity;

  static constexpr uint64_t Pack(uint32_t maximum, uint32_t current) noexcept {
    return (static_cast<uint64_t>(maximum) << kMaximumShift) | (current & kCurrentMask);
  }

  static constexpr uint32_t Maximum(uint64_t state) noexcept { return static_cast<uint32_t>(state >> kMaximumShift); }

  static constexpr uint32_t Current(uint64_t state) noexcept { return static_cast<uint32_t>(state & kCurrentMask); }

  std::atomic<uint64_t> _state;
};

}  // namespace tollgate::internal
