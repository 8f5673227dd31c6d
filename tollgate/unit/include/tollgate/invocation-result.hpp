#pragma once

#include <chrono>
#include <cstdint>

namespace tollgate {

// Outcome of one invocation of a unit, interpreted by UnitInvoker to drive the unit availability.
class InvocationResult {
 public:
  enum class Kind : uint8_t { Ok, TemporarilyUnavailable, PermanentlyUnavailable };

  // Default to Ok.
  InvocationResult() noexcept = default;

  static InvocationResult Ok() noexcept { return {}; }

  // The unit cannot serve requests for the given duration. A non-positive backoff means no estimate: the unit is
  // retried on the next request.
  static InvocationResult TemporarilyUnavailable(std::chrono::seconds backoff) noexcept {
    return InvocationResult(Kind::TemporarilyUnavailable, backoff);
  }

  // The unit will never be able to serve requests again and should be retired.
  static InvocationResult PermanentlyUnavailable() noexcept {
    return InvocationResult(Kind::PermanentlyUnavailable, std::chrono::seconds{0});
  }

  [[nodiscard]] Kind kind() const noexcept { return _kind; }

  [[nodiscard]] bool isOk() const noexcept { return _kind == Kind::Ok; }

  [[nodiscard]] bool isTemporarilyUnavailable() const noexcept { return _kind == Kind::TemporarilyUnavailable; }

  [[nodiscard]] bool isPermanentlyUnavailable() const noexcept { return _kind == Kind::PermanentlyUnavailable; }

  // Only meaningful for TemporarilyUnavailable.
  [[nodiscard]] std::chrono::seconds backoff() const noexcept { return _backoff; }

  bool operator==(const InvocationResult&) const noexcept = default;

 private:
  InvocationResult(Kind kind, std::chrono::seconds backoff) noexcept : _backoff(backoff), _kind(kind) {}

  std::chrono::seconds _backoff{0};
  Kind _kind{Kind::Ok};
};

}  // namespace tollgate
