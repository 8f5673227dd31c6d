#pragma once

#include <functional>
#include <memory>

#include "tollgate/exchange-data.hpp"
#include "tollgate/invocation-result.hpp"

namespace tollgate {

// Server-side unit of work invoked by a UnitInvoker, one call per exchange.
// service() may be called concurrently from several threads on the same instance.
class Unit {
 public:
  Unit() noexcept = default;

  Unit(const Unit&) = delete;
  Unit(Unit&&) = delete;
  Unit& operator=(const Unit&) = delete;
  Unit& operator=(Unit&&) = delete;

  virtual ~Unit() = default;

  // Called once, before the first service call. May throw, in which case the instance is discarded.
  virtual void init() {}

  virtual InvocationResult service(const RequestData& request, ResponseData& response) = 0;

  // Called once when the owning ManagedUnit is stopped.
  virtual void destroy() noexcept {}
};

using UnitFactory = std::function<std::unique_ptr<Unit>()>;

}  // namespace tollgate
