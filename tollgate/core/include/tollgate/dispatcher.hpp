#pragma once

#include <functional>

namespace tollgate {

// Execution context running continuations of parked exchanges on worker threads.
class Dispatcher {
 public:
  using Task = std::function<void()>;

  Dispatcher() noexcept = default;

  Dispatcher(const Dispatcher&) = delete;
  Dispatcher(Dispatcher&&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;
  Dispatcher& operator=(Dispatcher&&) = delete;

  virtual ~Dispatcher() = default;

  // Schedule task for execution. Implementations must never run it inline on the calling thread, which is typically
  // the thread completing another exchange: draining a long queue inline would grow the call stack without bound.
  // Throws if the task cannot be accepted.
  virtual void submit(Task task) = 0;
};

}  // namespace tollgate
