#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

#include "tollgate/dispatcher.hpp"

namespace tollgate {

// Dispatcher running tasks in FIFO order on a fixed set of std::jthread workers.
//
// Destroying the WorkerPool (or calling stop()) lets the workers finish the tasks already submitted, then joins
// them. Tasks submitted after stop() are refused.
class WorkerPool final : public Dispatcher {
 public:
  // Creates a pool of nbThreads workers. If nbThreads is 0, uses the number of available processors.
  explicit WorkerPool(uint32_t nbThreads = 0);

  ~WorkerPool() override;

  // Throws std::logic_error if the pool is stopped.
  void submit(Task task) override;

  // Blocks until all workers exited. Idempotent.
  void stop() noexcept;

  [[nodiscard]] std::size_t nbThreads() const noexcept { return _threads.size(); }

  [[nodiscard]] std::size_t nbPendingTasks() const;

 private:
  void workerLoop(const std::stop_token& stopToken);

  mutable std::mutex _mutex;
  std::condition_variable_any _cv;
  std::deque<Task> _tasks;
  bool _stopped{false};
  std::vector<std::jthread> _threads;
};

}  // namespace tollgate
