#include "tollgate/worker-pool.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <utility>

#include "tollgate/log.hpp"

namespace tollgate {

WorkerPool::WorkerPool(uint32_t nbThreads) {
  if (nbThreads == 0) {
    nbThreads = std::thread::hardware_concurrency();
    if (nbThreads == 0) {
      nbThreads = 1;
      log::warn("Unable to detect the number of available processors for WorkerPool - defaults to {}", nbThreads);
    }
    log::debug("WorkerPool auto-thread constructor detected hw_concurrency={}", nbThreads);
  }
  _threads.reserve(nbThreads);
  for (uint32_t threadPos = 0; threadPos < nbThreads; ++threadPos) {
    _threads.emplace_back([this](const std::stop_token& stopToken) { workerLoop(stopToken); });
  }
}

WorkerPool::~WorkerPool() { stop(); }

void WorkerPool::submit(Task task) {
  {
    std::lock_guard lock(_mutex);
    if (_stopped) {
      throw std::logic_error("WorkerPool is stopped");
    }
    _tasks.push_back(std::move(task));
  }
  _cv.notify_one();
}

void WorkerPool::stop() noexcept {
  {
    std::lock_guard lock(_mutex);
    if (_stopped) {
      return;
    }
    _stopped = true;
  }
  for (auto& thread : _threads) {
    thread.request_stop();
  }
  for (auto& thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  log::debug("WorkerPool stopped ({} threads joined)", _threads.size());
}

std::size_t WorkerPool::nbPendingTasks() const {
  std::lock_guard lock(_mutex);
  return _tasks.size();
}

void WorkerPool::workerLoop(const std::stop_token& stopToken) {
  while (true) {
    Task task;
    {
      std::unique_lock lock(_mutex);
      // Returns false only when stop is requested and no task remains: pending tasks are always run before exiting.
      if (!_cv.wait(lock, stopToken, [this] { return !_tasks.empty(); })) {
        return;
      }
      task = std::move(_tasks.front());
      _tasks.pop_front();
    }
    try {
      task();
    } catch (const std::exception& ex) {
      log::error("Uncaught exception in WorkerPool task: {}", ex.what());
    }
  }
}

}  // namespace tollgate
