#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "tollgate/dispatcher.hpp"

namespace tollgate::test {

// Dispatcher recording submitted tasks, which are run only when the test asks for it, on the test thread.
class ManualDispatcher final : public Dispatcher {
 public:
  void submit(Task task) override {
    std::lock_guard lock(_mutex);
    if (_refuseTasks) {
      throw std::runtime_error("ManualDispatcher refuses tasks");
    }
    _tasks.push_back(std::move(task));
  }

  [[nodiscard]] std::size_t nbPending() const {
    std::lock_guard lock(_mutex);
    return _tasks.size();
  }

  // Run the oldest pending task. Returns false if there was none.
  bool runNext() {
    Task task;
    {
      std::lock_guard lock(_mutex);
      if (_tasks.empty()) {
        return false;
      }
      task = std::move(_tasks.front());
      _tasks.pop_front();
    }
    task();
    return true;
  }

  // Run pending tasks, including the ones they submit, until none is left. Returns the number of tasks run.
  std::size_t runAll() {
    std::size_t nbRun = 0;
    while (runNext()) {
      ++nbRun;
    }
    return nbRun;
  }

  // Make subsequent submit() calls throw, to simulate a saturated or stopped runtime.
  void setRefuseTasks(bool refuseTasks = true) {
    std::lock_guard lock(_mutex);
    _refuseTasks = refuseTasks;
  }

 private:
  mutable std::mutex _mutex;
  std::deque<Task> _tasks;
  bool _refuseTasks{false};
};

}  // namespace tollgate::test
