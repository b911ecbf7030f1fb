#include <squad/orchestrator/process_pool.hpp>

#include <squad/common/util.hpp>

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace squad::orchestrator {

  std::string to_string(QueueStrategy strategy)
  {
    switch (strategy) {
    case QueueStrategy::FIFO:
      return "fifo";
    case QueueStrategy::PRIORITY:
      return "priority";
    }
    return "unknown";
  }

  std::optional<QueueStrategy> queue_strategy_from_string(const std::string& name)
  {
    if (name == "fifo") {
      return QueueStrategy::FIFO;
    }
    if (name == "priority") {
      return QueueStrategy::PRIORITY;
    }
    return std::nullopt;
  }

  ProcessPool::ProcessPool(int max_concurrent, QueueStrategy strategy)
      : _max_concurrent(max_concurrent), _strategy(strategy)
  {
    _logger = common::util::create_logger("ProcessPool");

    if (max_concurrent < 1) {
      throw common::InvalidConfigurationError{
          fmt::format("Process pool limit must be at least 1, got {}", max_concurrent)};
    }
  }

  bool ProcessPool::acquire(int priority, std::optional<std::chrono::milliseconds> timeout)
  {
    std::unique_lock<std::mutex> lock{_mutex};

    if (_queue.empty() && _running < _max_concurrent) {
      ++_running;
      return true;
    }

    auto waiter = std::make_shared<Waiter>(Waiter{priority});
    _enqueue(waiter);
    SPDLOG_LOGGER_DEBUG(
        _logger, "Pool is full ({} running), queued with priority {} at position {}", _running,
        priority, _queue.size()
    );

    auto ready = [&waiter]() { return waiter->granted || waiter->cancelled; };
    if (timeout.has_value()) {
      if (!_cv.wait_for(lock, *timeout, ready)) {
        _queue.remove(waiter);
        return false;
      }
    } else {
      _cv.wait(lock, ready);
    }

    if (waiter->cancelled) {
      throw QueueClearedError{};
    }
    return true;
  }

  bool ProcessPool::try_acquire()
  {
    std::lock_guard<std::mutex> lock{_mutex};
    if (_queue.empty() && _running < _max_concurrent) {
      ++_running;
      return true;
    }
    return false;
  }

  void ProcessPool::release()
  {
    std::lock_guard<std::mutex> lock{_mutex};
    if (_running <= 0) {
      _logger->warn("Released a slot while none is in use, ignoring");
      return;
    }
    --_running;
    _dispatch();
  }

  void ProcessPool::set_limit(int max_concurrent)
  {
    if (max_concurrent < 1) {
      throw common::InvalidConfigurationError{
          fmt::format("Process pool limit must be at least 1, got {}", max_concurrent)};
    }

    std::lock_guard<std::mutex> lock{_mutex};
    _logger->info("Changing the limit from {} to {}", _max_concurrent, max_concurrent);
    _max_concurrent = max_concurrent;
    _dispatch();
  }

  void ProcessPool::clear_queue()
  {
    std::lock_guard<std::mutex> lock{_mutex};
    if (!_queue.empty()) {
      _logger->info("Rejecting {} waiting callers", _queue.size());
    }
    for (auto& waiter : _queue) {
      waiter->cancelled = true;
    }
    _queue.clear();
    _cv.notify_all();
  }

  void ProcessPool::_enqueue(const waiter_ptr& waiter)
  {
    if (_strategy == QueueStrategy::PRIORITY) {
      // After every waiter of the same or a higher priority.
      auto pos = std::find_if(_queue.begin(), _queue.end(), [&waiter](const waiter_ptr& other) {
        return other->priority < waiter->priority;
      });
      _queue.insert(pos, waiter);
    } else {
      _queue.push_back(waiter);
    }
  }

  void ProcessPool::_dispatch()
  {
    bool woken = false;
    while (_running < _max_concurrent && !_queue.empty()) {
      _queue.front()->granted = true;
      _queue.pop_front();
      ++_running;
      woken = true;
    }
    if (woken) {
      _cv.notify_all();
    }
  }

  int ProcessPool::running() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _running;
  }

  int ProcessPool::queued() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return static_cast<int>(_queue.size());
  }

  int ProcessPool::available() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return std::max(0, _max_concurrent - _running);
  }

  int ProcessPool::max_concurrent() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _max_concurrent;
  }

  QueueStrategy ProcessPool::strategy() const
  {
    return _strategy;
  }

  bool ProcessPool::has_available_slot() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _running < _max_concurrent;
  }

  ProcessPoolStats ProcessPool::get_stats() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return ProcessPoolStats{
        _max_concurrent, _running, static_cast<int>(_queue.size()),
        std::max(0, _max_concurrent - _running),
        static_cast<int>(std::lround(100.0 * _running / _max_concurrent))};
  }

} // namespace squad::orchestrator
