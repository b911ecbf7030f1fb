#ifndef SQUAD_ORCHESTRATOR_PROCESS_POOL_HPP
#define SQUAD_ORCHESTRATOR_PROCESS_POOL_HPP

#include <squad/common/exceptions.hpp>

#include <chrono>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace squad::orchestrator {

  enum class QueueStrategy { FIFO = 0, PRIORITY };

  std::string to_string(QueueStrategy strategy);

  std::optional<QueueStrategy> queue_strategy_from_string(const std::string& name);

  struct QueueClearedError : common::SquadException {
    QueueClearedError() : SquadException("Process pool queue was cleared") {}
  };

  struct ProcessPoolStats {
    int max_concurrent;
    int running;
    int queued;
    int available;
    int utilization_percent;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Counting gate that limits how many workers run at the same time.
  ///
  /// Callers that find no free slot block in acquire until a slot is released
  /// to them. Waiters are served in arrival order, or by descending priority
  /// with arrival order among equal priorities.
  ////////////////////////////////////////////////////////////////////////////////
  class ProcessPool {
  public:
    static constexpr int DEFAULT_MAX_CONCURRENT = 5;

    ProcessPool(int max_concurrent = DEFAULT_MAX_CONCURRENT,
                QueueStrategy strategy = QueueStrategy::FIFO);

    ProcessPool(const ProcessPool&) = delete;
    ProcessPool& operator=(const ProcessPool&) = delete;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Takes a slot, waiting in the queue while the pool is full.
    ///
    /// @param[in] priority position in the queue under the priority strategy
    /// @param[in] timeout give up waiting after this long
    /// @return false when the timeout elapsed before a slot was granted
    /// @throws QueueClearedError when clear_queue removed the waiting caller
    ////////////////////////////////////////////////////////////////////////////////
    bool acquire(int priority = 0, std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Takes a slot only when one is free and nobody is waiting.
    bool try_acquire();

    // Returns a slot; the next waiter receives it when the limit allows.
    void release();

    // Raising the limit wakes waiters at once; lowering it lets running
    // workers finish and holds the queue until the count drops below the limit.
    void set_limit(int max_concurrent);

    // Rejects every waiting caller with QueueClearedError.
    void clear_queue();

    int running() const;
    int queued() const;
    int available() const;
    int max_concurrent() const;
    QueueStrategy strategy() const;
    bool has_available_slot() const;
    ProcessPoolStats get_stats() const;

  private:
    struct Waiter {
      int priority;
      bool granted = false;
      bool cancelled = false;
    };
    using waiter_ptr = std::shared_ptr<Waiter>;

    void _enqueue(const waiter_ptr& waiter);
    void _dispatch();

    int _max_concurrent;
    QueueStrategy _strategy;
    int _running = 0;
    std::list<waiter_ptr> _queue;

    mutable std::mutex _mutex;
    std::condition_variable _cv;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace squad::orchestrator

#endif
