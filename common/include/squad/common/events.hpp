#ifndef SQUAD_COMMON_EVENTS_HPP
#define SQUAD_COMMON_EVENTS_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <deque>

#include <spdlog/spdlog.h>

namespace squad::common::events {

  enum class EventType {
    AGENT_STARTED = 0,
    AGENT_OUTPUT,
    AGENT_COMPLETED,
    AGENT_ERROR,
    AGENT_PAUSED,
    AGENT_RESUMED,
    GIT_WORKTREE_CREATED,
    GIT_WORKTREE_REMOVED,
    GIT_COMMIT_CREATED
  };

  std::string to_string(EventType type);

  struct AgentStarted {
    std::string process_id;
    std::string agent_id;
    int pid;
    std::string working_directory;
  };

  struct AgentOutput {
    std::string process_id;
    std::string agent_id;
    std::string stream;
    std::string content;
  };

  struct AgentCompleted {
    std::string process_id;
    std::string agent_id;
    std::optional<int> exit_code;
    bool killed;
    double cost;
    int64_t duration_ms;
  };

  struct AgentError {
    std::string process_id;
    std::string agent_id;
    std::string message;
    std::optional<int> exit_code;
  };

  struct AgentPaused {
    std::string process_id;
    std::string agent_id;
  };

  struct AgentResumed {
    std::string process_id;
    std::string agent_id;
  };

  struct WorktreeCreated {
    std::string repository;
    std::string allocation_id;
    std::string path;
    std::string branch;
    std::string feature_id;
  };

  struct WorktreeRemoved {
    std::string repository;
    std::string allocation_id;
    std::string path;
    std::string branch;
    bool forced;
  };

  struct CommitCreated {
    std::string repository;
    std::string branch;
    std::string commit;
    std::string message;
  };

  using Payload = std::variant<
      AgentStarted, AgentOutput, AgentCompleted, AgentError, AgentPaused, AgentResumed,
      WorktreeCreated, WorktreeRemoved, CommitCreated>;

  struct Event {
    std::chrono::system_clock::time_point timestamp;
    Payload payload;

    EventType type() const;
  };

  Event make_event(Payload&& payload);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Receiver of lifecycle notifications.
  /// Implementations are called from the drain thread and from callers of
  /// pool/coordinator operations, so they must be thread-safe. A sink never calls
  /// back into the component that published the event.
  ////////////////////////////////////////////////////////////////////////////////
  class EventSink {
  public:
    virtual ~EventSink() = default;

    virtual void publish(const Event& event) = 0;
  };

  class EventBus : public EventSink {
  public:
    using handler_t = std::function<void(const Event&)>;

    static constexpr size_t DEFAULT_HISTORY = 1000;

    EventBus(size_t history_size = DEFAULT_HISTORY);

    void publish(const Event& event) override;

    // A handler of std::nullopt type receives every event.
    int subscribe(handler_t handler, std::optional<EventType> type = std::nullopt);
    bool unsubscribe(int id);

    std::deque<Event> history() const;
    size_t published() const;

  private:
    struct Subscription {
      std::optional<EventType> type;
      handler_t handler;
    };

    mutable std::mutex _mutex;
    size_t _history_size;
    size_t _published = 0;
    int _next_id = 0;
    std::deque<Event> _history;
    std::unordered_map<int, Subscription> _subscriptions;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace squad::common::events

#endif
