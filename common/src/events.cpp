#include <squad/common/events.hpp>

#include <squad/common/util.hpp>

#include <vector>

namespace squad::common::events {

  namespace {

    template <class... Ts>
    struct overloaded : Ts... {
      using Ts::operator()...;
    };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

  } // namespace

  std::string to_string(EventType type)
  {
    switch (type) {
    case EventType::AGENT_STARTED:
      return "AGENT_STARTED";
    case EventType::AGENT_OUTPUT:
      return "AGENT_OUTPUT";
    case EventType::AGENT_COMPLETED:
      return "AGENT_COMPLETED";
    case EventType::AGENT_ERROR:
      return "AGENT_ERROR";
    case EventType::AGENT_PAUSED:
      return "AGENT_PAUSED";
    case EventType::AGENT_RESUMED:
      return "AGENT_RESUMED";
    case EventType::GIT_WORKTREE_CREATED:
      return "GIT_WORKTREE_CREATED";
    case EventType::GIT_WORKTREE_REMOVED:
      return "GIT_WORKTREE_REMOVED";
    case EventType::GIT_COMMIT_CREATED:
      return "GIT_COMMIT_CREATED";
    }
    return "UNKNOWN";
  }

  EventType Event::type() const
  {
    return std::visit(
        overloaded{
            [](const AgentStarted&) { return EventType::AGENT_STARTED; },
            [](const AgentOutput&) { return EventType::AGENT_OUTPUT; },
            [](const AgentCompleted&) { return EventType::AGENT_COMPLETED; },
            [](const AgentError&) { return EventType::AGENT_ERROR; },
            [](const AgentPaused&) { return EventType::AGENT_PAUSED; },
            [](const AgentResumed&) { return EventType::AGENT_RESUMED; },
            [](const WorktreeCreated&) { return EventType::GIT_WORKTREE_CREATED; },
            [](const WorktreeRemoved&) { return EventType::GIT_WORKTREE_REMOVED; },
            [](const CommitCreated&) { return EventType::GIT_COMMIT_CREATED; }},
        payload
    );
  }

  Event make_event(Payload&& payload)
  {
    return Event{std::chrono::system_clock::now(), std::move(payload)};
  }

  EventBus::EventBus(size_t history_size) : _history_size(history_size)
  {
    _logger = common::util::create_logger("EventBus");
  }

  void EventBus::publish(const Event& event)
  {
    std::vector<handler_t> handlers;
    {
      std::lock_guard<std::mutex> lock{_mutex};

      ++_published;
      if (_history_size > 0) {
        if (_history.size() == _history_size) {
          _history.pop_front();
        }
        _history.push_back(event);
      }

      EventType type = event.type();
      for (auto& [id, sub] : _subscriptions) {
        if (!sub.type.has_value() || sub.type.value() == type) {
          handlers.push_back(sub.handler);
        }
      }
    }

    // Handlers run outside the lock so they may publish or subscribe themselves.
    for (auto& handler : handlers) {
      try {
        handler(event);
      } catch (std::exception& exc) {
        _logger->error("Event handler for {} failed: {}", to_string(event.type()), exc.what());
      }
    }
  }

  int EventBus::subscribe(handler_t handler, std::optional<EventType> type)
  {
    std::lock_guard<std::mutex> lock{_mutex};
    int id = _next_id++;
    _subscriptions.emplace(id, Subscription{type, std::move(handler)});
    SPDLOG_LOGGER_DEBUG(_logger, "Added subscription {}", id);
    return id;
  }

  bool EventBus::unsubscribe(int id)
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _subscriptions.erase(id) > 0;
  }

  std::deque<Event> EventBus::history() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _history;
  }

  size_t EventBus::published() const
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _published;
  }

} // namespace squad::common::events
