#include <squad/orchestrator/process.hpp>

#include <fmt/format.h>

namespace squad::orchestrator::process {

  std::string to_string(State state)
  {
    switch (state) {
    case State::STARTING:
      return "starting";
    case State::WORKING:
      return "working";
    case State::WAITING:
      return "waiting";
    case State::PAUSED:
      return "paused";
    case State::COMPLETED:
      return "completed";
    case State::ERROR:
      return "error";
    case State::KILLED:
      return "killed";
    }
    return "unknown";
  }

  bool is_terminal(State state)
  {
    return state == State::COMPLETED || state == State::ERROR || state == State::KILLED;
  }

  AgentProcess::AgentProcess(
      std::string id, std::string agent_id, std::string task, std::string working_directory,
      std::optional<std::string> session_id, common::Subprocess&& handle, size_t output_capacity
  )
      : _id(std::move(id)), _agent_id(std::move(agent_id)), _task(std::move(task)),
        _working_directory(std::move(working_directory)), _session_id(std::move(session_id)),
        _started_at(clock_type::now()), _pid(handle.pid()), _handle(std::move(handle)),
        _output(std::make_shared<OutputLog>(output_capacity))
  {
  }

  AgentProcess::lock_t AgentProcess::lock() const
  {
    return lock_t{_mutex};
  }

  const std::string& AgentProcess::id() const
  {
    return _id;
  }

  const std::string& AgentProcess::agent_id() const
  {
    return _agent_id;
  }

  State AgentProcess::state() const
  {
    return _state;
  }

  std::optional<std::string> AgentProcess::session_id() const
  {
    return _session_id;
  }

  double AgentProcess::total_cost() const
  {
    return _total_cost;
  }

  timestamp_t AgentProcess::started_at() const
  {
    return _started_at;
  }

  ProcessInfo AgentProcess::info() const
  {
    return ProcessInfo{
        _id,        _agent_id,  _session_id, _pid,           _state,
        _task,      _working_directory,      _started_at,    _ended_at,
        _exit_code, _total_cost,             _last_activity, _error,
        _output};
  }

  common::Subprocess& AgentProcess::handle()
  {
    return _handle;
  }

  OutputLog& AgentProcess::output()
  {
    return *_output;
  }

  bool AgentProcess::mark_working()
  {
    if (_state != State::STARTING) {
      return false;
    }
    _state = State::WORKING;
    return true;
  }

  bool AgentProcess::mark_waiting()
  {
    if (_state != State::WORKING) {
      return false;
    }
    _state = State::WAITING;
    return true;
  }

  bool AgentProcess::mark_input_received()
  {
    if (_state != State::WAITING) {
      return false;
    }
    _state = State::WORKING;
    return true;
  }

  bool AgentProcess::mark_paused()
  {
    if (_state == State::PAUSED || is_terminal(_state)) {
      return false;
    }
    _paused_from = _state;
    _state = State::PAUSED;
    return true;
  }

  bool AgentProcess::mark_resumed()
  {
    if (_state != State::PAUSED) {
      return false;
    }
    _state = _paused_from;
    return true;
  }

  void AgentProcess::mark_killed(timestamp_t when)
  {
    _state = State::KILLED;
    _ended_at = when;
    _kill_requested_at = when;
  }

  void AgentProcess::mark_failed(const std::string& message, timestamp_t when)
  {
    _state = State::ERROR;
    _ended_at = when;
    _error = message;
  }

  bool AgentProcess::finish(int exit_code, timestamp_t when)
  {
    _exit_code = exit_code;
    if (is_terminal(_state)) {
      return false;
    }

    _ended_at = when;
    if (exit_code == 0) {
      _state = State::COMPLETED;
    } else {
      _state = State::ERROR;
      _error = fmt::format("Process exited with code {}", exit_code);
    }
    return true;
  }

  void AgentProcess::touch(timestamp_t when)
  {
    _last_activity = when;
  }

  void AgentProcess::add_cost(double cost)
  {
    _total_cost += cost;
  }

  void AgentProcess::set_session_id(std::string session_id)
  {
    _session_id = std::move(session_id);
  }

  std::optional<timestamp_t> AgentProcess::kill_requested_at() const
  {
    return _kill_requested_at;
  }

  bool AgentProcess::escalated() const
  {
    return _escalated;
  }

  void AgentProcess::set_escalated()
  {
    _escalated = true;
  }

  bool AgentProcess::write_input(std::string_view data)
  {
    std::lock_guard<std::mutex> lock{_input_mutex};
    return _handle.write_input(data);
  }

  void AgentProcess::close_input()
  {
    std::lock_guard<std::mutex> lock{_input_mutex};
    _handle.close_input();
  }

  void AgentProcess::notify()
  {
    _cv.notify_all();
  }

  bool AgentProcess::wait_terminal(lock_t& lock, std::optional<std::chrono::milliseconds> timeout)
  {
    auto pred = [this]() { return is_terminal(_state); };
    if (timeout.has_value()) {
      return _cv.wait_for(lock, *timeout, pred);
    }
    _cv.wait(lock, pred);
    return true;
  }

  bool AgentProcess::wait_exited(lock_t& lock, std::optional<std::chrono::milliseconds> timeout)
  {
    auto pred = [this]() { return _exit_code.has_value(); };
    if (timeout.has_value()) {
      return _cv.wait_for(lock, *timeout, pred);
    }
    _cv.wait(lock, pred);
    return true;
  }

} // namespace squad::orchestrator::process
