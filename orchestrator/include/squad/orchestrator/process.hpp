#ifndef SQUAD_ORCHESTRATOR_PROCESS_HPP
#define SQUAD_ORCHESTRATOR_PROCESS_HPP

#include <squad/common/subprocess.hpp>
#include <squad/orchestrator/output.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace squad::orchestrator::process {

  enum class State { STARTING = 0, WORKING, WAITING, PAUSED, COMPLETED, ERROR, KILLED };

  std::string to_string(State state);

  bool is_terminal(State state);

  using clock_type = std::chrono::system_clock;
  using timestamp_t = clock_type::time_point;

  // Copy of a process record taken under its lock.
  struct ProcessInfo {
    std::string id;
    std::string agent_id;
    std::optional<std::string> session_id;
    int pid;
    State state;
    std::string task;
    std::string working_directory;
    timestamp_t started_at;
    std::optional<timestamp_t> ended_at;
    std::optional<int> exit_code;
    double total_cost;
    std::optional<timestamp_t> last_activity;
    std::optional<std::string> error;
    std::shared_ptr<OutputLog> output;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief One supervised worker invocation.
  ///
  /// All accessors and transitions require the lock returned by lock().
  /// Writes to the child's input are serialized separately with write_input,
  /// so a blocked write never stalls the reaper.
  ////////////////////////////////////////////////////////////////////////////////
  class AgentProcess {
  public:
    using lock_t = std::unique_lock<std::mutex>;

    AgentProcess(
        std::string id, std::string agent_id, std::string task, std::string working_directory,
        std::optional<std::string> session_id, common::Subprocess&& handle,
        size_t output_capacity
    );

    AgentProcess(const AgentProcess&) = delete;
    AgentProcess& operator=(const AgentProcess&) = delete;

    lock_t lock() const;

    const std::string& id() const;
    const std::string& agent_id() const;
    State state() const;
    std::optional<std::string> session_id() const;
    double total_cost() const;
    timestamp_t started_at() const;

    ProcessInfo info() const;

    common::Subprocess& handle();
    OutputLog& output();

    // STARTING -> WORKING; returns true when the state changed.
    bool mark_working();
    // WORKING -> WAITING
    bool mark_waiting();
    // WAITING -> WORKING
    bool mark_input_received();

    bool mark_paused();
    bool mark_resumed();

    void mark_killed(timestamp_t when);
    void mark_failed(const std::string& message, timestamp_t when);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Records the exit of the child. A process that is already terminal
    /// keeps its state and end time; only the exit code is filled in.
    ///
    /// @return true if the process reached a terminal state through this call
    ////////////////////////////////////////////////////////////////////////////////
    bool finish(int exit_code, timestamp_t when);

    void touch(timestamp_t when);
    void add_cost(double cost);
    void set_session_id(std::string session_id);

    std::optional<timestamp_t> kill_requested_at() const;
    bool escalated() const;
    void set_escalated();

    bool write_input(std::string_view data);
    void close_input();

    void notify();
    // Waits for a terminal state; returns false on timeout.
    bool wait_terminal(lock_t& lock, std::optional<std::chrono::milliseconds> timeout);
    // Waits until the child has been reaped; returns false on timeout.
    bool wait_exited(lock_t& lock, std::optional<std::chrono::milliseconds> timeout);

  private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::mutex _input_mutex;

    std::string _id;
    std::string _agent_id;
    std::string _task;
    std::string _working_directory;
    std::optional<std::string> _session_id;

    State _state = State::STARTING;
    State _paused_from = State::WORKING;
    timestamp_t _started_at;
    std::optional<timestamp_t> _ended_at;
    std::optional<int> _exit_code;
    double _total_cost = 0.0;
    std::optional<timestamp_t> _last_activity;
    std::optional<std::string> _error;

    std::optional<timestamp_t> _kill_requested_at;
    bool _escalated = false;

    int _pid;
    common::Subprocess _handle;
    std::shared_ptr<OutputLog> _output;
  };

  using ProcessPtr = std::shared_ptr<AgentProcess>;

} // namespace squad::orchestrator::process

#endif
