#ifndef SQUAD_ORCHESTRATOR_ORCHESTRATOR_HPP
#define SQUAD_ORCHESTRATOR_ORCHESTRATOR_HPP

#include <squad/common/credentials.hpp>
#include <squad/common/events.hpp>
#include <squad/common/uuid.hpp>
#include <squad/orchestrator/args.hpp>
#include <squad/orchestrator/config.hpp>
#include <squad/orchestrator/process.hpp>
#include <squad/orchestrator/process_pool.hpp>
#include <squad/orchestrator/stream_parser.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace squad::orchestrator {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Supervises worker processes.
  ///
  /// One background thread drains the output of all children through epoll and
  /// reaps them; public operations only issue OS calls and never wait for a child,
  /// except for wait_for_process.
  ////////////////////////////////////////////////////////////////////////////////
  class Orchestrator {
  public:
    static constexpr int EPOLL_TIMEOUT = 50;
    static constexpr int MAX_EPOLL_EVENTS = 32;
    static constexpr size_t READ_BUFFER_SIZE = 8192;

    Orchestrator(
        const config::Orchestrator& cfg, common::events::EventSink* events = nullptr,
        common::credentials::CredentialStore* credentials = nullptr
    );
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Launches a worker in the given working directory.
    ///
    /// @param[in] options agent, task and invocation settings
    /// Blocks while max-concurrent workers are running; the slot is returned
    /// when the worker exits.
    ///
    /// @return snapshot of the new record, in state starting or working
    /// @throws common::SpawnError when the binary or the directory is invalid,
    /// or when shutdown rejects a spawn waiting for a slot
    ////////////////////////////////////////////////////////////////////////////////
    process::ProcessInfo spawn(const SpawnOptions& options);

    std::optional<process::ProcessInfo> get_process(const std::string& id) const;
    std::vector<process::ProcessInfo> get_all_processes() const;
    std::vector<process::ProcessInfo> get_processes_by_agent(const std::string& agent_id) const;
    std::vector<process::ProcessInfo> get_active_processes() const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Writes a line to the standard input of a working or waiting process.
    /// A trailing newline is added when missing.
    ///
    /// @return false for unknown ids, processes in other states, or a closed input
    ////////////////////////////////////////////////////////////////////////////////
    bool send_input(const std::string& id, const std::string& text);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Sends a termination signal. The record becomes killed as soon as the
    /// signal is accepted; children that ignore it receive SIGKILL after the grace
    /// period.
    ///
    /// @return false for unknown ids and processes that are already terminal
    ////////////////////////////////////////////////////////////////////////////////
    bool kill(const std::string& id, int signal = SIGTERM);

    bool pause(const std::string& id);
    bool resume(const std::string& id);

    // Returns std::nullopt for unknown ids or when the timeout elapses.
    std::optional<process::ProcessInfo> wait_for_process(
        const std::string& id, std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Waits until the child has exited and been reaped. A killed or failed
    /// process turns terminal before that; once this returns, the exit code is set
    /// and the output log is closed.
    ///
    /// @return std::nullopt for unknown ids or when the timeout elapses
    ////////////////////////////////////////////////////////////////////////////////
    std::optional<process::ProcessInfo> wait_for_exit(
        const std::string& id, std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    std::optional<std::string> get_session_id(const std::string& id) const;
    double get_total_cost(const std::string& id) const;

    // Refuses to remove records of processes that are still active.
    bool remove_process(const std::string& id);
    int clear_completed();

    std::optional<int> subscribe(
        const std::string& id, OutputLog::callback_t callback,
        OutputLog::completion_t on_complete = nullptr
    );

    // Changes the number of workers allowed to run at once.
    void set_max_concurrent(int max_concurrent);
    ProcessPoolStats get_pool_stats() const;

    // Rejects queued spawns, kills remaining children and stops the drain thread.
    void shutdown();

  private:
    using lock_t = std::shared_mutex;
    using write_lock_t = std::unique_lock<lock_t>;
    using read_lock_t = std::shared_lock<lock_t>;

    struct Tracked;

    struct Channel {
      Tracked* owner;
      OutputStream stream;
      LineSplitter lines;
      bool open = true;
    };

    struct Tracked {
      process::ProcessPtr proc;
      Channel out;
      Channel err;
    };

    process::ProcessPtr _find(const std::string& id) const;

    std::vector<std::string> _environment(const AgentDescriptor& agent);

    template <typename Pred>
    std::vector<process::ProcessInfo> _collect(Pred&& pred) const;

    void _poll();
    void _wakeup();
    void _accept_pending();
    void _read(Channel& channel);
    void _close(Channel& channel);
    void _line(Tracked& tracked, OutputStream stream, const std::string& line);
    void _append(Tracked& tracked, OutputChunk&& chunk);
    void _io_failure(Tracked& tracked, const std::string& message);
    void _reap(bool block);
    void _finalize(Tracked& tracked, int exit_code);

    void _publish(common::events::Payload&& payload);

    config::Orchestrator _config;
    common::events::EventSink* _events;
    common::credentials::CredentialStore* _credentials;
    common::UUID _uuid;
    ProcessPool _pool;

    // We need to be able to iterate across all processes.
    // Thus, we apply a read lock over the collection instead of using a concurrent map.
    mutable lock_t _registry_mutex;
    std::unordered_map<std::string, process::ProcessPtr> _processes;

    std::mutex _pending_mutex;
    std::deque<process::ProcessPtr> _pending;

    // Owned by the drain thread.
    std::unordered_map<std::string, std::unique_ptr<Tracked>> _tracked;

    int _epoll_fd = -1;
    int _event_fd = -1;
    std::atomic<bool> _ending{false};
    std::thread _poller;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace squad::orchestrator

#endif
