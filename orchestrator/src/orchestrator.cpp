#include <squad/orchestrator/orchestrator.hpp>

#include <squad/common/exceptions.hpp>
#include <squad/common/util.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <map>

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <fmt/format.h>

namespace squad::orchestrator {

  namespace {

    // This assumes that the pointer does NOT change after submitting to epoll.
    template <typename T>
    bool epoll_add(int epoll_fd, int fd, T* data, uint32_t epoll_events)
    {
      epoll_event event{};
      memset(&event, 0, sizeof(epoll_event));
      event.events = epoll_events;
      // NOLINTNEXTLINE
      event.data.ptr = reinterpret_cast<void*>(data);

      if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, fd, &event) == -1) {
        spdlog::error("Adding descriptor {} to epoll failed, reason: {}", fd, strerror(errno));
        return false;
      }
      return true;
    }

    int64_t duration_ms(process::timestamp_t begin, process::timestamp_t end)
    {
      return std::chrono::duration_cast<std::chrono::milliseconds>(end - begin).count();
    }

  } // namespace

  Orchestrator::Orchestrator(
      const config::Orchestrator& cfg, common::events::EventSink* events,
      common::credentials::CredentialStore* credentials
  )
      : _config(cfg), _events(events), _credentials(credentials),
        _pool(cfg.max_concurrent, cfg.queue_strategy)
  {
    _logger = common::util::create_logger("Orchestrator");

    if (_config.buffer_capacity <= 0) {
      throw common::InvalidConfigurationError{"Output buffer capacity must be positive"};
    }

    // Writes to a child that closed its input must surface as EPIPE, not kill us.
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);

    _epoll_fd = epoll_create1(EPOLL_CLOEXEC);
    if (_epoll_fd < 0) {
      throw common::SquadException{
          fmt::format("Incorrect epoll initialization! {}", strerror(errno))};
    }

    _event_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (_event_fd < 0 || !epoll_add(_epoll_fd, _event_fd, this, EPOLLIN)) {
      close(_epoll_fd);
      throw common::SquadException{
          fmt::format("Incorrect eventfd initialization! {}", strerror(errno))};
    }

    _poller = std::thread(&Orchestrator::_poll, this);
  }

  Orchestrator::~Orchestrator()
  {
    shutdown();
    close(_event_fd);
    close(_epoll_fd);
  }

  process::ProcessInfo Orchestrator::spawn(const SpawnOptions& options)
  {
    if (_ending) {
      throw common::SpawnError{"Orchestrator is shutting down"};
    }
    if (options.working_directory.empty()) {
      throw common::SpawnError{"Working directory of the worker is not set"};
    }

    std::vector<std::string> argv{_config.binary};
    auto args = build_arguments(options, _config.default_model);
    argv.insert(argv.end(), args.begin(), args.end());

    try {
      _pool.acquire(options.priority);
    } catch (QueueClearedError& exc) {
      throw common::SpawnError{
          fmt::format("Spawn for agent {} was cancelled: {}", options.agent.id, exc.what())};
    }

    process::ProcessPtr proc;
    try {
      if (_ending) {
        throw common::SpawnError{"Orchestrator is shutting down"};
      }
      common::Subprocess handle =
          common::Subprocess::spawn(argv, options.working_directory, _environment(options.agent));

      proc = std::make_shared<process::AgentProcess>(
          _uuid.prefixed("proc"), options.agent.id, options.task, options.working_directory,
          options.resume_session, std::move(handle), static_cast<size_t>(_config.buffer_capacity)
      );
    } catch (std::exception&) {
      _pool.release();
      throw;
    }

    process::ProcessInfo info;
    {
      auto lock = proc->lock();
      info = proc->info();
    }

    {
      write_lock_t lock{_registry_mutex};
      _processes.emplace(info.id, proc);
    }

    _logger->info(
        "Spawned process {} for agent {} with PID {} in {}", info.id, info.agent_id, info.pid,
        info.working_directory
    );
    _publish(common::events::AgentStarted{info.id, info.agent_id, info.pid, info.working_directory}
    );

    {
      std::lock_guard<std::mutex> lock{_pending_mutex};
      _pending.push_back(std::move(proc));
    }
    _wakeup();

    return info;
  }

  std::vector<std::string> Orchestrator::_environment(const AgentDescriptor& agent)
  {
    std::map<std::string, std::string> vars;
    for (const auto& var : common::current_environment()) {
      auto pos = var.find('=');
      if (pos != std::string::npos) {
        vars[var.substr(0, pos)] = var.substr(pos + 1);
      }
    }

    for (const auto& [key, value] : agent.environment) {
      vars[key] = value;
    }
    vars["FORCE_COLOR"] = "0";
    vars["NO_COLOR"] = "1";

    if (_credentials) {
      auto token = _credentials->retrieve(_config.credential_service, _config.credential_account);
      if (token.has_value()) {
        vars[_config.token_variable] = *token;
      } else {
        SPDLOG_LOGGER_DEBUG(
            _logger, "No credential for {}/{}, the worker inherits the environment",
            _config.credential_service, _config.credential_account
        );
      }
    }

    std::vector<std::string> env;
    env.reserve(vars.size());
    for (const auto& [key, value] : vars) {
      env.push_back(key + "=" + value);
    }
    return env;
  }

  process::ProcessPtr Orchestrator::_find(const std::string& id) const
  {
    read_lock_t lock{_registry_mutex};
    auto it = _processes.find(id);
    return it != _processes.end() ? it->second : nullptr;
  }

  template <typename Pred>
  std::vector<process::ProcessInfo> Orchestrator::_collect(Pred&& pred) const
  {
    std::vector<process::ProcessInfo> result;
    read_lock_t lock{_registry_mutex};
    for (const auto& [id, proc] : _processes) {
      auto proc_lock = proc->lock();
      if (pred(*proc)) {
        result.push_back(proc->info());
      }
    }
    return result;
  }

  std::optional<process::ProcessInfo> Orchestrator::get_process(const std::string& id) const
  {
    auto proc = _find(id);
    if (!proc) {
      return std::nullopt;
    }
    auto lock = proc->lock();
    return proc->info();
  }

  std::vector<process::ProcessInfo> Orchestrator::get_all_processes() const
  {
    return _collect([](const process::AgentProcess&) { return true; });
  }

  std::vector<process::ProcessInfo>
  Orchestrator::get_processes_by_agent(const std::string& agent_id) const
  {
    return _collect([&agent_id](const process::AgentProcess& proc) {
      return proc.agent_id() == agent_id;
    });
  }

  std::vector<process::ProcessInfo> Orchestrator::get_active_processes() const
  {
    return _collect([](const process::AgentProcess& proc) {
      return !process::is_terminal(proc.state());
    });
  }

  bool Orchestrator::send_input(const std::string& id, const std::string& text)
  {
    auto proc = _find(id);
    if (!proc) {
      return false;
    }

    {
      auto lock = proc->lock();
      auto state = proc->state();
      if (state != process::State::WORKING && state != process::State::WAITING) {
        return false;
      }
    }

    std::string line = text;
    if (line.empty() || line.back() != '\n') {
      line.push_back('\n');
    }
    if (!proc->write_input(line)) {
      _logger->warn("Process {} does not accept input anymore", id);
      return false;
    }

    auto lock = proc->lock();
    proc->mark_input_received();
    proc->touch(process::clock_type::now());
    return true;
  }

  bool Orchestrator::kill(const std::string& id, int signal)
  {
    auto proc = _find(id);
    if (!proc) {
      return false;
    }

    {
      auto lock = proc->lock();
      if (process::is_terminal(proc->state())) {
        return false;
      }

      bool was_paused = proc->state() == process::State::PAUSED;
      if (!proc->handle().signal(signal)) {
        return false;
      }
      // A stopped child would not act on the signal.
      if (was_paused && signal != SIGKILL) {
        proc->handle().signal(SIGCONT);
      }

      proc->mark_killed(process::clock_type::now());
      proc->notify();
    }

    _logger->info("Sent signal {} to process {}", signal, id);
    proc->output().append(make_chunk(
        OutputStream::SYSTEM, ChunkKind::SYSTEM,
        fmt::format("Process terminated by user (signal {})", signal)
    ));
    return true;
  }

  bool Orchestrator::pause(const std::string& id)
  {
    auto proc = _find(id);
    if (!proc) {
      return false;
    }

    std::string agent_id;
    {
      auto lock = proc->lock();
      if (process::is_terminal(proc->state()) || proc->state() == process::State::PAUSED) {
        return false;
      }
      if (!proc->handle().signal(SIGSTOP)) {
        return false;
      }
      proc->mark_paused();
      agent_id = proc->agent_id();
    }

    SPDLOG_LOGGER_DEBUG(_logger, "Paused process {}", id);
    _publish(common::events::AgentPaused{id, agent_id});
    return true;
  }

  bool Orchestrator::resume(const std::string& id)
  {
    auto proc = _find(id);
    if (!proc) {
      return false;
    }

    std::string agent_id;
    {
      auto lock = proc->lock();
      if (proc->state() != process::State::PAUSED) {
        return false;
      }
      if (!proc->handle().signal(SIGCONT)) {
        return false;
      }
      proc->mark_resumed();
      agent_id = proc->agent_id();
    }

    SPDLOG_LOGGER_DEBUG(_logger, "Resumed process {}", id);
    _publish(common::events::AgentResumed{id, agent_id});
    return true;
  }

  std::optional<process::ProcessInfo> Orchestrator::wait_for_process(
      const std::string& id, std::optional<std::chrono::milliseconds> timeout
  )
  {
    auto proc = _find(id);
    if (!proc) {
      return std::nullopt;
    }

    auto lock = proc->lock();
    if (!proc->wait_terminal(lock, timeout)) {
      return std::nullopt;
    }
    return proc->info();
  }

  std::optional<process::ProcessInfo> Orchestrator::wait_for_exit(
      const std::string& id, std::optional<std::chrono::milliseconds> timeout
  )
  {
    auto proc = _find(id);
    if (!proc) {
      return std::nullopt;
    }

    auto lock = proc->lock();
    if (!proc->wait_exited(lock, timeout)) {
      return std::nullopt;
    }
    return proc->info();
  }

    std::optional<std::string> Orchestrator::get_session_id(const std::string& id) const
  {
    auto proc = _find(id);
    if (!proc) {
      return std::nullopt;
    }
    auto lock = proc->lock();
    return proc->session_id();
  }

  double Orchestrator::get_total_cost(const std::string& id) const
  {
    auto proc = _find(id);
    if (!proc) {
      return 0.0;
    }
    auto lock = proc->lock();
    return proc->total_cost();
  }

  bool Orchestrator::remove_process(const std::string& id)
  {
    write_lock_t lock{_registry_mutex};
    auto it = _processes.find(id);
    if (it == _processes.end()) {
      return false;
    }

    {
      auto proc_lock = it->second->lock();
      if (!process::is_terminal(it->second->state())) {
        return false;
      }
    }

    _processes.erase(it);
    return true;
  }

  int Orchestrator::clear_completed()
  {
    write_lock_t lock{_registry_mutex};

    int removed = 0;
    for (auto it = _processes.begin(); it != _processes.end();) {

      bool terminal = false;
      {
        auto proc_lock = it->second->lock();
        terminal = process::is_terminal(it->second->state());
      }

      if (terminal) {
        it = _processes.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }

    SPDLOG_LOGGER_DEBUG(_logger, "Removed {} finished processes", removed);
    return removed;
  }

  std::optional<int> Orchestrator::subscribe(
      const std::string& id, OutputLog::callback_t callback, OutputLog::completion_t on_complete
  )
  {
    auto proc = _find(id);
    if (!proc) {
      return std::nullopt;
    }
    return proc->output().subscribe(std::move(callback), std::move(on_complete));
  }

  void Orchestrator::shutdown()
  {
    if (_ending.exchange(true)) {
      return;
    }
    _pool.clear_queue();

    _wakeup();
    if (_poller.joinable()) {
      _poller.join();
    }

    // The drain thread is gone; finish the remaining children here.
    _accept_pending();
    for (auto& [id, tracked] : _tracked) {
      auto lock = tracked->proc->lock();
      if (!tracked->proc->handle().reaped()) {
        tracked->proc->handle().signal(SIGKILL);
        if (!process::is_terminal(tracked->proc->state())) {
          tracked->proc->mark_killed(process::clock_type::now());
        }
      }
    }
    _reap(true);

    _logger->info("Orchestrator stopped");
  }

  void Orchestrator::set_max_concurrent(int max_concurrent)
  {
    _pool.set_limit(max_concurrent);
  }

  ProcessPoolStats Orchestrator::get_pool_stats() const
  {
    return _pool.get_stats();
  }

  void Orchestrator::_wakeup()
  {
    uint64_t tmp = 1;
    if (write(_event_fd, &tmp, sizeof(tmp)) == -1 && errno != EAGAIN) {
      _logger->error("Could not wake up the drain thread, reason: {}", strerror(errno));
    }
  }

  void Orchestrator::_publish(common::events::Payload&& payload)
  {
    if (_events) {
      _events->publish(common::events::make_event(std::move(payload)));
    }
  }

  void Orchestrator::_poll()
  {
    std::array<epoll_event, MAX_EPOLL_EVENTS> events{};

    while (!_ending) {

      int events_count = epoll_wait(_epoll_fd, events.data(), MAX_EPOLL_EVENTS, EPOLL_TIMEOUT);

      if (_ending) {
        break;
      }
      if (events_count == -1) {
        if (errno == EINTR) {
          continue;
        }
        _logger->error("Polling failed, reason: {}", strerror(errno));
        break;
      }

      for (int i = 0; i < events_count; ++i) {

        // Wake-up signal
        if (events[i].data.ptr == this) {

          uint64_t read_val;
          if (read(_event_fd, &read_val, sizeof(read_val)) == -1 && errno != EAGAIN) {
            _logger->error("Reading from eventfd failed, reason: {}", strerror(errno));
          }
          _accept_pending();

        } else {
          _read(*static_cast<Channel*>(events[i].data.ptr));
        }
      }

      _reap(false);
    }
  }

  void Orchestrator::_accept_pending()
  {
    std::deque<process::ProcessPtr> pending;
    {
      std::lock_guard<std::mutex> lock{_pending_mutex};
      pending.swap(_pending);
    }

    for (auto& proc : pending) {

      auto tracked = std::make_unique<Tracked>();
      tracked->proc = std::move(proc);
      tracked->out.owner = tracked.get();
      tracked->out.stream = OutputStream::STDOUT;
      tracked->err.owner = tracked.get();
      tracked->err.stream = OutputStream::STDERR;

      auto& handle = tracked->proc->handle();
      if (!epoll_add(_epoll_fd, handle.stdout_fd(), &tracked->out, EPOLLIN) ||
          !epoll_add(_epoll_fd, handle.stderr_fd(), &tracked->err, EPOLLIN)) {
        _io_failure(*tracked, "Could not monitor the output of the process");
      }

      std::string id = tracked->proc->id();
      _tracked.emplace(std::move(id), std::move(tracked));
    }
  }

  void Orchestrator::_read(Channel& channel)
  {
    if (!channel.open) {
      return;
    }

    Tracked& tracked = *channel.owner;
    auto& handle = tracked.proc->handle();
    int fd = channel.stream == OutputStream::STDOUT ? handle.stdout_fd() : handle.stderr_fd();

    std::array<char, READ_BUFFER_SIZE> buffer{};
    while (true) {

      ssize_t count = read(fd, buffer.data(), buffer.size());
      if (count > 0) {
        for (auto& line : channel.lines.feed({buffer.data(), static_cast<size_t>(count)})) {
          _line(tracked, channel.stream, line);
        }
        continue;
      }

      if (count == 0) {
        _close(channel);
      } else if (errno == EINTR) {
        continue;
      } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
        _io_failure(
            tracked, fmt::format(
                         "Reading {} of the process failed: {}", to_string(channel.stream),
                         strerror(errno)
                     )
        );
        _close(channel);
      }
      break;
    }
  }

  void Orchestrator::_close(Channel& channel)
  {
    if (!channel.open) {
      return;
    }
    channel.open = false;

    Tracked& tracked = *channel.owner;
    if (auto rest = channel.lines.flush(); rest.has_value()) {
      _line(tracked, channel.stream, *rest);
    }

    auto& handle = tracked.proc->handle();
    int fd = channel.stream == OutputStream::STDOUT ? handle.stdout_fd() : handle.stderr_fd();
    if (fd != -1) {
      epoll_ctl(_epoll_fd, EPOLL_CTL_DEL, fd, nullptr);
    }

    if (channel.stream == OutputStream::STDOUT) {
      handle.close_stdout();
    } else {
      handle.close_stderr();
    }
  }

  void Orchestrator::_line(Tracked& tracked, OutputStream stream, const std::string& line)
  {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      return;
    }

    auto& proc = *tracked.proc;
    auto now = process::clock_type::now();

    std::optional<StreamMessage> msg;
    if (stream == OutputStream::STDOUT) {
      msg = parse_stream_line(line);
    }

    {
      auto lock = proc.lock();
      proc.touch(now);

      if (stream == OutputStream::STDOUT) {
        proc.mark_working();
      }

      if (msg.has_value()) {
        if (msg->session_id.has_value() && proc.session_id() != msg->session_id) {
          proc.set_session_id(*msg->session_id);
        }
        if (msg->cost_usd.has_value()) {
          proc.add_cost(*msg->cost_usd);
        }
        if (is_input_request(*msg)) {
          proc.mark_waiting();
        }
      }
    }

    if (stream == OutputStream::STDERR) {
      _append(tracked, make_chunk(OutputStream::STDERR, ChunkKind::ERROR, line));
    } else if (msg.has_value()) {
      _append(tracked, to_chunk(*msg, line));
    } else {
      _append(tracked, make_chunk(OutputStream::STDOUT, ChunkKind::RAW, line));
    }
  }

  void Orchestrator::_append(Tracked& tracked, OutputChunk&& chunk)
  {
    common::events::AgentOutput event{
        tracked.proc->id(), tracked.proc->agent_id(), to_string(chunk.stream), chunk.content};

    tracked.proc->output().append(std::move(chunk));
    _publish(std::move(event));
  }

  void Orchestrator::_io_failure(Tracked& tracked, const std::string& message)
  {
    auto& proc = *tracked.proc;
    bool failed = false;
    {
      auto lock = proc.lock();
      if (!process::is_terminal(proc.state())) {
        proc.mark_failed(message, process::clock_type::now());
        // Output can no longer be observed; the child is stopped and reaped later.
        proc.handle().signal(SIGKILL);
        proc.notify();
        failed = true;
      }
    }

    _logger->error("Process {} failed: {}", proc.id(), message);
    if (failed) {
      _publish(common::events::AgentError{proc.id(), proc.agent_id(), message, std::nullopt});
    }
  }

  void Orchestrator::_reap(bool block)
  {
    auto now = process::clock_type::now();
    auto grace = std::chrono::milliseconds{_config.kill_grace_period};

    for (auto it = _tracked.begin(); it != _tracked.end();) {

      Tracked& tracked = *it->second;
      auto& proc = *tracked.proc;

      std::optional<int> exit_code;
      {
        auto lock = proc.lock();
        if (block) {
          exit_code = proc.handle().wait();
        } else {
          exit_code = proc.handle().try_wait();
        }

        if (!exit_code.has_value()) {
          auto requested = proc.kill_requested_at();
          if (requested.has_value() && !proc.escalated() && now - *requested >= grace) {
            _logger->warn("Process {} ignored the termination request, sending SIGKILL", proc.id());
            proc.handle().signal(SIGKILL);
            proc.set_escalated();
          }
        }
      }

      if (!exit_code.has_value()) {
        ++it;
        continue;
      }

      // Everything the child wrote is still in the pipes.
      _read(tracked.out);
      _read(tracked.err);
      _close(tracked.out);
      _close(tracked.err);

      _finalize(tracked, *exit_code);
      it = _tracked.erase(it);
    }
  }

  void Orchestrator::_finalize(Tracked& tracked, int exit_code)
  {
    auto& proc = *tracked.proc;
    proc.close_input();

    std::string message;
    if (exit_code == 0) {
      message = "Process completed successfully";
    } else if (exit_code > common::Subprocess::SIGNAL_EXIT_BASE) {
      message = fmt::format(
          "Process terminated by signal {}", exit_code - common::Subprocess::SIGNAL_EXIT_BASE
      );
    } else {
      message = fmt::format("Process exited with code {}", exit_code);
    }
    proc.output().append(make_chunk(OutputStream::SYSTEM, ChunkKind::SYSTEM, message));
    proc.output().close();

    auto now = process::clock_type::now();
    bool changed = false;
    process::ProcessInfo info;
    {
      auto lock = proc.lock();
      changed = proc.finish(exit_code, now);
      info = proc.info();
      proc.notify();
    }

    _pool.release();
    _logger->info("Process {} finished: {}, state {}", info.id, message, to_string(info.state));

    int64_t duration = duration_ms(info.started_at, info.ended_at.value_or(now));
    if (info.state == process::State::COMPLETED || info.state == process::State::KILLED) {
      _publish(common::events::AgentCompleted{
          info.id, info.agent_id, exit_code, info.state == process::State::KILLED,
          info.total_cost, duration});
    } else if (changed) {
      _publish(common::events::AgentError{
          info.id, info.agent_id, info.error.value_or(message), exit_code});
    }
  }

} // namespace squad::orchestrator
