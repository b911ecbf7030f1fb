#include <squad/common/subprocess.hpp>

#include <squad/common/exceptions.hpp>
#include <squad/common/util.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace squad::common {

  namespace {

    struct Pipe {
      std::array<int, 2> fds{-1, -1};

      Pipe()
      {
        if (pipe2(fds.data(), O_CLOEXEC) == -1) {
          throw SpawnError{fmt::format("Could not create a pipe, reason: {}", strerror(errno))};
        }
      }

      ~Pipe()
      {
        close_read();
        close_write();
      }

      Pipe(const Pipe&) = delete;
      Pipe& operator=(const Pipe&) = delete;

      int read_end() const
      {
        return fds[0];
      }

      int write_end() const
      {
        return fds[1];
      }

      int release_read()
      {
        int fd = fds[0];
        fds[0] = -1;
        return fd;
      }

      int release_write()
      {
        int fd = fds[1];
        fds[1] = -1;
        return fd;
      }

      void close_read()
      {
        if (fds[0] != -1) {
          close(fds[0]);
          fds[0] = -1;
        }
      }

      void close_write()
      {
        if (fds[1] != -1) {
          close(fds[1]);
          fds[1] = -1;
        }
      }
    };

    // Runs in the forked child: only async-signal-safe calls are allowed.
    [[noreturn]] void child_failure(int status_fd)
    {
      int err = errno;
      [[maybe_unused]] ssize_t ret = write(status_fd, &err, sizeof(err));
      _exit(Subprocess::EXEC_FAILURE_CODE);
    }

    int decode_status(int status)
    {
      if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
      }
      if (WIFSIGNALED(status)) {
        return Subprocess::SIGNAL_EXIT_BASE + WTERMSIG(status);
      }
      return -1;
    }

    void set_nonblocking(int fd)
    {
      int flags = fcntl(fd, F_GETFL, 0);
      if (flags == -1 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        throw SpawnError{fmt::format("Could not configure pipe, reason: {}", strerror(errno))};
      }
    }

    void close_fd(int& fd)
    {
      if (fd != -1) {
        close(fd);
        fd = -1;
      }
    }

  } // namespace

  Subprocess::Subprocess(pid_t pid, int in, int out, int err)
      : _pid(pid), _stdin(in), _stdout(out), _stderr(err)
  {
  }

  Subprocess::~Subprocess()
  {
    _close_all();
  }

  Subprocess::Subprocess(Subprocess&& obj) noexcept
      : _pid(obj._pid), _stdin(obj._stdin), _stdout(obj._stdout), _stderr(obj._stderr),
        _reaped(obj._reaped), _exit_code(obj._exit_code)
  {
    obj._pid = -1;
    obj._stdin = obj._stdout = obj._stderr = -1;
  }

  Subprocess& Subprocess::operator=(Subprocess&& obj) noexcept
  {
    if (this != &obj) {
      _close_all();
      _pid = obj._pid;
      _stdin = obj._stdin;
      _stdout = obj._stdout;
      _stderr = obj._stderr;
      _reaped = obj._reaped;
      _exit_code = obj._exit_code;

      obj._pid = -1;
      obj._stdin = obj._stdout = obj._stderr = -1;
    }
    return *this;
  }

  void Subprocess::_close_all()
  {
    close_fd(_stdin);
    close_fd(_stdout);
    close_fd(_stderr);
  }

  Subprocess Subprocess::spawn(
      const std::vector<std::string>& argv, const std::string& cwd,
      const std::optional<std::vector<std::string>>& env
  )
  {
    if (argv.empty() || argv[0].empty()) {
      throw SpawnError{"Cannot launch a process without a program name"};
    }

    if (!cwd.empty()) {
      std::error_code ec;
      if (!std::filesystem::is_directory(cwd, ec)) {
        throw SpawnError{fmt::format("Working directory {} does not exist", cwd)};
      }
    }

    auto binary = find_executable(argv[0]);
    if (!binary) {
      throw SpawnError{fmt::format("Executable {} could not be found", argv[0])};
    }

    // Everything the child touches must be prepared before fork.
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
      args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    std::vector<char*> envp;
    if (env.has_value()) {
      envp.reserve(env->size() + 1);
      for (const auto& var : *env) {
        envp.push_back(const_cast<char*>(var.c_str()));
      }
      envp.push_back(nullptr);
    }

    Pipe input, output, error, status;

    pid_t pid = fork();
    if (pid < 0) {
      throw SpawnError{fmt::format("Fork failed, reason: {}", strerror(errno))};
    }

    if (pid == 0) {

      if (dup2(input.read_end(), STDIN_FILENO) == -1 ||
          dup2(output.write_end(), STDOUT_FILENO) == -1 ||
          dup2(error.write_end(), STDERR_FILENO) == -1) {
        child_failure(status.write_end());
      }

      // Dispositions set to ignore survive exec.
      ::signal(SIGPIPE, SIG_DFL);
      sigset_t mask;
      sigemptyset(&mask);
      sigprocmask(SIG_SETMASK, &mask, nullptr);

      if (!cwd.empty() && chdir(cwd.c_str()) == -1) {
        child_failure(status.write_end());
      }

      if (env.has_value()) {
        execve(binary->c_str(), args.data(), envp.data());
      } else {
        execv(binary->c_str(), args.data());
      }
      child_failure(status.write_end());
    }

    input.close_read();
    output.close_write();
    error.close_write();
    status.close_write();

    int child_errno = 0;
    ssize_t count = 0;
    do {
      count = read(status.read_end(), &child_errno, sizeof(child_errno));
    } while (count == -1 && errno == EINTR);

    if (count == sizeof(child_errno)) {
      int wstatus = 0;
      while (waitpid(pid, &wstatus, 0) == -1 && errno == EINTR) {
      }
      throw SpawnError{
          fmt::format("Could not execute {}, reason: {}", argv[0], strerror(child_errno))};
    }

    set_nonblocking(output.read_end());
    set_nonblocking(error.read_end());

    spdlog::debug("Started process {} with PID {}", argv[0], pid);

    return Subprocess{pid, input.release_write(), output.release_read(), error.release_read()};
  }

  pid_t Subprocess::pid() const
  {
    return _pid;
  }

  int Subprocess::stdout_fd() const
  {
    return _stdout;
  }

  int Subprocess::stderr_fd() const
  {
    return _stderr;
  }

  bool Subprocess::write_input(std::string_view data)
  {
    if (_stdin == -1) {
      return false;
    }

    size_t written = 0;
    while (written < data.size()) {
      ssize_t ret = write(_stdin, data.data() + written, data.size() - written);
      if (ret == -1) {
        if (errno == EINTR) {
          continue;
        }
        spdlog::debug("Writing input to PID {} failed, reason: {}", _pid, strerror(errno));
        return false;
      }
      written += static_cast<size_t>(ret);
    }
    return true;
  }

  void Subprocess::close_input()
  {
    close_fd(_stdin);
  }

  void Subprocess::close_stdout()
  {
    close_fd(_stdout);
  }

  void Subprocess::close_stderr()
  {
    close_fd(_stderr);
  }

  bool Subprocess::signal(int signum)
  {
    if (_pid <= 0 || _reaped) {
      return false;
    }
    if (kill(_pid, signum) == -1) {
      spdlog::debug("Sending signal {} to PID {} failed, reason: {}", signum, _pid, strerror(errno));
      return false;
    }
    return true;
  }

  std::optional<int> Subprocess::try_wait()
  {
    if (_reaped) {
      return _exit_code;
    }
    if (_pid <= 0) {
      return std::nullopt;
    }

    int status = 0;
    pid_t ret = waitpid(_pid, &status, WNOHANG);
    if (ret == 0) {
      return std::nullopt;
    }
    if (ret == -1) {
      if (errno == ECHILD) {
        spdlog::warn("Process {} was reaped by someone else", _pid);
        _reaped = true;
        _exit_code = -1;
        return _exit_code;
      }
      return std::nullopt;
    }

    _reaped = true;
    _exit_code = decode_status(status);
    return _exit_code;
  }

  int Subprocess::wait()
  {
    if (_reaped || _pid <= 0) {
      return _exit_code;
    }

    int status = 0;
    pid_t ret = 0;
    do {
      ret = waitpid(_pid, &status, 0);
    } while (ret == -1 && errno == EINTR);

    _reaped = true;
    _exit_code = ret == -1 ? -1 : decode_status(status);
    return _exit_code;
  }

  bool Subprocess::reaped() const
  {
    return _reaped;
  }

  std::optional<std::string> Subprocess::find_executable(const std::string& name)
  {
    if (name.find('/') != std::string::npos) {
      if (access(name.c_str(), X_OK) == 0) {
        return name;
      }
      return std::nullopt;
    }

    const char* path_env = getenv("PATH");
    std::stringstream paths{path_env ? path_env : "/usr/local/bin:/usr/bin:/bin"};
    std::string dir;
    while (std::getline(paths, dir, ':')) {
      if (dir.empty()) {
        dir = ".";
      }
      std::filesystem::path candidate = std::filesystem::path{dir} / name;
      std::error_code ec;
      if (std::filesystem::is_regular_file(candidate, ec) &&
          access(candidate.c_str(), X_OK) == 0) {
        return candidate.string();
      }
    }
    return std::nullopt;
  }

  CommandResult run_command(const std::vector<std::string>& argv, const std::optional<std::string>& cwd)
  {
    Subprocess proc = Subprocess::spawn(argv, cwd.value_or(""));
    proc.close_input();

    CommandResult result{0, "", ""};
    std::array<pollfd, 2> fds{
        pollfd{proc.stdout_fd(), POLLIN, 0}, pollfd{proc.stderr_fd(), POLLIN, 0}};
    std::array<std::string*, 2> targets{&result.out, &result.err};
    std::array<char, 4096> buffer{};

    int open_streams = 2;
    while (open_streams > 0) {

      int ret = poll(fds.data(), fds.size(), -1);
      if (ret == -1) {
        if (errno == EINTR) {
          continue;
        }
        spdlog::error("Polling output of {} failed, reason: {}", argv[0], strerror(errno));
        break;
      }

      for (size_t i = 0; i < fds.size(); ++i) {

        if (fds[i].fd == -1 || fds[i].revents == 0) {
          continue;
        }

        ssize_t count = read(fds[i].fd, buffer.data(), buffer.size());
        if (count > 0) {
          targets[i]->append(buffer.data(), static_cast<size_t>(count));
        } else if (count == 0 || (errno != EAGAIN && errno != EINTR)) {
          fds[i].fd = -1;
          --open_streams;
        }
      }
    }

    proc.close_stdout();
    proc.close_stderr();
    result.exit_code = proc.wait();
    return result;
  }

  std::vector<std::string> current_environment()
  {
    std::vector<std::string> env;
    for (char** var = environ; var && *var; ++var) {
      env.emplace_back(*var);
    }
    return env;
  }

} // namespace squad::common
