#ifndef SQUAD_COMMON_SUBPROCESS_HPP
#define SQUAD_COMMON_SUBPROCESS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace squad::common {

  struct CommandResult {
    int exit_code;
    std::string out;
    std::string err;

    bool success() const
    {
      return exit_code == 0;
    }
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Handle of a single child process with all three standard streams piped.
  ///
  /// Output descriptors are non-blocking; the owner is expected to drain them.
  /// The handle does not synchronize access: callers serialize signal/try_wait
  /// and the threads reading output.
  ////////////////////////////////////////////////////////////////////////////////
  class Subprocess {
  public:
    static constexpr int EXEC_FAILURE_CODE = 127;
    static constexpr int SIGNAL_EXIT_BASE = 128;

    Subprocess() = default;
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    Subprocess(Subprocess&& obj) noexcept;
    Subprocess& operator=(Subprocess&& obj) noexcept;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Launches the process. Failures before the new image starts running
    /// (missing binary, invalid working directory, exec failure) are reported
    /// synchronously.
    ///
    /// @param[in] argv program and its arguments; the program is resolved in PATH
    /// @param[in] cwd working directory; empty string keeps the current one
    /// @param[in] env complete environment of the child; inherits ours when empty
    /// @throws SpawnError
    ////////////////////////////////////////////////////////////////////////////////
    static Subprocess spawn(
        const std::vector<std::string>& argv, const std::string& cwd,
        const std::optional<std::vector<std::string>>& env = std::nullopt
    );

    pid_t pid() const;

    int stdout_fd() const;
    int stderr_fd() const;

    // Returns false when the child no longer accepts input.
    bool write_input(std::string_view data);
    void close_input();

    void close_stdout();
    void close_stderr();

    // Returns false if the signal could not be delivered or the child was reaped.
    bool signal(int signum);

    // Non-blocking reap. Signalled children report 128 + signal number.
    std::optional<int> try_wait();
    int wait();

    bool reaped() const;

    static std::optional<std::string> find_executable(const std::string& name);

  private:
    Subprocess(pid_t pid, int in, int out, int err);

    void _close_all();

    pid_t _pid = -1;
    int _stdin = -1;
    int _stdout = -1;
    int _stderr = -1;
    bool _reaped = false;
    int _exit_code = -1;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Runs a short-lived command to completion and captures its output.
  ///
  /// @throws SpawnError when the command cannot be launched
  ////////////////////////////////////////////////////////////////////////////////
  CommandResult
  run_command(const std::vector<std::string>& argv, const std::optional<std::string>& cwd = {});

  std::vector<std::string> current_environment();

} // namespace squad::common

#endif
