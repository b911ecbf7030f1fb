#include <squad/workspace/git.hpp>

#include <squad/common/subprocess.hpp>
#include <squad/common/util.hpp>

#include <charconv>
#include <filesystem>
#include <sstream>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace squad::workspace::git {

  namespace {

    constexpr std::string_view BRANCH_PREFIX = "refs/heads/";

    std::string trim_newlines(std::string value)
    {
      while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
      }
      return value;
    }

    int to_int(std::string_view value)
    {
      int result = 0;
      std::from_chars(value.data(), value.data() + value.size(), result);
      return result;
    }

    std::vector<std::string_view> split_lines(std::string_view output)
    {
      std::vector<std::string_view> lines;
      size_t pos = 0;
      while (pos <= output.size()) {
        size_t end = output.find('\n', pos);
        if (end == std::string_view::npos) {
          end = output.size();
        }
        lines.push_back(output.substr(pos, end - pos));
        pos = end + 1;
      }
      return lines;
    }

  } // namespace

  GitError::GitError(std::string command, int exit_code, std::string stderr_output)
      : common::SquadException(
            fmt::format("Git command '{}' failed with code {}: {}", command, exit_code, stderr_output)
        ),
        command(std::move(command)), exit_code(exit_code), stderr_output(std::move(stderr_output))
  {
  }

  std::vector<Worktree> parse_worktree_list(std::string_view output)
  {
    std::vector<Worktree> worktrees;
    std::optional<Worktree> current;

    for (auto line : split_lines(output)) {

      if (line.empty()) {
        if (current.has_value()) {
          worktrees.push_back(std::move(*current));
          current.reset();
        }
        continue;
      }

      if (line.starts_with("worktree ")) {
        if (current.has_value()) {
          worktrees.push_back(std::move(*current));
        }
        current = Worktree{};
        current->path = std::string{line.substr(9)};
        continue;
      }

      if (!current.has_value()) {
        continue;
      }

      if (line.starts_with("HEAD ")) {
        current->head = std::string{line.substr(5)};
      } else if (line.starts_with("branch ")) {
        auto branch = line.substr(7);
        if (branch.starts_with(BRANCH_PREFIX)) {
          branch.remove_prefix(BRANCH_PREFIX.size());
        }
        current->branch = std::string{branch};
      } else if (line == "bare") {
        current->bare = true;
      } else if (line == "detached") {
        current->detached = true;
      } else if (line.starts_with("locked")) {
        current->locked = true;
      } else if (line.starts_with("prunable")) {
        current->prunable = true;
      }
    }

    if (current.has_value()) {
      worktrees.push_back(std::move(*current));
    }
    return worktrees;
  }

  Status parse_status(std::string_view output)
  {
    Status status;

    for (auto line : split_lines(output)) {

      if (line.starts_with("# branch.head ")) {
        auto head = line.substr(14);
        if (head != "(detached)") {
          status.branch = std::string{head};
        }
      } else if (line.starts_with("# branch.upstream ")) {
        status.upstream = std::string{line.substr(18)};
      } else if (line.starts_with("# branch.ab ")) {
        // # branch.ab +<ahead> -<behind>
        std::istringstream stream{std::string{line.substr(12)}};
        std::string ahead, behind;
        stream >> ahead >> behind;
        if (ahead.size() > 1) {
          status.ahead = to_int(std::string_view{ahead}.substr(1));
        }
        if (behind.size() > 1) {
          status.behind = to_int(std::string_view{behind}.substr(1));
        }
      } else if (line.starts_with("1 ") || line.starts_with("2 ")) {
        // <type> <XY> <sub> <mH> <mI> <mW> <hH> <hI> [<X><score>] <path>[\t<orig>]
        int fields = line[0] == '1' ? 8 : 9;
        size_t pos = 0;
        for (int i = 0; i < fields && pos != std::string_view::npos; ++i) {
          pos = line.find(' ', pos + 1);
        }
        if (pos == std::string_view::npos || line.size() < 4) {
          continue;
        }
        auto path = line.substr(pos + 1);
        if (auto tab = path.find('\t'); tab != std::string_view::npos) {
          path = path.substr(0, tab);
        }
        status.files.push_back(FileStatus{std::string{path}, line[2], line[3]});
      } else if (line.starts_with("u ")) {
        auto pos = line.rfind(' ');
        status.files.push_back(FileStatus{std::string{line.substr(pos + 1)}, 'U', 'U'});
      } else if (line.starts_with("? ")) {
        status.files.push_back(FileStatus{std::string{line.substr(2)}, '?', '?'});
      }
    }

    return status;
  }

  CommandLineGit::CommandLineGit(std::string repository, std::string binary)
      : _repository(std::move(repository)), _binary(std::move(binary))
  {
    _logger = common::util::create_logger("Git");
  }

  const std::string& CommandLineGit::repository() const
  {
    return _repository;
  }

  CommandLineGit::Output
  CommandLineGit::_exec(const std::vector<std::string>& args, const std::string& cwd)
  {
    std::vector<std::string> argv{_binary};
    argv.insert(argv.end(), args.begin(), args.end());

    SPDLOG_LOGGER_DEBUG(_logger, "Running git {} in {}", fmt::join(args, " "), cwd);
    auto result = common::run_command(argv, cwd);
    return Output{result.exit_code, std::move(result.out), std::move(result.err)};
  }

  std::string CommandLineGit::_run(const std::vector<std::string>& args, const std::string& cwd)
  {
    auto result = _exec(args, cwd);
    if (result.exit_code != 0) {
      throw GitError{
          fmt::format("git {}", fmt::join(args, " ")), result.exit_code,
          trim_newlines(std::move(result.err))};
    }
    return trim_newlines(std::move(result.out));
  }

  bool CommandLineGit::is_repository()
  {
    std::error_code ec;
    if (!std::filesystem::is_directory(_repository, ec)) {
      return false;
    }
    return _exec({"rev-parse", "--git-dir"}, _repository).exit_code == 0;
  }

  std::vector<Worktree> CommandLineGit::list_worktrees()
  {
    return parse_worktree_list(_run({"worktree", "list", "--porcelain"}, _repository));
  }

  void CommandLineGit::add_worktree(
      const std::string& path, const std::string& branch, const std::optional<std::string>& base
  )
  {
    if (base.has_value()) {
      _run({"worktree", "add", "-b", branch, path, *base}, _repository);
    } else {
      _run({"worktree", "add", path, branch}, _repository);
    }
  }

  void CommandLineGit::remove_worktree(const std::string& path, bool force)
  {
    if (force) {
      _run({"worktree", "remove", "--force", path}, _repository);
    } else {
      _run({"worktree", "remove", path}, _repository);
    }
  }

  void CommandLineGit::prune_worktrees()
  {
    _run({"worktree", "prune"}, _repository);
  }

  bool CommandLineGit::branch_exists(const std::string& branch)
  {
    auto ref = std::string{BRANCH_PREFIX} + branch;
    return _exec({"rev-parse", "--verify", "--quiet", ref}, _repository).exit_code == 0;
  }

  void CommandLineGit::delete_branch(const std::string& branch, bool force)
  {
    _run({"branch", force ? "-D" : "-d", branch}, _repository);
  }

  Status CommandLineGit::status(const std::string& worktree)
  {
    return parse_status(_run({"status", "--branch", "--porcelain=v2"}, worktree));
  }

  bool CommandLineGit::has_changes(const std::string& worktree)
  {
    return !_run({"status", "--porcelain"}, worktree).empty();
  }

  std::string
  CommandLineGit::commit(const std::string& worktree, const std::string& message, bool stage_all)
  {
    if (stage_all) {
      _run({"add", "-A"}, worktree);
    }

    // Exit code 1 means there are staged differences.
    auto staged = _exec({"diff", "--cached", "--quiet"}, worktree);
    if (staged.exit_code == 0) {
      throw common::CommitError{fmt::format("Nothing to commit in {}", worktree)};
    }
    if (staged.exit_code != 1) {
      throw GitError{"git diff --cached --quiet", staged.exit_code, trim_newlines(staged.err)};
    }

    _run({"commit", "-m", message}, worktree);
    return _run({"rev-parse", "HEAD"}, worktree);
  }

  int CommandLineGit::commits_ahead(const std::string& worktree, const std::string& base)
  {
    return to_int(_run({"rev-list", "--count", base + "..HEAD"}, worktree));
  }

  void CommandLineGit::push(
      const std::string& worktree, const std::string& remote, const std::string& branch
  )
  {
    _run({"push", "-u", remote, branch}, worktree);
  }

} // namespace squad::workspace::git
