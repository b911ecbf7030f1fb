#ifndef SQUAD_WORKSPACE_GIT_HPP
#define SQUAD_WORKSPACE_GIT_HPP

#include <squad/common/exceptions.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace squad::workspace::git {

  struct GitError : common::SquadException {

    GitError(std::string command, int exit_code, std::string stderr_output);

    std::string command;
    int exit_code;
    std::string stderr_output;
  };

  struct Worktree {
    std::string path;
    std::string head;
    std::optional<std::string> branch;
    bool bare = false;
    bool detached = false;
    bool locked = false;
    bool prunable = false;
  };

  struct FileStatus {
    std::string path;
    char index;
    char worktree;
  };

  struct Status {
    std::optional<std::string> branch;
    std::optional<std::string> upstream;
    int ahead = 0;
    int behind = 0;
    std::vector<FileStatus> files;

    bool clean() const
    {
      return files.empty();
    }
  };

  // Output of `git worktree list --porcelain`; branch names lose the refs/heads/ prefix.
  std::vector<Worktree> parse_worktree_list(std::string_view output);

  // Output of `git status --branch --porcelain=v2`.
  Status parse_status(std::string_view output);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Version-control operations on one repository and its worktrees.
  /// Failures of the underlying tool are reported as GitError.
  ////////////////////////////////////////////////////////////////////////////////
  class Git {
  public:
    virtual ~Git() = default;

    virtual const std::string& repository() const = 0;

    virtual bool is_repository() = 0;

    virtual std::vector<Worktree> list_worktrees() = 0;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Adds a worktree checked out at branch.
    ///
    /// @param[in] path new worktree location
    /// @param[in] branch branch to check out
    /// @param[in] base when set, branch is created from base
    ////////////////////////////////////////////////////////////////////////////////
    virtual void add_worktree(
        const std::string& path, const std::string& branch, const std::optional<std::string>& base
    ) = 0;

    virtual void remove_worktree(const std::string& path, bool force) = 0;
    virtual void prune_worktrees() = 0;

    virtual bool branch_exists(const std::string& branch) = 0;
    virtual void delete_branch(const std::string& branch, bool force) = 0;

    virtual Status status(const std::string& worktree) = 0;
    virtual bool has_changes(const std::string& worktree) = 0;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Commits the staged changes of a worktree.
    ///
    /// @param[in] stage_all stage every change, including untracked files, first
    /// @return hash of the new commit
    /// @throws common::CommitError when there is nothing to commit
    ////////////////////////////////////////////////////////////////////////////////
    virtual std::string
    commit(const std::string& worktree, const std::string& message, bool stage_all) = 0;

    // Number of commits on HEAD that are not on base.
    virtual int commits_ahead(const std::string& worktree, const std::string& base) = 0;

    virtual void
    push(const std::string& worktree, const std::string& remote, const std::string& branch) = 0;
  };

  class CommandLineGit : public Git {
  public:
    CommandLineGit(std::string repository, std::string binary = "git");

    const std::string& repository() const override;
    bool is_repository() override;
    std::vector<Worktree> list_worktrees() override;
    void add_worktree(
        const std::string& path, const std::string& branch, const std::optional<std::string>& base
    ) override;
    void remove_worktree(const std::string& path, bool force) override;
    void prune_worktrees() override;
    bool branch_exists(const std::string& branch) override;
    void delete_branch(const std::string& branch, bool force) override;
    Status status(const std::string& worktree) override;
    bool has_changes(const std::string& worktree) override;
    std::string
    commit(const std::string& worktree, const std::string& message, bool stage_all) override;
    int commits_ahead(const std::string& worktree, const std::string& base) override;
    void push(const std::string& worktree, const std::string& remote, const std::string& branch)
        override;

  private:
    struct Output {
      int exit_code;
      std::string out;
      std::string err;
    };

    Output _exec(const std::vector<std::string>& args, const std::string& cwd);

    // Throws GitError on a non-zero exit; returns stdout without the trailing newline.
    std::string _run(const std::vector<std::string>& args, const std::string& cwd);

    std::string _repository;
    std::string _binary;
    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace squad::workspace::git

#endif
