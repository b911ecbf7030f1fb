#ifndef SQUAD_WORKSPACE_COORDINATOR_HPP
#define SQUAD_WORKSPACE_COORDINATOR_HPP

#include <squad/common/events.hpp>
#include <squad/common/exceptions.hpp>
#include <squad/workspace/config.hpp>
#include <squad/workspace/git.hpp>
#include <squad/workspace/pull_request.hpp>
#include <squad/workspace/worktree_pool.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include <BS_thread_pool.hpp>
#include <spdlog/spdlog.h>

namespace squad::workspace {

  struct Feature {
    std::string id;
    std::string name;
    std::string description;
    std::string branch;
  };

  // One feature branch checked out in every configured repository.
  struct MultiRepoWorktree {
    std::string feature_branch;
    std::string feature_id;
    std::optional<std::string> agent_id;
    // Keyed by repository name.
    std::map<std::string, Allocation> worktrees;
    timestamp_t created_at;
  };

  struct RepoCommitResult {
    std::string repository;
    std::string branch;
    std::optional<std::string> commit;
    std::optional<common::CommitError> error;

    bool success() const
    {
      return commit.has_value();
    }
  };

  struct RepoStatus {
    std::string repository;
    std::string branch;
    std::string path;
    bool clean = true;
    int ahead = 0;
    int behind = 0;
    std::vector<git::FileStatus> files;
    std::optional<std::string> error;
  };

  struct PullRequestResults {
    std::vector<PullRequest> pull_requests;
    // Repository name to failure description.
    std::map<std::string, std::string> failures;
  };

  struct CoordinatorStats {
    size_t total_repos = 0;
    size_t active_features = 0;
    size_t active_worktrees = 0;
    std::map<std::string, size_t> by_repo;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Treats one branch across the primary repository and its dependencies
  /// as a single unit.
  ///
  /// Allocation is all-or-none: allocations made by a failed call are released
  /// in reverse order. Commits and pull requests are fanned out to a thread pool
  /// and report failures per repository.
  /// Every mutating operation throws common::NotInitializedError until
  /// initialize_workspace succeeds; get_* queries return empty results instead.
  ////////////////////////////////////////////////////////////////////////////////
  class Coordinator {
  public:
    using git_factory_t = std::function<std::shared_ptr<git::Git>(const config::Repository&)>;

    Coordinator(
        const config::WorktreePool& cfg, git_factory_t git_factory,
        PullRequestProvider* pull_requests = nullptr,
        common::events::EventSink* events = nullptr, WorktreePool::now_t now = nullptr
    );

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Validates every repository before creating any pool.
    ///
    /// @throws common::InvalidConfigurationError duplicate or empty names, or
    /// re-initialization while worktrees are allocated
    /// @throws common::AllocationError naming the first repository whose path is
    /// missing or is not a git repository
    ////////////////////////////////////////////////////////////////////////////////
    void initialize_workspace(const config::Workspace& workspace);
    bool initialized() const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Allocates branch in every repository, in configuration order.
    ///
    /// @throws common::AllocationError after rolling back the allocations of this
    /// call; rollback failures are logged and appended to the message
    ////////////////////////////////////////////////////////////////////////////////
    MultiRepoWorktree create_multi_repo_worktree(
        const std::string& branch, const std::string& feature_id = "",
        const std::optional<std::string>& agent_id = std::nullopt
    );

    // Without force, fails with common::UncommittedChangesError before any
    // repository is released.
    void release_multi_repo_worktree(const std::string& branch, bool force = false);

    // One result per allocated worktree, restricted to branch when given.
    std::vector<RepoCommitResult>
    commit_all(const std::string& message, const std::optional<std::string>& branch = std::nullopt);

    // Returns the commit hash; throws common::ObjectDoesNotExist or common::CommitError.
    std::string commit_in_repo(
        const std::string& repository, const std::string& message, const std::string& branch
    );

    PullRequestResults create_multi_repo_prs(const Feature& feature);

    std::vector<RepoStatus> get_multi_repo_status(const std::string& branch);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Releases every worktree, aggregates first.
    /// Without force, an aggregate with uncommitted changes in any repository is
    /// kept whole and so are dirty allocations made directly through a pool.
    ///
    /// @return number of released worktrees
    ////////////////////////////////////////////////////////////////////////////////
    int cleanup_all(bool force = false);

    // Releases aggregates idle for longer than the threshold and stale strays;
    // anything marked dirty is kept.
    int cleanup_stale(double max_idle_hours);

    CoordinatorStats get_stats() const;
    std::optional<MultiRepoWorktree> get_multi_repo_worktree(const std::string& branch) const;
    std::vector<MultiRepoWorktree> get_multi_repo_worktrees() const;
    std::optional<std::string>
    get_worktree_path(const std::string& repository, const std::string& branch) const;
    std::vector<config::Repository> get_configured_repos() const;

    std::shared_ptr<WorktreePool> pool(const std::string& repository) const;

  private:
    using lock_t = std::shared_mutex;
    using write_lock_t = std::unique_lock<lock_t>;
    using read_lock_t = std::shared_lock<lock_t>;

    struct Member {
      config::Repository repository;
      std::shared_ptr<WorktreePool> pool;
    };

    // Throws NotInitializedError.
    std::vector<Member> _members(const std::string& operation) const;

    std::string _commit(Member& member, const Allocation& alloc, const std::string& message);

    // Refreshes the allocations of a record from the pools.
    MultiRepoWorktree _refresh(const MultiRepoWorktree& record) const;

    void _publish(common::events::Payload&& payload);

    config::WorktreePool _config;
    git_factory_t _git_factory;
    PullRequestProvider* _pull_requests;
    common::events::EventSink* _events;
    WorktreePool::now_t _now;

    mutable lock_t _mutex;
    bool _initialized = false;
    std::vector<Member> _repositories;
    std::map<std::string, MultiRepoWorktree> _records;
    std::unordered_set<std::string> _creating;

    BS::thread_pool _batch;
    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace squad::workspace

#endif
