#ifndef SQUAD_WORKSPACE_WORKTREE_POOL_HPP
#define SQUAD_WORKSPACE_WORKTREE_POOL_HPP

#include <squad/common/events.hpp>
#include <squad/common/uuid.hpp>
#include <squad/workspace/config.hpp>
#include <squad/workspace/git.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <spdlog/spdlog.h>

namespace squad::workspace {

  using clock_type = std::chrono::system_clock;
  using timestamp_t = clock_type::time_point;

  struct Allocation {
    std::string id;
    std::string repository;
    std::string repository_path;
    std::string worktree_path;
    std::string branch;
    std::optional<std::string> agent_id;
    std::string feature_id;
    timestamp_t created_at;
    timestamp_t last_active_at;
    bool allocated = true;
    bool dirty = false;
    // The branch did not exist before this allocation.
    bool created_branch = false;
  };

  struct ReleaseOptions {
    // Acknowledges that uncommitted changes are discarded.
    bool force = false;
    // Deletion only applies to branches created by the pool.
    bool keep_branch = true;
  };

  struct PoolStats {
    size_t total = 0;
    size_t dirty = 0;
    std::map<std::string, size_t> by_feature;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Exclusive, branch-scoped worktrees of a single repository.
  ///
  /// At most one live allocation exists per branch. Git operations run outside
  /// of the registry lock; a branch is reserved while its worktree is prepared so
  /// that concurrent callers observe the conflict immediately.
  ////////////////////////////////////////////////////////////////////////////////
  class WorktreePool {
  public:
    using now_t = std::function<timestamp_t()>;

    WorktreePool(
        std::string name, std::shared_ptr<git::Git> git, const config::WorktreePool& cfg,
        std::string base_branch, common::events::EventSink* events = nullptr,
        now_t now = nullptr
    );

    WorktreePool(const WorktreePool&) = delete;
    WorktreePool& operator=(const WorktreePool&) = delete;

    // Fails with AllocationError when the path is missing or not a repository.
    void initialize();
    bool initialized() const;

    const std::string& name() const;
    const std::string& base_branch() const;
    git::Git& git();

    // <root>/<repository name>/<branch with '/' replaced by '-'>
    std::string worktree_path(const std::string& branch) const;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Allocates a worktree for branch, creating the branch from the base
    /// branch when it does not exist yet.
    ///
    /// @param[in] branch branch to check out
    /// @param[in] feature_id owning feature
    /// @param[in] agent_id owning agent, if any
    /// @param[in] base overrides the repository's base branch for new branches
    /// @throws common::AllocationError
    ////////////////////////////////////////////////////////////////////////////////
    Allocation allocate(
        const std::string& branch, const std::string& feature_id,
        const std::optional<std::string>& agent_id = std::nullopt,
        const std::optional<std::string>& base = std::nullopt
    );

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Removes the worktree and the registry entry.
    /// Without force, a worktree marked dirty or with uncommitted changes stays
    /// allocated and common::UncommittedChangesError is thrown.
    ////////////////////////////////////////////////////////////////////////////////
    void release(const std::string& id, ReleaseOptions options = {});

    // Metadata updates; return false for unknown ids.
    bool touch(const std::string& id);
    bool mark_dirty(const std::string& id, bool dirty = true);
    bool mark_clean(const std::string& id);

    std::optional<Allocation> get_allocation(const std::string& id) const;
    std::optional<Allocation> find_by_branch(const std::string& branch) const;
    std::vector<Allocation> get_all_allocations() const;
    std::vector<Allocation> get_allocations_for_feature(const std::string& feature_id) const;
    std::vector<Allocation> get_allocations_for_agent(const std::string& agent_id) const;

    // Force-releases allocations idle for longer than the threshold, except dirty ones.
    int cleanup_stale(double max_idle_hours);

    int cleanup_feature(const std::string& feature_id, ReleaseOptions options = {true, true});
    int cleanup_agent(const std::string& agent_id, ReleaseOptions options = {true, true});
    int release_all(bool force);

    // Drops allocations whose directory disappeared and prunes git metadata.
    int sync_with_disk();

    PoolStats get_stats() const;

  private:
    using lock_t = std::shared_mutex;
    using write_lock_t = std::unique_lock<lock_t>;
    using read_lock_t = std::shared_lock<lock_t>;

    bool _prepare_worktree(
        const std::string& path, const std::string& branch, const std::string& base
    );
    bool _has_changes(const Allocation& alloc);
    void _remove_worktree(const Allocation& alloc, bool force);

    template <typename Pred>
    std::vector<Allocation> _select(Pred&& pred) const;

    template <typename Pred>
    int _release_matching(Pred&& pred, ReleaseOptions options);

    void _publish(common::events::Payload&& payload);

    std::string _name;
    std::shared_ptr<git::Git> _git;
    config::WorktreePool _config;
    std::string _base_branch;
    common::events::EventSink* _events;
    now_t _now;
    common::UUID _uuid;
    bool _initialized = false;

    mutable lock_t _mutex;
    std::unordered_map<std::string, Allocation> _allocations;
    std::unordered_map<std::string, std::string> _branches;
    std::unordered_set<std::string> _reserved;
    std::unordered_set<std::string> _releasing;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace squad::workspace

#endif
