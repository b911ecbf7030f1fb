#include <squad/workspace/worktree_pool.hpp>

#include <squad/common/exceptions.hpp>
#include <squad/common/util.hpp>

#include <algorithm>
#include <filesystem>

#include <fmt/format.h>

namespace squad::workspace {

  namespace {

    std::string normalize(const std::string& path)
    {
      std::error_code ec;
      auto canonical = std::filesystem::weakly_canonical(path, ec);
      if (ec) {
        return std::filesystem::path{path}.lexically_normal().string();
      }
      return canonical.string();
    }

    bool directory_exists(const std::string& path)
    {
      std::error_code ec;
      return std::filesystem::is_directory(path, ec);
    }

  } // namespace

  WorktreePool::WorktreePool(
      std::string name, std::shared_ptr<git::Git> git, const config::WorktreePool& cfg,
      std::string base_branch, common::events::EventSink* events, now_t now
  )
      : _name(std::move(name)), _git(std::move(git)), _config(cfg),
        _base_branch(std::move(base_branch)), _events(events), _now(std::move(now))
  {
    if (!_now) {
      _now = []() { return clock_type::now(); };
    }
    _logger = common::util::create_logger(fmt::format("WorktreePool:{}", _name));
  }

  void WorktreePool::initialize()
  {
    const std::string& path = _git->repository();
    if (!directory_exists(path)) {
      throw common::AllocationError{
          fmt::format("Repository {}: path {} does not exist", _name, path)};
    }
    if (!_git->is_repository()) {
      throw common::AllocationError{
          fmt::format("Repository {}: {} is not a valid git repository", _name, path)};
    }

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path{_config.root} / _name, ec);
    if (ec) {
      throw common::AllocationError{fmt::format(
          "Repository {}: could not create worktree root {}: {}", _name, _config.root,
          ec.message()
      )};
    }

    _initialized = true;
    _logger->info("Initialized worktree pool of {} at {}", _name, path);
  }

  bool WorktreePool::initialized() const
  {
    return _initialized;
  }

  const std::string& WorktreePool::name() const
  {
    return _name;
  }

  const std::string& WorktreePool::base_branch() const
  {
    return _base_branch;
  }

  git::Git& WorktreePool::git()
  {
    return *_git;
  }

  std::string WorktreePool::worktree_path(const std::string& branch) const
  {
    std::string dir = branch;
    std::replace(dir.begin(), dir.end(), '/', '-');
    return (std::filesystem::path{_config.root} / _name / dir).string();
  }

  Allocation WorktreePool::allocate(
      const std::string& branch, const std::string& feature_id,
      const std::optional<std::string>& agent_id, const std::optional<std::string>& base
  )
  {
    if (!_initialized) {
      throw common::AllocationError{fmt::format("Repository {} is not initialized", _name)};
    }
    if (branch.empty()) {
      throw common::AllocationError{"Branch name cannot be empty"};
    }

    {
      write_lock_t lock{_mutex};
      if (_branches.count(branch) || _reserved.count(branch)) {
        throw common::AllocationError{
            fmt::format("Branch {} of repository {} is already allocated", branch, _name)};
      }
      if (_allocations.size() + _reserved.size() >= static_cast<size_t>(_config.max_per_repo)) {
        throw common::AllocationError{fmt::format(
            "Repository {} reached the limit of {} worktrees", _name, _config.max_per_repo
        )};
      }
      _reserved.insert(branch);
    }

    std::string path = worktree_path(branch);
    bool created_branch = false;
    try {
      created_branch = _prepare_worktree(path, branch, base.value_or(_base_branch));
    } catch (common::AllocationError&) {
      write_lock_t lock{_mutex};
      _reserved.erase(branch);
      throw;
    } catch (std::exception& exc) {
      {
        write_lock_t lock{_mutex};
        _reserved.erase(branch);
      }
      throw common::AllocationError{fmt::format(
          "Could not create worktree for branch {} in repository {}: {}", branch, _name,
          exc.what()
      )};
    }

    auto now = _now();
    Allocation alloc{
        _uuid.prefixed("wt"),
        _name,
        _git->repository(),
        path,
        branch,
        agent_id,
        feature_id,
        now,
        now,
        true,
        false,
        created_branch};

    {
      write_lock_t lock{_mutex};
      _reserved.erase(branch);
      _allocations.emplace(alloc.id, alloc);
      _branches.emplace(branch, alloc.id);
    }

    _logger->info("Allocated worktree {} for branch {} at {}", alloc.id, branch, path);
    _publish(common::events::WorktreeCreated{_name, alloc.id, path, branch, feature_id});
    return alloc;
  }

  bool WorktreePool::_prepare_worktree(
      const std::string& path, const std::string& branch, const std::string& base
  )
  {
    auto normalized = normalize(path);
    for (const auto& worktree : _git->list_worktrees()) {

      if (normalize(worktree.path) != normalized) {
        continue;
      }
      if (worktree.branch == branch) {
        SPDLOG_LOGGER_DEBUG(_logger, "Reusing existing worktree {} for branch {}", path, branch);
        return false;
      }
      throw common::AllocationError{fmt::format(
          "Path {} of repository {} is a worktree of branch {}", path, _name,
          worktree.branch.value_or("(detached)")
      )};
    }

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
      throw common::AllocationError{
          fmt::format("Path {} exists and is not a worktree of repository {}", path, _name)};
    }
    std::filesystem::create_directories(std::filesystem::path{path}.parent_path());

    if (_git->branch_exists(branch)) {
      _git->add_worktree(path, branch, std::nullopt);
      return false;
    }

    _git->add_worktree(path, branch, base);
    return true;
  }

  bool WorktreePool::_has_changes(const Allocation& alloc)
  {
    if (!directory_exists(alloc.worktree_path)) {
      return false;
    }

    try {
      return _git->has_changes(alloc.worktree_path);
    } catch (git::GitError& exc) {
      // Unknown state counts as dirty.
      _logger->warn("Could not inspect worktree {}: {}", alloc.worktree_path, exc.what());
      return true;
    }
  }

  void WorktreePool::_remove_worktree(const Allocation& alloc, bool force)
  {
    if (directory_exists(alloc.worktree_path)) {
      _git->remove_worktree(alloc.worktree_path, force);
    } else {
      _git->prune_worktrees();
    }
  }

  void WorktreePool::release(const std::string& id, ReleaseOptions options)
  {
    Allocation alloc;
    {
      write_lock_t lock{_mutex};
      auto it = _allocations.find(id);
      if (it == _allocations.end()) {
        throw common::ObjectDoesNotExist{
            fmt::format("Worktree allocation {} does not exist in {}", id, _name)};
      }
      if (_releasing.count(id)) {
        throw common::AllocationError{
            fmt::format("Worktree allocation {} is already being released", id)};
      }
      if (it->second.dirty && !options.force) {
        throw common::UncommittedChangesError{_name, it->second.worktree_path};
      }
      alloc = it->second;
      _releasing.insert(id);
    }

    if (!options.force && _has_changes(alloc)) {
      {
        write_lock_t lock{_mutex};
        _releasing.erase(id);
        auto it = _allocations.find(id);
        if (it != _allocations.end()) {
          it->second.dirty = true;
        }
      }
      throw common::UncommittedChangesError{_name, alloc.worktree_path};
    }

    try {
      _remove_worktree(alloc, options.force);
    } catch (std::exception& exc) {
      {
        write_lock_t lock{_mutex};
        _releasing.erase(id);
      }
      throw common::AllocationError{fmt::format(
          "Could not remove worktree {} of repository {}: {}", alloc.worktree_path, _name,
          exc.what()
      )};
    }

    if (!options.keep_branch && alloc.created_branch) {
      try {
        _git->delete_branch(alloc.branch, true);
      } catch (git::GitError& exc) {
        _logger->warn("Could not delete branch {}: {}", alloc.branch, exc.what());
      }
    }

    {
      write_lock_t lock{_mutex};
      _allocations.erase(id);
      _branches.erase(alloc.branch);
      _releasing.erase(id);
    }

    _logger->info(
        "Released worktree {} of branch {}{}", alloc.id, alloc.branch,
        options.force ? " (forced)" : ""
    );
    _publish(common::events::WorktreeRemoved{
        _name, alloc.id, alloc.worktree_path, alloc.branch, options.force});
  }

  bool WorktreePool::touch(const std::string& id)
  {
    write_lock_t lock{_mutex};
    auto it = _allocations.find(id);
    if (it == _allocations.end()) {
      return false;
    }
    it->second.last_active_at = _now();
    return true;
  }

  bool WorktreePool::mark_dirty(const std::string& id, bool dirty)
  {
    write_lock_t lock{_mutex};
    auto it = _allocations.find(id);
    if (it == _allocations.end()) {
      return false;
    }
    it->second.dirty = dirty;
    return true;
  }

  bool WorktreePool::mark_clean(const std::string& id)
  {
    return mark_dirty(id, false);
  }

  template <typename Pred>
  std::vector<Allocation> WorktreePool::_select(Pred&& pred) const
  {
    std::vector<Allocation> result;
    read_lock_t lock{_mutex};
    for (const auto& [id, alloc] : _allocations) {
      if (pred(alloc)) {
        result.push_back(alloc);
      }
    }
    std::sort(result.begin(), result.end(), [](const Allocation& a, const Allocation& b) {
      return a.created_at < b.created_at;
    });
    return result;
  }

  std::optional<Allocation> WorktreePool::get_allocation(const std::string& id) const
  {
    read_lock_t lock{_mutex};
    auto it = _allocations.find(id);
    if (it == _allocations.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::optional<Allocation> WorktreePool::find_by_branch(const std::string& branch) const
  {
    read_lock_t lock{_mutex};
    auto it = _branches.find(branch);
    if (it == _branches.end()) {
      return std::nullopt;
    }
    return _allocations.at(it->second);
  }

  std::vector<Allocation> WorktreePool::get_all_allocations() const
  {
    return _select([](const Allocation&) { return true; });
  }

  std::vector<Allocation>
  WorktreePool::get_allocations_for_feature(const std::string& feature_id) const
  {
    return _select([&](const Allocation& alloc) { return alloc.feature_id == feature_id; });
  }

  std::vector<Allocation> WorktreePool::get_allocations_for_agent(const std::string& agent_id
  ) const
  {
    return _select([&](const Allocation& alloc) { return alloc.agent_id == agent_id; });
  }

  template <typename Pred>
  int WorktreePool::_release_matching(Pred&& pred, ReleaseOptions options)
  {
    int released = 0;
    for (const auto& alloc : _select(std::forward<Pred>(pred))) {
      try {
        release(alloc.id, options);
        ++released;
      } catch (common::SquadException& exc) {
        _logger->error("Could not release worktree {}: {}", alloc.id, exc.what());
      }
    }
    return released;
  }

  int WorktreePool::cleanup_stale(double max_idle_hours)
  {
    auto idle = std::chrono::duration_cast<clock_type::duration>(
        std::chrono::duration<double, std::ratio<3600>>{max_idle_hours}
    );
    auto threshold = _now() - idle;

    // Dirty worktrees hold uncommitted work and are never swept.
    int released = _release_matching(
        [threshold](const Allocation& alloc) {
          return alloc.last_active_at < threshold && !alloc.dirty;
        },
        ReleaseOptions{true, true}
    );
    if (released > 0) {
      _logger->info("Released {} stale worktrees", released);
    }
    return released;
  }

  int WorktreePool::cleanup_feature(const std::string& feature_id, ReleaseOptions options)
  {
    return _release_matching(
        [&](const Allocation& alloc) { return alloc.feature_id == feature_id; }, options
    );
  }

  int WorktreePool::cleanup_agent(const std::string& agent_id, ReleaseOptions options)
  {
    return _release_matching(
        [&](const Allocation& alloc) { return alloc.agent_id == agent_id; }, options
    );
  }

  int WorktreePool::release_all(bool force)
  {
    return _release_matching([](const Allocation&) { return true; }, ReleaseOptions{force, true});
  }

  int WorktreePool::sync_with_disk()
  {
    int dropped = 0;
    {
      write_lock_t lock{_mutex};
      for (auto it = _allocations.begin(); it != _allocations.end();) {
        if (!_releasing.count(it->first) && !directory_exists(it->second.worktree_path)) {
          _logger->warn("Worktree {} disappeared from disk", it->second.worktree_path);
          _branches.erase(it->second.branch);
          it = _allocations.erase(it);
          ++dropped;
        } else {
          ++it;
        }
      }
    }

    try {
      _git->prune_worktrees();
    } catch (git::GitError& exc) {
      _logger->warn("Could not prune worktrees of {}: {}", _name, exc.what());
    }
    return dropped;
  }

  PoolStats WorktreePool::get_stats() const
  {
    PoolStats stats;
    read_lock_t lock{_mutex};
    stats.total = _allocations.size();
    for (const auto& [id, alloc] : _allocations) {
      if (alloc.dirty) {
        ++stats.dirty;
      }
      ++stats.by_feature[alloc.feature_id];
    }
    return stats;
  }

  void WorktreePool::_publish(common::events::Payload&& payload)
  {
    if (_events) {
      _events->publish(common::events::make_event(std::move(payload)));
    }
  }

} // namespace squad::workspace
