#include <squad/workspace/coordinator.hpp>

#include <squad/common/util.hpp>

#include <algorithm>
#include <filesystem>
#include <future>
#include <unordered_set>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace squad::workspace {

  Coordinator::Coordinator(
      const config::WorktreePool& cfg, git_factory_t git_factory,
      PullRequestProvider* pull_requests, common::events::EventSink* events,
      WorktreePool::now_t now
  )
      : _config(cfg), _git_factory(std::move(git_factory)), _pull_requests(pull_requests),
        _events(events), _now(std::move(now)), _batch(cfg.batch_threads)
  {
    if (!_now) {
      _now = []() { return clock_type::now(); };
    }
    _logger = common::util::create_logger("Coordinator");
  }

  void Coordinator::initialize_workspace(const config::Workspace& workspace)
  {
    auto repositories = workspace.repositories();

    std::unordered_set<std::string> names;
    for (const auto& repo : repositories) {
      if (repo.name.empty()) {
        throw common::InvalidConfigurationError{
            fmt::format("Repository at {} has no name", repo.path)};
      }
      if (!names.insert(repo.name).second) {
        throw common::InvalidConfigurationError{
            fmt::format("Repository name {} is used more than once", repo.name)};
      }
    }

    {
      read_lock_t lock{_mutex};
      for (const auto& member : _repositories) {
        if (member.pool->get_stats().total > 0) {
          throw common::InvalidConfigurationError{fmt::format(
              "Cannot reinitialize the workspace while repository {} has allocated worktrees",
              member.repository.name
          )};
        }
      }
    }

    // Nothing is created before every repository passed validation.
    std::vector<std::shared_ptr<git::Git>> gits;
    for (const auto& repo : repositories) {

      std::error_code ec;
      if (repo.path.empty() || !std::filesystem::is_directory(repo.path, ec)) {
        throw common::AllocationError{
            fmt::format("Repository {} at {}: path does not exist", repo.name, repo.path)};
      }

      auto git = _git_factory(repo);
      bool valid = false;
      try {
        valid = git->is_repository();
      } catch (common::SquadException& exc) {
        throw common::AllocationError{fmt::format(
            "Repository {} at {}: cannot run git: {}", repo.name, repo.path, exc.what()
        )};
      }
      if (!valid) {
        throw common::AllocationError{fmt::format(
            "Repository {} at {}: not a valid git repository", repo.name, repo.path
        )};
      }
      gits.push_back(std::move(git));
    }

    std::vector<Member> members;
    for (size_t i = 0; i < repositories.size(); ++i) {
      auto pool = std::make_shared<WorktreePool>(
          repositories[i].name, gits[i], _config, repositories[i].default_branch, _events, _now
      );
      pool->initialize();
      members.push_back(Member{repositories[i], std::move(pool)});
    }

    write_lock_t lock{_mutex};
    _repositories = std::move(members);
    _records.clear();
    _initialized = true;

    _logger->info(
        "Initialized workspace with {} repositories: {}", _repositories.size(),
        fmt::join(names, ", ")
    );
  }

  bool Coordinator::initialized() const
  {
    read_lock_t lock{_mutex};
    return _initialized;
  }

  std::vector<Coordinator::Member> Coordinator::_members(const std::string& operation) const
  {
    read_lock_t lock{_mutex};
    if (!_initialized) {
      throw common::NotInitializedError{
          fmt::format("Cannot {}: the workspace has not been initialized", operation)};
    }
    return _repositories;
  }

  MultiRepoWorktree Coordinator::create_multi_repo_worktree(
      const std::string& branch, const std::string& feature_id,
      const std::optional<std::string>& agent_id
  )
  {
    auto members = _members("create a multi-repository worktree");

    {
      write_lock_t lock{_mutex};
      if (_records.count(branch) || _creating.count(branch)) {
        throw common::AllocationError{
            fmt::format("Branch {} already has a multi-repository worktree", branch)};
      }
      _creating.insert(branch);
    }

    MultiRepoWorktree result{branch, feature_id, agent_id, {}, _now()};
    std::vector<std::function<void()>> undo;

    try {

      for (auto& member : members) {
        auto alloc = member.pool->allocate(branch, feature_id, agent_id);
        undo.emplace_back([pool = member.pool, id = alloc.id]() {
          pool->release(id, ReleaseOptions{true, false});
        });
        result.worktrees.emplace(member.repository.name, std::move(alloc));
      }

    } catch (common::SquadException& exc) {

      std::string message = fmt::format(
          "Could not allocate branch {} in every repository: {}", branch, exc.what()
      );

      for (auto it = undo.rbegin(); it != undo.rend(); ++it) {
        try {
          (*it)();
        } catch (common::SquadException& rollback_exc) {
          common::RollbackError error{fmt::format(
              "Rollback of branch {} left a worktree behind: {}", branch, rollback_exc.what()
          )};
          _logger->error(error.what());
          message += fmt::format("; {}", error.what());
        }
      }

      {
        write_lock_t lock{_mutex};
        _creating.erase(branch);
      }
      throw common::AllocationError{message};
    }

    {
      write_lock_t lock{_mutex};
      _creating.erase(branch);
      _records.emplace(branch, result);
    }

    _logger->info("Allocated branch {} in {} repositories", branch, result.worktrees.size());
    return result;
  }

  void Coordinator::release_multi_repo_worktree(const std::string& branch, bool force)
  {
    auto members = _members("release a multi-repository worktree");

    MultiRepoWorktree record;
    {
      read_lock_t lock{_mutex};
      auto it = _records.find(branch);
      if (it == _records.end()) {
        throw common::ObjectDoesNotExist{
            fmt::format("Branch {} has no multi-repository worktree", branch)};
      }
      record = it->second;
    }

    std::map<std::string, std::shared_ptr<WorktreePool>> pools;
    for (auto& member : members) {
      pools.emplace(member.repository.name, member.pool);
    }

    if (!force) {
      for (const auto& [repo, alloc] : record.worktrees) {

        auto current = pools.at(repo)->get_allocation(alloc.id);
        if (!current.has_value()) {
          continue;
        }

        bool dirty = current->dirty;
        std::error_code ec;
        if (!dirty && std::filesystem::is_directory(current->worktree_path, ec)) {
          try {
            dirty = pools.at(repo)->git().has_changes(current->worktree_path);
          } catch (git::GitError& exc) {
            _logger->warn("Could not inspect {}: {}", current->worktree_path, exc.what());
            dirty = true;
          }
        }

        if (dirty) {
          pools.at(repo)->mark_dirty(alloc.id);
          throw common::UncommittedChangesError{repo, current->worktree_path};
        }
      }
    }

    std::vector<std::string> failures;
    for (const auto& [repo, alloc] : record.worktrees) {
      try {
        pools.at(repo)->release(alloc.id, ReleaseOptions{true, true});
      } catch (common::ObjectDoesNotExist&) {
        SPDLOG_LOGGER_DEBUG(_logger, "Worktree {} was already released", alloc.id);
      } catch (common::SquadException& exc) {
        _logger->error("Could not release {} in {}: {}", branch, repo, exc.what());
        failures.push_back(fmt::format("{}: {}", repo, exc.what()));
      }
    }

    {
      write_lock_t lock{_mutex};
      auto it = _records.find(branch);
      if (it != _records.end()) {
        if (failures.empty()) {
          _records.erase(it);
        } else {
          it->second = _refresh(it->second);
        }
      }
    }

    if (!failures.empty()) {
      throw common::AllocationError{fmt::format(
          "Could not release branch {} in every repository: {}", branch, fmt::join(failures, "; ")
      )};
    }
    _logger->info("Released branch {}", branch);
  }

  std::string
  Coordinator::_commit(Member& member, const Allocation& alloc, const std::string& message)
  {
    std::string commit;
    try {
      commit = member.pool->git().commit(alloc.worktree_path, message, _config.stage_all);
    } catch (common::CommitError&) {
      throw;
    } catch (common::SquadException& exc) {
      throw common::CommitError{fmt::format(
          "Commit in repository {} failed: {}", member.repository.name, exc.what()
      )};
    }

    member.pool->mark_clean(alloc.id);
    member.pool->touch(alloc.id);
    _logger->info("Committed {} in {} on {}", commit, member.repository.name, alloc.branch);
    _publish(common::events::CommitCreated{member.repository.name, alloc.branch, commit, message});
    return commit;
  }

  std::vector<RepoCommitResult>
  Coordinator::commit_all(const std::string& message, const std::optional<std::string>& branch)
  {
    auto members = _members("commit");

    struct Task {
      RepoCommitResult result;
      std::future<std::string> commit;
    };
    std::vector<Task> tasks;

    for (auto& member : members) {

      std::vector<Allocation> allocations;
      if (branch.has_value()) {
        auto alloc = member.pool->find_by_branch(*branch);
        if (alloc.has_value()) {
          allocations.push_back(std::move(*alloc));
        }
      } else {
        allocations = member.pool->get_all_allocations();
      }

      for (auto& alloc : allocations) {
        RepoCommitResult result{member.repository.name, alloc.branch, std::nullopt, std::nullopt};
        auto future = _batch.submit_task([this, &member, alloc, &message]() {
          return _commit(member, alloc, message);
        });
        tasks.push_back(Task{std::move(result), std::move(future)});
      }
    }

    std::vector<RepoCommitResult> results;
    for (auto& task : tasks) {
      try {
        task.result.commit = task.commit.get();
      } catch (common::CommitError& exc) {
        _logger->warn("{}", exc.what());
        task.result.error = exc;
      } catch (std::exception& exc) {
        _logger->error("Commit in {} failed: {}", task.result.repository, exc.what());
        task.result.error = common::CommitError{exc.what()};
      }
      results.push_back(std::move(task.result));
    }
    return results;
  }

  std::string Coordinator::commit_in_repo(
      const std::string& repository, const std::string& message, const std::string& branch
  )
  {
    auto members = _members("commit");

    auto it = std::find_if(members.begin(), members.end(), [&](const Member& member) {
      return member.repository.name == repository;
    });
    if (it == members.end()) {
      throw common::ObjectDoesNotExist{fmt::format("Unknown repository {}", repository)};
    }

    auto alloc = it->pool->find_by_branch(branch);
    if (!alloc.has_value()) {
      throw common::ObjectDoesNotExist{
          fmt::format("Branch {} is not allocated in repository {}", branch, repository)};
    }

    return _commit(*it, *alloc, message);
  }

  PullRequestResults Coordinator::create_multi_repo_prs(const Feature& feature)
  {
    auto members = _members("create pull requests");
    if (!_pull_requests) {
      throw common::InvalidConfigurationError{"No pull request provider is configured"};
    }

    PullRequestResults results;

    struct Candidate {
      Member* member;
      Allocation alloc;
      std::future<int> ahead;
    };
    std::vector<Candidate> candidates;
    for (auto& member : members) {
      auto alloc = member.pool->find_by_branch(feature.branch);
      if (!alloc.has_value()) {
        continue;
      }
      auto ahead = _batch.submit_task([&member, path = alloc->worktree_path]() {
        return member.pool->git().commits_ahead(path, member.repository.default_branch);
      });
      candidates.push_back(Candidate{&member, std::move(*alloc), std::move(ahead)});
    }

    std::vector<Candidate*> changed;
    for (auto& candidate : candidates) {
      const auto& name = candidate.member->repository.name;
      try {
        int ahead = candidate.ahead.get();
        if (ahead > 0) {
          changed.push_back(&candidate);
        } else {
          SPDLOG_LOGGER_DEBUG(_logger, "No commits on {} in {}", feature.branch, name);
        }
      } catch (std::exception& exc) {
        results.failures.emplace(name, exc.what());
      }
    }

    std::string title = fmt::format(
        "[{}] {}", feature.name,
        feature.description.empty() ? "Feature implementation" : feature.description
    );

    std::vector<std::future<PullRequest>> requests;
    for (auto* candidate : changed) {

      std::string body = fmt::format("Feature: {}\n", feature.name);
      if (!feature.description.empty()) {
        body += fmt::format("\n{}\n", feature.description);
      }
      if (changed.size() > 1) {
        body += "\nRelated changes in:\n";
        for (auto* other : changed) {
          if (other != candidate) {
            body += fmt::format("- {} ({})\n", other->member->repository.name, feature.branch);
          }
        }
      }

      PullRequestRequest request{
          candidate->member->repository.name,
          candidate->alloc.worktree_path,
          title,
          std::move(body),
          feature.branch,
          candidate->member->repository.default_branch};

      requests.push_back(_batch.submit_task([this, candidate, request = std::move(request)]() {
        candidate->member->pool->git().push(request.worktree_path, "origin", request.head);
        return _pull_requests->create(request);
      }));
    }

    for (size_t i = 0; i < changed.size(); ++i) {
      const auto& name = changed[i]->member->repository.name;
      try {
        results.pull_requests.push_back(requests[i].get());
      } catch (std::exception& exc) {
        _logger->error("Could not open pull request for {}: {}", name, exc.what());
        results.failures.emplace(name, exc.what());
      }
    }

    return results;
  }

  std::vector<RepoStatus> Coordinator::get_multi_repo_status(const std::string& branch)
  {
    auto members = _members("query the status");

    std::vector<std::pair<RepoStatus, std::future<git::Status>>> pending;
    for (auto& member : members) {
      auto alloc = member.pool->find_by_branch(branch);
      if (!alloc.has_value()) {
        continue;
      }
      RepoStatus status;
      status.repository = member.repository.name;
      status.branch = branch;
      status.path = alloc->worktree_path;
      auto future = _batch.submit_task([&member, path = alloc->worktree_path]() {
        return member.pool->git().status(path);
      });
      pending.emplace_back(std::move(status), std::move(future));
    }

    std::vector<RepoStatus> results;
    for (auto& [status, future] : pending) {
      try {
        auto git_status = future.get();
        status.clean = git_status.clean();
        status.ahead = git_status.ahead;
        status.behind = git_status.behind;
        status.files = std::move(git_status.files);
      } catch (std::exception& exc) {
        status.clean = false;
        status.error = exc.what();
      }
      results.push_back(std::move(status));
    }
    return results;
  }

  int Coordinator::cleanup_all(bool force)
  {
    auto members = _members("clean up");
    auto active = [&members]() {
      size_t total = 0;
      for (const auto& member : members) {
        total += member.pool->get_stats().total;
      }
      return total;
    };
    size_t before = active();

    // Aggregates go first so that a dirty repository keeps its whole feature.
    for (const auto& record : get_multi_repo_worktrees()) {
      try {
        release_multi_repo_worktree(record.feature_branch, force);
      } catch (common::SquadException& exc) {
        _logger->warn("Keeping branch {}: {}", record.feature_branch, exc.what());
      }
    }

    std::unordered_set<std::string> kept;
    for (const auto& record : get_multi_repo_worktrees()) {
      for (const auto& [repo, alloc] : record.worktrees) {
        kept.insert(alloc.id);
      }
    }

    for (auto& member : members) {
      for (const auto& alloc : member.pool->get_all_allocations()) {
        if (kept.count(alloc.id)) {
          continue;
        }
        try {
          member.pool->release(alloc.id, ReleaseOptions{force, true});
        } catch (common::SquadException& exc) {
          _logger->warn("Keeping worktree {}: {}", alloc.worktree_path, exc.what());
        }
      }
    }

    {
      write_lock_t lock{_mutex};
      for (auto it = _records.begin(); it != _records.end();) {
        auto refreshed = _refresh(it->second);
        if (refreshed.worktrees.empty()) {
          it = _records.erase(it);
        } else {
          it->second = std::move(refreshed);
          ++it;
        }
      }
    }

    size_t after = active();
    return before > after ? static_cast<int>(before - after) : 0;
  }

  int Coordinator::cleanup_stale(double max_idle_hours)
  {
    auto members = _members("clean up");
    auto idle = std::chrono::duration_cast<clock_type::duration>(
        std::chrono::duration<double, std::ratio<3600>>{max_idle_hours}
    );
    auto threshold = _now() - idle;

    std::vector<MultiRepoWorktree> stale;
    std::unordered_set<std::string> live;
    {
      read_lock_t lock{_mutex};
      for (const auto& [branch, record] : _records) {
        auto refreshed = _refresh(record);
        if (refreshed.worktrees.empty()) {
          continue;
        }
        auto last_active = std::max_element(
            refreshed.worktrees.begin(), refreshed.worktrees.end(),
            [](const auto& a, const auto& b) {
              return a.second.last_active_at < b.second.last_active_at;
            }
        );
        bool dirty = std::any_of(
            refreshed.worktrees.begin(), refreshed.worktrees.end(),
            [](const auto& entry) { return entry.second.dirty; }
        );
        if (last_active->second.last_active_at < threshold && !dirty) {
          stale.push_back(std::move(refreshed));
        } else {
          for (const auto& [repo, alloc] : refreshed.worktrees) {
            live.insert(alloc.id);
          }
        }
      }
    }

    std::map<std::string, std::shared_ptr<WorktreePool>> pools;
    for (auto& member : members) {
      pools.emplace(member.repository.name, member.pool);
    }

    int released = 0;
    auto release = [&](WorktreePool& pool, const Allocation& alloc) {
      try {
        pool.release(alloc.id, ReleaseOptions{true, true});
        ++released;
      } catch (common::SquadException& exc) {
        _logger->error("Could not release stale worktree {}: {}", alloc.worktree_path, exc.what());
      }
    };

    for (const auto& record : stale) {
      _logger->info("Releasing stale branch {}", record.feature_branch);
      for (const auto& [repo, alloc] : record.worktrees) {
        release(*pools.at(repo), alloc);
      }
    }

    // Allocations made directly through a pool; members of active or dirty aggregates stay.
    for (auto& member : members) {
      for (const auto& alloc : member.pool->get_all_allocations()) {
        if (!live.count(alloc.id) && !alloc.dirty && alloc.last_active_at < threshold) {
          release(*member.pool, alloc);
        }
      }
    }

    write_lock_t lock{_mutex};
    for (auto it = _records.begin(); it != _records.end();) {
      auto refreshed = _refresh(it->second);
      if (refreshed.worktrees.empty()) {
        it = _records.erase(it);
      } else {
        it->second = std::move(refreshed);
        ++it;
      }
    }
    return released;
  }

  MultiRepoWorktree Coordinator::_refresh(const MultiRepoWorktree& record) const
  {
    MultiRepoWorktree refreshed = record;
    refreshed.worktrees.clear();
    for (const auto& member : _repositories) {
      auto it = record.worktrees.find(member.repository.name);
      if (it == record.worktrees.end()) {
        continue;
      }
      auto current = member.pool->get_allocation(it->second.id);
      if (current.has_value()) {
        refreshed.worktrees.emplace(member.repository.name, std::move(*current));
      }
    }
    return refreshed;
  }

  CoordinatorStats Coordinator::get_stats() const
  {
    CoordinatorStats stats;
    read_lock_t lock{_mutex};
    stats.total_repos = _repositories.size();
    stats.active_features = _records.size();
    for (const auto& member : _repositories) {
      size_t total = member.pool->get_stats().total;
      stats.by_repo[member.repository.name] = total;
      stats.active_worktrees += total;
    }
    return stats;
  }

  std::optional<MultiRepoWorktree> Coordinator::get_multi_repo_worktree(const std::string& branch
  ) const
  {
    read_lock_t lock{_mutex};
    auto it = _records.find(branch);
    if (it == _records.end()) {
      return std::nullopt;
    }
    return _refresh(it->second);
  }

  std::vector<MultiRepoWorktree> Coordinator::get_multi_repo_worktrees() const
  {
    std::vector<MultiRepoWorktree> result;
    read_lock_t lock{_mutex};
    for (const auto& [branch, record] : _records) {
      result.push_back(_refresh(record));
    }
    return result;
  }

  std::optional<std::string>
  Coordinator::get_worktree_path(const std::string& repository, const std::string& branch) const
  {
    auto member = pool(repository);
    if (!member) {
      return std::nullopt;
    }
    auto alloc = member->find_by_branch(branch);
    if (!alloc.has_value()) {
      return std::nullopt;
    }
    return alloc->worktree_path;
  }

  std::vector<config::Repository> Coordinator::get_configured_repos() const
  {
    std::vector<config::Repository> result;
    read_lock_t lock{_mutex};
    for (const auto& member : _repositories) {
      result.push_back(member.repository);
    }
    return result;
  }

  std::shared_ptr<WorktreePool> Coordinator::pool(const std::string& repository) const
  {
    read_lock_t lock{_mutex};
    for (const auto& member : _repositories) {
      if (member.repository.name == repository) {
        return member.pool;
      }
    }
    return nullptr;
  }

  void Coordinator::_publish(common::events::Payload&& payload)
  {
    if (_events) {
      _events->publish(common::events::make_event(std::move(payload)));
    }
  }

} // namespace squad::workspace
