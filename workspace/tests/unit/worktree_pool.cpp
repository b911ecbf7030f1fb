#include <squad/common/exceptions.hpp>
#include <squad/workspace/worktree_pool.hpp>

#include "mocks.hpp"

#include <future>
#include <latch>
#include <thread>

#include <gtest/gtest.h>

using testing::_;
using testing::NiceMock;
using testing::Return;

class WorktreePoolTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    git = std::make_shared<NiceMock<MockGit>>((repo.path / "repo").string());
    std::filesystem::create_directories(git->repository());
    setup_repository(*git);

    cfg.root = (root.path).string();
    cfg.max_per_repo = 10;

    pool = std::make_unique<WorktreePool>("backend", git, cfg, "main", &events, [this]() {
      return now;
    });
    pool->initialize();
  }

  TemporaryDirectory repo;
  TemporaryDirectory root;
  std::shared_ptr<NiceMock<MockGit>> git;
  config::WorktreePool cfg;
  NiceMock<MockEventSink> events;
  timestamp_t now = clock_type::now();
  std::unique_ptr<WorktreePool> pool;
};

TEST_F(WorktreePoolTest, InitializeFailures)
{
  auto missing = std::make_shared<NiceMock<MockGit>>((repo.path / "missing").string());
  WorktreePool no_path{"missing", missing, cfg, "main"};
  EXPECT_THROW(no_path.initialize(), common::AllocationError);
  EXPECT_FALSE(no_path.initialized());

  auto invalid = std::make_shared<NiceMock<MockGit>>(repo.path.string());
  ON_CALL(*invalid, is_repository()).WillByDefault(Return(false));
  WorktreePool not_repo{"invalid", invalid, cfg, "main"};
  EXPECT_THROW(not_repo.initialize(), common::AllocationError);

  EXPECT_THROW(not_repo.allocate("feature/x", "f1"), common::AllocationError);
}

TEST_F(WorktreePoolTest, Allocate)
{
  EXPECT_CALL(
      *git,
      add_worktree(pool->worktree_path("feature/x"), "feature/x", std::optional<std::string>{"main"})
  );
  EXPECT_CALL(events, publish(_));

  auto alloc = pool->allocate("feature/x", "feature-1", "agent-1");

  EXPECT_TRUE(alloc.id.starts_with("wt_"));
  EXPECT_EQ(alloc.repository, "backend");
  EXPECT_EQ(alloc.branch, "feature/x");
  EXPECT_EQ(alloc.worktree_path, (root.path / "backend" / "feature-x").string());
  EXPECT_EQ(alloc.agent_id, "agent-1");
  EXPECT_TRUE(alloc.allocated);
  EXPECT_FALSE(alloc.dirty);
  EXPECT_TRUE(alloc.created_branch);

  EXPECT_EQ(pool->get_allocation(alloc.id)->branch, "feature/x");
  EXPECT_EQ(pool->find_by_branch("feature/x")->id, alloc.id);
  EXPECT_EQ(pool->get_allocations_for_feature("feature-1").size(), 1);
  EXPECT_EQ(pool->get_allocations_for_agent("agent-1").size(), 1);
  EXPECT_TRUE(pool->get_allocations_for_agent("agent-2").empty());
}

TEST_F(WorktreePoolTest, ExistingBranch)
{
  ON_CALL(*git, branch_exists("feature/x")).WillByDefault(Return(true));
  EXPECT_CALL(*git, add_worktree(_, "feature/x", std::optional<std::string>{}));

  auto alloc = pool->allocate("feature/x", "f1");
  EXPECT_FALSE(alloc.created_branch);
}

TEST_F(WorktreePoolTest, ReuseRegisteredWorktree)
{
  auto path = pool->worktree_path("feature/x");
  std::filesystem::create_directories(path);
  ON_CALL(*git, list_worktrees())
      .WillByDefault(Return(std::vector<git::Worktree>{git::Worktree{path, "abc", "feature/x"}}));
  EXPECT_CALL(*git, add_worktree(_, _, _)).Times(0);

  auto alloc = pool->allocate("feature/x", "f1");
  EXPECT_EQ(alloc.worktree_path, path);
  EXPECT_FALSE(alloc.created_branch);
}

TEST_F(WorktreePoolTest, PathOccupied)
{
  std::filesystem::create_directories(pool->worktree_path("feature/x"));
  EXPECT_CALL(*git, add_worktree(_, _, _)).Times(0);

  EXPECT_THROW(pool->allocate("feature/x", "f1"), common::AllocationError);
  EXPECT_TRUE(pool->get_all_allocations().empty());
}

TEST_F(WorktreePoolTest, DuplicateBranch)
{
  pool->allocate("feature/x", "f1");
  EXPECT_THROW(pool->allocate("feature/x", "f2"), common::AllocationError);
  EXPECT_EQ(pool->get_all_allocations().size(), 1);
}

TEST_F(WorktreePoolTest, ConcurrentAllocation)
{
  // Both callers pass the registry check before either reaches git.
  std::latch start{2};
  auto allocate = [&]() {
    start.arrive_and_wait();
    try {
      pool->allocate("feature/x", "f1");
      return true;
    } catch (common::AllocationError&) {
      return false;
    }
  };

  auto first = std::async(std::launch::async, allocate);
  auto second = std::async(std::launch::async, allocate);
  int succeeded = static_cast<int>(first.get()) + static_cast<int>(second.get());

  EXPECT_EQ(succeeded, 1);
  EXPECT_EQ(pool->get_all_allocations().size(), 1);
}

TEST_F(WorktreePoolTest, GitFailureReleasesReservation)
{
  EXPECT_CALL(*git, add_worktree(_, _, _))
      .WillOnce(testing::Throw(git::GitError{"git worktree add", 128, "fatal: invalid reference"}))
      .WillOnce([](const std::string& path, const std::string&, const std::optional<std::string>&) {
        std::filesystem::create_directories(path);
      });

  EXPECT_THROW(pool->allocate("feature/x", "f1"), common::AllocationError);
  EXPECT_NO_THROW(pool->allocate("feature/x", "f1"));
}

TEST_F(WorktreePoolTest, Limit)
{
  cfg.max_per_repo = 2;
  WorktreePool limited{"limited", git, cfg, "main"};
  limited.initialize();

  limited.allocate("a", "f1");
  limited.allocate("b", "f1");
  EXPECT_THROW(limited.allocate("c", "f1"), common::AllocationError);
}

TEST_F(WorktreePoolTest, Release)
{
  auto alloc = pool->allocate("feature/x", "f1");
  EXPECT_CALL(*git, remove_worktree(alloc.worktree_path, false));
  EXPECT_CALL(*git, delete_branch(_, _)).Times(0);

  pool->release(alloc.id);

  EXPECT_FALSE(pool->get_allocation(alloc.id).has_value());
  EXPECT_FALSE(pool->find_by_branch("feature/x").has_value());
  EXPECT_THROW(pool->release(alloc.id), common::ObjectDoesNotExist);

  // The branch is free again.
  EXPECT_NO_THROW(pool->allocate("feature/x", "f1"));
}

TEST_F(WorktreePoolTest, ReleaseDeletesCreatedBranch)
{
  auto alloc = pool->allocate("feature/x", "f1");
  EXPECT_CALL(*git, delete_branch("feature/x", true));

  pool->release(alloc.id, ReleaseOptions{false, false});
}

TEST_F(WorktreePoolTest, DirtyReleaseFails)
{
  auto alloc = pool->allocate("feature/x", "f1");
  EXPECT_TRUE(pool->mark_dirty(alloc.id));
  EXPECT_CALL(*git, remove_worktree(_, _)).Times(0);

  try {
    pool->release(alloc.id);
    FAIL() << "Release of a dirty worktree succeeded";
  } catch (common::UncommittedChangesError& exc) {
    EXPECT_EQ(exc.repository, "backend");
    EXPECT_EQ(exc.path, alloc.worktree_path);
  }

  auto current = pool->get_allocation(alloc.id);
  ASSERT_TRUE(current.has_value());
  EXPECT_TRUE(current->allocated);
  EXPECT_TRUE(current->dirty);
}

TEST_F(WorktreePoolTest, UncommittedChangesDetected)
{
  auto alloc = pool->allocate("feature/x", "f1");
  ON_CALL(*git, has_changes(alloc.worktree_path)).WillByDefault(Return(true));

  EXPECT_THROW(pool->release(alloc.id), common::UncommittedChangesError);
  EXPECT_TRUE(pool->get_allocation(alloc.id)->dirty);

  EXPECT_CALL(*git, remove_worktree(alloc.worktree_path, true));
  pool->release(alloc.id, ReleaseOptions{true, true});
  EXPECT_TRUE(pool->get_all_allocations().empty());
}

TEST_F(WorktreePoolTest, MarkClean)
{
  auto alloc = pool->allocate("feature/x", "f1");
  pool->mark_dirty(alloc.id);
  EXPECT_TRUE(pool->mark_clean(alloc.id));
  EXPECT_NO_THROW(pool->release(alloc.id));

  EXPECT_FALSE(pool->mark_dirty("wt_unknown"));
  EXPECT_FALSE(pool->touch("wt_unknown"));
}

TEST_F(WorktreePoolTest, CleanupStale)
{
  auto old_alloc = pool->allocate("old", "f1");
  now += std::chrono::hours{20};
  auto fresh = pool->allocate("fresh", "f1");
  auto touched = pool->allocate("touched", "f1");
  pool->mark_dirty(old_alloc.id);

  now += std::chrono::hours{5};
  EXPECT_TRUE(pool->touch(touched.id));

  // old: 25h idle but dirty, fresh: 5h, touched: 0h
  EXPECT_EQ(pool->cleanup_stale(24), 0);
  EXPECT_TRUE(pool->get_allocation(old_alloc.id).has_value());
  EXPECT_TRUE(pool->get_allocation(old_alloc.id)->dirty);

  EXPECT_TRUE(pool->mark_clean(old_alloc.id));
  EXPECT_EQ(pool->cleanup_stale(24), 1);
  EXPECT_FALSE(pool->get_allocation(old_alloc.id).has_value());
  EXPECT_TRUE(pool->get_allocation(fresh.id).has_value());
  EXPECT_TRUE(pool->get_allocation(touched.id).has_value());

  now += std::chrono::hours{20};
  EXPECT_EQ(pool->cleanup_stale(24), 1);
  EXPECT_TRUE(pool->get_allocation(touched.id).has_value());
}

TEST_F(WorktreePoolTest, CleanupByOwner)
{
  pool->allocate("a", "f1", "agent-1");
  pool->allocate("b", "f1", "agent-2");
  pool->allocate("c", "f2", "agent-2");

  EXPECT_EQ(pool->cleanup_agent("agent-1"), 1);
  EXPECT_EQ(pool->cleanup_feature("f2"), 1);
  EXPECT_EQ(pool->get_all_allocations().size(), 1);

  auto stats = pool->get_stats();
  EXPECT_EQ(stats.total, 1);
  EXPECT_EQ(stats.by_feature["f1"], 1);

  EXPECT_EQ(pool->release_all(true), 1);
  EXPECT_EQ(pool->get_stats().total, 0);
}

TEST_F(WorktreePoolTest, SyncWithDisk)
{
  auto kept = pool->allocate("a", "f1");
  auto removed = pool->allocate("b", "f1");
  std::filesystem::remove_all(removed.worktree_path);

  EXPECT_CALL(*git, prune_worktrees());
  EXPECT_EQ(pool->sync_with_disk(), 1);
  EXPECT_TRUE(pool->get_allocation(kept.id).has_value());
  EXPECT_FALSE(pool->get_allocation(removed.id).has_value());
}

TEST_F(WorktreePoolTest, ReleaseMissingDirectory)
{
  auto alloc = pool->allocate("a", "f1");
  std::filesystem::remove_all(alloc.worktree_path);

  EXPECT_CALL(*git, remove_worktree(_, _)).Times(0);
  EXPECT_CALL(*git, prune_worktrees());
  pool->release(alloc.id);
  EXPECT_TRUE(pool->get_all_allocations().empty());
}

TEST_F(WorktreePoolTest, Events)
{
  std::vector<common::events::EventType> published;
  ON_CALL(events, publish(_)).WillByDefault([&](const common::events::Event& event) {
    published.push_back(event.type());
  });

  auto alloc = pool->allocate("a", "f1");
  pool->release(alloc.id);

  EXPECT_EQ(
      published, (std::vector<common::events::EventType>{
                     common::events::EventType::GIT_WORKTREE_CREATED,
                     common::events::EventType::GIT_WORKTREE_REMOVED})
  );
}
