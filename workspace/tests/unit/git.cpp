#include <squad/workspace/git.hpp>

#include <gtest/gtest.h>

using namespace squad::workspace::git;

TEST(Git, ParseWorktreeList)
{
  std::string output = "worktree /repo\n"
                       "HEAD 1111111111111111111111111111111111111111\n"
                       "branch refs/heads/main\n"
                       "\n"
                       "worktree /worktrees/repo/feature-x\n"
                       "HEAD 2222222222222222222222222222222222222222\n"
                       "branch refs/heads/feature/x\n"
                       "locked\n"
                       "\n"
                       "worktree /worktrees/repo/detached\n"
                       "HEAD 3333333333333333333333333333333333333333\n"
                       "detached\n"
                       "prunable gitdir file points to non-existent location\n";

  auto worktrees = parse_worktree_list(output);
  ASSERT_EQ(worktrees.size(), 3);

  EXPECT_EQ(worktrees[0].path, "/repo");
  EXPECT_EQ(worktrees[0].branch, "main");
  EXPECT_EQ(worktrees[0].head, "1111111111111111111111111111111111111111");

  EXPECT_EQ(worktrees[1].branch, "feature/x");
  EXPECT_TRUE(worktrees[1].locked);

  EXPECT_FALSE(worktrees[2].branch.has_value());
  EXPECT_TRUE(worktrees[2].detached);
  EXPECT_TRUE(worktrees[2].prunable);
}

TEST(Git, ParseBareRepository)
{
  auto worktrees = parse_worktree_list("worktree /repo.git\nbare\n\n");
  ASSERT_EQ(worktrees.size(), 1);
  EXPECT_TRUE(worktrees[0].bare);
}

TEST(Git, ParseStatus)
{
  std::string output = "# branch.oid 1111111111111111111111111111111111111111\n"
                       "# branch.head feature/x\n"
                       "# branch.upstream origin/feature/x\n"
                       "# branch.ab +2 -1\n"
                       "1 .M N... 100644 100644 100644 aaaaaaa aaaaaaa src/main.cpp\n"
                       "1 A. N... 000000 100644 100644 0000000 bbbbbbb include/new file.hpp\n"
                       "2 R. N... 100644 100644 100644 ccccccc ccccccc R100 renamed.cpp\told.cpp\n"
                       "? untracked.txt\n";

  auto status = parse_status(output);

  EXPECT_EQ(status.branch, "feature/x");
  EXPECT_EQ(status.upstream, "origin/feature/x");
  EXPECT_EQ(status.ahead, 2);
  EXPECT_EQ(status.behind, 1);
  EXPECT_FALSE(status.clean());

  ASSERT_EQ(status.files.size(), 4);
  EXPECT_EQ(status.files[0].path, "src/main.cpp");
  EXPECT_EQ(status.files[0].index, '.');
  EXPECT_EQ(status.files[0].worktree, 'M');
  EXPECT_EQ(status.files[1].path, "include/new file.hpp");
  EXPECT_EQ(status.files[1].index, 'A');
  EXPECT_EQ(status.files[2].path, "renamed.cpp");
  EXPECT_EQ(status.files[3].path, "untracked.txt");
  EXPECT_EQ(status.files[3].index, '?');
}

TEST(Git, ParseCleanDetachedStatus)
{
  auto status = parse_status("# branch.oid 1111111\n# branch.head (detached)\n");
  EXPECT_FALSE(status.branch.has_value());
  EXPECT_TRUE(status.clean());
  EXPECT_EQ(status.ahead, 0);
}

TEST(Git, ErrorMessage)
{
  GitError error{"git worktree add", 128, "fatal: already exists"};
  EXPECT_EQ(error.exit_code, 128);
  EXPECT_NE(std::string{error.what()}.find("fatal: already exists"), std::string::npos);
}
