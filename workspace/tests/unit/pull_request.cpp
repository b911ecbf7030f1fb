#include <squad/workspace/pull_request.hpp>

#include <gtest/gtest.h>

using namespace squad::workspace;

TEST(PullRequest, ParseUrl)
{
  EXPECT_EQ(parse_pull_request_url("https://github.com/org/app/pull/42"), 42);
  EXPECT_EQ(parse_pull_request_url("https://gitlab.com/org/app/-/merge_requests/7"), 7);
  EXPECT_FALSE(parse_pull_request_url("https://github.com/org/app").has_value());
  EXPECT_FALSE(parse_pull_request_url("https://github.com/org/app/pull/abc").has_value());
  EXPECT_FALSE(parse_pull_request_url("").has_value());
}

TEST(PullRequest, States)
{
  EXPECT_EQ(to_string(PullRequestState::OPEN), "open");
  EXPECT_EQ(to_string(PullRequestState::MERGED), "merged");
}

TEST(PullRequest, MissingClient)
{
  GhCliProvider provider{"squad-no-such-gh-binary"};
  PullRequestRequest request{"app", "/tmp", "title", "body", "feature/x", "main"};
  EXPECT_THROW(provider.create(request), PullRequestError);
}
