#include <squad/cli/config.hpp>
#include <squad/common/exceptions.hpp>

#include <sstream>

#include <gtest/gtest.h>

using namespace squad;
using namespace squad::cli::config;

namespace {

  Options parse(std::vector<std::string> args)
  {
    args.insert(args.begin(), "squad");
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(arg.data());
    }
    return Options::parse(static_cast<int>(argv.size()), argv.data());
  }

} // namespace

TEST(CliConfig, Deserialize)
{
  std::stringstream in{R"({
    "verbose": true,
    "orchestrator": {"binary": "/opt/agent", "buffer-capacity": 10},
    "worktrees": {"root": "/tmp/squad", "max-per-repo": 3},
    "workspace": {
      "primary": {"path": "/src/app"},
      "dependencies": [{"name": "shared", "path": "/src/lib", "default-branch": "develop"}]
    }
  })"};

  auto cfg = Config::deserialize(in);
  EXPECT_TRUE(cfg.verbose);
  EXPECT_EQ(cfg.orchestrator.binary, "/opt/agent");
  EXPECT_EQ(cfg.orchestrator.buffer_capacity, 10);
  EXPECT_EQ(
      cfg.orchestrator.kill_grace_period,
      orchestrator::config::Orchestrator::DEFAULT_KILL_GRACE_PERIOD
  );
  EXPECT_EQ(cfg.worktrees.root, "/tmp/squad");
  EXPECT_EQ(cfg.worktrees.max_per_repo, 3);

  auto repos = cfg.workspace.repositories();
  ASSERT_EQ(repos.size(), 2);
  EXPECT_EQ(repos[0].name, "primary");
  EXPECT_EQ(repos[0].path, "/src/app");
  EXPECT_EQ(repos[1].name, "shared");
  EXPECT_EQ(repos[1].default_branch, "develop");
}

TEST(CliConfig, DeserializeFailures)
{
  {
    std::stringstream in{R"({"verbose": false})"};
    EXPECT_THROW(Config::deserialize(in), common::InvalidConfigurationError);
  }

  {
    std::stringstream in{R"({"workspace": )"};
    EXPECT_THROW(Config::deserialize(in), common::InvalidConfigurationError);
  }

  {
    std::stringstream in{
        R"({"worktrees": {"max-per-repo": 0}, "workspace": {"primary": {"path": "/src/app"}}})"};
    EXPECT_THROW(Config::deserialize(in), common::InvalidConfigurationError);
  }

  EXPECT_THROW(
      Config::deserialize(std::string{"/nonexistent/squad.json"}),
      common::InvalidConfigurationError
  );
}

TEST(CliOptions, Parse)
{
  auto options = parse(
      {"-c", "squad.json", "-f", "feature/login", "-t", "Add a login page", "--model", "opus",
       "--max-turns", "5", "--timeout", "60", "--pr", "--keep"}
  );

  EXPECT_FALSE(options.help);
  EXPECT_EQ(options.config_file, "squad.json");
  EXPECT_EQ(options.feature, "feature/login");
  EXPECT_EQ(options.task, "Add a login page");
  EXPECT_EQ(options.agent, Options::DEFAULT_AGENT);
  EXPECT_EQ(options.model, "opus");
  EXPECT_EQ(options.max_turns, 5);
  EXPECT_EQ(options.timeout, 60);
  EXPECT_EQ(options.message, Options::DEFAULT_COMMIT_MESSAGE);
  EXPECT_TRUE(options.pull_requests);
  EXPECT_TRUE(options.keep);
  EXPECT_FALSE(options.verbose);
}

TEST(CliOptions, Help)
{
  auto options = parse({"--help"});
  EXPECT_TRUE(options.help);
  EXPECT_FALSE(options.usage.empty());
}

TEST(CliOptions, Failures)
{
  EXPECT_THROW(parse({"-c", "squad.json", "-f", "feature"}), common::InvalidConfigurationError);
  EXPECT_THROW(
      parse({"-c", "squad.json", "-f", "feature", "-t", "task", "--timeout", "0"}),
      common::InvalidConfigurationError
  );
  EXPECT_THROW(
      parse({"-c", "squad.json", "-f", "feature", "-t", "task", "--max-turns", "many"}),
      common::InvalidConfigurationError
  );
}
