#include <squad/common/exceptions.hpp>
#include <squad/orchestrator/config.hpp>

#include <sstream>

#include <cereal/archives/json.hpp>
#include <gtest/gtest.h>

using namespace squad::orchestrator::config;

namespace {

  Orchestrator load(const std::string& json)
  {
    std::stringstream stream{json};
    cereal::JSONInputArchive archive{stream};
    Orchestrator cfg;
    cfg.load(archive);
    return cfg;
  }

} // namespace

TEST(Config, Defaults)
{
  Orchestrator cfg = load("{}");

  EXPECT_EQ(cfg.binary, Orchestrator::DEFAULT_BINARY);
  EXPECT_EQ(cfg.buffer_capacity, Orchestrator::DEFAULT_BUFFER_CAPACITY);
  EXPECT_EQ(cfg.kill_grace_period, Orchestrator::DEFAULT_KILL_GRACE_PERIOD);
  EXPECT_EQ(cfg.token_variable, Orchestrator::DEFAULT_TOKEN_VARIABLE);
  EXPECT_FALSE(cfg.default_model.has_value());
  EXPECT_EQ(cfg.max_concurrent, squad::orchestrator::ProcessPool::DEFAULT_MAX_CONCURRENT);
  EXPECT_EQ(cfg.queue_strategy, squad::orchestrator::QueueStrategy::FIFO);
}

TEST(Config, Values)
{
  Orchestrator cfg = load(R"(
    {
      "binary": "/opt/agent/bin/claude",
      "buffer-capacity": 500,
      "kill-grace-period": 250,
      "default-model": "opus",
      "credential-service": "team",
      "credential-account": "bot",
      "max-concurrent": 2,
      "queue-strategy": "priority"
    }
  )");

  EXPECT_EQ(cfg.binary, "/opt/agent/bin/claude");
  EXPECT_EQ(cfg.buffer_capacity, 500);
  EXPECT_EQ(cfg.kill_grace_period, 250);
  EXPECT_EQ(cfg.default_model, "opus");
  EXPECT_EQ(cfg.credential_service, "team");
  EXPECT_EQ(cfg.credential_account, "bot");
  EXPECT_EQ(cfg.max_concurrent, 2);
  EXPECT_EQ(cfg.queue_strategy, squad::orchestrator::QueueStrategy::PRIORITY);
}

TEST(Config, Invalid)
{
  EXPECT_THROW(load(R"({"buffer-capacity": 0})"), squad::common::InvalidConfigurationError);
  EXPECT_THROW(load(R"({"kill-grace-period": -1})"), squad::common::InvalidConfigurationError);
  EXPECT_THROW(load(R"({"buffer-capacity": "many"})"), squad::common::InvalidConfigurationError);
  EXPECT_THROW(load(R"({"max-concurrent": 0})"), squad::common::InvalidConfigurationError);
  EXPECT_THROW(load(R"({"queue-strategy": "lifo"})"), squad::common::InvalidConfigurationError);
}
