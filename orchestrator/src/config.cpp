#include <squad/orchestrator/config.hpp>

#include <squad/common/exceptions.hpp>
#include <squad/common/util.hpp>

#include <cereal/archives/json.hpp>
#include <fmt/format.h>

namespace squad::orchestrator::config {

  void Orchestrator::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_optional_value(archive, "binary", binary);
    common::util::cereal_load_optional_value(archive, "buffer-capacity", buffer_capacity);
    common::util::cereal_load_optional_value(archive, "kill-grace-period", kill_grace_period);
    common::util::cereal_load_optional_value(archive, "max-concurrent", max_concurrent);
    common::util::cereal_load_optional_value(archive, "token-variable", token_variable);
    common::util::cereal_load_optional_value(archive, "credential-service", credential_service);
    common::util::cereal_load_optional_value(archive, "credential-account", credential_account);

    std::string model;
    common::util::cereal_load_optional_value(archive, "default-model", model);
    if (!model.empty()) {
      default_model = std::move(model);
    }

    std::string strategy;
    common::util::cereal_load_optional_value(archive, "queue-strategy", strategy);
    if (!strategy.empty()) {
      auto parsed = queue_strategy_from_string(strategy);
      if (!parsed.has_value()) {
        throw common::InvalidConfigurationError{
            fmt::format("Unknown queue strategy {}, expected fifo or priority", strategy)};
      }
      queue_strategy = *parsed;
    }

    if (buffer_capacity <= 0) {
      throw common::InvalidConfigurationError{"Output buffer capacity must be positive"};
    }
    if (kill_grace_period < 0) {
      throw common::InvalidConfigurationError{"Kill grace period cannot be negative"};
    }
    if (max_concurrent < 1) {
      throw common::InvalidConfigurationError{"At least one concurrent worker must be allowed"};
    }
  }

  void Orchestrator::set_defaults()
  {
    binary = DEFAULT_BINARY;
    buffer_capacity = DEFAULT_BUFFER_CAPACITY;
    default_model = std::nullopt;
    kill_grace_period = DEFAULT_KILL_GRACE_PERIOD;
    max_concurrent = ProcessPool::DEFAULT_MAX_CONCURRENT;
    queue_strategy = QueueStrategy::FIFO;
    token_variable = DEFAULT_TOKEN_VARIABLE;
    credential_service = "squad";
    credential_account = "anthropic";
  }

} // namespace squad::orchestrator::config
