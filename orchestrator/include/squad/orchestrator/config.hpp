#ifndef SQUAD_ORCHESTRATOR_CONFIG_HPP
#define SQUAD_ORCHESTRATOR_CONFIG_HPP

#include <squad/orchestrator/process_pool.hpp>

#include <optional>
#include <string>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace squad::orchestrator::config {

  struct Orchestrator {

    static constexpr int DEFAULT_BUFFER_CAPACITY = 100;
    static constexpr int DEFAULT_KILL_GRACE_PERIOD = 5000;
    static constexpr const char* DEFAULT_BINARY = "claude";
    static constexpr const char* DEFAULT_TOKEN_VARIABLE = "ANTHROPIC_API_KEY";

    Orchestrator()
    {
      set_defaults();
    }

    std::string binary;
    int buffer_capacity;
    std::optional<std::string> default_model;

    // Milliseconds between a kill request and escalation to SIGKILL.
    int kill_grace_period;

    // Workers running at once; further spawns wait in the queue.
    int max_concurrent;
    QueueStrategy queue_strategy;

    std::string token_variable;
    std::string credential_service;
    std::string credential_account;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

} // namespace squad::orchestrator::config

#endif
