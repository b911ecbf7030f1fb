#ifndef SQUAD_ORCHESTRATOR_ARGS_HPP
#define SQUAD_ORCHESTRATOR_ARGS_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace squad::orchestrator {

  struct AgentDescriptor {
    std::string id;
    std::string name;
    std::optional<std::string> model;
    std::optional<int> max_turns;
    std::optional<std::string> system_prompt;
    std::map<std::string, std::string> environment;
  };

  struct SpawnOptions {
    AgentDescriptor agent;
    std::string task;
    std::string working_directory;

    // Options below override the agent's defaults.
    std::optional<std::string> model;
    std::optional<int> max_turns;
    std::vector<std::string> extra_args;

    std::optional<std::string> resume_session;
    std::optional<std::string> append_system_prompt;
    std::vector<std::string> allowed_tools;
    std::vector<std::string> disallowed_tools;
    std::optional<std::string> permission_mode;
    bool verbose = false;

    // Queue position when the process pool is full.
    int priority = 0;
  };

  // Maps short aliases (sonnet, opus, haiku) to full model identifiers.
  std::string resolve_model(const std::string& model);

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Builds the argument vector of the worker, without the binary itself.
  /// The task is always the last argument.
  ///
  /// @param[in] options spawn request
  /// @param[in] default_model model used when neither options nor agent select one
  ////////////////////////////////////////////////////////////////////////////////
  std::vector<std::string>
  build_arguments(const SpawnOptions& options, const std::optional<std::string>& default_model);

} // namespace squad::orchestrator

#endif
