#include <squad/orchestrator/args.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace squad::orchestrator {

  std::string resolve_model(const std::string& model)
  {
    static const std::map<std::string, std::string> MODELS = {
        {"sonnet", "claude-sonnet-4-20250514"},
        {"opus", "claude-opus-4-20250514"},
        {"haiku", "claude-haiku-3-5-20250620"}};

    auto it = MODELS.find(model);
    return it != MODELS.end() ? it->second : model;
  }

  std::vector<std::string>
  build_arguments(const SpawnOptions& options, const std::optional<std::string>& default_model)
  {
    std::vector<std::string> args{"-p", "--output-format", "stream-json"};

    std::optional<std::string> model = options.model;
    if (!model.has_value()) {
      model = options.agent.model.has_value() ? options.agent.model : default_model;
    }
    if (model.has_value() && !model->empty()) {
      args.emplace_back("--model");
      args.push_back(resolve_model(*model));
    }

    std::optional<int> max_turns = options.max_turns ? options.max_turns : options.agent.max_turns;
    if (max_turns.has_value() && *max_turns > 0) {
      args.emplace_back("--max-turns");
      args.push_back(std::to_string(*max_turns));
    }

    if (options.resume_session.has_value()) {
      args.emplace_back("--resume");
      args.push_back(*options.resume_session);
    }

    if (options.agent.system_prompt.has_value()) {
      args.emplace_back("--system-prompt");
      args.push_back(*options.agent.system_prompt);
    }

    if (options.append_system_prompt.has_value()) {
      args.emplace_back("--append-system-prompt");
      args.push_back(*options.append_system_prompt);
    }

    if (!options.allowed_tools.empty()) {
      args.emplace_back("--allowedTools");
      args.push_back(fmt::format("{}", fmt::join(options.allowed_tools, ",")));
    }

    if (!options.disallowed_tools.empty()) {
      args.emplace_back("--disallowedTools");
      args.push_back(fmt::format("{}", fmt::join(options.disallowed_tools, ",")));
    }

    if (options.permission_mode.has_value()) {
      args.emplace_back("--permission-mode");
      args.push_back(*options.permission_mode);
    }

    if (options.verbose) {
      args.emplace_back("--verbose");
    }

    args.insert(args.end(), options.extra_args.begin(), options.extra_args.end());
    args.push_back(options.task);

    return args;
  }

} // namespace squad::orchestrator
