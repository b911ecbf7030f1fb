#include <squad/cli/config.hpp>

#include <squad/common/exceptions.hpp>
#include <squad/common/util.hpp>

#include <fstream>

#include <cereal/archives/json.hpp>
#include <cxxopts.hpp>
#include <fmt/format.h>

namespace squad::cli::config {

  void Config::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_optional_value(archive, "verbose", verbose);
    common::util::cereal_load_optional(archive, "orchestrator", orchestrator);
    common::util::cereal_load_optional(archive, "worktrees", worktrees);

    // Without a primary repository there is nothing to work on.
    try {
      archive(cereal::make_nvp("workspace", workspace));
    } catch (cereal::Exception& exc) {
      throw common::InvalidConfigurationError{
          fmt::format("Could not parse workspace configuration, reason: {}", exc.what())};
    }
  }

  void Config::set_defaults()
  {
    verbose = false;
    orchestrator.set_defaults();
    worktrees.set_defaults();
    workspace.set_defaults();
  }

  Config Config::deserialize(std::istream& in)
  {
    Config cfg;
    cfg.set_defaults();
    try {
      cereal::JSONInputArchive archive_in(in);
      cfg.load(archive_in);
    } catch (cereal::Exception& exc) {
      throw common::InvalidConfigurationError{
          fmt::format("Could not parse configuration, reason: {}", exc.what())};
    } catch (cereal::RapidJSONException& exc) {
      throw common::InvalidConfigurationError{
          fmt::format("Configuration is not valid JSON: {}", exc.what())};
    }
    return cfg;
  }

  Config Config::deserialize(const std::string& path)
  {
    std::ifstream in_stream{path};
    if (!in_stream.is_open()) {
      throw common::InvalidConfigurationError{fmt::format("Could not open config file {}", path)};
    }
    return deserialize(in_stream);
  }

  Options Options::parse(int argc, char** argv)
  {
    cxxopts::Options options("squad", "Runs an agent on a feature branch across repositories.");
    // clang-format off
    options.add_options()
      ("c,config", "JSON config.", cxxopts::value<std::string>())
      ("f,feature", "Feature branch.", cxxopts::value<std::string>())
      ("t,task", "Task given to the agent.", cxxopts::value<std::string>())
      ("agent", "Agent identifier.", cxxopts::value<std::string>()->default_value(DEFAULT_AGENT))
      ("model", "Model name or alias.", cxxopts::value<std::string>())
      ("max-turns", "Turn limit of the agent.", cxxopts::value<int>())
      ("timeout", "Seconds before the agent is killed.", cxxopts::value<int>())
      ("m,message", "Commit message.", cxxopts::value<std::string>()->default_value(DEFAULT_COMMIT_MESSAGE))
      ("pr", "Open pull requests for changed repositories.", cxxopts::value<bool>()->default_value("false"))
      ("keep", "Keep the worktrees after the run.", cxxopts::value<bool>()->default_value("false"))
      ("v,verbose", "Debug logging.", cxxopts::value<bool>()->default_value("false"))
      ("h,help", "Print usage.");
    // clang-format on

    Options result;
    result.usage = options.help();

    cxxopts::ParseResult parsed;
    try {
      parsed = options.parse(argc, argv);
    } catch (std::exception& exc) {
      throw common::InvalidConfigurationError{exc.what()};
    }

    if (parsed.count("help")) {
      result.help = true;
      return result;
    }

    for (const char* required : {"config", "feature", "task"}) {
      if (!parsed.count(required)) {
        throw common::InvalidConfigurationError{
            fmt::format("Missing required option --{}", required)};
      }
    }

    result.config_file = parsed["config"].as<std::string>();
    result.feature = parsed["feature"].as<std::string>();
    result.task = parsed["task"].as<std::string>();
    result.agent = parsed["agent"].as<std::string>();
    result.message = parsed["message"].as<std::string>();
    result.pull_requests = parsed["pr"].as<bool>();
    result.keep = parsed["keep"].as<bool>();
    result.verbose = parsed["verbose"].as<bool>();

    if (parsed.count("model")) {
      result.model = parsed["model"].as<std::string>();
    }
    if (parsed.count("max-turns")) {
      result.max_turns = parsed["max-turns"].as<int>();
    }
    if (parsed.count("timeout")) {
      int timeout = parsed["timeout"].as<int>();
      if (timeout <= 0) {
        throw common::InvalidConfigurationError{"Timeout must be positive"};
      }
      result.timeout = timeout;
    }

    return result;
  }

} // namespace squad::cli::config
