#ifndef SQUAD_CLI_CONFIG_HPP
#define SQUAD_CLI_CONFIG_HPP

#include <squad/orchestrator/config.hpp>
#include <squad/workspace/config.hpp>

#include <istream>
#include <optional>
#include <string>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace squad::cli::config {

  struct Config {

    bool verbose = false;
    orchestrator::config::Orchestrator orchestrator;
    workspace::config::WorktreePool worktrees;
    workspace::config::Workspace workspace;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();

    static Config deserialize(std::istream& in);
    static Config deserialize(const std::string& path);
  };

  // Command-line options of a single feature run.
  struct Options {

    static constexpr const char* DEFAULT_AGENT = "squad-agent";
    static constexpr const char* DEFAULT_COMMIT_MESSAGE = "Agent changes";

    std::string config_file;
    std::string feature;
    std::string task;
    std::string agent = DEFAULT_AGENT;
    std::optional<std::string> model;
    std::optional<int> max_turns;
    // Seconds; the worker is killed when it runs longer.
    std::optional<int> timeout;
    std::string message = DEFAULT_COMMIT_MESSAGE;
    bool pull_requests = false;
    bool keep = false;
    bool verbose = false;

    bool help = false;
    std::string usage;

    // Throws InvalidConfigurationError on missing or malformed arguments.
    static Options parse(int argc, char** argv);
  };

} // namespace squad::cli::config

#endif
