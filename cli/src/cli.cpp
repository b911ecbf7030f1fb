#include <squad/cli/config.hpp>
#include <squad/common/credentials.hpp>
#include <squad/common/events.hpp>
#include <squad/common/exceptions.hpp>
#include <squad/orchestrator/orchestrator.hpp>
#include <squad/workspace/coordinator.hpp>
#include <squad/workspace/git.hpp>
#include <squad/workspace/pull_request.hpp>

#include <chrono>
#include <csignal>
#include <iostream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

  volatile std::sig_atomic_t interrupted = 0;

  constexpr std::chrono::milliseconds WAIT_INTERVAL{100};

} // namespace

void signal_handler(int /*unused*/)
{
  interrupted = 1;
}

using namespace squad;

// Runs until the worker finishes, the timeout elapses or SIGINT arrives.
// Returns only after the child has exited so that nothing writes to the
// worktrees while they are committed.
std::optional<orchestrator::process::ProcessInfo> wait_for_worker(
    orchestrator::Orchestrator& agents, const std::string& id, std::optional<int> timeout
)
{
  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (timeout.has_value()) {
    deadline = std::chrono::steady_clock::now() + std::chrono::seconds{*timeout};
  }

  while (true) {

    auto info = agents.wait_for_exit(id, WAIT_INTERVAL);
    if (info.has_value()) {
      return info;
    }

    if (interrupted) {
      spdlog::warn("Interrupted, stopping the agent");
      agents.kill(id);
      return agents.wait_for_exit(id);
    }

    if (deadline.has_value() && std::chrono::steady_clock::now() > *deadline) {
      spdlog::warn("Agent exceeded the timeout of {} seconds", *timeout);
      agents.kill(id);
      return agents.wait_for_exit(id);
    }
  }
}

int run(const cli::config::Options& opts, const cli::config::Config& cfg)
{
  common::events::EventBus events;
  common::credentials::EnvironmentCredentialStore credentials;
  workspace::GhCliProvider pull_requests;

  workspace::Coordinator coordinator{
      cfg.worktrees,
      [](const workspace::config::Repository& repo) {
        return std::make_shared<workspace::git::CommandLineGit>(repo.path);
      },
      &pull_requests, &events};
  orchestrator::Orchestrator agents{cfg.orchestrator, &events, &credentials};

  coordinator.initialize_workspace(cfg.workspace);
  auto worktree = coordinator.create_multi_repo_worktree(opts.feature, opts.feature, opts.agent);

  const auto& primary = cfg.workspace.primary.name;
  orchestrator::SpawnOptions spawn_options;
  spawn_options.agent.id = opts.agent;
  spawn_options.agent.name = opts.agent;
  spawn_options.task = opts.task;
  spawn_options.working_directory = worktree.worktrees.at(primary).worktree_path;
  spawn_options.model = opts.model;
  spawn_options.max_turns = opts.max_turns;
  spawn_options.verbose = opts.verbose;

  orchestrator::process::ProcessInfo process;
  try {
    process = agents.spawn(spawn_options);
  } catch (common::SpawnError&) {
    coordinator.release_multi_repo_worktree(opts.feature, true);
    throw;
  }
  spdlog::info("Started agent {} as process {} (pid {})", opts.agent, process.id, process.pid);

  auto subscription = agents.subscribe(process.id, [](const orchestrator::OutputChunk& chunk) {
    std::cout << fmt::format("[{}] {}", orchestrator::to_string(chunk.kind), chunk.content)
              << std::endl;
  });

  auto result = wait_for_worker(agents, process.id, opts.timeout);
  if (subscription.has_value()) {
    process.output->unsubscribe(*subscription);
  }

  int exit_code = 0;
  if (result.has_value()) {
    spdlog::info(
        "Agent finished in state {}, cost ${:.4f}", orchestrator::process::to_string(result->state),
        result->total_cost
    );
    if (result->state != orchestrator::process::State::COMPLETED) {
      exit_code = 1;
    }
  }

  for (const auto& commit : coordinator.commit_all(opts.message, opts.feature)) {
    if (commit.success()) {
      std::cout << fmt::format("{}: committed {}", commit.repository, *commit.commit) << std::endl;
    } else {
      std::cout << fmt::format("{}: {}", commit.repository, commit.error->what()) << std::endl;
    }
  }

  if (opts.pull_requests) {
    workspace::Feature feature{opts.feature, opts.feature, opts.task, opts.feature};
    auto prs = coordinator.create_multi_repo_prs(feature);
    for (const auto& pr : prs.pull_requests) {
      std::cout << fmt::format("{}: pull request #{} {}", pr.repository, pr.number, pr.url)
                << std::endl;
    }
    for (const auto& [repo, failure] : prs.failures) {
      std::cout << fmt::format("{}: pull request failed: {}", repo, failure) << std::endl;
      exit_code = 1;
    }
  }

  std::cout << fmt::format("Total cost: ${:.4f}", agents.get_total_cost(process.id))
            << std::endl;

  if (!opts.keep) {
    try {
      coordinator.release_multi_repo_worktree(opts.feature);
    } catch (common::UncommittedChangesError& exc) {
      spdlog::warn("{}; worktrees are kept for inspection", exc.what());
    }
  }

  agents.shutdown();
  return exit_code;
}

int main(int argc, char** argv)
{
  cli::config::Options opts;
  cli::config::Config cfg;
  try {
    opts = cli::config::Options::parse(argc, argv);
    if (opts.help) {
      std::cout << opts.usage << std::endl;
      return 0;
    }
    cfg = cli::config::Config::deserialize(opts.config_file);
  } catch (common::InvalidConfigurationError& exc) {
    spdlog::error("{}", exc.what());
    return 2;
  }

  if (cfg.verbose || opts.verbose) {
    spdlog::set_level(spdlog::level::debug);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
  spdlog::set_pattern("[%H:%M:%S:%f] [P %P] [T %t] [%l] %v ");

  // Catch SIGINT
  struct sigaction sigIntHandler {};
  sigIntHandler.sa_handler = &signal_handler;
  sigemptyset(&sigIntHandler.sa_mask);
  sigIntHandler.sa_flags = 0;
  sigaction(SIGINT, &sigIntHandler, nullptr);

  try {
    return run(opts, cfg);
  } catch (common::SquadException& exc) {
    spdlog::error("{}", exc.what());
    return 1;
  }
}
