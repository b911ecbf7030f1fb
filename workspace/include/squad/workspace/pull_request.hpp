#ifndef SQUAD_WORKSPACE_PULL_REQUEST_HPP
#define SQUAD_WORKSPACE_PULL_REQUEST_HPP

#include <squad/common/exceptions.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace squad::workspace {

  struct PullRequestError : common::SquadException {

    PullRequestError(const std::string& msg) : common::SquadException(msg) {}
  };

  enum class PullRequestState { OPEN = 0, CLOSED, MERGED };

  std::string to_string(PullRequestState state);

  struct PullRequest {
    std::string repository;
    int number = 0;
    std::string url;
    std::string title;
    PullRequestState state = PullRequestState::OPEN;
    std::string head;
    std::string base;
  };

  struct PullRequestRequest {
    std::string repository;
    std::string worktree_path;
    std::string title;
    std::string body;
    std::string head;
    std::string base;
  };

  // Number of a pull or merge request URL, e.g. https://github.com/org/repo/pull/42
  std::optional<int> parse_pull_request_url(std::string_view url);

  class PullRequestProvider {
  public:
    virtual ~PullRequestProvider() = default;

    // Opens a request from head to base; throws PullRequestError.
    virtual PullRequest create(const PullRequestRequest& request) = 0;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Opens pull requests with the `gh` command-line client, running in the
  /// worktree so that the client resolves the remote on its own.
  ////////////////////////////////////////////////////////////////////////////////
  class GhCliProvider : public PullRequestProvider {
  public:
    GhCliProvider(std::string binary = "gh");

    PullRequest create(const PullRequestRequest& request) override;

  private:
    std::string _binary;
    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace squad::workspace

#endif
