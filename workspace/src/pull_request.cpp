#include <squad/workspace/pull_request.hpp>

#include <squad/common/subprocess.hpp>
#include <squad/common/util.hpp>

#include <charconv>

#include <fmt/format.h>

namespace squad::workspace {

  std::string to_string(PullRequestState state)
  {
    switch (state) {
    case PullRequestState::OPEN:
      return "open";
    case PullRequestState::CLOSED:
      return "closed";
    case PullRequestState::MERGED:
      return "merged";
    }
    return "unknown";
  }

  std::optional<int> parse_pull_request_url(std::string_view url)
  {
    for (std::string_view marker : {"/pull/", "/merge_requests/"}) {

      auto pos = url.rfind(marker);
      if (pos == std::string_view::npos) {
        continue;
      }

      auto digits = url.substr(pos + marker.size());
      int number = 0;
      auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), number);
      if (ec != std::errc{} || ptr == digits.data() || number <= 0) {
        return std::nullopt;
      }
      return number;
    }
    return std::nullopt;
  }

  GhCliProvider::GhCliProvider(std::string binary) : _binary(std::move(binary))
  {
    _logger = common::util::create_logger("GhCliProvider");
  }

  PullRequest GhCliProvider::create(const PullRequestRequest& request)
  {
    std::vector<std::string> argv{_binary,       "pr",         "create",       "--title",
                                  request.title, "--body",     request.body,   "--head",
                                  request.head,  "--base",     request.base};

    common::CommandResult result;
    try {
      result = common::run_command(argv, request.worktree_path);
    } catch (common::SpawnError& exc) {
      throw PullRequestError{fmt::format(
          "Could not run {} for repository {}: {}", _binary, request.repository, exc.what()
      )};
    }

    if (!result.success()) {
      throw PullRequestError{fmt::format(
          "Creating pull request for {} failed with code {}: {}", request.repository,
          result.exit_code, result.err
      )};
    }

    // The client prints the URL of the new request as its last line.
    std::string url;
    size_t end = result.out.size();
    while (end > 0) {
      size_t begin = result.out.rfind('\n', end - 1);
      begin = begin == std::string::npos ? 0 : begin + 1;
      std::string line = result.out.substr(begin, end - begin);
      while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
      }
      if (!line.empty()) {
        url = std::move(line);
        break;
      }
      end = begin == 0 ? 0 : begin - 1;
    }

    auto number = parse_pull_request_url(url);
    if (!number.has_value()) {
      throw PullRequestError{fmt::format(
          "Unexpected output while creating pull request for {}: {}", request.repository,
          result.out
      )};
    }

    _logger->info("Opened pull request {} for {}", url, request.repository);
    return PullRequest{
        request.repository, *number, url, request.title, PullRequestState::OPEN,
        request.head,       request.base};
  }

} // namespace squad::workspace
