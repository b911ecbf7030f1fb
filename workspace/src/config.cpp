#include <squad/workspace/config.hpp>

#include <squad/common/exceptions.hpp>
#include <squad/common/util.hpp>

#include <cstdlib>
#include <filesystem>

#include <cereal/archives/json.hpp>
#include <cereal/types/vector.hpp>

namespace squad::workspace::config {

  std::string to_string(Role role)
  {
    return role == Role::PRIMARY ? "primary" : "dependency";
  }

  Role deserialize_role(const std::string& role)
  {
    if (role == "primary") {
      return Role::PRIMARY;
    }
    if (role == "dependency") {
      return Role::DEPENDENCY;
    }
    throw common::InvalidConfigurationError{"Unknown repository role " + role};
  }

  void Repository::load(cereal::JSONInputArchive& archive)
  {
    archive(cereal::make_nvp("path", path));
    common::util::cereal_load_optional_value(archive, "name", name);
    common::util::cereal_load_optional_value(archive, "url", url);
    common::util::cereal_load_optional_value(archive, "default-branch", default_branch);

    std::string role_name;
    common::util::cereal_load_optional_value(archive, "role", role_name);
    if (!role_name.empty()) {
      role = deserialize_role(role_name);
    }

    if (name.empty()) {
      name = std::filesystem::path{path}.filename().string();
    }
  }

  std::vector<Repository> Workspace::repositories() const
  {
    std::vector<Repository> repos{primary};
    repos.insert(repos.end(), dependencies.begin(), dependencies.end());
    return repos;
  }

  void Workspace::load(cereal::JSONInputArchive& archive)
  {
    primary.name = Repository::PRIMARY_NAME;
    archive(cereal::make_nvp("primary", primary));
    primary.role = Role::PRIMARY;

    common::util::cereal_load_optional_value(archive, "dependencies", dependencies);
    for (auto& dep : dependencies) {
      dep.role = Role::DEPENDENCY;
    }
  }

  void Workspace::set_defaults()
  {
    primary = Repository{};
    primary.name = Repository::PRIMARY_NAME;
    primary.role = Role::PRIMARY;
    dependencies.clear();
  }

  std::string WorktreePool::default_root()
  {
    const char* home = getenv("HOME");
    std::filesystem::path base = home ? home : std::filesystem::temp_directory_path().string();
    return (base / ".squad" / "worktrees").string();
  }

  void WorktreePool::load(cereal::JSONInputArchive& archive)
  {
    common::util::cereal_load_optional_value(archive, "root", root);
    common::util::cereal_load_optional_value(archive, "max-per-repo", max_per_repo);
    common::util::cereal_load_optional_value(archive, "stale-hours", stale_hours);
    common::util::cereal_load_optional_value(archive, "stage-all", stage_all);
    common::util::cereal_load_optional_value(archive, "batch-threads", batch_threads);

    if (!root.empty() && root[0] == '~') {
      const char* home = getenv("HOME");
      if (home) {
        root = std::string{home} + root.substr(1);
      }
    }

    if (max_per_repo <= 0 || stale_hours <= 0 || batch_threads <= 0) {
      throw common::InvalidConfigurationError{
          "Worktree limits, stale threshold and batch threads must be positive"};
    }
  }

  void WorktreePool::set_defaults()
  {
    root = default_root();
    max_per_repo = DEFAULT_MAX_PER_REPO;
    stale_hours = DEFAULT_STALE_HOURS;
    stage_all = true;
    batch_threads = DEFAULT_BATCH_THREADS;
  }

} // namespace squad::workspace::config
