#ifndef SQUAD_WORKSPACE_CONFIG_HPP
#define SQUAD_WORKSPACE_CONFIG_HPP

#include <string>
#include <vector>

namespace cereal {
  class JSONInputArchive;
} // namespace cereal

namespace squad::workspace::config {

  enum class Role { PRIMARY = 0, DEPENDENCY };

  std::string to_string(Role role);
  Role deserialize_role(const std::string& role);

  struct Repository {

    static constexpr const char* DEFAULT_BRANCH = "main";
    static constexpr const char* PRIMARY_NAME = "primary";

    std::string name;
    std::string url;
    std::string path;
    std::string default_branch = DEFAULT_BRANCH;
    Role role = Role::DEPENDENCY;

    void load(cereal::JSONInputArchive& archive);
  };

  struct Workspace {

    Repository primary;
    std::vector<Repository> dependencies;

    // Primary first, then dependencies in configuration order.
    std::vector<Repository> repositories() const;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();
  };

  struct WorktreePool {

    static constexpr int DEFAULT_MAX_PER_REPO = 10;
    static constexpr int DEFAULT_STALE_HOURS = 24;
    static constexpr int DEFAULT_BATCH_THREADS = 4;

    WorktreePool()
    {
      set_defaults();
    }

    std::string root;
    int max_per_repo;
    int stale_hours;
    bool stage_all;
    int batch_threads;

    void load(cereal::JSONInputArchive& archive);
    void set_defaults();

    static std::string default_root();
  };

} // namespace squad::workspace::config

#endif
