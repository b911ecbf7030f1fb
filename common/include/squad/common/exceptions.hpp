#ifndef SQUAD_COMMON_EXCEPTIONS_HPP
#define SQUAD_COMMON_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

namespace squad::common {

  struct SquadException : std::runtime_error {

    SquadException(const std::string& msg) : std::runtime_error(msg) {}
  };

  struct InvalidConfigurationError : SquadException {

    InvalidConfigurationError(const std::string& msg) : SquadException(msg) {}
  };

  struct ObjectDoesNotExist : SquadException {

    ObjectDoesNotExist(const std::string& name) : SquadException(name) {}
  };

  struct SpawnError : SquadException {

    SpawnError(const std::string& msg) : SquadException(msg) {}
  };

  struct AllocationError : SquadException {

    AllocationError(const std::string& msg) : SquadException(msg) {}
  };

  struct UncommittedChangesError : SquadException {

    UncommittedChangesError(std::string repository, std::string path)
        : SquadException(
              "Worktree " + path + " of repository " + repository + " has uncommitted changes"
          ),
          repository(std::move(repository)), path(std::move(path))
    {
    }

    std::string repository;
    std::string path;
  };

  struct CommitError : SquadException {

    CommitError(const std::string& msg) : SquadException(msg) {}
  };

  struct RollbackError : SquadException {

    RollbackError(const std::string& msg) : SquadException(msg) {}
  };

  struct NotInitializedError : SquadException {

    NotInitializedError(const std::string& msg) : SquadException(msg) {}
  };

} // namespace squad::common

#endif
