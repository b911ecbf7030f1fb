#ifndef SQUAD_COMMON_CREDENTIALS_HPP
#define SQUAD_COMMON_CREDENTIALS_HPP

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace squad::common::credentials {

  class CredentialStore {
  public:
    virtual ~CredentialStore() = default;

    virtual std::optional<std::string>
    retrieve(const std::string& service, const std::string& account) = 0;
  };

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Resolves secrets from the environment.
  /// The variable name is SQUAD_<SERVICE>_<ACCOUNT>, upper-cased, with every
  /// character outside [A-Z0-9] replaced by an underscore.
  ////////////////////////////////////////////////////////////////////////////////
  class EnvironmentCredentialStore : public CredentialStore {
  public:
    std::optional<std::string>
    retrieve(const std::string& service, const std::string& account) override;

    static std::string variable_name(const std::string& service, const std::string& account);
  };

  class MemoryCredentialStore : public CredentialStore {
  public:
    std::optional<std::string>
    retrieve(const std::string& service, const std::string& account) override;

    void store(const std::string& service, const std::string& account, std::string secret);
    bool remove(const std::string& service, const std::string& account);

  private:
    std::mutex _mutex;
    std::map<std::pair<std::string, std::string>, std::string> _secrets;
  };

} // namespace squad::common::credentials

#endif
