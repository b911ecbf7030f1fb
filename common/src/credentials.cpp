#include <squad/common/credentials.hpp>

#include <cctype>
#include <cstdlib>

namespace squad::common::credentials {

  std::string
  EnvironmentCredentialStore::variable_name(const std::string& service, const std::string& account)
  {
    std::string name = "SQUAD_" + service + "_" + account;
    for (char& c : name) {
      if (std::isalnum(static_cast<unsigned char>(c))) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
      } else {
        c = '_';
      }
    }
    return name;
  }

  std::optional<std::string>
  EnvironmentCredentialStore::retrieve(const std::string& service, const std::string& account)
  {
    const char* value = getenv(variable_name(service, account).c_str());
    if (!value || *value == '\0') {
      return std::nullopt;
    }
    return std::string{value};
  }

  std::optional<std::string>
  MemoryCredentialStore::retrieve(const std::string& service, const std::string& account)
  {
    std::lock_guard<std::mutex> lock{_mutex};
    auto it = _secrets.find({service, account});
    if (it == _secrets.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void MemoryCredentialStore::store(
      const std::string& service, const std::string& account, std::string secret
  )
  {
    std::lock_guard<std::mutex> lock{_mutex};
    _secrets[{service, account}] = std::move(secret);
  }

  bool MemoryCredentialStore::remove(const std::string& service, const std::string& account)
  {
    std::lock_guard<std::mutex> lock{_mutex};
    return _secrets.erase({service, account}) > 0;
  }

} // namespace squad::common::credentials
