#ifndef SQUAD_COMMON_UUID_HPP
#define SQUAD_COMMON_UUID_HPP

#include <mutex>
#include <random>
#include <string>
#include <string_view>

#include <uuid.h>

namespace squad::common {

  class UUID {
  public:
    UUID() : _generator{_rd()}, _uuid_generator{_generator} {}

    UUID(const UUID&) = delete;
    UUID& operator=(const UUID&) = delete;

    uuids::uuid generate()
    {
      std::lock_guard<std::mutex> lock{_mutex};
      return _uuid_generator();
    }

    std::string str()
    {
      return uuids::to_string(generate());
    }

    // Identifiers handed out to callers, e.g. proc_1b4e28ba-2fa1-11d2-883f-0016d3cca427
    std::string prefixed(std::string_view prefix)
    {
      return std::string{prefix} + "_" + str();
    }

  private:
    std::mutex _mutex;
    std::random_device _rd;
    std::mt19937 _generator;
    uuids::uuid_random_generator _uuid_generator;
  };

} // namespace squad::common

#endif
