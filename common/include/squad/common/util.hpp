#ifndef SQUAD_COMMON_UTIL_HPP
#define SQUAD_COMMON_UTIL_HPP

#include <squad/common/exceptions.hpp>

#include <memory>
#include <string>
#include <string_view>

#include <cereal/archives/json.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace squad::common::util {

  std::shared_ptr<spdlog::logger> create_logger(std::string_view name);

  namespace detail {

    inline bool is_missing_field(const cereal::Exception& exc, const std::string& name)
    {
      return std::string_view{exc.what()}.find(fmt::format("({}) not found", name)) !=
             std::string::npos;
    }

  } // namespace detail

  template <typename T>
  void cereal_load_optional(cereal::JSONInputArchive& archive, const std::string& name, T& obj)
  {
    // Cereal does not allow to skip non-existing objects easily.
    // There is also no separate exception type for this.
    try {
      archive(cereal::make_nvp(name, obj));
    } catch (cereal::Exception& exc) {

      if (detail::is_missing_field(exc, name)) {
        archive.setNextName(nullptr);
        obj.set_defaults();
      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration of {}, reason: {}", name, exc.what())
        );
      }
    } catch (cereal::RapidJSONException& exc) {
      throw common::InvalidConfigurationError(
          fmt::format("Configuration of {} has a wrong type: {}", name, exc.what())
      );
    }
  }

  // Same as above, but for plain values: the default is whatever the caller put there.
  template <typename T>
  void
  cereal_load_optional_value(cereal::JSONInputArchive& archive, const std::string& name, T& value)
  {
    try {
      archive(cereal::make_nvp(name, value));
    } catch (cereal::Exception& exc) {

      if (detail::is_missing_field(exc, name)) {
        archive.setNextName(nullptr);
      } else {
        throw common::InvalidConfigurationError(
            fmt::format("Could not parse configuration value {}, reason: {}", name, exc.what())
        );
      }
    } catch (cereal::RapidJSONException& exc) {
      throw common::InvalidConfigurationError(
          fmt::format("Configuration value {} has a wrong type: {}", name, exc.what())
      );
    }
  }

} // namespace squad::common::util

#endif
