#pragma once

#include "aoa/config/app_config.hpp"
#include "aoa/core/error.hpp"

#include <string_view>

namespace aoa {

using Config = AppConfig;

class ConfigLoader {
public:
  /// `.json` files use the JSON layout, everything else is TOML.
  /// Environment overrides are applied; call validate() once every other
  /// override is in.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<AppConfig>;
  [[nodiscard]] static auto
  load_from_string(std::string_view text,
                   ConfigFormat format = ConfigFormat::Toml)
      -> Result<AppConfig>;
  /// Built-in defaults plus environment overrides.
  [[nodiscard]] static auto load_defaults() -> Result<AppConfig>;

  [[nodiscard]] static auto format_for(std::string_view path) -> ConfigFormat;
  [[nodiscard]] static auto apply_env_overrides(AppConfig &cfg)
      -> Result<void>;
  [[nodiscard]] static auto validate(const AppConfig &cfg) -> Result<void>;
};

} // namespace aoa
