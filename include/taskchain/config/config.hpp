#pragma once

#include "taskchain/config/system_config.hpp"
#include "taskchain/core/error.hpp"

#include <string_view>

namespace taskchain {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
};

}  // namespace taskchain
