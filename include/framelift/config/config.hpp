#pragma once

#include "framelift/config/system_config.hpp"
#include "framelift/core/error.hpp"

#include <string_view>

namespace framelift {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<ClientConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<ClientConfig>;
};

}  // namespace framelift
