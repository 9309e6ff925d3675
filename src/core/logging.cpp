#include "fops/core/logging.hpp"

namespace fops::logging {

void init(spdlog::level::level_enum level) {
    spdlog::set_level(level);
    spdlog::set_pattern(kDefaultPattern);
}

spdlog::level::level_enum level_from_string(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace fops::logging
