#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace fops::logging {

/// Console pattern used by every fops binary
inline constexpr const char* kDefaultPattern = "[%H:%M:%S] [%^%l%$] %v";

/**
 * @brief Configure the default spdlog logger
 *
 * Safe to call more than once; the last call wins.
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"; unknown names map to info
spdlog::level::level_enum level_from_string(const std::string& name);

} // namespace fops::logging
