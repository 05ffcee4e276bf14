/// @file logging.hpp
/// @brief Log level control for the library's spdlog output.

#pragma once

#include <string_view>

namespace ot_cpp {

/// Set the level of the default spdlog logger by name.
///
/// Accepts "trace", "debug", "info", "warn", "warning", "error", "err",
/// "critical" and "off".
/// @return false if the name is unknown; the level is left unchanged.
auto set_log_level(std::string_view level) -> bool;

}  // namespace ot_cpp
