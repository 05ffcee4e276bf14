#include <ot-cpp/logging.hpp>

#include <spdlog/spdlog.h>

#include <string>

namespace ot_cpp {

auto set_log_level(std::string_view level) -> bool {
    // from_str maps every unknown name to off.
    auto value = spdlog::level::from_str(std::string{level});
    if (value == spdlog::level::off && level != "off") return false;
    spdlog::set_level(value);
    return true;
}

}  // namespace ot_cpp
