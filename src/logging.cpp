#include "../include/logging.hpp"
#include <spdlog/spdlog.h>

void init_logging(const std::string& level) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (lvl == spdlog::level::off && level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("unknown log level '{}', using info", level);
        return;
    }
    spdlog::set_level(lvl);
}
