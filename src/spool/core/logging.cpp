// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/logging.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace spool::core {

void init_logging(std::string_view level) noexcept {
    try {
        auto parsed = spdlog::level::from_str(std::string(level));
        // from_str maps unknown names to "off"
        if (parsed == spdlog::level::off && level != "off") {
            parsed = spdlog::level::info;
        }
        spdlog::set_level(parsed);
        spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    } catch (const std::exception& e) {
        spdlog::warn("failed to configure logging: {}", e.what());
    }
}

} // namespace spool::core
