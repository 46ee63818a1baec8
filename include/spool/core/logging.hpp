// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string_view>

namespace spool::core {

// Configure the default spdlog logger. Unknown level names fall back to "info".
void init_logging(std::string_view level) noexcept;

} // namespace spool::core
