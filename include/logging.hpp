#pragma once
#include <string>

// Configures the default spdlog logger. Unknown level names fall back to info.
void init_logging(const std::string& level);
