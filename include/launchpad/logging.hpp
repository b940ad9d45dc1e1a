#pragma once

#include <string>

namespace launchpad {

/// Installs the "launchpad" colour console logger as spdlog's default.
/// Unknown levels fall back to info.
void setup_logging(const std::string& log_level);

} // namespace launchpad
