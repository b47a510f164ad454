#pragma once

#include <Formatting.h>
#include <spdlog/spdlog.h>
#include <string>

namespace tessel {

// accepts trace, debug, info, warn, err, critical and off plus a few aliases
bool setLogLevel(const std::string& level);

} // namespace tessel
