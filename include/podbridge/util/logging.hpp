#pragma once

#include <string>

namespace podbridge::util::log {

void debug(const std::string& message);
void info(const std::string& message);
void warn(const std::string& message);
void error(const std::string& message);

// Accepts trace/debug/info/warn/error/critical/off; unknown names fall back to info.
void set_level(const std::string& name);

}  // namespace podbridge::util::log
