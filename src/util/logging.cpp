#include "podbridge/util/logging.hpp"

#include <map>

#include <spdlog/spdlog.h>

namespace podbridge::util::log {

namespace {

spdlog::level::level_enum parse_level(const std::string& name) {
    static const std::map<std::string, spdlog::level::level_enum> kLevels = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
        {"off", spdlog::level::off}};
    auto it = kLevels.find(name);
    if (it == kLevels.end()) {
        spdlog::warn("Unknown log level '{}', fallback to 'info'", name);
        return spdlog::level::info;
    }
    return it->second;
}

}  // namespace

void debug(const std::string& message) {
    spdlog::debug(message);
}

void info(const std::string& message) {
    spdlog::info(message);
}

void warn(const std::string& message) {
    spdlog::warn(message);
}

void error(const std::string& message) {
    spdlog::error(message);
}

void set_level(const std::string& name) {
    spdlog::set_level(parse_level(name));
}

}  // namespace podbridge::util::log
