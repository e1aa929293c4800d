#include "nhdsync/util/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <mutex>

namespace nhdsync::util::log {

namespace {

constexpr const char* kLoggerName = "nhdsync";

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (!spdlog::get(kLoggerName)) {
            auto created = spdlog::stdout_color_mt(kLoggerName);
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        }
    });
    return spdlog::get(kLoggerName);
}

spdlog::level::level_enum parse_level(const std::string& name) {
    static const std::map<std::string, spdlog::level::level_enum> kLevels = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},   {"critical", spdlog::level::critical}};
    auto it = kLevels.find(name);
    if (it == kLevels.end()) {
        logger()->warn("Unknown log level '{}', fallback to 'info'", name);
        return spdlog::level::info;
    }
    return it->second;
}

}  // namespace

void set_level(const std::string& level) {
    logger()->set_level(parse_level(level));
}

void debug(const std::string& message) {
    logger()->debug(message);
}

void info(const std::string& message) {
    logger()->info(message);
}

void warn(const std::string& message) {
    logger()->warn(message);
}

void error(const std::string& message) {
    logger()->error(message);
}

}  // namespace nhdsync::util::log
