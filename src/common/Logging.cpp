#include "common/Logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace termchat::logging {

namespace {

constexpr const char* kLoggerName = "termchat";
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%t] [%^%l%$] %v";

std::mutex init_mu;

std::shared_ptr<spdlog::logger> create_locked(spdlog::level::level_enum level) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
        logger->set_pattern(kPattern);
    }
    logger->set_level(level);
    return logger;
}

} // namespace

void init(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lk(init_mu);
    create_locked(level);
}

std::shared_ptr<spdlog::logger> get() {
    if (auto logger = spdlog::get(kLoggerName)) return logger;

    std::lock_guard<std::mutex> lk(init_mu);
    if (auto logger = spdlog::get(kLoggerName)) return logger;
    return create_locked(spdlog::level::info);
}

spdlog::level::level_enum parse_level(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info")  return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off")   return spdlog::level::off;
    return spdlog::level::info;
}

void shutdown() {
    if (auto logger = spdlog::get(kLoggerName)) logger->flush();
    spdlog::shutdown();
}

} // namespace termchat::logging
