#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace termchat::logging {

// Creates the shared "termchat" stdout logger. Safe to call more than once;
// later calls only change the level.
void init(spdlog::level::level_enum level);

// Returns the shared logger, creating a default one on first use.
std::shared_ptr<spdlog::logger> get();

// trace|debug|info|warn|error|off, case-insensitive. Unknown names map to info.
spdlog::level::level_enum parse_level(std::string name);

void shutdown();

} // namespace termchat::logging

#define TERMCHAT_LOG_TRACE(...) ::termchat::logging::get()->trace(__VA_ARGS__)
#define TERMCHAT_LOG_DEBUG(...) ::termchat::logging::get()->debug(__VA_ARGS__)
#define TERMCHAT_LOG_INFO(...)  ::termchat::logging::get()->info(__VA_ARGS__)
#define TERMCHAT_LOG_WARN(...)  ::termchat::logging::get()->warn(__VA_ARGS__)
#define TERMCHAT_LOG_ERROR(...) ::termchat::logging::get()->error(__VA_ARGS__)
