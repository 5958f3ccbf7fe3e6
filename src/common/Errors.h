#pragma once

#include <stdexcept>
#include <string>

namespace termchat {

// Fatal errors only. Per-session failures are reported as result values
// or boost::system::error_code and never leave their session.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error("config: " + what) {}
};

class StartupError : public Error {
public:
    explicit StartupError(const std::string& what) : Error("startup: " + what) {}
};

} // namespace termchat
