#include "common/Config.h"

#include "common/Errors.h"
#include "common/Logging.h"

#include <boost/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <variant>

namespace json = boost::json;

namespace termchat {

namespace {

using Field = std::variant<int ServerConfig::*, double ServerConfig::*, std::string ServerConfig::*>;

struct FieldSpec {
    const char* key;
    const char* env;
    Field field;
};

const FieldSpec kFields[] = {
    {"host",                           "CHAT_SERVER_HOST",            &ServerConfig::host},
    {"port",                           "CHAT_SERVER_PORT",            &ServerConfig::port},
    {"max_clients",                    "CHAT_MAX_CLIENTS",            &ServerConfig::max_clients},
    {"max_connections_per_ip",         "CHAT_MAX_CONNECTIONS_PER_IP", &ServerConfig::max_connections_per_ip},
    {"rate_limit_messages_per_minute", "CHAT_RATE_LIMIT_MSG_PER_MIN", &ServerConfig::rate_limit_messages_per_minute},
    {"rate_limit_burst",               "CHAT_RATE_LIMIT_BURST",       &ServerConfig::rate_limit_burst},
    {"message_history_size",           "CHAT_MESSAGE_HISTORY_SIZE",   &ServerConfig::message_history_size},
    {"max_message_length",             "CHAT_MAX_MESSAGE_LENGTH",     &ServerConfig::max_message_length},
    {"max_username_length",            "CHAT_MAX_USERNAME_LENGTH",    &ServerConfig::max_username_length},
    {"max_frame_bytes",                "CHAT_MAX_FRAME_BYTES",        &ServerConfig::max_frame_bytes},
    {"max_pending_frames",             "CHAT_MAX_PENDING_FRAMES",     &ServerConfig::max_pending_frames},
    {"idle_timeout_seconds",           "CHAT_IDLE_TIMEOUT",           &ServerConfig::idle_timeout_seconds},
    {"write_timeout_seconds",          "CHAT_WRITE_TIMEOUT",          &ServerConfig::write_timeout_seconds},
    {"shutdown_timeout_seconds",       "CHAT_SHUTDOWN_TIMEOUT",       &ServerConfig::shutdown_timeout_seconds},
    {"worker_threads",                 "CHAT_WORKER_THREADS",         &ServerConfig::worker_threads},
    {"log_level",                      "CHAT_LOG_LEVEL",              &ServerConfig::log_level},
};

const FieldSpec* find_field(json::string_view key) {
    for (const auto& def : kFields) {
        if (key == def.key) return &def;
    }
    return nullptr;
}

int checked_int(double value, const char* key) {
    if (std::floor(value) != value || value < -2147483648.0 || value > 2147483647.0) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    return static_cast<int>(value);
}

void assign_json(ServerConfig& cfg, const FieldSpec& def, const json::value& v) {
    try {
        if (auto p = std::get_if<int ServerConfig::*>(&def.field)) {
            cfg.*(*p) = checked_int(json::value_to<double>(v), def.key);
        } else if (auto p = std::get_if<double ServerConfig::*>(&def.field)) {
            cfg.*(*p) = json::value_to<double>(v);
        } else if (auto p = std::get_if<std::string ServerConfig::*>(&def.field)) {
            cfg.*(*p) = json::value_to<std::string>(v);
        }
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception&) {
        throw ConfigError(std::string("'") + def.key + "' has the wrong type");
    }
}

void assign_text(ServerConfig& cfg, const FieldSpec& def, const std::string& text) {
    if (auto p = std::get_if<std::string ServerConfig::*>(&def.field)) {
        cfg.*(*p) = text;
        return;
    }

    double value = 0.0;
    std::size_t used = 0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(def.env) + " is not a number: '" + text + "'");
    }
    if (used != text.size()) {
        throw ConfigError(std::string(def.env) + " is not a number: '" + text + "'");
    }

    if (auto p = std::get_if<int ServerConfig::*>(&def.field)) {
        cfg.*(*p) = checked_int(value, def.env);
    } else if (auto p = std::get_if<double ServerConfig::*>(&def.field)) {
        cfg.*(*p) = value;
    }
}

void require(bool ok, const std::string& message) {
    if (!ok) throw ConfigError(message);
}

} // namespace

ServerConfig ServerConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    boost::system::error_code ec;
    json::value root = json::parse(buffer.str(), ec);
    if (ec) {
        throw ConfigError(path + ": " + ec.message());
    }

    auto* obj = root.if_object();
    if (!obj) {
        throw ConfigError(path + ": top-level value must be an object");
    }

    ServerConfig cfg;
    cfg.apply_json(*obj);
    return cfg;
}

void ServerConfig::apply_json(const json::object& obj) {
    for (const auto& entry : obj) {
        const FieldSpec* def = find_field(entry.key());
        if (!def) {
            TERMCHAT_LOG_WARN("config: ignoring unknown key '{}'", std::string(entry.key()));
            continue;
        }
        assign_json(*this, *def, entry.value());
    }
}

void ServerConfig::apply_env() {
    for (const auto& def : kFields) {
        const char* value = std::getenv(def.env);
        if (value && *value) assign_text(*this, def, value);
    }
}

void ServerConfig::validate() const {
    require(!host.empty(), "'host' cannot be empty");
    require(port >= 0 && port <= 65535, "'port' must be between 0 and 65535");
    require(max_clients > 0, "'max_clients' must be positive");
    require(max_connections_per_ip > 0, "'max_connections_per_ip' must be positive");
    require(max_connections_per_ip <= max_clients,
            "'max_connections_per_ip' cannot exceed 'max_clients'");
    require(rate_limit_messages_per_minute > 0.0, "'rate_limit_messages_per_minute' must be positive");
    require(rate_limit_burst >= 0, "'rate_limit_burst' cannot be negative");
    require(message_history_size > 0 && message_history_size <= kMaxHistorySize,
            "'message_history_size' must be between 1 and " + std::to_string(kMaxHistorySize));
    require(max_message_length > 0, "'max_message_length' must be positive");
    require(max_username_length > 0, "'max_username_length' must be positive");
    require(max_frame_bytes > max_message_length,
            "'max_frame_bytes' must be larger than 'max_message_length'");
    require(max_pending_frames > 0, "'max_pending_frames' must be positive");
    require(idle_timeout_seconds > 0, "'idle_timeout_seconds' must be positive");
    require(write_timeout_seconds > 0, "'write_timeout_seconds' must be positive");
    require(shutdown_timeout_seconds > 0, "'shutdown_timeout_seconds' must be positive");
    require(worker_threads >= 0, "'worker_threads' cannot be negative");
}

std::size_t ServerConfig::burst_capacity() const noexcept {
    if (rate_limit_burst > 0) return static_cast<std::size_t>(rate_limit_burst);
    return static_cast<std::size_t>(std::max(1.0, std::ceil(rate_limit_messages_per_minute)));
}

double ServerConfig::refill_per_second() const noexcept {
    return rate_limit_messages_per_minute / 60.0;
}

unsigned ServerConfig::resolved_worker_threads() const noexcept {
    if (worker_threads > 0) return static_cast<unsigned>(worker_threads);
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 2u : n;
}

} // namespace termchat
