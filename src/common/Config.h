#pragma once

#include <boost/json/object.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace termchat {

// Immutable startup parameters, read once when the server is constructed.
// Precedence, lowest first: defaults, JSON file, CHAT_* environment, CLI flags.
struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;

    int max_clients = 100;
    int max_connections_per_ip = 5;

    double rate_limit_messages_per_minute = 60.0;
    int rate_limit_burst = 0;  // 0: same as the per-minute rate

    int message_history_size = 50;
    int max_message_length = 1000;
    int max_username_length = 50;
    int max_frame_bytes = 4096;
    int max_pending_frames = 1024;

    int idle_timeout_seconds = 1800;
    int write_timeout_seconds = 10;
    int shutdown_timeout_seconds = 5;

    int worker_threads = 0;  // 0: hardware concurrency
    std::string log_level = "info";

    static constexpr int kMaxHistorySize = 2000;

    // Defaults overlaid with the JSON object stored at `path`.
    static ServerConfig from_file(const std::string& path);

    void apply_json(const boost::json::object& obj);
    void apply_env();

    // Throws ConfigError naming the first offending key.
    void validate() const;

    std::size_t burst_capacity() const noexcept;
    double refill_per_second() const noexcept;
    unsigned resolved_worker_threads() const noexcept;

    std::chrono::seconds idle_timeout() const noexcept { return std::chrono::seconds(idle_timeout_seconds); }
    std::chrono::seconds write_timeout() const noexcept { return std::chrono::seconds(write_timeout_seconds); }
    std::chrono::seconds shutdown_timeout() const noexcept { return std::chrono::seconds(shutdown_timeout_seconds); }
};

} // namespace termchat
