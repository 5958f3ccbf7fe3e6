#include "common/Config.h"
#include "common/Errors.h"

#include <boost/json.hpp>

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace termchat;

namespace {

void write_file(const std::string& filename, const std::string& text) {
    std::ofstream file(filename);
    file << text;
}

template <class F>
bool throws_config_error(F&& f) {
    try {
        f();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

} // namespace

void testDefaultConfig() {
    std::cout << "Testing default configuration..." << std::endl;

    ServerConfig config;
    assert(config.host == "0.0.0.0");
    assert(config.port == 8080);
    assert(config.max_clients == 100);
    assert(config.max_connections_per_ip == 5);
    assert(config.message_history_size == 50);
    assert(config.max_message_length == 1000);
    assert(config.max_username_length == 50);
    assert(config.idle_timeout().count() == 1800);
    assert(config.burst_capacity() == 60);
    assert(config.refill_per_second() == 1.0);
    assert(config.resolved_worker_threads() >= 1);
    config.validate();

    std::cout << "Default configuration test PASSED" << std::endl;
}

void testJsonConfig() {
    std::cout << "Testing JSON configuration loading..." << std::endl;

    const std::string filename = "test_termchat_config.json";
    write_file(filename,
               "{\n"
               "  \"host\": \"127.0.0.1\",\n"
               "  \"port\": 9100,\n"
               "  \"max_clients\": 10,\n"
               "  \"max_connections_per_ip\": 2,\n"
               "  \"rate_limit_messages_per_minute\": 120,\n"
               "  \"rate_limit_burst\": 20,\n"
               "  \"message_history_size\": 25,\n"
               "  \"log_level\": \"debug\",\n"
               "  \"some_future_key\": true\n"
               "}\n");

    ServerConfig config = ServerConfig::from_file(filename);
    assert(config.host == "127.0.0.1");
    assert(config.port == 9100);
    assert(config.max_clients == 10);
    assert(config.max_connections_per_ip == 2);
    assert(config.rate_limit_messages_per_minute == 120.0);
    assert(config.burst_capacity() == 20);
    assert(config.refill_per_second() == 2.0);
    assert(config.message_history_size == 25);
    assert(config.log_level == "debug");
    assert(config.max_message_length == 1000 && "unset keys keep their defaults");
    config.validate();

    std::remove(filename.c_str());
    std::cout << "JSON configuration test PASSED" << std::endl;
}

void testJsonErrors() {
    std::cout << "Testing JSON configuration errors..." << std::endl;

    assert(throws_config_error([] { ServerConfig::from_file("/nonexistent/termchat.json"); }));

    const std::string filename = "test_termchat_bad.json";
    write_file(filename, "{ \"port\": ");
    assert(throws_config_error([&] { ServerConfig::from_file(filename); }));

    write_file(filename, "[1, 2, 3]");
    assert(throws_config_error([&] { ServerConfig::from_file(filename); }));

    std::remove(filename.c_str());

    ServerConfig config;
    assert(throws_config_error([&] { config.apply_json(boost::json::parse(R"({"port": "eighty"})").as_object()); }));
    assert(throws_config_error([&] { config.apply_json(boost::json::parse(R"({"max_clients": 2.5})").as_object()); }));

    std::cout << "JSON configuration errors test PASSED" << std::endl;
}

void testEnvironmentOverrides() {
    std::cout << "Testing environment overrides..." << std::endl;

    setenv("CHAT_SERVER_PORT", "7000", 1);
    setenv("CHAT_MAX_CLIENTS", "3", 1);
    setenv("CHAT_MAX_CONNECTIONS_PER_IP", "3", 1);
    setenv("CHAT_RATE_LIMIT_MSG_PER_MIN", "30", 1);
    setenv("CHAT_LOG_LEVEL", "warn", 1);

    ServerConfig config;
    config.port = 9100;  // as if loaded from a file
    config.apply_env();
    assert(config.port == 7000 && "environment beats the file");
    assert(config.max_clients == 3);
    assert(config.rate_limit_messages_per_minute == 30.0);
    assert(config.refill_per_second() == 0.5);
    assert(config.log_level == "warn");
    config.validate();

    setenv("CHAT_SERVER_PORT", "70x", 1);
    ServerConfig bad;
    assert(throws_config_error([&] { bad.apply_env(); }));

    unsetenv("CHAT_SERVER_PORT");
    unsetenv("CHAT_MAX_CLIENTS");
    unsetenv("CHAT_MAX_CONNECTIONS_PER_IP");
    unsetenv("CHAT_RATE_LIMIT_MSG_PER_MIN");
    unsetenv("CHAT_LOG_LEVEL");

    std::cout << "Environment overrides test PASSED" << std::endl;
}

void testValidation() {
    std::cout << "Testing validation..." << std::endl;

    auto invalid = [](auto mutate) {
        ServerConfig config;
        mutate(config);
        return throws_config_error([&] { config.validate(); });
    };

    assert(invalid([](ServerConfig& c) { c.port = 70000; }));
    assert(invalid([](ServerConfig& c) { c.max_clients = 0; }));
    assert(invalid([](ServerConfig& c) { c.max_connections_per_ip = 200; }));
    assert(invalid([](ServerConfig& c) { c.message_history_size = ServerConfig::kMaxHistorySize + 1; }));
    assert(invalid([](ServerConfig& c) { c.message_history_size = 0; }));
    assert(invalid([](ServerConfig& c) { c.max_frame_bytes = 1000; }));
    assert(invalid([](ServerConfig& c) { c.idle_timeout_seconds = 0; }));
    assert(invalid([](ServerConfig& c) { c.rate_limit_messages_per_minute = 0.0; }));
    assert(invalid([](ServerConfig& c) { c.host.clear(); }));

    assert(!invalid([](ServerConfig& c) { c.port = 0; }) && "port 0 picks an ephemeral port");

    try {
        ServerConfig config;
        config.max_clients = -1;
        config.validate();
        assert(false && "validate() should have thrown");
    } catch (const ConfigError& e) {
        assert(std::string(e.what()).find("max_clients") != std::string::npos);
    }

    std::cout << "Validation test PASSED" << std::endl;
}

int main() {
    std::cout << "Running Config tests..." << std::endl << std::endl;

    try {
        testDefaultConfig();
        testJsonConfig();
        testJsonErrors();
        testEnvironmentOverrides();
        testValidation();

        std::cout << std::endl << "All Config tests PASSED!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
