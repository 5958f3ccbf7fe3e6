#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logging.h"
#include "networking/ChatServer.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <getopt.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr const char* kVersion = "1.0.0";

constexpr int kExitOk = 0;
constexpr int kExitStartup = 1;
constexpr int kExitConfig = 2;

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  -c, --config FILE     JSON configuration file\n"
              << "  -H, --host HOST       Listen address (default 0.0.0.0)\n"
              << "  -p, --port PORT       Listen port (default 8080)\n"
              << "  -l, --log-level LEVEL trace|debug|info|warn|error|off\n"
              << "  -h, --help            Show this help\n"
              << "  -v, --version         Show version\n"
              << "\nEvery setting can also be given as a CHAT_* environment variable.\n";
}

struct Overrides {
    std::string config_file;
    std::string host;
    std::string port;
    std::string log_level;
};

termchat::ServerConfig load_config(const Overrides& cli) {
    termchat::ServerConfig config =
        cli.config_file.empty() ? termchat::ServerConfig{} : termchat::ServerConfig::from_file(cli.config_file);
    config.apply_env();

    if (!cli.host.empty()) config.host = cli.host;
    if (!cli.port.empty()) {
        char* end = nullptr;
        const long port = std::strtol(cli.port.c_str(), &end, 10);
        if (end == cli.port.c_str() || *end != '\0') {
            throw termchat::ConfigError("port: not a number: " + cli.port);
        }
        config.port = static_cast<int>(port);
    }
    if (!cli.log_level.empty()) config.log_level = cli.log_level;

    config.validate();
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    Overrides cli;

    static struct option long_options[] = {
        {"config",    required_argument, nullptr, 'c'},
        {"host",      required_argument, nullptr, 'H'},
        {"port",      required_argument, nullptr, 'p'},
        {"log-level", required_argument, nullptr, 'l'},
        {"help",      no_argument,       nullptr, 'h'},
        {"version",   no_argument,       nullptr, 'v'},
        {nullptr,     0,                 nullptr, 0}
    };

    int c;
    while ((c = getopt_long(argc, argv, "c:H:p:l:hv", long_options, nullptr)) != -1) {
        switch (c) {
            case 'c':
                cli.config_file = optarg;
                break;
            case 'H':
                cli.host = optarg;
                break;
            case 'p':
                cli.port = optarg;
                break;
            case 'l':
                cli.log_level = optarg;
                break;
            case 'h':
                print_usage(argv[0]);
                return kExitOk;
            case 'v':
                std::cout << "termchat " << kVersion << std::endl;
                return kExitOk;
            case '?':
            default:
                print_usage(argv[0]);
                return kExitConfig;
        }
    }

    termchat::ServerConfig config;
    try {
        config = load_config(cli);
    } catch (const termchat::ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return kExitConfig;
    }

    termchat::logging::init(termchat::logging::parse_level(config.log_level));

    boost::asio::io_context ioc;
    termchat::networking::ChatServer server(ioc, config);

    try {
        server.start();
    } catch (const termchat::StartupError& e) {
        TERMCHAT_LOG_ERROR("{}", e.what());
        termchat::logging::shutdown();
        return kExitStartup;
    }

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        TERMCHAT_LOG_INFO("received signal {}, shutting down", signo);
        server.stop([&ioc] { ioc.stop(); });
    });

    const unsigned threads = config.resolved_worker_threads();
    TERMCHAT_LOG_INFO("termchat {} running on {} with {} worker threads", kVersion, server.local_endpoint(),
                      threads);

    std::vector<std::thread> workers;
    workers.reserve(threads > 0 ? threads - 1 : 0);
    for (unsigned i = 1; i < threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();
    for (auto& t : workers) t.join();

    const auto conns = server.connection_stats();
    const auto broker = server.broker_stats();
    TERMCHAT_LOG_INFO("exit: {} connections admitted, {} rejected, {} broadcasts, {} failed deliveries",
                      conns.admitted, conns.rejected, broker.broadcasts, broker.failed_deliveries);
    termchat::logging::shutdown();
    return kExitOk;
}
