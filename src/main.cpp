#include "bridge_server.hpp"
#include "builtin_handlers.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>

namespace fs = std::filesystem;

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: webview-bridge [options] [directory ...]\n"
              << "Serves web content from the directories, highest priority first, and\n"
              << "answers JSON commands POSTed to any path.\n"
              << "Options:\n"
              << "  -c, --config <path>    Config file (default: bridge.yaml, if present)\n"
              << "  -p, --port <port>      Port number (default: 8001)\n"
              << "  -h, --help             Show this help\n"
              << "\nEnvironment variables:\n"
              << "  BRIDGE_PORT            Port number\n"
              << "  BRIDGE_LIBRARY_ROOT    Built-in library directory, always searched last\n"
              << "  LOG_LEVEL              Log level (trace/debug/info/warn/error)\n";
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path = "bridge.yaml";
    bool config_given = false;
    int port_override = -1;
    std::vector<std::string> directories;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
            config_given = true;
        } else if ((arg == "--port" || arg == "-p") && i + 1 < argc) {
            try {
                port_override = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "ERROR: Invalid port \"" << argv[i] << "\"" << std::endl;
                return 2;
            }
            if (port_override < 0 || port_override > 65535) {
                std::cerr << "ERROR: Port out of range " << port_override << std::endl;
                return 2;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "ERROR: Unknown option " << arg << std::endl;
            print_usage();
            return 2;
        } else {
            directories.push_back(arg);
        }
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    wvb::AppConfig config;
    try {
        std::error_code ec;
        if (config_given || fs::exists(config_path, ec)) {
            config = wvb::load_config(config_path);
        } else {
            wvb::apply_env_overrides(config);
        }
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    if (port_override >= 0) {
        config.server.port = static_cast<uint16_t>(port_override);
    }
    if (!directories.empty()) {
        config.server.directories = directories;
    }

    wvb::init_logger(config.logging, "webview-bridge");

    // ─── Content roots, library last ──────────────────────────────────────────
    std::vector<fs::path> roots(config.server.directories.begin(), config.server.directories.end());
    roots.emplace_back(config.server.library_root);

    std::unique_ptr<wvb::BridgeServer> server;
    try {
        server = std::make_unique<wvb::BridgeServer>(config.server, roots);
    } catch (const wvb::ConfigurationError& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    if (config.commands.builtin) {
        for (auto& handler : wvb::builtin_handlers()) {
            server->add_handler(std::move(handler));
        }
    }

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!server->start()) {
        spdlog::critical("Failed to start HTTP bridge on port {}", config.server.port);
        return 1;
    }
    std::cout << server->start_message() << std::flush;

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    server->stop();
    return 0;
}
