#pragma once

#include <string>
#include <vector>
#include <cstdint>

#ifndef WVB_VERSION
#define WVB_VERSION "0.0.0"
#endif

#ifndef WVB_LIBRARY_DIR
#define WVB_LIBRARY_DIR "resources/library"
#endif

namespace wvb {

struct ServerConfig {
    uint16_t port = 8001;
    int read_timeout_ms = 10000;
    std::string library_root = WVB_LIBRARY_DIR;  // always the lowest-priority root
    std::vector<std::string> directories;        // highest priority first
};

struct CommandsConfig {
    bool builtin = true;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct NoticeConfig {
    std::vector<std::string> exempt_extensions = {
        ".png", ".jpg", ".jpeg", ".gif", ".ico", ".json", ".md", ".txt"};
    std::vector<std::string> exempt_names = {"LICENSE", ".gitignore"};
    int header_lines = 10;
};

struct AppConfig {
    ServerConfig server;
    CommandsConfig commands;
    LoggingConfig logging;
    NoticeConfig notice;
};

// Load configuration from YAML file, then apply environment variable overrides.
// Throws ConfigurationError if the file can't be read or parsed.
AppConfig load_config(const std::string& path);

// BRIDGE_PORT, BRIDGE_LIBRARY_ROOT, LOG_LEVEL
void apply_env_overrides(AppConfig& cfg);

// "WebViewBridge/<version>", sent in the Server header and the confirm field
std::string server_version_token();

} // namespace wvb
