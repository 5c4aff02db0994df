#include "config.hpp"
#include "errors.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>

namespace wvb {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

static int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        throw ConfigurationError(std::string("Invalid integer in ") + name + ": " + val);
    }
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to load config: " + std::string(e.what()));
    }

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.port = s["port"].as<uint16_t>(cfg.server.port);
            cfg.server.read_timeout_ms = s["read_timeout_ms"].as<int>(cfg.server.read_timeout_ms);
            cfg.server.library_root = s["library_root"].as<std::string>(cfg.server.library_root);
            if (auto d = s["directories"]) {
                cfg.server.directories = d.as<std::vector<std::string>>();
            }
        }

        // Commands
        if (auto c = root["commands"]) {
            cfg.commands.builtin = c["builtin"].as<bool>(cfg.commands.builtin);
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }

        // Notice checker
        if (auto n = root["notice"]) {
            if (auto e = n["exempt_extensions"]) {
                cfg.notice.exempt_extensions = e.as<std::vector<std::string>>();
            }
            if (auto e = n["exempt_names"]) {
                cfg.notice.exempt_names = e.as<std::vector<std::string>>();
            }
            cfg.notice.header_lines = n["header_lines"].as<int>(cfg.notice.header_lines);
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Invalid value in " + path + ": " + std::string(e.what()));
    }

    apply_env_overrides(cfg);
    return cfg;
}

void apply_env_overrides(AppConfig& cfg) {
    cfg.server.port = static_cast<uint16_t>(env_int_or("BRIDGE_PORT", cfg.server.port));
    cfg.server.library_root = env_or("BRIDGE_LIBRARY_ROOT", cfg.server.library_root);
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);
}

std::string server_version_token() {
    return std::string("WebViewBridge/") + WVB_VERSION;
}

} // namespace wvb
