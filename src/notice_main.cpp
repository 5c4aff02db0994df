#include "config.hpp"
#include "logger.hpp"
#include "notice_scanner.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>

namespace fs = std::filesystem;

static void print_usage() {
    std::cout << "Usage: notice-check [options] [path ...]\n"
              << "Checks the copyright notice year of every file against its last\n"
              << "modified date, from git history or the file system.\n"
              << "Options:\n"
              << "  -c, --config <path>    Config file (default: bridge.yaml, if present)\n"
              << "  -h, --help             Show this help\n"
              << "\nStates: - exempt, 0 missing, . correct, X incorrect date, ! error\n";
}

int main(int argc, char* argv[]) {
    std::string config_path = "bridge.yaml";
    bool config_given = false;
    std::vector<fs::path> paths;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
            config_given = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "ERROR: Unknown option " << arg << std::endl;
            print_usage();
            return 2;
        } else {
            paths.emplace_back(arg);
        }
    }
    if (paths.empty()) {
        paths.emplace_back(".");
    }

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
    wvb::init_logger(config.logging, "notice-check");

    wvb::NoticeScanner scanner(config.notice, std::make_shared<wvb::GitDateSource>());

    std::vector<wvb::NoticedFile> results;
    for (const auto& path : paths) {
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            spdlog::error("No such file or directory \"{}\"", path.string());
            return 1;
        }
        for (auto& noticed : scanner.scan(path)) {
            std::cout << wvb::state_symbol(noticed.state) << std::flush;
            results.push_back(std::move(noticed));
        }
    }
    std::cout << "\n";

    std::map<wvb::NoticeState, std::size_t> counts;
    bool all_good = true;
    for (const auto& noticed : results) {
        ++counts[noticed.state];
        if (noticed.state != wvb::NoticeState::Exempt && noticed.state != wvb::NoticeState::Correct) {
            std::cout << noticed.to_string() << "\n";
            all_good = false;
        }
    }

    for (const auto& [state, count] : counts) {
        std::cout << wvb::state_name(state) << " " << count << "\n";
    }
    return all_good ? 0 : 1;
}
