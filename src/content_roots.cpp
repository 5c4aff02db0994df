#include "content_roots.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace wvb {

ContentRoots::ContentRoots(const std::vector<fs::path>& directories) {
    if (directories.empty()) {
        throw ConfigurationError("No content directories configured.");
    }

    for (const auto& directory : directories) {
        std::error_code ec;
        if (!fs::is_directory(directory, ec)) {
            throw ConfigurationError("Not a directory \"" + directory.string() + "\".");
        }
        fs::path resolved = fs::canonical(directory, ec);
        if (ec) {
            throw ConfigurationError("Cannot resolve \"" + directory.string() + "\": " + ec.message());
        }
        directories_.push_back(resolved);
    }

    common_ancestor_ = common_path(directories_);
    for (const auto& directory : directories_) {
        relative_roots_.push_back(directory.lexically_relative(common_ancestor_));
    }

    for (std::size_t i = 0; i < directories_.size(); ++i) {
        spdlog::debug("Root {}: {} -> {}", i, directories_[i].string(), relative_roots_[i].string());
    }
}

std::string ContentRoots::basename(const std::string& filename) {
    auto slash = filename.rfind('/');
    return slash == std::string::npos ? filename : filename.substr(slash + 1);
}

fs::path ContentRoots::resolve(const std::string& filename) const {
    std::string name = basename(filename);
    if (name.empty()) {
        name = "index.html";
    }

    for (std::size_t i = 0; i < directories_.size(); ++i) {
        std::error_code ec;
        if (fs::is_regular_file(directories_[i] / name, ec)) {
            return relative_roots_[i] / name;
        }
    }
    throw NotFoundError(name);
}

std::optional<std::size_t> ContentRoots::match_prefix(const std::string& request_path) const {
    std::string effective = request_path;
    if (!effective.empty() && effective.front() == '/') {
        effective.erase(0, 1);
    }

    for (std::size_t i = 0; i < relative_roots_.size(); ++i) {
        const std::string prefix = relative_roots_[i].generic_string();
        if (effective.compare(0, prefix.size(), prefix) == 0) {
            return i;
        }
    }
    return std::nullopt;
}

fs::path ContentRoots::absolute(const fs::path& relative) const {
    return (common_ancestor_ / relative).lexically_normal();
}

fs::path ContentRoots::common_path(const std::vector<fs::path>& paths) {
    fs::path common = paths.front();
    for (std::size_t i = 1; i < paths.size(); ++i) {
        fs::path next;
        auto a = common.begin();
        auto b = paths[i].begin();
        for (; a != common.end() && b != paths[i].end() && *a == *b; ++a, ++b) {
            next /= *a;
        }
        common = next;
    }
    return common;
}

} // namespace wvb
