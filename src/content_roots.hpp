#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace wvb {

// Ordered set of content directories, searched highest priority first.
//
// All roots are expressed relative to their common ancestor so that every
// served file lives in one virtual namespace. The tables are computed once on
// construction and never change, so lookups may run concurrently.
class ContentRoots {
public:
    // Throws ConfigurationError if the list is empty or any entry is not an
    // existing directory.
    explicit ContentRoots(const std::vector<std::filesystem::path>& directories);

    // Finds the basename of `filename` under the roots in priority order and
    // returns it relative to the common ancestor. An empty basename means
    // index.html. Throws NotFoundError if no root has the file.
    std::filesystem::path resolve(const std::string& filename) const;

    // Index of the first relative root that is a string prefix of the request
    // path, after stripping one leading '/'.
    std::optional<std::size_t> match_prefix(const std::string& request_path) const;

    std::filesystem::path absolute(const std::filesystem::path& relative) const;

    const std::vector<std::filesystem::path>& directories() const { return directories_; }
    const std::vector<std::filesystem::path>& relative_roots() const { return relative_roots_; }
    const std::filesystem::path& common_ancestor() const { return common_ancestor_; }
    std::size_t size() const { return directories_.size(); }

    static std::string basename(const std::string& filename);

private:
    static std::filesystem::path common_path(const std::vector<std::filesystem::path>& paths);

    std::vector<std::filesystem::path> directories_;
    std::vector<std::filesystem::path> relative_roots_;
    std::filesystem::path common_ancestor_;
};

} // namespace wvb
