#include "start_message.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace wvb {

std::string directory_lines(const ContentRoots& roots, std::size_t width, std::size_t indent) {
    std::string out;

    for (const auto& directory : roots.directories()) {
        bool first = true;
        std::size_t line_len = 0;
        std::size_t index = 0;

        for (const auto& leg : directory) {
            const std::string part = leg.string();
            if (index == 0 && part == "/") {
                ++index;
                continue;
            }
            const std::string append = (index == 0 ? "" : "/") + part;
            ++index;

            while (true) {
                bool line_start = false;
                if (line_len == 0) {
                    std::string lead = first ? ">" : "";
                    lead.resize(std::max(indent, lead.size()), ' ');
                    out += "\n" + lead;
                    line_len += lead.size();
                    line_start = true;
                }
                if (line_len + append.size() > width) {
                    // A part longer than a whole line gets a line of its own
                    if (line_start) {
                        out += append;
                    }
                    first = false;
                    line_len = 0;
                    if (line_start) {
                        break;
                    }
                } else {
                    line_len += append.size();
                    out += append;
                    break;
                }
            }
        }
    }
    return out;
}

std::vector<std::string> page_links(const std::string& server_url, const ContentRoots& roots) {
    std::vector<std::string> links;
    const fs::path& top = roots.directories().front();

    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(top, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        const fs::path& p = it->path();
        const std::string name = p.filename().string();
        if (p.extension() != ".html" || name.empty() ||
            !std::isupper(static_cast<unsigned char>(name.front()))) {
            continue;
        }
        links.push_back(server_url + "/" + p.lexically_relative(top).generic_string());
    }
    std::sort(links.begin(), links.end());
    return links;
}

std::string start_message(const std::string& server_url, const ContentRoots& roots) {
    std::ostringstream oss;
    oss << "Starting HTTP server at " << server_url << " for:" << directory_lines(roots) << "\n"
        << "cd " << roots.common_ancestor().string() << "\n";
    for (const auto& link : page_links(server_url, roots)) {
        oss << link << "\n";
    }
    return oss.str();
}

} // namespace wvb
