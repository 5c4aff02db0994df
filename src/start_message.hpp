#pragma once

#include "content_roots.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace wvb {

// Root paths, one or more lines each, wrapped at `width` columns. The first
// line of each root is marked with '>'.
std::string directory_lines(const ContentRoots& roots, std::size_t width = 80, std::size_t indent = 2);

// Links to the HTML pages under the first root whose name starts with a
// capital letter, sorted.
std::vector<std::string> page_links(const std::string& server_url, const ContentRoots& roots);

std::string start_message(const std::string& server_url, const ContentRoots& roots);

} // namespace wvb
