#pragma once

#include "content_roots.hpp"
#include "http_message.hpp"
#include <filesystem>
#include <string>
#include <unordered_map>

namespace wvb {

// GET/HEAD handler that serves files out of the content roots.
//
// A request for "/" or "/name" is resolved directly. Any other path must
// start with one of the relative roots, otherwise it is forbidden. The
// basename is then searched across all roots in priority order, so
// "/web/index.html" is served from "lib/index.html" when only the lowest
// priority root has it.
class StaticResponder {
public:
    explicit StaticResponder(const ContentRoots& roots);

    HttpResponse respond(const HttpRequest& request) const;

    static std::string mime_type(const std::filesystem::path& path);

private:
    HttpResponse serve_file(const HttpRequest& request, const std::filesystem::path& relative) const;

    const ContentRoots& roots_;

    static const std::unordered_map<std::string, std::string> mime_types_;
};

} // namespace wvb
