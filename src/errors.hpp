#pragma once

#include <stdexcept>
#include <string>

namespace wvb {

// A content root or config file that can't be used; aborts startup
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Requested basename is absent from every content root
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& filename)
        : std::runtime_error("File \"" + filename + "\" not found.")
        , filename_(filename)
    {
    }

    const std::string& filename() const { return filename_; }

private:
    std::string filename_;
};

// Malformed request head
class HttpParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// File header that isn't text
class NoticeDecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace wvb
