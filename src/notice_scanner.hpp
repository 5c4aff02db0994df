#pragma once

#include "config.hpp"
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wvb {

enum class NoticeState { Exempt, Missing, Correct, IncorrectDate, Error };

char state_symbol(NoticeState state);
const char* state_name(NoticeState state);

struct CalendarDate {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;

    std::string to_string() const; // YYYY-MM-DD
};

// A "Copyright <year> <holder>" line found in a file header
struct DiscoveredNotice {
    std::string style;  // comment leader, e.g. "//" or "#"
    int year = 0;
    std::string suffix; // text after the year
};

struct NoticedFile {
    std::filesystem::path path;
    std::optional<CalendarDate> modified;
    std::optional<DiscoveredNotice> notice;
    NoticeState state = NoticeState::Error;
    std::string error;

    // Path on the first line, state and details on the second
    std::string to_string() const;
};

// Scans at most `max_lines` lines. Throws NoticeDecodeError on binary content.
std::optional<DiscoveredNotice> find_notice(std::istream& in, int max_lines);

// Source of a file's last-modified date
class DateSource {
public:
    virtual ~DateSource() = default;
    virtual CalendarDate modified_date(const std::filesystem::path& path) = 0;
};

// Filesystem modification time, local calendar date
class FilesystemDateSource : public DateSource {
public:
    CalendarDate modified_date(const std::filesystem::path& path) override;
};

// Date of the last commit touching the file, unless the working copy differs
// from the repository or git has no history for it; then the filesystem time.
class GitDateSource : public DateSource {
public:
    CalendarDate modified_date(const std::filesystem::path& path) override;

private:
    FilesystemDateSource fallback_;
};

class NoticeScanner {
public:
    NoticeScanner(NoticeConfig config, std::shared_ptr<DateSource> dates);

    bool is_exempt(const std::filesystem::path& path) const;
    NoticedFile check(const std::filesystem::path& path) const;

    // Every regular file under `root` (or `root` itself), sorted, .git skipped
    std::vector<NoticedFile> scan(const std::filesystem::path& root) const;

private:
    NoticeConfig config_;
    std::shared_ptr<DateSource> dates_;
};

} // namespace wvb
