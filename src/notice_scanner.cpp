#include "notice_scanner.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <sys/stat.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <regex>
#include <system_error>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace wvb {

char state_symbol(NoticeState state) {
    switch (state) {
        case NoticeState::Exempt:        return '-';
        case NoticeState::Missing:       return '0';
        case NoticeState::Correct:       return '.';
        case NoticeState::IncorrectDate: return 'X';
        case NoticeState::Error:         return '!';
    }
    return '?';
}

const char* state_name(NoticeState state) {
    switch (state) {
        case NoticeState::Exempt:        return "EXEMPT";
        case NoticeState::Missing:       return "MISSING";
        case NoticeState::Correct:       return "CORRECT";
        case NoticeState::IncorrectDate: return "INCORRECT_DATE";
        case NoticeState::Error:         return "ERROR";
    }
    return "UNKNOWN";
}

std::string CalendarDate::to_string() const {
    return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

std::string NoticedFile::to_string() const {
    std::string summary = state_name(state);
    if (modified || notice) {
        summary += " " + (modified ? modified->to_string() : std::string("None"));
        if (notice) {
            summary += fmt::format(" \"{}\" {} \"{}\"", notice->style, notice->year, notice->suffix);
        } else {
            summary += " None";
        }
    }
    if (!error.empty()) {
        summary += " " + error;
    }
    return path.string() + "\n" + summary;
}

std::optional<DiscoveredNotice> find_notice(std::istream& in, int max_lines) {
    static const std::regex pattern(
        R"(^\s*(#|//|/\*|\*|<!--|--|;)\s*Copyright\s+(?:\([cC]\)\s+)?(\d{4})\s*(.*?)\s*(?:\*/|-->)?\s*$)",
        std::regex::icase);

    std::string line;
    for (int i = 0; i < max_lines && std::getline(in, line); ++i) {
        if (line.find('\0') != std::string::npos) {
            throw NoticeDecodeError("Binary content in line " + std::to_string(i + 1));
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::smatch m;
        if (std::regex_match(line, m, pattern)) {
            DiscoveredNotice notice;
            notice.style = m[1].str();
            notice.year = std::stoi(m[2].str());
            notice.suffix = m[3].str();
            return notice;
        }
    }
    return std::nullopt;
}

CalendarDate FilesystemDateSource::modified_date(const fs::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        throw fs::filesystem_error("stat failed", path, std::error_code(errno, std::generic_category()));
    }
    std::tm tm{};
    localtime_r(&st.st_mtime, &tm);
    return CalendarDate{tm.tm_year + 1900, static_cast<unsigned>(tm.tm_mon + 1), static_cast<unsigned>(tm.tm_mday)};
}

namespace {

std::string shell_quote(const std::string& text) {
    std::string out = "'";
    for (char c : text) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    return out + "'";
}

// stdout of a shell command, or nullopt if it couldn't run or exited non-zero
std::optional<std::string> run_command(const std::string& cmd) {
    FILE* pipe = popen((cmd + " 2>/dev/null").c_str(), "r");
    if (!pipe) {
        return std::nullopt;
    }
    std::string result;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result += buffer;
    }
    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::nullopt;
    }
    return result;
}

} // namespace

CalendarDate GitDateSource::modified_date(const fs::path& path) {
    const std::string dir = shell_quote(path.has_parent_path() ? path.parent_path().string() : ".");
    const std::string name = shell_quote(path.filename().string());

    auto status = run_command("git -C " + dir + " status --porcelain -- " + name);
    if (!status || !status->empty()) {
        // Not tracked by git, or changed since the last commit
        return fallback_.modified_date(path);
    }

    auto log = run_command("git -C " + dir + " log -1 --format=%cd --date=short -- " + name);
    CalendarDate date;
    if (log && std::sscanf(log->c_str(), "%d-%u-%u", &date.year, &date.month, &date.day) == 3) {
        return date;
    }
    spdlog::debug("No git history for {}", path.string());
    return fallback_.modified_date(path);
}

NoticeScanner::NoticeScanner(NoticeConfig config, std::shared_ptr<DateSource> dates)
    : config_(std::move(config))
    , dates_(std::move(dates))
{
}

bool NoticeScanner::is_exempt(const fs::path& path) const {
    const std::string name = path.filename().string();
    if (std::find(config_.exempt_names.begin(), config_.exempt_names.end(), name) != config_.exempt_names.end()) {
        return true;
    }
    const std::string ext = path.extension().string();
    return !ext.empty() &&
           std::find(config_.exempt_extensions.begin(), config_.exempt_extensions.end(), ext) !=
               config_.exempt_extensions.end();
}

NoticedFile NoticeScanner::check(const fs::path& path) const {
    NoticedFile result;
    result.path = path;

    if (is_exempt(path)) {
        result.state = NoticeState::Exempt;
        return result;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        result.state = NoticeState::Error;
        result.error = "Cannot open file";
        return result;
    }

    try {
        result.notice = find_notice(in, config_.header_lines);
        result.modified = dates_->modified_date(path);
    } catch (const NoticeDecodeError& e) {
        result.state = NoticeState::Error;
        result.error = e.what();
        return result;
    } catch (const fs::filesystem_error& e) {
        result.state = NoticeState::Error;
        result.error = e.what();
        return result;
    }

    if (!result.notice) {
        result.state = NoticeState::Missing;
    } else if (result.notice->year != result.modified->year) {
        result.state = NoticeState::IncorrectDate;
    } else {
        result.state = NoticeState::Correct;
    }
    return result;
}

std::vector<NoticedFile> NoticeScanner::scan(const fs::path& root) const {
    std::vector<fs::path> files;
    std::error_code ec;

    if (fs::is_regular_file(root, ec)) {
        files.push_back(root);
    } else {
        for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator();
             it.increment(ec)) {
            std::error_code entry_ec;
            if (it->is_directory(entry_ec) && it->path().filename() == ".git") {
                it.disable_recursion_pending();
                continue;
            }
            if (it->is_regular_file(entry_ec)) {
                files.push_back(it->path());
            }
        }
        if (ec) {
            spdlog::warn("Walking {}: {}", root.string(), ec.message());
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<NoticedFile> results;
    results.reserve(files.size());
    for (const auto& file : files) {
        results.push_back(check(file));
    }
    return results;
}

} // namespace wvb
