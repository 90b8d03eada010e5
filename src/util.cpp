#include "util.hpp"

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <random>
#include <fcntl.h>
#include <unistd.h>

namespace taleweave {

uint64_t epoch_seconds() {
    return static_cast<uint64_t>(std::time(nullptr));
}

std::string format_iso8601(Timestamp ts) {
    std::time_t t = static_cast<std::time_t>(ts);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::optional<Timestamp> parse_iso8601(const std::string& s) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }
    // timegm would roll Feb 31 over into March
    static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (day > kDaysInMonth[month - 1] + (month == 2 && leap ? 1 : 0)) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);

    // Fractional seconds are accepted and truncated
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            ++pos;
            ++digits;
        }
        if (digits == 0) return std::nullopt;
    }

    long offset_seconds = 0;
    if (pos < s.size()) {
        char c = s[pos];
        if (c == 'Z' || c == 'z') {
            ++pos;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            int n = 0;
            if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d%n", &oh, &om, &n) != 2 || n != 5) {
                return std::nullopt;
            }
            offset_seconds = (oh * 3600L + om * 60L) * (c == '+' ? 1 : -1);
            pos += 1 + static_cast<size_t>(n);
        }
    }
    if (pos != s.size()) return std::nullopt;

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    std::time_t t = timegm(&tm_buf);
    return static_cast<Timestamp>(t) - offset_seconds;
}

std::string generate_id() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<uint64_t> dist;
    uint64_t val = dist(gen);
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(val));
    return buf;
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool atomic_write_file(const std::string& path, const std::string& content) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[io] Cannot create directory " << parent.string()
                      << ": " << ec.message() << "\n";
            return false;
        }
    }

    std::string tmp = path + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        std::cerr << "[io] Cannot open " << tmp << ": " << std::strerror(errno) << "\n";
        return false;
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[io] Write to " << tmp << " failed: " << std::strerror(errno) << "\n";
            ::close(fd);
            ::unlink(tmp.c_str());
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0) {
        std::cerr << "[io] fsync of " << tmp << " failed: " << std::strerror(errno) << "\n";
        ::close(fd);
        ::unlink(tmp.c_str());
        return false;
    }
    if (::close(fd) != 0) {
        ::unlink(tmp.c_str());
        return false;
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        std::cerr << "[io] Rename " << tmp << " -> " << path << " failed: "
                  << std::strerror(errno) << "\n";
        ::unlink(tmp.c_str());
        return false;
    }
    return true;
}

} // namespace taleweave
