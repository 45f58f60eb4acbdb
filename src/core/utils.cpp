#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

std::string format_iso_utc(SystemTime t) {
    auto tt = std::chrono::system_clock::to_time_t(t);
    struct tm tm_buf;
    gmtime_r(&tt, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

std::optional<SystemTime> parse_iso_utc(const std::string& iso) {
    struct tm tm_buf = {};
    int consumed = 0;
    if (sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d%n",
               &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
               &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    std::string rest = iso.substr(static_cast<size_t>(consumed));
    if (!rest.empty() && rest != "Z") return std::nullopt;
    if (tm_buf.tm_mon < 1 || tm_buf.tm_mon > 12 || tm_buf.tm_mday < 1 || tm_buf.tm_mday > 31)
        return std::nullopt;

    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    std::time_t t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string sanitize_key(const std::string& key) {
    std::string out = key;
    for (auto& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-') c = '_';
    }
    return out;
}
