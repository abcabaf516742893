#include "utils/DateParser.hpp"
#include "utils/StringUtils.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <vector>

namespace ZenFeed {
namespace DateParser {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && isLeap(y) ? 29 : days[m - 1];
}

std::optional<Timestamp> build(int year, int month, int day, int hour, int minute,
                               int second, int offsetSeconds) {
    if (year < 1970 || year > 2100) return std::nullopt;
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) return std::nullopt;
    if (second < 0 || second > 60) return std::nullopt;
    if (second == 60) second = 59;  // leap second

    std::int64_t secs = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400
        + hour * 3600 + minute * 60 + second - offsetSeconds;
    return fromUnixSeconds(secs);
}

bool allDigits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool allAlpha(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

int monthIndex(const std::string& token) {
    static const char* names[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                  "jul", "aug", "sep", "oct", "nov", "dec"};
    if (token.size() < 3) return 0;
    std::string key = StringUtils::toLower(token.substr(0, 3));
    for (int i = 0; i < 12; ++i) {
        if (key == names[i]) return i + 1;
    }
    return 0;
}

// Reads exactly n digits at pos.
bool readDigits(const std::string& s, size_t& pos, size_t n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    pos += n;
    return true;
}

// "+0200", "-05:00", "+02"
bool parseNumericOffset(const std::string& s, int& offsetSeconds) {
    if (s.size() < 3 || (s[0] != '+' && s[0] != '-')) return false;
    int sign = s[0] == '-' ? -1 : 1;
    size_t pos = 1;
    int hh = 0, mm = 0;
    if (!readDigits(s, pos, 2, hh)) return false;
    if (pos < s.size() && s[pos] == ':') ++pos;
    if (pos < s.size() && !readDigits(s, pos, 2, mm)) return false;
    if (pos != s.size() || hh > 23 || mm > 59) return false;
    offsetSeconds = sign * (hh * 3600 + mm * 60);
    return true;
}

bool parseZoneName(const std::string& name, int& offsetSeconds) {
    struct Zone { const char* name; int hours; };
    static const Zone zones[] = {
        {"gmt", 0}, {"ut", 0}, {"utc", 0}, {"z", 0},
        {"est", -5}, {"edt", -4}, {"cst", -6}, {"cdt", -5},
        {"mst", -7}, {"mdt", -6}, {"pst", -8}, {"pdt", -7},
    };
    std::string key = StringUtils::toLower(name);
    for (const auto& z : zones) {
        if (key == z.name) {
            offsetSeconds = z.hours * 3600;
            return true;
        }
    }
    return false;
}

}

std::optional<Timestamp> parseRfc822(const std::string& text) {
    std::string cleaned = text;
    for (char& c : cleaned) {
        if (c == ',') c = ' ';
    }
    std::istringstream in(cleaned);
    std::vector<std::string> tokens;
    std::string tok;
    while (in >> tok) tokens.push_back(tok);

    size_t i = 0;
    if (i < tokens.size() && allAlpha(tokens[i]) && monthIndex(tokens[i]) == 0) ++i;  // weekday
    if (i + 3 > tokens.size()) return std::nullopt;
    if (!allDigits(tokens[i]) || tokens[i].size() > 2) return std::nullopt;
    if (!allDigits(tokens[i + 2]) || tokens[i + 2].size() > 4) return std::nullopt;

    int day = std::stoi(tokens[i]);
    int month = monthIndex(tokens[i + 1]);
    if (month == 0) return std::nullopt;
    int year = std::stoi(tokens[i + 2]);
    if (tokens[i + 2].size() == 2) {
        year += year < 50 ? 2000 : 1900;
    } else if (tokens[i + 2].size() == 3) {
        year += 1900;
    }
    i += 3;

    int hour = 0, minute = 0, second = 0;
    if (i < tokens.size() && tokens[i].find(':') != std::string::npos) {
        const std::string& t = tokens[i];
        // Single-digit hours ("9:05") occur in the wild.
        size_t colon = t.find(':');
        if (colon != 1 && colon != 2) return std::nullopt;
        size_t pos = 0;
        if (!readDigits(t, pos, colon, hour)) return std::nullopt;
        ++pos;
        if (!readDigits(t, pos, 2, minute)) return std::nullopt;
        if (pos < t.size()) {
            if (t[pos] != ':') return std::nullopt;
            ++pos;
            if (!readDigits(t, pos, 2, second) || pos != t.size()) return std::nullopt;
        }
        ++i;
    }

    int offset = 0;
    if (i < tokens.size()) {
        const std::string& z = tokens[i];
        if (!parseNumericOffset(z, offset) && !parseZoneName(z, offset)) {
            // Unknown zone names (military letters, "CEST", ...) are read as UTC.
            if (!allAlpha(z)) return std::nullopt;
            offset = 0;
        }
    }
    return build(year, month, day, hour, minute, second, offset);
}

std::optional<Timestamp> parseIso8601(const std::string& raw) {
    std::string s = StringUtils::trim(raw);
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!readDigits(s, pos, 4, year)) return std::nullopt;
    if (pos >= s.size() || s[pos] != '-') return std::nullopt;
    ++pos;
    if (!readDigits(s, pos, 2, month)) return std::nullopt;
    if (pos >= s.size() || s[pos] != '-') return std::nullopt;
    ++pos;
    if (!readDigits(s, pos, 2, day)) return std::nullopt;
    if (pos == s.size()) return build(year, month, day, 0, 0, 0, 0);

    if (s[pos] != 'T' && s[pos] != 't' && s[pos] != ' ') return std::nullopt;
    ++pos;
    int hour = 0, minute = 0, second = 0;
    if (!readDigits(s, pos, 2, hour)) return std::nullopt;
    if (pos >= s.size() || s[pos] != ':') return std::nullopt;
    ++pos;
    if (!readDigits(s, pos, 2, minute)) return std::nullopt;
    if (pos < s.size() && s[pos] == ':') {
        ++pos;
        if (!readDigits(s, pos, 2, second)) return std::nullopt;
        if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
            ++pos;
            size_t fracStart = pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) ++pos;
            if (pos == fracStart) return std::nullopt;
        }
    }

    int offset = 0;
    if (pos < s.size()) {
        std::string zone = StringUtils::trim(s.substr(pos));
        if (zone == "Z" || zone == "z") {
            offset = 0;
        } else if (!parseNumericOffset(zone, offset) && !parseZoneName(zone, offset)) {
            return std::nullopt;
        }
    }
    return build(year, month, day, hour, minute, second, offset);
}

std::optional<Timestamp> parse(const std::string& text) {
    std::string s = StringUtils::trim(text);
    if (s.empty()) return std::nullopt;
    if (s.size() >= 10 && std::isdigit(static_cast<unsigned char>(s[0])) && s[4] == '-') {
        return parseIso8601(s);
    }
    return parseRfc822(s);
}

std::string formatDay(Timestamp t) {
    std::time_t tt = Clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

std::string formatMinute(Timestamp t) {
    std::time_t tt = Clock::to_time_t(t);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

}
}
