#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cctype>

namespace ZenFeed {
namespace StringUtils {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\n\r\f\v");
    return s.substr(start, end - start + 1);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string collapseWhitespace(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    bool lastSpace = true;
    for (char c : s) {
        if (c == '\n' || c == '\r' || c == '\t' || c == '\f' || c == '\v') c = ' ';
        if (c == ' ') {
            if (!lastSpace) result += ' ';
            lastSpace = true;
        } else {
            result += c;
            lastSpace = false;
        }
    }
    if (!result.empty() && result.back() == ' ') result.pop_back();
    return result;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string sanitizeUtf8(const std::string& input) {
    std::string result;
    result.reserve(input.size());
    const size_t n = input.size();
    size_t i = 0;
    auto cont = [&](size_t k) {
        return k < n && (static_cast<unsigned char>(input[k]) & 0xC0) == 0x80;
    };
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t len = 0;
        if (c < 0x80) {
            len = c == 0 ? 0 : 1;
        } else if ((c & 0xE0) == 0xC0) {
            len = cont(i + 1) ? 2 : 0;
        } else if ((c & 0xF0) == 0xE0) {
            len = cont(i + 1) && cont(i + 2) ? 3 : 0;
        } else if ((c & 0xF8) == 0xF0) {
            len = cont(i + 1) && cont(i + 2) && cont(i + 3) ? 4 : 0;
        }
        if (len == 0) {
            ++i; // skip invalid byte
            continue;
        }
        result.append(input, i, len);
        i += len;
    }
    return result;
}

std::uint64_t fnv1a64(const std::string& value) {
    std::uint64_t hash = 14695981039346656037ull;
    for (unsigned char c : value) {
        hash ^= c;
        hash *= 1099511628211ull;
    }
    return hash;
}

std::string toHex(std::uint64_t value) {
    static const char digits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = digits[value & 0xF];
        value >>= 4;
    }
    return out;
}

std::string normalizeFeedUrl(const std::string& url) {
    std::string u = trim(url);
    size_t schemeEnd = u.find("://");
    if (schemeEnd == std::string::npos) return "";
    std::string scheme = toLower(u.substr(0, schemeEnd));
    if (scheme != "http" && scheme != "https") return "";
    if (u.find_first_of(" \t\r\n") != std::string::npos) return "";

    size_t hostStart = schemeEnd + 3;
    size_t hostEnd = u.find_first_of("/?#", hostStart);
    std::string host = u.substr(hostStart, hostEnd == std::string::npos ? std::string::npos : hostEnd - hostStart);
    if (host.empty()) return "";

    std::string rest = hostEnd == std::string::npos ? "" : u.substr(hostEnd);
    return scheme + "://" + toLower(host) + rest;
}

std::string normalizeLink(const std::string& link) {
    std::string u = normalizeFeedUrl(link);
    if (u.empty()) return trim(link);
    size_t hash = u.find('#');
    if (hash != std::string::npos) u.erase(hash);
    while (!u.empty() && u.back() == '/') u.pop_back();
    return u;
}

}
}
