#pragma once
#include <cstdint>
#include <string>

namespace ZenFeed {
namespace StringUtils {

std::string trim(const std::string& s);
std::string toLower(std::string s);

// Collapse whitespace runs (including newlines) to single spaces and trim.
std::string collapseWhitespace(const std::string& s);

bool startsWith(const std::string& s, const std::string& prefix);

// Drop byte sequences that are not valid UTF-8.
std::string sanitizeUtf8(const std::string& input);

std::uint64_t fnv1a64(const std::string& value);
std::string toHex(std::uint64_t value);

// Trimmed, scheme and host lower-cased. Returns empty when the url is not
// an absolute http(s) URL.
std::string normalizeFeedUrl(const std::string& url);

// normalizeFeedUrl semantics plus fragment and trailing slash removed; used
// for identity comparison of article links. Non-http links are only trimmed.
std::string normalizeLink(const std::string& link);

}
}
