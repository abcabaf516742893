#pragma once
#include "core/Types.hpp"
#include <optional>
#include <string>

namespace ZenFeed {
namespace DateParser {

// RFC 822/1123 ("Mon, 02 Jan 2006 15:04:05 -0700") or ISO 8601/RFC 3339
// ("2006-01-02T15:04:05Z", fractional seconds, offsets, date only).
// Dates outside 1970..2100 are treated as unparseable.
std::optional<Timestamp> parse(const std::string& text);

std::optional<Timestamp> parseRfc822(const std::string& text);
std::optional<Timestamp> parseIso8601(const std::string& text);

// "YYYY-MM-DD" in UTC.
std::string formatDay(Timestamp t);

// "YYYY-MM-DD HH:MM" in UTC.
std::string formatMinute(Timestamp t);

}
}
