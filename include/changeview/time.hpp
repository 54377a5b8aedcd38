#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace changeview::timeutil {

// Parse ±HHMM (e.g., "+0300" -> 180, "-0700" -> -420). nullopt on malformed input.
auto parse_tz_offset(std::string_view text) -> std::optional<int>;

// "YYYY-MM-DD HH:MM:SS" for `epoch` shifted by `tz_minutes` east of UTC.
auto format_timestamp(std::time_t epoch, int tz_minutes) -> std::string;

} // namespace changeview::timeutil
