#include "changeview/time.hpp"

#include <cctype>

namespace changeview::timeutil {

std::optional<int> parse_tz_offset(std::string_view text) {
  if (text.size() != 5 || (text[0] != '+' && text[0] != '-'))
    return std::nullopt;
  for (std::size_t i = 1; i < text.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i])))
      return std::nullopt;
  }
  const int hh = (text[1] - '0') * 10 + (text[2] - '0');
  const int mm = (text[3] - '0') * 10 + (text[4] - '0');
  if (mm >= 60)
    return std::nullopt;
  const int minutes = hh * 60 + mm;
  return text[0] == '-' ? -minutes : minutes;
}

std::string format_timestamp(std::time_t epoch, int tz_minutes) {
  // Shift into the target zone, then break down as if it were UTC.
  const std::time_t shifted = epoch + static_cast<std::time_t>(tz_minutes) * 60;
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &shifted);
#else
  gmtime_r(&shifted, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return std::string(buf);
}

} // namespace changeview::timeutil
