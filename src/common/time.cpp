#include "conductor/common/time.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace conductor::common {

TimePoint truncate_to_millis(const TimePoint value) {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(value);
}

TimePoint now() { return truncate_to_millis(std::chrono::system_clock::now()); }

Clock system_clock() {
  return [] { return now(); };
}

std::int64_t epoch_millis(const TimePoint value) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
}

std::string format_timestamp(const TimePoint value) {
  const auto millis = epoch_millis(value);
  auto seconds = millis / 1000;
  auto fraction = millis % 1000;
  if (fraction < 0) {
    fraction += 1000;
    --seconds;
  }

  const auto t = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << fraction << 'Z';
  return out.str();
}

Result<TimePoint> parse_timestamp(const std::string &text) {
  std::tm tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    return Result<TimePoint>::failure("invalid timestamp: " + text);
  }

  std::int64_t millis = 0;
  if (in.peek() == '.') {
    in.get();
    int digits = 0;
    while (std::isdigit(in.peek()) != 0) {
      const int digit = in.get() - '0';
      if (digits < 3) {
        millis = millis * 10 + digit;
      }
      ++digits;
    }
    if (digits == 0) {
      return Result<TimePoint>::failure("invalid fractional seconds: " + text);
    }
    for (; digits < 3; ++digits) {
      millis *= 10;
    }
  }

  const int suffix = in.peek();
  if (suffix == 'Z') {
    in.get();
  }
  if (in.peek() != std::char_traits<char>::eof()) {
    return Result<TimePoint>::failure("unexpected timestamp suffix: " + text);
  }

  const std::time_t seconds = timegm(&tm);
  return Result<TimePoint>::success(TimePoint(std::chrono::seconds(seconds)) +
                                    std::chrono::milliseconds(millis));
}

} // namespace conductor::common
