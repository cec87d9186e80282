#pragma once

#include "conductor/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace conductor::common {

using TimePoint = std::chrono::system_clock::time_point;

/// Time source injected into components that take timestamps, so tests can drive time.
using Clock = std::function<TimePoint()>;

/// Wall clock truncated to milliseconds, the precision timestamps are persisted with.
[[nodiscard]] TimePoint now();
[[nodiscard]] Clock system_clock();
[[nodiscard]] TimePoint truncate_to_millis(TimePoint value);
[[nodiscard]] std::int64_t epoch_millis(TimePoint value);

/// ISO-8601 UTC with milliseconds, e.g. 2026-10-19T08:15:02.413Z.
[[nodiscard]] std::string format_timestamp(TimePoint value);

/// Accepts the form produced by format_timestamp, with or without the fractional part.
[[nodiscard]] Result<TimePoint> parse_timestamp(const std::string &text);

} // namespace conductor::common
