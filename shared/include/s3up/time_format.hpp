/**
 * s3up - UTC timestamp formatting used by signing, listing and state files.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace s3up
{

    using SystemTime = std::chrono::system_clock::time_point;

    // YYYYMMDDThhmmssZ
    std::string format_amz_date(SystemTime time);

    // YYYYMMDD
    std::string format_date_stamp(SystemTime time);

    // YYYY-MM-DDThh:mm:ss.mmmZ
    std::string format_iso8601(SystemTime time);

    // Accepts YYYY-MM-DDThh:mm:ss[.fraction](Z|+hh:mm|-hh:mm).
    std::optional<SystemTime> parse_iso8601(std::string_view text);

    std::int64_t to_unix_millis(SystemTime time);
    SystemTime from_unix_millis(std::int64_t millis);

} // namespace s3up
