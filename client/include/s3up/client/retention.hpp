#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "s3up/s3_types.hpp"

namespace s3up::client
{

    // "7d", "12h", "30m" or a bare number of days. "0" and anything
    // malformed parse as zero.
    std::chrono::milliseconds parse_age(std::string_view text);

    struct RetentionPolicy
    {
        std::optional<int> older_than_days;
        std::optional<std::size_t> keep_last;
        // Objects younger than this are never selected.
        std::chrono::milliseconds min_age{std::chrono::hours(24)};
    };

    // Objects to delete, newest first. Every configured criterion must agree
    // before an object is selected.
    std::vector<ObjectInfo> select_for_deletion(const std::vector<ObjectInfo> &objects, const RetentionPolicy &policy,
                                                SystemTime now);

    struct DeletionSummary
    {
        std::size_t count{};
        std::uint64_t total_bytes{};
    };

    DeletionSummary summarize(const std::vector<ObjectInfo> &objects);

} // namespace s3up::client
