#include "s3up/client/retention.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace s3up::client
{

    std::chrono::milliseconds parse_age(std::string_view text)
    {
        if (text.empty())
        {
            return std::chrono::milliseconds::zero();
        }
        char unit = 'd';
        auto digits = text;
        if (!std::isdigit(static_cast<unsigned char>(digits.back())))
        {
            unit = digits.back();
            digits.remove_suffix(1);
        }
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](char ch)
                                           { return std::isdigit(static_cast<unsigned char>(ch)); }))
        {
            return std::chrono::milliseconds::zero();
        }
        std::int64_t value = 0;
        const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec != std::errc{} || end != digits.data() + digits.size())
        {
            return std::chrono::milliseconds::zero();
        }
        switch (unit)
        {
        case 'd':
            return std::chrono::hours(24 * value);
        case 'h':
            return std::chrono::hours(value);
        case 'm':
            return std::chrono::minutes(value);
        default:
            return std::chrono::milliseconds::zero();
        }
    }

    std::vector<ObjectInfo> select_for_deletion(const std::vector<ObjectInfo> &objects, const RetentionPolicy &policy,
                                                SystemTime now)
    {
        std::vector<ObjectInfo> sorted = objects;
        std::stable_sort(sorted.begin(), sorted.end(), [](const ObjectInfo &a, const ObjectInfo &b)
                         { return a.last_modified > b.last_modified; });

        const std::size_t protected_count = policy.keep_last.value_or(0);
        const auto older_than = policy.older_than_days
                                    ? std::optional<std::chrono::milliseconds>(std::chrono::hours(24 * *policy.older_than_days))
                                    : std::nullopt;

        std::vector<ObjectInfo> selected;
        for (std::size_t i = 0; i < sorted.size(); ++i)
        {
            const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(now - sorted[i].last_modified);
            if (age <= policy.min_age)
            {
                continue;
            }
            if (i < protected_count)
            {
                continue;
            }
            if (older_than && age <= *older_than)
            {
                continue;
            }
            selected.push_back(sorted[i]);
        }
        return selected;
    }

    DeletionSummary summarize(const std::vector<ObjectInfo> &objects)
    {
        DeletionSummary summary;
        summary.count = objects.size();
        for (const auto &object : objects)
        {
            summary.total_bytes += object.size;
        }
        return summary;
    }

} // namespace s3up::client
