#include "s3up/client/output.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

#include "s3up/time_format.hpp"

namespace s3up::client::output
{

    namespace
    {
        constexpr double kKiB = 1024.0;
        constexpr double kMiB = kKiB * 1024.0;
        constexpr double kGiB = kMiB * 1024.0;

        std::string one_decimal(double value, const char *unit)
        {
            std::ostringstream out;
            out << std::fixed << std::setprecision(1) << value << ' ' << unit;
            return out.str();
        }
    } // namespace

    std::string format_bytes(std::uint64_t bytes)
    {
        const auto value = static_cast<double>(bytes);
        if (value < kKiB)
        {
            return std::to_string(bytes) + " B";
        }
        if (value < kMiB)
        {
            return one_decimal(value / kKiB, "KB");
        }
        if (value < kGiB)
        {
            return one_decimal(value / kMiB, "MB");
        }
        return one_decimal(value / kGiB, "GB");
    }

    std::string format_upload_success(const UploadOutcome &outcome)
    {
        return outcome.filename + " \xE2\x86\x92 " + outcome.public_url + " (" + format_bytes(outcome.size) + ")";
    }

    std::string format_upload_error(const UploadOutcome &outcome)
    {
        return "Error: " + outcome.filename + " - " + outcome.message;
    }

    std::string format_list_item(const ObjectInfo &object, bool quiet, bool json)
    {
        const auto iso = format_iso8601(object.last_modified);
        if (json)
        {
            return nlohmann::json{{"key", object.key}, {"lastModified", iso}, {"size", object.size}}.dump();
        }
        if (quiet)
        {
            std::ostringstream out;
            out << object.key << '\t' << std::setw(10) << format_bytes(object.size) << '\t' << iso.substr(0, 10);
            return out.str();
        }
        return object.key + "\t" + format_bytes(object.size) + "\t" + iso;
    }

    std::string format_delete_summary(std::size_t count, std::uint64_t total_bytes, bool dry_run)
    {
        return std::string(dry_run ? "Would delete " : "Deleted ") + std::to_string(count) + " objects (" +
               format_bytes(total_bytes) + ")";
    }

    std::string format_dry_run_list(const std::vector<ObjectInfo> &objects)
    {
        std::string text;
        for (const auto &object : objects)
        {
            if (!text.empty())
            {
                text += '\n';
            }
            text += "  " + object.key + " (" + format_bytes(object.size) + ")";
        }
        return text;
    }

    std::string format_progress(const ProgressSnapshot &snapshot, std::size_t bar_width)
    {
        const auto filled = std::min(bar_width, static_cast<std::size_t>(snapshot.percent / 100.0 *
                                                                          static_cast<double>(bar_width)));
        std::ostringstream out;
        out << snapshot.filename << " [" << std::string(filled, '#') << std::string(bar_width - filled, '-') << "] "
            << std::fixed << std::setprecision(0) << snapshot.percent << "% " << snapshot.completed_parts << '/'
            << snapshot.total_parts << " parts "
            << format_bytes(static_cast<std::uint64_t>(snapshot.bytes_per_second)) << "/s";
        return out.str();
    }

} // namespace s3up::client::output
