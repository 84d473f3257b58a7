#include "s3up/time_format.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace s3up
{

    namespace
    {

        struct Fields
        {
            int year{};
            unsigned month{};
            unsigned day{};
            long hours{};
            long minutes{};
            long seconds{};
            long millis{};
        };

        Fields split(SystemTime time)
        {
            using namespace std::chrono;
            const auto millis_total = floor<milliseconds>(time);
            const auto day_point = floor<days>(millis_total);
            const year_month_day ymd{day_point};
            const hh_mm_ss hms{millis_total - day_point};
            return Fields{
                .year = static_cast<int>(ymd.year()),
                .month = static_cast<unsigned>(ymd.month()),
                .day = static_cast<unsigned>(ymd.day()),
                .hours = static_cast<long>(hms.hours().count()),
                .minutes = static_cast<long>(hms.minutes().count()),
                .seconds = static_cast<long>(hms.seconds().count()),
                .millis = static_cast<long>(hms.subseconds().count()),
            };
        }

        bool read_number(std::string_view text, std::size_t offset, std::size_t width, int &out)
        {
            if (offset + width > text.size())
            {
                return false;
            }
            const auto *begin = text.data() + offset;
            const auto [ptr, ec] = std::from_chars(begin, begin + width, out);
            return ec == std::errc{} && ptr == begin + width;
        }

    } // namespace

    std::string format_amz_date(SystemTime time)
    {
        const auto f = split(time);
        std::ostringstream out;
        out << std::setfill('0') << std::setw(4) << f.year << std::setw(2) << f.month << std::setw(2) << f.day << 'T'
            << std::setw(2) << f.hours << std::setw(2) << f.minutes << std::setw(2) << f.seconds << 'Z';
        return out.str();
    }

    std::string format_date_stamp(SystemTime time)
    {
        return format_amz_date(time).substr(0, 8);
    }

    std::string format_iso8601(SystemTime time)
    {
        const auto f = split(time);
        std::ostringstream out;
        out << std::setfill('0') << std::setw(4) << f.year << '-' << std::setw(2) << f.month << '-' << std::setw(2)
            << f.day << 'T' << std::setw(2) << f.hours << ':' << std::setw(2) << f.minutes << ':' << std::setw(2)
            << f.seconds << '.' << std::setw(3) << f.millis << 'Z';
        return out.str();
    }

    std::optional<SystemTime> parse_iso8601(std::string_view text)
    {
        using namespace std::chrono;
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        if (text.size() < 19 || text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != ' ') ||
            text[13] != ':' || text[16] != ':')
        {
            return std::nullopt;
        }
        if (!read_number(text, 0, 4, year) || !read_number(text, 5, 2, month) || !read_number(text, 8, 2, day) ||
            !read_number(text, 11, 2, hour) || !read_number(text, 14, 2, minute) || !read_number(text, 17, 2, second))
        {
            return std::nullopt;
        }
        const year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                 std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok() || hour > 23 || minute > 59 || second > 60)
        {
            return std::nullopt;
        }

        std::size_t pos = 19;
        milliseconds fraction{0};
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            int scale = 100;
            long value = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                value += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
            fraction = milliseconds{value};
        }

        minutes offset{0};
        if (pos < text.size())
        {
            const char zone = text[pos];
            if (zone == 'Z' || zone == 'z')
            {
                ++pos;
            }
            else if (zone == '+' || zone == '-')
            {
                int offset_hours = 0;
                int offset_minutes = 0;
                if (!read_number(text, pos + 1, 2, offset_hours) || text.size() < pos + 6 || text[pos + 3] != ':' ||
                    !read_number(text, pos + 4, 2, offset_minutes))
                {
                    return std::nullopt;
                }
                offset = hours{offset_hours} + minutes{offset_minutes};
                if (zone == '-')
                {
                    offset = -offset;
                }
                pos += 6;
            }
        }
        if (pos != text.size())
        {
            return std::nullopt;
        }

        const auto point = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second} + fraction - offset;
        return time_point_cast<system_clock::duration>(point);
    }

    std::int64_t to_unix_millis(SystemTime time)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    }

    SystemTime from_unix_millis(std::int64_t millis)
    {
        return SystemTime{std::chrono::duration_cast<SystemTime::duration>(std::chrono::milliseconds{millis})};
    }

} // namespace s3up
