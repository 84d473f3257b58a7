#include "s3up/url.hpp"

#include <cctype>
#include <charconv>
#include <stdexcept>

namespace s3up
{

    namespace
    {

        std::uint16_t default_port(std::string_view scheme)
        {
            return scheme == "https" ? 443 : 80;
        }

        bool is_unreserved(unsigned char c)
        {
            return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
        }

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f')
            {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F')
            {
                return c - 'A' + 10;
            }
            return -1;
        }

    } // namespace

    std::string Url::authority() const
    {
        if (!explicit_port || port == default_port(scheme))
        {
            return host;
        }
        return host + ":" + std::to_string(port);
    }

    std::string Url::target() const
    {
        return query.empty() ? path : path + "?" + query;
    }

    Url parse_url(std::string_view text)
    {
        Url url;
        const auto scheme_end = text.find("://");
        if (scheme_end == std::string_view::npos)
        {
            throw std::invalid_argument("Malformed URL (missing scheme): " + std::string(text));
        }
        for (const char c : text.substr(0, scheme_end))
        {
            url.scheme.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        if (url.scheme != "http" && url.scheme != "https")
        {
            throw std::invalid_argument("Unsupported URL scheme: " + url.scheme);
        }

        auto rest = text.substr(scheme_end + 3);
        const auto authority_end = rest.find_first_of("/?");
        const auto authority = rest.substr(0, authority_end);
        rest = authority_end == std::string_view::npos ? std::string_view{} : rest.substr(authority_end);

        if (authority.empty() || authority.find_first_of(" @") != std::string_view::npos)
        {
            throw std::invalid_argument("Malformed URL host: " + std::string(text));
        }

        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos)
        {
            url.host = std::string(authority.substr(0, colon));
            const auto port_text = authority.substr(colon + 1);
            unsigned int port = 0;
            const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
            if (ec != std::errc{} || ptr != port_text.data() + port_text.size() || port == 0 || port > 65535)
            {
                throw std::invalid_argument("Malformed URL port: " + std::string(text));
            }
            url.port = static_cast<std::uint16_t>(port);
            url.explicit_port = true;
        }
        else
        {
            url.host = std::string(authority);
            url.port = default_port(url.scheme);
        }
        if (url.host.empty())
        {
            throw std::invalid_argument("Malformed URL host: " + std::string(text));
        }

        const auto query_start = rest.find('?');
        const auto path = rest.substr(0, query_start);
        url.path = path.empty() ? "/" : std::string(path);
        if (query_start != std::string_view::npos)
        {
            url.query = std::string(rest.substr(query_start + 1));
        }
        return url;
    }

    std::string uri_encode(std::string_view value, bool keep_slash)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string result;
        result.reserve(value.size());
        for (const char ch : value)
        {
            const auto c = static_cast<unsigned char>(ch);
            if (is_unreserved(c) || (keep_slash && c == '/'))
            {
                result.push_back(ch);
            }
            else
            {
                result.push_back('%');
                result.push_back(kHexDigits[(c >> 4) & 0x0F]);
                result.push_back(kHexDigits[c & 0x0F]);
            }
        }
        return result;
    }

    std::string uri_decode(std::string_view value)
    {
        std::string result;
        result.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            if (value[i] == '%' && i + 2 < value.size())
            {
                const int high = hex_value(value[i + 1]);
                const int low = hex_value(value[i + 2]);
                if (high >= 0 && low >= 0)
                {
                    result.push_back(static_cast<char>((high << 4) | low));
                    i += 2;
                    continue;
                }
            }
            result.push_back(value[i] == '+' ? ' ' : value[i]);
        }
        return result;
    }

    std::vector<std::pair<std::string, std::string>> parse_query(std::string_view query)
    {
        std::vector<std::pair<std::string, std::string>> params;
        while (!query.empty())
        {
            const auto amp = query.find('&');
            const auto item = query.substr(0, amp);
            if (!item.empty())
            {
                const auto eq = item.find('=');
                if (eq == std::string_view::npos)
                {
                    params.emplace_back(uri_decode(item), std::string{});
                }
                else
                {
                    params.emplace_back(uri_decode(item.substr(0, eq)), uri_decode(item.substr(eq + 1)));
                }
            }
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        }
        return params;
    }

} // namespace s3up
