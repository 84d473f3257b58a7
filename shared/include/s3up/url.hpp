/**
 * s3up - URL parsing and SigV4 URI encoding.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace s3up
{

    struct Url
    {
        std::string scheme;
        std::string host;
        std::uint16_t port{};
        bool explicit_port{};
        std::string path{"/"};
        std::string query;

        // host[:port], with the port omitted when it is the scheme default
        std::string authority() const;
        std::string target() const;
    };

    // Throws std::invalid_argument for anything that is not
    // http(s)://host[:port][/path][?query].
    Url parse_url(std::string_view text);

    // Percent-encodes everything outside A-Za-z0-9-._~ ; '/' survives when
    // keep_slash is set.
    std::string uri_encode(std::string_view value, bool keep_slash = false);

    std::string uri_decode(std::string_view value);

    std::vector<std::pair<std::string, std::string>> parse_query(std::string_view query);

} // namespace s3up
