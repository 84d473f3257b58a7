/**
 * s3up - AWS Signature Version 4 request signing.
 */
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "s3up/time_format.hpp"

namespace s3up
{

    using HeaderMap = std::map<std::string, std::string>;

    struct Credentials
    {
        std::string access_key_id;
        std::string secret_access_key;
        std::string region;
    };

    struct SignedRequest
    {
        std::string method;
        std::string url;
        // Lower-cased names, including host, x-amz-date,
        // x-amz-content-sha256 and authorization.
        HeaderMap headers;
    };

    inline constexpr std::string_view kSigningAlgorithm = "AWS4-HMAC-SHA256";

    // Throws std::invalid_argument when the URL cannot be parsed.
    SignedRequest sign_request(std::string_view method, const std::string &url, const HeaderMap &headers,
                               std::optional<std::string_view> body, const Credentials &credentials,
                               std::string_view service = "s3");

    SignedRequest sign_request(std::string_view method, const std::string &url, const HeaderMap &headers,
                               std::optional<std::string_view> body, const Credentials &credentials,
                               std::string_view service, SystemTime signing_time);

    // The intermediate canonical request, exposed for diagnostics and tests.
    std::string canonical_request(std::string_view method, const std::string &url, const HeaderMap &signed_headers,
                                  std::string_view payload_hash);

    std::string credential_scope(std::string_view date_stamp, std::string_view region, std::string_view service);

} // namespace s3up
