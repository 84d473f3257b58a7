#include "s3up/signing.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

#include "s3up/crypto.hpp"
#include "s3up/url.hpp"

namespace s3up
{

    namespace
    {

        std::string to_lower(std::string_view value)
        {
            std::string result(value);
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        std::string trim(std::string_view value)
        {
            const auto first = value.find_first_not_of(" \t");
            if (first == std::string_view::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t");
            return std::string(value.substr(first, last - first + 1));
        }

        std::string canonical_query(std::string_view query)
        {
            auto params = parse_query(query);
            std::sort(params.begin(), params.end());
            std::string result;
            for (const auto &[key, value] : params)
            {
                if (!result.empty())
                {
                    result.push_back('&');
                }
                result += uri_encode(key);
                result.push_back('=');
                result += uri_encode(value);
            }
            return result;
        }

        std::string signed_header_names(const HeaderMap &headers)
        {
            std::string names;
            for (const auto &[name, value] : headers)
            {
                if (!names.empty())
                {
                    names.push_back(';');
                }
                names += name;
            }
            return names;
        }

        crypto::Digest signing_key(std::string_view secret_key, std::string_view date_stamp, std::string_view region,
                                   std::string_view service)
        {
            const auto k_date = crypto::hmac_sha256("AWS4" + std::string(secret_key), date_stamp);
            const auto k_region = crypto::hmac_sha256(k_date, region);
            const auto k_service = crypto::hmac_sha256(k_region, service);
            return crypto::hmac_sha256(k_service, "aws4_request");
        }

    } // namespace

    std::string credential_scope(std::string_view date_stamp, std::string_view region, std::string_view service)
    {
        std::string scope(date_stamp);
        scope += '/';
        scope += region;
        scope += '/';
        scope += service;
        scope += "/aws4_request";
        return scope;
    }

    std::string canonical_request(std::string_view method, const std::string &url, const HeaderMap &signed_headers,
                                  std::string_view payload_hash)
    {
        const auto parsed = parse_url(url);
        std::string canonical_headers;
        for (const auto &[name, value] : signed_headers)
        {
            canonical_headers += name;
            canonical_headers += ':';
            canonical_headers += value;
            canonical_headers += '\n';
        }

        std::string request(method);
        request += '\n';
        request += parsed.path;
        request += '\n';
        request += canonical_query(parsed.query);
        request += '\n';
        request += canonical_headers;
        request += '\n';
        request += signed_header_names(signed_headers);
        request += '\n';
        request += payload_hash;
        return request;
    }

    SignedRequest sign_request(std::string_view method, const std::string &url, const HeaderMap &headers,
                               std::optional<std::string_view> body, const Credentials &credentials,
                               std::string_view service)
    {
        return sign_request(method, url, headers, body, credentials, service, std::chrono::system_clock::now());
    }

    SignedRequest sign_request(std::string_view method, const std::string &url, const HeaderMap &headers,
                               std::optional<std::string_view> body, const Credentials &credentials,
                               std::string_view service, SystemTime signing_time)
    {
        const auto parsed = parse_url(url);
        const auto amz_date = format_amz_date(signing_time);
        const auto date_stamp = format_date_stamp(signing_time);
        const auto payload_hash = crypto::sha256_hex(body.value_or(std::string_view{}));

        HeaderMap signed_headers;
        for (const auto &[name, value] : headers)
        {
            signed_headers[to_lower(name)] = trim(value);
        }
        signed_headers["host"] = parsed.authority();
        signed_headers["x-amz-date"] = amz_date;
        signed_headers["x-amz-content-sha256"] = payload_hash;

        const auto canonical = canonical_request(method, url, signed_headers, payload_hash);
        const auto scope = credential_scope(date_stamp, credentials.region, service);

        std::string string_to_sign(kSigningAlgorithm);
        string_to_sign += '\n';
        string_to_sign += amz_date;
        string_to_sign += '\n';
        string_to_sign += scope;
        string_to_sign += '\n';
        string_to_sign += crypto::sha256_hex(canonical);

        const auto key = signing_key(credentials.secret_access_key, date_stamp, credentials.region, service);
        const auto signature = crypto::to_hex(crypto::hmac_sha256(key, string_to_sign));

        std::string authorization(kSigningAlgorithm);
        authorization += " Credential=" + credentials.access_key_id + "/" + scope;
        authorization += ", SignedHeaders=" + signed_header_names(signed_headers);
        authorization += ", Signature=" + signature;

        SignedRequest signed_request{
            .method = std::string(method),
            .url = url,
            .headers = std::move(signed_headers),
        };
        signed_request.headers["authorization"] = std::move(authorization);
        return signed_request;
    }

} // namespace s3up
