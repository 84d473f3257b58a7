/**
 * s3up - Storage providers and the resolved connection configuration.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "s3up/signing.hpp"

namespace s3up
{

    enum class Provider : std::uint8_t
    {
        Aws,
        R2,
        DigitalOcean,
        Backblaze,
        Custom
    };

    std::string_view to_string(Provider provider) noexcept;
    std::optional<Provider> provider_from_string(std::string_view value) noexcept;

    struct S3Config
    {
        Provider provider{Provider::Aws};
        std::string access_key_id;
        std::string secret_access_key;
        std::string bucket;
        std::string public_url_base;
        std::optional<std::string> region;
        std::optional<std::string> account_id;
        std::optional<std::string> endpoint;
    };

    void to_json(nlohmann::json &json, const S3Config &config);
    // Throws ConfigurationError for unknown providers or missing fields.
    void from_json(const nlohmann::json &json, S3Config &config);

    struct ProviderInfo
    {
        Provider provider;
        std::string_view id;
        std::string_view name;
        std::string_view description;
        bool requires_region;
        bool requires_account_id;
        bool requires_endpoint;
        std::string (*endpoint)(const S3Config &config);
        // Fixed signing region, or empty to use the configured one.
        std::string_view fixed_region;
    };

    const ProviderInfo &provider_info(Provider provider);

    inline constexpr std::string_view kDefaultSigningRegion = "us-east-1";
    inline constexpr std::string_view kConfigEnvironmentVariable = "S3UP_CONFIG";

    // Throws ConfigurationError when the provider's endpoint inputs are missing.
    std::string endpoint_for(const S3Config &config);

    std::string signing_region(const S3Config &config);

    Credentials credentials_for(const S3Config &config);

    void validate(const S3Config &config);

    S3Config parse_config(std::string_view json_text);

    // Reads the JSON document from config_file when given, otherwise from
    // the S3UP_CONFIG environment variable.
    S3Config load_config(const std::optional<std::filesystem::path> &config_file);

} // namespace s3up
