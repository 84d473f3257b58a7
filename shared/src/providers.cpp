#include "s3up/providers.hpp"

#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "s3up/errors.hpp"

namespace s3up
{

    namespace
    {

        const std::string &require(const std::optional<std::string> &value, std::string_view field, Provider provider)
        {
            if (!value || value->empty())
            {
                throw ConfigurationError(std::string(to_string(provider)) + " provider requires " + std::string(field));
            }
            return *value;
        }

        std::string aws_endpoint(const S3Config &config)
        {
            return "https://s3." + require(config.region, "region", config.provider) + ".amazonaws.com";
        }

        std::string r2_endpoint(const S3Config &config)
        {
            return "https://" + require(config.account_id, "accountId", config.provider) + ".r2.cloudflarestorage.com";
        }

        std::string digitalocean_endpoint(const S3Config &config)
        {
            return "https://" + require(config.region, "region", config.provider) + ".digitaloceanspaces.com";
        }

        std::string backblaze_endpoint(const S3Config &config)
        {
            return "https://s3." + require(config.region, "region", config.provider) + ".backblazeb2.com";
        }

        std::string custom_endpoint(const S3Config &config)
        {
            auto endpoint = require(config.endpoint, "endpoint", config.provider);
            while (!endpoint.empty() && endpoint.back() == '/')
            {
                endpoint.pop_back();
            }
            return endpoint;
        }

        const std::array<ProviderInfo, 5> kProviders{{
            {Provider::Aws, "aws", "AWS S3", "Amazon Web Services S3", true, false, false, &aws_endpoint, ""},
            {Provider::R2, "r2", "Cloudflare R2", "Cloudflare R2 Storage", false, true, false, &r2_endpoint, "auto"},
            {Provider::DigitalOcean, "digitalocean", "DigitalOcean Spaces", "DigitalOcean Spaces Object Storage", true,
             false, false, &digitalocean_endpoint, ""},
            {Provider::Backblaze, "backblaze", "Backblaze B2", "Backblaze B2 Cloud Storage", true, false, false,
             &backblaze_endpoint, ""},
            {Provider::Custom, "custom", "Custom S3", "Custom S3-compatible endpoint (MinIO, etc.)", false, false, true,
             &custom_endpoint, ""},
        }};

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
        }

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (!json.contains(key) || json.at(key).is_null())
            {
                return std::nullopt;
            }
            auto value = json.at(key).get<std::string>();
            if (value.empty())
            {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    std::string_view to_string(Provider provider) noexcept
    {
        for (const auto &entry : kProviders)
        {
            if (entry.provider == provider)
            {
                return entry.id;
            }
        }
        return "unknown";
    }

    std::optional<Provider> provider_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kProviders)
        {
            if (entry.id == value)
            {
                return entry.provider;
            }
        }
        return std::nullopt;
    }

    const ProviderInfo &provider_info(Provider provider)
    {
        for (const auto &entry : kProviders)
        {
            if (entry.provider == provider)
            {
                return entry;
            }
        }
        throw ConfigurationError("Unknown provider");
    }

    void to_json(nlohmann::json &json, const S3Config &config)
    {
        json = nlohmann::json{{"provider", to_string(config.provider)},
                              {"accessKeyId", config.access_key_id},
                              {"secretAccessKey", config.secret_access_key},
                              {"bucket", config.bucket},
                              {"publicUrlBase", config.public_url_base}};
        put_optional(json, "region", config.region);
        put_optional(json, "accountId", config.account_id);
        put_optional(json, "endpoint", config.endpoint);
    }

    void from_json(const nlohmann::json &json, S3Config &config)
    {
        if (!json.is_object())
        {
            throw ConfigurationError("Configuration must be a JSON object");
        }
        const auto provider_id = json.value("provider", std::string{});
        const auto provider = provider_from_string(provider_id);
        if (!provider)
        {
            throw ConfigurationError("Unknown provider: " + provider_id);
        }
        config.provider = *provider;
        config.access_key_id = json.value("accessKeyId", std::string{});
        config.secret_access_key = json.value("secretAccessKey", std::string{});
        config.bucket = json.value("bucket", std::string{});
        config.public_url_base = json.value("publicUrlBase", std::string{});
        config.region = optional_string(json, "region");
        config.account_id = optional_string(json, "accountId");
        config.endpoint = optional_string(json, "endpoint");
        validate(config);
    }

    std::string endpoint_for(const S3Config &config)
    {
        return provider_info(config.provider).endpoint(config);
    }

    std::string signing_region(const S3Config &config)
    {
        const auto &info = provider_info(config.provider);
        if (!info.fixed_region.empty())
        {
            return std::string(info.fixed_region);
        }
        return config.region.value_or(std::string(kDefaultSigningRegion));
    }

    Credentials credentials_for(const S3Config &config)
    {
        return Credentials{
            .access_key_id = config.access_key_id,
            .secret_access_key = config.secret_access_key,
            .region = signing_region(config),
        };
    }

    void validate(const S3Config &config)
    {
        if (config.access_key_id.empty() || config.secret_access_key.empty())
        {
            throw ConfigurationError("Missing credentials (accessKeyId/secretAccessKey)");
        }
        if (config.bucket.empty())
        {
            throw ConfigurationError("Missing bucket");
        }
        if (config.public_url_base.empty())
        {
            throw ConfigurationError("Missing publicUrlBase");
        }
        (void)endpoint_for(config);
    }

    S3Config parse_config(std::string_view json_text)
    {
        try
        {
            return nlohmann::json::parse(json_text).get<S3Config>();
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ConfigurationError(std::string("Configuration is not valid JSON: ") + ex.what());
        }
    }

    S3Config load_config(const std::optional<std::filesystem::path> &config_file)
    {
        if (config_file)
        {
            std::ifstream in(*config_file);
            if (!in.is_open())
            {
                throw ConfigurationError("Cannot open configuration file: " + config_file->string());
            }
            std::ostringstream content;
            content << in.rdbuf();
            return parse_config(content.str());
        }
        const std::string variable(kConfigEnvironmentVariable);
        const char *value = std::getenv(variable.c_str());
        if (value == nullptr || *value == '\0')
        {
            throw ConfigurationError(variable + " not set");
        }
        return parse_config(value);
    }

} // namespace s3up
