#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "s3up/http.hpp"
#include "s3up/providers.hpp"
#include "s3up/s3_types.hpp"
#include "s3up/signing.hpp"

namespace s3up::client
{

    struct DeleteResult
    {
        std::size_t deleted{};
        // "key: reason" for every key that could not be deleted
        std::vector<std::string> errors;
    };

    // Signed S3 operations against one bucket. Every call signs a fresh
    // request; the client itself holds no mutable state and may be shared by
    // concurrent part workers.
    class ObjectStoreClient
    {
    public:
        ObjectStoreClient(S3Config config, http::Transport &transport);

        const S3Config &config() const noexcept { return config_; }
        const std::string &endpoint() const noexcept { return endpoint_; }

        std::string object_url(std::string_view key) const;
        std::string public_url(std::string_view key) const;

        std::string create_multipart_upload(const std::string &key, std::stop_token stop = {});

        // Returns the part's ETag exactly as the service sent it.
        std::string upload_part(const std::string &key, const std::string &upload_id, std::uint32_t part_number,
                                const std::string &data, std::stop_token stop = {});

        // All pages, ascending. nullopt when the service no longer knows the
        // upload id.
        std::optional<std::vector<CompletedPart>> list_parts(const std::string &key, const std::string &upload_id,
                                                             std::stop_token stop = {});

        void complete_multipart_upload(const std::string &key, const std::string &upload_id,
                                       std::span<const CompletedPart> parts, std::stop_token stop = {});

        // A 404 means the upload is already gone and is not an error.
        void abort_multipart_upload(const std::string &key, const std::string &upload_id, std::stop_token stop = {});

        void put_object(const std::string &key, const std::string &data, std::string_view filename,
                        std::stop_token stop = {});

        ListObjectsPage list_objects_page(const std::optional<std::string> &prefix,
                                          const std::optional<std::string> &continuation_token,
                                          std::size_t max_keys = 1000, std::stop_token stop = {});

        std::vector<ObjectInfo> list_all_objects(const std::optional<std::string> &prefix, std::stop_token stop = {});

        void delete_object(const std::string &key, std::stop_token stop = {});

        DeleteResult delete_objects(const std::vector<std::string> &keys, std::stop_token stop = {});

    private:
        http::Response execute(std::string_view method, const std::string &url, const HeaderMap &headers,
                               const std::string &body, std::stop_token stop);

        S3Config config_;
        std::string endpoint_;
        Credentials credentials_;
        http::Transport &transport_;
    };

} // namespace s3up::client
