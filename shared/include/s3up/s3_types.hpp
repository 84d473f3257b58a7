/**
 * s3up - Value types exchanged with the object storage API.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "s3up/time_format.hpp"

namespace s3up
{

    struct CompletedPart
    {
        std::uint32_t part_number{};
        std::string etag;

        friend bool operator==(const CompletedPart &, const CompletedPart &) = default;
    };

    void to_json(nlohmann::json &json, const CompletedPart &part);
    void from_json(const nlohmann::json &json, CompletedPart &part);

    struct ObjectInfo
    {
        std::string key;
        std::uint64_t size{};
        SystemTime last_modified{};
        std::optional<std::string> etag{};
    };

    void to_json(nlohmann::json &json, const ObjectInfo &object);

    struct ListPartsPage
    {
        std::vector<CompletedPart> parts;
        bool is_truncated{};
        std::optional<std::uint32_t> next_part_number_marker{};
    };

    struct ListObjectsPage
    {
        std::vector<ObjectInfo> objects;
        bool is_truncated{};
        std::optional<std::string> next_continuation_token{};
    };

    struct ServiceError
    {
        std::string code;
        std::string message;
    };

} // namespace s3up
