#include "s3up/s3_types.hpp"

namespace s3up
{

    void to_json(nlohmann::json &json, const CompletedPart &part)
    {
        json = nlohmann::json{{"partNumber", part.part_number}, {"etag", part.etag}};
    }

    void from_json(const nlohmann::json &json, CompletedPart &part)
    {
        json.at("partNumber").get_to(part.part_number);
        json.at("etag").get_to(part.etag);
    }

    void to_json(nlohmann::json &json, const ObjectInfo &object)
    {
        json = nlohmann::json{{"key", object.key},
                              {"size", object.size},
                              {"lastModified", format_iso8601(object.last_modified)}};
        if (object.etag)
        {
            json["etag"] = *object.etag;
        }
    }

} // namespace s3up
