#include "s3up/client/object_store_client.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

#include "s3up/errors.hpp"
#include "s3up/url.hpp"
#include "s3up/xml_codec.hpp"

namespace s3up::client
{

    namespace
    {
        constexpr int kNotFound = 404;

        [[noreturn]] void raise_for(const std::string &operation, const http::Response &response)
        {
            if (auto service_error = xml::decode_error(response.body))
            {
                std::string detail = service_error->code;
                if (!service_error->message.empty())
                {
                    detail += detail.empty() ? service_error->message : ": " + service_error->message;
                }
                throw ProtocolError(operation, response.status, detail);
            }
            throw ProtocolError(operation, response.status, response.body);
        }

        template <typename Decode>
        auto decode_or_raise(const std::string &operation, const http::Response &response, Decode decode)
        {
            try
            {
                return decode(response.body);
            }
            catch (const ResponseDecodeError &ex)
            {
                throw ProtocolError(operation, response.status, ex.what());
            }
        }

        std::string upload_query(const std::string &upload_id)
        {
            return "uploadId=" + uri_encode(upload_id);
        }

        std::string content_disposition(std::string_view filename)
        {
            std::string escaped;
            escaped.reserve(filename.size());
            for (char ch : filename)
            {
                if (ch == '"' || ch == '\\')
                {
                    escaped.push_back('\\');
                }
                escaped.push_back(ch);
            }
            return "attachment; filename=\"" + escaped + "\"";
        }

    } // namespace

    ObjectStoreClient::ObjectStoreClient(S3Config config, http::Transport &transport)
        : config_(std::move(config)),
          endpoint_(endpoint_for(config_)),
          credentials_(credentials_for(config_)),
          transport_(transport)
    {
    }

    std::string ObjectStoreClient::object_url(std::string_view key) const
    {
        return endpoint_ + "/" + uri_encode(config_.bucket) + "/" + uri_encode(key, true);
    }

    std::string ObjectStoreClient::public_url(std::string_view key) const
    {
        auto base = config_.public_url_base;
        while (!base.empty() && base.back() == '/')
        {
            base.pop_back();
        }
        return base + "/" + std::string(key);
    }

    http::Response ObjectStoreClient::execute(std::string_view method, const std::string &url,
                                              const HeaderMap &headers, const std::string &body,
                                              std::stop_token stop)
    {
        auto signed_request = sign_request(method, url, headers, body, credentials_);
        http::Request request{
            .method = std::move(signed_request.method),
            .url = std::move(signed_request.url),
            .headers = std::move(signed_request.headers),
            .body = body,
        };
        auto response = transport_.send(request, std::move(stop));
        if (!response.ok())
        {
            spdlog::debug("{} {} -> {}", method, url, response.status);
        }
        return response;
    }

    std::string ObjectStoreClient::create_multipart_upload(const std::string &key, std::stop_token stop)
    {
        const auto url = object_url(key) + "?uploads";
        const auto response = execute("POST", url, {{"content-type", "application/octet-stream"}}, {}, stop);
        if (!response.ok())
        {
            raise_for("CreateMultipartUpload", response);
        }
        return decode_or_raise("CreateMultipartUpload", response, xml::decode_initiate_result);
    }

    std::string ObjectStoreClient::upload_part(const std::string &key, const std::string &upload_id,
                                               std::uint32_t part_number, const std::string &data,
                                               std::stop_token stop)
    {
        const auto url =
            object_url(key) + "?partNumber=" + std::to_string(part_number) + "&" + upload_query(upload_id);
        const auto response = execute("PUT", url, {{"content-type", "application/octet-stream"}}, data, stop);
        if (!response.ok())
        {
            raise_for("UploadPart " + std::to_string(part_number), response);
        }
        auto etag = response.header("etag");
        if (!etag || etag->empty())
        {
            throw ProtocolError("UploadPart " + std::to_string(part_number), response.status, "missing ETag header");
        }
        return *etag;
    }

    std::optional<std::vector<CompletedPart>> ObjectStoreClient::list_parts(const std::string &key,
                                                                            const std::string &upload_id,
                                                                            std::stop_token stop)
    {
        std::vector<CompletedPart> parts;
        std::optional<std::uint32_t> marker;
        while (true)
        {
            auto url = object_url(key) + "?" + upload_query(upload_id);
            if (marker)
            {
                url += "&part-number-marker=" + std::to_string(*marker);
            }
            const auto response = execute("GET", url, {}, {}, stop);
            if (response.status == kNotFound)
            {
                return std::nullopt;
            }
            if (!response.ok())
            {
                raise_for("ListParts", response);
            }
            auto page = decode_or_raise("ListParts", response, xml::decode_list_parts);
            parts.insert(parts.end(), std::make_move_iterator(page.parts.begin()),
                         std::make_move_iterator(page.parts.end()));
            if (!page.is_truncated || !page.next_part_number_marker || page.next_part_number_marker == marker)
            {
                break;
            }
            marker = page.next_part_number_marker;
        }
        std::sort(parts.begin(), parts.end(),
                  [](const CompletedPart &a, const CompletedPart &b) { return a.part_number < b.part_number; });
        return parts;
    }

    void ObjectStoreClient::complete_multipart_upload(const std::string &key, const std::string &upload_id,
                                                      std::span<const CompletedPart> parts, std::stop_token stop)
    {
        const auto url = object_url(key) + "?" + upload_query(upload_id);
        const auto body = xml::encode_complete_request(parts);
        const auto response = execute("POST", url, {{"content-type", "application/xml"}}, body, stop);
        if (!response.ok())
        {
            raise_for("CompleteMultipartUpload", response);
        }
        // The service may answer 200 and carry the failure in the body.
        if (auto service_error = xml::decode_error(response.body))
        {
            throw ProtocolError("CompleteMultipartUpload", response.status,
                                service_error->code + ": " + service_error->message);
        }
    }

    void ObjectStoreClient::abort_multipart_upload(const std::string &key, const std::string &upload_id,
                                                   std::stop_token stop)
    {
        const auto url = object_url(key) + "?" + upload_query(upload_id);
        const auto response = execute("DELETE", url, {}, {}, stop);
        if (response.status == kNotFound)
        {
            return;
        }
        if (!response.ok())
        {
            raise_for("AbortMultipartUpload", response);
        }
    }

    void ObjectStoreClient::put_object(const std::string &key, const std::string &data, std::string_view filename,
                                       std::stop_token stop)
    {
        const HeaderMap headers{
            {"content-type", "application/octet-stream"},
            {"content-disposition", content_disposition(filename)},
        };
        const auto response = execute("PUT", object_url(key), headers, data, stop);
        if (!response.ok())
        {
            raise_for("PutObject", response);
        }
    }

    ListObjectsPage ObjectStoreClient::list_objects_page(const std::optional<std::string> &prefix,
                                                         const std::optional<std::string> &continuation_token,
                                                         std::size_t max_keys, std::stop_token stop)
    {
        auto url = endpoint_ + "/" + uri_encode(config_.bucket) + "?list-type=2&max-keys=" + std::to_string(max_keys);
        if (prefix && !prefix->empty())
        {
            url += "&prefix=" + uri_encode(*prefix);
        }
        if (continuation_token)
        {
            url += "&continuation-token=" + uri_encode(*continuation_token);
        }
        const auto response = execute("GET", url, {}, {}, stop);
        if (!response.ok())
        {
            raise_for("ListObjectsV2", response);
        }
        return decode_or_raise("ListObjectsV2", response, xml::decode_list_objects);
    }

    std::vector<ObjectInfo> ObjectStoreClient::list_all_objects(const std::optional<std::string> &prefix,
                                                                std::stop_token stop)
    {
        std::vector<ObjectInfo> objects;
        std::optional<std::string> token;
        while (true)
        {
            auto page = list_objects_page(prefix, token, 1000, stop);
            objects.insert(objects.end(), std::make_move_iterator(page.objects.begin()),
                           std::make_move_iterator(page.objects.end()));
            if (!page.is_truncated || !page.next_continuation_token || page.next_continuation_token == token)
            {
                break;
            }
            token = std::move(page.next_continuation_token);
        }
        return objects;
    }

    void ObjectStoreClient::delete_object(const std::string &key, std::stop_token stop)
    {
        const auto response = execute("DELETE", object_url(key), {}, {}, stop);
        if (!response.ok())
        {
            raise_for("DeleteObject", response);
        }
    }

    DeleteResult ObjectStoreClient::delete_objects(const std::vector<std::string> &keys, std::stop_token stop)
    {
        DeleteResult result;
        for (const auto &key : keys)
        {
            if (stop.stop_requested())
            {
                throw CancelledError();
            }
            try
            {
                delete_object(key, stop);
                ++result.deleted;
            }
            catch (const ProtocolError &ex)
            {
                result.errors.push_back(key + ": " + ex.what());
            }
            catch (const TransportError &ex)
            {
                result.errors.push_back(key + ": " + ex.what());
            }
        }
        return result;
    }

} // namespace s3up::client
