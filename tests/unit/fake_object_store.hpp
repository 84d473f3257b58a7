#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

#include "s3up/errors.hpp"
#include "s3up/http.hpp"
#include "s3up/time_format.hpp"
#include "s3up/url.hpp"
#include "s3up/xml_codec.hpp"

namespace s3up::testing
{

    // In-memory S3 service speaking the path-style REST protocol, enough
    // for the multipart, put, list and delete calls the client makes.
    class FakeObjectStore : public http::Transport
    {
    public:
        struct StoredObject
        {
            std::string data;
            SystemTime last_modified{};
        };

        struct MultipartRecord
        {
            std::string key;
            std::map<std::uint32_t, std::string> etags;
            std::map<std::uint32_t, std::string> data;
        };

        struct CompleteCall
        {
            std::string key;
            std::string upload_id;
            std::vector<CompletedPart> parts;
        };

        explicit FakeObjectStore(std::string bucket) : bucket_(std::move(bucket)) {}

        http::Response send(const http::Request &request, std::stop_token stop = {}) override
        {
            if (stop.stop_requested())
            {
                throw CancelledError();
            }
            std::unique_lock lock(mutex_);
            if (request.headers.count("authorization") == 0 || request.headers.count("x-amz-date") == 0)
            {
                return respond(403, error_xml("AccessDenied", "unsigned request"));
            }

            const auto url = parse_url(request.url);
            std::map<std::string, std::string> query;
            for (auto &[name, value] : parse_query(url.query))
            {
                query[name] = value;
            }
            const auto bucket_prefix = "/" + bucket_;
            if (url.path.rfind(bucket_prefix, 0) != 0)
            {
                return respond(404, error_xml("NoSuchBucket", "unknown bucket"));
            }
            std::string key = url.path.size() > bucket_prefix.size() + 1
                                  ? uri_decode(url.path.substr(bucket_prefix.size() + 1))
                                  : std::string{};
            requests.push_back(request.method + " " + url.target());

            if (request.method == "PUT" && query.count("partNumber"))
            {
                const auto part_number = static_cast<std::uint32_t>(std::stoul(query["partNumber"]));
                const auto upload_id = query["uploadId"];
                ++part_requests[part_number];
                last_part_content_type =
                    request.headers.count("content-type") ? request.headers.at("content-type") : std::string{};
                if (hang_parts.count(part_number))
                {
                    const auto hook = on_part_hanging;
                    lock.unlock();
                    if (hook)
                    {
                        hook(part_number);
                    }
                    // Never answers; only the caller's stop token ends the request.
                    std::mutex wait_mutex;
                    std::unique_lock wait_lock(wait_mutex);
                    std::condition_variable_any never;
                    never.wait(wait_lock, stop, []()
                               { return false; });
                    throw CancelledError();
                }
                if (auto failure = fail_parts.find(part_number); failure != fail_parts.end())
                {
                    return respond(failure->second, error_xml("InternalError", "injected failure"));
                }
                auto upload = uploads.find(upload_id);
                if (upload == uploads.end())
                {
                    return respond(404, error_xml("NoSuchUpload", "upload does not exist"));
                }
                const auto etag = "\"etag-" + upload_id + "-" + std::to_string(part_number) + "\"";
                upload->second.etags[part_number] = etag;
                upload->second.data[part_number] = request.body;
                ++uploaded_parts;
                http::Response response = respond(200, {});
                response.headers["etag"] = etag;
                if (on_part_uploaded)
                {
                    const auto hook = on_part_uploaded;
                    const auto count = uploaded_parts;
                    lock.unlock();
                    hook(part_number, count);
                }
                return response;
            }
            if (request.method == "POST" && query.count("uploads"))
            {
                const auto upload_id = "upload-" + std::to_string(++next_upload_id_);
                uploads[upload_id] = MultipartRecord{.key = key, .etags = {}, .data = {}};
                return respond(200, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
                                    "<InitiateMultipartUploadResult xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
                                    "<Bucket>" + bucket_ + "</Bucket><Key>" + key + "</Key>"
                                    "<UploadId>" + upload_id + "</UploadId></InitiateMultipartUploadResult>");
            }
            if (request.method == "GET" && query.count("uploadId"))
            {
                return list_parts(query);
            }
            if (request.method == "POST" && query.count("uploadId"))
            {
                return complete(key, query["uploadId"], request.body);
            }
            if (request.method == "DELETE" && query.count("uploadId"))
            {
                ++abort_calls;
                if (uploads.erase(query["uploadId"]) == 0)
                {
                    return respond(404, error_xml("NoSuchUpload", "upload does not exist"));
                }
                return respond(204, {});
            }
            if (request.method == "PUT")
            {
                if (fail_keys.count(key))
                {
                    return respond(500, error_xml("InternalError", "injected failure"));
                }
                objects[key] = StoredObject{.data = request.body, .last_modified = now};
                last_content_disposition = request.headers.count("content-disposition")
                                               ? request.headers.at("content-disposition")
                                               : std::string{};
                return respond(200, {});
            }
            if (request.method == "GET" && query.count("list-type"))
            {
                return list_objects(query);
            }
            if (request.method == "DELETE")
            {
                if (fail_keys.count(key))
                {
                    return respond(500, error_xml("InternalError", "injected failure"));
                }
                objects.erase(key);
                return respond(204, {});
            }
            return respond(400, error_xml("InvalidRequest", "unsupported request"));
        }

        // Drops a multipart upload as if it expired on the service.
        void expire_upload(const std::string &upload_id)
        {
            std::lock_guard lock(mutex_);
            uploads.erase(upload_id);
        }

        std::string bucket_;
        std::map<std::string, MultipartRecord> uploads;
        std::map<std::string, StoredObject> objects;
        std::vector<CompleteCall> complete_calls;
        std::vector<std::string> requests;
        std::map<std::uint32_t, int> part_requests;
        std::map<std::uint32_t, int> fail_parts;
        std::set<std::string> fail_keys;
        std::function<void(std::uint32_t part_number, std::size_t uploaded)> on_part_uploaded;
        std::set<std::uint32_t> hang_parts;
        std::function<void(std::uint32_t part_number)> on_part_hanging;
        std::string last_part_content_type;
        std::size_t uploaded_parts{};
        std::size_t abort_calls{};
        std::size_t list_calls{};
        std::size_t list_page_size{1000};
        std::size_t max_parts_per_page{1000};
        std::string last_content_disposition;
        SystemTime now{from_unix_millis(1700000000000)};

    private:
        static http::Response respond(int status, std::string body)
        {
            http::Response response;
            response.status = status;
            response.body = std::move(body);
            return response;
        }

        static std::string error_xml(const std::string &code, const std::string &message)
        {
            return "<?xml version=\"1.0\" encoding=\"UTF-8\"?><Error><Code>" + code + "</Code><Message>" + message +
                   "</Message></Error>";
        }

        http::Response list_parts(std::map<std::string, std::string> &query)
        {
            auto upload = uploads.find(query["uploadId"]);
            if (upload == uploads.end())
            {
                return respond(404, error_xml("NoSuchUpload", "upload does not exist"));
            }
            const std::uint32_t marker =
                query.count("part-number-marker") ? static_cast<std::uint32_t>(std::stoul(query["part-number-marker"]))
                                                  : 0;
            std::string body = "<?xml version=\"1.0\" encoding=\"UTF-8\"?><ListPartsResult>";
            std::size_t listed = 0;
            std::uint32_t last = marker;
            bool truncated = false;
            for (const auto &[number, etag] : upload->second.etags)
            {
                if (number <= marker)
                {
                    continue;
                }
                if (listed == max_parts_per_page)
                {
                    truncated = true;
                    break;
                }
                body += "<Part><PartNumber>" + std::to_string(number) + "</PartNumber><ETag>" + etag +
                        "</ETag><Size>" + std::to_string(upload->second.data[number].size()) + "</Size></Part>";
                last = number;
                ++listed;
            }
            body += std::string("<IsTruncated>") + (truncated ? "true" : "false") + "</IsTruncated>";
            if (truncated)
            {
                body += "<NextPartNumberMarker>" + std::to_string(last) + "</NextPartNumberMarker>";
            }
            body += "</ListPartsResult>";
            return respond(200, body);
        }

        http::Response complete(const std::string &key, const std::string &upload_id, const std::string &body)
        {
            auto upload = uploads.find(upload_id);
            if (upload == uploads.end())
            {
                return respond(404, error_xml("NoSuchUpload", "upload does not exist"));
            }
            const auto parts = xml::decode_complete_request(body);
            complete_calls.push_back(CompleteCall{.key = key, .upload_id = upload_id, .parts = parts});
            std::string data;
            for (const auto &part : parts)
            {
                auto etag = upload->second.etags.find(part.part_number);
                if (etag == upload->second.etags.end() || etag->second != part.etag)
                {
                    return respond(400, error_xml("InvalidPart", "part " + std::to_string(part.part_number)));
                }
                data += upload->second.data[part.part_number];
            }
            objects[key] = StoredObject{.data = std::move(data), .last_modified = now};
            uploads.erase(upload);
            return respond(200, "<?xml version=\"1.0\" encoding=\"UTF-8\"?><CompleteMultipartUploadResult>"
                                "<Key>" + key + "</Key></CompleteMultipartUploadResult>");
        }

        http::Response list_objects(std::map<std::string, std::string> &query)
        {
            const auto prefix = query.count("prefix") ? query["prefix"] : std::string{};
            const std::size_t start = query.count("continuation-token") ? std::stoul(query["continuation-token"]) : 0;
            std::vector<std::pair<std::string, StoredObject>> matching;
            for (const auto &[key, object] : objects)
            {
                if (key.rfind(prefix, 0) == 0)
                {
                    matching.emplace_back(key, object);
                }
            }
            std::string body = "<?xml version=\"1.0\" encoding=\"UTF-8\"?><ListBucketResult>";
            std::size_t page_size = list_page_size;
            if (query.count("max-keys"))
            {
                page_size = std::min<std::size_t>(page_size, std::stoul(query["max-keys"]));
            }
            const auto end = std::min(matching.size(), start + page_size);
            for (std::size_t i = start; i < end; ++i)
            {
                body += "<Contents><Key>" + matching[i].first + "</Key><LastModified>" +
                        format_iso8601(matching[i].second.last_modified) + "</LastModified><ETag>\"e" +
                        std::to_string(i) + "\"</ETag><Size>" + std::to_string(matching[i].second.data.size()) +
                        "</Size></Contents>";
            }
            const bool truncated = end < matching.size();
            body += std::string("<IsTruncated>") + (truncated ? "true" : "false") + "</IsTruncated>";
            if (truncated)
            {
                body += "<NextContinuationToken>" + std::to_string(end) + "</NextContinuationToken>";
            }
            body += "</ListBucketResult>";
            ++list_calls;
            return respond(200, body);
        }

        std::mutex mutex_;
        std::uint64_t next_upload_id_{};
    };

} // namespace s3up::testing
