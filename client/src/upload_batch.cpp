#include "s3up/client/upload_batch.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "s3up/errors.hpp"

namespace s3up::client
{

    namespace
    {
        constexpr auto kTag = "batch";

        std::string read_file(const std::filesystem::path &path)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                throw std::runtime_error("Cannot open " + path.string());
            }
            std::ostringstream buffer;
            buffer << in.rdbuf();
            if (in.bad())
            {
                throw std::runtime_error("Failed reading " + path.string());
            }
            return buffer.str();
        }

        UploadOutcome small_outcome(const UploadRequest &request, UploadStatus status, std::string message)
        {
            return UploadOutcome{
                .status = status,
                .filename = request.local_path.filename().string(),
                .key = request.remote_key,
                .size = request.size,
                .public_url = {},
                .message = std::move(message),
            };
        }

    } // namespace

    TransferSettings preset_for(SpeedMode mode) noexcept
    {
        switch (mode)
        {
        case SpeedMode::Fast:
            return TransferSettings{.chunk_size = 5 * kMiB, .connections = 16};
        case SpeedMode::Slow:
            return TransferSettings{.chunk_size = 50 * kMiB, .connections = 4};
        case SpeedMode::Default:
            break;
        }
        return TransferSettings{.chunk_size = 25 * kMiB, .connections = 8};
    }

    std::uint64_t multipart_threshold(SpeedMode mode) noexcept
    {
        return mode == SpeedMode::Fast ? preset_for(mode).chunk_size : kMultipartThreshold;
    }

    std::string apply_prefix(std::string_view prefix, std::string_view filename)
    {
        const auto first = prefix.find_first_not_of('/');
        if (first == std::string_view::npos)
        {
            return std::string(filename);
        }
        const auto last = prefix.find_last_not_of('/');
        return std::string(prefix.substr(first, last - first + 1)) + "/" + std::string(filename);
    }

    ResolvedRequests resolve_requests(const std::vector<std::string> &paths, const std::optional<std::string> &prefix)
    {
        ResolvedRequests resolved;
        for (const auto &input : paths)
        {
            std::error_code ec;
            const auto absolute = std::filesystem::absolute(input, ec);
            if (ec || !std::filesystem::is_regular_file(absolute, ec))
            {
                resolved.invalid_paths.push_back(input);
                continue;
            }
            const auto size = std::filesystem::file_size(absolute, ec);
            if (ec)
            {
                resolved.invalid_paths.push_back(input);
                continue;
            }
            const auto name = absolute.filename().string();
            resolved.requests.push_back(UploadRequest{
                .local_path = absolute,
                .remote_key = prefix ? apply_prefix(*prefix, name) : name,
                .size = size,
            });
        }
        return resolved;
    }

    ErrorCode summarize_outcomes(const std::vector<UploadOutcome> &outcomes) noexcept
    {
        const auto failed = static_cast<std::size_t>(std::count_if(
            outcomes.begin(), outcomes.end(), [](const UploadOutcome &o) { return o.status == UploadStatus::Failed; }));
        if (outcomes.empty() || failed == outcomes.size())
        {
            return ErrorCode::GeneralError;
        }
        return failed > 0 ? ErrorCode::PartialFailure : ErrorCode::Ok;
    }

    UploadBatch::UploadBatch(ObjectStoreClient &client, const TransferStateStore &store, Logger &logger)
        : client_(client),
          store_(store),
          logger_(logger)
    {
    }

    std::vector<std::pair<UploadRequest, ResumeInfo>> UploadBatch::find_resumable(
        const std::vector<UploadRequest> &requests, SpeedMode mode) const
    {
        std::vector<std::pair<UploadRequest, ResumeInfo>> resumable;
        MultipartUpload probe(client_, store_, logger_);
        const auto threshold = multipart_threshold(mode);
        for (const auto &request : requests)
        {
            if (request.size < threshold)
            {
                continue;
            }
            if (auto info = probe.check_resumable(request.local_path))
            {
                resumable.emplace_back(request, std::move(*info));
            }
        }
        return resumable;
    }

    BatchResult UploadBatch::run(const std::vector<UploadRequest> &requests, SpeedMode mode, std::stop_token stop,
                                 const ProgressCallback &progress, const ResumeDecision &decide_resume)
    {
        const auto settings = preset_for(mode);
        const auto threshold = multipart_threshold(mode);

        std::vector<UploadRequest> large;
        std::vector<UploadRequest> small;
        std::partition_copy(requests.begin(), requests.end(), std::back_inserter(large), std::back_inserter(small),
                            [&](const UploadRequest &request) { return request.size >= threshold; });
        logger_.log(kTag, requests.size(), " file(s): ", large.size(), " multipart, ", small.size(), " single");

        BatchResult result;
        for (const auto &request : large)
        {
            result.outcomes.push_back(upload_large(request, settings, stop, progress, decide_resume));
        }
        auto small_outcomes = upload_small(small, settings.connections, stop);
        std::move(small_outcomes.begin(), small_outcomes.end(), std::back_inserter(result.outcomes));

        result.code = summarize_outcomes(result.outcomes);
        return result;
    }

    UploadOutcome UploadBatch::upload_large(const UploadRequest &request, const TransferSettings &settings,
                                            std::stop_token stop, const ProgressCallback &progress,
                                            const ResumeDecision &decide_resume)
    {
        MultipartUpload upload(client_, store_, logger_);
        if (stop.stop_requested())
        {
            return small_outcome(request, UploadStatus::Paused, "Upload cancelled before it started");
        }
        if (decide_resume)
        {
            if (auto info = upload.check_resumable(request.local_path); info && !decide_resume(request, *info))
            {
                try
                {
                    upload.cleanup_existing_upload(request.local_path, stop);
                }
                catch (const std::exception &ex)
                {
                    return small_outcome(request, UploadStatus::Failed,
                                         std::string("Could not discard previous upload: ") + ex.what());
                }
            }
        }
        return upload.upload(request.local_path, request.remote_key, settings, stop, progress);
    }

    UploadOutcome UploadBatch::put_single(const UploadRequest &request, std::stop_token stop)
    {
        try
        {
            const auto data = read_file(request.local_path);
            client_.put_object(request.remote_key, data, request.local_path.filename().string(), stop);
            logger_.log(kTag, "uploaded ", request.local_path.string(), " to ", request.remote_key);
            auto outcome = small_outcome(request, UploadStatus::Success, {});
            outcome.size = data.size();
            outcome.public_url = client_.public_url(request.remote_key);
            return outcome;
        }
        catch (const CancelledError &ex)
        {
            return small_outcome(request, UploadStatus::Failed, ex.what());
        }
        catch (const std::exception &ex)
        {
            logger_.error(kTag, request.remote_key, ": ", ex.what());
            return small_outcome(request, UploadStatus::Failed, ex.what());
        }
    }

    std::vector<UploadOutcome> UploadBatch::upload_small(const std::vector<UploadRequest> &requests,
                                                         std::size_t connections, std::stop_token stop)
    {
        std::vector<UploadOutcome> outcomes(requests.size());
        if (requests.empty())
        {
            return outcomes;
        }
        std::atomic<std::size_t> next{0};
        auto worker = [&]
        {
            while (true)
            {
                const auto index = next.fetch_add(1);
                if (index >= requests.size())
                {
                    break;
                }
                if (stop.stop_requested())
                {
                    outcomes[index] = small_outcome(requests[index], UploadStatus::Failed, "operation cancelled");
                    continue;
                }
                outcomes[index] = put_single(requests[index], stop);
            }
        };

        const auto worker_count = std::clamp<std::size_t>(connections, 1, requests.size());
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i)
        {
            workers.emplace_back(worker);
        }
        for (auto &thread : workers)
        {
            if (thread.joinable())
            {
                thread.join();
            }
        }
        return outcomes;
    }

} // namespace s3up::client
