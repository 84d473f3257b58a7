#include "s3up/client/multipart_upload.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

#include "s3up/errors.hpp"

namespace s3up::client
{

    namespace
    {
        constexpr auto kTag = "upload";

        UploadOutcome make_outcome(UploadStatus status, const std::filesystem::path &file_path, const std::string &key,
                                   std::uint64_t size, std::string message)
        {
            return UploadOutcome{
                .status = status,
                .filename = file_path.filename().string(),
                .key = key,
                .size = size,
                .public_url = {},
                .message = std::move(message),
            };
        }

        bool same_part(const CompletedPart &a, const CompletedPart &b)
        {
            return a.part_number == b.part_number && a.etag == b.etag;
        }

    } // namespace

    std::string_view to_string(UploadPhase phase) noexcept
    {
        switch (phase)
        {
        case UploadPhase::Idle:
            return "idle";
        case UploadPhase::Initiating:
            return "initiating";
        case UploadPhase::Transferring:
            return "transferring";
        case UploadPhase::Finalizing:
            return "finalizing";
        case UploadPhase::Done:
            return "done";
        case UploadPhase::Aborting:
            return "aborting";
        case UploadPhase::Failed:
            return "failed";
        }
        return "unknown";
    }

    std::string_view to_string(UploadStatus status) noexcept
    {
        switch (status)
        {
        case UploadStatus::Success:
            return "success";
        case UploadStatus::Paused:
            return "paused";
        case UploadStatus::Failed:
            return "failed";
        }
        return "unknown";
    }

    MultipartUpload::MultipartUpload(ObjectStoreClient &client, const TransferStateStore &store, Logger &logger,
                                     std::chrono::milliseconds grace_period)
        : client_(client),
          store_(store),
          logger_(logger),
          grace_period_(grace_period)
    {
    }

    UploadOutcome MultipartUpload::upload(const std::filesystem::path &file_path, const std::string &key,
                                          const TransferSettings &settings, std::stop_token stop,
                                          const ProgressCallback &progress)
    {
        phase_ = UploadPhase::Initiating;
        std::uint64_t file_size = 0;
        std::optional<UploadState> state;
        try
        {
            const auto stamp = stat_file(file_path);
            file_size = stamp.size;
            if (stamp.size == 0)
            {
                phase_ = UploadPhase::Failed;
                return make_outcome(UploadStatus::Failed, file_path, key, 0, "cannot multipart upload an empty file");
            }

            state = prepare_state(file_path, key, settings, stamp, stop);

            phase_ = UploadPhase::Transferring;
            ProgressEstimator estimator(file_path.filename().string(), state->total_parts, state->file_size);
            estimator.credit_completed(static_cast<std::uint32_t>(state->completed_parts.size()),
                                       completed_bytes(*state));
            if (progress)
            {
                progress(estimator.snapshot());
            }

            PartScheduler scheduler(client_, store_, logger_, grace_period_);
            const auto result =
                scheduler.run(file_path, *state, settings.connections, stop,
                              [&](std::uint32_t, std::uint64_t bytes)
                              {
                                  estimator.record_part(bytes);
                                  if (progress)
                                  {
                                      progress(estimator.snapshot());
                                  }
                              });

            if (result == ScheduleResult::Cancelled || stop.stop_requested())
            {
                throw CancelledError();
            }

            phase_ = UploadPhase::Finalizing;
            if (!PartScheduler::pending_parts(*state).empty())
            {
                throw std::runtime_error("Not all parts were uploaded for " + key);
            }
            logger_.log(kTag, "completing ", key, " with ", state->completed_parts.size(), " parts");
            // Finalize runs to completion once started so the remote object
            // and the sidecar do not disagree.
            client_.complete_multipart_upload(key, state->upload_id, state->completed_parts);
            store_.remove(file_path);

            phase_ = UploadPhase::Done;
            logger_.log(kTag, "uploaded ", file_path.string(), " to ", key);
            auto outcome = make_outcome(UploadStatus::Success, file_path, key, file_size, {});
            outcome.public_url = client_.public_url(key);
            return outcome;
        }
        catch (const CancelledError &)
        {
            phase_ = UploadPhase::Aborting;
            std::string message = "Upload cancelled before it started";
            if (state)
            {
                message = "Upload paused at " + std::to_string(state->completed_parts.size()) + "/" +
                          std::to_string(state->total_parts) + " parts. Run the same command to resume.";
            }
            logger_.log(kTag, key, ": ", message);
            return make_outcome(UploadStatus::Paused, file_path, key, file_size, std::move(message));
        }
        catch (const std::exception &ex)
        {
            phase_ = UploadPhase::Failed;
            logger_.error(kTag, key, ": ", ex.what());
            return make_outcome(UploadStatus::Failed, file_path, key, file_size, ex.what());
        }
    }

    UploadState MultipartUpload::prepare_state(const std::filesystem::path &file_path, const std::string &key,
                                               const TransferSettings &settings, const FileStamp &stamp,
                                               std::stop_token stop)
    {
        if (auto existing = store_.load(file_path))
        {
            if (store_.has_file_changed(file_path, *existing))
            {
                logger_.log(kTag, file_path.string(), " changed since the last attempt, starting over");
                discard_state(file_path, *existing, existing->bucket == client_.config().bucket);
            }
            else if (existing->bucket != client_.config().bucket || existing->endpoint != client_.endpoint())
            {
                logger_.log(kTag, "state for ", file_path.string(), " targets another bucket, starting over");
                discard_state(file_path, *existing, false);
            }
            else if (existing->key != key)
            {
                logger_.log(kTag, "state for ", file_path.string(), " targets ", existing->key, ", starting over");
                discard_state(file_path, *existing, true);
            }
            else if (auto resumed = reconcile_with_remote(file_path, std::move(*existing), stop))
            {
                return std::move(*resumed);
            }
        }

        if (stop.stop_requested())
        {
            throw CancelledError();
        }
        auto upload_id = client_.create_multipart_upload(key, stop);
        auto state = make_initial_state(std::move(upload_id), client_.config().bucket, key, stamp,
                                        settings.chunk_size, std::string(to_string(client_.config().provider)),
                                        client_.endpoint());
        store_.save(file_path, state);
        logger_.log(kTag, "initiated ", key, " as ", state.upload_id, " with ", state.total_parts, " parts");
        return state;
    }

    std::optional<UploadState> MultipartUpload::reconcile_with_remote(const std::filesystem::path &file_path,
                                                                      UploadState state, std::stop_token stop)
    {
        const auto listed = client_.list_parts(state.key, state.upload_id, stop);
        if (!listed || (listed->empty() && !state.completed_parts.empty()))
        {
            logger_.log(kTag, "remote upload ", state.upload_id, " has expired, starting over");
            store_.remove(file_path);
            return std::nullopt;
        }
        const auto &remote = *listed;

        // Only parts the service confirms with the same ETag are kept; the
        // rest are uploaded again.
        std::vector<CompletedPart> confirmed;
        std::copy_if(state.completed_parts.begin(), state.completed_parts.end(), std::back_inserter(confirmed),
                     [&](const CompletedPart &local)
                     {
                         return std::any_of(remote.begin(), remote.end(), [&](const CompletedPart &candidate)
                                            { return same_part(local, candidate); });
                     });
        if (confirmed.size() != state.completed_parts.size())
        {
            logger_.warn(kTag, "service confirmed ", confirmed.size(), " of ", state.completed_parts.size(),
                         " recorded parts for ", state.key);
            state.completed_parts = std::move(confirmed);
            store_.save(file_path, state);
        }
        logger_.log(kTag, "resuming ", state.key, " at ", state.completed_parts.size(), "/", state.total_parts,
                    " parts");
        return state;
    }

    void MultipartUpload::discard_state(const std::filesystem::path &file_path, const UploadState &state,
                                        bool abort_remote)
    {
        if (abort_remote)
        {
            try
            {
                client_.abort_multipart_upload(state.key, state.upload_id);
            }
            catch (const std::exception &ex)
            {
                logger_.warn(kTag, "could not abort stale upload ", state.upload_id, ": ", ex.what());
            }
        }
        store_.remove(file_path);
    }

    std::optional<ResumeInfo> MultipartUpload::check_resumable(const std::filesystem::path &file_path) const
    {
        auto state = store_.load(file_path);
        if (!state || store_.has_file_changed(file_path, *state))
        {
            return std::nullopt;
        }
        const auto percent = state->file_size == 0 ? 0.0
                                                   : static_cast<double>(completed_bytes(*state)) * 100.0 /
                                                         static_cast<double>(state->file_size);
        const auto completed = static_cast<std::uint32_t>(state->completed_parts.size());
        return ResumeInfo{.state = std::move(*state), .completed_parts = completed, .percent = percent};
    }

    void MultipartUpload::cleanup_existing_upload(const std::filesystem::path &file_path, std::stop_token stop)
    {
        const auto state = store_.load(file_path);
        if (!state)
        {
            return;
        }
        phase_ = UploadPhase::Aborting;
        client_.abort_multipart_upload(state->key, state->upload_id, stop);
        store_.remove(file_path);
        logger_.log(kTag, "aborted ", state->upload_id, " for ", state->key);
        phase_ = UploadPhase::Idle;
    }

} // namespace s3up::client
