#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "s3up/client/logger.hpp"
#include "s3up/client/object_store_client.hpp"
#include "s3up/client/part_scheduler.hpp"
#include "s3up/client/progress.hpp"
#include "s3up/client/transfer_state_store.hpp"

namespace s3up::client
{

    enum class UploadPhase
    {
        Idle,
        Initiating,
        Transferring,
        Finalizing,
        Done,
        Aborting,
        Failed
    };

    std::string_view to_string(UploadPhase phase) noexcept;

    enum class UploadStatus
    {
        Success,
        Paused,
        Failed
    };

    std::string_view to_string(UploadStatus status) noexcept;

    struct UploadOutcome
    {
        UploadStatus status{UploadStatus::Failed};
        std::string filename;
        std::string key;
        std::uint64_t size{};
        std::string public_url;
        // Human readable reason for Paused and Failed.
        std::string message;

        bool succeeded() const noexcept { return status == UploadStatus::Success; }
    };

    struct TransferSettings
    {
        std::uint64_t chunk_size{};
        std::size_t connections{};
    };

    struct ResumeInfo
    {
        UploadState state;
        std::uint32_t completed_parts{};
        double percent{};
    };

    // Drives one multipart upload from start or from its sidecar state to
    // completion, pause or failure. Instances are not reusable concurrently.
    class MultipartUpload
    {
    public:
        MultipartUpload(ObjectStoreClient &client, const TransferStateStore &store, Logger &logger,
                        std::chrono::milliseconds grace_period = PartScheduler::kDefaultGracePeriod);

        // Never throws for per-file problems; they are reported in the outcome.
        UploadOutcome upload(const std::filesystem::path &file_path, const std::string &key,
                             const TransferSettings &settings, std::stop_token stop,
                             const ProgressCallback &progress = {});

        UploadPhase phase() const noexcept { return phase_; }

        // State that a call to upload() would resume from, if any.
        std::optional<ResumeInfo> check_resumable(const std::filesystem::path &file_path) const;

        // Aborts the remote upload recorded for file_path and deletes its
        // sidecar. Does nothing when there is no sidecar.
        void cleanup_existing_upload(const std::filesystem::path &file_path, std::stop_token stop = {});

    private:
        UploadState prepare_state(const std::filesystem::path &file_path, const std::string &key,
                                  const TransferSettings &settings, const FileStamp &stamp, std::stop_token stop);
        std::optional<UploadState> reconcile_with_remote(const std::filesystem::path &file_path, UploadState state,
                                                         std::stop_token stop);
        void discard_state(const std::filesystem::path &file_path, const UploadState &state, bool abort_remote);

        ObjectStoreClient &client_;
        const TransferStateStore &store_;
        Logger &logger_;
        std::chrono::milliseconds grace_period_;
        UploadPhase phase_{UploadPhase::Idle};
    };

} // namespace s3up::client
