#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "s3up/client/logger.hpp"
#include "s3up/client/multipart_upload.hpp"
#include "s3up/client/object_store_client.hpp"
#include "s3up/client/progress.hpp"
#include "s3up/client/transfer_state_store.hpp"
#include "s3up/error_codes.hpp"

namespace s3up::client
{

    enum class SpeedMode
    {
        Default,
        Fast,
        Slow
    };

    inline constexpr std::uint64_t kMiB = 1024 * 1024;
    inline constexpr std::uint64_t kMultipartThreshold = 100 * kMiB;

    TransferSettings preset_for(SpeedMode mode) noexcept;

    // Files at or above this size go through a multipart upload. Forcing the
    // fast preset lowers it to the fast chunk size.
    std::uint64_t multipart_threshold(SpeedMode mode) noexcept;

    struct UploadRequest
    {
        std::filesystem::path local_path;
        std::string remote_key;
        std::uint64_t size{};
    };

    // "/a/b/" + "f.bin" -> "a/b/f.bin"
    std::string apply_prefix(std::string_view prefix, std::string_view filename);

    struct ResolvedRequests
    {
        std::vector<UploadRequest> requests;
        // Inputs that are missing or are not regular files.
        std::vector<std::string> invalid_paths;
    };

    ResolvedRequests resolve_requests(const std::vector<std::string> &paths, const std::optional<std::string> &prefix);

    // Return true to resume the recorded upload, false to abort it and start
    // over.
    using ResumeDecision = std::function<bool(const UploadRequest &, const ResumeInfo &)>;

    struct BatchResult
    {
        std::vector<UploadOutcome> outcomes;
        ErrorCode code{ErrorCode::Ok};
    };

    // Ok when nothing failed, PartialFailure when some files failed and
    // GeneralError when all did (or when there was nothing to upload).
    ErrorCode summarize_outcomes(const std::vector<UploadOutcome> &outcomes) noexcept;

    class UploadBatch
    {
    public:
        UploadBatch(ObjectStoreClient &client, const TransferStateStore &store, Logger &logger);

        // Large files whose sidecar would be resumed.
        std::vector<std::pair<UploadRequest, ResumeInfo>> find_resumable(const std::vector<UploadRequest> &requests,
                                                                        SpeedMode mode) const;

        BatchResult run(const std::vector<UploadRequest> &requests, SpeedMode mode, std::stop_token stop,
                        const ProgressCallback &progress = {}, const ResumeDecision &decide_resume = {});

    private:
        UploadOutcome upload_large(const UploadRequest &request, const TransferSettings &settings,
                                   std::stop_token stop, const ProgressCallback &progress,
                                   const ResumeDecision &decide_resume);
        std::vector<UploadOutcome> upload_small(const std::vector<UploadRequest> &requests, std::size_t connections,
                                                std::stop_token stop);
        UploadOutcome put_single(const UploadRequest &request, std::stop_token stop);

        ObjectStoreClient &client_;
        const TransferStateStore &store_;
        Logger &logger_;
    };

} // namespace s3up::client
