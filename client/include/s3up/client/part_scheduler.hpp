#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <vector>

#include "s3up/client/logger.hpp"
#include "s3up/client/object_store_client.hpp"
#include "s3up/client/transfer_state_store.hpp"

namespace s3up::client
{

    enum class ScheduleResult
    {
        Completed,
        Cancelled
    };

    // Invoked once per committed part, never concurrently.
    using PartCommittedCallback = std::function<void(std::uint32_t part_number, std::uint64_t bytes)>;

    class PartScheduler
    {
    public:
        static constexpr std::chrono::milliseconds kDefaultGracePeriod{1000};

        PartScheduler(ObjectStoreClient &client, const TransferStateStore &store, Logger &logger,
                      std::chrono::milliseconds grace_period = kDefaultGracePeriod);

        // Uploads every part of state not yet in completed_parts with at most
        // `connections` requests in flight. Each part is committed to the
        // state store before its worker picks another part. When stop fires,
        // no new parts start and in-flight parts get the grace period to
        // finish before they are aborted. The first non-cancellation failure
        // is rethrown after all workers have stopped.
        ScheduleResult run(const std::filesystem::path &file_path, UploadState &state, std::size_t connections,
                           std::stop_token stop, const PartCommittedCallback &on_part = {});

        static std::vector<std::uint32_t> pending_parts(const UploadState &state);

    private:
        ObjectStoreClient &client_;
        const TransferStateStore &store_;
        Logger &logger_;
        std::chrono::milliseconds grace_period_;
    };

} // namespace s3up::client
