#include "s3up/client/part_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_set>

#include "s3up/errors.hpp"

namespace s3up::client
{

    namespace
    {

        std::string read_range(const std::filesystem::path &path, const ByteRange &range)
        {
            std::ifstream in(path, std::ios::binary);
            if (!in.is_open())
            {
                throw std::runtime_error("Cannot open " + path.string());
            }
            in.seekg(static_cast<std::streamoff>(range.offset));
            std::string data(range.length, '\0');
            in.read(data.data(), static_cast<std::streamsize>(range.length));
            if (static_cast<std::uint64_t>(in.gcount()) != range.length)
            {
                throw std::runtime_error("Short read from " + path.string() + " at offset " +
                                         std::to_string(range.offset));
            }
            return data;
        }

    } // namespace

    PartScheduler::PartScheduler(ObjectStoreClient &client, const TransferStateStore &store, Logger &logger,
                                 std::chrono::milliseconds grace_period)
        : client_(client),
          store_(store),
          logger_(logger),
          grace_period_(grace_period)
    {
    }

    std::vector<std::uint32_t> PartScheduler::pending_parts(const UploadState &state)
    {
        std::unordered_set<std::uint32_t> done;
        for (const auto &part : state.completed_parts)
        {
            done.insert(part.part_number);
        }
        std::vector<std::uint32_t> pending;
        for (std::uint32_t part = 1; part <= state.total_parts; ++part)
        {
            if (!done.contains(part))
            {
                pending.push_back(part);
            }
        }
        return pending;
    }

    ScheduleResult PartScheduler::run(const std::filesystem::path &file_path, UploadState &state,
                                      std::size_t connections, std::stop_token stop,
                                      const PartCommittedCallback &on_part)
    {
        const auto pending = pending_parts(state);
        if (pending.empty())
        {
            return stop.stop_requested() ? ScheduleResult::Cancelled : ScheduleResult::Completed;
        }

        const auto worker_count = std::clamp<std::size_t>(connections, 1, pending.size());
        std::stop_source in_flight;
        std::atomic<std::size_t> next{0};
        std::atomic<bool> failed{false};
        std::exception_ptr first_error;
        std::mutex mutex;
        std::condition_variable_any finished;
        std::size_t active = worker_count;

        auto winding_down = [&]
        { return stop.stop_requested() || in_flight.stop_requested(); };

        auto worker = [&]
        {
            while (!winding_down() && !failed.load())
            {
                const auto index = next.fetch_add(1);
                if (index >= pending.size())
                {
                    break;
                }
                const auto part_number = pending[index];
                try
                {
                    const auto range = part_range(state, part_number);
                    const auto data = read_range(file_path, range);
                    auto etag = client_.upload_part(state.key, state.upload_id, part_number, data,
                                                    in_flight.get_token());
                    store_.add_completed_part(file_path, state, CompletedPart{part_number, std::move(etag)});
                    logger_.log("upload", "part ", part_number, "/", state.total_parts, " committed for ",
                                state.key);
                    std::lock_guard lock(mutex);
                    if (on_part)
                    {
                        on_part(part_number, range.length);
                    }
                }
                catch (const std::exception &ex)
                {
                    if (winding_down())
                    {
                        logger_.log("upload", "part ", part_number, " interrupted: ", ex.what());
                        break;
                    }
                    logger_.error("upload", "part ", part_number, " failed: ", ex.what());
                    std::lock_guard lock(mutex);
                    if (!first_error)
                    {
                        first_error = std::current_exception();
                    }
                    failed.store(true);
                    break;
                }
            }
            std::lock_guard lock(mutex);
            --active;
            finished.notify_all();
        };

        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i)
        {
            workers.emplace_back(worker);
        }

        {
            std::unique_lock lock(mutex);
            auto all_done = [&]
            { return active == 0; };
            if (!finished.wait(lock, stop, all_done))
            {
                logger_.log("upload", "interrupt received, waiting for ", active, " in-flight part(s)");
                if (!finished.wait_for(lock, grace_period_, all_done))
                {
                    in_flight.request_stop();
                }
            }
        }

        for (auto &thread : workers)
        {
            if (thread.joinable())
            {
                thread.join();
            }
        }

        if (first_error)
        {
            std::rethrow_exception(first_error);
        }
        return stop.stop_requested() ? ScheduleResult::Cancelled : ScheduleResult::Completed;
    }

} // namespace s3up::client
