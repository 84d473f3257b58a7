#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>

namespace s3up::client
{

    struct ProgressSnapshot
    {
        std::string filename;
        std::uint32_t completed_parts{};
        std::uint32_t total_parts{};
        std::uint64_t bytes_uploaded{};
        std::uint64_t total_bytes{};
        double bytes_per_second{};
        double percent{};
    };

    using ProgressCallback = std::function<void(const ProgressSnapshot &)>;

    // Throughput over a trailing window of (time, cumulative bytes) samples.
    // Not thread-safe; callers serialize updates.
    class ProgressEstimator
    {
    public:
        using Clock = std::chrono::steady_clock;

        static constexpr std::chrono::seconds kDefaultWindow{30};

        ProgressEstimator(std::string filename, std::uint32_t total_parts, std::uint64_t total_bytes,
                          std::chrono::milliseconds window = kDefaultWindow, Clock::time_point start = Clock::now());

        // Counts work finished before this session (a resumed upload) so the
        // percentage continues where it stopped. Credited bytes do not count
        // towards speed.
        void credit_completed(std::uint32_t parts, std::uint64_t bytes);

        void record_part(std::uint64_t bytes, Clock::time_point now = Clock::now());

        double bytes_per_second(Clock::time_point now = Clock::now()) const;
        double percent() const;

        std::uint64_t bytes_uploaded() const noexcept { return bytes_uploaded_; }
        std::uint32_t completed_parts() const noexcept { return completed_parts_; }

        ProgressSnapshot snapshot(Clock::time_point now = Clock::now()) const;

    private:
        struct Sample
        {
            Clock::time_point time;
            std::uint64_t bytes;
        };

        void prune(Clock::time_point now);

        std::string filename_;
        std::uint32_t total_parts_;
        std::uint64_t total_bytes_;
        std::chrono::milliseconds window_;
        Clock::time_point start_;
        std::uint32_t completed_parts_{};
        std::uint64_t bytes_uploaded_{};
        // Bytes moved during this session only.
        std::uint64_t session_bytes_{};
        std::deque<Sample> samples_;
    };

} // namespace s3up::client
