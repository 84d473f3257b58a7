#include "s3up/client/progress.hpp"

#include <algorithm>
#include <utility>

namespace s3up::client
{

    ProgressEstimator::ProgressEstimator(std::string filename, std::uint32_t total_parts, std::uint64_t total_bytes,
                                         std::chrono::milliseconds window, Clock::time_point start)
        : filename_(std::move(filename)),
          total_parts_(total_parts),
          total_bytes_(total_bytes),
          window_(window),
          start_(start)
    {
        samples_.push_back(Sample{start_, 0});
    }

    void ProgressEstimator::credit_completed(std::uint32_t parts, std::uint64_t bytes)
    {
        completed_parts_ = std::min(completed_parts_ + parts, total_parts_);
        bytes_uploaded_ = std::min(bytes_uploaded_ + bytes, total_bytes_);
    }

    void ProgressEstimator::record_part(std::uint64_t bytes, Clock::time_point now)
    {
        completed_parts_ = std::min(completed_parts_ + 1, total_parts_);
        bytes_uploaded_ = std::min(bytes_uploaded_ + bytes, total_bytes_);
        session_bytes_ += bytes;
        samples_.push_back(Sample{now, session_bytes_});
        prune(now);
    }

    void ProgressEstimator::prune(Clock::time_point now)
    {
        while (!samples_.empty() && now - samples_.front().time > window_)
        {
            samples_.pop_front();
        }
    }

    double ProgressEstimator::bytes_per_second(Clock::time_point now) const
    {
        const Sample *oldest = nullptr;
        const Sample *newest = nullptr;
        for (const auto &sample : samples_)
        {
            if (now - sample.time > window_)
            {
                continue;
            }
            if (!oldest)
            {
                oldest = &sample;
            }
            newest = &sample;
        }
        if (oldest && newest && oldest != newest && newest->time > oldest->time)
        {
            const auto seconds = std::chrono::duration<double>(newest->time - oldest->time).count();
            return static_cast<double>(newest->bytes - oldest->bytes) / seconds;
        }
        const auto elapsed = std::chrono::duration<double>(now - start_).count();
        if (elapsed <= 0.0)
        {
            return 0.0;
        }
        return static_cast<double>(session_bytes_) / elapsed;
    }

    double ProgressEstimator::percent() const
    {
        if (total_bytes_ == 0)
        {
            return 0.0;
        }
        const auto value = static_cast<double>(bytes_uploaded_) * 100.0 / static_cast<double>(total_bytes_);
        return std::clamp(value, 0.0, 100.0);
    }

    ProgressSnapshot ProgressEstimator::snapshot(Clock::time_point now) const
    {
        return ProgressSnapshot{
            .filename = filename_,
            .completed_parts = completed_parts_,
            .total_parts = total_parts_,
            .bytes_uploaded = bytes_uploaded_,
            .total_bytes = total_bytes_,
            .bytes_per_second = bytes_per_second(now),
            .percent = percent(),
        };
    }

} // namespace s3up::client
