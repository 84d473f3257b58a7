#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "s3up/s3_types.hpp"

namespace s3up::client
{

    inline constexpr int kUploadStateVersion = 1;

    struct UploadState
    {
        int schema_version{kUploadStateVersion};
        std::string upload_id;
        std::string bucket;
        std::string key;
        std::uint64_t file_size{};
        // Unix milliseconds of the file's last write time.
        std::int64_t file_modified{};
        std::uint64_t chunk_size{};
        std::uint32_t total_parts{};
        // Unique by part number, ascending.
        std::vector<CompletedPart> completed_parts;
        std::int64_t created_at{};
        std::string provider;
        std::string endpoint;

        friend bool operator==(const UploadState &, const UploadState &) = default;
    };

    void to_json(nlohmann::json &json, const UploadState &state);
    void from_json(const nlohmann::json &json, UploadState &state);

    struct FileStamp
    {
        std::uint64_t size{};
        std::int64_t modified{};
    };

    // Throws std::filesystem::filesystem_error when the file cannot be stat'ed.
    FileStamp stat_file(const std::filesystem::path &path);

    std::uint32_t part_count(std::uint64_t file_size, std::uint64_t chunk_size);

    struct ByteRange
    {
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    // Part numbers are 1-based; the last part carries the remainder.
    ByteRange part_range(const UploadState &state, std::uint32_t part_number);

    std::uint64_t completed_bytes(const UploadState &state);

    UploadState make_initial_state(std::string upload_id, std::string bucket, std::string key, FileStamp file,
                                   std::uint64_t chunk_size, std::string provider, std::string endpoint);

    // Sidecar persistence of resumable upload state. The sidecar for
    // "dir/name" is "dir/.name.s3up".
    class TransferStateStore
    {
    public:
        static std::filesystem::path state_path(const std::filesystem::path &file_path);

        // Missing, unreadable, corrupt or wrong-version sidecars load as nullopt.
        std::optional<UploadState> load(const std::filesystem::path &file_path) const;

        // Writes a temporary sibling and renames it over the sidecar.
        void save(const std::filesystem::path &file_path, const UploadState &state) const;

        void remove(const std::filesystem::path &file_path) const;

        bool has_file_changed(const std::filesystem::path &file_path, const UploadState &state) const;

        // Upserts by part number, keeps the list sorted and saves. Safe to call
        // from concurrent part workers sharing the same state.
        void add_completed_part(const std::filesystem::path &file_path, UploadState &state, CompletedPart part) const;

    private:
        mutable std::mutex mutex_;
    };

} // namespace s3up::client
