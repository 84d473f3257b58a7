#include "s3up/client/transfer_state_store.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

#include "s3up/time_format.hpp"

namespace s3up::client
{

    namespace
    {
        constexpr auto kStateExtension = ".s3up";
        constexpr auto kTempSuffix = ".tmp";

        void normalize_parts(std::vector<CompletedPart> &parts)
        {
            std::stable_sort(parts.begin(), parts.end(), [](const CompletedPart &a, const CompletedPart &b)
                             { return a.part_number < b.part_number; });
            // Later entries for the same part number win, as with an upsert.
            std::vector<CompletedPart> unique;
            unique.reserve(parts.size());
            for (auto &part : parts)
            {
                if (!unique.empty() && unique.back().part_number == part.part_number)
                {
                    unique.back() = std::move(part);
                }
                else
                {
                    unique.push_back(std::move(part));
                }
            }
            parts = std::move(unique);
        }

        bool is_consistent(const UploadState &state)
        {
            if (state.upload_id.empty() || state.key.empty() || state.chunk_size == 0)
            {
                return false;
            }
            if (state.total_parts != part_count(state.file_size, state.chunk_size))
            {
                return false;
            }
            return std::all_of(state.completed_parts.begin(), state.completed_parts.end(),
                               [&](const CompletedPart &part)
                               { return part.part_number >= 1 && part.part_number <= state.total_parts &&
                                        !part.etag.empty(); });
        }

    } // namespace

    void to_json(nlohmann::json &json, const UploadState &state)
    {
        json = nlohmann::json{
            {"version", state.schema_version},
            {"uploadId", state.upload_id},
            {"bucket", state.bucket},
            {"key", state.key},
            {"fileSize", state.file_size},
            {"fileModified", state.file_modified},
            {"chunkSize", state.chunk_size},
            {"totalParts", state.total_parts},
            {"completedParts", state.completed_parts},
            {"createdAt", state.created_at},
            {"provider", state.provider},
            {"endpoint", state.endpoint},
        };
    }

    void from_json(const nlohmann::json &json, UploadState &state)
    {
        json.at("version").get_to(state.schema_version);
        json.at("uploadId").get_to(state.upload_id);
        json.at("bucket").get_to(state.bucket);
        json.at("key").get_to(state.key);
        json.at("fileSize").get_to(state.file_size);
        json.at("fileModified").get_to(state.file_modified);
        json.at("chunkSize").get_to(state.chunk_size);
        json.at("totalParts").get_to(state.total_parts);
        json.at("completedParts").get_to(state.completed_parts);
        state.created_at = json.value("createdAt", std::int64_t{0});
        state.provider = json.value("provider", std::string{});
        state.endpoint = json.value("endpoint", std::string{});
    }

    FileStamp stat_file(const std::filesystem::path &path)
    {
        const auto size = std::filesystem::file_size(path);
        const auto write_time = std::filesystem::last_write_time(path);
        const auto system_time = std::chrono::file_clock::to_sys(write_time);
        return FileStamp{
            .size = size,
            .modified = to_unix_millis(std::chrono::time_point_cast<SystemTime::duration>(system_time)),
        };
    }

    std::uint32_t part_count(std::uint64_t file_size, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("chunk size must be positive");
        }
        return static_cast<std::uint32_t>((file_size + chunk_size - 1) / chunk_size);
    }

    ByteRange part_range(const UploadState &state, std::uint32_t part_number)
    {
        if (part_number == 0 || part_number > state.total_parts)
        {
            throw std::out_of_range("part number " + std::to_string(part_number) + " outside 1.." +
                                    std::to_string(state.total_parts));
        }
        const auto offset = static_cast<std::uint64_t>(part_number - 1) * state.chunk_size;
        const auto end = std::min(offset + state.chunk_size, state.file_size);
        return ByteRange{.offset = offset, .length = end - offset};
    }

    std::uint64_t completed_bytes(const UploadState &state)
    {
        std::uint64_t total = 0;
        for (const auto &part : state.completed_parts)
        {
            total += part_range(state, part.part_number).length;
        }
        return std::min(total, state.file_size);
    }

    UploadState make_initial_state(std::string upload_id, std::string bucket, std::string key, FileStamp file,
                                   std::uint64_t chunk_size, std::string provider, std::string endpoint)
    {
        UploadState state;
        state.upload_id = std::move(upload_id);
        state.bucket = std::move(bucket);
        state.key = std::move(key);
        state.file_size = file.size;
        state.file_modified = file.modified;
        state.chunk_size = chunk_size;
        state.total_parts = part_count(file.size, chunk_size);
        state.created_at = to_unix_millis(std::chrono::system_clock::now());
        state.provider = std::move(provider);
        state.endpoint = std::move(endpoint);
        return state;
    }

    std::filesystem::path TransferStateStore::state_path(const std::filesystem::path &file_path)
    {
        auto name = "." + file_path.filename().string() + kStateExtension;
        return file_path.parent_path() / name;
    }

    std::optional<UploadState> TransferStateStore::load(const std::filesystem::path &file_path) const
    {
        const auto path = state_path(file_path);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            return std::nullopt;
        }
        std::ifstream in(path);
        if (!in.is_open())
        {
            return std::nullopt;
        }
        try
        {
            nlohmann::json json;
            in >> json;
            auto state = json.get<UploadState>();
            if (state.schema_version != kUploadStateVersion)
            {
                spdlog::debug("Ignoring state {} with version {}", path.string(), state.schema_version);
                return std::nullopt;
            }
            normalize_parts(state.completed_parts);
            if (!is_consistent(state))
            {
                spdlog::debug("Ignoring inconsistent state {}", path.string());
                return std::nullopt;
            }
            return state;
        }
        catch (const nlohmann::json::exception &ex)
        {
            spdlog::debug("Ignoring corrupt state {}: {}", path.string(), ex.what());
            return std::nullopt;
        }
    }

    void TransferStateStore::save(const std::filesystem::path &file_path, const UploadState &state) const
    {
        const auto path = state_path(file_path);
        auto temp_path = path;
        temp_path += kTempSuffix;
        {
            std::ofstream out(temp_path, std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Cannot write transfer state: " + temp_path.string());
            }
            out << nlohmann::json(state).dump(2);
            out.flush();
            if (!out)
            {
                throw std::runtime_error("Failed writing transfer state: " + temp_path.string());
            }
        }
        std::filesystem::rename(temp_path, path);
    }

    void TransferStateStore::remove(const std::filesystem::path &file_path) const
    {
        const auto path = state_path(file_path);
        auto temp_path = path;
        temp_path += kTempSuffix;
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        std::filesystem::remove(path, ec);
        if (ec)
        {
            throw std::filesystem::filesystem_error("Cannot delete transfer state", path, ec);
        }
    }

    bool TransferStateStore::has_file_changed(const std::filesystem::path &file_path, const UploadState &state) const
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file_path, ec))
        {
            return true;
        }
        const auto stamp = stat_file(file_path);
        return stamp.size != state.file_size || stamp.modified != state.file_modified;
    }

    void TransferStateStore::add_completed_part(const std::filesystem::path &file_path, UploadState &state,
                                                CompletedPart part) const
    {
        std::lock_guard lock(mutex_);
        auto it = std::find_if(state.completed_parts.begin(), state.completed_parts.end(),
                               [&](const CompletedPart &existing)
                               { return existing.part_number == part.part_number; });
        if (it != state.completed_parts.end())
        {
            *it = std::move(part);
        }
        else
        {
            state.completed_parts.push_back(std::move(part));
        }
        std::sort(state.completed_parts.begin(), state.completed_parts.end(),
                  [](const CompletedPart &a, const CompletedPart &b)
                  { return a.part_number < b.part_number; });
        save(file_path, state);
    }

} // namespace s3up::client
