#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "s3up/client/upload_batch.hpp"

namespace s3up::client
{

    enum class Command
    {
        Upload,
        List,
        Prune,
        Help,
        Version
    };

    struct GlobalOptions
    {
        bool quiet{};
        bool ci{};
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> config_path;
    };

    struct UploadOptions
    {
        std::vector<std::string> paths;
        std::optional<std::string> prefix;
        SpeedMode mode{SpeedMode::Default};
    };

    struct ListOptions
    {
        std::optional<std::string> prefix;
        bool json{};
    };

    struct PruneOptions
    {
        std::string prefix;
        std::optional<int> older_than_days;
        std::optional<std::size_t> keep_last;
        std::string min_age{"1d"};
        bool dry_run{};
    };

    struct CliOptions
    {
        Command command{Command::Help};
        GlobalOptions global;
        UploadOptions upload;
        ListOptions list;
        PruneOptions prune;
    };

    // Throws std::runtime_error with a usage hint on malformed arguments.
    CliOptions parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace s3up::client
