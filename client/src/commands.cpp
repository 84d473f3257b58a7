#include "s3up/client/commands.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>
#include <mutex>

#include "s3up/client/output.hpp"
#include "s3up/client/retention.hpp"
#include "s3up/client/upload_batch.hpp"

namespace s3up::client
{

    namespace
    {

        std::string trim_lower(std::string value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            value = value.substr(first, last - first + 1);
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        void print_outcomes(const std::vector<UploadOutcome> &outcomes, Console &console)
        {
            for (const auto &outcome : outcomes)
            {
                switch (outcome.status)
                {
                case UploadStatus::Success:
                    console.out << output::format_upload_success(outcome) << std::endl;
                    break;
                case UploadStatus::Paused:
                    console.out << outcome.filename << ": " << outcome.message << std::endl;
                    break;
                case UploadStatus::Failed:
                    console.err << output::format_upload_error(outcome) << std::endl;
                    break;
                }
            }
        }

    } // namespace

    bool ask_yes_no(Console &console, const std::string &question)
    {
        while (true)
        {
            console.out << question << " [y/N]: " << std::flush;
            std::string answer;
            if (!std::getline(console.in, answer))
            {
                return false;
            }
            answer = trim_lower(answer);
            if (answer == "y" || answer == "yes")
            {
                return true;
            }
            if (answer.empty() || answer == "n" || answer == "no")
            {
                return false;
            }
            console.out << "Please answer y or n." << std::endl;
        }
    }

    ErrorCode run_upload(const UploadOptions &options, const GlobalOptions &global, ObjectStoreClient &client,
                         const TransferStateStore &store, Logger &logger, Console &console, std::stop_token stop)
    {
        auto resolved = resolve_requests(options.paths, options.prefix);
        for (const auto &invalid : resolved.invalid_paths)
        {
            console.err << "Warning: path not found or not a file: " << invalid << std::endl;
        }
        if (resolved.requests.empty())
        {
            console.err << "Error: No valid files to upload" << std::endl;
            return ErrorCode::GeneralError;
        }

        UploadBatch batch(client, store, logger);

        std::map<std::filesystem::path, bool> resume_answers;
        const auto resumable = batch.find_resumable(resolved.requests, options.mode);
        if (!resumable.empty() && !global.ci)
        {
            if (!console.interactive)
            {
                console.err << "Error: " << resumable.front().first.local_path.filename().string()
                            << " has an incomplete upload; rerun with --ci to resume it without asking" << std::endl;
                return ErrorCode::PromptRequired;
            }
            for (const auto &[request, info] : resumable)
            {
                const auto question = "Resume incomplete upload of " + request.local_path.filename().string() +
                                      "? (" + std::to_string(static_cast<int>(std::lround(info.percent))) +
                                      "% done)";
                resume_answers[request.local_path] = ask_yes_no(console, question);
            }
        }

        if (!global.quiet)
        {
            std::uint64_t total = 0;
            for (const auto &request : resolved.requests)
            {
                total += request.size;
            }
            console.out << "Uploading " << resolved.requests.size() << " file(s) to " << client.config().bucket
                        << " (" << output::format_bytes(total) << ")" << std::endl;
        }

        std::mutex progress_mutex;
        ProgressCallback progress;
        if (!global.quiet)
        {
            progress = [&](const ProgressSnapshot &snapshot)
            {
                std::lock_guard lock(progress_mutex);
                console.out << '\r' << output::format_progress(snapshot) << std::flush;
                if (snapshot.completed_parts == snapshot.total_parts)
                {
                    console.out << std::endl;
                }
            };
        }

        const auto decide = [&](const UploadRequest &request, const ResumeInfo &)
        {
            const auto it = resume_answers.find(request.local_path);
            return it == resume_answers.end() || it->second;
        };

        const auto result = batch.run(resolved.requests, options.mode, stop, progress, decide);
        print_outcomes(result.outcomes, console);
        return result.code;
    }

    ErrorCode run_list(const ListOptions &options, const GlobalOptions &global, ObjectStoreClient &client,
                       Console &console, std::stop_token stop)
    {
        auto objects = client.list_all_objects(options.prefix, stop);
        if (objects.empty())
        {
            if (!global.quiet)
            {
                console.out << "No objects found" << std::endl;
            }
            return ErrorCode::Ok;
        }

        std::stable_sort(objects.begin(), objects.end(), [](const ObjectInfo &a, const ObjectInfo &b)
                         { return a.last_modified > b.last_modified; });
        for (const auto &object : objects)
        {
            console.out << output::format_list_item(object, global.quiet, options.json) << '\n';
        }
        if (!global.quiet && !options.json)
        {
            const auto summary = summarize(objects);
            console.out << summary.count << " objects (" << output::format_bytes(summary.total_bytes) << " total)"
                        << '\n';
        }
        console.out << std::flush;
        return ErrorCode::Ok;
    }

    ErrorCode run_prune(const PruneOptions &options, const GlobalOptions &global, ObjectStoreClient &client,
                        Logger &logger, Console &console, std::stop_token stop, SystemTime now)
    {
        const auto objects = client.list_all_objects(options.prefix, stop);
        const RetentionPolicy policy{
            .older_than_days = options.older_than_days,
            .keep_last = options.keep_last,
            .min_age = parse_age(options.min_age),
        };
        const auto selected = select_for_deletion(objects, policy, now);
        if (selected.empty())
        {
            if (global.quiet)
            {
                console.out << "0 objects deleted" << std::endl;
            }
            else
            {
                console.out << (objects.empty() ? "No objects found matching prefix"
                                                : "No objects match deletion criteria")
                            << std::endl;
            }
            return ErrorCode::Ok;
        }

        const auto summary = summarize(selected);
        if (options.dry_run)
        {
            console.out << output::format_delete_summary(summary.count, summary.total_bytes, true) << std::endl;
            if (!global.quiet)
            {
                console.out << output::format_dry_run_list(selected) << std::endl;
            }
            return ErrorCode::Ok;
        }

        if (!global.ci && !global.quiet)
        {
            if (!console.interactive)
            {
                console.err << "Error: prune needs confirmation; rerun with --ci to delete without asking"
                            << std::endl;
                return ErrorCode::PromptRequired;
            }
            console.out << output::format_dry_run_list(selected) << std::endl;
            const auto question = "Delete " + std::to_string(summary.count) + " objects (" +
                                  output::format_bytes(summary.total_bytes) + ")?";
            if (!ask_yes_no(console, question))
            {
                console.out << "Cancelled" << std::endl;
                return ErrorCode::Ok;
            }
        }

        std::vector<std::string> keys;
        keys.reserve(selected.size());
        for (const auto &object : selected)
        {
            keys.push_back(object.key);
        }
        const auto result = client.delete_objects(keys, stop);
        logger.log("prune", "deleted ", result.deleted, "/", keys.size(), " objects under ", options.prefix);

        if (!result.errors.empty())
        {
            console.err << "Deleted " << result.deleted << "/" << keys.size() << " objects" << std::endl;
            for (const auto &error : result.errors)
            {
                console.err << "Error: " << error << std::endl;
            }
            return result.deleted == 0 ? ErrorCode::GeneralError : ErrorCode::PartialFailure;
        }
        console.out << output::format_delete_summary(result.deleted, summary.total_bytes, false) << std::endl;
        return ErrorCode::Ok;
    }

} // namespace s3up::client
