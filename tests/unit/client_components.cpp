#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "s3up/client/config.hpp"
#include "s3up/client/logger.hpp"
#include "s3up/client/output.hpp"
#include "s3up/client/progress.hpp"
#include "s3up/client/retention.hpp"
#include "s3up/client/transfer_state_store.hpp"
#include "s3up/client/upload_batch.hpp"

using namespace s3up;
using namespace s3up::client;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path make_temp_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        std::filesystem::create_directories(root);
        return root;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    UploadState sample_state(const std::filesystem::path &file)
    {
        const auto stamp = stat_file(file);
        auto state = make_initial_state("upload-1", "bucket", "dir/file.bin", stamp, 4, "aws",
                                        "https://s3.us-east-1.amazonaws.com");
        return state;
    }

    void test_state_store_round_trip()
    {
        const auto root = make_temp_root("s3up_state_round_trip");
        const auto file = root / "file.bin";
        write_file(file, "0123456789");

        TransferStateStore store;
        assert(TransferStateStore::state_path(file) == root / ".file.bin.s3up");
        assert(!store.load(file));

        auto state = sample_state(file);
        assert(state.total_parts == 3);
        state.completed_parts = {{1, "\"a\""}, {3, "\"c\""}};
        store.save(file, state);
        assert(std::filesystem::exists(TransferStateStore::state_path(file)));

        const auto loaded = store.load(file);
        assert(loaded);
        assert(*loaded == state);

        std::ifstream in(TransferStateStore::state_path(file));
        const auto json = nlohmann::json::parse(in);
        assert(json.at("version") == 1);
        assert(json.at("uploadId") == "upload-1");
        assert(json.at("completedParts").at(1).at("partNumber") == 3);

        store.remove(file);
        assert(!store.load(file));
        store.remove(file);

        cleanup_path(root);
    }

    void test_state_store_rejects_corruption()
    {
        const auto root = make_temp_root("s3up_state_corrupt");
        const auto file = root / "file.bin";
        write_file(file, "0123456789");
        const auto sidecar = TransferStateStore::state_path(file);
        TransferStateStore store;

        write_file(sidecar, "{\"version\": 1, \"uploadId\": ");
        assert(!store.load(file));

        auto json = nlohmann::json(sample_state(file));
        json["version"] = 2;
        write_file(sidecar, json.dump());
        assert(!store.load(file));

        json["version"] = 1;
        json["totalParts"] = 7;
        write_file(sidecar, json.dump());
        assert(!store.load(file));

        json["totalParts"] = 3;
        json["completedParts"] = nlohmann::json::array({{{"partNumber", 2}, {"etag", "x"}},
                                                        {{"partNumber", 1}, {"etag", "y"}},
                                                        {{"partNumber", 2}, {"etag", "z"}}});
        write_file(sidecar, json.dump());
        const auto normalized = store.load(file);
        assert(normalized);
        assert(normalized->completed_parts.size() == 2);
        assert(normalized->completed_parts[0].part_number == 1);
        assert(normalized->completed_parts[1].etag == "z");

        cleanup_path(root);
    }

    void test_add_completed_part_is_idempotent()
    {
        const auto root = make_temp_root("s3up_state_upsert");
        const auto file = root / "file.bin";
        write_file(file, "0123456789");
        TransferStateStore store;
        auto state = sample_state(file);

        store.add_completed_part(file, state, {3, "\"c\""});
        store.add_completed_part(file, state, {1, "\"a\""});
        store.add_completed_part(file, state, {1, "\"a\""});
        store.add_completed_part(file, state, {2, "\"b\""});
        store.add_completed_part(file, state, {2, "\"b2\""});

        const std::vector<CompletedPart> expected{{1, "\"a\""}, {2, "\"b2\""}, {3, "\"c\""}};
        assert(state.completed_parts == expected);
        assert(store.load(file)->completed_parts == expected);
        assert(completed_bytes(state) == 10);

        cleanup_path(root);
    }

    void test_concurrent_commits_are_not_lost()
    {
        const auto root = make_temp_root("s3up_state_concurrent");
        const auto file = root / "file.bin";
        write_file(file, std::string(64, 'x'));
        TransferStateStore store;
        auto state = make_initial_state("u", "b", "k", stat_file(file), 1, "aws", "e");
        assert(state.total_parts == 64);

        std::vector<std::thread> threads;
        for (std::uint32_t t = 0; t < 4; ++t)
        {
            threads.emplace_back([&, t]
                                 {
                for (std::uint32_t part = t + 1; part <= 64; part += 4) {
                    store.add_completed_part(file, state, {part, "e" + std::to_string(part)});
                } });
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
        const auto loaded = store.load(file);
        assert(loaded && loaded->completed_parts.size() == 64);
        for (std::uint32_t i = 0; i < 64; ++i)
        {
            assert(loaded->completed_parts[i].part_number == i + 1);
        }
        cleanup_path(root);
    }

    void test_has_file_changed()
    {
        const auto root = make_temp_root("s3up_state_changed");
        const auto file = root / "file.bin";
        write_file(file, "0123456789");
        TransferStateStore store;
        const auto state = sample_state(file);

        assert(!store.has_file_changed(file, state));

        auto size_changed = state;
        size_changed.file_size += 1;
        assert(store.has_file_changed(file, size_changed));

        auto time_changed = state;
        time_changed.file_modified -= 5000;
        assert(store.has_file_changed(file, time_changed));

        auto both_changed = state;
        both_changed.file_size += 1;
        both_changed.file_modified -= 5000;
        assert(store.has_file_changed(file, both_changed));

        std::filesystem::remove(file);
        assert(store.has_file_changed(file, state));

        cleanup_path(root);
    }

    void test_part_ranges()
    {
        UploadState state;
        state.file_size = 10;
        state.chunk_size = 4;
        state.total_parts = part_count(10, 4);
        assert(state.total_parts == 3);
        assert(part_range(state, 1).offset == 0 && part_range(state, 1).length == 4);
        assert(part_range(state, 3).offset == 8 && part_range(state, 3).length == 2);
        assert(part_count(8, 4) == 2);

        bool caught = false;
        try
        {
            (void)part_range(state, 4);
        }
        catch (const std::out_of_range &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_progress_window_speed()
    {
        using Clock = ProgressEstimator::Clock;
        const auto start = Clock::time_point{} + std::chrono::hours(1);
        ProgressEstimator estimator("file.bin", 4, 4000, std::chrono::seconds(30), start);

        estimator.record_part(1000, start + std::chrono::seconds(1));
        estimator.record_part(1000, start + std::chrono::seconds(2));
        estimator.record_part(1000, start + std::chrono::seconds(4));

        const auto speed = estimator.bytes_per_second(start + std::chrono::seconds(4));
        assert(std::abs(speed - 750.0) < 1e-6);
        assert(std::abs(estimator.percent() - 75.0) < 1e-9);

        // No samples left in the window: lifetime average, not zero.
        const auto later = start + std::chrono::seconds(100);
        const auto fallback = estimator.bytes_per_second(later);
        assert(std::abs(fallback - 30.0) < 1e-6);

        const auto snapshot = estimator.snapshot(later);
        assert(snapshot.completed_parts == 3 && snapshot.total_parts == 4);
        assert(snapshot.bytes_uploaded == 3000);
    }

    void test_progress_resume_credit()
    {
        using Clock = ProgressEstimator::Clock;
        const auto start = Clock::time_point{} + std::chrono::hours(1);
        ProgressEstimator estimator("file.bin", 4, 4000, std::chrono::seconds(30), start);
        estimator.credit_completed(2, 2000);
        assert(std::abs(estimator.percent() - 50.0) < 1e-9);
        assert(estimator.bytes_per_second(start + std::chrono::seconds(10)) == 0.0);

        estimator.record_part(1000, start + std::chrono::seconds(10));
        estimator.record_part(5000, start + std::chrono::seconds(20));
        assert(estimator.percent() == 100.0);
        assert(estimator.bytes_uploaded() == 4000);

        ProgressEstimator empty("empty", 0, 0, std::chrono::seconds(30), start);
        assert(empty.percent() == 0.0);
    }

    ObjectInfo aged(const std::string &key, SystemTime now, std::chrono::hours age, std::uint64_t size = 100)
    {
        return ObjectInfo{.key = key, .size = size, .last_modified = now - age, .etag = std::nullopt};
    }

    void test_retention_keep_last_and_older_than()
    {
        const auto now = from_unix_millis(1700000000000);
        const std::vector<ObjectInfo> objects{
            aged("d3", now, std::chrono::hours(24 * 3)),
            aged("d21", now, std::chrono::hours(24 * 21)),
            aged("d1", now, std::chrono::hours(24 * 1)),
            aged("d11", now, std::chrono::hours(24 * 11)),
            aged("d2", now, std::chrono::hours(24 * 2)),
        };
        const RetentionPolicy policy{.older_than_days = 2, .keep_last = 3, .min_age = parse_age("0d")};
        const auto selected = select_for_deletion(objects, policy, now);
        assert(selected.size() == 2);
        assert(selected[0].key == "d11");
        assert(selected[1].key == "d21");

        const auto summary = summarize(selected);
        assert(summary.count == 2 && summary.total_bytes == 200);

        const RetentionPolicy keep_only{.older_than_days = std::nullopt, .keep_last = 4, .min_age = parse_age("0")};
        const auto oldest = select_for_deletion(objects, keep_only, now);
        assert(oldest.size() == 1 && oldest[0].key == "d21");

        const RetentionPolicy keep_zero{.older_than_days = 10, .keep_last = 0, .min_age = parse_age("0")};
        assert(select_for_deletion(objects, keep_zero, now).size() == 2);
    }

    void test_retention_min_age_floor()
    {
        const auto now = from_unix_millis(1700000000000);
        const std::vector<ObjectInfo> objects{aged("fresh", now, std::chrono::hours(12)),
                                              aged("old", now, std::chrono::hours(24 * 30))};
        RetentionPolicy policy;
        assert(policy.min_age == std::chrono::hours(24));
        policy.older_than_days = 0;
        policy.keep_last = 0;
        const auto selected = select_for_deletion(objects, policy, now);
        assert(selected.size() == 1 && selected[0].key == "old");

        policy.min_age = parse_age("6h");
        assert(select_for_deletion(objects, policy, now).size() == 2);
    }

    void test_parse_age()
    {
        using namespace std::chrono;
        assert(parse_age("7d") == hours(24 * 7));
        assert(parse_age("12h") == hours(12));
        assert(parse_age("30m") == minutes(30));
        assert(parse_age("5") == hours(24 * 5));
        assert(parse_age("0") == milliseconds::zero());
        assert(parse_age("") == milliseconds::zero());
        assert(parse_age("abc") == milliseconds::zero());
        assert(parse_age("7w") == milliseconds::zero());
        assert(parse_age("-1d") == milliseconds::zero());
        assert(parse_age("1.5h") == milliseconds::zero());
    }

    void test_output_formatting()
    {
        assert(output::format_bytes(0) == "0 B");
        assert(output::format_bytes(1023) == "1023 B");
        assert(output::format_bytes(1536) == "1.5 KB");
        assert(output::format_bytes(138200000) == "131.8 MB");
        assert(output::format_bytes(2ULL * 1024 * 1024 * 1024) == "2.0 GB");

        assert(output::format_delete_summary(3, 138200000, false) == "Deleted 3 objects (131.8 MB)");
        assert(output::format_delete_summary(3, 138200000, true) == "Would delete 3 objects (131.8 MB)");

        const ObjectInfo object{.key = "a/b.txt", .size = 2048, .last_modified = from_unix_millis(1704164645000),
                                .etag = std::nullopt};
        assert(output::format_list_item(object, false, false) == "a/b.txt\t2.0 KB\t2024-01-02T03:04:05.000Z");
        assert(output::format_list_item(object, true, false) == "a/b.txt\t    2.0 KB\t2024-01-02");
        const auto json = nlohmann::json::parse(output::format_list_item(object, false, true));
        assert(json.at("key") == "a/b.txt" && json.at("size") == 2048);
        assert(json.at("lastModified") == "2024-01-02T03:04:05.000Z");

        const std::vector<ObjectInfo> list{object, ObjectInfo{.key = "c", .size = 5, .last_modified = {},
                                                              .etag = std::nullopt}};
        assert(output::format_dry_run_list(list) == "  a/b.txt (2.0 KB)\n  c (5 B)");

        const UploadOutcome failed{.status = UploadStatus::Failed, .filename = "f.bin", .key = "f.bin", .size = 1,
                                   .public_url = {}, .message = "boom"};
        assert(output::format_upload_error(failed) == "Error: f.bin - boom");

        const ProgressSnapshot snapshot{.filename = "f.bin", .completed_parts = 1, .total_parts = 2,
                                        .bytes_uploaded = 50, .total_bytes = 100, .bytes_per_second = 2048,
                                        .percent = 50};
        assert(output::format_progress(snapshot, 10) == "f.bin [#####-----] 50% 1/2 parts 2.0 KB/s");
    }

    std::vector<char *> make_argv(std::vector<std::string> &args)
    {
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return argv;
    }

    CliOptions parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "s3up");
        auto argv = make_argv(args);
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    bool parse_fails(std::vector<std::string> args)
    {
        try
        {
            (void)parse(std::move(args));
        }
        catch (const std::runtime_error &)
        {
            return true;
        }
        return false;
    }

    void test_cli_arguments()
    {
        assert(parse({}).command == Command::Help);
        assert(parse({"list", "--version"}).command == Command::Version);

        const auto upload = parse({"--quiet", "upload", "a.bin", "b.bin", "--prefix", "/backups/", "--slow", "--ci"});
        assert(upload.command == Command::Upload);
        assert(upload.global.quiet && upload.global.ci);
        assert(upload.upload.paths == (std::vector<std::string>{"a.bin", "b.bin"}));
        assert(upload.upload.prefix == "/backups/");
        assert(upload.upload.mode == SpeedMode::Slow);
        assert(parse({"upload", "a", "--slow", "--fast"}).upload.mode == SpeedMode::Fast);

        const auto list = parse({"list", "logs/", "--json", "--config", "cfg.json"});
        assert(list.command == Command::List && list.list.json);
        assert(list.list.prefix == "logs/");
        assert(list.global.config_path == std::filesystem::path("cfg.json"));

        const auto prune = parse({"prune", "backups/", "--keep-last", "3", "--older-than", "7", "--min-age", "12h",
                                  "--dry-run", "--log", "s3up.log"});
        assert(prune.command == Command::Prune);
        assert(prune.prune.prefix == "backups/");
        assert(prune.prune.keep_last == 3u && prune.prune.older_than_days == 7);
        assert(prune.prune.min_age == "12h" && prune.prune.dry_run);
        assert(prune.global.log_path == std::filesystem::path("s3up.log"));
        assert(parse({"prune", "x", "--keep-last", "1"}).prune.min_age == "1d");

        assert(parse_fails({"upload"}));
        assert(parse_fails({"prune", "--keep-last", "2"}));
        assert(parse_fails({"prune", "backups/"}));
        assert(parse_fails({"prune", "backups/", "--keep-last", "-1"}));
        assert(parse_fails({"prune", "backups/", "--older-than"}));
        assert(parse_fails({"sync", "x"}));
        assert(parse_fails({"list", "--bogus"}));
    }

    void test_presets_and_prefix()
    {
        assert(preset_for(SpeedMode::Default).chunk_size == 25 * kMiB);
        assert(preset_for(SpeedMode::Default).connections == 8);
        assert(preset_for(SpeedMode::Fast).chunk_size == 5 * kMiB);
        assert(preset_for(SpeedMode::Fast).connections == 16);
        assert(preset_for(SpeedMode::Slow).chunk_size == 50 * kMiB);
        assert(preset_for(SpeedMode::Slow).connections == 4);
        assert(multipart_threshold(SpeedMode::Default) == 100 * kMiB);
        assert(multipart_threshold(SpeedMode::Fast) == 5 * kMiB);

        assert(apply_prefix("/backups/daily/", "db.sql") == "backups/daily/db.sql");
        assert(apply_prefix("releases", "app.tar") == "releases/app.tar");
        assert(apply_prefix("//", "app.tar") == "app.tar");

        const auto root = make_temp_root("s3up_resolve_requests");
        write_file(root / "a.bin", "abc");
        std::filesystem::create_directories(root / "dir");
        const auto resolved = resolve_requests(
            {(root / "a.bin").string(), (root / "missing.bin").string(), (root / "dir").string()}, "up");
        assert(resolved.requests.size() == 1);
        assert(resolved.requests[0].remote_key == "up/a.bin");
        assert(resolved.requests[0].size == 3);
        assert(resolved.invalid_paths.size() == 2);
        cleanup_path(root);
    }

    void test_logger_writes_tagged_lines()
    {
        const auto root = make_temp_root("s3up_logger");
        const auto log_path = root / "s3up.log";
        {
            Logger logger(log_path);
            logger.log("upload", "part ", 3, "/", 8, " committed");
            logger.warn("upload", "slow");
        }
        std::ifstream in(log_path);
        const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(content.find("[info] [upload] part 3/8 committed") != std::string::npos);
        assert(content.find("[warning] [upload] slow") != std::string::npos);

        Logger silent(std::nullopt);
        silent.log("noop", "ignored");
        cleanup_path(root);
    }

} // namespace

void run_client_component_tests()
{
    test_state_store_round_trip();
    test_state_store_rejects_corruption();
    test_add_completed_part_is_idempotent();
    test_concurrent_commits_are_not_lost();
    test_has_file_changed();
    test_part_ranges();
    test_progress_window_speed();
    test_progress_resume_credit();
    test_retention_keep_last_and_older_than();
    test_retention_min_age_floor();
    test_parse_age();
    test_output_formatting();
    test_cli_arguments();
    test_presets_and_prefix();
    test_logger_writes_tagged_lines();
}
