#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "s3up/client/multipart_upload.hpp"
#include "s3up/client/progress.hpp"
#include "s3up/s3_types.hpp"

namespace s3up::client::output
{

    // 512 B, 1.5 KB, 131.8 MB, 2.0 GB
    std::string format_bytes(std::uint64_t bytes);

    std::string format_upload_success(const UploadOutcome &outcome);
    std::string format_upload_error(const UploadOutcome &outcome);

    // key<TAB>size<TAB>ISO date, or one JSON object per line. Quiet mode pads
    // the size and shows only the date.
    std::string format_list_item(const ObjectInfo &object, bool quiet, bool json);

    std::string format_delete_summary(std::size_t count, std::uint64_t total_bytes, bool dry_run);

    std::string format_dry_run_list(const std::vector<ObjectInfo> &objects);

    std::string format_progress(const ProgressSnapshot &snapshot, std::size_t bar_width = 24);

} // namespace s3up::client::output
