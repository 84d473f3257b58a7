#pragma once

#include <iosfwd>
#include <stop_token>
#include <string>

#include "s3up/client/config.hpp"
#include "s3up/client/logger.hpp"
#include "s3up/client/object_store_client.hpp"
#include "s3up/client/transfer_state_store.hpp"
#include "s3up/error_codes.hpp"
#include "s3up/time_format.hpp"

namespace s3up::client
{

    struct Console
    {
        std::istream &in;
        std::ostream &out;
        std::ostream &err;
        // Whether questions may be asked on `in`.
        bool interactive{};
    };

    // Asks until the answer is yes or no; end of input counts as no.
    bool ask_yes_no(Console &console, const std::string &question);

    ErrorCode run_upload(const UploadOptions &options, const GlobalOptions &global, ObjectStoreClient &client,
                         const TransferStateStore &store, Logger &logger, Console &console, std::stop_token stop);

    ErrorCode run_list(const ListOptions &options, const GlobalOptions &global, ObjectStoreClient &client,
                       Console &console, std::stop_token stop);

    ErrorCode run_prune(const PruneOptions &options, const GlobalOptions &global, ObjectStoreClient &client,
                        Logger &logger, Console &console, std::stop_token stop, SystemTime now);

} // namespace s3up::client
