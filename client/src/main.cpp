#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stop_token>
#include <thread>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "s3up/client/commands.hpp"
#include "s3up/client/config.hpp"
#include "s3up/client/logger.hpp"
#include "s3up/client/object_store_client.hpp"
#include "s3up/client/transfer_state_store.hpp"
#include "s3up/error_codes.hpp"
#include "s3up/errors.hpp"
#include "s3up/http.hpp"
#include "s3up/providers.hpp"
#include "s3up/version.hpp"

namespace
{

    // SIGINT/SIGTERM request a graceful stop; a second signal exits at once.
    class InterruptWatcher
    {
    public:
        InterruptWatcher()
            : signals_(io_context_, SIGINT, SIGTERM)
        {
            arm();
            thread_ = std::thread([this]
                                  { io_context_.run(); });
        }

        ~InterruptWatcher()
        {
            io_context_.stop();
            if (thread_.joinable())
            {
                thread_.join();
            }
        }

        InterruptWatcher(const InterruptWatcher &) = delete;
        InterruptWatcher &operator=(const InterruptWatcher &) = delete;

        std::stop_token token() const noexcept { return stop_source_.get_token(); }

    private:
        void arm()
        {
            signals_.async_wait([this](const std::error_code &ec, int signal)
                                {
            if (ec) {
                return;
            }
            if (stop_source_.stop_requested()) {
                std::cerr << "\nInterrupted again, exiting." << std::endl;
                std::_Exit(128 + signal);
            }
            std::cerr << "\nStopping after in-flight parts finish. Press Ctrl+C again to quit now." << std::endl;
            stop_source_.request_stop();
            arm(); });
        }

        asio::io_context io_context_;
        asio::signal_set signals_;
        std::stop_source stop_source_;
        std::thread thread_;
    };

    int exit_with(s3up::ErrorCode code)
    {
        return s3up::to_exit_code(code);
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace s3up;
    try
    {
        const auto options = client::parse_arguments(argc, argv);
        if (options.command == client::Command::Help)
        {
            std::cout << "s3up " << version() << " - upload files to S3-compatible storage\n\n"
                      << client::usage();
            return exit_with(ErrorCode::Ok);
        }
        if (options.command == client::Command::Version)
        {
            std::cout << "s3up " << version() << std::endl;
            return exit_with(ErrorCode::Ok);
        }

        client::Logger logger(options.global.log_path);
        spdlog::set_level(spdlog::level::warn);

        S3Config config;
        try
        {
            config = load_config(options.global.config_path);
            validate(config);
        }
        catch (const ConfigurationError &ex)
        {
            std::cerr << "Error: " << ex.what() << std::endl;
            return exit_with(ErrorCode::ConfigMissing);
        }

        http::BeastTransport transport;
        client::ObjectStoreClient store_client(config, transport);
        client::TransferStateStore state_store;
        InterruptWatcher interrupts;
        client::Console console{std::cin, std::cout, std::cerr, ::isatty(STDIN_FILENO) == 1};
        logger.log("main", "command start, bucket ", config.bucket, " at ", store_client.endpoint());

        ErrorCode code = ErrorCode::Ok;
        switch (options.command)
        {
        case client::Command::Upload:
            code = client::run_upload(options.upload, options.global, store_client, state_store, logger, console,
                                      interrupts.token());
            break;
        case client::Command::List:
            code = client::run_list(options.list, options.global, store_client, console, interrupts.token());
            break;
        case client::Command::Prune:
            code = client::run_prune(options.prune, options.global, store_client, logger, console,
                                     interrupts.token(), std::chrono::system_clock::now());
            break;
        case client::Command::Help:
        case client::Command::Version:
            break;
        }
        logger.log("main", "command finished: ", to_string(code));
        return exit_with(code);
    }
    catch (const CancelledError &ex)
    {
        std::cerr << "Cancelled: " << ex.what() << std::endl;
        return exit_with(ErrorCode::GeneralError);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return exit_with(ErrorCode::GeneralError);
    }
}
