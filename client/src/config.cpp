#include "s3up/client/config.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace s3up::client
{

    namespace
    {

        std::string require_value(const std::vector<std::string> &args, std::size_t &index, const std::string &flag)
        {
            if (index + 1 >= args.size())
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return args[++index];
        }

        unsigned long long parse_count(const std::string &value, const std::string &flag)
        {
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
            {
                throw std::runtime_error(flag + " expects a non-negative integer, got '" + value + "'");
            }
            try
            {
                return std::stoull(value);
            }
            catch (const std::out_of_range &)
            {
                throw std::runtime_error(flag + " value is too large: " + value);
            }
        }

        bool is_flag(const std::string &arg)
        {
            return arg.size() > 1 && arg.front() == '-';
        }

        void parse_upload(const std::vector<std::string> &args, UploadOptions &options)
        {
            bool fast = false;
            bool slow = false;
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                const auto &arg = args[i];
                if (arg == "--prefix")
                {
                    options.prefix = require_value(args, i, arg);
                }
                else if (arg == "--fast" || arg == "-f")
                {
                    fast = true;
                }
                else if (arg == "--slow" || arg == "-s")
                {
                    slow = true;
                }
                else if (is_flag(arg))
                {
                    throw std::runtime_error("Unknown upload option: " + arg);
                }
                else
                {
                    options.paths.push_back(arg);
                }
            }
            if (options.paths.empty())
            {
                throw std::runtime_error("Usage: s3up upload <paths...> [--prefix <prefix>] [--fast|--slow]");
            }
            // --fast wins when both are given.
            options.mode = fast ? SpeedMode::Fast : (slow ? SpeedMode::Slow : SpeedMode::Default);
        }

        void parse_list(const std::vector<std::string> &args, ListOptions &options)
        {
            for (const auto &arg : args)
            {
                if (arg == "--json")
                {
                    options.json = true;
                }
                else if (is_flag(arg))
                {
                    throw std::runtime_error("Unknown list option: " + arg);
                }
                else
                {
                    options.prefix = arg;
                }
            }
        }

        void parse_prune(const std::vector<std::string> &args, PruneOptions &options)
        {
            for (std::size_t i = 0; i < args.size(); ++i)
            {
                const auto &arg = args[i];
                if (arg == "--older-than")
                {
                    const auto days = parse_count(require_value(args, i, arg), arg);
                    if (days > static_cast<unsigned long long>(std::numeric_limits<int>::max() / 24))
                    {
                        throw std::runtime_error("--older-than value is too large");
                    }
                    options.older_than_days = static_cast<int>(days);
                }
                else if (arg == "--keep-last")
                {
                    options.keep_last = static_cast<std::size_t>(parse_count(require_value(args, i, arg), arg));
                }
                else if (arg == "--min-age")
                {
                    options.min_age = require_value(args, i, arg);
                }
                else if (arg == "--dry-run")
                {
                    options.dry_run = true;
                }
                else if (is_flag(arg))
                {
                    throw std::runtime_error("Unknown prune option: " + arg);
                }
                else
                {
                    options.prefix = arg;
                }
            }
            if (options.prefix.empty())
            {
                throw std::runtime_error("prefix is required for prune\n"
                                         "Usage: s3up prune <prefix> --keep-last <n> | --older-than <days>");
            }
            if (!options.older_than_days && !options.keep_last)
            {
                throw std::runtime_error("at least one of --older-than or --keep-last is required");
            }
        }

    } // namespace

    CliOptions parse_arguments(int argc, char *argv[])
    {
        CliOptions options;
        std::vector<std::string> rest;
        bool help = false;
        bool version = false;

        std::vector<std::string> args(argv + 1, argv + argc);
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            const auto &arg = args[i];
            if (arg == "--quiet" || arg == "-q")
            {
                options.global.quiet = true;
            }
            else if (arg == "--ci")
            {
                options.global.ci = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                help = true;
            }
            else if (arg == "--version" || arg == "-v")
            {
                version = true;
            }
            else if (arg == "--log")
            {
                options.global.log_path = std::filesystem::path(require_value(args, i, arg));
            }
            else if (arg == "--config")
            {
                options.global.config_path = std::filesystem::path(require_value(args, i, arg));
            }
            else
            {
                rest.push_back(arg);
            }
        }

        if (version)
        {
            options.command = Command::Version;
            return options;
        }
        if (help || rest.empty())
        {
            options.command = Command::Help;
            return options;
        }

        const auto command = rest.front();
        rest.erase(rest.begin());
        if (command == "upload")
        {
            options.command = Command::Upload;
            parse_upload(rest, options.upload);
        }
        else if (command == "list" || command == "ls")
        {
            options.command = Command::List;
            parse_list(rest, options.list);
        }
        else if (command == "prune")
        {
            options.command = Command::Prune;
            parse_prune(rest, options.prune);
        }
        else
        {
            throw std::runtime_error("Unknown command: " + command + "\n" + usage());
        }
        return options;
    }

    std::string usage()
    {
        return "Usage: s3up <command> [options]\n"
               "\n"
               "Commands:\n"
               "  upload <paths...> [--prefix <prefix>] [--fast|--slow]\n"
               "  list [prefix] [--json]\n"
               "  prune <prefix> [--older-than <days>] [--keep-last <n>] [--min-age <age>] [--dry-run]\n"
               "\n"
               "Options:\n"
               "  -q, --quiet        minimal output\n"
               "  --ci               never prompt\n"
               "  --log <file>       write a log file\n"
               "  --config <file>    read configuration from a JSON file instead of S3UP_CONFIG\n"
               "  -h, --help         show this help\n"
               "  -v, --version      show the version\n";
    }

} // namespace s3up::client
