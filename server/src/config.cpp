#include "nimbus/server/config.hpp"

#include <iostream>
#include <stdexcept>

#include "nimbus/version.hpp"

namespace nimbus::server
{

    namespace
    {

        void print_usage(const char *program_name)
        {
            std::cout << "Nimbus server " << nimbus::version() << "\n"
                      << "Usage: " << program_name
                      << " --port <PORT> --root <ROOT> [--address <ADDRESS>] [--threads <N>]\n"
                         "       [--upload-timeout <seconds>] [--session-ttl <seconds>] [--quota <bytes>]\n"
                         "       [--log <FILE>] [--verbose]\n";
        }

        std::string read_option(int &index, int argc, char *argv[])
        {
            const std::string flag = argv[index];
            if (index + 1 >= argc)
            {
                throw std::invalid_argument("Missing value for " + flag);
            }
            ++index;
            return argv[index];
        }

        std::uint64_t read_number(int &index, int argc, char *argv[])
        {
            const std::string flag = argv[index];
            const auto value = read_option(index, argc, argv);
            std::size_t consumed = 0;
            const auto number = std::stoull(value, &consumed);
            if (consumed != value.size())
            {
                throw std::invalid_argument("Expected a number for " + flag + ", got " + value);
            }
            return number;
        }

    } // namespace

    std::optional<ServerConfig> parse_arguments(int argc, char *argv[])
    {
        ServerConfig config;
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--port")
            {
                const auto port = read_number(i, argc, argv);
                if (port == 0 || port > 65535)
                {
                    throw std::invalid_argument("Port out of range");
                }
                config.port = static_cast<std::uint16_t>(port);
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(read_option(i, argc, argv));
            }
            else if (arg == "--address")
            {
                config.address = read_option(i, argc, argv);
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(read_number(i, argc, argv));
            }
            else if (arg == "--upload-timeout")
            {
                config.upload_timeout = std::chrono::seconds(read_number(i, argc, argv));
            }
            else if (arg == "--session-ttl")
            {
                config.session_ttl = std::chrono::seconds(read_number(i, argc, argv));
            }
            else if (arg == "--quota")
            {
                config.quota_bytes = read_number(i, argc, argv);
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(read_option(i, argc, argv));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return std::nullopt;
            }
            else
            {
                print_usage(argv[0]);
                throw std::invalid_argument("Unknown argument: " + arg);
            }
        }

        if (config.port == 0 || config.root.empty())
        {
            print_usage(argv[0]);
            throw std::invalid_argument("--port and --root are required");
        }
        return config;
    }

} // namespace nimbus::server
