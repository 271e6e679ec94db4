#include "nimbus/client/config.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "nimbus/framing.hpp"

namespace nimbus::client
{

    namespace
    {

        void apply_retry(const nlohmann::json &json, RetryPolicy &policy)
        {
            policy.max_attempts = json.value("max_attempts", policy.max_attempts);
            policy.base_delay = std::chrono::milliseconds(json.value("base_delay_ms", policy.base_delay.count()));
            policy.max_delay = std::chrono::milliseconds(json.value("max_delay_ms", policy.max_delay.count()));
            if (policy.max_attempts == 0)
            {
                throw std::runtime_error("retry.max_attempts must be at least 1");
            }
        }

        void check_chunk_size(std::uint64_t chunk_size)
        {
            if (chunk_size == 0 || chunk_size > protocol::kMaxChunkSize)
            {
                throw std::runtime_error("chunk size must be between 1 and " +
                                         std::to_string(protocol::kMaxChunkSize) + " bytes");
            }
        }

        void apply_transfers(const nlohmann::json &json, TransferOptions &options)
        {
            options.chunk_size = json.value("chunk_size", options.chunk_size);
            check_chunk_size(options.chunk_size);
            options.parallelism = json.value("parallelism", options.parallelism);
            options.chunk_timeout = std::chrono::milliseconds(json.value("chunk_timeout_ms", options.chunk_timeout.count()));
            options.resume = json.value("resume", options.resume);
            if (auto it = json.find("max_upload_rate"); it != json.end() && !it->is_null())
            {
                options.max_upload_rate = it->get<std::size_t>();
            }
            if (auto it = json.find("max_download_rate"); it != json.end() && !it->is_null())
            {
                options.max_download_rate = it->get<std::size_t>();
            }
            if (auto it = json.find("retry"); it != json.end())
            {
                apply_retry(*it, options.chunk_retry);
            }
        }

        void parse_endpoint(const std::string &endpoint, ClientConfig &config)
        {
            const auto at_pos = endpoint.find('@');
            std::string host_part = endpoint;
            if (at_pos != std::string::npos)
            {
                config.username = endpoint.substr(0, at_pos);
                host_part = endpoint.substr(at_pos + 1);
            }

            const auto colon_pos = host_part.rfind(':');
            if (colon_pos == std::string::npos)
            {
                throw std::runtime_error("Expected endpoint format host:port");
            }
            config.host = host_part.substr(0, colon_pos);
            const auto port_value = std::stoul(host_part.substr(colon_pos + 1));
            if (port_value == 0 || port_value > 65535)
            {
                throw std::runtime_error("Port out of range");
            }
            config.port = static_cast<std::uint16_t>(port_value);
        }

        const char *require_value(int argc, char *argv[], int &index, const std::string &flag)
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    void apply_config_file(const std::filesystem::path &path, ClientConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Cannot open config file " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::runtime_error("Malformed config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw std::runtime_error("Config file must contain a JSON object");
        }

        if (auto it = json.find("username"); it != json.end())
        {
            config.username = it->get<std::string>();
        }
        config.host = json.value("host", config.host);
        config.port = json.value("port", config.port);
        if (auto it = json.find("log"); it != json.end())
        {
            config.log_path = std::filesystem::path(it->get<std::string>());
        }
        config.verbose = json.value("verbose", config.verbose);
        if (auto it = json.find("state_file"); it != json.end())
        {
            config.state_path = std::filesystem::path(it->get<std::string>());
        }
        config.io_threads = json.value("io_threads", config.io_threads);
        config.cache_ttl = std::chrono::seconds(json.value("cache_ttl_seconds", config.cache_ttl.count()));
        config.refresh_margin = std::chrono::seconds(json.value("refresh_margin_seconds", config.refresh_margin.count()));
        config.request_timeout = std::chrono::milliseconds(json.value("request_timeout_ms", config.request_timeout.count()));
        if (auto it = json.find("retry"); it != json.end())
        {
            apply_retry(*it, config.session_retry);
        }
        if (auto it = json.find("transfers"); it != json.end())
        {
            apply_transfers(*it, config.transfers);
        }
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 2)
        {
            throw std::runtime_error(
                "Usage: nimbus [username@]<server>:<port> [--config <file>] [--log <file>] [--verbose] "
                "[--chunk-size <bytes>] [--parallelism <n>] [--max-upload-rate <bps>] "
                "[--max-download-rate <bps>] [--state-file <file>]");
        }

        ClientConfig config;

        // The config file is applied first so that flags override it.
        for (int i = 2; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                apply_config_file(argv[i + 1], config);
            }
        }

        int index = 1;
        parse_endpoint(argv[index++], config);

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config")
            {
                require_value(argc, argv, index, arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg == "--chunk-size")
            {
                config.transfers.chunk_size = std::stoull(require_value(argc, argv, index, arg));
                check_chunk_size(config.transfers.chunk_size);
            }
            else if (arg == "--parallelism")
            {
                config.transfers.parallelism = static_cast<std::size_t>(std::stoul(require_value(argc, argv, index, arg)));
            }
            else if (arg == "--max-upload-rate")
            {
                config.transfers.max_upload_rate = static_cast<std::size_t>(std::stoull(require_value(argc, argv, index, arg)));
            }
            else if (arg == "--max-download-rate")
            {
                config.transfers.max_download_rate = static_cast<std::size_t>(std::stoull(require_value(argc, argv, index, arg)));
            }
            else if (arg == "--state-file")
            {
                config.state_path = std::filesystem::path(require_value(argc, argv, index, arg));
            }
            else
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
        }

        return config;
    }

} // namespace nimbus::client
