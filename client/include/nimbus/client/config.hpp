#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace nimbus::client
{

    // Bounded exponential backoff. Attempt n (1-based) waits base * 2^(n-1), capped at max_delay.
    struct RetryPolicy
    {
        std::size_t max_attempts{3};
        std::chrono::milliseconds base_delay{200};
        std::chrono::milliseconds max_delay{5000};
    };

    struct TransferOptions
    {
        std::uint64_t chunk_size{2 * 1024 * 1024};
        std::size_t parallelism{0}; // 0 = hardware concurrency
        RetryPolicy chunk_retry{};
        std::chrono::milliseconds chunk_timeout{30000};
        std::optional<std::size_t> max_upload_rate;
        std::optional<std::size_t> max_download_rate;
        bool resume{true};
    };

    struct ClientConfig
    {
        std::optional<std::string> username;
        std::string host;
        std::uint16_t port{};
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
        std::optional<std::filesystem::path> state_path;
        std::size_t io_threads{2};
        std::chrono::seconds cache_ttl{300}; // 0 = listings never expire
        std::chrono::seconds refresh_margin{60};
        RetryPolicy session_retry{};
        std::chrono::milliseconds request_timeout{15000};
        TransferOptions transfers{};
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    // Overlays the keys present in a JSON config file onto config.
    void apply_config_file(const std::filesystem::path &path, ClientConfig &config);

} // namespace nimbus::client
