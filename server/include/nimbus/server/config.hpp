#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace nimbus::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        std::size_t worker_threads{0};
        std::chrono::seconds upload_timeout{std::chrono::seconds{3600}};
        std::chrono::seconds session_ttl{std::chrono::seconds{3600}};
        std::uint64_t quota_bytes{1ULL << 30}; // per user, counted in encrypted bytes
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
    };

    // Parses command-line flags. Returns nullopt when --help was requested.
    std::optional<ServerConfig> parse_arguments(int argc, char *argv[]);

} // namespace nimbus::server
