#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace nimbus::client
{

    // Owns a file descriptor and exposes positional reads and writes, so several
    // workers can use disjoint regions of one file without sharing a cursor.
    class LocalFile
    {
    public:
        enum class Mode
        {
            Read,
            Write, // create if missing, keep existing content
        };

        LocalFile(const std::filesystem::path &path, Mode mode);
        ~LocalFile();

        LocalFile(const LocalFile &) = delete;
        LocalFile &operator=(const LocalFile &) = delete;
        LocalFile(LocalFile &&other) noexcept;
        LocalFile &operator=(LocalFile &&other) noexcept;

        // Reads exactly length bytes at offset; throws std::system_error on I/O failure or short read.
        std::vector<std::byte> read_at(std::uint64_t offset, std::size_t length) const;

        void write_at(std::uint64_t offset, std::span<const std::byte> data) const;

        void resize(std::uint64_t size) const;
        void sync() const;

        std::uint64_t size() const;
        const std::filesystem::path &path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
        int fd_{-1};
    };

    // Byte range of a LocalFile owned by a single chunk task.
    class FileRegion
    {
    public:
        FileRegion(const LocalFile &file, std::uint64_t offset, std::uint64_t length)
            : file_(file), offset_(offset), length_(length) {}

        std::vector<std::byte> read() const;

        // data must be exactly the region's length.
        void write(std::span<const std::byte> data) const;

    private:
        const LocalFile &file_;
        std::uint64_t offset_;
        std::uint64_t length_;
    };

} // namespace nimbus::client
