#include "nimbus/client/local_file.hpp"

#include <cerrno>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace nimbus::client
{

    namespace
    {
        [[noreturn]] void throw_errno(const std::string &what, const std::filesystem::path &path)
        {
            throw std::system_error(errno, std::generic_category(), what + " " + path.string());
        }
    } // namespace

    LocalFile::LocalFile(const std::filesystem::path &path, Mode mode)
        : path_(path)
    {
        const int flags = mode == Mode::Read ? O_RDONLY : (O_RDWR | O_CREAT);
        fd_ = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
        if (fd_ < 0)
        {
            throw_errno("open", path);
        }
    }

    LocalFile::~LocalFile()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
        }
    }

    LocalFile::LocalFile(LocalFile &&other) noexcept
        : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)) {}

    LocalFile &LocalFile::operator=(LocalFile &&other) noexcept
    {
        if (this != &other)
        {
            if (fd_ >= 0)
            {
                ::close(fd_);
            }
            path_ = std::move(other.path_);
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    std::vector<std::byte> LocalFile::read_at(std::uint64_t offset, std::size_t length) const
    {
        std::vector<std::byte> buffer(length);
        std::size_t done = 0;
        while (done < length)
        {
            const auto n = ::pread(fd_, buffer.data() + done, length - done, static_cast<off_t>(offset + done));
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw_errno("pread", path_);
            }
            if (n == 0)
            {
                throw std::system_error(std::make_error_code(std::errc::io_error),
                                        "unexpected end of file " + path_.string());
            }
            done += static_cast<std::size_t>(n);
        }
        return buffer;
    }

    void LocalFile::write_at(std::uint64_t offset, std::span<const std::byte> data) const
    {
        std::size_t done = 0;
        while (done < data.size())
        {
            const auto n = ::pwrite(fd_, data.data() + done, data.size() - done, static_cast<off_t>(offset + done));
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw_errno("pwrite", path_);
            }
            done += static_cast<std::size_t>(n);
        }
    }

    void LocalFile::resize(std::uint64_t size) const
    {
        if (::ftruncate(fd_, static_cast<off_t>(size)) != 0)
        {
            throw_errno("ftruncate", path_);
        }
    }

    void LocalFile::sync() const
    {
        if (::fsync(fd_) != 0)
        {
            throw_errno("fsync", path_);
        }
    }

    std::uint64_t LocalFile::size() const
    {
        struct stat info
        {
        };
        if (::fstat(fd_, &info) != 0)
        {
            throw_errno("fstat", path_);
        }
        return static_cast<std::uint64_t>(info.st_size);
    }

    std::vector<std::byte> FileRegion::read() const
    {
        return file_.read_at(offset_, static_cast<std::size_t>(length_));
    }

    void FileRegion::write(std::span<const std::byte> data) const
    {
        if (data.size() != length_)
        {
            throw std::invalid_argument("Region write does not match the region length");
        }
        file_.write_at(offset_, data);
    }

} // namespace nimbus::client
