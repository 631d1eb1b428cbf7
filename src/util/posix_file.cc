#include "util/posix_file.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace chatarc::util
{

    static chatarc::Status Err(std::string_view what, const std::string &path = {})
    {
        const int saved = errno;
        std::string msg(what);
        if (!path.empty())
            msg += " " + path;
        msg += ": ";
        msg += std::strerror(saved);
        if (saved == EEXIST)
            return chatarc::Status::AlreadyExists(msg);
        return chatarc::Status::IOError(msg);
    }

    PosixFile::PosixFile(PosixFile &&other) noexcept : fd_(other.fd_)
    {
        other.fd_ = -1;
    }

    PosixFile &PosixFile::operator=(PosixFile &&other) noexcept
    {
        if (this != &other)
        {
            (void)Close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    PosixFile::~PosixFile() { (void)Close(); }

    chatarc::Status PosixFile::CreateExclusive(const std::string &path, PosixFile *out)
    {
        int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_RDWR, 0644);
        if (fd < 0)
            return Err("create", path);
        *out = PosixFile(fd);
        return chatarc::Status::Ok();
    }

    chatarc::Status PosixFile::OpenRead(const std::string &path, PosixFile *out)
    {
        int fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0)
            return Err("open", path);
        *out = PosixFile(fd);
        return chatarc::Status::Ok();
    }

    chatarc::Status PosixFile::OpenReadWrite(const std::string &path, PosixFile *out)
    {
        int fd = ::open(path.c_str(), O_RDWR);
        if (fd < 0)
            return Err("open", path);
        *out = PosixFile(fd);
        return chatarc::Status::Ok();
    }

    chatarc::Status PosixFile::OpenAppend(const std::string &path, PosixFile *out)
    {
        int fd = ::open(path.c_str(), O_WRONLY | O_APPEND);
        if (fd < 0)
            return Err("open", path);
        *out = PosixFile(fd);
        return chatarc::Status::Ok();
    }

    chatarc::Status PosixFile::PWrite(std::uint64_t off, const void *data, std::size_t n)
    {
        const std::uint8_t *p = static_cast<const std::uint8_t *>(data);
        std::size_t done = 0;
        while (done < n)
        {
            ssize_t w = ::pwrite(fd_, p + done, n - done, static_cast<off_t>(off + done));
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                return Err("pwrite");
            }
            if (w == 0)
                return chatarc::Status::IOError("pwrite: wrote 0 bytes");
            done += static_cast<std::size_t>(w);
        }
        return chatarc::Status::Ok();
    }

    chatarc::Status PosixFile::Append(const void *data, std::size_t n)
    {
        const std::uint8_t *p = static_cast<const std::uint8_t *>(data);
        std::size_t done = 0;
        while (done < n)
        {
            ssize_t w = ::write(fd_, p + done, n - done);
            if (w < 0)
            {
                if (errno == EINTR)
                    continue;
                return Err("write");
            }
            if (w == 0)
                return chatarc::Status::IOError("write: wrote 0 bytes");
            done += static_cast<std::size_t>(w);
        }
        return chatarc::Status::Ok();
    }

    chatarc::Status PosixFile::ReadAt(std::uint64_t off, void *data, std::size_t n, std::size_t *out_read)
    {
        std::uint8_t *p = static_cast<std::uint8_t *>(data);
        std::size_t done = 0;
        while (done < n)
        {
            ssize_t r = ::pread(fd_, p + done, n - done, static_cast<off_t>(off + done));
            if (r < 0)
            {
                if (errno == EINTR)
                    continue;
                return Err("pread");
            }
            if (r == 0)
                break;
            done += static_cast<std::size_t>(r);
        }
        *out_read = done;
        return chatarc::Status::Ok();
    }

    chatarc::Status PosixFile::Size(std::uint64_t *out) const
    {
        struct stat st;
        if (::fstat(fd_, &st) != 0)
            return Err("fstat");
        *out = static_cast<std::uint64_t>(st.st_size);
        return chatarc::Status::Ok();
    }

    chatarc::Status PosixFile::SyncData()
    {
        if (::fdatasync(fd_) != 0)
            return Err("fdatasync");
        return chatarc::Status::Ok();
    }

    chatarc::Status PosixFile::Close()
    {
        if (fd_ >= 0)
        {
            int r;
            do
            {
                r = ::close(fd_);
            } while (r != 0 && errno == EINTR);
            fd_ = -1;
            if (r != 0)
                return Err("close");
        }
        return chatarc::Status::Ok();
    }

} // namespace chatarc::util
