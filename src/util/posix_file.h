#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "chatarc/status.h"

namespace chatarc::util
{

    class PosixFile
    {
    public:
        PosixFile() = default;
        ~PosixFile();

        PosixFile(const PosixFile &) = delete;
        PosixFile &operator=(const PosixFile &) = delete;
        PosixFile(PosixFile &&other) noexcept;
        PosixFile &operator=(PosixFile &&other) noexcept;

        // Fails with kAlreadyExists if `path` is already present.
        static chatarc::Status CreateExclusive(const std::string &path, PosixFile *out);
        static chatarc::Status OpenRead(const std::string &path, PosixFile *out);
        static chatarc::Status OpenReadWrite(const std::string &path, PosixFile *out);
        // O_APPEND on an existing file; every Append lands at the current end.
        static chatarc::Status OpenAppend(const std::string &path, PosixFile *out);

        chatarc::Status PWrite(std::uint64_t off, const void *data, std::size_t n);
        chatarc::Status Append(const void *data, std::size_t n);
        chatarc::Status ReadAt(std::uint64_t off, void *data, std::size_t n, std::size_t *out_read);
        chatarc::Status Size(std::uint64_t *out) const;

        chatarc::Status SyncData();
        chatarc::Status Close();


    private:
        explicit PosixFile(int fd) : fd_(fd) {}
        int fd_ = -1;
    };

} // namespace chatarc::util
