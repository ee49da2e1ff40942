#include "object_io.hpp"
#include "s3_transfer_error.hpp"

// stdlib includes
#include <cerrno>
#include <cstring>

// system includes
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

// other includes
#include <fmt/format.h>

namespace s3_cli::io::s3_transfer
{

    namespace
    {
        auto errno_message(const std::string& _what, const std::string& _path) -> std::string
        {
            return fmt::format("{} [{}]: {}", _what, _path, std::strerror(errno));
        }
    } // anonymous namespace

    auto stat_local_file(const std::string& _path) -> local_file_info
    {
        struct stat statbuf;
        if (::stat(_path.c_str(), &statbuf) != 0) {
            throw local_io_error{errno_message("cannot stat local file", _path)};
        }
        if (!S_ISREG(statbuf.st_mode)) {
            throw local_io_error{fmt::format("not a regular file [{}]", _path)};
        }
        return {static_cast<uint64_t>(statbuf.st_size), statbuf.st_mtime};
    }

    object_reader::object_reader(const std::string& _path)
        : path_{_path}
        , fd_{::open(_path.c_str(), O_RDONLY | O_CLOEXEC)}
        , size_{0}
    {
        if (fd_ < 0) {
            throw local_io_error{errno_message("cannot open file for reading", path_)};
        }

        struct stat statbuf;
        if (::fstat(fd_, &statbuf) != 0) {
            const auto msg = errno_message("cannot stat file", path_);
            ::close(fd_);
            throw local_io_error{msg};
        }
        size_ = static_cast<uint64_t>(statbuf.st_size);
    }

    object_reader::~object_reader()
    {
        ::close(fd_);
    }

    auto object_reader::read(uint64_t _offset, uint64_t _length) const -> std::string
    {
        std::string buffer(_length, '\0');
        uint64_t done = 0;

        while (done < _length) {
            const auto got = ::pread(fd_, &buffer[done], _length - done, static_cast<off_t>(_offset + done));
            if (got < 0) {
                if (EINTR == errno) {
                    continue;
                }
                throw local_io_error{errno_message(fmt::format("read of {} bytes at offset {} failed", _length, _offset), path_)};
            }
            if (0 == got) {
                throw local_io_error{fmt::format("unexpected end of file at offset {} (wanted {} bytes) [{}]",
                            _offset + done, _length, path_)};
            }
            done += static_cast<uint64_t>(got);
        }

        return buffer;
    }

    object_writer::object_writer(const std::string& _path, uint64_t _size, bool _truncate)
        : path_{_path}
        , fd_{::open(_path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC | (_truncate ? O_TRUNC : 0), 0644)}
    {
        if (fd_ < 0) {
            throw local_io_error{errno_message("cannot open file for writing", path_)};
        }

        struct stat statbuf;
        if (::fstat(fd_, &statbuf) != 0) {
            const auto msg = errno_message("cannot stat file", path_);
            ::close(fd_);
            throw local_io_error{msg};
        }

        // Size the file up front so that a full disk shows up here rather than
        // halfway through the transfer.
        if (static_cast<uint64_t>(statbuf.st_size) != _size) {
            if (::ftruncate(fd_, static_cast<off_t>(_size)) != 0) {
                const auto msg = errno_message(fmt::format("cannot size file to {} bytes", _size), path_);
                ::close(fd_);
                throw local_io_error{msg};
            }
        }
    }

    object_writer::~object_writer()
    {
        ::close(fd_);
    }

    void object_writer::write(uint64_t _offset, const std::string& _data) const
    {
        uint64_t done = 0;

        while (done < _data.size()) {
            const auto wrote = ::pwrite(fd_, _data.data() + done, _data.size() - done,
                    static_cast<off_t>(_offset + done));
            if (wrote < 0) {
                if (EINTR == errno) {
                    continue;
                }
                throw local_io_error{errno_message(fmt::format("write of {} bytes at offset {} failed",
                                _data.size(), _offset), path_)};
            }
            if (0 == wrote) {
                throw local_io_error{fmt::format("no progress writing at offset {} [{}]", _offset + done, path_)};
            }
            done += static_cast<uint64_t>(wrote);
        }
    }

    void object_writer::flush() const
    {
        if (::fsync(fd_) != 0) {
            throw local_io_error{errno_message("fsync failed", path_)};
        }
    }

} // s3_cli::io::s3_transfer
