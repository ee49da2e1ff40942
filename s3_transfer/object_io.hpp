#ifndef S3_CLI_OBJECT_IO_HPP
#define S3_CLI_OBJECT_IO_HPP

// stdlib includes
#include <cstdint>
#include <ctime>
#include <string>

namespace s3_cli::io::s3_transfer
{

    struct local_file_info
    {
        uint64_t    size;
        std::time_t last_modified;
    };

    // Throws local_io_error if the path cannot be stat'ed or is not a regular file.
    auto stat_local_file(const std::string& _path) -> local_file_info;

    /// Read-only handle on a local file with positional reads.
    ///
    /// Reads use pread() so that any number of workers may share one instance
    /// without coordinating a file cursor.
    class object_reader
    {
    public:

        explicit object_reader(const std::string& _path);
        ~object_reader();

        object_reader(const object_reader&) = delete;
        auto operator=(const object_reader&) -> object_reader& = delete;

        // Reads exactly [_offset, _offset + _length). Throws local_io_error on
        // failure or if the file is shorter than requested.
        auto read(uint64_t _offset, uint64_t _length) const -> std::string;

        auto size() const -> uint64_t { return size_; }
        auto path() const -> const std::string& { return path_; }

    private:

        std::string path_;
        int         fd_;
        uint64_t    size_;
    };

    /// Write handle on a local file with positional writes.
    ///
    /// Writes use pwrite() at absolute offsets, so parts may complete and be
    /// written in any order by concurrent workers.
    class object_writer
    {
    public:

        // Creates the file if needed. When _truncate is set the file is
        // truncated and then sized to _size; otherwise existing bytes are kept
        // (resumed downloads) and the file is only extended to _size.
        object_writer(const std::string& _path, uint64_t _size, bool _truncate);
        ~object_writer();

        object_writer(const object_writer&) = delete;
        auto operator=(const object_writer&) -> object_writer& = delete;

        // Throws local_io_error on failure or short write.
        void write(uint64_t _offset, const std::string& _data) const;

        // fsync(); throws local_io_error.
        void flush() const;

        auto path() const -> const std::string& { return path_; }

    private:

        std::string path_;
        int         fd_;
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_OBJECT_IO_HPP
