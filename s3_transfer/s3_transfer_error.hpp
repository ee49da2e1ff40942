#ifndef S3_CLI_S3_TRANSFER_ERROR_HPP
#define S3_CLI_S3_TRANSFER_ERROR_HPP

#include "s3_transfer_types.hpp"

#include <stdexcept>
#include <string>

namespace s3_cli::io::s3_transfer
{

    /// Base class of the exceptions thrown by this library. Carries the error
    /// kind reported in a transfer_result.
    class s3_transfer_error
        : public std::runtime_error
    {
    public:
        s3_transfer_error(error_kind _kind, const std::string& _what)
            : std::runtime_error{_what}
            , kind_{_kind}
        {}

        auto kind() const noexcept -> error_kind { return kind_; }

    private:
        error_kind kind_;
    };

    /// Invalid request parameters or configuration values.
    class configuration_error
        : public s3_transfer_error
    {
    public:
        explicit configuration_error(const std::string& _what)
            : s3_transfer_error{error_kind::configuration_error, _what}
        {}
    };

    /// Failure reading or writing the local file.
    class local_io_error
        : public s3_transfer_error
    {
    public:
        explicit local_io_error(const std::string& _what)
            : s3_transfer_error{error_kind::local_io_error, _what}
        {}
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_S3_TRANSFER_ERROR_HPP
