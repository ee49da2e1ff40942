#ifndef S3_CLI_CANCELLATION_TOKEN_HPP
#define S3_CLI_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <memory>

namespace s3_cli::io::s3_transfer
{

    /// Shared cancellation flag. Copies observe the same flag, so one copy can
    /// be handed to a transfer while another is kept by whoever may cancel it.
    class cancellation_token
    {
    public:

        cancellation_token()
            : flag_{std::make_shared<std::atomic<bool>>(false)}
        {}

        void cancel() const noexcept { flag_->store(true); }

        bool is_cancelled() const noexcept { return flag_->load(); }

    private:

        std::shared_ptr<std::atomic<bool>> flag_;
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_CANCELLATION_TOKEN_HPP
