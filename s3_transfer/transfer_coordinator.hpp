#ifndef S3_CLI_TRANSFER_COORDINATOR_HPP
#define S3_CLI_TRANSFER_COORDINATOR_HPP

// stdlib includes
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// local includes
#include "cancellation_token.hpp"
#include "multipart_engine.hpp"
#include "resume_record.hpp"
#include "s3_client.hpp"
#include "s3_transfer_types.hpp"
#include "transfer_session.hpp"

namespace s3_cli::io::s3_transfer
{

    /// Entry point for one transfer: validates the request, discovers the
    /// object size, plans the parts, decides whether to resume, runs the
    /// engine and reports a transfer_result.
    ///
    /// run() blocks until the transfer is terminal and never throws; every
    /// failure is reported in the result. Retries happen below this layer
    /// only.
    class transfer_coordinator
    {
    public:

        // Without a resume store no progress is persisted and failed uploads
        // are always aborted.
        transfer_coordinator(std::shared_ptr<s3_client> _client,
                             std::shared_ptr<resume_store> _resume_store = nullptr);

        auto run(const transfer_request& _request,
                 cancellation_token _cancel = cancellation_token{},
                 transfer_session::progress_callback _progress = {}) const -> transfer_result;

        // Throws configuration_error.
        static void validate(const transfer_request& _request);

        // Report of the last run, for callers interested in the engine's
        // remote side effects.
        auto last_report() const -> engine_report;

    private:

        auto run_upload(const transfer_request& _request,
                        const cancellation_token& _cancel,
                        const transfer_session::progress_callback& _progress) const -> transfer_result;

        auto run_download(const transfer_request& _request,
                          const cancellation_token& _cancel,
                          const transfer_session::progress_callback& _progress) const -> transfer_result;

        auto make_result(const transfer_session& _session,
                         const engine_report& _report) const -> transfer_result;

        std::shared_ptr<s3_client>    client_;
        std::shared_ptr<resume_store> resume_store_;
        multipart_engine              engine_;

        mutable std::mutex            report_mutex_;
        mutable engine_report         last_report_;
    };

    // Failed result that never reached the engine.
    auto make_failed_result(error_kind _kind, const std::string& _message) -> transfer_result;

} // s3_cli::io::s3_transfer

#endif // S3_CLI_TRANSFER_COORDINATOR_HPP
