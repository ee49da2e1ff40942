#ifndef S3_CLI_S3_TRANSPORT_HPP
#define S3_CLI_S3_TRANSPORT_HPP

// stdlib includes
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

// local includes
#include "http_client.hpp"
#include "s3_request_signer.hpp"
#include "s3_transfer_types.hpp"

namespace s3_cli::io::s3_transfer
{

    enum class outcome_kind
    {
        success,
        retryable_failure,
        fatal_failure
    };

    struct request_outcome
    {
        request_outcome()
            : kind{outcome_kind::success}
            , error{error_kind::none}
            , http_status{0}
            , attempts{0}
        {}

        bool ok() const { return outcome_kind::success == kind; }

        outcome_kind  kind;
        error_kind    error;
        unsigned int  http_status;   // 0 when no response was received
        std::string   s3_error_code; // <Code> from an S3 error body, if any
        std::string   message;
        int           attempts;
        http_response response;
    };

    // Called on every state change of a request's attempt state machine:
    // in_flight before each attempt, retry_scheduled after a retryable failure
    // (with the backoff delay), completed or failed once terminal.
    using attempt_observer = std::function<void(int                        _attempt,
                                                part_state                 _state,
                                                const request_outcome&     _outcome,
                                                std::chrono::milliseconds  _delay)>;

    // Checked before each attempt; returning false stops the retry loop.
    using continue_predicate = std::function<bool()>;

    // Inspects a 2xx response; returns an error message if the response is
    // unusable (for example a truncated body). Such responses are retried.
    using response_validator = std::function<std::optional<std::string>(const http_response&)>;

    /// Executes signed requests against the endpoint with a uniform retry and
    /// backoff policy.
    ///
    /// Every attempt is signed afresh so that retries late in a long transfer
    /// do not carry a stale x-amz-date. Instances are safe for concurrent use;
    /// all mutable connection state lives in the http_client.
    class s3_transport
    {
    public:

        s3_transport(std::shared_ptr<http_client> _client,
                     request_signer _signer,
                     retry_policy _default_policy = retry_policy{});

        s3_transport(const s3_transport&) = delete;
        auto operator=(const s3_transport&) -> s3_transport& = delete;

        // One attempt: sign, send, classify.
        auto execute_once(http_request& _request,
                          const response_validator& _validator = {}) const -> request_outcome;

        // Attempts until success, a fatal failure, exhaustion of the policy or
        // until _keep_going returns false.
        auto execute(http_request _request,
                     const retry_policy& _policy,
                     const attempt_observer& _observer = {},
                     const continue_predicate& _keep_going = {},
                     const response_validator& _validator = {}) const -> request_outcome;

        auto execute(http_request _request) const -> request_outcome
        {
            return execute(std::move(_request), default_policy_);
        }

        auto default_policy() const -> const retry_policy& { return default_policy_; }

        auto signer() const -> const request_signer& { return signer_; }

        // Maps an HTTP status to outcome and error kind.
        static auto classify(unsigned int _http_status) -> std::pair<outcome_kind, error_kind>;

    private:

        std::shared_ptr<http_client> client_;
        request_signer               signer_;
        retry_policy                 default_policy_;
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_S3_TRANSPORT_HPP
