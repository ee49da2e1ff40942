#include "s3_transport.hpp"
#include "s3_transfer_util.hpp"
#include "s3_xml.hpp"
#include "log.hpp"

// stdlib includes
#include <algorithm>

// boost includes
#include <boost/system/system_error.hpp>

// other includes
#include <fmt/format.h>

namespace s3_cli::io::s3_transfer
{

    s3_transport::s3_transport(std::shared_ptr<http_client> _client,
                               request_signer _signer,
                               retry_policy _default_policy)
        : client_{std::move(_client)}
        , signer_{std::move(_signer)}
        , default_policy_{std::move(_default_policy)}
    {
    }

    auto s3_transport::classify(unsigned int _http_status) -> std::pair<outcome_kind, error_kind>
    {
        if (_http_status >= 200 && _http_status < 300) {
            return {outcome_kind::success, error_kind::none};
        }

        switch (_http_status) {
            case 429:
            case 500:
            case 502:
            case 503:
            case 504:
                return {outcome_kind::retryable_failure, error_kind::transient_network_error};

            case 401:
            case 403:
                return {outcome_kind::fatal_failure, error_kind::authentication_error};

            default:
                return {outcome_kind::fatal_failure, error_kind::server_rejection_error};
        }
    }

    auto s3_transport::execute_once(http_request& _request,
                                    const response_validator& _validator) const -> request_outcome
    {
        request_outcome outcome;

        signer_.sign(_request);

        try {
            outcome.response = client_->perform(_request);
        }
        catch (const boost::system::system_error& e) {
            outcome.kind    = outcome_kind::retryable_failure;
            outcome.error   = error_kind::transient_network_error;
            outcome.message = fmt::format("network error: {}", e.what());
            return outcome;
        }

        outcome.http_status = outcome.response.status;

        const auto [kind, error] = classify(outcome.http_status);
        outcome.kind  = kind;
        outcome.error = error;

        if (outcome.ok()) {
            if (_validator) {
                if (auto problem = _validator(outcome.response)) {
                    outcome.kind    = outcome_kind::retryable_failure;
                    outcome.error   = error_kind::transient_network_error;
                    outcome.message = *problem;
                }
            }
            return outcome;
        }

        if (auto details = parse_error(outcome.response.body)) {
            outcome.s3_error_code = details->code;
            outcome.message = fmt::format("HTTP {} {}: {}", outcome.http_status, details->code, details->message);
        } else {
            outcome.message = fmt::format("HTTP {}", outcome.http_status);
        }

        return outcome;
    }

    auto s3_transport::execute(http_request _request,
                               const retry_policy& _policy,
                               const attempt_observer& _observer,
                               const continue_predicate& _keep_going,
                               const response_validator& _validator) const -> request_outcome
    {
        const auto notify = [&_observer](int _attempt, part_state _state,
                                         const request_outcome& _outcome, std::chrono::milliseconds _delay) {
            if (_observer) {
                _observer(_attempt, _state, _outcome, _delay);
            }
        };

        const int max_attempts = std::max(1, _policy.max_attempts);

        request_outcome outcome;
        part_state state = part_state::pending;
        int attempt = 0;

        for (;;) {
            switch (state) {

                case part_state::pending:
                case part_state::retry_scheduled:
                {
                    if (_keep_going && !_keep_going()) {
                        outcome.kind    = outcome_kind::fatal_failure;
                        outcome.error   = error_kind::cancelled;
                        outcome.message = "request abandoned before attempt " + std::to_string(attempt + 1);
                        outcome.attempts = attempt;
                        state = part_state::failed;
                        break;
                    }

                    ++attempt;
                    notify(attempt, part_state::in_flight, outcome, std::chrono::milliseconds{0});
                    state = part_state::in_flight;
                    break;
                }

                case part_state::in_flight:
                {
                    outcome = execute_once(_request, _validator);
                    outcome.attempts = attempt;

                    if (outcome.ok()) {
                        state = part_state::completed;
                        break;
                    }

                    const bool may_retry = outcome_kind::retryable_failure == outcome.kind
                        && _policy.is_retryable(outcome.error)
                        && attempt < max_attempts;

                    if (!may_retry) {
                        if (outcome_kind::retryable_failure == outcome.kind) {
                            outcome.message = fmt::format("{} (giving up after {} attempts)", outcome.message, attempt);
                        }
                        state = part_state::failed;
                        break;
                    }

                    const auto delay = compute_backoff_delay(_policy, attempt);
                    log::debug(__FILE__, __LINE__, __FUNCTION__,
                            fmt::format("{} {} attempt {} failed [{}], retrying in {} ms",
                                _request.method, _request.path, attempt, outcome.message, delay.count()));
                    notify(attempt, part_state::retry_scheduled, outcome, delay);
                    s3_sleep(delay);
                    state = part_state::retry_scheduled;
                    break;
                }

                case part_state::completed:
                case part_state::failed:
                {
                    notify(attempt, state, outcome, std::chrono::milliseconds{0});
                    return outcome;
                }
            }
        }
    }

} // s3_cli::io::s3_transfer
