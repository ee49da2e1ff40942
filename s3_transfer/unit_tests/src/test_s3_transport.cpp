#include <catch2/catch.hpp>

#include "fake_s3_endpoint.hpp"
#include "s3_transport.hpp"
#include "s3_transfer_util.hpp"

// stdlib includes
#include <deque>
#include <vector>

using namespace s3_cli::io::s3_transfer;
using namespace s3_cli::test;

namespace
{
    // Answers with a scripted sequence of statuses. A status of 0 throws a
    // connection reset instead of answering.
    class scripted_client : public http_client
    {
    public:
        explicit scripted_client(std::deque<unsigned int> _statuses)
            : statuses_{std::move(_statuses)}
        {}

        auto perform(const http_request& _request) -> http_response override
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(_request);

            const unsigned int status = statuses_.empty() ? 200 : statuses_.front();
            if (!statuses_.empty()) {
                statuses_.pop_front();
            }
            if (0 == status) {
                throw boost::system::system_error{boost::asio::error::connection_reset};
            }

            http_response response;
            response.status = status;
            if (status >= 300) {
                response.body = fmt::format("<Error><Code>Code{}</Code><Message>failed</Message></Error>", status);
            }
            return response;
        }

        auto requests() const -> std::vector<http_request>
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return requests_;
        }

    private:
        mutable std::mutex        mutex_;
        std::deque<unsigned int>  statuses_;
        std::vector<http_request> requests_;
    };

    auto make_transport(std::shared_ptr<http_client> _client, int _max_attempts = 5) -> s3_transport
    {
        return s3_transport{std::move(_client),
                            request_signer{credentials{TEST_ACCESS_KEY, TEST_SECRET_KEY, ""}, "us-east-1"},
                            fast_retry_policy(_max_attempts)};
    }

    auto simple_get() -> http_request
    {
        http_request request;
        request.scheme = "http";
        request.host   = "fake.s3.local";
        request.port   = 80;
        request.path   = "/test-bucket/key";
        return request;
    }
}

TEST_CASE("status classification", "[s3_transport]")
{
    using result = std::pair<outcome_kind, error_kind>;

    REQUIRE(s3_transport::classify(200) == result{outcome_kind::success, error_kind::none});
    REQUIRE(s3_transport::classify(204) == result{outcome_kind::success, error_kind::none});
    REQUIRE(s3_transport::classify(206) == result{outcome_kind::success, error_kind::none});

    for (unsigned int status : {429u, 500u, 502u, 503u, 504u}) {
        REQUIRE(s3_transport::classify(status) == result{outcome_kind::retryable_failure, error_kind::transient_network_error});
    }

    REQUIRE(s3_transport::classify(401) == result{outcome_kind::fatal_failure, error_kind::authentication_error});
    REQUIRE(s3_transport::classify(403) == result{outcome_kind::fatal_failure, error_kind::authentication_error});

    for (unsigned int status : {400u, 404u, 409u, 412u, 416u, 501u}) {
        REQUIRE(s3_transport::classify(status) == result{outcome_kind::fatal_failure, error_kind::server_rejection_error});
    }
}

TEST_CASE("retry loop", "[s3_transport]")
{
    SECTION("transient failures are retried until success")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{503, 0, 500, 200});
        auto transport = make_transport(client);

        auto outcome = transport.execute(simple_get());
        REQUIRE(outcome.ok());
        REQUIRE(outcome.attempts == 4);
        REQUIRE(outcome.http_status == 200);
        REQUIRE(client->requests().size() == 4);
    }

    SECTION("fatal failures are not retried")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{404, 200});
        auto transport = make_transport(client);

        auto outcome = transport.execute(simple_get());
        REQUIRE(outcome.kind == outcome_kind::fatal_failure);
        REQUIRE(outcome.error == error_kind::server_rejection_error);
        REQUIRE(outcome.attempts == 1);
        REQUIRE(outcome.s3_error_code == "Code404");
        REQUIRE(client->requests().size() == 1);
    }

    SECTION("authentication failures are not retried")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{403});
        auto transport = make_transport(client);

        auto outcome = transport.execute(simple_get());
        REQUIRE(outcome.error == error_kind::authentication_error);
        REQUIRE(outcome.attempts == 1);
    }

    SECTION("attempts are bounded by the policy")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{503, 503, 503, 503, 503, 503});
        auto transport = make_transport(client, 3);

        auto outcome = transport.execute(simple_get());
        REQUIRE(outcome.kind == outcome_kind::retryable_failure);
        REQUIRE(outcome.error == error_kind::transient_network_error);
        REQUIRE(outcome.attempts == 3);
        REQUIRE(client->requests().size() == 3);
        REQUIRE(outcome.message.find("giving up after 3 attempts") != std::string::npos);
    }

    SECTION("a policy without the kind in its retryable set does not retry")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{503, 200});
        auto transport = make_transport(client);

        auto policy = fast_retry_policy(5);
        policy.retryable_kinds.clear();

        auto outcome = transport.execute(simple_get(), policy);
        REQUIRE_FALSE(outcome.ok());
        REQUIRE(outcome.attempts == 1);
    }

    SECTION("network errors are transient")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{0});
        auto transport = make_transport(client);

        http_request request = simple_get();
        auto outcome = transport.execute_once(request);
        REQUIRE(outcome.kind == outcome_kind::retryable_failure);
        REQUIRE(outcome.error == error_kind::transient_network_error);
        REQUIRE(outcome.http_status == 0);
        REQUIRE(outcome.message.find("network error") == 0);
    }

    SECTION("every attempt is signed")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{500, 200});
        auto transport = make_transport(client);

        transport.execute(simple_get());
        for (const auto& request : client->requests()) {
            REQUIRE(request.headers.count("authorization") == 1);
            REQUIRE(request.headers.count("x-amz-date") == 1);
        }
    }
}

TEST_CASE("attempt observer and continuation", "[s3_transport]")
{
    SECTION("observer sees every state change")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{503, 200});
        auto transport = make_transport(client);

        std::vector<std::pair<int, part_state>> seen;
        auto outcome = transport.execute(simple_get(), fast_retry_policy(5),
                [&seen](int _attempt, part_state _state, const request_outcome&, std::chrono::milliseconds) {
                    seen.emplace_back(_attempt, _state);
                });

        REQUIRE(outcome.ok());
        const std::vector<std::pair<int, part_state>> expected{
            {1, part_state::in_flight},
            {1, part_state::retry_scheduled},
            {2, part_state::in_flight},
            {2, part_state::completed}};
        REQUIRE(seen == expected);
    }

    SECTION("retry delay is reported to the observer")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{503, 200});
        auto transport = make_transport(client);

        std::chrono::milliseconds reported{-1};
        transport.execute(simple_get(), fast_retry_policy(5),
                [&reported](int, part_state _state, const request_outcome&, std::chrono::milliseconds _delay) {
                    if (part_state::retry_scheduled == _state) {
                        reported = _delay;
                    }
                });
        REQUIRE(reported.count() >= 1);
        REQUIRE(reported.count() <= 5);
    }

    SECTION("continue predicate stops before the next attempt")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{503, 503, 200});
        auto transport = make_transport(client);

        int checks = 0;
        auto outcome = transport.execute(simple_get(), fast_retry_policy(5), {},
                [&checks] { return ++checks < 2; });

        REQUIRE(outcome.error == error_kind::cancelled);
        REQUIRE(outcome.kind == outcome_kind::fatal_failure);
        REQUIRE(outcome.attempts == 1);
        REQUIRE(client->requests().size() == 1);
    }

    SECTION("continue predicate false from the start sends nothing")
    {
        auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{});
        auto transport = make_transport(client);

        auto outcome = transport.execute(simple_get(), fast_retry_policy(5), {}, [] { return false; });
        REQUIRE(outcome.error == error_kind::cancelled);
        REQUIRE(outcome.attempts == 0);
        REQUIRE(client->requests().empty());
    }
}

TEST_CASE("response validation", "[s3_transport]")
{
    auto client = std::make_shared<scripted_client>(std::deque<unsigned int>{200, 200, 200});
    auto transport = make_transport(client);

    int calls = 0;
    const response_validator validator = [&calls](const http_response&) -> std::optional<std::string> {
        if (++calls < 3) {
            return std::string{"body too short"};
        }
        return std::nullopt;
    };

    SECTION("rejected 2xx responses are retried")
    {
        auto outcome = transport.execute(simple_get(), fast_retry_policy(5), {}, {}, validator);
        REQUIRE(outcome.ok());
        REQUIRE(outcome.attempts == 3);
    }

    SECTION("a rejected response is transient")
    {
        http_request request = simple_get();
        auto outcome = transport.execute_once(request, validator);
        REQUIRE(outcome.kind == outcome_kind::retryable_failure);
        REQUIRE(outcome.error == error_kind::transient_network_error);
        REQUIRE(outcome.message == "body too short");
    }
}

TEST_CASE("backoff delay", "[s3_transport]")
{
    retry_policy policy;
    policy.base_delay         = std::chrono::milliseconds{100};
    policy.backoff_multiplier = 2.0;
    policy.max_delay          = std::chrono::milliseconds{1000};
    policy.jitter_min         = std::chrono::milliseconds{0};
    policy.jitter_max         = std::chrono::milliseconds{0};

    SECTION("grows geometrically")
    {
        REQUIRE(compute_backoff_delay(policy, 1).count() == 100);
        REQUIRE(compute_backoff_delay(policy, 2).count() == 200);
        REQUIRE(compute_backoff_delay(policy, 3).count() == 400);
        REQUIRE(compute_backoff_delay(policy, 4).count() == 800);
    }

    SECTION("is capped")
    {
        REQUIRE(compute_backoff_delay(policy, 5).count() == 1000);
        REQUIRE(compute_backoff_delay(policy, 30).count() == 1000);
    }

    SECTION("jitter stays within its bounds")
    {
        policy.jitter_min = std::chrono::milliseconds{10};
        policy.jitter_max = std::chrono::milliseconds{50};
        for (int i = 0; i < 100; ++i) {
            const auto delay = compute_backoff_delay(policy, 1).count();
            REQUIRE(delay >= 110);
            REQUIRE(delay <= 150);
        }
    }
}
