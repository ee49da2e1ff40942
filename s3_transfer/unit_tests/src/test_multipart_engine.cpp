#include <catch2/catch.hpp>

#include "fake_s3_endpoint.hpp"
#include "multipart_engine.hpp"
#include "object_io.hpp"
#include "part_plan.hpp"
#include "s3_transfer_error.hpp"
#include "transfer_coordinator.hpp"
#include "transfer_session.hpp"

// stdlib includes
#include <vector>

// boost includes
#include <boost/filesystem.hpp>

using namespace s3_cli::io::s3_transfer;
using namespace s3_cli::test;

namespace
{
    const uint64_t MiB = constants::MEBIBYTE;

    auto make_request(transfer_direction _direction,
                      const std::string& _local_path,
                      uint64_t _part_size,
                      int _max_parallel,
                      int _max_attempts = 5) -> transfer_request
    {
        transfer_request request;
        request.direction          = _direction;
        request.bucket             = TEST_BUCKET;
        request.key                = "object.bin";
        request.local_path         = _local_path;
        request.part_size          = _part_size;
        request.max_parallel_parts = _max_parallel;
        request.retry_override     = fast_retry_policy(_max_attempts);
        return request;
    }

    auto part_error_kinds(const transfer_result& _result) -> std::vector<error_kind>
    {
        std::vector<error_kind> kinds;
        for (const auto& e : _result.part_errors) {
            kinds.push_back(e.kind);
        }
        return kinds;
    }
}

TEST_CASE("multipart upload of a large object", "[multipart_engine][upload]")
{
    scoped_temp_dir dir;
    const auto path = dir.file("large.bin");

    // sparse, nothing is held in memory beyond the parts in flight
    write_file(path, "");
    boost::filesystem::resize_file(path, 250 * MiB);

    auto fake = std::make_shared<fake_s3_endpoint>();
    fake->set_keep_payloads(false);

    transfer_coordinator coordinator{make_test_client(fake)};
    auto result = coordinator.run(make_request(transfer_direction::upload, path, 50 * MiB, 2));

    REQUIRE(result.state == session_state::completed);
    REQUIRE(result.error == error_kind::none);
    REQUIRE(result.bytes_transferred == 250 * MiB);
    REQUIRE(result.parts_total == 5);
    REQUIRE(result.parts_completed == 5);
    REQUIRE(result.multipart);
    REQUIRE(result.part_errors.empty());

    REQUIRE(fake->count("initiate") == 1);
    REQUIRE(fake->count("upload_part") == 5);
    REQUIRE(fake->count("complete") == 1);
    REQUIRE(fake->count("abort") == 0);
    REQUIRE(fake->object("object.bin")->size == 250 * MiB);
    REQUIRE(fake->open_uploads() == 0);
}

TEST_CASE("transient part failures are retried", "[multipart_engine][upload]")
{
    scoped_temp_dir dir;
    const auto path = dir.file("source.bin");
    const auto data = make_pattern(25 * MiB);
    write_file(path, data);

    auto fake = std::make_shared<fake_s3_endpoint>();
    transfer_coordinator coordinator{make_test_client(fake)};

    SECTION("503 three times then success within four attempts")
    {
        for (int attempt = 1; attempt <= 3; ++attempt) {
            fake->add_fault("upload_part", 3, attempt, status_fault(503));
        }

        auto result = coordinator.run(make_request(transfer_direction::upload, path, 5 * MiB, 3, 4));

        REQUIRE(result.state == session_state::completed);
        REQUIRE(fake->attempts("upload_part", 3) == 4);
        REQUIRE(fake->attempts("upload_part", 1) == 1);
        REQUIRE(fake->object("object.bin")->data == data);
    }

    SECTION("retries exhausted fail the transfer and abort the upload")
    {
        for (int attempt = 1; attempt <= 4; ++attempt) {
            fake->add_fault("upload_part", 1, attempt, status_fault(503));
        }

        auto result = coordinator.run(make_request(transfer_direction::upload, path, 5 * MiB, 1, 4));

        REQUIRE(result.state == session_state::failed);
        REQUIRE(result.error == error_kind::transient_network_error);
        REQUIRE(result.parts_completed == 0);
        REQUIRE(result.error_message.find("0 of 5 parts completed") == 0);
        REQUIRE(fake->attempts("upload_part", 1) == 4);
        REQUIRE(fake->count("abort") == 1);
        REQUIRE(fake->open_uploads() == 0);
        REQUIRE(result.part_errors.size() == 1);
        REQUIRE(result.part_errors[0].index == 1);
        REQUIRE(result.part_errors[0].attempts == 4);
    }

    SECTION("retried parts resend the same bytes and get the same etag")
    {
        fake->add_fault("upload_part", 3, 1, lost_response_fault());

        auto result = coordinator.run(make_request(transfer_direction::upload, path, 5 * MiB, 2));
        REQUIRE(result.state == session_state::completed);

        const auto digests = fake->uploaded_part_digests(3);
        REQUIRE(digests.size() == 2);
        REQUIRE(digests[0] == digests[1]);
        REQUIRE(digests[0] == md5_hex(data.substr(10 * MiB, 5 * MiB)));

        std::vector<std::string> part3_etags;
        for (const auto& [number, etag] : fake->uploaded_part_etags()) {
            if (3 == number) {
                part3_etags.push_back(etag);
            }
        }
        REQUIRE(part3_etags.size() == 2);
        REQUIRE(part3_etags[0] == part3_etags[1]);
        REQUIRE(fake->object("object.bin")->data == data);
    }
}

TEST_CASE("fatal part failure", "[multipart_engine][upload]")
{
    scoped_temp_dir dir;
    const auto path = dir.file("source.bin");
    write_file(path, make_pattern(25 * MiB));

    auto fake = std::make_shared<fake_s3_endpoint>();
    fake->add_fault("upload_part", 2, 1, status_fault(403));

    SECTION("the transfer fails and the upload is aborted once")
    {
        transfer_coordinator coordinator{make_test_client(fake)};
        auto result = coordinator.run(make_request(transfer_direction::upload, path, 5 * MiB, 1));

        REQUIRE(result.state == session_state::failed);
        REQUIRE(result.error == error_kind::partial_transfer_error);
        REQUIRE(result.parts_completed == 1);
        REQUIRE(result.parts_total == 5);
        REQUIRE(result.error_message.find("1 of 5 parts completed") == 0);
        REQUIRE(result.error_message.find("authentication_error") != std::string::npos);
        REQUIRE(part_error_kinds(result) == std::vector<error_kind>{error_kind::authentication_error});

        REQUIRE(fake->count("abort") == 1);
        REQUIRE(fake->count("complete") == 0);
        REQUIRE(fake->open_uploads() == 0);
        REQUIRE(fake->attempts("upload_part", 2) == 1);
        REQUIRE(coordinator.last_report().abort_requests == 1);
        REQUIRE_FALSE(coordinator.last_report().upload_id_retained);
    }

    SECTION("no part is dispatched after the failure")
    {
        auto client = make_test_client(fake);
        multipart_engine engine{client};

        auto request = make_request(transfer_direction::upload, path, 5 * MiB, 1);
        transfer_session session{make_part_plan(25 * MiB, 5 * MiB, transfer_direction::upload)};
        object_reader reader{path};

        auto report = engine.upload(request, session, reader, true);

        REQUIRE(session.state() == session_state::failed);
        REQUIRE(session.dispatch_count() == 2);
        REQUIRE(fake->count("upload_part") == 2);
        REQUIRE(fake->attempts("upload_part", 3) == 0);
        REQUIRE(report.abort_requests == 1);
        REQUIRE_FALSE(report.upload_id.empty());
    }

    SECTION("parallel workers still abort exactly once")
    {
        transfer_coordinator coordinator{make_test_client(fake)};
        auto result = coordinator.run(make_request(transfer_direction::upload, path, 5 * MiB, 5));

        REQUIRE(result.state == session_state::failed);
        REQUIRE(fake->count("abort") == 1);
        REQUIRE(fake->count("complete") == 0);
        REQUIRE(fake->open_uploads() == 0);
    }

    SECTION("a failing abort is not retried")
    {
        for (int attempt = 1; attempt <= 5; ++attempt) {
            fake->add_fault("abort", 0, attempt, status_fault(503));
        }

        transfer_coordinator coordinator{make_test_client(fake)};
        auto result = coordinator.run(make_request(transfer_direction::upload, path, 5 * MiB, 1, 5));

        REQUIRE(result.state == session_state::failed);
        REQUIRE(fake->count("abort") == 1);
        REQUIRE(fake->open_uploads() == 1);
        REQUIRE(coordinator.last_report().abort_requests == 1);
    }

    SECTION("the client's default policy does not retry the abort either")
    {
        fake->add_fault("abort", 0, 1, status_fault(503));

        auto request = make_request(transfer_direction::upload, path, 5 * MiB, 1);
        request.retry_override.reset();

        transfer_coordinator coordinator{make_test_client(fake, 5)};
        REQUIRE(coordinator.run(request).state == session_state::failed);
        REQUIRE(fake->count("abort") == 1);
    }
}

TEST_CASE("completion lists parts in ascending order", "[multipart_engine][upload]")
{
    scoped_temp_dir dir;
    const auto path = dir.file("source.bin");
    const auto data = make_pattern(25 * MiB);
    write_file(path, data);

    auto fake = std::make_shared<fake_s3_endpoint>();

    // the first parts finish last
    fake->add_fault("upload_part", 1, 1, delay_fault(std::chrono::milliseconds{150}));
    fake->add_fault("upload_part", 2, 1, delay_fault(std::chrono::milliseconds{100}));
    fake->add_fault("upload_part", 3, 1, delay_fault(std::chrono::milliseconds{50}));

    transfer_coordinator coordinator{make_test_client(fake)};
    auto result = coordinator.run(make_request(transfer_direction::upload, path, 5 * MiB, 5));

    REQUIRE(result.state == session_state::completed);

    const auto arrival = fake->uploaded_part_etags();
    REQUIRE(arrival.size() == 5);
    REQUIRE(arrival.front().first != 1);

    const auto lists = fake->completion_lists();
    REQUIRE(lists.size() == 1);
    REQUIRE(lists[0] == std::vector<int>{1, 2, 3, 4, 5});
    REQUIRE(fake->object("object.bin")->data == data);
}

TEST_CASE("single request path", "[multipart_engine]")
{
    scoped_temp_dir dir;
    auto fake = std::make_shared<fake_s3_endpoint>();
    transfer_coordinator coordinator{make_test_client(fake)};

    SECTION("small upload")
    {
        const auto path = dir.file("small.bin");
        const auto data = make_pattern(1 * MiB);
        write_file(path, data);

        auto request = make_request(transfer_direction::upload, path, 5 * MiB, 4);
        request.multipart_threshold = 5 * MiB;

        auto result = coordinator.run(request);
        REQUIRE(result.state == session_state::completed);
        REQUIRE_FALSE(result.multipart);
        REQUIRE(result.parts_total == 1);
        REQUIRE(result.bytes_transferred == 1 * MiB);
        REQUIRE(fake->count("initiate") == 0);
        REQUIRE(fake->count("put") == 1);
        REQUIRE(fake->object("object.bin")->data == data);
    }

    SECTION("empty upload")
    {
        const auto path = dir.file("empty.bin");
        write_file(path, "");

        auto result = coordinator.run(make_request(transfer_direction::upload, path, 5 * MiB, 4));
        REQUIRE(result.state == session_state::completed);
        REQUIRE(result.bytes_transferred == 0);
        REQUIRE(fake->count("initiate") == 0);
        REQUIRE(fake->object("object.bin")->size == 0);
    }

    SECTION("small download")
    {
        const auto data = make_pattern(1 * MiB);
        fake->put("object.bin", data);

        const auto path = dir.file("small.out");
        auto request = make_request(transfer_direction::download, path, 2 * MiB, 4);
        request.multipart_threshold = 5 * MiB;

        auto result = coordinator.run(request);
        REQUIRE(result.state == session_state::completed);
        REQUIRE_FALSE(result.multipart);
        REQUIRE(fake->count("head") == 1);
        REQUIRE(fake->count("get") == 1);
        REQUIRE(read_file(path) == data);
    }

    SECTION("empty download")
    {
        fake->put("object.bin", "");

        const auto path = dir.file("empty.out");
        auto result = coordinator.run(make_request(transfer_direction::download, path, 2 * MiB, 4));
        REQUIRE(result.state == session_state::completed);
        REQUIRE(boost::filesystem::exists(path));
        REQUIRE(boost::filesystem::file_size(path) == 0);
    }
}

TEST_CASE("multipart download", "[multipart_engine][download]")
{
    scoped_temp_dir dir;
    const auto path = dir.file("download.bin");
    const auto data = make_pattern(10 * MiB, 11);

    auto fake = std::make_shared<fake_s3_endpoint>();
    fake->put("object.bin", data);
    fake->set_download_part_size(2 * MiB);

    transfer_coordinator coordinator{make_test_client(fake)};
    auto request = make_request(transfer_direction::download, path, 2 * MiB, 3);

    SECTION("dropped connection on part 4")
    {
        fake->add_fault("get", 4, 1, network_fault());

        auto result = coordinator.run(request);

        REQUIRE(result.state == session_state::completed);
        REQUIRE(result.parts_total == 5);
        REQUIRE(result.bytes_transferred == 10 * MiB);
        REQUIRE(fake->attempts("get", 4) == 2);

        const auto local = read_file(path);
        REQUIRE(local.size() == data.size());
        REQUIRE(local.substr(6 * MiB, 2 * MiB) == data.substr(6 * MiB, 2 * MiB));
        REQUIRE(local == data);
    }

    SECTION("truncated part body is retried")
    {
        fake->add_fault("get", 2, 1, truncated_body_fault());

        auto result = coordinator.run(request);
        REQUIRE(result.state == session_state::completed);
        REQUIRE(fake->attempts("get", 2) == 2);
        REQUIRE(read_file(path) == data);
    }

    SECTION("object replaced during the download")
    {
        request.max_parallel_parts = 1;
        fake->set_request_hook([&fake](const std::string& _operation, int _part_number) {
            if ("get" == _operation && 2 == _part_number) {
                fake->put("object.bin", make_pattern(10 * MiB, 99));
            }
        });

        auto result = coordinator.run(request);

        REQUIRE(result.state == session_state::failed);
        REQUIRE(result.error == error_kind::partial_transfer_error);
        REQUIRE(result.parts_completed == 1);
        REQUIRE(part_error_kinds(result) == std::vector<error_kind>{error_kind::server_rejection_error});
        REQUIRE(result.part_errors[0].message.find("PreconditionFailed") != std::string::npos);
        REQUIRE(fake->attempts("get", 3) == 0);
    }

    SECTION("missing object")
    {
        request.key = "no-such-object";
        auto result = coordinator.run(request);

        REQUIRE(result.state == session_state::failed);
        REQUIRE(result.error == error_kind::server_rejection_error);
        REQUIRE(result.error_message.find("HeadObject") == 0);
        REQUIRE_FALSE(boost::filesystem::exists(path));
    }

    SECTION("progress is reported up to the object size")
    {
        std::mutex progress_mutex;
        std::vector<uint64_t> reported;
        auto result = coordinator.run(request, cancellation_token{},
                [&](uint64_t _done, uint64_t _total) {
                    std::lock_guard<std::mutex> lock(progress_mutex);
                    REQUIRE(_total == 10 * MiB);
                    reported.push_back(_done);
                });

        REQUIRE(result.state == session_state::completed);
        REQUIRE(reported.size() == 5);
        REQUIRE(std::is_sorted(reported.begin(), reported.end()));
        REQUIRE(reported.back() == 10 * MiB);
    }
}

TEST_CASE("cancellation", "[multipart_engine]")
{
    scoped_temp_dir dir;
    const auto path = dir.file("source.bin");
    write_file(path, make_pattern(25 * MiB));

    auto fake = std::make_shared<fake_s3_endpoint>();
    cancellation_token token;

    fake->set_request_hook([token](const std::string& _operation, int _part_number) {
        if ("upload_part" == _operation && 2 == _part_number) {
            token.cancel();
        }
    });

    transfer_coordinator coordinator{make_test_client(fake)};
    auto result = coordinator.run(make_request(transfer_direction::upload, path, 5 * MiB, 1), token);

    REQUIRE(result.state == session_state::cancelled);
    REQUIRE(result.error == error_kind::cancelled);
    REQUIRE(fake->count("upload_part") == 2);
    REQUIRE(fake->count("complete") == 0);
    REQUIRE(fake->count("abort") == 1);
    REQUIRE(fake->open_uploads() == 0);
}

TEST_CASE("request validation", "[transfer_coordinator]")
{
    scoped_temp_dir dir;
    auto fake = std::make_shared<fake_s3_endpoint>();
    transfer_coordinator coordinator{make_test_client(fake)};

    const auto source = dir.file("source.bin");
    write_file(source, "data");

    SECTION("empty key")
    {
        auto request = make_request(transfer_direction::upload, source, 5 * MiB, 1);
        request.key.clear();
        auto result = coordinator.run(request);
        REQUIRE(result.state == session_state::failed);
        REQUIRE(result.error == error_kind::configuration_error);
        REQUIRE(fake->count("put") == 0);
    }

    SECTION("missing upload source")
    {
        auto result = coordinator.run(make_request(transfer_direction::upload, dir.file("missing"), 5 * MiB, 1));
        REQUIRE(result.error == error_kind::configuration_error);
    }

    SECTION("download onto a directory")
    {
        fake->put("object.bin", "x");
        auto result = coordinator.run(make_request(transfer_direction::download, dir.path().string(), 5 * MiB, 1));
        REQUIRE(result.error == error_kind::configuration_error);
        REQUIRE(fake->count("head") == 0);
    }

    SECTION("download creates missing parent directories")
    {
        fake->put("object.bin", "x");
        const auto nested = dir.file("a/b/c/out.bin");
        auto result = coordinator.run(make_request(transfer_direction::download, nested, 5 * MiB, 1));
        REQUIRE(result.state == session_state::completed);
        REQUIRE(read_file(nested) == "x");
    }

    SECTION("bad worker count and part size")
    {
        auto request = make_request(transfer_direction::upload, source, 5 * MiB, 0);
        REQUIRE_THROWS_AS(transfer_coordinator::validate(request), configuration_error);

        request.max_parallel_parts = 1;
        request.part_size = 0;
        REQUIRE_THROWS_AS(transfer_coordinator::validate(request), configuration_error);

        request.part_size = 5 * MiB;
        request.retry_override->max_attempts = 0;
        REQUIRE_THROWS_AS(transfer_coordinator::validate(request), configuration_error);
    }
}
