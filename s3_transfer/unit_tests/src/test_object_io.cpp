#include <catch2/catch.hpp>

#include "fake_s3_endpoint.hpp"
#include "object_io.hpp"
#include "s3_transfer_error.hpp"

// stdlib includes
#include <thread>
#include <vector>

using namespace s3_cli::io::s3_transfer;
using namespace s3_cli::test;

TEST_CASE("object reader", "[object_io]")
{
    scoped_temp_dir dir;
    const auto path = dir.file("source.bin");
    const auto data = make_pattern(10000);
    write_file(path, data);

    object_reader reader{path};
    REQUIRE(reader.size() == 10000);

    SECTION("positional reads")
    {
        REQUIRE(reader.read(0, 10) == data.substr(0, 10));
        REQUIRE(reader.read(9990, 10) == data.substr(9990, 10));
        REQUIRE(reader.read(5000, 0).empty());
    }

    SECTION("reading past the end fails")
    {
        REQUIRE_THROWS_AS(reader.read(9995, 10), local_io_error);
    }

    SECTION("concurrent readers share one handle")
    {
        std::vector<std::thread> threads;
        std::vector<std::string> chunks(10);
        for (int i = 0; i < 10; ++i) {
            threads.emplace_back([&reader, &chunks, i] { chunks[i] = reader.read(i * 1000, 1000); });
        }
        for (auto& t : threads) {
            t.join();
        }
        std::string joined;
        for (const auto& chunk : chunks) {
            joined += chunk;
        }
        REQUIRE(joined == data);
    }

    SECTION("stat")
    {
        auto info = stat_local_file(path);
        REQUIRE(info.size == 10000);
        REQUIRE(info.last_modified > 0);
    }
}

TEST_CASE("object reader errors", "[object_io]")
{
    scoped_temp_dir dir;

    REQUIRE_THROWS_AS(object_reader{dir.file("missing")}, local_io_error);
    REQUIRE_THROWS_AS(stat_local_file(dir.file("missing")), local_io_error);
    REQUIRE_THROWS_AS(stat_local_file(dir.path().string()), local_io_error);
}

TEST_CASE("object writer", "[object_io]")
{
    scoped_temp_dir dir;
    const auto path = dir.file("dest.bin");

    SECTION("parts written out of order land at their offsets")
    {
        const auto data = make_pattern(3000);
        {
            object_writer writer{path, 3000, true};
            writer.write(2000, data.substr(2000, 1000));
            writer.write(0, data.substr(0, 1000));
            writer.write(1000, data.substr(1000, 1000));
            writer.flush();
        }
        REQUIRE(read_file(path) == data);
    }

    SECTION("file is sized up front")
    {
        {
            object_writer writer{path, 4096, true};
        }
        REQUIRE(stat_local_file(path).size == 4096);
    }

    SECTION("truncation replaces existing content")
    {
        write_file(path, std::string(100, 'x'));
        {
            object_writer writer{path, 10, true};
            writer.write(0, "0123456789");
        }
        REQUIRE(read_file(path) == "0123456789");
    }

    SECTION("without truncation existing bytes are kept")
    {
        write_file(path, "abcdefghij");
        {
            object_writer writer{path, 10, false};
            writer.write(5, "VWXYZ");
        }
        REQUIRE(read_file(path) == "abcdeVWXYZ");
    }

    SECTION("unwritable location")
    {
        REQUIRE_THROWS_AS((object_writer{dir.file("no/such/dir/file"), 10, true}), local_io_error);
    }
}
