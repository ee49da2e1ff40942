#include "s3_transfer/beast_http_client.hpp"
#include "s3_transfer/cancellation_token.hpp"
#include "s3_transfer/config.hpp"
#include "s3_transfer/log.hpp"
#include "s3_transfer/resume_record.hpp"
#include "s3_transfer/s3_client.hpp"
#include "s3_transfer/s3_request_signer.hpp"
#include "s3_transfer/s3_transfer_error.hpp"
#include "s3_transfer/s3_transfer_util.hpp"
#include "s3_transfer/s3_transport.hpp"
#include "s3_transfer/transfer_coordinator.hpp"

// stdlib includes
#include <algorithm>
#include <csignal>
#include <iostream>
#include <mutex>
#include <thread>

// boost includes
#include <boost/algorithm/string.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

// other includes
#include <fmt/format.h>

namespace po = boost::program_options;

using s3_cli::io::s3_transfer::cancellation_token;
using s3_cli::io::s3_transfer::client_config;
using s3_cli::io::s3_transfer::configuration_error;
using s3_cli::io::s3_transfer::object_metadata;
using s3_cli::io::s3_transfer::object_summary;
using s3_cli::io::s3_transfer::request_outcome;
using s3_cli::io::s3_transfer::s3_client;
using s3_cli::io::s3_transfer::session_state;
using s3_cli::io::s3_transfer::transfer_config;
using s3_cli::io::s3_transfer::transfer_direction;
using s3_cli::io::s3_transfer::transfer_result;

namespace
{

    const int EXIT_TRANSFER_FAILED = 1;
    const int EXIT_CONFIGURATION   = 2;

    const uint64_t LIST_ALL_KEYS{100000000};

    auto basename_of(const std::string& _path) -> std::string
    {
        auto trimmed = _path;
        while (trimmed.size() > 1 && trimmed.back() == '/') {
            trimmed.pop_back();
        }
        const auto slash = trimmed.rfind('/');
        return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
    }

    // Upload key: <bucket path>/<file name>, or the local path itself when no
    // bucket path is given.
    auto upload_key(const std::string& _bucket_path, const std::string& _bucket, const std::string& _local_path) -> std::string
    {
        if (_bucket_path.empty()) {
            return boost::algorithm::trim_left_copy_if(_local_path, boost::algorithm::is_any_of("/"));
        }

        auto folder = s3_cli::io::s3_transfer::strip_s3_url(_bucket_path, _bucket);
        boost::algorithm::trim_if(folder, boost::algorithm::is_any_of("/"));
        return folder.empty() ? basename_of(_local_path) : folder + "/" + basename_of(_local_path);
    }

    auto object_key(const std::string& _bucket_path, const std::string& _bucket) -> std::string
    {
        auto key = s3_cli::io::s3_transfer::strip_s3_url(_bucket_path, _bucket);
        boost::algorithm::trim_left_if(key, boost::algorithm::is_any_of("/"));
        return key;
    }

    void print_result(const std::string& _what, const transfer_result& _result)
    {
        if (session_state::completed == _result.state) {
            fmt::print("{}: {} bytes in {:.3f} s ({} part(s){})\n", _what, _result.bytes_transferred,
                    static_cast<double>(_result.duration.count()) / 1000.0, _result.parts_total,
                    _result.parts_resumed > 0 ? fmt::format(", {} resumed", _result.parts_resumed) : std::string{});
            return;
        }

        fmt::print(stderr, "{} {}: {} of {} parts completed\n", _what,
                to_string(_result.state), _result.parts_completed, _result.parts_total);
        fmt::print(stderr, "  error [{}]: {}\n", to_string(_result.error), _result.error_message);
        for (const auto& e : _result.part_errors) {
            fmt::print(stderr, "  part {} after {} attempt(s) [{}]: {}\n", e.index, e.attempts,
                    to_string(e.kind), e.message);
        }
    }

    void print_failure(const std::string& _what, const request_outcome& _outcome)
    {
        fmt::print(stderr, "{} failed [{}]: {}\n", _what, to_string(_outcome.error), _outcome.message);
    }

    void print_objects(const std::vector<object_summary>& _objects, bool _extra_info)
    {
        for (const auto& object : _objects) {
            if (_extra_info) {
                fmt::print("- Key: {}\n  Size: {}\n  LastModified: {}\n  ETag: {}\n",
                        object.key, object.size, object.last_modified, object.etag);
            } else {
                fmt::print("- {}\n", object.key);
            }
        }
    }

    /// Cancels a token on SIGINT or SIGTERM. The signal is handled on a
    /// dedicated thread so the token is never touched from a signal handler.
    class interrupt_watcher
    {
    public:

        explicit interrupt_watcher(cancellation_token _token)
            : signals_{io_context_, SIGINT, SIGTERM}
        {
            signals_.async_wait([_token](const boost::system::error_code& _ec, int _signal) {
                if (!_ec) {
                    s3_cli::log::warn(fmt::format("signal {} received, cancelling", _signal));
                    _token.cancel();
                }
            });
            thread_ = std::thread{[this]() { io_context_.run(); }};
        }

        ~interrupt_watcher()
        {
            io_context_.stop();
            thread_.join();
        }

        interrupt_watcher(const interrupt_watcher&) = delete;
        interrupt_watcher& operator=(const interrupt_watcher&) = delete;

    private:

        boost::asio::io_context  io_context_;
        boost::asio::signal_set  signals_;
        std::thread              thread_;
    };

} // namespace

int main(int argc, char** argv)
{
    namespace s3 = s3_cli::io::s3_transfer;

    po::options_description general{"Options"};
    general.add_options()
        ("help,h", "show this help")
        ("config", po::value<std::string>(), "JSON settings file (hostname, bucket_name, keyfile, thread_count, ...)")
        ("bucket-name", po::value<std::string>(), "bucket (default $S3_BUCKET_NAME)")
        ("bucket-path", po::value<std::string>()->default_value(""), "object key or folder, s3://bucket/... accepted")
        ("local-path", po::value<std::string>()->default_value(""), "local file (upload) or directory (download)")
        ("prefix", po::value<std::string>()->default_value(""), "list: only keys starting with this prefix")
        ("file-name", po::value<std::string>()->default_value(""), "find: substring to look for")
        ("extra-info", po::bool_switch(), "list/find: show size, last modified and ETag")
        ("max-keys", po::value<uint64_t>()->default_value(LIST_ALL_KEYS), "list/find: maximum number of keys")
        ("endpoint", po::value<std::string>(), "endpoint URL (default $S3_ENDPOINT or https://s3.amazonaws.com)")
        ("region", po::value<std::string>(), "signing region (default $AWS_REGION or us-east-1)")
        ("keyfile", po::value<std::string>(), "file holding the access key and the secret key on two lines")
        ("part-size", po::value<std::string>()->default_value("8M"), "multipart part size")
        ("multipart-threshold", po::value<std::string>()->default_value("8M"), "objects at least this large use multipart")
        ("max-parallel", po::value<int>()->default_value(s3::constants::DEFAULT_MAX_PARALLEL_PARTS), "parts in flight at once")
        ("max-attempts", po::value<int>()->default_value(5), "attempts per request")
        ("retry-base-delay-ms", po::value<long>()->default_value(200), "backoff before the second attempt")
        ("connect-timeout", po::value<long>()->default_value(10), "seconds")
        ("request-timeout", po::value<long>()->default_value(120), "seconds")
        ("no-verify-ssl", po::bool_switch(), "skip TLS certificate verification")
        ("resume-directory", po::value<std::string>()->default_value(s3::constants::DEFAULT_RESUME_DIRECTORY),
            "where interrupted transfers are recorded")
        ("no-resume", po::bool_switch(), "neither record nor resume interrupted transfers")
        ("progress", po::bool_switch(), "report progress on stderr")
        ("debug", po::bool_switch(), "debug logging");

    po::options_description hidden;
    hidden.add_options()
        ("command", po::value<std::string>(), "command");

    po::options_description all;
    all.add(general).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1);

    const auto usage = [&general]() {
        std::cerr << "Usage: s3_cmd <upload|download|delete|info|list|find> [options]\n\n" << general << std::endl;
    };

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& e) {
        std::cerr << "error: " << e.what() << std::endl;
        usage();
        return EXIT_CONFIGURATION;
    }

    if (vm.count("help") || !vm.count("command")) {
        usage();
        return vm.count("help") ? 0 : EXIT_CONFIGURATION;
    }

    const auto command = vm["command"].as<std::string>();

    client_config client_settings;
    transfer_config transfer_settings;

    std::string bucket;
    std::string bucket_path;
    std::string local_path;

    try {
        if (vm.count("config")) {
            s3::read_config_file(vm["config"].as<std::string>(), client_settings, transfer_settings);
        }

        s3::apply_environment(client_settings);

        if (vm.count("endpoint")) {
            client_settings.endpoint = vm["endpoint"].as<std::string>();
        }
        if (vm.count("region")) {
            client_settings.region = vm["region"].as<std::string>();
        }
        if (vm.count("keyfile")) {
            s3::read_keyfile(vm["keyfile"].as<std::string>(), client_settings.keys);
        }
        if (vm.count("bucket-name")) {
            client_settings.bucket_name = vm["bucket-name"].as<std::string>();
        }
        client_settings.http.connect_timeout = std::chrono::seconds{vm["connect-timeout"].as<long>()};
        client_settings.http.request_timeout = std::chrono::seconds{vm["request-timeout"].as<long>()};
        client_settings.http.verify_ssl      = !vm["no-verify-ssl"].as<bool>();
        client_settings.debug                = client_settings.debug || vm["debug"].as<bool>();

        // the settings file wins over defaulted options
        if (!vm["part-size"].defaulted() || !vm.count("config")) {
            transfer_settings.part_size = s3::parse_size(vm["part-size"].as<std::string>());
        }
        if (!vm["max-parallel"].defaulted() || !vm.count("config")) {
            transfer_settings.max_parallel_parts = vm["max-parallel"].as<int>();
        }
        if (!vm["resume-directory"].defaulted() || !vm.count("config")) {
            transfer_settings.resume_directory = vm["resume-directory"].as<std::string>();
        }
        transfer_settings.multipart_threshold = s3::parse_size(vm["multipart-threshold"].as<std::string>());
        transfer_settings.retry.max_attempts  = vm["max-attempts"].as<int>();
        transfer_settings.retry.base_delay    = std::chrono::milliseconds{vm["retry-base-delay-ms"].as<long>()};
        transfer_settings.retry.max_delay     = std::max(transfer_settings.retry.max_delay, transfer_settings.retry.base_delay);
        transfer_settings.resume_enabled      = !vm["no-resume"].as<bool>();

        s3::validate(client_settings);
        s3::validate(transfer_settings);

        bucket      = client_settings.bucket_name;
        bucket_path = vm["bucket-path"].as<std::string>();
        local_path  = vm["local-path"].as<std::string>();

        if (bucket.empty()) {
            throw configuration_error{"no bucket: pass --bucket-name or set S3_BUCKET_NAME"};
        }
    }
    catch (const configuration_error& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return EXIT_CONFIGURATION;
    }

    s3_cli::log::set_level(client_settings.debug ? s3_cli::log::level::debug : s3_cli::log::level::info);

    std::shared_ptr<s3_client> client;
    try {
        auto http = std::make_shared<s3::beast_http_client>(client_settings.http);
        auto transport = std::make_shared<s3::s3_transport>(http,
                s3::request_signer{client_settings.keys, client_settings.region},
                transfer_settings.retry);
        client = std::make_shared<s3_client>(transport, s3::parse_endpoint(client_settings.endpoint));
    }
    catch (const configuration_error& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return EXIT_CONFIGURATION;
    }

    s3::request_options options;
    options.policy = transfer_settings.retry;

    if ("upload" == command || "download" == command) {

        if (local_path.empty()) {
            std::cerr << "error: " << command << " needs --local-path" << std::endl;
            return EXIT_CONFIGURATION;
        }
        if ("download" == command && bucket_path.empty()) {
            std::cerr << "error: download needs --bucket-path" << std::endl;
            return EXIT_CONFIGURATION;
        }

        const bool uploading = "upload" == command;
        const auto key = uploading ? upload_key(bucket_path, bucket, local_path) : object_key(bucket_path, bucket);
        const auto file = uploading ? local_path : (boost::filesystem::path{local_path} / basename_of(key)).string();

        auto request = s3::make_transfer_request(transfer_settings,
                uploading ? transfer_direction::upload : transfer_direction::download, bucket, key, file);

        std::shared_ptr<s3::resume_store> store;
        if (transfer_settings.resume_enabled) {
            store = std::make_shared<s3::resume_store>(transfer_settings.resume_directory);
        }

        s3::transfer_coordinator coordinator{client, store};

        std::mutex progress_mutex;
        s3::transfer_session::progress_callback progress;
        if (vm["progress"].as<bool>()) {
            progress = [&progress_mutex, &key](uint64_t _done, uint64_t _total) {
                std::lock_guard<std::mutex> lock(progress_mutex);
                const double percent = _total > 0 ? 100.0 * static_cast<double>(_done) / static_cast<double>(_total) : 100.0;
                fmt::print(stderr, "\r{}  {} / {}  ({:.2f}%)", key, _done, _total, percent);
                if (_done == _total) {
                    fmt::print(stderr, "\n");
                }
            };
        }

        cancellation_token cancel;
        transfer_result result;
        {
            interrupt_watcher watcher{cancel};
            result = coordinator.run(request, cancel, progress);
        }

        print_result(fmt::format("{} s3://{}/{} {} {}", command, bucket, key, uploading ? "<-" : "->", file), result);
        if (session_state::completed != result.state) {
            return s3::error_kind::configuration_error == result.error ? EXIT_CONFIGURATION : EXIT_TRANSFER_FAILED;
        }

        if (uploading) {
            s3_cli::log::info(fmt::format("File \"{}\" saved in the bucket under: {}", local_path, key));
        } else {
            s3_cli::log::info(fmt::format("File \"{}\" saved locally under: {}", key, file));
        }
        return 0;
    }

    if ("delete" == command || "info" == command) {

        if (bucket_path.empty()) {
            std::cerr << "error: " << command << " needs --bucket-path" << std::endl;
            return EXIT_CONFIGURATION;
        }
        const auto key = object_key(bucket_path, bucket);

        if ("delete" == command) {
            const auto outcome = client->delete_object(bucket, key, options);
            if (!outcome.ok()) {
                print_failure("delete " + key, outcome);
                s3_cli::log::info(fmt::format("Please re-try, {} is not deleted.", key));
                return EXIT_TRANSFER_FAILED;
            }
            s3_cli::log::info(fmt::format("{} is deleted.", key));
            return 0;
        }

        object_metadata metadata;
        const auto outcome = client->head_object(bucket, key, metadata, options);
        if (!outcome.ok()) {
            print_failure("info " + key, outcome);
            return EXIT_TRANSFER_FAILED;
        }
        fmt::print("Key: {}\nContentLength: {}\nETag: {}\nLastModified: {}\nContentType: {}\n",
                key, metadata.size, metadata.etag, metadata.last_modified, metadata.content_type);
        return 0;
    }

    if ("list" == command || "find" == command) {

        const auto file_name = vm["file-name"].as<std::string>();
        if ("find" == command && file_name.empty()) {
            std::cerr << "error: find needs --file-name" << std::endl;
            return EXIT_CONFIGURATION;
        }

        std::vector<object_summary> objects;
        const auto prefix = "list" == command ? vm["prefix"].as<std::string>() : std::string{};
        const auto outcome = client->list_objects(bucket, prefix, "", vm["max-keys"].as<uint64_t>(), objects, options);
        if (!outcome.ok()) {
            print_failure(command + " " + bucket, outcome);
            return EXIT_TRANSFER_FAILED;
        }

        if ("find" == command) {
            objects.erase(std::remove_if(objects.begin(), objects.end(), [&file_name](const object_summary& _object) {
                        return _object.key.find(file_name) == std::string::npos;
                    }), objects.end());
        }

        print_objects(objects, vm["extra-info"].as<bool>());
        return 0;
    }

    std::cerr << "error: unknown command [" << command << "]" << std::endl;
    usage();
    return EXIT_CONFIGURATION;
}
