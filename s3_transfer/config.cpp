#include "config.hpp"
#include "s3_transfer_error.hpp"

// stdlib includes
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <memory>
#include <utility>

// boost includes
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

// other includes
#include <fmt/format.h>
#include <jansson.h>

namespace s3_cli::io::s3_transfer
{

    namespace
    {
        bool read_env(const char* _name, std::string& _value)
        {
            const char* value = std::getenv(_name);
            if (value == nullptr || *value == '\0') {
                return false;
            }
            _value = value;
            return true;
        }

        struct json_deleter
        {
            void operator()(json_t* _json) const { json_decref(_json); }
        };

        // Returns nullptr when _name is absent.
        auto member(json_t* _root, const char* _name) -> json_t*
        {
            json_t* value = json_object_get(_root, _name);
            if (value == nullptr || json_is_null(value)) {
                return nullptr;
            }
            return value;
        }

        void read_string(json_t* _root, const char* _name, const std::string& _path, std::string& _value)
        {
            if (json_t* value = member(_root, _name)) {
                if (!json_is_string(value)) {
                    throw configuration_error{fmt::format("({}): {} is not a string", _path, _name)};
                }
                _value = json_string_value(value);
            }
        }

        template <typename T>
        void read_integer(json_t* _root, const char* _name, const std::string& _path, T& _value)
        {
            if (json_t* value = member(_root, _name)) {
                if (!json_is_integer(value) || json_integer_value(value) < 0) {
                    throw configuration_error{fmt::format("({}): {} is not a non-negative integer", _path, _name)};
                }
                _value = static_cast<T>(json_integer_value(value));
            }
        }
    } // namespace

    void apply_environment(client_config& _config)
    {
        read_env("S3_ENDPOINT", _config.endpoint);

        if (!read_env("AWS_REGION", _config.region)) {
            read_env("AWS_DEFAULT_REGION", _config.region);
        }

        read_env("AWS_ACCESS_KEY_ID", _config.keys.access_key);
        read_env("AWS_SECRET_ACCESS_KEY", _config.keys.secret_access_key);
        read_env("AWS_SESSION_TOKEN", _config.keys.session_token);
        read_env("S3_BUCKET_NAME", _config.bucket_name);
    }

    void read_keyfile(const std::string& _path, credentials& _credentials)
    {
        std::ifstream in{_path};
        if (!in) {
            throw configuration_error{fmt::format("cannot open key file [{}]", _path)};
        }

        std::string access_key;
        std::string secret_access_key;
        std::getline(in, access_key);
        std::getline(in, secret_access_key);

        boost::algorithm::trim(access_key);
        boost::algorithm::trim(secret_access_key);

        if (access_key.empty() || secret_access_key.empty()) {
            throw configuration_error{fmt::format("key file [{}] must hold the access key and the secret key "
                        "on its first two lines", _path)};
        }

        _credentials.access_key        = access_key;
        _credentials.secret_access_key = secret_access_key;
    }

    void read_config_file(const std::string& _path,
                          client_config& _client_config,
                          transfer_config& _transfer_config)
    {
        std::ifstream in{_path};
        if (!in) {
            throw configuration_error{fmt::format("cannot open configuration file [{}]", _path)};
        }
        const std::string config_str{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

        json_error_t error;
        std::unique_ptr<json_t, json_deleter> root{json_loads(config_str.c_str(), 0, &error)};
        if (!root) {
            throw configuration_error{fmt::format("error: on line {} in {}: {}", error.line, _path, error.text)};
        }
        if (!json_is_object(root.get())) {
            throw configuration_error{fmt::format("({}): configuration must be a JSON object", _path)};
        }

        read_string(root.get(), "hostname", _path, _client_config.endpoint);
        read_string(root.get(), "region", _path, _client_config.region);
        read_string(root.get(), "bucket_name", _path, _client_config.bucket_name);

        std::string keyfile;
        read_string(root.get(), "keyfile", _path, keyfile);
        if (!keyfile.empty()) {
            read_keyfile(keyfile, _client_config.keys);
        }

        read_integer(root.get(), "thread_count", _path, _transfer_config.max_parallel_parts);
        read_integer(root.get(), "part_size", _path, _transfer_config.part_size);
        read_string(root.get(), "resume_directory", _path, _transfer_config.resume_directory);

        if (json_t* debug_flag = member(root.get(), "debug_flag")) {
            _client_config.debug = json_is_true(debug_flag);
        }
    }

    auto parse_size(const std::string& _value) -> uint64_t
    {
        auto text = boost::algorithm::trim_copy(_value);
        boost::algorithm::to_upper(text);

        static const std::pair<const char*, uint64_t> suffixes[] = {
            {"KIB", 1024ull},
            {"MIB", 1024ull * 1024},
            {"GIB", 1024ull * 1024 * 1024},
            {"K",   1024ull},
            {"M",   1024ull * 1024},
            {"G",   1024ull * 1024 * 1024}
        };

        uint64_t multiplier = 1;
        for (const auto& [suffix, factor] : suffixes) {
            if (boost::algorithm::ends_with(text, suffix)) {
                multiplier = factor;
                text.erase(text.size() - std::char_traits<char>::length(suffix));
                break;
            }
        }

        // lexical_cast wraps negative input into the unsigned range
        if (text.empty() || !std::all_of(text.begin(), text.end(), [](char _c) { return _c >= '0' && _c <= '9'; })) {
            throw configuration_error{fmt::format("invalid size [{}]", _value)};
        }

        uint64_t value = 0;
        try {
            value = boost::lexical_cast<uint64_t>(text);
        }
        catch (const boost::bad_lexical_cast&) {
            throw configuration_error{fmt::format("invalid size [{}]", _value)};
        }

        if (value > std::numeric_limits<uint64_t>::max() / multiplier) {
            throw configuration_error{fmt::format("size [{}] is out of range", _value)};
        }
        return value * multiplier;
    }

    void validate(const client_config& _config)
    {
        if (_config.endpoint.empty()) {
            throw configuration_error{"endpoint is empty"};
        }
        if (_config.region.empty()) {
            throw configuration_error{"region is empty"};
        }
        if (_config.keys.access_key.empty() || _config.keys.secret_access_key.empty()) {
            throw configuration_error{"credentials missing: set AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY "
                        "or pass --keyfile"};
        }
        if (_config.http.connect_timeout.count() <= 0 || _config.http.request_timeout.count() <= 0) {
            throw configuration_error{"timeouts must be positive"};
        }
    }

    void validate(const transfer_config& _config)
    {
        if (0 == _config.part_size) {
            throw configuration_error{"part size must be greater than zero"};
        }
        if (_config.part_size > constants::MAXIMUM_PART_SIZE) {
            throw configuration_error{fmt::format("part size {} exceeds the {} byte limit",
                        _config.part_size, constants::MAXIMUM_PART_SIZE)};
        }
        if (_config.max_parallel_parts < 1) {
            throw configuration_error{fmt::format("max parallel parts must be at least 1, got {}",
                        _config.max_parallel_parts)};
        }
        if (_config.retry.max_attempts < 1) {
            throw configuration_error{"max attempts must be at least 1"};
        }
        if (_config.retry.base_delay.count() < 0 || _config.retry.max_delay < _config.retry.base_delay) {
            throw configuration_error{"retry delays must satisfy 0 <= base delay <= max delay"};
        }
        if (_config.retry.backoff_multiplier < 1.0) {
            throw configuration_error{"backoff multiplier must be at least 1"};
        }
        if (_config.retry.jitter_min.count() < 0 || _config.retry.jitter_max < _config.retry.jitter_min) {
            throw configuration_error{"jitter bounds must satisfy 0 <= min <= max"};
        }
        if (_config.resume_enabled && _config.resume_directory.empty()) {
            throw configuration_error{"resume directory is empty"};
        }
    }

    auto make_transfer_request(const transfer_config& _config,
                               transfer_direction _direction,
                               const std::string& _bucket,
                               const std::string& _key,
                               const std::string& _local_path) -> transfer_request
    {
        transfer_request request;
        request.direction           = _direction;
        request.bucket              = _bucket;
        request.key                 = _key;
        request.local_path          = _local_path;
        request.part_size           = _config.part_size;
        request.max_parallel_parts  = _config.max_parallel_parts;
        request.multipart_threshold = _config.multipart_threshold;
        request.retry_override      = _config.retry;
        request.resumable           = _config.resume_enabled;
        return request;
    }

} // s3_cli::io::s3_transfer
