#include "s3_transfer_util.hpp"

// stdlib includes
#include <algorithm>
#include <cmath>
#include <mutex>
#include <random>
#include <thread>

// system includes
#include <openssl/evp.h>
#include <openssl/md5.h>
#include <openssl/sha.h>

namespace s3_cli::io::s3_transfer
{

    auto to_string(transfer_direction _direction) -> const char*
    {
        switch (_direction) {
            case transfer_direction::upload:   return "upload";
            case transfer_direction::download: return "download";
        }
        return "unknown";
    }

    auto to_string(error_kind _kind) -> const char*
    {
        switch (_kind) {
            case error_kind::none:                    return "none";
            case error_kind::configuration_error:     return "configuration_error";
            case error_kind::transient_network_error: return "transient_network_error";
            case error_kind::authentication_error:    return "authentication_error";
            case error_kind::server_rejection_error:  return "server_rejection_error";
            case error_kind::partial_transfer_error:  return "partial_transfer_error";
            case error_kind::local_io_error:          return "local_io_error";
            case error_kind::cancelled:               return "cancelled";
        }
        return "unknown";
    }

    auto to_string(part_state _state) -> const char*
    {
        switch (_state) {
            case part_state::pending:         return "pending";
            case part_state::in_flight:       return "in_flight";
            case part_state::retry_scheduled: return "retry_scheduled";
            case part_state::completed:       return "completed";
            case part_state::failed:          return "failed";
        }
        return "unknown";
    }

    auto to_string(session_state _state) -> const char*
    {
        switch (_state) {
            case session_state::running:   return "running";
            case session_state::completed: return "completed";
            case session_state::failed:    return "failed";
            case session_state::cancelled: return "cancelled";
        }
        return "unknown";
    }

    auto compute_backoff_delay(const retry_policy& _policy, int _attempts_made) -> std::chrono::milliseconds
    {
        // shared by all worker threads
        static std::mutex   random_mutex;
        static std::mt19937 generator{std::random_device{}()};

        const auto exponent = std::max(0, _attempts_made - 1);
        const double scaled = static_cast<double>(_policy.base_delay.count())
            * std::pow(_policy.backoff_multiplier, exponent);
        const double capped = std::min(scaled, static_cast<double>(_policy.max_delay.count()));

        auto jitter_min = _policy.jitter_min.count();
        auto jitter_max = std::max(_policy.jitter_min.count(), _policy.jitter_max.count());

        long long jitter = jitter_min;
        if (jitter_max > jitter_min) {
            std::lock_guard<std::mutex> lock(random_mutex);
            std::uniform_int_distribution<long long> distribution{jitter_min, jitter_max};
            jitter = distribution(generator);
        }

        return std::chrono::milliseconds{static_cast<long long>(capped) + jitter};
    }

    void s3_sleep(std::chrono::milliseconds _delay)
    {
        if (_delay.count() > 0) {
            std::this_thread::sleep_for(_delay);
        }
    }

    auto format_amz_date(std::time_t _t) -> std::string
    {
        std::tm tm_utc{};
        gmtime_r(&_t, &tm_utc);
        char buffer[20];
        std::strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &tm_utc);
        return buffer;
    }

    auto to_hex(const unsigned char* _data, std::size_t _size) -> std::string
    {
        static const char digits[] = "0123456789abcdef";
        std::string hex;
        hex.reserve(_size * 2);
        for (std::size_t i = 0; i < _size; ++i) {
            hex.push_back(digits[_data[i] >> 4]);
            hex.push_back(digits[_data[i] & 0x0f]);
        }
        return hex;
    }

    auto base64_encode(const unsigned char* _data, std::size_t _size) -> std::string
    {
        std::string encoded(4 * ((_size + 2) / 3), '\0');
        const int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                _data, static_cast<int>(_size));
        encoded.resize(length);
        return encoded;
    }

    auto sha256_hex(const std::string& _data) -> std::string
    {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(_data.data()), _data.size(), hash);
        return to_hex(hash, SHA256_DIGEST_LENGTH);
    }

    auto content_md5(const std::string& _data) -> std::string
    {
        unsigned char md5_bin[MD5_DIGEST_LENGTH];
        unsigned int  md5_length = 0;
        EVP_Digest(_data.data(), _data.size(), md5_bin, &md5_length, EVP_md5(), nullptr);
        return base64_encode(md5_bin, md5_length);
    }

    auto uri_encode(const std::string& _input, bool _encode_slash) -> std::string
    {
        static const char digits[] = "0123456789ABCDEF";
        std::string encoded;
        encoded.reserve(_input.size() * 3);
        for (unsigned char c : _input) {
            if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                    || c == '-' || c == '_' || c == '.' || c == '~') {
                encoded.push_back(static_cast<char>(c));
            } else if (c == '/' && !_encode_slash) {
                encoded.push_back('/');
            } else {
                encoded.push_back('%');
                encoded.push_back(digits[c >> 4]);
                encoded.push_back(digits[c & 0x0f]);
            }
        }
        return encoded;
    }

    auto strip_s3_url(const std::string& _path, const std::string& _bucket) -> std::string
    {
        const std::string scheme{"s3://"};
        if (_path.compare(0, scheme.size(), scheme) != 0) {
            return _path;
        }

        auto remainder = _path.substr(scheme.size());
        const auto prefix = _bucket + "/";
        if (remainder.compare(0, prefix.size(), prefix) == 0) {
            return remainder.substr(prefix.size());
        }

        // s3://other-bucket/key, keep everything after the bucket segment
        auto slash = remainder.find('/');
        return slash == std::string::npos ? std::string{} : remainder.substr(slash + 1);
    }

} // s3_cli::io::s3_transfer
