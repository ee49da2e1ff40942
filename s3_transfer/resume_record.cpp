#include "resume_record.hpp"
#include "resume_lock.hpp"
#include "s3_transfer_error.hpp"
#include "s3_transfer_util.hpp"
#include "log.hpp"

// stdlib includes
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>

// boost includes
#include <boost/filesystem.hpp>
#include <boost/interprocess/exceptions.hpp>

// other includes
#include <fmt/format.h>
#include <jansson.h>

namespace s3_cli::io::s3_transfer
{

    namespace fs = boost::filesystem;

    bool resume_record::same_identity(const resume_record& _other) const
    {
        return direction == _other.direction
            && bucket == _other.bucket
            && key == _other.key
            && local_path == _other.local_path;
    }

    bool resume_record::applies_to(const resume_record& _other) const
    {
        return same_identity(_other)
            && object_size == _other.object_size
            && source_stamp == _other.source_stamp
            && part_size == _other.part_size;
    }

    namespace
    {
        struct json_deleter
        {
            void operator()(json_t* _json) const { json_decref(_json); }
        };

        using json_ptr = std::unique_ptr<json_t, json_deleter>;

        auto get_string(json_t* _object, const char* _name) -> std::string
        {
            json_t* value = json_object_get(_object, _name);
            if (!json_is_string(value)) {
                throw std::invalid_argument{fmt::format("{} missing or is not a string", _name)};
            }
            return json_string_value(value);
        }

        auto get_integer(json_t* _object, const char* _name) -> json_int_t
        {
            json_t* value = json_object_get(_object, _name);
            if (!json_is_integer(value) || json_integer_value(value) < 0) {
                throw std::invalid_argument{fmt::format("{} missing or is not a non-negative integer", _name)};
            }
            return json_integer_value(value);
        }
    } // namespace

    auto to_json_string(const resume_record& _record) -> std::string
    {
        json_ptr parts{json_array()};
        for (const auto& [index, etag] : _record.completed_parts) {
            json_array_append_new(parts.get(), json_pack("{s:i, s:s}", "part", index, "etag", etag.c_str()));
        }

        json_ptr root{json_pack("{s:s, s:s, s:s, s:s, s:I, s:s, s:I, s:s, s:O}",
                "direction",       to_string(_record.direction),
                "bucket",          _record.bucket.c_str(),
                "key",             _record.key.c_str(),
                "local_path",      _record.local_path.c_str(),
                "object_size",     static_cast<json_int_t>(_record.object_size),
                "source_stamp",    _record.source_stamp.c_str(),
                "part_size",       static_cast<json_int_t>(_record.part_size),
                "upload_id",       _record.upload_id.c_str(),
                "completed_parts", parts.get())};
        if (!root) {
            throw local_io_error{"cannot encode resume record"};
        }

        std::unique_ptr<char, decltype(&std::free)> text{json_dumps(root.get(), JSON_INDENT(2)), &std::free};
        if (!text) {
            throw local_io_error{"cannot encode resume record"};
        }
        return text.get();
    }

    auto parse_resume_record(const std::string& _json) -> resume_record
    {
        json_error_t error;
        json_ptr root{json_loads(_json.c_str(), 0, &error)};
        if (!root) {
            throw std::invalid_argument{fmt::format("line {}: {}", error.line, error.text)};
        }
        if (!json_is_object(root.get())) {
            throw std::invalid_argument{"resume record is not an object"};
        }

        resume_record record;

        const auto direction = get_string(root.get(), "direction");
        if ("upload" == direction) {
            record.direction = transfer_direction::upload;
        } else if ("download" == direction) {
            record.direction = transfer_direction::download;
        } else {
            throw std::invalid_argument{"unknown direction " + direction};
        }

        record.bucket       = get_string(root.get(), "bucket");
        record.key          = get_string(root.get(), "key");
        record.local_path   = get_string(root.get(), "local_path");
        record.object_size  = get_integer(root.get(), "object_size");
        record.source_stamp = get_string(root.get(), "source_stamp");
        record.part_size    = get_integer(root.get(), "part_size");
        record.upload_id    = get_string(root.get(), "upload_id");

        json_t* parts = json_object_get(root.get(), "completed_parts");
        if (!json_is_array(parts)) {
            throw std::invalid_argument{"completed_parts missing or is not an array"};
        }

        size_t i;
        json_t* entry;
        json_array_foreach(parts, i, entry) {
            if (!json_is_object(entry)) {
                throw std::invalid_argument{"completed_parts entry is not an object"};
            }
            record.completed_parts[static_cast<int>(get_integer(entry, "part"))] = get_string(entry, "etag");
        }

        return record;
    }

    resume_store::resume_store(std::string _directory, std::string _lock_prefix)
        : directory_{std::move(_directory)}
        , lock_prefix_{std::move(_lock_prefix)}
    {
    }

    auto resume_store::identity_hash(const resume_record& _identity) const -> std::string
    {
        const auto identity = fmt::format("{}\n{}\n{}\n{}", to_string(_identity.direction),
                _identity.bucket, _identity.key, _identity.local_path);
        return sha256_hex(identity).substr(0, 32);
    }

    auto resume_store::record_path(const resume_record& _identity) const -> std::string
    {
        return (fs::path{directory_} / (identity_hash(_identity) + ".json")).string();
    }

    auto resume_store::load(const resume_record& _expected) const -> std::optional<resume_record>
    {
        const auto path = record_path(_expected);
        resume_lock lock{lock_prefix_ + identity_hash(_expected), __FILE__, __LINE__, __FUNCTION__};

        boost::system::error_code ec;
        if (!fs::exists(path, ec)) {
            return std::nullopt;
        }

        resume_record stored;
        try {
            std::ifstream in{path};
            if (!in) {
                log::warn(fmt::format("cannot open resume record {}", path));
                return std::nullopt;
            }
            const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
            stored = parse_resume_record(text);
        }
        catch (const std::invalid_argument& e) {
            log::warn(fmt::format("discarding unreadable resume record {}: {}", path, e.what()));
            fs::remove(path, ec);
            return std::nullopt;
        }

        if (!stored.applies_to(_expected)) {
            log::info(fmt::format("source of {} changed since the interrupted transfer, starting over", _expected.local_path));
            fs::remove(path, ec);
            return std::nullopt;
        }

        return stored;
    }

    void resume_store::save(const resume_record& _record) const
    {
        const auto path = record_path(_record);
        const auto temporary = path + ".tmp";

        resume_lock lock{lock_prefix_ + identity_hash(_record)};

        boost::system::error_code ec;
        fs::create_directories(directory_, ec);
        if (ec) {
            throw local_io_error{fmt::format("cannot create resume directory {}: {}", directory_, ec.message())};
        }

        {
            std::ofstream out{temporary, std::ios::out | std::ios::trunc};
            out << to_json_string(_record) << '\n';
            out.flush();
            if (!out) {
                throw local_io_error{fmt::format("cannot write resume record {}", temporary)};
            }
        }

        fs::rename(temporary, path, ec);
        if (ec) {
            fs::remove(temporary, ec);
            throw local_io_error{fmt::format("cannot replace resume record {}", path)};
        }
    }

    void resume_store::remove(const resume_record& _identity) const
    {
        const auto path = record_path(_identity);

        try {
            resume_lock lock{lock_prefix_ + identity_hash(_identity)};

            boost::system::error_code ec;
            fs::remove(path, ec);
            if (ec) {
                log::warn(fmt::format("cannot remove resume record {}: {}", path, ec.message()));
            }
        }
        catch (const boost::interprocess::interprocess_exception& e) {
            log::warn(fmt::format("resume record {} not removed, lock unavailable: {}", path, e.what()));
        }
    }

    resume_journal::resume_journal(const resume_store& _store, resume_record _record)
        : store_{_store}
        , record_{std::move(_record)}
    {
    }

    void resume_journal::set_upload_id(const std::string& _upload_id)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        record_.upload_id = _upload_id;
        changed(lock);
    }

    void resume_journal::part_completed(int _index, const std::string& _etag)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        record_.completed_parts[_index] = _etag;
        changed(lock);
    }

    void resume_journal::discard()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        discarded_ = true;
        idle_.wait(lock, [this] { return !writing_; });
        const auto identity = record_;
        lock.unlock();

        store_.remove(identity);
    }

    auto resume_journal::snapshot() const -> resume_record
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return record_;
    }

    void resume_journal::changed(std::unique_lock<std::mutex>& _lock)
    {
        ++version_;

        // the active writer picks up this change before it stops
        if (writing_) {
            return;
        }

        writing_ = true;
        while (!discarded_ && written_version_ < version_) {
            const auto snapshot = record_;
            const auto version = version_;

            _lock.unlock();
            persist(snapshot);
            _lock.lock();

            written_version_ = version;
        }
        writing_ = false;
        idle_.notify_all();
    }

    void resume_journal::persist(const resume_record& _snapshot) const
    {
        try {
            store_.save(_snapshot);
        }
        catch (const local_io_error& e) {
            log::warn(fmt::format("resume record not updated: {}", e.what()));
        }
        catch (const boost::interprocess::interprocess_exception& e) {
            log::warn(fmt::format("resume record not updated, lock unavailable: {}", e.what()));
        }
    }

} // s3_cli::io::s3_transfer
