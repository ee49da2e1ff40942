#include "transfer_coordinator.hpp"
#include "object_io.hpp"
#include "part_plan.hpp"
#include "s3_transfer_error.hpp"
#include "s3_transfer_util.hpp"
#include "log.hpp"

// stdlib includes
#include <mutex>

// boost includes
#include <boost/filesystem.hpp>
#include <boost/interprocess/exceptions.hpp>

// other includes
#include <fmt/format.h>

namespace s3_cli::io::s3_transfer
{

    namespace fs = boost::filesystem;

    namespace
    {
        auto identity_of(const transfer_request& _request) -> resume_record
        {
            resume_record record;
            record.direction  = _request.direction;
            record.bucket     = _request.bucket;
            record.key        = _request.key;
            record.local_path = fs::absolute(_request.local_path).lexically_normal().string();
            return record;
        }

        // Returns the stored record for _expected, or nothing when there is
        // none or it cannot be read.
        auto load_record(const resume_store& _store, const resume_record& _expected) -> std::optional<resume_record>
        {
            try {
                return _store.load(_expected);
            }
            catch (const boost::interprocess::interprocess_exception& e) {
                log::warn(fmt::format("resume record for {} unavailable: {}", _expected.local_path, e.what()));
            }
            return std::nullopt;
        }

        // Marks the stored parts completed. False if the record names a part
        // outside the plan.
        bool restore_parts(transfer_session& _session, const resume_record& _record)
        {
            for (const auto& [index, etag] : _record.completed_parts) {
                if (index < 1 || index > _session.part_count()) {
                    return false;
                }
            }
            for (const auto& [index, etag] : _record.completed_parts) {
                _session.restore_completed_part(index, etag);
            }
            return true;
        }

        bool keep_for_resume(const transfer_request& _request, const transfer_session& _session)
        {
            if (!_request.resumable || session_state::completed == _session.state()) {
                return false;
            }
            const auto error = _session.error();
            return error_kind::transient_network_error == error || error_kind::cancelled == error;
        }
    } // namespace

    auto make_failed_result(error_kind _kind, const std::string& _message) -> transfer_result
    {
        transfer_result result;
        result.state         = error_kind::cancelled == _kind ? session_state::cancelled : session_state::failed;
        result.error         = _kind;
        result.error_message = _message;
        return result;
    }

    transfer_coordinator::transfer_coordinator(std::shared_ptr<s3_client> _client,
                                               std::shared_ptr<resume_store> _resume_store)
        : client_{_client}
        , resume_store_{std::move(_resume_store)}
        , engine_{std::move(_client)}
    {
    }

    void transfer_coordinator::validate(const transfer_request& _request)
    {
        if (_request.bucket.empty()) {
            throw configuration_error{"bucket name is empty"};
        }
        if (_request.key.empty()) {
            throw configuration_error{"object key is empty"};
        }
        if (_request.local_path.empty()) {
            throw configuration_error{"local path is empty"};
        }
        if (_request.max_parallel_parts < 1) {
            throw configuration_error{fmt::format("max parallel parts must be at least 1, got {}", _request.max_parallel_parts)};
        }
        if (0 == _request.part_size) {
            throw configuration_error{"part size must be greater than zero"};
        }
        if (_request.retry_override && _request.retry_override->max_attempts < 1) {
            throw configuration_error{"retry policy must allow at least one attempt"};
        }

        boost::system::error_code ec;
        const fs::path local_path{_request.local_path};

        if (transfer_direction::upload == _request.direction) {
            if (!fs::is_regular_file(local_path, ec)) {
                throw configuration_error{fmt::format("upload source [{}] does not exist or is not a regular file",
                            _request.local_path)};
            }

            const uint64_t size = fs::file_size(local_path, ec);
            if (ec) {
                throw configuration_error{fmt::format("cannot determine size of [{}]: {}", _request.local_path, ec.message())};
            }
            if (size > constants::MAXIMUM_OBJECT_SIZE) {
                throw configuration_error{fmt::format("[{}] is {} bytes, larger than the {} byte object limit",
                            _request.local_path, size, constants::MAXIMUM_OBJECT_SIZE)};
            }
            if (!use_multipart(size, _request.multipart_threshold) && size > constants::MAXIMUM_SINGLE_PART_SIZE) {
                throw configuration_error{fmt::format("[{}] is {} bytes, larger than the {} byte single request limit; "
                            "lower the multipart threshold", _request.local_path, size, constants::MAXIMUM_SINGLE_PART_SIZE)};
            }
            return;
        }

        if (fs::is_directory(local_path, ec)) {
            throw configuration_error{fmt::format("download destination [{}] is a directory", _request.local_path)};
        }

        auto parent = fs::absolute(local_path).parent_path();
        if (!fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                throw configuration_error{fmt::format("cannot create destination directory [{}]: {}",
                            parent.string(), ec.message())};
            }
        } else if (!fs::is_directory(parent, ec)) {
            throw configuration_error{fmt::format("[{}] is not a directory", parent.string())};
        }

        if (_request.object_size && *_request.object_size > constants::MAXIMUM_OBJECT_SIZE) {
            throw configuration_error{fmt::format("object size {} exceeds the {} byte limit",
                        *_request.object_size, constants::MAXIMUM_OBJECT_SIZE)};
        }
    }

    auto transfer_coordinator::run(const transfer_request& _request,
                                   cancellation_token _cancel,
                                   transfer_session::progress_callback _progress) const -> transfer_result
    {
        const auto started = std::chrono::steady_clock::now();

        transfer_result result;
        try {
            validate(_request);

            result = transfer_direction::upload == _request.direction
                ? run_upload(_request, _cancel, _progress)
                : run_download(_request, _cancel, _progress);
        }
        catch (const s3_transfer_error& e) {
            result = make_failed_result(e.kind(), e.what());
        }
        catch (const fs::filesystem_error& e) {
            result = make_failed_result(error_kind::local_io_error, e.what());
        }

        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);

        if (session_state::completed == result.state) {
            log::info(fmt::format("{} of {}/{} completed: {} bytes in {} ms ({} parts, {} resumed)",
                        to_string(_request.direction), _request.bucket, _request.key, result.bytes_transferred,
                        result.duration.count(), result.parts_total, result.parts_resumed));
        } else {
            log::error(fmt::format("{} of {}/{} {}: [{}] {}", to_string(_request.direction), _request.bucket,
                        _request.key, to_string(result.state), to_string(result.error), result.error_message));
        }

        return result;
    }

    auto transfer_coordinator::run_upload(const transfer_request& _request,
                                          const cancellation_token& _cancel,
                                          const transfer_session::progress_callback& _progress) const -> transfer_result
    {
        const auto info = stat_local_file(_request.local_path);
        const bool multipart = use_multipart(info.size, _request.multipart_threshold);

        transfer_session session{multipart
            ? make_part_plan(info.size, _request.part_size, transfer_direction::upload)
            : make_single_part_plan(info.size), _cancel};
        session.set_progress_callback(_progress);

        std::unique_ptr<resume_journal> journal;
        std::string resume_upload_id;

        if (multipart && _request.resumable && resume_store_) {
            auto expected = identity_of(_request);
            expected.object_size  = info.size;
            expected.source_stamp = std::to_string(info.last_modified);
            expected.part_size    = session.part_size();

            if (auto stored = load_record(*resume_store_, expected)) {
                if (!stored->upload_id.empty() && restore_parts(session, *stored)) {
                    resume_upload_id = stored->upload_id;
                    expected = *stored;
                } else {
                    resume_store_->remove(expected);
                }
            }

            journal = std::make_unique<resume_journal>(*resume_store_, expected);
        }

        object_reader reader{_request.local_path};

        engine_hooks hooks;
        if (journal) {
            hooks.upload_initiated = [&journal](const std::string& _upload_id) {
                journal->set_upload_id(_upload_id);
            };
            hooks.part_completed = [&journal](int _index, const std::string& _etag) {
                journal->part_completed(_index, _etag);
            };
        }

        const auto report = engine_.upload(_request, session, reader, multipart, resume_upload_id, hooks);

        if (journal && !report.upload_id_retained) {
            journal->discard();
        }

        {
            std::lock_guard<std::mutex> lock(report_mutex_);
            last_report_ = report;
        }

        return make_result(session, report);
    }

    auto transfer_coordinator::run_download(const transfer_request& _request,
                                            const cancellation_token& _cancel,
                                            const transfer_session::progress_callback& _progress) const -> transfer_result
    {
        uint64_t    size = 0;
        std::string etag;
        std::string source_stamp;

        if (_request.object_size) {
            size = *_request.object_size;
        } else {
            request_options options;
            options.policy     = _request.retry_override;
            options.keep_going = [&_cancel]() { return !_cancel.is_cancelled(); };

            object_metadata metadata;
            const auto outcome = client_->head_object(_request.bucket, _request.key, metadata, options);
            if (!outcome.ok()) {
                return make_failed_result(outcome.error, "HeadObject: " + outcome.message);
            }

            size         = metadata.size;
            etag         = metadata.etag;
            source_stamp = etag.empty() ? metadata.last_modified : etag;

            if (size > constants::MAXIMUM_OBJECT_SIZE) {
                throw configuration_error{fmt::format("object size {} exceeds the {} byte limit",
                            size, constants::MAXIMUM_OBJECT_SIZE)};
            }
        }

        const bool multipart = use_multipart(size, _request.multipart_threshold);

        transfer_session session{multipart
            ? make_part_plan(size, _request.part_size, transfer_direction::download)
            : make_single_part_plan(size), _cancel};
        session.set_progress_callback(_progress);

        std::unique_ptr<resume_journal> journal;
        bool truncate = true;

        if (multipart && _request.resumable && resume_store_ && !source_stamp.empty()) {
            auto expected = identity_of(_request);
            expected.object_size  = size;
            expected.source_stamp = source_stamp;
            expected.part_size    = session.part_size();

            if (auto stored = load_record(*resume_store_, expected)) {
                boost::system::error_code ec;
                const bool partial_file_present = fs::is_regular_file(_request.local_path, ec)
                    && fs::file_size(_request.local_path, ec) == size;

                if (partial_file_present && restore_parts(session, *stored)) {
                    truncate = false;
                    expected = *stored;
                } else {
                    resume_store_->remove(expected);
                }
            }

            journal = std::make_unique<resume_journal>(*resume_store_, expected);
        }

        object_writer writer{_request.local_path, size, truncate};

        engine_hooks hooks;
        if (journal) {
            hooks.part_completed = [&journal](int _index, const std::string& _etag) {
                journal->part_completed(_index, _etag);
            };
        }

        const auto report = engine_.download(_request, session, writer, multipart, etag, hooks);

        if (journal && !keep_for_resume(_request, session)) {
            journal->discard();
        }

        {
            std::lock_guard<std::mutex> lock(report_mutex_);
            last_report_ = report;
        }

        return make_result(session, report);
    }

    auto transfer_coordinator::make_result(const transfer_session& _session,
                                           const engine_report& _report) const -> transfer_result
    {
        transfer_result result;
        result.state             = _session.state();
        result.bytes_transferred = _session.bytes_completed();
        result.parts_completed   = _session.completed_count();
        result.parts_total       = _session.part_count();
        result.parts_resumed     = _session.restored_count();
        result.multipart         = _report.multipart;

        for (const auto& p : _session.parts()) {
            if (part_state::failed == p.state) {
                result.part_errors.push_back({p.index, p.attempts, p.last_error, p.last_error_message});
            }
        }

        if (session_state::completed == result.state) {
            return result;
        }

        const auto cause = _session.error();
        if (session_state::failed == result.state && result.parts_completed > 0) {
            result.error = error_kind::partial_transfer_error;
            result.error_message = fmt::format("{} of {} parts completed; {} ({})", result.parts_completed,
                    result.parts_total, _session.error_message(), to_string(cause));
        } else {
            result.error = cause;
            result.error_message = fmt::format("{} of {} parts completed; {}", result.parts_completed,
                    result.parts_total, _session.error_message());
        }

        if (_report.upload_id_retained) {
            result.error_message += fmt::format("; upload {} kept for resume", _report.upload_id);
        }

        return result;
    }

    auto transfer_coordinator::last_report() const -> engine_report
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        return last_report_;
    }

} // s3_cli::io::s3_transfer
