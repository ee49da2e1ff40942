#include "multipart_engine.hpp"
#include "s3_transfer_error.hpp"
#include "thread_pool.hpp"
#include "log.hpp"

// stdlib includes
#include <algorithm>

// other includes
#include <fmt/format.h>

namespace s3_cli::io::s3_transfer
{

    multipart_engine::multipart_engine(std::shared_ptr<s3_client> _client)
        : client_{std::move(_client)}
    {
    }

    auto multipart_engine::options_for(const transfer_request& _request,
                                       transfer_session& _session,
                                       int _index) const -> request_options
    {
        request_options options;
        options.policy = _request.retry_override;

        options.observer = [&_session, _index](int _attempt, part_state _state,
                                               const request_outcome& _outcome,
                                               std::chrono::milliseconds _delay) {
            _session.record_attempt(_index, _attempt, _state);
            if (part_state::retry_scheduled == _state) {
                log::debug(__FILE__, __LINE__, __FUNCTION__,
                        fmt::format("part {} attempt {} failed [{}], next attempt in {} ms",
                            _index, _attempt, _outcome.message, _delay.count()));
            }
        };

        options.keep_going = [&_session]() { return _session.is_running(); };

        return options;
    }

    void multipart_engine::record_failure(transfer_session& _session,
                                          const part& _part,
                                          const request_outcome& _outcome) const
    {
        if (error_kind::cancelled == _outcome.error) {
            log::debug(__FILE__, __LINE__, __FUNCTION__,
                    fmt::format("part {} abandoned: {}", _part.index, _outcome.message));
            _session.release_part(_part.index, _outcome.message);
            return;
        }

        log::error(fmt::format("part {} [{}, {}) failed after {} attempt(s): {}",
                    _part.index, _part.start, _part.end, _outcome.attempts, _outcome.message));
        _session.fail_part(_part.index, _outcome.error, _outcome.message, _outcome.attempts);
    }

    void multipart_engine::settle(transfer_session& _session) const
    {
        if (session_state::running != _session.state()) {
            return;
        }
        if (!_session.is_running() || !_session.all_parts_completed()) {
            _session.mark_failed(error_kind::cancelled, "transfer cancelled");
        }
    }

    void multipart_engine::run_parts(const transfer_request& _request,
                                     transfer_session& _session,
                                     const part_action& _action) const
    {
        const int worker_count = std::max(1, std::min(_request.max_parallel_parts, _session.part_count()));

        log::debug(__FILE__, __LINE__, __FUNCTION__,
                fmt::format("{} {}/{}: {} parts of {} bytes on {} workers", to_string(_request.direction),
                    _request.bucket, _request.key, _session.part_count(), _session.part_size(), worker_count));

        thread_pool workers{worker_count};

        for (int worker = 0; worker < worker_count; ++worker) {
            thread_pool::post(workers, [&_session, &_action] () {
                while (auto next = _session.claim_next_part()) {
                    try {
                        _action(*next);
                    }
                    catch (const s3_transfer_error& e) {
                        log::error(fmt::format("part {} failed: {}", next->index, e.what()));
                        _session.fail_part(next->index, e.kind(), e.what(), next->attempts);
                    }
                    catch (const std::exception& e) {
                        log::error(fmt::format("part {} failed: {}", next->index, e.what()));
                        _session.fail_part(next->index, error_kind::local_io_error, e.what(), next->attempts);
                    }
                }
            });
        }

        workers.join();
    }

    auto multipart_engine::upload(const transfer_request& _request,
                                  transfer_session& _session,
                                  const object_reader& _reader,
                                  bool _multipart,
                                  const std::string& _resume_upload_id,
                                  const engine_hooks& _hooks) const -> engine_report
    {
        engine_report report;
        report.multipart = _multipart;

        if (!_multipart) {
            run_parts(_request, _session, [&](const part& _part) {
                const auto body = _reader.read(_part.start, _part.size());

                std::string etag;
                const auto outcome = client_->put_object(_request.bucket, _request.key, body, etag,
                        options_for(_request, _session, _part.index));

                if (!outcome.ok()) {
                    record_failure(_session, _part, outcome);
                    return;
                }
                _session.complete_part(_part.index, etag, body.size());
            });

            settle(_session);
            _session.mark_completed();
            return report;
        }

        std::string upload_id = _resume_upload_id;
        if (upload_id.empty()) {
            request_options options;
            options.policy     = _request.retry_override;
            options.keep_going = [&_session]() { return _session.is_running(); };

            const auto outcome = client_->initiate_multipart_upload(_request.bucket, _request.key, upload_id, options);
            if (!outcome.ok()) {
                log::error(fmt::format("cannot start multipart upload of {}/{}: {}",
                            _request.bucket, _request.key, outcome.message));
                _session.mark_failed(outcome.error, "InitiateMultipartUpload: " + outcome.message);
                return report;
            }

            if (_hooks.upload_initiated) {
                _hooks.upload_initiated(upload_id);
            }
        } else {
            log::info(fmt::format("resuming upload {} of {}/{} with {} of {} parts already stored",
                        upload_id, _request.bucket, _request.key, _session.completed_count(), _session.part_count()));
        }

        report.upload_id = upload_id;

        run_parts(_request, _session, [&](const part& _part) {
            const auto body = _reader.read(_part.start, _part.size());

            std::string etag;
            const auto outcome = client_->upload_part(_request.bucket, _request.key, upload_id,
                    _part.index, body, etag, options_for(_request, _session, _part.index));

            if (!outcome.ok()) {
                record_failure(_session, _part, outcome);
                return;
            }

            if (_session.complete_part(_part.index, etag, body.size()) && _hooks.part_completed) {
                _hooks.part_completed(_part.index, etag);
            }
        });

        finish_upload(_request, _session, _hooks, report);
        return report;
    }

    void multipart_engine::finish_upload(const transfer_request& _request,
                                         transfer_session& _session,
                                         const engine_hooks& _hooks,
                                         engine_report& _report) const
    {
        settle(_session);

        if (_session.is_running() && _session.all_parts_completed()) {
            request_options options;
            options.policy     = _request.retry_override;
            options.keep_going = [&_session]() { return _session.is_running(); };

            // listed by ascending part number whatever order the parts finished in
            const auto outcome = client_->complete_multipart_upload(_request.bucket, _request.key,
                    _report.upload_id, _session.completed_etags(), options);

            if (outcome.ok()) {
                _session.mark_completed();
                return;
            }

            _session.mark_failed(outcome.error, "CompleteMultipartUpload: " + outcome.message);
        }

        const auto error = _session.error();
        const bool resumable = _request.resumable && _hooks.part_completed
            && (error_kind::transient_network_error == error || error_kind::cancelled == error);

        if (resumable) {
            _report.upload_id_retained = true;
            log::info(fmt::format("keeping upload {} of {}/{} for a later resume ({} of {} parts stored)",
                        _report.upload_id, _request.bucket, _request.key,
                        _session.completed_count(), _session.part_count()));
            return;
        }

        abort_upload(_request, _report.upload_id, _report);
    }

    void multipart_engine::abort_upload(const transfer_request& _request,
                                        const std::string& _upload_id,
                                        engine_report& _report) const
    {
        ++_report.abort_requests;

        // best effort and sent once, even when the transfer was cancelled
        request_options options;
        options.policy = _request.retry_override.value_or(client_->transport().default_policy());
        options.policy->max_attempts = 1;

        const auto outcome = client_->abort_multipart_upload(_request.bucket, _request.key, _upload_id, options);
        if (!outcome.ok()) {
            log::warn(fmt::format("abort of upload {} for {}/{} failed: {}",
                        _upload_id, _request.bucket, _request.key, outcome.message));
            return;
        }

        log::debug(__FILE__, __LINE__, __FUNCTION__,
                fmt::format("aborted upload {} for {}/{}", _upload_id, _request.bucket, _request.key));
    }

    auto multipart_engine::download(const transfer_request& _request,
                                    transfer_session& _session,
                                    const object_writer& _writer,
                                    bool _multipart,
                                    const std::string& _etag,
                                    const engine_hooks& _hooks) const -> engine_report
    {
        engine_report report;
        report.multipart = _multipart;

        if (!_multipart) {
            run_parts(_request, _session, [&](const part& _part) {
                std::string body;
                const auto outcome = client_->get_object(_request.bucket, _request.key, body,
                        options_for(_request, _session, _part.index));

                if (!outcome.ok()) {
                    record_failure(_session, _part, outcome);
                    return;
                }

                if (body.size() != _part.size()) {
                    _session.fail_part(_part.index, error_kind::server_rejection_error,
                            fmt::format("object size changed: expected {} bytes, received {}", _part.size(), body.size()),
                            outcome.attempts);
                    return;
                }

                if (!body.empty()) {
                    _writer.write(0, body);
                }
                _session.complete_part(_part.index, {}, body.size());
            });
        } else {
            run_parts(_request, _session, [&](const part& _part) {
                std::string body;
                const auto outcome = client_->get_object_range(_request.bucket, _request.key,
                        _part.start, _part.end, _etag, body, options_for(_request, _session, _part.index));

                if (!outcome.ok()) {
                    record_failure(_session, _part, outcome);
                    return;
                }

                _writer.write(_part.start, body);

                if (_session.complete_part(_part.index, {}, body.size()) && _hooks.part_completed) {
                    _hooks.part_completed(_part.index, {});
                }
            });
        }

        settle(_session);

        if (_session.is_running() && _session.all_parts_completed()) {
            try {
                _writer.flush();
                _session.mark_completed();
            }
            catch (const local_io_error& e) {
                _session.mark_failed(error_kind::local_io_error, e.what());
            }
        }

        return report;
    }

} // s3_cli::io::s3_transfer
