#include "transfer_session.hpp"
#include "s3_transfer_error.hpp"

// stdlib includes
#include <algorithm>

// other includes
#include <fmt/format.h>

namespace s3_cli::io::s3_transfer
{

    transfer_session::transfer_session(part_plan _plan, cancellation_token _cancel)
        : object_size_{_plan.object_size}
        , part_size_{_plan.part_size}
        , cancel_{std::move(_cancel)}
        , parts_{std::move(_plan.parts)}
        , next_pending_{0}
        , state_{session_state::running}
        , completed_count_{0}
        , restored_count_{0}
        , bytes_completed_{0}
        , dispatch_count_{0}
        , error_{error_kind::none}
    {
    }

    auto transfer_session::find_part(int _index) -> part&
    {
        if (_index < 1 || static_cast<std::size_t>(_index) > parts_.size()) {
            throw s3_transfer_error{error_kind::configuration_error,
                fmt::format("part index {} out of range [1, {}]", _index, parts_.size())};
        }
        return parts_[_index - 1];
    }

    void transfer_session::update_state_from_token()
    {
        if (session_state::running == state_ && cancel_.is_cancelled()) {
            state_         = session_state::cancelled;
            error_         = error_kind::cancelled;
            error_message_ = "transfer cancelled";
        }
    }

    void transfer_session::restore_completed_part(int _index, const std::string& _etag)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& p = find_part(_index);
        if (part_state::completed == p.state) {
            return;
        }
        p.state          = part_state::completed;
        p.etag           = _etag;
        p.bytes_received = p.size();
        ++completed_count_;
        ++restored_count_;
        bytes_completed_ += p.size();
    }

    auto transfer_session::claim_next_part() -> std::optional<part>
    {
        std::lock_guard<std::mutex> lock(mutex_);

        update_state_from_token();
        if (session_state::running != state_) {
            return std::nullopt;
        }

        while (next_pending_ < parts_.size() && part_state::pending != parts_[next_pending_].state) {
            ++next_pending_;
        }
        if (next_pending_ >= parts_.size()) {
            return std::nullopt;
        }

        auto& p = parts_[next_pending_++];
        p.state = part_state::in_flight;
        ++dispatch_count_;
        return p;
    }

    void transfer_session::record_attempt(int _index, int _attempt, part_state _state)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& p = find_part(_index);
        p.attempts = _attempt;
        if (part_state::in_flight == _state || part_state::retry_scheduled == _state) {
            p.state = _state;
        }
    }

    bool transfer_session::complete_part(int _index, const std::string& _etag, uint64_t _bytes)
    {
        progress_callback progress;
        uint64_t bytes_completed = 0;

        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto& p = find_part(_index);
            if (session_state::running != state_) {
                // late result from a part that was in flight when the session stopped
                p.state = part_state::pending;
                return false;
            }

            p.state          = part_state::completed;
            p.etag           = _etag;
            p.bytes_received = _bytes;
            ++completed_count_;
            bytes_completed_ += p.size();

            progress        = progress_;
            bytes_completed = bytes_completed_;
        }

        if (progress) {
            progress(bytes_completed, object_size_);
        }

        return true;
    }

    void transfer_session::fail_part(int _index, error_kind _kind, const std::string& _message, int _attempts)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto& p = find_part(_index);
        p.state              = part_state::failed;
        p.attempts           = std::max(p.attempts, _attempts);
        p.last_error         = _kind;
        p.last_error_message = _message;

        if (session_state::running == state_) {
            state_         = session_state::failed;
            error_         = _kind;
            error_message_ = fmt::format("part {}: {}", _index, _message);
        }
    }

    void transfer_session::release_part(int _index, const std::string& _reason)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& p = find_part(_index);
        if (part_state::completed != p.state) {
            p.state              = part_state::pending;
            p.last_error         = error_kind::cancelled;
            p.last_error_message = _reason;
        }
    }

    void transfer_session::cancel()
    {
        cancel_.cancel();
        std::lock_guard<std::mutex> lock(mutex_);
        update_state_from_token();
    }

    void transfer_session::mark_completed()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_state::running == state_ && completed_count_ == static_cast<int>(parts_.size())) {
            state_ = session_state::completed;
        }
    }

    void transfer_session::mark_failed(error_kind _kind, const std::string& _message)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_state::running == state_) {
            state_         = error_kind::cancelled == _kind ? session_state::cancelled : session_state::failed;
            error_         = _kind;
            error_message_ = _message;
        }
    }

    void transfer_session::set_progress_callback(progress_callback _callback)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_ = std::move(_callback);
    }

    auto transfer_session::state() const -> session_state
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    bool transfer_session::is_running() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return session_state::running == state_ && !cancel_.is_cancelled();
    }

    bool transfer_session::all_parts_completed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_count_ == static_cast<int>(parts_.size());
    }

    auto transfer_session::part_count() const -> int
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(parts_.size());
    }

    auto transfer_session::completed_count() const -> int
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_count_;
    }

    auto transfer_session::restored_count() const -> int
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return restored_count_;
    }

    auto transfer_session::bytes_completed() const -> uint64_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return bytes_completed_;
    }

    auto transfer_session::dispatch_count() const -> uint64_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return dispatch_count_;
    }

    auto transfer_session::error() const -> error_kind
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_;
    }

    auto transfer_session::error_message() const -> std::string
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return error_message_;
    }

    auto transfer_session::completed_etags() const -> std::vector<std::pair<int, std::string>>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::pair<int, std::string>> etags;
        etags.reserve(completed_count_);
        for (const auto& p : parts_) {
            if (part_state::completed == p.state) {
                etags.emplace_back(p.index, p.etag);
            }
        }
        return etags;
    }

    auto transfer_session::parts() const -> std::vector<part>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return parts_;
    }

} // s3_cli::io::s3_transfer
