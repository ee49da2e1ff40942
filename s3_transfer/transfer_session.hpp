#ifndef S3_CLI_TRANSFER_SESSION_HPP
#define S3_CLI_TRANSFER_SESSION_HPP

// stdlib includes
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// local includes
#include "cancellation_token.hpp"
#include "part_plan.hpp"
#include "s3_transfer_types.hpp"

namespace s3_cli::io::s3_transfer
{

    /// Runtime state of one transfer: every Part's state, the completion
    /// counter, the ETags (ordered by part index) and the session state.
    ///
    /// All mutation goes through one mutex. Workers receive copies of parts,
    /// never references into the session.
    class transfer_session
    {
    public:

        using progress_callback = std::function<void(uint64_t _bytes_completed, uint64_t _total_bytes)>;

        explicit transfer_session(part_plan _plan, cancellation_token _cancel = cancellation_token{});

        transfer_session(const transfer_session&) = delete;
        auto operator=(const transfer_session&) -> transfer_session& = delete;

        // Marks a part completed from a persisted record before any dispatch.
        void restore_completed_part(int _index, const std::string& _etag);

        // Hands out the next pending part (lowest index first) and marks it in
        // flight. Returns nothing once the session is no longer running, when
        // cancellation was requested, or when no pending part is left.
        auto claim_next_part() -> std::optional<part>;

        void record_attempt(int _index, int _attempt, part_state _state);

        // Returns false when the session is no longer running and the result
        // was discarded.
        bool complete_part(int _index, const std::string& _etag, uint64_t _bytes);

        // Fails the part and, if still running, the session. The first failure
        // becomes the session's terminal error.
        void fail_part(int _index, error_kind _kind, const std::string& _message, int _attempts);

        // Returns an in-flight part whose request was abandoned after the
        // session stopped running to the pending state.
        void release_part(int _index, const std::string& _reason);

        void cancel();

        // Session level outcomes once the part phase is over.
        void mark_completed();
        void mark_failed(error_kind _kind, const std::string& _message);

        void set_progress_callback(progress_callback _callback);

        auto state() const -> session_state;
        bool is_running() const;
        bool all_parts_completed() const;

        auto part_count() const -> int;
        auto completed_count() const -> int;
        auto restored_count() const -> int;
        auto bytes_completed() const -> uint64_t;
        auto dispatch_count() const -> uint64_t;
        auto object_size() const -> uint64_t { return object_size_; }
        auto part_size() const -> uint64_t { return part_size_; }

        auto error() const -> error_kind;
        auto error_message() const -> std::string;

        // (index, etag) of completed parts in ascending index order.
        auto completed_etags() const -> std::vector<std::pair<int, std::string>>;

        auto parts() const -> std::vector<part>;

    private:

        auto find_part(int _index) -> part&;
        void update_state_from_token();

        const uint64_t     object_size_;
        const uint64_t     part_size_;
        cancellation_token cancel_;

        mutable std::mutex mutex_;
        std::vector<part>  parts_;
        std::size_t        next_pending_;
        session_state      state_;
        int                completed_count_;
        int                restored_count_;
        uint64_t           bytes_completed_;
        uint64_t           dispatch_count_;
        error_kind         error_;
        std::string        error_message_;
        progress_callback  progress_;
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_TRANSFER_SESSION_HPP
