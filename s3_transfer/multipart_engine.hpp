#ifndef S3_CLI_MULTIPART_ENGINE_HPP
#define S3_CLI_MULTIPART_ENGINE_HPP

// stdlib includes
#include <functional>
#include <memory>
#include <string>

// local includes
#include "object_io.hpp"
#include "s3_client.hpp"
#include "s3_transfer_types.hpp"
#include "transfer_session.hpp"

namespace s3_cli::io::s3_transfer
{

    // Callbacks used to persist progress. Both may be invoked from worker
    // threads and must not throw.
    struct engine_hooks
    {
        std::function<void(const std::string& _upload_id)>                upload_initiated;
        std::function<void(int _index, const std::string& _etag)>         part_completed;
    };

    struct engine_report
    {
        bool        multipart{false};
        std::string upload_id;
        bool        upload_id_retained{false}; // kept for a later resume instead of aborted
        int         abort_requests{0};
    };

    /// Drives the parts of one transfer session through a bounded worker pool.
    ///
    /// Workers pull parts from the session until it runs dry or stops running;
    /// each part goes through the transport's retry state machine, whose
    /// attempts are mirrored into the session. The first part that fails for
    /// good fails the session, which stops further dispatch. Parts still in
    /// flight finish on their own and their results are dropped.
    class multipart_engine
    {
    public:

        explicit multipart_engine(std::shared_ptr<s3_client> _client);

        // Multipart upload when _session has been planned for it, otherwise a
        // single PutObject. _resume_upload_id continues an existing upload.
        auto upload(const transfer_request& _request,
                    transfer_session& _session,
                    const object_reader& _reader,
                    bool _multipart,
                    const std::string& _resume_upload_id = {},
                    const engine_hooks& _hooks = {}) const -> engine_report;

        // Ranged GETs written at each part's offset, or one GetObject.
        // A non-empty _etag makes every ranged GET conditional on it.
        auto download(const transfer_request& _request,
                      transfer_session& _session,
                      const object_writer& _writer,
                      bool _multipart,
                      const std::string& _etag = {},
                      const engine_hooks& _hooks = {}) const -> engine_report;

    private:

        using part_action = std::function<void(const part&)>;

        // Runs _action over every part the session hands out, with at most
        // max_parallel_parts workers. Returns once all workers are idle.
        void run_parts(const transfer_request& _request,
                       transfer_session& _session,
                       const part_action& _action) const;

        auto options_for(const transfer_request& _request,
                         transfer_session& _session,
                         int _index) const -> request_options;

        // A part whose request was abandoned goes back to pending; any other
        // failure fails the part and with it the session.
        void record_failure(transfer_session& _session,
                            const part& _part,
                            const request_outcome& _outcome) const;

        // Settles a session whose workers stopped because of a cancellation
        // that no claim observed.
        void settle(transfer_session& _session) const;

        void finish_upload(const transfer_request& _request,
                           transfer_session& _session,
                           const engine_hooks& _hooks,
                           engine_report& _report) const;

        void abort_upload(const transfer_request& _request,
                          const std::string& _upload_id,
                          engine_report& _report) const;

        std::shared_ptr<s3_client> client_;
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_MULTIPART_ENGINE_HPP
