#ifndef S3_CLI_RESUME_RECORD_HPP
#define S3_CLI_RESUME_RECORD_HPP

// stdlib includes
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

// local includes
#include "s3_transfer_types.hpp"

namespace s3_cli::io::s3_transfer
{

    /// Persisted progress of one transfer.
    ///
    /// The identity (direction, bucket, key, local path) selects the record;
    /// the source stamp (object size plus local mtime for uploads, remote ETag
    /// for downloads) and the part size decide whether it still applies.
    struct resume_record
    {
        transfer_direction         direction{transfer_direction::upload};
        std::string                bucket;
        std::string                key;
        std::string                local_path;
        uint64_t                   object_size{0};
        std::string                source_stamp;
        uint64_t                   part_size{0};
        std::string                upload_id;
        std::map<int, std::string> completed_parts; // index -> ETag (empty for downloads)

        bool same_identity(const resume_record& _other) const;

        // identity, size, stamp and part size all equal
        bool applies_to(const resume_record& _other) const;
    };

    auto to_json_string(const resume_record& _record) -> std::string;

    // Throws std::invalid_argument when _json is not a well formed record.
    auto parse_resume_record(const std::string& _json) -> resume_record;

    /// Directory of JSON sidecar records, one file per transfer identity.
    ///
    /// Files are replaced atomically (write to a temporary file, then rename)
    /// while holding a named mutex derived from the identity.
    class resume_store
    {
    public:

        // Record files are locked through named mutexes called
        // _lock_prefix followed by the identity hash.
        explicit resume_store(std::string _directory, std::string _lock_prefix = "s3_cli-");

        // Returns the stored record if it applies to _expected. A stored
        // record that is unreadable or stale is removed.
        auto load(const resume_record& _expected) const -> std::optional<resume_record>;

        // Throws local_io_error.
        void save(const resume_record& _record) const;

        void remove(const resume_record& _identity) const;

        auto record_path(const resume_record& _identity) const -> std::string;

        auto directory() const -> const std::string& { return directory_; }

    private:

        auto identity_hash(const resume_record& _identity) const -> std::string;

        std::string directory_;
        std::string lock_prefix_;
    };

    /// In-memory copy of one transfer's record, updated by the engine as parts
    /// complete and flushed to the store. Safe to call from any worker. One
    /// caller at a time writes the file, outside the journal mutex, and keeps
    /// writing until it has stored the latest version; changes arriving
    /// meanwhile are folded into that writer's next save. Persistence failures
    /// are logged and otherwise ignored.
    class resume_journal
    {
    public:

        resume_journal(const resume_store& _store, resume_record _record);

        resume_journal(const resume_journal&) = delete;
        auto operator=(const resume_journal&) -> resume_journal& = delete;

        void set_upload_id(const std::string& _upload_id);
        void part_completed(int _index, const std::string& _etag);

        // Removes the stored record.
        void discard();

        auto snapshot() const -> resume_record;

    private:

        // Called with _lock held on mutex_.
        void changed(std::unique_lock<std::mutex>& _lock);

        void persist(const resume_record& _snapshot) const;

        const resume_store&     store_;
        mutable std::mutex      mutex_;
        std::condition_variable idle_;
        resume_record           record_;
        uint64_t                version_{0};
        uint64_t                written_version_{0};
        bool                    writing_{false};
        bool                    discarded_{false};
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_RESUME_RECORD_HPP
