#ifndef S3_CLI_RESUME_LOCK_HPP
#define S3_CLI_RESUME_LOCK_HPP

// boost includes
#include <boost/interprocess/sync/named_mutex.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>

// stdlib includes
#include <memory>
#include <string>

// local includes
#include "log.hpp"

namespace s3_cli::io::s3_transfer
{

    /// Holds a system wide named mutex for the lifetime of the object, so that
    /// processes resuming the same transfer never interleave their updates of
    /// its sidecar record.
    class resume_lock
    {
    public:

        resume_lock(const std::string& _key,
                    const char* _file = nullptr,
                    int _line = 0,
                    const char* _function = nullptr)
            : file_{_file}
            , line_{_line}
            , function_{_function}
            , mutex_name_{_key + RESUME_MUTEX_EXTENSION}
        {
            namespace bi = boost::interprocess;

            if (file_ != nullptr && function_ != nullptr) {
                log::debug(file_, line_, function_, "---LOCK--- waiting for lock " + mutex_name_);
            }

            named_mutex_ptr_ = std::make_unique<bi::named_mutex>(bi::open_or_create, mutex_name_.c_str());
            lock_ptr_ = std::make_unique<bi::scoped_lock<bi::named_mutex>>(*named_mutex_ptr_);

            if (file_ != nullptr && function_ != nullptr) {
                log::debug(file_, line_, function_, "---LOCK--- acquired lock " + mutex_name_);
            }
        }

        ~resume_lock()
        {
            // the scoped lock must be released before its mutex goes away
            lock_ptr_.reset();

            if (file_ != nullptr && function_ != nullptr) {
                log::debug(file_, line_, function_, "---LOCK--- released lock " + mutex_name_);
            }
        }

        resume_lock(resume_lock&&) = delete;
        resume_lock(const resume_lock&) = delete;
        resume_lock& operator=(const resume_lock&) = delete;
        resume_lock& operator=(resume_lock&&) = delete;

    private:

        inline static const std::string RESUME_MUTEX_EXTENSION{"-mtx"};

        const char*       file_;
        int               line_;
        const char*       function_;
        const std::string mutex_name_;

        std::unique_ptr<boost::interprocess::named_mutex> named_mutex_ptr_;
        std::unique_ptr<boost::interprocess::scoped_lock<boost::interprocess::named_mutex>> lock_ptr_;
    };

} // s3_cli::io::s3_transfer

#endif // S3_CLI_RESUME_LOCK_HPP
