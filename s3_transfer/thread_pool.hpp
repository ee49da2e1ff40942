#ifndef S3_CLI_THREAD_POOL_HPP
#define S3_CLI_THREAD_POOL_HPP

// boost includes
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

// stdlib includes
#include <utility>

namespace s3_cli
{

    /// Fixed-size worker pool. Destruction joins the workers, so a pool
    /// declared in a scope bounds the lifetime of everything posted to it.
    class thread_pool
    {
    public:

        explicit thread_pool(int _size)
            : pool_(_size < 1 ? 1 : _size)
        {
        }

        thread_pool(const thread_pool&) = delete;
        thread_pool& operator=(const thread_pool&) = delete;

        ~thread_pool()
        {
            pool_.join();
        }

        template <typename Function>
        static void post(thread_pool& _pool, Function&& _func)
        {
            boost::asio::post(_pool.pool_, std::forward<Function>(_func));
        }

        void join()
        {
            pool_.join();
        }

    private:

        boost::asio::thread_pool pool_;
    };

} // s3_cli

#endif // S3_CLI_THREAD_POOL_HPP
