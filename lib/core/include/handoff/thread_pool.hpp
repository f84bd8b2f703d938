#ifndef HANDOFF_THREAD_POOL_HPP
#define HANDOFF_THREAD_POOL_HPP

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/thread.hpp>

#include <memory>
#include <optional>
#include <utility>

namespace handoff
{
    class thread_pool
    {
    public:
        explicit thread_pool(int _size)
            : io_context_{std::make_shared<boost::asio::io_context>()}
            , work_{boost::asio::make_work_guard(*io_context_)}
        {
            for (decltype(_size) i{}; i < _size; i++) {
                thread_group_.create_thread([this] {
                    io_context_->run();
                });
            }
        }

        thread_pool(const thread_pool&) = delete;
        auto operator=(const thread_pool&) -> thread_pool& = delete;

        ~thread_pool()
        {
            stop();
            join();
        }

        template <typename Function>
        static inline void post(thread_pool& _pool, Function&& _func)
        {
            _pool.post(std::forward<Function>(_func));
        }

        void join()
        {
            thread_group_.join_all();
        }

        // Abandons posted functions which have not started yet.
        void stop()
        {
            if (io_context_) {
                io_context_->stop();
            }
        }

    private:
        using work_guard_type = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

        boost::thread_group thread_group_;
        std::shared_ptr<boost::asio::io_context> io_context_;
        std::optional<work_guard_type> work_;

        template <typename Function>
        void post(Function&& _func)
        {
            boost::asio::post(*io_context_, std::forward<Function>(_func));
        }
    }; // class thread_pool
} // namespace handoff

#endif // HANDOFF_THREAD_POOL_HPP
