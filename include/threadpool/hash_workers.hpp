#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <cstdint>
#include <exception>
#include <expected>
#include <future>
#include <memory>
#include <string>
#include <type_traits>

namespace net = boost::asio;

/**
 * Runs memory-hard hashing off the calling thread.
 *
 * Argon2 allocates its full memory cost per call, so the worker count caps
 * how much of it is live at once. run() blocks the caller until the job is
 * done.
 */
class HashWorkers
{
public:
    // 0 selects std::thread::hardware_concurrency()
    explicit HashWorkers(size_t n_threads);
    ~HashWorkers();

    HashWorkers(const HashWorkers&) = delete;
    HashWorkers& operator=(const HashWorkers&) = delete;
    HashWorkers(HashWorkers&&) = delete;
    HashWorkers& operator=(HashWorkers&&) = delete;

    template<class Fn>
    auto run(Fn&& fn) -> std::expected<std::invoke_result_t<Fn>, std::string>
    {
        using Ret = std::invoke_result_t<Fn>;

        if (!running)
        {
            return std::unexpected("HashWorkers stopped");
        }

        auto task = std::make_shared<std::packaged_task<Ret()>>(std::forward<Fn>(fn));
        auto fut = task->get_future();

        net::post(pool, [this, task] {
            ++started;
            (*task)();
        });

        try
        {
            if constexpr (std::is_void_v<Ret>)
            {
                fut.get();
                return {};
            }
            else
            {
                return fut.get();
            }
        }
        catch (const std::future_error& e)
        {
            // Job dropped by stop() before it ran
            return std::unexpected(std::string("HashWorkers job abandoned: ") + e.what());
        }
        catch (const std::exception& e)
        {
            return std::unexpected(std::string("HashWorkers job failed: ") + e.what());
        }
    }

    [[nodiscard]] size_t size() const { return n_workers; }

    // Jobs a worker has picked up; counted before the caller sees the result
    [[nodiscard]] uint64_t jobs_started() const { return started.load(); }

    void stop();

private:
    size_t n_workers;
    net::thread_pool pool;
    std::atomic<bool> running{true};
    std::atomic<uint64_t> started{0};
};
