#include "threadpool/hash_workers.hpp"

#include <algorithm>
#include <thread>

namespace {

size_t resolve_count(size_t n_threads)
{
    if (n_threads > 0)
    {
        return n_threads;
    }
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

} // namespace

HashWorkers::HashWorkers(size_t n_threads)
    : n_workers(resolve_count(n_threads))
    , pool(n_workers)
{
}

HashWorkers::~HashWorkers()
{
    stop();
}

void HashWorkers::stop()
{
    if (bool was_running = running.exchange(false); !was_running)
    {
        return;
    }

    pool.stop();
    pool.join();
}
