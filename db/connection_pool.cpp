#include "db/connection_pool.hpp"
#include "logger/logger.hpp"

#include <format>

namespace db
{

ConnectionPool::Lease::Lease(ConnectionPool& owner, sqlite3* handle)
    : pool(std::addressof(owner))
    , conn(handle)
{
}

ConnectionPool::Lease::~Lease()
{
    reset();
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool(other.pool)
    , conn(other.conn)
{
    other.pool = nullptr;
    other.conn = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept
{
    if (this != &other)
    {
        reset();
        pool = other.pool;
        conn = other.conn;
        other.pool = nullptr;
        other.conn = nullptr;
    }
    return *this;
}

void ConnectionPool::Lease::reset()
{
    if (pool && conn)
    {
        pool->release(conn);
    }
    pool = nullptr;
    conn = nullptr;
}

std::expected<sqlite3*, std::string> ConnectionPool::connect(const PoolOptions& opts)
{
    sqlite3* handle = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX | SQLITE_OPEN_URI;
    int rc = sqlite3_open_v2(opts.path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK)
    {
        std::string err = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        return std::unexpected(err);
    }

    sqlite3_busy_timeout(handle, static_cast<int>(opts.busy_timeout.count()));

    for (const char* pragma : {"PRAGMA journal_mode=WAL;", "PRAGMA synchronous=NORMAL;", "PRAGMA foreign_keys=ON;"})
    {
        char* err = nullptr;
        if (sqlite3_exec(handle, pragma, nullptr, nullptr, std::addressof(err)) != SQLITE_OK)
        {
            std::string msg = std::format("{} failed: {}", pragma, err ? err : sqlite3_errmsg(handle));
            sqlite3_free(err);
            sqlite3_close(handle);
            return std::unexpected(msg);
        }
    }
    return handle;
}

std::expected<std::unique_ptr<ConnectionPool>, std::string> ConnectionPool::open(const PoolOptions& opts)
{
    if (opts.size == 0)
    {
        return std::unexpected("Connection pool size must be positive");
    }

    std::unique_ptr<ConnectionPool> pool(new ConnectionPool(opts));
    for (size_t i = 0; i < opts.size; ++i)
    {
        auto handle = connect(opts);
        if (!handle)
        {
            return std::unexpected(std::format("Failed to open {}: {}", opts.path, handle.error()));
        }
        pool->all.push_back(*handle);
        pool->idle.push_back(*handle);
    }

    LOG_INFO("Opened {} connection(s) to {}", opts.size, opts.path);
    return pool;
}

ConnectionPool::ConnectionPool(PoolOptions options)
    : opts(std::move(options))
{
}

ConnectionPool::~ConnectionPool()
{
    std::lock_guard<std::mutex> lock(mtx);
    if (idle.size() != all.size())
    {
        LOG_WARN("Connection pool for {} destroyed with {} lease(s) outstanding",
                 opts.path, all.size() - idle.size());
    }
    for (auto* handle : all)
    {
        sqlite3_close_v2(handle);
    }
}

std::expected<ConnectionPool::Lease, std::string> ConnectionPool::acquire()
{
    std::unique_lock<std::mutex> lock(mtx);
    if (!cv.wait_for(lock, opts.checkout_timeout, [this] { return !idle.empty(); }))
    {
        LOG_WARN("Connection checkout timed out after {}ms", opts.checkout_timeout.count());
        return std::unexpected(std::format("Timed out waiting {}ms for a database connection",
                                           opts.checkout_timeout.count()));
    }
    sqlite3* handle = idle.back();
    idle.pop_back();
    return Lease(*this, handle);
}

size_t ConnectionPool::available() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return idle.size();
}

void ConnectionPool::release(sqlite3* handle)
{
    {
        std::lock_guard<std::mutex> lock(mtx);
        idle.push_back(handle);
    }
    cv.notify_one();
}

}
