#pragma once

#include <sqlite3.h>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace db
{

struct PoolOptions
{
    std::string path;
    size_t size = 4;
    std::chrono::milliseconds checkout_timeout{5000};
    std::chrono::milliseconds busy_timeout{5000};
};

/**
 * Fixed set of SQLite connections to one database file.
 *
 * Connections are handed out as Leases and go back to the pool when the
 * Lease is destroyed. A Lease must not outlive its pool. Each connection
 * is used by one thread at a time.
 *
 * ":memory:" opens an independent database per connection; use a file
 * (or a shared-cache URI) when size > 1.
 */
class ConnectionPool
{
public:
    class Lease
    {
    public:
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;

        [[nodiscard]] sqlite3* get() const { return conn; }

    private:
        friend class ConnectionPool;
        Lease(ConnectionPool& owner, sqlite3* handle);
        void reset();

        ConnectionPool* pool;
        sqlite3* conn;
    };

    [[nodiscard]] static std::expected<std::unique_ptr<ConnectionPool>, std::string> open(const PoolOptions& opts);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;
    ConnectionPool(ConnectionPool&&) = delete;
    ConnectionPool& operator=(ConnectionPool&&) = delete;

    // Waits up to the configured checkout timeout for a free connection
    [[nodiscard]] std::expected<Lease, std::string> acquire();

    [[nodiscard]] size_t size() const { return all.size(); }
    [[nodiscard]] size_t available() const;
    [[nodiscard]] const std::string& path() const { return opts.path; }

private:
    explicit ConnectionPool(PoolOptions options);

    [[nodiscard]] static std::expected<sqlite3*, std::string> connect(const PoolOptions& opts);
    void release(sqlite3* handle);

    PoolOptions opts;
    std::vector<sqlite3*> all;
    std::vector<sqlite3*> idle;
    mutable std::mutex mtx;
    std::condition_variable cv;
};

}
