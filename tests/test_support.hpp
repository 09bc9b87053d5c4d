#pragma once

#include "db/connection_pool.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Database file under /tmp that is removed (with its WAL files) on both ends
struct TempDb
{
    std::string path;

    explicit TempDb(std::string_view name)
        : path(std::string("/tmp/sonar_test_") + std::string(name) + ".db")
    {
        remove_files();
    }

    ~TempDb()
    {
        remove_files();
    }

    TempDb(const TempDb&) = delete;
    TempDb& operator=(const TempDb&) = delete;

    [[nodiscard]] db::PoolOptions options(size_t size = 4) const
    {
        db::PoolOptions opts;
        opts.path = path;
        opts.size = size;
        opts.checkout_timeout = std::chrono::milliseconds(2000);
        opts.busy_timeout = std::chrono::milliseconds(5000);
        return opts;
    }

    void remove_files() const
    {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm"})
        {
            fs::remove(path + suffix, ec);
        }
    }
};

inline std::vector<std::string> token_header(std::string_view key)
{
    return {"Token " + std::string(key)};
}
