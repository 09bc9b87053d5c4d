#include "logger/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

Logger::State& Logger::instance()
{
    static State s;
    return s;
}

Logger::Level Logger::parse_level(std::string_view lvl)
{
    std::string lower;
    lower.reserve(lvl.size());
    std::ranges::transform(lvl, std::back_inserter(lower),
                           [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Level::Debug;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return Level::Info;
}

std::string_view Logger::level_str(Level l)
{
    switch (l)
    {
        case Level::Debug: return "DEBUG";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        default:           return "INFO";
    }
}

std::string Logger::timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&secs, &tm);
    return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
                       tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                       tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count());
}

// Caller holds s.mtx
uint32_t Logger::thread_tag(State& s)
{
    thread_local uint32_t tag = 0;
    if (tag == 0)
    {
        tag = s.next_thread++;
    }
    return tag;
}

std::expected<void, std::string> Logger::init(std::string_view level,
                                               std::string_view file,
                                               size_t max_size_mb,
                                               bool enable_console)
{
    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);

    s.lvl = parse_level(level);
    s.console = enable_console;
    s.max_size = static_cast<uint64_t>(max_size_mb) * 1024 * 1024;
    s.filename = std::string(file);
    s.written = 0;

    if (s.file.is_open())
    {
        s.file.close();
    }
    if (s.filename.empty())
    {
        return {};
    }

    s.file.open(s.filename, std::ios::app);
    if (!s.file.is_open())
    {
        return std::unexpected("Failed to open log file: " + s.filename);
    }

    std::error_code ec;
    if (auto size = fs::file_size(s.filename, ec); !ec)
    {
        s.written = size;
    }
    return {};
}

void Logger::shutdown()
{
    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.file.close();
}

// Keeps one previous generation: <file> -> <file>.1
void Logger::rotate(State& s)
{
    s.file.close();
    std::error_code ec;
    fs::rename(s.filename, s.filename + ".1", ec);
    s.file.open(s.filename, std::ios::trunc);
    s.written = 0;
    if (ec && s.console)
    {
        std::cerr << std::format("[{}] [WARN] log rotation failed: {}\n", timestamp(), ec.message());
    }
}

void Logger::write(Level l, const std::string& msg)
{
    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);

    auto line = std::format("[{}] [T{}] [{}] {}\n", timestamp(), thread_tag(s), level_str(l), msg);

    if (s.console)
    {
        auto& out = (l >= Level::Warn) ? std::cerr : std::cout;
        out << line;
    }
    if (!s.file.is_open())
    {
        return;
    }
    if (s.max_size > 0 && s.written > 0 && s.written + line.size() > s.max_size)
    {
        rotate(s);
    }
    s.file << line;
    s.file.flush();
    s.written += line.size();
}
