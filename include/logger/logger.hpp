#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

/**
 * Process-wide logger.
 *
 * Lines look like `[time] [T<n>] [LEVEL] message`, where n numbers threads in
 * the order they first log. The file sink keeps one rotated generation
 * (`<file>.1`) once it grows past max_size_mb.
 */
class Logger
{
public:
    enum class Level { Debug, Info, Warn, Error };

    [[nodiscard]] static std::expected<void, std::string> init(std::string_view level,
                                                                std::string_view file,
                                                                size_t max_size_mb,
                                                                bool enable_console);
    static void shutdown();

    [[nodiscard]] static bool enabled(Level l) { return instance().lvl <= l; }

    template<typename... Args>
    static void log(Level l, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(l))
        {
            write(l, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    static void debug(std::format_string<Args...> fmt, Args&&... args)
    {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(std::format_string<Args...> fmt, Args&&... args)
    {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(std::format_string<Args...> fmt, Args&&... args)
    {
        log(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(std::format_string<Args...> fmt, Args&&... args)
    {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

private:
    struct State
    {
        Level lvl = Level::Info;
        bool console = true;
        std::ofstream file;
        std::string filename;
        uint64_t max_size = 100 * 1024 * 1024;
        uint64_t written = 0;
        uint32_t next_thread = 1;
        std::mutex mtx;
    };

    static State& instance();
    static Level parse_level(std::string_view lvl);
    static std::string_view level_str(Level l);
    static std::string timestamp();
    static uint32_t thread_tag(State& s);
    static void rotate(State& s);
    static void write(Level l, const std::string& msg);
};

#define LOG_DEBUG(...) Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) Logger::error(__VA_ARGS__)
