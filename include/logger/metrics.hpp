#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <algorithm>
#include <ranges>
#include <string>
#include <vector>

struct AuthMetrics
{
    std::atomic<uint64_t> tokens_issued{0};
    std::atomic<uint64_t> tokens_invalidated{0};
    std::atomic<uint64_t> key_collisions{0};
    std::atomic<uint64_t> generation_exhausted{0};
    std::atomic<uint64_t> authentications_successful{0};
    std::atomic<uint64_t> authentications_rejected{0};
    std::atomic<uint64_t> store_failures{0};

    // Set once at construction; counters only ever grow
    const std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

    AuthMetrics() = default;

};

template<>
struct std::formatter<AuthMetrics>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const AuthMetrics& s, std::format_context& fc) const
    {
        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - s.start_time).count();

        uint64_t auth_ok = s.authentications_successful.load();
        uint64_t auth_rej = s.authentications_rejected.load();

        std::vector<std::string> lines;

        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("AUTH METRICS REPORT"));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("Uptime: {}s", uptime));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- TOKENS ---"));
        lines.push_back(std::format("  Issued:          {}", s.tokens_issued.load()));
        lines.push_back(std::format("  Invalidated:     {}", s.tokens_invalidated.load()));
        lines.push_back(std::format("  Key Collisions:  {}", s.key_collisions.load()));
        lines.push_back(std::format("  Exhausted:       {}", s.generation_exhausted.load()));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- AUTHENTICATION ---"));
        lines.push_back(std::format("  Successful:      {}", auth_ok));
        lines.push_back(std::format("  Rejected:        {}", auth_rej));
        lines.push_back(std::format("  Success Rate:    {:.1f}%", auth_ok + auth_rej > 0 ?
                    (auth_ok * 100.0 / (auth_ok + auth_rej)) : 0.0));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- ERRORS ---"));
        lines.push_back(std::format("  Store Failures:  {}", s.store_failures.load()));
        lines.push_back(std::format("============================================================"));

        return std::ranges::copy(lines | std::views::join_with('\n'), fc.out()).out;
    }
};
