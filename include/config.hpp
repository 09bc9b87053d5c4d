#pragma once

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <optional>
#include <cstdint>
#include <chrono>

namespace json = boost::json;

/**
 * Service configuration loaded from JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct DatabaseCfg
    {
        std::string path = "sonar.db";
        size_t pool_size = 4;
        std::chrono::milliseconds checkout_timeout{5000};
        std::chrono::milliseconds busy_timeout{5000};
    };

    struct AccountsCfg
    {
        size_t min_password_length = 16;
        size_t hash_workers = 0;
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath, std::optional<std::string> cli_db_path = std::nullopt);
    [[nodiscard]] static Config load_defaults(std::optional<std::string> cli_db_path = std::nullopt);
    [[nodiscard]] static Config load_or_defaults(const std::string& filepath, std::optional<std::string> cli_db_path = std::nullopt);

    // A path the operator named must load; the implicit default may fall back
    [[nodiscard]] static std::expected<Config, std::string> resolve(const std::string& filepath, bool named_by_user,
                                                                    std::optional<std::string> cli_db_path = std::nullopt);

    [[nodiscard]] const DatabaseCfg& database() const { return db; }
    [[nodiscard]] const AccountsCfg& accounts() const { return acct; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

private:
    DatabaseCfg db;
    AccountsCfg acct;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
