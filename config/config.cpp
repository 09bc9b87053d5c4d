#include "config.hpp"

#include <fstream>
#include <sstream>
#include <format>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().get_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

std::expected<std::string, std::string> get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return std::string(default_val);
    }
    if (!it->value().is_string())
    {
        return std::unexpected(std::format("'{}' must be a string", key));
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

std::expected<void, std::string> parse_database(const json::object& obj, Config::DatabaseCfg& out)
{
    auto path = get_string(obj, "path", out.path);
    if (!path)
    {
        return std::unexpected(path.error());
    }
    if (path->empty())
    {
        return std::unexpected("'path' must not be empty");
    }
    auto pool = get_uint<size_t>(obj, "pool_size", 1, 64, out.pool_size);
    if (!pool)
    {
        return std::unexpected(pool.error());
    }
    auto checkout = get_uint<uint64_t>(obj, "checkout_timeout_ms", 1, 600000, out.checkout_timeout.count());
    if (!checkout)
    {
        return std::unexpected(checkout.error());
    }
    auto busy = get_uint<uint64_t>(obj, "busy_timeout_ms", 0, 600000, out.busy_timeout.count());
    if (!busy)
    {
        return std::unexpected(busy.error());
    }

    out.path = std::move(*path);
    out.pool_size = *pool;
    out.checkout_timeout = std::chrono::milliseconds(*checkout);
    out.busy_timeout = std::chrono::milliseconds(*busy);
    return {};
}

std::expected<void, std::string> parse_accounts(const json::object& obj, Config::AccountsCfg& out)
{
    auto min_len = get_uint<size_t>(obj, "min_password_length", 1, 1024, out.min_password_length);
    if (!min_len)
    {
        return std::unexpected(min_len.error());
    }
    auto workers = get_uint<size_t>(obj, "hash_workers", 0, 256, out.hash_workers);
    if (!workers)
    {
        return std::unexpected(workers.error());
    }

    out.min_password_length = *min_len;
    out.hash_workers = *workers;
    return {};
}

std::expected<void, std::string> parse_logging(const json::object& obj, Config::LoggingCfg& out)
{
    auto level = get_string(obj, "level", out.level);
    if (!level)
    {
        return std::unexpected(level.error());
    }
    auto file = get_string(obj, "file", out.file);
    if (!file)
    {
        return std::unexpected(file.error());
    }
    auto max_size = get_uint<size_t>(obj, "max_size_mb", 1, 10000, out.max_size_mb);
    if (!max_size)
    {
        return std::unexpected(max_size.error());
    }

    out.level = std::move(*level);
    out.file = std::move(*file);
    out.max_size_mb = *max_size;
    out.enable_console = get_bool(obj, "enable_console", out.enable_console);
    return {};
}

// Missing or non-object sections keep their defaults
template<class Section, class Fn>
std::expected<void, std::string> section(const json::object& root, std::string_view name, Section& out, Fn parse_fn)
{
    auto it = root.find(name);
    if (it == root.end() || !it->value().is_object())
    {
        return {};
    }
    if (auto res = parse_fn(it->value().as_object(), out); !res)
    {
        return std::unexpected(std::format("{}: {}", name, res.error()));
    }
    return {};
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath, std::optional<std::string> cli_db_path)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    boost::system::error_code ec;
    json::value jv = json::parse(buffer.str(), ec);
    if (ec)
    {
        return std::unexpected(std::format("JSON parse error: {}", ec.message()));
    }

    auto result = parse(jv);
    if (result && cli_db_path.has_value())
    {
        result->db.path = std::move(*cli_db_path);
    }
    return result;
}

Config Config::load_defaults(std::optional<std::string> cli_db_path)
{
    Config cfg{};
    if (cli_db_path.has_value())
    {
        cfg.db.path = std::move(*cli_db_path);
    }
    return cfg;
}

Config Config::load_or_defaults(const std::string& filepath, std::optional<std::string> cli_db_path)
{
    auto result = load(filepath, cli_db_path);
    if (result)
    {
        return *result;
    }
    return load_defaults(std::move(cli_db_path));
}

std::expected<Config, std::string> Config::resolve(const std::string& filepath, bool named_by_user,
                                                   std::optional<std::string> cli_db_path)
{
    if (named_by_user)
    {
        return load(filepath, std::move(cli_db_path));
    }
    return load_or_defaults(filepath, std::move(cli_db_path));
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();

    Config config;
    if (auto res = section(root, "database", config.db, parse_database); !res)
    {
        return std::unexpected(res.error());
    }
    if (auto res = section(root, "accounts", config.acct, parse_accounts); !res)
    {
        return std::unexpected(res.error());
    }
    if (auto res = section(root, "logging", config.log, parse_logging); !res)
    {
        return std::unexpected(res.error());
    }
    return config;
}
