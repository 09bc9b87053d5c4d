#include "auth/account_service.hpp"
#include "auth/sqlite_store.hpp"
#include "auth/token_authority.hpp"
#include "config.hpp"
#include "crypto/secure.hpp"
#include "db/connection_pool.hpp"
#include "logger/logger.hpp"
#include "threadpool/hash_workers.hpp"

#include <print>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* prog)
{
    std::println("Usage: {} [--config <file>] [--db <path>] <command> [args]", prog);
    std::println("Commands:");
    std::println("  add <username> <password> [real name]   Create new user");
    std::println("  list                                    List all users");
    std::println("  login <username> <password>             Issue a session token");
    std::println("  whoami <token>                          Resolve a token to its user");
    std::println("  logout <token>                          Invalidate a session token");
    std::println("  passwd <token> <old> <new>              Change password, ends the session");
}

std::vector<std::string> as_header(std::string_view key)
{
    return {std::string(auth::TokenAuthority::header_prefix) + std::string(key)};
}

int report(const auth::AuthFailure& err)
{
    std::println(stderr, "{}", err);
    return auth::is_server_error(err.kind) ? 2 : 1;
}

int cmd_add(auth::AccountService& accounts, std::string_view user, std::string_view pass, std::string_view real_name)
{
    auto res = accounts.register_user(user, pass, real_name);
    if (!res)
    {
        return report(res.error());
    }
    std::println("User '{}' created with id {}", res->username, res->id);
    return 0;
}

int cmd_list(auth::SqliteStore& store)
{
    auto users = store.list_users();
    if (!users)
    {
        std::println(stderr, "Failed to list users: {}", users.error().message);
        return 2;
    }
    if (users->empty())
    {
        std::println("No users found");
        return 0;
    }

    std::println("{:<6} {:<20} {:<24} {}", "Id", "Username", "Real Name", "Created");
    std::println("{}", std::string(64, '-'));

    for (const auto& u : *users)
    {
        std::println("{:<6} {:<20} {:<24} {}", u.id, u.username, u.real_name, u.created_at);
    }

    return 0;
}

int cmd_login(auth::AccountService& accounts, std::string_view user, std::string_view pass)
{
    auto key = accounts.login(user, pass);
    if (!key)
    {
        return report(key.error());
    }
    std::println("{}", *key);
    return 0;
}

int cmd_whoami(auth::AccountService& accounts, std::string_view key)
{
    auto user = accounts.tokens().authenticate(as_header(key));
    if (!user)
    {
        return report(user.error());
    }
    std::println("{} (id {})", user->username, user->id);
    return 0;
}

int cmd_logout(auth::AccountService& accounts, std::string_view key)
{
    if (auto res = accounts.logout(as_header(key)); !res)
    {
        return report(res.error());
    }
    std::println("Session ended");
    return 0;
}

int cmd_passwd(auth::AccountService& accounts, std::string_view key, std::string_view old_pass, std::string_view new_pass)
{
    if (auto res = accounts.change_password(as_header(key), old_pass, new_pass); !res)
    {
        return report(res.error());
    }
    std::println("Password changed; log in again");
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    std::string config_file = "sonar.json";
    bool explicit_config = false;
    std::optional<std::string> cli_db;

    int idx = 1;
    while (idx + 1 < argc && std::string_view(argv[idx]).starts_with("--"))
    {
        std::string_view flag = argv[idx];
        if (flag == "--config")
        {
            config_file = argv[idx + 1];
            explicit_config = true;
        }
        else if (flag == "--db")
        {
            cli_db = argv[idx + 1];
        }
        else
        {
            print_usage(argv[0]);
            return 1;
        }
        idx += 2;
    }

    if (idx >= argc)
    {
        print_usage(argv[0]);
        return 1;
    }

    std::vector<std::string_view> args(argv + idx, argv + argc);
    std::string_view cmd = args[0];

    auto resolved = Config::resolve(config_file, explicit_config, cli_db);
    if (!resolved)
    {
        std::println(stderr, "Failed to load config {}: {}", config_file, resolved.error());
        return 1;
    }
    const Config& config = *resolved;

    const auto& log_cfg = config.logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    if (auto ok = crypto::init(); !ok)
    {
        LOG_ERROR("Fatal: {}", ok.error());
        return 2;
    }

    const auto& db_cfg = config.database();
    auto pool = db::ConnectionPool::open(db::PoolOptions{
        db_cfg.path,
        db_cfg.pool_size,
        db_cfg.checkout_timeout,
        db_cfg.busy_timeout,
    });
    if (!pool)
    {
        std::println(stderr, "Failed to open database: {}", pool.error());
        return 2;
    }

    auth::SqliteStore store(**pool);
    if (auto schema = store.init_schema(); !schema)
    {
        std::println(stderr, "{}", schema.error());
        return 2;
    }

    auth::TokenAuthority tokens(store);
    HashWorkers workers(config.accounts().hash_workers);
    auth::AccountService accounts(store, tokens, workers, {config.accounts().min_password_length});

    int rc = 1;
    if (cmd == "add" && (args.size() == 3 || args.size() == 4))
    {
        rc = cmd_add(accounts, args[1], args[2], args.size() == 4 ? args[3] : std::string_view{});
    }
    else if (cmd == "list" && args.size() == 1)
    {
        rc = cmd_list(store);
    }
    else if (cmd == "login" && args.size() == 3)
    {
        rc = cmd_login(accounts, args[1], args[2]);
    }
    else if (cmd == "whoami" && args.size() == 2)
    {
        rc = cmd_whoami(accounts, args[1]);
    }
    else if (cmd == "logout" && args.size() == 2)
    {
        rc = cmd_logout(accounts, args[1]);
    }
    else if (cmd == "passwd" && args.size() == 4)
    {
        rc = cmd_passwd(accounts, args[1], args[2], args[3]);
    }
    else
    {
        print_usage(argv[0]);
    }

    LOG_DEBUG("\n{}", tokens.metrics());
    Logger::shutdown();
    return rc;
}
