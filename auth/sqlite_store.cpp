#include "auth/sqlite_store.hpp"
#include "logger/logger.hpp"

#include <ctime>
#include <format>
#include <memory>

namespace auth
{

namespace {

using stmt_ptr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StoreError db_error(sqlite3* db, std::string_view what)
{
    auto msg = std::format("{}: {}", what, sqlite3_errmsg(db));
    LOG_ERROR("SQLite {}", msg);
    return StoreError{StoreErrc::unavailable, std::move(msg)};
}

std::expected<stmt_ptr, StoreError> prepare(sqlite3* db, const char* sql)
{
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK)
    {
        sqlite3_finalize(stmt);
        return std::unexpected(db_error(db, "prepare failed"));
    }
    return stmt_ptr(stmt, &sqlite3_finalize);
}

void bind_text(sqlite3_stmt* stmt, int idx, std::string_view text)
{
    sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()), SQLITE_STATIC);
}

std::string column_string(sqlite3_stmt* stmt, int col)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    if (!text)
    {
        return {};
    }
    return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

UserRecord read_user(sqlite3_stmt* stmt)
{
    UserRecord rec;
    rec.id = sqlite3_column_int64(stmt, 0);
    rec.username = column_string(stmt, 1);
    rec.password = column_string(stmt, 2);
    rec.real_name = column_string(stmt, 3);
    rec.blurb = column_string(stmt, 4);
    rec.created_at = sqlite3_column_int64(stmt, 5);
    return rec;
}

bool is_unique_violation(sqlite3* db, std::string_view column)
{
    return sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE
        && std::string_view(sqlite3_errmsg(db)).find(column) != std::string_view::npos;
}

constexpr const char* user_columns = "id, username, password, real_name, blurb, created_at";

std::expected<std::optional<UserRecord>, StoreError> fetch_one_user(sqlite3* db, const std::string& sql,
                                                                    const std::function<void(sqlite3_stmt*)>& bind)
{
    auto stmt = prepare(db, sql.c_str());
    if (!stmt)
    {
        return std::unexpected(stmt.error());
    }
    bind(stmt->get());

    int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_ROW)
    {
        return read_user(stmt->get());
    }
    if (rc == SQLITE_DONE)
    {
        return std::nullopt;
    }
    return std::unexpected(db_error(db, "user lookup failed"));
}

} // namespace

SqliteStore::SqliteStore(db::ConnectionPool& pool)
    : pool(pool)
{
}

std::expected<db::ConnectionPool::Lease, StoreError> SqliteStore::lease()
{
    auto conn = pool.get().acquire();
    if (!conn)
    {
        return std::unexpected(StoreError{StoreErrc::unavailable, conn.error()});
    }
    return std::move(*conn);
}

std::expected<void, std::string> SqliteStore::init_schema()
{
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS users (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            username TEXT UNIQUE NOT NULL,
            password TEXT NOT NULL,
            real_name TEXT NOT NULL DEFAULT '',
            blurb TEXT NOT NULL DEFAULT '',
            created_at INTEGER NOT NULL DEFAULT (strftime('%s', 'now'))
        );

        CREATE TABLE IF NOT EXISTS auth_token (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            "user" INTEGER NOT NULL UNIQUE REFERENCES users(id) ON DELETE CASCADE,
            issued_at INTEGER NOT NULL,
            "key" TEXT NOT NULL UNIQUE
        );
    )";

    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error().message);
    }

    char* err = nullptr;
    int rc = sqlite3_exec(conn->get(), sql, nullptr, nullptr, std::addressof(err));
    if (rc != SQLITE_OK)
    {
        std::string msg = err ? err : sqlite3_errmsg(conn->get());
        sqlite3_free(err);
        return std::unexpected(std::format("Schema creation failed: {}", msg));
    }
    return {};
}

std::expected<std::optional<TokenRecord>, StoreError> SqliteStore::find_token_by_key(std::string_view key)
{
    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error());
    }
    sqlite3* db = conn->get();

    auto stmt = prepare(db, R"(SELECT id, "user", issued_at, "key" FROM auth_token WHERE "key" = ?;)");
    if (!stmt)
    {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, key);

    int rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE)
    {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW)
    {
        return std::unexpected(db_error(db, "token lookup failed"));
    }

    TokenRecord rec;
    rec.id = sqlite3_column_int64(stmt->get(), 0);
    rec.user_id = sqlite3_column_int64(stmt->get(), 1);
    rec.issued_at = sqlite3_column_int64(stmt->get(), 2);
    rec.key = column_string(stmt->get(), 3);
    return rec;
}

std::expected<std::optional<UserRecord>, StoreError> SqliteStore::find_user_by_id(int64_t id)
{
    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error());
    }
    return fetch_one_user(conn->get(), std::format("SELECT {} FROM users WHERE id = ?;", user_columns),
                          [id](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, id); });
}

std::expected<void, StoreError> SqliteStore::delete_tokens_for_user(int64_t user_id)
{
    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error());
    }
    sqlite3* db = conn->get();

    auto stmt = prepare(db, R"(DELETE FROM auth_token WHERE "user" = ?;)");
    if (!stmt)
    {
        return std::unexpected(stmt.error());
    }
    sqlite3_bind_int64(stmt->get(), 1, user_id);

    if (sqlite3_step(stmt->get()) != SQLITE_DONE)
    {
        return std::unexpected(db_error(db, "token delete failed"));
    }
    return {};
}

std::expected<void, StoreError> SqliteStore::insert_token(int64_t user_id, std::string_view key, int64_t issued_at)
{
    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error());
    }
    sqlite3* db = conn->get();

    auto stmt = prepare(db, R"(INSERT INTO auth_token ("user", "key", issued_at) VALUES (?, ?, ?);)");
    if (!stmt)
    {
        return std::unexpected(stmt.error());
    }
    sqlite3_bind_int64(stmt->get(), 1, user_id);
    bind_text(stmt->get(), 2, key);
    sqlite3_bind_int64(stmt->get(), 3, issued_at);

    if (sqlite3_step(stmt->get()) != SQLITE_DONE)
    {
        if (is_unique_violation(db, "auth_token.key"))
        {
            return std::unexpected(StoreError{StoreErrc::key_conflict, "token key already in use"});
        }
        return std::unexpected(db_error(db, "token insert failed"));
    }
    return {};
}

std::expected<bool, StoreError> SqliteStore::token_key_exists(std::string_view key)
{
    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error());
    }
    sqlite3* db = conn->get();

    auto stmt = prepare(db, R"(SELECT EXISTS (SELECT 1 FROM auth_token WHERE "key" = ?);)");
    if (!stmt)
    {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, key);

    if (sqlite3_step(stmt->get()) != SQLITE_ROW)
    {
        return std::unexpected(db_error(db, "token existence check failed"));
    }
    return sqlite3_column_int(stmt->get(), 0) != 0;
}

std::expected<void, StoreError> SqliteStore::replace_token(int64_t user_id, std::string_view key, int64_t issued_at)
{
    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error());
    }
    sqlite3* db = conn->get();

    auto stmt = prepare(db, R"(
        INSERT INTO auth_token ("user", "key", issued_at) VALUES (?, ?, ?)
        ON CONFLICT ("user") DO UPDATE SET "key" = excluded."key", issued_at = excluded.issued_at;
    )");
    if (!stmt)
    {
        return std::unexpected(stmt.error());
    }
    sqlite3_bind_int64(stmt->get(), 1, user_id);
    bind_text(stmt->get(), 2, key);
    sqlite3_bind_int64(stmt->get(), 3, issued_at);

    if (sqlite3_step(stmt->get()) != SQLITE_DONE)
    {
        if (is_unique_violation(db, "auth_token.key"))
        {
            return std::unexpected(StoreError{StoreErrc::key_conflict, "token key already in use"});
        }
        return std::unexpected(db_error(db, "token replace failed"));
    }
    return {};
}

std::expected<UserRecord, StoreError> SqliteStore::create_user(const NewUser& user)
{
    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error());
    }
    sqlite3* db = conn->get();

    auto stmt = prepare(db, "INSERT INTO users (username, password, real_name, blurb, created_at) VALUES (?, ?, ?, ?, ?);");
    if (!stmt)
    {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, user.username);
    bind_text(stmt->get(), 2, user.password);
    bind_text(stmt->get(), 3, user.real_name);
    bind_text(stmt->get(), 4, user.blurb);
    sqlite3_bind_int64(stmt->get(), 5, static_cast<int64_t>(std::time(nullptr)));

    if (sqlite3_step(stmt->get()) != SQLITE_DONE)
    {
        if (is_unique_violation(db, "users.username"))
        {
            return std::unexpected(StoreError{StoreErrc::username_taken, "username already in use"});
        }
        return std::unexpected(db_error(db, "user insert failed"));
    }

    // Same connection, so last_insert_rowid belongs to this insert
    int64_t id = sqlite3_last_insert_rowid(db);
    auto created = fetch_one_user(db, std::format("SELECT {} FROM users WHERE id = ?;", user_columns),
                                  [id](sqlite3_stmt* s) { sqlite3_bind_int64(s, 1, id); });
    if (!created)
    {
        return std::unexpected(created.error());
    }
    if (!*created)
    {
        return std::unexpected(StoreError{StoreErrc::unavailable, "inserted user not found"});
    }
    return std::move(**created);
}

std::expected<std::optional<UserRecord>, StoreError> SqliteStore::find_user_by_name(std::string_view username)
{
    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error());
    }
    return fetch_one_user(conn->get(), std::format("SELECT {} FROM users WHERE username = ?;", user_columns),
                          [username](sqlite3_stmt* stmt) { bind_text(stmt, 1, username); });
}

std::expected<bool, StoreError> SqliteStore::update_password(int64_t user_id, std::string_view serialized)
{
    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error());
    }
    sqlite3* db = conn->get();

    auto stmt = prepare(db, "UPDATE users SET password = ? WHERE id = ?;");
    if (!stmt)
    {
        return std::unexpected(stmt.error());
    }
    bind_text(stmt->get(), 1, serialized);
    sqlite3_bind_int64(stmt->get(), 2, user_id);

    if (sqlite3_step(stmt->get()) != SQLITE_DONE)
    {
        return std::unexpected(db_error(db, "password update failed"));
    }
    return sqlite3_changes(db) > 0;
}

std::expected<std::vector<UserRecord>, StoreError> SqliteStore::list_users()
{
    auto conn = lease();
    if (!conn)
    {
        return std::unexpected(conn.error());
    }
    sqlite3* db = conn->get();

    auto sql = std::format("SELECT {} FROM users ORDER BY id;", user_columns);
    auto stmt = prepare(db, sql.c_str());
    if (!stmt)
    {
        return std::unexpected(stmt.error());
    }

    std::vector<UserRecord> users;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW)
    {
        users.push_back(read_user(stmt->get()));
    }
    if (rc != SQLITE_DONE)
    {
        return std::unexpected(db_error(db, "user listing failed"));
    }
    return users;
}

}
