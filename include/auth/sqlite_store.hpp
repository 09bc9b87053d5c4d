#pragma once

#include "auth/credential_store.hpp"
#include "db/connection_pool.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace auth
{

/**
 * Users and tokens in SQLite.
 *
 * Every call leases its own connection for the duration of the call only.
 * A user has at most one row in auth_token (UNIQUE(user)), and keys are
 * UNIQUE across the table.
 */
class SqliteStore final : public CredentialStore, public UserDirectory
{
public:
    explicit SqliteStore(db::ConnectionPool& pool);

    [[nodiscard]] std::expected<void, std::string> init_schema();

    [[nodiscard]] std::expected<std::optional<TokenRecord>, StoreError> find_token_by_key(std::string_view key) override;
    [[nodiscard]] std::expected<std::optional<UserRecord>, StoreError> find_user_by_id(int64_t id) override;
    [[nodiscard]] std::expected<void, StoreError> delete_tokens_for_user(int64_t user_id) override;
    [[nodiscard]] std::expected<void, StoreError> insert_token(int64_t user_id, std::string_view key, int64_t issued_at) override;
    [[nodiscard]] std::expected<bool, StoreError> token_key_exists(std::string_view key) override;

    // Single upsert keyed by user, so the swap of one user's row is atomic.
    // Key uniqueness is not: a key taken after TokenAuthority's existence check
    // fails here as key_conflict and the caller retries with a fresh key.
    [[nodiscard]] std::expected<void, StoreError> replace_token(int64_t user_id, std::string_view key, int64_t issued_at) override;

    [[nodiscard]] std::expected<UserRecord, StoreError> create_user(const NewUser& user) override;
    [[nodiscard]] std::expected<std::optional<UserRecord>, StoreError> find_user_by_name(std::string_view username) override;
    [[nodiscard]] std::expected<bool, StoreError> update_password(int64_t user_id, std::string_view serialized) override;
    [[nodiscard]] std::expected<std::vector<UserRecord>, StoreError> list_users() override;

private:
    [[nodiscard]] std::expected<db::ConnectionPool::Lease, StoreError> lease();

    std::reference_wrapper<db::ConnectionPool> pool;
};

}
