#pragma once

#include "auth/records.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace auth
{

enum class StoreErrc
{
    unavailable,
    key_conflict,
    username_taken,
};

struct StoreError
{
    StoreErrc code = StoreErrc::unavailable;
    std::string message;
};

/**
 * Persistence surface the token core depends on.
 *
 * Implementations must be safe to call from several threads at once.
 */
class CredentialStore
{
public:
    virtual ~CredentialStore() = default;

    [[nodiscard]] virtual std::expected<std::optional<TokenRecord>, StoreError> find_token_by_key(std::string_view key) = 0;
    [[nodiscard]] virtual std::expected<std::optional<UserRecord>, StoreError> find_user_by_id(int64_t id) = 0;
    [[nodiscard]] virtual std::expected<void, StoreError> delete_tokens_for_user(int64_t user_id) = 0;

    // StoreErrc::key_conflict when another live token already has this key
    [[nodiscard]] virtual std::expected<void, StoreError> insert_token(int64_t user_id, std::string_view key, int64_t issued_at) = 0;

    [[nodiscard]] virtual std::expected<bool, StoreError> token_key_exists(std::string_view key) = 0;

    /**
     * Makes `key` the only token of `user_id`.
     *
     * The default is delete followed by insert and is not atomic; stores
     * that can do better override it.
     */
    [[nodiscard]] virtual std::expected<void, StoreError> replace_token(int64_t user_id, std::string_view key, int64_t issued_at);
};

class UserDirectory
{
public:
    virtual ~UserDirectory() = default;

    // StoreErrc::username_taken on a duplicate username
    [[nodiscard]] virtual std::expected<UserRecord, StoreError> create_user(const NewUser& user) = 0;
    [[nodiscard]] virtual std::expected<std::optional<UserRecord>, StoreError> find_user_by_name(std::string_view username) = 0;
    [[nodiscard]] virtual std::expected<bool, StoreError> update_password(int64_t user_id, std::string_view serialized) = 0;
    [[nodiscard]] virtual std::expected<std::vector<UserRecord>, StoreError> list_users() = 0;
};

}
