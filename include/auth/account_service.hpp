#pragma once

#include "auth/auth_error.hpp"
#include "auth/credential_store.hpp"
#include "auth/password.hpp"
#include "auth/token_authority.hpp"
#include "threadpool/hash_workers.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace auth
{

class AccountService
{
public:
    struct Options
    {
        size_t min_password_length = 16;
    };

    AccountService(UserDirectory& users, TokenAuthority& tokens, HashWorkers& workers, Options opts = {});

    [[nodiscard]] std::expected<UserRecord, AuthFailure> register_user(
        std::string_view username,
        std::string_view password,
        std::string_view real_name = {},
        std::string_view blurb = {}
    );

    // Returns the new session key
    [[nodiscard]] std::expected<std::string, AuthFailure> login(
        std::string_view username,
        std::string_view password
    );

    [[nodiscard]] std::expected<void, AuthFailure> logout(std::span<const std::string> authorization);

    // Drops the caller's token before storing the new password; a fresh login
    // is required. If the token cannot be dropped the password is left as is.
    [[nodiscard]] std::expected<void, AuthFailure> change_password(
        std::span<const std::string> authorization,
        std::string_view old_password,
        std::string_view new_password
    );

    [[nodiscard]] TokenAuthority& tokens() { return token_authority; }

private:
    [[nodiscard]] std::expected<SaltyPassword, AuthFailure> encode(std::string_view password);
    [[nodiscard]] bool verify(const SaltyPassword& stored, std::string_view password);

    // Costs one Argon2 verification so failures take as long as a wrong password
    void burn_decoy(std::string_view password);

    std::reference_wrapper<UserDirectory> users;
    std::reference_wrapper<TokenAuthority> token_authority;
    std::reference_wrapper<HashWorkers> hash_pool;
    Options opts;

    // Checked against unknown usernames so they cost as much as a wrong password
    std::optional<SaltyPassword> decoy;
};

}
