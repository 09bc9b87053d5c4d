#pragma once

#include "auth/auth_error.hpp"
#include "auth/credential_store.hpp"
#include "logger/metrics.hpp"

#include <expected>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace auth
{

/**
 * Issues and checks bearer session tokens.
 *
 * A user holds at most one live token; issuing a new one replaces the old.
 * Keys are 64 printable ASCII characters from the OS CSPRNG. Uniqueness is
 * checked before writing and enforced again by the store on write, and a
 * collision at either point costs one of `max_attempts` attempts.
 */
class TokenAuthority
{
public:
    static constexpr size_t key_len = 64;
    static constexpr size_t max_attempts = 10;
    static constexpr std::string_view header_prefix = "Token ";

    using key_generator = std::function<std::expected<std::string, std::string>()>;

    explicit TokenAuthority(CredentialStore& store, key_generator generator = random_key);

    TokenAuthority(const TokenAuthority&) = delete;
    TokenAuthority& operator=(const TokenAuthority&) = delete;

    [[nodiscard]] static std::expected<std::string, std::string> random_key();

    [[nodiscard]] std::expected<void, AuthFailure> invalidate_for(const UserRecord& user);
    [[nodiscard]] std::expected<std::string, AuthFailure> create_for(const UserRecord& user);

    // Every value of the request's Authorization header, in arrival order
    [[nodiscard]] std::expected<UserRecord, AuthFailure> authenticate(std::span<const std::string> authorization);

    [[nodiscard]] const AuthMetrics& metrics() const { return stats; }

private:
    [[nodiscard]] std::unexpected<AuthFailure> store_failure(const StoreError& err);
    [[nodiscard]] std::unexpected<AuthFailure> reject(AuthError kind, std::string message);

    std::reference_wrapper<CredentialStore> store;
    key_generator generate;
    AuthMetrics stats;
};

}
