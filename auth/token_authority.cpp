#include "auth/token_authority.hpp"
#include "crypto/secure.hpp"
#include "logger/logger.hpp"

#include <ctime>
#include <format>

namespace auth
{

TokenAuthority::TokenAuthority(CredentialStore& store, key_generator generator)
    : store(store)
    , generate(std::move(generator))
{
}

std::expected<std::string, std::string> TokenAuthority::random_key()
{
    return crypto::random_string(crypto::printable, key_len);
}

std::unexpected<AuthFailure> TokenAuthority::store_failure(const StoreError& err)
{
    ++stats.store_failures;
    LOG_ERROR("Credential store failure: {}", err.message);
    return std::unexpected(AuthFailure{AuthError::StoreUnavailable, err.message});
}

std::unexpected<AuthFailure> TokenAuthority::reject(AuthError kind, std::string message)
{
    ++stats.authentications_rejected;
    LOG_DEBUG("Authentication rejected: {}", message);
    return std::unexpected(AuthFailure{kind, std::move(message)});
}

std::expected<void, AuthFailure> TokenAuthority::invalidate_for(const UserRecord& user)
{
    if (auto res = store.get().delete_tokens_for_user(user.id); !res)
    {
        return store_failure(res.error());
    }
    ++stats.tokens_invalidated;
    LOG_INFO("Invalidated tokens for user {}", user.id);
    return {};
}

std::expected<std::string, AuthFailure> TokenAuthority::create_for(const UserRecord& user)
{
    for (size_t attempt = 1; attempt <= max_attempts; ++attempt)
    {
        auto key = generate();
        if (!key)
        {
            ++stats.generation_exhausted;
            LOG_ERROR("Secure random source unavailable: {}", key.error());
            return std::unexpected(AuthFailure{AuthError::TokenGenerationExhausted, key.error()});
        }

        auto exists = store.get().token_key_exists(*key);
        if (!exists)
        {
            return store_failure(exists.error());
        }
        if (*exists)
        {
            ++stats.key_collisions;
            LOG_WARN("Token key collision for user {} (attempt {}/{})", user.id, attempt, max_attempts);
            continue;
        }

        auto replaced = store.get().replace_token(user.id, *key, static_cast<int64_t>(std::time(nullptr)));
        if (!replaced)
        {
            // Another writer took the key between the check and the write
            if (replaced.error().code == StoreErrc::key_conflict)
            {
                ++stats.key_collisions;
                LOG_WARN("Token key conflict on write for user {} (attempt {}/{})", user.id, attempt, max_attempts);
                continue;
            }
            return store_failure(replaced.error());
        }

        ++stats.tokens_issued;
        LOG_INFO("Issued token for user {}", user.id);
        return std::move(*key);
    }

    ++stats.generation_exhausted;
    LOG_ERROR("Token generation exhausted after {} attempts for user {}; check the random source",
              max_attempts, user.id);
    return std::unexpected(AuthFailure{
        AuthError::TokenGenerationExhausted,
        std::format("no unused token key found in {} attempts", max_attempts)
    });
}

std::expected<UserRecord, AuthFailure> TokenAuthority::authenticate(std::span<const std::string> authorization)
{
    if (authorization.size() != 1)
    {
        return reject(AuthError::MalformedRequest, "`Authorization` header must appear exactly once");
    }

    std::string_view value = authorization.front();
    if (!value.starts_with(header_prefix))
    {
        return reject(AuthError::MalformedRequest,
                      std::format("`Authorization` header must begin with the string '{}'", header_prefix));
    }
    auto key = value.substr(header_prefix.size());

    auto token = store.get().find_token_by_key(key);
    if (!token)
    {
        return store_failure(token.error());
    }
    if (!*token)
    {
        return reject(AuthError::InvalidCredential, "Token presented was not valid");
    }

    auto user = store.get().find_user_by_id((*token)->user_id);
    if (!user)
    {
        return store_failure(user.error());
    }
    if (!*user)
    {
        LOG_ERROR("Token {} refers to missing user {}", (*token)->id, (*token)->user_id);
        return store_failure(StoreError{
            StoreErrc::unavailable,
            std::format("token {} has no owning user", (*token)->id)
        });
    }

    ++stats.authentications_successful;
    return std::move(**user);
}

}
