#include "auth/account_service.hpp"
#include "logger/logger.hpp"

#include <format>

namespace auth
{

namespace {

constexpr std::string_view login_failed = "Invalid username or password";
constexpr std::string_view username_taken = "Username already in use; pick another";

std::unexpected<AuthFailure> unavailable(const StoreError& err)
{
    LOG_ERROR("Account store failure: {}", err.message);
    return std::unexpected(AuthFailure{AuthError::StoreUnavailable, err.message});
}

std::unexpected<AuthFailure> fail(AuthError kind, std::string_view message)
{
    return std::unexpected(AuthFailure{kind, std::string(message)});
}

} // namespace

AccountService::AccountService(UserDirectory& users, TokenAuthority& tokens, HashWorkers& workers, Options opts)
    : users(users)
    , token_authority(tokens)
    , hash_pool(workers)
    , opts(opts)
{
    if (auto pw = SaltyPassword::encode("decoy password for unknown accounts"); pw)
    {
        decoy = std::move(*pw);
    }
    else
    {
        LOG_WARN("No decoy password available; unknown usernames will fail fast");
    }
}

std::expected<SaltyPassword, AuthFailure> AccountService::encode(std::string_view password)
{
    auto res = hash_pool.get().run([password] { return SaltyPassword::encode(password); });
    if (!res)
    {
        LOG_ERROR("Password hashing job failed: {}", res.error());
        return fail(AuthError::StoreUnavailable, res.error());
    }
    if (!*res)
    {
        return fail(AuthError::StoreUnavailable, res->error());
    }
    return std::move(**res);
}

bool AccountService::verify(const SaltyPassword& stored, std::string_view password)
{
    auto res = hash_pool.get().run([&stored, password] { return stored.verify(password); });
    if (!res)
    {
        LOG_ERROR("Password verification job failed: {}", res.error());
    }
    return res.value_or(false);
}

void AccountService::burn_decoy(std::string_view password)
{
    if (decoy)
    {
        [[maybe_unused]] bool ignored = verify(*decoy, password);
    }
}

std::expected<UserRecord, AuthFailure> AccountService::register_user(
    std::string_view username,
    std::string_view password,
    std::string_view real_name,
    std::string_view blurb
)
{
    if (username.empty())
    {
        return fail(AuthError::InvalidInput, "Username must not be empty");
    }
    if (!check_password(password, opts.min_password_length))
    {
        return fail(AuthError::InvalidInput,
                    std::format("Password too short (min {} chars)", opts.min_password_length));
    }

    auto existing = users.get().find_user_by_name(username);
    if (!existing)
    {
        return unavailable(existing.error());
    }
    if (*existing)
    {
        return fail(AuthError::InvalidInput, username_taken);
    }

    auto pw = encode(password);
    if (!pw)
    {
        return std::unexpected(pw.error());
    }

    auto created = users.get().create_user(NewUser{
        std::string(username),
        pw->serialize(),
        std::string(real_name),
        std::string(blurb),
    });
    if (!created)
    {
        // Lost a race with another registration of the same name
        if (created.error().code == StoreErrc::username_taken)
        {
            return fail(AuthError::InvalidInput, username_taken);
        }
        return unavailable(created.error());
    }

    LOG_INFO("Registered user '{}' with id {}", created->username, created->id);
    return std::move(*created);
}

std::expected<std::string, AuthFailure> AccountService::login(std::string_view username, std::string_view password)
{
    auto rec = users.get().find_user_by_name(username);
    if (!rec)
    {
        return unavailable(rec.error());
    }
    if (!*rec)
    {
        burn_decoy(password);
        LOG_DEBUG("Login for unknown user rejected");
        return fail(AuthError::InvalidCredential, login_failed);
    }

    auto stored = SaltyPassword::parse((*rec)->password);
    if (!stored)
    {
        LOG_ERROR("Stored password of user {} is not in a recognised format", (*rec)->id);
        burn_decoy(password);
        return fail(AuthError::InvalidCredential, login_failed);
    }

    if (!verify(*stored, password))
    {
        LOG_DEBUG("Wrong password for user {}", (*rec)->id);
        return fail(AuthError::InvalidCredential, login_failed);
    }

    return token_authority.get().create_for(**rec);
}

std::expected<void, AuthFailure> AccountService::logout(std::span<const std::string> authorization)
{
    auto user = token_authority.get().authenticate(authorization);
    if (!user)
    {
        return std::unexpected(user.error());
    }
    return token_authority.get().invalidate_for(*user);
}

std::expected<void, AuthFailure> AccountService::change_password(
    std::span<const std::string> authorization,
    std::string_view old_password,
    std::string_view new_password
)
{
    auto user = token_authority.get().authenticate(authorization);
    if (!user)
    {
        return std::unexpected(user.error());
    }

    if (!check_password(new_password, opts.min_password_length))
    {
        return fail(AuthError::InvalidInput,
                    std::format("Password too short (min {} chars)", opts.min_password_length));
    }

    auto stored = SaltyPassword::parse(user->password);
    if (!stored)
    {
        LOG_ERROR("Stored password of user {} is not in a recognised format", user->id);
        return fail(AuthError::InvalidCredential, "Current password is incorrect");
    }
    if (!verify(*stored, old_password))
    {
        return fail(AuthError::InvalidCredential, "Current password is incorrect");
    }

    auto pw = encode(new_password);
    if (!pw)
    {
        return std::unexpected(pw.error());
    }

    // Sessions go first: a failure here leaves the old password in place
    if (auto revoked = token_authority.get().invalidate_for(*user); !revoked)
    {
        return revoked;
    }

    auto updated = users.get().update_password(user->id, pw->serialize());
    if (!updated)
    {
        return unavailable(updated.error());
    }
    if (!*updated)
    {
        return unavailable(StoreError{StoreErrc::unavailable,
                                      std::format("user {} disappeared during password change", user->id)});
    }

    LOG_INFO("Password changed for user {}", user->id);
    return {};
}

}
