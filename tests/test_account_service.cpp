#include <catch2/catch_test_macros.hpp>

#include "auth/account_service.hpp"
#include "auth/sqlite_store.hpp"
#include "test_support.hpp"

#include <optional>
#include <string>

using namespace auth;

namespace {

constexpr std::string_view alice_pw = "wonderland-rabbit-20";

// Token storage over SQLite whose deletes can be made to fail
class FlakyTokenStore : public CredentialStore
{
public:
    explicit FlakyTokenStore(SqliteStore& inner) : inner(inner) {}

    bool fail_deletes = false;

    std::expected<std::optional<TokenRecord>, StoreError> find_token_by_key(std::string_view key) override
    {
        return inner.find_token_by_key(key);
    }

    std::expected<std::optional<UserRecord>, StoreError> find_user_by_id(int64_t id) override
    {
        return inner.find_user_by_id(id);
    }

    std::expected<void, StoreError> delete_tokens_for_user(int64_t user_id) override
    {
        if (fail_deletes)
        {
            return std::unexpected(StoreError{StoreErrc::unavailable, "Timed out waiting for a database connection"});
        }
        return inner.delete_tokens_for_user(user_id);
    }

    std::expected<void, StoreError> insert_token(int64_t user_id, std::string_view key, int64_t issued_at) override
    {
        return inner.insert_token(user_id, key, issued_at);
    }

    std::expected<bool, StoreError> token_key_exists(std::string_view key) override
    {
        return inner.token_key_exists(key);
    }

    std::expected<void, StoreError> replace_token(int64_t user_id, std::string_view key, int64_t issued_at) override
    {
        return inner.replace_token(user_id, key, issued_at);
    }

private:
    SqliteStore& inner;
};

struct Accounts
{
    TempDb tmp;
    std::unique_ptr<db::ConnectionPool> pool;
    std::unique_ptr<SqliteStore> store;
    std::unique_ptr<FlakyTokenStore> token_store;
    std::unique_ptr<TokenAuthority> tokens;
    HashWorkers workers{2};
    std::unique_ptr<AccountService> service;

    explicit Accounts(std::string_view name)
        : tmp(name)
    {
        auto opened = db::ConnectionPool::open(tmp.options());
        REQUIRE(opened.has_value());
        pool = std::move(*opened);
        store = std::make_unique<SqliteStore>(*pool);
        REQUIRE(store->init_schema().has_value());
        token_store = std::make_unique<FlakyTokenStore>(*store);
        tokens = std::make_unique<TokenAuthority>(*token_store);
        service = std::make_unique<AccountService>(*store, *tokens, workers);
    }
};

} // namespace

TEST_CASE("AccountService: register, log in and authenticate")
{
    Accounts acc("acct_flow");

    auto alice = acc.service->register_user("alice", alice_pw, "Alice Liddell");
    REQUIRE(alice.has_value());
    CHECK(alice->username == "alice");
    CHECK(alice->real_name == "Alice Liddell");
    CHECK(alice->password.starts_with("$argon2$"));
    CHECK(alice->password.find(alice_pw) == std::string::npos);

    auto k1 = acc.service->login("alice", alice_pw);
    REQUIRE(k1.has_value());
    CHECK(k1->size() == TokenAuthority::key_len);

    auto who = acc.tokens->authenticate(token_header(*k1));
    REQUIRE(who.has_value());
    CHECK(who->id == alice->id);

    SECTION("a second login replaces the first token")
    {
        auto k2 = acc.service->login("alice", alice_pw);
        REQUIRE(k2.has_value());
        CHECK(*k2 != *k1);

        auto stale = acc.tokens->authenticate(token_header(*k1));
        REQUIRE_FALSE(stale.has_value());
        CHECK(stale.error().kind == AuthError::InvalidCredential);
        CHECK(acc.tokens->authenticate(token_header(*k2)).has_value());
    }

    SECTION("logout ends the session")
    {
        REQUIRE(acc.service->logout(token_header(*k1)).has_value());

        auto after = acc.tokens->authenticate(token_header(*k1));
        REQUIRE_FALSE(after.has_value());
        CHECK(after.error().kind == AuthError::InvalidCredential);

        auto twice = acc.service->logout(token_header(*k1));
        REQUIRE_FALSE(twice.has_value());
        CHECK(twice.error().kind == AuthError::InvalidCredential);
    }
}

TEST_CASE("AccountService::register_user validates its input")
{
    Accounts acc("acct_register");

    SECTION("empty username")
    {
        auto res = acc.service->register_user("", alice_pw);
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind == AuthError::InvalidInput);
        CHECK(http_status(res.error().kind) == 400);
    }

    SECTION("short password")
    {
        auto res = acc.service->register_user("alice", "fifteen chars!!");
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind == AuthError::InvalidInput);
        CHECK(res.error().message == "Password too short (min 16 chars)");
    }

    SECTION("taken username")
    {
        REQUIRE(acc.service->register_user("alice", alice_pw).has_value());

        auto res = acc.service->register_user("alice", "another-long-password");
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind == AuthError::InvalidInput);
        CHECK(res.error().message == "Username already in use; pick another");
    }
}

TEST_CASE("AccountService::login rejects bad credentials alike")
{
    Accounts acc("acct_login");
    REQUIRE(acc.service->register_user("alice", alice_pw).has_value());

    auto wrong = acc.service->login("alice", "wonderland-rabbit-21");
    auto unknown = acc.service->login("bob", alice_pw);

    REQUIRE_FALSE(wrong.has_value());
    REQUIRE_FALSE(unknown.has_value());
    CHECK(wrong.error().kind == AuthError::InvalidCredential);
    CHECK(unknown.error().kind == AuthError::InvalidCredential);
    CHECK(wrong.error().message == unknown.error().message);

    auto jobs_before = acc.workers.jobs_started();
    REQUIRE_FALSE(acc.service->login("carol", alice_pw).has_value());
    REQUIRE_FALSE(acc.service->login("alice", "wonderland-rabbit-22").has_value());
    CHECK(acc.workers.jobs_started() - jobs_before == 2);
    CHECK(http_status(wrong.error().kind) == 403);
}

TEST_CASE("AccountService::login refuses a corrupt stored password")
{
    Accounts acc("acct_corrupt");
    auto alice = acc.service->register_user("alice", alice_pw);
    REQUIRE(alice.has_value());

    auto broken = acc.store->update_password(alice->id, "$argon2$not-a-real-record$");
    REQUIRE(broken.has_value());
    REQUIRE(*broken);

    auto jobs_before = acc.workers.jobs_started();
    auto res = acc.service->login("alice", alice_pw);

    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().kind == AuthError::InvalidCredential);
    CHECK(res.error().message == "Invalid username or password");
    // Same Argon2 work as a wrong password, so the reply time gives nothing away
    CHECK(acc.workers.jobs_started() - jobs_before == 1);
}

TEST_CASE("AccountService::change_password")
{
    Accounts acc("acct_change");
    REQUIRE(acc.service->register_user("alice", alice_pw).has_value());
    auto key = acc.service->login("alice", alice_pw);
    REQUIRE(key.has_value());

    constexpr std::string_view new_pw = "through-the-looking-glass";

    SECTION("wrong current password")
    {
        auto res = acc.service->change_password(token_header(*key), "not my password!", new_pw);
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind == AuthError::InvalidCredential);
        CHECK(acc.tokens->authenticate(token_header(*key)).has_value());
    }

    SECTION("new password too short")
    {
        auto res = acc.service->change_password(token_header(*key), alice_pw, "short");
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind == AuthError::InvalidInput);
    }

    SECTION("bad token")
    {
        std::vector<std::string> none;
        auto res = acc.service->change_password(none, alice_pw, new_pw);
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind == AuthError::MalformedRequest);
    }

    SECTION("success ends the session and swaps the password")
    {
        REQUIRE(acc.service->change_password(token_header(*key), alice_pw, new_pw).has_value());

        auto stale = acc.tokens->authenticate(token_header(*key));
        REQUIRE_FALSE(stale.has_value());
        CHECK(stale.error().kind == AuthError::InvalidCredential);

        CHECK_FALSE(acc.service->login("alice", alice_pw).has_value());
        CHECK(acc.service->login("alice", new_pw).has_value());
    }

    SECTION("a failed session drop leaves the old password and reports the outage")
    {
        acc.token_store->fail_deletes = true;

        auto res = acc.service->change_password(token_header(*key), alice_pw, new_pw);
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind == AuthError::StoreUnavailable);

        acc.token_store->fail_deletes = false;

        // Nothing changed: the session is still the caller's and the old password still works
        auto still = acc.tokens->authenticate(token_header(*key));
        REQUIRE(still.has_value());
        auto stored = SaltyPassword::parse(still->password);
        REQUIRE(stored.has_value());
        CHECK(stored->verify(alice_pw));
        CHECK_FALSE(stored->verify(new_pw));

        // A retry once the store recovers completes the change
        REQUIRE(acc.service->change_password(token_header(*key), alice_pw, new_pw).has_value());
        CHECK_FALSE(acc.tokens->authenticate(token_header(*key)).has_value());
        CHECK(acc.service->login("alice", new_pw).has_value());
    }
}
