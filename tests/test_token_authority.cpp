#include <catch2/catch_test_macros.hpp>

#include "auth/token_authority.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <deque>
#include <format>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

using namespace auth;

namespace {

// In-memory store; relies on the default (delete + insert) replace_token
class MemoryStore : public CredentialStore
{
public:
    bool offline = false;
    size_t write_conflicts = 0;

    UserRecord add_user(std::string name)
    {
        std::lock_guard lock(mtx);
        UserRecord u;
        u.id = next_user++;
        u.username = std::move(name);
        users[u.id] = u;
        return u;
    }

    void add_token(int64_t user_id, std::string key)
    {
        std::lock_guard lock(mtx);
        tokens.push_back(TokenRecord{next_token++, user_id, 0, std::move(key)});
    }

    size_t token_count(int64_t user_id)
    {
        std::lock_guard lock(mtx);
        return static_cast<size_t>(std::ranges::count(tokens, user_id, &TokenRecord::user_id));
    }

    std::expected<std::optional<TokenRecord>, StoreError> find_token_by_key(std::string_view key) override
    {
        std::lock_guard lock(mtx);
        if (offline) return std::unexpected(down());
        auto it = std::ranges::find(tokens, key, &TokenRecord::key);
        if (it == tokens.end()) return std::nullopt;
        return *it;
    }

    std::expected<std::optional<UserRecord>, StoreError> find_user_by_id(int64_t id) override
    {
        std::lock_guard lock(mtx);
        if (offline) return std::unexpected(down());
        auto it = users.find(id);
        if (it == users.end()) return std::nullopt;
        return it->second;
    }

    std::expected<void, StoreError> delete_tokens_for_user(int64_t user_id) override
    {
        std::lock_guard lock(mtx);
        if (offline) return std::unexpected(down());
        std::erase_if(tokens, [user_id](const TokenRecord& t) { return t.user_id == user_id; });
        return {};
    }

    std::expected<void, StoreError> insert_token(int64_t user_id, std::string_view key, int64_t issued_at) override
    {
        std::lock_guard lock(mtx);
        if (offline) return std::unexpected(down());
        if (write_conflicts > 0)
        {
            --write_conflicts;
            return std::unexpected(StoreError{StoreErrc::key_conflict, "raced"});
        }
        if (std::ranges::find(tokens, key, &TokenRecord::key) != tokens.end())
        {
            return std::unexpected(StoreError{StoreErrc::key_conflict, "duplicate key"});
        }
        tokens.push_back(TokenRecord{next_token++, user_id, issued_at, std::string(key)});
        return {};
    }

    std::expected<bool, StoreError> token_key_exists(std::string_view key) override
    {
        std::lock_guard lock(mtx);
        if (offline) return std::unexpected(down());
        return std::ranges::find(tokens, key, &TokenRecord::key) != tokens.end();
    }

private:
    static StoreError down() { return StoreError{StoreErrc::unavailable, "store offline"}; }

    std::mutex mtx;
    std::map<int64_t, UserRecord> users;
    std::vector<TokenRecord> tokens;
    int64_t next_user = 1;
    int64_t next_token = 1;
};

// Hands out the given keys in order, then falls back to random ones
TokenAuthority::key_generator scripted(std::vector<std::string> keys)
{
    auto queue = std::make_shared<std::deque<std::string>>(keys.begin(), keys.end());
    return [queue]() -> std::expected<std::string, std::string> {
        if (queue->empty())
        {
            return TokenAuthority::random_key();
        }
        auto k = queue->front();
        queue->pop_front();
        return k;
    };
}

} // namespace

TEST_CASE("TokenAuthority::random_key yields 64 printable non-space characters")
{
    auto key = TokenAuthority::random_key();

    REQUIRE(key.has_value());
    CHECK(key->size() == TokenAuthority::key_len);
    CHECK(std::ranges::all_of(*key, [](char c){ return c >= 0x21 && c <= 0x7E; }));
    CHECK(*key != *TokenAuthority::random_key());
}

TEST_CASE("TokenAuthority replaces the previous token of a user")
{
    MemoryStore store;
    TokenAuthority authority(store);
    auto alice = store.add_user("alice");

    auto k1 = authority.create_for(alice);
    auto k2 = authority.create_for(alice);

    REQUIRE(k1.has_value());
    REQUIRE(k2.has_value());
    CHECK(*k1 != *k2);
    CHECK(store.token_count(alice.id) == 1);

    auto old = authority.authenticate(token_header(*k1));
    REQUIRE_FALSE(old.has_value());
    CHECK(old.error().kind == AuthError::InvalidCredential);

    auto cur = authority.authenticate(token_header(*k2));
    REQUIRE(cur.has_value());
    CHECK(cur->id == alice.id);
    CHECK(cur->username == "alice");

    CHECK(authority.metrics().tokens_issued.load() == 2);
    CHECK(authority.metrics().authentications_successful.load() == 1);
    CHECK(authority.metrics().authentications_rejected.load() == 1);

    auto report = std::format("{}", authority.metrics());
    CHECK(report.find("AUTH METRICS REPORT") != std::string::npos);
    CHECK(report.find("Issued:          2") != std::string::npos);
}

TEST_CASE("TokenAuthority leaves other users' tokens alone")
{
    MemoryStore store;
    TokenAuthority authority(store);
    auto alice = store.add_user("alice");
    auto bob = store.add_user("bob");

    auto ka = authority.create_for(alice);
    auto kb = authority.create_for(bob);
    REQUIRE(ka.has_value());
    REQUIRE(kb.has_value());

    REQUIRE(authority.create_for(alice).has_value());

    auto still_bob = authority.authenticate(token_header(*kb));
    REQUIRE(still_bob.has_value());
    CHECK(still_bob->id == bob.id);
}

TEST_CASE("TokenAuthority::authenticate validates the Authorization header")
{
    MemoryStore store;
    TokenAuthority authority(store);

    SECTION("absent")
    {
        std::vector<std::string> none;
        auto res = authority.authenticate(none);
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind == AuthError::MalformedRequest);
        CHECK(res.error().message == "`Authorization` header must appear exactly once");
        CHECK(http_status(res.error().kind) == 401);
    }

    SECTION("supplied twice")
    {
        std::vector<std::string> twice{"Token a", "Token b"};
        auto res = authority.authenticate(twice);
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind == AuthError::MalformedRequest);
    }

    SECTION("wrong scheme")
    {
        for (const char* value : {"Bearer abc", "token abc", "Token", "", " Token abc"})
        {
            std::vector<std::string> one{value};
            auto res = authority.authenticate(one);
            REQUIRE_FALSE(res.has_value());
            CHECK(res.error().kind == AuthError::MalformedRequest);
            CHECK(res.error().message.find("'Token '") != std::string::npos);
        }
    }

    SECTION("unknown key")
    {
        auto res = authority.authenticate(token_header(std::string(64, 'x')));
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error().kind == AuthError::InvalidCredential);
        CHECK(res.error().message == "Token presented was not valid");
        CHECK(http_status(res.error().kind) == 403);
    }
}

TEST_CASE("TokenAuthority::authenticate matches keys exactly")
{
    MemoryStore store;
    TokenAuthority authority(store);
    auto alice = store.add_user("alice");
    auto key = authority.create_for(alice);
    REQUIRE(key.has_value());

    CHECK_FALSE(authority.authenticate(token_header(*key + " ")).has_value());
    CHECK_FALSE(authority.authenticate(token_header(key->substr(1))).has_value());
    CHECK_FALSE(authority.authenticate(std::vector<std::string>{"Token  " + *key}).has_value());
    CHECK(authority.authenticate(token_header(*key)).has_value());
}

TEST_CASE("TokenAuthority reports a token without a user as a store failure")
{
    MemoryStore store;
    TokenAuthority authority(store);
    store.add_token(42, std::string(64, 'o'));

    auto res = authority.authenticate(token_header(std::string(64, 'o')));

    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().kind == AuthError::StoreUnavailable);
    CHECK(http_status(res.error().kind) == 500);
}

TEST_CASE("TokenAuthority maps store outages to StoreUnavailable")
{
    MemoryStore store;
    TokenAuthority authority(store);
    auto alice = store.add_user("alice");
    store.offline = true;

    auto auth = authority.authenticate(token_header(std::string(64, 'k')));
    REQUIRE_FALSE(auth.has_value());
    CHECK(auth.error().kind == AuthError::StoreUnavailable);

    auto created = authority.create_for(alice);
    REQUIRE_FALSE(created.has_value());
    CHECK(created.error().kind == AuthError::StoreUnavailable);

    auto dropped = authority.invalidate_for(alice);
    REQUIRE_FALSE(dropped.has_value());
    CHECK(dropped.error().kind == AuthError::StoreUnavailable);

    CHECK(authority.metrics().store_failures.load() == 3);
}

TEST_CASE("TokenAuthority retries when a generated key is taken")
{
    MemoryStore store;
    auto bob = store.add_user("bob");
    auto alice = store.add_user("alice");
    std::string taken(64, 't');
    std::string fresh(64, 'f');
    store.add_token(bob.id, taken);

    TokenAuthority authority(store, scripted({taken, taken, fresh}));
    auto key = authority.create_for(alice);

    REQUIRE(key.has_value());
    CHECK(*key == fresh);
    CHECK(authority.metrics().key_collisions.load() == 2);

    auto still_bob = authority.authenticate(token_header(taken));
    REQUIRE(still_bob.has_value());
    CHECK(still_bob->id == bob.id);
}

TEST_CASE("TokenAuthority retries when the key is claimed between check and write")
{
    MemoryStore store;
    auto alice = store.add_user("alice");
    store.write_conflicts = 1;

    TokenAuthority authority(store);
    auto key = authority.create_for(alice);

    REQUIRE(key.has_value());
    CHECK(authority.metrics().key_collisions.load() == 1);
    CHECK(authority.authenticate(token_header(*key)).has_value());
}

TEST_CASE("TokenAuthority gives up after ten colliding keys")
{
    MemoryStore store;
    auto bob = store.add_user("bob");
    auto alice = store.add_user("alice");
    std::string taken(64, 't');
    store.add_token(bob.id, taken);

    TokenAuthority authority(store, scripted(std::vector<std::string>(TokenAuthority::max_attempts + 5, taken)));
    auto key = authority.create_for(alice);

    REQUIRE_FALSE(key.has_value());
    CHECK(key.error().kind == AuthError::TokenGenerationExhausted);
    CHECK(http_status(key.error().kind) == 500);
    CHECK(authority.metrics().key_collisions.load() == TokenAuthority::max_attempts);
    CHECK(authority.metrics().generation_exhausted.load() == 1);
    CHECK(store.token_count(alice.id) == 0);
}

TEST_CASE("TokenAuthority surfaces a failing random source")
{
    MemoryStore store;
    auto alice = store.add_user("alice");
    TokenAuthority authority(store, []() -> std::expected<std::string, std::string> {
        return std::unexpected("no entropy");
    });

    auto key = authority.create_for(alice);

    REQUIRE_FALSE(key.has_value());
    CHECK(key.error().kind == AuthError::TokenGenerationExhausted);
}

TEST_CASE("TokenAuthority::invalidate_for is idempotent")
{
    MemoryStore store;
    TokenAuthority authority(store);
    auto alice = store.add_user("alice");

    CHECK(authority.invalidate_for(alice).has_value());

    auto key = authority.create_for(alice);
    REQUIRE(key.has_value());
    CHECK(authority.invalidate_for(alice).has_value());
    CHECK(authority.invalidate_for(alice).has_value());

    auto res = authority.authenticate(token_header(*key));
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error().kind == AuthError::InvalidCredential);
}
