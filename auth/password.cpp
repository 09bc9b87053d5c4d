#include "auth/password.hpp"
#include "crypto/secure.hpp"
#include "logger/logger.hpp"

#include <sodium.h>
#include <algorithm>
#include <cctype>

namespace auth
{

SaltyPassword::SaltyPassword(std::string salt, const hash_t& hash)
    : salt_(std::move(salt))
    , hash_(hash)
{
}

std::expected<SaltyPassword::hash_t, std::string> SaltyPassword::compute(
    std::string_view password,
    std::string_view salt
)
{
    if (auto ok = crypto::init(); !ok)
    {
        return std::unexpected(ok.error());
    }

    // crypto_pwhash only accepts a fixed-size salt; condense the stored one
    std::array<uint8_t, crypto_pwhash_SALTBYTES> argon_salt{};
    crypto_generichash(
        argon_salt.data(), argon_salt.size(),
        reinterpret_cast<const unsigned char*>(salt.data()), salt.size(),
        nullptr, 0
    );

    hash_t out{};
    int result = crypto_pwhash(
        out.data(), out.size(),
        password.data(), password.size(),
        argon_salt.data(),
        ops_limit,
        mem_limit,
        crypto_pwhash_ALG_ARGON2I13
    );
    crypto::secure_clear(argon_salt);

    if (result != 0)
    {
        return std::unexpected("Failed to hash password");
    }
    return out;
}

std::expected<SaltyPassword, std::string> SaltyPassword::encode(std::string_view password)
{
    auto salt = crypto::random_string(crypto::alphanumeric, salt_len);
    if (!salt)
    {
        LOG_ERROR("Password salt generation failed: {}", salt.error());
        return std::unexpected(salt.error());
    }

    auto hash = compute(password, *salt);
    if (!hash)
    {
        LOG_ERROR("Password hashing failed: {}", hash.error());
        return std::unexpected(hash.error());
    }

    return SaltyPassword(std::move(*salt), *hash);
}

std::optional<SaltyPassword> SaltyPassword::parse(std::string_view serialized)
{
    if (serialized.size() <= prefix.size()
        || !serialized.starts_with(prefix)
        || !serialized.ends_with('$'))
    {
        return std::nullopt;
    }

    auto body = serialized.substr(prefix.size(), serialized.size() - prefix.size() - 1);
    auto split = body.find('$');
    if (split == std::string_view::npos)
    {
        return std::nullopt;
    }

    auto salt = body.substr(0, split);
    auto hex = body.substr(split + 1);

    if (salt.size() != salt_len
        || !std::ranges::all_of(salt, [](unsigned char c){ return std::isalnum(c) != 0; }))
    {
        return std::nullopt;
    }
    if (hex.size() != hash_len * 2
        || !std::ranges::all_of(hex, [](unsigned char c){ return std::isxdigit(c) != 0; }))
    {
        return std::nullopt;
    }

    hash_t hash{};
    size_t bin_len = 0;
    if (sodium_hex2bin(hash.data(), hash.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, nullptr) != 0
        || bin_len != hash.size())
    {
        return std::nullopt;
    }

    return SaltyPassword(std::string(salt), hash);
}

bool SaltyPassword::verify(std::string_view password) const
{
    auto candidate = compute(password, salt_);
    if (!candidate)
    {
        LOG_ERROR("Password verification could not hash candidate: {}", candidate.error());
        return false;
    }

    bool equal = crypto::constant_time_equal(*candidate, hash_);
    crypto::secure_clear(*candidate);
    return equal;
}

std::string SaltyPassword::serialize() const
{
    std::array<char, hash_len * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), hash_.data(), hash_.size());

    std::string out;
    out.reserve(prefix.size() + salt_.size() + hash_len * 2 + 2);
    out.append(prefix);
    out.append(salt_);
    out.push_back('$');
    out.append(hex.data(), hash_len * 2);
    out.push_back('$');
    return out;
}

bool check_password(std::string_view password, size_t min_length)
{
    return password.size() >= min_length;
}

}
