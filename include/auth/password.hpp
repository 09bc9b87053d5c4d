#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace auth
{

/**
 * Salted Argon2i password hash.
 *
 * Stored as `$argon2$<salt>$<hex(hash)>$`. The salt is drawn from [A-Za-z0-9],
 * which carries roughly a quarter of the entropy of a random byte, so it is
 * four times as long as the hash.
 *
 * Instances are immutable; a password change produces a new value.
 */
class SaltyPassword
{
public:
    static constexpr size_t hash_len = 32;
    static constexpr size_t salt_len = hash_len * 4;

    using hash_t = std::array<uint8_t, hash_len>;

    [[nodiscard]] static std::expected<SaltyPassword, std::string> encode(std::string_view password);

    // nullopt for anything that is not a well-formed argon2 record
    [[nodiscard]] static std::optional<SaltyPassword> parse(std::string_view serialized);

    [[nodiscard]] bool verify(std::string_view password) const;
    [[nodiscard]] std::string serialize() const;

    [[nodiscard]] std::string_view salt() const { return salt_; }
    [[nodiscard]] const hash_t& hash() const { return hash_; }

private:
    SaltyPassword(std::string salt, const hash_t& hash);

    [[nodiscard]] static std::expected<hash_t, std::string> compute(std::string_view password, std::string_view salt);

    static constexpr std::string_view prefix = "$argon2$";
    static constexpr uint64_t ops_limit = 3;
    static constexpr size_t mem_limit = 4096 * 1024;

    std::string salt_;
    hash_t hash_;
};

[[nodiscard]] bool check_password(std::string_view password, size_t min_length);

}
