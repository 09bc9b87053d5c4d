#pragma once
#include <openssl/crypto.h>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace crypto
{

inline constexpr std::string_view alphanumeric =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

// Printable ASCII without the space character (0x21..0x7E)
inline constexpr std::string_view printable =
    "!\"#$%&'()*+,-./0123456789:;<=>?@ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "[\\]^_`abcdefghijklmnopqrstuvwxyz{|}~";

static_assert(alphanumeric.size() == 62);
static_assert(printable.size() == 94);

template<class T>
void secure_clear(T& cont)
{
    if constexpr (requires { cont.data(); cont.size(); })
    {
        OPENSSL_cleanse(cont.data(), cont.size() * sizeof(*cont.data()));
    }
    else
    {
        OPENSSL_cleanse(std::addressof(cont), sizeof(cont));
    }
}

/**
 * Initialises libsodium and its OS-backed random source.
 * Safe to call repeatedly and from several threads.
 */
[[nodiscard]] std::expected<void, std::string> init();

/**
 * Draws `len` symbols uniformly from `alphabet` using the OS CSPRNG.
 * Fails only when the random source cannot be initialised.
 */
[[nodiscard]] std::expected<std::string, std::string> random_string(std::string_view alphabet, size_t len);

/**
 * Compares two byte ranges in time independent of their contents.
 * Ranges of different length compare unequal.
 */
[[nodiscard]] bool constant_time_equal(std::span<const uint8_t> a, std::span<const uint8_t> b);

} // namespace crypto
