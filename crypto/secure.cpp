#include "crypto/secure.hpp"

#include <sodium.h>
#include <cstdint>

namespace crypto
{

std::expected<void, std::string> init()
{
    if (sodium_init() < 0)
    {
        return std::unexpected("Failed to initialize libsodium");
    }
    return {};
}

std::expected<std::string, std::string> random_string(std::string_view alphabet, size_t len)
{
    if (auto ok = init(); !ok)
    {
        return std::unexpected(ok.error());
    }
    if (alphabet.empty())
    {
        return std::unexpected("Empty alphabet");
    }

    std::string out(len, '\0');
    const auto upper = static_cast<uint32_t>(alphabet.size());
    for (auto& ch : out)
    {
        ch = alphabet[randombytes_uniform(upper)];
    }
    return out;
}

bool constant_time_equal(std::span<const uint8_t> a, std::span<const uint8_t> b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace crypto
