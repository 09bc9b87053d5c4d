#pragma once

#include <cstdint>
#include <format>
#include <string>
#include <string_view>

namespace auth
{

enum class AuthError : uint8_t
{
    MalformedRequest,
    InvalidCredential,
    InvalidInput,
    StoreUnavailable,
    TokenGenerationExhausted,
};

struct AuthFailure
{
    AuthError kind;
    std::string message;
};

[[nodiscard]] constexpr uint16_t http_status(AuthError e) noexcept
{
    switch (e)
    {
        case AuthError::MalformedRequest:         return 401;
        case AuthError::InvalidCredential:        return 403;
        case AuthError::InvalidInput:             return 400;
        case AuthError::StoreUnavailable:         return 500;
        case AuthError::TokenGenerationExhausted: return 500;
    }
    return 500;
}

[[nodiscard]] constexpr std::string_view to_string(AuthError e) noexcept
{
    switch (e)
    {
        case AuthError::MalformedRequest:         return "MalformedRequest";
        case AuthError::InvalidCredential:        return "InvalidCredential";
        case AuthError::InvalidInput:             return "InvalidInput";
        case AuthError::StoreUnavailable:         return "StoreUnavailable";
        case AuthError::TokenGenerationExhausted: return "TokenGenerationExhausted";
    }
    return "Unknown";
}

[[nodiscard]] constexpr bool is_server_error(AuthError e) noexcept
{
    return http_status(e) >= 500;
}

}

template<>
struct std::formatter<auth::AuthFailure>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const auth::AuthFailure& f, std::format_context& fc) const
    {
        return std::format_to(fc.out(), "{} ({}): {}", auth::to_string(f.kind), auth::http_status(f.kind), f.message);
    }
};
