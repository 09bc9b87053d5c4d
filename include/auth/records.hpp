#pragma once

#include <string>
#include <cstdint>

namespace auth
{

struct UserRecord
{
    int64_t id = 0;
    std::string username;
    std::string password;
    std::string real_name;
    std::string blurb;
    int64_t created_at = 0;
};

struct NewUser
{
    std::string username;
    std::string password;
    std::string real_name;
    std::string blurb;
};

// issued_at is unix seconds; nothing reads it for expiry yet
struct TokenRecord
{
    int64_t id = 0;
    int64_t user_id = 0;
    int64_t issued_at = 0;
    std::string key;
};

}
