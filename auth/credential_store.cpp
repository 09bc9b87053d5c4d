#include "auth/credential_store.hpp"

namespace auth
{

std::expected<void, StoreError> CredentialStore::replace_token(int64_t user_id, std::string_view key, int64_t issued_at)
{
    if (auto res = delete_tokens_for_user(user_id); !res)
    {
        return res;
    }
    return insert_token(user_id, key, issued_at);
}

}
