#include "User.hpp"

User::User(const std::string& user, const std::string& hash, const std::string& salt_hex, std::time_t created)
    : username(user), password_hash(hash), key_salt(salt_hex), created_at(created)
{
}
