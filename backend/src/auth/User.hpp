#pragma once
#include <string>
#include <ctime>

class User {
public:
    User() = default;
    User(const std::string& user, const std::string& hash, const std::string& salt_hex, std::time_t created);

    std::string username;
    std::string password_hash; // Argon2id hash (crypto_pwhash_str)
    std::string key_salt;      // hex-encoded salt for card-file key derivation
    std::time_t created_at = 0;
};
