#pragma once

#include <memory>
#include <string>
#include <vector>
#include "User.hpp"

// Logged-in user plus the card-file key derived from their password.
// The key is wiped when the session is destroyed.
class UserSession {
public:
    UserSession(std::string user, std::vector<unsigned char> derivedKey);
    ~UserSession();

    UserSession(const UserSession&) = delete;
    UserSession& operator=(const UserSession&) = delete;

    const std::string& username() const { return name; }
    const std::vector<unsigned char>& key() const { return card_key; }

private:
    std::string name;
    std::vector<unsigned char> card_key;
};

class AuthManager {
public:
    static constexpr std::size_t MAX_USERNAME_LENGTH = 64;

    explicit AuthManager(const std::string& userFile = "users.txt");

    // Throws InvalidInput on empty username/password or a username outside
    // [A-Za-z0-9_.-]. Returns false if the name is taken or the user file
    // cannot be written.
    bool signup(const std::string& username, const std::string& password);

    // nullptr on unknown user, wrong password or key derivation failure
    std::unique_ptr<UserSession> login(const std::string& username, const std::string& password) const;

    bool hasUser(const std::string& username) const;
    static bool isValidUsername(const std::string& username);
    std::size_t userCount() const { return users.size(); }

private:
    std::vector<User> users;
    std::string userFilePath;

    void loadUsers();

    // Password hashing / verification (libsodium)
    static std::string hashPassword(const std::string& password);
    static bool verifyPassword(const std::string& password, const std::string& hash);

    // Derives a crypto_secretbox key from password + the user's hex salt.
    // Returns an empty vector on failure.
    static std::vector<unsigned char> deriveKey(const std::string& password, const std::string& salt_hex);
};
