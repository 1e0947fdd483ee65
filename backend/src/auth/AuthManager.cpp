#include "AuthManager.hpp"
#include "../core/Errors.hpp"
#include "../storage/Storage.hpp"
#include <sodium.h>
#include <cctype>
#include <ctime>
#include <stdexcept>
#include <utility>
#include <spdlog/spdlog.h>

// constants for key derivation / pwhash
static constexpr std::size_t CARD_KEY_BYTES = crypto_secretbox_KEYBYTES; // 32
static constexpr std::size_t SALT_BYTES = crypto_pwhash_SALTBYTES;

UserSession::UserSession(std::string user, std::vector<unsigned char> derivedKey)
    : name(std::move(user)), card_key(std::move(derivedKey))
{
}

UserSession::~UserSession() {
    if (!card_key.empty()) {
        spdlog::debug("Wiping card key for '{}'", name);
        sodium_memzero(card_key.data(), card_key.size());
    }
}

AuthManager::AuthManager(const std::string& userFile)
    : userFilePath(userFile)
{
    spdlog::info("AuthManager initialized with user file '{}'", userFilePath);
    loadUsers();
}

void AuthManager::loadUsers() {
    std::vector<User> loaded;
    if (!Storage::loadUsers(loaded, userFilePath)) {
        throw std::runtime_error("user file '" + userFilePath + "' is corrupt");
    }
    users = std::move(loaded);
}

std::string AuthManager::hashPassword(const std::string& password) {
    char out[crypto_pwhash_STRBYTES];

    if (crypto_pwhash_str(
        out,
        password.c_str(),
        static_cast<unsigned long long>(password.size()),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0)
    {
        spdlog::error("crypto_pwhash_str failed (likely out of memory)");
        throw std::runtime_error("crypto_pwhash_str failed (out of memory)");
    }

    return std::string(out);
}

bool AuthManager::verifyPassword(const std::string& password, const std::string& hash) {
    if (hash.empty()) {
        spdlog::warn("verifyPassword() called with empty hash");
        return false;
    }

    return crypto_pwhash_str_verify(hash.c_str(),
        password.c_str(),
        static_cast<unsigned long long>(password.size())) == 0;
}

// Helper: hex-encode salt bytes to string
static std::string saltToHex(const unsigned char* salt, size_t len) {
    std::string hex(2 * len + 1, '\0');
    sodium_bin2hex(&hex[0], hex.size(), salt, len);
    hex.pop_back(); // trailing NUL
    return hex;
}

// Helper: hex string to exactly SALT_BYTES bytes
static bool hexToSalt(const std::string& hex, std::vector<unsigned char>& out) {
    out.resize(SALT_BYTES);
    size_t bin_len = 0;

    if (sodium_hex2bin(out.data(), out.size(),
        hex.c_str(), hex.size(),
        nullptr, &bin_len, nullptr) != 0)
    {
        spdlog::error("Failed to convert hex salt to binary");
        return false;
    }

    if (bin_len != SALT_BYTES) {
        spdlog::error("Salt length mismatch while decoding");
        return false;
    }

    return true;
}

std::vector<unsigned char> AuthManager::deriveKey(const std::string& password, const std::string& salt_hex) {
    std::vector<unsigned char> salt;
    if (salt_hex.empty() || !hexToSalt(salt_hex, salt)) {
        spdlog::error("Cannot derive card key: bad salt");
        return {};
    }

    std::vector<unsigned char> key(CARD_KEY_BYTES, 0);

    if (crypto_pwhash(key.data(),
        key.size(),
        password.c_str(),
        static_cast<unsigned long long>(password.size()),
        salt.data(),
        crypto_pwhash_OPSLIMIT_INTERACTIVE,
        crypto_pwhash_MEMLIMIT_INTERACTIVE,
        crypto_pwhash_ALG_DEFAULT) != 0)
    {
        spdlog::error("crypto_pwhash failed during card key derivation");
        return {};
    }

    return key;
}

bool AuthManager::isValidUsername(const std::string& username) {
    if (username.empty() || username.size() > MAX_USERNAME_LENGTH) return false;
    // The name becomes part of the card file name
    for (char c : username) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-' && c != '.') return false;
    }
    return username != "." && username != "..";
}

bool AuthManager::hasUser(const std::string& username) const {
    for (const auto& u : users) {
        if (u.username == username) return true;
    }
    return false;
}

bool AuthManager::signup(const std::string& username, const std::string& password) {
    spdlog::info("Attempting signup for username '{}'", username);

    if (username.empty() || password.empty()) {
        spdlog::warn("Signup failed: empty username or password");
        throw InvalidInput("username and password cannot be empty");
    }

    if (!isValidUsername(username)) {
        spdlog::warn("Signup failed: username '{}' has characters outside [A-Za-z0-9_.-]", username);
        throw InvalidInput("username may only contain letters, digits, '_', '-' and '.'");
    }

    if (hasUser(username)) {
        spdlog::warn("Signup failed: username '{}' already exists", username);
        return false;
    }

    unsigned char salt[SALT_BYTES];
    randombytes_buf(salt, SALT_BYTES);

    users.emplace_back(username, hashPassword(password), saltToHex(salt, SALT_BYTES), std::time(nullptr));
    if (!Storage::saveUsers(users, userFilePath)) {
        users.pop_back();
        spdlog::error("Signup failed: could not write '{}'", userFilePath);
        return false;
    }

    spdlog::info("Signup successful for username '{}'", username);
    return true;
}

std::unique_ptr<UserSession> AuthManager::login(const std::string& username, const std::string& password) const {
    spdlog::info("Login attempt for username '{}'", username);

    for (const auto& u : users) {
        if (u.username != username) continue;

        if (!verifyPassword(password, u.password_hash)) {
            spdlog::warn("Login failed: incorrect password for '{}'", username);
            return nullptr;
        }

        std::vector<unsigned char> key = deriveKey(password, u.key_salt);
        if (key.empty()) {
            spdlog::error("Failed to derive card key for '{}'", username);
            return nullptr;
        }

        spdlog::info("User '{}' logged in successfully", username);
        return std::make_unique<UserSession>(username, std::move(key));
    }

    spdlog::warn("Login failed: username '{}' not found", username);
    return nullptr;
}
