#pragma once
#include <vector>
#include <string>
#include "../auth/User.hpp"

// Storage handles the user file and sealed (encrypted) data files.
//
// Users: text-based safe lines (username, hash, salt_hex, created_at, ---)
// Sealed files:
//   Header: caller-supplied magic line (e.g. "CWCARDS1\n")
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
//
// Sealed IO requires a crypto_secretbox_KEYBYTES key; any other size fails.

class Storage {
public:
    // USERS (text)
    // Writes through a temporary file; loadUsers fails on any partial record
    static bool saveUsers(const std::vector<User>& users, const std::string& filename);
    static bool loadUsers(std::vector<User>& users, const std::string& filename);

    // SEALED FILES (encrypted)
    // Writes to a temporary file and renames it over `filename`
    static bool writeSealed(const std::string& filename, const std::string& magic,
        const std::string& plain, const std::vector<unsigned char>& key);
    // A missing file yields `found = false` and returns true
    static bool readSealed(const std::string& filename, const std::string& magic,
        const std::vector<unsigned char>& key, std::string& plain, bool& found);
};
