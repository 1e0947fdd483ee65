#include "Storage.hpp"
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char USER_RECORD_END[] = "---";

// Moves a fully written temporary file over `filename`
static bool commitTempFile(const std::string& tmp, const std::string& filename) {
    if (std::rename(tmp.c_str(), filename.c_str()) != 0) {
        spdlog::error("Failed to replace '{}' with '{}'", filename, tmp);
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

bool Storage::saveUsers(const std::vector<User>& users, const std::string& filename) {
    spdlog::info("Saving {} users to '{}'", users.size(), filename);

    const std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for writing user data", tmp);
            return false;
        }

        for (const auto& u : users) {
            out << u.username << "\n"
                << u.password_hash << "\n"
                << u.key_salt << "\n"
                << u.created_at << "\n"
                << USER_RECORD_END << "\n";
        }

        out.flush();
        if (!out) {
            spdlog::error("Write to '{}' failed", tmp);
            std::remove(tmp.c_str());
            return false;
        }
    }

    return commitTempFile(tmp, filename);
}

bool Storage::loadUsers(std::vector<User>& users, const std::string& filename) {
    spdlog::info("Loading users from '{}'", filename);
    users.clear();

    std::ifstream in(filename);
    if (!in) {
        spdlog::warn("User file '{}' not found; treating as empty", filename);
        return true;
    }

    std::vector<User> loaded;
    std::string username;
    while (std::getline(in, username)) {
        User u;
        u.username = username;

        std::string created, sep;
        if (!std::getline(in, u.password_hash) || !std::getline(in, u.key_salt) ||
            !std::getline(in, created) || !std::getline(in, sep))
        {
            spdlog::error("Truncated user record for '{}' in '{}'", u.username, filename);
            return false;
        }

        if (sep != USER_RECORD_END || u.username.empty() || u.password_hash.empty() || u.key_salt.empty()) {
            spdlog::error("Malformed user record for '{}' in '{}'", u.username, filename);
            return false;
        }

        try {
            std::size_t used = 0;
            u.created_at = static_cast<std::time_t>(std::stoll(created, &used));
            if (used != created.size()) {
                spdlog::error("Bad creation time for '{}' in '{}'", u.username, filename);
                return false;
            }
        }
        catch (const std::logic_error& e) {
            spdlog::error("Bad creation time for '{}' in '{}': {}", u.username, filename, e.what());
            return false;
        }

        loaded.push_back(u);
    }

    users = std::move(loaded);
    spdlog::info("Loaded {} users", users.size());
    return true;
}

bool Storage::writeSealed(const std::string& filename, const std::string& magic,
    const std::string& plain, const std::vector<unsigned char>& key)
{
    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, key.data()) != 0) {
        spdlog::error("Encryption failed");
        return false;
    }

    const std::string tmp = filename + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::error("Failed to open '{}' for encrypted write", tmp);
            return false;
        }

        out.write(magic.data(), static_cast<std::streamsize>(magic.size()));
        out.write(reinterpret_cast<const char*>(nonce), sizeof(nonce));
        out.write(reinterpret_cast<const char*>(ciphertext.data()), static_cast<std::streamsize>(ciphertext.size()));
        out.flush();
        if (!out) {
            spdlog::error("Encrypted write to '{}' failed", tmp);
            std::remove(tmp.c_str());
            return false;
        }
    }

    if (!commitTempFile(tmp, filename))
        return false;

    spdlog::debug("Sealed {} bytes into '{}'", plain.size(), filename);
    return true;
}

bool Storage::readSealed(const std::string& filename, const std::string& magic,
    const std::vector<unsigned char>& key, std::string& plain, bool& found)
{
    plain.clear();
    found = false;

    if (key.size() != crypto_secretbox_KEYBYTES) {
        spdlog::error("Invalid key size");
        return false;
    }

    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::warn("Sealed file '{}' not found; treating as empty", filename);
        return true;
    }
    found = true;

    std::string hdr(magic.size(), '\0');
    in.read(&hdr[0], static_cast<std::streamsize>(hdr.size()));
    if (static_cast<std::size_t>(in.gcount()) != hdr.size() || hdr != magic) {
        spdlog::error("Invalid magic header in '{}'", filename);
        return false;
    }

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    in.read(reinterpret_cast<char*>(nonce), sizeof(nonce));
    if (in.gcount() != sizeof(nonce)) {
        spdlog::error("Failed to read nonce");
        return false;
    }

    std::vector<unsigned char> ciphertext(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>());

    if (ciphertext.size() < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short");
        return false;
    }

    std::vector<unsigned char> decrypted(ciphertext.size() - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(decrypted.data(), ciphertext.data(), ciphertext.size(), nonce, key.data()) != 0) {
        spdlog::error("Decryption failed (wrong key or tampered file)");
        return false;
    }

    plain.assign(reinterpret_cast<const char*>(decrypted.data()), decrypted.size());
    sodium_memzero(decrypted.data(), decrypted.size());
    return true;
}
