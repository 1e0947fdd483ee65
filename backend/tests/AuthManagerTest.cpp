#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <sodium.h>
#include "../src/auth/AuthManager.hpp"
#include "../src/core/Errors.hpp"

class AuthManagerTest : public ::testing::Test {
protected:
    std::string userFile;

    void SetUp() override {
        ASSERT_GE(sodium_init(), 0);
        userFile = ::testing::TempDir() + "users_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".txt";
        std::remove(userFile.c_str());
    }

    void TearDown() override {
        std::remove(userFile.c_str());
        std::remove((userFile + ".tmp").c_str());
    }

    void writeUserFile(const std::string& contents) {
        std::ofstream out(userFile, std::ios::trunc);
        out << contents;
    }
};

const char VALID_HASH[] = "$argon2id$v=19$m=65536,t=2,p=1$c29tZXNhbHQ$aGFzaA";
const char VALID_SALT[] = "00112233445566778899aabbccddeeff";

TEST_F(AuthManagerTest, SignupThenLoginYieldsCardKey) {
    AuthManager auth(userFile);
    ASSERT_TRUE(auth.signup("ada", "correct horse"));

    auto session = auth.login("ada", "correct horse");
    ASSERT_TRUE(session);
    EXPECT_EQ(session->username(), "ada");
    EXPECT_EQ(session->key().size(), static_cast<std::size_t>(crypto_secretbox_KEYBYTES));
}

TEST_F(AuthManagerTest, KeyIsStableAcrossLoginsAndRestarts) {
    std::vector<unsigned char> first;
    {
        AuthManager auth(userFile);
        ASSERT_TRUE(auth.signup("ada", "pw"));
        first = auth.login("ada", "pw")->key();
    }

    AuthManager reloaded(userFile);
    EXPECT_TRUE(reloaded.hasUser("ada"));
    auto session = reloaded.login("ada", "pw");
    ASSERT_TRUE(session);
    EXPECT_EQ(session->key(), first);
}

TEST_F(AuthManagerTest, WrongPasswordOrUnknownUserFails) {
    AuthManager auth(userFile);
    ASSERT_TRUE(auth.signup("ada", "pw"));
    EXPECT_FALSE(auth.login("ada", "nope"));
    EXPECT_FALSE(auth.login("bob", "pw"));
}

TEST_F(AuthManagerTest, DuplicateAndEmptySignupsAreRejected) {
    AuthManager auth(userFile);
    ASSERT_TRUE(auth.signup("ada", "pw"));
    EXPECT_FALSE(auth.signup("ada", "other"));
    EXPECT_THROW(auth.signup("", "pw"), InvalidInput);
    EXPECT_THROW(auth.signup("bob", ""), InvalidInput);
    EXPECT_EQ(auth.userCount(), 1u);
}

TEST_F(AuthManagerTest, UsernamesThatAreNotPlainFileNamesAreRejected) {
    AuthManager auth(userFile);
    EXPECT_THROW(auth.signup("a/b", "pw"), InvalidInput);
    EXPECT_THROW(auth.signup("../../tmp/x", "pw"), InvalidInput);
    EXPECT_THROW(auth.signup("a\\b", "pw"), InvalidInput);
    EXPECT_THROW(auth.signup("..", "pw"), InvalidInput);
    EXPECT_THROW(auth.signup(std::string("a\0b", 3), "pw"), InvalidInput);
    EXPECT_THROW(auth.signup("ada lovelace", "pw"), InvalidInput);
    EXPECT_THROW(auth.signup(std::string(AuthManager::MAX_USERNAME_LENGTH + 1, 'a'), "pw"), InvalidInput);
    EXPECT_EQ(auth.userCount(), 0u);

    EXPECT_TRUE(auth.signup("ada_lovelace-1.x", "pw"));
    EXPECT_TRUE(auth.hasUser("ada_lovelace-1.x"));
}

TEST_F(AuthManagerTest, SignupLeavesNoTemporaryFile) {
    AuthManager auth(userFile);
    ASSERT_TRUE(auth.signup("ada", "pw"));
    ASSERT_TRUE(auth.signup("bob", "pw"));

    std::ifstream tmp(userFile + ".tmp");
    EXPECT_FALSE(tmp.good());

    AuthManager reloaded(userFile);
    EXPECT_EQ(reloaded.userCount(), 2u);
}

TEST_F(AuthManagerTest, HandWrittenRecordLoads) {
    writeUserFile(std::string("ada\n") + VALID_HASH + "\n" + VALID_SALT + "\n1792368000\n---\n");
    AuthManager auth(userFile);
    EXPECT_TRUE(auth.hasUser("ada"));
    EXPECT_EQ(auth.userCount(), 1u);
}

TEST_F(AuthManagerTest, TruncatedUserFileIsRejected) {
    writeUserFile(std::string("ada\n") + VALID_HASH + "\n");
    EXPECT_THROW(AuthManager auth(userFile), std::runtime_error);

    // Record cut off before its separator
    writeUserFile(std::string("ada\n") + VALID_HASH + "\n" + VALID_SALT + "\n1792368000\n");
    EXPECT_THROW(AuthManager auth(userFile), std::runtime_error);
}

TEST_F(AuthManagerTest, BadRecordSeparatorIsRejected) {
    writeUserFile(std::string("ada\n") + VALID_HASH + "\n" + VALID_SALT + "\n1792368000\nxxx\n");
    EXPECT_THROW(AuthManager auth(userFile), std::runtime_error);

    writeUserFile(std::string("ada\n") + VALID_HASH + "\n" + VALID_SALT + "\n17923x\n---\n");
    EXPECT_THROW(AuthManager auth(userFile), std::runtime_error);
}
