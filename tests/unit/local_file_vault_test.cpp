// tests/unit/local_file_vault_test.cpp
#include <gtest/gtest.h>
#include "common/vault/include/LocalFileVault.hpp"
#include "common/vault/include/VaultException.hpp"
#include "fakes/TempDir.hpp"

using namespace secret_env;
using namespace secret_env::vault;
using secret_env::test::TempDir;

class LocalFileVaultTest : public ::testing::Test {
protected:
    TempDir dir;
};

TEST_F(LocalFileVaultTest, ReadsJsonFile) {
    dir.Write("db-password.json", R"({"DB_PASS":"secret123","DB_PORT":5432})");

    LocalFileVault vault(dir.Path());
    EnvEntries entries = vault.DownloadJson("db-password");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, "DB_PASS");
    EXPECT_EQ(entries[0].second, "secret123");
    EXPECT_EQ(entries[1].first, "DB_PORT");
    EXPECT_EQ(entries[1].second, "5432");
    EXPECT_STREQ(vault.Name(), "local");
}

TEST_F(LocalFileVaultTest, MissingFileIsNotFound) {
    LocalFileVault vault(dir.Path());
    try {
        vault.DownloadJson("absent");
        FAIL() << "expected RemoteCallException";
    } catch (const RemoteCallException& e) {
        EXPECT_EQ(e.Code(), rpc::StatusCode::NOT_FOUND);
    }
}

TEST_F(LocalFileVaultTest, EmptyFileIsEmptySecret) {
    dir.Write("empty.json", "");
    LocalFileVault vault(dir.Path());
    EXPECT_THROW(vault.DownloadJson("empty"), EmptySecretException);
}

TEST_F(LocalFileVaultTest, InvalidContentIsDecodeError) {
    dir.Write("broken.json", "{ nope");
    dir.Write("list.json", "[\"a\"]");

    LocalFileVault vault(dir.Path());
    EXPECT_THROW(vault.DownloadJson("broken"), DecodeException);
    EXPECT_THROW(vault.DownloadJson("list"), DecodeException);
}

TEST_F(LocalFileVaultTest, RejectsPathTraversal) {
    dir.Write("inner/secret.json", R"({"A":"1"})");

    LocalFileVault vault(dir.Path() / "inner");
    EXPECT_THROW(vault.DownloadJson("../inner/secret"), ConfigurationException);
    EXPECT_THROW(vault.DownloadJson("sub/secret"), ConfigurationException);
    EXPECT_THROW(vault.DownloadJson("sub\\secret"), ConfigurationException);
    EXPECT_THROW(vault.DownloadJson(""), ConfigurationException);
    EXPECT_EQ(vault.DownloadJson("secret").size(), 1u);
}

TEST_F(LocalFileVaultTest, DownloadPrefixedIsUnimplemented) {
    LocalFileVault vault(dir.Path());
    EXPECT_THROW(vault.DownloadPrefixed("db-"), UnimplementedException);
    EXPECT_THROW(vault.DownloadPrefixed(""), UnimplementedException);
}
