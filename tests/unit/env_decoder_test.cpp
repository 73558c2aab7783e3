// tests/unit/env_decoder_test.cpp
#include <gtest/gtest.h>
#include "common/env/include/EnvDecoder.hpp"
#include "common/vault/include/VaultException.hpp"

using namespace secret_env;
using namespace secret_env::env;
using secret_env::vault::DecodeException;
using secret_env::vault::VaultErrorKind;

TEST(EnvDecoderTest, StringValuesAreVerbatim) {
    auto value = EnvDecoder::ParsePayload("db-password", R"({"DB_PASS":"secret123"})");
    EnvEntries entries = EnvDecoder::DecodeEnvFromJson("db-password", value);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, "DB_PASS");
    EXPECT_EQ(entries[0].second, "secret123");
}

TEST(EnvDecoderTest, PreservesPayloadOrder) {
    auto value = EnvDecoder::ParsePayload("app", R"({"ZETA":"z","ALPHA":"a","MID":"m"})");
    EnvEntries entries = EnvDecoder::DecodeEnvFromJson("app", value);

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].first, "ZETA");
    EXPECT_EQ(entries[1].first, "ALPHA");
    EXPECT_EQ(entries[2].first, "MID");
}

TEST(EnvDecoderTest, NumbersAndBooleansUseJsonText) {
    auto value = EnvDecoder::ParsePayload("app", R"({"PORT":5432,"DEBUG":true,"RATIO":-3,"OFF":false})");
    EnvEntries entries = EnvDecoder::DecodeEnvFromJson("app", value);

    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].second, "5432");
    EXPECT_EQ(entries[1].second, "true");
    EXPECT_EQ(entries[2].second, "-3");
    EXPECT_EQ(entries[3].second, "false");
}

TEST(EnvDecoderTest, EmptyObjectYieldsNoEntries) {
    auto value = EnvDecoder::ParsePayload("app", "{}");
    EXPECT_TRUE(EnvDecoder::DecodeEnvFromJson("app", value).empty());
}

TEST(EnvDecoderTest, StringsKeepSpecialCharacters) {
    auto value = EnvDecoder::ParsePayload("app", R"({"DSN":"postgres://u:p@h/db?x=1 y","EMPTY":""})");
    EnvEntries entries = EnvDecoder::DecodeEnvFromJson("app", value);

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].second, "postgres://u:p@h/db?x=1 y");
    EXPECT_EQ(entries[1].second, "");
}

TEST(EnvDecoderTest, InvalidJsonThrowsDecode) {
    try {
        EnvDecoder::ParsePayload("broken", "not json");
        FAIL() << "expected DecodeException";
    } catch (const DecodeException& e) {
        EXPECT_EQ(e.Kind(), VaultErrorKind::DECODE);
        EXPECT_NE(std::string(e.what()).find("broken"), std::string::npos);
    }
}

TEST(EnvDecoderTest, TopLevelMustBeObject) {
    EXPECT_THROW(EnvDecoder::DecodeEnvFromJson("a", EnvDecoder::ParsePayload("a", "[1,2]")), DecodeException);
    EXPECT_THROW(EnvDecoder::DecodeEnvFromJson("a", EnvDecoder::ParsePayload("a", "\"text\"")), DecodeException);
    EXPECT_THROW(EnvDecoder::DecodeEnvFromJson("a", EnvDecoder::ParsePayload("a", "42")), DecodeException);
}

TEST(EnvDecoderTest, RejectsNullObjectAndArrayValues) {
    EXPECT_THROW(EnvDecoder::DecodeEnvFromJson("a", EnvDecoder::ParsePayload("a", R"({"K":null})")),
                 DecodeException);
    EXPECT_THROW(EnvDecoder::DecodeEnvFromJson("a", EnvDecoder::ParsePayload("a", R"({"K":{"x":1}})")),
                 DecodeException);
    EXPECT_THROW(EnvDecoder::DecodeEnvFromJson("a", EnvDecoder::ParsePayload("a", R"({"K":[1]})")),
                 DecodeException);
}

TEST(EnvDecoderTest, ErrorNamesSecretAndKey) {
    try {
        EnvDecoder::DecodeEnvFromJson("db-password", EnvDecoder::ParsePayload("db-password", R"({"NESTED":{}})"));
        FAIL() << "expected DecodeException";
    } catch (const DecodeException& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("db-password"), std::string::npos);
        EXPECT_NE(msg.find("NESTED"), std::string::npos);
    }
}

TEST(EnvDecoderTest, RejectsInvalidKeys) {
    EXPECT_THROW(EnvDecoder::DecodeEnvFromJson("a", EnvDecoder::ParsePayload("a", R"({"":"v"})")),
                 DecodeException);
    EXPECT_THROW(EnvDecoder::DecodeEnvFromJson("a", EnvDecoder::ParsePayload("a", R"({"A=B":"v"})")),
                 DecodeException);
    EXPECT_THROW(EnvDecoder::DecodeEnvFromJson("a", EnvDecoder::ParsePayload("a", R"({"A\u0000B":"v"})")),
                 DecodeException);
}

TEST(EnvDecoderTest, RejectsNulInValue) {
    auto value = EnvDecoder::ParsePayload("a", R"({"TOKEN":"abc\u0000def"})");
    try {
        EnvDecoder::DecodeEnvFromJson("a", value);
        FAIL() << "expected DecodeException";
    } catch (const DecodeException& e) {
        EXPECT_NE(std::string(e.what()).find("TOKEN"), std::string::npos);
    }

    auto multiline = EnvDecoder::ParsePayload("a", R"({"PEM":"line1\nline2"})");
    EnvEntries entries = EnvDecoder::DecodeEnvFromJson("a", multiline);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].second, "line1\nline2");
}

TEST(EnvDecoderTest, IsValidKey) {
    EXPECT_TRUE(EnvDecoder::IsValidKey("DB_PASS"));
    EXPECT_TRUE(EnvDecoder::IsValidKey("lower.case-key"));
    EXPECT_FALSE(EnvDecoder::IsValidKey(""));
    EXPECT_FALSE(EnvDecoder::IsValidKey("A=B"));
    EXPECT_FALSE(EnvDecoder::IsValidKey(std::string("A\0B", 3)));
}
