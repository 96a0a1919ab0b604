/**
 * @file test_serde_json.cpp
 * @brief Unit tests for the JsonCpp adapter
 */

#include <gtest/gtest.h>
#include <hrid/serde/json.h>

#include <vector>

using namespace hrid;

class SerdeJsonTest : public ::testing::Test {
protected:
    const std::vector<std::string> samples_ = {
        "my-service", "日本語", "café", "v1.2.3", "100%", "🚀-launch", "a", "x\x7fy"
    };
};

TEST_F(SerdeJsonTest, Encode_BareString) {
    EXPECT_EQ(serde::encode(Id::of("my-service")), "\"my-service\"");
}

TEST_F(SerdeJsonTest, Encode_RawUtf8) {
    EXPECT_EQ(serde::encode(Id::of("日本語")), "\"日本語\"");
}

TEST_F(SerdeJsonTest, ToJson_IsString) {
    Json::Value v = serde::toJson(Id::of("my-service"));
    ASSERT_TRUE(v.isString());
    EXPECT_EQ(v.asString(), "my-service");
}

TEST_F(SerdeJsonTest, RoundTrip) {
    for (const auto& s : samples_) {
        auto id = Id::of(s);
        EXPECT_EQ(serde::decode(serde::encode(id)), id) << s;
        EXPECT_EQ(serde::fromJson(serde::toJson(id)), id) << s;
    }
}

TEST_F(SerdeJsonTest, Decode_EscapedUnicode) {
    EXPECT_EQ(serde::decode("\"\\u65e5\\u672c\\u8a9e\""), Id::of("日本語"));
}

TEST_F(SerdeJsonTest, Decode_GrammarViolation) {
    try {
        (void)serde::decode("\"a..b\"");
        FAIL() << "expected DeserializationError";
    } catch (const DeserializationError& e) {
        EXPECT_EQ(e.getRule(), Rule::PATH_TRAVERSAL);
        ASSERT_NE(e.getValidationError(), nullptr);
        EXPECT_EQ(e.getValidationError()->getInput(), "a..b");
        EXPECT_EQ(e.getCode(), "DESERIALIZATION_ERROR");
    }
}

TEST_F(SerdeJsonTest, Decode_EscapedControlCharacterRejected) {
    // Valid JSON, but the decoded text contains a newline
    try {
        (void)serde::decode("\"line\\nbreak\"");
        FAIL() << "expected DeserializationError";
    } catch (const DeserializationError& e) {
        EXPECT_EQ(e.getRule(), Rule::CONTROL_CHARACTER);
    }
}

TEST_F(SerdeJsonTest, Decode_EmptyString) {
    try {
        (void)serde::decode("\"\"");
        FAIL() << "expected DeserializationError";
    } catch (const DeserializationError& e) {
        EXPECT_EQ(e.getRule(), Rule::EMPTY);
    }
}

TEST_F(SerdeJsonTest, Decode_NotAString) {
    for (const char* text : {"42", "null", "true", "[\"a\"]", "{\"id\":\"a\"}"}) {
        try {
            (void)serde::decode(text);
            ADD_FAILURE() << "accepted " << text;
        } catch (const DeserializationError& e) {
            EXPECT_EQ(e.getValidationError(), nullptr) << text;
            EXPECT_EQ(e.getRule(), Rule::NONE);
        }
    }
}

TEST_F(SerdeJsonTest, Decode_MalformedJson) {
    EXPECT_THROW(serde::decode("\"unterminated"), DeserializationError);
    EXPECT_THROW(serde::decode(""), DeserializationError);
}

TEST_F(SerdeJsonTest, Decode_TrailingContentRejected) {
    EXPECT_THROW(serde::decode("\"ok\" \"../etc/passwd\""), DeserializationError);
    EXPECT_THROW(serde::decode("\"ok\"garbage"), DeserializationError);
    EXPECT_EQ(serde::decode("  \"ok\"\n"), "ok");
}

TEST_F(SerdeJsonTest, Decode_CommentsRejected) {
    EXPECT_THROW(serde::decode("/* c */ \"ok\""), DeserializationError);
    EXPECT_THROW(serde::decode("\"ok\" // x"), DeserializationError);
}

TEST_F(SerdeJsonTest, FromJson_NonStringValue) {
    EXPECT_THROW(serde::fromJson(Json::Value(7)), DeserializationError);
    EXPECT_THROW(serde::fromJson(Json::Value()), DeserializationError);
}

TEST_F(SerdeJsonTest, EmbeddedInDocument) {
    Json::Value doc;
    doc["owner"] = serde::toJson(Id::of("team-a"));
    doc["services"].append(serde::toJson(Id::of("svc-1")));
    doc["services"].append(serde::toJson(Id::of("svc-2")));

    EXPECT_EQ(serde::fromJson(doc["owner"]), "team-a");
    EXPECT_EQ(serde::fromJson(doc["services"][1]), "svc-2");
}
