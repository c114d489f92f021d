/**
 * @file test_json_bridge.cpp
 * @brief Unit tests for the JSON bridge
 */

#include <gtest/gtest.h>
#include <typesys/format/date_format.h>
#include <typesys/format/email_format.h>
#include <typesys/format/json_bridge.h>

using namespace typesys::format;

class JsonBridgeTest : public ::testing::Test {
protected:
    DateFormat dateFormat_;
    EmailFormat emailFormat_;
};

TEST_F(JsonBridgeTest, ValidateJson_String) {
    FormatValue value = validateJson(dateFormat_, Json::Value("2021-06-01"));
    ASSERT_TRUE(std::holds_alternative<Date>(value));
    EXPECT_EQ(std::get<Date>(value), Date::of(2021, 6, 1));
}

TEST_F(JsonBridgeTest, ValidateJson_Null) {
    FormatValue value = validateJson(dateFormat_, Json::Value(Json::nullValue));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(value));
}

TEST_F(JsonBridgeTest, ValidateJson_NonStringRejected) {
    for (const Json::Value& input : {Json::Value(20210601), Json::Value(true),
                                     Json::Value(Json::arrayValue), Json::Value(Json::objectValue)}) {
        try {
            validateJson(dateFormat_, input);
            FAIL() << "Expected ValidationError";
        } catch (const ValidationError& e) {
            EXPECT_EQ(e.getCode(), "type");
        }
    }
}

TEST_F(JsonBridgeTest, ValidateJson_FormatErrorPropagates) {
    try {
        validateJson(emailFormat_, Json::Value("a@b"));
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.getCode(), "format");
    }
}

TEST_F(JsonBridgeTest, SerializeJson_Value) {
    Json::Value json = serializeJson(dateFormat_, Date::of(2021, 6, 1));
    ASSERT_TRUE(json.isString());
    EXPECT_EQ(json.asString(), "2021-06-01");
}

TEST_F(JsonBridgeTest, SerializeJson_Null) {
    EXPECT_TRUE(serializeJson(dateFormat_, std::monostate{}).isNull());
}

TEST_F(JsonBridgeTest, ErrorToJson) {
    try {
        validateJson(dateFormat_, Json::Value("2021-13-01"));
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        Json::Value json = e.toJson();
        EXPECT_EQ(json["code"].asString(), "invalid");
        EXPECT_EQ(json["text"].asString(), "Must be a real date.");
        EXPECT_EQ(json.size(), 2u);
    }
}
