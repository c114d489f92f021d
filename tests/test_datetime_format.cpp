/**
 * @file test_datetime_format.cpp
 * @brief Unit tests for DateTimeFormat
 */

#include <gtest/gtest.h>
#include <typesys/format/datetime_format.h>

using namespace typesys::format;

class DateTimeFormatTest : public ::testing::Test {
protected:
    DateTimeFormat format_;

    std::string rejectCode(const std::string& input) const {
        try {
            format_.validate(input);
        } catch (const ValidationError& e) {
            return e.getCode();
        }
        return "";
    }

    int offsetMinutes(const std::string& input) const {
        auto offset = format_.parse(input).getOffset();
        EXPECT_TRUE(offset.has_value()) << input;
        return offset ? offset->getTotalMinutes() : 0;
    }
};

// ============================================================================
// Timezone designators
// ============================================================================

TEST_F(DateTimeFormatTest, Validate_Utc) {
    DateTime value = format_.parse("2021-06-01T12:00:00Z");
    ASSERT_TRUE(value.getOffset().has_value());
    EXPECT_TRUE(value.getOffset()->isUtc());
    EXPECT_EQ(value.getDate(), Date::of(2021, 6, 1));
    EXPECT_EQ(value.getTime(), Time::of(12, 0, 0));
}

TEST_F(DateTimeFormatTest, Validate_PositiveOffsetWithColon) {
    EXPECT_EQ(offsetMinutes("2021-06-01T12:00:00+05:30"), 5 * 60 + 30);
}

TEST_F(DateTimeFormatTest, Validate_OffsetWithoutColon) {
    EXPECT_EQ(offsetMinutes("2021-06-01T12:00:00+0530"), 330);
}

TEST_F(DateTimeFormatTest, Validate_OffsetHoursOnly) {
    EXPECT_EQ(offsetMinutes("2021-06-01T12:00:00+05"), 300);
    EXPECT_EQ(offsetMinutes("2021-06-01T12:00:00-03"), -180);
}

TEST_F(DateTimeFormatTest, Validate_NegativeOffset) {
    EXPECT_EQ(offsetMinutes("2021-06-01T12:00:00-08:00"), -480);
    EXPECT_EQ(offsetMinutes("2021-06-01T12:00:00-09:30"), -570);
}

TEST_F(DateTimeFormatTest, Validate_Naive) {
    DateTime value = format_.parse("2021-06-01 12:00");
    EXPECT_TRUE(value.isNaive());
    EXPECT_EQ(value.getTime(), Time::of(12, 0));
}

TEST_F(DateTimeFormatTest, Validate_FractionPadding) {
    EXPECT_EQ(format_.parse("2021-06-01T12:00:00.5Z").getTime().getMicrosecond(), 500000);
    EXPECT_EQ(format_.parse("2021-06-01T12:00:00.1234567").getTime().getMicrosecond(), 123456);
}

// ============================================================================
// Rejections
// ============================================================================

TEST_F(DateTimeFormatTest, Validate_ImpossibleValues) {
    EXPECT_EQ(rejectCode("2021-02-30T12:00:00"), "invalid");
    EXPECT_EQ(rejectCode("2021-06-01T25:00:00"), "invalid");
    EXPECT_EQ(rejectCode("2021-06-01T12:60:00Z"), "invalid");
    EXPECT_EQ(rejectCode("2021-06-01T12:00:00+24:00"), "invalid");
    EXPECT_EQ(rejectCode("2021-06-01T12:00:00-23:60"), "invalid");
}

TEST_F(DateTimeFormatTest, Validate_BadFormat) {
    EXPECT_EQ(rejectCode("2021-06-01"), "format");
    EXPECT_EQ(rejectCode("12:00:00"), "format");
    EXPECT_EQ(rejectCode("2021-06-01X12:00:00"), "format");
    EXPECT_EQ(rejectCode("2021-06-01T12:00:00 Z"), "format");
    EXPECT_EQ(rejectCode("2021-06-01T12:00:00+5:30"), "format");
    EXPECT_EQ(rejectCode("2021-06-01T12:00:00UTC"), "format");
    EXPECT_EQ(rejectCode("2021-06-01T12:00:00.1234567890123"), "format");
}

TEST_F(DateTimeFormatTest, ErrorMessages) {
    try {
        format_.validate("2021-02-30T00:00");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.getText(), "Must be a real datetime.");
    }

    try {
        format_.validate("now");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.getText(), "Must be a valid datetime format.");
    }
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(DateTimeFormatTest, Serialize_UtcAsZ) {
    auto text = format_.serialize(format_.validate("2021-06-01T12:00:00Z"));
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "2021-06-01T12:00:00Z");
}

TEST_F(DateTimeFormatTest, Serialize_ZeroOffsetAsZ) {
    EXPECT_EQ(format_.serialize(format_.validate("2021-06-01T12:00:00+00:00")), "2021-06-01T12:00:00Z");
    EXPECT_EQ(format_.serialize(format_.validate("2021-06-01T12:00:00-00:00")), "2021-06-01T12:00:00Z");
    EXPECT_EQ(format_.serialize(format_.validate("2021-06-01T12:00:00+00")), "2021-06-01T12:00:00Z");
}

TEST_F(DateTimeFormatTest, Serialize_Offsets) {
    EXPECT_EQ(format_.serialize(format_.validate("2021-06-01T12:00:00+0530")), "2021-06-01T12:00:00+05:30");
    EXPECT_EQ(format_.serialize(format_.validate("2021-06-01T12:00:00-08")), "2021-06-01T12:00:00-08:00");
}

TEST_F(DateTimeFormatTest, Serialize_NaiveAndFraction) {
    EXPECT_EQ(format_.serialize(format_.validate("2021-6-1 9:05")), "2021-06-01T09:05:00");
    EXPECT_EQ(format_.serialize(format_.validate("2021-06-01T12:00:00.5Z")), "2021-06-01T12:00:00.500000Z");
}

TEST_F(DateTimeFormatTest, Serialize_Null) {
    EXPECT_EQ(format_.serialize(std::monostate{}), std::nullopt);
}

TEST_F(DateTimeFormatTest, Serialize_WrongType) {
    EXPECT_THROW(format_.serialize(Date::of(2021, 6, 1)), std::invalid_argument);
}

TEST_F(DateTimeFormatTest, IsNativeType) {
    EXPECT_TRUE(format_.isNativeType(format_.validate("2021-06-01T12:00:00Z")));
    EXPECT_FALSE(format_.isNativeType(Date::of(2021, 6, 1)));
    EXPECT_FALSE(format_.isNativeType(std::string("2021-06-01T12:00:00Z")));
}

TEST_F(DateTimeFormatTest, SameInstantDifferentOffsets) {
    DateTime india = format_.parse("2021-06-01T12:00:00+05:30");
    DateTime utc = format_.parse("2021-06-01T06:30:00Z");

    EXPECT_EQ(india.toTimePoint(), utc.toTimePoint());
    EXPECT_NE(india, utc);
}

TEST_F(DateTimeFormatTest, RoundTrip) {
    for (const char* input : {
             "2021-06-01T12:00:00Z",
             "2021-06-01T12:00:00+05:30",
             "2021-06-01 12:00:00-0800",
             "2020-02-29T23:59:59.999999",
             "1999-12-31T00:00:00.000001+14:00"}) {
        DateTime parsed = format_.parse(input);
        auto text = format_.serialize(parsed);
        ASSERT_TRUE(text.has_value()) << input;
        EXPECT_EQ(format_.parse(*text), parsed) << input;
    }
}
