/**
 * @file test_format.cpp
 * @brief Unit tests for the shared Format behaviour
 *
 * Error templating, toNative() coercion and value type names.
 */

#include <gtest/gtest.h>
#include <typesys/format/date_format.h>
#include <typesys/format/format.h>
#include <typesys/format/uuid_format.h>

using namespace typesys::format;

namespace {

/// Format with parameterized messages, accepting strings of a minimum length
class MinLengthFormat : public Format {
public:
    explicit MinLengthFormat(size_t minLength) : minLength_(minLength) {}

    std::string name() const override { return "min-length"; }

    bool isNativeType(const FormatValue&) const override { return false; }

    FormatValue validate(const std::string& value) const override {
        if (value.length() < minLength_) {
            throw validationError("min_length");
        }
        return value;
    }

    std::optional<std::string> serialize(const FormatValue& value) const override {
        if (std::holds_alternative<std::monostate>(value)) {
            return std::nullopt;
        }
        return std::get<std::string>(value);
    }

    const ErrorTemplates& errorTemplates() const override {
        static const ErrorTemplates templates = {
            {"min_length", "Must have at least {min_length} characters."},
        };
        return templates;
    }

    ErrorParams errorParams() const override {
        return {{"min_length", std::to_string(minLength_)}};
    }

private:
    size_t minLength_;
};

} // anonymous namespace

// ============================================================================
// renderErrorTemplate
// ============================================================================

TEST(ErrorTemplateTest, Render_NoPlaceholders) {
    EXPECT_EQ(renderErrorTemplate("Must be a real date.", {}), "Must be a real date.");
}

TEST(ErrorTemplateTest, Render_SubstitutesAllOccurrences) {
    EXPECT_EQ(renderErrorTemplate("{a} and {b} and {a}", {{"a", "1"}, {"b", "2"}}),
              "1 and 2 and 1");
}

TEST(ErrorTemplateTest, Render_UnknownPlaceholderKept) {
    EXPECT_EQ(renderErrorTemplate("Between {min} and {max}.", {{"min", "3"}}),
              "Between 3 and {max}.");
}

// ============================================================================
// Format::validationError
// ============================================================================

TEST(FormatErrorTest, ValidationError_UsesParams) {
    MinLengthFormat format(3);
    try {
        format.validate("ab");
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.getCode(), "min_length");
        EXPECT_EQ(e.getText(), "Must have at least 3 characters.");
    }
}

TEST(FormatErrorTest, ValidationError_UnknownCode) {
    DateFormat format;
    EXPECT_THROW(format.validationError("max_length"), std::logic_error);
}

TEST(FormatErrorTest, ValidationError_DeclaredCodes) {
    EXPECT_EQ(DateFormat().errorTemplates().size(), 2u);
    EXPECT_EQ(UuidFormat().errorTemplates().size(), 1u);
    EXPECT_EQ(UuidFormat().validationError("format"),
              ValidationError("Must be valid UUID format.", "format"));
}

TEST(FormatErrorTest, ValidationError_ToJson) {
    Json::Value json = DateFormat().validationError("invalid").toJson();
    EXPECT_EQ(json["text"].asString(), "Must be a real date.");
    EXPECT_EQ(json["code"].asString(), "invalid");
}

// ============================================================================
// toNative
// ============================================================================

TEST(ToNativeTest, NullStaysNull) {
    EXPECT_TRUE(std::holds_alternative<std::monostate>(toNative(DateFormat(), std::monostate{})));
}

TEST(ToNativeTest, NativeValuePassesThrough) {
    FormatValue date = Date::of(2021, 6, 1);
    EXPECT_EQ(toNative(DateFormat(), date), date);
}

TEST(ToNativeTest, StringIsValidated) {
    FormatValue value = toNative(DateFormat(), std::string("2021-6-1"));
    ASSERT_TRUE(std::holds_alternative<Date>(value));
    EXPECT_EQ(std::get<Date>(value), Date::of(2021, 6, 1));
}

TEST(ToNativeTest, InvalidStringPropagatesError) {
    EXPECT_THROW(toNative(DateFormat(), std::string("2021-02-30")), ValidationError);
}

TEST(ToNativeTest, OtherNativeTypeRejected) {
    try {
        toNative(DateFormat(), Time::of(12, 0));
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.getCode(), "type");
        EXPECT_EQ(e.getText(), "Must be a string.");
    }
}

TEST(ValueTypeNameTest, Names) {
    EXPECT_EQ(valueTypeName(std::monostate{}), "null");
    EXPECT_EQ(valueTypeName(std::string("x")), "string");
    EXPECT_EQ(valueTypeName(Date::of(2021, 1, 1)), "date");
    EXPECT_EQ(valueTypeName(Uuid::generateV4()), "uuid");
    EXPECT_EQ(valueTypeName(EmailAddress::of("a@b.com")), "email");
}
