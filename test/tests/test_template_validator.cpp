#include <gtest/gtest.h>
#include "lunar_trace.hpp"
#include "utils/test_utils.hpp"
#include <string>
#include <vector>

class TemplateValidatorTest : public ::testing::Test {
protected:
    lunar_trace::ValidatedTemplate validate(const std::string &tmpl,
                                            const std::vector<std::string> &names) {
        return lunar_trace::validateTemplate(tmpl, names, "StoreTrace", "Op");
    }

    std::string rejectedToken(const std::string &tmpl, const std::vector<std::string> &names) {
        try {
            validate(tmpl, names);
        } catch (const lunar_trace::TemplateError &e) {
            return e.token();
        }
        ADD_FAILURE() << "expected TemplateError for \"" << tmpl << "\"";
        return std::string();
    }
};

TEST_F(TemplateValidatorTest, NamedPlaceholderBecomesPositional) {
    auto result = validate("Hello {name}", {"name"});
    EXPECT_EQ(result.text, "Hello {0}");
}

TEST_F(TemplateValidatorTest, MultipleNamesMapToDeclaredOrder) {
    auto result = validate("{b} then {a}", {"a", "b"});
    EXPECT_EQ(result.text, "{1} then {0}");
}

TEST_F(TemplateValidatorTest, RepeatedPlaceholderUsesSameIndex) {
    auto result = validate("{x}-{x}", {"x"});
    EXPECT_EQ(result.text, "{0}-{0}");
}

TEST_F(TemplateValidatorTest, DuplicateParameterNameMapsToFirstIndex) {
    auto result = validate("{a}", {"a", "a"});
    EXPECT_EQ(result.text, "{0}");
}

TEST_F(TemplateValidatorTest, PlainTextPassesUnchanged) {
    auto result = validate("ignored", {});
    EXPECT_EQ(result.text, "ignored");
    ASSERT_EQ(result.segments.size(), 1u);
    EXPECT_EQ(result.segments[0].literal, "ignored");
    EXPECT_FALSE(result.segments[0].hasParameter());
}

TEST_F(TemplateValidatorTest, EmptyTemplateHasNoSegments) {
    auto result = validate("", {"a"});
    EXPECT_EQ(result.text, "");
    EXPECT_TRUE(result.segments.empty());
}

TEST_F(TemplateValidatorTest, PositionalMarkersAreAccepted) {
    auto result = validate("{0} and {1}", {"a", "b"});
    EXPECT_EQ(result.text, "{0} and {1}");
}

TEST_F(TemplateValidatorTest, SegmentsSplitLiteralsAndParameters) {
    auto result = validate("Moved {count} items to {target}.", {"count", "target"});
    ASSERT_EQ(result.segments.size(), 3u);
    EXPECT_EQ(result.segments[0].literal, "Moved ");
    EXPECT_EQ(result.segments[0].parameterIndex, 0u);
    EXPECT_EQ(result.segments[1].literal, " items to ");
    EXPECT_EQ(result.segments[1].parameterIndex, 1u);
    EXPECT_EQ(result.segments[2].literal, ".");
    EXPECT_FALSE(result.segments[2].hasParameter());
}

TEST_F(TemplateValidatorTest, NamesAreCaseSensitive) {
    EXPECT_EQ(rejectedToken("Hello {Name}", {"name"}), "{Name}");
}

TEST_F(TemplateValidatorTest, UnknownNameIsRejected) {
    EXPECT_EQ(rejectedToken("Hello {unknown}", {"name"}), "{unknown}");
}

TEST_F(TemplateValidatorTest, EmptyBracesAreRejected) {
    EXPECT_EQ(rejectedToken("Hello {}", {"name"}), "{}");
}

TEST_F(TemplateValidatorTest, LoneOpeningBraceIsRejected) {
    EXPECT_EQ(rejectedToken("Hello {name", {"name"}), "{");
}

TEST_F(TemplateValidatorTest, LoneClosingBraceIsRejected) {
    EXPECT_EQ(rejectedToken("Hello name}", {"name"}), "}");
}

TEST_F(TemplateValidatorTest, EscapedBracesAreRejected) {
    EXPECT_THROW(validate("{{literal}}", {"literal"}), lunar_trace::TemplateError);
}

TEST_F(TemplateValidatorTest, OutOfRangeMarkerIsRejected) {
    EXPECT_EQ(rejectedToken("{1}", {"a"}), "{1}");
}

TEST_F(TemplateValidatorTest, FirstOffendingTokenIsReported) {
    EXPECT_EQ(rejectedToken("{a} {bad} {worse}", {"a"}), "{bad}");
}

TEST_F(TemplateValidatorTest, ErrorNamesContractOperationAndTemplate) {
    try {
        lunar_trace::validateTemplate("Hi {who}", {"name"}, "StoreTrace", "Greet");
        FAIL() << "expected TemplateError";
    } catch (const lunar_trace::TemplateError &e) {
        EXPECT_EQ(e.contractName(), "StoreTrace");
        EXPECT_EQ(e.operationName(), "Greet");
        EXPECT_EQ(e.templateText(), "Hi {who}");
        std::string what = e.what();
        EXPECT_NE(what.find("{who}"), std::string::npos);
        EXPECT_NE(what.find("StoreTrace.Greet"), std::string::npos);
    }
}

TEST_F(TemplateValidatorTest, TemplateErrorIsAContractError) {
    EXPECT_THROW(validate("{x}", {}), lunar_trace::ContractError);
}
