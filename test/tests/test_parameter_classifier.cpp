#include <gtest/gtest.h>
#include "lunar_trace.hpp"
#include "utils/test_utils.hpp"
#include <vector>

using lunar_trace::ParamKind;
using lunar_trace::ReturnKind;

class ParameterClassifierTest : public ::testing::Test {
protected:
    std::vector<lunar_trace::ParameterSpec> params(const std::vector<ParamKind> &kinds) {
        std::vector<lunar_trace::ParameterSpec> result;
        for (size_t i = 0; i < kinds.size(); ++i) {
            result.push_back(TestUtils::parameter("p" + std::to_string(i), kinds[i], i));
        }
        return result;
    }
};

TEST_F(ParameterClassifierTest, PrimitivesBecomeContext) {
    auto c = lunar_trace::classify(params({ParamKind::STRING, ParamKind::INTEGER, ParamKind::BOOLEAN}),
                                   ReturnKind::VOID, "C", "Op");
    EXPECT_FALSE(c.hasException);
    EXPECT_EQ(c.contextIndices, (std::vector<size_t>{0, 1, 2}));
    EXPECT_EQ(c.allIndices, (std::vector<size_t>{0, 1, 2}));
}

TEST_F(ParameterClassifierTest, ObjectsAreTemplateOnly) {
    auto c = lunar_trace::classify(params({ParamKind::OBJECT, ParamKind::FLOATING}),
                                   ReturnKind::VOID, "C", "Op");
    EXPECT_EQ(c.contextIndices, (std::vector<size_t>{1}));
    EXPECT_EQ(c.allIndices, (std::vector<size_t>{0, 1}));
}

TEST_F(ParameterClassifierTest, ExceptionFillsSlotOnVoidOperation) {
    auto c = lunar_trace::classify(params({ParamKind::EXCEPTION, ParamKind::INTEGER}),
                                   ReturnKind::VOID, "C", "Fail");
    EXPECT_TRUE(c.hasException);
    EXPECT_EQ(c.exceptionIndex, 0u);
    EXPECT_EQ(c.contextIndices, (std::vector<size_t>{1}));
    EXPECT_EQ(c.allIndices.size(), 2u);
}

TEST_F(ParameterClassifierTest, ExceptionAnywhereInTheListIsFound) {
    auto c = lunar_trace::classify(params({ParamKind::STRING, ParamKind::CHARACTER, ParamKind::EXCEPTION}),
                                   ReturnKind::VOID, "C", "Fail");
    EXPECT_TRUE(c.hasException);
    EXPECT_EQ(c.exceptionIndex, 2u);
    EXPECT_EQ(c.contextIndices, (std::vector<size_t>{0, 1}));
}

TEST_F(ParameterClassifierTest, SecondExceptionIsRejected) {
    try {
        lunar_trace::classify(params({ParamKind::EXCEPTION, ParamKind::EXCEPTION}),
                              ReturnKind::VOID, "C", "Fail");
        FAIL() << "expected ClassificationError";
    } catch (const lunar_trace::ClassificationError &e) {
        EXPECT_EQ(e.parameterName(), "p1");
        EXPECT_EQ(e.operationName(), "Fail");
    }
}

TEST_F(ParameterClassifierTest, ExceptionOnActivityOperationIsRejected) {
    EXPECT_THROW(lunar_trace::classify(params({ParamKind::STRING, ParamKind::EXCEPTION}),
                                       ReturnKind::ACTIVITY, "C", "Import"),
                 lunar_trace::ClassificationError);
}

TEST_F(ParameterClassifierTest, ActivityOperationWithoutExceptionIsFine) {
    auto c = lunar_trace::classify(params({ParamKind::STRING}), ReturnKind::ACTIVITY, "C", "Import");
    EXPECT_FALSE(c.hasException);
    EXPECT_EQ(c.contextIndices, (std::vector<size_t>{0}));
}

TEST_F(ParameterClassifierTest, NoParameters) {
    auto c = lunar_trace::classify(params({}), ReturnKind::VOID, "C", "Op");
    EXPECT_FALSE(c.hasException);
    EXPECT_TRUE(c.contextIndices.empty());
    EXPECT_TRUE(c.allIndices.empty());
}

TEST_F(ParameterClassifierTest, KindOfMapsCppTypes) {
    EXPECT_EQ(lunar_trace::kindOf<std::string>(), ParamKind::STRING);
    EXPECT_EQ(lunar_trace::kindOf<const char *>(), ParamKind::STRING);
    EXPECT_EQ(lunar_trace::kindOf<bool>(), ParamKind::BOOLEAN);
    EXPECT_EQ(lunar_trace::kindOf<char>(), ParamKind::CHARACTER);
    EXPECT_EQ(lunar_trace::kindOf<int>(), ParamKind::INTEGER);
    EXPECT_EQ(lunar_trace::kindOf<long long>(), ParamKind::INTEGER);
    EXPECT_EQ(lunar_trace::kindOf<unsigned>(), ParamKind::UNSIGNED);
    EXPECT_EQ(lunar_trace::kindOf<double>(), ParamKind::FLOATING);
    EXPECT_EQ(lunar_trace::kindOf<float>(), ParamKind::FLOATING);
    EXPECT_EQ(lunar_trace::kindOf<std::runtime_error>(), ParamKind::EXCEPTION);
    EXPECT_EQ(lunar_trace::kindOf<std::exception>(), ParamKind::EXCEPTION);
    EXPECT_EQ(lunar_trace::kindOf<std::vector<int> >(), ParamKind::OBJECT);
}

TEST_F(ParameterClassifierTest, ContextEligibility) {
    EXPECT_TRUE(lunar_trace::isContextEligible(ParamKind::STRING));
    EXPECT_TRUE(lunar_trace::isContextEligible(ParamKind::FLOATING));
    EXPECT_FALSE(lunar_trace::isContextEligible(ParamKind::EXCEPTION));
    EXPECT_FALSE(lunar_trace::isContextEligible(ParamKind::OBJECT));
}
