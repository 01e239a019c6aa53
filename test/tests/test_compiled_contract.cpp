#include <gtest/gtest.h>
#include "lunar_trace.hpp"
#include "utils/test_utils.hpp"
#include <stdexcept>
#include <string>

namespace {
    struct StoreTrace {
        static void declare(lunar_trace::ContractBuilder &c) {
            c.operation("Greet").info("Hello {name}").param<std::string>("name");
            c.operation("Fail").error("failure {code}")
                .param<std::runtime_error>("ex").param<int>("code");
            c.operation("Import").info("Importing {file}")
                .param<std::string>("file").returns<lunar_trace::Activity>();
            c.operation("Noise").ignored();
        }
    };

    struct NoLevelTrace {
        static void declare(lunar_trace::ContractBuilder &c) {
            c.operation("Missing").param<int>("n");
        }
    };

    struct ReturnsIntTrace {
        static void declare(lunar_trace::ContractBuilder &c) {
            c.operation("Count").info("count").returns<int>();
        }
    };

    struct DuplicateTrace {
        static void declare(lunar_trace::ContractBuilder &c) {
            c.operation("Same").info("one");
            c.operation("Same").info("two");
        }
    };

    struct BadTemplateTrace {
        static void declare(lunar_trace::ContractBuilder &c) {
            c.operation("Good").info("fine");
            c.operation("Bad").info("Hi {who}").param<std::string>("name");
        }
    };

    struct ActivityWithExceptionTrace {
        static void declare(lunar_trace::ContractBuilder &c) {
            c.operation("Span").info("span")
                .param<std::logic_error>("ex").returns<lunar_trace::Activity>();
        }
    };
}

class CompiledContractTest : public ::testing::Test {};

TEST_F(CompiledContractTest, DescribeUsesDemangledTypeName) {
    auto spec = lunar_trace::describeContract<StoreTrace>();
    EXPECT_NE(spec.name.find("StoreTrace"), std::string::npos);
    ASSERT_EQ(spec.operations.size(), 4u);
    EXPECT_EQ(spec.operations[0].name, "Greet");
    EXPECT_EQ(spec.operations[1].parameters[0].kind, lunar_trace::ParamKind::EXCEPTION);
    EXPECT_EQ(spec.operations[1].parameters[1].position, 1u);
    EXPECT_TRUE(spec.operations[2].returnsActivity());
}

TEST_F(CompiledContractTest, IgnoredDefaultsToIgnoredText) {
    auto spec = lunar_trace::describeContract<StoreTrace>();
    const auto &noise = spec.operations[3];
    EXPECT_EQ(noise.level, lunar_trace::LogLevel::NONE);
    EXPECT_TRUE(noise.hasLevel);
    EXPECT_EQ(noise.templateStr, "ignored");
}

TEST_F(CompiledContractTest, BuilderNameOverridesContractName) {
    lunar_trace::ContractBuilder builder("Default");
    builder.name("Renamed").operation("Op").debug("x");
    EXPECT_EQ(builder.spec().name, "Renamed");
    EXPECT_EQ(builder.spec().operations[0].level, lunar_trace::LogLevel::DEBUG);
}

TEST_F(CompiledContractTest, CompilesEveryOperation) {
    auto compiled = lunar_trace::compileContract(lunar_trace::describeContract<StoreTrace>());
    ASSERT_EQ(compiled->size(), 4u);

    const lunar_trace::CompiledOperation *greet = compiled->find("Greet");
    ASSERT_NE(greet, nullptr);
    EXPECT_EQ(greet->validatedTemplate().text, "Hello {0}");
    EXPECT_EQ(greet->level(), lunar_trace::LogLevel::INFO);

    const lunar_trace::CompiledOperation *fail = compiled->find("Fail");
    ASSERT_NE(fail, nullptr);
    EXPECT_TRUE(fail->classification().hasException);
    EXPECT_EQ(fail->validatedTemplate().text, "failure {1}");

    EXPECT_TRUE(compiled->find("Import")->returnsActivity());
    EXPECT_EQ(compiled->find("Unknown"), nullptr);
}

TEST_F(CompiledContractTest, FormatBindsAndFormats) {
    auto compiled = lunar_trace::compileContract(lunar_trace::describeContract<StoreTrace>());
    auto record = compiled->find("Greet")->format({lunar_trace::makeValue("Ada")});
    EXPECT_EQ(record.message, "Hello Ada");
    EXPECT_EQ(TestUtils::contextString(record.context, "name"), "Ada");
}

TEST_F(CompiledContractTest, MissingLevelIsContractError) {
    try {
        lunar_trace::compileContract(lunar_trace::describeContract<NoLevelTrace>());
        FAIL() << "expected ContractError";
    } catch (const lunar_trace::ContractError &e) {
        EXPECT_EQ(e.operationName(), "Missing");
        EXPECT_NE(std::string(e.what()).find("log level"), std::string::npos);
    }
}

TEST_F(CompiledContractTest, UnsupportedReturnTypeIsContractError) {
    try {
        lunar_trace::compileContract(lunar_trace::describeContract<ReturnsIntTrace>());
        FAIL() << "expected ContractError";
    } catch (const lunar_trace::ContractError &e) {
        EXPECT_EQ(e.operationName(), "Count");
        EXPECT_NE(std::string(e.what()).find("not supported"), std::string::npos);
    }
}

TEST_F(CompiledContractTest, DuplicateOperationIsContractError) {
    EXPECT_THROW(lunar_trace::compileContract(lunar_trace::describeContract<DuplicateTrace>()),
                 lunar_trace::ContractError);
}

TEST_F(CompiledContractTest, BadTemplateAbortsWholeContract) {
    try {
        lunar_trace::compileContract(lunar_trace::describeContract<BadTemplateTrace>());
        FAIL() << "expected TemplateError";
    } catch (const lunar_trace::TemplateError &e) {
        EXPECT_EQ(e.operationName(), "Bad");
        EXPECT_EQ(e.token(), "{who}");
    }
}

TEST_F(CompiledContractTest, ExceptionOnActivityIsClassificationError) {
    EXPECT_THROW(lunar_trace::compileContract(lunar_trace::describeContract<ActivityWithExceptionTrace>()),
                 lunar_trace::ClassificationError);
}

TEST_F(CompiledContractTest, PlainSpecDataCompiles) {
    lunar_trace::OperationSpec op;
    op.name = "Ping";
    op.level = lunar_trace::LogLevel::WARNING;
    op.hasLevel = true;
    op.templateStr = "ping {0}";
    op.parameters.push_back(TestUtils::parameter("host", lunar_trace::ParamKind::STRING, 0));

    auto compiled = lunar_trace::compileContract(TestUtils::singleOperation(op, "Net"));
    EXPECT_EQ(compiled->name(), "Net");
    auto record = compiled->find("Ping")->format({lunar_trace::makeValue("db1")});
    EXPECT_EQ(record.message, "ping db1");
    EXPECT_EQ(record.level, lunar_trace::LogLevel::WARNING);
}
