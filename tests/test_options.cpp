// ═══════════════════════════════════════════════════════════════════
//  test_options.cpp — Tests for compiler options
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <gqlir/options.h>

using namespace gqlir;

TEST(CompilerOptionsTest, Defaults) {
    CompilerOptions options;
    EXPECT_FALSE(options.addTypename);
    EXPECT_TRUE(options.mergeInFieldsFromFragmentSpreads);
    EXPECT_FALSE(options.passthroughCustomScalars);
    EXPECT_EQ(options.customScalarsPrefix, "");
    EXPECT_EQ(options.namespaceName, "");
    EXPECT_FALSE(options.generateOperationIds);
    EXPECT_EQ(options.maxSelectionDepth, 512u);
}

TEST(CompilerOptionsTest, ParsesKnownKeys) {
    auto options = parseCompilerOptions(R"({
        "addTypename": true,
        "mergeInFieldsFromFragmentSpreads": false,
        "passthroughCustomScalars": true,
        "customScalarsPrefix": "Custom",
        "namespace": "API",
        "generateOperationIds": true,
        "maxSelectionDepth": 64
    })");
    EXPECT_TRUE(options.addTypename);
    EXPECT_FALSE(options.mergeInFieldsFromFragmentSpreads);
    EXPECT_TRUE(options.passthroughCustomScalars);
    EXPECT_EQ(options.customScalarsPrefix, "Custom");
    EXPECT_EQ(options.namespaceName, "API");
    EXPECT_TRUE(options.generateOperationIds);
    EXPECT_EQ(options.maxSelectionDepth, 64u);
}

TEST(CompilerOptionsTest, MissingAndUnknownKeysKeepDefaults) {
    auto options = parseCompilerOptions(R"({"generateOperationIds": true, "somethingElse": 1})");
    CompilerOptions expected;
    expected.generateOperationIds = true;
    EXPECT_EQ(options, expected);
}

TEST(CompilerOptionsTest, RoundTripsThroughJson) {
    CompilerOptions options;
    options.namespaceName = "Pets";
    options.addTypename = true;
    nlohmann::json j = options;
    EXPECT_EQ(j["namespace"], "Pets");
    EXPECT_EQ(j.get<CompilerOptions>(), options);
}

TEST(CompilerOptionsTest, WrongTypeThrows) {
    EXPECT_THROW(parseCompilerOptions(R"({"addTypename": "yes"})"), CompilationError);
}

TEST(CompilerOptionsTest, NonObjectThrows) {
    EXPECT_THROW(parseCompilerOptions("[1, 2]"), CompilationError);
}

TEST(CompilerOptionsTest, MalformedJsonThrows) {
    EXPECT_THROW(parseCompilerOptions("{"), CompilationError);
}
