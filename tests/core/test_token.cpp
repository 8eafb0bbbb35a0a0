// tests/core/test_token.cpp
// Tests for core/token.h (normalize, token_pattern)

#include <prefsort/core/token.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace prefsort;

// =====================================================================
// normalize
// =====================================================================

TEST(Normalize, CaseStyles) {
    EXPECT_EQ(normalize("camelCaseString"), "camel case string");
    EXPECT_EQ(normalize("PascalCaseString"), "pascal case string");
    EXPECT_EQ(normalize("snake_case_string"), "snake case string");
    EXPECT_EQ(normalize("kebab-case-string"), "kebab case string");
    EXPECT_EQ(normalize("dot.case.string"), "dot case string");
    EXPECT_EQ(normalize("UPPER_CASE_STRING"), "upper case string");
}

TEST(Normalize, EquivalentSpellingsCollapse) {
    std::vector<std::string> const spellings = {
        "TARGET_BUILD_VERSION", "TARGET_buildVersion", "Target_Build_Version",
        "TargetBuildVersion",   "targetBuildVersion",  "target-build-version",
    };
    for (auto const& s : spellings) {
        EXPECT_EQ(normalize(s), "target build version") << s;
    }
}

TEST(Normalize, MixedCaseAndDigits) {
    // Each lower->upper step splits; a digit run stays with its word.
    EXPECT_EQ(normalize("MiXeD_CaSe-STRING.Value123"), "mi xe d ca se string value123");
    EXPECT_EQ(normalize("test123String"), "test123 string");
}

TEST(Normalize, Acronyms) {
    EXPECT_EQ(normalize("XMLDocument"), "xml document");
    EXPECT_EQ(normalize("CIACMELCase"), "ciacmel case");
    EXPECT_EQ(normalize("fooIdentifierBARIdentifier"), "foo identifier bar identifier");
    EXPECT_EQ(normalize("IDENTIFIER_fooIdentifier"), "identifier foo identifier");
    EXPECT_EQ(normalize("IDENTIFIER"), "identifier");
}

TEST(Normalize, SingleWords) {
    EXPECT_EQ(normalize("Word"), "word");
    EXPECT_EQ(normalize("identifier"), "identifier");
    EXPECT_EQ(normalize("single"), "single");
}

TEST(Normalize, SurroundingNoiseIsStripped) {
    EXPECT_EQ(normalize("  _leading-Test_  "), "leading test");
    EXPECT_EQ(normalize(""), "");
    EXPECT_EQ(normalize(" __ "), "");
}

TEST(Normalize, InteriorWhitespaceIsKept) {
    // Two input spaces plus one for the "__--" run.
    EXPECT_EQ(normalize("word1  __--word2..word3"), "word1   word2 word3");
}

TEST(Normalize, AttributeNames) {
    EXPECT_EQ(normalize("onClick"), "on click");
    EXPECT_EQ(normalize("aria-label"), "aria label");
    EXPECT_EQ(normalize("data-test-id"), "data test id");
    EXPECT_EQ(normalize("className"), "class name");
    EXPECT_EQ(normalize("data-*"), "data *");
}

TEST(Normalize, Idempotent) {
    for (auto const* s : {"onClick", "XMLDocument", "  _leading-Test_  ", "Value123"}) {
        auto const once = normalize(s);
        EXPECT_EQ(normalize(once), once) << s;
    }
}

// =====================================================================
// token_pattern
// =====================================================================

TEST(TokenPattern, ExactEntry) {
    auto p = token_pattern::parse("key");
    EXPECT_FALSE(p.is_prefix());
    EXPECT_EQ(p.text(), "key");
    EXPECT_TRUE(p.matches("key"));
    EXPECT_FALSE(p.matches("keys"));
    EXPECT_FALSE(p.matches("ke"));
}

TEST(TokenPattern, PrefixEntry) {
    auto p = token_pattern::parse("data *");
    EXPECT_TRUE(p.is_prefix());
    EXPECT_EQ(p.text(), "data ");
    EXPECT_TRUE(p.matches("data id"));
    EXPECT_TRUE(p.matches("data "));
    EXPECT_FALSE(p.matches("data"));
    EXPECT_FALSE(p.matches("metadata id"));
}

TEST(TokenPattern, BareWildcardMatchesEverything) {
    auto p = token_pattern::parse("*");
    EXPECT_TRUE(p.is_prefix());
    EXPECT_FALSE(p.empty());
    EXPECT_TRUE(p.matches(""));
    EXPECT_TRUE(p.matches("anything"));
}

TEST(TokenPattern, EmptyEntryMatchesNothing) {
    auto p = token_pattern::parse("");
    EXPECT_TRUE(p.empty());
    EXPECT_FALSE(p.matches(""));
    EXPECT_FALSE(p.matches("key"));
}
