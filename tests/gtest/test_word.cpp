// =============================================================================
// Word Tests
// =============================================================================

#include <gtest/gtest.h>

#include <sstream>

#include "halbrain/word.hpp"

using namespace halbrain;

class WordTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(WordTest, TextIsLowerCased) {
    Word a("NN", "Cat");
    Word b("NN", "cAT");
    EXPECT_EQ(a.text(), "cat");
    EXPECT_EQ(a, b);
}

TEST_F(WordTest, TextIsComposed) {
    // "e" followed by a combining acute accent composes to U+00E9
    Word decomposed("NN", "cafe\xCC\x81");
    Word composed("NN", "caf\xC3\xA9");
    EXPECT_EQ(decomposed.text(), "caf\xC3\xA9");
    EXPECT_EQ(decomposed, composed);
}

TEST_F(WordTest, TagTakesPartInEquality) {
    EXPECT_NE(Word("NN", "run"), Word("VB", "run"));
    EXPECT_NE(WordHasher()(Word("NN", "run")), WordHasher()(Word("VB", "run")));
}

TEST_F(WordTest, TagIsKeptVerbatim) {
    Word w("NNP", "Paris");
    EXPECT_EQ(w.tag(), "NNP");
    EXPECT_EQ(w.text(), "paris");
}

TEST_F(WordTest, DefaultWordIsInvalid) {
    Word w;
    EXPECT_FALSE(w.valid());
    EXPECT_TRUE(Word("NN", "x").valid());

    std::ostringstream os;
    os << w;
    EXPECT_EQ(os.str(), "<invalid>");
}

TEST_F(WordTest, PrintsTextAndTag) {
    std::ostringstream os;
    os << Word("DT", "The");
    EXPECT_EQ(os.str(), "the/DT");
}

TEST_F(WordTest, TagClassification) {
    EXPECT_EQ(classify_tag("NN"), TagCategory::CommonNoun);
    EXPECT_EQ(classify_tag("NNS"), TagCategory::CommonNoun);
    EXPECT_EQ(classify_tag("NNP"), TagCategory::ProperNoun);
    EXPECT_EQ(classify_tag("NNPS"), TagCategory::ProperNoun);
    EXPECT_EQ(classify_tag("."), TagCategory::Punctuation);
    EXPECT_EQ(classify_tag("``"), TagCategory::Punctuation);
    EXPECT_EQ(classify_tag("VBZ"), TagCategory::Other);
    EXPECT_EQ(classify_tag(""), TagCategory::Other);
    EXPECT_STREQ(tag_category_name(TagCategory::ProperNoun), "proper-noun");
}

TEST_F(WordTest, NounPredicates) {
    Word common("NNS", "cats");
    Word proper("NNP", "paris");
    Word verb("VBZ", "is");

    EXPECT_TRUE(common.is_noun());
    EXPECT_FALSE(common.is_proper_noun());
    EXPECT_TRUE(proper.is_noun());
    EXPECT_TRUE(proper.is_proper_noun());
    EXPECT_FALSE(verb.is_noun());
}

TEST_F(WordTest, HashtagsAndMentions) {
    EXPECT_TRUE(Word("NN", "#caturday").is_hashtag());
    EXPECT_FALSE(Word("NN", "#caturday").is_at_mention());
    EXPECT_TRUE(Word("NN", "@bob").is_at_mention());
    EXPECT_FALSE(Word("#", "#").is_hashtag());
}

TEST_F(WordTest, TerminatorsSharePeriodTag) {
    EXPECT_EQ(words::period().tag(), ".");
    EXPECT_EQ(words::question_mark().tag(), ".");
    EXPECT_EQ(words::exclamation_mark().tag(), ".");
    EXPECT_EQ(words::question_mark().text(), "?");
    EXPECT_TRUE(words::period().is_punctuation());
    EXPECT_NE(words::period(), words::question_mark());
}
