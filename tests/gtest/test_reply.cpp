// =============================================================================
// Reply Construction Tests
// =============================================================================

#include <gtest/gtest.h>

#include <algorithm>

#include "halbrain/brain.hpp"
#include "halbrain/reply.hpp"

using namespace halbrain;

class ReplyTest : public ::testing::Test {
protected:
    void SetUp() override {
        brain.seed(5);
        brain.add_sentences({
            parse_tagged("paris/NNP is/VBZ a/DT city/NN in/IN france/NNP ./."),
            parse_tagged("the/DT cat/NN is/VBZ a/DT pet/NN ./."),
        });
    }

    static bool contains(const Sentence& s, const Word& w) {
        return std::find(s.begin(), s.end(), w) != s.end();
    }

    Brain brain;
};

TEST_F(ReplyTest, ScoringRubric) {
    ReplyContext ctx = ReplyContext::from_sentences({
        parse_tagged("i/PRP like/VBP paris/NNP and/CC cats/NNS"),
    });

    // paris: proper noun, input noun, input proper noun, input word
    EXPECT_EQ(score_reply_candidate(parse_tagged("paris/NNP is/VBZ nice/JJ"), ctx),
              SCORE_PROPER_NOUN + SCORE_INPUT_NOUN + SCORE_INPUT_PROPER_NOUN + SCORE_INPUT_WORD);
    // cats: input noun and word; like: input word
    EXPECT_EQ(score_reply_candidate(parse_tagged("cats/NNS like/VBP fish/NN"), ctx),
              SCORE_INPUT_NOUN + SCORE_INPUT_WORD + SCORE_INPUT_WORD);
    // rome is a proper noun the input never mentioned
    EXPECT_EQ(score_reply_candidate(parse_tagged("rome/NNP"), ctx), SCORE_PROPER_NOUN);
    EXPECT_EQ(score_reply_candidate(Sentence{}, ctx), 0);
}

TEST_F(ReplyTest, ContextSpansAllInputSentences) {
    ReplyContext ctx = ReplyContext::from_sentences({
        parse_tagged("the/DT cat/NN"),
        parse_tagged("the/DT dog/NN"),
    });
    EXPECT_EQ(ctx.all_words.size(), 3u);
    EXPECT_EQ(ctx.nouns.size(), 2u);
    EXPECT_TRUE(ctx.proper_nouns.empty());
}

TEST_F(ReplyTest, KeywordsPreferSeveralProperNouns) {
    ReplyContext one = ReplyContext::from_sentences({parse_tagged("paris/NNP has/VBZ cats/NNS")});
    EXPECT_EQ(one.keywords(), (WordSet{Word("NNP", "paris"), Word("NNS", "cats")}));

    ReplyContext two = ReplyContext::from_sentences({
        parse_tagged("paris/NNP and/CC rome/NNP have/VBP cats/NNS"),
    });
    EXPECT_EQ(two.keywords(), (WordSet{Word("NNP", "paris"), Word("NNP", "rome")}));
}

TEST_F(ReplyTest, NoNounsNoReply) {
    EXPECT_TRUE(brain.make_reply({parse_tagged("is/VBZ it/PRP ?/.")}).empty());
    EXPECT_TRUE(brain.make_reply({}).empty());
}

TEST_F(ReplyTest, UnknownNounsNoReply) {
    EXPECT_TRUE(brain.make_reply({parse_tagged("the/DT giraffe/NN")}).empty());
}

TEST_F(ReplyTest, SingleCandidateWins) {
    Sentence reply = brain.make_reply({parse_tagged("tell/VB me/PRP about/IN the/DT cat/NN")});
    EXPECT_EQ(reply, parse_tagged("the/DT cat/NN is/VBZ a/DT pet/NN ./."));
}

TEST_F(ReplyTest, HighestScoreWins) {
    // Keywords are paris and cat. The paris sentence scores 12 (paris 10,
    // france 2) against 5 for the cat sentence (cat 4, the 1).
    Sentence reply = brain.make_reply({parse_tagged("paris/NNP and/CC the/DT cat/NN")});
    ASSERT_FALSE(reply.empty());
    EXPECT_TRUE(contains(reply, Word("NNP", "paris")));
    EXPECT_EQ(reply, parse_tagged("paris/NNP is/VBZ a/DT city/NN in/IN france/NNP ./."));
}
