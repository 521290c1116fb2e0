// =============================================================================
// Training Input Tests
// =============================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>

#include "halbrain/annotate/annotator.hpp"
#include "halbrain/brain.hpp"
#include "halbrain/error.hpp"
#include "halbrain/training/training.hpp"

#ifndef HALBRAIN_TEST_DATA_DIR
#define HALBRAIN_TEST_DATA_DIR "tests/data"
#endif

using namespace halbrain;
using namespace halbrain::training;

namespace fs = std::filesystem;

class TrainingTest : public ::testing::Test {
protected:
    std::vector<Sentence> parse(const std::string& text, const char* filename) {
        std::istringstream in(text);
        return parse_training_input(in, filename, annotator);
    }

    static fs::path data_file(const char* name) {
        return fs::path(HALBRAIN_TEST_DATA_DIR) / name;
    }

    annotate::SimpleAnnotator annotator;
};

TEST_F(TrainingTest, DetectFormat) {
    EXPECT_EQ(detect_format("notes.txt"), TrainingFormat::Plain);
    EXPECT_EQ(detect_format("NOTES.TXT"), TrainingFormat::Plain);
    EXPECT_EQ(detect_format("megahal.trn"), TrainingFormat::MegaHAL);
    EXPECT_EQ(detect_format("corpus.tagged"), TrainingFormat::Tagged);
    EXPECT_EQ(detect_format("page.html"), TrainingFormat::Unknown);
    EXPECT_EQ(detect_format("README"), TrainingFormat::Unknown);
}

TEST_F(TrainingTest, PlainTextIsAnnotatedWhole) {
    auto sentences = parse("One sentence here. Another one\nfollows! And a third?", "chat.txt");
    ASSERT_EQ(sentences.size(), 3u);
    EXPECT_EQ(to_string(sentences[1]), "another one follows!");
}

TEST_F(TrainingTest, MegaHALSkipsCommentsAndBlankLines) {
    auto sentences = parse(
        "# comment\n"
        "hello there my friend\n"
        "\n"
        "   # indented comment\n"
        "the dog barks loudly today\n",
        "megahal.trn");
    ASSERT_EQ(sentences.size(), 2u);
    EXPECT_EQ(to_string(sentences[0]), "hello there my friend");
}

TEST_F(TrainingTest, TaggedLinesSkipBrokenOnes) {
    auto sentences = parse(
        "the/DT cat/NN sat/VBD ./.\n"
        "not tagged at all\n"
        "# comment\n"
        "do/VBP cats/NNS purr/VB ?/.\n",
        "corpus.tagged");
    ASSERT_EQ(sentences.size(), 2u);
    EXPECT_EQ(sentences[1].back(), words::question_mark());
}

TEST_F(TrainingTest, UnknownFormatIsRejected) {
    try {
        parse("<p>hi</p>", "page.html");
        FAIL() << "expected UnknownFormatError";
    } catch (const UnknownFormatError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_FORMAT);
    }
}

TEST_F(TrainingTest, MissingFileIsReported) {
    try {
        parse_training_file(data_file("missing.txt"), annotator);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::FILE_NOT_FOUND);
    }
    EXPECT_THROW(parse_training_file(data_file("missing.html"), annotator), UnknownFormatError);
}

TEST_F(TrainingTest, TrainFromMegaHALFile) {
    auto sentences = parse_training_file(data_file("sample.trn"), annotator);
    EXPECT_EQ(sentences.size(), 6u);

    Brain brain;
    brain.seed(11);
    brain.add_sentences(sentences);
    EXPECT_FALSE(brain.empty());

    Sentence q = brain.make_question();
    ASSERT_FALSE(q.empty());
    EXPECT_EQ(q.back(), words::question_mark());
}

TEST_F(TrainingTest, TrainFromTaggedFile) {
    auto sentences = parse_training_file(data_file("sample.tagged"), annotator);
    ASSERT_EQ(sentences.size(), 4u);

    Brain brain;
    brain.seed(3);
    brain.add_sentences(sentences);

    Sentence reply = brain.make_reply({parse_tagged("tell/VB me/PRP about/IN london/NNP")});
    ASSERT_FALSE(reply.empty());
    EXPECT_NE(std::find(reply.begin(), reply.end(), Word("NNP", "london")), reply.end());
}
