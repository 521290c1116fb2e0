// =============================================================================
// Concurrent Learning and Generation Tests
// =============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "halbrain/brain.hpp"

using namespace halbrain;

namespace {

Chain window(const Sentence& s, size_t at) {
    return Chain(std::span<const Word>(s.data() + at, CHAIN_LENGTH));
}

void expect_well_formed(const Brain& brain, const Sentence& s) {
    ASSERT_GE(s.size(), CHAIN_LENGTH) << to_string(s);
    for (size_t i = 0; i + CHAIN_LENGTH <= s.size(); ++i) {
        EXPECT_TRUE(brain.has_chain(window(s, i))) << to_string(s) << " at " << i;
    }
    EXPECT_TRUE(brain.is_start_chain(window(s, 0))) << to_string(s);
    EXPECT_TRUE(brain.is_end_chain(window(s, s.size() - CHAIN_LENGTH))) << to_string(s);
}

} // namespace

class BrainConcurrencyTest : public ::testing::Test {
protected:
    static constexpr int kReaders = 3;
    static constexpr int kWrites = 100;

    void SetUp() override {
        brain.seed(99);
        brain.add_sentence(parse_tagged("a/NN b/NN c/NN d/NN e/NN"));
    }

    Brain brain;
    Word c{"NN", "c"};
};

TEST_F(BrainConcurrencyTest, LearningDuringGenerationKeepsSentencesWellFormed) {
    std::atomic<bool> done{false};
    std::atomic<int> ready{0};
    std::atomic<long> generated{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < kReaders; ++r) {
        readers.emplace_back([&] {
            bool first = true;
            while (!done.load()) {
                Sentence s = brain.make_sentence_with_keyword(c);
                expect_well_formed(brain, s);
                generated.fetch_add(1);
                if (first) {
                    ready.fetch_add(1);
                    first = false;
                }
                std::this_thread::yield();
            }
        });
    }

    // Every reader is generating before the first write lands.
    while (ready.load() < kReaders) {
        std::this_thread::yield();
    }

    for (int n = 0; n < kWrites; ++n) {
        brain.add_sentence(parse_tagged("x/NN a/NN b/NN c/NN d/NN e/NN w" + std::to_string(n) + "/NN"));
    }
    done.store(true);

    for (auto& t : readers) {
        t.join();
    }

    EXPECT_GE(generated.load(), kReaders);

    // [a b c d] [b c d e] from the base, [x a b c], then [c d e wN] per write.
    BrainStats s = brain.stats();
    EXPECT_EQ(s.chains, 3u + kWrites);
    EXPECT_EQ(s.words, 6u + kWrites);
    EXPECT_EQ(s.start_chains, 2u);
    EXPECT_EQ(s.end_chains, 1u + kWrites);
}

TEST_F(BrainConcurrencyTest, ConcurrentWritersLearnEverySentence) {
    std::vector<std::thread> writers;
    for (int t = 0; t < kReaders; ++t) {
        writers.emplace_back([&, t] {
            for (int n = 0; n < kWrites; ++n) {
                brain.add_sentence(parse_tagged("c/NN d/NN e/NN t" + std::to_string(t) +
                                                "_" + std::to_string(n) + "/NN"));
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }

    // Each write adds one start chain, which is also an end chain.
    BrainStats s = brain.stats();
    EXPECT_EQ(s.chains, 2u + kReaders * kWrites);
    EXPECT_EQ(s.start_chains, 1u + kReaders * kWrites);
    EXPECT_EQ(s.end_chains, 1u + kReaders * kWrites);
    for (int t = 0; t < kReaders; ++t) {
        Sentence last = parse_tagged("c/NN d/NN e/NN t" + std::to_string(t) + "_" +
                                     std::to_string(kWrites - 1) + "/NN");
        EXPECT_TRUE(brain.has_chain(window(last, 0)));
    }
}
