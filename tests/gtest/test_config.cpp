// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "halbrain/config.hpp"
#include "halbrain/logging.hpp"

using namespace halbrain;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::getInstance().clear();
        conf_file = fs::temp_directory_path() /
                    (std::string("halbrain_config_test_") +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".conf");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(conf_file, ec);
        Config::getInstance().clear();
    }

    void write_conf(const std::string& content) {
        std::ofstream out(conf_file);
        out << content;
    }

    fs::path conf_file;
};

TEST_F(ConfigTest, TypedGetters) {
    Config& config = Config::getInstance();
    config.set("a.int", "42");
    config.set("a.bool", "yes");
    config.set("a.text", "hello");
    config.set("a.bad", "forty");

    EXPECT_EQ(config.get<int>("a.int"), 42);
    EXPECT_TRUE(config.get<bool>("a.bool"));
    EXPECT_EQ(config.get<std::string>("a.text"), "hello");
    EXPECT_EQ(config.get<int>("a.bad", 7), 7);
    EXPECT_EQ(config.get<int>("a.missing", 3), 3);
}

TEST_F(ConfigTest, HasIgnoresEmptyValues) {
    Config& config = Config::getInstance();
    config.set("x", "");
    config.set("y", "1");
    EXPECT_FALSE(config.has("x"));
    EXPECT_TRUE(config.has("y"));
    EXPECT_FALSE(config.has("z"));
}

TEST_F(ConfigTest, GenerationDefaults) {
    GenerationConfig gen = Config::getInstance().generation();
    EXPECT_EQ(gen.continue_chance, DEFAULT_CONTINUE_CHANCE);
    EXPECT_EQ(gen.max_words, 0u);
}

TEST_F(ConfigTest, GenerationFromValues) {
    Config& config = Config::getInstance();
    config.set("generation.continue_chance", "64");
    config.set("generation.max_words", "30");
    GenerationConfig gen = config.generation();
    EXPECT_EQ(gen.continue_chance, 64);
    EXPECT_EQ(gen.max_words, 30u);

    config.set("generation.max_words", "-5");
    EXPECT_EQ(config.generation().max_words, 0u);
}

TEST_F(ConfigTest, FileOverridesDefaults) {
    write_conf(
        "# halbrain settings\n"
        "; old-style comment\n"
        "brain.file = other.brain\n"
        "generation.max_words=12\n"
        "generation.seed = 77\n");

    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(conf_file.string()));
    EXPECT_EQ(config.get<std::string>("brain.file"), "other.brain");
    EXPECT_EQ(config.generation().max_words, 12u);
    EXPECT_EQ(config.get<std::string>("generation.seed"), "77");
}

TEST_F(ConfigTest, ValidationRepairsBadValues) {
    write_conf(
        "generation.continue_chance = 999\n"
        "log.level = loud\n"
        "generation.seed = abc\n"
        "generation.max_words = -1\n");

    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load(conf_file.string()));
    EXPECT_EQ(config.generation().continue_chance, DEFAULT_CONTINUE_CHANCE);
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
    EXPECT_EQ(config.get<std::string>("generation.seed"), "");
    EXPECT_EQ(config.get<int>("generation.max_words"), 0);
}

TEST_F(ConfigTest, EmptyBrainFileFailsValidation) {
    write_conf("brain.file =\n");
    EXPECT_FALSE(Config::getInstance().load(conf_file.string()));
}

TEST_F(ConfigTest, MissingFileUsesDefaults) {
    Config& config = Config::getInstance();
    EXPECT_TRUE(config.load((fs::temp_directory_path() / "halbrain_no_such.conf").string()));
    EXPECT_TRUE(config.has("brain.file"));
    EXPECT_TRUE(config.has("generation.continue_chance"));
}

TEST_F(ConfigTest, ParseLogLevel) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);
    EXPECT_FALSE(parse_log_level("chatty", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

// =============================================================================
// Logger
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_output(captured);
    }

    void TearDown() override {
        set_log_output(std::cerr);
        set_log_level(LogLevel::INFO);
    }

    std::ostringstream captured;
};

TEST_F(LoggerTest, RecordsBelowLevelAreDropped) {
    set_log_level(LogLevel::WARN);
    LOG_INFO("quiet ", 1);
    LOG_WARN("loud ", 2);

    const std::string out = captured.str();
    EXPECT_EQ(out.find("quiet"), std::string::npos);
    EXPECT_NE(out.find("loud 2"), std::string::npos);
    EXPECT_NE(out.find("WARN test_config.cpp:"), std::string::npos);
    EXPECT_FALSE(Logger::getInstance().enabled(LogLevel::INFO));
    EXPECT_TRUE(Logger::getInstance().enabled(LogLevel::FATAL));
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_STREQ(log_level_name(LogLevel::DEBUG), "DEBG");
    EXPECT_STREQ(log_level_name(LogLevel::ERROR), "EROR");
    EXPECT_STREQ(log_level_name(LogLevel::FATAL), "FATL");
}
