// =============================================================================
// halbrain CLI - Command-Line Interface
// =============================================================================
//
// Usage:
//   halbrain [global options] <command> [args]
//
// Commands:
//   train       Learn sentences from corpus files
//   chat        Talk to the brain interactively
//   reply       Print one reply to the given text
//   stats       Show brain statistics
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   halbrain train corpus.txt quotes.trn
//   halbrain --brain bot.brain chat
//   halbrain --seed 42 reply "tell me about cats"
//
// =============================================================================

#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "halbrain/annotate/annotator.hpp"
#include "halbrain/brain.hpp"
#include "halbrain/config.hpp"
#include "halbrain/error.hpp"
#include "halbrain/logging.hpp"
#include "halbrain/sentence.hpp"
#include "halbrain/snapshot/brain_file.hpp"
#include "halbrain/training/training.hpp"

namespace halbrain::cli {
    int cmd_train(int argc, char* argv[]);
    int cmd_chat(int argc, char* argv[]);
    int cmd_reply(int argc, char* argv[]);
    int cmd_stats(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define HALBRAIN_VERSION_MAJOR 1
#define HALBRAIN_VERSION_MINOR 0
#define HALBRAIN_VERSION_PATCH 0
#define HALBRAIN_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"train",   "Learn sentences from corpus files (.txt, .trn, .tagged)", halbrain::cli::cmd_train},
    {"chat",    "Talk to the brain interactively", halbrain::cli::cmd_chat},
    {"reply",   "Print one reply to the given text without learning it", halbrain::cli::cmd_reply},
    {"stats",   "Show brain statistics", halbrain::cli::cmd_stats},
    {"version", "Show version information", halbrain::cli::cmd_version},
    {"help",    "Show this help message", halbrain::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string brain_file;   // overrides brain.file
    std::string seed;         // overrides generation.seed
    std::string config_file = "halbrain.conf";
    bool debug = false;
};

static GlobalOptions g_options;

namespace halbrain::cli {

namespace {

std::filesystem::path brain_path() {
    return Config::getInstance().get<std::string>("brain.file");
}

void apply_seed(Brain& brain) {
    std::string seed = Config::getInstance().get<std::string>("generation.seed");
    if (seed.empty()) return;
    try {
        brain.seed(static_cast<uint32_t>(std::stoul(seed)));
        LOG_DEBUG("random source seeded with ", seed);
    } catch (const std::exception&) {
        LOG_WARN("ignoring unusable seed '", seed, "'");
    }
}

// A missing brain file yields an empty brain when allow_missing is set.
std::unique_ptr<Brain> open_brain(bool allow_missing) {
    const GenerationConfig gen = Config::getInstance().generation();
    std::unique_ptr<Brain> brain;
    try {
        brain = snapshot::load_brain_file(brain_path(), gen);
    } catch (const IOError& e) {
        if (!allow_missing || e.code() != ErrorCode::FILE_NOT_FOUND) throw;
        LOG_INFO("starting with a new, empty brain");
        brain = std::make_unique<Brain>(gen);
    }
    apply_seed(*brain);
    return brain;
}

bool is_why_question(const std::vector<Sentence>& sentences) {
    static const Word why("WRB", "why");
    return !sentences.empty() && !sentences.front().empty() && sentences.front().front() == why;
}

} // namespace

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "halbrain - Markov chain chatterbot\n";
    std::cout << "Version " << HALBRAIN_VERSION_STRING << "\n\n";
    std::cout << "Usage: halbrain [options] <command> [args]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -b, --brain <file>      Brain snapshot file (default: halbrain.brain)\n";
    std::cout << "  -c, --config <file>     Configuration file (default: halbrain.conf)\n";
    std::cout << "  -s, --seed <n>          Seed the random source for repeatable output\n";
    std::cout << "  -D, --debug             Debug logging and tagged chat output\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  HB_BRAIN_FILE           Brain snapshot file\n";
    std::cout << "  HB_LOG_LEVEL            debug, info, warn, error\n";
    std::cout << "  HB_LOG_FILE             Append log output to this file\n";
    std::cout << "  HB_SEED                 Random seed\n";
    std::cout << "  HB_CONTINUE_CHANCE      Chance out of 256 to grow past a sentence boundary\n";
    std::cout << "  HB_MAX_WORDS            Stop optional growth at this length (0 = never)\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "halbrain " << HALBRAIN_VERSION_STRING << "\n";
    std::cout << "Chain length: " << CHAIN_LENGTH << "\n";
    std::cout << "Snapshot magic: " << snapshot::SNAPSHOT_MAGIC << "\n";
    return 0;
}

// =============================================================================
// Stats Command
// =============================================================================

int cmd_stats([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    auto brain = open_brain(false);
    BrainStats s = brain->stats();

    std::cout << "Brain: " << brain_path().string() << "\n";
    std::cout << "  chains:        " << s.chains << "\n";
    std::cout << "  words:         " << s.words << "\n";
    std::cout << "  start chains:  " << s.start_chains << "\n";
    std::cout << "  end chains:    " << s.end_chains << "\n";
    return 0;
}

// =============================================================================
// Train Command
// =============================================================================

int cmd_train(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: halbrain train <corpus-file>...\n";
        return 1;
    }

    auto brain = open_brain(true);
    annotate::SimpleAnnotator annotator;

    for (int i = 0; i < argc; ++i) {
        std::filesystem::path corpus = argv[i];
        LOG_INFO("reading training content from ", corpus.string());

        auto sentences = training::parse_training_file(corpus, annotator);
        for (size_t n = 0; n < sentences.size() && n < 5; ++n) {
            LOG_DEBUG("- ", to_string(sentences[n]));
        }
        brain->add_sentences(sentences);

        snapshot::safe_save_brain_file(*brain, brain_path());
    }

    BrainStats s = brain->stats();
    std::cout << "Trained " << argc << " file(s); brain now holds " << s.chains
              << " chains over " << s.words << " words\n";
    return 0;
}

// =============================================================================
// Reply Command
// =============================================================================

int cmd_reply(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: halbrain reply <text>\n";
        return 1;
    }

    std::string text;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) text += ' ';
        text += argv[i];
    }

    auto brain = open_brain(false);
    annotate::SimpleAnnotator annotator;
    auto sentences = annotator.annotate(text);

    Sentence reply;
    if (is_why_question(sentences)) {
        reply = brain->make_reason();
    }
    if (reply.empty()) {
        reply = brain->make_reply(sentences);
    }
    if (reply.empty()) {
        std::cout << "i am speechless :(\n";
        return 0;
    }
    std::cout << to_string(trim_period(reply)) << "\n";
    return 0;
}

// =============================================================================
// Chat Command
// =============================================================================

int cmd_chat([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    auto brain = open_brain(true);
    annotate::SimpleAnnotator annotator;

    Sentence opener = brain->make_question();
    if (!opener.empty()) {
        std::cout << "hello! " << to_string(opener) << "\n";
    } else {
        std::cout << "hello!\n";
    }

    std::string line;
    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (line == "exit" || line == "quit") {
            std::cout << "bye!\n";
            break;
        }

        auto sentences = annotator.annotate(line);
        if (g_options.debug) {
            std::cout << "Here's how I understood your message:\n";
            for (const auto& s : sentences) {
                std::cout << "- " << to_tagged_string(s) << "\n";
            }
            std::cout << "\n";
        }

        Sentence reply;
        if (is_why_question(sentences)) {
            reply = brain->make_reason();
        }
        if (reply.empty()) {
            reply = brain->make_reply(sentences);
        }
        if (reply.empty()) {
            reply = brain->make_question();
        }

        if (reply.empty()) {
            std::cout << "i am speechless :(\n";
        } else {
            reply = trim_period(reply);
            if (g_options.debug) {
                std::cout << "My response:\n- " << to_tagged_string(reply) << "\n";
            } else {
                std::cout << to_string(reply) << "\n";
            }
        }

        // Learned without the trailing period to keep the replies chatty.
        for (const auto& s : sentences) {
            brain->add_sentence(trim_period(s));
        }
    }

    snapshot::safe_save_brain_file(*brain, brain_path());
    return 0;
}

} // namespace halbrain::cli

// =============================================================================
// Main Entry Point
// =============================================================================

int parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-b" || arg == "--brain") && i + 1 < argc) {
            g_options.brain_file = argv[++i];
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if ((arg == "-s" || arg == "--seed") && i + 1 < argc) {
            g_options.seed = argv[++i];
        } else if (arg == "-D" || arg == "--debug") {
            g_options.debug = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
    return i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        halbrain::cli::cmd_help(0, nullptr);
        return 1;
    }

    using halbrain::Config;
    Config& config = Config::getInstance();
    if (!halbrain::init_config(g_options.config_file)) {
        return 1;
    }
    if (!g_options.brain_file.empty()) {
        config.set("brain.file", g_options.brain_file);
    }
    if (!g_options.seed.empty()) {
        config.set("generation.seed", g_options.seed);
    }
    if (g_options.debug) {
        halbrain::set_log_level(halbrain::LogLevel::DEBUG);
        config.print();
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const halbrain::HalbrainException& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'halbrain help' for usage.\n";
    return 1;
}
