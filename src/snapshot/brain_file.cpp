#include "halbrain/snapshot/brain_file.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "halbrain/error.hpp"
#include "halbrain/logging.hpp"
#include "halbrain/snapshot/wire.hpp"

namespace halbrain::snapshot {

namespace {

// Smallest valid encodings: a one-key map holding four fixint indices, and
// a two-element array of empty strings. Reservations never exceed what the
// input could actually hold.
constexpr size_t MIN_CHAIN_RECORD_BYTES = 8;
constexpr size_t MIN_WORD_RECORD_BYTES = 3;

// Decoded form of one chain record, before word indices are resolved.
// The words table may follow the chains, so resolution waits until the
// whole map has been read.
struct ChainEntry {
    std::vector<int64_t> words;
    std::vector<int64_t> after;
    std::vector<int64_t> before;
    bool can_start = false;
    bool can_end = false;
};

class WordTable {
public:
    uint32_t intern(const Word& w) {
        auto [it, inserted] = index_.try_emplace(w, static_cast<uint32_t>(words_.size()));
        if (inserted) {
            words_.push_back(w);
        }
        return it->second;
    }

    const std::vector<Word>& words() const noexcept { return words_; }

private:
    std::vector<Word> words_;
    std::unordered_map<Word, uint32_t, WordHasher> index_;
};

void write_indices(PackWriter& out, WordTable& table, const WordSet& set) {
    out.write_array_header(static_cast<uint32_t>(set.size()));
    for (const auto& w : set) {
        out.write_int(table.intern(w));
    }
}

std::vector<int64_t> read_indices(PackReader& in) {
    uint32_t n = in.read_array_header_or_nil();
    std::vector<int64_t> out;
    out.reserve(std::min<size_t>(n, 1024));
    for (uint32_t i = 0; i < n; ++i) {
        out.push_back(in.read_index());
    }
    return out;
}

ChainEntry read_chain_entry(PackReader& in) {
    ChainEntry entry;
    uint32_t fields = in.read_map_header();
    for (uint32_t i = 0; i < fields; ++i) {
        std::string key = in.read_string();
        if (key == "w") {
            entry.words = read_indices(in);
        } else if (key == "a") {
            entry.after = read_indices(in);
        } else if (key == "b") {
            entry.before = read_indices(in);
        } else if (key == "s") {
            entry.can_start = in.read_bool();
        } else if (key == "e") {
            entry.can_end = in.read_bool();
        } else {
            in.skip();
        }
    }
    return entry;
}

Word read_word_entry(PackReader& in) {
    uint32_t n = in.read_array_header();
    if (n < 2) {
        throw SnapshotFormatError(ErrorCode::MALFORMED_SNAPSHOT,
                                  "word entry has " + std::to_string(n) + " fields; need 2");
    }
    std::string text = in.read_string();
    std::string tag = in.read_string();
    for (uint32_t i = 2; i < n; ++i) {
        in.skip();
    }
    return Word::from_normalized(std::move(tag), std::move(text));
}

// Out-of-range references decode to the invalid Word.
Word resolve(const std::vector<Word>& table, int64_t idx) {
    if (idx < 0 || static_cast<uint64_t>(idx) >= table.size()) {
        return Word{};
    }
    return table[static_cast<size_t>(idx)];
}

WordSet resolve_set(const std::vector<Word>& table, const std::vector<int64_t>& indices) {
    WordSet set;
    for (int64_t idx : indices) {
        set.add(resolve(table, idx));
    }
    return set;
}

} // namespace

std::string encode_brain(const Brain& brain) {
    WordTable table;
    PackWriter chains;
    uint32_t chain_count = 0;

    brain.for_each_chain([&](const Brain::ChainRecord& rec) {
        chains.write_map_header(5);
        chains.write_string("w");
        chains.write_array_header(CHAIN_LENGTH);
        for (const auto& w : rec.chain) {
            chains.write_int(table.intern(w));
        }
        chains.write_string("a");
        write_indices(chains, table, rec.after);
        chains.write_string("b");
        write_indices(chains, table, rec.before);
        chains.write_string("s");
        chains.write_bool(rec.can_start);
        chains.write_string("e");
        chains.write_bool(rec.can_end);
        ++chain_count;
    });

    PackWriter out;
    out.write_raw(SNAPSHOT_MAGIC);
    out.write_map_header(3);
    out.write_string("chainLen");
    out.write_int(CHAIN_LENGTH);
    out.write_string("chains");
    out.write_array_header(chain_count);
    out.write_raw(chains.bytes());
    out.write_string("words");
    out.write_array_header(static_cast<uint32_t>(table.words().size()));
    for (const auto& w : table.words()) {
        out.write_array_header(2);
        out.write_string(w.text());
        out.write_string(w.tag());
    }

    LOG_DEBUG("encoded ", chain_count, " chains over ", table.words().size(), " words");
    return out.take();
}

void save_brain(const Brain& brain, std::ostream& out) {
    std::string bytes = encode_brain(brain);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw IOError("failed writing brain snapshot");
    }
}

std::unique_ptr<Brain> decode_brain(std::string_view bytes, GenerationConfig config) {
    if (bytes.size() < SNAPSHOT_MAGIC.size() ||
        bytes.substr(0, SNAPSHOT_MAGIC.size()) != SNAPSHOT_MAGIC) {
        throw SnapshotFormatError(ErrorCode::NOT_A_BRAIN_FILE, "not a brain file");
    }

    PackReader in(bytes.substr(SNAPSHOT_MAGIC.size()));

    int64_t chain_len = 0;
    std::vector<ChainEntry> entries;
    std::vector<Word> table;

    uint32_t fields = in.read_map_header();
    for (uint32_t i = 0; i < fields; ++i) {
        std::string key = in.read_string();
        if (key == "chainLen") {
            chain_len = in.read_int();
        } else if (key == "chains") {
            uint32_t n = in.read_array_header_or_nil();
            entries.reserve(std::min<size_t>(n, bytes.size() / MIN_CHAIN_RECORD_BYTES));
            for (uint32_t c = 0; c < n; ++c) {
                entries.push_back(read_chain_entry(in));
            }
        } else if (key == "words") {
            uint32_t n = in.read_array_header_or_nil();
            table.reserve(std::min<size_t>(n, bytes.size() / MIN_WORD_RECORD_BYTES));
            for (uint32_t w = 0; w < n; ++w) {
                table.push_back(read_word_entry(in));
            }
        } else {
            LOG_DEBUG("skipping unknown snapshot field ", key);
            in.skip();
        }
    }

    if (chain_len != static_cast<int64_t>(CHAIN_LENGTH)) {
        throw SnapshotFormatError(ErrorCode::CHAIN_LENGTH_MISMATCH,
                                  "wrong chain length " + std::to_string(chain_len) +
                                  "; need " + std::to_string(CHAIN_LENGTH));
    }
    for (size_t c = 0; c < entries.size(); ++c) {
        if (entries[c].words.size() != CHAIN_LENGTH) {
            throw SnapshotFormatError(ErrorCode::MALFORMED_SNAPSHOT,
                                      "chain " + std::to_string(c) + " has wrong length " +
                                      std::to_string(entries[c].words.size()) +
                                      "; need " + std::to_string(CHAIN_LENGTH));
        }
    }

    auto brain = std::make_unique<Brain>(config);
    for (const auto& entry : entries) {
        Chain::Words words;
        for (size_t k = 0; k < CHAIN_LENGTH; ++k) {
            words[k] = resolve(table, entry.words[k]);
        }
        brain->restore_chain(Chain(words),
                             resolve_set(table, entry.before),
                             resolve_set(table, entry.after),
                             entry.can_start, entry.can_end);
    }

    LOG_DEBUG("decoded ", entries.size(), " chains over ", table.size(), " words");
    return brain;
}

std::unique_ptr<Brain> load_brain(std::istream& in, GenerationConfig config) {
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw IOError("failed reading brain snapshot");
    }
    return decode_brain(bytes, config);
}

std::unique_ptr<Brain> load_brain_file(const std::filesystem::path& path, GenerationConfig config) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw IOError("brain file does not exist", path.string(), ErrorCode::FILE_NOT_FOUND);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("cannot open brain file", path.string());
    }

    auto brain = load_brain(file, config);
    BrainStats s = brain->stats();
    LOG_INFO("loaded ", path.string(), ": ", s.chains, " chains, ", s.words, " words");
    return brain;
}

void save_brain_file(const Brain& brain, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError("cannot open brain file for writing", path.string());
    }
    save_brain(brain, file);
    file.close();
    if (!file) {
        throw IOError("failed closing brain file", path.string());
    }
}

void safe_save_brain_file(const Brain& brain, const std::filesystem::path& path) {
    std::filesystem::path tmp = path.parent_path() / ("." + path.filename().string() + ".new");
    save_brain_file(brain, tmp);

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw IOError("cannot replace brain file: " + ec.message(), path.string());
    }
    LOG_INFO("saved brain to ", path.string());
}

} // namespace halbrain::snapshot
