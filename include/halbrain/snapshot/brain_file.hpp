// =============================================================================
// brain_file.hpp - Brain snapshot save/load
// =============================================================================
// Layout: the magic bytes "QWOK" followed by one encoded map
//
//   chainLen : integer, must equal CHAIN_LENGTH
//   chains   : array of { w: [idx x4], a: [idx...], b: [idx...], s: bool, e: bool }
//   words    : array of [text, tag]
//
// Every word reference is an index into the words table. Words are interned
// in the order the encoder first meets them.
// =============================================================================

#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

#include "halbrain/brain.hpp"
#include "halbrain/config.hpp"

namespace halbrain::snapshot {

inline constexpr std::string_view SNAPSHOT_MAGIC = "QWOK";

// Encodes brain under its shared lock. Throws IOError if the stream fails.
void save_brain(const Brain& brain, std::ostream& out);
std::string encode_brain(const Brain& brain);

/**
 * Decodes a snapshot into a new Brain.
 *
 * The whole payload is decoded and validated before the Brain is built, so
 * a failure never leaves a half-populated result behind.
 *
 * @throws SnapshotFormatError NOT_A_BRAIN_FILE, CHAIN_LENGTH_MISMATCH or
 *         MALFORMED_SNAPSHOT
 */
std::unique_ptr<Brain> decode_brain(std::string_view bytes, GenerationConfig config = {});
std::unique_ptr<Brain> load_brain(std::istream& in, GenerationConfig config = {});

// @throws IOError (FILE_NOT_FOUND when path does not exist)
std::unique_ptr<Brain> load_brain_file(const std::filesystem::path& path,
                                       GenerationConfig config = {});
void save_brain_file(const Brain& brain, const std::filesystem::path& path);

// Writes ".<name>.new" beside path, then renames it over path.
void safe_save_brain_file(const Brain& brain, const std::filesystem::path& path);

} // namespace halbrain::snapshot
