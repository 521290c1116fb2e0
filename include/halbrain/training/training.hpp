#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

#include "halbrain/annotate/annotator.hpp"
#include "halbrain/sentence.hpp"

namespace halbrain::training {

enum class TrainingFormat {
    Unknown,
    Plain,     // .txt: free text
    MegaHAL,   // .trn: one utterance per line, '#' comments
    Tagged     // .tagged: one "text/TAG ..." sentence per line
};

const char* training_format_name(TrainingFormat format) noexcept;

// Chosen by file extension alone.
TrainingFormat detect_format(const std::filesystem::path& filename);

/**
 * Extract training sentences from a stream.
 *
 * filename only selects the format. Lines of a .tagged file that do not
 * parse are logged and skipped.
 *
 * @throws UnknownFormatError if the extension is not recognised
 */
std::vector<Sentence> parse_training_input(std::istream& in, const std::filesystem::path& filename,
                                           const annotate::Annotator& annotator);

// @throws IOError (FILE_NOT_FOUND when path does not exist), UnknownFormatError
std::vector<Sentence> parse_training_file(const std::filesystem::path& path,
                                          const annotate::Annotator& annotator);

} // namespace halbrain::training
