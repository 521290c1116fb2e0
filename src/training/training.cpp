#include "halbrain/training/training.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <string_view>

#include "halbrain/error.hpp"
#include "halbrain/logging.hpp"

namespace halbrain::training {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::vector<Sentence> parse_plain(std::istream& in, const annotate::Annotator& annotator) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return annotator.annotate(text);
}

std::vector<Sentence> parse_megahal(std::istream& in, const annotate::Annotator& annotator) {
    std::vector<Sentence> ret;
    std::string line;
    while (std::getline(in, line)) {
        std::string_view content = trim(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }
        auto sentences = annotator.annotate(content);
        ret.insert(ret.end(), std::make_move_iterator(sentences.begin()),
                   std::make_move_iterator(sentences.end()));
    }
    return ret;
}

std::vector<Sentence> parse_tagged_lines(std::istream& in, const std::filesystem::path& filename) {
    std::vector<Sentence> ret;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string_view content = trim(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }
        try {
            ret.push_back(parse_tagged(content));
        } catch (const InvalidArgumentError& e) {
            LOG_WARN(filename.string(), ":", line_no, ": skipping line: ", e.message());
        }
    }
    return ret;
}

} // namespace

const char* training_format_name(TrainingFormat format) noexcept {
    switch (format) {
        case TrainingFormat::Plain: return "plain text";
        case TrainingFormat::MegaHAL: return "megahal training";
        case TrainingFormat::Tagged: return "tagged";
        case TrainingFormat::Unknown: break;
    }
    return "unknown";
}

TrainingFormat detect_format(const std::filesystem::path& filename) {
    std::string ext = filename.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".txt") return TrainingFormat::Plain;
    if (ext == ".trn") return TrainingFormat::MegaHAL;
    if (ext == ".tagged") return TrainingFormat::Tagged;
    return TrainingFormat::Unknown;
}

std::vector<Sentence> parse_training_input(std::istream& in, const std::filesystem::path& filename,
                                           const annotate::Annotator& annotator) {
    TrainingFormat format = detect_format(filename);
    LOG_DEBUG("reading ", filename.string(), " as ", training_format_name(format));

    switch (format) {
        case TrainingFormat::Plain:
            return parse_plain(in, annotator);
        case TrainingFormat::MegaHAL:
            return parse_megahal(in, annotator);
        case TrainingFormat::Tagged:
            return parse_tagged_lines(in, filename);
        case TrainingFormat::Unknown:
            break;
    }
    throw UnknownFormatError("cannot detect training file format", filename.string());
}

std::vector<Sentence> parse_training_file(const std::filesystem::path& path,
                                          const annotate::Annotator& annotator) {
    if (detect_format(path) == TrainingFormat::Unknown) {
        throw UnknownFormatError("cannot detect training file format", path.string());
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw IOError("training file does not exist", path.string(), ErrorCode::FILE_NOT_FOUND);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("cannot open training file", path.string());
    }

    auto sentences = parse_training_input(file, path, annotator);
    if (file.bad()) {
        throw IOError("failed reading training file", path.string());
    }
    LOG_INFO("parsed ", sentences.size(), " sentences from ", path.string());
    return sentences;
}

} // namespace halbrain::training
