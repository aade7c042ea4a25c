#include "voxrag_core/extractors/plaintext_extractor.hpp"

#include <regex>

#include "voxrag_core/text_utils.hpp"

namespace voxrag_core {

bool PlainTextExtractor::can_handle(const std::filesystem::path& file_path) const {
    const std::string extension = file_path.extension().string();
    return extension == ".txt";
}

/**
 * @brief Chunks plain text by paragraphs.
 *
 * Throws LoadError for text that is not valid UTF-8.
 * Paragraphs are separated by one or more blank lines. Consecutive paragraphs
 * are merged while the merged chunk stays below max_chunk_chars_; a paragraph
 * that alone exceeds the limit is cut into fixed-size pieces.
 */
std::vector<Chunk> PlainTextExtractor::chunk_text(const std::string& content) const {
    validate_utf8(content);

    // \n\s*\n matches a newline, followed by any whitespace, followed by another newline.
    const std::regex paragraph_regex(R"(\n\s*\n)");

    std::vector<std::string> paragraphs;
    std::sregex_token_iterator it(content.begin(), content.end(), paragraph_regex, -1);
    for (std::sregex_token_iterator end; it != end; ++it) {
        std::string paragraph = text::trim(it->str());
        if (!paragraph.empty()) {
            paragraphs.push_back(std::move(paragraph));
        }
    }

    std::vector<std::string> merged;
    std::string current_chunk;
    for (const auto& paragraph : paragraphs) {
        if (current_chunk.length() + paragraph.length() < max_chunk_chars_) {
            current_chunk += paragraph + "\n\n";
        } else {
            if (!current_chunk.empty()) {
                merged.push_back(text::trim(current_chunk));
            }
            current_chunk = paragraph + "\n\n";
        }
    }
    if (!current_chunk.empty()) {
        merged.push_back(text::trim(current_chunk));
    }

    std::vector<Chunk> final_chunks;
    int current_chunk_index = 0;
    for (const auto& section : merged) {
        if (section.length() > max_chunk_chars_) {
            for (const auto& piece : split_into_fixed_chunks(section)) {
                final_chunks.push_back({.content = piece, .chunk_index = current_chunk_index++});
            }
        } else {
            final_chunks.push_back({.content = section, .chunk_index = current_chunk_index++});
        }
    }

    return final_chunks;
}

} // namespace voxrag_core
