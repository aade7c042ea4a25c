#pragma once

#include "content_extractor.hpp"

namespace voxrag_core {

class PlainTextExtractor : public ContentExtractor {
public:
    using ContentExtractor::ContentExtractor;

    bool can_handle(const fs::path& file_path) const override;

    std::vector<Chunk> chunk_text(const std::string& text) const override;
};

}
