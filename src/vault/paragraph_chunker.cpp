#include <loregraph/vault/paragraph_chunker.h>

#include <loregraph/common/pattern_utils.h>
#include <loregraph/vault/markdown_parser.h>

#include <spdlog/spdlog.h>

namespace loregraph::vault {

namespace {

// Positions just past each "\n\n", plus the end of the text.
std::vector<size_t> findParagraphBoundaries(std::string_view text) {
    std::vector<size_t> boundaries;
    size_t pos = 0;
    while ((pos = text.find("\n\n", pos)) != std::string_view::npos) {
        boundaries.push_back(pos + 2);
        pos += 2;
    }
    if (!text.empty()) {
        boundaries.push_back(text.size());
    }
    return boundaries;
}

} // namespace

ParagraphChunker::ParagraphChunker(host::DocumentStore& store, ChunkingConfig config)
    : store_(store), config_(config) {}

Result<std::vector<host::RetrievalChunk>> ParagraphChunker::getChunks(std::string_view path) {
    auto content = store_.readContent(path);
    if (!content) {
        return content.error();
    }
    if (!config_.stripFrontmatter) {
        return chunkText(path, content.value());
    }
    const auto split = splitFrontmatter(content.value());
    return chunkText(path, split.body);
}

std::vector<host::RetrievalChunk> ParagraphChunker::chunkText(std::string_view path,
                                                              std::string_view content) const {
    std::vector<host::RetrievalChunk> chunks;

    // Normalize CRLF so paragraph boundaries are found
    std::string text;
    text.reserve(content.size());
    for (char c : content) {
        if (c != '\r') {
            text.push_back(c);
        }
    }

    auto flush = [&](std::string& current) {
        if (current.empty()) {
            return;
        }
        host::RetrievalChunk chunk;
        chunk.index = chunks.size();
        chunk.id = std::string(path) + "#" + std::to_string(chunk.index);
        chunk.path = std::string(path);
        chunk.content = std::move(current);
        chunks.push_back(std::move(chunk));
        current.clear();
    };

    std::string current;
    size_t start = 0;
    for (size_t boundary : findParagraphBoundaries(text)) {
        auto paragraph =
            std::string(common::trim(std::string_view(text).substr(start, boundary - start)));
        start = boundary;
        if (paragraph.empty()) {
            continue;
        }

        if (!current.empty() &&
            current.size() + paragraph.size() + 2 > config_.targetChunkSize) {
            flush(current);
        }
        if (!current.empty()) {
            current += "\n\n";
        }
        current += paragraph;
    }
    flush(current);

    spdlog::debug("Chunked {} into {} chunk(s)", path, chunks.size());
    return chunks;
}

} // namespace loregraph::vault
