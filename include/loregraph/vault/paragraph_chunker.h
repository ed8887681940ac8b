#pragma once

#include <loregraph/host/document_store.h>

#include <string>
#include <string_view>
#include <vector>

namespace loregraph::vault {

struct ChunkingConfig {
    std::size_t targetChunkSize = 512; // Characters; a single longer paragraph stays whole
    bool stripFrontmatter = true;
};

/**
 * Paragraph-packing ChunkProvider over a DocumentStore.
 *
 * Paragraphs (separated by blank lines) are joined with "\n\n" until the next one would push a
 * chunk past targetChunkSize. Chunk ids are "{path}#{index}".
 */
class ParagraphChunker : public host::ChunkProvider {
public:
    explicit ParagraphChunker(host::DocumentStore& store, ChunkingConfig config = {});

    Result<std::vector<host::RetrievalChunk>> getChunks(std::string_view path) override;

    // Chunk already-loaded text.
    std::vector<host::RetrievalChunk> chunkText(std::string_view path,
                                                std::string_view content) const;

    const ChunkingConfig& config() const { return config_; }

private:
    host::DocumentStore& store_;
    ChunkingConfig config_;
};

} // namespace loregraph::vault
