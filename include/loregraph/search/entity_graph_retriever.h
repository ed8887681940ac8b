#pragma once

#include <loregraph/config/settings.h>
#include <loregraph/graph/entity_graph_index.h>
#include <loregraph/graph/types.h>
#include <loregraph/host/document_store.h>
#include <loregraph/search/retrieval_document.h>

#include <string>
#include <string_view>
#include <vector>

namespace loregraph::search {

/**
 * Graph expansion bounds for one augmentation call. Zero falls back to the configured values.
 */
struct EntityGraphAugmentationOptions {
    int maxHops = 0;
    int maxExpandedDocs = 0;
};

struct EntityGraphAugmentationResult {
    std::vector<RetrievalDocument> documents; // Merged, highest score first
    bool entityQueryMode = false;             // Query resolved to at least one entity
    bool hasEntityEvidence = false;           // Some merged document carries graph evidence
    std::vector<graph::ResolvedEntity> resolvedEntities;
};

/**
 * Augments lexical retrieval results with documents reached through the entity graph.
 *
 * Degrades to a passthrough of the base documents when graph retrieval is disabled or the query
 * names no known entity.
 */
class EntityGraphRetriever {
public:
    EntityGraphRetriever(graph::EntityGraphIndexManager& index, host::DocumentStore& store,
                         host::ChunkProvider& chunks, config::SettingsStore& settings);

    EntityGraphAugmentationResult
    augmentDocuments(std::string_view query, const std::vector<RetrievalDocument>& baseDocuments,
                     const EntityGraphAugmentationOptions& options = {});

    // Score used for ranking merged documents: rerank_score, then score, else 0.
    static double documentScore(const RetrievalDocument& doc);

    // Dedupe key: chunkId, path, title, or the first 64 bytes of content.
    static std::string documentKey(const RetrievalDocument& doc);

private:
    std::vector<RetrievalDocument>
    buildGraphEvidenceDocuments(const std::vector<graph::EntityGraphExpansionHit>& hits);

    std::vector<RetrievalDocument>
    mergeDocuments(const std::vector<RetrievalDocument>& baseDocuments,
                   const std::vector<RetrievalDocument>& graphDocuments,
                   const std::vector<graph::ResolvedEntity>& resolvedEntities) const;

    graph::EntityGraphIndexManager& index_;
    host::DocumentStore& store_;
    host::ChunkProvider& chunks_;
    config::SettingsStore& settings_;
};

} // namespace loregraph::search
