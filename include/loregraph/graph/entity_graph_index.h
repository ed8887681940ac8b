#pragma once

#include <loregraph/config/settings.h>
#include <loregraph/graph/types.h>
#include <loregraph/host/document_store.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace loregraph::graph {

// Maximum entities returned by resolveEntities()
inline constexpr std::size_t kMaxResolvedEntities = 8;
// Members considered per shared-tag / shared-heading group
inline constexpr std::size_t kMaxSharedGroupSize = 24;
// Per-hit explanation caps
inline constexpr std::size_t kMaxRelationPaths = 6;
inline constexpr std::size_t kMaxEvidenceRefs = 16;

struct EntityGraphStats {
    std::size_t nodes = 0;
    std::size_t aliases = 0;
    std::size_t edges = 0;
    std::uint64_t rebuilds = 0;
    bool initialized = false;
};

/**
 * Deterministic entity graph built from document metadata.
 *
 * One node per eligible document, keyed by its path. Aliases come from file name, path,
 * configured front-matter alias fields and link display text. Edges come from links
 * (wiki_link + backlink), link-like front-matter values, semantic front-matter relations,
 * shared tags and shared headings.
 *
 * The graph is built lazily: readers call ensureReady(), concurrent callers share one in-flight
 * rebuild. Document change events from the host are applied incrementally once the graph is
 * initialized; shared-tag and heading edges are recomputed over the whole corpus on every change.
 *
 * Thread-safety: all public methods may be called concurrently. Graph state uses a single
 * writer / multiple reader lock.
 */
class EntityGraphIndexManager {
public:
    EntityGraphIndexManager(host::DocumentStore& store, config::SettingsStore& settings);
    ~EntityGraphIndexManager();

    EntityGraphIndexManager(const EntityGraphIndexManager&) = delete;
    EntityGraphIndexManager& operator=(const EntityGraphIndexManager&) = delete;

    // Rebuild if not initialized; waits for a rebuild already in flight.
    void ensureReady();

    // Mark stale; the next ensureReady() rebuilds.
    void invalidate();

    /**
     * Full rebuild from the document store. Coalesces with a rebuild already in flight.
     * Failures are logged and leave the index uninitialized.
     */
    void rebuild();

    // Incremental maintenance entry point (registered with the document store).
    void onDocumentChanged(const host::DocumentChangeEvent& event);

    /**
     * Entities referenced by a free-text query, best first (at most 8).
     * Matches the normalized query and its 1-4 token n-grams against the alias table.
     */
    std::vector<ResolvedEntity> resolveEntities(std::string_view query);

    /**
     * Breadth-first expansion from resolved seeds.
     *
     * @param maxHops clamped to [1, 4]
     * @param maxExpandedDocs clamped to [1, 100]
     * @return hits excluding the seeds, highest score first
     */
    std::vector<EntityGraphExpansionHit>
    expandFromResolvedEntities(const std::vector<ResolvedEntity>& resolved, int maxHops,
                               int maxExpandedDocs) const;

    std::optional<EntityNode> getNode(std::string_view entityId) const;
    std::vector<EntityEdge> getOutgoingEdges(std::string_view entityId) const;

    EntityGraphStats stats() const;
    bool isInitialized() const;

    // Edge weight used by expansion scoring.
    static double relationWeight(RelationType relation);

private:
    struct SemanticRelationDescriptor {
        std::string targetPath;
        SemanticPredicate predicate = SemanticPredicate::ParentOf;
        double confidence = 0.0; // [0.1, 1]
        std::string sourceField;
    };

    // Everything extracted from one document; edges are derived from these.
    struct IndexedDocument {
        std::string path;
        std::string title;
        std::int64_t mtime = 0;
        std::vector<std::string> tags;
        std::vector<std::string> headings;
        std::vector<std::string> outgoingTargets;
        std::vector<std::string> frontmatterTargets;
        std::vector<std::string> aliases;
        std::vector<SemanticRelationDescriptor> semanticRelations;
    };

    void rebuildOrJoin(bool force);
    bool runRebuild();

    // Extraction (store access, no graph state)
    IndexedDocument buildDescriptor(const host::DocumentInfo& info,
                                    const config::GraphSettings& settings);
    std::vector<SemanticRelationDescriptor>
    extractSemanticRelations(const nlohmann::json& frontmatter, const std::string& sourcePath,
                             const config::GraphSettings& settings);
    void collectSemanticRelations(const nlohmann::json& value, const std::string& sourcePath,
                                  const std::string& sourceField,
                                  std::optional<SemanticPredicate> defaultPredicate,
                                  int minimumConfidence,
                                  std::vector<SemanticRelationDescriptor>& out);
    std::vector<std::string> resolveTargets(const nlohmann::json& value,
                                            const std::string& sourcePath);
    std::optional<std::string> resolveNotePath(std::string_view candidate,
                                               const std::string& sourcePath);

    // Incremental handlers
    void onDocumentUpserted(const host::DocumentInfo& info,
                            const std::string* oldPath = nullptr);
    void onDocumentRemoved(const std::string& path);

    // Graph mutation (caller holds stateMutex_ exclusively)
    void upsertDescriptorLocked(IndexedDocument descriptor);
    void removeDescriptorLocked(const std::string& path);
    void rebuildDirectRelationEdgesLocked();
    void rebuildSharedRelationEdgesLocked();
    void
    buildPairwiseSharedEdgesLocked(const std::map<std::string, std::vector<std::string>>& groups,
                                   RelationType relation, double confidence);
    void addEdgeLocked(const std::string& fromId, const std::string& toId, RelationType relation,
                       double confidence, EvidenceRef evidence,
                       const std::string* sourcePath = nullptr,
                       std::optional<SemanticPredicate> predicate = std::nullopt);
    void removeEdgesFromSourcePathLocked(const std::string& path);
    void removeEdgesReferencingNodeLocked(const std::string& nodeId);
    void removeEdgesByRelationLocked(RelationType relation);
    void addAliasLocked(const std::string& alias, const std::string& entityId);
    void removeAliasLocked(const std::string& alias, const std::string& entityId);
    void clearAllStateLocked();
    std::size_t edgeCountLocked() const;

    host::DocumentStore& store_;
    config::SettingsStore& settings_;
    host::ListenerId documentListener_{0};
    config::SettingsStore::SubscriptionId settingsSubscription_{0};

    // Graph state
    mutable std::shared_mutex stateMutex_;
    std::unordered_map<std::string, EntityNode> nodesById_;
    std::unordered_map<std::string, std::set<std::string>> aliasesToEntityIds_;
    std::map<std::string, std::map<std::string, EntityEdge>> edgesByFrom_;
    std::unordered_map<std::string, std::string> edgeIdToFromId_;
    std::unordered_map<std::string, std::set<std::string>> sourcePathToEdgeIds_;
    std::map<std::string, IndexedDocument> descriptorsByPath_;

    // Rebuild coordination
    mutable std::mutex rebuildMutex_;
    bool initialized_{false};
    std::optional<std::shared_future<void>> rebuildInFlight_;
    std::atomic<std::uint64_t> rebuildCount_{0};
};

} // namespace loregraph::graph
