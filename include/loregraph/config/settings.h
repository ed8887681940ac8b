#pragma once

#include <loregraph/core/types.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace loregraph::config {

/**
 * User-facing settings consumed by the entity graph.
 *
 * Semantic confidence is expressed on the 0-100 scale, matching what users type into the
 * configuration file. Consumers clamp every numeric value to its documented range.
 */
struct GraphSettings {
    // Front-matter fields whose string values become aliases.
    std::vector<std::string> entityAliasFields{"aliases"};

    bool enableSemanticEntityRelations = true;
    std::vector<std::string> semanticEntityRelationFields{"relations"};
    int semanticEntityMinConfidence = 70; // [0,100]
    int semanticEntityBatchSize = 25;     // [5,200]

    bool enableEntityGraphRetrieval = true;
    int entityGraphMaxHops = 2;          // [1,4]
    int entityGraphMaxExpandedDocs = 12; // [1,100]

    // Host eligibility filtering (applied by vault implementations)
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns;

    bool debug = false;

    bool operator==(const GraphSettings&) const = default;
};

/**
 * Load settings from a TOML file.
 *
 * Recognized keys:
 *   [entity_graph]
 *   alias_fields, semantic_relations, semantic_fields, semantic_min_confidence,
 *   semantic_batch_size, retrieval, max_hops, max_expanded_docs, debug
 *   [vault]
 *   include, exclude
 *
 * Missing keys keep their defaults. A missing file yields defaults; a file that exists but
 * cannot be read yields an error.
 */
Result<GraphSettings> loadSettings(const std::filesystem::path& configPath);

/**
 * Holds the current settings and notifies observers on change.
 *
 * Listeners receive (previous, next) and are invoked outside the internal lock, so they may call
 * back into get().
 */
class SettingsStore {
public:
    using Listener = std::function<void(const GraphSettings& prev, const GraphSettings& next)>;
    using SubscriptionId = std::uint64_t;

    SettingsStore() = default;
    explicit SettingsStore(GraphSettings initial) : settings_(std::move(initial)) {}

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    GraphSettings get() const;

    // Replace settings wholesale.
    void set(GraphSettings next);

    // Mutate a copy of the current settings and publish it.
    void update(const std::function<void(GraphSettings&)>& mutator);

    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);

    std::size_t subscriberCount() const;

private:
    void publish(const GraphSettings& prev, const GraphSettings& next);

    mutable std::mutex mutex_;
    GraphSettings settings_;
    std::map<SubscriptionId, Listener> listeners_;
    SubscriptionId nextId_{1};
};

} // namespace loregraph::config
