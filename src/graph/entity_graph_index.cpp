#include <loregraph/graph/entity_graph_index.h>

#include <loregraph/common/pattern_utils.h>
#include <loregraph/graph/alias_utils.h>
#include <loregraph/graph/frontmatter_utils.h>
#include <loregraph/graph/semantic_predicate.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <deque>
#include <unordered_set>

namespace loregraph::graph {

namespace {

void appendUnique(std::vector<std::string>& values, std::string value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(std::move(value));
    }
}

std::string makeEdgeId(const std::string& fromId, RelationType relation,
                       std::optional<SemanticPredicate> predicate, const std::string& toId) {
    std::string id = fromId;
    id += '|';
    id += relationTypeName(relation);
    if (predicate) {
        id += ':';
        id += semanticPredicateName(*predicate);
    }
    id += '|';
    id += toId;
    return id;
}

std::string relationLabel(const EntityEdge& edge) {
    std::string label = relationTypeName(edge.relation);
    if (edge.relation == RelationType::SemanticFrontmatter && edge.semanticPredicate) {
        label += ':';
        label += semanticPredicateName(*edge.semanticPredicate);
    }
    return label;
}

EvidenceRef structuralEvidence(const std::string& path, std::int64_t mtime,
                               RelationType extractor) {
    EvidenceRef ref;
    ref.path = path;
    ref.chunkId = path + "#0";
    ref.mtime = mtime;
    ref.extractor = extractor;
    return ref;
}

} // namespace

EntityGraphIndexManager::EntityGraphIndexManager(host::DocumentStore& store,
                                                 config::SettingsStore& settings)
    : store_(store), settings_(settings) {
    documentListener_ = store_.addChangeListener(
        [this](const host::DocumentChangeEvent& event) { onDocumentChanged(event); });

    settingsSubscription_ = settings_.subscribe(
        [this](const config::GraphSettings& prev, const config::GraphSettings& next) {
            if (prev.entityAliasFields != next.entityAliasFields ||
                prev.enableSemanticEntityRelations != next.enableSemanticEntityRelations ||
                prev.semanticEntityRelationFields != next.semanticEntityRelationFields ||
                prev.semanticEntityMinConfidence != next.semanticEntityMinConfidence) {
                spdlog::debug("Entity graph settings changed; invalidating index");
                invalidate();
            }
        });
}

EntityGraphIndexManager::~EntityGraphIndexManager() {
    settings_.unsubscribe(settingsSubscription_);
    store_.removeChangeListener(documentListener_);
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void EntityGraphIndexManager::ensureReady() {
    rebuildOrJoin(false);
}

void EntityGraphIndexManager::rebuild() {
    rebuildOrJoin(true);
}

void EntityGraphIndexManager::invalidate() {
    std::lock_guard<std::mutex> lock(rebuildMutex_);
    initialized_ = false;
}

bool EntityGraphIndexManager::isInitialized() const {
    std::lock_guard<std::mutex> lock(rebuildMutex_);
    return initialized_;
}

void EntityGraphIndexManager::rebuildOrJoin(bool force) {
    std::promise<void> done;
    std::shared_future<void> pending;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(rebuildMutex_);
        if (rebuildInFlight_) {
            pending = *rebuildInFlight_;
        } else if (!force && initialized_) {
            return;
        } else {
            pending = done.get_future().share();
            rebuildInFlight_ = pending;
            owner = true;
        }
    }

    if (!owner) {
        pending.wait();
        return;
    }

    const bool ok = runRebuild();
    {
        std::lock_guard<std::mutex> lock(rebuildMutex_);
        initialized_ = ok;
        rebuildInFlight_.reset();
    }
    done.set_value();
}

bool EntityGraphIndexManager::runRebuild() {
    const auto start = std::chrono::steady_clock::now();
    try {
        const auto settings = settings_.get();
        const auto documents = store_.listDocuments();

        std::vector<IndexedDocument> descriptors;
        descriptors.reserve(documents.size());
        for (const auto& info : documents) {
            try {
                descriptors.push_back(buildDescriptor(info, settings));
            } catch (const std::exception& e) {
                spdlog::warn("Failed to index {}: {}", info.path, e.what());
            }
        }

        std::unique_lock<std::shared_mutex> lock(stateMutex_);
        clearAllStateLocked();
        for (auto& descriptor : descriptors) {
            upsertDescriptorLocked(std::move(descriptor));
        }
        rebuildDirectRelationEdgesLocked();
        rebuildSharedRelationEdgesLocked();
        rebuildCount_.fetch_add(1, std::memory_order_relaxed);

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - start)
                                 .count();
        spdlog::info("Rebuilt entity graph: nodes={}, aliases={}, edges={} ({}ms)",
                     nodesById_.size(), aliasesToEntityIds_.size(), edgeCountLocked(), elapsed);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("Entity graph rebuild failed: {}", e.what());
        return false;
    }
}

// ---------------------------------------------------------------------------
// Incremental maintenance
// ---------------------------------------------------------------------------

void EntityGraphIndexManager::onDocumentChanged(const host::DocumentChangeEvent& event) {
    try {
        switch (event.kind) {
            case host::DocumentChangeKind::Modified:
            case host::DocumentChangeKind::Created:
                onDocumentUpserted(event.document);
                break;
            case host::DocumentChangeKind::Renamed:
                onDocumentUpserted(event.document, &event.oldPath);
                break;
            case host::DocumentChangeKind::Deleted:
                onDocumentRemoved(event.document.path);
                break;
        }
    } catch (const std::exception& e) {
        spdlog::warn("Failed to apply document change for {}: {}", event.document.path,
                     e.what());
    }
}

void EntityGraphIndexManager::onDocumentUpserted(const host::DocumentInfo& info,
                                                 const std::string* oldPath) {
    if (!isInitialized()) {
        return;
    }

    std::optional<IndexedDocument> descriptor;
    if (store_.isEligible(info.path)) {
        descriptor = buildDescriptor(info, settings_.get());
    }

    std::unique_lock<std::shared_mutex> lock(stateMutex_);
    if (oldPath && !oldPath->empty() && *oldPath != info.path) {
        removeDescriptorLocked(*oldPath);
    }
    if (descriptor) {
        upsertDescriptorLocked(std::move(*descriptor));
    } else {
        removeDescriptorLocked(info.path);
    }
    rebuildDirectRelationEdgesLocked();
    rebuildSharedRelationEdgesLocked();
}

void EntityGraphIndexManager::onDocumentRemoved(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(stateMutex_);
    removeDescriptorLocked(path);
    rebuildDirectRelationEdgesLocked();
    rebuildSharedRelationEdgesLocked();
}

// ---------------------------------------------------------------------------
// Extraction
// ---------------------------------------------------------------------------

EntityGraphIndexManager::IndexedDocument
EntityGraphIndexManager::buildDescriptor(const host::DocumentInfo& info,
                                         const config::GraphSettings& settings) {
    auto metadata = store_.getMetadata(info.path).value_or(host::DocumentMetadata{});
    const nlohmann::json frontmatter =
        metadata.frontmatter.is_object() ? metadata.frontmatter : nlohmann::json::object();

    IndexedDocument doc;
    doc.path = info.path;
    doc.title = info.basename;
    doc.mtime = info.mtime;

    auto addAlias = [&doc](std::string alias) {
        if (!alias.empty()) {
            appendUnique(doc.aliases, std::move(alias));
        }
    };

    addAlias(normalizeAlias(info.basename));
    addAlias(normalizeAlias(info.path));

    for (const auto& field : sanitizeFieldList(settings.entityAliasFields)) {
        auto it = frontmatter.find(field);
        if (it == frontmatter.end()) {
            continue;
        }
        for (auto& alias : collectAliasValues(*it)) {
            addAlias(std::move(alias));
        }
    }

    for (const auto& tag : metadata.tags) {
        auto normalized = normalizeAlias(tag);
        if (!normalized.empty()) {
            appendUnique(doc.tags, std::move(normalized));
        }
    }
    for (const auto& heading : metadata.headings) {
        auto normalized = normalizeAlias(heading);
        if (!normalized.empty()) {
            appendUnique(doc.headings, std::move(normalized));
        }
    }

    for (const auto& link : metadata.links) {
        if (link.target.empty()) {
            continue;
        }
        auto resolved = resolveNotePath(link.target, info.path);
        if (resolved && *resolved != info.path) {
            appendUnique(doc.outgoingTargets, std::move(*resolved));
        }
        const bool hasDisplay = link.displayText && !link.displayText->empty();
        addAlias(normalizeAlias(hasDisplay ? *link.displayText : link.target));
    }

    for (const auto& candidate : collectReferenceCandidates(frontmatter)) {
        auto resolved = resolveNotePath(candidate, info.path);
        if (resolved && *resolved != info.path) {
            appendUnique(doc.frontmatterTargets, std::move(*resolved));
        }
    }

    doc.semanticRelations = extractSemanticRelations(frontmatter, info.path, settings);
    return doc;
}

std::vector<EntityGraphIndexManager::SemanticRelationDescriptor>
EntityGraphIndexManager::extractSemanticRelations(const nlohmann::json& frontmatter,
                                                  const std::string& sourcePath,
                                                  const config::GraphSettings& settings) {
    if (!settings.enableSemanticEntityRelations || !frontmatter.is_object()) {
        return {};
    }

    const int minimumConfidence = clampMinimumConfidence(settings.semanticEntityMinConfidence);
    std::vector<SemanticRelationDescriptor> extracted;

    for (const auto& field : sanitizeFieldList(settings.semanticEntityRelationFields)) {
        auto it = frontmatter.find(field);
        if (it != frontmatter.end()) {
            collectSemanticRelations(*it, sourcePath, field, std::nullopt, minimumConfidence,
                                     extracted);
        }
    }

    for (const auto& key : fixedPredicateKeys()) {
        auto it = frontmatter.find(key.field);
        if (it != frontmatter.end()) {
            collectSemanticRelations(*it, sourcePath, key.field, key.predicate,
                                     minimumConfidence, extracted);
        }
    }

    // One relation per (target, predicate); the strongest wins, first position is kept.
    std::vector<SemanticRelationDescriptor> deduped;
    std::unordered_map<std::string, std::size_t> positions;
    for (auto& relation : extracted) {
        auto key = relation.targetPath + "|" + semanticPredicateName(relation.predicate);
        auto [it, inserted] = positions.emplace(std::move(key), deduped.size());
        if (inserted) {
            deduped.push_back(std::move(relation));
        } else if (relation.confidence > deduped[it->second].confidence) {
            deduped[it->second] = std::move(relation);
        }
    }
    return deduped;
}

void EntityGraphIndexManager::collectSemanticRelations(
    const nlohmann::json& value, const std::string& sourcePath, const std::string& sourceField,
    std::optional<SemanticPredicate> defaultPredicate, int minimumConfidence,
    std::vector<SemanticRelationDescriptor>& out) {
    switch (value.type()) {
        case nlohmann::json::value_t::string: {
            // Bare strings only carry a relation under a fixed predicate key
            if (!defaultPredicate) {
                return;
            }
            const double confidence = normalizeConfidenceFraction(nullptr, minimumConfidence);
            for (auto& target : resolveTargets(value, sourcePath)) {
                out.push_back({std::move(target), *defaultPredicate, confidence, sourceField});
            }
            return;
        }
        case nlohmann::json::value_t::array:
            for (const auto& entry : value) {
                collectSemanticRelations(entry, sourcePath, sourceField, defaultPredicate,
                                         minimumConfidence, out);
            }
            return;
        case nlohmann::json::value_t::object: {
            const auto* predicateValue = firstTruthyField(value, {"predicate", "relation", "type"});
            const auto predicate =
                predicateValue ? parsePredicateValue(*predicateValue) : defaultPredicate;
            if (!predicate) {
                return;
            }

            const auto confidenceIt = value.find("confidence");
            const double confidence = normalizeConfidenceFraction(
                confidenceIt != value.end() ? &*confidenceIt : nullptr, minimumConfidence);

            const auto* targetValue =
                firstTruthyField(value, {"target", "to", "entity", "path", "note"});
            if (!targetValue) {
                return;
            }
            for (auto& target : resolveTargets(*targetValue, sourcePath)) {
                out.push_back({std::move(target), *predicate, confidence, sourceField});
            }
            return;
        }
        default:
            return;
    }
}

std::vector<std::string> EntityGraphIndexManager::resolveTargets(const nlohmann::json& value,
                                                                 const std::string& sourcePath) {
    std::vector<std::string> resolved;
    for (const auto& candidate : collectTargetCandidates(value)) {
        auto path = resolveNotePath(candidate, sourcePath);
        if (path && *path != sourcePath) {
            appendUnique(resolved, std::move(*path));
        }
    }
    return resolved;
}

std::optional<std::string> EntityGraphIndexManager::resolveNotePath(std::string_view candidate,
                                                                    const std::string& sourcePath) {
    const auto value = common::trim(candidate);
    if (value.empty()) {
        return std::nullopt;
    }
    return store_.resolveLink(value, sourcePath);
}

// ---------------------------------------------------------------------------
// Graph mutation
// ---------------------------------------------------------------------------

void EntityGraphIndexManager::upsertDescriptorLocked(IndexedDocument descriptor) {
    removeDescriptorLocked(descriptor.path);

    EntityNode node;
    node.id = descriptor.path;
    node.canonicalName = descriptor.title;
    node.aliases = descriptor.aliases;
    node.path = descriptor.path;
    node.mtime = descriptor.mtime;
    node.tags = descriptor.tags;

    const auto id = node.id;
    nodesById_[id] = std::move(node);
    for (const auto& alias : descriptor.aliases) {
        addAliasLocked(alias, id);
    }
    descriptorsByPath_[id] = std::move(descriptor);
}

void EntityGraphIndexManager::removeDescriptorLocked(const std::string& path) {
    auto it = descriptorsByPath_.find(path);
    if (it == descriptorsByPath_.end()) {
        return;
    }

    for (const auto& alias : it->second.aliases) {
        removeAliasLocked(alias, path);
    }

    removeEdgesFromSourcePathLocked(path);
    removeEdgesReferencingNodeLocked(path);

    nodesById_.erase(path);
    descriptorsByPath_.erase(it);
}

void EntityGraphIndexManager::rebuildDirectRelationEdgesLocked() {
    removeEdgesByRelationLocked(RelationType::WikiLink);
    removeEdgesByRelationLocked(RelationType::Backlink);
    removeEdgesByRelationLocked(RelationType::FrontmatterReference);
    removeEdgesByRelationLocked(RelationType::SemanticFrontmatter);
    sourcePathToEdgeIds_.clear();

    for (const auto& [path, descriptor] : descriptorsByPath_) {
        const auto linkEvidence =
            structuralEvidence(path, descriptor.mtime, RelationType::WikiLink);
        const auto backlinkEvidence =
            structuralEvidence(path, descriptor.mtime, RelationType::Backlink);
        for (const auto& target : descriptor.outgoingTargets) {
            addEdgeLocked(path, target, RelationType::WikiLink, 0.95, linkEvidence, &path);
            addEdgeLocked(target, path, RelationType::Backlink, 0.9, backlinkEvidence, &path);
        }

        const auto referenceEvidence =
            structuralEvidence(path, descriptor.mtime, RelationType::FrontmatterReference);
        for (const auto& target : descriptor.frontmatterTargets) {
            addEdgeLocked(path, target, RelationType::FrontmatterReference, 0.9, referenceEvidence,
                          &path);
        }

        const auto semanticEvidence =
            structuralEvidence(path, descriptor.mtime, RelationType::SemanticFrontmatter);
        for (const auto& relation : descriptor.semanticRelations) {
            addEdgeLocked(path, relation.targetPath, RelationType::SemanticFrontmatter,
                          relation.confidence, semanticEvidence, &path, relation.predicate);
        }
    }
}

void EntityGraphIndexManager::rebuildSharedRelationEdgesLocked() {
    removeEdgesByRelationLocked(RelationType::SharedTag);
    removeEdgesByRelationLocked(RelationType::HeadingCooccurrence);

    // Descriptors iterate in path order, so each group is path-sorted.
    std::map<std::string, std::vector<std::string>> tagGroups;
    std::map<std::string, std::vector<std::string>> headingGroups;
    for (const auto& [path, descriptor] : descriptorsByPath_) {
        for (const auto& tag : descriptor.tags) {
            if (tag.size() < 2) {
                continue;
            }
            tagGroups[tag.front() == '#' ? tag : "#" + tag].push_back(path);
        }
        for (const auto& heading : descriptor.headings) {
            if (heading.size() < 3) {
                continue;
            }
            headingGroups[heading].push_back(path);
        }
    }

    buildPairwiseSharedEdgesLocked(tagGroups, RelationType::SharedTag, 0.7);
    buildPairwiseSharedEdgesLocked(headingGroups, RelationType::HeadingCooccurrence, 0.55);
}

void EntityGraphIndexManager::buildPairwiseSharedEdgesLocked(
    const std::map<std::string, std::vector<std::string>>& groups, RelationType relation,
    double confidence) {
    for (const auto& [label, paths] : groups) {
        std::vector<std::string> members;
        for (const auto& path : paths) {
            appendUnique(members, path);
            if (members.size() >= kMaxSharedGroupSize) {
                break;
            }
        }
        if (members.size() < 2) {
            continue;
        }

        for (std::size_t i = 0; i < members.size(); ++i) {
            for (std::size_t j = i + 1; j < members.size(); ++j) {
                const auto& fromPath = members[i];
                const auto& toPath = members[j];
                auto fromIt = nodesById_.find(fromPath);
                auto toIt = nodesById_.find(toPath);
                if (fromIt == nodesById_.end() || toIt == nodesById_.end()) {
                    continue;
                }
                addEdgeLocked(fromPath, toPath, relation, confidence,
                              structuralEvidence(fromPath, fromIt->second.mtime, relation));
                addEdgeLocked(toPath, fromPath, relation, confidence,
                              structuralEvidence(toPath, toIt->second.mtime, relation));
            }
        }
    }
}

void EntityGraphIndexManager::addEdgeLocked(const std::string& fromId, const std::string& toId,
                                            RelationType relation, double confidence,
                                            EvidenceRef evidence, const std::string* sourcePath,
                                            std::optional<SemanticPredicate> predicate) {
    if (fromId == toId) {
        return;
    }
    if (nodesById_.find(fromId) == nodesById_.end() || nodesById_.find(toId) == nodesById_.end()) {
        return;
    }

    auto edgeId = makeEdgeId(fromId, relation, predicate, toId);
    auto& outgoing = edgesByFrom_[fromId];
    auto it = outgoing.find(edgeId);
    if (it == outgoing.end()) {
        EntityEdge edge;
        edge.id = edgeId;
        edge.fromId = fromId;
        edge.toId = toId;
        edge.relation = relation;
        edge.confidence = std::clamp(confidence, 0.1, 1.0);
        edge.semanticPredicate = predicate;
        edge.evidence.push_back(std::move(evidence));
        outgoing.emplace(edgeId, std::move(edge));
        edgeIdToFromId_[edgeId] = fromId;
    } else {
        auto& existing = it->second.evidence;
        const bool known = std::any_of(existing.begin(), existing.end(),
                                       [&](const EvidenceRef& e) {
                                           return e.sameSource(evidence);
                                       });
        if (!known) {
            existing.push_back(std::move(evidence));
        }
    }

    if (sourcePath) {
        sourcePathToEdgeIds_[*sourcePath].insert(std::move(edgeId));
    }
}

void EntityGraphIndexManager::removeEdgesFromSourcePathLocked(const std::string& path) {
    auto it = sourcePathToEdgeIds_.find(path);
    if (it == sourcePathToEdgeIds_.end()) {
        return;
    }

    for (const auto& edgeId : it->second) {
        auto fromIt = edgeIdToFromId_.find(edgeId);
        if (fromIt == edgeIdToFromId_.end()) {
            continue;
        }
        auto outgoingIt = edgesByFrom_.find(fromIt->second);
        edgeIdToFromId_.erase(fromIt);
        if (outgoingIt == edgesByFrom_.end()) {
            continue;
        }
        outgoingIt->second.erase(edgeId);
        if (outgoingIt->second.empty()) {
            edgesByFrom_.erase(outgoingIt);
        }
    }

    sourcePathToEdgeIds_.erase(it);
}

void EntityGraphIndexManager::removeEdgesReferencingNodeLocked(const std::string& nodeId) {
    if (auto outgoing = edgesByFrom_.find(nodeId); outgoing != edgesByFrom_.end()) {
        for (const auto& [edgeId, _] : outgoing->second) {
            edgeIdToFromId_.erase(edgeId);
        }
        edgesByFrom_.erase(outgoing);
    }

    for (auto fromIt = edgesByFrom_.begin(); fromIt != edgesByFrom_.end();) {
        auto& edges = fromIt->second;
        for (auto edgeIt = edges.begin(); edgeIt != edges.end();) {
            if (edgeIt->second.toId == nodeId) {
                edgeIdToFromId_.erase(edgeIt->first);
                edgeIt = edges.erase(edgeIt);
            } else {
                ++edgeIt;
            }
        }
        fromIt = edges.empty() ? edgesByFrom_.erase(fromIt) : std::next(fromIt);
    }
}

void EntityGraphIndexManager::removeEdgesByRelationLocked(RelationType relation) {
    for (auto fromIt = edgesByFrom_.begin(); fromIt != edgesByFrom_.end();) {
        auto& edges = fromIt->second;
        for (auto edgeIt = edges.begin(); edgeIt != edges.end();) {
            if (edgeIt->second.relation == relation) {
                edgeIdToFromId_.erase(edgeIt->first);
                edgeIt = edges.erase(edgeIt);
            } else {
                ++edgeIt;
            }
        }
        fromIt = edges.empty() ? edgesByFrom_.erase(fromIt) : std::next(fromIt);
    }
}

void EntityGraphIndexManager::addAliasLocked(const std::string& alias,
                                             const std::string& entityId) {
    auto normalized = normalizeAlias(alias);
    if (normalized.empty()) {
        return;
    }
    aliasesToEntityIds_[normalized].insert(entityId);
}

void EntityGraphIndexManager::removeAliasLocked(const std::string& alias,
                                                const std::string& entityId) {
    auto it = aliasesToEntityIds_.find(normalizeAlias(alias));
    if (it == aliasesToEntityIds_.end()) {
        return;
    }
    it->second.erase(entityId);
    if (it->second.empty()) {
        aliasesToEntityIds_.erase(it);
    }
}

void EntityGraphIndexManager::clearAllStateLocked() {
    nodesById_.clear();
    aliasesToEntityIds_.clear();
    edgesByFrom_.clear();
    edgeIdToFromId_.clear();
    sourcePathToEdgeIds_.clear();
    descriptorsByPath_.clear();
}

std::size_t EntityGraphIndexManager::edgeCountLocked() const {
    std::size_t count = 0;
    for (const auto& [_, edges] : edgesByFrom_) {
        count += edges.size();
    }
    return count;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::vector<ResolvedEntity> EntityGraphIndexManager::resolveEntities(std::string_view query) {
    ensureReady();

    const auto normalizedQuery = normalizeAlias(query);
    if (normalizedQuery.empty()) {
        return {};
    }

    const auto terms = generateCandidateAliasTerms(normalizedQuery);

    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    std::vector<ResolvedEntity> resolved;
    std::unordered_map<std::string, std::size_t> positions;
    for (const auto& term : terms) {
        auto aliasIt = aliasesToEntityIds_.find(term);
        if (aliasIt == aliasesToEntityIds_.end() || aliasIt->second.empty()) {
            continue;
        }

        const double score = computeTermScore(term);
        for (const auto& entityId : aliasIt->second) {
            auto nodeIt = nodesById_.find(entityId);
            if (nodeIt == nodesById_.end()) {
                continue;
            }
            auto [pos, inserted] = positions.emplace(entityId, resolved.size());
            if (inserted) {
                resolved.push_back({entityId, nodeIt->second.canonicalName, term, score});
            } else if (score > resolved[pos->second].score) {
                resolved[pos->second].score = score;
                resolved[pos->second].matchedAlias = term;
            }
        }
    }

    std::stable_sort(resolved.begin(), resolved.end(),
                     [](const ResolvedEntity& a, const ResolvedEntity& b) {
                         return a.score > b.score;
                     });
    if (resolved.size() > kMaxResolvedEntities) {
        resolved.resize(kMaxResolvedEntities);
    }
    return resolved;
}

std::vector<EntityGraphExpansionHit>
EntityGraphIndexManager::expandFromResolvedEntities(const std::vector<ResolvedEntity>& resolved,
                                                    int maxHops, int maxExpandedDocs) const {
    if (resolved.empty()) {
        return {};
    }

    const int hopLimit = std::clamp(maxHops, 1, 4);
    const auto docLimit = static_cast<std::size_t>(std::clamp(maxExpandedDocs, 1, 100));

    struct QueueItem {
        std::string nodeId;
        int hop;
        const ResolvedEntity* seed;
    };

    struct Accumulator {
        std::string entityId;
        double score = 0.0;
        int hopDepth = 0;
        std::vector<RelationType> relationTypes;
        std::vector<std::string> matchedEntities;
        std::vector<std::string> relationPaths;
        std::vector<EvidenceRef> evidenceRefs;
        std::size_t evidenceCount = 0;
    };

    std::unordered_set<std::string> seedIds;
    std::deque<QueueItem> queue;
    for (const auto& seed : resolved) {
        seedIds.insert(seed.entityId);
        queue.push_back({seed.entityId, 0, &seed});
    }

    std::unordered_set<std::string> visitedStates;
    std::vector<Accumulator> accumulators;
    std::unordered_map<std::string, std::size_t> positions;

    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    while (!queue.empty()) {
        const auto current = std::move(queue.front());
        queue.pop_front();

        if (current.hop >= hopLimit) {
            continue;
        }
        auto outgoingIt = edgesByFrom_.find(current.nodeId);
        if (outgoingIt == edgesByFrom_.end() || outgoingIt->second.empty()) {
            continue;
        }

        auto currentNodeIt = nodesById_.find(current.nodeId);
        const std::string fromName =
            (currentNodeIt != nodesById_.end() && !currentNodeIt->second.canonicalName.empty())
                ? currentNodeIt->second.canonicalName
                : current.nodeId;

        for (const auto& [edgeId, edge] : outgoingIt->second) {
            auto nextNodeIt = nodesById_.find(edge.toId);
            if (nextNodeIt == nodesById_.end()) {
                continue;
            }

            const int nextHop = current.hop + 1;
            const double transition =
                current.seed->score * relationWeight(edge.relation) * edge.confidence / nextHop;
            const auto relationPath =
                fromName + " --" + relationLabel(edge) + "--> " + nextNodeIt->second.canonicalName;

            auto [pos, inserted] = positions.emplace(edge.toId, accumulators.size());
            if (inserted) {
                Accumulator fresh;
                fresh.entityId = edge.toId;
                fresh.hopDepth = nextHop;
                accumulators.push_back(std::move(fresh));
            }
            auto& acc = accumulators[pos->second];

            acc.score += transition;
            acc.hopDepth = std::min(acc.hopDepth, nextHop);
            if (std::find(acc.relationTypes.begin(), acc.relationTypes.end(), edge.relation) ==
                acc.relationTypes.end()) {
                acc.relationTypes.push_back(edge.relation);
            }
            appendUnique(acc.matchedEntities, current.seed->canonicalName);
            if (acc.relationPaths.size() < kMaxRelationPaths) {
                appendUnique(acc.relationPaths, relationPath);
            }
            for (const auto& evidence : edge.evidence) {
                if (acc.evidenceRefs.size() >= kMaxEvidenceRefs) {
                    break;
                }
                const bool known =
                    std::any_of(acc.evidenceRefs.begin(), acc.evidenceRefs.end(),
                                [&](const EvidenceRef& e) { return e.sameSource(evidence); });
                if (!known) {
                    acc.evidenceRefs.push_back(evidence);
                }
            }
            acc.evidenceCount += edge.evidence.size();

            auto stateKey =
                edge.toId + ":" + std::to_string(nextHop) + ":" + current.seed->entityId;
            if (visitedStates.insert(std::move(stateKey)).second) {
                queue.push_back({edge.toId, nextHop, current.seed});
            }
        }
    }

    std::vector<EntityGraphExpansionHit> hits;
    for (auto& acc : accumulators) {
        if (seedIds.count(acc.entityId) > 0) {
            continue;
        }
        auto nodeIt = nodesById_.find(acc.entityId);
        if (nodeIt == nodesById_.end()) {
            continue;
        }

        EntityGraphExpansionHit hit;
        hit.path = nodeIt->second.path;
        hit.title = nodeIt->second.canonicalName;
        hit.score = acc.score;
        hit.explanation.matchedEntities = std::move(acc.matchedEntities);
        hit.explanation.relationTypes = std::move(acc.relationTypes);
        hit.explanation.hopDepth = acc.hopDepth;
        hit.explanation.evidenceCount = acc.evidenceCount;
        hit.explanation.relationPaths = std::move(acc.relationPaths);
        hit.explanation.evidenceRefs = std::move(acc.evidenceRefs);
        hit.explanation.scoreContribution = acc.score;
        hits.push_back(std::move(hit));
    }

    std::stable_sort(hits.begin(), hits.end(),
                     [](const EntityGraphExpansionHit& a, const EntityGraphExpansionHit& b) {
                         return a.score > b.score;
                     });
    if (hits.size() > docLimit) {
        hits.resize(docLimit);
    }
    return hits;
}

std::optional<EntityNode> EntityGraphIndexManager::getNode(std::string_view entityId) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    auto it = nodesById_.find(std::string(entityId));
    if (it == nodesById_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<EntityEdge> EntityGraphIndexManager::getOutgoingEdges(std::string_view entityId) const {
    std::shared_lock<std::shared_mutex> lock(stateMutex_);
    std::vector<EntityEdge> edges;
    auto it = edgesByFrom_.find(std::string(entityId));
    if (it == edgesByFrom_.end()) {
        return edges;
    }
    edges.reserve(it->second.size());
    for (const auto& [_, edge] : it->second) {
        edges.push_back(edge);
    }
    return edges;
}

EntityGraphStats EntityGraphIndexManager::stats() const {
    EntityGraphStats out;
    {
        std::shared_lock<std::shared_mutex> lock(stateMutex_);
        out.nodes = nodesById_.size();
        out.aliases = aliasesToEntityIds_.size();
        out.edges = edgeCountLocked();
    }
    out.rebuilds = rebuildCount_.load(std::memory_order_relaxed);
    out.initialized = isInitialized();
    return out;
}

double EntityGraphIndexManager::relationWeight(RelationType relation) {
    switch (relation) {
        case RelationType::WikiLink:
            return 1.0;
        case RelationType::FrontmatterReference:
            return 0.95;
        case RelationType::SemanticFrontmatter:
            return 0.92;
        case RelationType::Backlink:
            return 0.9;
        case RelationType::SharedTag:
            return 0.7;
        case RelationType::HeadingCooccurrence:
            return 0.55;
    }
    return 0.5;
}

} // namespace loregraph::graph
