#include <loregraph/search/entity_graph_retriever.h>

#include <loregraph/graph/frontmatter_utils.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <initializer_list>
#include <unordered_map>

namespace loregraph::search {

namespace {

constexpr std::size_t kContentKeyPrefix = 64;

bool hasMarkdownExtension(std::string_view path) {
    return path.size() >= 3 && path.substr(path.size() - 3) == ".md";
}

bool isBlank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

int firstNonZero(std::initializer_list<int> values) {
    for (int v : values) {
        if (v != 0) {
            return v;
        }
    }
    return 0;
}

bool metadataFlag(const nlohmann::json& metadata, const char* key) {
    if (!metadata.is_object()) {
        return false;
    }
    auto it = metadata.find(key);
    return it != metadata.end() && graph::isTruthy(*it);
}

nlohmann::json matchedEntityNames(const std::vector<graph::ResolvedEntity>& resolved) {
    auto names = nlohmann::json::array();
    for (const auto& entity : resolved) {
        names.push_back(entity.canonicalName);
    }
    return names;
}

// Shallow merge of two explanation payloads; the incoming entityGraph section wins when present.
nlohmann::json mergeExplanations(const nlohmann::json* current, const nlohmann::json* incoming) {
    const auto currentObj = (current && current->is_object()) ? *current : nlohmann::json::object();
    const auto incomingObj =
        (incoming && incoming->is_object()) ? *incoming : nlohmann::json::object();

    const nlohmann::json* entityGraph = nullptr;
    if (auto it = incomingObj.find("entityGraph");
        it != incomingObj.end() && graph::isTruthy(*it)) {
        entityGraph = &*it;
    } else if (auto cit = currentObj.find("entityGraph");
               cit != currentObj.end() && graph::isTruthy(*cit)) {
        entityGraph = &*cit;
    }

    auto merged = currentObj;
    merged.update(incomingObj);
    if (entityGraph) {
        merged["entityGraph"] = *entityGraph;
    }
    return merged;
}

const nlohmann::json* findMember(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    return it == object.end() ? nullptr : &*it;
}

} // namespace

EntityGraphRetriever::EntityGraphRetriever(graph::EntityGraphIndexManager& index,
                                           host::DocumentStore& store,
                                           host::ChunkProvider& chunks,
                                           config::SettingsStore& settings)
    : index_(index), store_(store), chunks_(chunks), settings_(settings) {}

EntityGraphAugmentationResult
EntityGraphRetriever::augmentDocuments(std::string_view query,
                                       const std::vector<RetrievalDocument>& baseDocuments,
                                       const EntityGraphAugmentationOptions& options) {
    const auto settings = settings_.get();

    EntityGraphAugmentationResult passthrough;
    passthrough.documents = baseDocuments;
    if (!settings.enableEntityGraphRetrieval) {
        return passthrough;
    }

    std::vector<graph::ResolvedEntity> resolved;
    try {
        resolved = index_.resolveEntities(query);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to resolve query entities: {}", e.what());
    }
    if (resolved.empty()) {
        return passthrough;
    }

    const int maxHops =
        std::max(1, firstNonZero({options.maxHops, settings.entityGraphMaxHops, 2}));
    const int maxExpandedDocs = std::max(
        1, firstNonZero({options.maxExpandedDocs, settings.entityGraphMaxExpandedDocs, 12}));

    const auto hits = index_.expandFromResolvedEntities(resolved, maxHops, maxExpandedDocs);
    const auto graphDocuments = buildGraphEvidenceDocuments(hits);

    EntityGraphAugmentationResult result;
    result.documents = mergeDocuments(baseDocuments, graphDocuments, resolved);
    result.entityQueryMode = true;
    result.hasEntityEvidence =
        std::any_of(result.documents.begin(), result.documents.end(),
                    [](const RetrievalDocument& doc) {
                        return metadataFlag(doc.metadata, "entityEvidence");
                    });

    if (settings.debug) {
        spdlog::info("Entity graph augmentation: resolved={} expansionHits={} merged={}",
                     resolved.size(), hits.size(), result.documents.size());
    }

    result.resolvedEntities = std::move(resolved);
    return result;
}

std::vector<RetrievalDocument> EntityGraphRetriever::buildGraphEvidenceDocuments(
    const std::vector<graph::EntityGraphExpansionHit>& hits) {
    std::vector<RetrievalDocument> documents;

    for (const auto& hit : hits) {
        auto info = store_.getDocument(hit.path);
        if (!info || !hasMarkdownExtension(info->path)) {
            continue;
        }

        try {
            auto chunks = chunks_.getChunks(info->path);
            if (!chunks) {
                spdlog::warn("Failed to chunk {}: {}", info->path, chunks.error().message);
                continue;
            }

            const host::RetrievalChunk* topChunk =
                chunks.value().empty() ? nullptr : &chunks.value().front();
            std::string pageContent;
            if (topChunk && !topChunk->content.empty()) {
                pageContent = topChunk->content;
            } else {
                auto content = store_.readContent(info->path);
                if (!content) {
                    spdlog::warn("Failed to read {}: {}", info->path, content.error().message);
                    continue;
                }
                pageContent = std::move(content).value();
            }

            if (pageContent.empty() || isBlank(pageContent)) {
                continue;
            }

            RetrievalDocument doc;
            doc.pageContent = std::move(pageContent);
            auto& meta = doc.metadata;
            meta["path"] = info->path;
            if (topChunk) {
                meta["chunkId"] = topChunk->id;
            }
            meta["title"] = info->basename;
            meta["mtime"] = info->mtime;
            meta["ctime"] = info->ctime;
            meta["score"] = hit.score;
            meta["rerank_score"] = hit.score;
            meta["engine"] = "entity-graph";
            meta["includeInContext"] = true;
            meta["explanation"] = {{"entityGraph", hit.explanation},
                                   {"baseScore", hit.score},
                                   {"finalScore", hit.score}};
            meta["entityEvidence"] = true;
            meta["isChunk"] = topChunk != nullptr;
            documents.push_back(std::move(doc));
        } catch (const std::exception& e) {
            spdlog::warn("Failed to build graph document for {}: {}", hit.path, e.what());
        }
    }

    return documents;
}

std::vector<RetrievalDocument>
EntityGraphRetriever::mergeDocuments(const std::vector<RetrievalDocument>& baseDocuments,
                                     const std::vector<RetrievalDocument>& graphDocuments,
                                     const std::vector<graph::ResolvedEntity>& resolved) const {
    const auto matched = matchedEntityNames(resolved);

    std::vector<RetrievalDocument> merged;
    std::unordered_map<std::string, std::size_t> positions;

    auto upsert = [&](const RetrievalDocument& doc, bool fromGraph) {
        const auto key = documentKey(doc);
        auto found = positions.find(key);
        if (found == positions.end()) {
            RetrievalDocument entry = doc;
            if (!entry.metadata.is_object()) {
                entry.metadata = nlohmann::json::object();
            }
            entry.metadata["entityQueryMode"] = true;
            entry.metadata["entityEvidence"] =
                fromGraph || metadataFlag(doc.metadata, "entityEvidence");
            entry.metadata["matchedEntities"] = matched;
            positions.emplace(key, merged.size());
            merged.push_back(std::move(entry));
            return;
        }

        auto& existing = merged[found->second];
        const bool incomingWins = documentScore(doc) > documentScore(existing);
        const auto& winner = incomingWins ? doc : existing;

        auto explanation = mergeExplanations(findMember(existing.metadata, "explanation"),
                                             findMember(doc.metadata, "explanation"));
        const bool evidence = metadataFlag(existing.metadata, "entityEvidence") ||
                              metadataFlag(doc.metadata, "entityEvidence");

        RetrievalDocument next;
        next.pageContent = winner.pageContent;
        next.metadata = winner.metadata.is_object() ? winner.metadata : nlohmann::json::object();
        next.metadata["explanation"] = std::move(explanation);
        next.metadata["entityQueryMode"] = true;
        next.metadata["entityEvidence"] = evidence;
        next.metadata["matchedEntities"] = matched;
        existing = std::move(next);
    };

    for (const auto& doc : baseDocuments) {
        upsert(doc, false);
    }
    for (const auto& doc : graphDocuments) {
        upsert(doc, true);
    }

    std::stable_sort(merged.begin(), merged.end(),
                     [](const RetrievalDocument& a, const RetrievalDocument& b) {
                         return documentScore(a) > documentScore(b);
                     });
    return merged;
}

double EntityGraphRetriever::documentScore(const RetrievalDocument& doc) {
    for (const char* key : {"rerank_score", "score"}) {
        const auto* value = findMember(doc.metadata, key);
        if (value && value->is_number()) {
            const double score = value->get<double>();
            if (score != 0.0 && !std::isnan(score)) {
                return std::isfinite(score) ? score : 0.0;
            }
        }
    }
    return 0.0;
}

std::string EntityGraphRetriever::documentKey(const RetrievalDocument& doc) {
    for (const char* key : {"chunkId", "path", "title"}) {
        const auto* value = findMember(doc.metadata, key);
        if (value && graph::isTruthy(*value)) {
            return value->is_string() ? value->get<std::string>() : value->dump();
        }
    }
    return doc.pageContent.substr(0, kContentKeyPrefix);
}

} // namespace loregraph::search
