#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace loregraph::search {

/**
 * Retrieval unit handed to the answer/context layer.
 *
 * metadata is an open JSON object. Keys understood by the merge logic: path, chunkId, title,
 * score, rerank_score, explanation, entityEvidence.
 */
struct RetrievalDocument {
    std::string pageContent;
    nlohmann::json metadata = nlohmann::json::object();
};

inline void to_json(nlohmann::json& j, const RetrievalDocument& doc) {
    j = nlohmann::json{{"pageContent", doc.pageContent}, {"metadata", doc.metadata}};
}

inline void from_json(const nlohmann::json& j, RetrievalDocument& doc) {
    doc.pageContent = j.value("pageContent", std::string{});
    auto it = j.find("metadata");
    doc.metadata =
        (it != j.end() && it->is_object()) ? *it : nlohmann::json(nlohmann::json::object());
}

} // namespace loregraph::search
