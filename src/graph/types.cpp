#include <loregraph/graph/types.h>

#include <stdexcept>

namespace loregraph::graph {

const char* relationTypeName(RelationType relation) noexcept {
    switch (relation) {
        case RelationType::WikiLink:
            return "wiki_link";
        case RelationType::Backlink:
            return "backlink";
        case RelationType::SharedTag:
            return "shared_tag";
        case RelationType::FrontmatterReference:
            return "frontmatter_reference";
        case RelationType::HeadingCooccurrence:
            return "heading_cooccurrence";
        case RelationType::SemanticFrontmatter:
            return "semantic_frontmatter";
    }
    return "unknown";
}

std::optional<RelationType> parseRelationType(std::string_view name) noexcept {
    for (auto r : {RelationType::WikiLink, RelationType::Backlink, RelationType::SharedTag,
                   RelationType::FrontmatterReference, RelationType::HeadingCooccurrence,
                   RelationType::SemanticFrontmatter}) {
        if (name == relationTypeName(r)) {
            return r;
        }
    }
    return std::nullopt;
}

const char* semanticPredicateName(SemanticPredicate predicate) noexcept {
    switch (predicate) {
        case SemanticPredicate::ParentOf: return "parent_of";
        case SemanticPredicate::ChildOf: return "child_of";
        case SemanticPredicate::SiblingOf: return "sibling_of";
        case SemanticPredicate::SpouseOf: return "spouse_of";
        case SemanticPredicate::HouseOf: return "house_of";
        case SemanticPredicate::AlliedWith: return "allied_with";
        case SemanticPredicate::RivalOf: return "rival_of";
        case SemanticPredicate::Rules: return "rules";
        case SemanticPredicate::RuledBy: return "ruled_by";
        case SemanticPredicate::VassalOf: return "vassal_of";
        case SemanticPredicate::OverlordOf: return "overlord_of";
        case SemanticPredicate::MemberOf: return "member_of";
        case SemanticPredicate::Leads: return "leads";
        case SemanticPredicate::Founded: return "founded";
        case SemanticPredicate::FoundedBy: return "founded_by";
        case SemanticPredicate::LocatedIn: return "located_in";
        case SemanticPredicate::Governs: return "governs";
        case SemanticPredicate::Borders: return "borders";
        case SemanticPredicate::PartOf: return "part_of";
        case SemanticPredicate::ParticipatedIn: return "participated_in";
        case SemanticPredicate::OccurredAt: return "occurred_at";
        case SemanticPredicate::DuringEra: return "during_era";
        case SemanticPredicate::Wields: return "wields";
        case SemanticPredicate::BoundTo: return "bound_to";
        case SemanticPredicate::ArtifactOf: return "artifact_of";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, RelationType relation) {
    j = relationTypeName(relation);
}

void from_json(const nlohmann::json& j, RelationType& relation) {
    auto parsed = parseRelationType(j.get<std::string>());
    if (!parsed) {
        throw std::invalid_argument("unknown relation type: " + j.get<std::string>());
    }
    relation = *parsed;
}

void to_json(nlohmann::json& j, SemanticPredicate predicate) {
    j = semanticPredicateName(predicate);
}

void from_json(const nlohmann::json& j, SemanticPredicate& predicate) {
    const auto name = j.get<std::string>();
    for (auto p : kAllSemanticPredicates) {
        if (name == semanticPredicateName(p)) {
            predicate = p;
            return;
        }
    }
    throw std::invalid_argument("unknown semantic predicate: " + name);
}

void to_json(nlohmann::json& j, const EvidenceRef& ref) {
    j = nlohmann::json{{"path", ref.path}, {"mtime", ref.mtime}, {"extractor", ref.extractor}};
    if (ref.chunkId) {
        j["chunkId"] = *ref.chunkId;
    }
}

void to_json(nlohmann::json& j, const EntityNode& node) {
    j = nlohmann::json{{"id", node.id},       {"canonicalName", node.canonicalName},
                       {"type", node.type},   {"aliases", node.aliases},
                       {"path", node.path},   {"mtime", node.mtime},
                       {"tags", node.tags}};
}

void to_json(nlohmann::json& j, const EntityEdge& edge) {
    j = nlohmann::json{{"id", edge.id},
                       {"fromId", edge.fromId},
                       {"toId", edge.toId},
                       {"relation", edge.relation},
                       {"confidence", edge.confidence},
                       {"evidence", edge.evidence}};
    if (edge.semanticPredicate) {
        j["semanticPredicate"] = *edge.semanticPredicate;
    }
}

void to_json(nlohmann::json& j, const ResolvedEntity& entity) {
    j = nlohmann::json{{"entityId", entity.entityId},
                       {"canonicalName", entity.canonicalName},
                       {"matchedAlias", entity.matchedAlias},
                       {"score", entity.score}};
}

void to_json(nlohmann::json& j, const EntityGraphExplanation& explanation) {
    j = nlohmann::json{{"matchedEntities", explanation.matchedEntities},
                       {"relationTypes", explanation.relationTypes},
                       {"hopDepth", explanation.hopDepth},
                       {"evidenceCount", explanation.evidenceCount},
                       {"relationPaths", explanation.relationPaths},
                       {"evidenceRefs", explanation.evidenceRefs},
                       {"scoreContribution", explanation.scoreContribution}};
}

void to_json(nlohmann::json& j, const EntityGraphExpansionHit& hit) {
    j = nlohmann::json{{"path", hit.path},
                       {"title", hit.title},
                       {"score", hit.score},
                       {"explanation", hit.explanation}};
}

} // namespace loregraph::graph
