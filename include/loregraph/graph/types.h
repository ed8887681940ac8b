#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loregraph::graph {

/**
 * Deterministic relation types extracted from document structure.
 */
enum class RelationType {
    WikiLink,
    Backlink,
    SharedTag,
    FrontmatterReference,
    HeadingCooccurrence,
    SemanticFrontmatter,
};

/**
 * Canonical semantic predicates for worldbuilding-oriented relationships.
 */
enum class SemanticPredicate {
    ParentOf,
    ChildOf,
    SiblingOf,
    SpouseOf,
    HouseOf,
    AlliedWith,
    RivalOf,
    Rules,
    RuledBy,
    VassalOf,
    OverlordOf,
    MemberOf,
    Leads,
    Founded,
    FoundedBy,
    LocatedIn,
    Governs,
    Borders,
    PartOf,
    ParticipatedIn,
    OccurredAt,
    DuringEra,
    Wields,
    BoundTo,
    ArtifactOf,
};

inline constexpr std::array<SemanticPredicate, 25> kAllSemanticPredicates = {
    SemanticPredicate::ParentOf,   SemanticPredicate::ChildOf,        SemanticPredicate::SiblingOf,
    SemanticPredicate::SpouseOf,   SemanticPredicate::HouseOf,        SemanticPredicate::AlliedWith,
    SemanticPredicate::RivalOf,    SemanticPredicate::Rules,          SemanticPredicate::RuledBy,
    SemanticPredicate::VassalOf,   SemanticPredicate::OverlordOf,     SemanticPredicate::MemberOf,
    SemanticPredicate::Leads,      SemanticPredicate::Founded,        SemanticPredicate::FoundedBy,
    SemanticPredicate::LocatedIn,  SemanticPredicate::Governs,        SemanticPredicate::Borders,
    SemanticPredicate::PartOf,     SemanticPredicate::ParticipatedIn, SemanticPredicate::OccurredAt,
    SemanticPredicate::DuringEra,  SemanticPredicate::Wields,         SemanticPredicate::BoundTo,
    SemanticPredicate::ArtifactOf,
};

const char* relationTypeName(RelationType relation) noexcept;
std::optional<RelationType> parseRelationType(std::string_view name) noexcept;

const char* semanticPredicateName(SemanticPredicate predicate) noexcept;

/**
 * Evidence pointer explaining where a relation was extracted from.
 */
struct EvidenceRef {
    std::string path;                   // Document that produced this evidence
    std::optional<std::string> chunkId; // Chunk-level anchor, "{path}#0" for structural signals
    std::int64_t mtime = 0;             // Source document mtime at extraction time
    RelationType extractor = RelationType::WikiLink;

    bool sameSource(const EvidenceRef& other) const {
        return path == other.path && chunkId == other.chunkId && extractor == other.extractor;
    }
};

/**
 * Canonical entity node derived from one document.
 */
struct EntityNode {
    std::string id; // Vault-relative document path
    std::string canonicalName;
    std::string type = "note";
    std::vector<std::string> aliases; // Normalized
    std::string path;
    std::int64_t mtime = 0;
    std::vector<std::string> tags; // Normalized
};

/**
 * Directed relation edge between two entity nodes.
 */
struct EntityEdge {
    std::string id; // "{from}|{relation}[:{predicate}]|{to}"
    std::string fromId;
    std::string toId;
    RelationType relation = RelationType::WikiLink;
    double confidence = 1.0; // [0.1, 1.0]
    std::optional<SemanticPredicate> semanticPredicate;
    std::vector<EvidenceRef> evidence;
};

/**
 * Entity matched from free-text query via alias lookup.
 */
struct ResolvedEntity {
    std::string entityId;
    std::string canonicalName;
    std::string matchedAlias;
    double score = 0.0;
};

/**
 * Per-document explanation of why graph expansion reached it.
 */
struct EntityGraphExplanation {
    std::vector<std::string> matchedEntities;
    std::vector<RelationType> relationTypes;
    int hopDepth = 0;
    std::size_t evidenceCount = 0;
    std::vector<std::string> relationPaths; // At most 6
    std::vector<EvidenceRef> evidenceRefs;  // At most 16, deduplicated
    double scoreContribution = 0.0;
};

struct EntityGraphExpansionHit {
    std::string path;
    std::string title;
    double score = 0.0;
    EntityGraphExplanation explanation;
};

// JSON conversions (used by the CLI and for retrieval explanation payloads)
void to_json(nlohmann::json& j, RelationType relation);
void from_json(const nlohmann::json& j, RelationType& relation);
void to_json(nlohmann::json& j, SemanticPredicate predicate);
void from_json(const nlohmann::json& j, SemanticPredicate& predicate);
void to_json(nlohmann::json& j, const EvidenceRef& ref);
void to_json(nlohmann::json& j, const EntityNode& node);
void to_json(nlohmann::json& j, const EntityEdge& edge);
void to_json(nlohmann::json& j, const ResolvedEntity& entity);
void to_json(nlohmann::json& j, const EntityGraphExplanation& explanation);
void to_json(nlohmann::json& j, const EntityGraphExpansionHit& hit);

} // namespace loregraph::graph
