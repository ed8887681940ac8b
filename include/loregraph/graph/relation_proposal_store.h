#pragma once

#include <loregraph/graph/semantic_relation_batch_service.h>

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace loregraph::graph {

// Oldest proposals are evicted beyond this size
inline constexpr std::size_t kMaxStoredProposals = 2000;

/**
 * Extract relation proposals from an untrusted tool or model payload.
 *
 * Walks the payload breadth-first. Strings are parsed as JSON (including "ENC:"-prefixed
 * URL-encoded and backslash-escaped variants), scanned for embedded JSON objects/arrays and for
 * `submitSemanticRelationProposals` tool-call renderings. Objects are searched under
 * semanticRelationProposals / semantic_relations / relationProposals / relations / proposals /
 * items arrays and data / result / payload wrappers.
 *
 * Returned proposals have ".md" paths, a canonical predicate and a 0-100 confidence when one was
 * given; duplicates (note, predicate, target) keep the later entry unless it is less confident.
 * Never throws on malformed input.
 */
std::vector<SemanticRelationProposal> extractProposalsFromPayload(const nlohmann::json& payload);

// Same as above for raw text.
std::vector<SemanticRelationProposal> extractProposalsFromText(std::string_view text);

/**
 * Session-scoped buffer of relation proposals captured from tool outputs.
 *
 * Thread-safe. Proposals keep their first-insertion order; replacing a proposal keeps its
 * position.
 */
class RelationProposalStore {
public:
    RelationProposalStore() = default;

    RelationProposalStore(const RelationProposalStore&) = delete;
    RelationProposalStore& operator=(const RelationProposalStore&) = delete;

    // Extract and store proposals from one tool result. Returns the number accepted.
    std::size_t ingestFromToolOutput(std::string_view toolName, const nlohmann::json& payload);

    /**
     * Normalize and store explicit proposals. Proposals without a source field get
     * defaultSourceField. An existing proposal is replaced only when the new one is at least as
     * confident. Returns the number accepted (inserted or replaced).
     */
    std::size_t ingestProposals(const std::vector<SemanticRelationProposal>& proposals,
                                std::string_view defaultSourceField);

    // Stateless extraction, see extractProposalsFromPayload().
    std::vector<SemanticRelationProposal> extractFromPayload(const nlohmann::json& payload) const;

    std::vector<SemanticRelationProposal> getAllProposals() const;
    void clear();
    std::size_t size() const;

private:
    void enforceCapacityLocked();

    mutable std::mutex mutex_;
    std::vector<std::string> order_; // Keys in first-insertion order
    std::unordered_map<std::string, SemanticRelationProposal> proposals_;
};

// Adapter exposing the store's contents to SemanticRelationBatchService.
ProposalSourceAdapter makeToolOutputProposalAdapter(const RelationProposalStore& store);

} // namespace loregraph::graph
