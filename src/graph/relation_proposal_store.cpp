#include <loregraph/graph/relation_proposal_store.h>

#include <loregraph/common/pattern_utils.h>
#include <loregraph/graph/frontmatter_utils.h>
#include <loregraph/graph/semantic_predicate.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <deque>
#include <optional>

namespace loregraph::graph {

namespace {

constexpr std::string_view kToolCallMarker = "submitSemanticRelationProposals";

std::string proposalKey(const SemanticRelationProposal& p) {
    return p.notePath + "|" + p.predicate + "|" + p.targetPath;
}

void replaceAll(std::string& s, std::string_view from, std::string_view to) {
    for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
        s.replace(pos, from.size(), to);
    }
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

// Percent-decoding; nullopt on a malformed escape.
std::optional<std::string> urlDecode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') {
            out.push_back(s[i]);
            continue;
        }
        if (i + 2 >= s.size()) {
            return std::nullopt;
        }
        const int hi = hexValue(s[i + 1]);
        const int lo = hexValue(s[i + 2]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

std::optional<nlohmann::json> parseJson(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

// Lenient JSON parse: raw text, "ENC:" URL-encoded payloads, and backslash-escaped renderings.
std::optional<nlohmann::json> tryParseJsonPayload(std::string_view value) {
    const auto trimmed = std::string(common::trim(value));
    if (trimmed.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> attempts{trimmed};
    if (trimmed.rfind("ENC:", 0) == 0) {
        if (auto decoded = urlDecode(std::string_view(trimmed).substr(4))) {
            attempts.push_back(std::move(*decoded));
        }
    }

    for (const auto& attempt : attempts) {
        if (auto parsed = parseJson(attempt)) {
            return parsed;
        }
        std::string unescaped = attempt;
        replaceAll(unescaped, "\\\"", "\"");
        replaceAll(unescaped, "\\n", "\n");
        replaceAll(unescaped, "\\t", "\t");
        replaceAll(unescaped, "\\r", "\r");
        if (unescaped != attempt) {
            if (auto parsed = parseJson(unescaped)) {
                return parsed;
            }
        }
    }
    return std::nullopt;
}

// Balanced {...} or [...] starting at `start`, honoring JSON string quoting; empty if unclosed.
std::string extractBalancedJson(std::string_view text, size_t start) {
    const char opening = text[start];
    const char closing = opening == '{' ? '}' : opening == '[' ? ']' : '\0';
    if (closing == '\0') {
        return {};
    }

    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (size_t i = start; i < text.size(); ++i) {
        const char c = text[i];
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                inString = false;
            }
            continue;
        }
        if (c == '"') {
            inString = true;
        } else if (c == opening) {
            ++depth;
        } else if (c == closing) {
            if (--depth == 0) {
                return std::string(text.substr(start, i - start + 1));
            }
        }
    }
    return {};
}

std::vector<nlohmann::json> extractEmbeddedJson(std::string_view text) {
    std::vector<nlohmann::json> found;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '{' && text[i] != '[') {
            continue;
        }
        const auto fragment = extractBalancedJson(text, i);
        if (fragment.empty()) {
            continue;
        }
        if (auto parsed = tryParseJsonPayload(fragment)) {
            found.push_back(std::move(*parsed));
        }
    }
    return found;
}

std::vector<nlohmann::json> extractToolCallPayloads(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::string marker(kToolCallMarker);
    std::transform(marker.begin(), marker.end(), marker.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::vector<nlohmann::json> found;
    for (size_t pos = lowered.find(marker); pos != std::string::npos;
         pos = lowered.find(marker, pos + marker.size())) {
        const auto start = text.find_first_of("{[", pos + marker.size());
        if (start == std::string_view::npos) {
            continue;
        }
        const auto fragment = extractBalancedJson(text, start);
        if (fragment.empty()) {
            continue;
        }
        if (auto parsed = tryParseJsonPayload(fragment)) {
            found.push_back(std::move(*parsed));
        }
    }
    return found;
}

bool hasStringField(const nlohmann::json& object, std::initializer_list<const char*> keys) {
    return std::any_of(keys.begin(), keys.end(), [&](const char* key) {
        auto it = object.find(key);
        return it != object.end() && it->is_string();
    });
}

bool isProposalLike(const nlohmann::json& value) {
    return value.is_object() && hasStringField(value, {"predicate", "relation"}) &&
           hasStringField(value, {"target", "targetPath", "to"}) &&
           hasStringField(value, {"notePath", "sourcePath", "path", "fromPath"});
}

std::vector<nlohmann::json> collectProposalCandidates(const nlohmann::json& payload) {
    static const char* const kArrayKeys[] = {"semanticRelationProposals",
                                             "semantic_relations",
                                             "relationProposals",
                                             "relations",
                                             "proposals",
                                             "items"};
    static const char* const kNestedKeys[] = {"data", "result", "payload"};

    std::deque<nlohmann::json> queue{payload};
    std::vector<nlohmann::json> collected;

    while (!queue.empty()) {
        const auto current = std::move(queue.front());
        queue.pop_front();

        if (current.is_string()) {
            const auto& text = current.get_ref<const std::string&>();
            if (auto parsed = tryParseJsonPayload(text)) {
                queue.push_back(std::move(*parsed));
            }
            for (auto& embedded : extractEmbeddedJson(text)) {
                queue.push_back(std::move(embedded));
            }
            for (auto& call : extractToolCallPayloads(text)) {
                queue.push_back(std::move(call));
            }
            continue;
        }

        if (current.is_array()) {
            for (const auto& item : current) {
                if (isProposalLike(item)) {
                    collected.push_back(item);
                }
            }
            continue;
        }

        if (!current.is_object()) {
            continue;
        }

        for (const char* key : kArrayKeys) {
            auto it = current.find(key);
            if (it != current.end() && it->is_array()) {
                queue.push_back(*it);
            }
        }
        for (const char* key : kNestedKeys) {
            auto it = current.find(key);
            if (it != current.end() && (it->is_object() || it->is_array())) {
                queue.push_back(*it);
            }
        }
    }
    return collected;
}

// "[[Folder/Note#Section|alias]]" -> "Folder/Note.md"
std::string normalizePathField(const nlohmann::json* value) {
    if (value == nullptr || !value->is_string()) {
        return {};
    }
    const auto trimmed = std::string(common::trim(value->get_ref<const std::string&>()));
    if (trimmed.empty()) {
        return {};
    }

    std::string core = unwrapWikiLink(trimmed).value_or(trimmed);
    core = core.substr(0, core.find('#'));
    core = std::string(common::trim(core.substr(0, core.find('|'))));
    if (core.empty()) {
        return {};
    }
    if (core.size() < 3 || core.compare(core.size() - 3, 3, ".md") != 0) {
        core += ".md";
    }
    return core;
}

std::optional<double> normalizeProposalConfidence(const nlohmann::json* value) {
    auto parsed = toNumber(value);
    if (!parsed) {
        return std::nullopt;
    }
    const double scaled = *parsed <= 1.0 ? std::floor(*parsed * 100.0) : std::floor(*parsed);
    return std::clamp(scaled, 0.0, 100.0);
}

std::optional<SemanticRelationProposal> normalizeCandidate(const nlohmann::json& record) {
    if (!record.is_object()) {
        return std::nullopt;
    }

    SemanticRelationProposal proposal;
    proposal.notePath = normalizePathField(
        firstTruthyField(record, {"notePath", "sourcePath", "path", "fromPath", "from"}));
    proposal.targetPath =
        normalizePathField(firstTruthyField(record, {"targetPath", "target", "to", "entity"}));
    const auto* predicateValue = firstTruthyField(record, {"predicate", "relation", "type"});
    std::optional<SemanticPredicate> predicate;
    if (predicateValue) {
        predicate = parsePredicateValue(*predicateValue);
    }
    if (proposal.notePath.empty() || proposal.targetPath.empty() || !predicate) {
        return std::nullopt;
    }
    proposal.predicate = semanticPredicateName(*predicate);

    auto confidenceIt = record.find("confidence");
    proposal.confidence =
        normalizeProposalConfidence(confidenceIt != record.end() ? &*confidenceIt : nullptr);

    if (auto it = record.find("sourceField"); it != record.end() && it->is_string()) {
        auto field = std::string(common::trim(it->get_ref<const std::string&>()));
        if (!field.empty()) {
            proposal.sourceField = std::move(field);
        }
    }
    return proposal;
}

// Later entries replace earlier ones unless strictly less confident; first position is kept.
void mergeProposal(std::vector<SemanticRelationProposal>& ordered,
                   std::unordered_map<std::string, std::size_t>& positions,
                   SemanticRelationProposal proposal) {
    auto [it, inserted] = positions.emplace(proposalKey(proposal), ordered.size());
    if (inserted) {
        ordered.push_back(std::move(proposal));
        return;
    }
    auto& existing = ordered[it->second];
    if (proposal.confidence.value_or(0.0) >= existing.confidence.value_or(0.0)) {
        existing = std::move(proposal);
    }
}

} // namespace

std::vector<SemanticRelationProposal> extractProposalsFromPayload(const nlohmann::json& payload) {
    std::vector<SemanticRelationProposal> ordered;
    std::unordered_map<std::string, std::size_t> positions;
    for (const auto& candidate : collectProposalCandidates(payload)) {
        if (auto normalized = normalizeCandidate(candidate)) {
            mergeProposal(ordered, positions, std::move(*normalized));
        }
    }
    return ordered;
}

std::vector<SemanticRelationProposal> extractProposalsFromText(std::string_view text) {
    return extractProposalsFromPayload(nlohmann::json(std::string(text)));
}

std::size_t RelationProposalStore::ingestFromToolOutput(std::string_view toolName,
                                                        const nlohmann::json& payload) {
    const auto extracted = extractProposalsFromPayload(payload);
    const auto accepted = ingestProposals(extracted, "tool:" + std::string(toolName));
    if (accepted > 0) {
        spdlog::debug("Captured {} semantic relation proposal(s) from tool {}", accepted,
                      toolName);
    }
    return accepted;
}

std::size_t RelationProposalStore::ingestProposals(
    const std::vector<SemanticRelationProposal>& proposals, std::string_view defaultSourceField) {
    if (proposals.empty()) {
        return 0;
    }

    std::vector<SemanticRelationProposal> batch;
    std::unordered_map<std::string, std::size_t> positions;
    for (const auto& proposal : proposals) {
        nlohmann::json record{{"notePath", proposal.notePath},
                              {"predicate", proposal.predicate},
                              {"targetPath", proposal.targetPath}};
        if (proposal.confidence) {
            record["confidence"] = *proposal.confidence;
        }
        if (proposal.sourceField) {
            record["sourceField"] = *proposal.sourceField;
        }
        auto normalized = normalizeCandidate(record);
        if (!normalized) {
            continue;
        }
        if (!normalized->sourceField) {
            normalized->sourceField = std::string(defaultSourceField);
        }
        mergeProposal(batch, positions, std::move(*normalized));
    }

    if (batch.empty()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t accepted = 0;
    for (auto& proposal : batch) {
        auto key = proposalKey(proposal);
        auto it = proposals_.find(key);
        if (it == proposals_.end()) {
            order_.push_back(key);
            proposals_.emplace(std::move(key), std::move(proposal));
            ++accepted;
        } else if (proposal.confidence.value_or(0.0) >= it->second.confidence.value_or(0.0)) {
            it->second = std::move(proposal);
            ++accepted;
        }
    }
    enforceCapacityLocked();
    return accepted;
}

std::vector<SemanticRelationProposal>
RelationProposalStore::extractFromPayload(const nlohmann::json& payload) const {
    return extractProposalsFromPayload(payload);
}

std::vector<SemanticRelationProposal> RelationProposalStore::getAllProposals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SemanticRelationProposal> out;
    out.reserve(order_.size());
    for (const auto& key : order_) {
        out.push_back(proposals_.at(key));
    }
    return out;
}

void RelationProposalStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    proposals_.clear();
}

std::size_t RelationProposalStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposals_.size();
}

void RelationProposalStore::enforceCapacityLocked() {
    if (order_.size() <= kMaxStoredProposals) {
        return;
    }
    const auto excess = order_.size() - kMaxStoredProposals;
    for (std::size_t i = 0; i < excess; ++i) {
        proposals_.erase(order_[i]);
    }
    order_.erase(order_.begin(), order_.begin() + static_cast<std::ptrdiff_t>(excess));
}

ProposalSourceAdapter makeToolOutputProposalAdapter(const RelationProposalStore& store) {
    ProposalSourceAdapter adapter;
    adapter.id = "tool-output-semantic-relations";
    adapter.label = "Tool Output Proposals";
    adapter.getProposals = [&store]() { return store.getAllProposals(); };
    return adapter;
}

} // namespace loregraph::graph
