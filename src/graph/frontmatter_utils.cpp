#include <loregraph/graph/frontmatter_utils.h>

#include <loregraph/common/pattern_utils.h>
#include <loregraph/graph/alias_utils.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <unordered_set>

namespace loregraph::graph {

namespace {

const std::regex& wikiLinkPattern() {
    static const std::regex kPattern(R"(\[\[([^\]|#]+)(?:#[^\]]+)?(?:\|[^\]]+)?\]\])");
    return kPattern;
}

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

// Insertion-ordered set of strings
class OrderedSet {
public:
    void add(std::string value) {
        if (seen_.insert(value).second) {
            items_.push_back(std::move(value));
        }
    }
    std::vector<std::string> take() { return std::move(items_); }

private:
    std::unordered_set<std::string> seen_;
    std::vector<std::string> items_;
};

template <typename StringVisitor>
void walkStrings(const nlohmann::json& value, bool descendObjects, StringVisitor&& onString) {
    switch (value.type()) {
        case nlohmann::json::value_t::string:
            onString(value.get_ref<const std::string&>());
            break;
        case nlohmann::json::value_t::array:
            for (const auto& item : value) {
                walkStrings(item, descendObjects, onString);
            }
            break;
        case nlohmann::json::value_t::object:
            if (descendObjects) {
                for (const auto& [_, item] : value.items()) {
                    walkStrings(item, descendObjects, onString);
                }
            }
            break;
        default:
            break;
    }
}

} // namespace

const std::array<FixedPredicateKey, 25>& fixedPredicateKeys() {
    static const std::array<FixedPredicateKey, 25> kKeys = {{
        {"parentOf", SemanticPredicate::ParentOf},
        {"childOf", SemanticPredicate::ChildOf},
        {"siblingOf", SemanticPredicate::SiblingOf},
        {"spouseOf", SemanticPredicate::SpouseOf},
        {"houseOf", SemanticPredicate::HouseOf},
        {"alliedWith", SemanticPredicate::AlliedWith},
        {"rivalOf", SemanticPredicate::RivalOf},
        {"rules", SemanticPredicate::Rules},
        {"ruledBy", SemanticPredicate::RuledBy},
        {"vassalOf", SemanticPredicate::VassalOf},
        {"overlordOf", SemanticPredicate::OverlordOf},
        {"memberOf", SemanticPredicate::MemberOf},
        {"leads", SemanticPredicate::Leads},
        {"founded", SemanticPredicate::Founded},
        {"foundedBy", SemanticPredicate::FoundedBy},
        {"locatedIn", SemanticPredicate::LocatedIn},
        {"governs", SemanticPredicate::Governs},
        {"borders", SemanticPredicate::Borders},
        {"partOf", SemanticPredicate::PartOf},
        {"participatedIn", SemanticPredicate::ParticipatedIn},
        {"occurredAt", SemanticPredicate::OccurredAt},
        {"duringEra", SemanticPredicate::DuringEra},
        {"wields", SemanticPredicate::Wields},
        {"boundTo", SemanticPredicate::BoundTo},
        {"artifactOf", SemanticPredicate::ArtifactOf},
    }};
    return kKeys;
}

bool isTruthy(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return false;
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float: {
            const double d = value.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        case nlohmann::json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        default:
            return true;
    }
}

const nlohmann::json* firstTruthyField(const nlohmann::json& object,
                                       std::initializer_list<std::string_view> keys) {
    if (!object.is_object()) {
        return nullptr;
    }
    for (auto key : keys) {
        auto it = object.find(std::string(key));
        if (it != object.end() && isTruthy(*it)) {
            return &*it;
        }
    }
    return nullptr;
}

std::optional<double> toNumber(const nlohmann::json* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    switch (value->type()) {
        case nlohmann::json::value_t::null:
            return 0.0;
        case nlohmann::json::value_t::boolean:
            return value->get<bool>() ? 1.0 : 0.0;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float: {
            const double d = value->get<double>();
            if (std::isnan(d)) {
                return std::nullopt;
            }
            return d;
        }
        case nlohmann::json::value_t::string: {
            const auto trimmed = std::string(common::trim(value->get_ref<const std::string&>()));
            if (trimmed.empty()) {
                return 0.0;
            }
            char* end = nullptr;
            const double d = std::strtod(trimmed.c_str(), &end);
            if (end != trimmed.c_str() + trimmed.size() || std::isnan(d)) {
                return std::nullopt;
            }
            return d;
        }
        default:
            return std::nullopt;
    }
}

std::vector<std::string> extractWikiLinkTargets(std::string_view text) {
    std::vector<std::string> targets;
    const std::string haystack(text);
    for (std::sregex_iterator it(haystack.begin(), haystack.end(), wikiLinkPattern()), end;
         it != end; ++it) {
        auto target = std::string(common::trim((*it)[1].str()));
        if (!target.empty()) {
            targets.push_back(std::move(target));
        }
    }
    return targets;
}

std::optional<std::string> unwrapWikiLink(std::string_view text) {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_match(text.begin(), text.end(), match, wikiLinkPattern())) {
        return std::nullopt;
    }
    return match[1].str();
}

std::vector<std::string> collectAliasValues(const nlohmann::json& value) {
    OrderedSet aliases;
    walkStrings(value, false, [&](const std::string& s) {
        auto normalized = normalizeAlias(s);
        if (!normalized.empty()) {
            aliases.add(std::move(normalized));
        }
    });
    return aliases.take();
}

std::vector<std::string> collectReferenceCandidates(const nlohmann::json& value) {
    OrderedSet candidates;
    walkStrings(value, true, [&](const std::string& s) {
        // Strings containing wiki-link syntax count only through their links
        if (std::regex_search(s, wikiLinkPattern())) {
            for (auto& target : extractWikiLinkTargets(s)) {
                candidates.add(std::move(target));
            }
            return;
        }
        auto trimmed = std::string(common::trim(s));
        if (!trimmed.empty() &&
            (trimmed.find('/') != std::string::npos || endsWith(trimmed, ".md"))) {
            candidates.add(std::move(trimmed));
        }
    });
    return candidates.take();
}

std::vector<std::string> collectTargetCandidates(const nlohmann::json& value) {
    OrderedSet candidates;
    walkStrings(value, true, [&](const std::string& s) {
        if (std::regex_search(s, wikiLinkPattern())) {
            for (auto& target : extractWikiLinkTargets(s)) {
                candidates.add(std::move(target));
            }
            return;
        }
        auto trimmed = std::string(common::trim(s));
        if (!trimmed.empty()) {
            candidates.add(std::move(trimmed));
        }
    });
    return candidates.take();
}

double normalizeConfidenceFraction(const nlohmann::json* value, int defaultPercent) {
    auto parsed = toNumber(value);
    double fraction = 0.0;
    if (!parsed) {
        fraction = static_cast<double>(defaultPercent) / 100.0;
    } else if (*parsed <= 1.0) {
        fraction = *parsed;
    } else {
        fraction = *parsed / 100.0;
    }
    return std::clamp(fraction, 0.1, 1.0);
}

int normalizeConfidencePercent(const nlohmann::json* value, int defaultPercent) {
    auto parsed = toNumber(value);
    if (!parsed) {
        return defaultPercent;
    }
    const double scaled = *parsed <= 1.0 ? std::floor(*parsed * 100.0) : std::floor(*parsed);
    return static_cast<int>(std::clamp(scaled, 0.0, 100.0));
}

std::vector<std::string> sanitizeFieldList(const std::vector<std::string>& fields) {
    std::vector<std::string> out;
    for (const auto& field : fields) {
        auto trimmed = std::string(common::trim(field));
        if (trimmed.empty()) {
            continue;
        }
        out.push_back(std::move(trimmed));
        if (out.size() >= kMaxConfiguredFields) {
            break;
        }
    }
    return out;
}

int clampMinimumConfidence(int configured) {
    return std::clamp(configured, 0, 100);
}

int clampBatchSize(int configured) {
    return std::clamp(configured, 5, 200);
}

} // namespace loregraph::graph
