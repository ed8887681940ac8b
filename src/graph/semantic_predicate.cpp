#include <loregraph/graph/semantic_predicate.h>

#include <nlohmann/json.hpp>

#include <cctype>
#include <unordered_map>

namespace loregraph::graph {

namespace {

const std::unordered_map<std::string, SemanticPredicate>& predicateAliasMap() {
    static const std::unordered_map<std::string, SemanticPredicate> kAliases = {
        {"parent", SemanticPredicate::ParentOf},
        {"child", SemanticPredicate::ChildOf},
        {"sibling", SemanticPredicate::SiblingOf},
        {"spouse", SemanticPredicate::SpouseOf},
        {"house", SemanticPredicate::HouseOf},
        {"ally", SemanticPredicate::AlliedWith},
        {"allies_with", SemanticPredicate::AlliedWith},
        {"rival", SemanticPredicate::RivalOf},
        {"enemy_of", SemanticPredicate::RivalOf},
        {"opposes", SemanticPredicate::RivalOf},
        {"locatedin", SemanticPredicate::LocatedIn},
        {"residesin", SemanticPredicate::LocatedIn},
        {"headquarteredin", SemanticPredicate::LocatedIn},
        {"operatesin", SemanticPredicate::LocatedIn},
        {"inhabits", SemanticPredicate::LocatedIn},
        {"serves", SemanticPredicate::MemberOf},
        {"atwarwith", SemanticPredicate::RivalOf},
        {"borderdisputewith", SemanticPredicate::Borders},
        {"sacredto", SemanticPredicate::BoundTo},
        {"storedin", SemanticPredicate::LocatedIn},
    };
    return kAliases;
}

const std::unordered_map<std::string, SemanticPredicate>& canonicalMap() {
    static const std::unordered_map<std::string, SemanticPredicate> kCanonical = [] {
        std::unordered_map<std::string, SemanticPredicate> m;
        for (auto p : kAllSemanticPredicates) {
            m.emplace(semanticPredicateName(p), p);
        }
        return m;
    }();
    return kCanonical;
}

bool isLowerOrDigit(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

} // namespace

std::string normalizePredicateKey(std::string_view value) {
    // trim
    size_t b = 0;
    size_t e = value.size();
    while (b < e && std::isspace(static_cast<unsigned char>(value[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(value[e - 1])))
        --e;
    value = value.substr(b, e - b);

    // camelCase split, then lowercase
    std::string split;
    split.reserve(value.size() + 8);
    for (size_t i = 0; i < value.size(); ++i) {
        const auto c = static_cast<unsigned char>(value[i]);
        const bool upper = c >= 'A' && c <= 'Z';
        if (i > 0 && upper && isLowerOrDigit(static_cast<unsigned char>(value[i - 1]))) {
            split.push_back('_');
        }
        split.push_back(static_cast<char>(std::tolower(c)));
    }

    // non [a-z0-9_] runs -> '_', collapse repeated '_'
    std::string out;
    out.reserve(split.size());
    for (char ch : split) {
        const auto c = static_cast<unsigned char>(ch);
        const char mapped = (isLowerOrDigit(c) || c == '_') ? ch : '_';
        if (mapped == '_' && !out.empty() && out.back() == '_')
            continue;
        out.push_back(mapped);
    }

    size_t start = 0;
    while (start < out.size() && out[start] == '_')
        ++start;
    size_t end = out.size();
    while (end > start && out[end - 1] == '_')
        --end;
    return out.substr(start, end - start);
}

std::optional<SemanticPredicate> parseSemanticPredicate(std::string_view value) {
    const auto key = normalizePredicateKey(value);
    if (key.empty()) {
        return std::nullopt;
    }
    if (auto it = canonicalMap().find(key); it != canonicalMap().end()) {
        return it->second;
    }
    if (auto it = predicateAliasMap().find(key); it != predicateAliasMap().end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<SemanticPredicate> parsePredicateValue(const nlohmann::json& value) {
    if (!value.is_string()) {
        return std::nullopt;
    }
    return parseSemanticPredicate(std::string_view(value.get_ref<const std::string&>()));
}

bool isCanonicalPredicateName(std::string_view value) {
    return canonicalMap().find(std::string(value)) != canonicalMap().end();
}

} // namespace loregraph::graph
