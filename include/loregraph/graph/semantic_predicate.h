#pragma once

#include <loregraph/graph/types.h>

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace loregraph::graph {

/**
 * Normalize a raw predicate spelling into a lookup key:
 * camelCase boundaries become '_', everything is lowercased, runs of other characters collapse
 * into a single '_', and leading/trailing '_' are removed.
 *
 *   "alliedWith" -> "allied_with", " Located In " -> "located_in", "--" -> ""
 */
std::string normalizePredicateKey(std::string_view value);

/**
 * Parse a free-form predicate into its canonical value. Accepts canonical names in any casing or
 * separator style plus a fixed alias table ("ally", "enemy_of", "residesIn", ...).
 */
std::optional<SemanticPredicate> parseSemanticPredicate(std::string_view value);

// Predicate taken from a loosely typed front matter or payload value; non-strings never parse.
std::optional<SemanticPredicate> parsePredicateValue(const nlohmann::json& value);

// True only for the exact canonical spelling ("allied_with").
bool isCanonicalPredicateName(std::string_view value);

} // namespace loregraph::graph
