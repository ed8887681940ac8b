#pragma once

#include <loregraph/graph/types.h>

#include <nlohmann/json.hpp>

#include <array>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loregraph::graph {

// Cap applied to configured alias and relation field lists
inline constexpr std::size_t kMaxConfiguredFields = 24;

/**
 * Convenience front-matter keys that carry one predicate implicitly, e.g. `alliedWith: [[Lira]]`.
 */
struct FixedPredicateKey {
    const char* field;
    SemanticPredicate predicate;
};

const std::array<FixedPredicateKey, 25>& fixedPredicateKeys();

// Truthiness of a loosely-typed front-matter value (null, false, 0, "" are falsy).
bool isTruthy(const nlohmann::json& value);

/**
 * First truthy member of an object among `keys`, in order; nullptr if none.
 * Mirrors `record.a || record.b || ...` on hand-written YAML.
 */
const nlohmann::json* firstTruthyField(const nlohmann::json& object,
                                       std::initializer_list<std::string_view> keys);

/**
 * Numeric reading of a value: numbers as-is, booleans as 0/1, null and blank strings as 0,
 * numeric strings parsed. Absent values, objects, arrays and non-numeric strings yield nullopt.
 */
std::optional<double> toNumber(const nlohmann::json* value);

// Targets of every `[[target#section|display]]` occurrence, section and display stripped.
std::vector<std::string> extractWikiLinkTargets(std::string_view text);

// Link target when the whole string is one wiki link ("[[Lira#Early life|her]]" -> "Lira").
std::optional<std::string> unwrapWikiLink(std::string_view text);

// Normalized aliases from a string or (nested) array of strings.
std::vector<std::string> collectAliasValues(const nlohmann::json& value);

/**
 * Link-like reference candidates anywhere in a front-matter value. Strings contribute their
 * wiki-link targets, or themselves when they contain '/' or end in ".md".
 */
std::vector<std::string> collectReferenceCandidates(const nlohmann::json& value);

/**
 * Relation target candidates from a string, array or object. Strings contribute their wiki-link
 * targets, or the whole trimmed string when they contain none.
 */
std::vector<std::string> collectTargetCandidates(const nlohmann::json& value);

// Confidence as a fraction in [0.1, 1]; absent/non-numeric values use defaultPercent / 100.
double normalizeConfidenceFraction(const nlohmann::json* value, int defaultPercent);

// Confidence as an integer percent in [0, 100]; values <= 1 are read as fractions.
int normalizeConfidencePercent(const nlohmann::json* value, int defaultPercent);

// Trimmed, non-empty field names, capped at kMaxConfiguredFields.
std::vector<std::string> sanitizeFieldList(const std::vector<std::string>& fields);

// Minimum semantic confidence clamped to [0, 100].
int clampMinimumConfidence(int configured);

// Draft batch size clamped to [5, 200].
int clampBatchSize(int configured);

} // namespace loregraph::graph
