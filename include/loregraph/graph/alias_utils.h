#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace loregraph::graph {

// Maximum query tokens considered for n-gram alias matching
inline constexpr std::size_t kMaxQueryTokens = 18;
// Largest n-gram size generated from the query
inline constexpr std::size_t kMaxAliasNgram = 4;

/**
 * Normalize an alias, tag, heading or query for matching: lowercase, brackets/braces/parentheses
 * replaced by spaces, whitespace collapsed, trimmed.
 */
std::string normalizeAlias(std::string_view value);

// Maximal runs of letters, digits, '_' or '-'. Non-ASCII bytes count as letters.
std::vector<std::string> tokenizeAliasText(std::string_view normalized);

/**
 * Candidate alias terms for a normalized query: the full query first, then every n-gram
 * (n = 4 down to 1) over the first 18 tokens. Phrases shorter than 2 characters are dropped and
 * duplicates keep their first position.
 */
std::vector<std::string> generateCandidateAliasTerms(const std::string& normalizedQuery);

// tokenCount * 10 + min(10, codePoints / 4); longer phrases outrank their sub-phrases.
double computeTermScore(std::string_view term);

} // namespace loregraph::graph
