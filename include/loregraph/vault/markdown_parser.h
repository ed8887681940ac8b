#pragma once

#include <loregraph/core/types.h>
#include <loregraph/host/document_store.h>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace loregraph::vault {

/**
 * A note split at its YAML front matter block.
 *
 * yaml is set only when the note starts with a "---" line and a closing "---" (or "...") line
 * follows. body is everything after the closing delimiter, or the whole note otherwise.
 */
struct FrontmatterSplit {
    std::optional<std::string> yaml;
    std::string body;
};

struct ParsedNote {
    host::DocumentMetadata metadata;
    std::string body;
    bool frontmatterValid = true; // false when a front matter block exists but is not a mapping
};

FrontmatterSplit splitFrontmatter(std::string_view content);

/**
 * Parse a YAML front matter block into a JSON object.
 *
 * Plain scalars follow the YAML core schema (null, booleans, integers, floats); quoted scalars
 * stay strings. An empty block yields an empty object. Anything but a mapping is an error.
 */
Result<nlohmann::json> parseFrontmatterYaml(std::string_view yaml);

// Block-style YAML for a front matter object (without the "---" delimiters).
std::string emitFrontmatterYaml(const nlohmann::json& frontmatter);

/**
 * Replace (or insert) the front matter block of a note, keeping the body byte-for-byte.
 * An empty object removes the block.
 */
std::string replaceFrontmatter(std::string_view content, const nlohmann::json& frontmatter);

/**
 * Extract links, tags, headings and front matter from a markdown note.
 *
 * - wiki links `[[target#section|display]]` (embeds included); target keeps its "#section"
 * - markdown links `[text](relative/path.md)`; external URLs are skipped
 * - inline `#tags` plus front matter `tags` / `tag`, always with a leading '#'
 * - ATX headings
 * Fenced code blocks and inline code spans are ignored.
 */
ParsedNote parseNote(std::string_view content);

} // namespace loregraph::vault
