#pragma once

#include <loregraph/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loregraph::host {

/**
 * Identity and timestamps of one markdown document known to the host.
 */
struct DocumentInfo {
    std::string path;     // Vault-relative path, e.g. "Characters/Arin.md"
    std::string basename; // File name without extension, e.g. "Arin"
    std::int64_t mtime = 0;
    std::int64_t ctime = 0;
};

struct DocumentLink {
    std::string target;                     // Raw link target as written
    std::optional<std::string> displayText; // Alias text after '|' or markdown link text
};

/**
 * Parsed per-document metadata: outgoing links, tags, section headings and structured
 * front matter (an object; empty when the document has none).
 */
struct DocumentMetadata {
    std::vector<DocumentLink> links;
    std::vector<std::string> tags;
    std::vector<std::string> headings;
    nlohmann::json frontmatter = nlohmann::json::object();
};

enum class DocumentChangeKind { Modified, Created, Renamed, Deleted };

struct DocumentChangeEvent {
    DocumentChangeKind kind = DocumentChangeKind::Modified;
    DocumentInfo document; // Current identity (for Deleted: the removed document)
    std::string oldPath;   // Set for Renamed
};

using DocumentChangeListener = std::function<void(const DocumentChangeEvent&)>;
using ListenerId = std::uint64_t;

/**
 * Capability interface onto the host document store.
 *
 * Implementations own inclusion/exclusion filtering: listDocuments() returns eligible documents
 * only and isEligible() answers the same question for a single path. resolveLink() returns the
 * canonical path of an existing markdown document or nullopt.
 */
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual std::vector<DocumentInfo> listDocuments() = 0;
    virtual bool isEligible(std::string_view path) const = 0;
    virtual std::optional<DocumentInfo> getDocument(std::string_view path) = 0;
    virtual std::optional<DocumentMetadata> getMetadata(std::string_view path) = 0;
    virtual std::optional<std::string> resolveLink(std::string_view candidate,
                                                   std::string_view sourcePath) = 0;

    virtual Result<std::string> readContent(std::string_view path) = 0;

    // Read-modify-write of a document's front matter. The mutator receives the current front
    // matter object (empty object when none) and edits it in place.
    virtual Result<void>
    updateFrontmatter(std::string_view path,
                      const std::function<void(nlohmann::json& frontmatter)>& mutator) = 0;

    virtual ListenerId addChangeListener(DocumentChangeListener listener) = 0;
    virtual void removeChangeListener(ListenerId id) = 0;
};

/**
 * One retrievable chunk of a document.
 */
struct RetrievalChunk {
    std::string id; // Stable chunk id, e.g. "Characters/Arin.md#0"
    std::string path;
    std::string content;
    std::size_t index = 0;
};

/**
 * Chunking collaborator: ordered chunks for a document (empty when it has no content).
 */
class ChunkProvider {
public:
    virtual ~ChunkProvider() = default;
    virtual Result<std::vector<RetrievalChunk>> getChunks(std::string_view path) = 0;
};

} // namespace loregraph::host
