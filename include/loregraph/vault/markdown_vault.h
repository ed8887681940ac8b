#pragma once

#include <loregraph/core/types.h>
#include <loregraph/host/document_store.h>

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loregraph::vault {

struct VaultOptions {
    // Glob patterns over vault-relative paths ('*', '?', "**"). Empty include list admits all.
    std::vector<std::string> includePatterns;
    std::vector<std::string> excludePatterns;
};

/**
 * DocumentStore over a directory tree of markdown notes.
 *
 * Paths are vault-relative with '/' separators. Hidden files and directories (".obsidian",
 * ".git", ...) are never scanned. The directory is snapshotted by open() and rescan(); changes
 * made through this class (updateFrontmatter, renameDocument) update the snapshot and notify
 * listeners directly.
 *
 * ctime is the modification time observed when a note was first scanned.
 *
 * Thread-safety: all methods may be called concurrently; listeners run on the calling thread
 * after internal locks are released.
 */
class MarkdownVault : public host::DocumentStore {
public:
    static Result<std::unique_ptr<MarkdownVault>> open(const std::filesystem::path& root,
                                                       VaultOptions options = {});

    ~MarkdownVault() override = default;

    MarkdownVault(const MarkdownVault&) = delete;
    MarkdownVault& operator=(const MarkdownVault&) = delete;

    std::vector<host::DocumentInfo> listDocuments() override;
    bool isEligible(std::string_view path) const override;
    std::optional<host::DocumentInfo> getDocument(std::string_view path) override;
    std::optional<host::DocumentMetadata> getMetadata(std::string_view path) override;

    /**
     * Obsidian-style link resolution: "#section" and "|alias" are dropped, then the candidate is
     * tried as a vault path, with ".md" appended, relative to the source note's folder, and
     * finally as a case-insensitive basename / path suffix (shortest path wins).
     */
    std::optional<std::string> resolveLink(std::string_view candidate,
                                           std::string_view sourcePath) override;

    Result<std::string> readContent(std::string_view path) override;

    Result<void>
    updateFrontmatter(std::string_view path,
                      const std::function<void(nlohmann::json& frontmatter)>& mutator) override;

    host::ListenerId addChangeListener(host::DocumentChangeListener listener) override;
    void removeChangeListener(host::ListenerId id) override;

    /**
     * Re-walk the directory and emit Created / Modified / Deleted events for the differences
     * against the previous snapshot. Returns the number of events emitted.
     */
    Result<std::size_t> rescan();

    // Move a note on disk and emit a Renamed event.
    Result<void> renameDocument(std::string_view oldPath, std::string_view newPath);

    const std::filesystem::path& root() const { return root_; }

private:
    MarkdownVault(std::filesystem::path root, VaultOptions options);

    struct Entry {
        host::DocumentInfo info;
        std::optional<host::DocumentMetadata> metadata; // Parsed lazily, dropped on change
    };

    using Snapshot = std::map<std::string, Entry>;

    Result<Snapshot> scanDirectory() const;
    std::optional<host::DocumentInfo> statDocument(const std::string& relativePath) const;
    std::filesystem::path absolutePath(std::string_view relativePath) const;
    Result<void> atomicWrite(const std::filesystem::path& path, const std::string& content) const;
    void notify(const std::vector<host::DocumentChangeEvent>& events);

    std::filesystem::path root_;
    VaultOptions options_;

    mutable std::mutex mutex_;
    Snapshot documents_;

    std::mutex listenerMutex_;
    std::map<host::ListenerId, host::DocumentChangeListener> listeners_;
    host::ListenerId nextListenerId_{1};
};

} // namespace loregraph::vault
