#pragma once

#include <loregraph/host/document_store.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cctype>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace loregraph::test {

/**
 * In-memory DocumentStore/ChunkProvider used by graph, batch and retrieval tests.
 *
 * Documents are stored with pre-parsed metadata and optional content. Events are only emitted
 * through emit(), so tests control when listeners observe a change.
 */
class InMemoryDocumentStore : public host::DocumentStore, public host::ChunkProvider {
public:
    struct Document {
        host::DocumentInfo info;
        host::DocumentMetadata metadata;
        std::string content;
    };

    host::DocumentInfo upsert(const std::string& path, std::int64_t mtime,
                              host::DocumentMetadata metadata = {}, std::string content = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        Document doc;
        doc.info.path = path;
        doc.info.basename = basenameOf(path);
        doc.info.mtime = mtime;
        doc.info.ctime = mtime;
        doc.metadata = std::move(metadata);
        doc.content = std::move(content);
        auto info = doc.info;
        documents_[path] = std::move(doc);
        return info;
    }

    void remove(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        documents_.erase(path);
    }

    void emit(const host::DocumentChangeEvent& event) {
        std::vector<host::DocumentChangeListener> listeners;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [id, listener] : listeners_) {
                listeners.push_back(listener);
            }
        }
        for (const auto& listener : listeners) {
            listener(event);
        }
    }

    void setExcluded(std::vector<std::string> paths) {
        std::lock_guard<std::mutex> lock(mutex_);
        excluded_ = std::move(paths);
    }

    void setListDelay(std::chrono::milliseconds delay) { listDelay_ = delay; }
    int listCalls() const { return listCalls_.load(); }

    void failWritesFor(std::string path) {
        std::lock_guard<std::mutex> lock(mutex_);
        failingWrites_.push_back(std::move(path));
    }

    nlohmann::json frontmatterOf(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(path);
        return it == documents_.end() ? nlohmann::json() : it->second.metadata.frontmatter;
    }

    std::size_t listenerCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    // host::DocumentStore
    std::vector<host::DocumentInfo> listDocuments() override {
        listCalls_.fetch_add(1);
        if (listDelay_.count() > 0) {
            std::this_thread::sleep_for(listDelay_);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<host::DocumentInfo> out;
        for (const auto& [path, doc] : documents_) {
            if (!isExcludedLocked(path)) {
                out.push_back(doc.info);
            }
        }
        return out;
    }

    bool isEligible(std::string_view path) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return documents_.count(std::string(path)) > 0 && !isExcludedLocked(std::string(path));
    }

    std::optional<host::DocumentInfo> getDocument(std::string_view path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(std::string(path));
        if (it == documents_.end()) {
            return std::nullopt;
        }
        return it->second.info;
    }

    std::optional<host::DocumentMetadata> getMetadata(std::string_view path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(std::string(path));
        if (it == documents_.end()) {
            return std::nullopt;
        }
        return it->second.metadata;
    }

    // Exact path, then "{path}.md", then a case-insensitive basename match.
    std::optional<std::string> resolveLink(std::string_view candidate,
                                           std::string_view /*sourcePath*/) override {
        std::string cleaned(candidate);
        if (cleaned.rfind("[[", 0) == 0)
            cleaned.erase(0, 2);
        if (cleaned.size() >= 2 && cleaned.compare(cleaned.size() - 2, 2, "]]") == 0)
            cleaned.erase(cleaned.size() - 2);
        cleaned = cleaned.substr(0, cleaned.find('|'));
        cleaned = cleaned.substr(0, cleaned.find('#'));
        while (!cleaned.empty() && std::isspace(static_cast<unsigned char>(cleaned.back())))
            cleaned.pop_back();
        while (!cleaned.empty() && std::isspace(static_cast<unsigned char>(cleaned.front())))
            cleaned.erase(0, 1);
        if (cleaned.empty()) {
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (documents_.count(cleaned)) {
            return cleaned;
        }
        if (documents_.count(cleaned + ".md")) {
            return cleaned + ".md";
        }
        const auto wanted = lower(cleaned);
        for (const auto& [path, doc] : documents_) {
            if (lower(doc.info.basename) == wanted) {
                return path;
            }
        }
        return std::nullopt;
    }

    Result<std::string> readContent(std::string_view path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(std::string(path));
        if (it == documents_.end()) {
            return Error{ErrorCode::FileNotFound, "No document " + std::string(path)};
        }
        return it->second.content;
    }

    Result<void>
    updateFrontmatter(std::string_view path,
                      const std::function<void(nlohmann::json& frontmatter)>& mutator) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(std::string(path));
        if (it == documents_.end()) {
            return Error{ErrorCode::FileNotFound, "No document " + std::string(path)};
        }
        if (std::find(failingWrites_.begin(), failingWrites_.end(), it->first) !=
            failingWrites_.end()) {
            return Error{ErrorCode::WriteError, "Write refused for " + it->first};
        }
        auto& fm = it->second.metadata.frontmatter;
        if (!fm.is_object()) {
            fm = nlohmann::json::object();
        }
        mutator(fm);
        return Result<void>();
    }

    host::ListenerId addChangeListener(host::DocumentChangeListener listener) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto id = nextListenerId_++;
        listeners_.emplace(id, std::move(listener));
        return id;
    }

    void removeChangeListener(host::ListenerId id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.erase(id);
    }

    // host::ChunkProvider: one chunk holding the whole content.
    Result<std::vector<host::RetrievalChunk>> getChunks(std::string_view path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(std::string(path));
        if (it == documents_.end()) {
            return Error{ErrorCode::FileNotFound, "No document " + std::string(path)};
        }
        std::vector<host::RetrievalChunk> chunks;
        if (!it->second.content.empty()) {
            chunks.push_back({it->first + "#0", it->first, it->second.content, 0});
        }
        return chunks;
    }

private:
    static std::string basenameOf(const std::string& path) {
        auto slash = path.rfind('/');
        std::string base = slash == std::string::npos ? path : path.substr(slash + 1);
        if (base.size() > 3 && lower(base.substr(base.size() - 3)) == ".md") {
            base.erase(base.size() - 3);
        }
        return base;
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    bool isExcludedLocked(const std::string& path) const {
        return std::find(excluded_.begin(), excluded_.end(), path) != excluded_.end();
    }

    mutable std::mutex mutex_;
    std::map<std::string, Document> documents_;
    std::map<host::ListenerId, host::DocumentChangeListener> listeners_;
    host::ListenerId nextListenerId_{1};
    std::vector<std::string> excluded_;
    std::vector<std::string> failingWrites_;
    std::chrono::milliseconds listDelay_{0};
    std::atomic<int> listCalls_{0};
};

// Metadata builder for concise fixtures.
inline host::DocumentMetadata
makeMetadata(std::vector<host::DocumentLink> links, std::vector<std::string> tags,
             std::vector<std::string> headings,
             nlohmann::json frontmatter = nlohmann::json::object()) {
    host::DocumentMetadata metadata;
    metadata.links = std::move(links);
    metadata.tags = std::move(tags);
    metadata.headings = std::move(headings);
    metadata.frontmatter = std::move(frontmatter);
    return metadata;
}

} // namespace loregraph::test
