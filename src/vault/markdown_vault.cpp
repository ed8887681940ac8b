#include <loregraph/vault/markdown_vault.h>

#include <loregraph/common/pattern_utils.h>
#include <loregraph/vault/markdown_parser.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace loregraph::vault {

namespace {

constexpr std::string_view kMarkdownExtension = ".md";
constexpr std::string_view kTempSuffix = ".loregraph.tmp";

bool endsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool hasHiddenSegment(std::string_view path) {
    size_t start = 0;
    while (start < path.size()) {
        if (path[start] == '.') {
            return true;
        }
        const auto slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            break;
        }
        start = slash + 1;
    }
    return false;
}

std::int64_t toEpochMillis(std::filesystem::file_time_type t) {
    const auto sys = std::chrono::file_clock::to_sys(t);
    return std::chrono::duration_cast<std::chrono::milliseconds>(sys.time_since_epoch()).count();
}

Result<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + path.string()};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Error{ErrorCode::InternalError, "Failed to read " + path.string()};
    }
    return buffer.str();
}

// "Folder/Note#Section|alias" -> "Folder/Note"
std::string stripLinkDecorations(std::string_view candidate) {
    auto value = common::trim(candidate);
    value = value.substr(0, value.find('|'));
    value = common::trim(value.substr(0, value.find('#')));
    while (!value.empty() && value.front() == '/') {
        value.remove_prefix(1);
    }
    return common::normalize_path(value);
}

} // namespace

MarkdownVault::MarkdownVault(std::filesystem::path root, VaultOptions options)
    : root_(std::move(root)), options_(std::move(options)) {}

Result<std::unique_ptr<MarkdownVault>> MarkdownVault::open(const std::filesystem::path& root,
                                                           VaultOptions options) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return Error{ErrorCode::FileNotFound, "Vault directory not found: " + root.string()};
    }

    auto canonical = std::filesystem::weakly_canonical(root, ec);
    std::unique_ptr<MarkdownVault> vault(
        new MarkdownVault(ec ? root : std::move(canonical), std::move(options)));

    auto snapshot = vault->scanDirectory();
    if (!snapshot) {
        return snapshot.error();
    }
    vault->documents_ = std::move(snapshot).value();
    spdlog::info("Opened vault {} ({} notes)", vault->root_.string(), vault->documents_.size());
    return Result<std::unique_ptr<MarkdownVault>>(std::move(vault));
}

std::vector<host::DocumentInfo> MarkdownVault::listDocuments() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<host::DocumentInfo> out;
    out.reserve(documents_.size());
    for (const auto& [path, entry] : documents_) {
        out.push_back(entry.info);
    }
    return out;
}

bool MarkdownVault::isEligible(std::string_view path) const {
    const auto normalized = common::normalize_path(path);
    if (!endsWith(normalized, kMarkdownExtension) || hasHiddenSegment(normalized)) {
        return false;
    }
    if (!options_.includePatterns.empty() &&
        !common::matches_any(normalized, options_.includePatterns)) {
        return false;
    }
    return !common::matches_any(normalized, options_.excludePatterns);
}

std::optional<host::DocumentInfo> MarkdownVault::getDocument(std::string_view path) {
    const auto normalized = common::normalize_path(path);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(normalized);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return it->second.info;
}

std::optional<host::DocumentMetadata> MarkdownVault::getMetadata(std::string_view path) {
    const auto normalized = common::normalize_path(path);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(normalized);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    if (!it->second.metadata) {
        auto content = readFile(absolutePath(normalized));
        if (!content) {
            spdlog::warn("Failed to read {}: {}", normalized, content.error().message);
            return std::nullopt;
        }
        auto parsed = parseNote(content.value());
        if (!parsed.frontmatterValid) {
            spdlog::warn("Malformed front matter in {}", normalized);
        }
        it->second.metadata = std::move(parsed.metadata);
    }
    return it->second.metadata;
}

std::optional<std::string> MarkdownVault::resolveLink(std::string_view candidate,
                                                      std::string_view sourcePath) {
    const auto target = stripLinkDecorations(candidate);
    if (target.empty()) {
        return std::nullopt;
    }
    const bool hasExtension = endsWith(target, kMarkdownExtension);
    const std::string withExtension =
        hasExtension ? target : target + std::string(kMarkdownExtension);

    std::lock_guard<std::mutex> lock(mutex_);
    auto exists = [this](const std::string& p) { return documents_.count(p) > 0; };

    if (exists(target)) {
        return target;
    }
    if (exists(withExtension)) {
        return withExtension;
    }

    const auto source = common::normalize_path(sourcePath);
    if (const auto slash = source.rfind('/'); slash != std::string::npos) {
        const auto relative =
            (std::filesystem::path(source.substr(0, slash)) / withExtension).lexically_normal();
        const auto joined = relative.generic_string();
        if (exists(joined)) {
            return joined;
        }
    }

    // Basename or trailing-path match, case-insensitive; the shortest path wins
    const auto needle = toLower(withExtension);
    const std::string* best = nullptr;
    for (const auto& [path, entry] : documents_) {
        const auto lowered = toLower(path);
        const bool matches =
            lowered == needle || (lowered.size() > needle.size() && endsWith(lowered, needle) &&
                                  lowered[lowered.size() - needle.size() - 1] == '/');
        if (matches && (best == nullptr || path.size() < best->size())) {
            best = &path;
        }
    }
    if (best) {
        return *best;
    }
    return std::nullopt;
}

Result<std::string> MarkdownVault::readContent(std::string_view path) {
    const auto normalized = common::normalize_path(path);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (documents_.find(normalized) == documents_.end()) {
            return Error{ErrorCode::NotFound, "Note not found: " + normalized};
        }
    }
    return readFile(absolutePath(normalized));
}

Result<void>
MarkdownVault::updateFrontmatter(std::string_view path,
                                 const std::function<void(nlohmann::json& frontmatter)>& mutator) {
    const auto normalized = common::normalize_path(path);
    std::vector<host::DocumentChangeEvent> events;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(normalized);
        if (it == documents_.end()) {
            return Error{ErrorCode::NotFound, "Note not found: " + normalized};
        }

        const auto file = absolutePath(normalized);
        auto content = readFile(file);
        if (!content) {
            return content.error();
        }

        const auto split = splitFrontmatter(content.value());
        nlohmann::json frontmatter = nlohmann::json::object();
        if (split.yaml) {
            auto parsed = parseFrontmatterYaml(*split.yaml);
            if (!parsed) {
                return Error{parsed.error().code, normalized + ": " + parsed.error().message};
            }
            frontmatter = std::move(parsed).value();
        }

        mutator(frontmatter);

        const auto updated = replaceFrontmatter(content.value(), frontmatter);
        if (updated == content.value()) {
            return {};
        }
        if (auto written = atomicWrite(file, updated); !written) {
            return written;
        }

        const auto ctime = it->second.info.ctime;
        if (auto info = statDocument(normalized)) {
            it->second.info = std::move(*info);
            it->second.info.ctime = ctime;
        }
        it->second.metadata.reset();

        host::DocumentChangeEvent event;
        event.kind = host::DocumentChangeKind::Modified;
        event.document = it->second.info;
        events.push_back(std::move(event));
    }

    spdlog::debug("Updated front matter of {}", normalized);
    notify(events);
    return {};
}

host::ListenerId MarkdownVault::addChangeListener(host::DocumentChangeListener listener) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    const auto id = nextListenerId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void MarkdownVault::removeChangeListener(host::ListenerId id) {
    std::lock_guard<std::mutex> lock(listenerMutex_);
    listeners_.erase(id);
}

Result<std::size_t> MarkdownVault::rescan() {
    auto scanned = scanDirectory();
    if (!scanned) {
        return scanned.error();
    }
    auto next = std::move(scanned).value();

    std::vector<host::DocumentChangeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [path, entry] : documents_) {
            if (next.find(path) == next.end()) {
                host::DocumentChangeEvent event;
                event.kind = host::DocumentChangeKind::Deleted;
                event.document = entry.info;
                events.push_back(std::move(event));
            }
        }
        for (auto& [path, entry] : next) {
            auto previous = documents_.find(path);
            host::DocumentChangeEvent event;
            event.document = entry.info;
            if (previous == documents_.end()) {
                event.kind = host::DocumentChangeKind::Created;
            } else {
                entry.info.ctime = previous->second.info.ctime;
                event.document.ctime = entry.info.ctime;
                if (previous->second.info.mtime == entry.info.mtime) {
                    entry.metadata = std::move(previous->second.metadata);
                    continue;
                }
                event.kind = host::DocumentChangeKind::Modified;
            }
            events.push_back(std::move(event));
        }
        documents_ = std::move(next);
    }

    if (!events.empty()) {
        spdlog::debug("Vault rescan found {} change(s)", events.size());
    }
    notify(events);
    return events.size();
}

Result<void> MarkdownVault::renameDocument(std::string_view oldPath, std::string_view newPath) {
    const auto from = common::normalize_path(oldPath);
    const auto to = common::normalize_path(newPath);
    if (!isEligible(to)) {
        return Error{ErrorCode::InvalidArgument, "Not an eligible note path: " + to};
    }

    std::vector<host::DocumentChangeEvent> events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(from);
        if (it == documents_.end()) {
            return Error{ErrorCode::NotFound, "Note not found: " + from};
        }
        if (documents_.count(to) > 0) {
            return Error{ErrorCode::InvalidState, "Note already exists: " + to};
        }

        const auto target = absolutePath(to);
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        std::filesystem::rename(absolutePath(from), target, ec);
        if (ec) {
            return Error{ErrorCode::WriteError,
                         "Failed to rename " + from + " to " + to + ": " + ec.message()};
        }

        Entry entry;
        if (auto info = statDocument(to)) {
            entry.info = std::move(*info);
        }
        entry.info.ctime = it->second.info.ctime;
        documents_.erase(it);

        host::DocumentChangeEvent event;
        event.kind = host::DocumentChangeKind::Renamed;
        event.document = entry.info;
        event.oldPath = from;
        events.push_back(std::move(event));
        documents_.emplace(to, std::move(entry));
    }

    notify(events);
    return {};
}

Result<MarkdownVault::Snapshot> MarkdownVault::scanDirectory() const {
    Snapshot snapshot;
    std::error_code ec;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(root_, options, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot scan " + root_.string() + ": " + ec.message()};
    }

    std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        const auto name = it->path().filename().string();
        std::error_code entryEc;
        if (!name.empty() && name.front() == '.') {
            if (it->is_directory(entryEc)) {
                it.disable_recursion_pending();
            }
        } else if (it->is_regular_file(entryEc) && !entryEc) {
            const auto relative = it->path().lexically_relative(root_).generic_string();
            if (isEligible(relative)) {
                if (auto info = statDocument(relative)) {
                    Entry entry;
                    entry.info = std::move(*info);
                    snapshot.emplace(relative, std::move(entry));
                }
            }
        }

        it.increment(ec);
        if (ec) {
            spdlog::warn("Error advancing directory iterator: {}", ec.message());
            ec.clear();
        }
    }
    return snapshot;
}

std::optional<host::DocumentInfo>
MarkdownVault::statDocument(const std::string& relativePath) const {
    std::error_code ec;
    const auto written = std::filesystem::last_write_time(absolutePath(relativePath), ec);
    if (ec) {
        spdlog::warn("Skipping {}: {}", relativePath, ec.message());
        return std::nullopt;
    }

    host::DocumentInfo info;
    info.path = relativePath;
    info.basename = std::filesystem::path(relativePath).stem().string();
    info.mtime = toEpochMillis(written);
    info.ctime = info.mtime;
    return info;
}

std::filesystem::path MarkdownVault::absolutePath(std::string_view relativePath) const {
    return root_ / std::filesystem::path(std::string(relativePath));
}

Result<void> MarkdownVault::atomicWrite(const std::filesystem::path& path,
                                        const std::string& content) const {
    auto tempPath = path;
    tempPath += std::string(kTempSuffix);

    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            spdlog::error("Failed to create temp file: {}", tempPath.string());
            return Error{ErrorCode::PermissionDenied, "Cannot write " + tempPath.string()};
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!file) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(tempPath, ignored);
            return Error{ErrorCode::WriteError, "Failed to write " + tempPath.string()};
        }
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tempPath, ignored);
        spdlog::error("Failed to rename {} to {}: {}", tempPath.string(), path.string(),
                      ec.message());
        return Error{ErrorCode::WriteError, "Failed to replace " + path.string()};
    }
    return {};
}

void MarkdownVault::notify(const std::vector<host::DocumentChangeEvent>& events) {
    if (events.empty()) {
        return;
    }
    std::vector<host::DocumentChangeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenerMutex_);
        for (const auto& [id, listener] : listeners_) {
            listeners.push_back(listener);
        }
    }
    for (const auto& event : events) {
        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                spdlog::warn("Change listener failed for {}: {}", event.document.path, e.what());
            }
        }
    }
}

} // namespace loregraph::vault
