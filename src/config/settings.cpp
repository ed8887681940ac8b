#include <loregraph/config/config_helpers.h>
#include <loregraph/config/settings.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace loregraph::config {

namespace {

void readInt(const std::filesystem::path& path, const std::string& section, const std::string& key,
             int& target) {
    auto raw = parse_config_value(path, section, key);
    if (raw.empty()) {
        return;
    }
    try {
        target = std::stoi(raw);
    } catch (const std::exception&) {
        spdlog::warn("config: ignoring non-numeric {}.{} = '{}'", section, key, raw);
    }
}

void readBool(const std::filesystem::path& path, const std::string& section, const std::string& key,
              bool& target) {
    auto raw = parse_config_value(path, section, key);
    if (!raw.empty()) {
        target = parse_bool(raw, target);
    }
}

void readList(const std::filesystem::path& path, const std::string& section, const std::string& key,
              std::vector<std::string>& target) {
    auto raw = parse_config_value(path, section, key);
    if (!raw.empty()) {
        target = parse_string_list(raw);
    }
}

} // namespace

Result<GraphSettings> loadSettings(const std::filesystem::path& configPath) {
    GraphSettings settings;

    std::error_code ec;
    if (configPath.empty() || !std::filesystem::exists(configPath, ec)) {
        spdlog::debug("config: no config at '{}', using defaults", configPath.string());
        return settings;
    }

    {
        std::ifstream file(configPath);
        if (!file) {
            return Error{ErrorCode::PermissionDenied,
                         "Cannot read config file: " + configPath.string()};
        }
    }

    constexpr const char* kGraph = "entity_graph";
    readList(configPath, kGraph, "alias_fields", settings.entityAliasFields);
    readBool(configPath, kGraph, "semantic_relations", settings.enableSemanticEntityRelations);
    readList(configPath, kGraph, "semantic_fields", settings.semanticEntityRelationFields);
    readInt(configPath, kGraph, "semantic_min_confidence", settings.semanticEntityMinConfidence);
    readInt(configPath, kGraph, "semantic_batch_size", settings.semanticEntityBatchSize);
    readBool(configPath, kGraph, "retrieval", settings.enableEntityGraphRetrieval);
    readInt(configPath, kGraph, "max_hops", settings.entityGraphMaxHops);
    readInt(configPath, kGraph, "max_expanded_docs", settings.entityGraphMaxExpandedDocs);
    readBool(configPath, kGraph, "debug", settings.debug);

    readList(configPath, "vault", "include", settings.includePatterns);
    readList(configPath, "vault", "exclude", settings.excludePatterns);

    spdlog::debug("config: loaded settings from {}", configPath.string());
    return settings;
}

GraphSettings SettingsStore::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

void SettingsStore::set(GraphSettings next) {
    GraphSettings prev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prev = settings_;
        settings_ = next;
    }
    publish(prev, next);
}

void SettingsStore::update(const std::function<void(GraphSettings&)>& mutator) {
    GraphSettings prev;
    GraphSettings next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        prev = settings_;
        next = settings_;
        mutator(next);
        settings_ = next;
    }
    publish(prev, next);
}

SettingsStore::SubscriptionId SettingsStore::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = nextId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void SettingsStore::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
}

std::size_t SettingsStore::subscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

void SettingsStore::publish(const GraphSettings& prev, const GraphSettings& next) {
    std::vector<Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) {
            snapshot.push_back(listener);
        }
    }
    for (const auto& listener : snapshot) {
        if (listener) {
            listener(prev, next);
        }
    }
}

} // namespace loregraph::config
