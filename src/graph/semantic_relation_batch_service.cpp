#include <loregraph/graph/semantic_relation_batch_service.h>

#include <loregraph/common/pattern_utils.h>
#include <loregraph/graph/frontmatter_utils.h>
#include <loregraph/graph/semantic_predicate.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace loregraph::graph {

namespace {

constexpr const char* kVaultProposalSource = "vault-frontmatter";
constexpr const char* kDefaultRelationField = "relations";

bool endsWithMd(std::string_view s) {
    return s.size() >= 3 && s.substr(s.size() - 3) == ".md";
}

std::string rowKey(const SemanticRelationDraftRow& row) {
    return row.notePath + "|" + row.predicate + "|" + row.targetPath;
}

std::string createRowId(const std::string& notePath, const std::string& predicate,
                        const std::string& targetPath) {
    return notePath + "::" + predicate + "::" + targetPath;
}

// "[[Path/To/Note]]" for "Path/To/Note.md"
std::string toWikiLink(const std::string& path) {
    std::string core = path;
    if (core.size() >= 3) {
        std::string ext = core.substr(core.size() - 3);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".md") {
            core.resize(core.size() - 3);
        }
    }
    return "[[" + core + "]]";
}

// Keep the highest-confidence row per (note, predicate, target); first position wins ties.
std::vector<SemanticRelationDraftRow> dedupeRows(std::vector<SemanticRelationDraftRow> rows) {
    std::vector<SemanticRelationDraftRow> deduped;
    std::unordered_map<std::string, std::size_t> positions;
    for (auto& row : rows) {
        auto [it, inserted] = positions.emplace(rowKey(row), deduped.size());
        if (inserted) {
            deduped.push_back(std::move(row));
        } else if (row.confidence > deduped[it->second].confidence) {
            deduped[it->second] = std::move(row);
        }
    }
    return deduped;
}

nlohmann::json confidenceToJson(double confidence) {
    if (std::isfinite(confidence) && std::floor(confidence) == confidence &&
        std::abs(confidence) < 1e9) {
        return static_cast<int>(confidence);
    }
    return confidence;
}

struct FrontmatterRelationRecord {
    std::string predicate;
    std::string target;
    nlohmann::json confidence;
    std::string sourceField;
};

// Existing relation records in the canonical field; unparseable entries are dropped.
std::vector<FrontmatterRelationRecord> normalizeCanonicalRelations(const nlohmann::json& value) {
    std::vector<FrontmatterRelationRecord> records;
    if (!value.is_array()) {
        return records;
    }
    for (const auto& item : value) {
        if (!item.is_object()) {
            continue;
        }
        const auto* predicateValue = firstTruthyField(item, {"predicate", "relation", "type"});
        const auto predicate = predicateValue ? parsePredicateValue(*predicateValue)
                                              : std::optional<SemanticPredicate>{};
        if (!predicate) {
            continue;
        }

        auto targetIt = item.find("target");
        const std::string target =
            (targetIt != item.end() && targetIt->is_string())
                ? std::string(common::trim(targetIt->get_ref<const std::string&>()))
                : std::string{};
        if (target.empty()) {
            continue;
        }

        // Stored fractions (0.84) keep their meaning as percents (84)
        auto confidenceIt = item.find("confidence");
        const int confidence =
            normalizeConfidencePercent(confidenceIt != item.end() ? &*confidenceIt : nullptr, 0);

        std::string sourceField = kDefaultRelationField;
        if (auto sfIt = item.find("sourceField"); sfIt != item.end() && sfIt->is_string()) {
            auto trimmedField = std::string(common::trim(sfIt->get_ref<const std::string&>()));
            if (!trimmedField.empty()) {
                sourceField = std::move(trimmedField);
            }
        }

        records.push_back(
            {semanticPredicateName(*predicate), target, confidence, std::move(sourceField)});
    }
    return records;
}

} // namespace

const char* rowApplyStatusName(RowApplyStatus status) noexcept {
    switch (status) {
        case RowApplyStatus::Applied:
            return "applied";
        case RowApplyStatus::Skipped:
            return "skipped";
        case RowApplyStatus::Error:
            return "error";
    }
    return "unknown";
}

SemanticRelationBatchService::SemanticRelationBatchService(host::DocumentStore& store,
                                                           config::SettingsStore& settings)
    : store_(store), settings_(settings) {}

SemanticRelationBatchService::Context SemanticRelationBatchService::currentContext() const {
    const auto settings = settings_.get();
    Context ctx;
    ctx.minimumConfidence = clampMinimumConfidence(settings.semanticEntityMinConfidence);
    ctx.relationFields = sanitizeFieldList(settings.semanticEntityRelationFields);
    if (ctx.relationFields.empty()) {
        ctx.relationFields.push_back(kDefaultRelationField);
    }
    return ctx;
}

std::vector<SemanticRelationDraftBatch>
SemanticRelationBatchService::buildDraftBatches(const DraftBatchBuildOptions& options) {
    const auto ctx = currentContext();

    std::vector<SemanticRelationDraftRow> rows;
    if (options.includeVaultDrafts) {
        rows = collectVaultRows(ctx);
    }
    auto adapterRows = collectAdapterRows(options.proposalAdapters, ctx);
    rows.insert(rows.end(), std::make_move_iterator(adapterRows.begin()),
                std::make_move_iterator(adapterRows.end()));

    auto deduped = dedupeRows(std::move(rows));
    std::stable_sort(deduped.begin(), deduped.end(),
                     [](const SemanticRelationDraftRow& a, const SemanticRelationDraftRow& b) {
                         if (a.notePath != b.notePath)
                             return a.notePath < b.notePath;
                         if (a.predicate != b.predicate)
                             return a.predicate < b.predicate;
                         return a.targetPath < b.targetPath;
                     });

    std::vector<SemanticRelationDraftBatch> batches;
    if (deduped.empty()) {
        return batches;
    }

    const auto batchSize =
        static_cast<std::size_t>(clampBatchSize(settings_.get().semanticEntityBatchSize));
    for (std::size_t start = 0; start < deduped.size(); start += batchSize) {
        const auto end = std::min(start + batchSize, deduped.size());
        SemanticRelationDraftBatch batch;
        batch.index = batches.size();
        batch.id = "semantic-batch-" + std::to_string(batch.index + 1);
        batch.startRow = start + 1;
        batch.endRow = end;
        batch.totalRows = deduped.size();
        batch.rows.assign(deduped.begin() + static_cast<std::ptrdiff_t>(start),
                          deduped.begin() + static_cast<std::ptrdiff_t>(end));
        batches.push_back(std::move(batch));
    }
    return batches;
}

ApplyBatchResult
SemanticRelationBatchService::applyEditedBatch(const std::vector<SemanticRelationDraftRow>& rows) {
    ApplyBatchResult result;

    auto makeResult = [](const SemanticRelationDraftRow& row, RowApplyStatus status,
                         std::optional<std::string> reason) {
        ApplyRowResult r;
        r.rowId = row.id;
        r.notePath = row.notePath;
        r.targetPath = row.targetPath;
        r.predicate = row.predicate;
        r.status = status;
        r.reason = std::move(reason);
        return r;
    };

    // Group valid rows by note, preserving first-seen note order
    std::vector<std::pair<std::string, std::vector<const SemanticRelationDraftRow*>>> byNote;
    std::unordered_map<std::string, std::size_t> notePositions;
    for (const auto& row : rows) {
        const auto problems = validateDraftRow(row);
        if (!problems.empty()) {
            std::string reason;
            for (std::size_t i = 0; i < problems.size(); ++i) {
                if (i > 0)
                    reason += "; ";
                reason += problems[i];
            }
            result.rowResults.push_back(
                makeResult(row, RowApplyStatus::Skipped, std::move(reason)));
            ++result.skippedRows;
            continue;
        }
        auto [it, inserted] = notePositions.emplace(row.notePath, byNote.size());
        if (inserted) {
            byNote.emplace_back(row.notePath, std::vector<const SemanticRelationDraftRow*>{});
        }
        byNote[it->second].second.push_back(&row);
    }

    const auto canonicalField = currentContext().relationFields.front();

    for (const auto& [notePath, noteRows] : byNote) {
        const auto document = store_.getDocument(notePath);
        if (!document || !endsWithMd(document->path)) {
            result.errors.push_back("Missing markdown note: " + notePath);
            for (const auto* row : noteRows) {
                result.rowResults.push_back(
                    makeResult(*row, RowApplyStatus::Error, std::string("Missing markdown note")));
            }
            continue;
        }

        Result<void> written;
        try {
            written = store_.updateFrontmatter(notePath, [&](nlohmann::json& frontmatter) {
                auto existingIt = frontmatter.find(canonicalField);
                auto existing = existingIt != frontmatter.end()
                                    ? normalizeCanonicalRelations(*existingIt)
                                    : std::vector<FrontmatterRelationRecord>{};

                std::vector<FrontmatterRelationRecord> merged;
                std::unordered_map<std::string, std::size_t> positions;
                auto upsert = [&](FrontmatterRelationRecord record) {
                    auto key = record.predicate + "|" + record.target;
                    auto [pos, inserted] = positions.emplace(std::move(key), merged.size());
                    if (inserted) {
                        merged.push_back(std::move(record));
                    } else {
                        merged[pos->second] = std::move(record);
                    }
                };

                for (auto& record : existing) {
                    upsert(std::move(record));
                }
                for (const auto* row : noteRows) {
                    upsert({row->predicate, toWikiLink(row->targetPath),
                            confidenceToJson(row->confidence), row->sourceField});
                }

                nlohmann::json relations = nlohmann::json::array();
                for (const auto& record : merged) {
                    relations.push_back({{"predicate", record.predicate},
                                         {"target", record.target},
                                         {"confidence", record.confidence},
                                         {"sourceField", record.sourceField}});
                }
                frontmatter[canonicalField] = std::move(relations);
            });
        } catch (const std::exception& e) {
            written = Error{ErrorCode::WriteError, e.what()};
        }

        if (!written) {
            const auto message = "Failed to update " + notePath + ": " + written.error().message;
            spdlog::warn("{}", message);
            result.errors.push_back(message);
            for (const auto* row : noteRows) {
                result.rowResults.push_back(makeResult(*row, RowApplyStatus::Error, message));
            }
            continue;
        }

        ++result.updatedNotes;
        result.writtenRelations += noteRows.size();
        for (const auto* row : noteRows) {
            result.rowResults.push_back(makeResult(*row, RowApplyStatus::Applied, std::nullopt));
        }
    }

    spdlog::debug("Applied semantic batch: notes={}, relations={}, skipped={}, errors={}",
                  result.updatedNotes, result.writtenRelations, result.skippedRows,
                  result.errors.size());
    return result;
}

std::vector<std::string>
SemanticRelationBatchService::validateDraftRow(const SemanticRelationDraftRow& row) {
    std::vector<std::string> reasons;
    if (row.notePath.empty() || row.targetPath.empty() || row.sourceField.empty()) {
        reasons.emplace_back("Missing required fields");
    }
    if (!isCanonicalPredicateName(row.predicate)) {
        reasons.emplace_back("Invalid predicate");
    }
    if (!(std::isfinite(row.confidence) && row.confidence >= 0.0 && row.confidence <= 100.0)) {
        reasons.emplace_back("Confidence out of range");
    }
    return reasons;
}

std::string SemanticRelationBatchService::normalizePathCandidate(const std::string& value,
                                                                 const std::string& sourcePath,
                                                                 bool allowSelfReference) {
    const auto raw = std::string(common::trim(value));
    if (raw.empty()) {
        return {};
    }

    std::string candidate;
    if (auto wrapped = unwrapWikiLink(raw)) {
        candidate = std::string(common::trim(*wrapped));
    } else {
        candidate = raw.substr(0, raw.find('|'));
        candidate = std::string(common::trim(candidate.substr(0, candidate.find('#'))));
    }
    if (candidate.empty()) {
        return {};
    }

    if (auto resolved = store_.resolveLink(candidate, sourcePath)) {
        if (!allowSelfReference && *resolved == sourcePath) {
            return {};
        }
        return *resolved;
    }

    if (candidate.find('/') != std::string::npos || endsWithMd(candidate)) {
        auto withExtension = endsWithMd(candidate) ? candidate : candidate + ".md";
        if (!allowSelfReference && withExtension == sourcePath) {
            return {};
        }
        return withExtension;
    }

    return candidate;
}

std::vector<SemanticRelationDraftRow>
SemanticRelationBatchService::collectVaultRows(const Context& ctx) {
    std::vector<SemanticRelationDraftRow> rows;
    for (const auto& document : store_.listDocuments()) {
        try {
            const auto metadata = store_.getMetadata(document.path);
            if (!metadata || !metadata->frontmatter.is_object()) {
                continue;
            }
            auto noteRows = extractRowsFromFrontmatter(document.path, metadata->frontmatter, ctx);
            rows.insert(rows.end(), std::make_move_iterator(noteRows.begin()),
                        std::make_move_iterator(noteRows.end()));
        } catch (const std::exception& e) {
            spdlog::warn("Failed to inspect {} for semantic relations: {}", document.path,
                         e.what());
        }
    }
    return rows;
}

std::vector<SemanticRelationDraftRow>
SemanticRelationBatchService::collectAdapterRows(const std::vector<ProposalSourceAdapter>& adapters,
                                                 const Context& ctx) {
    std::vector<SemanticRelationDraftRow> rows;
    for (const auto& adapter : adapters) {
        if (!adapter.getProposals) {
            continue;
        }
        try {
            const auto proposals = adapter.getProposals();
            for (std::size_t index = 0; index < proposals.size(); ++index) {
                const auto& proposal = proposals[index];
                const auto predicate = parseSemanticPredicate(proposal.predicate);
                if (!predicate) {
                    continue;
                }

                const auto notePath =
                    normalizePathCandidate(proposal.notePath, proposal.notePath, true);
                const auto targetPath = normalizePathCandidate(
                    proposal.targetPath, notePath.empty() ? proposal.notePath : notePath, false);
                if (notePath.empty() || targetPath.empty()) {
                    continue;
                }

                const std::string predicateName = semanticPredicateName(*predicate);
                SemanticRelationDraftRow row;
                row.id = "adapter:" + adapter.id + ":" + std::to_string(index) + ":" +
                         predicateName + ":" + targetPath;
                row.notePath = notePath;
                row.sourceField =
                    proposal.sourceField ? std::string(common::trim(*proposal.sourceField)) : "";
                if (row.sourceField.empty()) {
                    row.sourceField = "adapter:" + adapter.id;
                }
                row.predicate = predicateName;
                row.targetPath = targetPath;
                if (proposal.confidence) {
                    const nlohmann::json confidence = *proposal.confidence;
                    row.confidence = normalizeConfidencePercent(&confidence, ctx.minimumConfidence);
                } else {
                    row.confidence = ctx.minimumConfidence;
                }
                row.proposalSource = adapter.label.empty() ? adapter.id : adapter.label;
                rows.push_back(std::move(row));
            }
        } catch (const std::exception& e) {
            spdlog::warn("Semantic relation adapter failed: {}: {}", adapter.id, e.what());
        }
    }
    return rows;
}

std::vector<SemanticRelationDraftRow>
SemanticRelationBatchService::extractRowsFromFrontmatter(const std::string& notePath,
                                                         const nlohmann::json& fm,
                                                         const Context& ctx) {
    std::vector<SemanticRelationDraftRow> rows;
    for (const auto& field : ctx.relationFields) {
        if (auto it = fm.find(field); it != fm.end()) {
            collectRowsFromValue(notePath, field, *it, std::nullopt, ctx, rows);
        }
    }
    for (const auto& key : fixedPredicateKeys()) {
        if (auto it = fm.find(key.field); it != fm.end()) {
            collectRowsFromValue(notePath, key.field, *it,
                                 std::string(semanticPredicateName(key.predicate)), ctx, rows);
        }
    }
    return dedupeRows(std::move(rows));
}

void SemanticRelationBatchService::collectRowsFromValue(
    const std::string& notePath, const std::string& sourceField, const nlohmann::json& value,
    const std::optional<std::string>& defaultPredicate, const Context& ctx,
    std::vector<SemanticRelationDraftRow>& out) {
    auto emit = [&](const std::string& predicate, double confidence) {
        return [&, predicate, confidence](std::string targetPath) {
            SemanticRelationDraftRow row;
            row.id = createRowId(notePath, predicate, targetPath);
            row.notePath = notePath;
            row.sourceField = sourceField;
            row.predicate = predicate;
            row.targetPath = std::move(targetPath);
            row.confidence = confidence;
            row.proposalSource = kVaultProposalSource;
            out.push_back(std::move(row));
        };
    };

    switch (value.type()) {
        case nlohmann::json::value_t::string: {
            if (!defaultPredicate) {
                return;
            }
            auto push = emit(*defaultPredicate, ctx.minimumConfidence);
            for (auto& target : resolveTargets(value, notePath)) {
                push(std::move(target));
            }
            return;
        }
        case nlohmann::json::value_t::array:
            for (const auto& entry : value) {
                collectRowsFromValue(notePath, sourceField, entry, defaultPredicate, ctx, out);
            }
            return;
        case nlohmann::json::value_t::object: {
            const auto* predicateValue = firstTruthyField(value, {"predicate", "relation", "type"});
            std::optional<SemanticPredicate> predicate;
            if (predicateValue) {
                predicate = parsePredicateValue(*predicateValue);
            } else if (defaultPredicate) {
                predicate = parseSemanticPredicate(*defaultPredicate);
            }
            if (!predicate) {
                return;
            }

            auto confidenceIt = value.find("confidence");
            const int confidence = normalizeConfidencePercent(
                confidenceIt != value.end() ? &*confidenceIt : nullptr, ctx.minimumConfidence);
            const auto* targetValue =
                firstTruthyField(value, {"target", "to", "entity", "path", "note"});
            if (!targetValue) {
                return;
            }
            auto push = emit(semanticPredicateName(*predicate), confidence);
            for (auto& target : resolveTargets(*targetValue, notePath)) {
                push(std::move(target));
            }
            return;
        }
        default:
            return;
    }
}

std::vector<std::string>
SemanticRelationBatchService::resolveTargets(const nlohmann::json& value,
                                             const std::string& sourcePath) {
    std::vector<std::string> resolved;
    for (const auto& candidate : collectTargetCandidates(value)) {
        auto path = store_.resolveLink(candidate, sourcePath);
        if (!path && !endsWithMd(candidate)) {
            path = store_.resolveLink(candidate + ".md", sourcePath);
        }
        if (path && endsWithMd(*path) && *path != sourcePath &&
            std::find(resolved.begin(), resolved.end(), *path) == resolved.end()) {
            resolved.push_back(std::move(*path));
        }
    }
    return resolved;
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

void to_json(nlohmann::json& j, const SemanticRelationProposal& proposal) {
    j = nlohmann::json{{"notePath", proposal.notePath},
                       {"predicate", proposal.predicate},
                       {"targetPath", proposal.targetPath}};
    if (proposal.confidence) {
        j["confidence"] = *proposal.confidence;
    }
    if (proposal.sourceField) {
        j["sourceField"] = *proposal.sourceField;
    }
}

void from_json(const nlohmann::json& j, SemanticRelationProposal& proposal) {
    proposal.notePath = j.value("notePath", std::string{});
    proposal.predicate = j.value("predicate", std::string{});
    proposal.targetPath = j.value("targetPath", std::string{});
    proposal.confidence.reset();
    if (auto it = j.find("confidence"); it != j.end()) {
        proposal.confidence = toNumber(&*it);
    }
    proposal.sourceField.reset();
    if (auto it = j.find("sourceField"); it != j.end() && it->is_string()) {
        proposal.sourceField = it->get<std::string>();
    }
}

void to_json(nlohmann::json& j, const SemanticRelationDraftRow& row) {
    j = nlohmann::json{{"id", row.id},
                       {"notePath", row.notePath},
                       {"sourceField", row.sourceField},
                       {"predicate", row.predicate},
                       {"targetPath", row.targetPath},
                       {"confidence", confidenceToJson(row.confidence)}};
    if (row.proposalSource) {
        j["proposalSource"] = *row.proposalSource;
    }
}

// Edited rows are untrusted: wrong types become empty values so validation reports them.
void from_json(const nlohmann::json& j, SemanticRelationDraftRow& row) {
    auto str = [&j](const char* key) {
        auto it = j.find(key);
        return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string{};
    };
    row.id = str("id");
    row.notePath = str("notePath");
    row.sourceField = str("sourceField");
    row.predicate = str("predicate");
    row.targetPath = str("targetPath");
    auto confidenceIt = j.find("confidence");
    row.confidence = toNumber(confidenceIt != j.end() ? &*confidenceIt : nullptr)
                         .value_or(std::numeric_limits<double>::quiet_NaN());
    row.proposalSource.reset();
    if (auto it = j.find("proposalSource"); it != j.end() && it->is_string()) {
        row.proposalSource = it->get<std::string>();
    }
}

void to_json(nlohmann::json& j, const SemanticRelationDraftBatch& batch) {
    j = nlohmann::json{{"id", batch.id},
                       {"index", batch.index},
                       {"startRow", batch.startRow},
                       {"endRow", batch.endRow},
                       {"totalRows", batch.totalRows},
                       {"rows", batch.rows}};
}

void to_json(nlohmann::json& j, const ApplyRowResult& result) {
    j = nlohmann::json{{"rowId", result.rowId},
                       {"notePath", result.notePath},
                       {"targetPath", result.targetPath},
                       {"predicate", result.predicate},
                       {"status", rowApplyStatusName(result.status)}};
    if (result.reason) {
        j["reason"] = *result.reason;
    }
}

void to_json(nlohmann::json& j, const ApplyBatchResult& result) {
    j = nlohmann::json{{"updatedNotes", result.updatedNotes},
                       {"writtenRelations", result.writtenRelations},
                       {"skippedRows", result.skippedRows},
                       {"errors", result.errors},
                       {"rowResults", result.rowResults}};
}

} // namespace loregraph::graph
