#pragma once

#include <loregraph/config/settings.h>
#include <loregraph/host/document_store.h>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace loregraph::graph {

/**
 * One relation proposal from an external source (an AI pass, a tool output, an import).
 * Predicates and paths are free-form until normalized by the batch service.
 */
struct SemanticRelationProposal {
    std::string notePath;
    std::string predicate;
    std::string targetPath;
    std::optional<double> confidence; // 0-1 fraction or 0-100 percent
    std::optional<std::string> sourceField;
};

/**
 * Editable draft row. Rows built by the service always carry a canonical predicate and an
 * integer confidence in [0, 100]; edited rows coming back may carry anything and are validated.
 */
struct SemanticRelationDraftRow {
    std::string id;
    std::string notePath;
    std::string sourceField;
    std::string predicate;
    std::string targetPath;
    double confidence = 0.0; // 0-100
    std::optional<std::string> proposalSource;
};

struct SemanticRelationDraftBatch {
    std::string id; // "semantic-batch-{index+1}"
    std::size_t index = 0;
    std::size_t startRow = 0; // 1-based, inclusive
    std::size_t endRow = 0;   // inclusive
    std::size_t totalRows = 0;
    std::vector<SemanticRelationDraftRow> rows;
};

/**
 * Pluggable proposal source surfaced in the draft batches.
 */
struct ProposalSourceAdapter {
    std::string id;
    std::string label; // Shown as proposalSource; falls back to id when empty
    std::function<std::vector<SemanticRelationProposal>()> getProposals;
};

struct DraftBatchBuildOptions {
    bool includeVaultDrafts = true;
    std::vector<ProposalSourceAdapter> proposalAdapters;
};

enum class RowApplyStatus { Applied, Skipped, Error };

const char* rowApplyStatusName(RowApplyStatus status) noexcept;

struct ApplyRowResult {
    std::string rowId;
    std::string notePath;
    std::string targetPath;
    std::string predicate;
    RowApplyStatus status = RowApplyStatus::Applied;
    std::optional<std::string> reason;
};

struct ApplyBatchResult {
    std::size_t updatedNotes = 0;
    std::size_t writtenRelations = 0;
    std::size_t skippedRows = 0;
    std::vector<std::string> errors;
    std::vector<ApplyRowResult> rowResults;
};

/**
 * Builds reviewable batches of semantic relation rows from front matter and proposal adapters,
 * and writes edited batches back into each note's canonical relation field.
 */
class SemanticRelationBatchService {
public:
    SemanticRelationBatchService(host::DocumentStore& store, config::SettingsStore& settings);

    /**
     * Collect rows from eligible documents' front matter (unless disabled) and from every
     * adapter, dedupe by (note, predicate, target) keeping the highest confidence, sort by
     * note path, predicate and target path, and chunk by the configured batch size.
     */
    std::vector<SemanticRelationDraftBatch>
    buildDraftBatches(const DraftBatchBuildOptions& options = DraftBatchBuildOptions{});

    /**
     * Validate rows, then merge the valid ones into the first configured relation field of each
     * note. Per-note failures are reported in the result; nothing throws.
     */
    ApplyBatchResult applyEditedBatch(const std::vector<SemanticRelationDraftRow>& rows);

    // Empty when the row may be persisted.
    static std::vector<std::string> validateDraftRow(const SemanticRelationDraftRow& row);

    /**
     * Normalize an adapter-supplied path: strips wiki wrappers, "#section" and "|alias", resolves
     * through the host, and falls back to "{value}.md" for path-like values.
     * Returns an empty string for unusable values (and for self references when not allowed).
     */
    std::string normalizePathCandidate(const std::string& value, const std::string& sourcePath,
                                       bool allowSelfReference);

private:
    struct Context {
        int minimumConfidence = 70;
        std::vector<std::string> relationFields;
    };

    Context currentContext() const;

    std::vector<SemanticRelationDraftRow> collectVaultRows(const Context& ctx);
    std::vector<SemanticRelationDraftRow>
    collectAdapterRows(const std::vector<ProposalSourceAdapter>& adapters, const Context& ctx);
    std::vector<SemanticRelationDraftRow> extractRowsFromFrontmatter(const std::string& notePath,
                                                                     const nlohmann::json& fm,
                                                                     const Context& ctx);
    void collectRowsFromValue(const std::string& notePath, const std::string& sourceField,
                              const nlohmann::json& value,
                              const std::optional<std::string>& defaultPredicate,
                              const Context& ctx, std::vector<SemanticRelationDraftRow>& out);
    std::vector<std::string> resolveTargets(const nlohmann::json& value,
                                            const std::string& sourcePath);

    host::DocumentStore& store_;
    config::SettingsStore& settings_;
};

// Draft rows travel to and from the editing surface as JSON.
void to_json(nlohmann::json& j, const SemanticRelationProposal& proposal);
void from_json(const nlohmann::json& j, SemanticRelationProposal& proposal);
void to_json(nlohmann::json& j, const SemanticRelationDraftRow& row);
void from_json(const nlohmann::json& j, SemanticRelationDraftRow& row);
void to_json(nlohmann::json& j, const SemanticRelationDraftBatch& batch);
void to_json(nlohmann::json& j, const ApplyRowResult& result);
void to_json(nlohmann::json& j, const ApplyBatchResult& result);

} // namespace loregraph::graph
