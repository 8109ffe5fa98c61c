#pragma once
#include "config.hpp"
#include "duplicate_detector.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace sift {

// ── Staged item status ──────────────────────────────────────────

enum class ImportStatus { Pending, DuplicateDetected };

std::string import_status_to_string(ImportStatus status);

// Top similarity above which a staged item is flagged as a duplicate
constexpr double kDuplicateStatusThreshold = 0.95;

ImportStatus classify(const std::vector<DuplicateMatch>& matches);

// ── Duplicate summary ───────────────────────────────────────────

enum class RecommendedAction { Import, Merge, Skip, Review };

std::string recommended_action_to_string(RecommendedAction action);

struct DuplicateSummary {
    bool has_duplicates = false;
    uint32_t duplicate_count = 0;
    double highest_similarity = 0.0;
    RecommendedAction recommended_action = RecommendedAction::Import;
    std::vector<DuplicateMatch> matches;
};

// Expects matches ordered best-first, as check_for_duplicates returns them.
DuplicateSummary summarize(const std::vector<DuplicateMatch>& matches);

// ── Batch review ────────────────────────────────────────────────

struct StagedItem {
    std::string id;
    std::string name;
    std::string content;
};

struct ReviewOutcome {
    std::string staged_id;
    ImportStatus status = ImportStatus::Pending;
    DuplicateSummary summary;
};

// Check every staged item against the owner's library, at most wave_size
// at a time. Outcomes are returned in input order.
std::vector<ReviewOutcome> review_batch(DuplicateDetector& detector,
                                        const std::vector<StagedItem>& items,
                                        const std::string& owner_id,
                                        const DetectionOptions& options,
                                        uint32_t wave_size);

} // namespace sift
