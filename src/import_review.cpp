#include "import_review.hpp"
#include <algorithm>
#include <iostream>
#include <thread>

namespace sift {

std::string import_status_to_string(ImportStatus status) {
    switch (status) {
        case ImportStatus::Pending:           return "pending";
        case ImportStatus::DuplicateDetected: return "duplicate_detected";
    }
    return "pending";
}

ImportStatus classify(const std::vector<DuplicateMatch>& matches) {
    double top = 0.0;
    for (const auto& m : matches) top = std::max(top, m.similarity);
    return top > kDuplicateStatusThreshold ? ImportStatus::DuplicateDetected
                                           : ImportStatus::Pending;
}

std::string recommended_action_to_string(RecommendedAction action) {
    switch (action) {
        case RecommendedAction::Import: return "import";
        case RecommendedAction::Merge:  return "merge";
        case RecommendedAction::Skip:   return "skip";
        case RecommendedAction::Review: return "review";
    }
    return "review";
}

DuplicateSummary summarize(const std::vector<DuplicateMatch>& matches) {
    DuplicateSummary summary;
    summary.matches = matches;
    summary.duplicate_count = static_cast<uint32_t>(matches.size());
    summary.has_duplicates = !matches.empty();
    if (matches.empty()) return summary;

    const DuplicateMatch& top = matches.front();
    for (const auto& m : matches) {
        summary.highest_similarity = std::max(summary.highest_similarity, m.similarity);
    }

    if (top.match_type == MatchType::Exact) {
        summary.recommended_action = RecommendedAction::Skip;
    } else if (top.should_merge) {
        summary.recommended_action = RecommendedAction::Merge;
    } else {
        summary.recommended_action = RecommendedAction::Review;
    }
    return summary;
}

std::vector<ReviewOutcome> review_batch(DuplicateDetector& detector,
                                        const std::vector<StagedItem>& items,
                                        const std::string& owner_id,
                                        const DetectionOptions& options,
                                        uint32_t wave_size) {
    if (wave_size == 0) wave_size = 1;

    std::vector<ReviewOutcome> outcomes(items.size());
    for (size_t start = 0; start < items.size(); start += wave_size) {
        size_t end = std::min(items.size(), start + wave_size);

        std::vector<std::thread> wave;
        wave.reserve(end - start);
        for (size_t i = start; i < end; i++) {
            wave.emplace_back([&, i]() {
                ReviewOutcome& out = outcomes[i];
                out.staged_id = items[i].id;
                try {
                    auto matches = detector.check_for_duplicates(
                        items[i].content, items[i].name, owner_id, options);
                    out.status = classify(matches);
                    out.summary = summarize(matches);
                } catch (const std::exception& e) {
                    // Left pending for manual review
                    std::cerr << "[duplicates] Review failed for staged item "
                              << items[i].id << ": " << e.what() << "\n";
                }
            });
        }
        for (auto& t : wave) t.join();
    }
    return outcomes;
}

} // namespace sift
