#include "duplicate_detector.hpp"
#include "embedding_generator.hpp"
#include "errors.hpp"
#include "similarity/fingerprint.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

namespace sift {

std::string match_type_to_string(MatchType type) {
    switch (type) {
        case MatchType::Exact:      return "exact";
        case MatchType::Structural: return "structural";
        case MatchType::Semantic:   return "semantic";
    }
    return "semantic";
}

static bool match_order(const DuplicateMatch& a, const DuplicateMatch& b) {
    if (a.similarity != b.similarity) return a.similarity > b.similarity;
    return a.existing_item_id < b.existing_item_id;
}

std::vector<DuplicateMatch> fuse_matches(const std::vector<DuplicateMatch>& matches,
                                         uint32_t limit) {
    std::vector<DuplicateMatch> fused;
    std::unordered_map<std::string, size_t> index; // item id -> fused index

    for (const auto& m : matches) {
        auto it = index.find(m.existing_item_id);
        if (it == index.end()) {
            index.emplace(m.existing_item_id, fused.size());
            fused.push_back(m);
        } else if (m.similarity > fused[it->second].similarity) {
            fused[it->second] = m;
        }
    }

    std::sort(fused.begin(), fused.end(), match_order);
    if (fused.size() > limit) fused.resize(limit);
    return fused;
}

DuplicateDetector::DuplicateDetector(ContentStore& store, const EmbeddingGenerator* generator)
    : store_(store), embeddings_(store), search_(embeddings_, generator), generator_(generator) {}

DetectorStats DuplicateDetector::stats() const {
    DetectorStats s;
    s.calls = calls_.load();
    s.exact_runs = exact_runs_.load();
    s.structural_runs = structural_runs_.load();
    s.semantic_runs = semantic_runs_.load();
    s.stage_failures = stage_failures_.load();
    return s;
}

std::vector<DuplicateMatch> DuplicateDetector::check_for_duplicates(
    const std::string& content, const std::string& name,
    const std::string& owner_id, const DetectionOptions& options) {
    calls_++;
    if (options.max_candidates == 0) return {};

    // Stage 1: exact. Any hit ends the cascade.
    if (options.enable_exact) {
        exact_runs_++;
        try {
            auto exact = find_exact(content, owner_id, options);
            if (!exact.empty()) return exact;
        } catch (const StoreError& e) {
            stage_failures_++;
            std::cerr << "[duplicates] Exact check failed for \"" << name
                      << "\": " << e.what() << "\n";
        }
    }

    std::vector<DuplicateMatch> matches;

    // Stage 2: structural
    if (options.enable_structural) {
        structural_runs_++;
        try {
            auto structural = find_structural(content, owner_id, options);
            matches.insert(matches.end(), structural.begin(), structural.end());
        } catch (const StoreError& e) {
            stage_failures_++;
            std::cerr << "[duplicates] Structural check failed for \"" << name
                      << "\": " << e.what() << "\n";
        }
    }

    // Stage 3: semantic, excluding what stage 2 already found
    if (options.enable_semantic) {
        semantic_runs_++;
        std::vector<std::string> exclude;
        exclude.reserve(matches.size());
        for (const auto& m : matches) exclude.push_back(m.existing_item_id);

        try {
            auto semantic = find_semantic(content, owner_id, options, exclude);
            matches.insert(matches.end(), semantic.begin(), semantic.end());
        } catch (const ProviderError& e) {
            stage_failures_++;
            std::cerr << "[duplicates] Semantic check failed for \"" << name
                      << "\": " << e.what() << "\n";
        } catch (const StoreError& e) {
            stage_failures_++;
            std::cerr << "[duplicates] Semantic check failed for \"" << name
                      << "\": " << e.what() << "\n";
        } catch (const DimensionMismatch& e) {
            stage_failures_++;
            std::cerr << "[duplicates] Semantic check failed for \"" << name
                      << "\": " << e.what() << "\n";
        }
    }

    return fuse_matches(matches, options.max_candidates);
}

std::vector<DuplicateMatch> DuplicateDetector::find_exact(const std::string& content,
                                                          const std::string& owner_id,
                                                          const DetectionOptions& options) {
    std::string normalized = normalize_content(content);
    // Punctuation-only input normalizes to "" and would match every such item
    if (normalized.empty()) return {};

    std::vector<DuplicateMatch> matches;
    for (const auto& item : store_.find_exact_content_matches(owner_id, normalized)) {
        DuplicateMatch m;
        m.existing_item_id = item.id;
        m.similarity = 1.0;
        m.match_type = MatchType::Exact;
        m.confidence = kExactConfidence;
        m.should_merge = true;
        m.canonical_id = resolve_canonical(item, owner_id);
        matches.push_back(std::move(m));
    }

    std::sort(matches.begin(), matches.end(), match_order);
    if (matches.size() > options.max_candidates) matches.resize(options.max_candidates);
    return matches;
}

std::vector<DuplicateMatch> DuplicateDetector::find_structural(const std::string& content,
                                                               const std::string& owner_id,
                                                               const DetectionOptions& options) {
    uint32_t factor = std::max<uint32_t>(options.candidate_pool_factor, 1);
    auto candidates = store_.list_owner_items(owner_id, options.max_candidates * factor);

    Fingerprint incoming = extract_fingerprint(content);

    std::vector<DuplicateMatch> matches;
    for (const auto& candidate : candidates) {
        double sim = fingerprint_similarity(incoming, extract_fingerprint(candidate.content));
        if (sim < options.threshold) continue;

        DuplicateMatch m;
        m.existing_item_id = candidate.id;
        m.similarity = sim;
        m.match_type = MatchType::Structural;
        m.confidence = kStructuralConfidence;
        m.should_merge = sim > kMergeThreshold;
        m.canonical_id = resolve_canonical(candidate, owner_id);
        matches.push_back(std::move(m));
    }

    std::sort(matches.begin(), matches.end(), match_order);
    if (matches.size() > options.max_candidates) matches.resize(options.max_candidates);
    return matches;
}

std::vector<DuplicateMatch> DuplicateDetector::find_semantic(
    const std::string& content, const std::string& owner_id,
    const DetectionOptions& options, const std::vector<std::string>& exclude_ids) {
    if (!generator_) {
        std::cerr << "[duplicates] Semantic check skipped: no embedder configured\n";
        return {};
    }

    EmbeddingResult query = generator_->generate(content);

    RankOptions rank_opts;
    rank_opts.limit = options.max_candidates * 2;
    rank_opts.threshold = options.threshold;
    rank_opts.exclude_ids = exclude_ids;
    rank_opts.provider = query.provider;
    rank_opts.model = query.model;
    auto similar = search_.rank(query.vector, owner_id, rank_opts);
    if (similar.empty()) return {};

    std::vector<std::string> ids;
    ids.reserve(similar.size());
    for (const auto& s : similar) ids.push_back(s.item_id);

    // Vectors can outlive their items; only keep ids the library still has
    std::unordered_map<std::string, ItemRef> items;
    for (auto& item : store_.get_items(owner_id, ids)) {
        std::string id = item.id;
        items.emplace(std::move(id), std::move(item));
    }

    std::vector<DuplicateMatch> matches;
    for (const auto& s : similar) {
        auto it = items.find(s.item_id);
        if (it == items.end()) continue;

        DuplicateMatch m;
        m.existing_item_id = s.item_id;
        m.similarity = s.similarity;
        m.match_type = MatchType::Semantic;
        m.confidence = kSemanticConfidence;
        m.should_merge = s.similarity > kMergeThreshold;
        m.canonical_id = resolve_canonical(it->second, owner_id);
        matches.push_back(std::move(m));
        if (matches.size() >= options.max_candidates) break;
    }
    return matches;
}

std::string DuplicateDetector::resolve_canonical(const ItemRef& item,
                                                 const std::string& owner_id) {
    if (item.is_canonical || item.canonical_id.empty()) return item.id;

    std::unordered_set<std::string> visited = {item.id};
    std::string target = item.canonical_id;
    try {
        for (int hop = 0; hop < kMaxCanonicalHops; hop++) {
            if (!visited.insert(target).second) break; // alias cycle

            auto refs = store_.get_items(owner_id, {target});
            if (refs.empty()) break; // dangling alias

            const ItemRef& next = refs.front();
            if (next.is_canonical || next.canonical_id.empty()) return next.id;
            target = next.canonical_id;
        }
    } catch (const StoreError& e) {
        std::cerr << "[duplicates] Canonical lookup failed for " << item.id
                  << ": " << e.what() << "\n";
    }
    return item.id;
}

} // namespace sift
