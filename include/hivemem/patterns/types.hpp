/*
 * HiveMem C++ - Pattern types
 */
#ifndef hivemem_PATTERNS_TYPES_HPP
#define hivemem_PATTERNS_TYPES_HPP

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace hivemem {

typedef std::vector<float> Embedding;

// Success rate of a pattern nobody has rated yet (stored as NULL)
inline double unrated() { return std::numeric_limits<double>::quiet_NaN(); }
inline bool is_rated(double success_rate) { return !std::isnan(success_rate); }

struct PatternBankConfig {
    double similarity_threshold;    // merge at or above this cosine similarity
    int embedding_dim;
    double min_confidence;          // consolidation drops clusters below this
    int hnsw_m;
    int hnsw_ef_construction;
    int hnsw_ef_search;

    PatternBankConfig()
        : similarity_threshold(0.85)
        , embedding_dim(256)
        , min_confidence(0.0)
        , hnsw_m(16)
        , hnsw_ef_construction(200)
        , hnsw_ef_search(50)
    {}
};

struct Pattern {
    std::string id;
    std::string content;
    Embedding embedding;        // unit length
    double confidence;          // [0, 1]
    int64_t usage_count;
    double success_rate;        // [0, 1], or unrated()
    std::string agent_id;       // empty = not agent scoped
    std::string domain;         // empty = not domain scoped
    int64_t created_at;         // unix ms
    int64_t updated_at;         // unix ms

    Pattern() : confidence(0.0), usage_count(1), success_rate(unrated()), created_at(0), updated_at(0) {}
};

struct PatternMatch {
    Pattern pattern;
    float similarity;

    PatternMatch() : similarity(0.0f) {}
};

// Outcome of storePattern
struct PatternStoreResult {
    std::string id;
    bool merged;                // true when folded into an existing pattern
    float similarity;           // similarity to the merge target

    PatternStoreResult() : merged(false), similarity(0.0f) {}
};

struct ConsolidationReport {
    int domains_scanned;
    int patterns_scanned;
    int clusters_merged;
    int patterns_removed;
    int conflicts_resolved;
    int patterns_pruned;        // below min_confidence, logged individually
    int64_t duration_ms;

    ConsolidationReport()
        : domains_scanned(0), patterns_scanned(0), clusters_merged(0)
        , patterns_removed(0), conflicts_resolved(0), patterns_pruned(0), duration_ms(0) {}
};

} // namespace hivemem

#endif // hivemem_PATTERNS_TYPES_HPP
