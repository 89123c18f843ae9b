/*
 * HiveMem C++ - Pattern Bank
 *
 * Reusable knowledge with hashed embeddings and one HNSW index per
 * (agent, domain) scope. Row writes and index writes happen under the
 * database lock, so the index and the patterns table never disagree.
 */
#ifndef hivemem_PATTERNS_PATTERN_BANK_HPP
#define hivemem_PATTERNS_PATTERN_BANK_HPP

#include <hivemem/core/result.hpp>
#include <hivemem/engine/context.hpp>
#include <hivemem/patterns/embedding.hpp>
#include <hivemem/patterns/hnsw_index.hpp>
#include <hivemem/patterns/types.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace hivemem {

class PatternBank {
public:
    explicit PatternBank(EngineContext& ctx);

    // Create/migrate the patterns table and rebuild every scope index
    bool init();

    // Inserts a new pattern, or merges into the nearest pattern of the same
    // (agent, domain) scope when similarity >= threshold. An unrated
    // success rate leaves the stored rate untouched on merge.
    Result<PatternStoreResult> store_pattern(const std::string& content, double confidence,
                                             const std::string& agent_id = "",
                                             const std::string& domain = "",
                                             double success_rate = unrated());

    Result<Pattern> get_pattern(const std::string& id);
    Status delete_pattern(const std::string& id);
    Result<int64_t> count_patterns();

    // Ordered by success rate, then confidence (both descending); unrated last
    Result<std::vector<Pattern>> query_by_domain(const std::string& domain, int limit = 100);
    Result<std::vector<Pattern>> query_by_agent(const std::string& agent_id, int limit = 100);

    // Nearest patterns to content. With neither agent nor domain given,
    // every scope is searched.
    Result<std::vector<PatternMatch>> search_similar(const std::string& content, int k,
                                                     const std::string& agent_id = "",
                                                     const std::string& domain = "");

    // Clusters each scope by similarity and folds every cluster into its
    // best pattern. Never throws; failures are logged.
    ConsolidationReport consolidate();

    // Weighted readability/completeness/specificity/reusability/success
    static double quality_score(const Pattern& p);

    size_t indexed_count() const;

private:
    bool ensure_schema();
    Result<Pattern> load(const std::string& id);
    Result<std::vector<Pattern>> load_where(const std::string& where, const std::string& arg, int limit);
    HnswIndex& index_for(const std::string& agent_id, const std::string& domain);
    void merge_cluster(const std::vector<std::string>& ids, ConsolidationReport& report);
    void prune_low_confidence(ConsolidationReport& report);

    static std::string scope_key(const std::string& agent_id, const std::string& domain);

    EngineContext& ctx_;
    HashEmbedder embedder_;
    HnswConfig hnsw_config_;
    bool schema_ready_;
    // scope key -> index, guarded by ctx_.db.mutex()
    std::map<std::string, std::unique_ptr<HnswIndex>> indexes_;
};

} // namespace hivemem

#endif // hivemem_PATTERNS_PATTERN_BANK_HPP
