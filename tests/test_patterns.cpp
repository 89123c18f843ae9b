/*
 * HiveMem C++ - Pattern bank, HNSW and embedding tests
 */
#include "test_support.hpp"
#include <hivemem/patterns/embedding.hpp>
#include <hivemem/patterns/hnsw_index.hpp>
#include <iostream>
#include <cassert>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace hivemem;
using namespace hivemem::testing;

void test_embedding() {
    std::cout << "Testing feature-hashing embeddings..." << std::endl;

    HashEmbedder embedder(128);
    Embedding a = embedder.embed("Retry flaky network calls with backoff");
    Embedding b = embedder.embed("retry FLAKY network calls, with backoff!");
    Embedding c = embedder.embed("Cache compiled templates in memory");

    assert(a.size() == 128);
    assert(a == embedder.embed("Retry flaky network calls with backoff"));
    assert(near(cosine_similarity(a, a), 1.0, 1e-4));
    assert(near(cosine_similarity(a, b), 1.0, 1e-4));
    assert(cosine_similarity(a, c) < 0.5);

    std::cout << "  PASS" << std::endl;
}

void test_hnsw_index() {
    std::cout << "Testing HNSW index..." << std::endl;

    HashEmbedder embedder(64);
    HnswIndex index;
    const char* texts[] = {
        "deploy the service with blue green rollout",
        "rotate database credentials every week",
        "profile hot loops before optimizing",
        "write integration tests for the sync path",
        "cache compiled templates in memory",
    };
    for (int i = 0; i < 5; ++i) {
        index.insert("p" + std::to_string(i), embedder.embed(texts[i]));
    }
    assert(index.size() == 5);

    std::vector<std::pair<std::string, float>> hits =
        index.search(embedder.embed("rotate database credentials every week"), 3);
    assert(!hits.empty());
    assert(hits[0].first == "p1");
    assert(near(hits[0].second, 1.0, 1e-4));
    for (size_t i = 1; i < hits.size(); ++i) {
        assert(hits[i - 1].second >= hits[i].second);
    }

    index.remove("p1");
    assert(index.size() == 4);
    hits = index.search(embedder.embed("rotate database credentials every week"), 5);
    for (const auto& h : hits) {
        assert(h.first != "p1");
    }

    index.remove("p0");
    index.remove("p2");
    index.remove("p3");
    index.remove("p4");
    assert(index.size() == 0);
    assert(index.search(embedder.embed("anything"), 3).empty());

    std::cout << "  PASS" << std::endl;
}

// Six words no other content shares
std::string distinct_content(int n) {
    std::string out;
    for (int j = 0; j < 6; ++j) {
        if (j > 0) out += ' ';
        out += "tok" + std::to_string(n * 6 + j);
    }
    return out;
}

Embedding random_unit(std::mt19937& rng, size_t dim) {
    std::normal_distribution<float> dist(0.0f, 1.0f);
    Embedding v(dim);
    for (auto& x : v) x = dist(rng);
    normalize(v);
    return v;
}

void test_hnsw_reaches_every_node_at_scale() {
    std::cout << "Testing HNSW self-lookup past neighbour list capacity..." << std::endl;

    std::mt19937 rng(42);
    HnswIndex index;
    std::vector<Embedding> vectors;
    const int n = 400;
    for (int i = 0; i < n; ++i) {
        vectors.push_back(random_unit(rng, 32));
        index.insert("v" + std::to_string(i), vectors.back());
    }
    assert(index.size() == static_cast<size_t>(n));

    int misses = 0;
    for (int i = 0; i < n; ++i) {
        std::vector<std::pair<std::string, float>> hit = index.search(vectors[i], 1);
        if (hit.empty() || hit[0].first != "v" + std::to_string(i)) misses++;
    }
    assert(misses <= n / 100);

    // Removing a third of the nodes keeps the rest reachable
    for (int i = 0; i < n; i += 3) {
        index.remove("v" + std::to_string(i));
    }
    misses = 0;
    int remaining = 0;
    for (int i = 0; i < n; ++i) {
        if (i % 3 == 0) continue;
        remaining++;
        std::vector<std::pair<std::string, float>> hit = index.search(vectors[i], 1);
        if (hit.empty() || hit[0].first != "v" + std::to_string(i)) misses++;
    }
    assert(index.size() == static_cast<size_t>(remaining));
    assert(misses <= remaining / 100);

    std::cout << "  PASS" << std::endl;
}

void test_restore_merges_in_large_scope() {
    std::cout << "Testing re-store merges in a scope of 250 patterns..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    PatternBank& bank = engine->patterns();

    const int n = 250;
    std::vector<std::string> ids;
    for (int i = 0; i < n; ++i) {
        Result<PatternStoreResult> r = bank.store_pattern(distinct_content(i), 0.5, "coder", "bulk");
        assert(r.success);
        assert(!r.value.merged);
        ids.push_back(r.value.id);
    }
    assert(bank.count_patterns().value == n);

    for (int i = 0; i < n; ++i) {
        Result<PatternStoreResult> again = bank.store_pattern(distinct_content(i), 0.5, "coder", "bulk");
        assert(again.success);
        assert(again.value.merged);
        assert(again.value.id == ids[i]);
    }
    assert(bank.count_patterns().value == n);
    assert(bank.indexed_count() == static_cast<size_t>(n));
    assert(bank.get_pattern(ids[0]).value.usage_count == 2);

    std::cout << "  PASS" << std::endl;
}

void test_unrated_success_rate() {
    std::cout << "Testing unrated success rates..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    PatternBank& bank = engine->patterns();

    Result<PatternStoreResult> unrated_p = bank.store_pattern("Pin toolchain versions in CI", 0.9, "ops", "ci");
    clock.advance_ms(1);
    Result<PatternStoreResult> rated = bank.store_pattern("Cache dependency downloads", 0.1, "ops", "ci", 0.2);
    assert(unrated_p.success && rated.success);

    Pattern stored = bank.get_pattern(unrated_p.value.id).value;
    assert(!is_rated(stored.success_rate));

    // Measured patterns outrank unrated ones regardless of confidence
    std::vector<Pattern> ci = bank.query_by_domain("ci").value;
    assert(ci.size() == 2);
    assert(ci[0].id == rated.value.id);
    assert(ci[1].id == unrated_p.value.id);

    // Unrated merges leave a measured rate alone, and a first rating sticks
    assert(bank.store_pattern("Cache dependency downloads", 0.1, "ops", "ci").value.merged);
    assert(near(bank.get_pattern(rated.value.id).value.success_rate, 0.2));
    assert(bank.store_pattern("Pin toolchain versions in CI", 0.9, "ops", "ci", 0.6).value.merged);
    assert(near(bank.get_pattern(unrated_p.value.id).value.success_rate, 0.6));

    std::cout << "  PASS" << std::endl;
}

void test_store_during_consolidation() {
    std::cout << "Testing concurrent store and consolidation..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    PatternBank& bank = engine->patterns();

    const int writers = 4;
    const int per_writer = 40;
    std::atomic<bool> failed(false);
    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w) {
        threads.emplace_back([&bank, &failed, w]() {
            for (int i = 0; i < per_writer; ++i) {
                // Every content twice, so consolidation and merges overlap
                std::string content = distinct_content(w * per_writer + i);
                if (!bank.store_pattern(content, 0.5, "swarm", "shared").success) failed = true;
                if (!bank.store_pattern(content, 0.7, "swarm", "shared").success) failed = true;
            }
        });
    }
    threads.emplace_back([&bank]() {
        for (int i = 0; i < 10; ++i) {
            bank.consolidate();
        }
    });
    for (auto& t : threads) t.join();

    assert(!failed);
    Result<int64_t> rows = bank.count_patterns();
    assert(rows.success);
    assert(rows.value == writers * per_writer);
    assert(bank.indexed_count() == static_cast<size_t>(rows.value));

    std::cout << "  PASS" << std::endl;
}

void test_store_merges_near_duplicates() {
    std::cout << "Testing near-duplicate merge on store..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    PatternBank& bank = engine->patterns();

    Result<PatternStoreResult> first =
        bank.store_pattern("Retry flaky network calls with backoff", 0.8, "coder", "net");
    assert(first.success);
    assert(!first.value.merged);

    clock.advance_ms(10);
    Result<PatternStoreResult> second =
        bank.store_pattern("retry flaky network calls, with backoff", 0.6, "coder", "net");
    assert(second.success);
    assert(second.value.merged);
    assert(second.value.id == first.value.id);
    assert(second.value.similarity >= 0.85f);

    Result<Pattern> merged = bank.get_pattern(first.value.id);
    assert(merged.success);
    assert(merged.value.usage_count == 2);
    assert(near(merged.value.confidence, 0.7));
    assert(merged.value.updated_at > merged.value.created_at);
    assert(bank.count_patterns().value == 1);

    // Other scopes never merge into this one
    Result<PatternStoreResult> other =
        bank.store_pattern("Retry flaky network calls with backoff", 0.5, "tester", "net");
    assert(other.success);
    assert(!other.value.merged);
    assert(other.value.id != first.value.id);
    assert(bank.count_patterns().value == 2);
    assert(bank.indexed_count() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_pattern_validation() {
    std::cout << "Testing pattern validation..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    PatternBank& bank = engine->patterns();

    assert(bank.store_pattern("", 0.5).code == ErrorCode::VALIDATION);
    assert(bank.store_pattern("x", 1.5).code == ErrorCode::VALIDATION);
    assert(bank.store_pattern("x", -0.1).code == ErrorCode::VALIDATION);
    assert(bank.store_pattern("x", 0.5, "", "", 2.0).code == ErrorCode::VALIDATION);
    assert(bank.search_similar("x", 0).code == ErrorCode::VALIDATION);
    assert(bank.get_pattern("missing").code == ErrorCode::NOT_FOUND);
    assert(bank.count_patterns().value == 0);

    std::cout << "  PASS" << std::endl;
}

void test_query_and_search() {
    std::cout << "Testing pattern queries..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    PatternBank& bank = engine->patterns();

    Result<PatternStoreResult> weak =
        bank.store_pattern("Log every retry attempt with the peer address", 0.9, "coder", "net", 0.4);
    clock.advance_ms(1);
    Result<PatternStoreResult> strong =
        bank.store_pattern("Use exponential backoff between reconnects", 0.5, "coder", "net", 0.9);
    clock.advance_ms(1);
    assert(bank.store_pattern("Keep migrations idempotent", 0.7, "dba", "storage").success);
    assert(weak.success && strong.success);

    // Success rate first, then confidence
    Result<std::vector<Pattern>> net = bank.query_by_domain("net");
    assert(net.success);
    assert(net.value.size() == 2);
    assert(net.value[0].id == strong.value.id);
    assert(net.value[1].id == weak.value.id);
    assert(bank.query_by_domain("net", 1).value.size() == 1);
    assert(bank.query_by_agent("dba").value.size() == 1);
    assert(bank.query_by_domain("nothing").value.empty());

    Result<std::vector<PatternMatch>> hits = bank.search_similar("exponential backoff between reconnects", 5);
    assert(hits.success);
    assert(!hits.value.empty());
    assert(hits.value[0].pattern.id == strong.value.id);

    Result<std::vector<PatternMatch>> scoped =
        bank.search_similar("Keep migrations idempotent", 5, "coder", "net");
    for (const auto& m : scoped.value) {
        assert(m.pattern.domain == "net");
    }

    assert(bank.delete_pattern(strong.value.id));
    assert(bank.get_pattern(strong.value.id).code == ErrorCode::NOT_FOUND);
    assert(bank.delete_pattern(strong.value.id).code == ErrorCode::NOT_FOUND);
    for (const auto& m : bank.search_similar("exponential backoff between reconnects", 5).value) {
        assert(m.pattern.id != strong.value.id);
    }

    std::cout << "  PASS" << std::endl;
}

void test_consolidation_is_idempotent() {
    std::cout << "Testing consolidation idempotence..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    PatternBank& bank = engine->patterns();
    PatternBankConfig& cfg = engine->context().config.patterns;

    // Store duplicates side by side, then consolidate at the normal threshold
    cfg.similarity_threshold = 1.1;
    assert(bank.store_pattern("Retry flaky network calls with backoff", 0.9, "coder", "net").success);
    clock.advance_ms(1);
    assert(bank.store_pattern("retry flaky network calls with backoff", 0.6, "coder", "net").success);
    clock.advance_ms(1);
    assert(bank.store_pattern("Retry flaky network calls, with backoff.", 0.3, "coder", "net").success);
    clock.advance_ms(1);
    assert(bank.store_pattern("Cache compiled templates in memory", 0.5, "coder", "net").success);
    assert(bank.count_patterns().value == 4);

    cfg.similarity_threshold = 0.85;
    ConsolidationReport first = bank.consolidate();
    assert(first.patterns_scanned == 4);
    assert(first.domains_scanned == 1);
    assert(first.clusters_merged == 1);
    assert(first.patterns_removed == 2);
    assert(bank.count_patterns().value == 2);

    std::set<std::string> ids_after_first;
    bool found_merged = false;
    for (const auto& p : bank.query_by_domain("net").value) {
        ids_after_first.insert(p.id);
        if (p.usage_count == 3) {
            found_merged = true;
            assert(near(p.confidence, 0.6));
        }
    }
    assert(found_merged);

    ConsolidationReport second = bank.consolidate();
    assert(second.clusters_merged == 0);
    assert(second.patterns_removed == 0);
    assert(bank.count_patterns().value == 2);
    std::set<std::string> ids_after_second;
    for (const auto& p : bank.query_by_domain("net").value) {
        ids_after_second.insert(p.id);
    }
    assert(ids_after_first == ids_after_second);

    std::cout << "  PASS" << std::endl;
}

void test_consolidation_conflict_keeps_earliest() {
    std::cout << "Testing consolidation tie-break..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    PatternBank& bank = engine->patterns();
    PatternBankConfig& cfg = engine->context().config.patterns;

    cfg.similarity_threshold = 1.1;
    Result<PatternStoreResult> older = bank.store_pattern("Pin dependency versions", 0.5, "", "build");
    clock.advance_s(5);
    Result<PatternStoreResult> newer = bank.store_pattern("Pin dependency versions", 0.5, "", "build");
    assert(older.success && newer.success);
    assert(older.value.id != newer.value.id);

    cfg.similarity_threshold = 0.85;
    ConsolidationReport report = bank.consolidate();
    assert(report.clusters_merged == 1);
    assert(report.conflicts_resolved == 1);
    assert(bank.get_pattern(older.value.id).success);
    assert(bank.get_pattern(newer.value.id).code == ErrorCode::NOT_FOUND);
    assert(bank.get_pattern(older.value.id).value.usage_count == 2);

    std::cout << "  PASS" << std::endl;
}

void test_consolidation_prunes_low_confidence() {
    std::cout << "Testing low-confidence pruning..." << std::endl;

    ManualClock clock;
    auto engine = start_engine(clock);
    PatternBank& bank = engine->patterns();

    Result<PatternStoreResult> low = bank.store_pattern("Guess the config format", 0.1, "coder", "misc");
    Result<PatternStoreResult> high = bank.store_pattern("Validate config on load", 0.8, "coder", "misc");
    assert(low.success && high.success);

    // Disabled by default
    assert(bank.consolidate().patterns_pruned == 0);
    assert(bank.count_patterns().value == 2);

    engine->context().config.patterns.min_confidence = 0.3;
    engine->run_consolidation();
    assert(bank.count_patterns().value == 1);
    assert(bank.get_pattern(low.value.id).code == ErrorCode::NOT_FOUND);
    assert(bank.get_pattern(high.value.id).success);
    assert(bank.indexed_count() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_quality_score() {
    std::cout << "Testing quality score..." << std::endl;

    Pattern p;
    p.content = "Validate every inbound sync delta before applying entries";
    p.usage_count = 1;
    p.success_rate = 1.0;
    double good = PatternBank::quality_score(p);

    Pattern q = p;
    q.success_rate = 0.0;
    assert(PatternBank::quality_score(q) < good);

    Pattern used = p;
    used.usage_count = 31;
    assert(PatternBank::quality_score(used) > good);

    assert(good >= 0.0 && good <= 1.0);

    std::cout << "  PASS" << std::endl;
}

int main() {
    quiet_logs();
    std::cout << "=== HiveMem Pattern Tests ===" << std::endl;

    test_embedding();
    test_hnsw_index();
    test_hnsw_reaches_every_node_at_scale();
    test_store_merges_near_duplicates();
    test_restore_merges_in_large_scope();
    test_unrated_success_rate();
    test_pattern_validation();
    test_query_and_search();
    test_consolidation_is_idempotent();
    test_consolidation_conflict_keeps_earliest();
    test_consolidation_prunes_low_confidence();
    test_store_during_consolidation();
    test_quality_score();

    std::cout << std::endl << "All pattern tests passed." << std::endl;
    return 0;
}
