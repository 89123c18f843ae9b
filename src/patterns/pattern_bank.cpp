/*
 * HiveMem C++ - Pattern Bank Implementation
 */
#include <hivemem/patterns/pattern_bank.hpp>
#include <hivemem/core/logger.hpp>
#include <hivemem/core/utils.hpp>
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace hivemem {

namespace {

const char* kPatternColumns =
    "id, content, embedding, confidence, usage_count, success_rate, "
    "agent_id, domain, created_at, updated_at";

Pattern pattern_from_stmt(const Statement& stmt) {
    Pattern p;
    p.id = stmt.column_text(0);
    p.content = stmt.column_text(1);
    p.embedding = HashEmbedder::from_blob(stmt.column_blob(2));
    p.confidence = stmt.column_double(3);
    p.usage_count = stmt.column_int64(4);
    p.success_rate = stmt.column_is_null(5) ? unrated() : stmt.column_double(5);
    p.agent_id = stmt.column_text(6);
    p.domain = stmt.column_text(7);
    p.created_at = stmt.column_int64(8);
    p.updated_at = stmt.column_int64(9);
    return p;
}

// Higher quality first; equal quality resolves to the earliest created
bool ranks_before(const Pattern& a, double qa, const Pattern& b, double qb) {
    if (qa != qb) return qa > qb;
    if (a.created_at != b.created_at) return a.created_at < b.created_at;
    return a.id < b.id;
}

double weighted(double a, int64_t wa, double b, int64_t wb) {
    int64_t total = wa + wb;
    if (total <= 0) return (a + b) / 2.0;
    return (a * static_cast<double>(wa) + b * static_cast<double>(wb)) / static_cast<double>(total);
}

// Unrated sides do not take part in the average
double merge_rates(double a, int64_t wa, double b, int64_t wb) {
    if (!is_rated(a)) return b;
    if (!is_rated(b)) return a;
    return weighted(a, wa, b, wb);
}

void bind_rate(Statement& stmt, int index, double success_rate) {
    if (is_rated(success_rate)) {
        stmt.bind_double(index, success_rate);
    } else {
        stmt.bind_null(index);
    }
}

} // anonymous namespace

PatternBank::PatternBank(EngineContext& ctx)
    : ctx_(ctx)
    , embedder_(ctx.config.patterns.embedding_dim)
    , schema_ready_(false)
{
    hnsw_config_.M = static_cast<size_t>(std::max(2, ctx.config.patterns.hnsw_m));
    hnsw_config_.ef_construction = static_cast<size_t>(std::max(1, ctx.config.patterns.hnsw_ef_construction));
    hnsw_config_.ef_search = static_cast<size_t>(std::max(1, ctx.config.patterns.hnsw_ef_search));
}

std::string PatternBank::scope_key(const std::string& agent_id, const std::string& domain) {
    return agent_id + '\x1f' + domain;
}

bool PatternBank::ensure_schema() {
    if (schema_ready_) return true;
    if (!ctx_.db.ensure_table("patterns", {
            "CREATE TABLE IF NOT EXISTS patterns ("
            "  id TEXT PRIMARY KEY,"
            "  content TEXT NOT NULL,"
            "  confidence REAL NOT NULL DEFAULT 0.5,"
            "  usage_count INTEGER NOT NULL DEFAULT 1,"
            "  created_at INTEGER NOT NULL,"
            "  updated_at INTEGER NOT NULL"
            ")"})) {
        return false;
    }
    // Older databases predate scoping and embeddings
    schema_ready_ = ctx_.db.add_column_if_missing("patterns", "embedding", "BLOB") &&
           ctx_.db.add_column_if_missing("patterns", "success_rate", "REAL") &&
           ctx_.db.add_column_if_missing("patterns", "agent_id", "TEXT") &&
           ctx_.db.add_column_if_missing("patterns", "domain", "TEXT") &&
           ctx_.db.exec("CREATE INDEX IF NOT EXISTS idx_patterns_domain ON patterns(domain)") &&
           ctx_.db.exec("CREATE INDEX IF NOT EXISTS idx_patterns_agent ON patterns(agent_id)");
    return schema_ready_;
}

HnswIndex& PatternBank::index_for(const std::string& agent_id, const std::string& domain) {
    std::unique_ptr<HnswIndex>& slot = indexes_[scope_key(agent_id, domain)];
    if (!slot) {
        slot.reset(new HnswIndex(hnsw_config_));
    }
    return *slot;
}

bool PatternBank::init() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        LOG_ERROR("[PatternBank] Schema setup failed: %s", ctx_.db.last_error().c_str());
        return false;
    }

    indexes_.clear();
    std::vector<Pattern> stale;
    {
        Statement stmt(ctx_.db, std::string("SELECT ") + kPatternColumns + " FROM patterns");
        if (!stmt.ok()) return false;
        while (stmt.step_row()) {
            Pattern p = pattern_from_stmt(stmt);
            if (p.embedding.size() != static_cast<size_t>(embedder_.dim())) {
                p.embedding = embedder_.embed(p.content);
                stale.push_back(p);
            }
            index_for(p.agent_id, p.domain).insert(p.id, p.embedding);
        }
        if (!stmt.error().empty()) return false;
    }

    // Rows written without an embedding, or with another dimension
    for (const auto& p : stale) {
        Statement upd(ctx_.db, "UPDATE patterns SET embedding = ? WHERE id = ?");
        std::string blob = HashEmbedder::to_blob(p.embedding);
        upd.bind_blob(1, blob.data(), blob.size());
        upd.bind_text(2, p.id);
        if (!upd.run()) return false;
    }

    LOG_INFO("[PatternBank] Indexed %zu patterns across %zu scopes (%zu re-embedded)",
             indexed_count(), indexes_.size(), stale.size());
    return true;
}

// ============================================================================
// Store / Merge
// ============================================================================

Result<PatternStoreResult> PatternBank::store_pattern(const std::string& content, double confidence,
                                                     const std::string& agent_id,
                                                     const std::string& domain,
                                                     double success_rate) {
    if (trim(content).empty()) {
        return Result<PatternStoreResult>::fail(ErrorCode::VALIDATION, "pattern content must not be empty");
    }
    if (confidence < 0.0 || confidence > 1.0) {
        return Result<PatternStoreResult>::fail(ErrorCode::VALIDATION, "confidence must be within [0, 1]");
    }
    if (is_rated(success_rate) && (success_rate < 0.0 || success_rate > 1.0)) {
        return Result<PatternStoreResult>::fail(ErrorCode::VALIDATION, "successRate must be within [0, 1]");
    }

    Embedding embedding = embedder_.embed(content);

    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<PatternStoreResult>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    HnswIndex& index = index_for(agent_id, domain);
    int64_t now = ctx_.now_ms();
    PatternStoreResult out;

    std::vector<std::pair<std::string, float>> nearest = index.search(embedding, 1);
    if (!nearest.empty() && nearest[0].second >= ctx_.config.patterns.similarity_threshold) {
        Result<Pattern> existing = load(nearest[0].first);
        if (!existing) {
            return Result<PatternStoreResult>::fail(existing.status());
        }
        Pattern& p = existing.value;
        double merged_confidence = weighted(p.confidence, p.usage_count, confidence, 1);
        double merged_success = merge_rates(p.success_rate, p.usage_count, success_rate, 1);

        Statement stmt(ctx_.db,
            "UPDATE patterns SET usage_count = usage_count + 1, confidence = ?, success_rate = ?, "
            "updated_at = ? WHERE id = ?");
        if (!stmt.ok()) {
            return Result<PatternStoreResult>::fail(ErrorCode::STORAGE, stmt.error());
        }
        stmt.bind_double(1, merged_confidence);
        bind_rate(stmt, 2, merged_success);
        stmt.bind_int64(3, now);
        stmt.bind_text(4, p.id);
        if (!stmt.run()) {
            return Result<PatternStoreResult>::fail(ErrorCode::STORAGE, stmt.error());
        }

        out.id = p.id;
        out.merged = true;
        out.similarity = nearest[0].second;
        LOG_DEBUG("[PatternBank] Merged into %s (similarity %.3f, usage %lld)", p.id.c_str(),
                  out.similarity, static_cast<long long>(p.usage_count + 1));
        return Result<PatternStoreResult>::ok(out);
    }

    out.id = "pattern-" + generate_uuid();
    std::string blob = HashEmbedder::to_blob(embedding);
    Statement stmt(ctx_.db,
        "INSERT INTO patterns (id, content, embedding, confidence, usage_count, success_rate, "
        "agent_id, domain, created_at, updated_at) VALUES (?, ?, ?, ?, 1, ?, ?, ?, ?, ?)");
    if (!stmt.ok()) {
        return Result<PatternStoreResult>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, out.id);
    stmt.bind_text(2, content);
    stmt.bind_blob(3, blob.data(), blob.size());
    stmt.bind_double(4, confidence);
    bind_rate(stmt, 5, success_rate);
    stmt.bind_text_or_null(6, agent_id);
    stmt.bind_text_or_null(7, domain);
    stmt.bind_int64(8, now);
    stmt.bind_int64(9, now);
    if (!stmt.run()) {
        return Result<PatternStoreResult>::fail(ErrorCode::STORAGE, stmt.error());
    }
    index.insert(out.id, embedding);

    LOG_DEBUG("[PatternBank] Stored %s (agent=%s domain=%s)", out.id.c_str(),
              agent_id.empty() ? "-" : agent_id.c_str(), domain.empty() ? "-" : domain.c_str());
    return Result<PatternStoreResult>::ok(out);
}

// ============================================================================
// Lookup
// ============================================================================

Result<Pattern> PatternBank::load(const std::string& id) {
    Statement stmt(ctx_.db, std::string("SELECT ") + kPatternColumns + " FROM patterns WHERE id = ?");
    if (!stmt.ok()) {
        return Result<Pattern>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, id);
    if (!stmt.step_row()) {
        if (!stmt.error().empty()) {
            return Result<Pattern>::fail(ErrorCode::STORAGE, stmt.error());
        }
        return Result<Pattern>::fail(ErrorCode::NOT_FOUND, "pattern not found: " + id);
    }
    return Result<Pattern>::ok(pattern_from_stmt(stmt));
}

Result<Pattern> PatternBank::get_pattern(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<Pattern>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return load(id);
}

Status PatternBank::delete_pattern(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Status::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Result<Pattern> existing = load(id);
    if (!existing) {
        return existing.status();
    }

    Statement stmt(ctx_.db, "DELETE FROM patterns WHERE id = ?");
    if (!stmt.ok()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, id);
    if (!stmt.run()) {
        return Status::fail(ErrorCode::STORAGE, stmt.error());
    }
    index_for(existing.value.agent_id, existing.value.domain).remove(id);
    return Status::ok();
}

Result<int64_t> PatternBank::count_patterns() {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, "SELECT COUNT(*) FROM patterns");
    if (!stmt.ok() || !stmt.step_row()) {
        return Result<int64_t>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    return Result<int64_t>::ok(stmt.column_int64(0));
}

Result<std::vector<Pattern>> PatternBank::load_where(const std::string& where, const std::string& arg,
                                                     int limit) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<Pattern>>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }
    Statement stmt(ctx_.db, std::string("SELECT ") + kPatternColumns + " FROM patterns WHERE " + where +
                            " ORDER BY success_rate IS NULL, success_rate DESC, confidence DESC, created_at ASC"
                            " LIMIT ?");
    if (!stmt.ok()) {
        return Result<std::vector<Pattern>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    stmt.bind_text(1, arg);
    stmt.bind_int64(2, limit > 0 ? limit : 100);
    std::vector<Pattern> out;
    while (stmt.step_row()) {
        out.push_back(pattern_from_stmt(stmt));
    }
    if (!stmt.error().empty()) {
        return Result<std::vector<Pattern>>::fail(ErrorCode::STORAGE, stmt.error());
    }
    return Result<std::vector<Pattern>>::ok(std::move(out));
}

Result<std::vector<Pattern>> PatternBank::query_by_domain(const std::string& domain, int limit) {
    return load_where("domain = ?", domain, limit);
}

Result<std::vector<Pattern>> PatternBank::query_by_agent(const std::string& agent_id, int limit) {
    return load_where("agent_id = ?", agent_id, limit);
}

Result<std::vector<PatternMatch>> PatternBank::search_similar(const std::string& content, int k,
                                                              const std::string& agent_id,
                                                              const std::string& domain) {
    if (k <= 0) {
        return Result<std::vector<PatternMatch>>::fail(ErrorCode::VALIDATION, "k must be positive");
    }
    Embedding query = embedder_.embed(content);

    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    if (!ensure_schema()) {
        return Result<std::vector<PatternMatch>>::fail(ErrorCode::STORAGE, ctx_.db.last_error());
    }

    std::vector<std::pair<std::string, float>> hits;
    if (agent_id.empty() && domain.empty()) {
        for (const auto& kv : indexes_) {
            std::vector<std::pair<std::string, float>> part = kv.second->search(query, static_cast<size_t>(k));
            hits.insert(hits.end(), part.begin(), part.end());
        }
        std::sort(hits.begin(), hits.end(),
                  [](const std::pair<std::string, float>& a, const std::pair<std::string, float>& b) {
                      return a.second > b.second;
                  });
        if (hits.size() > static_cast<size_t>(k)) hits.resize(static_cast<size_t>(k));
    } else {
        auto it = indexes_.find(scope_key(agent_id, domain));
        if (it != indexes_.end()) {
            hits = it->second->search(query, static_cast<size_t>(k));
        }
    }

    std::vector<PatternMatch> out;
    for (const auto& hit : hits) {
        Result<Pattern> p = load(hit.first);
        if (!p) {
            if (p.code == ErrorCode::NOT_FOUND) continue;
            return Result<std::vector<PatternMatch>>::fail(p.status());
        }
        PatternMatch m;
        m.pattern = p.value;
        m.similarity = hit.second;
        out.push_back(m);
    }
    return Result<std::vector<PatternMatch>>::ok(std::move(out));
}

size_t PatternBank::indexed_count() const {
    size_t total = 0;
    for (const auto& kv : indexes_) {
        total += kv.second->size();
    }
    return total;
}

// ============================================================================
// Consolidation
// ============================================================================

double PatternBank::quality_score(const Pattern& p) {
    std::vector<std::string> words = tokenize_words(p.content);

    double readability = 0.0;
    double specificity = 0.0;
    if (!words.empty()) {
        size_t chars = 0;
        std::set<std::string> distinct;
        for (const auto& w : words) {
            chars += w.size();
            distinct.insert(w);
        }
        double avg_len = static_cast<double>(chars) / static_cast<double>(words.size());
        readability = clamp(1.0 - std::fabs(avg_len - 5.5) / 10.0, 0.0, 1.0);
        specificity = static_cast<double>(distinct.size()) / static_cast<double>(words.size());
    }
    double completeness = std::min(1.0, static_cast<double>(words.size()) / 20.0);
    double reusability = std::min(1.0, std::log2(1.0 + static_cast<double>(p.usage_count)) / 5.0);
    // Unrated patterns score as neutral
    double success = is_rated(p.success_rate) ? p.success_rate : 0.5;

    return 0.15 * readability + 0.20 * completeness + 0.15 * specificity +
           0.20 * reusability + 0.30 * success;
}

ConsolidationReport PatternBank::consolidate() {
    ConsolidationReport report;
    int64_t started = current_timestamp_ms();

    try {
        // Snapshot every scope; clustering runs without the lock
        std::map<std::string, std::vector<Pattern>> scopes;
        {
            std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
            if (!ensure_schema()) {
                LOG_ERROR("[PatternBank] Consolidation skipped: %s", ctx_.db.last_error().c_str());
                return report;
            }
            Statement stmt(ctx_.db, std::string("SELECT ") + kPatternColumns + " FROM patterns");
            if (!stmt.ok()) return report;
            while (stmt.step_row()) {
                Pattern p = pattern_from_stmt(stmt);
                scopes[scope_key(p.agent_id, p.domain)].push_back(p);
            }
            if (!stmt.error().empty()) {
                LOG_ERROR("[PatternBank] Consolidation skipped: %s", stmt.error().c_str());
                return report;
            }
        }

        std::set<std::string> domains;
        double threshold = ctx_.config.patterns.similarity_threshold;

        for (auto& kv : scopes) {
            std::vector<Pattern>& members = kv.second;
            report.patterns_scanned += static_cast<int>(members.size());
            domains.insert(members.front().domain);

            std::vector<double> quality;
            std::vector<size_t> order(members.size());
            for (size_t i = 0; i < members.size(); ++i) {
                order[i] = i;
                quality.push_back(quality_score(members[i]));
            }
            std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
                return ranks_before(members[a], quality[a], members[b], quality[b]);
            });

            // Greedy clustering: each unassigned pattern in rank order seeds
            // a cluster of every unassigned pattern similar to it
            std::vector<bool> assigned(members.size(), false);
            for (size_t oi = 0; oi < order.size(); ++oi) {
                size_t seed = order[oi];
                if (assigned[seed]) continue;
                assigned[seed] = true;

                std::vector<std::string> cluster;
                cluster.push_back(members[seed].id);
                for (size_t oj = oi + 1; oj < order.size(); ++oj) {
                    size_t cand = order[oj];
                    if (assigned[cand]) continue;
                    if (cosine_similarity(members[seed].embedding, members[cand].embedding) >= threshold) {
                        assigned[cand] = true;
                        cluster.push_back(members[cand].id);
                    }
                }
                if (cluster.size() > 1) {
                    merge_cluster(cluster, report);
                }
            }
        }
        report.domains_scanned = static_cast<int>(domains.size());

        if (ctx_.config.patterns.min_confidence > 0.0) {
            prune_low_confidence(report);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("[PatternBank] Consolidation aborted: %s", e.what());
    }

    report.duration_ms = current_timestamp_ms() - started;
    LOG_INFO("[PatternBank] Consolidation: %d scanned, %d clusters merged, %d removed, %d pruned (%lld ms)",
             report.patterns_scanned, report.clusters_merged, report.patterns_removed,
             report.patterns_pruned, static_cast<long long>(report.duration_ms));
    return report;
}

void PatternBank::merge_cluster(const std::vector<std::string>& ids, ConsolidationReport& report) {
    // Holds the lock for this one cluster only
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());

    // Rows may have changed or vanished since the snapshot
    std::vector<Pattern> present;
    for (const auto& id : ids) {
        Result<Pattern> p = load(id);
        if (p) {
            present.push_back(p.value);
        } else if (p.code != ErrorCode::NOT_FOUND) {
            LOG_WARN("[PatternBank] Skipping cluster of %s: %s", ids.front().c_str(), p.error.c_str());
            return;
        }
    }
    if (present.size() < 2) return;

    std::vector<double> quality;
    for (const auto& p : present) quality.push_back(quality_score(p));
    size_t best = 0;
    for (size_t i = 1; i < present.size(); ++i) {
        if (ranks_before(present[i], quality[i], present[best], quality[best])) best = i;
    }
    for (size_t i = 0; i < present.size(); ++i) {
        if (i != best && quality[i] == quality[best]) {
            report.conflicts_resolved++;
            LOG_WARN("[PatternBank] %s: %s and %s rank equally, keeping earliest created %s",
                     error_code_name(ErrorCode::CONSOLIDATION_CONFLICT), present[best].id.c_str(),
                     present[i].id.c_str(), present[best].id.c_str());
            break;
        }
    }

    Pattern rep = present[best];
    for (size_t i = 0; i < present.size(); ++i) {
        if (i == best) continue;
        const Pattern& p = present[i];
        rep.confidence = weighted(rep.confidence, rep.usage_count, p.confidence, p.usage_count);
        rep.success_rate = merge_rates(rep.success_rate, rep.usage_count, p.success_rate, p.usage_count);
        rep.usage_count += p.usage_count;
    }

    Transaction txn(ctx_.db);
    if (!txn.active()) {
        LOG_ERROR("[PatternBank] Cluster merge could not begin: %s", ctx_.db.last_error().c_str());
        return;
    }
    {
        Statement upd(ctx_.db,
            "UPDATE patterns SET usage_count = ?, confidence = ?, success_rate = ?, updated_at = ? WHERE id = ?");
        upd.bind_int64(1, rep.usage_count);
        upd.bind_double(2, rep.confidence);
        bind_rate(upd, 3, rep.success_rate);
        upd.bind_int64(4, ctx_.now_ms());
        upd.bind_text(5, rep.id);
        if (!upd.run()) return;
    }
    for (size_t i = 0; i < present.size(); ++i) {
        if (i == best) continue;
        Statement del(ctx_.db, "DELETE FROM patterns WHERE id = ?");
        del.bind_text(1, present[i].id);
        if (!del.run()) return;
    }
    if (!txn.commit()) {
        LOG_ERROR("[PatternBank] Cluster merge commit failed: %s", ctx_.db.last_error().c_str());
        return;
    }

    HnswIndex& index = index_for(rep.agent_id, rep.domain);
    for (size_t i = 0; i < present.size(); ++i) {
        if (i == best) continue;
        index.remove(present[i].id);
        LOG_DEBUG("[PatternBank] Folded %s into %s", present[i].id.c_str(), rep.id.c_str());
    }
    report.clusters_merged++;
    report.patterns_removed += static_cast<int>(present.size() - 1);
}

void PatternBank::prune_low_confidence(ConsolidationReport& report) {
    std::lock_guard<std::recursive_mutex> lock(ctx_.db.mutex());
    std::vector<Pattern> low;
    {
        Statement stmt(ctx_.db, std::string("SELECT ") + kPatternColumns + " FROM patterns WHERE confidence < ?");
        if (!stmt.ok()) return;
        stmt.bind_double(1, ctx_.config.patterns.min_confidence);
        while (stmt.step_row()) {
            low.push_back(pattern_from_stmt(stmt));
        }
        if (!stmt.error().empty()) {
            LOG_ERROR("[PatternBank] Pruning skipped: %s", stmt.error().c_str());
            return;
        }
    }
    for (const auto& p : low) {
        Statement del(ctx_.db, "DELETE FROM patterns WHERE id = ?");
        del.bind_text(1, p.id);
        if (!del.run()) return;
        index_for(p.agent_id, p.domain).remove(p.id);
        report.patterns_pruned++;
        LOG_INFO("[PatternBank] Pruned %s (confidence %.3f below %.3f)", p.id.c_str(), p.confidence,
                 ctx_.config.patterns.min_confidence);
    }
}

} // namespace hivemem
