/*
 * HiveMem C++ - HNSW index
 *
 * Hierarchical Navigable Small World graph over unit vectors, keyed by
 * pattern id. Distance is 1 - cosine, which for unit vectors is 1 - dot.
 * Not thread-safe: callers serialize access (PatternBank holds its lock).
 */
#ifndef hivemem_PATTERNS_HNSW_INDEX_HPP
#define hivemem_PATTERNS_HNSW_INDEX_HPP

#include <hivemem/patterns/types.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hivemem {

struct HnswConfig {
    size_t M;                   // max connections per node per layer
    size_t ef_construction;     // search width during insert
    size_t ef_search;           // search width during query
    size_t max_layers;
    uint32_t seed;              // level generator seed

    HnswConfig() : M(16), ef_construction(200), ef_search(50), max_layers(6), seed(0x5eed) {}
};

class HnswIndex {
public:
    explicit HnswIndex(const HnswConfig& config = HnswConfig());

    // Replaces any vector already stored under id
    void insert(const std::string& id, const Embedding& vector);
    void remove(const std::string& id);
    bool contains(const std::string& id) const { return nodes_.count(id) > 0; }

    // k nearest as (id, cosine similarity), most similar first
    std::vector<std::pair<std::string, float>> search(const Embedding& query, size_t k) const;

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

private:
    struct Node {
        std::string id;
        Embedding vector;
        std::vector<std::vector<std::string>> connections;  // per layer

        Node(const std::string& i, const Embedding& v, size_t layers)
            : id(i), vector(v), connections(layers) {}
    };

    struct DistPair {
        float distance;
        std::string id;

        DistPair() : distance(0.0f) {}
        DistPair(float d, const std::string& i) : distance(d), id(i) {}

        bool operator<(const DistPair& o) const { return distance < o.distance; }
        bool operator>(const DistPair& o) const { return distance > o.distance; }
    };

    size_t random_level();
    float distance(const Embedding& a, const Embedding& b) const;
    std::string search_layer_greedy(const Embedding& query, const std::string& start, size_t layer) const;
    std::vector<DistPair> search_layer(const Embedding& query, const std::string& start,
                                       size_t ef, size_t layer) const;
    void connect(const std::shared_ptr<Node>& node, const std::vector<DistPair>& candidates, size_t layer);
    // Adds to -> from and, when the list overflows, keeps the nearest max_conns
    void add_link(Node& from, const std::string& to, size_t layer);
    void shrink(Node& node, size_t layer);
    size_t max_conns(size_t layer) const { return layer == 0 ? config_.M * 2 : config_.M; }

    HnswConfig config_;
    std::unordered_map<std::string, std::shared_ptr<Node>> nodes_;
    std::string entry_point_;
    size_t max_level_;
    std::mt19937 rng_;
};

} // namespace hivemem

#endif // hivemem_PATTERNS_HNSW_INDEX_HPP
