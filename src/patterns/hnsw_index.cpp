/*
 * HiveMem C++ - HNSW index Implementation
 */
#include <hivemem/patterns/hnsw_index.hpp>
#include <algorithm>
#include <queue>
#include <unordered_set>

namespace hivemem {

HnswIndex::HnswIndex(const HnswConfig& config)
    : config_(config)
    , max_level_(0)
    , rng_(config.seed)
{
    if (config_.M < 2) config_.M = 2;
    if (config_.max_layers < 1) config_.max_layers = 1;
}

void HnswIndex::insert(const std::string& id, const Embedding& vector) {
    if (nodes_.count(id)) {
        remove(id);
    }

    size_t level = random_level();
    std::shared_ptr<Node> node = std::make_shared<Node>(id, vector, level + 1);
    nodes_[id] = node;

    if (nodes_.size() == 1) {
        entry_point_ = id;
        max_level_ = level;
        return;
    }

    // Descend greedily through the layers above the new node's level
    std::string curr = entry_point_;
    for (size_t l = max_level_; l > level; --l) {
        curr = search_layer_greedy(vector, curr, l);
    }

    for (int l = static_cast<int>(std::min(level, max_level_)); l >= 0; --l) {
        std::vector<DistPair> neighbors = search_layer(vector, curr, config_.ef_construction, l);
        connect(node, neighbors, static_cast<size_t>(l));
        if (!neighbors.empty()) {
            curr = neighbors[0].id;
        }
    }

    if (level > max_level_) {
        entry_point_ = id;
        max_level_ = level;
    }
}

void HnswIndex::remove(const std::string& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return;

    std::shared_ptr<Node> node = it->second;
    nodes_.erase(it);

    // Links pointing at the node, mirrored or not
    for (auto& kv : nodes_) {
        for (auto& conns : kv.second->connections) {
            conns.erase(std::remove(conns.begin(), conns.end(), id), conns.end());
        }
    }

    // Reconnect the former neighbours among themselves, nearest first, so the
    // region the node bridged stays reachable
    for (size_t l = 0; l < node->connections.size(); ++l) {
        const std::vector<std::string>& former = node->connections[l];
        for (const auto& a : former) {
            auto ait = nodes_.find(a);
            if (ait == nodes_.end() || l >= ait->second->connections.size()) continue;
            Node& orphan = *ait->second;

            std::vector<DistPair> candidates;
            for (const auto& b : former) {
                if (b == a) continue;
                auto bit = nodes_.find(b);
                if (bit == nodes_.end() || l >= bit->second->connections.size()) continue;
                candidates.push_back(DistPair(distance(orphan.vector, bit->second->vector), b));
            }
            std::sort(candidates.begin(), candidates.end());

            std::vector<std::string>& conns = orphan.connections[l];
            for (const auto& c : candidates) {
                if (conns.size() >= max_conns(l)) break;
                if (std::find(conns.begin(), conns.end(), c.id) != conns.end()) continue;
                conns.push_back(c.id);
                add_link(*nodes_[c.id], a, l);
            }
        }
    }

    if (id == entry_point_) {
        entry_point_.clear();
        max_level_ = 0;
        for (const auto& kv : nodes_) {
            size_t top = kv.second->connections.size() - 1;
            if (entry_point_.empty() || top > max_level_) {
                entry_point_ = kv.first;
                max_level_ = top;
            }
        }
    }
}

std::vector<std::pair<std::string, float>> HnswIndex::search(const Embedding& query, size_t k) const {
    std::vector<std::pair<std::string, float>> results;
    if (nodes_.empty() || k == 0) return results;

    std::string curr = entry_point_;
    for (size_t l = max_level_; l > 0; --l) {
        curr = search_layer_greedy(query, curr, l);
    }

    std::vector<DistPair> candidates = search_layer(query, curr, std::max(config_.ef_search, k), 0);
    for (size_t i = 0; i < std::min(k, candidates.size()); ++i) {
        results.push_back(std::make_pair(candidates[i].id, 1.0f - candidates[i].distance));
    }
    return results;
}

size_t HnswIndex::random_level() {
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    float p = 1.0f / static_cast<float>(config_.M);
    size_t level = 0;
    while (dist(rng_) < p && level < config_.max_layers - 1) {
        level++;
    }
    return level;
}

float HnswIndex::distance(const Embedding& a, const Embedding& b) const {
    size_t n = std::min(a.size(), b.size());
    float dot = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        dot += a[i] * b[i];
    }
    return 1.0f - dot;
}

std::string HnswIndex::search_layer_greedy(const Embedding& query, const std::string& start, size_t layer) const {
    std::string curr = start;
    auto curr_it = nodes_.find(curr);
    if (curr_it == nodes_.end()) return curr;
    float curr_dist = distance(query, curr_it->second->vector);

    bool changed = true;
    while (changed) {
        changed = false;
        auto node_it = nodes_.find(curr);
        if (node_it == nodes_.end()) break;
        const std::shared_ptr<Node>& node = node_it->second;
        if (layer >= node->connections.size()) break;
        for (const auto& neighbor : node->connections[layer]) {
            auto neighbor_it = nodes_.find(neighbor);
            if (neighbor_it == nodes_.end()) continue;
            float d = distance(query, neighbor_it->second->vector);
            if (d < curr_dist) {
                curr = neighbor;
                curr_dist = d;
                changed = true;
            }
        }
    }
    return curr;
}

std::vector<HnswIndex::DistPair> HnswIndex::search_layer(const Embedding& query, const std::string& start,
                                                         size_t ef, size_t layer) const {
    std::vector<DistPair> out;
    auto start_it = nodes_.find(start);
    if (start_it == nodes_.end()) return out;

    std::unordered_set<std::string> visited;
    std::priority_queue<DistPair, std::vector<DistPair>, std::greater<DistPair>> candidates;
    std::priority_queue<DistPair> results;

    float start_dist = distance(query, start_it->second->vector);
    candidates.push(DistPair(start_dist, start));
    results.push(DistPair(start_dist, start));
    visited.insert(start);

    while (!candidates.empty()) {
        DistPair current = candidates.top();
        candidates.pop();
        if (current.distance > results.top().distance && results.size() >= ef) break;

        auto node_it = nodes_.find(current.id);
        if (node_it == nodes_.end()) continue;
        const std::shared_ptr<Node>& node = node_it->second;
        if (layer >= node->connections.size()) continue;

        for (const auto& neighbor : node->connections[layer]) {
            if (!visited.insert(neighbor).second) continue;
            auto neighbor_it = nodes_.find(neighbor);
            if (neighbor_it == nodes_.end()) continue;
            float d = distance(query, neighbor_it->second->vector);
            if (results.size() < ef || d < results.top().distance) {
                candidates.push(DistPair(d, neighbor));
                results.push(DistPair(d, neighbor));
                if (results.size() > ef) results.pop();
            }
        }
    }

    while (!results.empty()) {
        out.push_back(results.top());
        results.pop();
    }
    std::reverse(out.begin(), out.end());
    return out;
}

void HnswIndex::connect(const std::shared_ptr<Node>& node, const std::vector<DistPair>& candidates, size_t layer) {
    size_t limit = max_conns(layer);

    for (size_t i = 0; i < candidates.size() && node->connections[layer].size() < limit; ++i) {
        const std::string& neighbor_id = candidates[i].id;
        if (neighbor_id == node->id) continue;
        node->connections[layer].push_back(neighbor_id);

        auto nit = nodes_.find(neighbor_id);
        if (nit == nodes_.end() || nit->second->connections.size() <= layer) continue;
        add_link(*nit->second, node->id, layer);
    }
}

void HnswIndex::add_link(Node& from, const std::string& to, size_t layer) {
    std::vector<std::string>& conns = from.connections[layer];
    if (std::find(conns.begin(), conns.end(), to) != conns.end()) return;
    conns.push_back(to);
    if (conns.size() > max_conns(layer)) {
        shrink(from, layer);
    }
}

void HnswIndex::shrink(Node& node, size_t layer) {
    std::vector<std::string>& conns = node.connections[layer];
    std::vector<DistPair> ranked;
    ranked.reserve(conns.size());
    for (const auto& id : conns) {
        auto it = nodes_.find(id);
        if (it == nodes_.end()) continue;
        ranked.push_back(DistPair(distance(node.vector, it->second->vector), id));
    }
    std::sort(ranked.begin(), ranked.end());
    if (ranked.size() > max_conns(layer)) ranked.resize(max_conns(layer));

    conns.clear();
    for (const auto& d : ranked) {
        conns.push_back(d.id);
    }
}

} // namespace hivemem
