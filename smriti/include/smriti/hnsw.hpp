#pragma once
// HNSW (Hierarchical Navigable Small World) index for vector kNN
// Keyed by the integer handles of vec_metadata, L2 distance.
// Small indexes are scanned exactly; the graph only pays off past that.

#include "types.hpp"
#include <algorithm>
#include <limits>
#include <memory>
#include <mutex>
#include <queue>
#include <random>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace smriti {

using Handle = int64_t;

// HNSW configuration
struct HNSWConfig {
    size_t M = 16;                 // Max connections per node per layer
    size_t ef_construction = 200;  // Search width during construction
    size_t ef_search = 50;         // Search width during query
    size_t max_layers = 6;         // Maximum number of layers
    size_t exact_below = 16384;    // Exact scan under this size
};

struct HNSWNode {
    Handle id;
    Embedding vector;
    std::vector<std::vector<Handle>> connections;  // connections[layer] = neighbors

    HNSWNode(Handle i, const Embedding& v, size_t layers)
        : id(i), vector(v), connections(layers) {}
};

// Distance pair for priority queues
struct DistPair {
    float distance;
    Handle id;

    DistPair() : distance(0.0f), id(0) {}
    DistPair(float d, Handle i) : distance(d), id(i) {}

    bool operator<(const DistPair& o) const {
        return distance < o.distance || (distance == o.distance && id < o.id);
    }
    bool operator>(const DistPair& o) const { return o < *this; }
};

class HNSWIndex {
public:
    explicit HNSWIndex(HNSWConfig config = {})
        : config_(config), rng_(0x534D5249) {}

    // Insert, replacing any existing vector under the same handle
    void insert(Handle id, const Embedding& vector) {
        std::unique_lock lock(mutex_);
        if (nodes_.count(id)) remove_locked(id);
        insert_locked(id, vector);
    }

    // k nearest as (handle, L2 distance), ascending
    std::vector<std::pair<Handle, float>> search(const Embedding& query, size_t k) const {
        std::shared_lock lock(mutex_);
        if (nodes_.empty() || k == 0) return {};

        std::vector<DistPair> candidates;
        if (nodes_.size() < config_.exact_below) {
            candidates.reserve(nodes_.size());
            for (const auto& [id, node] : nodes_) {
                candidates.emplace_back(distance(query, node->vector), id);
            }
            std::sort(candidates.begin(), candidates.end());
        } else {
            Handle curr = entry_point_;
            for (int l = static_cast<int>(max_level_); l > 0; --l) {
                curr = search_layer_greedy(query, curr, l);
            }
            candidates = search_layer(query, curr, std::max(config_.ef_search, k), 0);
        }

        std::vector<std::pair<Handle, float>> results;
        for (size_t i = 0; i < std::min(k, candidates.size()); ++i) {
            results.emplace_back(candidates[i].id, candidates[i].distance);
        }
        return results;
    }

    void remove(Handle id) {
        std::unique_lock lock(mutex_);
        remove_locked(id);
    }

    void clear() {
        std::unique_lock lock(mutex_);
        nodes_.clear();
        entry_point_ = 0;
        max_level_ = 0;
    }

    bool contains(Handle id) const {
        std::shared_lock lock(mutex_);
        return nodes_.count(id) > 0;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return nodes_.size();
    }

    bool empty() const { return size() == 0; }

private:
    void insert_locked(Handle id, const Embedding& vector) {
        size_t level = random_level();

        auto node = std::make_shared<HNSWNode>(id, vector, level + 1);
        nodes_[id] = node;

        if (nodes_.size() == 1) {
            entry_point_ = id;
            max_level_ = level;
            return;
        }

        // Find entry point and descend
        Handle curr = entry_point_;
        for (int l = static_cast<int>(max_level_); l > static_cast<int>(level); --l) {
            curr = search_layer_greedy(vector, curr, l);
        }

        // Insert at each level
        for (int l = static_cast<int>(std::min(level, max_level_)); l >= 0; --l) {
            auto neighbors = search_layer(vector, curr, config_.ef_construction, l);
            neighbors.erase(std::remove_if(neighbors.begin(), neighbors.end(),
                                           [id](const DistPair& p) { return p.id == id; }),
                            neighbors.end());
            if (neighbors.empty()) continue;

            node->connections[l] = select_neighbors(neighbors, max_connections(l));
            for (Handle neighbor_id : node->connections[l]) {
                link(neighbor_id, id, l);
            }
            curr = neighbors[0].id;
        }

        if (level > max_level_) {
            entry_point_ = id;
            max_level_ = level;
        }
    }

    // Unlink id everywhere, then reconnect each former neighbor through the
    // removed node's own neighbors so the layer stays navigable
    void remove_locked(Handle id) {
        auto it = nodes_.find(id);
        if (it == nodes_.end()) return;

        std::shared_ptr<HNSWNode> removed = it->second;
        nodes_.erase(it);

        for (auto& [other_id, other] : nodes_) {
            size_t layers = std::min(other->connections.size(), removed->connections.size());
            for (size_t l = 0; l < layers; ++l) {
                auto& conns = other->connections[l];
                auto pos = std::find(conns.begin(), conns.end(), id);
                if (pos == conns.end()) continue;
                conns.erase(pos);

                std::vector<DistPair> candidates;
                std::unordered_set<Handle> seen(conns.begin(), conns.end());
                seen.insert(other_id);
                for (Handle c : conns) {
                    auto cit = nodes_.find(c);
                    if (cit != nodes_.end()) {
                        candidates.emplace_back(distance(other->vector, cit->second->vector), c);
                    }
                }
                for (Handle c : removed->connections[l]) {
                    if (!seen.insert(c).second) continue;
                    auto cit = nodes_.find(c);
                    if (cit == nodes_.end() || l >= cit->second->connections.size()) continue;
                    candidates.emplace_back(distance(other->vector, cit->second->vector), c);
                }
                std::sort(candidates.begin(), candidates.end());
                conns = select_neighbors(candidates, max_connections(l));
            }
        }

        if (nodes_.empty()) {
            entry_point_ = 0;
            max_level_ = 0;
        } else if (id == entry_point_) {
            // Highest remaining node becomes the entry point
            auto best = nodes_.begin();
            for (auto nit = nodes_.begin(); nit != nodes_.end(); ++nit) {
                if (nit->second->connections.size() > best->second->connections.size()) best = nit;
            }
            entry_point_ = best->first;
            max_level_ = best->second->connections.size() - 1;
        }
    }

    size_t random_level() {
        std::uniform_real_distribution<float> dist(0.0f, 1.0f);
        float r = dist(rng_);
        size_t level = 0;
        float p = 1.0f / static_cast<float>(config_.M);
        while (r < p && level < config_.max_layers - 1) {
            level++;
            r = dist(rng_);
        }
        return level;
    }

    float distance(const Embedding& a, const Embedding& b) const {
        return a.l2_distance(b);
    }

    Handle search_layer_greedy(const Embedding& query, Handle start, size_t layer) const {
        Handle curr = start;
        auto curr_it = nodes_.find(curr);
        if (curr_it == nodes_.end()) return curr;
        float curr_dist = distance(query, curr_it->second->vector);

        bool changed = true;
        while (changed) {
            changed = false;
            auto node_it = nodes_.find(curr);
            if (node_it == nodes_.end()) break;
            const auto& node = node_it->second;
            if (layer >= node->connections.size()) break;
            for (Handle neighbor : node->connections[layer]) {
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

    std::vector<DistPair> search_layer(const Embedding& query, Handle start,
                                       size_t ef, size_t layer) const {
        std::unordered_set<Handle> visited;
        std::priority_queue<DistPair, std::vector<DistPair>, std::greater<DistPair>> candidates;
        std::priority_queue<DistPair> results;

        auto start_it = nodes_.find(start);
        if (start_it == nodes_.end()) return {};
        float start_dist = distance(query, start_it->second->vector);
        candidates.push(DistPair(start_dist, start));
        results.push(DistPair(start_dist, start));
        visited.insert(start);

        while (!candidates.empty()) {
            DistPair curr = candidates.top();
            candidates.pop();

            if (curr.distance > results.top().distance && results.size() >= ef) break;

            auto node_it = nodes_.find(curr.id);
            if (node_it == nodes_.end()) continue;
            const auto& node = node_it->second;
            if (layer >= node->connections.size()) continue;
            for (Handle neighbor : node->connections[layer]) {
                if (!visited.insert(neighbor).second) continue;

                auto neighbor_it = nodes_.find(neighbor);
                if (neighbor_it == nodes_.end()) continue;
                float n_dist = distance(query, neighbor_it->second->vector);
                if (results.size() < ef || n_dist < results.top().distance) {
                    candidates.push(DistPair(n_dist, neighbor));
                    results.push(DistPair(n_dist, neighbor));
                    if (results.size() > ef) results.pop();
                }
            }
        }

        std::vector<DistPair> out;
        out.reserve(results.size());
        while (!results.empty()) {
            out.push_back(results.top());
            results.pop();
        }
        std::reverse(out.begin(), out.end());
        return out;
    }

    size_t max_connections(size_t layer) const {
        return layer == 0 ? config_.M * 2 : config_.M;
    }

    // Back-link from -> to; an overfull list is cut back to the best max_connections
    void link(Handle from, Handle to, size_t layer) {
        auto it = nodes_.find(from);
        if (it == nodes_.end() || layer >= it->second->connections.size()) return;
        auto& node = it->second;
        auto& conns = node->connections[layer];
        if (std::find(conns.begin(), conns.end(), to) != conns.end()) return;
        conns.push_back(to);

        size_t limit = max_connections(layer);
        if (conns.size() <= limit) return;

        std::vector<DistPair> candidates;
        candidates.reserve(conns.size());
        for (Handle c : conns) {
            auto cit = nodes_.find(c);
            if (cit != nodes_.end()) {
                candidates.emplace_back(distance(node->vector, cit->second->vector), c);
            }
        }
        std::sort(candidates.begin(), candidates.end());
        conns = select_neighbors(candidates, limit);
    }

    // Neighbor selection heuristic (Malkov & Yashunin, alg. 4).
    // candidates ascending by distance to the base node. A candidate is kept
    // when it is closer to the base than to every neighbor kept so far; the remaining
    // slots are filled with the nearest of the rejected ones.
    std::vector<Handle> select_neighbors(const std::vector<DistPair>& candidates,
                                         size_t limit) const {
        std::vector<Handle> selected;
        std::vector<const Embedding*> selected_vectors;
        std::vector<Handle> rejected;
        selected.reserve(limit);

        for (const auto& c : candidates) {
            if (selected.size() >= limit) break;
            auto it = nodes_.find(c.id);
            if (it == nodes_.end()) continue;
            const Embedding& v = it->second->vector;

            bool diverse = true;
            for (const Embedding* kept : selected_vectors) {
                if (distance(v, *kept) < c.distance) {
                    diverse = false;
                    break;
                }
            }
            if (diverse) {
                selected.push_back(c.id);
                selected_vectors.push_back(&v);
            } else {
                rejected.push_back(c.id);
            }
        }

        for (Handle r : rejected) {
            if (selected.size() >= limit) break;
            selected.push_back(r);
        }
        return selected;
    }

    HNSWConfig config_;
    std::unordered_map<Handle, std::shared_ptr<HNSWNode>> nodes_;
    Handle entry_point_ = 0;
    size_t max_level_ = 0;
    std::mt19937 rng_;
    mutable std::shared_mutex mutex_;
};

} // namespace smriti
