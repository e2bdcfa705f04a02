#pragma once
// GraphStore: typed nodes and weighted directed edges in SQLite
//
// knowledge_nodes(id, type, label, properties JSON)
// knowledge_edges(source, target, relationship, weight), key (source, target, relationship)
//
// Writes upsert: a node keeps its id, an edge keeps its triple.
// Traversal is breadth-first along outgoing edges.

#include "database.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdint>
#include <deque>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace smriti {

using json = nlohmann::json;

struct GraphNode {
    std::string id;
    std::string type;
    std::string label;
    json properties = json::object();
};

struct GraphEdge {
    std::string source;
    std::string target;
    std::string relationship;
    double weight = 1.0;
};

enum class Direction { Outgoing, Incoming };

inline const char* direction_name(Direction d) {
    return d == Direction::Outgoing ? "outgoing" : "incoming";
}

struct Neighbor {
    GraphNode node;
    GraphEdge edge;
    Direction direction;
};

struct TraversalHit {
    GraphNode node;
    int depth = 0;
    std::string via;    // relationship of the edge that reached this node
};

struct GraphStats {
    size_t nodes = 0;
    size_t edges = 0;
    std::map<std::string, size_t> node_types;
};

constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();

class GraphStore {
public:
    explicit GraphStore(Database& db) : db_(db) {}

    bool initialize() {
        try {
            db_.exec(
                "CREATE TABLE IF NOT EXISTS knowledge_nodes ("
                "  id TEXT PRIMARY KEY,"
                "  type TEXT NOT NULL,"
                "  label TEXT NOT NULL,"
                "  properties TEXT DEFAULT '{}')");
            db_.exec(
                "CREATE TABLE IF NOT EXISTS knowledge_edges ("
                "  source TEXT NOT NULL,"
                "  target TEXT NOT NULL,"
                "  relationship TEXT NOT NULL,"
                "  weight REAL DEFAULT 1.0,"
                "  PRIMARY KEY (source, target, relationship))");
            db_.exec("CREATE INDEX IF NOT EXISTS idx_edges_source ON knowledge_edges(source)");
            db_.exec("CREATE INDEX IF NOT EXISTS idx_edges_target ON knowledge_edges(target)");
            return true;
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] Error: " << e.what() << "\n";
            return false;
        }
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Nodes
    // ═══════════════════════════════════════════════════════════════════════

    // Replaces label and properties of an existing id
    bool add_node(const GraphNode& node) { return add_nodes({node}); }

    bool add_nodes(const std::vector<GraphNode>& nodes) {
        if (nodes.empty()) return true;
        try {
            Transaction txn(db_);
            auto stmt = db_.prepare(
                "INSERT INTO knowledge_nodes (id, type, label, properties) VALUES (?, ?, ?, ?) "
                "ON CONFLICT(id) DO UPDATE SET label = excluded.label, properties = excluded.properties");
            for (const auto& node : nodes) {
                const json& props = node.properties.is_object() ? node.properties : json::object();
                stmt.bind(1, node.id).bind(2, node.type).bind(3, node.label).bind(4, props.dump());
                stmt.run();
                stmt.reset();
            }
            txn.commit();
            return true;
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] add_nodes failed: " << e.what() << "\n";
            return false;
        }
    }

    std::optional<GraphNode> get_node(const std::string& id) const {
        try {
            auto stmt = db_.prepare("SELECT id, type, label, properties FROM knowledge_nodes WHERE id = ?");
            stmt.bind(1, id);
            if (stmt.step()) return read_node(stmt, 0);
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] Warning: " << e.what() << "\n";
        }
        return std::nullopt;
    }

    std::vector<GraphNode> nodes_by_type(const std::string& type) const {
        std::vector<GraphNode> out;
        try {
            auto stmt = db_.prepare(
                "SELECT id, type, label, properties FROM knowledge_nodes WHERE type = ? ORDER BY id");
            stmt.bind(1, type);
            while (stmt.step()) out.push_back(read_node(stmt, 0));
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] Warning: " << e.what() << "\n";
        }
        return out;
    }

    size_t node_count() const { return count("knowledge_nodes"); }

    // ═══════════════════════════════════════════════════════════════════════
    // Edges
    // ═══════════════════════════════════════════════════════════════════════

    // Same (source, target, relationship) overwrites the weight
    bool add_edge(const GraphEdge& edge) { return add_edges({edge}); }

    bool add_edges(const std::vector<GraphEdge>& edges) {
        if (edges.empty()) return true;
        try {
            Transaction txn(db_);
            auto stmt = db_.prepare(
                "INSERT INTO knowledge_edges (source, target, relationship, weight) VALUES (?, ?, ?, ?) "
                "ON CONFLICT(source, target, relationship) DO UPDATE SET weight = excluded.weight");
            for (const auto& edge : edges) {
                stmt.bind(1, edge.source).bind(2, edge.target)
                    .bind(3, edge.relationship).bind(4, edge.weight);
                stmt.run();
                stmt.reset();
            }
            txn.commit();
            return true;
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] add_edges failed: " << e.what() << "\n";
            return false;
        }
    }

    size_t edge_count() const { return count("knowledge_edges"); }

    // ═══════════════════════════════════════════════════════════════════════
    // Traversal
    // ═══════════════════════════════════════════════════════════════════════

    // One hop both ways; edges to missing nodes are not reported
    std::vector<Neighbor> neighbors(const std::string& id) const {
        std::vector<Neighbor> out;
        try {
            collect_neighbors(id, Direction::Outgoing, out);
            collect_neighbors(id, Direction::Incoming, out);
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] Warning: " << e.what() << "\n";
            return {};
        }
        return out;
    }

    // Breadth-first over outgoing edges. start is never reported; a node is
    // reported once, at the depth it was first discovered.
    std::vector<TraversalHit> traverse_bfs(const std::string& start, int max_depth,
                                           size_t max_nodes = UNBOUNDED) const {
        std::vector<TraversalHit> results;
        if (max_nodes == 0) return results;

        struct Pending {
            std::string id;
            int depth;
            std::string via;
        };

        std::unordered_set<std::string> visited{start};
        std::deque<Pending> queue;
        queue.push_back({start, 0, ""});

        try {
            while (!queue.empty() && results.size() < max_nodes) {
                Pending current = std::move(queue.front());
                queue.pop_front();

                if (current.depth > 0) {
                    if (auto node = get_node(current.id)) {
                        results.push_back({std::move(*node), current.depth, current.via});
                        if (results.size() >= max_nodes) break;
                    }
                }
                if (current.depth >= max_depth) continue;

                std::vector<Neighbor> next;
                collect_neighbors(current.id, Direction::Outgoing, next);
                for (auto& n : next) {
                    if (visited.insert(n.node.id).second) {
                        queue.push_back({n.node.id, current.depth + 1, n.edge.relationship});
                    }
                }
            }
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] Warning: traversal stopped: " << e.what() << "\n";
        }
        return results;
    }

    // Case-insensitive substring match on labels, any keyword
    std::vector<GraphNode> find_nodes_by_keywords(const std::vector<std::string>& keywords,
                                                  size_t max_results = 10) const {
        std::vector<std::string> terms;
        for (const auto& k : keywords) {
            if (!k.empty()) terms.push_back(k);
        }
        if (terms.empty() || max_results == 0) return {};

        std::string sql = "SELECT id, type, label, properties FROM knowledge_nodes WHERE ";
        for (size_t i = 0; i < terms.size(); ++i) {
            if (i > 0) sql += " OR ";
            sql += "LOWER(label) LIKE ? ESCAPE '\\'";
        }
        sql += " ORDER BY id LIMIT ?";

        std::vector<GraphNode> out;
        try {
            auto stmt = db_.prepare(sql);
            int idx = 1;
            for (const auto& t : terms) {
                stmt.bind(idx++, "%" + like_escape(to_lower(t)) + "%");
            }
            stmt.bind(idx, static_cast<int64_t>(max_results));
            while (stmt.step()) out.push_back(read_node(stmt, 0));
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] Warning: " << e.what() << "\n";
        }
        return out;
    }

    GraphStats stats() const {
        GraphStats s;
        s.nodes = node_count();
        s.edges = edge_count();
        try {
            auto stmt = db_.prepare("SELECT type, count(*) FROM knowledge_nodes GROUP BY type");
            while (stmt.step()) {
                s.node_types[stmt.column_text(0)] = static_cast<size_t>(stmt.column_int64(1));
            }
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] Warning: " << e.what() << "\n";
        }
        return s;
    }

    // Full wipe
    bool clear() {
        try {
            Transaction txn(db_);
            db_.exec("DELETE FROM knowledge_edges");
            db_.exec("DELETE FROM knowledge_nodes");
            txn.commit();
            std::cerr << "[GraphStore] Cleared\n";
            return true;
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] clear failed: " << e.what() << "\n";
            return false;
        }
    }

private:
    void collect_neighbors(const std::string& id, Direction dir, std::vector<Neighbor>& out) const {
        const char* sql = dir == Direction::Outgoing
            ? "SELECT e.source, e.target, e.relationship, e.weight, n.id, n.type, n.label, n.properties "
              "FROM knowledge_edges e JOIN knowledge_nodes n ON n.id = e.target "
              "WHERE e.source = ? ORDER BY e.target, e.relationship"
            : "SELECT e.source, e.target, e.relationship, e.weight, n.id, n.type, n.label, n.properties "
              "FROM knowledge_edges e JOIN knowledge_nodes n ON n.id = e.source "
              "WHERE e.target = ? ORDER BY e.source, e.relationship";

        auto stmt = db_.prepare(sql);
        stmt.bind(1, id);
        while (stmt.step()) {
            GraphEdge edge{stmt.column_text(0), stmt.column_text(1),
                           stmt.column_text(2), stmt.column_double(3)};
            out.push_back({read_node(stmt, 4), std::move(edge), dir});
        }
    }

    // Columns id, type, label, properties starting at col
    static GraphNode read_node(const Statement& stmt, int col) {
        GraphNode node;
        node.id = stmt.column_text(col);
        node.type = stmt.column_text(col + 1);
        node.label = stmt.column_text(col + 2);
        node.properties = parse_properties(stmt.column_text(col + 3));
        return node;
    }

    static json parse_properties(const std::string& text) {
        if (text.empty()) return json::object();
        json parsed = json::parse(text, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            std::cerr << "[GraphStore] Warning: malformed properties, using {}\n";
            return json::object();
        }
        return parsed;
    }

    static std::string to_lower(const std::string& s) {
        std::string out = s;
        for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }

    // % and _ match literally
    static std::string like_escape(const std::string& s) {
        std::string out;
        for (char c : s) {
            if (c == '%' || c == '_' || c == '\\') out.push_back('\\');
            out.push_back(c);
        }
        return out;
    }

    size_t count(const char* table) const {
        try {
            auto stmt = db_.prepare(std::string("SELECT count(*) FROM ") + table);
            return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
        } catch (const DatabaseError& e) {
            std::cerr << "[GraphStore] Warning: " << e.what() << "\n";
            return 0;
        }
    }

    Database& db_;
};

} // namespace smriti
