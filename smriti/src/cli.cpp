// smriti: Command-line interface for the knowledge engine
//
// Usage: smriti <command> [options]
//
// Commands:
//   stats      Show store statistics
//   index      Rebuild lexical and vector indexes from the knowledge files
//   search     Lexical search (BM25 + time decay)
//   similar    Vector similarity search
//   record     Record an episode
//   recall     Recall episodes by keyword
//   recent     Recent episodes for a sprint phase
//   tagged     Episodes carrying every given tag
//   node       Add or show a graph node
//   edge       Add a graph edge
//   neighbors  One-hop neighbors of a node
//   traverse   Breadth-first traversal from a node
//   find       Graph nodes whose label matches keywords
//   promote    Entries retrieved often enough to promote
//   stale      Entries nobody retrieves any more
//   help       Show this help

#include <smriti/smriti.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace smriti;
using json = nlohmann::json;

// Get program name from path
static const char* prog_name(const char* path) {
    const char* last = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') last = p + 1;
    }
    return last;
}

// Global verbose flag for debug logging
static std::atomic<bool> verbose_mode{false};

void log_debug(const char* component, const char* fmt, ...) {
    if (!verbose_mode) return;

    // Get timestamp with milliseconds
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", std::localtime(&now_time_t));

    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << component << "] ";

    va_list args;
    va_start(args, fmt);
    vfprintf(stderr, fmt, args);
    va_end(args);
    std::cerr << "\n";
}

void print_usage(const char* prog) {
    const char* name = prog_name(prog);
    std::cerr << "smriti " << SMRITI_VERSION << " - Knowledge retrieval engine\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Knowledge:\n"
              << "  stats                      Show store statistics\n"
              << "  index                      Rebuild lexical + vector indexes\n"
              << "  search <query>             Lexical search\n"
              << "  similar <query>            Vector similarity search\n"
              << "  promote                    Entries retrieved 3+ times\n"
              << "  stale                      Entries not retrieved recently\n\n"
              << "Episodes:\n"
              << "  record <action> <outcome>  Record an episode (--phase required)\n"
              << "  recall <query>             Recall episodes by keyword\n"
              << "  recent                     Recent episodes (--phase required)\n"
              << "  tagged <tag>...            Episodes carrying all tags\n\n"
              << "Graph:\n"
              << "  node <id>                  Show node, or upsert with --type/--label\n"
              << "  edge                       Upsert edge (--from --rel --to [--weight])\n"
              << "  neighbors <id>             One-hop neighbors\n"
              << "  traverse <id>              BFS along outgoing edges\n"
              << "  find <keyword>...          Nodes whose label contains a keyword\n\n"
              << "Options:\n"
              << "  --dir PATH         Knowledge directory (default: $SMRITI_KNOWLEDGE_DIR or ~/.smriti/knowledge)\n"
              << "  --db FILE          Database file name or absolute path (default: knowledge.db)\n"
              << "  --limit N          Maximum results (default: 10)\n"
              << "  --phase NAME       Sprint phase\n"
              << "  --lesson TEXT      Lesson learned (record)\n"
              << "  --tags a,b,c       Tags (record)\n"
              << "  --type T           Node type\n"
              << "  --label L          Node label\n"
              << "  --props JSON       Node properties object\n"
              << "  --from/--rel/--to  Edge endpoints and relationship\n"
              << "  --weight W         Edge weight (default: 1.0)\n"
              << "  --depth N          Traversal depth (default: 2)\n"
              << "  --max-nodes N      Traversal result cap (default: unbounded)\n"
              << "  --no-vectors       Disable vector search\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

static std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

static std::string join_args(const std::vector<std::string>& args, size_t from = 0) {
    std::string out;
    for (size_t i = from; i < args.size(); ++i) {
        if (!out.empty()) out += " ";
        out += args[i];
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON views
// ═══════════════════════════════════════════════════════════════════════════

static json node_json(const GraphNode& n) {
    return {{"id", n.id}, {"type", n.type}, {"label", n.label}, {"properties", n.properties}};
}

static json edge_json(const GraphEdge& e) {
    return {{"source", e.source}, {"target", e.target},
            {"relationship", e.relationship}, {"weight", e.weight}};
}

static json episode_json(const Episode& ep) {
    json j = {{"id", ep.id}, {"sprintPhase", ep.sprint_phase}, {"timestamp", ep.timestamp},
              {"action", ep.action}, {"outcome", ep.outcome}, {"tags", ep.tags}};
    j["lesson"] = ep.lesson ? json(*ep.lesson) : json(nullptr);
    return j;
}

static void print_episodes(const std::vector<Episode>& episodes, bool json_output) {
    if (json_output) {
        json arr = json::array();
        for (const auto& ep : episodes) arr.push_back(episode_json(ep));
        std::cout << arr.dump(2) << "\n";
        return;
    }
    if (episodes.empty()) {
        std::cout << "No episodes found.\n";
        return;
    }
    for (const auto& ep : episodes) {
        std::cout << "#" << ep.id << " [" << ep.sprint_phase << "] " << ep.timestamp << "\n"
                  << "  action:  " << ep.action << "\n"
                  << "  outcome: " << ep.outcome << "\n";
        if (ep.lesson) std::cout << "  lesson:  " << *ep.lesson << "\n";
        if (!ep.tags.empty()) {
            std::cout << "  tags:   ";
            for (const auto& t : ep.tags) std::cout << " " << t;
            std::cout << "\n";
        }
    }
}

static void print_nodes(const std::vector<GraphNode>& nodes, bool json_output) {
    if (json_output) {
        json arr = json::array();
        for (const auto& n : nodes) arr.push_back(node_json(n));
        std::cout << arr.dump(2) << "\n";
        return;
    }
    if (nodes.empty()) {
        std::cout << "No nodes found.\n";
        return;
    }
    for (const auto& n : nodes) {
        std::cout << n.id << "  (" << n.type << ")  " << n.label << "\n";
    }
}

static void print_records(const std::vector<RetrievalRecord>& records, bool json_output) {
    if (json_output) {
        json arr = json::array();
        for (const auto& r : records) {
            arr.push_back({{"entryId", r.entry_id}, {"count", r.count},
                           {"lastRetrieved", r.last_retrieved}});
        }
        std::cout << arr.dump(2) << "\n";
        return;
    }
    if (records.empty()) {
        std::cout << "None.\n";
        return;
    }
    for (const auto& r : records) {
        std::cout << std::left << std::setw(24) << r.entry_id << " " << std::right
                  << std::setw(4) << r.count << "  " << r.last_retrieved << "\n";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_stats(Engine& engine, bool json_output) {
    auto vec = engine.vec_stats();
    auto graph = engine.graph_stats();
    size_t entries = engine.knowledge().count();
    size_t episodes = engine.episodes().count();

    if (json_output) {
        json j = {
            {"version", SMRITI_VERSION},
            {"database", engine.database().path()},
            {"entries", entries},
            {"vectors", {{"count", vec.count}, {"dimensions", vec.dimensions},
                         {"available", engine.is_vec_available()},
                         {"vocabulary", engine.is_vocabulary_ready()}}},
            {"graph", {{"nodes", graph.nodes}, {"edges", graph.edges}, {"nodeTypes", graph.node_types}}},
            {"episodes", {{"count", episodes}, {"tags", engine.episodes().tag_count()}}},
        };
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    std::cout << "Smriti Statistics\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "Database: " << engine.database().path() << "\n";
    std::cout << "Knowledge entries: " << entries << "\n";
    std::cout << "\nVectors:\n";
    std::cout << "  Count:      " << vec.count << "\n";
    std::cout << "  Dimensions: " << vec.dimensions << "\n";
    std::cout << "  Vocabulary: " << (engine.is_vocabulary_ready() ? "ready" : "not built") << "\n";
    std::cout << "\nGraph:\n";
    std::cout << "  Nodes: " << graph.nodes << "\n";
    std::cout << "  Edges: " << graph.edges << "\n";
    for (const auto& [type, count] : graph.node_types) {
        std::cout << "    " << type << ": " << count << "\n";
    }
    std::cout << "\nEpisodes: " << episodes << " (" << engine.episodes().tag_count() << " tags)\n";
    return 0;
}

int cmd_index(Engine& engine, bool json_output) {
    size_t n = engine.index_all();
    if (json_output) {
        std::cout << json{{"indexed", n}}.dump() << "\n";
    } else {
        std::cout << "Indexed " << n << " entries\n";
    }
    return 0;
}

int cmd_search(Engine& engine, const std::string& query, int limit, bool json_output) {
    auto q = engine.prepare(query);
    auto hits = engine.lexical_search(q, static_cast<size_t>(std::max(limit, 0)));
    log_debug("search", "%zu hits for '%s'", hits.size(), query.c_str());

    std::vector<std::string> ids;
    for (const auto& h : hits) ids.push_back(h.id);
    engine.knowledge().record_retrievals(ids);

    if (json_output) {
        json arr = json::array();
        for (const auto& h : hits) {
            arr.push_back({{"id", h.id}, {"source", h.source}, {"sourceId", h.source_id},
                           {"text", h.text}, {"date", h.date}, {"score", h.fts_score}});
        }
        std::cout << arr.dump(2) << "\n";
        return 0;
    }
    if (hits.empty()) {
        std::cout << "No results.\n";
        return 0;
    }
    for (const auto& h : hits) {
        std::cout << "[" << std::fixed << std::setprecision(3) << h.fts_score << "] "
                  << h.id << "  " << h.text.substr(0, 100) << "\n";
    }
    return 0;
}

int cmd_similar(Engine& engine, const std::string& query, int limit, bool json_output) {
    if (!engine.has_embedder()) {
        std::cerr << "Error: vocabulary not built, run 'smriti index' first\n";
        return 1;
    }
    auto hits = engine.semantic_search(query, limit);
    if (json_output) {
        json arr = json::array();
        for (const auto& h : hits) {
            arr.push_back({{"id", h.id}, {"distance", h.distance}, {"score", h.score}});
        }
        std::cout << arr.dump(2) << "\n";
        return 0;
    }
    if (hits.empty()) {
        std::cout << "No results.\n";
        return 0;
    }
    for (const auto& h : hits) {
        std::cout << "[" << std::fixed << std::setprecision(3) << h.score << "] " << h.id
                  << "  (d=" << h.distance << ")\n";
    }
    return 0;
}

int cmd_record(Engine& engine, const std::string& phase, const std::string& action,
               const std::string& outcome, const std::string& lesson,
               const std::string& tags, bool json_output) {
    std::optional<std::string> lesson_opt;
    if (!lesson.empty()) lesson_opt = lesson;

    auto ep = engine.episodes().record(phase, action, outcome, lesson_opt, split_csv(tags));
    if (!ep) {
        std::cerr << "Error: failed to record episode\n";
        return 1;
    }
    if (json_output) {
        std::cout << episode_json(*ep).dump(2) << "\n";
    } else {
        std::cout << "Recorded episode #" << ep->id << " at " << ep->timestamp << "\n";
    }
    return 0;
}

int cmd_node(Engine& engine, const std::string& id, const std::string& type,
             const std::string& label, const std::string& props, bool json_output) {
    if (type.empty() && label.empty()) {
        auto node = engine.graph().get_node(id);
        if (!node) {
            std::cerr << "Error: node not found: " << id << "\n";
            return 1;
        }
        if (json_output) {
            std::cout << node_json(*node).dump(2) << "\n";
        } else {
            std::cout << node->id << "  (" << node->type << ")  " << node->label << "\n"
                      << "  " << node->properties.dump() << "\n";
        }
        return 0;
    }

    if (type.empty() || label.empty()) {
        std::cerr << "Usage: smriti node <id> --type T --label L [--props JSON]\n";
        return 1;
    }

    GraphNode node{id, type, label, json::object()};
    if (!props.empty()) {
        json parsed = json::parse(props, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            std::cerr << "Error: --props must be a JSON object\n";
            return 1;
        }
        node.properties = std::move(parsed);
    }
    if (!engine.graph().add_node(node)) return 1;
    std::cout << "Node " << id << " saved\n";
    return 0;
}

int cmd_edge(Engine& engine, const std::string& from, const std::string& rel,
             const std::string& to, double weight) {
    if (from.empty() || rel.empty() || to.empty()) {
        std::cerr << "Usage: smriti edge --from ID --rel REL --to ID [--weight W]\n";
        return 1;
    }
    if (!engine.graph().add_edge({from, to, rel, weight})) return 1;
    std::cout << from << " -[" << rel << "]-> " << to << " (" << weight << ")\n";
    return 0;
}

int cmd_neighbors(Engine& engine, const std::string& id, bool json_output) {
    auto neighbors = engine.graph().neighbors(id);
    if (json_output) {
        json arr = json::array();
        for (const auto& n : neighbors) {
            arr.push_back({{"node", node_json(n.node)}, {"edge", edge_json(n.edge)},
                           {"direction", direction_name(n.direction)}});
        }
        std::cout << arr.dump(2) << "\n";
        return 0;
    }
    if (neighbors.empty()) {
        std::cout << "No neighbors.\n";
        return 0;
    }
    for (const auto& n : neighbors) {
        const char* arrow = n.direction == Direction::Outgoing ? "->" : "<-";
        std::cout << arrow << " " << n.edge.relationship << " " << n.node.id
                  << "  (" << n.node.label << ", w=" << n.edge.weight << ")\n";
    }
    return 0;
}

int cmd_traverse(Engine& engine, const std::string& id, int depth, size_t max_nodes,
                 bool json_output) {
    auto hits = engine.graph().traverse_bfs(id, depth, max_nodes);
    if (json_output) {
        json arr = json::array();
        for (const auto& h : hits) {
            arr.push_back({{"node", node_json(h.node)}, {"depth", h.depth}, {"via", h.via}});
        }
        std::cout << arr.dump(2) << "\n";
        return 0;
    }
    if (hits.empty()) {
        std::cout << "Nothing reachable.\n";
        return 0;
    }
    for (const auto& h : hits) {
        std::cout << std::string(static_cast<size_t>(h.depth) * 2, ' ') << h.node.id
                  << "  via " << h.via << "  (" << h.node.label << ")\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    EngineConfig config;
    std::string command;
    std::vector<std::string> args;

    std::string phase, lesson, tags;
    std::string node_type, node_label, node_props;
    std::string edge_from, edge_rel, edge_to;
    double edge_weight = 1.0;
    int limit = 10;
    bool limit_given = false;
    int depth = 2;
    size_t max_nodes = UNBOUNDED;
    bool json_output = false;

    // Parse arguments
    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--dir") == 0 && i + 1 < argc) {
                config.knowledge_dir = argv[++i];
            } else if (strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
                config.db_file = argv[++i];
            } else if (strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
                limit = std::stoi(argv[++i]);
                limit_given = true;
            } else if (strcmp(argv[i], "--phase") == 0 && i + 1 < argc) {
                phase = argv[++i];
            } else if (strcmp(argv[i], "--lesson") == 0 && i + 1 < argc) {
                lesson = argv[++i];
            } else if (strcmp(argv[i], "--tags") == 0 && i + 1 < argc) {
                tags = argv[++i];
            } else if (strcmp(argv[i], "--type") == 0 && i + 1 < argc) {
                node_type = argv[++i];
            } else if (strcmp(argv[i], "--label") == 0 && i + 1 < argc) {
                node_label = argv[++i];
            } else if (strcmp(argv[i], "--props") == 0 && i + 1 < argc) {
                node_props = argv[++i];
            } else if (strcmp(argv[i], "--from") == 0 && i + 1 < argc) {
                edge_from = argv[++i];
            } else if (strcmp(argv[i], "--rel") == 0 && i + 1 < argc) {
                edge_rel = argv[++i];
            } else if (strcmp(argv[i], "--to") == 0 && i + 1 < argc) {
                edge_to = argv[++i];
            } else if (strcmp(argv[i], "--weight") == 0 && i + 1 < argc) {
                edge_weight = std::stod(argv[++i]);
            } else if (strcmp(argv[i], "--depth") == 0 && i + 1 < argc) {
                depth = std::stoi(argv[++i]);
            } else if (strcmp(argv[i], "--max-nodes") == 0 && i + 1 < argc) {
                max_nodes = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (strcmp(argv[i], "--no-vectors") == 0) {
                config.enable_vectors = false;
            } else if (strcmp(argv[i], "--json") == 0) {
                json_output = true;
            } else if (strcmp(argv[i], "--verbose") == 0) {
                verbose_mode = true;
            } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
                print_usage(argv[0]);
                return 0;
            } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
                std::cout << "smriti " << SMRITI_VERSION << "\n";
                return 0;
            } else if (argv[i][0] != '-') {
                if (command.empty()) {
                    command = argv[i];
                } else {
                    args.push_back(argv[i]);
                }
            } else {
                std::cerr << "Unknown option: " << argv[i] << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    log_debug("main", "command=%s dir=%s", command.c_str(), config.knowledge_dir.c_str());

    Engine engine(config);
    if (!engine.open()) {
        std::cerr << "Error: Failed to open knowledge base at " << config.db_path() << "\n";
        return 1;
    }

    if (command == "stats") {
        return cmd_stats(engine, json_output);
    }
    if (command == "index") {
        return cmd_index(engine, json_output);
    }
    if (command == "search" || command == "similar") {
        std::string query = join_args(args);
        if (query.empty()) {
            std::cerr << "Usage: smriti " << command << " <query>\n";
            return 1;
        }
        return command == "search" ? cmd_search(engine, query, limit, json_output)
                                   : cmd_similar(engine, query, limit, json_output);
    }
    if (command == "promote") {
        print_records(engine.knowledge().promotion_candidates(), json_output);
        return 0;
    }
    if (command == "stale") {
        print_records(engine.knowledge().stale_entries(), json_output);
        return 0;
    }
    if (command == "record") {
        if (phase.empty() || args.size() < 2) {
            std::cerr << "Usage: smriti record <action> <outcome> --phase P [--lesson L] [--tags a,b]\n";
            return 1;
        }
        return cmd_record(engine, phase, args[0], join_args(args, 1), lesson, tags, json_output);
    }
    if (command == "recall") {
        std::string query = join_args(args);
        std::optional<std::string> phase_opt;
        if (!phase.empty()) phase_opt = phase;
        print_episodes(engine.episodes().recall(query, limit, phase_opt), json_output);
        return 0;
    }
    if (command == "recent") {
        if (phase.empty()) {
            std::cerr << "Usage: smriti recent --phase P [--limit N]\n";
            return 1;
        }
        print_episodes(engine.episodes().recent(phase, limit_given ? limit : 20), json_output);
        return 0;
    }
    if (command == "tagged") {
        if (args.empty()) {
            std::cerr << "Usage: smriti tagged <tag>...\n";
            return 1;
        }
        print_episodes(engine.episodes().by_tags(args, limit_given ? limit : 20), json_output);
        return 0;
    }
    if (command == "node") {
        if (args.empty()) {
            std::cerr << "Usage: smriti node <id> [--type T --label L [--props JSON]]\n";
            return 1;
        }
        return cmd_node(engine, args[0], node_type, node_label, node_props, json_output);
    }
    if (command == "edge") {
        return cmd_edge(engine, edge_from, edge_rel, edge_to, edge_weight);
    }
    if (command == "neighbors" || command == "traverse") {
        if (args.empty()) {
            std::cerr << "Usage: smriti " << command << " <id>\n";
            return 1;
        }
        return command == "neighbors" ? cmd_neighbors(engine, args[0], json_output)
                                      : cmd_traverse(engine, args[0], depth, max_nodes, json_output);
    }
    if (command == "find") {
        print_nodes(engine.graph().find_nodes_by_keywords(args, static_cast<size_t>(std::max(limit, 0))),
                    json_output);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
