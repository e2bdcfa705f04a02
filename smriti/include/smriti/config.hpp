#pragma once
// Engine configuration

#include "hnsw.hpp"
#include <cstdlib>
#include <string>

namespace smriti {

// Where the knowledge JSON files and knowledge.db live.
// SMRITI_KNOWLEDGE_DIR wins, then ~/.smriti/knowledge.
inline std::string default_knowledge_dir() {
    if (const char* dir = std::getenv("SMRITI_KNOWLEDGE_DIR")) {
        if (*dir) return dir;
    }
    const char* home = std::getenv("HOME");
    if (!home) home = ".";
    return std::string(home) + "/.smriti/knowledge";
}

struct EngineConfig {
    std::string knowledge_dir = default_knowledge_dir();
    std::string db_file = "knowledge.db";   // ":memory:" keeps everything in RAM
    int episode_retention_days = 90;        // Episodes older than this are pruned at init
    bool enable_vectors = true;             // false installs the null embedder
    bool rebuild_lexical_if_empty = true;   // Populate knowledge_fts from JSON on first open
    int busy_timeout_ms = 5000;
    HNSWConfig hnsw;

    // Resolved database location
    std::string db_path() const {
        if (db_file == ":memory:" || db_file.empty()) return ":memory:";
        if (!db_file.empty() && db_file[0] == '/') return db_file;
        return knowledge_dir + "/" + db_file;
    }
};

} // namespace smriti
