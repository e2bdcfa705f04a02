#pragma once
// KnowledgeIndex: FTS5 lexical index over the knowledge base
//
// Rebuilt from the JSON knowledge files (patterns, lessons, decisions,
// deferred). BM25 ranking with exponential time decay. Also tracks how often
// each entry is retrieved, for promotion and staleness reports.
//
// Supplies the corpus that the vector store embeds.

#include "database.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace smriti {

using json = nlohmann::json;

struct KnowledgeEntry {
    std::string source;     // pattern | lesson | decision | deferred
    int64_t source_id = 0;
    std::string text;
    std::string date;

    std::string id() const { return source + "-" + std::to_string(source_id); }
};

struct KnowledgeHit {
    std::string id;
    std::string source;
    int64_t source_id = 0;
    std::string text;
    std::string date;
    double fts_score = 0.0;   // -bm25 × time decay
};

struct KnowledgeQuery {
    std::string query;
    size_t max_results = 10;
    double half_life_days = 30.0;
};

struct RetrievalRecord {
    std::string entry_id;
    int64_t count = 0;
    std::string last_retrieved;
};

constexpr int64_t PROMOTION_THRESHOLD = 3;
constexpr int STALE_DAYS = 60;
constexpr int STALE_LIMIT = 20;

// Exponential decay with a 0.2 floor; future dates keep full weight
inline double time_decay(const std::string& date, double half_life_days, Timestamp at = now()) {
    Timestamp ts;
    if (!parse_iso8601(date, ts)) return 1.0;
    double age_days = static_cast<double>(at - ts) / static_cast<double>(MILLIS_PER_DAY);
    if (age_days < 0) return 1.0;
    return std::max(0.2, std::exp(-0.693 * age_days / half_life_days));
}

// Strip FTS5 metacharacters, quote each token, OR them together
inline std::string sanitize_fts_query(const std::string& raw) {
    std::string stripped;
    stripped.reserve(raw.size());
    for (char c : raw) {
        switch (c) {
            case '"': case '*': case '-': case '^': case '(': case ')': case ':':
                stripped.push_back(' ');
                break;
            default:
                stripped.push_back(c);
        }
    }

    std::string out;
    std::istringstream iss(stripped);
    std::string tok;
    while (iss >> tok) {
        if (!out.empty()) out += " OR ";
        out += "\"" + tok + "\"";
    }
    return out;
}

class KnowledgeIndex {
public:
    KnowledgeIndex(Database& db, std::string knowledge_dir)
        : db_(db), knowledge_dir_(std::move(knowledge_dir)) {}

    // Create tables; populate from the JSON files when the index is empty
    bool initialize(bool rebuild_if_empty = true) {
        try {
            db_.exec(
                "CREATE VIRTUAL TABLE IF NOT EXISTS knowledge_fts USING fts5("
                "  text, id UNINDEXED, source UNINDEXED, source_id UNINDEXED, date UNINDEXED)");
            db_.exec(
                "CREATE TABLE IF NOT EXISTS retrieval_counts ("
                "  entry_id TEXT PRIMARY KEY,"
                "  count INTEGER DEFAULT 0,"
                "  last_retrieved_at TEXT)");
        } catch (const DatabaseError& e) {
            std::cerr << "[KnowledgeIndex] Error: " << e.what() << "\n";
            return false;
        }

        size_t n = count();
        if (n == 0 && rebuild_if_empty) {
            size_t built = rebuild();
            std::cerr << "[KnowledgeIndex] Index was empty, rebuilt " << built << " entries\n";
        }
        return true;
    }

    // Read every knowledge file under dir. Missing or corrupt files are skipped.
    static std::vector<KnowledgeEntry> load_entries(const std::string& dir) {
        std::vector<KnowledgeEntry> entries;
        load_file(dir + "/patterns.json", "patterns", "pattern",
                  {"name", "description", "example"}, entries);
        load_file(dir + "/lessons.json", "lessons", "lesson",
                  {"situation", "learning"}, entries);
        load_file(dir + "/decisions.json", "decisions", "decision",
                  {"title", "context", "rationale", "alternatives"}, entries);
        load_file(dir + "/deferred.json", "items", "deferred",
                  {"title", "reason", "effort"}, entries);
        return entries;
    }

    // Clear and repopulate from the knowledge directory
    size_t rebuild() { return rebuild(load_entries(knowledge_dir_)); }

    size_t rebuild(const std::vector<KnowledgeEntry>& entries) {
        try {
            Transaction txn(db_);
            db_.exec("DELETE FROM knowledge_fts");
            auto insert = db_.prepare(
                "INSERT INTO knowledge_fts (text, id, source, source_id, date) VALUES (?, ?, ?, ?, ?)");
            for (const auto& entry : entries) {
                bind_entry(insert, entry);
                insert.run();
                insert.reset();
            }
            txn.commit();
        } catch (const DatabaseError& e) {
            std::cerr << "[KnowledgeIndex] Rebuild failed: " << e.what() << "\n";
            return 0;
        }
        return entries.size();
    }

    // FTS5 has no UPDATE: delete by id then insert
    bool upsert(const KnowledgeEntry& entry) {
        try {
            Transaction txn(db_);
            auto del = db_.prepare("DELETE FROM knowledge_fts WHERE id = ?");
            del.bind(1, entry.id());
            del.run();
            auto insert = db_.prepare(
                "INSERT INTO knowledge_fts (text, id, source, source_id, date) VALUES (?, ?, ?, ?, ?)");
            bind_entry(insert, entry);
            insert.run();
            txn.commit();
            return true;
        } catch (const DatabaseError& e) {
            std::cerr << "[KnowledgeIndex] Upsert failed: " << e.what() << "\n";
            return false;
        }
    }

    bool remove(const std::string& id) {
        try {
            auto del = db_.prepare("DELETE FROM knowledge_fts WHERE id = ?");
            del.bind(1, id);
            del.run();
            return db_.changes() > 0;
        } catch (const DatabaseError& e) {
            std::cerr << "[KnowledgeIndex] Remove failed: " << e.what() << "\n";
            return false;
        }
    }

    // BM25 × time decay, best first
    std::vector<KnowledgeHit> search(const KnowledgeQuery& q) const {
        std::string safe = sanitize_fts_query(q.query);
        if (safe.empty() || q.max_results == 0) return {};

        std::vector<KnowledgeHit> hits;
        try {
            auto stmt = db_.prepare(
                "SELECT text, id, source, source_id, date, -bm25(knowledge_fts) AS fts_score "
                "FROM knowledge_fts WHERE knowledge_fts MATCH ? "
                "ORDER BY fts_score DESC LIMIT ?");
            stmt.bind(1, safe);
            stmt.bind(2, static_cast<int64_t>(q.max_results * 3));

            Timestamp at = now();
            while (stmt.step()) {
                KnowledgeHit hit;
                hit.text = stmt.column_text(0);
                hit.id = stmt.column_text(1);
                hit.source = stmt.column_text(2);
                hit.source_id = stmt.column_int64(3);
                hit.date = stmt.column_text(4);
                hit.fts_score = stmt.column_double(5) * time_decay(hit.date, q.half_life_days, at);
                hits.push_back(std::move(hit));
            }
        } catch (const DatabaseError& e) {
            std::cerr << "[KnowledgeIndex] Warning: query failed (" << safe << "): "
                      << e.what() << "\n";
            return {};
        }

        std::stable_sort(hits.begin(), hits.end(), [](const auto& a, const auto& b) {
            return a.fts_score > b.fts_score;
        });
        if (hits.size() > q.max_results) hits.resize(q.max_results);
        return hits;
    }

    // (id, text) for every indexed entry. Throws DatabaseError.
    std::vector<std::pair<std::string, std::string>> corpus() const {
        std::vector<std::pair<std::string, std::string>> out;
        auto stmt = db_.prepare("SELECT id, text FROM knowledge_fts");
        while (stmt.step()) {
            out.emplace_back(stmt.column_text(0), stmt.column_text(1));
        }
        return out;
    }

    size_t count() const {
        try {
            auto stmt = db_.prepare("SELECT count(*) FROM knowledge_fts");
            return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
        } catch (const DatabaseError&) {
            return 0;
        }
    }

    bool available() const { return count() > 0; }

    // ═══════════════════════════════════════════════════════════════════════
    // Retrieval tracking
    // ═══════════════════════════════════════════════════════════════════════

    void record_retrievals(const std::vector<std::string>& entry_ids) {
        if (entry_ids.empty()) return;
        std::string ts = format_iso8601(now());
        try {
            Transaction txn(db_);
            auto upsert = db_.prepare(
                "INSERT INTO retrieval_counts (entry_id, count, last_retrieved_at) VALUES (?, 1, ?) "
                "ON CONFLICT(entry_id) DO UPDATE SET count = count + 1, last_retrieved_at = excluded.last_retrieved_at");
            for (const auto& id : entry_ids) {
                upsert.bind(1, id).bind(2, ts);
                upsert.run();
                upsert.reset();
            }
            txn.commit();
        } catch (const DatabaseError& e) {
            std::cerr << "[KnowledgeIndex] Warning: retrieval tracking failed: " << e.what() << "\n";
        }
    }

    std::vector<RetrievalRecord> promotion_candidates() const {
        std::vector<RetrievalRecord> out;
        try {
            auto stmt = db_.prepare(
                "SELECT entry_id, count, last_retrieved_at FROM retrieval_counts "
                "WHERE count >= ? ORDER BY count DESC, entry_id ASC");
            stmt.bind(1, PROMOTION_THRESHOLD);
            while (stmt.step()) {
                out.push_back({stmt.column_text(0), stmt.column_int64(1), stmt.column_text(2)});
            }
        } catch (const DatabaseError& e) {
            std::cerr << "[KnowledgeIndex] Warning: " << e.what() << "\n";
        }
        return out;
    }

    // Never retrieved, or retrieved fewer than twice and not since the cutoff
    std::vector<RetrievalRecord> stale_entries() const {
        std::vector<RetrievalRecord> out;
        std::string cutoff = format_iso8601(now() - STALE_DAYS * MILLIS_PER_DAY);
        try {
            auto stmt = db_.prepare(
                "SELECT f.id, COALESCE(r.count, 0) AS cnt, "
                "       COALESCE(r.last_retrieved_at, f.date) AS last_at "
                "FROM knowledge_fts f LEFT JOIN retrieval_counts r ON r.entry_id = f.id "
                "WHERE r.entry_id IS NULL "
                "   OR (r.count = 0 AND r.last_retrieved_at < ?1) "
                "   OR (r.last_retrieved_at < ?1 AND r.count < 2) "
                "ORDER BY last_at ASC LIMIT ?2");
            stmt.bind(1, cutoff);
            stmt.bind(2, STALE_LIMIT);
            while (stmt.step()) {
                out.push_back({stmt.column_text(0), stmt.column_int64(1), stmt.column_text(2)});
            }
        } catch (const DatabaseError& e) {
            std::cerr << "[KnowledgeIndex] Warning: " << e.what() << "\n";
        }
        return out;
    }

    const std::string& knowledge_dir() const { return knowledge_dir_; }

private:
    static void bind_entry(Statement& stmt, const KnowledgeEntry& entry) {
        stmt.bind(1, entry.text)
            .bind(2, entry.id())
            .bind(3, entry.source)
            .bind(4, entry.source_id)
            .bind(5, entry.date);
    }

    // Field as text: strings as-is, numbers printed, arrays space-joined
    static std::string field_text(const json& obj, const char* key) {
        auto it = obj.find(key);
        if (it == obj.end() || it->is_null()) return {};
        if (it->is_string()) return it->get<std::string>();
        if (it->is_array()) {
            std::string joined;
            for (const auto& el : *it) {
                if (!joined.empty()) joined += " ";
                joined += el.is_string() ? el.get<std::string>() : el.dump();
            }
            return joined;
        }
        return it->dump();
    }

    static void load_file(const std::string& path, const char* array_key, const char* source,
                          std::initializer_list<const char*> fields,
                          std::vector<KnowledgeEntry>& out) {
        std::ifstream in(path);
        if (!in) return;

        json data = json::parse(in, nullptr, false);
        if (data.is_discarded() || !data.is_object()) {
            std::cerr << "[KnowledgeIndex] Warning: skipping corrupt " << path << "\n";
            return;
        }
        auto arr = data.find(array_key);
        if (arr == data.end() || !arr->is_array()) return;

        std::string today = format_iso8601(now());
        for (const auto& item : *arr) {
            if (!item.is_object()) continue;

            KnowledgeEntry entry;
            entry.source = source;
            auto id = item.find("id");
            entry.source_id = (id != item.end() && id->is_number_integer()) ? id->get<int64_t>() : 0;

            std::string text;
            for (const char* f : fields) {
                if (!text.empty()) text += " ";
                text += field_text(item, f);
            }
            auto b = text.find_first_not_of(' ');
            auto e = text.find_last_not_of(' ');
            entry.text = b == std::string::npos ? std::string() : text.substr(b, e - b + 1);

            std::string date = field_text(item, "date");
            entry.date = date.empty() ? today : date;
            out.push_back(std::move(entry));
        }
    }

    Database& db_;
    std::string knowledge_dir_;
};

} // namespace smriti
