#pragma once
// EpisodicLog: what happened, sprint by sprint
//
// episodes          append-only rows (phase, timestamp, action, outcome, lesson, tags)
// episodes_fts      external-content FTS5 shadow, kept in sync by triggers
//
// Episodes past the retention window are deleted when the log initializes.
// Recall is lexical and recency-ordered, not relevance-ordered.

#include "database.hpp"
#include "embedding.hpp"
#include "tag_index.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace smriti {

using json = nlohmann::json;

struct Episode {
    int64_t id = 0;
    std::string sprint_phase;
    std::string timestamp;   // ISO-8601 UTC
    std::string action;
    std::string outcome;
    std::optional<std::string> lesson;
    std::vector<std::string> tags;
};

// JSON array of strings; anything else gives an empty list.
// Non-string elements are kept in their JSON text form.
inline std::vector<std::string> parse_tags(const std::string& text) {
    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) return {};

    std::vector<std::string> tags;
    tags.reserve(parsed.size());
    for (const auto& el : parsed) {
        tags.push_back(el.is_string() ? el.get<std::string>() : el.dump());
    }
    return tags;
}

class EpisodicLog {
public:
    EpisodicLog(Database& db, int retention_days = 90)
        : db_(db), retention_days_(retention_days) {}

    bool initialize() {
        try {
            db_.exec(
                "CREATE TABLE IF NOT EXISTS episodes ("
                "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
                "  sprint_phase TEXT NOT NULL,"
                "  timestamp TEXT NOT NULL,"
                "  action TEXT NOT NULL,"
                "  outcome TEXT NOT NULL,"
                "  lesson TEXT,"
                "  tags TEXT NOT NULL DEFAULT '[]')");
            db_.exec("CREATE INDEX IF NOT EXISTS idx_episodes_phase_ts ON episodes(sprint_phase, timestamp)");
            db_.exec(
                "CREATE VIRTUAL TABLE IF NOT EXISTS episodes_fts USING fts5("
                "  action, outcome, lesson, tags, content='episodes', content_rowid='id')");
            db_.exec(
                "CREATE TRIGGER IF NOT EXISTS episodes_ai AFTER INSERT ON episodes BEGIN "
                "  INSERT INTO episodes_fts(rowid, action, outcome, lesson, tags) "
                "  VALUES (new.id, new.action, new.outcome, COALESCE(new.lesson, ''), new.tags); "
                "END");
            db_.exec(
                "CREATE TRIGGER IF NOT EXISTS episodes_ad AFTER DELETE ON episodes BEGIN "
                "  INSERT INTO episodes_fts(episodes_fts, rowid, action, outcome, lesson, tags) "
                "  VALUES ('delete', old.id, old.action, old.outcome, COALESCE(old.lesson, ''), old.tags); "
                "END");
        } catch (const DatabaseError& e) {
            std::cerr << "[EpisodicLog] Error: " << e.what() << "\n";
            return false;
        }

        size_t pruned = prune();
        if (pruned > 0) {
            std::cerr << "[EpisodicLog] Pruned " << pruned << " episodes older than "
                      << retention_days_ << " days\n";
        }
        rebuild_tag_index();
        initialized_ = true;
        return true;
    }

    bool initialized() const { return initialized_; }

    std::optional<Episode> record(const std::string& sprint_phase, const std::string& action,
                                  const std::string& outcome,
                                  const std::optional<std::string>& lesson = std::nullopt,
                                  const std::vector<std::string>& tags = {}) {
        return record_at(now(), sprint_phase, action, outcome, lesson, tags);
    }

    // Record with an explicit time, e.g. when importing history
    std::optional<Episode> record_at(Timestamp at, const std::string& sprint_phase,
                                     const std::string& action, const std::string& outcome,
                                     const std::optional<std::string>& lesson = std::nullopt,
                                     const std::vector<std::string>& tags = {}) {
        Episode ep;
        ep.sprint_phase = sprint_phase;
        ep.timestamp = format_iso8601(at);
        ep.action = action;
        ep.outcome = outcome;
        ep.lesson = lesson;
        ep.tags = tags;

        try {
            auto stmt = db_.prepare(
                "INSERT INTO episodes (sprint_phase, timestamp, action, outcome, lesson, tags) "
                "VALUES (?, ?, ?, ?, ?, ?)");
            stmt.bind(1, ep.sprint_phase).bind(2, ep.timestamp).bind(3, ep.action)
                .bind(4, ep.outcome).bind(5, ep.lesson).bind(6, json(ep.tags).dump());
            stmt.run();
            ep.id = db_.last_insert_rowid();
        } catch (const DatabaseError& e) {
            std::cerr << "[EpisodicLog] record failed: " << e.what() << "\n";
            return std::nullopt;
        }

        index_tags(ep.id, ep.tags);
        return ep;
    }

    // Lexical match on action/outcome/lesson/tags, newest first.
    // No usable token → empty, never a wildcard.
    std::vector<Episode> recall(const std::string& query, int limit = 10,
                                const std::optional<std::string>& sprint_phase = std::nullopt) const {
        auto tokens = tokenize(query, RECALL_MIN_TOKEN);
        if (tokens.empty() || limit <= 0) return {};

        std::string match;
        for (const auto& t : tokens) {
            if (!match.empty()) match += " OR ";
            match += "\"" + t + "\"";
        }

        std::string sql =
            "SELECT " + columns() + " FROM episodes "
            "WHERE id IN (SELECT rowid FROM episodes_fts WHERE episodes_fts MATCH ?)";
        if (sprint_phase) sql += " AND sprint_phase = ?";
        sql += " ORDER BY timestamp DESC, id DESC LIMIT ?";

        std::vector<Episode> out;
        try {
            auto stmt = db_.prepare(sql);
            int idx = 1;
            stmt.bind(idx++, match);
            if (sprint_phase) stmt.bind(idx++, *sprint_phase);
            stmt.bind(idx, limit);
            while (stmt.step()) out.push_back(read_episode(stmt));
        } catch (const DatabaseError& e) {
            std::cerr << "[EpisodicLog] Warning: recall failed: " << e.what() << "\n";
            return {};
        }
        return out;
    }

    std::vector<Episode> recent(const std::string& sprint_phase, int limit = 20) const {
        if (limit <= 0) return {};
        std::vector<Episode> out;
        try {
            auto stmt = db_.prepare(
                "SELECT " + columns() + " FROM episodes WHERE sprint_phase = ? "
                "ORDER BY timestamp DESC, id DESC LIMIT ?");
            stmt.bind(1, sprint_phase).bind(2, limit);
            while (stmt.step()) out.push_back(read_episode(stmt));
        } catch (const DatabaseError& e) {
            std::cerr << "[EpisodicLog] Warning: " << e.what() << "\n";
        }
        return out;
    }

    // Episodes carrying every one of the tags, newest first
    std::vector<Episode> by_tags(const std::vector<std::string>& tags, int limit = 20) const {
        auto ids = tags_.with_all_tags(tags);
        if (ids.empty() || limit <= 0) return {};

        std::string sql = "SELECT " + columns() + " FROM episodes WHERE id IN (";
        for (size_t i = 0; i < ids.size(); ++i) sql += (i == 0) ? "?" : ",?";
        sql += ") ORDER BY timestamp DESC, id DESC LIMIT ?";

        std::vector<Episode> out;
        try {
            auto stmt = db_.prepare(sql);
            int idx = 1;
            for (uint32_t id : ids) stmt.bind(idx++, static_cast<int64_t>(id));
            stmt.bind(idx, limit);
            while (stmt.step()) out.push_back(read_episode(stmt));
        } catch (const DatabaseError& e) {
            std::cerr << "[EpisodicLog] Warning: " << e.what() << "\n";
        }
        return out;
    }

    std::vector<Episode> by_tag(const std::string& tag, int limit = 20) const {
        return by_tags({tag}, limit);
    }

    // Delete episodes older than the retention window; returns how many
    size_t prune() {
        std::string cutoff = format_iso8601(now() - retention_days_ * MILLIS_PER_DAY);
        try {
            Transaction txn(db_);
            auto stmt = db_.prepare("DELETE FROM episodes WHERE timestamp < ?");
            stmt.bind(1, cutoff);
            stmt.run();
            size_t deleted = static_cast<size_t>(db_.changes());
            txn.commit();
            if (deleted > 0 && initialized_) rebuild_tag_index();
            return deleted;
        } catch (const DatabaseError& e) {
            std::cerr << "[EpisodicLog] Warning: prune failed: " << e.what() << "\n";
            return 0;
        }
    }

    size_t count() const {
        try {
            auto stmt = db_.prepare("SELECT count(*) FROM episodes");
            return stmt.step() ? static_cast<size_t>(stmt.column_int64(0)) : 0;
        } catch (const DatabaseError&) {
            return 0;
        }
    }

    size_t tag_count() const { return tags_.tag_count(); }

private:
    static std::string columns() {
        return "id, sprint_phase, timestamp, action, outcome, lesson, tags";
    }

    static Episode read_episode(const Statement& stmt) {
        Episode ep;
        ep.id = stmt.column_int64(0);
        ep.sprint_phase = stmt.column_text(1);
        ep.timestamp = stmt.column_text(2);
        ep.action = stmt.column_text(3);
        ep.outcome = stmt.column_text(4);
        ep.lesson = stmt.column_optional_text(5);
        ep.tags = parse_tags(stmt.column_text(6));
        return ep;
    }

    void index_tags(int64_t id, const std::vector<std::string>& tags) {
        if (tags.empty()) return;
        if (id <= 0 || id > std::numeric_limits<uint32_t>::max()) {
            std::cerr << "[EpisodicLog] Warning: episode " << id << " outside tag index range\n";
            return;
        }
        tags_.add(static_cast<uint32_t>(id), tags);
    }

    void rebuild_tag_index() {
        tags_.clear();
        try {
            auto stmt = db_.prepare("SELECT id, tags FROM episodes WHERE tags <> '[]'");
            while (stmt.step()) {
                index_tags(stmt.column_int64(0), parse_tags(stmt.column_text(1)));
            }
        } catch (const DatabaseError& e) {
            std::cerr << "[EpisodicLog] Warning: tag index rebuild failed: " << e.what() << "\n";
        }
    }

    Database& db_;
    int retention_days_;
    EpisodeTagIndex tags_;
    bool initialized_ = false;
};

} // namespace smriti
