#pragma once
// VectorStore: durable kNN over knowledge embeddings
//
// Tables:
//   vec_items(rowid, embedding BLOB)          vector under an integer handle
//   vec_metadata(rowid AUTOINCREMENT, entry_id UNIQUE)
//   vec_vocabulary(position, term, idf)       vocabulary the vectors were built with
//
// The HNSW index is rebuilt from vec_items at initialize() and kept in step
// with every committed write. Search is two-phase: kNN over handles first,
// then one batched lookup of entry ids for exactly those handles.

#include "database.hpp"
#include "embedding.hpp"
#include "hnsw.hpp"
#include "knowledge_index.hpp"
#include <algorithm>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace smriti {

struct VectorHit {
    std::string id;
    float distance = 0.0f;
    float score = 0.0f;   // max(0, 1 - distance)
};

struct VectorStats {
    size_t count = 0;
    size_t dimensions = EMBED_DIM;
};

constexpr size_t SEARCH_LIMIT_MAX = 100;

class VectorStore {
public:
    VectorStore(Database& db, TfIdfEmbedder& embedder, const KnowledgeIndex& lexical,
                HNSWConfig config = {})
        : db_(db), embedder_(embedder), lexical_(lexical), index_(config) {}

    // Idempotent
    bool initialize() {
        try {
            db_.exec(
                "CREATE TABLE IF NOT EXISTS vec_items ("
                "  rowid INTEGER PRIMARY KEY,"
                "  embedding BLOB NOT NULL)");
            db_.exec(
                "CREATE TABLE IF NOT EXISTS vec_metadata ("
                "  rowid INTEGER PRIMARY KEY AUTOINCREMENT,"
                "  entry_id TEXT NOT NULL UNIQUE)");
            db_.exec("CREATE INDEX IF NOT EXISTS idx_vec_metadata_entry ON vec_metadata(entry_id)");
            db_.exec(
                "CREATE TABLE IF NOT EXISTS vec_vocabulary ("
                "  position INTEGER PRIMARY KEY,"
                "  term TEXT NOT NULL,"
                "  idf REAL NOT NULL)");

            if (!embedder_.ready()) restore_vocabulary();
            load_index();
        } catch (const DatabaseError& e) {
            std::cerr << "[VectorStore] Error: initialize failed: " << e.what() << "\n";
            return false;
        }
        initialized_ = true;
        return true;
    }

    bool initialized() const { return initialized_; }

    // Same handle for an existing id, next AUTOINCREMENT handle for a new one
    bool upsert(const std::string& id, const Embedding& embedding) {
        if (!initialized_) {
            std::cerr << "[VectorStore] Warning: upsert before initialize\n";
            return false;
        }
        try {
            Transaction txn(db_);
            Handle handle = write_vector(id, embedding);
            txn.commit();
            index_.insert(handle, embedding);
            return true;
        } catch (const DatabaseError& e) {
            std::cerr << "[VectorStore] Upsert failed for " << id << ": " << e.what() << "\n";
            return false;
        }
    }

    bool remove(const std::string& id) {
        if (!initialized_) return false;
        try {
            auto handle = find_handle(id);
            if (!handle) return false;

            Transaction txn(db_);
            auto del_vec = db_.prepare("DELETE FROM vec_items WHERE rowid = ?");
            del_vec.bind(1, *handle);
            del_vec.run();
            auto del_meta = db_.prepare("DELETE FROM vec_metadata WHERE rowid = ?");
            del_meta.bind(1, *handle);
            del_meta.run();
            txn.commit();

            index_.remove(*handle);
            return true;
        } catch (const DatabaseError& e) {
            std::cerr << "[VectorStore] Remove failed for " << id << ": " << e.what() << "\n";
            return false;
        }
    }

    // Nearest first. limit is clamped to [1, 100].
    std::vector<VectorHit> search(const Embedding& query, int limit) const {
        if (!initialized_) {
            std::cerr << "[VectorStore] Warning: search before initialize\n";
            return {};
        }
        size_t k = static_cast<size_t>(std::clamp(limit, 1, static_cast<int>(SEARCH_LIMIT_MAX)));

        // Phase 1: kNN over handles only
        auto neighbors = index_.search(query, k);
        if (neighbors.empty()) return {};

        // Phase 2: resolve those handles in one query
        std::unordered_map<Handle, std::string> ids;
        try {
            std::string sql = "SELECT rowid, entry_id FROM vec_metadata WHERE rowid IN (";
            for (size_t i = 0; i < neighbors.size(); ++i) {
                sql += (i == 0) ? "?" : ",?";
            }
            sql += ")";

            auto stmt = db_.prepare(sql);
            for (size_t i = 0; i < neighbors.size(); ++i) {
                stmt.bind(static_cast<int>(i + 1), neighbors[i].first);
            }
            while (stmt.step()) {
                ids[stmt.column_int64(0)] = stmt.column_text(1);
            }
        } catch (const DatabaseError& e) {
            std::cerr << "[VectorStore] Warning: search failed: " << e.what() << "\n";
            return {};
        }

        std::vector<VectorHit> hits;
        hits.reserve(neighbors.size());
        for (const auto& [handle, dist] : neighbors) {
            auto it = ids.find(handle);
            if (it == ids.end()) continue;
            hits.push_back({it->second, dist, std::max(0.0f, 1.0f - dist)});
        }
        return hits;
    }

    // Re-embed the whole lexical corpus with a fresh vocabulary.
    // All-or-nothing: on failure the previous vectors and vocabulary stay.
    size_t index_all_knowledge() {
        if (!initialized_) {
            std::cerr << "[VectorStore] Warning: index before initialize\n";
            return 0;
        }

        std::vector<std::pair<std::string, std::string>> corpus;
        try {
            corpus = lexical_.corpus();
        } catch (const DatabaseError& e) {
            std::cerr << "[VectorStore] Warning: cannot read corpus: " << e.what() << "\n";
            return 0;
        }
        if (corpus.empty()) {
            std::cerr << "[VectorStore] Corpus empty, index unchanged\n";
            return 0;
        }

        std::vector<std::string> documents;
        documents.reserve(corpus.size());
        for (const auto& entry : corpus) documents.push_back(entry.second);
        auto vocab = std::make_shared<const Vocabulary>(Vocabulary::build(documents));

        // Entries sharing an id share a handle; the last one wins
        std::unordered_map<Handle, Embedding> written;
        try {
            Transaction txn(db_);
            db_.exec("DELETE FROM vec_items");
            db_.exec("DELETE FROM vec_metadata");
            db_.exec("DELETE FROM vec_vocabulary");
            save_vocabulary(*vocab);
            for (const auto& [id, text] : corpus) {
                Embedding e = vocab->embed(text);
                written[write_vector(id, e)] = e;
            }
            txn.commit();
        } catch (const DatabaseError& e) {
            std::cerr << "[VectorStore] Rebuild failed, keeping previous index: " << e.what() << "\n";
            return 0;
        }

        embedder_.install(vocab);
        index_.clear();
        for (const auto& [handle, e] : written) index_.insert(handle, e);

        std::cerr << "[VectorStore] Indexed " << written.size() << " entries ("
                  << vocab->size() << " terms)\n";
        return written.size();
    }

    size_t count() const { return index_.size(); }

    // At least one vector stored
    bool available() const { return initialized_ && count() > 0; }

    VectorStats stats() const { return {count(), EMBED_DIM}; }

private:
    std::optional<Handle> find_handle(const std::string& id) {
        auto stmt = db_.prepare("SELECT rowid FROM vec_metadata WHERE entry_id = ?");
        stmt.bind(1, id);
        if (stmt.step()) return stmt.column_int64(0);
        return std::nullopt;
    }

    // Caller holds the transaction
    Handle write_vector(const std::string& id, const Embedding& embedding) {
        Handle handle;
        if (auto existing = find_handle(id)) {
            handle = *existing;
            auto del = db_.prepare("DELETE FROM vec_items WHERE rowid = ?");
            del.bind(1, handle);
            del.run();
        } else {
            auto meta = db_.prepare("INSERT INTO vec_metadata (entry_id) VALUES (?)");
            meta.bind(1, id);
            meta.run();
            handle = db_.last_insert_rowid();
        }

        auto insert = db_.prepare("INSERT INTO vec_items (rowid, embedding) VALUES (?, ?)");
        insert.bind(1, handle);
        insert.bind_blob(2, embedding.data(), Embedding::byte_size());
        insert.run();
        return handle;
    }

    void save_vocabulary(const Vocabulary& vocab) {
        auto stmt = db_.prepare("INSERT INTO vec_vocabulary (position, term, idf) VALUES (?, ?, ?)");
        for (size_t i = 0; i < vocab.size(); ++i) {
            stmt.bind(1, static_cast<int64_t>(i))
                .bind(2, vocab.terms[i])
                .bind(3, static_cast<double>(vocab.idf[i]));
            stmt.run();
            stmt.reset();
        }
    }

    // Stored vectors with no vocabulary rows came from a corpus with no
    // usable terms: that is still a built (empty) vocabulary
    void restore_vocabulary() {
        std::vector<std::pair<std::string, float>> rows;
        auto stmt = db_.prepare("SELECT term, idf FROM vec_vocabulary ORDER BY position");
        while (stmt.step()) {
            rows.emplace_back(stmt.column_text(0), static_cast<float>(stmt.column_double(1)));
        }
        if (rows.empty()) {
            auto vectors = db_.prepare("SELECT 1 FROM vec_metadata LIMIT 1");
            if (!vectors.step()) return;
        }
        embedder_.install(std::make_shared<const Vocabulary>(Vocabulary::from_rows(std::move(rows))));
    }

    void load_index() {
        index_.clear();
        size_t skipped = 0;
        auto stmt = db_.prepare("SELECT rowid, embedding FROM vec_items");
        while (stmt.step()) {
            if (stmt.column_bytes(1) != Embedding::byte_size()) {
                ++skipped;
                continue;
            }
            Embedding e;
            std::memcpy(e.data(), stmt.column_blob(1), Embedding::byte_size());
            index_.insert(stmt.column_int64(0), e);
        }
        if (skipped > 0) {
            std::cerr << "[VectorStore] Warning: skipped " << skipped << " malformed vectors\n";
        }
    }

    Database& db_;
    TfIdfEmbedder& embedder_;
    const KnowledgeIndex& lexical_;
    HNSWIndex index_;
    bool initialized_ = false;
};

} // namespace smriti
