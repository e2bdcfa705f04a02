#pragma once
// Engine: the owning context for every store
//
// One database connection, one vocabulary, four stores:
// - KnowledgeIndex: lexical (FTS5 + BM25) over the knowledge files
// - VectorStore:    TF-IDF embeddings + HNSW kNN
// - GraphStore:     entities and relationships
// - EpisodicLog:    sprint history
//
// A query is tokenized and embedded once in prepare(), then handed to
// whichever stores the caller wants to consult.

#include "config.hpp"
#include "database.hpp"
#include "embedding.hpp"
#include "episodic.hpp"
#include "graph_store.hpp"
#include "knowledge_index.hpp"
#include "types.hpp"
#include "vector_store.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace smriti {

// A query string, prepared once for every store
struct Query {
    std::string text;
    std::vector<std::string> tokens;      // recall floor (2+ chars)
    std::optional<Embedding> embedding;   // absent when no embedder is ready
};

class Engine {
public:
    explicit Engine(EngineConfig config = {})
        : config_(std::move(config)),
          db_(config_.db_path(), config_.busy_timeout_ms),
          tfidf_(std::make_shared<TfIdfEmbedder>()),
          knowledge_(db_, config_.knowledge_dir),
          vectors_(db_, *tfidf_, knowledge_, config_.hnsw),
          graph_(db_),
          episodes_(db_, config_.episode_retention_days) {
        if (config_.enable_vectors) {
            embedder_ = tfidf_;
        } else {
            embedder_ = std::make_shared<NullEmbedder>();
        }
    }

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Create schemas, load indexes, prune old episodes
    bool open() {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            db_.handle();
        } catch (const DatabaseError& e) {
            std::cerr << "[Engine] Error: " << e.what() << "\n";
            return false;
        }

        bool ok = knowledge_.initialize(config_.rebuild_lexical_if_empty);
        if (config_.enable_vectors) ok = vectors_.initialize() && ok;
        ok = graph_.initialize() && ok;
        ok = episodes_.initialize() && ok;
        if (!ok) {
            std::cerr << "[Engine] Error: initialization incomplete for " << db_.path() << "\n";
            return false;
        }

        open_ = true;
        std::cerr << "[Engine] Opened " << db_.path() << " (" << knowledge_.count() << " entries, "
                  << vectors_.count() << " vectors, " << episodes_.count() << " episodes)\n";
        return true;
    }

    // Drop the connection; the next open() starts from what is on disk
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        db_.close();
        open_ = false;
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Embedding capability
    // ═══════════════════════════════════════════════════════════════════════

    void attach_embedder(std::shared_ptr<Embedder> embedder) {
        std::lock_guard<std::mutex> lock(mutex_);
        embedder_ = embedder ? std::move(embedder) : std::make_shared<NullEmbedder>();
    }

    bool has_embedder() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return embedder_ && embedder_->ready();
    }

    Query prepare(const std::string& text) const {
        Query q;
        q.text = text;
        q.tokens = tokenize(text, RECALL_MIN_TOKEN);

        auto embedder = current_embedder();
        if (embedder->ready()) {
            try {
                q.embedding = embedder->embed(text);
            } catch (const std::runtime_error& e) {
                std::cerr << "[Engine] Warning: embedding unavailable: " << e.what() << "\n";
            }
        }
        return q;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Retrieval
    // ═══════════════════════════════════════════════════════════════════════

    std::vector<VectorHit> semantic_search(const Query& q, int limit = 10) const {
        if (!q.embedding) return {};
        return vectors_.search(*q.embedding, limit);
    }

    std::vector<VectorHit> semantic_search(const std::string& text, int limit = 10) const {
        return semantic_search(prepare(text), limit);
    }

    std::vector<KnowledgeHit> lexical_search(const Query& q, size_t max_results = 10) const {
        KnowledgeQuery kq;
        kq.query = q.text;
        kq.max_results = max_results;
        return knowledge_.search(kq);
    }

    std::vector<GraphNode> keyword_nodes(const Query& q, size_t max_results = 10) const {
        return graph_.find_nodes_by_keywords(q.tokens, max_results);
    }

    std::vector<Episode> recall_episodes(const Query& q, int limit = 10,
                                         const std::optional<std::string>& phase = std::nullopt) const {
        return episodes_.recall(q.text, limit, phase);
    }

    // Lexical rebuild from the knowledge files, then re-embed everything
    size_t index_all() {
        size_t lexical = knowledge_.rebuild();
        std::cerr << "[Engine] Lexical index rebuilt (" << lexical << " entries)\n";
        if (!config_.enable_vectors) return lexical;
        return vectors_.index_all_knowledge();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Introspection
    // ═══════════════════════════════════════════════════════════════════════

    bool is_vec_available() const { return config_.enable_vectors && vectors_.available(); }
    bool is_vocabulary_ready() const { return tfidf_->ready(); }
    VectorStats vec_stats() const { return vectors_.stats(); }
    GraphStats graph_stats() const { return graph_.stats(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Stores
    // ═══════════════════════════════════════════════════════════════════════

    KnowledgeIndex& knowledge() { return knowledge_; }
    VectorStore& vectors() { return vectors_; }
    GraphStore& graph() { return graph_; }
    EpisodicLog& episodes() { return episodes_; }
    TfIdfEmbedder& tfidf() { return *tfidf_; }
    Database& database() { return db_; }
    const EngineConfig& config() const { return config_; }

private:
    std::shared_ptr<Embedder> current_embedder() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return embedder_;
    }

    EngineConfig config_;
    Database db_;
    std::shared_ptr<TfIdfEmbedder> tfidf_;
    std::shared_ptr<Embedder> embedder_;
    KnowledgeIndex knowledge_;
    VectorStore vectors_;
    GraphStore graph_;
    EpisodicLog episodes_;
    mutable std::mutex mutex_;
    bool open_ = false;
};

} // namespace smriti
