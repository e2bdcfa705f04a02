#include <smriti/smriti.hpp>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <random>
#include <set>
#include <stdexcept>

using namespace smriti;

static const char* TEST_DIR = "/tmp/smriti_test";

EngineConfig memory_config() {
    EngineConfig config;
    config.knowledge_dir = "/tmp/smriti_test_none";
    config.db_file = ":memory:";
    return config;
}

Embedding test_vector(float seed) {
    Embedding v;
    for (size_t i = 0; i < EMBED_DIM; ++i) {
        v[i] = std::sin((static_cast<float>(i) + seed) * 0.1f);
    }
    v.normalize();
    return v;
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

// Two patterns, one lesson, one decision, one deferred item
void write_knowledge(const std::string& dir) {
    std::system(("mkdir -p " + dir).c_str());
    write_file(dir + "/patterns.json", R"({
        "patterns": [
            {"id": 1, "name": "Retry with backoff", "description": "Wrap flaky network calls",
             "example": "fetch retries three times", "date": "2026-01-10T00:00:00.000Z"},
            {"id": 2, "name": "SQLite WAL mode", "description": "Enable write ahead logging for sqlite",
             "example": "PRAGMA journal_mode", "date": "2026-02-01T00:00:00.000Z"}
        ]})");
    write_file(dir + "/lessons.json", R"({
        "lessons": [
            {"id": 7, "situation": "Migration broke production schema",
             "learning": "Always test schema migration on a copy"}
        ]})");
    write_file(dir + "/decisions.json", R"({
        "decisions": [
            {"id": 3, "title": "Use sqlite for knowledge storage", "context": "single process",
             "rationale": "embedded and fast", "alternatives": ["postgres", "flat files"]}
        ]})");
    write_file(dir + "/deferred.json", R"({
        "items": [
            {"id": 4, "title": "Vector quantization", "reason": "not needed yet", "effort": "medium"}
        ]})");
}

// A→B (produced), B→C (mentions), A→D (produced)
void build_sample_graph(GraphStore& graph) {
    graph.add_nodes({
        {"A", "sprint", "Sprint A", json::object()},
        {"B", "artifact", "Artifact B", json::object()},
        {"C", "concept", "Concept C", json::object()},
        {"D", "artifact", "Artifact D", json::object()},
    });
    graph.add_edges({
        {"A", "B", "produced", 1.0},
        {"B", "C", "mentions", 1.0},
        {"A", "D", "produced", 1.0},
    });
}

std::set<std::string> hit_ids(const std::vector<TraversalHit>& hits) {
    std::set<std::string> ids;
    for (const auto& h : hits) ids.insert(h.node.id);
    return ids;
}

// Unit vectors spread over a fixed 8-dimensional subspace. The basis is the
// same for every seed, so points from different seeds share neighborhoods.
std::vector<Embedding> subspace_vectors(size_t count, unsigned seed) {
    std::mt19937 basis_rng(7);
    std::normal_distribution<float> basis_normal(0.0f, 1.0f);
    std::vector<Embedding> basis(8);
    for (auto& b : basis) {
        for (size_t i = 0; i < EMBED_DIM; ++i) b[i] = basis_normal(basis_rng);
    }

    std::mt19937 rng(seed);
    std::normal_distribution<float> normal(0.0f, 1.0f);
    std::vector<Embedding> out;
    out.reserve(count);
    for (size_t n = 0; n < count; ++n) {
        Embedding v;
        for (const auto& b : basis) {
            float c = normal(rng);
            for (size_t i = 0; i < EMBED_DIM; ++i) v[i] += c * b[i];
        }
        v.normalize();
        out.push_back(v);
    }
    return out;
}

// Index of the exact nearest vector, skipping erased slots
size_t nearest_by_scan(const std::vector<Embedding>& vectors, const std::vector<bool>& live,
                       const Embedding& query) {
    size_t best = vectors.size();
    float best_dist = 0.0f;
    for (size_t i = 0; i < vectors.size(); ++i) {
        if (!live[i]) continue;
        float d = query.l2_distance(vectors[i]);
        if (best == vectors.size() || d < best_dist) {
            best = i;
            best_dist = d;
        }
    }
    return best;
}

// ═══════════════════════════════════════════════════════════════════════════
// Embedding
// ═══════════════════════════════════════════════════════════════════════════

void test_tokenize() {
    std::cout << "Testing tokenize..." << std::endl;

    auto tokens = tokenize("Hello, World! a1 ab ABC x", EMBED_MIN_TOKEN);
    assert((tokens == std::vector<std::string>{"hello", "world", "abc"}));

    tokens = tokenize("Hello, World! a1 ab ABC x", RECALL_MIN_TOKEN);
    assert((tokens == std::vector<std::string>{"hello", "world", "a1", "ab", "abc"}));

    assert(tokenize("! @ # $", RECALL_MIN_TOKEN).empty());
    assert((tokenize("snake_case-and.dots", 3) == std::vector<std::string>{"snake", "case", "and", "dots"}));

    std::cout << "  PASS" << std::endl;
}

void test_vocabulary_build() {
    std::cout << "Testing Vocabulary build..." << std::endl;

    auto vocab = Vocabulary::build({"apple banana apple", "apple cherry", "banana apple"});
    assert(vocab.size() == 3);
    assert(vocab.terms[0] == "apple");    // df 3
    assert(vocab.terms[1] == "banana");   // df 2
    assert(vocab.terms[2] == "cherry");   // df 1
    assert(std::fabs(vocab.idf[0]) < 1e-6f);
    assert(std::fabs(vocab.idf[1] - std::log(3.0f / 2.0f)) < 1e-5f);
    assert(std::fabs(vocab.idf[2] - std::log(3.0f)) < 1e-5f);

    // Equal document frequency: lexicographic order
    auto tied = Vocabulary::build({"zeta alpha mid"});
    assert((tied.terms == std::vector<std::string>{"alpha", "mid", "zeta"}));

    // Capped at EMBED_DIM terms
    std::vector<std::string> docs;
    for (int i = 0; i < 1000; ++i) docs.push_back("word" + std::to_string(i) + " common");
    auto capped = Vocabulary::build(docs);
    assert(capped.size() == EMBED_DIM);
    assert(capped.terms[0] == "common");

    std::cout << "  PASS" << std::endl;
}

void test_embedding_normalized() {
    std::cout << "Testing embedding normalization..." << std::endl;

    TfIdfEmbedder embedder;
    embedder.build_vocabulary({"sprint planning code review",
                               "database migration schema design",
                               "authentication security tokens"});
    assert(embedder.ready());

    for (const char* text : {"sprint code", "database schema schema", "tokens review migration"}) {
        Embedding e = embedder.generate_embedding(text);
        assert(std::fabs(e.norm_sq() - 1.0f) < 1e-5f);
    }

    // Nothing in the vocabulary: zero vector, not NaN
    Embedding none = embedder.generate_embedding("completely unrelated words");
    assert(none.is_zero());

    // Deterministic
    assert(embedder.generate_embedding("sprint code") == embedder.generate_embedding("sprint code"));

    std::cout << "  PASS" << std::endl;
}

void test_embedding_requires_vocabulary() {
    std::cout << "Testing embedding before vocabulary..." << std::endl;

    TfIdfEmbedder embedder;
    assert(!embedder.ready());
    bool threw = false;
    try {
        embedder.generate_embedding("anything");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    NullEmbedder null_embedder;
    assert(!null_embedder.ready());
    threw = false;
    try {
        null_embedder.embed("anything");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_empty_corpus_keeps_vocabulary() {
    std::cout << "Testing empty corpus is a no-op..." << std::endl;

    TfIdfEmbedder embedder;
    embedder.build_vocabulary({"alpha beta gamma", "beta delta"});
    auto before = embedder.vocabulary();
    Embedding e1 = embedder.generate_embedding("beta gamma");

    embedder.build_vocabulary({});
    assert(embedder.vocabulary() == before);
    assert(embedder.generate_embedding("beta gamma") == e1);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// HNSW
// ═══════════════════════════════════════════════════════════════════════════

void test_hnsw_index() {
    std::cout << "Testing HNSW index..." << std::endl;

    HNSWConfig config;
    config.exact_below = 0;   // always walk the graph
    HNSWIndex index(config);

    for (int i = 0; i < 300; ++i) {
        index.insert(i + 1, test_vector(static_cast<float>(i) * 0.5f));
    }
    assert(index.size() == 300);

    auto results = index.search(test_vector(50.0f), 5);   // handle 101
    assert(results.size() == 5);
    bool found = false;
    for (const auto& [id, dist] : results) {
        if (id == 101) found = true;
    }
    assert(found);
    for (size_t i = 1; i < results.size(); ++i) {
        assert(results[i - 1].second <= results[i].second);
    }

    index.remove(101);
    assert(!index.contains(101));
    for (const auto& [id, dist] : index.search(test_vector(50.0f), 5)) {
        assert(id != 101);
    }

    // Reinsert under the same handle replaces the vector
    index.insert(7, test_vector(1000.0f));
    assert(index.size() == 299);
    auto moved = index.search(test_vector(1000.0f), 1);
    assert(moved.size() == 1 && moved[0].first == 7);

    index.clear();
    assert(index.empty());
    assert(index.search(test_vector(1.0f), 3).empty());

    std::cout << "  PASS" << std::endl;
}

void test_hnsw_exact_scan() {
    std::cout << "Testing HNSW exact scan..." << std::endl;

    HNSWIndex index;
    index.insert(1, test_vector(1.0f));
    index.insert(2, test_vector(40.0f));
    index.insert(3, test_vector(80.0f));

    auto results = index.search(test_vector(40.0f), 10);
    assert(results.size() == 3);
    assert(results[0].first == 2);
    assert(results[0].second < 1e-4f);

    std::cout << "  PASS" << std::endl;
}

void test_hnsw_graph_matches_scan() {
    std::cout << "Testing HNSW graph search against exact scan..." << std::endl;

    HNSWConfig config;
    config.exact_below = 0;
    HNSWIndex index(config);

    auto stored = subspace_vectors(1200, 11);
    std::vector<bool> live(stored.size(), true);
    for (size_t i = 0; i < stored.size(); ++i) {
        index.insert(static_cast<Handle>(i), stored[i]);
    }

    auto queries = subspace_vectors(200, 99);
    auto agreement = [&]() {
        size_t agree = 0;
        for (const auto& q : queries) {
            auto top = index.search(q, 1);
            assert(top.size() == 1);
            assert(live[static_cast<size_t>(top[0].first)]);
            if (static_cast<size_t>(top[0].first) == nearest_by_scan(stored, live, q)) ++agree;
        }
        return agree;
    };

    assert(agreement() >= 180);

    // Every stored vector finds itself
    size_t self_hits = 0;
    for (size_t i = 0; i < stored.size(); i += 4) {
        auto top = index.search(stored[i], 1);
        if (!top.empty() && top[0].first == static_cast<Handle>(i)) ++self_hits;
    }
    assert(self_hits >= 285);   // of 300

    // Re-insert a third of the vectors under their handles, remove another fifth
    for (size_t i = 0; i < stored.size(); i += 3) {
        index.insert(static_cast<Handle>(i), stored[i]);
    }
    for (size_t i = 1; i < stored.size(); i += 5) {
        index.remove(static_cast<Handle>(i));
        live[i] = false;
    }
    assert(index.size() == 960);
    assert(agreement() >= 180);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Database
// ═══════════════════════════════════════════════════════════════════════════

void test_transaction_rollback() {
    std::cout << "Testing Transaction rollback..." << std::endl;

    Database db(":memory:");
    db.exec("CREATE TABLE t (x INTEGER)");
    {
        Transaction txn(db);
        db.exec("INSERT INTO t VALUES (1)");
        // no commit
    }
    {
        auto stmt = db.prepare("SELECT count(*) FROM t");
        assert(stmt.step() && stmt.column_int64(0) == 0);
    }
    {
        Transaction txn(db);
        db.exec("INSERT INTO t VALUES (2)");
        txn.commit();
    }
    auto stmt = db.prepare("SELECT count(*) FROM t");
    assert(stmt.step() && stmt.column_int64(0) == 1);

    bool threw = false;
    try {
        db.prepare("SELECT * FROM missing_table");
    } catch (const DatabaseError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Vector store
// ═══════════════════════════════════════════════════════════════════════════

void test_vector_search_uninitialized() {
    std::cout << "Testing vector search before initialize..." << std::endl;

    Database db(":memory:");
    TfIdfEmbedder embedder;
    KnowledgeIndex lexical(db, "/tmp/smriti_test_none");
    VectorStore store(db, embedder, lexical);

    assert(!store.initialized());
    assert(store.search(test_vector(1.0f), 5).empty());
    assert(!store.upsert("x", test_vector(1.0f)));
    assert(store.index_all_knowledge() == 0);
    assert(!store.available());

    std::cout << "  PASS" << std::endl;
}

void test_vector_upsert_twice() {
    std::cout << "Testing vector upsert keeps one record..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    auto& vectors = engine.vectors();

    auto handle_of = [&](const std::string& id) {
        auto stmt = engine.database().prepare("SELECT rowid FROM vec_metadata WHERE entry_id = ?");
        stmt.bind(1, id);
        assert(stmt.step());
        return stmt.column_int64(0);
    };

    Embedding e1 = test_vector(1.0f);
    Embedding e2 = test_vector(60.0f);
    assert(vectors.upsert("lesson-1", e1));
    int64_t h1 = handle_of("lesson-1");
    assert(vectors.upsert("lesson-1", e2));
    assert(handle_of("lesson-1") == h1);
    assert(vectors.count() == 1);
    assert(vectors.stats().count == 1);
    assert(vectors.stats().dimensions == 768);

    auto hits = vectors.search(e2, 5);
    assert(hits.size() == 1);
    assert(hits[0].id == "lesson-1");
    assert(hits[0].distance < 1e-4f);
    assert(hits[0].score > 0.99f);

    // New ids get increasing handles
    assert(vectors.upsert("lesson-2", e1));
    assert(handle_of("lesson-2") > h1);

    assert(vectors.remove("lesson-1"));
    assert(!vectors.remove("lesson-1"));
    assert(vectors.count() == 1);
    assert(vectors.search(e2, 5)[0].id == "lesson-2");

    std::cout << "  PASS" << std::endl;
}

void test_vector_search_limit_clamp() {
    std::cout << "Testing vector search limit clamp..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    for (int i = 0; i < 3; ++i) {
        engine.vectors().upsert("entry-" + std::to_string(i), test_vector(static_cast<float>(i) * 30.0f));
    }

    assert(engine.vectors().search(test_vector(0.0f), 0).size() == 1);
    assert(engine.vectors().search(test_vector(0.0f), -5).size() == 1);
    assert(engine.vectors().search(test_vector(0.0f), 1000).size() == 3);

    auto hits = engine.vectors().search(test_vector(0.0f), 3);
    for (const auto& h : hits) {
        assert(h.score >= 0.0f && h.score <= 1.0f);
        assert(std::fabs(h.score - std::max(0.0f, 1.0f - h.distance)) < 1e-6f);
    }

    std::cout << "  PASS" << std::endl;
}

void test_sprint_document_ranks_first() {
    std::cout << "Testing semantic ranking..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());

    std::vector<std::string> docs = {"sprint planning code review",
                                     "database migration schema design",
                                     "authentication security tokens"};
    engine.tfidf().build_vocabulary(docs);
    for (size_t i = 0; i < docs.size(); ++i) {
        engine.vectors().upsert("doc-" + std::to_string(i), engine.tfidf().generate_embedding(docs[i]));
    }

    auto hits = engine.vectors().search(engine.tfidf().generate_embedding("sprint code"), 3);
    assert(hits.size() == 3);
    assert(hits[0].id == "doc-0");
    assert(hits[0].distance < hits[1].distance);

    // Same path through the engine
    auto q = engine.prepare("sprint code");
    assert(q.embedding.has_value());
    auto via_engine = engine.semantic_search(q, 3);
    assert(via_engine.size() == 3 && via_engine[0].id == "doc-0");

    std::cout << "  PASS" << std::endl;
}

void test_index_all_knowledge() {
    std::cout << "Testing index all knowledge..." << std::endl;
    std::system("rm -rf /tmp/smriti_test");
    write_knowledge(TEST_DIR);

    EngineConfig config;
    config.knowledge_dir = TEST_DIR;
    config.db_file = ":memory:";
    Engine engine(config);
    assert(engine.open());
    assert(engine.knowledge().count() == 5);
    assert(!engine.is_vec_available());
    assert(!engine.is_vocabulary_ready());

    size_t n = engine.vectors().index_all_knowledge();
    assert(n == 5);
    assert(engine.is_vec_available());
    assert(engine.is_vocabulary_ready());
    assert(engine.vec_stats().count == 5);

    auto hits = engine.semantic_search("schema migration", 5);
    assert(!hits.empty());
    assert(hits[0].id == "lesson-7");

    // Rebuild is idempotent
    assert(engine.index_all() == 5);
    assert(engine.vec_stats().count == 5);

    std::cout << "  PASS" << std::endl;
}

void test_index_all_empty_corpus() {
    std::cout << "Testing index all with empty corpus..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    engine.vectors().upsert("keep-me", test_vector(3.0f));

    assert(engine.vectors().index_all_knowledge() == 0);
    assert(engine.vectors().count() == 1);
    assert(engine.vectors().search(test_vector(3.0f), 1)[0].id == "keep-me");
    assert(!engine.is_vocabulary_ready());

    std::cout << "  PASS" << std::endl;
}

void test_vocabulary_persists() {
    std::cout << "Testing vocabulary persistence..." << std::endl;
    std::system("rm -rf /tmp/smriti_test");
    write_knowledge(TEST_DIR);

    EngineConfig config;
    config.knowledge_dir = TEST_DIR;

    std::vector<VectorHit> before;
    {
        Engine engine(config);
        assert(engine.open());
        assert(engine.index_all() == 5);
        before = engine.semantic_search("retry network", 3);
        assert(!before.empty());
        engine.close();
    }

    Engine reopened(config);
    assert(reopened.open());
    assert(reopened.is_vocabulary_ready());
    assert(reopened.vec_stats().count == 5);
    auto after = reopened.semantic_search("retry network", 3);
    assert(after.size() == before.size());
    assert(after[0].id == before[0].id);
    assert(after[0].id == "pattern-1");

    std::cout << "  PASS" << std::endl;
}

void test_vectors_disabled() {
    std::cout << "Testing null embedder..." << std::endl;

    EngineConfig config = memory_config();
    config.enable_vectors = false;
    Engine engine(config);
    assert(engine.open());
    assert(!engine.has_embedder());

    auto q = engine.prepare("sprint code");
    assert(!q.embedding.has_value());
    assert((q.tokens == std::vector<std::string>{"sprint", "code"}));
    assert(engine.semantic_search(q, 5).empty());
    assert(!engine.is_vec_available());

    std::cout << "  PASS" << std::endl;
}

void test_vector_search_past_exact_threshold() {
    std::cout << "Testing vector search on a large store..." << std::endl;

    auto stored = subspace_vectors(1100, 23);
    std::vector<bool> live(stored.size(), true);
    auto queries = subspace_vectors(60, 77);

    auto top_hits_match = [&](Engine& engine) {
        size_t agree = 0;
        for (const auto& q : queries) {
            auto hits = engine.vectors().search(q, 5);
            assert(hits.size() == 5);
            size_t expected = nearest_by_scan(stored, live, q);
            if (hits[0].id == "entry-" + std::to_string(expected)) ++agree;
        }
        return agree;
    };

    // Default configuration: exact ranking
    {
        Engine engine(memory_config());
        assert(engine.open());
        for (size_t i = 0; i < stored.size(); ++i) {
            assert(engine.vectors().upsert("entry-" + std::to_string(i), stored[i]));
        }
        assert(engine.vec_stats().count == 1100);
        assert(top_hits_match(engine) == queries.size());
    }

    // Graph search from the first vector
    {
        EngineConfig config = memory_config();
        config.hnsw.exact_below = 0;
        Engine engine(config);
        assert(engine.open());
        for (size_t i = 0; i < stored.size(); ++i) {
            engine.vectors().upsert("entry-" + std::to_string(i), stored[i]);
        }
        assert(top_hits_match(engine) >= 54);

        // Upserting the same vectors again keeps the ranking
        for (size_t i = 0; i < stored.size(); i += 2) {
            engine.vectors().upsert("entry-" + std::to_string(i), stored[i]);
        }
        assert(engine.vec_stats().count == 1100);
        assert(top_hits_match(engine) >= 54);
    }

    std::cout << "  PASS" << std::endl;
}

void test_index_all_rolls_back() {
    std::cout << "Testing failed re-index keeps the previous index..." << std::endl;
    std::system("rm -rf /tmp/smriti_test");
    write_knowledge(TEST_DIR);

    EngineConfig config = memory_config();
    config.knowledge_dir = TEST_DIR;
    Engine engine(config);
    assert(engine.open());
    assert(engine.index_all() == 5);

    auto scalar = [&](const std::string& sql) {
        auto stmt = engine.database().prepare(sql);
        assert(stmt.step());
        return stmt.column_int64(0);
    };

    auto before = engine.semantic_search("schema migration", 3);
    assert(before[0].id == "lesson-7");
    auto vocab_before = engine.tfidf().vocabulary();
    int64_t handle_before = scalar("SELECT rowid FROM vec_metadata WHERE entry_id = 'lesson-7'");
    int64_t terms_before = scalar("SELECT count(*) FROM vec_vocabulary");

    engine.database().exec(
        "CREATE TRIGGER block_vectors BEFORE INSERT ON vec_items "
        "BEGIN SELECT RAISE(ABORT, 'blocked'); END");
    assert(engine.knowledge().upsert({"lesson", 9, "Flaky caching layer evicts hot keys", ""}));

    assert(engine.vectors().index_all_knowledge() == 0);
    assert(engine.vec_stats().count == 5);
    assert(engine.tfidf().vocabulary() == vocab_before);
    assert(scalar("SELECT count(*) FROM vec_items") == 5);
    assert(scalar("SELECT count(*) FROM vec_metadata") == 5);
    assert(scalar("SELECT rowid FROM vec_metadata WHERE entry_id = 'lesson-7'") == handle_before);
    assert(scalar("SELECT count(*) FROM vec_vocabulary") == terms_before);

    auto after = engine.semantic_search("schema migration", 3);
    assert(after.size() == before.size());
    assert(after[0].id == "lesson-7");
    assert(std::fabs(after[0].distance - before[0].distance) < 1e-6f);

    // Once writes go through again the rebuild picks up the new entry
    engine.database().exec("DROP TRIGGER block_vectors");
    assert(engine.vectors().index_all_knowledge() == 6);
    assert(engine.vec_stats().count == 6);

    std::cout << "  PASS" << std::endl;
}

void test_index_all_counts_distinct_ids() {
    std::cout << "Testing re-index count with repeated ids..." << std::endl;
    std::system("rm -rf /tmp/smriti_test");
    std::system("mkdir -p /tmp/smriti_test");
    write_file(std::string(TEST_DIR) + "/patterns.json", R"({
        "patterns": [
            {"name": "Pattern without id", "description": "first unnamed pattern"},
            {"name": "Another without id", "description": "second unnamed pattern"},
            {"id": 5, "name": "Numbered pattern", "description": "has its own id"}
        ]})");

    EngineConfig config = memory_config();
    config.knowledge_dir = TEST_DIR;
    Engine engine(config);
    assert(engine.open());
    assert(engine.knowledge().count() == 3);

    size_t n = engine.vectors().index_all_knowledge();
    assert(n == 2);
    assert(engine.vec_stats().count == n);

    std::cout << "  PASS" << std::endl;
}

void test_empty_vocabulary_is_built() {
    std::cout << "Testing vocabulary with no usable terms..." << std::endl;

    TfIdfEmbedder embedder;
    embedder.build_vocabulary({"a b to", "of it"});
    assert(embedder.vocabulary() != nullptr);
    assert(embedder.vocabulary()->empty());
    assert(embedder.ready());
    assert(embedder.generate_embedding("anything at all").is_zero());

    std::system("rm -rf /tmp/smriti_test");
    std::system("mkdir -p /tmp/smriti_test");
    write_file(std::string(TEST_DIR) + "/lessons.json", R"({
        "lessons": [{"id": 1, "situation": "a b", "learning": "to do"}]})");

    EngineConfig config;
    config.knowledge_dir = TEST_DIR;
    {
        Engine engine(config);
        assert(engine.open());
        assert(engine.index_all() == 1);
        assert(engine.is_vocabulary_ready());
        assert(engine.has_embedder());
        auto q = engine.prepare("do it");
        assert(q.embedding.has_value() && q.embedding->is_zero());
    }

    // Still built after a restart
    Engine reopened(config);
    assert(reopened.open());
    assert(reopened.is_vocabulary_ready());
    assert(reopened.vec_stats().count == 1);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Lexical index
// ═══════════════════════════════════════════════════════════════════════════

void test_knowledge_load_entries() {
    std::cout << "Testing knowledge file loading..." << std::endl;
    std::system("rm -rf /tmp/smriti_test");
    write_knowledge(TEST_DIR);

    auto entries = KnowledgeIndex::load_entries(TEST_DIR);
    assert(entries.size() == 5);
    assert(entries[0].id() == "pattern-1");
    assert(entries[0].text == "Retry with backoff Wrap flaky network calls fetch retries three times");
    assert(entries[2].id() == "lesson-7");
    assert(entries[3].id() == "decision-3");
    assert(entries[3].text.find("postgres flat files") != std::string::npos);
    assert(entries[4].id() == "deferred-4");
    assert(!entries[4].date.empty());

    // Corrupt file is skipped, the rest still load
    write_file(std::string(TEST_DIR) + "/lessons.json", "{ not json");
    assert(KnowledgeIndex::load_entries(TEST_DIR).size() == 4);

    assert(KnowledgeIndex::load_entries("/tmp/smriti_test_none").empty());

    std::cout << "  PASS" << std::endl;
}

void test_knowledge_search() {
    std::cout << "Testing knowledge search..." << std::endl;
    std::system("rm -rf /tmp/smriti_test");
    write_knowledge(TEST_DIR);

    EngineConfig config = memory_config();
    config.knowledge_dir = TEST_DIR;
    Engine engine(config);
    assert(engine.open());
    auto& lexical = engine.knowledge();
    assert(lexical.available());

    KnowledgeQuery q;
    q.query = "sqlite";
    auto hits = lexical.search(q);
    assert(hits.size() == 2);
    for (const auto& h : hits) {
        assert(h.id == "pattern-2" || h.id == "decision-3");
        assert(h.fts_score > 0.0);
    }

    // Metacharacters do not break the query
    q.query = "\"sqlite* -(mode):";
    assert(!lexical.search(q).empty());
    q.query = "  ";
    assert(lexical.search(q).empty());

    // Upsert replaces, remove deletes
    KnowledgeEntry entry{"lesson", 7, "Replaced lesson about caching", "2026-03-01T00:00:00.000Z"};
    assert(lexical.upsert(entry));
    assert(lexical.count() == 5);
    q.query = "caching";
    assert(lexical.search(q).size() == 1);
    assert(lexical.remove("lesson-7"));
    assert(lexical.count() == 4);

    std::cout << "  PASS" << std::endl;
}

void test_time_decay() {
    std::cout << "Testing time decay..." << std::endl;

    Timestamp t = now();
    assert(std::fabs(time_decay(format_iso8601(t), 30.0, t) - 1.0) < 1e-9);
    assert(std::fabs(time_decay(format_iso8601(t - 30 * MILLIS_PER_DAY), 30.0, t) - 0.5) < 0.01);
    assert(std::fabs(time_decay(format_iso8601(t - 365 * MILLIS_PER_DAY), 30.0, t) - 0.2) < 1e-9);
    assert(time_decay(format_iso8601(t + 10 * MILLIS_PER_DAY), 30.0, t) == 1.0);
    assert(time_decay("not a date", 30.0, t) == 1.0);

    assert(sanitize_fts_query("foo-bar (baz)") == "\"foo\" OR \"bar\" OR \"baz\"");
    assert(sanitize_fts_query("***").empty());

    Timestamp parsed = 0;
    assert(parse_iso8601("2026-01-02T03:04:05.678Z", parsed));
    assert(format_iso8601(parsed) == "2026-01-02T03:04:05.678Z");
    assert(parse_iso8601("2026-01-02", parsed));
    assert(format_iso8601(parsed) == "2026-01-02T00:00:00.000Z");

    std::cout << "  PASS" << std::endl;
}

void test_retrieval_tracking() {
    std::cout << "Testing retrieval tracking..." << std::endl;
    std::system("rm -rf /tmp/smriti_test");
    write_knowledge(TEST_DIR);

    EngineConfig config = memory_config();
    config.knowledge_dir = TEST_DIR;
    Engine engine(config);
    assert(engine.open());
    auto& lexical = engine.knowledge();

    lexical.record_retrievals({"pattern-1", "lesson-7"});
    lexical.record_retrievals({"pattern-1"});
    assert(lexical.promotion_candidates().empty());
    lexical.record_retrievals({"pattern-1"});

    auto candidates = lexical.promotion_candidates();
    assert(candidates.size() == 1);
    assert(candidates[0].entry_id == "pattern-1");
    assert(candidates[0].count == 3);

    // Never retrieved entries are stale, recently retrieved ones are not
    auto stale = lexical.stale_entries();
    std::set<std::string> stale_ids;
    for (const auto& r : stale) stale_ids.insert(r.entry_id);
    assert(stale_ids.count("pattern-2") == 1);
    assert(stale_ids.count("deferred-4") == 1);
    assert(stale_ids.count("pattern-1") == 0);
    assert(stale_ids.count("lesson-7") == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Graph
// ═══════════════════════════════════════════════════════════════════════════

void test_graph_node_upsert() {
    std::cout << "Testing graph node upsert..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    auto& graph = engine.graph();

    assert(graph.add_node({"n1", "concept", "First", {{"a", 1}, {"b", 2}}}));
    assert(graph.add_node({"n1", "concept", "Renamed", {{"c", 3}}}));
    assert(graph.node_count() == 1);

    auto node = graph.get_node("n1");
    assert(node.has_value());
    assert(node->label == "Renamed");
    assert(node->properties.size() == 1);    // replaced, not merged
    assert(node->properties["c"] == 3);

    assert(!graph.get_node("missing").has_value());
    assert(graph.nodes_by_type("concept").size() == 1);
    assert(graph.nodes_by_type("other").empty());

    // Corrupt properties read back as {}
    engine.database().exec("UPDATE knowledge_nodes SET properties = 'oops' WHERE id = 'n1'");
    node = graph.get_node("n1");
    assert(node.has_value());
    assert(node->properties.is_object() && node->properties.empty());

    std::cout << "  PASS" << std::endl;
}

void test_graph_edge_weight_overwrite() {
    std::cout << "Testing graph edge weight overwrite..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    auto& graph = engine.graph();
    build_sample_graph(graph);
    assert(graph.edge_count() == 3);

    assert(graph.add_edge({"A", "B", "produced", 0.25}));
    assert(graph.edge_count() == 3);
    assert(graph.add_edge({"A", "B", "produced", 0.75}));
    assert(graph.edge_count() == 3);

    bool found = false;
    for (const auto& n : graph.neighbors("A")) {
        if (n.node.id == "B") {
            assert(std::fabs(n.edge.weight - 0.75) < 1e-9);
            found = true;
        }
    }
    assert(found);

    // A different relationship is a different edge
    assert(graph.add_edge({"A", "B", "mentions", 1.0}));
    assert(graph.edge_count() == 4);

    std::cout << "  PASS" << std::endl;
}

void test_graph_neighbors() {
    std::cout << "Testing graph neighbors..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    auto& graph = engine.graph();
    build_sample_graph(graph);

    auto of_b = graph.neighbors("B");
    assert(of_b.size() == 2);
    assert(of_b[0].direction == Direction::Outgoing);
    assert(of_b[0].node.id == "C");
    assert(of_b[0].edge.relationship == "mentions");
    assert(of_b[1].direction == Direction::Incoming);
    assert(of_b[1].node.id == "A");
    assert(of_b[1].edge.source == "A" && of_b[1].edge.target == "B");

    // Edge to a node that does not exist is not reported
    graph.add_edge({"A", "ghost", "produced", 1.0});
    assert(graph.neighbors("A").size() == 2);
    assert(graph.neighbors("nobody").empty());

    std::cout << "  PASS" << std::endl;
}

void test_graph_traverse_bfs() {
    std::cout << "Testing graph BFS..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    auto& graph = engine.graph();
    build_sample_graph(graph);

    auto depth2 = graph.traverse_bfs("A", 2);
    assert(depth2.size() == 3);
    assert((hit_ids(depth2) == std::set<std::string>{"B", "C", "D"}));
    for (const auto& h : depth2) {
        if (h.node.id == "C") {
            assert(h.depth == 2);
            assert(h.via == "mentions");
        } else {
            assert(h.depth == 1);
            assert(h.via == "produced");
        }
    }

    auto depth1 = graph.traverse_bfs("A", 1);
    assert((hit_ids(depth1) == std::set<std::string>{"B", "D"}));

    auto capped = graph.traverse_bfs("A", 2, 1);
    assert(capped.size() == 1);
    assert(capped[0].depth == 1);

    // Outgoing only, start excluded even on a cycle
    graph.add_edge({"C", "A", "loops", 1.0});
    auto from_c = graph.traverse_bfs("C", 5);
    assert((hit_ids(from_c) == std::set<std::string>{"A", "B", "D"}));
    assert(graph.traverse_bfs("D", 3).empty());

    std::cout << "  PASS" << std::endl;
}

void test_graph_keywords_and_stats() {
    std::cout << "Testing graph keyword search and stats..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    auto& graph = engine.graph();
    graph.add_nodes({
        {"k1", "concept", "SQLite Store", json::object()},
        {"k2", "concept", "100% coverage", json::object()},
        {"k3", "practice", "snake_case naming", json::object()},
        {"k4", "practice", "snakeXcase typo", json::object()},
    });

    auto found = graph.find_nodes_by_keywords({"sqlite"});
    assert(found.size() == 1 && found[0].id == "k1");

    found = graph.find_nodes_by_keywords({"%"});
    assert(found.size() == 1 && found[0].id == "k2");

    found = graph.find_nodes_by_keywords({"snake_case"});
    assert(found.size() == 1 && found[0].id == "k3");

    found = graph.find_nodes_by_keywords({"store", "NAMING"});
    assert(found.size() == 2);
    assert(graph.find_nodes_by_keywords({"store", "naming"}, 1).size() == 1);
    assert(graph.find_nodes_by_keywords({}).empty());

    auto stats = engine.graph_stats();
    assert(stats.nodes == 4);
    assert(stats.edges == 0);
    assert(stats.node_types["concept"] == 2);
    assert(stats.node_types["practice"] == 2);

    // Keyword lookup from a prepared query
    auto q = engine.prepare("sqlite naming");
    assert(engine.keyword_nodes(q).size() == 2);

    assert(graph.clear());
    assert(engine.graph_stats().nodes == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Episodes
// ═══════════════════════════════════════════════════════════════════════════

void test_episode_record_recall() {
    std::cout << "Testing episode record/recall..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    auto& log = engine.episodes();

    auto ep = log.record("Phase 1", "Chose SQLite", "Fast");
    assert(ep.has_value());
    assert(ep->id > 0);
    assert(!ep->lesson.has_value());
    assert(ep->tags.empty());
    assert(ep->timestamp.size() == 24 && ep->timestamp.back() == 'Z');

    auto hits = log.recall("sqlite");
    assert(hits.size() == 1);
    assert(hits[0].id == ep->id);
    assert(hits[0].action == "Chose SQLite");
    assert(hits[0].timestamp == ep->timestamp);

    assert(log.recall("sqlite", 10, std::string("Phase 2")).empty());
    assert(log.recall("sqlite", 10, std::string("Phase 1")).size() == 1);

    assert(log.recall("! @ # $").empty());
    assert(log.recall("").empty());

    // Lesson and tags are searchable too
    log.record("Phase 1", "Added index", "Queries faster", std::string("measure before tuning"),
               {"perf", "db"});
    assert(log.recall("tuning").size() == 1);
    assert(log.recall("perf").size() == 1);

    // Engine path
    auto q = engine.prepare("sqlite index");
    assert(engine.recall_episodes(q).size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_episode_recency_order() {
    std::cout << "Testing episode recency order..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    auto& log = engine.episodes();

    Timestamp t = now();
    log.record_at(t - 3 * MILLIS_PER_DAY, "build", "deploy attempt one", "failed");
    log.record_at(t - 1 * MILLIS_PER_DAY, "build", "deploy attempt three", "worked");
    log.record_at(t - 2 * MILLIS_PER_DAY, "build", "deploy attempt two", "flaky");
    log.record_at(t, "review", "deploy review", "approved");

    auto recalled = log.recall("deploy", 10, std::string("build"));
    assert(recalled.size() == 3);
    assert(recalled[0].action == "deploy attempt three");
    assert(recalled[1].action == "deploy attempt two");
    assert(recalled[2].action == "deploy attempt one");

    assert(log.recall("deploy", 2).size() == 2);

    auto recent = log.recent("build");
    assert(recent.size() == 3);
    assert(recent[0].action == "deploy attempt three");
    assert(log.recent("build", 1).size() == 1);
    assert(log.recent("nothing").empty());

    std::cout << "  PASS" << std::endl;
}

void test_episode_pruning() {
    std::cout << "Testing episode pruning..." << std::endl;

    Engine engine(memory_config());
    assert(engine.open());
    auto& log = engine.episodes();

    Timestamp t = now();
    log.record_at(t - 100 * MILLIS_PER_DAY, "old", "ancient refactor", "done", std::nullopt, {"legacy"});
    log.record_at(t - 10 * MILLIS_PER_DAY, "new", "recent refactor", "done", std::nullopt, {"legacy"});
    assert(log.count() == 2);
    assert(log.by_tag("legacy").size() == 2);

    // Pruning happens at initialization
    assert(log.initialize());
    assert(log.count() == 1);
    auto hits = log.recall("refactor");
    assert(hits.size() == 1);
    assert(hits[0].action == "recent refactor");
    assert(log.recall("ancient").empty());
    assert(log.by_tag("legacy").size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_episode_tags() {
    std::cout << "Testing episode tags..." << std::endl;

    assert((parse_tags(R"(["a","b"])") == std::vector<std::string>{"a", "b"}));
    assert(parse_tags("not json").empty());
    assert(parse_tags(R"({"a":1})").empty());
    assert((parse_tags(R"([1,"x",true])") == std::vector<std::string>{"1", "x", "true"}));

    Engine engine(memory_config());
    assert(engine.open());
    auto& log = engine.episodes();

    auto a = log.record("p", "cache layer", "ok", std::nullopt, {"perf", "cache"});
    auto b = log.record("p", "query plan", "ok", std::nullopt, {"perf"});
    assert(a && b);
    assert(log.tag_count() == 2);

    assert(log.by_tag("perf").size() == 2);
    auto both = log.by_tags({"perf", "cache"});
    assert(both.size() == 1 && both[0].id == a->id);
    assert(log.by_tag("missing").empty());

    // Malformed stored tags degrade to an empty list
    engine.database().exec("UPDATE episodes SET tags = 'broken[' WHERE id = " + std::to_string(b->id));
    auto recent = log.recent("p");
    assert(recent.size() == 2);
    for (const auto& ep : recent) {
        if (ep.id == b->id) assert(ep.tags.empty());
        else assert(ep.tags.size() == 2);
    }

    std::cout << "  PASS" << std::endl;
}

void test_engine_reopen() {
    std::cout << "Testing engine close/reopen..." << std::endl;
    std::system("rm -rf /tmp/smriti_test");

    EngineConfig config;
    config.knowledge_dir = TEST_DIR;
    {
        Engine engine(config);
        assert(engine.open());
        engine.episodes().record("Phase 1", "Chose SQLite", "Fast");
        build_sample_graph(engine.graph());
        engine.close();
        assert(!engine.is_open());

        // close() is a reset: open again on the same object
        assert(engine.open());
        assert(engine.episodes().count() == 1);
    }

    Engine reopened(config);
    assert(reopened.open());
    assert(reopened.episodes().recall("sqlite").size() == 1);
    assert(reopened.graph_stats().edges == 3);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Smriti C++ Tests ===" << std::endl;
    std::cout << "EMBED_DIM = " << EMBED_DIM << std::endl;
    std::cout << std::endl;

    test_tokenize();
    test_vocabulary_build();
    test_embedding_normalized();
    test_embedding_requires_vocabulary();
    test_empty_corpus_keeps_vocabulary();
    test_hnsw_index();
    test_hnsw_exact_scan();
    test_hnsw_graph_matches_scan();
    test_transaction_rollback();

    std::cout << std::endl;
    std::cout << "=== Vector Store ===" << std::endl;
    test_vector_search_uninitialized();
    test_vector_upsert_twice();
    test_vector_search_limit_clamp();
    test_sprint_document_ranks_first();
    test_index_all_knowledge();
    test_index_all_empty_corpus();
    test_vocabulary_persists();
    test_vectors_disabled();
    test_vector_search_past_exact_threshold();
    test_index_all_rolls_back();
    test_index_all_counts_distinct_ids();
    test_empty_vocabulary_is_built();

    std::cout << std::endl;
    std::cout << "=== Lexical Index ===" << std::endl;
    test_knowledge_load_entries();
    test_knowledge_search();
    test_time_decay();
    test_retrieval_tracking();

    std::cout << std::endl;
    std::cout << "=== Graph ===" << std::endl;
    test_graph_node_upsert();
    test_graph_edge_weight_overwrite();
    test_graph_neighbors();
    test_graph_traverse_bfs();
    test_graph_keywords_and_stats();

    std::cout << std::endl;
    std::cout << "=== Episodes ===" << std::endl;
    test_episode_record_recall();
    test_episode_recency_order();
    test_episode_pruning();
    test_episode_tags();
    test_engine_reopen();

    std::system("rm -rf /tmp/smriti_test");

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
