#pragma once
// Smriti: durable memory for coding agents
//
// A hybrid retrieval engine with:
// - Types: Embeddings, timestamps
// - Embedding: Tokenizer, TF-IDF vocabulary, embedder capability
// - KnowledgeIndex: FTS5 lexical search with time decay
// - VectorStore: HNSW kNN over persisted embeddings
// - GraphStore: Typed nodes, weighted edges, BFS
// - EpisodicLog: Sprint history with lexical recall
// - Engine: Owning context for all of the above

#include "version.hpp"
#include "types.hpp"
#include "config.hpp"
#include "database.hpp"
#include "embedding.hpp"
#include "hnsw.hpp"
#include "knowledge_index.hpp"
#include "vector_store.hpp"
#include "graph_store.hpp"
#include "tag_index.hpp"
#include "episodic.hpp"
#include "engine.hpp"
