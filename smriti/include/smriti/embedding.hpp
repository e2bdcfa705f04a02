#pragma once
// Embedding: text → fixed-width vector
//
// Tokenizer: lowercase, non [a-z0-9] runs become spaces, split, length floor.
// Vocabulary: top EMBED_DIM terms by document frequency with idf weights.
// TfIdfEmbedder: term count × idf per dimension, L2-normalised.
//
// The vocabulary is immutable once built. Rebuilding produces a new one
// which is swapped in whole, so readers always see a consistent snapshot.

#include "types.hpp"
#include <cctype>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace smriti {

// Token length floors
constexpr size_t EMBED_MIN_TOKEN = 3;
constexpr size_t RECALL_MIN_TOKEN = 2;

inline std::vector<std::string> tokenize(const std::string& text, size_t min_length) {
    std::string cleaned;
    cleaned.reserve(text.size());
    for (unsigned char c : text) {
        char lc = static_cast<char>(std::tolower(c));
        if ((lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9')) {
            cleaned.push_back(lc);
        } else {
            cleaned.push_back(' ');
        }
    }

    std::vector<std::string> tokens;
    std::istringstream iss(cleaned);
    std::string tok;
    while (iss >> tok) {
        if (tok.size() >= min_length) tokens.push_back(std::move(tok));
    }
    return tokens;
}

struct Vocabulary {
    std::vector<std::string> terms;                 // terms[i] is dimension i
    std::unordered_map<std::string, size_t> index;  // term → dimension
    std::vector<float> idf;                         // parallel to terms

    size_t size() const { return terms.size(); }
    bool empty() const { return terms.empty(); }

    // Top EMBED_DIM terms by document frequency; ties go to the
    // lexicographically smaller term. Empty corpus → empty vocabulary.
    static Vocabulary build(const std::vector<std::string>& documents) {
        std::unordered_map<std::string, size_t> df;
        for (const auto& doc : documents) {
            auto tokens = tokenize(doc, EMBED_MIN_TOKEN);
            std::sort(tokens.begin(), tokens.end());
            tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
            for (auto& t : tokens) df[t]++;
        }

        std::vector<std::pair<std::string, size_t>> ranked(df.begin(), df.end());
        std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return a.first < b.first;
        });
        if (ranked.size() > EMBED_DIM) ranked.resize(EMBED_DIM);

        double total = static_cast<double>(std::max<size_t>(1, documents.size()));
        Vocabulary vocab;
        vocab.terms.reserve(ranked.size());
        vocab.idf.reserve(ranked.size());
        for (const auto& [term, count] : ranked) {
            vocab.index[term] = vocab.terms.size();
            vocab.terms.push_back(term);
            vocab.idf.push_back(static_cast<float>(std::log(total / static_cast<double>(count))));
        }
        return vocab;
    }

    // Restore from persisted (term, idf) rows in dimension order
    static Vocabulary from_rows(std::vector<std::pair<std::string, float>> rows) {
        Vocabulary vocab;
        for (auto& [term, weight] : rows) {
            if (vocab.terms.size() >= EMBED_DIM) break;
            vocab.index[term] = vocab.terms.size();
            vocab.terms.push_back(std::move(term));
            vocab.idf.push_back(weight);
        }
        return vocab;
    }

    Embedding embed(const std::string& text) const {
        std::unordered_map<size_t, float> tf;
        for (const auto& tok : tokenize(text, EMBED_MIN_TOKEN)) {
            auto it = index.find(tok);
            if (it != index.end()) tf[it->second] += 1.0f;
        }

        Embedding e;
        for (const auto& [dim, count] : tf) {
            e[dim] = count * idf[dim];
        }
        e.normalize();
        return e;
    }
};

// Capability interface for query embedding
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual bool ready() const = 0;
    // Throws std::runtime_error when not ready
    virtual Embedding embed(const std::string& text) const = 0;
    virtual const char* name() const = 0;
};

// Installed when vector search is disabled
class NullEmbedder : public Embedder {
public:
    bool ready() const override { return false; }

    Embedding embed(const std::string&) const override {
        throw std::runtime_error("embedding disabled");
    }

    const char* name() const override { return "null"; }
};

class TfIdfEmbedder : public Embedder {
public:
    TfIdfEmbedder() = default;

    // No-op with a warning on an empty corpus
    void build_vocabulary(const std::vector<std::string>& documents) {
        if (documents.empty()) {
            std::cerr << "[Embedding] Warning: empty corpus, keeping current vocabulary\n";
            return;
        }
        install(std::make_shared<const Vocabulary>(Vocabulary::build(documents)));
    }

    void install(std::shared_ptr<const Vocabulary> vocab) {
        std::unique_lock lock(mutex_);
        vocab_ = std::move(vocab);
    }

    std::shared_ptr<const Vocabulary> vocabulary() const {
        std::shared_lock lock(mutex_);
        return vocab_;
    }

    bool ready() const override {
        std::shared_lock lock(mutex_);
        return vocab_ != nullptr;
    }

    Embedding generate_embedding(const std::string& text) const {
        auto vocab = vocabulary();
        if (!vocab) {
            throw std::runtime_error("vocabulary not built");
        }
        return vocab->embed(text);
    }

    Embedding embed(const std::string& text) const override {
        return generate_embedding(text);
    }

    const char* name() const override { return "tfidf"; }

private:
    mutable std::shared_mutex mutex_;
    std::shared_ptr<const Vocabulary> vocab_;
};

} // namespace smriti
