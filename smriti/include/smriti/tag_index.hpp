#pragma once
// EpisodeTagIndex: tag → episode ids, in memory
//
//   - String interning: each unique tag stored once, referenced by tag_id
//   - Inverted index: tag_id → RoaringBitmap of episode ids
//
// Not persisted. The episodes table is the source of truth and the index is
// rebuilt from it when the log initializes.

#include <roaring/roaring.h>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace smriti {

class EpisodeTagIndex {
public:
    EpisodeTagIndex() = default;
    ~EpisodeTagIndex() { clear(); }

    EpisodeTagIndex(const EpisodeTagIndex&) = delete;
    EpisodeTagIndex& operator=(const EpisodeTagIndex&) = delete;

    void add(uint32_t episode, const std::vector<std::string>& tags) {
        std::unique_lock lock(mutex_);
        for (const auto& tag : tags) {
            roaring_bitmap_add(postings_[intern_locked(tag)], episode);
        }
    }

    // Episodes carrying every tag (AND), ascending
    std::vector<uint32_t> with_all_tags(const std::vector<std::string>& tags) const {
        if (tags.empty()) return {};
        std::shared_lock lock(mutex_);

        roaring_bitmap_t* acc = nullptr;
        for (const auto& tag : tags) {
            auto it = string_to_id_.find(tag);
            if (it == string_to_id_.end()) {
                if (acc) roaring_bitmap_free(acc);
                return {};
            }
            const roaring_bitmap_t* posting = postings_[it->second];
            if (!acc) {
                acc = roaring_bitmap_copy(posting);
            } else {
                roaring_bitmap_and_inplace(acc, posting);
            }
        }
        auto result = bitmap_to_vector(acc);
        roaring_bitmap_free(acc);
        return result;
    }

    size_t tag_count() const {
        std::shared_lock lock(mutex_);
        return id_to_string_.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        for (auto* bitmap : postings_) roaring_bitmap_free(bitmap);
        postings_.clear();
        string_to_id_.clear();
        id_to_string_.clear();
    }

private:
    uint32_t intern_locked(const std::string& tag) {
        auto it = string_to_id_.find(tag);
        if (it != string_to_id_.end()) return it->second;

        uint32_t id = static_cast<uint32_t>(id_to_string_.size());
        string_to_id_[tag] = id;
        id_to_string_.push_back(tag);
        postings_.push_back(roaring_bitmap_create());
        return id;
    }

    static std::vector<uint32_t> bitmap_to_vector(const roaring_bitmap_t* bitmap) {
        uint64_t card = roaring_bitmap_get_cardinality(bitmap);
        std::vector<uint32_t> result(card);
        if (card > 0) roaring_bitmap_to_uint32_array(bitmap, result.data());
        return result;
    }

    std::unordered_map<std::string, uint32_t> string_to_id_;
    std::vector<std::string> id_to_string_;
    std::vector<roaring_bitmap_t*> postings_;
    mutable std::shared_mutex mutex_;
};

} // namespace smriti
