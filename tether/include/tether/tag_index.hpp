#pragma once
// Tag Index: inverted tag -> slot postings for list filtering
//
//   - String interning: each unique tag stored once, referenced by tag_id
//   - Inverted index: tag_id -> RoaringBitmap of slots
//   - Forward index: slot -> [tag_ids] so a slot can be cleared on update
//
// Slots are dense uint32 handles handed out by the Index; the tag index
// never sees entity ids.

#include <roaring/roaring.h>
#include <algorithm>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

class TagIndex {
public:
    TagIndex() = default;
    ~TagIndex() { clear(); }

    TagIndex(const TagIndex&) = delete;
    TagIndex& operator=(const TagIndex&) = delete;

    // Replace the tag set of a slot
    void assign(uint32_t slot, const std::vector<std::string>& tags) {
        std::unique_lock lock(mutex_);
        remove_locked(slot);
        if (slot >= forward_.size()) forward_.resize(slot + 1);
        for (const auto& tag : tags) {
            uint32_t tag_id = intern_locked(tag);
            roaring_bitmap_add(postings_[tag_id], slot);
            forward_[slot].push_back(tag_id);
        }
    }

    void remove(uint32_t slot) {
        std::unique_lock lock(mutex_);
        remove_locked(slot);
    }

    std::vector<uint32_t> slots_with_tag(const std::string& tag) const {
        std::shared_lock lock(mutex_);
        auto it = string_to_id_.find(tag);
        if (it == string_to_id_.end()) return {};
        return bitmap_to_vector(postings_[it->second]);
    }

    // Slots carrying every tag (AND)
    std::vector<uint32_t> slots_with_all(const std::vector<std::string>& tags) const {
        if (tags.empty()) return {};
        std::shared_lock lock(mutex_);

        std::vector<const roaring_bitmap_t*> bitmaps;
        for (const auto& tag : tags) {
            auto it = string_to_id_.find(tag);
            if (it == string_to_id_.end()) return {};
            bitmaps.push_back(postings_[it->second]);
        }
        // Intersect smallest first
        std::sort(bitmaps.begin(), bitmaps.end(), [](const roaring_bitmap_t* a, const roaring_bitmap_t* b) {
            return roaring_bitmap_get_cardinality(a) < roaring_bitmap_get_cardinality(b);
        });

        roaring_bitmap_t* acc = roaring_bitmap_copy(bitmaps[0]);
        for (size_t i = 1; i < bitmaps.size(); ++i) {
            roaring_bitmap_and_inplace(acc, bitmaps[i]);
        }
        auto out = bitmap_to_vector(acc);
        roaring_bitmap_free(acc);
        return out;
    }

    bool slot_has_tag(uint32_t slot, const std::string& tag) const {
        std::shared_lock lock(mutex_);
        auto it = string_to_id_.find(tag);
        if (it == string_to_id_.end()) return false;
        return roaring_bitmap_contains(postings_[it->second], slot);
    }

    // Distinct tags with their usage counts
    std::vector<std::pair<std::string, uint64_t>> tag_counts() const {
        std::shared_lock lock(mutex_);
        std::vector<std::pair<std::string, uint64_t>> out;
        for (size_t i = 0; i < id_to_string_.size(); ++i) {
            uint64_t n = roaring_bitmap_get_cardinality(postings_[i]);
            if (n) out.emplace_back(id_to_string_[i], n);
        }
        return out;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        for (auto* bm : postings_) roaring_bitmap_free(bm);
        postings_.clear();
        string_to_id_.clear();
        id_to_string_.clear();
        forward_.clear();
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

    void remove_locked(uint32_t slot) {
        if (slot >= forward_.size()) return;
        for (uint32_t tag_id : forward_[slot]) {
            roaring_bitmap_remove(postings_[tag_id], slot);
        }
        forward_[slot].clear();
    }

    static std::vector<uint32_t> bitmap_to_vector(const roaring_bitmap_t* bm) {
        std::vector<uint32_t> out(roaring_bitmap_get_cardinality(bm));
        if (!out.empty()) roaring_bitmap_to_uint32_array(bm, out.data());
        return out;
    }

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, uint32_t> string_to_id_;
    std::vector<std::string> id_to_string_;
    std::vector<roaring_bitmap_t*> postings_;
    std::vector<std::vector<uint32_t>> forward_;
};

} // namespace tether
