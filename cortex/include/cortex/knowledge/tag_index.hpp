#pragma once
// Tag Index: inverted tag -> pattern lookup over roaring bitmaps
//
// One bitmap of pattern ids per tag, plus the forward pattern -> tags list
// needed to retag or drop a pattern. Empty bitmaps are dropped so every
// indexed tag is in use.
//
// Rebuilt from the patterns table when the knowledge graph opens, so it
// carries no persistence of its own. Callers synchronize access.

#include <roaring/roaring.h>
#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cortex {

class TagIndex {
public:
    TagIndex() = default;

    void add(uint32_t id, const std::string& tag) {
        auto& bitmap = bitmaps_[tag];
        if (!bitmap) bitmap.reset(roaring_bitmap_create());
        if (!roaring_bitmap_add_checked(bitmap.get(), id)) return;
        tags_of_[id].push_back(tag);
    }

    void add(uint32_t id, const std::vector<std::string>& tags) {
        for (const auto& tag : tags) add(id, tag);
    }

    void remove_all(uint32_t id) {
        auto entry = tags_of_.find(id);
        if (entry == tags_of_.end()) return;
        for (const auto& tag : entry->second) {
            auto bitmap = bitmaps_.find(tag);
            if (bitmap == bitmaps_.end()) continue;
            roaring_bitmap_remove(bitmap->second.get(), id);
            if (roaring_bitmap_is_empty(bitmap->second.get())) bitmaps_.erase(bitmap);
        }
        tags_of_.erase(entry);
    }

    // Replace the tag set of a pattern
    void set(uint32_t id, const std::vector<std::string>& tags) {
        remove_all(id);
        add(id, tags);
    }

    void clear() {
        bitmaps_.clear();
        tags_of_.clear();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Queries (ids come back ascending)
    // ═══════════════════════════════════════════════════════════════════════

    std::vector<uint32_t> with_tag(const std::string& tag) const {
        const roaring_bitmap_t* bitmap = find(tag);
        return bitmap ? ids_of(bitmap) : std::vector<uint32_t>{};
    }

    // match_all: intersection, otherwise union
    std::vector<uint32_t> with_tags(const std::vector<std::string>& tags, bool match_all) const {
        Bitmap combined;
        for (const auto& tag : tags) {
            const roaring_bitmap_t* bitmap = find(tag);
            if (!bitmap) {
                if (match_all) return {};
                continue;
            }
            if (!combined) {
                combined.reset(roaring_bitmap_copy(bitmap));
            } else if (match_all) {
                roaring_bitmap_and_inplace(combined.get(), bitmap);
            } else {
                roaring_bitmap_or_inplace(combined.get(), bitmap);
            }
        }
        return combined ? ids_of(combined.get()) : std::vector<uint32_t>{};
    }

    bool has(uint32_t id, const std::string& tag) const {
        const roaring_bitmap_t* bitmap = find(tag);
        return bitmap && roaring_bitmap_contains(bitmap, id);
    }

    // True if any tag of the pattern starts with prefix
    bool has_prefix(uint32_t id, const std::string& prefix) const {
        auto entry = tags_of_.find(id);
        if (entry == tags_of_.end()) return false;
        return std::any_of(entry->second.begin(), entry->second.end(), [&](const std::string& tag) {
            return tag.compare(0, prefix.size(), prefix) == 0;
        });
    }

    // (tag, pattern count), most used first, ties by name
    std::vector<std::pair<std::string, size_t>> counts() const {
        std::vector<std::pair<std::string, size_t>> out;
        out.reserve(bitmaps_.size());
        for (const auto& [tag, bitmap] : bitmaps_) {
            out.emplace_back(tag, static_cast<size_t>(roaring_bitmap_get_cardinality(bitmap.get())));
        }
        // bitmaps_ is ordered by name, so a stable sort keeps name order on ties
        std::stable_sort(out.begin(), out.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        return out;
    }

    size_t tag_count() const { return bitmaps_.size(); }

    size_t total_taggings() const {
        size_t total = 0;
        for (const auto& entry : tags_of_) total += entry.second.size();
        return total;
    }

private:
    struct BitmapFree {
        void operator()(roaring_bitmap_t* bitmap) const { roaring_bitmap_free(bitmap); }
    };
    using Bitmap = std::unique_ptr<roaring_bitmap_t, BitmapFree>;

    const roaring_bitmap_t* find(const std::string& tag) const {
        auto it = bitmaps_.find(tag);
        return it == bitmaps_.end() ? nullptr : it->second.get();
    }

    static std::vector<uint32_t> ids_of(const roaring_bitmap_t* bitmap) {
        std::vector<uint32_t> ids(roaring_bitmap_get_cardinality(bitmap));
        if (!ids.empty()) roaring_bitmap_to_uint32_array(bitmap, ids.data());
        return ids;
    }

    std::map<std::string, Bitmap> bitmaps_;
    std::unordered_map<uint32_t, std::vector<std::string>> tags_of_;
};

} // namespace cortex
