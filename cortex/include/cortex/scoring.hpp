#pragma once
// Scoring: BM25 ranking shared by every text search
//
// Term -> document posting maps; document frequency is the map size.
// Documents keep their token sequence so phrase queries never go back to
// the store.

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace cortex {

using DocId = int64_t;

struct BM25Config {
    float k1 = 1.5f;
    float b = 0.75f;
};

class BM25Index {
public:
    explicit BM25Index(BM25Config config = {}) : config_(config) {}

    // Indexing an id twice replaces the earlier text
    void add(DocId id, const std::string& text) {
        remove(id);

        Document doc;
        doc.tokens = tokenize(text);
        for (const auto& token : doc.tokens) ++doc.counts[token];
        for (const auto& [term, count] : doc.counts) postings_[term][id] = count;

        token_total_ += doc.tokens.size();
        docs_.emplace(id, std::move(doc));
    }

    void remove(DocId id) {
        auto doc = docs_.find(id);
        if (doc == docs_.end()) return;

        for (const auto& entry : doc->second.counts) {
            auto list = postings_.find(entry.first);
            if (list == postings_.end()) continue;
            list->second.erase(id);
            if (list->second.empty()) postings_.erase(list);
        }
        token_total_ -= doc->second.tokens.size();
        docs_.erase(doc);
    }

    void clear() {
        docs_.clear();
        postings_.clear();
        token_total_ = 0;
    }

    // Per-document BM25 weight of a single vocabulary term
    std::unordered_map<DocId, float> term_scores(const std::string& term) const {
        std::unordered_map<DocId, float> scores;
        auto list = postings_.find(term);
        if (list == postings_.end()) return scores;

        const float n = static_cast<float>(docs_.size());
        const float df = static_cast<float>(list->second.size());
        // Smoothed so a term present in every document still scores above zero
        const float idf = std::log(1.0f + (n - df + 0.5f) / (df + 0.5f));
        float avg_len = static_cast<float>(token_total_) / n;
        if (avg_len <= 0.0f) avg_len = 1.0f;

        for (const auto& [id, count] : list->second) {
            const float len = static_cast<float>(docs_.at(id).tokens.size());
            const float tf = static_cast<float>(count);
            const float norm = config_.k1 * (1.0f - config_.b + config_.b * len / avg_len);
            scores.emplace(id, idf * tf * (config_.k1 + 1.0f) / (tf + norm));
        }
        return scores;
    }

    // Vocabulary terms starting with prefix, in lexical order
    std::vector<std::string> expand_prefix(const std::string& prefix) const {
        std::vector<std::string> terms;
        for (auto it = postings_.lower_bound(prefix); it != postings_.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) break;
            terms.push_back(it->first);
        }
        return terms;
    }

    bool contains_phrase(DocId id, const std::vector<std::string>& phrase) const {
        auto doc = docs_.find(id);
        if (phrase.empty() || doc == docs_.end()) return false;
        const auto& tokens = doc->second.tokens;
        return std::search(tokens.begin(), tokens.end(), phrase.begin(), phrase.end()) != tokens.end();
    }

    // Bag-of-words search. Equal scores fall back to ascending id.
    std::vector<std::pair<DocId, float>> search(const std::string& query, size_t limit) const {
        std::map<DocId, float> totals;
        for (const auto& term : tokenize(query)) {
            for (const auto& [id, score] : term_scores(term)) totals[id] += score;
        }

        std::vector<std::pair<DocId, float>> ranked(totals.begin(), totals.end());
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        if (ranked.size() > limit) ranked.resize(limit);
        return ranked;
    }

    bool contains(DocId id) const { return docs_.count(id) > 0; }
    size_t size() const { return docs_.size(); }
    size_t vocab_size() const { return postings_.size(); }

    std::vector<DocId> documents() const {
        std::vector<DocId> ids;
        ids.reserve(docs_.size());
        for (const auto& entry : docs_) ids.push_back(entry.first);
        std::sort(ids.begin(), ids.end());
        return ids;
    }

private:
    struct Document {
        std::vector<std::string> tokens;   // Kept in order for phrase checks
        std::unordered_map<std::string, uint32_t> counts;
    };

    BM25Config config_;
    std::unordered_map<DocId, Document> docs_;
    // term -> (doc -> occurrences). Ordered for prefix expansion.
    std::map<std::string, std::unordered_map<DocId, uint32_t>> postings_;
    size_t token_total_ = 0;
};

} // namespace cortex
