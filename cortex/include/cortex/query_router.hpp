#pragma once
// Query Router: classify a context request into one retrieval path
//
//   "#refactor #cpp"             -> TagFilter    patterns carrying the tags
//   "why does src/store.cpp..."  -> FileContext  conversations touching the file
//   anything else                -> Keyword      ranked text search
//
// The set of intents is closed; Memory dispatches on the decision.

#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <string>
#include <vector>

namespace cortex {

enum class QueryIntent {
    Keyword,        // Ranked search over conversations and patterns
    TagFilter,      // Only tags were given
    FileContext,    // Request names one or more files
};

struct RoutingDecision {
    QueryIntent intent = QueryIntent::Keyword;
    float confidence = 0.0f;            // 0-1, how confident in classification

    std::vector<std::string> tags;      // Without '#' or brackets, lowercase
    std::vector<std::string> files;
    std::string text;                   // Request with tags removed
};

struct RouterPatterns {
    // "#tag", "[tag]"
    std::regex tag{"(?:^|\\s)(?:#([A-Za-z0-9_:-]+)|\\[([A-Za-z0-9_:-]+)\\])"};
    // dir/file.ext or file.ext with a short alphabetic extension
    std::regex file{"(?:^|[\\s(\"'`])((?:[\\w.-]+/)*[\\w-]+\\.[A-Za-z][A-Za-z0-9]{0,7})(?=$|[\\s),:;!?\"'`]|\\.(?:\\s|$))"};
};

class QueryRouter {
public:
    QueryRouter() = default;

    RoutingDecision route(const std::string& request) const {
        RoutingDecision decision;
        decision.text = trim(request);
        if (decision.text.empty()) return decision;

        // 1. Tags (highest specificity)
        decision.tags = extract_tags(request);
        if (!decision.tags.empty()) {
            decision.text = remove_tags(request);
            if (decision.text.empty()) {
                decision.intent = QueryIntent::TagFilter;
                decision.confidence = 0.95f;
                return decision;
            }
        }

        // 2. File paths
        decision.files = extract_files(decision.text);
        if (!decision.files.empty()) {
            decision.intent = QueryIntent::FileContext;
            decision.confidence = 0.85f;
            return decision;
        }

        // 3. Default to ranked keyword search
        decision.intent = QueryIntent::Keyword;
        decision.confidence = decision.tags.empty() ? 0.60f : 0.75f;
        return decision;
    }

    static const char* intent_name(QueryIntent intent) {
        switch (intent) {
            case QueryIntent::Keyword:     return "keyword";
            case QueryIntent::TagFilter:   return "tag";
            case QueryIntent::FileContext: return "file";
        }
        return "keyword";
    }

private:
    std::vector<std::string> extract_tags(const std::string& request) const {
        std::vector<std::string> tags;
        for (std::sregex_iterator it(request.begin(), request.end(), patterns_.tag), end; it != end; ++it) {
            const std::smatch& m = *it;
            std::string tag = to_lower(m[1].matched ? m[1].str() : m[2].str());
            if (std::find(tags.begin(), tags.end(), tag) == tags.end()) tags.push_back(tag);
        }
        return tags;
    }

    std::string remove_tags(const std::string& request) const {
        return trim(std::regex_replace(request, patterns_.tag, " "));
    }

    std::vector<std::string> extract_files(const std::string& text) const {
        std::vector<std::string> files;
        for (std::sregex_iterator it(text.begin(), text.end(), patterns_.file), end; it != end; ++it) {
            std::string path = (*it)[1].str();
            if (std::find(files.begin(), files.end(), path) == files.end()) files.push_back(path);
        }
        return files;
    }

    RouterPatterns patterns_;
};

} // namespace cortex
