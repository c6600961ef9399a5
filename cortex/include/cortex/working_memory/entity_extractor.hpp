#pragma once
// Entity extraction from conversation text
//
// Extractors are pluggable. They may throw; WorkingMemory catches at the
// call site so a failed extraction never blocks the turn from being stored.

#include "types.hpp"
#include <algorithm>
#include <regex>
#include <string>
#include <vector>

namespace cortex {

class EntityExtractor {
public:
    virtual ~EntityExtractor() = default;
    virtual std::vector<EntityMention> extract(const std::string& text) const = 0;
};

// Default rules:
//   `src/store.cpp`, src/store.cpp   -> file (needs an extension)
//   `RecordStore`, open_store()      -> symbol
//   #refactor                        -> concept
class RegexEntityExtractor : public EntityExtractor {
public:
    std::vector<EntityMention> extract(const std::string& text) const override {
        std::vector<EntityMention> found;
        auto add = [&found](EntityKind kind, std::string name) {
            if (name.empty()) return;
            EntityMention m{kind, std::move(name)};
            if (std::find(found.begin(), found.end(), m) == found.end()) {
                found.push_back(std::move(m));
            }
        };

        for_each_match(text, patterns_.call, [&](const std::smatch& m) {
            add(EntityKind::Symbol, m[1].str());
        });

        for_each_match(text, patterns_.backticked, [&](const std::smatch& m) {
            std::string inner = m[1].str();
            if (std::regex_match(inner, patterns_.file_name)) {
                add(EntityKind::File, inner);
            } else if (std::regex_match(inner, patterns_.pascal_case)) {
                add(EntityKind::Symbol, inner);
            }
        });

        for_each_match(text, patterns_.bare_path, [&](const std::smatch& m) {
            add(EntityKind::File, m[1].str());
        });

        for_each_match(text, patterns_.hashtag, [&](const std::smatch& m) {
            add(EntityKind::Concept, to_lower(m[1].str()));
        });

        return found;
    }

private:
    struct Patterns {
        std::regex backticked{"`([^`\\s]+)`"};
        std::regex file_name{"(?:[\\w.-]+/)*[\\w-][\\w.-]*\\.[A-Za-z0-9]{1,8}"};
        std::regex pascal_case{"[A-Z][a-z0-9]+(?:[A-Z][a-z0-9]*)+"};
        std::regex call{"([A-Za-z_][A-Za-z0-9_]*(?:::[A-Za-z_][A-Za-z0-9_]*)*)\\(\\)"};
        std::regex bare_path{"(?:^|[\\s(\"'])((?:[\\w.-]+/)+[\\w-][\\w.-]*\\.[A-Za-z0-9]{1,8})(?=$|[\\s),:;.!?\"'])"};
        std::regex hashtag{"(?:^|\\s)#([A-Za-z][\\w-]*)"};
    };

    template<typename Fn>
    static void for_each_match(const std::string& text, const std::regex& re, Fn&& fn) {
        for (std::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it) {
            fn(*it);
        }
    }

    Patterns patterns_;
};

} // namespace cortex
