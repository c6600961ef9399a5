#pragma once
// Knowledge graph records: patterns, relationships, observations, decay log

#include "../status.hpp"
#include "../types.hpp"
#include "metadata.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cortex {

using json = nlohmann::json;
using PatternId = int64_t;

enum class PatternKind { Workflow, Principle, AntiPattern, Solution, Context };

inline const char* pattern_kind_name(PatternKind kind) {
    switch (kind) {
        case PatternKind::Workflow:    return "workflow";
        case PatternKind::Principle:   return "principle";
        case PatternKind::AntiPattern: return "anti-pattern";
        case PatternKind::Solution:    return "solution";
        case PatternKind::Context:     return "context";
    }
    return "context";
}

inline bool parse_pattern_kind(const std::string& s, PatternKind& out) {
    std::string k = to_lower(s);
    if (k == "workflow") { out = PatternKind::Workflow; return true; }
    if (k == "principle") { out = PatternKind::Principle; return true; }
    if (k == "anti-pattern" || k == "anti_pattern" || k == "antipattern") {
        out = PatternKind::AntiPattern;
        return true;
    }
    if (k == "solution") { out = PatternKind::Solution; return true; }
    if (k == "context") { out = PatternKind::Context; return true; }
    return false;
}

enum class RelationshipKind { RelatedTo, Replaces, Extends, ConflictsWith };

inline const char* relationship_kind_name(RelationshipKind kind) {
    switch (kind) {
        case RelationshipKind::RelatedTo:     return "related_to";
        case RelationshipKind::Replaces:      return "replaces";
        case RelationshipKind::Extends:       return "extends";
        case RelationshipKind::ConflictsWith: return "conflicts_with";
    }
    return "related_to";
}

inline bool parse_relationship_kind(const std::string& s, RelationshipKind& out) {
    if (s == "related_to") { out = RelationshipKind::RelatedTo; return true; }
    if (s == "replaces") { out = RelationshipKind::Replaces; return true; }
    if (s == "extends") { out = RelationshipKind::Extends; return true; }
    if (s == "conflicts_with") { out = RelationshipKind::ConflictsWith; return true; }
    return false;
}

struct Pattern {
    PatternId id = 0;
    std::string title;
    std::string body;
    PatternKind kind = PatternKind::Context;
    float confidence = 1.0f;
    Timestamp created_at = 0;
    Timestamp last_accessed = 0;
    int64_t access_count = 0;
    std::string source;                 // Where the pattern came from
    std::vector<std::string> tags;      // Lowercase, unique
    Metadata metadata;
    bool pinned = false;
    bool immutable = false;
    DayNumber last_decay_day = -1;      // Last day a decay penalty was applied

    // Text indexed for ranked search
    std::string search_text() const {
        std::string out = title + "\n" + body;
        for (const auto& t : tags) out += "\n" + t;
        return out;
    }
};

// Fields update_pattern may change. Confidence is not among them: it moves
// only through decay and reinforce().
struct PatternUpdate {
    std::optional<std::string> title;
    std::optional<std::string> body;
    std::optional<PatternKind> kind;
    std::optional<std::string> source;
    std::optional<std::vector<std::string>> tags;
    std::optional<Metadata> metadata;
};

struct Relationship {
    PatternId from = 0;
    PatternId to = 0;
    RelationshipKind kind = RelationshipKind::RelatedTo;
    float strength = 1.0f;
    Timestamp created_at = 0;
};

struct RelatedPattern {
    Pattern pattern;
    int distance = 0;           // Hops from the start pattern
    float strength = 0.0f;      // Strength of the edge that reached it
    RelationshipKind via = RelationshipKind::RelatedTo;
};

struct PatternMatch {
    Pattern pattern;
    float score = 0.0f;
};

// Repeated sighting of the same idea; promoted to a pattern at threshold
struct Observation {
    std::string title;
    std::string body;
    PatternKind kind = PatternKind::Context;
    std::vector<std::string> tags;
    std::string source;
};

struct ObserveResult {
    int64_t observations = 0;
    std::optional<PatternId> pattern_id;    // Set once promoted
    bool promoted = false;                  // This call created the pattern
};

struct DecayOptions {
    size_t batch_size = 256;
    int64_t time_slice_ms = 0;      // 0 = run to completion
};

struct DecayReport {
    size_t evaluated = 0;
    size_t decayed_count = 0;
    size_t deleted_count = 0;
    size_t skipped = 0;             // Pinned, immutable or already evaluated
    bool complete = true;           // False when stopped by the time slice
};

struct DecayLogEntry {
    int64_t id = 0;
    PatternId pattern_id = 0;
    std::string title;
    float old_confidence = 0.0f;
    float new_confidence = 0.0f;
    std::string action;             // decayed | deleted
    std::string reason;
    Timestamp timestamp = 0;
};

// Bulk deletion. Given criteria are combined; at least one is required.
struct ForgetCriteria {
    std::optional<float> max_confidence;    // confidence <= value
    std::optional<int64_t> inactive_days;   // unused for at least this many days
    float max_fraction = 0.5f;              // Refuse to remove a larger share of all patterns
};

struct ForgetReport {
    std::vector<PatternId> deleted;         // Would be deleted, on a dry run
    std::vector<PatternId> protected_ids;   // Matched but pinned or immutable
    size_t total_patterns = 0;
    bool dry_run = false;
};

struct ImportReport {
    size_t imported = 0;
    size_t skipped = 0;             // Title already present
    size_t relationships = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON mapping
// ═══════════════════════════════════════════════════════════════════════════

inline json pattern_to_json(const Pattern& p) {
    return json{
        {"id", p.id},
        {"title", p.title},
        {"title_key", normalize_key(p.title)},
        {"body", p.body},
        {"kind", pattern_kind_name(p.kind)},
        {"confidence", p.confidence},
        {"created_at", p.created_at},
        {"last_accessed", p.last_accessed},
        {"access_count", p.access_count},
        {"source", p.source},
        {"tags", p.tags},
        {"metadata", metadata_to_json(p.metadata)},
        {"pinned", p.pinned},
        {"immutable", p.immutable},
        {"last_decay_day", p.last_decay_day},
    };
}

inline Result<Pattern> pattern_from_json(const json& j) {
    try {
        Pattern p;
        p.id = j.value("id", int64_t{0});
        p.title = j.at("title").get<std::string>();
        p.body = j.value("body", "");
        if (!parse_pattern_kind(j.value("kind", "context"), p.kind)) {
            return Status::validation("unknown pattern kind '" + j.value("kind", "") + "'");
        }
        p.confidence = j.value("confidence", 1.0f);
        p.created_at = j.value("created_at", int64_t{0});
        p.last_accessed = j.value("last_accessed", p.created_at);
        p.access_count = j.value("access_count", int64_t{0});
        p.source = j.value("source", "");
        p.tags = j.value("tags", std::vector<std::string>{});
        auto md = metadata_from_json(j.value("metadata", json::object()));
        if (!md.ok()) return md.status;
        p.metadata = std::move(*md);
        p.pinned = j.value("pinned", false);
        p.immutable = j.value("immutable", false);
        p.last_decay_day = j.value("last_decay_day", DayNumber{-1});
        return p;
    } catch (const json::exception& e) {
        return Status::validation(std::string("pattern record: ") + e.what());
    }
}

inline json relationship_to_json(const Relationship& r) {
    return json{
        {"from", r.from},
        {"to", r.to},
        {"kind", relationship_kind_name(r.kind)},
        {"strength", r.strength},
        {"created_at", r.created_at},
    };
}

inline Result<Relationship> relationship_from_json(const json& j) {
    try {
        Relationship r;
        r.from = j.at("from").get<int64_t>();
        r.to = j.at("to").get<int64_t>();
        if (!parse_relationship_kind(j.at("kind").get<std::string>(), r.kind)) {
            return Status::validation("unknown relationship kind");
        }
        r.strength = j.value("strength", 1.0f);
        r.created_at = j.value("created_at", int64_t{0});
        return r;
    } catch (const json::exception& e) {
        return Status::validation(std::string("relationship record: ") + e.what());
    }
}

inline json decay_entry_to_json(const DecayLogEntry& e) {
    return json{
        {"id", e.id},
        {"pattern_id", e.pattern_id},
        {"title", e.title},
        {"old_confidence", e.old_confidence},
        {"new_confidence", e.new_confidence},
        {"action", e.action},
        {"reason", e.reason},
        {"timestamp", e.timestamp},
    };
}

inline DecayLogEntry decay_entry_from_json(const json& j) {
    DecayLogEntry e;
    e.id = j.value("id", int64_t{0});
    e.pattern_id = j.value("pattern_id", int64_t{0});
    e.title = j.value("title", "");
    e.old_confidence = j.value("old_confidence", 0.0f);
    e.new_confidence = j.value("new_confidence", 0.0f);
    e.action = j.value("action", "");
    e.reason = j.value("reason", "");
    e.timestamp = j.value("timestamp", int64_t{0});
    return e;
}

} // namespace cortex
