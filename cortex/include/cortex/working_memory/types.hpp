#pragma once
// Working memory records: conversations, turns, entities

#include "../status.hpp"
#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace cortex {

using json = nlohmann::json;
using ConversationId = int64_t;
using EntityId = int64_t;

enum class EntityKind { File, Symbol, Concept };

inline const char* entity_kind_name(EntityKind kind) {
    switch (kind) {
        case EntityKind::File:    return "file";
        case EntityKind::Symbol:  return "symbol";
        case EntityKind::Concept: return "concept";
    }
    return "concept";
}

inline bool parse_entity_kind(const std::string& s, EntityKind& out) {
    if (s == "file") { out = EntityKind::File; return true; }
    if (s == "symbol") { out = EntityKind::Symbol; return true; }
    if (s == "concept") { out = EntityKind::Concept; return true; }
    return false;
}

struct Turn {
    std::string role;       // user | assistant | system
    std::string text;
    Timestamp timestamp = 0;
};

struct Conversation {
    ConversationId id = 0;
    std::string session_id;
    std::vector<Turn> turns;
    std::vector<std::string> files;     // Related file paths, first-seen order
    std::string intent;
    Timestamp started_at = 0;
    Timestamp last_activity = 0;
    bool closed = false;
    bool pinned = false;

    std::string text() const {
        std::string out;
        for (const auto& t : turns) {
            if (!out.empty()) out += '\n';
            out += t.text;
        }
        return out;
    }
};

struct Entity {
    EntityId id = 0;
    EntityKind kind = EntityKind::Concept;
    std::string name;
    Timestamp first_seen = 0;
    Timestamp last_seen = 0;
    int64_t occurrences = 0;
};

// Entity as reported by an extractor or a caller, before it has an id
struct EntityMention {
    EntityKind kind = EntityKind::Concept;
    std::string name;

    bool operator==(const EntityMention& o) const { return kind == o.kind && name == o.name; }
};

struct EntityStats {
    Entity entity;
    size_t conversation_count = 0;
};

struct ConversationMatch {
    Conversation conversation;
    float score = 0.0f;
};

struct CoModificationPattern {
    std::vector<std::string> files;
    int64_t frequency = 0;
    float confidence = 0.0f;
};

struct EvictionRecord {
    ConversationId conversation_id = 0;
    std::string session_id;
    Timestamp evicted_at = 0;
    std::string reason;
    size_t turn_count = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON mapping (store bodies)
// ═══════════════════════════════════════════════════════════════════════════

inline json turn_to_json(const Turn& t) {
    return json{{"role", t.role}, {"text", t.text}, {"timestamp", t.timestamp}};
}

inline json conversation_to_json(const Conversation& c) {
    json turns = json::array();
    for (const auto& t : c.turns) turns.push_back(turn_to_json(t));
    return json{
        {"id", c.id},
        {"session_id", c.session_id},
        {"turns", turns},
        {"files", c.files},
        {"intent", c.intent},
        {"started_at", c.started_at},
        {"last_activity", c.last_activity},
        {"closed", c.closed},
        {"pinned", c.pinned},
    };
}

inline Result<Conversation> conversation_from_json(const json& j) {
    try {
        Conversation c;
        c.id = j.at("id").get<int64_t>();
        c.session_id = j.at("session_id").get<std::string>();
        for (const auto& t : j.at("turns")) {
            c.turns.push_back({t.at("role").get<std::string>(), t.at("text").get<std::string>(),
                               t.at("timestamp").get<int64_t>()});
        }
        c.files = j.value("files", std::vector<std::string>{});
        c.intent = j.value("intent", "");
        c.started_at = j.at("started_at").get<int64_t>();
        c.last_activity = j.at("last_activity").get<int64_t>();
        c.closed = j.value("closed", false);
        c.pinned = j.value("pinned", false);
        return c;
    } catch (const json::exception& e) {
        return Status::corruption(std::string("conversation record: ") + e.what());
    }
}

inline json entity_to_json(const Entity& e) {
    return json{
        {"id", e.id},
        {"kind", entity_kind_name(e.kind)},
        {"name", e.name},
        {"first_seen", e.first_seen},
        {"last_seen", e.last_seen},
        {"occurrences", e.occurrences},
    };
}

inline Result<Entity> entity_from_json(const json& j) {
    try {
        Entity e;
        e.id = j.at("id").get<int64_t>();
        if (!parse_entity_kind(j.at("kind").get<std::string>(), e.kind)) {
            return Status::corruption("entity record: bad kind");
        }
        e.name = j.at("name").get<std::string>();
        e.first_seen = j.at("first_seen").get<int64_t>();
        e.last_seen = j.at("last_seen").get<int64_t>();
        e.occurrences = j.at("occurrences").get<int64_t>();
        return e;
    } catch (const json::exception& e) {
        return Status::corruption(std::string("entity record: ") + e.what());
    }
}

inline json eviction_to_json(const EvictionRecord& r) {
    return json{
        {"conversation_id", r.conversation_id},
        {"session_id", r.session_id},
        {"evicted_at", r.evicted_at},
        {"reason", r.reason},
        {"turn_count", r.turn_count},
    };
}

} // namespace cortex
