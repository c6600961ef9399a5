#pragma once
// WorkingMemory: bounded FIFO conversation log (Tier A)
//
// Retention:
//   - At most max_conversations are kept. Each insert past the cap evicts
//     one conversation: the oldest that is not active, lowest id on ties.
//   - Active = pinned, or still open and touched within the session timeout.
//     Active conversations are never evicted, so the cap can be exceeded
//     while every conversation is active.
//
// Each appended turn updates the entity index and the file co-modification
// counts in the same transaction as the turn itself.

#include "../config.hpp"
#include "../log.hpp"
#include "../scoring.hpp"
#include "../store/record_store.hpp"
#include "../version.hpp"
#include "entity_extractor.hpp"
#include "types.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cortex {

namespace wm_tables {
constexpr const char* CONVERSATIONS = "conversations";
constexpr const char* ENTITIES = "entities";
constexpr const char* MENTIONS = "conversation_entities";
constexpr const char* FILE_PAIRS = "file_pairs";
constexpr const char* EVICTIONS = "evictions";
} // namespace wm_tables

inline StoreSchema working_memory_schema() {
    StoreSchema schema;
    schema.version = CORTEX_WORKING_MEMORY_SCHEMA;
    schema.tables = {
        {wm_tables::CONVERSATIONS, {"session_id", "closed"}, {}},
        {wm_tables::ENTITIES, {}, {{"kind", "name"}}},
        {wm_tables::MENTIONS, {"conversation_id", "entity_id"}, {}},
        {wm_tables::FILE_PAIRS, {}, {}},
        {wm_tables::EVICTIONS, {"conversation_id"}, {}},
    };
    schema.migrations = {
        {1, 2, "add pin flag to conversations",
         [](Transaction& tx) {
             return tx.exec("UPDATE conversations SET body = json_set(body, '$.pinned', json('false')) "
                            "WHERE json_extract(body, '$.pinned') IS NULL");
         }},
    };
    return schema;
}

class WorkingMemory {
public:
    WorkingMemory(std::string path, WorkingMemoryConfig config = {},
                  std::shared_ptr<Clock> clock = system_clock())
        : config_(config)
        , clock_(std::move(clock))
        , store_(std::move(path), working_memory_schema(), "WorkingMemory")
        , extractor_(std::make_shared<RegexEntityExtractor>())
    {}

    Status open() {
        Status s = store_.open(report_);
        if (s && report_.recovered()) {
            log::warn("WorkingMemory", "Recovered store: ", report_.message);
        }
        return s;
    }

    void close() { store_.close(); }

    const OpenReport& open_report() const { return report_; }
    const WorkingMemoryConfig& config() const { return config_; }

    // Replace the entity extractor. Must be called before use from other threads.
    void set_extractor(std::shared_ptr<EntityExtractor> extractor) {
        extractor_ = std::move(extractor);
    }

    Status backup() { return store_.backup(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Conversation lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    // Start a conversation; the session's previous open conversation closes.
    Result<ConversationId> start_conversation(const std::string& session_id) {
        if (trim(session_id).empty()) return Status::validation("session id is empty");

        Timestamp ts = clock_->now();
        ConversationId id = 0;
        std::optional<EvictionRecord> evicted;

        Status s = store_.transaction([&](Transaction& tx) {
            auto next = tx.next_id("conversation");
            if (!next.ok()) return next.status;
            id = *next;

            auto same_session = tx.find(wm_tables::CONVERSATIONS, "session_id", session_id);
            if (!same_session.ok()) return same_session.status;
            for (auto& rec : *same_session) {
                if (rec.body.value("closed", false)) continue;
                rec.body["closed"] = true;
                Status put = tx.put(wm_tables::CONVERSATIONS, rec.key, rec.body);
                if (!put) return put;
            }

            Conversation c;
            c.id = id;
            c.session_id = session_id;
            c.started_at = ts;
            c.last_activity = ts;
            Status ins = tx.insert(wm_tables::CONVERSATIONS, id_key(id), conversation_to_json(c));
            if (!ins) return ins;

            return enforce_capacity(tx, id, ts, evicted);
        });

        if (!s) {
            note_failure(s);
            return s;
        }
        if (evicted) {
            log::info("WorkingMemory", "Evicted conversation ", evicted->conversation_id,
                      " (", evicted->reason, ")");
        }
        log::debug("WorkingMemory", "Started conversation ", id, " for session ", session_id);
        return id;
    }

    // Append a turn. Extraction failures are logged and the turn is stored
    // without extracted entities; caller-supplied files and entities are
    // always recorded.
    Status append_turn(ConversationId id, Turn turn,
                       const std::vector<std::string>& files = {},
                       const std::vector<EntityMention>& entities = {}) {
        Status valid = validate_turn(turn, config_);
        if (!valid) return valid;
        for (const auto& f : files) {
            if (trim(f).empty()) return Status::validation("empty file path");
        }

        std::vector<EntityMention> mentions = extract(turn.text);
        for (const auto& e : entities) {
            if (trim(e.name).empty()) return Status::validation("empty entity name");
            if (std::find(mentions.begin(), mentions.end(), e) == mentions.end()) mentions.push_back(e);
        }
        for (const auto& f : files) {
            EntityMention m{EntityKind::File, f};
            if (std::find(mentions.begin(), mentions.end(), m) == mentions.end()) mentions.push_back(m);
        }

        Timestamp ts = clock_->now();
        if (turn.timestamp == 0) turn.timestamp = ts;

        Status s = store_.transaction([&](Transaction& tx) {
            auto body = tx.get(wm_tables::CONVERSATIONS, id_key(id));
            if (!body.ok()) return body.status;
            auto conv = conversation_from_json(*body);
            if (!conv.ok()) return conv.status;
            if (conv->closed) {
                return Status::validation("conversation " + std::to_string(id) + " is closed");
            }

            conv->turns.push_back(turn);
            conv->last_activity = std::max(ts, turn.timestamp);

            for (const auto& m : mentions) {
                if (m.kind == EntityKind::File) {
                    Status fs = add_file(tx, *conv, m.name);
                    if (!fs) return fs;
                }
                Status es = record_mention(tx, id, m, turn.timestamp);
                if (!es) return es;
            }

            return tx.put(wm_tables::CONVERSATIONS, id_key(id), conversation_to_json(*conv));
        });

        if (!s) note_failure(s);
        return s;
    }

    static Status validate_turn(const Turn& turn, const WorkingMemoryConfig& config) {
        if (turn.role != "user" && turn.role != "assistant" && turn.role != "system") {
            return Status::validation("turn role must be user, assistant or system");
        }
        if (trim(turn.text).empty()) return Status::validation("turn text is empty");
        if (turn.text.size() > config.max_turn_chars) {
            return Status::validation("turn text exceeds " + std::to_string(config.max_turn_chars) + " chars");
        }
        return Status::ok();
    }

    Status close_conversation(ConversationId id) {
        return update(id, [](Conversation& c) { c.closed = true; return Status::ok(); });
    }

    // Pinned conversations stay active (and unevictable) until unpinned
    Status pin_conversation(ConversationId id, bool pinned) {
        return update(id, [pinned](Conversation& c) { c.pinned = pinned; return Status::ok(); });
    }

    Status set_intent(ConversationId id, const std::string& label) {
        return update(id, [&label](Conversation& c) { c.intent = label; return Status::ok(); });
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Reads
    // ═══════════════════════════════════════════════════════════════════════

    Result<Conversation> get_conversation(ConversationId id) const {
        auto body = store_.get(wm_tables::CONVERSATIONS, id_key(id));
        if (!body.ok()) {
            note_failure(body.status);
            return body.status;
        }
        return conversation_from_json(*body);
    }

    // Most recently started first, at most n
    Result<std::vector<Conversation>> get_recent(size_t n) const {
        auto all = load_all();
        if (!all.ok()) return all.status;
        auto& convs = *all;
        std::sort(convs.begin(), convs.end(), [](const Conversation& a, const Conversation& b) {
            if (a.started_at != b.started_at) return a.started_at > b.started_at;
            return a.id > b.id;
        });
        if (convs.size() > n) convs.resize(n);
        return convs;
    }

    // BM25 over retained conversation text; ties go to the most recent
    Result<std::vector<ConversationMatch>> search(const std::string& query, size_t limit = 10) const {
        auto all = load_all();
        if (!all.ok()) return all.status;

        BM25Index index;
        std::map<ConversationId, const Conversation*> by_id;
        for (const auto& c : *all) {
            index.add(c.id, c.text() + "\n" + join_files(c));
            by_id[c.id] = &c;
        }

        std::vector<ConversationMatch> matches;
        for (const auto& [id, score] : index.search(query, index.size())) {
            matches.push_back({*by_id[id], score});
        }
        std::sort(matches.begin(), matches.end(), [](const ConversationMatch& a, const ConversationMatch& b) {
            if (a.score != b.score) return a.score > b.score;
            if (a.conversation.last_activity != b.conversation.last_activity)
                return a.conversation.last_activity > b.conversation.last_activity;
            return a.conversation.id > b.conversation.id;
        });
        if (matches.size() > limit) matches.resize(limit);
        return matches;
    }

    size_t count() const {
        auto n = store_.count(wm_tables::CONVERSATIONS);
        if (!n.ok()) {
            note_failure(n.status);
            return 0;
        }
        return *n;
    }

    bool is_active(const Conversation& c) const {
        return is_active(c, clock_->now());
    }

    bool is_active(const Conversation& c, Timestamp at) const {
        if (c.pinned) return true;
        return !c.closed && at - c.last_activity <= config_.session_timeout_ms;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Entities
    // ═══════════════════════════════════════════════════════════════════════

    Result<std::vector<Entity>> get_entities(ConversationId id) const {
        auto links = store_.find(wm_tables::MENTIONS, "conversation_id", id);
        if (!links.ok()) {
            note_failure(links.status);
            return links.status;
        }
        std::vector<Entity> out;
        for (const auto& link : *links) {
            auto body = store_.get(wm_tables::ENTITIES, link.body.value("entity_key", ""));
            if (!body.ok()) continue;
            auto e = entity_from_json(*body);
            if (e.ok()) out.push_back(std::move(*e));
        }
        std::sort(out.begin(), out.end(), [](const Entity& a, const Entity& b) { return a.id < b.id; });
        return out;
    }

    Result<std::vector<Conversation>> find_conversations_with_entity(EntityKind kind,
                                                                     const std::string& name) const {
        auto body = store_.get(wm_tables::ENTITIES, entity_key(kind, name));
        if (body.status.code == ErrorCode::NotFound) return std::vector<Conversation>{};
        if (!body.ok()) return body.status;

        auto links = store_.find(wm_tables::MENTIONS, "entity_id", (*body)["id"]);
        if (!links.ok()) return links.status;

        std::vector<Conversation> out;
        for (const auto& link : *links) {
            auto conv = get_conversation(link.body.value("conversation_id", int64_t{0}));
            if (conv.ok()) out.push_back(std::move(*conv));
        }
        std::sort(out.begin(), out.end(), [](const Conversation& a, const Conversation& b) {
            return a.last_activity != b.last_activity ? a.last_activity > b.last_activity : a.id > b.id;
        });
        return out;
    }

    // Occurrence totals and conversation counts, most mentioned first
    Result<std::vector<EntityStats>> entity_statistics() const {
        auto entities = store_.scan(wm_tables::ENTITIES);
        if (!entities.ok()) return entities.status;
        auto links = store_.scan(wm_tables::MENTIONS);
        if (!links.ok()) return links.status;

        std::map<EntityId, size_t> conversation_counts;
        for (const auto& link : *links) {
            conversation_counts[link.body.value("entity_id", int64_t{0})]++;
        }

        std::vector<EntityStats> out;
        for (const auto& rec : *entities) {
            auto e = entity_from_json(rec.body);
            if (!e.ok()) continue;
            size_t convs = conversation_counts[e->id];
            out.push_back({std::move(*e), convs});
        }
        std::sort(out.begin(), out.end(), [](const EntityStats& a, const EntityStats& b) {
            if (a.entity.occurrences != b.entity.occurrences) return a.entity.occurrences > b.entity.occurrences;
            return a.entity.name < b.entity.name;
        });
        return out;
    }

    size_t entity_count() const {
        auto n = store_.count(wm_tables::ENTITIES);
        return n.ok() ? *n : 0;
    }

    // File pairs edited together across retained conversations.
    // confidence = frequency / retained conversation count.
    Result<std::vector<CoModificationPattern>> co_modification_patterns(int64_t min_frequency = 2) const {
        auto pairs = store_.scan(wm_tables::FILE_PAIRS);
        if (!pairs.ok()) return pairs.status;
        size_t total = count();

        std::vector<CoModificationPattern> out;
        for (const auto& rec : *pairs) {
            int64_t freq = rec.body.value("frequency", int64_t{0});
            if (freq < min_frequency) continue;
            CoModificationPattern p;
            p.files = rec.body.value("files", std::vector<std::string>{});
            p.frequency = freq;
            p.confidence = total ? std::min(1.0f, static_cast<float>(freq) / total) : 0.0f;
            out.push_back(std::move(p));
        }
        std::sort(out.begin(), out.end(), [](const CoModificationPattern& a, const CoModificationPattern& b) {
            if (a.frequency != b.frequency) return a.frequency > b.frequency;
            return a.files < b.files;
        });
        return out;
    }

    // Most recent evictions first
    Result<std::vector<EvictionRecord>> eviction_log(size_t limit = 100) const {
        auto recs = store_.scan(wm_tables::EVICTIONS);
        if (!recs.ok()) return recs.status;

        std::vector<EvictionRecord> out;
        for (auto it = recs->rbegin(); it != recs->rend() && out.size() < limit; ++it) {
            EvictionRecord r;
            r.conversation_id = it->body.value("conversation_id", int64_t{0});
            r.session_id = it->body.value("session_id", "");
            r.evicted_at = it->body.value("evicted_at", int64_t{0});
            r.reason = it->body.value("reason", "");
            r.turn_count = it->body.value("turn_count", size_t{0});
            out.push_back(std::move(r));
        }
        return out;
    }

private:
    static std::string entity_key(EntityKind kind, const std::string& name) {
        return std::string(entity_kind_name(kind)) + ":" + name;
    }

    static std::string pair_key(const std::string& a, const std::string& b) {
        return a < b ? a + "\n" + b : b + "\n" + a;
    }

    static std::string join_files(const Conversation& c) {
        std::string out;
        for (const auto& f : c.files) out += f + " ";
        return out;
    }

    std::vector<EntityMention> extract(const std::string& text) const {
        if (!extractor_) return {};
        try {
            return extractor_->extract(text);
        } catch (const std::exception& e) {
            log::warn("WorkingMemory", "Entity extraction failed, storing turn without entities: ",
                      e.what());
            return {};
        }
    }

    Result<std::vector<Conversation>> load_all() const {
        auto recs = store_.scan(wm_tables::CONVERSATIONS);
        if (!recs.ok()) {
            note_failure(recs.status);
            return recs.status;
        }
        std::vector<Conversation> out;
        out.reserve(recs->size());
        for (const auto& rec : *recs) {
            auto c = conversation_from_json(rec.body);
            if (!c.ok()) return c.status;
            out.push_back(std::move(*c));
        }
        return out;
    }

    template<typename Fn>
    Status update(ConversationId id, Fn&& fn) {
        Status s = store_.transaction([&](Transaction& tx) {
            auto body = tx.get(wm_tables::CONVERSATIONS, id_key(id));
            if (!body.ok()) return body.status;
            auto conv = conversation_from_json(*body);
            if (!conv.ok()) return conv.status;
            Status r = fn(*conv);
            if (!r) return r;
            return tx.put(wm_tables::CONVERSATIONS, id_key(id), conversation_to_json(*conv));
        });
        if (!s) note_failure(s);
        return s;
    }

    // New file in a conversation: one more co-modification for each file
    // the conversation already touched
    Status add_file(Transaction& tx, Conversation& conv, const std::string& path) {
        if (std::find(conv.files.begin(), conv.files.end(), path) != conv.files.end()) {
            return Status::ok();
        }
        for (const auto& other : conv.files) {
            std::string key = pair_key(path, other);
            auto existing = tx.get(wm_tables::FILE_PAIRS, key);
            json body;
            if (existing.ok()) {
                body = *existing;
            } else if (existing.status.code == ErrorCode::NotFound) {
                std::vector<std::string> files{path, other};
                std::sort(files.begin(), files.end());
                body = json{{"files", files}, {"frequency", 0}};
            } else {
                return existing.status;
            }
            body["frequency"] = body.value("frequency", int64_t{0}) + 1;
            Status s = tx.put(wm_tables::FILE_PAIRS, key, body);
            if (!s) return s;
        }
        conv.files.push_back(path);
        return Status::ok();
    }

    Status record_mention(Transaction& tx, ConversationId conv_id, const EntityMention& m, Timestamp ts) {
        std::string ekey = entity_key(m.kind, m.name);
        auto existing = tx.get(wm_tables::ENTITIES, ekey);
        Entity entity;
        if (existing.ok()) {
            auto parsed = entity_from_json(*existing);
            if (!parsed.ok()) return parsed.status;
            entity = std::move(*parsed);
        } else if (existing.status.code == ErrorCode::NotFound) {
            auto next = tx.next_id("entity");
            if (!next.ok()) return next.status;
            entity.id = *next;
            entity.kind = m.kind;
            entity.name = m.name;
            entity.first_seen = ts;
        } else {
            return existing.status;
        }
        entity.last_seen = std::max(entity.last_seen, ts);
        entity.occurrences++;
        Status s = tx.put(wm_tables::ENTITIES, ekey, entity_to_json(entity));
        if (!s) return s;

        std::string lkey = id_key(conv_id) + ":" + id_key(entity.id);
        auto link = tx.get(wm_tables::MENTIONS, lkey);
        json body;
        if (link.ok()) {
            body = *link;
        } else if (link.status.code == ErrorCode::NotFound) {
            body = json{{"conversation_id", conv_id}, {"entity_id", entity.id},
                        {"entity_key", ekey}, {"count", 0}};
        } else {
            return link.status;
        }
        body["count"] = body.value("count", int64_t{0}) + 1;
        return tx.put(wm_tables::MENTIONS, lkey, body);
    }

    // One eviction at most per insert
    Status enforce_capacity(Transaction& tx, ConversationId inserted, Timestamp at,
                            std::optional<EvictionRecord>& evicted) {
        auto n = tx.count(wm_tables::CONVERSATIONS);
        if (!n.ok()) return n.status;
        if (*n <= config_.max_conversations) return Status::ok();

        auto recs = tx.scan(wm_tables::CONVERSATIONS);
        if (!recs.ok()) return recs.status;

        std::optional<Conversation> victim;
        for (const auto& rec : *recs) {
            auto c = conversation_from_json(rec.body);
            if (!c.ok()) return c.status;
            if (c->id == inserted || is_active(*c, at)) continue;
            if (!victim || c->started_at < victim->started_at ||
                (c->started_at == victim->started_at && c->id < victim->id)) {
                victim = std::move(*c);
            }
        }

        if (!victim) {
            log::warn("WorkingMemory", "Retention cap ", config_.max_conversations,
                      " exceeded but every conversation is active");
            return Status::ok();
        }

        Status s = delete_conversation(tx, *victim);
        if (!s) return s;

        EvictionRecord rec;
        rec.conversation_id = victim->id;
        rec.session_id = victim->session_id;
        rec.evicted_at = at;
        rec.reason = "fifo: retention cap " + std::to_string(config_.max_conversations);
        rec.turn_count = victim->turns.size();

        auto next = tx.next_id("eviction");
        if (!next.ok()) return next.status;
        s = tx.insert(wm_tables::EVICTIONS, id_key(*next), eviction_to_json(rec));
        if (!s) return s;
        evicted = rec;
        return Status::ok();
    }

    // Drop a conversation with its entity links, orphaned entities and its
    // share of the co-modification counts
    Status delete_conversation(Transaction& tx, const Conversation& conv) {
        Status s = tx.erase(wm_tables::CONVERSATIONS, id_key(conv.id));
        if (!s) return s;

        for (size_t i = 0; i < conv.files.size(); ++i) {
            for (size_t j = i + 1; j < conv.files.size(); ++j) {
                std::string key = pair_key(conv.files[i], conv.files[j]);
                auto pair = tx.get(wm_tables::FILE_PAIRS, key);
                if (pair.status.code == ErrorCode::NotFound) continue;
                if (!pair.ok()) return pair.status;
                int64_t freq = pair->value("frequency", int64_t{0}) - 1;
                if (freq <= 0) {
                    s = tx.erase(wm_tables::FILE_PAIRS, key);
                } else {
                    (*pair)["frequency"] = freq;
                    s = tx.put(wm_tables::FILE_PAIRS, key, *pair);
                }
                if (!s) return s;
            }
        }

        auto links = tx.find(wm_tables::MENTIONS, "conversation_id", conv.id);
        if (!links.ok()) return links.status;
        for (const auto& link : *links) {
            s = tx.erase(wm_tables::MENTIONS, link.key);
            if (!s) return s;

            auto remaining = tx.find(wm_tables::MENTIONS, "entity_id", link.body["entity_id"]);
            if (!remaining.ok()) return remaining.status;
            if (remaining->empty()) {
                s = tx.erase(wm_tables::ENTITIES, link.body.value("entity_key", ""));
                if (!s && s.code != ErrorCode::NotFound) return s;
            }
        }
        return Status::ok();
    }

    // Corruption found at runtime: recover the store in place
    void note_failure(const Status& s) const {
        if (s.code != ErrorCode::Corruption) return;
        log::error("WorkingMemory", "Store corruption: ", s.message);
        OpenReport report;
        Status r = store_.recover(report);
        if (!r) {
            log::error("WorkingMemory", "Recovery failed: ", r.message);
            return;
        }
        report_ = report;
    }

    WorkingMemoryConfig config_;
    std::shared_ptr<Clock> clock_;
    mutable RecordStore store_;
    mutable OpenReport report_;
    std::shared_ptr<EntityExtractor> extractor_;
};

} // namespace cortex
