#pragma once
// KnowledgeGraph: long-lived patterns and typed relationships (Tier B)
//
// The store is the source of truth. An in-memory arena (patterns by id,
// outgoing edges, BM25 index, tag bitmaps) is rebuilt from it on open and
// updated after every committed write, so search and traversal never touch
// SQLite. Writers hold mutex_ exclusively across commit and arena update.
//
// Decay, evaluated at most once per pattern per evaluation window:
//   unused >= 60 days     confidence -= 0.10
//   unused >= 90 days     confidence -= 0.25 (replaces the 60 day penalty)
//   unused >= 120 days    deleted
//   decayed below 0.30    deleted
// Pinned and immutable patterns never decay and are never deleted by decay.
// Bulk deletion by confidence or age follows the same rule and logs to the
// same decay log.

#include "../config.hpp"
#include "../log.hpp"
#include "../scoring.hpp"
#include "../store/record_store.hpp"
#include "../version.hpp"
#include "metadata.hpp"
#include "pattern.hpp"
#include "query.hpp"
#include "tag_index.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <deque>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cortex {

namespace kg_tables {
constexpr const char* PATTERNS = "patterns";
constexpr const char* RELATIONSHIPS = "relationships";
constexpr const char* OBSERVATIONS = "observations";
constexpr const char* DECAY_LOG = "decay_log";
} // namespace kg_tables

inline StoreSchema knowledge_graph_schema() {
    StoreSchema schema;
    schema.version = CORTEX_KNOWLEDGE_GRAPH_SCHEMA;
    schema.tables = {
        {kg_tables::PATTERNS, {"title_key", "kind"}, {}},
        {kg_tables::RELATIONSHIPS, {"from", "to"}, {{"from", "to", "kind"}}},
        {kg_tables::OBSERVATIONS, {}, {}},
        {kg_tables::DECAY_LOG, {"pattern_id"}, {}},
    };
    schema.migrations = {
        {1, 2, "add metadata and decay marker to patterns",
         [](Transaction& tx) {
             Status s = tx.exec("UPDATE patterns SET body = json_set(body, '$.metadata', json('{}')) "
                                "WHERE json_extract(body, '$.metadata') IS NULL");
             if (!s) return s;
             return tx.exec("UPDATE patterns SET body = json_set(body, '$.last_decay_day', -1) "
                            "WHERE json_extract(body, '$.last_decay_day') IS NULL");
         }},
    };
    return schema;
}

class KnowledgeGraph {
public:
    KnowledgeGraph(std::string path, KnowledgeGraphConfig config = {},
                   std::shared_ptr<Clock> clock = system_clock())
        : config_(config)
        , clock_(std::move(clock))
        , store_(std::move(path), knowledge_graph_schema(), "KnowledgeGraph")
        , index_(BM25Config{config.bm25_k1, config.bm25_b})
        , metadata_schema_(MetadataSchema::defaults())
    {
        metadata_schema_.strict = config.strict_metadata;
    }

    KnowledgeGraph(const KnowledgeGraph&) = delete;
    KnowledgeGraph& operator=(const KnowledgeGraph&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    Status open() {
        std::unique_lock lock(mutex_);
        Status s = store_.open(report_);
        if (!s) return s;

        s = reload_locked();
        if (s.code == ErrorCode::Corruption) {
            log::error("KnowledgeGraph", "Unreadable records: ", s.message);
            s = store_.recover(report_);
            if (s) s = reload_locked();
        }
        if (!s) return s;

        if (report_.recovered()) {
            log::warn("KnowledgeGraph", "Recovered store: ", report_.message);
        }
        log::debug("KnowledgeGraph", "Loaded ", arena_.size(), " patterns, ",
                   relationship_count_locked(), " relationships");
        return s;
    }

    void close() {
        std::unique_lock lock(mutex_);
        store_.close();
        clear_locked();
    }

    const OpenReport& open_report() const { return report_; }
    const KnowledgeGraphConfig& config() const { return config_; }

    Status backup() { return store_.backup(); }

    void set_metadata_schema(MetadataSchema schema) {
        std::unique_lock lock(mutex_);
        metadata_schema_ = std::move(schema);
    }

    MetadataSchema metadata_schema() const {
        std::shared_lock lock(mutex_);
        return metadata_schema_;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Patterns
    // ═══════════════════════════════════════════════════════════════════════

    // Insert a new pattern. id, access_count and the decay marker are
    // assigned here; created_at/last_accessed default to now.
    Result<PatternId> add_pattern(Pattern p) {
        std::unique_lock lock(mutex_);
        Status v = validate_locked(p);
        if (!v) return v;

        Timestamp ts = clock_->now();
        p.tags = normalize_tags(p.tags);
        if (p.created_at == 0) p.created_at = ts;
        if (p.last_accessed == 0) p.last_accessed = p.created_at;
        p.access_count = 0;
        p.last_decay_day = -1;

        Status s = store_.transaction([&](Transaction& tx) {
            auto next = tx.next_id("pattern");
            if (!next.ok()) return next.status;
            if (*next > std::numeric_limits<uint32_t>::max()) {
                return Status::validation("pattern id space exhausted");
            }
            p.id = *next;
            return tx.insert(kg_tables::PATTERNS, id_key(p.id), pattern_to_json(p));
        });
        if (!s) return fail_locked(s);

        index_pattern_locked(p);
        log::debug("KnowledgeGraph", "Added pattern ", p.id, " '", p.title, "'");
        return p.id;
    }

    // Read a pattern, counting the access
    Result<Pattern> get_pattern(PatternId id) {
        std::unique_lock lock(mutex_);
        auto it = arena_.find(id);
        if (it == arena_.end()) return not_found(id);

        Pattern p = it->second;
        p.access_count++;
        p.last_accessed = std::max(p.last_accessed, clock_->now());

        Status s = store_.put(kg_tables::PATTERNS, id_key(id), pattern_to_json(p));
        if (!s) {
            // Reads stay available; the access just isn't counted
            Status failed = fail_locked(s);
            log::warn("KnowledgeGraph", "Could not record access to pattern ", id, ": ", failed.message);
            auto again = arena_.find(id);
            if (again == arena_.end()) return not_found(id);
            return again->second;
        }
        it->second = p;
        return p;
    }

    // Read without touching access statistics
    Result<Pattern> peek_pattern(PatternId id) const {
        std::shared_lock lock(mutex_);
        auto it = arena_.find(id);
        if (it == arena_.end()) return not_found(id);
        return it->second;
    }

    bool has_pattern(PatternId id) const {
        std::shared_lock lock(mutex_);
        return arena_.count(id) > 0;
    }

    Status update_pattern(PatternId id, const PatternUpdate& update) {
        std::unique_lock lock(mutex_);
        auto it = arena_.find(id);
        if (it == arena_.end()) return not_found(id);
        if (it->second.immutable) {
            return Status::validation("pattern " + std::to_string(id) + " is immutable");
        }

        Pattern p = it->second;
        if (update.title) p.title = *update.title;
        if (update.body) p.body = *update.body;
        if (update.kind) p.kind = *update.kind;
        if (update.source) p.source = *update.source;
        if (update.tags) p.tags = normalize_tags(*update.tags);
        if (update.metadata) p.metadata = *update.metadata;

        Status v = validate_locked(p);
        if (!v) return v;

        Status s = store_.put(kg_tables::PATTERNS, id_key(id), pattern_to_json(p));
        if (!s) return fail_locked(s);

        index_pattern_locked(p);
        return Status::ok();
    }

    // Remove a pattern with its relationships in one transaction
    Status delete_pattern(PatternId id) {
        std::unique_lock lock(mutex_);
        auto it = arena_.find(id);
        if (it == arena_.end()) return not_found(id);
        if (it->second.immutable) {
            return Status::validation("pattern " + std::to_string(id) + " is immutable");
        }

        Status s = store_.transaction([&](Transaction& tx) { return erase_pattern(tx, id); });
        if (!s) return fail_locked(s);

        unindex_pattern_locked(id);
        log::debug("KnowledgeGraph", "Deleted pattern ", id);
        return Status::ok();
    }

    // Pinned patterns are exempt from decay
    Status pin_pattern(PatternId id, bool pinned) {
        return modify(id, false, [pinned](Pattern& p) { p.pinned = pinned; });
    }

    // Immutable patterns reject updates, reinforcement and deletion
    Status set_immutable(PatternId id, bool immutable = true) {
        return modify(id, false, [immutable](Pattern& p) { p.immutable = immutable; });
    }

    // Explicit confidence change, clamped to [0, 1]. Counts as a use.
    Status reinforce(PatternId id, float amount) {
        if (!std::isfinite(amount) || amount < -1.0f || amount > 1.0f) {
            return Status::validation("reinforce amount must be within [-1, 1]");
        }
        Timestamp ts = clock_->now();
        return modify(id, true, [amount, ts](Pattern& p) {
            p.confidence = std::clamp(p.confidence + amount, 0.0f, 1.0f);
            p.last_accessed = std::max(p.last_accessed, ts);
        });
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Search
    // ═══════════════════════════════════════════════════════════════════════

    // Ranked search. Order: score desc, confidence desc, last_accessed desc,
    // id asc. Does not count as an access.
    Result<std::vector<PatternMatch>> search_patterns(const std::string& query,
                                                      float min_confidence = 0.0f,
                                                      size_t limit = 20) const {
        auto parsed = parse_query(query);
        if (!parsed.ok()) return parsed.status;

        std::shared_lock lock(mutex_);
        if (parsed->empty()) return std::vector<PatternMatch>{};

        auto scores = evaluate(*parsed);
        apply_tag_boost(*parsed, scores);

        std::vector<PatternMatch> matches;
        matches.reserve(scores.size());
        for (const auto& [id, score] : scores) {
            auto it = arena_.find(id);
            if (it == arena_.end()) continue;
            if (it->second.confidence < min_confidence) continue;
            matches.push_back({it->second, score});
        }
        std::sort(matches.begin(), matches.end(), [](const PatternMatch& a, const PatternMatch& b) {
            if (a.score != b.score) return a.score > b.score;
            if (a.pattern.confidence != b.pattern.confidence) {
                return a.pattern.confidence > b.pattern.confidence;
            }
            if (a.pattern.last_accessed != b.pattern.last_accessed) {
                return a.pattern.last_accessed > b.pattern.last_accessed;
            }
            return a.pattern.id < b.pattern.id;
        });
        if (matches.size() > limit) matches.resize(limit);
        return matches;
    }

    std::vector<Pattern> find_by_tag(const std::string& tag) const {
        std::shared_lock lock(mutex_);
        return collect_locked(tags_.with_tag(normalize_tag(tag)));
    }

    // match_all: every tag present, otherwise any
    std::vector<Pattern> find_by_tags(const std::vector<std::string>& tags, bool match_all) const {
        std::shared_lock lock(mutex_);
        return collect_locked(tags_.with_tags(normalize_tags(tags), match_all));
    }

    std::vector<Pattern> patterns_by_kind(PatternKind kind) const {
        std::shared_lock lock(mutex_);
        std::vector<Pattern> out;
        for (const auto& [id, p] : arena_) {
            if (p.kind == kind) out.push_back(p);
        }
        return out;
    }

    std::vector<Pattern> all_patterns() const {
        std::shared_lock lock(mutex_);
        std::vector<Pattern> out;
        out.reserve(arena_.size());
        for (const auto& [id, p] : arena_) out.push_back(p);
        return out;
    }

    // Most used tags first
    std::vector<std::pair<std::string, size_t>> tag_cloud(size_t limit = 50) const {
        std::shared_lock lock(mutex_);
        auto counts = tags_.counts();
        if (counts.size() > limit) counts.resize(limit);
        return counts;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Relationships
    // ═══════════════════════════════════════════════════════════════════════

    Status link_patterns(PatternId from, PatternId to, RelationshipKind kind, float strength = 1.0f) {
        if (!std::isfinite(strength) || strength < 0.0f || strength > 1.0f) {
            return Status::validation("relationship strength must be within [0, 1]");
        }
        if (from == to) return Status::validation("a pattern cannot be linked to itself");

        std::unique_lock lock(mutex_);
        if (!arena_.count(from)) {
            return Status::integrity("relationship source " + std::to_string(from) + " does not exist");
        }
        if (!arena_.count(to)) {
            return Status::integrity("relationship target " + std::to_string(to) + " does not exist");
        }
        for (const auto& r : out_edges_[from]) {
            if (r.to == to && r.kind == kind) {
                return Status::validation("relationship " + std::to_string(from) + " -" +
                                          relationship_kind_name(kind) + "-> " +
                                          std::to_string(to) + " already exists");
            }
        }

        Relationship rel{from, to, kind, strength, clock_->now()};
        Status s = store_.transaction([&](Transaction& tx) {
            return tx.insert(kg_tables::RELATIONSHIPS, edge_key(rel), relationship_to_json(rel));
        });
        if (!s) return fail_locked(s);

        out_edges_[from].push_back(rel);
        return Status::ok();
    }

    Status unlink_patterns(PatternId from, PatternId to, RelationshipKind kind) {
        std::unique_lock lock(mutex_);
        Relationship key{from, to, kind};
        Status s = store_.erase(kg_tables::RELATIONSHIPS, edge_key(key));
        if (!s) return fail_locked(s);

        auto& edges = out_edges_[from];
        edges.erase(std::remove_if(edges.begin(), edges.end(), [&](const Relationship& r) {
            return r.to == to && r.kind == kind;
        }), edges.end());
        return Status::ok();
    }

    // Edges touching a pattern in either direction
    Result<std::vector<Relationship>> get_relationships(PatternId id) const {
        std::shared_lock lock(mutex_);
        if (!arena_.count(id)) return not_found(id);

        std::vector<Relationship> out;
        for (const auto& [from, edges] : out_edges_) {
            for (const auto& r : edges) {
                if (r.from == id || r.to == id) out.push_back(r);
            }
        }
        std::sort(out.begin(), out.end(), [](const Relationship& a, const Relationship& b) {
            if (a.from != b.from) return a.from < b.from;
            if (a.to != b.to) return a.to < b.to;
            return a.kind < b.kind;
        });
        return out;
    }

    // Breadth-first over outgoing edges. The visited set makes cycles
    // terminate; each pattern is reported once, at its shortest distance.
    Result<std::vector<RelatedPattern>> get_related_patterns(PatternId id,
                                                             std::optional<RelationshipKind> kind = std::nullopt,
                                                             int max_depth = 2,
                                                             float min_strength = 0.0f) const {
        std::shared_lock lock(mutex_);
        if (!arena_.count(id)) return not_found(id);

        std::vector<RelatedPattern> out;
        std::unordered_set<PatternId> visited{id};
        std::deque<std::pair<PatternId, int>> frontier{{id, 0}};

        while (!frontier.empty()) {
            auto [current, depth] = frontier.front();
            frontier.pop_front();
            if (depth >= max_depth) continue;

            auto eit = out_edges_.find(current);
            if (eit == out_edges_.end()) continue;

            for (const auto& r : eit->second) {
                if (kind && r.kind != *kind) continue;
                if (r.strength < min_strength) continue;
                if (!visited.insert(r.to).second) continue;

                auto pit = arena_.find(r.to);
                if (pit == arena_.end()) continue;
                out.push_back({pit->second, depth + 1, r.strength, r.kind});
                frontier.emplace_back(r.to, depth + 1);
            }
        }

        std::sort(out.begin(), out.end(), [](const RelatedPattern& a, const RelatedPattern& b) {
            if (a.distance != b.distance) return a.distance < b.distance;
            if (a.strength != b.strength) return a.strength > b.strength;
            return a.pattern.id < b.pattern.id;
        });
        return out;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Observation and promotion
    // ═══════════════════════════════════════════════════════════════════════

    // Count a sighting by normalized title. At the promotion threshold the
    // pattern is created; later sightings reinforce it. The written pattern
    // must pass the metadata schema, otherwise nothing (not even the
    // sighting) is recorded. Immutable patterns only have sightings counted.
    Result<ObserveResult> observe(const Observation& obs) {
        if (trim(obs.title).empty()) return Status::validation("observation title is empty");

        std::unique_lock lock(mutex_);
        std::string key = normalize_key(obs.title);
        Timestamp ts = clock_->now();
        ObserveResult result;
        std::optional<Pattern> written;

        Status s = store_.transaction([&](Transaction& tx) {
            auto existing = tx.get(kg_tables::OBSERVATIONS, key);
            json body;
            if (existing.ok()) {
                body = *existing;
            } else if (existing.status.code == ErrorCode::NotFound) {
                body = json{{"title", obs.title}, {"count", 0}, {"first_seen", ts}};
            } else {
                return existing.status;
            }
            result.observations = body.value("count", int64_t{0}) + 1;
            body["count"] = result.observations;
            body["last_seen"] = ts;

            if (result.observations >= static_cast<int64_t>(config_.promotion_threshold)) {
                std::optional<PatternId> target = find_by_title_locked(key);
                if (target && arena_.at(*target).immutable) {
                    // Only the sighting is counted; the pattern stays as it is
                    result.pattern_id = *target;
                    body["pattern_id"] = *target;
                    return tx.put(kg_tables::OBSERVATIONS, key, body);
                }
                Pattern p;
                if (target) {
                    p = arena_.at(*target);
                    p.confidence = std::min(1.0f, p.confidence + config_.reinforce_step);
                    p.last_accessed = std::max(p.last_accessed, ts);
                    p.metadata["observations"] = result.observations;
                } else {
                    p.title = trim(obs.title);
                    p.body = obs.body;
                    p.kind = obs.kind;
                    p.tags = normalize_tags(obs.tags);
                    p.source = obs.source;
                    p.confidence = config_.promoted_confidence;
                    p.created_at = ts;
                    p.last_accessed = ts;
                    p.metadata["observations"] = result.observations;
                    p.metadata["origin"] = std::string("observed");
                }
                Status v = validate_locked(p);
                if (!v) return v;

                if (target) {
                    Status put = tx.put(kg_tables::PATTERNS, id_key(p.id), pattern_to_json(p));
                    if (!put) return put;
                } else {
                    auto next = tx.next_id("pattern");
                    if (!next.ok()) return next.status;
                    p.id = *next;
                    Status ins = tx.insert(kg_tables::PATTERNS, id_key(p.id), pattern_to_json(p));
                    if (!ins) return ins;
                    result.promoted = true;
                }
                written = std::move(p);
                result.pattern_id = written->id;
                body["pattern_id"] = written->id;
            }
            return tx.put(kg_tables::OBSERVATIONS, key, body);
        });
        if (!s) return fail_locked(s);

        if (written) {
            index_pattern_locked(*written);
            if (result.promoted) {
                log::info("KnowledgeGraph", "Promoted '", written->title, "' after ",
                          result.observations, " observations");
            }
        }
        return result;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Decay
    // ═══════════════════════════════════════════════════════════════════════

    // Batched pass over every pattern. Each batch commits on its own; with a
    // time slice the pass stops between batches and reports complete=false.
    // Rerunning continues where it left off because evaluated patterns carry
    // the day of their last penalty.
    Result<DecayReport> apply_confidence_decay(DecayOptions options = {}) {
        if (options.batch_size == 0) return Status::validation("decay batch size must be positive");

        std::vector<PatternId> ids;
        {
            std::shared_lock lock(mutex_);
            ids.reserve(arena_.size());
            for (const auto& [id, p] : arena_) ids.push_back(id);
        }

        DecayReport report;
        auto started = std::chrono::steady_clock::now();

        for (size_t begin = 0; begin < ids.size(); begin += options.batch_size) {
            if (options.time_slice_ms > 0 && begin > 0) {
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started).count();
                if (elapsed >= options.time_slice_ms) {
                    report.complete = false;
                    log::debug("KnowledgeGraph", "Decay paused after ", report.evaluated,
                               " patterns (time slice ", options.time_slice_ms, "ms)");
                    break;
                }
            }
            size_t end = std::min(ids.size(), begin + options.batch_size);
            Status s = decay_batch(ids, begin, end, report);
            if (!s) return s;
        }

        if (report.decayed_count || report.deleted_count) {
            log::info("KnowledgeGraph", "Decay: ", report.decayed_count, " decayed, ",
                      report.deleted_count, " deleted of ", report.evaluated, " evaluated");
        }
        return report;
    }

    // Newest first; all patterns when pattern_id is empty
    Result<std::vector<DecayLogEntry>> decay_log(std::optional<PatternId> pattern_id = std::nullopt,
                                                 size_t limit = 100) const {
        auto recs = pattern_id ? store_.find(kg_tables::DECAY_LOG, "pattern_id", *pattern_id)
                               : store_.scan(kg_tables::DECAY_LOG);
        if (!recs.ok()) return recs.status;

        std::vector<DecayLogEntry> out;
        out.reserve(recs->size());
        for (const auto& rec : *recs) out.push_back(decay_entry_from_json(rec.body));
        std::sort(out.begin(), out.end(), [](const DecayLogEntry& a, const DecayLogEntry& b) {
            return a.id > b.id;
        });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Bulk deletion
    // ═══════════════════════════════════════════════════════════════════════

    // Patterns matching every given criterion. Pinned and immutable matches
    // land in protected_ids. Nothing is written.
    Result<ForgetReport> deletion_preview(const ForgetCriteria& criteria) const {
        Status v = validate_criteria(criteria);
        if (!v) return v;
        std::shared_lock lock(mutex_);
        ForgetReport report = plan_forget_locked(criteria);
        report.dry_run = true;
        return report;
    }

    // Deletes the matches in one transaction, each logged to the decay log.
    // Fails without writing when the matches exceed max_fraction of all
    // patterns.
    Result<ForgetReport> forget(const ForgetCriteria& criteria, bool dry_run = false) {
        if (dry_run) return deletion_preview(criteria);
        Status v = validate_criteria(criteria);
        if (!v) return v;

        std::unique_lock lock(mutex_);
        ForgetReport report = plan_forget_locked(criteria);
        double limit = static_cast<double>(criteria.max_fraction) * static_cast<double>(report.total_patterns);
        if (static_cast<double>(report.deleted.size()) > limit) {
            return Status::validation("refusing to delete " + std::to_string(report.deleted.size()) + " of " +
                                      std::to_string(report.total_patterns) + " patterns");
        }
        if (report.deleted.empty()) return report;

        Timestamp ts = clock_->now();
        std::string reason = describe_criteria(criteria);
        Status s = store_.transaction([&](Transaction& tx) {
            for (PatternId id : report.deleted) {
                const Pattern& p = arena_.at(id);
                DecayLogEntry entry;
                entry.pattern_id = p.id;
                entry.title = p.title;
                entry.old_confidence = p.confidence;
                entry.action = "deleted";
                entry.reason = reason;
                entry.timestamp = ts;
                Status w = append_decay_log(tx, entry);
                if (!w) return w;
                w = erase_pattern(tx, id);
                if (!w) return w;
            }
            return Status::ok();
        });
        if (!s) return fail_locked(s);

        for (PatternId id : report.deleted) unindex_pattern_locked(id);
        log::info("KnowledgeGraph", "Forgot ", report.deleted.size(), " patterns (", reason, "), ",
                  report.protected_ids.size(), " protected");
        return report;
    }

    Result<ForgetReport> delete_by_confidence(float max_confidence, bool dry_run = false) {
        ForgetCriteria criteria;
        criteria.max_confidence = max_confidence;
        return forget(criteria, dry_run);
    }

    Result<ForgetReport> delete_by_age(int64_t inactive_days, bool dry_run = false) {
        ForgetCriteria criteria;
        criteria.inactive_days = inactive_days;
        return forget(criteria, dry_run);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Export / import
    // ═══════════════════════════════════════════════════════════════════════

    json export_patterns() const {
        std::shared_lock lock(mutex_);
        json patterns = json::array();
        for (const auto& [id, p] : arena_) patterns.push_back(pattern_to_json(p));

        json relationships = json::array();
        for (const auto& [from, edges] : out_edges_) {
            for (const auto& r : edges) relationships.push_back(relationship_to_json(r));
        }
        return json{
            {"format", "cortex-patterns"},
            {"version", CORTEX_KNOWLEDGE_GRAPH_SCHEMA},
            {"exported_at", clock_->now()},
            {"patterns", patterns},
            {"relationships", relationships},
        };
    }

    // Patterns get fresh ids. A title already present is skipped and its
    // relationships attach to the existing pattern.
    Result<ImportReport> import_patterns(const json& doc) {
        if (!doc.is_object() || !doc.contains("patterns") || !doc["patterns"].is_array()) {
            return Status::validation("import document needs a \"patterns\" array");
        }

        std::vector<Pattern> incoming;
        for (const auto& item : doc["patterns"]) {
            auto p = pattern_from_json(item);
            if (!p.ok()) return p.status;
            incoming.push_back(std::move(*p));
        }
        std::vector<Relationship> links;
        if (doc.contains("relationships")) {
            if (!doc["relationships"].is_array()) {
                return Status::validation("\"relationships\" must be an array");
            }
            for (const auto& item : doc["relationships"]) {
                auto r = relationship_from_json(item);
                if (!r.ok()) return r.status;
                links.push_back(*r);
            }
        }

        std::unique_lock lock(mutex_);
        for (auto& p : incoming) {
            p.tags = normalize_tags(p.tags);
            Status v = validate_locked(p);
            if (!v) return v;
        }

        ImportReport report;
        Status s = store_.transaction([&](Transaction& tx) {
            std::map<PatternId, PatternId> remap;
            std::map<std::string, PatternId> titles;
            for (const auto& [id, p] : arena_) titles.emplace(normalize_key(p.title), id);

            for (auto& p : incoming) {
                std::string key = normalize_key(p.title);
                auto existing = titles.find(key);
                if (existing != titles.end()) {
                    remap[p.id] = existing->second;
                    report.skipped++;
                    continue;
                }
                auto next = tx.next_id("pattern");
                if (!next.ok()) return next.status;
                PatternId old_id = p.id;
                p.id = *next;
                Status ins = tx.insert(kg_tables::PATTERNS, id_key(p.id), pattern_to_json(p));
                if (!ins) return ins;
                remap[old_id] = p.id;
                titles.emplace(key, p.id);
                report.imported++;
            }

            std::set<std::string> seen;
            for (auto r : links) {
                auto f = remap.find(r.from);
                auto t = remap.find(r.to);
                if (f == remap.end() || t == remap.end()) continue;
                r.from = f->second;
                r.to = t->second;
                if (r.from == r.to) continue;
                std::string key = edge_key(r);
                if (!seen.insert(key).second || tx.exists(kg_tables::RELATIONSHIPS, key)) continue;
                Status ins = tx.insert(kg_tables::RELATIONSHIPS, key, relationship_to_json(r));
                if (!ins) return ins;
                report.relationships++;
            }
            return Status::ok();
        });
        if (!s) return fail_locked(s);

        s = reload_locked();
        if (!s) return fail_locked(s);
        log::info("KnowledgeGraph", "Imported ", report.imported, " patterns (", report.skipped,
                  " skipped), ", report.relationships, " relationships");
        return report;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Statistics
    // ═══════════════════════════════════════════════════════════════════════

    size_t pattern_count() const {
        std::shared_lock lock(mutex_);
        return arena_.size();
    }

    size_t relationship_count() const {
        std::shared_lock lock(mutex_);
        return relationship_count_locked();
    }

    size_t tag_count() const {
        std::shared_lock lock(mutex_);
        return tags_.tag_count();
    }

    float average_confidence() const {
        std::shared_lock lock(mutex_);
        if (arena_.empty()) return 0.0f;
        double total = 0.0;
        for (const auto& [id, p] : arena_) total += p.confidence;
        return static_cast<float>(total / arena_.size());
    }

private:
    using ScoreMap = std::unordered_map<PatternId, float>;

    static Status not_found(PatternId id) {
        return Status::not_found("pattern " + std::to_string(id) + " does not exist");
    }

    static std::string normalize_tag(const std::string& tag) {
        return to_lower(trim(tag));
    }

    static std::vector<std::string> normalize_tags(const std::vector<std::string>& tags) {
        std::vector<std::string> out;
        for (const auto& t : tags) {
            std::string n = normalize_tag(t);
            if (n.empty()) continue;
            if (std::find(out.begin(), out.end(), n) == out.end()) out.push_back(std::move(n));
        }
        return out;
    }

    static std::string edge_key(const Relationship& r) {
        return id_key(r.from) + ":" + id_key(r.to) + ":" + relationship_kind_name(r.kind);
    }

    Status validate_locked(const Pattern& p) const {
        if (trim(p.title).empty()) return Status::validation("pattern title is empty");
        if (!std::isfinite(p.confidence) || p.confidence < 0.0f || p.confidence > 1.0f) {
            return Status::validation("pattern confidence must be within [0, 1]");
        }
        return metadata_schema_.validate(p.metadata);
    }

    // Read-modify-write of one pattern under the exclusive lock
    template<typename Fn>
    Status modify(PatternId id, bool respect_immutable, Fn&& fn) {
        std::unique_lock lock(mutex_);
        auto it = arena_.find(id);
        if (it == arena_.end()) return not_found(id);
        if (respect_immutable && it->second.immutable) {
            return Status::validation("pattern " + std::to_string(id) + " is immutable");
        }

        Pattern p = it->second;
        fn(p);
        Status s = store_.put(kg_tables::PATTERNS, id_key(id), pattern_to_json(p));
        if (!s) return fail_locked(s);
        it->second = std::move(p);
        return Status::ok();
    }

    std::optional<PatternId> find_by_title_locked(const std::string& key) const {
        for (const auto& [id, p] : arena_) {
            if (normalize_key(p.title) == key) return id;
        }
        return std::nullopt;
    }

    std::vector<Pattern> collect_locked(const std::vector<uint32_t>& ids) const {
        std::vector<Pattern> out;
        out.reserve(ids.size());
        for (uint32_t id : ids) {
            auto it = arena_.find(id);
            if (it != arena_.end()) out.push_back(it->second);
        }
        return out;
    }

    size_t relationship_count_locked() const {
        size_t n = 0;
        for (const auto& [from, edges] : out_edges_) n += edges.size();
        return n;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Arena maintenance (caller holds mutex_ exclusively)
    // ═══════════════════════════════════════════════════════════════════════

    void index_pattern_locked(const Pattern& p) {
        arena_[p.id] = p;
        index_.add(p.id, p.search_text());
        tags_.set(static_cast<uint32_t>(p.id), p.tags);
    }

    void unindex_pattern_locked(PatternId id) {
        arena_.erase(id);
        index_.remove(id);
        tags_.remove_all(static_cast<uint32_t>(id));
        out_edges_.erase(id);
        for (auto& [from, edges] : out_edges_) {
            edges.erase(std::remove_if(edges.begin(), edges.end(),
                [id](const Relationship& r) { return r.to == id; }), edges.end());
        }
    }

    void clear_locked() {
        arena_.clear();
        out_edges_.clear();
        index_.clear();
        tags_.clear();
    }

    Status reload_locked() {
        clear_locked();

        auto patterns = store_.scan(kg_tables::PATTERNS);
        if (!patterns.ok()) return patterns.status;
        for (const auto& rec : *patterns) {
            auto p = pattern_from_json(rec.body);
            if (!p.ok()) {
                log::warn("KnowledgeGraph", "Skipping pattern ", rec.key, ": ", p.status.message);
                continue;
            }
            index_pattern_locked(*p);
        }

        auto rels = store_.scan(kg_tables::RELATIONSHIPS);
        if (!rels.ok()) return rels.status;
        for (const auto& rec : *rels) {
            auto r = relationship_from_json(rec.body);
            if (!r.ok()) {
                log::warn("KnowledgeGraph", "Skipping relationship ", rec.key, ": ", r.status.message);
                continue;
            }
            if (!arena_.count(r->from) || !arena_.count(r->to)) continue;
            out_edges_[r->from].push_back(*r);
        }
        return Status::ok();
    }

    // Corruption at runtime: recover the file and rebuild the arena
    Status fail_locked(const Status& s) {
        if (s.code != ErrorCode::Corruption) return s;
        log::error("KnowledgeGraph", "Store corruption: ", s.message);
        OpenReport report;
        Status r = store_.recover(report);
        if (!r) {
            log::error("KnowledgeGraph", "Recovery failed: ", r.message);
            return s;
        }
        report_ = report;
        Status reloaded = reload_locked();
        if (!reloaded) log::error("KnowledgeGraph", "Reload after recovery failed: ", reloaded.message);
        return s;
    }

    // Pattern and every edge touching it
    static Status erase_pattern(Transaction& tx, PatternId id) {
        Status s = tx.erase(kg_tables::PATTERNS, id_key(id));
        if (!s) return s;
        auto out = tx.erase_where(kg_tables::RELATIONSHIPS, "from", id);
        if (!out.ok()) return out.status;
        auto in = tx.erase_where(kg_tables::RELATIONSHIPS, "to", id);
        if (!in.ok()) return in.status;
        return Status::ok();
    }

    // Assigns the entry its id
    static Status append_decay_log(Transaction& tx, DecayLogEntry& entry) {
        auto log_id = tx.next_id("decay");
        if (!log_id.ok()) return log_id.status;
        entry.id = *log_id;
        return tx.insert(kg_tables::DECAY_LOG, id_key(entry.id), decay_entry_to_json(entry));
    }

    static Status validate_criteria(const ForgetCriteria& c) {
        if (!c.max_confidence && !c.inactive_days) {
            return Status::validation("bulk deletion needs a confidence or age criterion");
        }
        if (c.max_confidence && !(*c.max_confidence >= 0.0f && *c.max_confidence <= 1.0f)) {
            return Status::validation("max confidence must be within [0, 1]");
        }
        if (c.inactive_days && *c.inactive_days < 0) {
            return Status::validation("inactive days must not be negative");
        }
        if (!(c.max_fraction >= 0.0f && c.max_fraction <= 1.0f)) {
            return Status::validation("max fraction must be within [0, 1]");
        }
        return Status::ok();
    }

    static std::string describe_criteria(const ForgetCriteria& c) {
        std::string reason = "manual:";
        if (c.max_confidence) reason += " confidence <= " + std::to_string(*c.max_confidence).substr(0, 4);
        if (c.max_confidence && c.inactive_days) reason += ",";
        if (c.inactive_days) reason += " unused >= " + std::to_string(*c.inactive_days) + " days";
        return reason;
    }

    ForgetReport plan_forget_locked(const ForgetCriteria& c) const {
        ForgetReport report;
        report.total_patterns = arena_.size();
        Timestamp ts = clock_->now();
        for (const auto& [id, p] : arena_) {
            if (c.max_confidence && p.confidence > *c.max_confidence) continue;
            if (c.inactive_days && days_between(p.last_accessed, ts) < *c.inactive_days) continue;
            if (p.pinned || p.immutable) {
                report.protected_ids.push_back(id);
            } else {
                report.deleted.push_back(id);
            }
        }
        return report;
    }

    Status decay_batch(const std::vector<PatternId>& ids, size_t begin, size_t end, DecayReport& report) {
        std::unique_lock lock(mutex_);
        Timestamp ts = clock_->now();
        DayNumber today = day_of(ts);

        std::vector<Pattern> updated;
        std::vector<PatternId> deleted;
        size_t evaluated = 0, skipped = 0;

        Status s = store_.transaction([&](Transaction& tx) {
            for (size_t i = begin; i < end; ++i) {
                auto it = arena_.find(ids[i]);
                if (it == arena_.end()) continue;
                const Pattern& p = it->second;
                evaluated++;

                if (p.pinned || p.immutable) { skipped++; continue; }
                if (p.last_decay_day >= 0 && today - p.last_decay_day < config_.evaluation_window_days) {
                    skipped++;
                    continue;
                }

                int64_t unused = days_between(p.last_accessed, ts);
                std::string reason = "unused " + std::to_string(unused) + " days";
                float next = p.confidence;
                bool remove = false;

                if (unused >= config_.decay_delete_days) {
                    remove = true;
                } else if (unused >= config_.decay_severe_days) {
                    next = std::max(0.0f, p.confidence - config_.decay_severe_penalty);
                } else if (unused >= config_.decay_threshold_days) {
                    next = std::max(0.0f, p.confidence - config_.decay_penalty);
                } else {
                    continue;
                }
                if (!remove && next < config_.deletion_floor) {
                    remove = true;
                    reason += ", confidence below " + std::to_string(config_.deletion_floor).substr(0, 4);
                }

                DecayLogEntry entry;
                entry.pattern_id = p.id;
                entry.title = p.title;
                entry.old_confidence = p.confidence;
                entry.new_confidence = remove ? 0.0f : next;
                entry.action = remove ? "deleted" : "decayed";
                entry.reason = reason;
                entry.timestamp = ts;
                Status w = append_decay_log(tx, entry);
                if (!w) return w;

                if (remove) {
                    w = erase_pattern(tx, p.id);
                    if (!w) return w;
                    deleted.push_back(p.id);
                } else {
                    Pattern copy = p;
                    copy.confidence = next;
                    copy.last_decay_day = today;
                    w = tx.put(kg_tables::PATTERNS, id_key(copy.id), pattern_to_json(copy));
                    if (!w) return w;
                    updated.push_back(std::move(copy));
                }
            }
            return Status::ok();
        });
        if (!s) return fail_locked(s);

        for (const auto& p : updated) arena_[p.id] = p;
        for (PatternId id : deleted) {
            log::debug("KnowledgeGraph", "Decay deleted pattern ", id);
            unindex_pattern_locked(id);
        }
        report.evaluated += evaluated;
        report.skipped += skipped;
        report.decayed_count += updated.size();
        report.deleted_count += deleted.size();
        return Status::ok();
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Query evaluation (caller holds mutex_ shared)
    // ═══════════════════════════════════════════════════════════════════════

    ScoreMap universe() const {
        ScoreMap all;
        for (const auto& [id, p] : arena_) all[id] = 0.0f;
        return all;
    }

    ScoreMap complement(const ScoreMap& excluded) const {
        ScoreMap out;
        for (const auto& [id, p] : arena_) {
            if (!excluded.count(id)) out[id] = 0.0f;
        }
        return out;
    }

    ScoreMap evaluate(const QueryNode& node) const {
        switch (node.type) {
            case QueryNode::Type::Term:
                return index_.term_scores(node.term);

            case QueryNode::Type::Prefix: {
                ScoreMap out;
                for (const auto& term : index_.expand_prefix(node.term)) {
                    for (const auto& [id, s] : index_.term_scores(term)) out[id] += s;
                }
                return out;
            }

            case QueryNode::Type::Phrase: {
                ScoreMap out = index_.term_scores(node.phrase.front());
                for (size_t i = 1; i < node.phrase.size() && !out.empty(); ++i) {
                    out = intersect(out, index_.term_scores(node.phrase[i]));
                }
                for (auto it = out.begin(); it != out.end();) {
                    if (index_.contains_phrase(it->first, node.phrase)) ++it;
                    else it = out.erase(it);
                }
                return out;
            }

            case QueryNode::Type::And: {
                if (node.children.empty()) return {};
                ScoreMap out = evaluate(node.children.front());
                for (size_t i = 1; i < node.children.size() && !out.empty(); ++i) {
                    out = intersect(out, evaluate(node.children[i]));
                }
                return out;
            }

            case QueryNode::Type::Or: {
                ScoreMap out;
                for (const auto& child : node.children) {
                    for (const auto& [id, s] : evaluate(child)) out[id] += s;
                }
                return out;
            }

            case QueryNode::Type::Not:
                return complement(evaluate(node.children.front()));

            case QueryNode::Type::Sequence: {
                ScoreMap positive;
                ScoreMap excluded;
                bool any_positive = false;
                for (const auto& child : node.children) {
                    if (child.type == QueryNode::Type::Not) {
                        for (const auto& [id, s] : evaluate(child.children.front())) excluded[id] = s;
                    } else {
                        any_positive = true;
                        for (const auto& [id, s] : evaluate(child)) positive[id] += s;
                    }
                }
                if (!any_positive) positive = universe();
                for (const auto& [id, s] : excluded) positive.erase(id);
                return positive;
            }
        }
        return {};
    }

    static ScoreMap intersect(const ScoreMap& a, const ScoreMap& b) {
        ScoreMap out;
        const ScoreMap& small = a.size() <= b.size() ? a : b;
        const ScoreMap& large = a.size() <= b.size() ? b : a;
        for (const auto& [id, s] : small) {
            auto it = large.find(id);
            if (it != large.end()) out[id] = s + it->second;
        }
        return out;
    }

    // Positive terms that exactly name a tag add tag_boost per term
    void apply_tag_boost(const QueryNode& root, ScoreMap& scores) const {
        std::vector<const QueryNode*> leaves;
        collect_positive_leaves(root, leaves);
        if (leaves.empty()) return;

        for (auto& [id, score] : scores) {
            uint32_t slot = static_cast<uint32_t>(id);
            for (const QueryNode* leaf : leaves) {
                bool hit = false;
                if (leaf->type == QueryNode::Type::Term) {
                    hit = tags_.has(slot, leaf->term);
                } else if (leaf->type == QueryNode::Type::Prefix) {
                    hit = tags_.has_prefix(slot, leaf->term);
                } else if (leaf->type == QueryNode::Type::Phrase) {
                    std::string joined;
                    for (const auto& t : leaf->phrase) joined += (joined.empty() ? "" : " ") + t;
                    hit = tags_.has(slot, joined);
                }
                if (hit) score += config_.tag_boost;
            }
        }
    }

    static void collect_positive_leaves(const QueryNode& node, std::vector<const QueryNode*>& out) {
        switch (node.type) {
            case QueryNode::Type::Term:
            case QueryNode::Type::Prefix:
            case QueryNode::Type::Phrase:
                out.push_back(&node);
                break;
            case QueryNode::Type::Not:
                break;
            default:
                for (const auto& child : node.children) collect_positive_leaves(child, out);
        }
    }

    KnowledgeGraphConfig config_;
    std::shared_ptr<Clock> clock_;
    RecordStore store_;
    OpenReport report_;

    mutable std::shared_mutex mutex_;
    std::map<PatternId, Pattern> arena_;
    std::map<PatternId, std::vector<Relationship>> out_edges_;
    BM25Index index_;
    TagIndex tags_;
    MetadataSchema metadata_schema_;
};

} // namespace cortex
