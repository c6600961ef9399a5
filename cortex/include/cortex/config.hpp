#pragma once
// Configuration: one nested struct per tier, loadable from JSON
//
// Missing keys keep their defaults, unknown keys are ignored. Malformed
// JSON or out-of-range values come back as Validation.

#include "status.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace cortex {

using json = nlohmann::json;

struct WorkingMemoryConfig {
    size_t max_conversations = 20;              // FIFO retention cap
    int64_t session_timeout_ms = 30 * MS_PER_MINUTE;
    size_t max_turn_chars = 64 * 1024;          // Longer turns are rejected
};

struct KnowledgeGraphConfig {
    size_t promotion_threshold = 3;             // Observations before a pattern is created
    float promoted_confidence = 0.6f;
    float reinforce_step = 0.05f;               // Confidence gained on re-promotion

    int64_t decay_threshold_days = 60;
    int64_t decay_severe_days = 90;
    int64_t decay_delete_days = 120;
    float decay_penalty = 0.10f;
    float decay_severe_penalty = 0.25f;
    float deletion_floor = 0.30f;
    int64_t evaluation_window_days = 1;         // A pattern is penalized at most once per window

    float tag_boost = 1.5f;                     // Added per query term matching a tag exactly
    float bm25_k1 = 1.5f;
    float bm25_b = 0.75f;

    bool strict_metadata = false;               // Reject metadata keys missing from the schema
};

struct ContextConfig {
    int64_t collection_interval_ms = MS_PER_HOUR;
    int64_t collection_window_days = 30;
    int64_t hotspot_window_days = 30;
    int64_t velocity_window_days = 14;

    float churn_low_threshold = 0.10f;          // At or below: stable
    float churn_high_threshold = 0.20f;         // At or above: unstable
    float churn_critical_threshold = 0.30f;     // Above: warning insight
    float velocity_min_delta = 0.30f;           // Relative change needed to leave "stable"
    size_t write_batch_size = 256;              // Snapshot or hotspot rows per transaction

    std::string repo_path = ".";
};

struct SchedulerConfig {
    int64_t interval_ms = MS_PER_HOUR;
    uint64_t event_threshold = 50;
    int64_t poll_interval_ms = 1000;
    size_t batch_size = 256;
    int64_t time_slice_ms = 50;
};

struct FacadeConfig {
    int64_t working_memory_budget_ms = 50;
    int64_t knowledge_graph_budget_ms = 150;
    int64_t context_budget_ms = 200;
    size_t default_conversations = 5;
    size_t default_patterns = 10;
};

struct CortexConfig {
    std::string base_dir;
    WorkingMemoryConfig working_memory;
    KnowledgeGraphConfig knowledge_graph;
    ContextConfig context;
    SchedulerConfig scheduler;
    FacadeConfig facade;

    CortexConfig() : base_dir(default_base_dir()) {}

    std::string working_memory_path() const { return base_dir + "/working_memory.db"; }
    std::string knowledge_graph_path() const { return base_dir + "/knowledge_graph.db"; }
    std::string context_path() const { return base_dir + "/context.db"; }

    static std::string default_base_dir() {
        const char* home = std::getenv("HOME");
        if (!home) home = ".";
        return std::string(home) + "/.cortex/brain";
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON mapping
// ═══════════════════════════════════════════════════════════════════════════

namespace detail {

template<typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->get<T>();
}

} // namespace detail

inline json to_json(const CortexConfig& c) {
    return json{
        {"base_dir", c.base_dir},
        {"working_memory", {
            {"max_conversations", c.working_memory.max_conversations},
            {"session_timeout_ms", c.working_memory.session_timeout_ms},
            {"max_turn_chars", c.working_memory.max_turn_chars},
        }},
        {"knowledge_graph", {
            {"promotion_threshold", c.knowledge_graph.promotion_threshold},
            {"promoted_confidence", c.knowledge_graph.promoted_confidence},
            {"reinforce_step", c.knowledge_graph.reinforce_step},
            {"decay_threshold_days", c.knowledge_graph.decay_threshold_days},
            {"decay_severe_days", c.knowledge_graph.decay_severe_days},
            {"decay_delete_days", c.knowledge_graph.decay_delete_days},
            {"decay_penalty", c.knowledge_graph.decay_penalty},
            {"decay_severe_penalty", c.knowledge_graph.decay_severe_penalty},
            {"deletion_floor", c.knowledge_graph.deletion_floor},
            {"evaluation_window_days", c.knowledge_graph.evaluation_window_days},
            {"tag_boost", c.knowledge_graph.tag_boost},
            {"bm25_k1", c.knowledge_graph.bm25_k1},
            {"bm25_b", c.knowledge_graph.bm25_b},
            {"strict_metadata", c.knowledge_graph.strict_metadata},
        }},
        {"context", {
            {"collection_interval_ms", c.context.collection_interval_ms},
            {"collection_window_days", c.context.collection_window_days},
            {"hotspot_window_days", c.context.hotspot_window_days},
            {"velocity_window_days", c.context.velocity_window_days},
            {"churn_low_threshold", c.context.churn_low_threshold},
            {"churn_high_threshold", c.context.churn_high_threshold},
            {"churn_critical_threshold", c.context.churn_critical_threshold},
            {"velocity_min_delta", c.context.velocity_min_delta},
            {"write_batch_size", c.context.write_batch_size},
            {"repo_path", c.context.repo_path},
        }},
        {"scheduler", {
            {"interval_ms", c.scheduler.interval_ms},
            {"event_threshold", c.scheduler.event_threshold},
            {"poll_interval_ms", c.scheduler.poll_interval_ms},
            {"batch_size", c.scheduler.batch_size},
            {"time_slice_ms", c.scheduler.time_slice_ms},
        }},
        {"facade", {
            {"working_memory_budget_ms", c.facade.working_memory_budget_ms},
            {"knowledge_graph_budget_ms", c.facade.knowledge_graph_budget_ms},
            {"context_budget_ms", c.facade.context_budget_ms},
            {"default_conversations", c.facade.default_conversations},
            {"default_patterns", c.facade.default_patterns},
        }},
    };
}

// Range checks shared by load_config and callers building configs by hand
inline Status validate_config(const CortexConfig& c) {
    if (c.base_dir.empty()) return Status::validation("base_dir is empty");
    if (c.working_memory.max_conversations == 0)
        return Status::validation("working_memory.max_conversations must be > 0");
    if (c.working_memory.session_timeout_ms <= 0)
        return Status::validation("working_memory.session_timeout_ms must be > 0");

    const auto& kg = c.knowledge_graph;
    if (kg.promotion_threshold == 0)
        return Status::validation("knowledge_graph.promotion_threshold must be > 0");
    if (!(kg.decay_threshold_days < kg.decay_severe_days && kg.decay_severe_days < kg.decay_delete_days))
        return Status::validation("knowledge_graph decay thresholds must be increasing");
    for (float v : {kg.promoted_confidence, kg.reinforce_step, kg.decay_penalty,
                    kg.decay_severe_penalty, kg.deletion_floor}) {
        if (v < 0.0f || v > 1.0f)
            return Status::validation("knowledge_graph confidence values must be within [0, 1]");
    }
    if (kg.evaluation_window_days < 1)
        return Status::validation("knowledge_graph.evaluation_window_days must be >= 1");

    const auto& ctx = c.context;
    if (ctx.collection_interval_ms < 0)
        return Status::validation("context.collection_interval_ms must be >= 0");
    if (ctx.collection_window_days < 1 || ctx.hotspot_window_days < 1 || ctx.velocity_window_days < 2)
        return Status::validation("context windows are too small");
    if (!(ctx.churn_low_threshold < ctx.churn_high_threshold))
        return Status::validation("context.churn_low_threshold must be below churn_high_threshold");
    if (ctx.velocity_min_delta < 0.0f)
        return Status::validation("context.velocity_min_delta must be >= 0");
    if (ctx.write_batch_size == 0)
        return Status::validation("context.write_batch_size must be > 0");

    if (c.scheduler.interval_ms <= 0 || c.scheduler.poll_interval_ms <= 0)
        return Status::validation("scheduler intervals must be > 0");
    if (c.scheduler.batch_size == 0)
        return Status::validation("scheduler.batch_size must be > 0");

    if (c.facade.working_memory_budget_ms <= 0 || c.facade.knowledge_graph_budget_ms <= 0 ||
        c.facade.context_budget_ms <= 0)
        return Status::validation("facade budgets must be > 0");
    return Status::ok();
}

inline Result<CortexConfig> config_from_json(const json& j) {
    CortexConfig c;
    if (!j.is_object()) return Status::validation("config root must be an object");

    try {
        detail::read_key(j, "base_dir", c.base_dir);

        if (auto it = j.find("working_memory"); it != j.end() && it->is_object()) {
            detail::read_key(*it, "max_conversations", c.working_memory.max_conversations);
            detail::read_key(*it, "session_timeout_ms", c.working_memory.session_timeout_ms);
            detail::read_key(*it, "max_turn_chars", c.working_memory.max_turn_chars);
        }
        if (auto it = j.find("knowledge_graph"); it != j.end() && it->is_object()) {
            auto& kg = c.knowledge_graph;
            detail::read_key(*it, "promotion_threshold", kg.promotion_threshold);
            detail::read_key(*it, "promoted_confidence", kg.promoted_confidence);
            detail::read_key(*it, "reinforce_step", kg.reinforce_step);
            detail::read_key(*it, "decay_threshold_days", kg.decay_threshold_days);
            detail::read_key(*it, "decay_severe_days", kg.decay_severe_days);
            detail::read_key(*it, "decay_delete_days", kg.decay_delete_days);
            detail::read_key(*it, "decay_penalty", kg.decay_penalty);
            detail::read_key(*it, "decay_severe_penalty", kg.decay_severe_penalty);
            detail::read_key(*it, "deletion_floor", kg.deletion_floor);
            detail::read_key(*it, "evaluation_window_days", kg.evaluation_window_days);
            detail::read_key(*it, "tag_boost", kg.tag_boost);
            detail::read_key(*it, "bm25_k1", kg.bm25_k1);
            detail::read_key(*it, "bm25_b", kg.bm25_b);
            detail::read_key(*it, "strict_metadata", kg.strict_metadata);
        }
        if (auto it = j.find("context"); it != j.end() && it->is_object()) {
            auto& ctx = c.context;
            detail::read_key(*it, "collection_interval_ms", ctx.collection_interval_ms);
            detail::read_key(*it, "collection_window_days", ctx.collection_window_days);
            detail::read_key(*it, "hotspot_window_days", ctx.hotspot_window_days);
            detail::read_key(*it, "velocity_window_days", ctx.velocity_window_days);
            detail::read_key(*it, "churn_low_threshold", ctx.churn_low_threshold);
            detail::read_key(*it, "churn_high_threshold", ctx.churn_high_threshold);
            detail::read_key(*it, "churn_critical_threshold", ctx.churn_critical_threshold);
            detail::read_key(*it, "velocity_min_delta", ctx.velocity_min_delta);
            detail::read_key(*it, "write_batch_size", ctx.write_batch_size);
            detail::read_key(*it, "repo_path", ctx.repo_path);
        }
        if (auto it = j.find("scheduler"); it != j.end() && it->is_object()) {
            detail::read_key(*it, "interval_ms", c.scheduler.interval_ms);
            detail::read_key(*it, "event_threshold", c.scheduler.event_threshold);
            detail::read_key(*it, "poll_interval_ms", c.scheduler.poll_interval_ms);
            detail::read_key(*it, "batch_size", c.scheduler.batch_size);
            detail::read_key(*it, "time_slice_ms", c.scheduler.time_slice_ms);
        }
        if (auto it = j.find("facade"); it != j.end() && it->is_object()) {
            detail::read_key(*it, "working_memory_budget_ms", c.facade.working_memory_budget_ms);
            detail::read_key(*it, "knowledge_graph_budget_ms", c.facade.knowledge_graph_budget_ms);
            detail::read_key(*it, "context_budget_ms", c.facade.context_budget_ms);
            detail::read_key(*it, "default_conversations", c.facade.default_conversations);
            detail::read_key(*it, "default_patterns", c.facade.default_patterns);
        }
    } catch (const json::exception& e) {
        return Status::validation(std::string("config: ") + e.what());
    }

    Status valid = validate_config(c);
    if (!valid) return valid;
    return c;
}

inline Result<CortexConfig> load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) return Status::io("cannot open config file " + path);

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        return Status::validation("config " + path + ": " + e.what());
    }
    return config_from_json(j);
}

inline Status save_config(const CortexConfig& c, const std::string& path) {
    std::ofstream out(path);
    if (!out) return Status::io("cannot write config file " + path);
    out << to_json(c).dump(2) << "\n";
    return out ? Status::ok() : Status::io("short write to " + path);
}

} // namespace cortex
