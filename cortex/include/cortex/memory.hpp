#pragma once
// Memory: one entry point over the three tiers
//
//   record_interaction  write a conversation (Tier A)
//   query_context       fan out to A, B and C, each under its own budget
//   run_maintenance     decay (B), collection and analysis (C), backups
//
// Each tier owns its own store file and recovers on its own; Memory holds
// nothing but tier handles. Reads in query_context run on detached workers
// that keep the tiers alive through shared_ptr, so a tier that misses its
// budget is dropped from the bundle instead of holding up the caller. A tier
// has at most one read in flight; while it is still busy later queries
// exclude it without starting another worker, and close() waits for it.

#include "config.hpp"
#include "context/context_intelligence.hpp"
#include "knowledge/knowledge_graph.hpp"
#include "log.hpp"
#include "query_router.hpp"
#include "scheduler.hpp"
#include "status.hpp"
#include "working_memory/working_memory.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace cortex {

struct TierReports {
    OpenReport working_memory;
    OpenReport knowledge_graph;
    OpenReport context;
};

struct Interaction {
    std::string session_id;             // Generated when empty
    std::vector<Turn> turns;
    std::vector<std::string> files;
    std::vector<EntityMention> entities;
    std::string intent;
};

struct ContextRequest {
    std::string query;
    size_t max_conversations = 0;       // 0 = facade default
    size_t max_patterns = 0;            // 0 = facade default
    float min_confidence = 0.0f;
};

struct ContextBundle {
    std::vector<Conversation> recent_conversations;
    std::vector<PatternMatch> matched_patterns;
    std::vector<Insight> insights;
    RoutingDecision route;
    std::vector<std::string> excluded_tiers;    // Timed out or failed
    bool partial = false;
};

struct MaintenanceReport {
    DecayReport decay;
    std::optional<CollectionResult> collection;
    bool collection_throttled = false;
    size_t hotspots = 0;
    size_t insights = 0;
    size_t backups = 0;
    std::vector<std::string> errors;
};

struct MemoryStats {
    size_t conversations = 0;
    size_t entities = 0;
    size_t patterns = 0;
    size_t relationships = 0;
    size_t tags = 0;
    float average_confidence = 0.0f;
    size_t snapshots = 0;
    size_t insights = 0;
};

// Called with the tier name just before a worker reads from it
using TierReadObserver = std::function<void(const std::string& tier)>;

// Tier reads still running on worker threads, at most one per tier
class ReadTracker {
public:
    bool begin(const std::string& tier) {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_.insert(tier).second;
    }

    void end(const std::string& tier) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            outstanding_.erase(tier);
        }
        idle_.notify_all();
    }

    size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_.size();
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_.wait(lock, [this]() { return outstanding_.empty(); });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_;
    std::set<std::string> outstanding_;
};

namespace tier_names {
constexpr const char* WORKING_MEMORY = "working_memory";
constexpr const char* KNOWLEDGE_GRAPH = "knowledge_graph";
constexpr const char* CONTEXT = "context";
} // namespace tier_names

class Memory {
public:
    explicit Memory(CortexConfig config = {},
                    std::shared_ptr<Clock> clock = system_clock(),
                    std::shared_ptr<CommitSource> source = nullptr)
        : config_(std::move(config))
        , clock_(std::move(clock))
        , working_memory_(std::make_shared<WorkingMemory>(config_.working_memory_path(),
                                                          config_.working_memory, clock_))
        , knowledge_graph_(std::make_shared<KnowledgeGraph>(config_.knowledge_graph_path(),
                                                            config_.knowledge_graph, clock_))
        , context_(std::make_shared<ContextIntelligence>(config_.context_path(), config_.context,
                                                         clock_, std::move(source)))
    {}

    ~Memory() {
        detach_scheduler();
        close();
    }

    Memory(const Memory&) = delete;
    Memory& operator=(const Memory&) = delete;

    // Open all three tiers. A failing tier does not stop the others; the
    // first failure is returned.
    Status open() {
        Status s = validate_config(config_);
        if (!s) return s;

        Status first;
        auto track = [&first](const char* tier, const Status& st) {
            if (st) return;
            log::error("Memory", "Could not open ", tier, ": ", st.to_string());
            if (first) first = st;
        };
        track(tier_names::WORKING_MEMORY, working_memory_->open());
        track(tier_names::KNOWLEDGE_GRAPH, knowledge_graph_->open());
        track(tier_names::CONTEXT, context_->open());

        if (first) log::debug("Memory", "Opened tiers under ", config_.base_dir);
        return first;
    }

    // Waits for tier reads still running on worker threads
    void close() {
        reads_->wait_idle();
        working_memory_->close();
        knowledge_graph_->close();
        context_->close();
    }

    TierReports reports() const {
        return {working_memory_->open_report(), knowledge_graph_->open_report(), context_->open_report()};
    }

    const CortexConfig& config() const { return config_; }

    static constexpr const char* MAINTENANCE_JOB = "maintenance";

    // Tier reads from earlier queries that are still running
    size_t outstanding_reads() const { return reads_->count(); }

    std::shared_ptr<WorkingMemory> working_memory() const { return working_memory_; }
    std::shared_ptr<KnowledgeGraph> knowledge_graph() const { return knowledge_graph_; }
    std::shared_ptr<ContextIntelligence> context() const { return context_; }

    // Instrumentation hook for tier reads (tests use it to stall a tier)
    void on_tier_read(TierReadObserver observer) {
        std::lock_guard<std::mutex> lock(observer_mutex_);
        observer_ = std::move(observer);
    }

    // Register run_maintenance() as a scheduler job; foreground writes then
    // count towards its event threshold. The scheduler may outlive this
    // object or die first: the job is removed on destruction, and events
    // stop once the scheduler is gone.
    Status attach_scheduler(const std::shared_ptr<Scheduler>& scheduler) {
        if (!scheduler) return Status::validation("scheduler is null");
        detach_scheduler();

        JobSpec job;
        job.name = MAINTENANCE_JOB;
        job.interval_ms = config_.scheduler.interval_ms;
        job.event_threshold = config_.scheduler.event_threshold;
        job.run = [this]() {
            MaintenanceReport report = run_maintenance();
            if (!report.errors.empty()) {
                return Status::io(std::to_string(report.errors.size()) + " maintenance step(s) failed: " +
                                  report.errors.front());
            }
            return Status::ok();
        };
        Status s = scheduler->add_job(std::move(job));
        if (s) {
            std::lock_guard<std::mutex> lock(scheduler_mutex_);
            scheduler_ = scheduler;
        }
        return s;
    }

    // Remove the maintenance job, waiting for a run in progress
    void detach_scheduler() {
        std::shared_ptr<Scheduler> scheduler;
        {
            std::lock_guard<std::mutex> lock(scheduler_mutex_);
            scheduler = scheduler_.lock();
            scheduler_.reset();
        }
        if (scheduler) scheduler->remove_job(MAINTENANCE_JOB);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Writes
    // ═══════════════════════════════════════════════════════════════════════

    // Persist a conversation. Every turn is validated before anything is
    // written, so a bad turn leaves no partial conversation behind.
    Result<ConversationId> record_interaction(const Interaction& interaction) {
        if (interaction.turns.empty()) return Status::validation("interaction has no turns");
        for (const auto& t : interaction.turns) {
            Status v = WorkingMemory::validate_turn(t, config_.working_memory);
            if (!v) return v;
        }
        for (const auto& f : interaction.files) {
            if (trim(f).empty()) return Status::validation("empty file path");
        }
        for (const auto& e : interaction.entities) {
            if (trim(e.name).empty()) return Status::validation("empty entity name");
        }

        std::string session = interaction.session_id.empty()
            ? "session-" + std::to_string(clock_->now())
            : interaction.session_id;

        auto id = working_memory_->start_conversation(session);
        if (!id.ok()) return id.status;

        for (size_t i = 0; i < interaction.turns.size(); ++i) {
            static const std::vector<std::string> no_files;
            static const std::vector<EntityMention> no_entities;
            Status s = working_memory_->append_turn(*id, interaction.turns[i],
                                                    i == 0 ? interaction.files : no_files,
                                                    i == 0 ? interaction.entities : no_entities);
            if (!s) return s;
        }
        if (!interaction.intent.empty()) {
            Status s = working_memory_->set_intent(*id, interaction.intent);
            if (!s) return s;
        }
        // Nothing appends to it after this call, so it must not stay active
        // and block eviction for the session timeout
        Status closed = working_memory_->close_conversation(*id);
        if (!closed) return closed;

        note_event();
        return id;
    }

    Result<PatternId> add_pattern(Pattern pattern) {
        auto id = knowledge_graph_->add_pattern(std::move(pattern));
        if (id.ok()) note_event();
        return id;
    }

    Status link_patterns(PatternId from, PatternId to, RelationshipKind kind, float strength = 1.0f) {
        Status s = knowledge_graph_->link_patterns(from, to, kind, strength);
        if (s) note_event();
        return s;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Reads
    // ═══════════════════════════════════════════════════════════════════════

    // Bounded-time read across all tiers. A tier that fails or misses
    // min(deadline, its budget) is listed in excluded_tiers.
    ContextBundle query_context(const ContextRequest& request,
                                std::chrono::milliseconds deadline = std::chrono::milliseconds(500)) {
        using SteadyClock = std::chrono::steady_clock;
        auto started = SteadyClock::now();
        auto overall = started + deadline;

        ContextBundle bundle;
        bundle.route = router_.route(request.query);

        size_t n_conv = request.max_conversations ? request.max_conversations
                                                  : config_.facade.default_conversations;
        size_t n_pat = request.max_patterns ? request.max_patterns : config_.facade.default_patterns;

        TierReadObserver observer;
        {
            std::lock_guard<std::mutex> lock(observer_mutex_);
            observer = observer_;
        }

        auto conversations = launch<std::vector<Conversation>>(tier_names::WORKING_MEMORY, observer,
            [wm = working_memory_, route = bundle.route, n_conv]() {
                return read_conversations(*wm, route, n_conv);
            });
        auto patterns = launch<std::vector<PatternMatch>>(tier_names::KNOWLEDGE_GRAPH, observer,
            [kg = knowledge_graph_, route = bundle.route, n_pat, min = request.min_confidence]() {
                return read_patterns(*kg, route, n_pat, min);
            });
        auto insights = launch<std::vector<Insight>>(tier_names::CONTEXT, observer,
            [ctx = context_, route = bundle.route]() {
                return read_insights(*ctx, route);
            });

        auto budget = [&](int64_t ms) {
            return std::min(overall, started + std::chrono::milliseconds(ms));
        };
        collect(tier_names::WORKING_MEMORY, conversations, budget(config_.facade.working_memory_budget_ms),
                bundle, bundle.recent_conversations);
        collect(tier_names::KNOWLEDGE_GRAPH, patterns, budget(config_.facade.knowledge_graph_budget_ms),
                bundle, bundle.matched_patterns);
        collect(tier_names::CONTEXT, insights, budget(config_.facade.context_budget_ms),
                bundle, bundle.insights);

        bundle.partial = !bundle.excluded_tiers.empty();
        log::debug("Memory", "query_context '", request.query, "' via ",
                   QueryRouter::intent_name(bundle.route.intent), ": ",
                   bundle.recent_conversations.size(), " conversations, ",
                   bundle.matched_patterns.size(), " patterns, ", bundle.insights.size(), " insights",
                   bundle.partial ? " (partial)" : "");
        return bundle;
    }

    MemoryStats stats() const {
        MemoryStats s;
        s.conversations = working_memory_->count();
        s.entities = working_memory_->entity_count();
        s.patterns = knowledge_graph_->pattern_count();
        s.relationships = knowledge_graph_->relationship_count();
        s.tags = knowledge_graph_->tag_count();
        s.average_confidence = knowledge_graph_->average_confidence();
        s.snapshots = context_->snapshot_count();
        auto insights = context_->get_insights();
        s.insights = insights.ok() ? insights->size() : 0;
        return s;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Maintenance
    // ═══════════════════════════════════════════════════════════════════════

    // Decay, collection, analysis and backups. Failures are logged and
    // reported; later steps still run.
    MaintenanceReport run_maintenance() {
        MaintenanceReport report;
        auto fail = [&report](const char* step, const Status& s) {
            log::warn("Memory", "Maintenance step ", step, " failed: ", s.to_string());
            report.errors.push_back(std::string(step) + ": " + s.to_string());
        };

        DecayOptions options;
        options.batch_size = config_.scheduler.batch_size;
        options.time_slice_ms = config_.scheduler.time_slice_ms;
        auto decay = knowledge_graph_->apply_confidence_decay(options);
        if (decay.ok()) report.decay = *decay;
        else fail("decay", decay.status);

        auto collection = context_->collect_git_metrics();
        if (collection.value) report.collection = *collection.value;
        if (collection.status.code == ErrorCode::Throttled) {
            report.collection_throttled = true;
        } else if (!collection.ok()) {
            fail("collect", collection.status);
        }

        if (collection.ok()) {
            auto hotspots = context_->analyze_file_hotspots();
            if (hotspots.ok()) report.hotspots = hotspots->size();
            else fail("hotspots", hotspots.status);

            auto insights = context_->generate_insights();
            if (insights.ok()) report.insights = insights->size();
            else fail("insights", insights.status);
        }

        for (const auto& [name, st] : backup_all()) {
            if (st) report.backups++;
            else fail(name.c_str(), st);
        }

        log::info("Memory", "Maintenance: ", report.decay.decayed_count, " decayed, ",
                  report.decay.deleted_count, " deleted, ",
                  report.collection_throttled ? std::string("collection throttled")
                                              : std::to_string(report.collection ? report.collection->written : 0) +
                                                    " snapshots",
                  ", ", report.insights, " insights, ", report.backups, " backups");
        return report;
    }

    Status backup() {
        for (const auto& [name, st] : backup_all()) {
            if (!st) return Status(st.code, name + ": " + st.message);
        }
        return Status::ok();
    }

private:
    template<typename T>
    using TierFuture = std::future<Result<T>>;

    // An invalid future means the tier's previous read is still running
    template<typename T, typename Fn>
    TierFuture<T> launch(const char* tier, const TierReadObserver& observer, Fn fn) {
        if (!reads_->begin(tier)) return {};

        std::packaged_task<Result<T>()> task([tier, observer, fn, reads = reads_]() -> Result<T> {
            struct Done {
                const std::shared_ptr<ReadTracker>& reads;
                const char* tier;
                ~Done() { reads->end(tier); }
            } done{reads, tier};
            try {
                if (observer) observer(tier);
                return fn();
            } catch (const std::exception& e) {
                return Status::io(std::string(tier) + " read threw: " + e.what());
            }
        });
        TierFuture<T> future = task.get_future();
        std::thread(std::move(task)).detach();
        return future;
    }

    template<typename T>
    static void collect(const char* tier, TierFuture<T>& future,
                        std::chrono::steady_clock::time_point until,
                        ContextBundle& bundle, T& out) {
        if (!future.valid()) {
            log::warn("Memory", tier, " still busy with an earlier read, excluded from context");
            bundle.excluded_tiers.push_back(tier);
            return;
        }
        if (future.wait_until(until) != std::future_status::ready) {
            log::warn("Memory", tier, " missed its read budget, excluded from context");
            bundle.excluded_tiers.push_back(tier);
            return;
        }
        Result<T> r = future.get();
        if (!r.ok()) {
            log::warn("Memory", tier, " read failed, excluded from context: ", r.status.to_string());
            bundle.excluded_tiers.push_back(tier);
            return;
        }
        out = std::move(*r);
    }

    static Result<std::vector<Conversation>> read_conversations(const WorkingMemory& wm,
                                                                const RoutingDecision& route, size_t limit) {
        switch (route.intent) {
            case QueryIntent::FileContext: {
                std::vector<Conversation> out;
                for (const auto& f : route.files) {
                    auto convs = wm.find_conversations_with_entity(EntityKind::File, f);
                    if (!convs.ok()) return convs.status;
                    for (auto& c : *convs) {
                        bool seen = std::any_of(out.begin(), out.end(),
                            [&c](const Conversation& o) { return o.id == c.id; });
                        if (!seen) out.push_back(std::move(c));
                    }
                }
                std::sort(out.begin(), out.end(), [](const Conversation& a, const Conversation& b) {
                    return a.last_activity != b.last_activity ? a.last_activity > b.last_activity : a.id > b.id;
                });
                if (out.size() > limit) out.resize(limit);
                return out;
            }
            case QueryIntent::Keyword: {
                if (route.text.empty()) return wm.get_recent(limit);
                auto matches = wm.search(route.text, limit);
                if (!matches.ok()) return matches.status;
                if (matches->empty()) return wm.get_recent(limit);
                std::vector<Conversation> out;
                for (auto& m : *matches) out.push_back(std::move(m.conversation));
                return out;
            }
            case QueryIntent::TagFilter:
                return wm.get_recent(limit);
        }
        return wm.get_recent(limit);
    }

    static Result<std::vector<PatternMatch>> read_patterns(const KnowledgeGraph& kg, const RoutingDecision& route,
                                                           size_t limit, float min_confidence) {
        if (route.intent == QueryIntent::TagFilter) {
            std::vector<PatternMatch> out;
            for (auto& p : kg.find_by_tags(route.tags, true)) {
                if (p.confidence < min_confidence) continue;
                float score = static_cast<float>(route.tags.size());
                out.push_back({std::move(p), score});
            }
            std::sort(out.begin(), out.end(), [](const PatternMatch& a, const PatternMatch& b) {
                if (a.pattern.confidence != b.pattern.confidence) return a.pattern.confidence > b.pattern.confidence;
                return a.pattern.id < b.pattern.id;
            });
            if (out.size() > limit) out.resize(limit);
            return out;
        }

        std::string query = route.text;
        for (const auto& t : route.tags) query += " " + t;
        auto matches = kg.search_patterns(query, min_confidence, limit);
        if (matches.status.code == ErrorCode::Validation) {
            // Free text that is not a valid query: search its words instead
            std::string words;
            for (const auto& t : tokenize(query)) words += t + " ";
            return kg.search_patterns(words, min_confidence, limit);
        }
        return matches;
    }

    static Result<std::vector<Insight>> read_insights(const ContextIntelligence& ctx, const RoutingDecision& route) {
        auto insights = ctx.get_insights();
        if (!insights.ok() || route.files.empty()) return insights;

        // Insights about the requested files first
        std::stable_partition(insights->begin(), insights->end(), [&route](const Insight& i) {
            return std::find(route.files.begin(), route.files.end(), i.related) != route.files.end();
        });
        return insights;
    }

    std::vector<std::pair<std::string, Status>> backup_all() {
        return {
            {tier_names::WORKING_MEMORY, working_memory_->backup()},
            {tier_names::KNOWLEDGE_GRAPH, knowledge_graph_->backup()},
            {tier_names::CONTEXT, context_->backup()},
        };
    }

    void note_event() {
        std::shared_ptr<Scheduler> scheduler;
        {
            std::lock_guard<std::mutex> lock(scheduler_mutex_);
            scheduler = scheduler_.lock();
        }
        if (scheduler) scheduler->record_event();
    }

    CortexConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<WorkingMemory> working_memory_;
    std::shared_ptr<KnowledgeGraph> knowledge_graph_;
    std::shared_ptr<ContextIntelligence> context_;
    QueryRouter router_;
    std::shared_ptr<ReadTracker> reads_ = std::make_shared<ReadTracker>();

    std::mutex scheduler_mutex_;
    std::weak_ptr<Scheduler> scheduler_;

    std::mutex observer_mutex_;
    TierReadObserver observer_;
};

} // namespace cortex
