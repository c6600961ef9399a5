#pragma once
// ContextIntelligence: derived metrics from version-control history (Tier C)
//
//   collect_git_metrics    one immutable snapshot per completed day, throttled
//   analyze_file_hotspots  churn = commits touching file / commits in window
//   analyze_velocity       commit sums of the two window halves
//   generate_insights      rule-based, replaces the previous set
//
// Snapshots are keyed by (scope, day) and only inserted, so a collection
// interrupted half way can simply be rerun. Snapshot and hotspot rows are
// written write_batch_size at a time, one transaction per batch, and the
// tier mutex is released between batches.

#include "../config.hpp"
#include "../log.hpp"
#include "../store/record_store.hpp"
#include "../version.hpp"
#include "commit_source.hpp"
#include "types.hpp"
#include <algorithm>
#include <cstdio>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace cortex {

namespace ctx_tables {
constexpr const char* SNAPSHOTS = "snapshots";
constexpr const char* HOTSPOTS = "hotspots";
constexpr const char* INSIGHTS = "insights";
constexpr const char* COLLECTIONS = "collections";
} // namespace ctx_tables

inline StoreSchema context_schema() {
    StoreSchema schema;
    schema.version = CORTEX_CONTEXT_SCHEMA;
    schema.tables = {
        {ctx_tables::SNAPSHOTS, {"scope", "day"}, {{"scope", "day"}}},
        {ctx_tables::HOTSPOTS, {"period_end", "stability"}, {}},
        {ctx_tables::INSIGHTS, {"kind"}, {}},
        {ctx_tables::COLLECTIONS, {}, {}},
    };
    return schema;
}

// Remembers when each scope was last collected and what that run returned.
// A scope may be collected again once interval_ms has passed.
class CollectionThrottle {
public:
    CollectionThrottle(int64_t interval_ms, std::shared_ptr<Clock> clock)
        : interval_ms_(interval_ms), clock_(std::move(clock)) {}

    bool allow(const std::string& scope) const {
        return remaining_ms(scope) == 0;
    }

    // Time until the next collection of scope is allowed
    int64_t remaining_ms(const std::string& scope) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_.find(scope);
        if (it == last_.end()) return 0;
        int64_t elapsed = clock_->now() - it->second.collected_at;
        return elapsed >= interval_ms_ ? 0 : interval_ms_ - elapsed;
    }

    void record(const CollectionResult& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_[result.scope] = result;
    }

    std::optional<CollectionResult> last(const std::string& scope) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_.find(scope);
        if (it == last_.end()) return std::nullopt;
        return it->second;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        last_.clear();
    }

    int64_t interval_ms() const { return interval_ms_; }

private:
    int64_t interval_ms_;
    std::shared_ptr<Clock> clock_;
    mutable std::mutex mutex_;
    std::map<std::string, CollectionResult> last_;
};

class ContextIntelligence {
public:
    ContextIntelligence(std::string path, ContextConfig config = {},
                        std::shared_ptr<Clock> clock = system_clock(),
                        std::shared_ptr<CommitSource> source = nullptr)
        : config_(config)
        , clock_(std::move(clock))
        , store_(std::move(path), context_schema(), "Context")
        , source_(source ? std::move(source) : std::make_shared<GitCliSource>(config.repo_path))
        , throttle_(config.collection_interval_ms, clock_)
    {}

    Status open() {
        std::lock_guard<std::mutex> lock(mutex_);
        Status s = store_.open(report_);
        if (!s) return s;
        if (report_.recovered()) {
            log::warn("Context", "Recovered store: ", report_.message);
        }
        return restore_throttle_locked();
    }

    void close() { store_.close(); }

    const OpenReport& open_report() const { return report_; }
    const ContextConfig& config() const { return config_; }

    Status backup() { return store_.backup(); }

    void set_source(std::shared_ptr<CommitSource> source) {
        std::lock_guard<std::mutex> lock(mutex_);
        source_ = std::move(source);
    }

    std::string scope() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return source_->scope();
    }

    const CollectionThrottle& throttle() const { return throttle_; }

    // ═══════════════════════════════════════════════════════════════════════
    // Collection
    // ═══════════════════════════════════════════════════════════════════════

    // Write snapshots for the completed days of the window. Within the
    // throttle interval nothing is collected and the previous result comes
    // back with a Throttled status.
    Result<CollectionResult> collect_git_metrics(int64_t window_days = 0) {
        if (window_days == 0) window_days = config_.collection_window_days;
        if (window_days < 1) return Status::validation("collection window must be at least one day");

        std::unique_lock<std::mutex> lock(mutex_);
        std::string scope = source_->scope();

        if (auto prior = throttle_.last(scope); prior && !throttle_.allow(scope)) {
            int64_t wait = throttle_.remaining_ms(scope);
            log::info("Context", "Collection for ", scope, " throttled, next in ", wait / MS_PER_SECOND, "s");
            return Result<CollectionResult>(
                Status::throttled("collected " + std::to_string((clock_->now() - prior->collected_at) / MS_PER_MINUTE) +
                                  " min ago, next allowed in " + std::to_string(wait / MS_PER_SECOND) + "s"),
                *prior);
        }

        Timestamp ts = clock_->now();
        DayNumber today = day_of(ts);
        DayNumber first = today - window_days;

        auto commits = source_->commits_since(first);
        if (!commits.ok()) {
            log::warn("Context", "Commit source ", scope, " failed: ", commits.status.message);
            return commits.status;
        }

        std::map<DayNumber, MetricSnapshot> days;
        std::map<DayNumber, std::set<std::string>> day_files;
        std::map<DayNumber, std::set<std::string>> day_authors;
        for (DayNumber d = first; d < today; ++d) {
            MetricSnapshot& s = days[d];
            s.day = d;
            s.scope = scope;
            s.collected_at = ts;
        }
        for (const auto& c : *commits) {
            auto it = days.find(c.day);
            if (it == days.end()) continue;    // Today or outside the window
            it->second.commits++;
            day_authors[c.day].insert(c.author);
            for (const auto& f : c.files) {
                it->second.lines_added += f.added;
                it->second.lines_removed += f.removed;
                day_files[c.day].insert(f.path);
            }
        }

        std::vector<MetricSnapshot> pending;
        pending.reserve(days.size());
        for (auto& [day, snap] : days) {
            snap.files_changed = static_cast<int64_t>(day_files[day].size());
            snap.contributors = static_cast<int64_t>(day_authors[day].size());
            pending.push_back(snap);
        }

        CollectionResult result;
        result.scope = scope;
        result.collected_at = ts;

        const size_t batch = config_.write_batch_size;
        for (size_t begin = 0; begin < pending.size(); begin += batch) {
            if (begin > 0) yield(lock);
            size_t end = std::min(pending.size(), begin + batch);
            size_t written = 0;
            Status s = store_.transaction([&](Transaction& tx) {
                for (size_t i = begin; i < end; ++i) {
                    std::string key = snapshot_key(scope, pending[i].day);
                    if (tx.exists(ctx_tables::SNAPSHOTS, key)) continue;
                    Status ins = tx.insert(ctx_tables::SNAPSHOTS, key, snapshot_to_json(pending[i]));
                    if (!ins) return ins;
                    written++;
                }
                return Status::ok();
            });
            if (!s) return fail(s);
            result.written += written;
            result.batches++;
        }

        Status s = store_.transaction([&](Transaction& tx) {
            auto stored = tx.find(ctx_tables::SNAPSHOTS, "scope", scope);
            if (!stored.ok()) return stored.status;
            for (const auto& rec : *stored) {
                auto snap = snapshot_from_json(rec.body);
                if (!snap.ok()) return snap.status;
                if (snap->day >= first && snap->day < today) result.snapshots.push_back(*snap);
            }
            std::sort(result.snapshots.begin(), result.snapshots.end(),
                      [](const MetricSnapshot& a, const MetricSnapshot& b) { return a.day < b.day; });

            return tx.put(ctx_tables::COLLECTIONS, scope, collection_to_json(result));
        });
        if (!s) return fail(s);

        throttle_.record(result);
        log::info("Context", "Collected ", scope, ": ", result.written, " new snapshots in ",
                  result.batches, " batches, ", commits->size(), " commits in ", window_days, " days");
        return result;
    }

    // Snapshots of the current scope from the last `days` days, oldest first
    Result<std::vector<MetricSnapshot>> get_metrics(int64_t days = 30) const {
        std::string scope = this->scope();
        auto recs = store_.find(ctx_tables::SNAPSHOTS, "scope", scope);
        if (!recs.ok()) return recs.status;

        DayNumber first = day_of(clock_->now()) - days;
        std::vector<MetricSnapshot> out;
        for (const auto& rec : *recs) {
            auto snap = snapshot_from_json(rec.body);
            if (!snap.ok()) return snap.status;
            if (snap->day >= first) out.push_back(*snap);
        }
        std::sort(out.begin(), out.end(),
                  [](const MetricSnapshot& a, const MetricSnapshot& b) { return a.day < b.day; });
        return out;
    }

    std::optional<CollectionResult> last_collection() const {
        return throttle_.last(scope());
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Analysis
    // ═══════════════════════════════════════════════════════════════════════

    // Classify every file touched in the window and store the result as the
    // hotspot set for this period. Highest churn first.
    Result<std::vector<FileHotspot>> analyze_file_hotspots(int64_t window_days = 0) {
        if (window_days == 0) window_days = config_.hotspot_window_days;
        if (window_days < 1) return Status::validation("hotspot window must be at least one day");

        std::unique_lock<std::mutex> lock(mutex_);
        DayNumber today = day_of(clock_->now());
        DayNumber start = today - window_days;

        auto commits = source_->commits_since(start);
        if (!commits.ok()) {
            log::warn("Context", "Commit source ", source_->scope(), " failed: ", commits.status.message);
            return commits.status;
        }

        int64_t total = 0;
        std::map<std::string, FileHotspot> by_path;
        for (const auto& c : *commits) {
            if (c.day < start) continue;
            total++;
            std::set<std::string> seen;
            for (const auto& f : c.files) {
                FileHotspot& h = by_path[f.path];
                h.path = f.path;
                h.lines_changed += f.added + f.removed;
                h.last_modified = std::max(h.last_modified, c.day);
                if (seen.insert(f.path).second) h.file_edits++;
            }
        }

        std::vector<FileHotspot> hotspots;
        for (auto& [path, h] : by_path) {
            h.period_start = start;
            h.period_end = today;
            h.total_commits = total;
            h.churn_rate = total ? static_cast<float>(h.file_edits) / total : 0.0f;
            h.stability = classify_churn(h.churn_rate, config_.churn_low_threshold,
                                         config_.churn_high_threshold);
            hotspots.push_back(h);
        }
        sort_hotspots(hotspots);

        // New rows first, then everything from earlier analyses goes
        const size_t batch = config_.write_batch_size;
        std::set<std::string> keys;
        for (size_t begin = 0; begin < hotspots.size(); begin += batch) {
            if (begin > 0) yield(lock);
            size_t end = std::min(hotspots.size(), begin + batch);
            Status s = store_.transaction([&](Transaction& tx) {
                for (size_t i = begin; i < end; ++i) {
                    std::string key = hotspot_key(hotspots[i]);
                    Status put = tx.put(ctx_tables::HOTSPOTS, key, hotspot_to_json(hotspots[i]));
                    if (!put) return put;
                    keys.insert(key);
                }
                return Status::ok();
            });
            if (!s) return fail(s);
        }

        Status s = store_.transaction([&](Transaction& tx) {
            auto stored = tx.scan(ctx_tables::HOTSPOTS);
            if (!stored.ok()) return stored.status;
            for (const auto& rec : *stored) {
                if (keys.count(rec.key)) continue;
                Status erased = tx.erase(ctx_tables::HOTSPOTS, rec.key);
                if (!erased) return erased;
            }
            return Status::ok();
        });
        if (!s) return fail(s);

        log::debug("Context", "Hotspots: ", hotspots.size(), " files over ", total, " commits");
        return hotspots;
    }

    // Stored hotspots from the latest analysis, highest churn first
    Result<std::vector<FileHotspot>> get_hotspots(size_t limit = 20,
                                                  std::optional<Stability> stability = std::nullopt) const {
        auto recs = stability ? store_.find(ctx_tables::HOTSPOTS, "stability", stability_name(*stability))
                              : store_.scan(ctx_tables::HOTSPOTS);
        if (!recs.ok()) return recs.status;

        std::vector<FileHotspot> out;
        for (const auto& rec : *recs) {
            auto h = hotspot_from_json(rec.body);
            if (!h.ok()) return h.status;
            out.push_back(std::move(*h));
        }
        sort_hotspots(out);
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    // Commits in the newer half of the window against the older half, from
    // stored snapshots. Relative change within min_delta counts as stable.
    Result<VelocityTrend> analyze_velocity(int64_t window_days = 0) const {
        if (window_days == 0) window_days = config_.velocity_window_days;
        if (window_days < 2) return Status::validation("velocity window must be at least two days");

        auto snaps = get_metrics(window_days);
        if (!snaps.ok()) return snaps.status;

        DayNumber today = day_of(clock_->now());
        DayNumber first = today - window_days;
        DayNumber split = today - window_days / 2;

        VelocityTrend v;
        v.window_days = window_days;
        for (const auto& s : *snaps) {
            if (s.day < first || s.day >= today) continue;
            if (s.day < split) v.previous += s.commits;
            else v.current += s.commits;
        }

        if (v.previous == 0) {
            v.change = v.current > 0 ? 1.0f : 0.0f;
            v.trend = v.current > 0 ? Trend::Increasing : Trend::Stable;
        } else {
            v.change = static_cast<float>(v.current - v.previous) / v.previous;
            if (v.change < -config_.velocity_min_delta) v.trend = Trend::Decreasing;
            else if (v.change > config_.velocity_min_delta) v.trend = Trend::Increasing;
            else v.trend = Trend::Stable;
        }
        return v;
    }

    // Rules:
    //   velocity decreasing         warning (error when the drop is twice min_delta)
    //   velocity increasing         info
    //   churn above critical        warning per file
    //   unstable, not critical      info per file
    Result<std::vector<Insight>> generate_insights() {
        auto velocity = analyze_velocity();
        if (!velocity.ok()) return velocity.status;
        auto hotspots = get_hotspots(std::numeric_limits<size_t>::max(), Stability::Unstable);
        if (!hotspots.ok()) return hotspots.status;

        Timestamp ts = clock_->now();
        std::vector<Insight> insights;

        const VelocityTrend& v = *velocity;
        if (v.trend == Trend::Decreasing) {
            Insight i;
            i.kind = InsightKind::VelocityDrop;
            i.severity = v.change <= -2.0f * config_.velocity_min_delta ? Severity::Error : Severity::Warning;
            i.title = "Commit velocity decreased " + percent(-v.change);
            i.message = "Commits dropped from " + std::to_string(v.previous) + " to " +
                        std::to_string(v.current) + " between the two halves of the last " +
                        std::to_string(v.window_days) + " days.";
            i.recommendation = "Break work into smaller, more frequent commits.";
            i.related = "velocity";
            i.data = velocity_to_json(v);
            insights.push_back(std::move(i));
        } else if (v.trend == Trend::Increasing && v.previous > 0) {
            Insight i;
            i.kind = InsightKind::VelocityIncrease;
            i.severity = Severity::Info;
            i.title = "Commit velocity increased " + percent(v.change);
            i.message = "Commits rose from " + std::to_string(v.previous) + " to " +
                        std::to_string(v.current) + " over the last " + std::to_string(v.window_days) + " days.";
            i.related = "velocity";
            i.data = velocity_to_json(v);
            insights.push_back(std::move(i));
        }

        for (const auto& h : *hotspots) {
            Insight i;
            i.kind = InsightKind::FileHotspot;
            bool critical = h.churn_rate > config_.churn_critical_threshold;
            i.severity = critical ? Severity::Warning : Severity::Info;
            i.title = (critical ? "High churn detected: " : "Unstable file: ") + basename_of(h.path);
            i.message = h.path + " was modified in " + std::to_string(h.file_edits) + " of " +
                        std::to_string(h.total_commits) + " commits (" + percent(h.churn_rate) + " churn).";
            if (critical) i.recommendation = "Consider splitting the file into smaller, focused modules.";
            i.related = h.path;
            i.data = json{{"churn_rate", h.churn_rate}, {"file_edits", h.file_edits},
                          {"total_commits", h.total_commits}};
            insights.push_back(std::move(i));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        Status s = store_.transaction([&](Transaction& tx) {
            auto cleared = tx.clear(ctx_tables::INSIGHTS);
            if (!cleared.ok()) return cleared.status;
            for (auto& i : insights) {
                auto id = tx.next_id("insight");
                if (!id.ok()) return id.status;
                i.id = *id;
                i.created_at = ts;
                Status put = tx.insert(ctx_tables::INSIGHTS, id_key(i.id), insight_to_json(i));
                if (!put) return put;
            }
            return Status::ok();
        });
        if (!s) return fail(s);

        if (!insights.empty()) log::info("Context", "Generated ", insights.size(), " insights");
        return insights;
    }

    // Insights from the latest generate_insights(), most severe first
    Result<std::vector<Insight>> get_insights() const {
        auto recs = store_.scan(ctx_tables::INSIGHTS);
        if (!recs.ok()) return recs.status;

        std::vector<Insight> out;
        for (const auto& rec : *recs) {
            auto i = insight_from_json(rec.body);
            if (!i.ok()) return i.status;
            out.push_back(std::move(*i));
        }
        std::stable_sort(out.begin(), out.end(), [](const Insight& a, const Insight& b) {
            return a.severity > b.severity;
        });
        return out;
    }

    Result<ContextSummary> context_summary(int64_t window_days = 30) const {
        ContextSummary summary;
        summary.window_days = window_days;

        auto snaps = get_metrics(window_days);
        if (!snaps.ok()) return snaps.status;
        for (const auto& s : *snaps) {
            summary.total_commits += s.commits;
            summary.lines_added += s.lines_added;
            summary.lines_removed += s.lines_removed;
            summary.files_changed += s.files_changed;
        }

        auto velocity = analyze_velocity();
        if (!velocity.ok()) return velocity.status;
        summary.velocity = *velocity;

        auto unstable = get_hotspots(5, Stability::Unstable);
        if (!unstable.ok()) return unstable.status;
        summary.unstable_files = std::move(*unstable);

        auto insights = get_insights();
        if (!insights.ok()) return insights.status;
        summary.insights = std::move(*insights);
        return summary;
    }

    size_t snapshot_count() const {
        auto n = store_.count(ctx_tables::SNAPSHOTS);
        return n.ok() ? *n : 0;
    }

private:
    static std::string snapshot_key(const std::string& scope, DayNumber day) {
        return scope + "|" + id_key(day);
    }

    static std::string percent(float ratio) {
        char buf[32];
        snprintf(buf, sizeof(buf), "%.1f%%", ratio * 100.0f);
        return buf;
    }

    static void sort_hotspots(std::vector<FileHotspot>& hotspots) {
        std::sort(hotspots.begin(), hotspots.end(), [](const FileHotspot& a, const FileHotspot& b) {
            if (a.churn_rate != b.churn_rate) return a.churn_rate > b.churn_rate;
            return a.path < b.path;
        });
    }

    Status restore_throttle_locked() {
        throttle_.reset();
        auto recs = store_.scan(ctx_tables::COLLECTIONS);
        if (!recs.ok()) return recs.status;
        for (const auto& rec : *recs) {
            auto r = collection_from_json(rec.body);
            if (!r.ok()) {
                log::warn("Context", "Dropping unreadable collection state for ", rec.key);
                continue;
            }
            throttle_.record(*r);
        }
        return Status::ok();
    }

    // Corruption at runtime: recover the file, the throttle starts over
    static std::string hotspot_key(const FileHotspot& h) {
        return id_key(h.period_end) + "|" + h.path;
    }

    // Lets readers of scope() and set_source() in between two write batches
    static void yield(std::unique_lock<std::mutex>& lock) {
        lock.unlock();
        std::this_thread::yield();
        lock.lock();
    }

    Status fail(const Status& s) {
        if (s.code != ErrorCode::Corruption) return s;
        log::error("Context", "Store corruption: ", s.message);
        OpenReport report;
        Status r = store_.recover(report);
        if (!r) {
            log::error("Context", "Recovery failed: ", r.message);
            return s;
        }
        report_ = report;
        Status restored = restore_throttle_locked();
        if (!restored) log::error("Context", "Throttle state lost: ", restored.message);
        return s;
    }

    ContextConfig config_;
    std::shared_ptr<Clock> clock_;
    RecordStore store_;
    OpenReport report_;
    std::shared_ptr<CommitSource> source_;
    CollectionThrottle throttle_;
    mutable std::mutex mutex_;
};

} // namespace cortex
