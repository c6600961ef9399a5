#pragma once
// Context intelligence records: daily snapshots, hotspots, trends, insights

#include "../status.hpp"
#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace cortex {

using json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Version control input
// ═══════════════════════════════════════════════════════════════════════════

struct FileChange {
    std::string path;
    int64_t added = 0;      // 0 for binary files
    int64_t removed = 0;
};

struct CommitRecord {
    std::string hash;
    std::string author;
    DayNumber day = 0;
    std::vector<FileChange> files;
};

// ═══════════════════════════════════════════════════════════════════════════
// Snapshots
// ═══════════════════════════════════════════════════════════════════════════

// One per completed day and scope. Never rewritten once stored.
struct MetricSnapshot {
    DayNumber day = 0;
    std::string scope;
    int64_t commits = 0;
    int64_t lines_added = 0;
    int64_t lines_removed = 0;
    int64_t files_changed = 0;      // Distinct paths
    int64_t contributors = 0;       // Distinct authors
    Timestamp collected_at = 0;

    int64_t net_growth() const { return lines_added - lines_removed; }
};

struct CollectionResult {
    std::string scope;
    std::vector<MetricSnapshot> snapshots;  // Every snapshot in the window
    size_t written = 0;                     // Snapshots new in this run
    size_t batches = 0;                     // Snapshot write transactions
    Timestamp collected_at = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Hotspots
// ═══════════════════════════════════════════════════════════════════════════

enum class Stability { Stable, Moderate, Unstable };

inline const char* stability_name(Stability s) {
    switch (s) {
        case Stability::Stable:   return "stable";
        case Stability::Moderate: return "moderate";
        case Stability::Unstable: return "unstable";
    }
    return "stable";
}

inline bool parse_stability(const std::string& s, Stability& out) {
    std::string k = to_lower(s);
    if (k == "stable") { out = Stability::Stable; return true; }
    if (k == "moderate") { out = Stability::Moderate; return true; }
    if (k == "unstable") { out = Stability::Unstable; return true; }
    return false;
}

// Monotonic in churn: stable <= moderate <= unstable
inline Stability classify_churn(float churn_rate, float low, float high) {
    if (churn_rate >= high) return Stability::Unstable;
    if (churn_rate <= low) return Stability::Stable;
    return Stability::Moderate;
}

struct FileHotspot {
    std::string path;
    DayNumber period_start = 0;
    DayNumber period_end = 0;
    int64_t total_commits = 0;      // Commits in the period
    int64_t file_edits = 0;         // Commits touching this file
    int64_t lines_changed = 0;
    float churn_rate = 0.0f;        // file_edits / total_commits
    Stability stability = Stability::Stable;
    DayNumber last_modified = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// Velocity
// ═══════════════════════════════════════════════════════════════════════════

enum class Trend { Increasing, Decreasing, Stable };

inline const char* trend_name(Trend t) {
    switch (t) {
        case Trend::Increasing: return "increasing";
        case Trend::Decreasing: return "decreasing";
        case Trend::Stable:     return "stable";
    }
    return "stable";
}

struct VelocityTrend {
    int64_t window_days = 0;
    int64_t previous = 0;           // Commits in the older half
    int64_t current = 0;            // Commits in the newer half
    float change = 0.0f;            // (current - previous) / previous
    Trend trend = Trend::Stable;
};

// ═══════════════════════════════════════════════════════════════════════════
// Insights
// ═══════════════════════════════════════════════════════════════════════════

enum class InsightKind { VelocityDrop, VelocityIncrease, FileHotspot };
enum class Severity { Info, Warning, Error, Critical };

inline const char* insight_kind_name(InsightKind k) {
    switch (k) {
        case InsightKind::VelocityDrop:     return "velocity_drop";
        case InsightKind::VelocityIncrease: return "velocity_increase";
        case InsightKind::FileHotspot:      return "file_hotspot";
    }
    return "file_hotspot";
}

inline const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::Error:    return "error";
        case Severity::Critical: return "critical";
    }
    return "info";
}

struct Insight {
    int64_t id = 0;
    InsightKind kind = InsightKind::FileHotspot;
    Severity severity = Severity::Info;
    std::string title;
    std::string message;
    std::string recommendation;
    std::string related;            // File path or metric name
    json data = json::object();     // Metrics the insight was derived from
    Timestamp created_at = 0;
};

struct ContextSummary {
    int64_t window_days = 0;
    int64_t total_commits = 0;
    int64_t lines_added = 0;
    int64_t lines_removed = 0;
    int64_t files_changed = 0;
    VelocityTrend velocity;
    std::vector<FileHotspot> unstable_files;
    std::vector<Insight> insights;
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON mapping
// ═══════════════════════════════════════════════════════════════════════════

inline json snapshot_to_json(const MetricSnapshot& s) {
    return json{
        {"day", s.day},
        {"date", format_day(s.day)},
        {"scope", s.scope},
        {"commits", s.commits},
        {"lines_added", s.lines_added},
        {"lines_removed", s.lines_removed},
        {"files_changed", s.files_changed},
        {"contributors", s.contributors},
        {"collected_at", s.collected_at},
    };
}

inline Result<MetricSnapshot> snapshot_from_json(const json& j) {
    try {
        MetricSnapshot s;
        s.day = j.at("day").get<int64_t>();
        s.scope = j.value("scope", "");
        s.commits = j.value("commits", int64_t{0});
        s.lines_added = j.value("lines_added", int64_t{0});
        s.lines_removed = j.value("lines_removed", int64_t{0});
        s.files_changed = j.value("files_changed", int64_t{0});
        s.contributors = j.value("contributors", int64_t{0});
        s.collected_at = j.value("collected_at", int64_t{0});
        return s;
    } catch (const json::exception& e) {
        return Status::corruption(std::string("snapshot record: ") + e.what());
    }
}

inline json collection_to_json(const CollectionResult& r) {
    json snaps = json::array();
    for (const auto& s : r.snapshots) snaps.push_back(snapshot_to_json(s));
    return json{
        {"scope", r.scope},
        {"snapshots", snaps},
        {"written", r.written},
        {"batches", r.batches},
        {"collected_at", r.collected_at},
    };
}

inline Result<CollectionResult> collection_from_json(const json& j) {
    try {
        CollectionResult r;
        r.scope = j.value("scope", "");
        r.written = j.value("written", size_t{0});
        r.batches = j.value("batches", size_t{0});
        r.collected_at = j.value("collected_at", int64_t{0});
        for (const auto& item : j.value("snapshots", json::array())) {
            auto s = snapshot_from_json(item);
            if (!s.ok()) return s.status;
            r.snapshots.push_back(*s);
        }
        return r;
    } catch (const json::exception& e) {
        return Status::corruption(std::string("collection record: ") + e.what());
    }
}

inline json hotspot_to_json(const FileHotspot& h) {
    return json{
        {"path", h.path},
        {"period_start", h.period_start},
        {"period_end", h.period_end},
        {"total_commits", h.total_commits},
        {"file_edits", h.file_edits},
        {"lines_changed", h.lines_changed},
        {"churn_rate", h.churn_rate},
        {"stability", stability_name(h.stability)},
        {"last_modified", h.last_modified},
    };
}

inline Result<FileHotspot> hotspot_from_json(const json& j) {
    try {
        FileHotspot h;
        h.path = j.at("path").get<std::string>();
        h.period_start = j.value("period_start", int64_t{0});
        h.period_end = j.value("period_end", int64_t{0});
        h.total_commits = j.value("total_commits", int64_t{0});
        h.file_edits = j.value("file_edits", int64_t{0});
        h.lines_changed = j.value("lines_changed", int64_t{0});
        h.churn_rate = j.value("churn_rate", 0.0f);
        if (!parse_stability(j.value("stability", "stable"), h.stability)) {
            return Status::corruption("unknown stability '" + j.value("stability", "") + "'");
        }
        h.last_modified = j.value("last_modified", int64_t{0});
        return h;
    } catch (const json::exception& e) {
        return Status::corruption(std::string("hotspot record: ") + e.what());
    }
}

inline json velocity_to_json(const VelocityTrend& v) {
    return json{
        {"window_days", v.window_days},
        {"previous", v.previous},
        {"current", v.current},
        {"change", v.change},
        {"trend", trend_name(v.trend)},
    };
}

inline json insight_to_json(const Insight& i) {
    return json{
        {"id", i.id},
        {"kind", insight_kind_name(i.kind)},
        {"severity", severity_name(i.severity)},
        {"title", i.title},
        {"message", i.message},
        {"recommendation", i.recommendation},
        {"related", i.related},
        {"data", i.data},
        {"created_at", i.created_at},
    };
}

inline Result<Insight> insight_from_json(const json& j) {
    try {
        Insight i;
        i.id = j.value("id", int64_t{0});
        std::string kind = j.value("kind", "");
        if (kind == "velocity_drop") i.kind = InsightKind::VelocityDrop;
        else if (kind == "velocity_increase") i.kind = InsightKind::VelocityIncrease;
        else if (kind == "file_hotspot") i.kind = InsightKind::FileHotspot;
        else return Status::corruption("unknown insight kind '" + kind + "'");

        std::string sev = j.value("severity", "info");
        if (sev == "info") i.severity = Severity::Info;
        else if (sev == "warning") i.severity = Severity::Warning;
        else if (sev == "error") i.severity = Severity::Error;
        else if (sev == "critical") i.severity = Severity::Critical;
        else return Status::corruption("unknown severity '" + sev + "'");

        i.title = j.value("title", "");
        i.message = j.value("message", "");
        i.recommendation = j.value("recommendation", "");
        i.related = j.value("related", "");
        i.data = j.value("data", json::object());
        i.created_at = j.value("created_at", int64_t{0});
        return i;
    } catch (const json::exception& e) {
        return Status::corruption(std::string("insight record: ") + e.what());
    }
}

inline json summary_to_json(const ContextSummary& s) {
    json unstable = json::array();
    for (const auto& h : s.unstable_files) unstable.push_back(hotspot_to_json(h));
    json insights = json::array();
    for (const auto& i : s.insights) insights.push_back(insight_to_json(i));
    return json{
        {"window_days", s.window_days},
        {"total_commits", s.total_commits},
        {"lines_added", s.lines_added},
        {"lines_removed", s.lines_removed},
        {"net_growth", s.lines_added - s.lines_removed},
        {"files_changed", s.files_changed},
        {"velocity", velocity_to_json(s.velocity)},
        {"unstable_files", unstable},
        {"insights", insights},
    };
}

} // namespace cortex
