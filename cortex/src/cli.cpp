// cortexd: command-line interface for the cortex memory tiers
//
// Usage: cortexd <command> [options]
//
// Commands:
//   stats      Show tier statistics
//   context    Bounded-time context bundle for a request
//   search     Search patterns
//   recent     Most recent conversations
//   insights   Current insights
//   hotspots   File hotspots from the last analysis
//   maintain   Run one maintenance pass
//   export     Write patterns as JSON
//   import     Read patterns from JSON
//   forget     Bulk delete patterns by confidence or age
//   daemon     Run scheduled maintenance in the background
//   help       Show this help

#include <cortex/cortex.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <thread>
#include <chrono>
#include <atomic>
#include <initializer_list>
#include <fstream>
#include <filesystem>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

using namespace cortex;

// Detach from the terminal (fork, setsid, fork) and point the standard
// streams at the log file. Only the grandchild returns.
static Status detach_process(const std::string& log_path) {
    auto fork_and_leave = [](const char* stage) -> Status {
        pid_t pid = fork();
        if (pid < 0) return Status::io(std::string(stage) + " fork: " + strerror(errno));
        if (pid > 0) _exit(0);
        return Status::ok();
    };

    Status s = fork_and_leave("first");
    if (!s) return s;
    if (setsid() < 0) return Status::io(std::string("setsid: ") + strerror(errno));
    s = fork_and_leave("second");
    if (!s) return s;

    umask(022);
    auto redirect = [](const char* path, int flags, std::initializer_list<int> targets) {
        int fd = open(path, flags, 0644);
        if (fd < 0) return false;
        for (int target : targets) dup2(fd, target);
        close(fd);
        return true;
    };
    redirect("/dev/null", O_RDONLY, {STDIN_FILENO});
    const char* out = log_path.empty() ? "/dev/null" : log_path.c_str();
    if (!redirect(out, O_WRONLY | O_CREAT | O_APPEND, {STDOUT_FILENO, STDERR_FILENO})) {
        return Status::io("cannot open daemon log " + std::string(out));
    }
    return Status::ok();
}

void print_usage(const char* prog) {
    std::string name = std::filesystem::path(prog).filename().string();
    std::cerr << "cortexd " << CORTEX_VERSION << " - Tiered memory administration\n\n"
              << "Usage: " << name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  stats              Show tier statistics\n"
              << "  context <request>  Context bundle for a request (#tags, file paths, text)\n"
              << "  search <query>     Search patterns (AND, OR, NOT, \"phrase\", prefix*)\n"
              << "  recent             Most recent conversations\n"
              << "  insights           Current insights\n"
              << "  hotspots           File hotspots from the last analysis\n"
              << "  maintain           Run one maintenance pass (decay, metrics, insights, backups)\n"
              << "  export [file]      Write patterns as JSON (stdout by default)\n"
              << "  import <file>      Read patterns from a JSON export\n"
              << "  forget             Delete patterns by --confidence and/or --days\n"
              << "  daemon             Run scheduled maintenance\n"
              << "  help               Show this help\n\n"
              << "Options:\n"
              << "  --dir PATH         Storage directory (default: ~/.cortex/brain)\n"
              << "  --config PATH      Config file (default: <dir>/config.json if present)\n"
              << "  --repo PATH        Repository analyzed by the context tier\n"
              << "  --limit N          Result limit (default: 10)\n"
              << "  --deadline MS      Deadline for context (default: 500)\n"
              << "  --interval SECS    Maintenance interval for daemon\n"
              << "  --confidence X     forget: confidence at or below X\n"
              << "  --days N           forget: unused for at least N days\n"
              << "  --dry-run          forget: list matches without deleting\n"
              << "  -f, --foreground   Keep the daemon attached to the terminal\n"
              << "  --log PATH         Log file for daemon output\n"
              << "  --json             Output as JSON\n"
              << "  --verbose          Enable verbose debug logging\n"
              << "  -v, --version      Show version\n";
}

static bool file_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

static void print_status_error(const char* what, const Status& s) {
    std::cerr << "Error: " << what << ": " << s.to_string() << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

json stats_to_json(Memory& memory) {
    MemoryStats s = memory.stats();
    TierReports r = memory.reports();
    return {
        {"version", CORTEX_VERSION},
        {"working_memory", {
            {"conversations", s.conversations},
            {"entities", s.entities},
            {"store", outcome_name(r.working_memory.outcome)},
        }},
        {"knowledge_graph", {
            {"patterns", s.patterns},
            {"relationships", s.relationships},
            {"tags", s.tags},
            {"average_confidence", s.average_confidence},
            {"store", outcome_name(r.knowledge_graph.outcome)},
        }},
        {"context", {
            {"snapshots", s.snapshots},
            {"insights", s.insights},
            {"store", outcome_name(r.context.outcome)},
        }},
    };
}

int cmd_stats(Memory& memory, bool json_output) {
    if (json_output) {
        std::cout << stats_to_json(memory).dump() << "\n";
        return 0;
    }

    MemoryStats s = memory.stats();
    std::cout << "Cortex Statistics\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "Working memory:\n";
    std::cout << "  Conversations: " << s.conversations << "\n";
    std::cout << "  Entities:      " << s.entities << "\n";
    std::cout << "\nKnowledge graph:\n";
    std::cout << "  Patterns:      " << s.patterns << "\n";
    std::cout << "  Relationships: " << s.relationships << "\n";
    std::cout << "  Tags:          " << s.tags << "\n";
    std::cout << "  Avg confidence:" << " " << s.average_confidence << "\n";
    std::cout << "\nContext:\n";
    std::cout << "  Snapshots:     " << s.snapshots << "\n";
    std::cout << "  Insights:      " << s.insights << "\n";
    return 0;
}

int cmd_context(Memory& memory, const std::string& request, int limit, int deadline_ms, bool json_output) {
    ContextRequest req;
    req.query = request;
    req.max_conversations = static_cast<size_t>(limit);
    req.max_patterns = static_cast<size_t>(limit);

    ContextBundle bundle = memory.query_context(req, std::chrono::milliseconds(deadline_ms));

    if (json_output) {
        json j;
        j["intent"] = QueryRouter::intent_name(bundle.route.intent);
        j["conversations"] = json::array();
        for (const auto& c : bundle.recent_conversations) j["conversations"].push_back(conversation_to_json(c));
        j["patterns"] = json::array();
        for (const auto& m : bundle.matched_patterns) {
            json p = pattern_to_json(m.pattern);
            p["score"] = m.score;
            j["patterns"].push_back(p);
        }
        j["insights"] = json::array();
        for (const auto& i : bundle.insights) j["insights"].push_back(insight_to_json(i));
        j["excluded_tiers"] = bundle.excluded_tiers;
        j["partial"] = bundle.partial;
        std::cout << j.dump() << "\n";
        return 0;
    }

    std::cout << "Context for: " << request << " ("
              << QueryRouter::intent_name(bundle.route.intent) << ")\n";
    std::cout << "═══════════════════════════════\n";
    std::cout << "Conversations (" << bundle.recent_conversations.size() << "):\n";
    for (const auto& c : bundle.recent_conversations) {
        std::cout << "  #" << c.id << " " << c.session_id;
        if (!c.intent.empty()) std::cout << " [" << c.intent << "]";
        std::cout << " (" << c.turns.size() << " turns)\n";
    }
    std::cout << "Patterns (" << bundle.matched_patterns.size() << "):\n";
    for (const auto& m : bundle.matched_patterns) {
        std::cout << "  #" << m.pattern.id << " " << m.pattern.title
                  << " (confidence " << m.pattern.confidence << ")\n";
    }
    std::cout << "Insights (" << bundle.insights.size() << "):\n";
    for (const auto& i : bundle.insights) {
        std::cout << "  [" << severity_name(i.severity) << "] " << i.title << "\n";
    }
    if (bundle.partial) {
        std::cout << "Partial result, excluded:";
        for (const auto& t : bundle.excluded_tiers) std::cout << " " << t;
        std::cout << "\n";
    }
    return 0;
}

int cmd_search(Memory& memory, const std::string& query, int limit, bool json_output) {
    auto matches = memory.knowledge_graph()->search_patterns(query, 0.0f, static_cast<size_t>(limit));
    if (!matches.ok()) {
        print_status_error("search", matches.status);
        return 1;
    }

    if (json_output) {
        json arr = json::array();
        for (const auto& m : *matches) {
            json p = pattern_to_json(m.pattern);
            p["score"] = m.score;
            arr.push_back(p);
        }
        std::cout << json{{"query", query}, {"results", arr}}.dump() << "\n";
        return 0;
    }

    if (matches->empty()) {
        std::cout << "No patterns found for: " << query << "\n";
        return 0;
    }
    std::cout << "Results for: " << query << "\n";
    std::cout << "═══════════════════════════════\n";
    for (size_t i = 0; i < matches->size(); ++i) {
        const auto& m = (*matches)[i];
        std::cout << "\n[" << (i + 1) << "] " << m.pattern.title << " (score: " << m.score
                  << ", confidence: " << m.pattern.confidence << ")\n";
        std::string body = m.pattern.body;
        if (body.length() > 200) body = body.substr(0, 200) + "...";
        if (!body.empty()) std::cout << body << "\n";
    }
    return 0;
}

int cmd_recent(Memory& memory, int limit, bool json_output) {
    auto recent = memory.working_memory()->get_recent(static_cast<size_t>(limit));
    if (!recent.ok()) {
        print_status_error("recent", recent.status);
        return 1;
    }

    if (json_output) {
        json arr = json::array();
        for (const auto& c : *recent) arr.push_back(conversation_to_json(c));
        std::cout << arr.dump() << "\n";
        return 0;
    }

    if (recent->empty()) {
        std::cout << "No conversations.\n";
        return 0;
    }
    for (const auto& c : *recent) {
        std::cout << "#" << c.id << " " << c.session_id << " " << c.turns.size() << " turns";
        if (!c.intent.empty()) std::cout << " [" << c.intent << "]";
        if (c.pinned) std::cout << " (pinned)";
        std::cout << "\n";
    }
    return 0;
}

int cmd_insights(Memory& memory, bool json_output) {
    auto insights = memory.context()->get_insights();
    if (!insights.ok()) {
        print_status_error("insights", insights.status);
        return 1;
    }

    if (json_output) {
        json arr = json::array();
        for (const auto& i : *insights) arr.push_back(insight_to_json(i));
        std::cout << arr.dump() << "\n";
        return 0;
    }

    if (insights->empty()) {
        std::cout << "No insights. Run 'maintain' to analyze the repository.\n";
        return 0;
    }
    for (const auto& i : *insights) {
        std::cout << "[" << severity_name(i.severity) << "] " << i.title << "\n";
        std::cout << "  " << i.message << "\n";
        if (!i.recommendation.empty()) std::cout << "  -> " << i.recommendation << "\n";
    }
    return 0;
}

int cmd_hotspots(Memory& memory, int limit, bool json_output) {
    auto hotspots = memory.context()->get_hotspots(static_cast<size_t>(limit));
    if (!hotspots.ok()) {
        print_status_error("hotspots", hotspots.status);
        return 1;
    }

    if (json_output) {
        json arr = json::array();
        for (const auto& h : *hotspots) arr.push_back(hotspot_to_json(h));
        std::cout << arr.dump() << "\n";
        return 0;
    }

    for (const auto& h : *hotspots) {
        std::cout << h.path << "  churn=" << h.churn_rate << " edits=" << h.file_edits
                  << " (" << stability_name(h.stability) << ")\n";
    }
    return 0;
}

int cmd_maintain(Memory& memory, bool json_output) {
    MaintenanceReport report = memory.run_maintenance();

    if (json_output) {
        json j = {
            {"decayed", report.decay.decayed_count},
            {"deleted", report.decay.deleted_count},
            {"decay_complete", report.decay.complete},
            {"collection_throttled", report.collection_throttled},
            {"hotspots", report.hotspots},
            {"insights", report.insights},
            {"backups", report.backups},
            {"errors", report.errors},
        };
        if (report.collection) j["collection"] = collection_to_json(*report.collection);
        std::cout << j.dump() << "\n";
    } else {
        std::cout << "Maintenance complete:\n";
        std::cout << "  Decayed:   " << report.decay.decayed_count << "\n";
        std::cout << "  Deleted:   " << report.decay.deleted_count << "\n";
        if (report.collection_throttled) {
            std::cout << "  Metrics:   throttled (retry in "
                      << memory.context()->throttle().remaining_ms(memory.context()->scope()) / 1000 << "s)\n";
        } else if (report.collection) {
            std::cout << "  Metrics:   " << report.collection->written << " new snapshots\n";
        }
        std::cout << "  Hotspots:  " << report.hotspots << "\n";
        std::cout << "  Insights:  " << report.insights << "\n";
        std::cout << "  Backups:   " << report.backups << "/3\n";
        for (const auto& e : report.errors) std::cerr << "  Error: " << e << "\n";
    }
    return report.errors.empty() ? 0 : 1;
}

int cmd_export(Memory& memory, const std::string& path) {
    json doc = memory.knowledge_graph()->export_patterns();
    if (path.empty()) {
        std::cout << doc.dump(2) << "\n";
        return 0;
    }

    std::ofstream out(path);
    if (!out) {
        std::cerr << "Error: cannot write " << path << "\n";
        return 1;
    }
    out << doc.dump(2) << "\n";
    std::cout << "Exported " << doc["patterns"].size() << " patterns to " << path << "\n";
    return 0;
}

int cmd_import(Memory& memory, const std::string& path) {
    if (path.empty()) {
        std::cerr << "Usage: cortexd import <file>\n";
        return 1;
    }
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Error: cannot open " << path << "\n";
        return 1;
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::parse_error& e) {
        std::cerr << "Error: " << path << " is not valid JSON: " << e.what() << "\n";
        return 1;
    }

    auto report = memory.knowledge_graph()->import_patterns(doc);
    if (!report.ok()) {
        print_status_error("import", report.status);
        return 1;
    }
    std::cout << "Import complete:\n";
    std::cout << "  Patterns imported:      " << report->imported << "\n";
    std::cout << "  Patterns skipped:       " << report->skipped << "\n";
    std::cout << "  Relationships imported: " << report->relationships << "\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Daemon
// ═══════════════════════════════════════════════════════════════════════════

static std::atomic<bool> daemon_running{true};

extern "C" void daemon_signal_handler(int) {
    daemon_running = false;
}

// Exclusive fcntl lock on <base_dir>/cortexd.pid, held for the life of the
// object. The file carries the owner's pid and is removed on release.
class InstanceLock {
public:
    explicit InstanceLock(std::string path) : path_(std::move(path)) {}
    ~InstanceLock() {
        if (fd_ < 0) return;
        unlink(path_.c_str());
        close(fd_);
    }
    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;

    Status acquire() {
        int fd = open(path_.c_str(), O_CREAT | O_RDWR, 0600);
        if (fd < 0) return Status::io("open " + path_ + ": " + strerror(errno));

        struct flock whole_file {};
        whole_file.l_type = F_WRLCK;
        whole_file.l_whence = SEEK_SET;
        if (fcntl(fd, F_SETLK, &whole_file) != 0) {
            int err = errno;
            close(fd);
            if (err == EACCES || err == EAGAIN) {
                return Status::validation("another cortexd holds " + path_);
            }
            return Status::io("lock " + path_ + ": " + strerror(err));
        }
        fd_ = fd;

        std::string pid = std::to_string(getpid()) + "\n";
        if (ftruncate(fd_, 0) != 0 || write(fd_, pid.data(), pid.size()) < 0) {
            log::warn("Daemon", "Could not record pid in ", path_);
        }
        return Status::ok();
    }

private:
    std::string path_;
    int fd_ = -1;
};

int cmd_forget(Memory& memory, const ForgetCriteria& criteria, bool dry_run, bool json_output) {
    auto report = memory.knowledge_graph()->forget(criteria, dry_run);
    if (!report.ok()) {
        print_status_error("forget", report.status);
        return 1;
    }

    if (json_output) {
        std::cout << json{{"dry_run", report->dry_run},
                          {"deleted", report->deleted},
                          {"protected", report->protected_ids},
                          {"total", report->total_patterns}}.dump() << "\n";
        return 0;
    }
    std::cout << (dry_run ? "Would delete " : "Deleted ") << report->deleted.size() << " of "
              << report->total_patterns << " patterns";
    if (!report->protected_ids.empty()) std::cout << " (" << report->protected_ids.size() << " pinned or immutable kept)";
    std::cout << "\n";
    if (dry_run) {
        for (PatternId id : report->deleted) {
            auto p = memory.knowledge_graph()->peek_pattern(id);
            if (p.ok()) std::cout << "  [" << id << "] " << p->title << " (" << p->confidence << ")\n";
        }
    }
    return 0;
}

int cmd_daemon(Memory& memory) {
    const CortexConfig& config = memory.config();
    InstanceLock lock(config.base_dir + "/cortexd.pid");
    Status locked = lock.acquire();
    if (!locked) {
        log::error("Daemon", locked.to_string());
        return 1;
    }

    std::signal(SIGTERM, daemon_signal_handler);
    std::signal(SIGINT, daemon_signal_handler);

    auto scheduler = std::make_shared<Scheduler>();
    Status attached = memory.attach_scheduler(scheduler);
    if (!attached) {
        log::error("Daemon", "Could not schedule maintenance: ", attached.to_string());
        return 1;
    }

    MaintenanceDaemon daemon(*scheduler, config.scheduler.poll_interval_ms);
    daemon.start();
    log::info("Daemon", "Started (interval=", config.scheduler.interval_ms / 1000, "s, pid=", getpid(), ")");

    while (daemon_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    daemon.stop();
    uint64_t runs = scheduler->run_count(Memory::MAINTENANCE_JOB);
    memory.detach_scheduler();

    log::info("Daemon", "Stopped after ", runs, " maintenance runs");
    return 0;
}

int main(int argc, char* argv[]) {
    std::string base_dir;
    std::string config_path;
    std::string repo_path;
    std::string command;
    std::string argument;
    std::string log_file;

    int limit = 10;
    int deadline_ms = 500;
    int interval_seconds = 0;
    bool json_output = false;
    bool foreground_mode = false;
    bool dry_run = false;
    ForgetCriteria forget_criteria;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--dir") == 0 && i + 1 < argc) {
            base_dir = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--repo") == 0 && i + 1 < argc) {
            repo_path = argv[++i];
        } else if (strcmp(argv[i], "--limit") == 0 && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "--deadline") == 0 && i + 1 < argc) {
            deadline_ms = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "--interval") == 0 && i + 1 < argc) {
            interval_seconds = std::atoi(argv[++i]);
        } else if (strcmp(argv[i], "--confidence") == 0 && i + 1 < argc) {
            forget_criteria.max_confidence = static_cast<float>(std::atof(argv[++i]));
        } else if (strcmp(argv[i], "--days") == 0 && i + 1 < argc) {
            forget_criteria.inactive_days = std::atoll(argv[++i]);
        } else if (strcmp(argv[i], "--dry-run") == 0) {
            dry_run = true;
        } else if (strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (strcmp(argv[i], "--json") == 0) {
            json_output = true;
        } else if (strcmp(argv[i], "--foreground") == 0 || strcmp(argv[i], "-f") == 0) {
            foreground_mode = true;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            log::set_verbose(true);
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << "cortex " << CORTEX_VERSION << "\n";
            return 0;
        } else if (argv[i][0] != '-') {
            if (command.empty()) {
                command = argv[i];
            } else if (argument.empty()) {
                argument = argv[i];
            } else {
                argument += " ";
                argument += argv[i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty() || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (limit <= 0 || deadline_ms <= 0 || interval_seconds < 0) {
        std::cerr << "Error: --limit, --deadline and --interval must be positive\n";
        return 1;
    }

    // Configuration: defaults, then file, then flags
    CortexConfig config;
    if (!base_dir.empty()) config.base_dir = base_dir;
    if (config_path.empty() && file_exists(config.base_dir + "/config.json")) {
        config_path = config.base_dir + "/config.json";
    }
    if (!config_path.empty()) {
        auto loaded = load_config(config_path);
        if (!loaded.ok()) {
            print_status_error("config", loaded.status);
            return 1;
        }
        config = *loaded;
        if (!base_dir.empty()) config.base_dir = base_dir;
    }
    if (!repo_path.empty()) config.context.repo_path = repo_path;
    if (interval_seconds > 0) config.scheduler.interval_ms = static_cast<int64_t>(interval_seconds) * 1000;

    if (json_output) log::set_quiet(true);

    if (command == "daemon" && !foreground_mode) {
        Status detached = detach_process(log_file);
        if (!detached) {
            log::error("Daemon", detached.to_string());
            return 1;
        }
    }

    Memory memory(config);
    Status opened = memory.open();
    if (!opened) {
        print_status_error("open", opened);
        return 1;
    }

    int rc = 0;
    if (command == "stats") {
        rc = cmd_stats(memory, json_output);
    } else if (command == "context") {
        rc = cmd_context(memory, argument, limit, deadline_ms, json_output);
    } else if (command == "search") {
        if (argument.empty()) {
            std::cerr << "Usage: cortexd search <query>\n";
            rc = 1;
        } else {
            rc = cmd_search(memory, argument, limit, json_output);
        }
    } else if (command == "recent") {
        rc = cmd_recent(memory, limit, json_output);
    } else if (command == "insights") {
        rc = cmd_insights(memory, json_output);
    } else if (command == "hotspots") {
        rc = cmd_hotspots(memory, limit, json_output);
    } else if (command == "maintain") {
        rc = cmd_maintain(memory, json_output);
    } else if (command == "export") {
        rc = cmd_export(memory, argument);
    } else if (command == "import") {
        rc = cmd_import(memory, argument);
    } else if (command == "forget") {
        rc = cmd_forget(memory, forget_criteria, dry_run, json_output);
    } else if (command == "daemon") {
        rc = cmd_daemon(memory);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        rc = 1;
    }

    memory.close();
    return rc;
}
