#include <cortex/cortex.hpp>
#include <iostream>
#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <future>
#include <stdexcept>
#include <thread>

using namespace cortex;

namespace fs = std::filesystem;

// Noon on a fixed day, far from any day boundary
static const Timestamp T0 = start_of_day(20000) + 12 * MS_PER_HOUR;

static std::string fresh_dir(const std::string& name) {
    std::string dir = "/tmp/cortex_test_" + name;
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    return dir;
}

static void corrupt_file(const std::string& path) {
    std::error_code ec;
    fs::remove(path + "-wal", ec);
    fs::remove(path + "-shm", ec);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    for (int i = 0; i < 512; ++i) out << "this is not a database file ";
}

static bool near(float a, float b) { return std::fabs(a - b) < 1e-4f; }

static Turn user_turn(const std::string& text) {
    Turn t;
    t.role = "user";
    t.text = text;
    return t;
}

static Pattern make_pattern(const std::string& title, const std::string& body,
                            std::vector<std::string> tags = {}, float confidence = 1.0f) {
    Pattern p;
    p.title = title;
    p.body = body;
    p.tags = std::move(tags);
    p.confidence = confidence;
    return p;
}

// ═══════════════════════════════════════════════════════════════════════════
// Foundations
// ═══════════════════════════════════════════════════════════════════════════

void test_status_result() {
    std::cout << "Testing Status/Result..." << std::endl;

    Status ok;
    assert(ok);
    assert(ok.to_string() == "ok");

    Status bad = Status::integrity("missing endpoint");
    assert(!bad);
    assert(bad.to_string() == "integrity_error: missing endpoint");

    Result<int> value(7);
    assert(value.ok() && *value == 7);

    Result<int> throttled(Status::throttled("too soon"), 3);
    assert(!throttled.ok());
    assert(throttled.value.has_value() && *throttled == 3);

    Result<int> failed(Status::not_found("x"));
    assert(!failed.ok() && !failed.value);

    std::cout << "  PASS" << std::endl;
}

void test_config() {
    std::cout << "Testing config..." << std::endl;

    CortexConfig defaults;
    assert(defaults.working_memory.max_conversations == 20);
    assert(defaults.knowledge_graph.decay_threshold_days == 60);
    assert(defaults.context.collection_interval_ms == MS_PER_HOUR);
    assert(defaults.facade.knowledge_graph_budget_ms == 150);
    assert(validate_config(defaults));

    // Missing keys keep defaults, unknown keys are ignored
    json partial = {
        {"base_dir", "/tmp/cortex_cfg"},
        {"working_memory", {{"max_conversations", 5}}},
        {"context", {{"repo_path", "/src/project"}}},
        {"unknown_section", {{"x", 1}}},
    };
    auto cfg = config_from_json(partial);
    assert(cfg.ok());
    assert(cfg->base_dir == "/tmp/cortex_cfg");
    assert(cfg->working_memory.max_conversations == 5);
    assert(cfg->working_memory.session_timeout_ms == 30 * MS_PER_MINUTE);
    assert(cfg->context.repo_path == "/src/project");
    assert(cfg->knowledge_graph.promotion_threshold == 3);

    // Out of range values
    json bad_order = {{"knowledge_graph", {{"decay_severe_days", 50}}}};
    assert(config_from_json(bad_order).status.code == ErrorCode::Validation);
    json bad_type = {{"working_memory", {{"max_conversations", "many"}}}};
    assert(config_from_json(bad_type).status.code == ErrorCode::Validation);

    // File round trip
    std::string dir = fresh_dir("config");
    CortexConfig custom = *cfg;
    custom.scheduler.event_threshold = 7;
    assert(save_config(custom, dir + "/config.json"));
    auto loaded = load_config(dir + "/config.json");
    assert(loaded.ok());
    assert(loaded->scheduler.event_threshold == 7);
    assert(to_json(*loaded) == to_json(custom));

    {
        std::ofstream junk(dir + "/broken.json");
        junk << "{ not json";
    }
    assert(load_config(dir + "/broken.json").status.code == ErrorCode::Validation);
    assert(load_config(dir + "/missing.json").status.code == ErrorCode::Io);

    std::cout << "  PASS" << std::endl;
}

void test_version() {
    std::cout << "Testing version..." << std::endl;

#ifdef CORTEX_PROJECT_VERSION
    assert(std::string(CORTEX_VERSION) == CORTEX_PROJECT_VERSION);
#endif
    assert(std::string(CORTEX_VERSION).find('.') != std::string::npos);

    std::cout << "  PASS" << std::endl;
}

void test_days() {
    std::cout << "Testing calendar days..." << std::endl;

    DayNumber d = 0;
    assert(parse_day("2024-03-01", d));
    assert(d == days_from_civil(2024, 3, 1));
    assert(format_day(d) == "2024-03-01");
    assert(!parse_day("2024-13-01", d));
    assert(day_of(start_of_day(d) + MS_PER_DAY - 1) == d);
    assert(days_between(T0, T0 + 65 * MS_PER_DAY) == 65);
    assert(days_between(T0, T0 - MS_PER_DAY) == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Record store
// ═══════════════════════════════════════════════════════════════════════════

static StoreSchema items_schema(int version) {
    StoreSchema schema;
    schema.version = version;
    schema.tables = {
        {"items", {"owner"}, {}},
        {"users", {}, {{"email"}}},
    };
    if (version >= 2) {
        schema.migrations = {
            {1, 2, "add status to items",
             [](Transaction& tx) {
                 return tx.exec("UPDATE items SET body = json_set(body, '$.status', 'new')");
             }},
        };
    }
    return schema;
}

void test_record_store_transactions() {
    std::cout << "Testing RecordStore transactions..." << std::endl;

    std::string dir = fresh_dir("store_tx");
    RecordStore store(dir + "/items.db", items_schema(1), "TestStore");
    OpenReport report;
    assert(store.open(report));
    assert(report.outcome == OpenReport::Outcome::Created);

    assert(store.put("items", "a", json{{"owner", "ana"}, {"n", 1}}));
    assert(store.put("items", "b", json{{"owner", "bo"}, {"n", 2}}));
    auto a = store.get("items", "a");
    assert(a.ok() && (*a)["n"] == 1);
    assert(store.get("items", "zzz").status.code == ErrorCode::NotFound);

    auto by_owner = store.find("items", "owner", "bo");
    assert(by_owner.ok() && by_owner->size() == 1 && (*by_owner)[0].key == "b");

    auto big = store.scan("items", [](const Record& r) { return r.body["n"].get<int>() > 1; });
    assert(big.ok() && big->size() == 1);

    // A failing transaction leaves nothing behind
    Status s = store.transaction([](Transaction& tx) {
        Status w = tx.put("items", "c", json{{"owner", "cy"}});
        if (!w) return w;
        return Status::validation("abort");
    });
    assert(s.code == ErrorCode::Validation);
    assert(store.get("items", "c").status.code == ErrorCode::NotFound);

    // Exceptions roll back too
    s = store.transaction([](Transaction& tx) -> Status {
        Status w = tx.put("items", "d", json{{"owner", "di"}});
        if (!w) return w;
        throw std::runtime_error("boom");
    });
    assert(s.code == ErrorCode::Io);
    assert(store.get("items", "d").status.code == ErrorCode::NotFound);

    // Unique groups and insert-only writes
    assert(store.put("users", "u1", json{{"email", "x@y.z"}}));
    assert(store.put("users", "u2", json{{"email", "x@y.z"}}).code == ErrorCode::Integrity);
    s = store.transaction([](Transaction& tx) { return tx.insert("items", "a", json{{"owner", "dup"}}); });
    assert(s.code == ErrorCode::Integrity);

    auto id1 = store.next_id("items");
    auto id2 = store.next_id("items");
    assert(id1.ok() && id2.ok() && *id2 == *id1 + 1);

    assert(store.erase("items", "a"));
    assert(store.erase("items", "a").code == ErrorCode::NotFound);
    assert(*store.count("items") == 1);

    store.close();
    assert(store.get("items", "b").status.code == ErrorCode::Io);

    std::cout << "  PASS" << std::endl;
}

void test_record_store_migration() {
    std::cout << "Testing RecordStore migration..." << std::endl;

    std::string dir = fresh_dir("store_migrate");
    std::string path = dir + "/items.db";
    {
        RecordStore v1(path, items_schema(1));
        OpenReport report;
        assert(v1.open(report));
        assert(v1.put("items", "a", json{{"owner", "ana"}}));
    }

    {
        RecordStore v2(path, items_schema(2));
        OpenReport report;
        assert(v2.open(report));
        assert(report.outcome == OpenReport::Outcome::Migrated);
        assert(report.from_version == 1 && report.to_version == 2);
        auto a = v2.get("items", "a");
        assert(a.ok() && (*a)["status"] == "new");
        assert(fs::exists(path + ".pre-v2.bak"));
    }

    // A file from a newer build is refused
    RecordStore old(path, items_schema(1));
    OpenReport report;
    assert(old.open(report).code == ErrorCode::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_record_store_recovery() {
    std::cout << "Testing RecordStore corruption recovery..." << std::endl;

    std::string dir = fresh_dir("store_recover");
    std::string path = dir + "/items.db";
    {
        RecordStore store(path, items_schema(1));
        OpenReport report;
        assert(store.open(report));
        assert(store.put("items", "a", json{{"owner", "ana"}}));
        assert(store.backup());
        assert(store.put("items", "b", json{{"owner", "bo"}}));
    }

    // Backup available: restored to the backed-up state
    corrupt_file(path);
    {
        RecordStore store(path, items_schema(1));
        OpenReport report;
        assert(store.open(report));
        assert(report.outcome == OpenReport::Outcome::Restored);
        assert(fs::exists(report.corrupt_path));
        assert(store.get("items", "a").ok());
        assert(store.get("items", "b").status.code == ErrorCode::NotFound);
    }

    // No backup: empty store
    fs::remove(path + ".bak");
    corrupt_file(path);
    {
        RecordStore store(path, items_schema(1));
        OpenReport report;
        assert(store.open(report));
        assert(report.outcome == OpenReport::Outcome::Reset);
        assert(report.recovered());
        assert(*store.count("items") == 0);
    }

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Tier A: working memory
// ═══════════════════════════════════════════════════════════════════════════

class ThrowingExtractor : public EntityExtractor {
public:
    std::vector<EntityMention> extract(const std::string&) const override {
        throw std::runtime_error("extractor unavailable");
    }
};

void test_wm_fifo_bound() {
    std::cout << "Testing WorkingMemory FIFO bound..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("wm_fifo");
    WorkingMemory wm(dir + "/wm.db", WorkingMemoryConfig{}, clock);
    assert(wm.open());

    std::vector<ConversationId> ids;
    for (int i = 0; i < 21; ++i) {
        auto id = wm.start_conversation("session-" + std::to_string(i));
        assert(id.ok());
        assert(wm.append_turn(*id, user_turn("turn " + std::to_string(i))));
        assert(wm.close_conversation(*id));
        ids.push_back(*id);
        clock->advance(MS_PER_MINUTE);
    }

    assert(wm.count() == 20);
    assert(wm.get_conversation(ids[0]).status.code == ErrorCode::NotFound);
    assert(wm.get_conversation(ids[1]).ok());
    assert(wm.get_conversation(ids[20]).ok());

    auto log = wm.eviction_log();
    assert(log.ok() && log->size() == 1);
    assert((*log)[0].conversation_id == ids[0]);
    assert((*log)[0].turn_count == 1);

    auto recent = wm.get_recent(3);
    assert(recent.ok() && recent->size() == 3);
    assert((*recent)[0].id == ids[20]);
    assert((*recent)[2].id == ids[18]);

    std::cout << "  PASS" << std::endl;
}

void test_wm_active_immunity() {
    std::cout << "Testing WorkingMemory active immunity..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("wm_active");
    WorkingMemoryConfig config;
    config.max_conversations = 3;
    WorkingMemory wm(dir + "/wm.db", config, clock);
    assert(wm.open());

    auto pinned = wm.start_conversation("pinned");
    assert(pinned.ok() && wm.pin_conversation(*pinned, true));
    clock->advance(MS_PER_MINUTE);
    auto open = wm.start_conversation("open");
    assert(open.ok());
    clock->advance(MS_PER_MINUTE);

    // Only closed conversations are evicted while the others stay active
    auto c3 = wm.start_conversation("third");
    assert(c3.ok() && wm.close_conversation(*c3));
    clock->advance(MS_PER_MINUTE);
    auto c4 = wm.start_conversation("fourth");
    assert(c4.ok());
    assert(wm.get_conversation(*c3).status.code == ErrorCode::NotFound);
    assert(wm.get_conversation(*pinned).ok());
    assert(wm.get_conversation(*open).ok());

    // Every conversation active: the cap is exceeded rather than evicting
    clock->advance(MS_PER_MINUTE);
    auto c5 = wm.start_conversation("fifth");
    assert(c5.ok());
    assert(wm.count() == 4);

    // Past the session timeout open conversations stop being active, the
    // pinned one never does
    clock->advance(31 * MS_PER_MINUTE);
    auto c6 = wm.start_conversation("sixth");
    assert(c6.ok());
    assert(wm.get_conversation(*open).status.code == ErrorCode::NotFound);
    assert(wm.get_conversation(*pinned).ok());

    // Starting again in a session closes its previous conversation
    auto c7 = wm.start_conversation("sixth");
    assert(c7.ok());
    auto prev = wm.get_conversation(*c6);
    assert(!prev.ok() || prev->closed);

    std::cout << "  PASS" << std::endl;
}

void test_wm_entities() {
    std::cout << "Testing WorkingMemory entities and co-modification..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("wm_entities");
    WorkingMemory wm(dir + "/wm.db", WorkingMemoryConfig{}, clock);
    assert(wm.open());

    auto c1 = wm.start_conversation("s1");
    assert(c1.ok());
    assert(wm.append_turn(*c1, user_turn("Refactor `RecordStore` in src/store.cpp and call open_store() #perf"),
                          {"src/store.hpp"}));

    auto entities = wm.get_entities(*c1);
    assert(entities.ok());
    auto has = [&entities](EntityKind kind, const std::string& name) {
        for (const auto& e : *entities) {
            if (e.kind == kind && e.name == name) return true;
        }
        return false;
    };
    assert(has(EntityKind::Symbol, "RecordStore"));
    assert(has(EntityKind::Symbol, "open_store"));
    assert(has(EntityKind::File, "src/store.cpp"));
    assert(has(EntityKind::File, "src/store.hpp"));
    assert(has(EntityKind::Concept, "perf"));

    auto conv = wm.get_conversation(*c1);
    assert(conv.ok() && conv->files.size() == 2);

    clock->advance(MS_PER_MINUTE);
    auto c2 = wm.start_conversation("s2");
    assert(c2.ok());
    assert(wm.append_turn(*c2, user_turn("Touching src/store.cpp again"), {"src/store.hpp"},
                          {{EntityKind::Concept, "storage"}}));

    auto touching = wm.find_conversations_with_entity(EntityKind::File, "src/store.cpp");
    assert(touching.ok() && touching->size() == 2);
    assert((*touching)[0].id == *c2);
    auto none = wm.find_conversations_with_entity(EntityKind::File, "nowhere.cpp");
    assert(none.ok() && none->empty());

    auto pairs = wm.co_modification_patterns(2);
    assert(pairs.ok() && pairs->size() == 1);
    assert((*pairs)[0].files == std::vector<std::string>({"src/store.cpp", "src/store.hpp"}));
    assert((*pairs)[0].frequency == 2);
    assert(near((*pairs)[0].confidence, 1.0f));

    auto stats = wm.entity_statistics();
    assert(stats.ok() && !stats->empty());
    assert((*stats)[0].conversation_count == 2);

    // Validation
    assert(wm.append_turn(*c2, user_turn("   ")).code == ErrorCode::Validation);
    Turn bot = user_turn("hello");
    bot.role = "bot";
    assert(wm.append_turn(*c2, bot).code == ErrorCode::Validation);
    assert(wm.append_turn(9999, user_turn("hello")).code == ErrorCode::NotFound);
    assert(wm.start_conversation(" ").status.code == ErrorCode::Validation);
    assert(wm.close_conversation(*c2));
    assert(wm.append_turn(*c2, user_turn("late")).code == ErrorCode::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_wm_extraction_failure() {
    std::cout << "Testing WorkingMemory extraction failure..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("wm_extract");
    WorkingMemory wm(dir + "/wm.db", WorkingMemoryConfig{}, clock);
    assert(wm.open());
    wm.set_extractor(std::make_shared<ThrowingExtractor>());

    auto id = wm.start_conversation("s");
    assert(id.ok());
    assert(wm.append_turn(*id, user_turn("Look at `Parser` in src/parse.cpp"), {"src/lex.cpp"}));

    auto conv = wm.get_conversation(*id);
    assert(conv.ok() && conv->turns.size() == 1);

    // Only the caller-supplied file made it in
    auto entities = wm.get_entities(*id);
    assert(entities.ok() && entities->size() == 1);
    assert((*entities)[0].name == "src/lex.cpp");

    std::cout << "  PASS" << std::endl;
}

void test_wm_search() {
    std::cout << "Testing WorkingMemory search..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("wm_search");
    WorkingMemory wm(dir + "/wm.db", WorkingMemoryConfig{}, clock);
    assert(wm.open());

    auto a = wm.start_conversation("a");
    assert(wm.append_turn(*a, user_turn("The decay job deletes stale patterns")));
    clock->advance(MS_PER_MINUTE);
    auto b = wm.start_conversation("b");
    assert(wm.append_turn(*b, user_turn("Unrelated talk about the build")));

    auto matches = wm.search("decay patterns");
    assert(matches.ok() && matches->size() == 1);
    assert((*matches)[0].conversation.id == *a);
    assert((*matches)[0].score > 0.0f);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Tier B: knowledge graph
// ═══════════════════════════════════════════════════════════════════════════

void test_query_parser() {
    std::cout << "Testing query parser..." << std::endl;

    auto term = parse_query("Refactor");
    assert(term.ok() && term->type == QueryNode::Type::Term && term->term == "refactor");

    auto prefix = parse_query("refactor*");
    assert(prefix.ok() && prefix->type == QueryNode::Type::Prefix && prefix->term == "refactor");

    auto phrase = parse_query("\"Extract Method\"");
    assert(phrase.ok() && phrase->type == QueryNode::Type::Phrase);
    assert(phrase->phrase == std::vector<std::string>({"extract", "method"}));

    auto seq = parse_query("cache -legacy");
    assert(seq.ok() && seq->type == QueryNode::Type::Sequence && seq->children.size() == 2);
    assert(seq->children[1].type == QueryNode::Type::Not);

    // AND binds tighter than OR
    auto bools = parse_query("a1 OR b1 AND c1");
    assert(bools.ok() && bools->type == QueryNode::Type::Or);
    assert(bools->children[1].type == QueryNode::Type::And);

    auto grouped = parse_query("(a1 OR b1) AND c1");
    assert(grouped.ok() && grouped->type == QueryNode::Type::And);
    assert(grouped->children[0].type == QueryNode::Type::Or);

    // Lowercase operators are plain words
    auto words = parse_query("this and that");
    assert(words.ok() && words->type == QueryNode::Type::Sequence);

    auto empty = parse_query("   ");
    assert(empty.ok() && empty->empty());

    assert(parse_query("\"unterminated").status.code == ErrorCode::Validation);
    assert(parse_query("(open").status.code == ErrorCode::Validation);
    assert(parse_query("AND foo").status.code == ErrorCode::Validation);
    assert(parse_query("NOT").status.code == ErrorCode::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_tag_index() {
    std::cout << "Testing TagIndex..." << std::endl;

    TagIndex index;
    index.add(1, std::vector<std::string>{"refactor", "cpp"});
    index.add(2, "cpp");
    index.add(3, "python");

    assert(index.with_tag("cpp") == std::vector<uint32_t>({1, 2}));
    assert(index.with_tags({"cpp", "refactor"}, true) == std::vector<uint32_t>({1}));
    assert(index.with_tags({"refactor", "python"}, false) == std::vector<uint32_t>({1, 3}));
    assert(index.with_tag("missing").empty());
    assert(index.with_tags({"cpp", "missing"}, true).empty());
    assert(index.has(1, "refactor"));
    assert(index.has_prefix(1, "refac"));
    assert(!index.has_prefix(2, "py"));

    auto counts = index.counts();
    assert(counts[0].first == "cpp" && counts[0].second == 2);
    assert(index.total_taggings() == 4);

    index.set(1, {"python"});
    assert(index.with_tag("refactor").empty());
    assert(index.with_tag("python") == std::vector<uint32_t>({1, 3}));

    index.remove_all(3);
    assert(index.with_tag("python") == std::vector<uint32_t>({1}));
    index.clear();
    assert(index.tag_count() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_kg_round_trip() {
    std::cout << "Testing KnowledgeGraph round trip..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_round_trip");
    std::string path = dir + "/kg.db";
    PatternId id = 0;
    {
        KnowledgeGraph kg(path, KnowledgeGraphConfig{}, clock);
        assert(kg.open());
        auto added = kg.add_pattern(make_pattern("Refactoring Workflow", "Extract, test, commit.",
                                                 {"Refactor", " cpp ", "refactor"}, 0.8f));
        assert(added.ok());
        id = *added;

        clock->advance(MS_PER_HOUR);
        auto p = kg.get_pattern(id);
        assert(p.ok());
        assert(p->title == "Refactoring Workflow");
        assert(p->body == "Extract, test, commit.");
        assert(p->tags == std::vector<std::string>({"refactor", "cpp"}));
        assert(p->access_count == 1);
        assert(p->last_accessed == T0 + MS_PER_HOUR);

        auto peeked = kg.peek_pattern(id);
        assert(peeked.ok() && peeked->access_count == 1);
    }

    // Persisted across reopen, access included
    KnowledgeGraph kg(path, KnowledgeGraphConfig{}, clock);
    assert(kg.open());
    assert(kg.open_report().outcome == OpenReport::Outcome::Opened);
    auto p = kg.get_pattern(id);
    assert(p.ok() && p->access_count == 2);
    assert(p->tags == std::vector<std::string>({"refactor", "cpp"}));

    PatternUpdate update;
    update.body = std::string("Extract, test, commit, push.");
    update.tags = std::vector<std::string>{"workflow"};
    assert(kg.update_pattern(id, update));
    p = kg.peek_pattern(id);
    assert(p->body == "Extract, test, commit, push.");
    assert(kg.find_by_tag("workflow").size() == 1);
    assert(kg.find_by_tag("refactor").empty());

    assert(kg.add_pattern(make_pattern("", "no title")).status.code == ErrorCode::Validation);
    assert(kg.add_pattern(make_pattern("t", "b", {}, 1.5f)).status.code == ErrorCode::Validation);
    assert(kg.get_pattern(424242).status.code == ErrorCode::NotFound);

    assert(kg.set_immutable(id));
    assert(kg.update_pattern(id, update).code == ErrorCode::Validation);
    assert(kg.delete_pattern(id).code == ErrorCode::Validation);
    assert(kg.set_immutable(id, false));
    assert(kg.delete_pattern(id));
    assert(!kg.has_pattern(id));

    std::cout << "  PASS" << std::endl;
}

void test_kg_relationships() {
    std::cout << "Testing KnowledgeGraph relationships..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_links");
    KnowledgeGraph kg(dir + "/kg.db", KnowledgeGraphConfig{}, clock);
    assert(kg.open());

    PatternId p1 = *kg.add_pattern(make_pattern("P1", "first"));
    PatternId p2 = *kg.add_pattern(make_pattern("P2", "second"));
    PatternId p3 = *kg.add_pattern(make_pattern("P3", "third"));

    // Referential integrity: nothing persisted on failure
    assert(kg.link_patterns(p1, 999, RelationshipKind::Extends).code == ErrorCode::Integrity);
    assert(kg.relationship_count() == 0);

    assert(kg.link_patterns(p1, p2, RelationshipKind::Extends, 0.9f));
    assert(kg.link_patterns(p1, p2, RelationshipKind::Extends, 0.5f).code == ErrorCode::Validation);
    assert(kg.link_patterns(p1, p1, RelationshipKind::RelatedTo).code == ErrorCode::Validation);
    assert(kg.link_patterns(p1, p3, RelationshipKind::RelatedTo, 2.0f).code == ErrorCode::Validation);

    // Scenario: extends at depth 1 gives exactly P2
    auto related = kg.get_related_patterns(p1, RelationshipKind::Extends, 1);
    assert(related.ok() && related->size() == 1);
    assert((*related)[0].pattern.id == p2);
    assert(near((*related)[0].strength, 0.9f));

    // A cycle still terminates
    assert(kg.link_patterns(p2, p3, RelationshipKind::Extends, 0.5f));
    assert(kg.link_patterns(p3, p1, RelationshipKind::RelatedTo, 0.7f));
    auto all = kg.get_related_patterns(p1, std::nullopt, 10);
    assert(all.ok() && all->size() == 2);
    assert((*all)[0].pattern.id == p2 && (*all)[0].distance == 1);
    assert((*all)[1].pattern.id == p3 && (*all)[1].distance == 2);

    auto strong = kg.get_related_patterns(p1, std::nullopt, 10, 0.8f);
    assert(strong.ok() && strong->size() == 1);

    auto edges = kg.get_relationships(p1);
    assert(edges.ok() && edges->size() == 2);   // p1->p2 and p3->p1

    // Deleting a pattern takes its edges with it
    assert(kg.delete_pattern(p2));
    assert(kg.relationship_count() == 1);
    assert(kg.unlink_patterns(p3, p1, RelationshipKind::RelatedTo));
    assert(kg.relationship_count() == 0);
    assert(kg.unlink_patterns(p3, p1, RelationshipKind::RelatedTo).code == ErrorCode::NotFound);

    std::cout << "  PASS" << std::endl;
}

void test_kg_search() {
    std::cout << "Testing KnowledgeGraph search..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_search");
    KnowledgeGraph kg(dir + "/kg.db", KnowledgeGraphConfig{}, clock);
    assert(kg.open());

    PatternId workflow = *kg.add_pattern(make_pattern("Refactoring Workflow", "Small steps", {"refactor"}));
    PatternId extract = *kg.add_pattern(make_pattern("Extract method", "Pull a block into a function",
                                                     {"refactor", "cpp"}));
    PatternId legacy = *kg.add_pattern(make_pattern("Refactor legacy parser", "Wrap it first", {"legacy"}));
    PatternId db = *kg.add_pattern(make_pattern("Legacy database migration", "Dual writes", {"legacy"}, 0.4f));

    // Scenario: prefix query finds the workflow with a positive score
    auto r = kg.search_patterns("refactor*");
    assert(r.ok());
    bool found = false;
    for (const auto& m : *r) {
        if (m.pattern.id == workflow) {
            found = true;
            assert(m.score > 0.0f);
        }
    }
    assert(found);

    auto excluded = kg.search_patterns("refactor* -legacy");
    assert(excluded.ok() && excluded->size() == 2);
    for (const auto& m : *excluded) assert(m.pattern.id != legacy && m.pattern.id != db);

    auto both = kg.search_patterns("legacy AND parser");
    assert(both.ok() && both->size() == 1 && (*both)[0].pattern.id == legacy);

    auto either = kg.search_patterns("parser OR database");
    assert(either.ok() && either->size() == 2);

    auto phrase = kg.search_patterns("\"extract method\"");
    assert(phrase.ok() && phrase->size() == 1 && (*phrase)[0].pattern.id == extract);
    auto reversed = kg.search_patterns("\"method extract\"");
    assert(reversed.ok() && reversed->empty());

    auto negated = kg.search_patterns("NOT legacy");
    assert(negated.ok() && negated->size() == 2);

    auto confident = kg.search_patterns("legacy", 0.5f);
    assert(confident.ok() && confident->size() == 1 && (*confident)[0].pattern.id == legacy);

    // Exact tag matches are boosted above body-only matches
    auto tagged = kg.search_patterns("cpp");
    assert(tagged.ok() && !tagged->empty() && (*tagged)[0].pattern.id == extract);

    // Search is not an access
    assert(kg.peek_pattern(workflow)->access_count == 0);

    assert(kg.search_patterns("\"open").status.code == ErrorCode::Validation);
    auto nothing = kg.search_patterns("");
    assert(nothing.ok() && nothing->empty());

    // Tag queries
    assert(kg.find_by_tags({"refactor", "cpp"}, true).size() == 1);
    assert(kg.find_by_tags({"cpp", "legacy"}, false).size() == 3);
    auto cloud = kg.tag_cloud(2);
    assert(cloud.size() == 2);
    assert(kg.tag_count() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_kg_relevance_determinism() {
    std::cout << "Testing KnowledgeGraph relevance determinism..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_ties");
    KnowledgeGraph kg(dir + "/kg.db", KnowledgeGraphConfig{}, clock);
    assert(kg.open());

    PatternId low = *kg.add_pattern(make_pattern("Cache invalidation", "Use versioned keys", {}, 0.5f));
    PatternId high = *kg.add_pattern(make_pattern("Cache invalidation", "Use versioned keys", {}, 0.9f));

    auto r = kg.search_patterns("cache");
    assert(r.ok() && r->size() == 2);
    assert(near((*r)[0].score, (*r)[1].score));
    assert((*r)[0].pattern.id == high);
    assert((*r)[1].pattern.id == low);

    // Same confidence: most recently accessed first, then lowest id
    PatternId twin = *kg.add_pattern(make_pattern("Cache invalidation", "Use versioned keys", {}, 0.5f));
    clock->advance(MS_PER_MINUTE);
    assert(kg.get_pattern(twin).ok());
    r = kg.search_patterns("cache");
    assert((*r)[1].pattern.id == twin);
    assert((*r)[2].pattern.id == low);

    std::cout << "  PASS" << std::endl;
}

void test_kg_decay() {
    std::cout << "Testing KnowledgeGraph decay..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_decay");
    KnowledgeGraph kg(dir + "/kg.db", KnowledgeGraphConfig{}, clock);
    assert(kg.open());

    auto unused_for = [&](const std::string& title, int64_t days, float confidence) {
        Pattern p = make_pattern(title, "body", {}, confidence);
        p.created_at = T0 - days * MS_PER_DAY;
        p.last_accessed = p.created_at;
        auto id = kg.add_pattern(p);
        assert(id.ok());
        return *id;
    };

    PatternId fresh = unused_for("fresh", 10, 1.0f);
    PatternId mild = unused_for("mild", 65, 1.0f);
    PatternId severe = unused_for("severe", 95, 1.0f);
    PatternId ancient = unused_for("ancient", 125, 1.0f);
    PatternId weak = unused_for("weak", 65, 0.35f);
    PatternId weak_pinned = unused_for("weak pinned", 65, 0.35f);
    PatternId old_pinned = unused_for("old pinned", 200, 0.9f);
    PatternId frozen = unused_for("frozen", 200, 0.9f);
    assert(kg.pin_pattern(weak_pinned, true));
    assert(kg.pin_pattern(old_pinned, true));
    assert(kg.set_immutable(frozen));

    auto first = kg.apply_confidence_decay();
    assert(first.ok() && first->complete);
    assert(first->decayed_count == 2);
    assert(first->deleted_count == 2);

    // 60 day rule only, not also the 90 day one
    assert(near(kg.peek_pattern(mild)->confidence, 0.90f));
    assert(near(kg.peek_pattern(severe)->confidence, 0.75f));
    assert(near(kg.peek_pattern(fresh)->confidence, 1.0f));
    assert(!kg.has_pattern(ancient));
    assert(!kg.has_pattern(weak));
    assert(near(kg.peek_pattern(weak_pinned)->confidence, 0.35f));
    assert(near(kg.peek_pattern(old_pinned)->confidence, 0.9f));
    assert(near(kg.peek_pattern(frozen)->confidence, 0.9f));

    // Same evaluation window: no change
    auto second = kg.apply_confidence_decay();
    assert(second.ok());
    assert(second->decayed_count == 0 && second->deleted_count == 0);
    assert(near(kg.peek_pattern(mild)->confidence, 0.90f));

    // Next day the pattern is evaluated again
    clock->advance_days(1);
    auto third = kg.apply_confidence_decay();
    assert(third.ok() && third->decayed_count == 2);
    assert(near(kg.peek_pattern(mild)->confidence, 0.80f));

    // Use resets the clock on disuse
    assert(kg.get_pattern(mild).ok());
    clock->advance_days(1);
    auto fourth = kg.apply_confidence_decay();
    assert(fourth.ok());
    assert(near(kg.peek_pattern(mild)->confidence, 0.80f));

    auto log = kg.decay_log();
    assert(log.ok() && log->size() == 7);
    auto weak_log = kg.decay_log(weak);
    assert(weak_log.ok() && weak_log->size() == 1);
    assert((*weak_log)[0].action == "deleted");

    std::cout << "  PASS" << std::endl;
}

void test_kg_decay_batches() {
    std::cout << "Testing KnowledgeGraph batched decay..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_decay_batches");
    KnowledgeGraph kg(dir + "/kg.db", KnowledgeGraphConfig{}, clock);
    assert(kg.open());

    for (int i = 0; i < 10; ++i) {
        Pattern p = make_pattern("stale " + std::to_string(i), "body");
        p.created_at = T0 - 70 * MS_PER_DAY;
        assert(kg.add_pattern(p).ok());
    }

    DecayOptions options;
    options.batch_size = 3;
    auto r = kg.apply_confidence_decay(options);
    assert(r.ok() && r->complete);
    assert(r->evaluated == 10 && r->decayed_count == 10);

    for (const auto& p : kg.all_patterns()) assert(near(p.confidence, 0.9f));
    assert(near(kg.average_confidence(), 0.9f));

    assert(kg.apply_confidence_decay(DecayOptions{0, 0}).status.code == ErrorCode::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_kg_bulk_delete() {
    std::cout << "Testing KnowledgeGraph bulk deletion..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_bulk_delete");
    KnowledgeGraph kg(dir + "/kg.db", KnowledgeGraphConfig{}, clock);
    assert(kg.open());

    auto add = [&](const std::string& title, int64_t days, float confidence) {
        Pattern p = make_pattern(title, "body", {}, confidence);
        p.created_at = T0 - days * MS_PER_DAY;
        p.last_accessed = p.created_at;
        auto id = kg.add_pattern(p);
        assert(id.ok());
        return *id;
    };

    PatternId weak = add("weak", 10, 0.2f);
    PatternId weak_old = add("weak and old", 200, 0.25f);
    PatternId strong_old = add("strong and old", 200, 0.9f);
    add("strong", 5, 0.9f);
    PatternId weak_pinned = add("weak pinned", 0, 0.1f);
    PatternId weak_frozen = add("weak frozen", 0, 0.15f);
    add("recent a", 0, 0.8f);
    add("recent b", 0, 0.7f);
    assert(kg.pin_pattern(weak_pinned, true));
    assert(kg.set_immutable(weak_frozen));

    // Dry run lists the matches and writes nothing
    auto preview = kg.delete_by_confidence(0.3f, true);
    assert(preview.ok() && preview->dry_run);
    assert((preview->deleted == std::vector<PatternId>{weak, weak_old}));
    assert((preview->protected_ids == std::vector<PatternId>{weak_pinned, weak_frozen}));
    assert(preview->total_patterns == 8);
    assert(kg.pattern_count() == 8);
    assert(kg.decay_log()->empty());

    auto removed = kg.delete_by_confidence(0.3f);
    assert(removed.ok() && !removed->dry_run);
    assert((removed->deleted == preview->deleted));
    assert(!kg.has_pattern(weak) && !kg.has_pattern(weak_old));
    assert(kg.has_pattern(weak_pinned) && kg.has_pattern(weak_frozen));
    assert(kg.pattern_count() == 6);

    auto weak_log = kg.decay_log(weak);
    assert(weak_log.ok() && weak_log->size() == 1);
    assert((*weak_log)[0].action == "deleted");
    assert(near((*weak_log)[0].old_confidence, 0.2f));
    assert((*weak_log)[0].reason.find("confidence <= 0.30") != std::string::npos);

    // Age alone, then age and confidence together
    ForgetCriteria both;
    both.max_confidence = 0.95f;
    both.inactive_days = 100;
    auto by_age = kg.delete_by_age(100, true);
    assert(by_age.ok() && (by_age->deleted == std::vector<PatternId>{strong_old}));
    auto combined = kg.deletion_preview(both);
    assert(combined.ok() && (combined->deleted == std::vector<PatternId>{strong_old}));
    assert(kg.pattern_count() == 6);

    // Four of six would go: refused without writing
    ForgetCriteria everything;
    everything.max_confidence = 1.0f;
    auto refused = kg.forget(everything);
    assert(refused.status.code == ErrorCode::Validation);
    assert(kg.pattern_count() == 6);
    everything.max_fraction = 1.0f;
    auto forced = kg.forget(everything);
    assert(forced.ok() && forced->deleted.size() == 4);
    assert(kg.pattern_count() == 2);
    assert(kg.decay_log()->size() == 6);

    assert(kg.forget(ForgetCriteria{}).status.code == ErrorCode::Validation);
    assert(kg.delete_by_confidence(1.5f).status.code == ErrorCode::Validation);
    assert(kg.delete_by_age(-1).status.code == ErrorCode::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_kg_observe() {
    std::cout << "Testing KnowledgeGraph observe/promotion..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_observe");
    KnowledgeGraph kg(dir + "/kg.db", KnowledgeGraphConfig{}, clock);
    assert(kg.open());

    Observation obs;
    obs.title = "Run tests before commit";
    obs.body = "Every time";
    obs.kind = PatternKind::Workflow;
    obs.tags = {"testing"};

    auto r1 = kg.observe(obs);
    assert(r1.ok() && r1->observations == 1 && !r1->pattern_id);
    obs.title = "  run TESTS before   commit ";
    auto r2 = kg.observe(obs);
    assert(r2.ok() && r2->observations == 2 && !r2->pattern_id);
    auto r3 = kg.observe(obs);
    assert(r3.ok() && r3->promoted && r3->pattern_id);

    auto p = kg.peek_pattern(*r3->pattern_id);
    assert(p.ok());
    assert(near(p->confidence, 0.6f));
    assert(p->kind == PatternKind::Workflow);
    assert(std::get<int64_t>(p->metadata.at("observations")) == 3);
    assert(std::get<std::string>(p->metadata.at("origin")) == "observed");

    auto r4 = kg.observe(obs);
    assert(r4.ok() && !r4->promoted && *r4->pattern_id == *r3->pattern_id);
    assert(near(kg.peek_pattern(*r3->pattern_id)->confidence, 0.65f));
    assert(kg.pattern_count() == 1);

    assert(kg.observe(Observation{}).status.code == ErrorCode::Validation);

    // Immutable: the sighting is counted, the pattern left alone
    assert(kg.set_immutable(*r3->pattern_id));
    Pattern before = *kg.peek_pattern(*r3->pattern_id);
    clock->advance(MS_PER_HOUR);
    auto r5 = kg.observe(obs);
    assert(r5.ok() && r5->observations == 5 && *r5->pattern_id == *r3->pattern_id);
    Pattern after = *kg.peek_pattern(*r3->pattern_id);
    assert(near(after.confidence, before.confidence));
    assert(after.last_accessed == before.last_accessed);
    assert(std::get<int64_t>(after.metadata.at("observations")) == 4);

    // A strict schema without the observation keys blocks promotion and
    // leaves the sighting count untouched
    MetadataSchema strict;
    strict.fields = {{"language", MetadataType::String}};
    strict.strict = true;
    kg.set_metadata_schema(strict);
    Observation other;
    other.title = "Pin dependency versions";
    assert(kg.observe(other).ok());
    assert(kg.observe(other).ok());
    assert(kg.observe(other).status.code == ErrorCode::Validation);
    assert(kg.pattern_count() == 1);

    kg.set_metadata_schema(MetadataSchema::defaults());
    auto promoted = kg.observe(other);
    assert(promoted.ok() && promoted->promoted && promoted->observations == 3);
    assert(kg.pattern_count() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_kg_metadata() {
    std::cout << "Testing KnowledgeGraph metadata..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_metadata");
    KnowledgeGraph kg(dir + "/kg.db", KnowledgeGraphConfig{}, clock);
    assert(kg.open());

    Pattern good = make_pattern("Typed", "metadata");
    good.metadata["language"] = std::string("cpp");
    good.metadata["files"] = std::vector<std::string>{"a.cpp", "b.cpp"};
    good.metadata["success_rate"] = int64_t{1};      // Integer accepted as real
    good.metadata["verified"] = true;
    good.metadata["custom"] = 2.5;                    // Unknown keys allowed when not strict
    auto id = kg.add_pattern(good);
    assert(id.ok());

    auto p = kg.peek_pattern(*id);
    assert(std::get<std::string>(p->metadata.at("language")) == "cpp");
    assert(std::get<std::vector<std::string>>(p->metadata.at("files")).size() == 2);
    assert(std::get<bool>(p->metadata.at("verified")));

    Pattern wrong = make_pattern("Wrong", "types");
    wrong.metadata["verified"] = std::string("yes");
    assert(kg.add_pattern(wrong).status.code == ErrorCode::Validation);

    MetadataSchema strict = MetadataSchema::defaults();
    strict.strict = true;
    kg.set_metadata_schema(strict);
    Pattern unknown = make_pattern("Unknown", "key");
    unknown.metadata["custom"] = true;
    assert(kg.add_pattern(unknown).status.code == ErrorCode::Validation);
    assert(kg.metadata_schema().strict);

    std::cout << "  PASS" << std::endl;
}

void test_kg_export_import() {
    std::cout << "Testing KnowledgeGraph export/import..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_transfer");

    KnowledgeGraph source(dir + "/source.db", KnowledgeGraphConfig{}, clock);
    assert(source.open());
    PatternId a = *source.add_pattern(make_pattern("Shared title", "from source", {"x"}));
    PatternId b = *source.add_pattern(make_pattern("Only in source", "body", {"y"}));
    assert(source.link_patterns(b, a, RelationshipKind::Extends, 0.6f));
    json doc = source.export_patterns();
    assert(doc["format"] == "cortex-patterns");
    assert(doc["patterns"].size() == 2 && doc["relationships"].size() == 1);

    KnowledgeGraph target(dir + "/target.db", KnowledgeGraphConfig{}, clock);
    assert(target.open());
    PatternId existing = *target.add_pattern(make_pattern("shared TITLE", "already here"));

    auto report = target.import_patterns(doc);
    assert(report.ok());
    assert(report->imported == 1 && report->skipped == 1 && report->relationships == 1);
    assert(target.pattern_count() == 2);

    // The imported edge points at the pattern that was already there
    auto found = target.search_patterns("\"only in source\"");
    assert(found.ok() && found->size() == 1);
    auto related = target.get_related_patterns((*found)[0].pattern.id, RelationshipKind::Extends, 1);
    assert(related.ok() && related->size() == 1 && (*related)[0].pattern.id == existing);

    assert(target.import_patterns(json{{"nothing", 1}}).status.code == ErrorCode::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_kg_recovery() {
    std::cout << "Testing KnowledgeGraph corruption recovery..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("kg_recover");
    std::string path = dir + "/kg.db";
    {
        KnowledgeGraph kg(path, KnowledgeGraphConfig{}, clock);
        assert(kg.open());
        assert(kg.add_pattern(make_pattern("Kept", "in backup")).ok());
        assert(kg.backup());
        assert(kg.add_pattern(make_pattern("Lost", "after backup")).ok());
        kg.close();
    }

    corrupt_file(path);
    KnowledgeGraph kg(path, KnowledgeGraphConfig{}, clock);
    assert(kg.open());
    assert(kg.open_report().outcome == OpenReport::Outcome::Restored);
    assert(kg.pattern_count() == 1);
    auto kept = kg.search_patterns("kept");
    assert(kept.ok() && kept->size() == 1);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Tier C: context intelligence
// ═══════════════════════════════════════════════════════════════════════════

static CommitRecord commit(const std::string& hash, DayNumber day, std::vector<std::string> files,
                           const std::string& author = "ana") {
    CommitRecord c;
    c.hash = hash;
    c.author = author;
    c.day = day;
    for (auto& f : files) c.files.push_back({std::move(f), 10, 2});
    return c;
}

void test_numstat_parse() {
    std::cout << "Testing numstat parsing..." << std::endl;

    std::string text =
        "@@abc123|2024-03-01|Ana Lima\n"
        "10\t2\tsrc/a.cpp\n"
        "-\t-\tassets/logo.png\n"
        "\n"
        "@@def456|2024-03-02|Bo\n"
        "1\t1\tsrc/a.cpp\n";
    auto commits = parse_numstat(text);
    assert(commits.ok() && commits->size() == 2);
    const auto& c0 = (*commits)[0];
    assert(c0.hash == "abc123" && c0.author == "Ana Lima");
    assert(c0.day == days_from_civil(2024, 3, 1));
    assert(c0.files.size() == 2);
    assert(c0.files[0].added == 10 && c0.files[0].removed == 2);
    assert(c0.files[1].path == "assets/logo.png" && c0.files[1].added == 0);

    auto empty = parse_numstat("");
    assert(empty.ok() && empty->empty());

    assert(parse_numstat("1\t2\tsrc/a.cpp\n").status.code == ErrorCode::Validation);
    assert(parse_numstat("@@abc|not-a-date|Ana\n").status.code == ErrorCode::Validation);
    assert(parse_numstat("@@abc|2024-03-01|Ana\nx\ty\n").status.code == ErrorCode::Validation);
    assert(parse_numstat("@@abc|2024-03-01|Ana\nx\ty\tz.cpp\n").status.code == ErrorCode::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_hotspot_monotonicity() {
    std::cout << "Testing hotspot classification monotonicity..." << std::endl;

    int previous = -1;
    for (int i = 0; i <= 100; ++i) {
        float rate = i / 100.0f;
        int level = static_cast<int>(classify_churn(rate, 0.10f, 0.20f));
        assert(level >= previous);
        previous = level;
    }
    assert(classify_churn(0.05f, 0.10f, 0.20f) == Stability::Stable);
    assert(classify_churn(0.15f, 0.10f, 0.20f) == Stability::Moderate);
    assert(classify_churn(0.50f, 0.10f, 0.20f) == Stability::Unstable);

    Stability parsed;
    assert(parse_stability("unstable", parsed) && parsed == Stability::Unstable);
    assert(!parse_stability("shaky", parsed));

    std::cout << "  PASS" << std::endl;
}

void test_context_collection_throttle() {
    std::cout << "Testing ContextIntelligence collection throttle..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("ctx_throttle");
    auto source = std::make_shared<InMemoryCommitSource>("repo");
    DayNumber today = day_of(T0);
    source->add(commit("c1", today - 2, {"a.cpp", "b.cpp"}, "ana"));
    source->add(commit("c2", today - 2, {"a.cpp"}, "bo"));
    source->add(commit("c3", today - 1, {"c.cpp"}));
    source->add(commit("c4", today, {"d.cpp"}));      // Day still in progress

    ContextIntelligence ctx(dir + "/ctx.db", ContextConfig{}, clock, source);
    assert(ctx.open());

    auto first = ctx.collect_git_metrics();
    assert(first.ok());
    assert(first->written == 30 && first->snapshots.size() == 30);
    assert(ctx.snapshot_count() == 30);

    const MetricSnapshot& two_days_ago = first->snapshots[28];
    assert(two_days_ago.day == today - 2);
    assert(two_days_ago.commits == 2 && two_days_ago.contributors == 2);
    assert(two_days_ago.files_changed == 2);
    assert(two_days_ago.lines_added == 30 && two_days_ago.net_growth() == 24);
    assert(first->snapshots.back().day == today - 1);

    // Ten minutes later: throttled, prior result returned
    clock->advance(10 * MS_PER_MINUTE);
    auto second = ctx.collect_git_metrics();
    assert(second.status.code == ErrorCode::Throttled);
    assert(second.value.has_value());
    assert(second->collected_at == first->collected_at);
    assert(second->snapshots.size() == first->snapshots.size());
    assert(ctx.throttle().remaining_ms("repo") == 50 * MS_PER_MINUTE);

    // After the interval: collected again, but stored days are never rewritten
    clock->advance(51 * MS_PER_MINUTE);
    auto third = ctx.collect_git_metrics();
    assert(third.ok() && third->written == 0);
    assert(ctx.snapshot_count() == 30);

    // Throttle state survives a reopen
    ctx.close();
    ContextIntelligence reopened(dir + "/ctx.db", ContextConfig{}, clock, source);
    assert(reopened.open());
    assert(reopened.collect_git_metrics().status.code == ErrorCode::Throttled);
    auto last = reopened.last_collection();
    assert(last && last->collected_at == third->collected_at);

    // A different scope has its own throttle
    reopened.set_source(std::make_shared<InMemoryCommitSource>("other"));
    assert(reopened.collect_git_metrics(7).ok());

    auto metrics = reopened.get_metrics(30);
    assert(metrics.ok() && metrics->size() == 7);

    std::cout << "  PASS" << std::endl;
}

void test_context_hotspots_and_insights() {
    std::cout << "Testing ContextIntelligence hotspots and insights..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("ctx_hotspots");
    auto source = std::make_shared<InMemoryCommitSource>("repo");
    DayNumber today = day_of(T0);

    // 20 commits, one per day: a.cpp in 10 (0.50), b.cpp in 5 (0.25),
    // c.cpp in 3 (0.15), d.cpp in 1 (0.05)
    for (int i = 0; i < 20; ++i) {
        std::vector<std::string> files{"other" + std::to_string(i) + ".txt"};
        if (i % 2 == 0) files.push_back("src/a.cpp");
        if (i % 4 == 0) files.push_back("src/b.cpp");
        if (i == 1 || i == 3 || i == 5) files.push_back("src/c.cpp");
        if (i == 7) files.push_back("src/d.cpp");
        source->add(commit("h" + std::to_string(i), today - 20 + i, files));
    }

    ContextIntelligence ctx(dir + "/ctx.db", ContextConfig{}, clock, source);
    assert(ctx.open());

    auto hotspots = ctx.analyze_file_hotspots();
    assert(hotspots.ok());
    const FileHotspot& top = (*hotspots)[0];
    assert(top.path == "src/a.cpp");
    assert(top.total_commits == 20 && top.file_edits == 10);
    assert(near(top.churn_rate, 0.5f));
    assert(top.stability == Stability::Unstable);

    auto find = [&hotspots](const std::string& path) {
        for (const auto& h : *hotspots) {
            if (h.path == path) return h;
        }
        return FileHotspot{};
    };
    assert(find("src/b.cpp").stability == Stability::Unstable);
    assert(find("src/c.cpp").stability == Stability::Moderate);
    assert(find("src/d.cpp").stability == Stability::Stable);

    // Churn never decreases severity
    for (size_t i = 1; i < hotspots->size(); ++i) {
        assert((*hotspots)[i - 1].churn_rate >= (*hotspots)[i].churn_rate);
        assert((*hotspots)[i - 1].stability >= (*hotspots)[i].stability);
    }

    auto unstable = ctx.get_hotspots(20, Stability::Unstable);
    assert(unstable.ok() && unstable->size() == 2);
    auto limited = ctx.get_hotspots(1);
    assert(limited.ok() && limited->size() == 1 && (*limited)[0].path == "src/a.cpp");

    // One commit a day in both halves: stable velocity
    assert(ctx.collect_git_metrics().ok());
    auto velocity = ctx.analyze_velocity();
    assert(velocity.ok() && velocity->trend == Trend::Stable);
    assert(velocity->previous == 7 && velocity->current == 7);

    auto insights = ctx.generate_insights();
    assert(insights.ok() && insights->size() == 2);
    auto stored = ctx.get_insights();
    assert(stored.ok() && stored->size() == 2);
    assert((*stored)[0].severity == Severity::Warning);
    assert((*stored)[0].related == "src/a.cpp");
    assert((*stored)[0].kind == InsightKind::FileHotspot);
    assert((*stored)[1].severity == Severity::Info);
    assert((*stored)[1].related == "src/b.cpp");

    // Regenerating replaces rather than appends
    assert(ctx.generate_insights().ok());
    assert(ctx.get_insights()->size() == 2);

    auto summary = ctx.context_summary(30);
    assert(summary.ok() && summary->total_commits == 20);
    assert(summary->unstable_files.size() == 2);

    std::cout << "  PASS" << std::endl;
}

void test_context_write_batches() {
    std::cout << "Testing ContextIntelligence batched writes..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("ctx_batches");
    auto source = std::make_shared<InMemoryCommitSource>("repo");
    DayNumber today = day_of(T0);
    for (int i = 0; i < 20; ++i) {
        std::vector<std::string> files{"other" + std::to_string(i) + ".txt"};
        if (i % 2 == 0) files.push_back("src/a.cpp");
        if (i % 4 == 0) files.push_back("src/b.cpp");
        source->add(commit("b" + std::to_string(i), today - 20 + i, files));
    }

    ContextConfig config;
    config.write_batch_size = 7;
    ContextIntelligence ctx(dir + "/ctx.db", config, clock, source);
    assert(ctx.open());

    // 30 days in batches of 7, 7, 7, 7, 2
    auto collected = ctx.collect_git_metrics();
    assert(collected.ok());
    assert(collected->written == 30 && collected->batches == 5);
    assert(ctx.snapshot_count() == 30);
    for (size_t i = 1; i < collected->snapshots.size(); ++i) {
        assert(collected->snapshots[i - 1].day + 1 == collected->snapshots[i].day);
    }
    assert(collected->snapshots[29].commits == 1);

    // 22 files across four batches
    auto wide = ctx.analyze_file_hotspots();
    assert(wide.ok() && wide->size() == 22);
    assert(ctx.get_hotspots(100)->size() == 22);

    // A narrower analysis leaves none of the earlier rows behind
    auto narrow = ctx.analyze_file_hotspots(5);
    assert(narrow.ok() && narrow->size() == 7);
    auto stored = ctx.get_hotspots(100);
    assert(stored.ok() && stored->size() == 7);
    for (const auto& h : *stored) assert(h.total_commits == 5);

    CortexConfig bad;
    bad.context.write_batch_size = 0;
    assert(validate_config(bad).code == ErrorCode::Validation);

    std::cout << "  PASS" << std::endl;
}

void test_context_velocity_drop() {
    std::cout << "Testing ContextIntelligence velocity drop..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("ctx_velocity");
    auto source = std::make_shared<InMemoryCommitSource>("repo");
    DayNumber today = day_of(T0);

    // Two commits a day in the older half, one commit in the newer half
    for (int d = 14; d > 7; --d) {
        source->add(commit("a" + std::to_string(d), today - d, {"x.cpp"}));
        source->add(commit("b" + std::to_string(d), today - d, {"y.cpp"}));
    }
    source->add(commit("late", today - 3, {"x.cpp"}));

    ContextIntelligence ctx(dir + "/ctx.db", ContextConfig{}, clock, source);
    assert(ctx.open());
    assert(ctx.collect_git_metrics().ok());

    auto v = ctx.analyze_velocity();
    assert(v.ok());
    assert(v->previous == 14 && v->current == 1);
    assert(v->trend == Trend::Decreasing);

    auto insights = ctx.generate_insights();
    assert(insights.ok() && insights->size() == 1);
    assert((*insights)[0].kind == InsightKind::VelocityDrop);
    assert((*insights)[0].severity == Severity::Error);

    // A one day window has no halves to compare
    assert(ctx.analyze_velocity(1).status.code == ErrorCode::Validation);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Scheduling and routing
// ═══════════════════════════════════════════════════════════════════════════

void test_scheduler() {
    std::cout << "Testing Scheduler..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    Scheduler scheduler(clock);
    int runs = 0;

    JobSpec job;
    job.name = "decay";
    job.interval_ms = MS_PER_HOUR;
    job.event_threshold = 3;
    job.run = [&runs]() { runs++; return Status::ok(); };
    assert(scheduler.add_job(job));
    assert(scheduler.add_job(job).code == ErrorCode::Validation);

    JobSpec no_trigger;
    no_trigger.name = "never";
    no_trigger.interval_ms = 0;
    no_trigger.run = []() { return Status::ok(); };
    assert(scheduler.add_job(no_trigger).code == ErrorCode::Validation);

    // Nothing due yet
    assert(scheduler.tick().empty());

    // Event threshold
    scheduler.record_event(2);
    assert(scheduler.due().empty());
    scheduler.record_event();
    assert(scheduler.due() == std::vector<std::string>({"decay"}));
    auto ran = scheduler.tick();
    assert(ran.size() == 1 && ran[0].trigger == "events" && ran[0].status);
    assert(runs == 1 && scheduler.pending_events("decay") == 0);

    // Elapsed time
    clock->advance(MS_PER_HOUR - 1);
    assert(scheduler.tick().empty());
    clock->advance(1);
    ran = scheduler.tick();
    assert(ran.size() == 1 && ran[0].trigger == "interval");
    assert(runs == 2 && scheduler.run_count("decay") == 2);

    // Failing and throwing jobs are reported, not propagated
    JobSpec failing;
    failing.name = "collect";
    failing.interval_ms = MS_PER_MINUTE;
    failing.run = []() -> Status { throw std::runtime_error("git missing"); };
    assert(scheduler.add_job(failing));
    clock->advance(MS_PER_MINUTE);
    ran = scheduler.tick();
    assert(ran.size() == 1 && ran[0].name == "collect");
    assert(ran[0].status.code == ErrorCode::Io);
    assert(scheduler.job_count() == 2);

    assert(scheduler.remove_job("collect"));
    assert(!scheduler.remove_job("collect"));
    assert(scheduler.job_count() == 1);
    clock->advance(MS_PER_MINUTE);
    assert(scheduler.tick().empty());

    // Background driver starts and stops cleanly
    MaintenanceDaemon daemon(scheduler, 10);
    assert(!daemon.is_running());
    daemon.start();
    assert(daemon.is_running());
    daemon.stop();
    assert(!daemon.is_running());

    // A long poll interval does not delay stop: the wakeup is never lost
    for (int i = 0; i < 20; ++i) {
        MaintenanceDaemon slow(scheduler, 60 * MS_PER_SECOND);
        slow.start();
        auto started = std::chrono::steady_clock::now();
        slow.stop();
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        assert(waited < 5000);
    }

    std::cout << "  PASS" << std::endl;
}

void test_query_router() {
    std::cout << "Testing QueryRouter..." << std::endl;

    QueryRouter router;

    auto tags = router.route("#Refactor [cpp]");
    assert(tags.intent == QueryIntent::TagFilter);
    assert(tags.tags == std::vector<std::string>({"refactor", "cpp"}));
    assert(tags.text.empty());

    auto file = router.route("why does src/store.cpp crash?");
    assert(file.intent == QueryIntent::FileContext);
    assert(file.files == std::vector<std::string>({"src/store.cpp"}));

    auto mixed = router.route("#perf slow queries");
    assert(mixed.intent == QueryIntent::Keyword);
    assert(mixed.tags == std::vector<std::string>({"perf"}));
    assert(mixed.text == "slow queries");

    auto keyword = router.route("how does decay work");
    assert(keyword.intent == QueryIntent::Keyword);
    assert(keyword.files.empty());

    assert(std::string(QueryRouter::intent_name(QueryIntent::TagFilter)) == "tag");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Facade
// ═══════════════════════════════════════════════════════════════════════════

static CortexConfig memory_config(const std::string& dir) {
    CortexConfig config;
    config.base_dir = dir;
    config.scheduler.event_threshold = 2;
    return config;
}

static std::shared_ptr<InMemoryCommitSource> sample_history() {
    auto source = std::make_shared<InMemoryCommitSource>("repo");
    DayNumber today = day_of(T0);
    for (int i = 0; i < 10; ++i) {
        std::vector<std::string> files{"docs/notes" + std::to_string(i) + ".md"};
        if (i % 2 == 0) files.push_back("src/store.cpp");
        source->add(commit("m" + std::to_string(i), today - 10 + i, files));
    }
    return source;
}

void test_memory_record_and_query() {
    std::cout << "Testing Memory record/query..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("memory_query");
    Memory memory(memory_config(dir), clock, sample_history());
    assert(memory.open());
    TierReports reports = memory.reports();
    assert(reports.working_memory.outcome == OpenReport::Outcome::Created);
    assert(reports.knowledge_graph.outcome == OpenReport::Outcome::Created);
    assert(reports.context.outcome == OpenReport::Outcome::Created);

    // A bad turn anywhere rejects the whole interaction
    Interaction bad;
    bad.session_id = "s1";
    bad.turns = {user_turn("fine"), user_turn("")};
    assert(memory.record_interaction(bad).status.code == ErrorCode::Validation);
    assert(memory.working_memory()->count() == 0);

    Interaction interaction;
    interaction.session_id = "s1";
    interaction.turns = {user_turn("Let's refactor the store module"), user_turn("Start with the writer")};
    interaction.turns[1].role = "assistant";
    interaction.files = {"src/store.cpp"};
    interaction.entities = {{EntityKind::Concept, "storage"}};
    interaction.intent = "refactoring";
    auto id = memory.record_interaction(interaction);
    assert(id.ok());

    auto conv = memory.working_memory()->get_conversation(*id);
    assert(conv.ok() && conv->turns.size() == 2 && conv->intent == "refactoring");

    Interaction anonymous;
    anonymous.turns = {user_turn("Unrelated question about builds")};
    auto anon_id = memory.record_interaction(anonymous);
    assert(anon_id.ok());
    assert(!memory.working_memory()->get_conversation(*anon_id)->session_id.empty());

    auto pattern = memory.add_pattern(make_pattern("Refactoring Workflow", "Small steps", {"refactor"}));
    assert(pattern.ok());
    assert(memory.add_pattern(make_pattern("Writer lock", "One writer", {"refactor", "store"})).ok());
    auto other = memory.add_pattern(make_pattern("Build caching", "Cache objects", {"build"}));
    assert(other.ok());
    assert(memory.link_patterns(*pattern, *other, RelationshipKind::RelatedTo, 0.5f));
    assert(memory.link_patterns(*pattern, 999, RelationshipKind::RelatedTo).code == ErrorCode::Integrity);

    // Keyword
    ContextRequest request;
    request.query = "refactor";
    ContextBundle bundle = memory.query_context(request);
    assert(!bundle.partial && bundle.excluded_tiers.empty());
    assert(bundle.route.intent == QueryIntent::Keyword);
    assert(bundle.recent_conversations.size() == 1 && bundle.recent_conversations[0].id == *id);
    assert(bundle.matched_patterns.size() == 2);

    // Tag filter
    request.query = "#refactor #store";
    bundle = memory.query_context(request);
    assert(bundle.route.intent == QueryIntent::TagFilter);
    assert(bundle.matched_patterns.size() == 1);
    assert(bundle.matched_patterns[0].pattern.title == "Writer lock");
    assert(bundle.recent_conversations.size() == 2);

    // File context, with the file's insight first
    MaintenanceReport report = memory.run_maintenance();
    assert(report.errors.empty());
    assert(report.collection && !report.collection_throttled);
    assert(report.hotspots > 0 && report.insights > 0 && report.backups == 3);

    request.query = "what changed in src/store.cpp";
    request.max_conversations = 1;
    bundle = memory.query_context(request);
    assert(bundle.route.intent == QueryIntent::FileContext);
    assert(bundle.recent_conversations.size() == 1 && bundle.recent_conversations[0].id == *id);
    assert(!bundle.insights.empty() && bundle.insights[0].related == "src/store.cpp");

    MemoryStats stats = memory.stats();
    assert(stats.conversations == 2);
    assert(stats.patterns == 3 && stats.relationships == 1);
    assert(stats.snapshots == 30);
    assert(stats.insights == report.insights);

    std::cout << "  PASS" << std::endl;
}

void test_memory_partial_results() {
    std::cout << "Testing Memory partial results..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("memory_partial");
    Memory memory(memory_config(dir), clock, sample_history());
    assert(memory.open());

    Interaction interaction;
    interaction.session_id = "s";
    interaction.turns = {user_turn("Investigate slow decay")};
    assert(memory.record_interaction(interaction).ok());
    assert(memory.add_pattern(make_pattern("Decay batches", "Bounded passes", {"decay"})).ok());

    // Hold the knowledge graph read past its budget
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    memory.on_tier_read([released](const std::string& tier) {
        if (tier == tier_names::KNOWLEDGE_GRAPH) released.wait();
    });

    ContextRequest request;
    request.query = "decay";
    auto started = std::chrono::steady_clock::now();
    ContextBundle bundle = memory.query_context(request, std::chrono::milliseconds(400));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    assert(bundle.partial);
    assert(bundle.excluded_tiers == std::vector<std::string>({tier_names::KNOWLEDGE_GRAPH}));
    assert(bundle.matched_patterns.empty());
    assert(bundle.recent_conversations.size() == 1);
    assert(elapsed < 400);
    assert(memory.outstanding_reads() == 1);

    // Repeated queries against the stalled tier do not pile up workers
    for (int i = 0; i < 5; ++i) {
        bundle = memory.query_context(request, std::chrono::milliseconds(400));
        assert(bundle.excluded_tiers == std::vector<std::string>({tier_names::KNOWLEDGE_GRAPH}));
        assert(bundle.recent_conversations.size() == 1);
    }
    assert(memory.outstanding_reads() == 1);

    release.set_value();
    for (int i = 0; i < 400 && memory.outstanding_reads() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(memory.outstanding_reads() == 0);

    // Without the stall everything comes back
    memory.on_tier_read(nullptr);
    bundle = memory.query_context(request);
    assert(!bundle.partial);
    assert(bundle.matched_patterns.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_memory_maintenance_schedule() {
    std::cout << "Testing Memory scheduled maintenance..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("memory_schedule");
    Memory memory(memory_config(dir), clock, sample_history());
    assert(memory.open());

    auto scheduler = std::make_shared<Scheduler>(clock);
    assert(memory.attach_scheduler(scheduler));

    Pattern stale = make_pattern("Stale advice", "old");
    stale.created_at = T0 - 65 * MS_PER_DAY;
    assert(memory.add_pattern(stale).ok());
    assert(scheduler->due().empty());

    Interaction interaction;
    interaction.session_id = "s";
    interaction.turns = {user_turn("hello")};
    assert(memory.record_interaction(interaction).ok());

    // Two writes reach the event threshold
    assert(scheduler->due() == std::vector<std::string>({"maintenance"}));
    auto runs = scheduler->tick();
    assert(runs.size() == 1 && runs[0].status);
    auto p = memory.knowledge_graph()->search_patterns("stale");
    assert(p.ok() && near((*p)[0].pattern.confidence, 0.9f));
    assert(fs::exists(dir + "/knowledge_graph.db.bak"));

    // Second pass inside the hour: collection throttled, decay idempotent
    MaintenanceReport report = memory.run_maintenance();
    assert(report.errors.empty());
    assert(report.collection_throttled && report.collection);
    assert(report.decay.decayed_count == 0);
    assert(memory.backup());

    std::cout << "  PASS" << std::endl;
}

void test_memory_retention_cap() {
    std::cout << "Testing Memory retention cap..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("memory_retention");
    Memory memory(memory_config(dir), clock, sample_history());
    assert(memory.open());

    // Same instant, distinct sessions: age ties break on the lowest id
    std::vector<ConversationId> ids;
    for (int i = 0; i < 21; ++i) {
        Interaction interaction;
        interaction.session_id = "s" + std::to_string(i);
        interaction.turns = {user_turn("question " + std::to_string(i))};
        auto id = memory.record_interaction(interaction);
        assert(id.ok());
        ids.push_back(*id);
    }

    auto wm = memory.working_memory();
    assert(wm->count() == 20);
    assert(wm->get_conversation(ids[0]).status.code == ErrorCode::NotFound);
    assert(wm->get_conversation(ids[1]).ok());
    assert(wm->get_conversation(ids[20]).ok());
    assert(wm->get_conversation(ids[20])->closed);

    auto evictions = wm->eviction_log();
    assert(evictions.ok() && evictions->size() == 1);
    assert((*evictions)[0].conversation_id == ids[0]);

    std::cout << "  PASS" << std::endl;
}

void test_memory_scheduler_lifetime() {
    std::cout << "Testing Memory scheduler lifetime..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    Interaction interaction;
    interaction.session_id = "s";
    interaction.turns = {user_turn("hello")};

    // Scheduler outlives the facade: the job goes with it
    auto outliving = std::make_shared<Scheduler>(clock);
    {
        Memory memory(memory_config(fresh_dir("memory_lifetime_a")), clock, sample_history());
        assert(memory.open());
        assert(memory.attach_scheduler(outliving));
        assert(outliving->job_count() == 1);
        assert(memory.record_interaction(interaction).ok());
        assert(outliving->pending_events(Memory::MAINTENANCE_JOB) == 1);
    }
    assert(outliving->job_count() == 0);
    outliving->record_event(10);
    clock->advance(2 * MS_PER_HOUR);
    assert(outliving->tick().empty());

    // Facade outlives the scheduler: writes go on without it
    Memory memory(memory_config(fresh_dir("memory_lifetime_b")), clock, sample_history());
    assert(memory.open());
    auto short_lived = std::make_shared<Scheduler>(clock);
    assert(memory.attach_scheduler(short_lived));
    short_lived.reset();
    assert(memory.record_interaction(interaction).ok());
    memory.detach_scheduler();

    // Re-attaching replaces the job instead of failing on the name
    auto first = std::make_shared<Scheduler>(clock);
    assert(memory.attach_scheduler(first));
    assert(memory.attach_scheduler(first));
    assert(first->job_count() == 1);
    memory.detach_scheduler();
    assert(first->job_count() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_memory_tier_isolation() {
    std::cout << "Testing Memory tier isolation on corruption..." << std::endl;

    auto clock = std::make_shared<ManualClock>(T0);
    std::string dir = fresh_dir("memory_isolation");
    {
        Memory memory(memory_config(dir), clock, sample_history());
        assert(memory.open());
        Interaction interaction;
        interaction.session_id = "s";
        interaction.turns = {user_turn("remember this")};
        assert(memory.record_interaction(interaction).ok());
        assert(memory.add_pattern(make_pattern("Gone", "no backup")).ok());
    }

    corrupt_file(dir + "/knowledge_graph.db");

    Memory memory(memory_config(dir), clock, sample_history());
    assert(memory.open());
    TierReports reports = memory.reports();
    assert(reports.knowledge_graph.outcome == OpenReport::Outcome::Reset);
    assert(reports.working_memory.outcome == OpenReport::Outcome::Opened);
    assert(memory.working_memory()->count() == 1);
    assert(memory.knowledge_graph()->pattern_count() == 0);

    // The recovered tier is usable straight away
    assert(memory.add_pattern(make_pattern("Fresh", "after reset")).ok());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Cortex C++ Tests ===" << std::endl;
    std::cout << "cortex " << CORTEX_VERSION << std::endl;
    std::cout << std::endl;
    log::set_quiet(true);

    test_status_result();
    test_config();
    test_version();
    test_days();

    std::cout << std::endl;
    std::cout << "=== Record Store ===" << std::endl;
    test_record_store_transactions();
    test_record_store_migration();
    test_record_store_recovery();

    std::cout << std::endl;
    std::cout << "=== Working Memory ===" << std::endl;
    test_wm_fifo_bound();
    test_wm_active_immunity();
    test_wm_entities();
    test_wm_extraction_failure();
    test_wm_search();

    std::cout << std::endl;
    std::cout << "=== Knowledge Graph ===" << std::endl;
    test_query_parser();
    test_tag_index();
    test_kg_round_trip();
    test_kg_relationships();
    test_kg_search();
    test_kg_relevance_determinism();
    test_kg_decay();
    test_kg_decay_batches();
    test_kg_bulk_delete();
    test_kg_observe();
    test_kg_metadata();
    test_kg_export_import();
    test_kg_recovery();

    std::cout << std::endl;
    std::cout << "=== Context Intelligence ===" << std::endl;
    test_numstat_parse();
    test_hotspot_monotonicity();
    test_context_collection_throttle();
    test_context_hotspots_and_insights();
    test_context_write_batches();
    test_context_velocity_drop();

    std::cout << std::endl;
    std::cout << "=== Scheduling and Facade ===" << std::endl;
    test_scheduler();
    test_query_router();
    test_memory_record_and_query();
    test_memory_partial_results();
    test_memory_maintenance_schedule();
    test_memory_retention_cap();
    test_memory_scheduler_lifetime();
    test_memory_tier_isolation();

    std::cout << std::endl;
    std::cout << "=== All tests passed ===" << std::endl;
    return 0;
}
