#pragma once
// RecordStore: transactional JSON records over one SQLite file
//
// Each table is (key TEXT PRIMARY KEY, body TEXT) with the record kept as
// a JSON document. Declared fields get json_extract expression indexes so
// find() is an indexed lookup; unique field groups become unique indexes.
//
// Connections:
//   writer_  serialized by write_mutex_, owns every transaction
//   reader_  separate WAL connection, sees only committed state
//
// Recovery: open() runs quick_check. A store that fails it is moved aside
// as <file>.corrupt.<ts>, then <file>.bak is restored if it is healthy,
// otherwise the tier starts empty. OpenReport says which happened.

#include "../log.hpp"
#include "../status.hpp"
#include "../types.hpp"
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cortex {

using json = nlohmann::json;

struct TableSpec {
    std::string name;
    std::vector<std::string> indexed;                 // Single-field lookup indexes
    std::vector<std::vector<std::string>> unique;     // Unique field groups
};

struct Record {
    std::string key;
    json body;
};

// Zero-padded numeric key so ORDER BY key follows id order
inline std::string id_key(int64_t id) {
    char buf[24];
    snprintf(buf, sizeof(buf), "%012lld", static_cast<long long>(id));
    return buf;
}

class Transaction;

struct Migration {
    int from;
    int to;
    std::string description;
    std::function<Status(Transaction&)> apply;
};

struct StoreSchema {
    int version = 1;
    std::vector<TableSpec> tables;
    std::vector<Migration> migrations;
};

struct OpenReport {
    enum class Outcome {
        Opened,      // Existing store, current schema
        Created,     // No file, fresh store
        Migrated,    // Schema upgraded in place
        Restored,    // Corrupt store replaced by its backup
        Reset,       // Corrupt store, no usable backup, started empty
    };

    Outcome outcome = Outcome::Opened;
    int from_version = 0;
    int to_version = 0;
    std::string corrupt_path;   // Where the bad file was moved
    std::string message;

    bool recovered() const { return outcome == Outcome::Restored || outcome == Outcome::Reset; }
};

inline const char* outcome_name(OpenReport::Outcome o) {
    switch (o) {
        case OpenReport::Outcome::Opened:   return "opened";
        case OpenReport::Outcome::Created:  return "created";
        case OpenReport::Outcome::Migrated: return "migrated";
        case OpenReport::Outcome::Restored: return "restored";
        case OpenReport::Outcome::Reset:    return "reset";
    }
    return "unknown";
}

// ═══════════════════════════════════════════════════════════════════════════
// SQLite helpers
// ═══════════════════════════════════════════════════════════════════════════

namespace sql {

// Map an SQLite result code onto the error taxonomy
inline Status status_from(int rc, sqlite3* db, const std::string& context) {
    std::string msg = context + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
    switch (rc & 0xff) {
        case SQLITE_OK:
        case SQLITE_DONE:
        case SQLITE_ROW:
            return Status::ok();
        case SQLITE_CONSTRAINT:
            return Status::integrity(msg);
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Status::corruption(msg);
        default:
            return Status::io(msg);
    }
}

// Prepared statement, finalized on scope exit
class Statement {
public:
    Statement(sqlite3* db, const std::string& text) {
        rc_ = sqlite3_prepare_v2(db, text.c_str(), -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
    int rc() const { return rc_; }

    void bind(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }
    void bind(int idx, int64_t value) { sqlite3_bind_int64(stmt_, idx, value); }
    void bind(int idx, double value) { sqlite3_bind_double(stmt_, idx, value); }
    void bind_null(int idx) { sqlite3_bind_null(stmt_, idx); }

    // Bind a JSON scalar the way json_extract reports it
    void bind_json(int idx, const json& value) {
        if (value.is_string()) bind(idx, value.get<std::string>());
        else if (value.is_boolean()) bind(idx, static_cast<int64_t>(value.get<bool>() ? 1 : 0));
        else if (value.is_number_integer()) bind(idx, value.get<int64_t>());
        else if (value.is_number()) bind(idx, value.get<double>());
        else if (value.is_null()) bind_null(idx);
        else bind(idx, value.dump());
    }

    int step() { return sqlite3_step(stmt_); }

    std::string column_text(int col) const {
        auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return text ? std::string(text, sqlite3_column_bytes(stmt_, col)) : std::string();
    }
    int64_t column_int(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_;
};

inline Status exec(sqlite3* db, const std::string& text) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, text.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        Status s = status_from(rc, nullptr, text.substr(0, 64));
        s.message = text.substr(0, 64) + ": " + msg;
        return s;
    }
    return Status::ok();
}

// Quote an identifier. Table and field names come from code, not users,
// but quoting keeps odd names from breaking the DDL.
inline std::string ident(const std::string& name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

inline std::string json_path(const std::string& field) {
    std::string out = "'$.";
    for (char c : field) {
        if (c == '\'') out += '\'';
        out += c;
    }
    return out + "'";
}

inline Status quick_check(sqlite3* db) {
    Statement stmt(db, "PRAGMA quick_check");
    if (!stmt.ok()) return status_from(stmt.rc(), db, "quick_check");
    int rc = stmt.step();
    if (rc != SQLITE_ROW) return status_from(rc, db, "quick_check");
    std::string verdict = stmt.column_text(0);
    if (verdict != "ok") return Status::corruption("quick_check: " + verdict);
    return Status::ok();
}

inline Result<int> user_version(sqlite3* db) {
    Statement stmt(db, "PRAGMA user_version");
    if (!stmt.ok()) return status_from(stmt.rc(), db, "user_version");
    int rc = stmt.step();
    if (rc != SQLITE_ROW) return status_from(rc, db, "user_version");
    return static_cast<int>(stmt.column_int(0));
}

// Open a connection and make sure the file really is a healthy database.
// sqlite3_open succeeds on garbage; the first read is what fails.
inline Status open_checked(const std::string& path, int flags, sqlite3** out) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        Status s = status_from(rc, db, "open " + path);
        sqlite3_close(db);
        return s;
    }
    sqlite3_busy_timeout(db, 5000);
    Status check = quick_check(db);
    if (!check) {
        sqlite3_close(db);
        return check;
    }
    *out = db;
    return Status::ok();
}

} // namespace sql

// ═══════════════════════════════════════════════════════════════════════════
// Transaction: every write goes through one
// ═══════════════════════════════════════════════════════════════════════════

class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {}

    Status put(const std::string& table, const std::string& key, const json& body) {
        sql::Statement stmt(db_, "INSERT INTO " + sql::ident(table) +
            " (key, body) VALUES (?, ?) ON CONFLICT(key) DO UPDATE SET body = excluded.body");
        if (!stmt.ok()) return sql::status_from(stmt.rc(), db_, "put " + table);
        stmt.bind(1, key);
        stmt.bind(2, body.dump());
        int rc = stmt.step();
        if (rc != SQLITE_DONE) return sql::status_from(rc, db_, "put " + table + "/" + key);
        return Status::ok();
    }

    // Insert only; an existing key is an Integrity error
    Status insert(const std::string& table, const std::string& key, const json& body) {
        sql::Statement stmt(db_, "INSERT INTO " + sql::ident(table) + " (key, body) VALUES (?, ?)");
        if (!stmt.ok()) return sql::status_from(stmt.rc(), db_, "insert " + table);
        stmt.bind(1, key);
        stmt.bind(2, body.dump());
        int rc = stmt.step();
        if (rc != SQLITE_DONE) return sql::status_from(rc, db_, "insert " + table + "/" + key);
        return Status::ok();
    }

    Result<json> get(const std::string& table, const std::string& key) const {
        sql::Statement stmt(db_, "SELECT body FROM " + sql::ident(table) + " WHERE key = ?");
        if (!stmt.ok()) return sql::status_from(stmt.rc(), db_, "get " + table);
        stmt.bind(1, key);
        int rc = stmt.step();
        if (rc == SQLITE_DONE) return Status::not_found(table + "/" + key);
        if (rc != SQLITE_ROW) return sql::status_from(rc, db_, "get " + table + "/" + key);
        return parse_body(stmt.column_text(0), table, key);
    }

    bool exists(const std::string& table, const std::string& key) const {
        sql::Statement stmt(db_, "SELECT 1 FROM " + sql::ident(table) + " WHERE key = ?");
        if (!stmt.ok()) return false;
        stmt.bind(1, key);
        return stmt.step() == SQLITE_ROW;
    }

    Result<std::vector<Record>> find(const std::string& table, const std::string& field,
                                     const json& value) const {
        sql::Statement stmt(db_, "SELECT key, body FROM " + sql::ident(table) +
            " WHERE json_extract(body, " + sql::json_path(field) + ") = ? ORDER BY key");
        if (!stmt.ok()) return sql::status_from(stmt.rc(), db_, "find " + table);
        stmt.bind_json(1, value);
        return collect(stmt, table);
    }

    Result<std::vector<Record>> scan(const std::string& table) const {
        sql::Statement stmt(db_, "SELECT key, body FROM " + sql::ident(table) + " ORDER BY key");
        if (!stmt.ok()) return sql::status_from(stmt.rc(), db_, "scan " + table);
        return collect(stmt, table);
    }

    // Returns NotFound when the key was absent
    Status erase(const std::string& table, const std::string& key) {
        sql::Statement stmt(db_, "DELETE FROM " + sql::ident(table) + " WHERE key = ?");
        if (!stmt.ok()) return sql::status_from(stmt.rc(), db_, "erase " + table);
        stmt.bind(1, key);
        int rc = stmt.step();
        if (rc != SQLITE_DONE) return sql::status_from(rc, db_, "erase " + table + "/" + key);
        if (sqlite3_changes(db_) == 0) return Status::not_found(table + "/" + key);
        return Status::ok();
    }

    Result<size_t> erase_where(const std::string& table, const std::string& field, const json& value) {
        sql::Statement stmt(db_, "DELETE FROM " + sql::ident(table) +
            " WHERE json_extract(body, " + sql::json_path(field) + ") = ?");
        if (!stmt.ok()) return sql::status_from(stmt.rc(), db_, "erase_where " + table);
        stmt.bind_json(1, value);
        int rc = stmt.step();
        if (rc != SQLITE_DONE) return sql::status_from(rc, db_, "erase_where " + table);
        return static_cast<size_t>(sqlite3_changes(db_));
    }

    Result<size_t> clear(const std::string& table) {
        Status s = sql::exec(db_, "DELETE FROM " + sql::ident(table));
        if (!s) return s;
        return static_cast<size_t>(sqlite3_changes(db_));
    }

    Result<size_t> count(const std::string& table) const {
        sql::Statement stmt(db_, "SELECT COUNT(*) FROM " + sql::ident(table));
        if (!stmt.ok()) return sql::status_from(stmt.rc(), db_, "count " + table);
        int rc = stmt.step();
        if (rc != SQLITE_ROW) return sql::status_from(rc, db_, "count " + table);
        return static_cast<size_t>(stmt.column_int(0));
    }

    // Monotonic id for a named sequence. Rolled back with the transaction.
    Result<int64_t> next_id(const std::string& sequence) {
        sql::Statement bump(db_,
            "INSERT INTO _sequences (name, value) VALUES (?, 1) "
            "ON CONFLICT(name) DO UPDATE SET value = value + 1");
        if (!bump.ok()) return sql::status_from(bump.rc(), db_, "next_id");
        bump.bind(1, sequence);
        int rc = bump.step();
        if (rc != SQLITE_DONE) return sql::status_from(rc, db_, "next_id " + sequence);

        sql::Statement read(db_, "SELECT value FROM _sequences WHERE name = ?");
        if (!read.ok()) return sql::status_from(read.rc(), db_, "next_id");
        read.bind(1, sequence);
        rc = read.step();
        if (rc != SQLITE_ROW) return sql::status_from(rc, db_, "next_id " + sequence);
        return read.column_int(0);
    }

    // Raise a sequence so it never hands out ids at or below floor
    Status bump_sequence(const std::string& sequence, int64_t floor) {
        sql::Statement stmt(db_,
            "INSERT INTO _sequences (name, value) VALUES (?, ?) "
            "ON CONFLICT(name) DO UPDATE SET value = MAX(value, excluded.value)");
        if (!stmt.ok()) return sql::status_from(stmt.rc(), db_, "bump_sequence");
        stmt.bind(1, sequence);
        stmt.bind(2, floor);
        int rc = stmt.step();
        if (rc != SQLITE_DONE) return sql::status_from(rc, db_, "bump_sequence " + sequence);
        return Status::ok();
    }

    // Raw statement for migrations
    Status exec(const std::string& text) { return sql::exec(db_, text); }

    sqlite3* handle() const { return db_; }

    static Result<json> parse_body(const std::string& text, const std::string& table,
                                   const std::string& key) {
        try {
            return json::parse(text);
        } catch (const json::parse_error& e) {
            return Status::corruption(table + "/" + key + ": unreadable record: " + e.what());
        }
    }

private:
    Result<std::vector<Record>> collect(sql::Statement& stmt, const std::string& table) const {
        std::vector<Record> out;
        int rc;
        while ((rc = stmt.step()) == SQLITE_ROW) {
            std::string key = stmt.column_text(0);
            auto body = parse_body(stmt.column_text(1), table, key);
            if (!body.ok()) return body.status;
            out.push_back({std::move(key), std::move(*body)});
        }
        if (rc != SQLITE_DONE) return sql::status_from(rc, db_, "read " + table);
        return out;
    }

    sqlite3* db_;
};

// ═══════════════════════════════════════════════════════════════════════════
// RecordStore
// ═══════════════════════════════════════════════════════════════════════════

class RecordStore {
public:
    using Predicate = std::function<bool(const Record&)>;

    RecordStore(std::string path, StoreSchema schema, std::string component = "Store")
        : path_(std::move(path)), schema_(std::move(schema)), component_(std::move(component)) {}

    ~RecordStore() { close(); }

    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    // Open, recovering from corruption if needed. Only Io (cannot create
    // the directory or file) and Validation (store from a newer version)
    // are returned as errors.
    Status open(OpenReport& report) {
        namespace fs = std::filesystem;
        std::lock_guard<std::mutex> wlock(write_mutex_);
        std::lock_guard<std::mutex> rlock(read_mutex_);
        close_locked();
        report = OpenReport{};

        std::error_code ec;
        fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) return Status::io("cannot create " + parent.string() + ": " + ec.message());
        }

        bool existed = fs::exists(path_, ec);
        Status s = existed ? sql::open_checked(path_, SQLITE_OPEN_READWRITE, &writer_)
                           : Status::ok();

        if (s.code == ErrorCode::Corruption) {
            log::warn(component_, "Corruption detected in ", path_, ": ", s.message);
            Status r = recover_locked(report);
            if (!r) return r;
        } else if (!s) {
            return s;
        } else if (!existed) {
            report.outcome = OpenReport::Outcome::Created;
        }

        if (!writer_) {
            int rc = sqlite3_open_v2(path_.c_str(), &writer_,
                                     SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
            if (rc != SQLITE_OK) {
                Status err = sql::status_from(rc, writer_, "open " + path_);
                sqlite3_close(writer_);
                writer_ = nullptr;
                return err.code == ErrorCode::Corruption ? Status::io(err.message) : err;
            }
            sqlite3_busy_timeout(writer_, 5000);
        }

        s = configure_locked();
        if (s) s = ensure_schema_locked(report);
        if (!s) {
            close_locked();
            return s;
        }

        int rc = sqlite3_open_v2(path_.c_str(), &reader_, SQLITE_OPEN_READONLY, nullptr);
        if (rc != SQLITE_OK) {
            Status err = sql::status_from(rc, reader_, "open reader " + path_);
            close_locked();
            return err;
        }
        sqlite3_busy_timeout(reader_, 5000);

        report.to_version = schema_.version;
        log::debug(component_, "Opened ", path_, " (", outcome_name(report.outcome),
                   ", schema v", schema_.version, ")");
        return Status::ok();
    }

    // Corruption found while running: move the file aside and reopen
    Status recover(OpenReport& report) {
        {
            std::lock_guard<std::mutex> wlock(write_mutex_);
            std::lock_guard<std::mutex> rlock(read_mutex_);
            close_locked();
            Status r = recover_locked(report);
            if (!r) return r;
        }
        OpenReport reopened;
        Status s = open(reopened);
        if (!s) return s;
        report.to_version = reopened.to_version;
        return Status::ok();
    }

    void close() {
        std::lock_guard<std::mutex> wlock(write_mutex_);
        std::lock_guard<std::mutex> rlock(read_mutex_);
        close_locked();
    }

    bool is_open() const { return writer_ != nullptr; }
    const std::string& path() const { return path_; }
    std::string backup_path() const { return path_ + ".bak"; }
    int schema_version() const { return schema_.version; }

    // ═══════════════════════════════════════════════════════════════════════
    // Writes
    // ═══════════════════════════════════════════════════════════════════════

    // Run fn inside BEGIN IMMEDIATE. Any non-ok status (or exception) rolls
    // back, so partial writes never become visible.
    Status transaction(const std::function<Status(Transaction&)>& fn) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!writer_) return Status::io(path_ + " is not open");

        Status s = sql::exec(writer_, "BEGIN IMMEDIATE");
        if (!s) return s;

        Transaction tx(writer_);
        Status result;
        try {
            result = fn(tx);
        } catch (const std::exception& e) {
            result = Status::io(std::string("transaction aborted: ") + e.what());
        }

        if (!result) {
            Status rb = sql::exec(writer_, "ROLLBACK");
            if (!rb) log::error(component_, "Rollback failed: ", rb.message);
            return result;
        }

        s = sql::exec(writer_, "COMMIT");
        if (!s) {
            Status rb = sql::exec(writer_, "ROLLBACK");
            if (!rb) log::error(component_, "Rollback after failed commit: ", rb.message);
        }
        return s;
    }

    Status put(const std::string& table, const std::string& key, const json& body) {
        return transaction([&](Transaction& tx) { return tx.put(table, key, body); });
    }

    Status erase(const std::string& table, const std::string& key) {
        return transaction([&](Transaction& tx) { return tx.erase(table, key); });
    }

    Result<int64_t> next_id(const std::string& sequence) {
        int64_t id = 0;
        Status s = transaction([&](Transaction& tx) {
            auto r = tx.next_id(sequence);
            if (!r.ok()) return r.status;
            id = *r;
            return Status::ok();
        });
        if (!s) return s;
        return id;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Reads (committed state only)
    // ═══════════════════════════════════════════════════════════════════════

    Result<json> get(const std::string& table, const std::string& key) const {
        std::lock_guard<std::mutex> lock(read_mutex_);
        if (!reader_) return Status::io(path_ + " is not open");
        return Transaction(reader_).get(table, key);
    }

    Result<std::vector<Record>> find(const std::string& table, const std::string& field,
                                     const json& value) const {
        std::lock_guard<std::mutex> lock(read_mutex_);
        if (!reader_) return Status::io(path_ + " is not open");
        return Transaction(reader_).find(table, field, value);
    }

    // Full scan filtered by predicate; an empty predicate keeps everything
    Result<std::vector<Record>> scan(const std::string& table, const Predicate& pred = {}) const {
        Result<std::vector<Record>> all;
        {
            std::lock_guard<std::mutex> lock(read_mutex_);
            if (!reader_) return Status::io(path_ + " is not open");
            all = Transaction(reader_).scan(table);
        }
        if (!all.ok() || !pred) return all;

        std::vector<Record> kept;
        for (auto& rec : *all) {
            if (pred(rec)) kept.push_back(std::move(rec));
        }
        return kept;
    }

    Result<size_t> count(const std::string& table) const {
        std::lock_guard<std::mutex> lock(read_mutex_);
        if (!reader_) return Status::io(path_ + " is not open");
        return Transaction(reader_).count(table);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Backup
    // ═══════════════════════════════════════════════════════════════════════

    // Online backup to <file>.bak (written to a temp name, then renamed)
    Status backup() {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!writer_) return Status::io(path_ + " is not open");
        return backup_locked(backup_path());
    }

private:
    Status configure_locked() {
        Status s = sql::exec(writer_, "PRAGMA journal_mode=WAL");
        if (s) s = sql::exec(writer_, "PRAGMA synchronous=NORMAL");
        if (s) s = sql::exec(writer_,
            "CREATE TABLE IF NOT EXISTS _sequences (name TEXT PRIMARY KEY, value INTEGER NOT NULL)");
        return s;
    }

    Status create_tables(Transaction& tx) {
        for (const auto& table : schema_.tables) {
            Status s = tx.exec("CREATE TABLE IF NOT EXISTS " + sql::ident(table.name) +
                               " (key TEXT PRIMARY KEY, body TEXT NOT NULL)");
            if (!s) return s;

            for (const auto& field : table.indexed) {
                s = tx.exec("CREATE INDEX IF NOT EXISTS " +
                            sql::ident("idx_" + table.name + "_" + field) + " ON " +
                            sql::ident(table.name) + " (json_extract(body, " +
                            sql::json_path(field) + "))");
                if (!s) return s;
            }

            for (const auto& group : table.unique) {
                std::string name = "uq_" + table.name;
                std::string cols;
                for (const auto& field : group) {
                    name += "_" + field;
                    if (!cols.empty()) cols += ", ";
                    cols += "json_extract(body, " + sql::json_path(field) + ")";
                }
                s = tx.exec("CREATE UNIQUE INDEX IF NOT EXISTS " + sql::ident(name) + " ON " +
                            sql::ident(table.name) + " (" + cols + ")");
                if (!s) return s;
            }
        }
        return Status::ok();
    }

    Status ensure_schema_locked(OpenReport& report) {
        auto version = sql::user_version(writer_);
        if (!version.ok()) return version.status;
        report.from_version = *version;

        if (*version > schema_.version) {
            return Status::validation(path_ + " has schema v" + std::to_string(*version) +
                                      ", this build supports up to v" +
                                      std::to_string(schema_.version));
        }

        bool fresh = *version == 0;
        if (!fresh && *version < schema_.version) {
            Status b = backup_locked(path_ + ".pre-v" + std::to_string(schema_.version) + ".bak");
            if (!b) return b;
        }

        Status s = sql::exec(writer_, "BEGIN IMMEDIATE");
        if (!s) return s;
        Transaction tx(writer_);

        if (!fresh) {
            int current = *version;
            while (s && current < schema_.version) {
                const Migration* step = nullptr;
                for (const auto& m : schema_.migrations) {
                    if (m.from == current) { step = &m; break; }
                }
                if (!step) {
                    s = Status::validation("no migration from schema v" + std::to_string(current));
                    break;
                }
                log::info(component_, "Migrating ", path_, " v", step->from, " -> v", step->to,
                          ": ", step->description);
                s = step->apply(tx);
                current = step->to;
            }
            if (s && report.outcome == OpenReport::Outcome::Opened) {
                report.outcome = OpenReport::Outcome::Migrated;
            }
        }

        if (s) s = create_tables(tx);
        if (s) s = tx.exec("PRAGMA user_version = " + std::to_string(schema_.version));

        if (!s) {
            Status rb = sql::exec(writer_, "ROLLBACK");
            if (!rb) log::error(component_, "Rollback failed: ", rb.message);
            return s;
        }
        return sql::exec(writer_, "COMMIT");
    }

    Status backup_locked(const std::string& dest_path) {
        namespace fs = std::filesystem;
        std::string tmp = dest_path + ".tmp";
        std::error_code ec;
        fs::remove(tmp, ec);

        sqlite3* dest = nullptr;
        int rc = sqlite3_open_v2(tmp.c_str(), &dest, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        if (rc != SQLITE_OK) {
            Status s = sql::status_from(rc, dest, "backup open " + tmp);
            sqlite3_close(dest);
            return Status::io(s.message);
        }

        sqlite3_backup* bk = sqlite3_backup_init(dest, "main", writer_, "main");
        if (!bk) {
            Status s = Status::io("backup init: " + std::string(sqlite3_errmsg(dest)));
            sqlite3_close(dest);
            return s;
        }
        rc = sqlite3_backup_step(bk, -1);
        sqlite3_backup_finish(bk);
        Status s = rc == SQLITE_DONE ? Status::ok() : sql::status_from(rc, dest, "backup step");
        sqlite3_close(dest);
        if (!s) {
            fs::remove(tmp, ec);
            return s;
        }

        fs::rename(tmp, dest_path, ec);
        if (ec) return Status::io("backup rename " + dest_path + ": " + ec.message());
        log::debug(component_, "Backup written to ", dest_path);
        return Status::ok();
    }

    // Move the bad file aside, then restore the backup or start empty.
    // Caller holds both locks with connections closed.
    Status recover_locked(OpenReport& report) {
        namespace fs = std::filesystem;
        std::error_code ec;

        if (writer_) {
            sqlite3_close(writer_);
            writer_ = nullptr;
        }

        report.corrupt_path = path_ + ".corrupt." + std::to_string(cortex::now());
        fs::rename(path_, report.corrupt_path, ec);
        if (ec) {
            return Status::io("cannot move corrupt store " + path_ + ": " + ec.message());
        }
        fs::remove(path_ + "-wal", ec);
        fs::remove(path_ + "-shm", ec);

        std::string bak = backup_path();
        if (fs::exists(bak, ec)) {
            sqlite3* probe = nullptr;
            Status check = sql::open_checked(bak, SQLITE_OPEN_READONLY, &probe);
            if (probe) sqlite3_close(probe);
            if (check) {
                fs::copy_file(bak, path_, fs::copy_options::overwrite_existing, ec);
                if (!ec) {
                    report.outcome = OpenReport::Outcome::Restored;
                    report.message = "restored from " + bak;
                    log::warn(component_, "Restored ", path_, " from backup (corrupt copy kept at ",
                              report.corrupt_path, ")");
                    return Status::ok();
                }
                log::warn(component_, "Backup copy failed: ", ec.message());
            } else {
                log::warn(component_, "Backup ", bak, " is unusable: ", check.message);
            }
        }

        report.outcome = OpenReport::Outcome::Reset;
        report.message = "no usable backup, started empty";
        log::warn(component_, "Reset ", path_, " to an empty store (corrupt copy kept at ",
                  report.corrupt_path, ")");
        return Status::ok();
    }

    void close_locked() {
        if (reader_) {
            sqlite3_close(reader_);
            reader_ = nullptr;
        }
        if (writer_) {
            sqlite3_close(writer_);
            writer_ = nullptr;
        }
    }

    std::string path_;
    StoreSchema schema_;
    std::string component_;

    sqlite3* writer_ = nullptr;
    sqlite3* reader_ = nullptr;
    mutable std::mutex write_mutex_;
    mutable std::mutex read_mutex_;
};

} // namespace cortex
