#pragma once
// SQLite store
//
// One database file holds items, the decision log, checkpoints and the
// manual-review queue. ":memory:" works for tests.

#include "log.hpp"
#include "store.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <string>

namespace viveka {

class SqliteStore : public Store {
public:
    SqliteStore() = default;
    ~SqliteStore() override { close(); }

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    bool open(const std::string& path) {
        close();
        if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
            last_error_ = db_ ? sqlite3_errmsg(db_) : "out of memory";
            close();
            return false;
        }
        sqlite3_busy_timeout(db_, 5000);
        if (!exec("PRAGMA journal_mode=WAL") && path != ":memory:") {
            log::warn("store", "WAL journal unavailable: %s", last_error_.c_str());
        }
        return create_schema();
    }

    void close() {
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool is_open() const { return db_ != nullptr; }

    bool put_item(const Item& item) override {
        return write_item(item);
    }

    std::vector<Item> load_items() override {
        std::vector<Item> items;
        Stmt stmt(db_, "SELECT id, category, title, body, embedding_ref, status, canonical_of, "
                       "created_at, updated_at FROM items ORDER BY id");
        if (!stmt.ok()) return fail_with(items);

        while (stmt.step() == SQLITE_ROW) {
            Item item;
            item.id = stmt.text(0);
            item.category = stmt.text(1);
            item.title = stmt.text(2);
            item.body = stmt.text(3);
            item.embedding_ref = stmt.text(4);
            item.status = static_cast<ItemStatus>(sqlite3_column_int(stmt.get(), 5));
            if (sqlite3_column_type(stmt.get(), 6) != SQLITE_NULL) item.canonical_of = stmt.text(6);
            item.created_at = sqlite3_column_int64(stmt.get(), 7);
            item.updated_at = sqlite3_column_int64(stmt.get(), 8);
            items.push_back(std::move(item));
        }
        return items;
    }

    bool commit(DecisionRecord& record, const std::vector<Item>& mutations) override {
        if (!exec("BEGIN IMMEDIATE")) return false;

        Stmt stmt(db_, "INSERT INTO decisions (session_id, round, subject, target, action, actor, "
                       "rationale, user, timestamp) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok()) return rollback();

        nlohmann::json subject = record.subject;
        std::string subject_text = subject.dump();
        stmt.bind(1, record.session_id);
        sqlite3_bind_int(stmt.get(), 2, static_cast<int>(record.round));
        stmt.bind(3, subject_text);
        if (record.target) stmt.bind(4, *record.target);
        else sqlite3_bind_null(stmt.get(), 4);
        stmt.bind(5, action_name(record.action));
        stmt.bind(6, actor_name(record.actor));
        stmt.bind(7, record.rationale);
        stmt.bind(8, record.user);
        sqlite3_bind_int64(stmt.get(), 9, record.timestamp);
        if (stmt.step() != SQLITE_DONE) return rollback();

        int64_t seq = sqlite3_last_insert_rowid(db_);
        for (const auto& item : mutations) {
            if (!write_item(item)) return rollback();
        }

        if (!exec("COMMIT")) return rollback();
        record.seq = seq;
        return true;
    }

    std::vector<DecisionRecord> decisions() override {
        std::vector<DecisionRecord> out;
        Stmt stmt(db_, "SELECT seq, session_id, round, subject, target, action, actor, rationale, "
                       "user, timestamp FROM decisions ORDER BY seq");
        if (!stmt.ok()) return fail_with(out);

        while (stmt.step() == SQLITE_ROW) {
            DecisionRecord r;
            r.seq = sqlite3_column_int64(stmt.get(), 0);
            r.session_id = stmt.text(1);
            r.round = static_cast<uint32_t>(sqlite3_column_int(stmt.get(), 2));
            try {
                r.subject = nlohmann::json::parse(stmt.text(3)).get<std::vector<ItemId>>();
            } catch (const nlohmann::json::exception& e) {
                log::warn("store", "decision %lld has unreadable subject: %s",
                          static_cast<long long>(r.seq), e.what());
            }
            if (sqlite3_column_type(stmt.get(), 4) != SQLITE_NULL) r.target = stmt.text(4);
            r.action = parse_action(stmt.text(5)).value_or(Action::KeepSeparate);
            r.actor = parse_actor(stmt.text(6)).value_or(Actor::Human);
            r.rationale = stmt.text(7);
            r.user = stmt.text(8);
            r.timestamp = sqlite3_column_int64(stmt.get(), 9);
            out.push_back(std::move(r));
        }
        return out;
    }

    size_t decision_count() override {
        Stmt stmt(db_, "SELECT COUNT(*) FROM decisions");
        if (!stmt.ok() || stmt.step() != SQLITE_ROW) return 0;
        return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
    }

    bool put_state(const std::string& key, const std::string& value) override {
        Stmt stmt(db_, "INSERT INTO kv (key, value, updated_at) VALUES (?, ?, ?) "
                       "ON CONFLICT(key) DO UPDATE SET value = excluded.value, "
                       "updated_at = excluded.updated_at");
        if (!stmt.ok()) return fail();
        stmt.bind(1, key);
        stmt.bind(2, value);
        sqlite3_bind_int64(stmt.get(), 3, now());
        if (stmt.step() != SQLITE_DONE) return fail();
        return true;
    }

    std::optional<std::string> get_state(const std::string& key) override {
        Stmt stmt(db_, "SELECT value FROM kv WHERE key = ?");
        if (!stmt.ok()) {
            fail();
            return std::nullopt;
        }
        stmt.bind(1, key);
        if (stmt.step() != SQLITE_ROW) return std::nullopt;
        return stmt.text(0);
    }

    bool erase_state(const std::string& key) override {
        Stmt stmt(db_, "DELETE FROM kv WHERE key = ?");
        if (!stmt.ok()) return fail();
        stmt.bind(1, key);
        if (stmt.step() != SQLITE_DONE) return fail();
        return true;
    }

    bool enqueue_manual(ManualReviewEntry& entry) override {
        Stmt stmt(db_, "INSERT INTO manual_queue (session_id, round, community_id, category, "
                       "members, reason, queued_at) VALUES (?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok()) return fail();
        nlohmann::json members = entry.members;
        std::string members_text = members.dump();
        stmt.bind(1, entry.session_id);
        sqlite3_bind_int(stmt.get(), 2, static_cast<int>(entry.round));
        stmt.bind(3, entry.community_id);
        stmt.bind(4, entry.category);
        stmt.bind(5, members_text);
        stmt.bind(6, entry.reason);
        sqlite3_bind_int64(stmt.get(), 7, entry.queued_at);
        if (stmt.step() != SQLITE_DONE) return fail();
        entry.id = sqlite3_last_insert_rowid(db_);
        return true;
    }

    std::vector<ManualReviewEntry> manual_queue() override {
        std::vector<ManualReviewEntry> out;
        Stmt stmt(db_, "SELECT id, session_id, round, community_id, category, members, reason, "
                       "queued_at FROM manual_queue ORDER BY id");
        if (!stmt.ok()) return fail_with(out);

        while (stmt.step() == SQLITE_ROW) {
            ManualReviewEntry e;
            e.id = sqlite3_column_int64(stmt.get(), 0);
            e.session_id = stmt.text(1);
            e.round = static_cast<uint32_t>(sqlite3_column_int(stmt.get(), 2));
            e.community_id = stmt.text(3);
            e.category = stmt.text(4);
            try {
                e.members = nlohmann::json::parse(stmt.text(5)).get<std::vector<ItemId>>();
            } catch (const nlohmann::json::exception& ex) {
                log::warn("store", "manual entry %lld has unreadable members: %s",
                          static_cast<long long>(e.id), ex.what());
            }
            e.reason = stmt.text(6);
            e.queued_at = sqlite3_column_int64(stmt.get(), 7);
            out.push_back(std::move(e));
        }
        return out;
    }

    std::string last_error() const override { return last_error_; }

private:
    // Prepared statement, finalized on scope exit
    class Stmt {
    public:
        Stmt(sqlite3* db, const char* sql) {
            if (db && sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
                stmt_ = nullptr;
            }
        }
        ~Stmt() { if (stmt_) sqlite3_finalize(stmt_); }

        Stmt(const Stmt&) = delete;
        Stmt& operator=(const Stmt&) = delete;

        bool ok() const { return stmt_ != nullptr; }
        sqlite3_stmt* get() const { return stmt_; }
        int step() { return sqlite3_step(stmt_); }

        void bind(int idx, const std::string& value) {
            sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
        }

        std::string text(int col) const {
            const char* s = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
            return s ? s : "";
        }

    private:
        sqlite3_stmt* stmt_ = nullptr;
    };

    bool create_schema() {
        const char* ddl[] = {
            "CREATE TABLE IF NOT EXISTS items ("
            "  id TEXT PRIMARY KEY,"
            "  category TEXT NOT NULL,"
            "  title TEXT NOT NULL DEFAULT '',"
            "  body TEXT NOT NULL DEFAULT '',"
            "  embedding_ref TEXT NOT NULL DEFAULT '',"
            "  status INTEGER NOT NULL DEFAULT 0,"
            "  canonical_of TEXT,"
            "  created_at INTEGER NOT NULL DEFAULT 0,"
            "  updated_at INTEGER NOT NULL DEFAULT 0)",
            "CREATE INDEX IF NOT EXISTS idx_items_category ON items(category, status)",
            "CREATE TABLE IF NOT EXISTS decisions ("
            "  seq INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  session_id TEXT NOT NULL,"
            "  round INTEGER NOT NULL DEFAULT 0,"
            "  subject TEXT NOT NULL,"
            "  target TEXT,"
            "  action TEXT NOT NULL,"
            "  actor TEXT NOT NULL,"
            "  rationale TEXT NOT NULL DEFAULT '',"
            "  user TEXT NOT NULL DEFAULT '',"
            "  timestamp INTEGER NOT NULL)",
            "CREATE TABLE IF NOT EXISTS kv ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT NOT NULL,"
            "  updated_at INTEGER NOT NULL)",
            "CREATE TABLE IF NOT EXISTS manual_queue ("
            "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  session_id TEXT NOT NULL,"
            "  round INTEGER NOT NULL DEFAULT 0,"
            "  community_id TEXT NOT NULL DEFAULT '',"
            "  category TEXT NOT NULL,"
            "  members TEXT NOT NULL,"
            "  reason TEXT NOT NULL DEFAULT '',"
            "  queued_at INTEGER NOT NULL)",
        };
        for (const char* sql : ddl) {
            if (!exec(sql)) {
                log::error("store", "schema: %s", last_error_.c_str());
                return false;
            }
        }
        return exec("PRAGMA user_version = " + std::to_string(VIVEKA_STATE_FORMAT_VERSION));
    }

    bool write_item(const Item& item) {
        Stmt stmt(db_, "INSERT OR REPLACE INTO items (id, category, title, body, embedding_ref, "
                       "status, canonical_of, created_at, updated_at) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!stmt.ok()) return fail();
        stmt.bind(1, item.id);
        stmt.bind(2, item.category);
        stmt.bind(3, item.title);
        stmt.bind(4, item.body);
        stmt.bind(5, item.embedding_ref);
        sqlite3_bind_int(stmt.get(), 6, static_cast<int>(item.status));
        if (item.canonical_of) stmt.bind(7, *item.canonical_of);
        else sqlite3_bind_null(stmt.get(), 7);
        sqlite3_bind_int64(stmt.get(), 8, item.created_at);
        sqlite3_bind_int64(stmt.get(), 9, item.updated_at);
        if (stmt.step() != SQLITE_DONE) return fail();
        return true;
    }

    bool exec(const std::string& sql) {
        if (!db_) {
            last_error_ = "database not open";
            return false;
        }
        char* err = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
            last_error_ = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            return false;
        }
        return true;
    }

    bool fail() {
        last_error_ = db_ ? sqlite3_errmsg(db_) : "database not open";
        return false;
    }

    template <typename T>
    T& fail_with(T& empty) {
        fail();
        log::error("store", "%s", last_error_.c_str());
        return empty;
    }

    bool rollback() {
        std::string err = db_ ? sqlite3_errmsg(db_) : "database not open";
        exec("ROLLBACK");
        last_error_ = err;
        log::error("store", "commit rolled back: %s", err.c_str());
        return false;
    }

    sqlite3* db_ = nullptr;
    std::string last_error_;
};

} // namespace viveka
