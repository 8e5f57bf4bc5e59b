#include "../include/database.hpp"
#include "../include/errors.hpp"
#include "../include/settings_store.hpp"
#include "../include/log.hpp"
#include <sqlite3.h>

static std::string sqlite_message(sqlite3* db, const std::string& what) {
    return "SQLite error (" + what + "): " + (db ? sqlite3_errmsg(db) : "no connection");
}

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
        throw SqliteError(sqlite3_extended_errcode(db_), sqlite_message(db_, "prepare"));
    }
}

Statement::~Statement() {
    if (st_) sqlite3_finalize(st_);
}

void Statement::reset() {
    sqlite3_reset(st_);
    sqlite3_clear_bindings(st_);
}

void Statement::bind(int idx, const std::string& v) {
    sqlite3_bind_text(st_, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

void Statement::bind(int idx, int64_t v) {
    sqlite3_bind_int64(st_, idx, (sqlite3_int64)v);
}

void Statement::bind_null(int idx) {
    sqlite3_bind_null(st_, idx);
}

bool Statement::step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw SqliteError(sqlite3_extended_errcode(db_), sqlite_message(db_, "step"));
}

int64_t Statement::column_int64(int col) const {
    return (int64_t)sqlite3_column_int64(st_, col);
}

std::string Statement::column_text(int col) const {
    const unsigned char* txt = sqlite3_column_text(st_, col);
    if (!txt) return {};
    return std::string(reinterpret_cast<const char*>(txt), (size_t)sqlite3_column_bytes(st_, col));
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(st_, col) == SQLITE_NULL;
}

Transaction::Transaction(Database& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) return;
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        log_error(std::string("rollback failed: ") + (err ? err : "unknown"));
        sqlite3_free(err);
    }
}

void Transaction::commit() {
    db_.exec("COMMIT;");
    done_ = true;
}

Database::Database(const std::string& db_path) : path_(db_path) {
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = sqlite_message(db_, "open " + db_path);
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw SqliteError(SQLITE_CANTOPEN, msg);
    }
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, 5000);
    try {
        init();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    log_debug("database opened: " + db_path);
}

Database::~Database() {
    if (db_) sqlite3_close(db_);
}

std::unique_lock<std::mutex> Database::lock() {
    return std::unique_lock<std::mutex>(mtx_);
}

void Database::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw SqliteError(sqlite3_extended_errcode(db_), "SQLite error: " + msg);
    }
}

int64_t Database::last_insert_id() const {
    return (int64_t)sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

void Database::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA foreign_keys=ON;");
    exec("CREATE TABLE IF NOT EXISTS prompts (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  date TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f','now')),\n"
         "  prompt TEXT NOT NULL,\n"
         "  tags TEXT\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS models (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  name TEXT NOT NULL UNIQUE,\n"
         "  api_url TEXT NOT NULL,\n"
         "  api_id TEXT NOT NULL,\n"
         "  model_name TEXT,\n"
         "  is_active INTEGER NOT NULL DEFAULT 1\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS results (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  prompt_id INTEGER NOT NULL,\n"
         "  model_id INTEGER NOT NULL,\n"
         "  response TEXT NOT NULL,\n"
         "  date TEXT NOT NULL DEFAULT (strftime('%Y-%m-%d %H:%M:%f','now')),\n"
         "  selected INTEGER NOT NULL DEFAULT 0,\n"
         "  status TEXT NOT NULL DEFAULT 'success',\n"
         "  error_kind TEXT,\n"
         "  FOREIGN KEY (prompt_id) REFERENCES prompts(id) ON DELETE CASCADE,\n"
         "  FOREIGN KEY (model_id) REFERENCES models(id) ON DELETE RESTRICT\n"
         ");");
    exec("CREATE TABLE IF NOT EXISTS settings (\n"
         "  key TEXT PRIMARY KEY NOT NULL,\n"
         "  value TEXT NOT NULL\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_prompts_date ON prompts(date);");
    exec("CREATE INDEX IF NOT EXISTS idx_prompts_tags ON prompts(tags);");
    exec("CREATE INDEX IF NOT EXISTS idx_models_active ON models(is_active);");
    exec("CREATE INDEX IF NOT EXISTS idx_results_prompt ON results(prompt_id);");
    exec("CREATE INDEX IF NOT EXISTS idx_results_model ON results(model_id);");
    exec("CREATE INDEX IF NOT EXISTS idx_results_date ON results(date);");
    exec("CREATE INDEX IF NOT EXISTS idx_results_selected ON results(selected);");
    seed_settings();
}

void Database::seed_settings() {
    Statement st(db_, "INSERT OR IGNORE INTO settings (key, value) VALUES (?, ?);");
    for (auto& kv : SettingsStore::defaults()) {
        st.reset();
        st.bind(1, kv.first);
        st.bind(2, kv.second);
        st.step();
    }
}
