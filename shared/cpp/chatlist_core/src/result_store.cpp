#include "../include/result_store.hpp"
#include "../include/database.hpp"
#include "../include/errors.hpp"
#include <sqlite3.h>

static const char* SELECT_JOINED =
    "SELECT r.id, r.prompt_id, r.model_id, r.response, r.date, r.selected, r.status, r.error_kind, "
    "m.name, p.prompt "
    "FROM results r "
    "JOIN models m ON r.model_id = m.id "
    "JOIN prompts p ON r.prompt_id = p.id ";

const char* result_status_name(ResultStatus s) {
    return s == ResultStatus::Success ? "success" : "failure";
}

static ResultRecord read_result(const Statement& st) {
    ResultRecord r;
    r.id = st.column_int64(0);
    r.prompt_id = st.column_int64(1);
    r.model_id = st.column_int64(2);
    r.response = st.column_text(3);
    r.created_at = st.column_text(4);
    r.selected = st.column_int64(5) != 0;
    r.status = st.column_text(6) == "failure" ? ResultStatus::Failure : ResultStatus::Success;
    r.error_kind = st.column_text(7);
    r.model_name = st.column_text(8);
    r.prompt_text = st.column_text(9);
    return r;
}

static bool row_exists(Database& db, const char* sql, int64_t id) {
    Statement st(db.handle(), sql);
    st.bind(1, id);
    return st.step();
}

ResultStore::ResultStore(Database& db) : db_(db) {}

int64_t ResultStore::create(int64_t prompt_id, int64_t model_id, const std::string& response,
                            ResultStatus status, const std::string& error_kind) {
    auto lk = db_.lock();
    Transaction tx(db_);
    if (!row_exists(db_, "SELECT 1 FROM prompts WHERE id = ?;", prompt_id)) {
        throw ChatlistError(ErrorKind::NotFound, "prompt not found: " + std::to_string(prompt_id));
    }
    if (!row_exists(db_, "SELECT 1 FROM models WHERE id = ?;", model_id)) {
        throw ChatlistError(ErrorKind::NotFound, "provider not found: " + std::to_string(model_id));
    }
    Statement st(db_.handle(),
                 "INSERT INTO results (prompt_id, model_id, response, status, error_kind) VALUES (?, ?, ?, ?, ?);");
    st.bind(1, prompt_id);
    st.bind(2, model_id);
    st.bind(3, response);
    st.bind(4, std::string(result_status_name(status)));
    if (error_kind.empty()) st.bind_null(5);
    else st.bind(5, error_kind);
    try {
        st.step();
    } catch (const SqliteError& e) {
        if (e.code() != SQLITE_CONSTRAINT_FOREIGNKEY) throw;
        throw ChatlistError(ErrorKind::NotFound, "result references a missing prompt or provider");
    }
    int64_t id = db_.last_insert_id();
    tx.commit();
    return id;
}

std::optional<ResultRecord> ResultStore::find(int64_t id) {
    auto lk = db_.lock();
    Statement st(db_.handle(), std::string(SELECT_JOINED) + "WHERE r.id = ?;");
    st.bind(1, id);
    if (!st.step()) return std::nullopt;
    return read_result(st);
}

std::vector<ResultRecord> ResultStore::find_results(int64_t prompt_id) {
    auto lk = db_.lock();
    std::vector<ResultRecord> out;
    Statement st(db_.handle(), std::string(SELECT_JOINED) + "WHERE r.prompt_id = ? ORDER BY r.date ASC, r.id ASC;");
    st.bind(1, prompt_id);
    while (st.step()) out.push_back(read_result(st));
    return out;
}

std::vector<ResultRecord> ResultStore::find_selected() {
    auto lk = db_.lock();
    std::vector<ResultRecord> out;
    Statement st(db_.handle(), std::string(SELECT_JOINED) + "WHERE r.selected = 1 ORDER BY r.date DESC, r.id DESC;");
    while (st.step()) out.push_back(read_result(st));
    return out;
}

std::vector<ResultRecord> ResultStore::search(const std::string& query) {
    auto lk = db_.lock();
    std::vector<ResultRecord> out;
    Statement st(db_.handle(), std::string(SELECT_JOINED) + "WHERE instr(r.response, ?) > 0 ORDER BY r.date DESC, r.id DESC;");
    st.bind(1, query);
    while (st.step()) out.push_back(read_result(st));
    return out;
}

void ResultStore::set_selected(int64_t id, bool selected) {
    auto lk = db_.lock();
    Statement st(db_.handle(), "UPDATE results SET selected = ? WHERE id = ?;");
    st.bind(1, (int64_t)(selected ? 1 : 0));
    st.bind(2, id);
    st.step();
    if (db_.changes() == 0) {
        throw ChatlistError(ErrorKind::NotFound, "result not found: " + std::to_string(id));
    }
}

bool ResultStore::toggle_selected(int64_t id) {
    auto lk = db_.lock();
    Transaction tx(db_);
    Statement upd(db_.handle(), "UPDATE results SET selected = 1 - selected WHERE id = ?;");
    upd.bind(1, id);
    upd.step();
    if (db_.changes() == 0) {
        throw ChatlistError(ErrorKind::NotFound, "result not found: " + std::to_string(id));
    }
    Statement sel(db_.handle(), "SELECT selected FROM results WHERE id = ?;");
    sel.bind(1, id);
    sel.step();
    bool selected = sel.column_int64(0) != 0;
    tx.commit();
    return selected;
}

void ResultStore::remove(int64_t id) {
    auto lk = db_.lock();
    Statement st(db_.handle(), "DELETE FROM results WHERE id = ?;");
    st.bind(1, id);
    st.step();
    if (db_.changes() == 0) {
        throw ChatlistError(ErrorKind::NotFound, "result not found: " + std::to_string(id));
    }
}

int64_t ResultStore::count_for_prompt(int64_t prompt_id) {
    auto lk = db_.lock();
    Statement st(db_.handle(), "SELECT COUNT(*) FROM results WHERE prompt_id = ?;");
    st.bind(1, prompt_id);
    st.step();
    return st.column_int64(0);
}

int64_t ResultStore::count_for_provider(int64_t model_id) {
    auto lk = db_.lock();
    Statement st(db_.handle(), "SELECT COUNT(*) FROM results WHERE model_id = ?;");
    st.bind(1, model_id);
    st.step();
    return st.column_int64(0);
}
