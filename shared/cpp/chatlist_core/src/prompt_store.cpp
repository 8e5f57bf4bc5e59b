#include "../include/prompt_store.hpp"
#include "../include/database.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include "../include/log.hpp"

static Prompt read_prompt(const Statement& st) {
    Prompt p;
    p.id = st.column_int64(0);
    p.created_at = st.column_text(1);
    p.text = st.column_text(2);
    p.tags = split_tags(st.column_text(3));
    return p;
}

PromptStore::PromptStore(Database& db) : db_(db) {}

int64_t PromptStore::create(const std::string& text, const std::vector<std::string>& tags) {
    if (trim(text).empty()) {
        throw ChatlistError(ErrorKind::InvalidArgument, "prompt text must not be empty");
    }
    auto lk = db_.lock();
    Statement st(db_.handle(), "INSERT INTO prompts (prompt, tags) VALUES (?, ?);");
    st.bind(1, text);
    std::string joined = join_tags(tags);
    if (joined.empty()) st.bind_null(2);
    else st.bind(2, joined);
    st.step();
    return db_.last_insert_id();
}

std::optional<Prompt> PromptStore::find(int64_t id) {
    auto lk = db_.lock();
    Statement st(db_.handle(), "SELECT id, date, prompt, tags FROM prompts WHERE id = ?;");
    st.bind(1, id);
    if (!st.step()) return std::nullopt;
    return read_prompt(st);
}

std::vector<Prompt> PromptStore::list(const std::string& sort_by, const std::string& order) {
    std::string col = (sort_by == "id" || sort_by == "date" || sort_by == "prompt") ? sort_by : "date";
    std::string dir = to_lower(order) == "asc" ? "ASC" : "DESC";
    auto lk = db_.lock();
    std::vector<Prompt> out;
    Statement st(db_.handle(),
                 "SELECT id, date, prompt, tags FROM prompts ORDER BY " + col + " " + dir + ", id " + dir + ";");
    while (st.step()) out.push_back(read_prompt(st));
    return out;
}

std::vector<Prompt> PromptStore::search(const std::string& query) {
    auto lk = db_.lock();
    std::vector<Prompt> out;
    Statement st(db_.handle(),
                 "SELECT id, date, prompt, tags FROM prompts "
                 "WHERE instr(prompt, ?1) > 0 OR instr(IFNULL(tags, ''), ?1) > 0 "
                 "ORDER BY date DESC, id DESC;");
    st.bind(1, query);
    while (st.step()) out.push_back(read_prompt(st));
    return out;
}

void PromptStore::remove(int64_t id) {
    auto lk = db_.lock();
    Transaction tx(db_);
    Statement results(db_.handle(), "DELETE FROM results WHERE prompt_id = ?;");
    results.bind(1, id);
    results.step();
    int removed_results = db_.changes();
    Statement prompt(db_.handle(), "DELETE FROM prompts WHERE id = ?;");
    prompt.bind(1, id);
    prompt.step();
    if (db_.changes() == 0) {
        // nothing committed; the transaction rolls back on unwind
        throw ChatlistError(ErrorKind::NotFound, "prompt not found: " + std::to_string(id));
    }
    tx.commit();
    log_info("prompt " + std::to_string(id) + " deleted with " + std::to_string(removed_results) + " result(s)");
}
