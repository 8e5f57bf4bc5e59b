#include "../include/model_registry.hpp"
#include "../include/database.hpp"
#include "../include/secrets.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include "../include/log.hpp"
#include <sqlite3.h>

static const char* SELECT_MODEL = "SELECT id, name, api_url, api_id, model_name, is_active FROM models ";

static Provider read_provider(const Statement& st) {
    Provider p;
    p.id = st.column_int64(0);
    p.name = st.column_text(1);
    p.api_url = st.column_text(2);
    p.api_id = st.column_text(3);
    p.model_name = st.column_text(4);
    p.is_active = st.column_int64(5) != 0;
    return p;
}

static bool is_unique_violation(const SqliteError& e) {
    return e.code() == SQLITE_CONSTRAINT_UNIQUE || e.code() == SQLITE_CONSTRAINT_PRIMARYKEY;
}

ModelRegistry::ModelRegistry(Database& db, const SecretResolver& secrets)
    : db_(db), secrets_(secrets) {}

void ModelRegistry::validate(const Provider& p) const {
    if (trim(p.name).empty()) throw ChatlistError(ErrorKind::InvalidArgument, "provider name must not be empty");
    if (trim(p.api_url).empty()) throw ChatlistError(ErrorKind::InvalidArgument, "provider api_url must not be empty");
    if (trim(p.api_id).empty()) throw ChatlistError(ErrorKind::InvalidArgument, "provider api_id must not be empty");
}

int64_t ModelRegistry::create(const Provider& p) {
    validate(p);
    auto lk = db_.lock();
    Statement st(db_.handle(),
                 "INSERT INTO models (name, api_url, api_id, model_name, is_active) VALUES (?, ?, ?, ?, ?);");
    st.bind(1, trim(p.name));
    st.bind(2, trim(p.api_url));
    st.bind(3, trim(p.api_id));
    st.bind(4, trim(p.model_name));
    st.bind(5, (int64_t)(p.is_active ? 1 : 0));
    try {
        st.step();
    } catch (const SqliteError& e) {
        if (!is_unique_violation(e)) throw;
        throw ChatlistError(ErrorKind::InvalidArgument, "provider name already exists: " + p.name);
    }
    int64_t id = db_.last_insert_id();
    log_info("provider created: " + p.name + " (id " + std::to_string(id) + ")");
    return id;
}

std::optional<Provider> ModelRegistry::find(int64_t id) {
    auto lk = db_.lock();
    Statement st(db_.handle(), std::string(SELECT_MODEL) + "WHERE id = ?;");
    st.bind(1, id);
    if (!st.step()) return std::nullopt;
    return read_provider(st);
}

std::optional<Provider> ModelRegistry::find_by_name(const std::string& name) {
    auto lk = db_.lock();
    Statement st(db_.handle(), std::string(SELECT_MODEL) + "WHERE name = ?;");
    st.bind(1, name);
    if (!st.step()) return std::nullopt;
    return read_provider(st);
}

std::vector<Provider> ModelRegistry::list_all() {
    auto lk = db_.lock();
    std::vector<Provider> out;
    Statement st(db_.handle(), std::string(SELECT_MODEL) + "ORDER BY name;");
    while (st.step()) out.push_back(read_provider(st));
    return out;
}

std::vector<Provider> ModelRegistry::list_active() {
    auto lk = db_.lock();
    std::vector<Provider> out;
    Statement st(db_.handle(), std::string(SELECT_MODEL) + "WHERE is_active = 1 ORDER BY id;");
    while (st.step()) out.push_back(read_provider(st));
    return out;
}

void ModelRegistry::update(const Provider& p) {
    validate(p);
    auto lk = db_.lock();
    Statement st(db_.handle(),
                 "UPDATE models SET name = ?, api_url = ?, api_id = ?, model_name = ?, is_active = ? WHERE id = ?;");
    st.bind(1, trim(p.name));
    st.bind(2, trim(p.api_url));
    st.bind(3, trim(p.api_id));
    st.bind(4, trim(p.model_name));
    st.bind(5, (int64_t)(p.is_active ? 1 : 0));
    st.bind(6, p.id);
    try {
        st.step();
    } catch (const SqliteError& e) {
        if (!is_unique_violation(e)) throw;
        throw ChatlistError(ErrorKind::InvalidArgument, "provider name already exists: " + p.name);
    }
    if (db_.changes() == 0) {
        throw ChatlistError(ErrorKind::NotFound, "provider not found: " + std::to_string(p.id));
    }
}

void ModelRegistry::set_active(int64_t id, bool active) {
    auto lk = db_.lock();
    Statement st(db_.handle(), "UPDATE models SET is_active = ? WHERE id = ?;");
    st.bind(1, (int64_t)(active ? 1 : 0));
    st.bind(2, id);
    st.step();
    if (db_.changes() == 0) {
        throw ChatlistError(ErrorKind::NotFound, "provider not found: " + std::to_string(id));
    }
}

bool ModelRegistry::toggle_active(int64_t id) {
    auto lk = db_.lock();
    Transaction tx(db_);
    Statement upd(db_.handle(), "UPDATE models SET is_active = 1 - is_active WHERE id = ?;");
    upd.bind(1, id);
    upd.step();
    if (db_.changes() == 0) {
        throw ChatlistError(ErrorKind::NotFound, "provider not found: " + std::to_string(id));
    }
    Statement sel(db_.handle(), "SELECT is_active FROM models WHERE id = ?;");
    sel.bind(1, id);
    sel.step();
    bool active = sel.column_int64(0) != 0;
    tx.commit();
    return active;
}

void ModelRegistry::remove(int64_t id) {
    auto lk = db_.lock();
    Transaction tx(db_);
    {
        Statement exists(db_.handle(), "SELECT name FROM models WHERE id = ?;");
        exists.bind(1, id);
        if (!exists.step()) {
            throw ChatlistError(ErrorKind::NotFound, "provider not found: " + std::to_string(id));
        }
    }
    Statement refs(db_.handle(), "SELECT COUNT(*) FROM results WHERE model_id = ?;");
    refs.bind(1, id);
    refs.step();
    int64_t n = refs.column_int64(0);
    if (n > 0) {
        throw ChatlistError(ErrorKind::ProviderInUse,
                            "provider " + std::to_string(id) + " is referenced by " + std::to_string(n) +
                            " result(s); deactivate it instead");
    }
    Statement del(db_.handle(), "DELETE FROM models WHERE id = ?;");
    del.bind(1, id);
    try {
        del.step();
    } catch (const SqliteError& e) {
        // RESTRICT backstop for a result inserted by another connection
        if (e.code() == SQLITE_CONSTRAINT_FOREIGNKEY || e.code() == SQLITE_CONSTRAINT_TRIGGER) {
            throw ChatlistError(ErrorKind::ProviderInUse, "provider " + std::to_string(id) + " is in use");
        }
        throw;
    }
    tx.commit();
    log_info("provider deleted: " + std::to_string(id));
}

std::string ModelRegistry::resolve_credential(const Provider& p) const {
    auto secret = secrets_.resolve(p.api_id);
    if (!secret) {
        throw ChatlistError(ErrorKind::MissingCredential,
                            "API key '" + p.api_id + "' not found for provider " + p.name);
    }
    log_debug("API key loaded for " + p.api_id + " (length: " + std::to_string(secret->size()) + ")");
    return *secret;
}
