#pragma once
#include <string>
#include <mutex>
#include <cstdint>

struct sqlite3;
struct sqlite3_stmt;

class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void reset();
    void bind(int idx, const std::string& v);
    void bind(int idx, int64_t v);
    void bind_null(int idx);

    // true while a row is available, false once done; throws SqliteError otherwise.
    bool step();

    int64_t column_int64(int col) const;
    std::string column_text(int col) const;
    bool column_is_null(int col) const;

private:
    sqlite3* db_ {nullptr};
    sqlite3_stmt* st_ {nullptr};
};

class Database;

// BEGIN IMMEDIATE on construction; rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(Database& db);
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    Database& db_;
    bool done_ {false};
};

class Database {
public:
    explicit Database(const std::string& db_path);
    ~Database();
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Every store holds this lock for the duration of one operation.
    std::unique_lock<std::mutex> lock();

    void exec(const std::string& sql);
    int64_t last_insert_id() const;
    int changes() const;
    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }

private:
    void init();
    void seed_settings();

    sqlite3* db_ {nullptr};
    std::string path_;
    std::mutex mtx_;
};
