#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

class Database;

struct Prompt {
    int64_t id{0};
    std::string created_at;
    std::string text;
    std::vector<std::string> tags;
};

class PromptStore {
public:
    explicit PromptStore(Database& db);

    int64_t create(const std::string& text, const std::vector<std::string>& tags = {});
    std::optional<Prompt> find(int64_t id);
    // sort_by: id|date|prompt, order: ASC|DESC; anything else falls back to date DESC.
    std::vector<Prompt> list(const std::string& sort_by = "date", const std::string& order = "DESC");
    std::vector<Prompt> search(const std::string& query);
    // Removes the prompt and every result referencing it in one transaction.
    void remove(int64_t id);

private:
    Database& db_;
};
