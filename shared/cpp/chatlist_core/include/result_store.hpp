#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

class Database;

enum class ResultStatus { Success, Failure };

const char* result_status_name(ResultStatus s);

struct ResultRecord {
    int64_t id{0};
    int64_t prompt_id{0};
    int64_t model_id{0};
    std::string response;    // response text, or the failure detail
    std::string created_at;
    bool selected{false};
    ResultStatus status{ResultStatus::Success};
    std::string error_kind;  // empty for successes
    // filled by the joined queries
    std::string model_name;
    std::string prompt_text;
};

class ResultStore {
public:
    explicit ResultStore(Database& db);

    // Throws NotFound when the prompt or the provider no longer exists.
    int64_t create(int64_t prompt_id, int64_t model_id, const std::string& response,
                   ResultStatus status = ResultStatus::Success, const std::string& error_kind = {});
    std::optional<ResultRecord> find(int64_t id);
    // Oldest first.
    std::vector<ResultRecord> find_results(int64_t prompt_id);
    std::vector<ResultRecord> find_selected();
    std::vector<ResultRecord> search(const std::string& query);

    void set_selected(int64_t id, bool selected);
    bool toggle_selected(int64_t id);
    void remove(int64_t id);

    int64_t count_for_prompt(int64_t prompt_id);
    int64_t count_for_provider(int64_t model_id);

private:
    Database& db_;
};
