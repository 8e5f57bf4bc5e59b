#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

class Database;
class SecretResolver;

struct Provider {
    int64_t id{0};
    std::string name;        // unique display name
    std::string api_url;     // chat completions endpoint
    std::string api_id;      // name of the secret holding the API key
    std::string model_name;  // model identifier sent upstream; empty means use name
    bool is_active{true};
};

class ModelRegistry {
public:
    ModelRegistry(Database& db, const SecretResolver& secrets);

    int64_t create(const Provider& p);
    std::optional<Provider> find(int64_t id);
    std::optional<Provider> find_by_name(const std::string& name);
    std::vector<Provider> list_all();
    // Active providers only, in id order.
    std::vector<Provider> list_active();

    void update(const Provider& p);
    void set_active(int64_t id, bool active);
    bool toggle_active(int64_t id);
    // Refused with ProviderInUse while any result references the provider.
    void remove(int64_t id);

    std::string resolve_credential(const Provider& p) const;

private:
    void validate(const Provider& p) const;

    Database& db_;
    const SecretResolver& secrets_;
};
