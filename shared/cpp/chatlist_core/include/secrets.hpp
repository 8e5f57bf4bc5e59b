#pragma once
#include <string>
#include <map>
#include <optional>
#include <filesystem>

// Looks up a named secret (an API key). Empty values count as absent.
class SecretResolver {
public:
    virtual ~SecretResolver() = default;
    virtual std::optional<std::string> resolve(const std::string& key) const = 0;
};

class EnvSecretResolver : public SecretResolver {
public:
    std::optional<std::string> resolve(const std::string& key) const override;
};

// KEY=VALUE lines from a .env file; the process environment wins on conflicts.
class DotEnvSecretResolver : public SecretResolver {
public:
    explicit DotEnvSecretResolver(const std::filesystem::path& env_file);
    std::optional<std::string> resolve(const std::string& key) const override;
    std::size_t size() const { return values_.size(); }

private:
    std::map<std::string, std::string> values_;
    EnvSecretResolver env_;
};

class MapSecretResolver : public SecretResolver {
public:
    MapSecretResolver() = default;
    explicit MapSecretResolver(std::map<std::string, std::string> values) : values_(std::move(values)) {}
    void set(const std::string& key, const std::string& value) { values_[key] = value; }
    std::optional<std::string> resolve(const std::string& key) const override;

private:
    std::map<std::string, std::string> values_;
};

std::map<std::string, std::string> parse_dotenv(const std::string& text);
