#pragma once
#include "outcome.hpp"
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>

class PromptStore;
class ModelRegistry;
class ResultStore;
class SettingsStore;
class HttpTransport;
class CancelToken;
struct Provider;

// Read once per dispatch and shared by every provider call in it.
struct DispatchPolicy {
    std::chrono::milliseconds timeout{30000};
    std::size_t max_response_length{10000};
    bool verify_tls{true};
};

class DispatchEngine {
public:
    using OutcomeCallback = std::function<void(const DispatchOutcome&)>;

    DispatchEngine(PromptStore& prompts, ModelRegistry& registry, ResultStore& results,
                   SettingsStore& settings, HttpTransport& transport);

    // Sends the prompt to every active provider concurrently. Each outcome is
    // persisted and reported through on_outcome as soon as it resolves; the call
    // returns once all providers have resolved. Throws NotFound for an unknown prompt.
    std::vector<DispatchOutcome> dispatch(int64_t prompt_id,
                                          const OutcomeCallback& on_outcome = {},
                                          const CancelToken* cancel = nullptr);

    // Invalid settings are logged and replaced by their defaults.
    DispatchPolicy resolve_policy();

private:
    DispatchOutcome call_provider(const Provider& provider, const std::string& prompt_text,
                                  const DispatchPolicy& policy, const CancelToken* cancel);
    void persist(int64_t prompt_id, DispatchOutcome& outcome);

    PromptStore& prompts_;
    ModelRegistry& registry_;
    ResultStore& results_;
    SettingsStore& settings_;
    HttpTransport& transport_;
};
