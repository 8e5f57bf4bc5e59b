#include "../include/dispatch_engine.hpp"
#include "../include/prompt_store.hpp"
#include "../include/model_registry.hpp"
#include "../include/result_store.hpp"
#include "../include/settings_store.hpp"
#include "../include/outcome_queue.hpp"
#include "../include/provider_protocol.hpp"
#include "../include/http.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <thread>
#include <system_error>

using std::chrono::steady_clock;
using std::chrono::milliseconds;
using std::chrono::duration_cast;

DispatchEngine::DispatchEngine(PromptStore& prompts, ModelRegistry& registry, ResultStore& results,
                               SettingsStore& settings, HttpTransport& transport)
    : prompts_(prompts), registry_(registry), results_(results), settings_(settings), transport_(transport) {}

DispatchPolicy DispatchEngine::resolve_policy() {
    DispatchPolicy policy;
    auto fallback = [](const ChatlistError& e) {
        if (e.kind() != ErrorKind::InvalidSetting) throw;
        log_warn(std::string(e.what()) + "; using default");
    };
    try {
        policy.timeout = std::chrono::seconds(settings_.get_positive_int(SETTING_TIMEOUT));
    } catch (const ChatlistError& e) {
        fallback(e);
    }
    try {
        policy.max_response_length = (std::size_t)settings_.get_positive_int(SETTING_MAX_RESPONSE_LENGTH);
    } catch (const ChatlistError& e) {
        fallback(e);
    }
    try {
        policy.verify_tls = settings_.get_bool(SETTING_VERIFY_SSL);
    } catch (const ChatlistError& e) {
        fallback(e);
    }
    return policy;
}

std::vector<DispatchOutcome> DispatchEngine::dispatch(int64_t prompt_id,
                                                      const OutcomeCallback& on_outcome,
                                                      const CancelToken* cancel) {
    auto prompt = prompts_.find(prompt_id);
    if (!prompt) {
        throw ChatlistError(ErrorKind::NotFound, "prompt not found: " + std::to_string(prompt_id));
    }
    auto providers = registry_.list_active();
    if (providers.empty()) {
        log_info("no active providers; nothing to dispatch for prompt " + std::to_string(prompt_id));
        return {};
    }
    const DispatchPolicy policy = resolve_policy();
    log_info("dispatching prompt " + std::to_string(prompt_id) + " to " + std::to_string(providers.size()) +
             " provider(s), timeout " + std::to_string(policy.timeout.count()) + " ms");

    const std::string text = prompt->text;
    OutcomeQueue queue;
    std::vector<std::thread> workers;
    workers.reserve(providers.size());
    for (const auto& p : providers) {
        try {
            workers.emplace_back([this, &queue, &text, &policy, cancel, p] {
                queue.push(call_provider(p, text, policy, cancel));
            });
        } catch (const std::system_error& e) {
            DispatchOutcome o;
            o.provider_id = p.id;
            o.provider_name = p.name;
            o.error_kind = ErrorKind::NetworkError;
            o.error_detail = std::string("could not start worker: ") + e.what();
            queue.push(std::move(o));
        }
    }

    std::vector<DispatchOutcome> outcomes;
    outcomes.reserve(providers.size());
    for (std::size_t i = 0; i < providers.size(); ++i) {
        DispatchOutcome o = queue.pop();
        // an aborted call is not a completed attempt and leaves no row behind
        if (!(o.error_kind && *o.error_kind == ErrorKind::Cancelled)) {
            persist(prompt_id, o);
        }
        if (on_outcome) {
            try {
                on_outcome(o);
            } catch (const std::exception& e) {
                log_warn(std::string("outcome callback failed: ") + e.what());
            }
        }
        outcomes.push_back(std::move(o));
    }
    for (auto& w : workers) w.join();
    return outcomes;
}

DispatchOutcome DispatchEngine::call_provider(const Provider& provider, const std::string& prompt_text,
                                              const DispatchPolicy& policy, const CancelToken* cancel) {
    // The deadline starts with the task, so credential lookup and the request share one budget.
    const auto started = steady_clock::now();
    const auto deadline = started + policy.timeout;

    DispatchOutcome o;
    o.provider_id = provider.id;
    o.provider_name = provider.name;
    try {
        if (cancel && cancel->cancelled()) {
            throw ChatlistError(ErrorKind::Cancelled, "dispatch cancelled before request");
        }
        std::string credential = registry_.resolve_credential(provider);

        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) {
            throw ChatlistError(ErrorKind::Timeout, "deadline reached before request was sent");
        }
        HttpRequest req;
        req.url = provider.api_url;
        req.body = build_chat_request(provider, prompt_text);
        req.bearer_token = credential;
        req.headers = chat_headers(provider);
        req.verify_tls = policy.verify_tls;
        req.timeout_ms = (long)remaining.count();
        req.cancel = cancel;

        HttpResponse resp = transport_.send(req);
        if (resp.status < 200 || resp.status >= 300) {
            throw ChatlistError(ErrorKind::NetworkError, describe_http_failure(resp.status, resp.body));
        }
        o.response_text = utf8_truncate(extract_response_text(resp.body), policy.max_response_length);
        o.status = OutcomeStatus::Success;
    } catch (const ChatlistError& e) {
        o.status = OutcomeStatus::Failure;
        o.error_kind = e.kind();
        o.error_detail = e.what();
    } catch (const std::exception& e) {
        o.status = OutcomeStatus::Failure;
        o.error_kind = ErrorKind::NetworkError;
        o.error_detail = std::string("unexpected error: ") + e.what();
    }
    o.elapsed = duration_cast<milliseconds>(steady_clock::now() - started);

    if (o.status == OutcomeStatus::Success) {
        log_info(provider.name + ": response received in " + std::to_string(o.elapsed.count()) + " ms");
    } else {
        log_warn(provider.name + ": " + error_kind_name(*o.error_kind) + ": " + o.error_detail);
    }
    return o;
}

void DispatchEngine::persist(int64_t prompt_id, DispatchOutcome& o) {
    try {
        if (o.status == OutcomeStatus::Success) {
            o.result_id = results_.create(prompt_id, o.provider_id, o.response_text, ResultStatus::Success);
        } else {
            o.result_id = results_.create(prompt_id, o.provider_id, o.error_detail, ResultStatus::Failure,
                                          error_kind_name(*o.error_kind));
        }
    } catch (const std::exception& e) {
        o.persist_error = e.what();
        log_error("could not store result of " + o.provider_name + " for prompt " +
                  std::to_string(prompt_id) + ": " + e.what());
    }
}
