#include "../../../shared/cpp/chatlist_core/include/core.hpp"
#include "../../../shared/cpp/chatlist_core/include/export.hpp"
#include "../../../shared/cpp/chatlist_core/include/util.hpp"
#include "../../../shared/cpp/chatlist_core/include/log.hpp"
#include <iostream>
#include <csignal>
#include <map>

static CancelToken g_cancel;

static void usage() {
    std::cerr << "chatlist usage: chatlist [--db <dbfile>] [--env-file <path>] <command> [options]\n"
              << "  prompt add --text \"...\" [--tags a,b]\n"
              << "  prompt list [--sort id|date|prompt] [--order ASC|DESC]\n"
              << "  prompt search --query \"...\"\n"
              << "  prompt rm --id N\n"
              << "  model add --name N --url U --key ENV_NAME [--model-name M] [--inactive]\n"
              << "  model list [--active]\n"
              << "  model toggle --id N\n"
              << "  model rm --id N\n"
              << "  send (--prompt-id N | --text \"...\" [--tags a,b])\n"
              << "  results --prompt-id N\n"
              << "  select --id N [--off] | toggle --id N\n"
              << "  selected\n"
              << "  settings [list | get KEY | set KEY VALUE]\n"
              << "  export --format markdown|json --out FILE\n";
}

// Collects "--flag value" pairs and bare "--flag" switches after the command words.
static std::map<std::string, std::string> parse_flags(int argc, char** argv, int start) {
    std::map<std::string, std::string> out;
    for (int i = start; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0) continue;
        if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) out[a] = argv[++i];
        else out[a] = "";
    }
    return out;
}

static std::string flag_or(const std::map<std::string, std::string>& f, const std::string& k, const std::string& def = {}) {
    auto it = f.find(k);
    return it == f.end() ? def : it->second;
}

static int64_t require_id(const std::map<std::string, std::string>& f, const std::string& k) {
    auto it = f.find(k);
    if (it == f.end() || it->second.empty()) {
        throw ChatlistError(ErrorKind::InvalidArgument, k + " is required");
    }
    try {
        return std::stoll(it->second);
    } catch (const std::exception&) {
        throw ChatlistError(ErrorKind::InvalidArgument, k + " must be a number");
    }
}

static void print_result(const ResultRecord& r) {
    std::cout << "[" << r.id << "] " << r.created_at << "  " << r.model_name
              << (r.selected ? "  (selected)" : "") << "\n";
    if (r.status == ResultStatus::Failure) std::cout << "  error " << r.error_kind << ": ";
    std::cout << r.response << "\n\n";
}

static int run_send(ChatlistCore& core, const std::map<std::string, std::string>& f) {
    int64_t prompt_id = 0;
    if (f.count("--text")) {
        prompt_id = core.prompts.create(flag_or(f, "--text"), split_tags(flag_or(f, "--tags")));
        std::cout << "[OK] Prompt saved: " << prompt_id << "\n";
    } else {
        prompt_id = require_id(f, "--prompt-id");
    }
    std::signal(SIGINT, [](int){ g_cancel.cancel(); });
    auto outcomes = core.engine.dispatch(prompt_id, [](const DispatchOutcome& o) {
        std::cout << "==== " << o.provider_name << " (" << o.elapsed.count() << " ms) ====\n";
        if (o.status == OutcomeStatus::Success) std::cout << o.response_text << "\n\n";
        else std::cout << "[" << error_kind_name(*o.error_kind) << "] " << o.error_detail << "\n\n";
        if (!o.persist_error.empty()) std::cout << "[WARN] not stored: " << o.persist_error << "\n\n";
    }, &g_cancel);
    std::signal(SIGINT, SIG_DFL);
    if (outcomes.empty()) {
        std::cout << "No active models. Add one with 'chatlist model add'.\n";
        return 0;
    }
    std::size_t ok = 0;
    for (auto& o : outcomes) if (o.status == OutcomeStatus::Success) ++ok;
    std::cout << "[OK] Responses: " << ok << "/" << outcomes.size() << "\n";
    return 0;
}

static int run_prompt(ChatlistCore& core, const std::string& sub, const std::map<std::string, std::string>& f) {
    if (sub == "add") {
        int64_t id = core.prompts.create(flag_or(f, "--text"), split_tags(flag_or(f, "--tags")));
        std::cout << "[OK] Prompt saved: " << id << "\n";
        return 0;
    }
    if (sub == "list" || sub == "search") {
        auto prompts = sub == "list" ? core.prompts.list(flag_or(f, "--sort", "date"), flag_or(f, "--order", "DESC"))
                                     : core.prompts.search(flag_or(f, "--query"));
        for (auto& p : prompts) {
            std::cout << "[" << p.id << "] " << p.created_at << "  " << join_tags(p.tags) << "\n  "
                      << utf8_truncate(p.text, 120) << "\n";
        }
        return 0;
    }
    if (sub == "rm") {
        core.prompts.remove(require_id(f, "--id"));
        std::cout << "[OK] Prompt deleted\n";
        return 0;
    }
    usage();
    return 1;
}

static int run_model(ChatlistCore& core, const std::string& sub, const std::map<std::string, std::string>& f) {
    if (sub == "add") {
        Provider p;
        p.name = flag_or(f, "--name");
        p.api_url = flag_or(f, "--url");
        p.api_id = flag_or(f, "--key");
        p.model_name = flag_or(f, "--model-name");
        p.is_active = !f.count("--inactive");
        std::cout << "[OK] Model saved: " << core.models.create(p) << "\n";
        return 0;
    }
    if (sub == "list") {
        auto models = f.count("--active") ? core.models.list_active() : core.models.list_all();
        for (auto& p : models) {
            std::cout << "[" << p.id << "] " << p.name << (p.is_active ? "" : " (inactive)") << "  "
                      << p.api_url << "  key=" << p.api_id
                      << (p.model_name.empty() ? "" : "  model=" + p.model_name) << "\n";
        }
        return 0;
    }
    if (sub == "toggle") {
        bool active = core.models.toggle_active(require_id(f, "--id"));
        std::cout << "[OK] Model is now " << (active ? "active" : "inactive") << "\n";
        return 0;
    }
    if (sub == "rm") {
        core.models.remove(require_id(f, "--id"));
        std::cout << "[OK] Model deleted\n";
        return 0;
    }
    usage();
    return 1;
}

static int run_settings(ChatlistCore& core, int argc, char** argv, int i) {
    std::string sub = i < argc ? argv[i] : "list";
    if (sub == "list") {
        for (auto& kv : core.settings.all()) std::cout << kv.first << " = " << kv.second << "\n";
        return 0;
    }
    if (sub == "get" && i + 1 < argc) {
        std::cout << core.settings.get(argv[i + 1]) << "\n";
        return 0;
    }
    if (sub == "set" && i + 2 < argc) {
        core.settings.set(argv[i + 1], argv[i + 2]);
        std::cout << "[OK] " << argv[i + 1] << " = " << argv[i + 2] << "\n";
        return 0;
    }
    usage();
    return 1;
}

int main(int argc, char** argv) {
    AppConfig cfg = load_config_from_env();
    int i = 1;
    for (; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--db" && i + 1 < argc) cfg.db_path = argv[++i];
        else if (a == "--env-file" && i + 1 < argc) cfg.env_file = argv[++i];
        else if (a == "--log-level" && i + 1 < argc) cfg.log_level = argv[++i];
        else break;
    }
    if (i >= argc) { usage(); return 1; }
    apply_logging(cfg);

    std::string cmd = argv[i];
    try {
        ChatlistCore core(cfg);
        if (cmd == "prompt" && i + 1 < argc) return run_prompt(core, argv[i + 1], parse_flags(argc, argv, i + 2));
        if (cmd == "model" && i + 1 < argc) return run_model(core, argv[i + 1], parse_flags(argc, argv, i + 2));
        if (cmd == "send") return run_send(core, parse_flags(argc, argv, i + 1));
        if (cmd == "settings") return run_settings(core, argc, argv, i + 1);
        auto f = parse_flags(argc, argv, i + 1);
        if (cmd == "results") {
            for (auto& r : core.results.find_results(require_id(f, "--prompt-id"))) print_result(r);
            return 0;
        }
        if (cmd == "selected") {
            for (auto& r : core.results.find_selected()) print_result(r);
            return 0;
        }
        if (cmd == "select") {
            core.results.set_selected(require_id(f, "--id"), !f.count("--off"));
            std::cout << "[OK]\n";
            return 0;
        }
        if (cmd == "toggle") {
            bool selected = core.results.toggle_selected(require_id(f, "--id"));
            std::cout << "[OK] " << (selected ? "selected" : "unselected") << "\n";
            return 0;
        }
        if (cmd == "export") {
            ExportFormat fmt = ExportFormat::Markdown;
            std::string requested = flag_or(f, "--format", core.settings.get("export_format"));
            if (!parse_export_format(requested, fmt)) {
                throw ChatlistError(ErrorKind::InvalidArgument, "unknown export format: " + requested);
            }
            std::string out = flag_or(f, "--out");
            if (out.empty()) throw ChatlistError(ErrorKind::InvalidArgument, "--out is required");
            std::size_t n = export_selected(core.results, fmt, out);
            std::cout << "[OK] Exported " << n << " result(s) to " << out << "\n";
            return 0;
        }
        usage();
        return 1;
    } catch (const ChatlistError& e) {
        std::cerr << "[ERROR] " << error_kind_name(e.kind()) << ": " << e.what() << "\n";
        return e.kind() == ErrorKind::InvalidArgument ? 2 : 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
