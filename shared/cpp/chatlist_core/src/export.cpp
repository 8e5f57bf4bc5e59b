#include "../include/export.hpp"
#include "../include/json_codec.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include "../include/log.hpp"
#include <fstream>
#include <sstream>

bool parse_export_format(const std::string& s, ExportFormat& out) {
    auto v = to_lower(trim(s));
    if (v == "markdown" || v == "md") { out = ExportFormat::Markdown; return true; }
    if (v == "json") { out = ExportFormat::Json; return true; }
    return false;
}

std::string export_markdown(const std::vector<ResultRecord>& results, const std::string& exported_at) {
    std::ostringstream os;
    os << "# ChatList results export\n\n";
    os << "Exported: " << exported_at << "\n\n";
    for (auto& r : results) {
        os << "## " << (r.model_name.empty() ? "Unknown" : r.model_name) << "\n\n";
        os << "**Prompt:** " << r.prompt_text << "\n\n";
        os << "**Date:** " << r.created_at << "\n\n";
        if (r.status == ResultStatus::Failure) {
            os << "**Error (" << r.error_kind << "):**\n\n" << r.response << "\n\n";
        } else {
            os << "**Response:**\n\n" << r.response << "\n\n";
        }
        os << "---\n\n";
    }
    return os.str();
}

std::string export_json(const std::vector<ResultRecord>& results) {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& r : results) arr.push_back(to_json(r));
    return arr.dump(2);
}

std::size_t export_selected(ResultStore& store, ExportFormat format, const std::filesystem::path& out) {
    auto results = store.find_selected();
    std::string body = format == ExportFormat::Json ? export_json(results)
                                                    : export_markdown(results, utc_timestamp());
    std::ofstream f(out, std::ios::binary | std::ios::trunc);
    if (!f) {
        throw ChatlistError(ErrorKind::InvalidArgument, "cannot open export file: " + out.string());
    }
    f << body;
    if (!f) {
        throw ChatlistError(ErrorKind::Storage, "failed writing export file: " + out.string());
    }
    log_info("exported " + std::to_string(results.size()) + " result(s) to " + out.string());
    return results.size();
}
