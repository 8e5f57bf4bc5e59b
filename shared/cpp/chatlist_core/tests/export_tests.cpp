#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "../include/export.hpp"
#include "../include/util.hpp"
#include <filesystem>

namespace fs = std::filesystem;

TEST_CASE("export formats are parsed case-insensitively", "[export]") {
    ExportFormat f = ExportFormat::Json;
    CHECK(parse_export_format("MD", f));
    CHECK(f == ExportFormat::Markdown);
    CHECK(parse_export_format("json", f));
    CHECK(f == ExportFormat::Json);
    CHECK_FALSE(parse_export_format("csv", f));
}

TEST_CASE("markdown export lists each selected result", "[export]") {
    ResultRecord ok;
    ok.model_name = "alpha";
    ok.prompt_text = "question";
    ok.created_at = "2024-01-01 10:00:00.000";
    ok.response = "answer";
    ResultRecord bad = ok;
    bad.model_name = "beta";
    bad.status = ResultStatus::Failure;
    bad.error_kind = "Timeout";
    bad.response = "timed out";

    auto md = export_markdown({ok, bad}, "2024-01-02 00:00:00");
    CHECK(md.rfind("# ChatList results export", 0) == 0);
    CHECK(md.find("## alpha") != std::string::npos);
    CHECK(md.find("**Response:**\n\nanswer") != std::string::npos);
    CHECK(md.find("**Error (Timeout):**") != std::string::npos);
    CHECK(md.find("## alpha") < md.find("## beta"));
}

TEST_CASE("selected results are written to disk", "[export]") {
    TestCore t;
    int64_t provider = t.add_provider("alpha");
    int64_t prompt = t.core->prompts.create("q");
    int64_t keep = t.core->results.create(prompt, provider, "kept");
    t.core->results.create(prompt, provider, "skipped");
    t.core->results.set_selected(keep, true);

    fs::path out = fs::temp_directory_path() / "chatlist_export_test.json";
    CHECK(export_selected(t.core->results, ExportFormat::Json, out) == 1);
    auto j = nlohmann::json::parse(read_text_file(out));
    REQUIRE(j.size() == 1);
    CHECK(j[0]["response"] == "kept");
    fs::remove(out);

    CHECK_THROWS_AS(export_selected(t.core->results, ExportFormat::Markdown,
                                    fs::path("/nonexistent-dir/x/out.md")), ChatlistError);
}
