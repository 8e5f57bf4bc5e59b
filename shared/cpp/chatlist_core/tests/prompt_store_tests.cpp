#include <catch2/catch.hpp>
#include "test_support.hpp"

TEST_CASE("prompts are created with normalized tags", "[prompts]") {
    TestCore t;
    int64_t id = t.core->prompts.create("Explain RAII", {" cpp ", "", "memory,safety"});
    auto p = t.core->prompts.find(id);
    REQUIRE(p);
    CHECK(p->text == "Explain RAII");
    CHECK(p->tags == std::vector<std::string>{"cpp", "memory safety"});
    CHECK_FALSE(p->created_at.empty());
}

TEST_CASE("empty prompt text is rejected", "[prompts]") {
    TestCore t;
    try {
        t.core->prompts.create("   ");
        FAIL("expected InvalidArgument");
    } catch (const ChatlistError& e) {
        CHECK(e.kind() == ErrorKind::InvalidArgument);
    }
}

TEST_CASE("prompts can be listed, sorted and searched", "[prompts]") {
    TestCore t;
    auto& ps = t.core->prompts;
    int64_t a = ps.create("beta question", {"x"});
    int64_t b = ps.create("alpha question", {"needle"});
    int64_t c = ps.create("gamma needle inside");

    auto by_id = ps.list("id", "ASC");
    REQUIRE(by_id.size() == 3);
    CHECK(by_id[0].id == a);
    CHECK(by_id[2].id == c);

    auto by_text = ps.list("prompt", "ASC");
    CHECK(by_text[0].id == b);

    // unknown column falls back to date DESC, newest first
    auto fallback = ps.list("drop table", "sideways");
    CHECK(fallback[0].id == c);

    auto hits = ps.search("needle");
    REQUIRE(hits.size() == 2);
    CHECK(hits[0].id == c);
    CHECK(hits[1].id == b);
    CHECK(ps.search("nothing here").empty());
}

TEST_CASE("deleting a prompt removes all of its results", "[prompts][cascade]") {
    TestCore t;
    int64_t provider = t.add_provider("alpha");
    int64_t keep = t.core->prompts.create("keep me");
    int64_t doomed = t.core->prompts.create("delete me");
    t.core->results.create(doomed, provider, "one");
    t.core->results.create(doomed, provider, "two");
    t.core->results.create(keep, provider, "three");

    t.core->prompts.remove(doomed);

    CHECK_FALSE(t.core->prompts.find(doomed).has_value());
    CHECK(t.core->results.count_for_prompt(doomed) == 0);
    CHECK(t.core->results.count_for_prompt(keep) == 1);
}

TEST_CASE("deleting a missing prompt reports NotFound and changes nothing", "[prompts]") {
    TestCore t;
    int64_t id = t.core->prompts.create("still here");
    try {
        t.core->prompts.remove(id + 100);
        FAIL("expected NotFound");
    } catch (const ChatlistError& e) {
        CHECK(e.kind() == ErrorKind::NotFound);
    }
    CHECK(t.core->prompts.find(id).has_value());
}
