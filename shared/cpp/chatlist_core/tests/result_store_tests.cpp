#include <catch2/catch.hpp>
#include "test_support.hpp"
#include <thread>
#include <algorithm>

TEST_CASE("results must reference existing rows", "[results]") {
    TestCore t;
    int64_t provider = t.add_provider("p");
    int64_t prompt = t.core->prompts.create("q");
    CHECK_THROWS_AS(t.core->results.create(prompt + 9, provider, "x"), ChatlistError);
    CHECK_THROWS_AS(t.core->results.create(prompt, provider + 9, "x"), ChatlistError);
    CHECK(t.core->results.count_for_prompt(prompt) == 0);
}

TEST_CASE("find_results returns a prompt's results oldest first", "[results]") {
    TestCore t;
    int64_t a = t.add_provider("a");
    int64_t b = t.add_provider("b");
    int64_t prompt = t.core->prompts.create("q");
    int64_t first = t.core->results.create(prompt, a, "first");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    int64_t second = t.core->results.create(prompt, b, "second", ResultStatus::Failure, "Timeout");

    auto rows = t.core->results.find_results(prompt);
    REQUIRE(rows.size() == 2);
    CHECK(rows[0].id == first);
    CHECK(rows[0].model_name == "a");
    CHECK(rows[0].prompt_text == "q");
    CHECK(rows[1].id == second);
    CHECK(rows[1].status == ResultStatus::Failure);
    CHECK(rows[1].error_kind == "Timeout");
}

TEST_CASE("selected toggling is idempotent and find_selected spans prompts", "[results][selected]") {
    TestCore t;
    int64_t provider = t.add_provider("p");
    int64_t p1 = t.core->prompts.create("one");
    int64_t p2 = t.core->prompts.create("two");
    int64_t r1 = t.core->results.create(p1, provider, "r1");
    int64_t r2 = t.core->results.create(p2, provider, "r2");
    int64_t r3 = t.core->results.create(p2, provider, "r3");

    CHECK(t.core->results.toggle_selected(r1) == true);
    CHECK(t.core->results.toggle_selected(r1) == false);
    CHECK_FALSE(t.core->results.find(r1)->selected);

    t.core->results.set_selected(r1, true);
    t.core->results.set_selected(r3, true);
    t.core->results.set_selected(r3, true);

    auto selected = t.core->results.find_selected();
    REQUIRE(selected.size() == 2);
    std::vector<int64_t> ids{selected[0].id, selected[1].id};
    CHECK(std::find(ids.begin(), ids.end(), r1) != ids.end());
    CHECK(std::find(ids.begin(), ids.end(), r3) != ids.end());
    CHECK(std::find(ids.begin(), ids.end(), r2) == ids.end());

    CHECK_THROWS_AS(t.core->results.toggle_selected(r3 + 100), ChatlistError);
}

TEST_CASE("results can be searched and removed", "[results]") {
    TestCore t;
    int64_t provider = t.add_provider("p");
    int64_t prompt = t.core->prompts.create("q");
    int64_t keep = t.core->results.create(prompt, provider, "contains the word banana");
    int64_t drop = t.core->results.create(prompt, provider, "nothing");
    auto hits = t.core->results.search("banana");
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].id == keep);
    t.core->results.remove(drop);
    CHECK(t.core->results.count_for_provider(provider) == 1);
}
