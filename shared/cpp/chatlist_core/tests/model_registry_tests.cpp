#include <catch2/catch.hpp>
#include "test_support.hpp"

TEST_CASE("list_active returns active providers in insertion order", "[registry]") {
    TestCore t;
    int64_t z = t.add_provider("zeta");
    t.add_provider("idle", false);
    int64_t a = t.add_provider("alpha");

    auto active = t.core->models.list_active();
    REQUIRE(active.size() == 2);
    CHECK(active[0].id == z);
    CHECK(active[1].id == a);

    auto all = t.core->models.list_all();
    REQUIRE(all.size() == 3);
    CHECK(all[0].name == "alpha");
}

TEST_CASE("provider names are unique", "[registry]") {
    TestCore t;
    t.add_provider("dup");
    try {
        t.add_provider("dup");
        FAIL("expected InvalidArgument");
    } catch (const ChatlistError& e) {
        CHECK(e.kind() == ErrorKind::InvalidArgument);
    }
}

TEST_CASE("providers can be edited and toggled", "[registry]") {
    TestCore t;
    int64_t id = t.add_provider("edit");
    auto p = *t.core->models.find(id);
    p.model_name = "gpt-4o-mini";
    p.api_url = "https://other.example/v1/chat/completions";
    t.core->models.update(p);
    auto stored = t.core->models.find_by_name("edit");
    REQUIRE(stored);
    CHECK(stored->model_name == "gpt-4o-mini");
    CHECK(stored->api_url == "https://other.example/v1/chat/completions");

    CHECK(t.core->models.toggle_active(id) == false);
    CHECK(t.core->models.list_active().empty());
    CHECK(t.core->models.toggle_active(id) == true);

    CHECK_THROWS_AS(t.core->models.set_active(id + 50, true), ChatlistError);
}

TEST_CASE("a referenced provider cannot be deleted", "[registry][restrict]") {
    TestCore t;
    int64_t provider = t.add_provider("busy");
    int64_t prompt = t.core->prompts.create("hello");
    int64_t result = t.core->results.create(prompt, provider, "answer");

    try {
        t.core->models.remove(provider);
        FAIL("expected ProviderInUse");
    } catch (const ChatlistError& e) {
        CHECK(e.kind() == ErrorKind::ProviderInUse);
    }
    CHECK(t.core->models.find(provider).has_value());
    auto r = t.core->results.find(result);
    REQUIRE(r);
    CHECK(r->response == "answer");

    // deactivating keeps history queryable
    t.core->models.set_active(provider, false);
    CHECK(t.core->results.find_results(prompt).size() == 1);
}

TEST_CASE("an unreferenced provider can be deleted", "[registry]") {
    TestCore t;
    int64_t provider = t.add_provider("free");
    t.core->models.remove(provider);
    CHECK_FALSE(t.core->models.find(provider).has_value());
    CHECK_THROWS_AS(t.core->models.remove(provider), ChatlistError);
}

TEST_CASE("credentials resolve through the injected resolver", "[registry][secrets]") {
    TestCore t;
    int64_t with = t.add_provider("keyed");
    int64_t without = t.add_provider("keyless", true, false);
    CHECK(t.core->models.resolve_credential(*t.core->models.find(with)) == "secret-keyed");
    try {
        t.core->models.resolve_credential(*t.core->models.find(without));
        FAIL("expected MissingCredential");
    } catch (const ChatlistError& e) {
        CHECK(e.kind() == ErrorKind::MissingCredential);
    }
}
