#include <catch2/catch.hpp>
#include "../include/util.hpp"
#include "../include/outcome_queue.hpp"
#include <thread>

TEST_CASE("truncation counts code points, not bytes", "[util][utf8]") {
    std::string s = "h\xC3\xA9llo \xE2\x82\xAC!";  // "héllo €!"
    CHECK(utf8_length(s) == 8);
    CHECK(utf8_truncate(s, 2) == "h\xC3\xA9");
    CHECK(utf8_truncate(s, 7) == "h\xC3\xA9llo \xE2\x82\xAC");
    CHECK(utf8_truncate(s, 8) == s);
    CHECK(utf8_truncate(s, 100) == s);
    CHECK(utf8_truncate(s, 0).empty());
    CHECK(utf8_truncate("", 5).empty());
}

TEST_CASE("tags split on commas and drop blanks", "[util][tags]") {
    CHECK(split_tags("rust, cpp ,,  ") == std::vector<std::string>{"rust", "cpp"});
    CHECK(split_tags("").empty());
    CHECK(join_tags({"a", " b ", "", "c,d"}) == "a,b,c d");
}

TEST_CASE("boolean settings accept the usual spellings", "[util]") {
    bool v = false;
    CHECK(parse_bool(" Yes ", v));
    CHECK(v);
    CHECK(parse_bool("off", v));
    CHECK_FALSE(v);
    CHECK_FALSE(parse_bool("maybe", v));
}

TEST_CASE("outcome queue hands results over in completion order", "[util][queue]") {
    OutcomeQueue q;
    std::thread producer([&] {
        for (int i = 1; i <= 3; ++i) {
            DispatchOutcome o;
            o.provider_id = i;
            q.push(o);
        }
    });
    CHECK(q.pop().provider_id == 1);
    CHECK(q.pop().provider_id == 2);
    CHECK(q.pop().provider_id == 3);
    producer.join();
    CHECK(q.size() == 0);
}
