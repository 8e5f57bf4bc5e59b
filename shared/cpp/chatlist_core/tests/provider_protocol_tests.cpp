#include <catch2/catch.hpp>
#include "../include/provider_protocol.hpp"
#include "../include/model_registry.hpp"
#include "../include/errors.hpp"
#include <nlohmann/json.hpp>

TEST_CASE("chat requests use the model identifier and fall back to the name", "[protocol]") {
    Provider p;
    p.name = "GPT-4o";
    p.api_url = "https://api.openai.com/v1/chat/completions";
    auto body = nlohmann::json::parse(build_chat_request(p, "hi there"));
    CHECK(body["model"] == "GPT-4o");
    CHECK(body["messages"].size() == 1);
    CHECK(body["messages"][0]["role"] == "user");
    CHECK(body["messages"][0]["content"] == "hi there");

    p.model_name = "openai/gpt-4o";
    body = nlohmann::json::parse(build_chat_request(p, "hi"));
    CHECK(body["model"] == "openai/gpt-4o");
}

TEST_CASE("openrouter endpoints get a title header", "[protocol]") {
    Provider p;
    p.api_url = "https://openrouter.ai/api/v1/chat/completions";
    CHECK(chat_headers(p) == std::vector<std::string>{"X-Title: ChatList"});
    p.api_url = "https://api.deepseek.com/chat/completions";
    CHECK(chat_headers(p).empty());
}

TEST_CASE("response text is found in the common reply shapes", "[protocol]") {
    CHECK(extract_response_text(R"({"choices":[{"message":{"content":"A"}}]})") == "A");
    CHECK(extract_response_text(R"({"choices":[{"text":"B"}]})") == "B");
    CHECK(extract_response_text(R"({"content":"C"})") == "C");
    CHECK(extract_response_text(R"({"message":{"content":"D"}})") == "D");
}

TEST_CASE("unusable bodies are network errors", "[protocol]") {
    auto kind_of = [](const std::string& body) {
        try {
            extract_response_text(body);
        } catch (const ChatlistError& e) {
            return e.kind();
        }
        return ErrorKind::Storage;
    };
    CHECK(kind_of("not json") == ErrorKind::NetworkError);
    CHECK(kind_of("[]") == ErrorKind::NetworkError);
    CHECK(kind_of(R"({"choices":[]})") == ErrorKind::NetworkError);
    CHECK(kind_of(R"({"error":{"message":"quota exceeded"}})") == ErrorKind::NetworkError);
    CHECK_THROWS_WITH(extract_response_text(R"({"error":{"message":"quota exceeded"}})"),
                      Catch::Contains("quota exceeded"));
}

TEST_CASE("http failure descriptions are bounded", "[protocol]") {
    std::string body(500, 'x');
    auto msg = describe_http_failure(503, body);
    CHECK(msg.find("503") != std::string::npos);
    CHECK(msg.size() < 250);
    CHECK(describe_http_failure(401, "denied") == "HTTP status 401: denied");
}
