#pragma once
#include <string>
#include <vector>

struct Provider;

// Every provider speaks the same OpenAI-compatible chat protocol; only the
// endpoint, credential and model identifier differ.
std::string build_chat_request(const Provider& p, const std::string& prompt);
std::vector<std::string> chat_headers(const Provider& p);

// Pulls the answer out of a chat completion body. Throws ChatlistError(NetworkError)
// when the body is not JSON or carries no text.
std::string extract_response_text(const std::string& body);

// Turns a non-2xx status into a NetworkError message with a short body excerpt.
std::string describe_http_failure(long status, const std::string& body);
