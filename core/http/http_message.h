#pragma once

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

namespace vigil {

class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& what)
        : std::runtime_error(what) {}
};

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;   // keys lower-cased
    std::string body;

    std::string query_param(const std::string& key) const;
};

struct HttpResponse {
    int status = 200;
    std::string content_type = "application/json";
    std::string body;

    std::string serialize() const;
};

// Parses a complete request (head plus body). Throws HttpError when the
// request line or headers are malformed.
HttpRequest parse_request(const std::string& raw);

// Returns the position just past the blank line ending the head, or npos.
std::size_t header_end(const std::string& raw);

// Content-Length of a request head, 0 when absent.
std::size_t content_length(const std::string& head);

std::string url_decode(const std::string& text);

const char* status_text(int status);

} // namespace vigil
