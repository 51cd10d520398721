#include "http/http_message.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace vigil {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string HttpRequest::query_param(const std::string& key) const {
    auto it = query.find(key);
    return it == query.end() ? "" : it->second;
}

std::string HttpResponse::serialize() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n"
        << "Content-Type: " << content_type << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n"
        << body;
    return out.str();
}

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::size_t header_end(const std::string& raw) {
    auto pos = raw.find("\r\n\r\n");
    if (pos == std::string::npos) {
        return std::string::npos;
    }
    return pos + 4;
}

std::size_t content_length(const std::string& head) {
    std::istringstream lines(head);
    std::string line;
    while (std::getline(lines, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (to_lower(trim(line.substr(0, colon))) == "content-length") {
            try {
                return static_cast<std::size_t>(std::stoul(trim(line.substr(colon + 1))));
            } catch (const std::exception&) {
                throw HttpError("invalid Content-Length");
            }
        }
    }
    return 0;
}

HttpRequest parse_request(const std::string& raw) {
    auto end = header_end(raw);
    if (end == std::string::npos) {
        throw HttpError("incomplete request head");
    }

    std::string head = raw.substr(0, end - 4);
    HttpRequest request;
    request.body = raw.substr(end);

    std::istringstream lines(head);
    std::string request_line;
    std::getline(lines, request_line);
    if (!request_line.empty() && request_line.back() == '\r') {
        request_line.pop_back();
    }

    std::istringstream parts(request_line);
    std::string target;
    std::string version;
    parts >> request.method >> target >> version;
    if (request.method.empty() || target.empty() || version.rfind("HTTP/", 0) != 0) {
        throw HttpError("malformed request line: " + request_line);
    }

    auto question = target.find('?');
    request.path = url_decode(target.substr(0, question));
    if (question != std::string::npos) {
        std::istringstream pairs(target.substr(question + 1));
        std::string pair;
        while (std::getline(pairs, pair, '&')) {
            if (pair.empty()) {
                continue;
            }
            auto eq = pair.find('=');
            std::string key = url_decode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : url_decode(pair.substr(eq + 1));
            request.query.emplace(key, value);
        }
    }

    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw HttpError("malformed header: " + line);
        }
        request.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    return request;
}

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
    }
    return "Unknown";
}

} // namespace vigil
