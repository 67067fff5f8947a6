#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace wxstream {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────

using HeaderMap = std::unordered_map<std::string, std::string>;

/// Case-insensitive lookup (header names are case-insensitive, RFC 9110).
inline HeaderMap::const_iterator find_header(const HeaderMap& headers, std::string_view name) {
    return std::ranges::find_if(headers, [&name](const auto& entry) {
        return entry.first.size() == name.size() &&
               std::ranges::equal(entry.first, name, [](char a, char b) {
                   return std::tolower(static_cast<unsigned char>(a)) ==
                          std::tolower(static_cast<unsigned char>(b));
               });
    });
}

inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = find_header(headers, name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

/// True when Content-Type names the given media type (parameters such as
/// "; charset=utf-8" are ignored).
[[nodiscard]] bool has_media_type(const HeaderMap& headers, std::string_view media_type);

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

// Subscriptions use GET, request-scoped RAG streams POST a JSON body
enum class HttpMethod {
    Get,
    Post
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "UNKNOWN";
}

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string path;                  // path and query, relative to the client's base URL
    HeaderMap headers;
    std::optional<std::string> body;

    HttpRequest& with_header(const std::string& name, const std::string& value) {
        headers[name] = value;
        return *this;
    }

    HttpRequest& with_body(std::string content) {
        body = std::move(content);
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// URLs
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port{0};
    std::string path;     // always starts with '/'
    std::string query;    // includes '?', may be empty

    [[nodiscard]] bool is_secure() const { return scheme == "https"; }

    /// "scheme://host:port", the base URL handed to IHttpClient.
    [[nodiscard]] std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    [[nodiscard]] std::string path_with_query() const {
        return query.empty() ? path : path + query;
    }
};

/// WHATWG URL parsing (ada). Returns nullopt for malformed URLs and for any
/// scheme other than http/https.
[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace wxstream
