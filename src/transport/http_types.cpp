#include "wxstream/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace wxstream {

bool has_media_type(const HeaderMap& headers, std::string_view media_type) {
    const auto content_type = get_header(headers, "Content-Type");
    if (content_type.has_value() == false) {
        return false;
    }
    std::string_view value(*content_type);
    value = value.substr(0, value.find(';'));
    while (value.empty() == false && value.back() == ' ') {
        value.remove_suffix(1);
    }
    return value.size() == media_type.size() &&
           std::ranges::equal(value, media_type, [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }
    const auto& ada_url = parsed.value();

    // ada reports the scheme as "https:"
    std::string scheme(ada_url.get_protocol());
    if (scheme.empty() == false && scheme.back() == ':') {
        scheme.pop_back();
    }
    const bool is_https = (scheme == "https");
    if (is_https == false && scheme != "http") {
        return std::nullopt;
    }

    UrlComponents result;
    result.host = std::string(ada_url.get_hostname());
    if (result.host.empty()) {
        return std::nullopt;
    }

    const auto port_text = ada_url.get_port();
    if (port_text.empty()) {
        result.port = is_https ? 443 : 80;
    } else {
        const auto [ptr, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), result.port);
        if (ec != std::errc{}) {
            return std::nullopt;
        }
    }

    result.scheme = std::move(scheme);
    result.path = std::string(ada_url.get_pathname());
    if (result.path.empty()) {
        result.path = "/";
    }
    result.query = std::string(ada_url.get_search());
    return result;
}

}  // namespace wxstream
