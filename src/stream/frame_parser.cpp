#include "wxstream/stream/frame_parser.hpp"

#include <charconv>

namespace wxstream {

namespace {

constexpr std::string_view kWhitespace = " \t";

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

[[nodiscard]] std::optional<std::uint32_t> parse_retry(std::string_view value) noexcept {
    if (value.empty()) {
        return std::nullopt;
    }
    std::uint32_t millis = 0;
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, millis);
    const bool consumed_all = (ec == std::errc{} && ptr == end);
    if (consumed_all == false) {
        return std::nullopt;
    }
    return millis;
}

}  // namespace

std::optional<StreamFrame> parse_frame(std::string_view block) {
    StreamFrame frame;
    bool has_data = false;

    while (block.empty() == false) {
        const auto newline = block.find('\n');
        std::string_view line = block.substr(0, newline);
        block = (newline == std::string_view::npos) ? std::string_view{} : block.substr(newline + 1);

        if (line.empty() == false && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty() || line.front() == ':') {
            continue;
        }

        std::string_view field = line;
        std::string_view value;
        const auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            field = line.substr(0, colon);
            value = line.substr(colon + 1);
            if (value.empty() == false && value.front() == ' ') {
                value.remove_prefix(1);
            }
        }
        field = trim(field);

        if (field == "data") {
            if (has_data) {
                frame.data.push_back('\n');
            }
            frame.data.append(value);
            has_data = true;
        } else if (field == "event") {
            frame.event = std::string(value);
        } else if (field == "id") {
            frame.id = std::string(value);
        } else if (field == "retry") {
            if (auto millis = parse_retry(value)) {
                frame.retry = millis;
            }
        }
    }

    if (has_data == false) {
        return std::nullopt;
    }
    return frame;
}

}  // namespace wxstream
