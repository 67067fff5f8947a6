#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace wxstream {

/// One dispatched event-stream message. Only produced for blocks that carried
/// at least one `data` line; multi-line data is joined with '\n'.
struct StreamFrame {
    std::optional<std::string> id;
    std::optional<std::string> event;
    std::string data;
    std::optional<std::uint32_t> retry;  // milliseconds

    [[nodiscard]] std::string_view event_type() const noexcept {
        return event.has_value() ? std::string_view(*event) : std::string_view("message");
    }

    bool operator==(const StreamFrame&) const = default;
};

}  // namespace wxstream
