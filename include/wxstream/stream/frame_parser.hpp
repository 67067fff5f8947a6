#pragma once

#include "wxstream/stream/stream_frame.hpp"

#include <optional>
#include <string_view>

namespace wxstream {

/// Parses one delimiter-bounded block of `field: value` lines.
///
/// - empty lines and lines starting with ':' are skipped
/// - the field name is trimmed; exactly one space after the colon is removed
/// - a line without a colon is a field with an empty value
/// - id and event overwrite, data lines append, retry must be all digits
/// - unknown fields are ignored
///
/// Returns nullopt when the block had no data field (comment-only blocks,
/// heartbeats, id-only blocks).
[[nodiscard]] std::optional<StreamFrame> parse_frame(std::string_view block);

}  // namespace wxstream
