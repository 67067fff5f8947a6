#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Payload JSON decoding
// ─────────────────────────────────────────────────────────────────────────────
//
// Frame payloads arrive on the reader thread at token rate, so they are
// decoded with simdjson's on-demand parser and materialised as nlohmann::json
// for the typed event layer. Outgoing request bodies are built with nlohmann
// directly.
//
//   auto payload = wxstream::fast_parse_object(frame.data);
//   if (payload) {
//       const nlohmann::json& obj = *payload;
//   }
//
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <string>
#include <format>
#include <string_view>

namespace wxstream {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg) : message(std::move(msg)) {}
};

using JsonResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    // Payloads are shallow; anything deeper is rejected rather than recursed into
    std::size_t max_depth{32};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    /// Not thread-safe; one parser per thread.
    [[nodiscard]] JsonResult parse(std::string_view text);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;

    [[nodiscard]] JsonResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] JsonResult convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] JsonResult convert_array(simdjson::ondemand::array arr, std::size_t depth);
};

/// Parses with a thread-local FastJsonParser.
[[nodiscard]] JsonResult fast_parse(std::string_view text);

/// Like fast_parse() but fails unless the document is a JSON object.
[[nodiscard]] JsonResult fast_parse_object(std::string_view text);

/// Name of the active simdjson kernel ("haswell", "arm64", "fallback", ...).
[[nodiscard]] std::string fast_json_implementation();

}  // namespace wxstream
