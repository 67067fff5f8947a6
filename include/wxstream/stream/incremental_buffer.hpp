#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace wxstream {

/// Thrown by IncrementalBuffer::feed() when an unterminated block would grow
/// past IncrementalBufferConfig::max_buffer_size.
class BufferOverflowError : public std::runtime_error {
public:
    BufferOverflowError(std::size_t size, std::size_t limit)
        : std::runtime_error("stream buffer overflow: " + std::to_string(size) +
                             " bytes exceeds limit of " + std::to_string(limit))
        , buffer_size(size)
        , buffer_limit(limit)
    {}

    std::size_t buffer_size;
    std::size_t buffer_limit;
};

struct IncrementalBufferConfig {
    /// Upper bound for the pending (not yet delimited) remainder.
    std::size_t max_buffer_size{1024 * 1024};

    /// Rewrite "\r\n" and lone "\r" to "\n" while appending.
    bool normalize_line_endings{true};
};

/// Splits an arbitrarily chunked byte stream into blocks separated by "\n\n".
///
/// Every call to feed() returns all blocks completed by that chunk, in order;
/// at most one incomplete block stays buffered. Feeding a stream in any
/// partition (including one that splits the delimiter) yields the same
/// blocks as feeding it whole.
///
///   IncrementalBuffer buffer;
///   for (auto chunk : body) {
///       for (auto& block : buffer.feed(chunk)) { ... }
///   }
///   if (auto tail = buffer.finish()) { ... }
///
class IncrementalBuffer {
public:
    IncrementalBuffer() = default;
    explicit IncrementalBuffer(IncrementalBufferConfig config) : config_(config) {}

    /// Throws BufferOverflowError; the buffer is left reset in that case.
    [[nodiscard]] std::vector<std::string> feed(std::string_view chunk);

    /// End of input: returns the non-blank remainder once, then is empty.
    [[nodiscard]] std::optional<std::string> finish();

    void reset() noexcept;

    /// Bytes waiting for a delimiter.
    [[nodiscard]] std::size_t pending_size() const noexcept {
        return buffer_.size() - consumed_;
    }

    [[nodiscard]] const IncrementalBufferConfig& config() const noexcept { return config_; }

private:
    void append(std::string_view chunk);
    void compact();

    IncrementalBufferConfig config_;
    std::string buffer_;
    std::size_t consumed_{0};     // start of the pending block
    std::size_t scan_from_{0};    // no delimiter starts before this offset
    bool after_cr_{false};        // last appended byte was a '\r' rewritten to '\n'
};

}  // namespace wxstream
