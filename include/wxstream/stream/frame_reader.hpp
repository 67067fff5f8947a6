#pragma once

#include "wxstream/stream/frame_parser.hpp"
#include "wxstream/stream/incremental_buffer.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace wxstream {

/// IncrementalBuffer + parse_frame(): chunks in, complete frames out.
/// Blocks without a data field are dropped and counted.
class FrameReader {
public:
    FrameReader() = default;
    explicit FrameReader(IncrementalBufferConfig config) : buffer_(config) {}

    /// Throws BufferOverflowError (see IncrementalBuffer::feed).
    [[nodiscard]] std::vector<StreamFrame> feed(std::string_view chunk);

    /// Flushes an unterminated final block at end of body.
    [[nodiscard]] std::vector<StreamFrame> finish();

    void reset() noexcept;

    [[nodiscard]] std::size_t frames_read() const noexcept { return frames_read_; }
    [[nodiscard]] std::size_t blocks_dropped() const noexcept { return blocks_dropped_; }

private:
    void collect(const std::string& block, std::vector<StreamFrame>& out);

    IncrementalBuffer buffer_;
    std::size_t frames_read_{0};
    std::size_t blocks_dropped_{0};
};

}  // namespace wxstream
