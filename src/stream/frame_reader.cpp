#include "wxstream/stream/frame_reader.hpp"

#include "wxstream/log/logger.hpp"

namespace wxstream {

void FrameReader::collect(const std::string& block, std::vector<StreamFrame>& out) {
    auto frame = parse_frame(block);
    if (frame.has_value() == false) {
        ++blocks_dropped_;
        get_logger().trace_fmt("dropping {}-byte block without data (comment or heartbeat)", block.size());
        return;
    }
    ++frames_read_;
    out.push_back(std::move(*frame));
}

std::vector<StreamFrame> FrameReader::feed(std::string_view chunk) {
    std::vector<StreamFrame> frames;
    for (const auto& block : buffer_.feed(chunk)) {
        collect(block, frames);
    }
    return frames;
}

std::vector<StreamFrame> FrameReader::finish() {
    std::vector<StreamFrame> frames;
    if (auto tail = buffer_.finish()) {
        get_logger().debug_fmt("flushing unterminated final block ({} bytes)", tail->size());
        collect(*tail, frames);
    }
    return frames;
}

void FrameReader::reset() noexcept {
    buffer_.reset();
}

}  // namespace wxstream
