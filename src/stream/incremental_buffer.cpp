#include "wxstream/stream/incremental_buffer.hpp"

#include <algorithm>

namespace wxstream {

namespace {

constexpr std::string_view kDelimiter = "\n\n";

// Consumed bytes are only erased once this many have piled up, so a chunk
// carrying many small blocks is not shifted once per block.
constexpr std::size_t kCompactThreshold = 4096;

}  // namespace

void IncrementalBuffer::append(std::string_view chunk) {
    if (config_.normalize_line_endings == false) {
        buffer_.append(chunk);
        return;
    }

    buffer_.reserve(buffer_.size() + chunk.size());
    for (const char c : chunk) {
        if (after_cr_) {
            after_cr_ = false;
            if (c == '\n') {
                continue;
            }
        }
        if (c == '\r') {
            buffer_.push_back('\n');
            after_cr_ = true;
        } else {
            buffer_.push_back(c);
        }
    }
}

std::vector<std::string> IncrementalBuffer::feed(std::string_view chunk) {
    append(chunk);

    std::vector<std::string> blocks;
    for (;;) {
        const auto pos = buffer_.find(kDelimiter, scan_from_);
        if (pos == std::string::npos) {
            break;
        }
        blocks.emplace_back(buffer_, consumed_, pos - consumed_);
        consumed_ = pos + kDelimiter.size();
        scan_from_ = consumed_;
    }

    // The last byte may be the first half of a delimiter split across chunks
    if (buffer_.size() > consumed_) {
        scan_from_ = std::max(consumed_, buffer_.size() - 1);
    }

    // Only the undelimited remainder counts against the limit
    const std::size_t pending = pending_size();
    if (pending > config_.max_buffer_size) {
        reset();
        throw BufferOverflowError(pending, config_.max_buffer_size);
    }

    compact();
    return blocks;
}

std::optional<std::string> IncrementalBuffer::finish() {
    std::string tail = buffer_.substr(consumed_);
    reset();

    const bool blank = tail.find_first_not_of(" \t\n") == std::string::npos;
    if (blank) {
        return std::nullopt;
    }
    return tail;
}

void IncrementalBuffer::reset() noexcept {
    buffer_.clear();
    consumed_ = 0;
    scan_from_ = 0;
    after_cr_ = false;
}

void IncrementalBuffer::compact() {
    if (consumed_ == buffer_.size()) {
        buffer_.clear();
        consumed_ = 0;
        scan_from_ = 0;
        return;
    }
    if (consumed_ >= kCompactThreshold) {
        buffer_.erase(0, consumed_);
        scan_from_ -= consumed_;
        consumed_ = 0;
    }
}

}  // namespace wxstream
