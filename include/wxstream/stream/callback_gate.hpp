#pragma once

#include "wxstream/log/logger.hpp"

#include <exception>
#include <mutex>
#include <string_view>
#include <utility>

namespace wxstream {

/// Serialises listener callbacks and shuts them off for good.
///
/// Every callback runs inside invoke() while the gate's mutex is held; close()
/// takes the same mutex, so once close() has returned no callback is running
/// and none will start. The mutex is recursive so a callback may cancel its
/// own stream.
class CallbackGate {
public:
    /// Runs fn unless the gate is closed. Exceptions thrown by listener code
    /// are logged and swallowed so they never unwind into the reader thread.
    template <typename Fn>
    bool invoke(std::string_view what, Fn&& fn) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        try {
            std::forward<Fn>(fn)();
        } catch (const std::exception& e) {
            get_logger().error_fmt("{} callback threw: {}", what, e.what());
        }
        return true;
    }

    /// Runs last_words (if still open) and closes the gate atomically.
    /// Returns false when the gate was already closed.
    template <typename Fn>
    bool close(Fn&& last_words) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        try {
            std::forward<Fn>(last_words)();
        } catch (const std::exception& e) {
            get_logger().error_fmt("close callback threw: {}", e.what());
        }
        closed_ = true;
        return true;
    }

    bool close() {
        return close([] {});
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::recursive_mutex mutex_;
    bool closed_{false};
};

}  // namespace wxstream
