#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

// Keeps the last N complete lines written to it, plus any trailing
// partial line. Both pipe readers feed the same buffer.
class TailBuffer {
public:
    explicit TailBuffer(size_t max_lines) : max_lines_(max_lines) {}

    void write(std::string_view chunk) {
        std::lock_guard lock(mutex_);
        for (char c : chunk) {
            if (c == '\n') {
                push_line(std::move(partial_));
                partial_.clear();
            } else {
                partial_.push_back(c);
            }
        }
    }

    // Completed lines, oldest first, then the partial line if non-empty.
    std::vector<std::string> lines() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> out(lines_.begin(), lines_.end());
        if (!partial_.empty()) {
            out.push_back(partial_);
            if (out.size() > max_lines_) out.erase(out.begin());
        }
        return out;
    }

    // Lines dropped off the front so far.
    size_t dropped() const {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

private:
    void push_line(std::string line) {
        if (max_lines_ == 0) {
            ++dropped_;
            return;
        }
        if (lines_.size() == max_lines_) {
            lines_.pop_front();
            ++dropped_;
        }
        lines_.push_back(std::move(line));
    }

    mutable std::mutex mutex_;
    size_t max_lines_;
    std::deque<std::string> lines_;
    std::string partial_;
    size_t dropped_ = 0;
};
