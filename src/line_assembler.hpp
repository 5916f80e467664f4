#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

// Splits a byte stream into '\n' terminated lines ('\r' removed).
// Lines longer than `max_line` are dropped whole, and at most `max_buffered`
// bytes are held; past that the oldest data goes first.
class LineAssembler {
public:
    explicit LineAssembler(size_t max_line = 64, size_t max_buffered = 4096);

    void feed(const char* data, size_t n);
    std::optional<std::string> next_line();
    void clear();

    size_t buffered() const { return buf_.size(); }
    uint64_t dropped_bytes() const { return dropped_; }

private:
    void drop_front(size_t n);

    size_t max_line_;
    size_t max_buffered_;
    std::string buf_;
    bool skip_to_newline_ = false; // inside a line we already gave up on
    uint64_t dropped_ = 0;
};
