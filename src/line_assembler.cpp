#include "line_assembler.hpp"
#include <algorithm>
#include <stdexcept>

LineAssembler::LineAssembler(size_t max_line, size_t max_buffered)
    : max_line_(max_line), max_buffered_(max_buffered) {
    if (max_line_ == 0 || max_buffered_ <= max_line_)
        throw std::invalid_argument("line assembler buffer must exceed the line limit");
}

void LineAssembler::drop_front(size_t n){
    n = std::min(n, buf_.size());
    buf_.erase(0, n);
    dropped_ += n;
}

void LineAssembler::feed(const char* data, size_t n){
    buf_.append(data, n);
    if (buf_.size() <= max_buffered_) return;

    // keep the newest bytes, the cut lands mid line so skip to the next boundary
    drop_front(buf_.size() - max_buffered_);
    skip_to_newline_ = true;
}

std::optional<std::string> LineAssembler::next_line(){
    for (;;){
        auto nl = buf_.find('\n');
        if (skip_to_newline_){
            if (nl == std::string::npos){
                drop_front(buf_.size());
                return std::nullopt;
            }
            drop_front(nl + 1);
            skip_to_newline_ = false;
            continue;
        }
        if (nl == std::string::npos){
            if (buf_.size() > max_line_){
                drop_front(buf_.size());
                skip_to_newline_ = true;
            }
            return std::nullopt;
        }
        std::string line = buf_.substr(0, nl);
        buf_.erase(0, nl + 1);
        line.erase(std::remove(line.begin(), line.end(), '\r'), line.end());
        if (line.size() > max_line_){
            dropped_ += nl + 1;
            continue;
        }
        return line;
    }
}

void LineAssembler::clear(){
    dropped_ += buf_.size();
    buf_.clear();
    skip_to_newline_ = false;
}
