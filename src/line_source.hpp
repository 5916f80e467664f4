#pragma once
#include <optional>
#include <string>

class LineSource {
public:
    virtual ~LineSource() = default;
    // non-blocking, returns a line without its terminator or nothing if none is ready
    virtual std::optional<std::string> poll_line() = 0;
    // drops whatever arrived but was not read yet
    virtual void discard_pending() {}
};
