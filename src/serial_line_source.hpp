#pragma once
#include "line_assembler.hpp"
#include "line_source.hpp"
#include <string>

// 8N1 raw tty opened non-blocking
class SerialLineSource : public LineSource {
public:
    SerialLineSource(const std::string& port, int baud);
    ~SerialLineSource() override;
    SerialLineSource(const SerialLineSource&) = delete;
    SerialLineSource& operator=(const SerialLineSource&) = delete;

    std::optional<std::string> poll_line() override;
    void discard_pending() override;

private:
    int fd_ = -1;
    std::string port_;
    LineAssembler lines_;
};
