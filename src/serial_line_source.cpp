#include "serial_line_source.hpp"
#include <fcntl.h>
#include <termios.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <stdexcept>

static speed_t to_speed(int baud){
    switch (baud){
        case 1200: return B1200;
        case 2400: return B2400;
        case 4800: return B4800;
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        default: throw std::runtime_error("unsupported baud rate: " + std::to_string(baud));
    }
}

SerialLineSource::SerialLineSource(const std::string& port, int baud): port_(port) {
    speed_t speed = to_speed(baud);
    fd_ = ::open(port.c_str(), O_RDONLY | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) throw std::runtime_error("cannot open " + port + ": " + strerror(errno));

    struct termios tty;
    if (tcgetattr(fd_, &tty) != 0){
        std::string err = strerror(errno);
        ::close(fd_);
        throw std::runtime_error("tcgetattr " + port + ": " + err);
    }
    cfmakeraw(&tty);
    cfsetispeed(&tty, speed);
    cfsetospeed(&tty, speed);
    tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
    tty.c_cflag |= CS8 | CLOCAL | CREAD;
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;
    if (tcsetattr(fd_, TCSANOW, &tty) != 0){
        std::string err = strerror(errno);
        ::close(fd_);
        throw std::runtime_error("tcsetattr " + port + ": " + err);
    }
    tcflush(fd_, TCIFLUSH);
}

SerialLineSource::~SerialLineSource(){
    if (fd_ >= 0) ::close(fd_);
}

std::optional<std::string> SerialLineSource::poll_line(){
    char buf[256];
    for (;;){
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) { lines_.feed(buf, (size_t)n); continue; }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
            fprintf(stderr, "[serial] read %s: %s\n", port_.c_str(), strerror(errno));
        break;
    }

    return lines_.next_line();
}

void SerialLineSource::discard_pending(){
    tcflush(fd_, TCIFLUSH);
    lines_.clear();
}
