#include "serial_port.hpp"

#include <fcntl.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

namespace repatcher {

// ------------------ helpers ------------------
static bool baud_to_speed(int baud, speed_t& speed) {
    switch (baud) {
        case 9600:   speed = B9600;   return true;
        case 19200:  speed = B19200;  return true;
        case 38400:  speed = B38400;  return true;
        case 57600:  speed = B57600;  return true;
        case 115200: speed = B115200; return true;
        case 230400: speed = B230400; return true;
        case 460800: speed = B460800; return true;
        case 921600: speed = B921600; return true;
        default:     return false;
    }
}

static void set_err(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

bool is_supported_baud(int baud) {
    speed_t unused;
    return baud_to_speed(baud, unused);
}

// ------------------ SerialPort ------------------
SerialPort::SerialPort(std::string path, int baud, int fd)
    : path_(std::move(path)), baud_(baud), fd_(fd) {}

SerialPort::~SerialPort() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::unique_ptr<SerialPort> SerialPort::open(const std::string& path, int baud, std::string* err) {
    speed_t speed;
    if (!baud_to_speed(baud, speed)) {
        set_err(err, "unsupported baud rate " + std::to_string(baud));
        return nullptr;
    }

    int fd = ::open(path.c_str(), O_RDWR | O_NOCTTY);
    if (fd < 0) {
        set_err(err, "cannot open " + path + ": " + std::strerror(errno));
        return nullptr;
    }
    // Owns fd from here so every early return closes it.
    std::unique_ptr<SerialPort> port(new SerialPort(path, baud, fd));

    termios tio{};
    if (tcgetattr(fd, &tio) != 0) {
        set_err(err, "tcgetattr on " + path + ": " + std::strerror(errno));
        return nullptr;
    }

    cfmakeraw(&tio);
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    // 8N1, no flow control
    tio.c_cflag = (tio.c_cflag & ~CSIZE) | CS8;
    tio.c_cflag &= ~(PARENB | PARODD);
    tio.c_cflag &= ~CSTOPB;
    tio.c_cflag &= ~CRTSCTS;
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_iflag &= ~(IXON | IXOFF | IXANY);

    // block until at least one byte is available
    tio.c_cc[VMIN]  = 1;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) {
        set_err(err, "tcsetattr on " + path + ": " + std::strerror(errno));
        return nullptr;
    }
    return port;
}

bool SerialPort::read_exact(uint8_t* buf, size_t n, std::string* err) {
    size_t total = 0;
    while (total < n) {
        ssize_t ret = ::read(fd_, buf + total, n - total);
        if (ret < 0) {
            set_err(err, "read from " + path_ + ": " + std::strerror(errno));
            return false;
        }
        if (ret == 0) {
            set_err(err, "end of stream on " + path_ + " after " + std::to_string(total) +
                         " of " + std::to_string(n) + " bytes");
            return false;
        }
        total += static_cast<size_t>(ret);
    }
    return true;
}

void SerialPort::discard_input() {
    if (tcflush(fd_, TCIFLUSH) != 0) {
        std::cerr << "[SerialPort] tcflush on " << path_ << ": " << std::strerror(errno) << "\n";
    }
}

} // namespace repatcher
