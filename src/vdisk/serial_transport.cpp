#include "vdisk/serial_transport.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace {

std::runtime_error system_error(const std::string& what) {
    return std::runtime_error(what + ": " + std::strerror(errno));
}

speed_t to_speed(unsigned int baud_rate) {
    switch (baud_rate) {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    default:
        throw std::invalid_argument("Unsupported baud rate: " + std::to_string(baud_rate));
    }
}

} // namespace

SerialTransport::SerialTransport(const std::string& device, const SerialConfig& config)
    : fd(-1), config(config) {
    this->fd = ::open(device.c_str(), O_RDWR | O_NOCTTY);
    if (this->fd == -1) {
        throw system_error("Failed to open serial device " + device);
    }

    try {
        configure_port();
    } catch (...) {
        ::close(this->fd);
        throw;
    }
}

SerialTransport::~SerialTransport() {
    if (this->fd != -1) {
        ::close(this->fd);
    }
}

void SerialTransport::configure_port() {
    struct termios tios;
    if (tcgetattr(this->fd, &tios) == -1) {
        throw system_error("tcgetattr failed");
    }

    // Raw 8N1, no flow control, no echo on our side
    cfmakeraw(&tios);
    tios.c_cflag |= CLOCAL | CREAD;
    tios.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);

    speed_t speed = to_speed(config.baud_rate);
    cfsetispeed(&tios, speed);
    cfsetospeed(&tios, speed);

    // Reads are bounded by poll() instead
    tios.c_cc[VMIN] = 0;
    tios.c_cc[VTIME] = 0;

    if (tcsetattr(this->fd, TCSANOW, &tios) == -1) {
        throw system_error("tcsetattr failed");
    }

    // Drop whatever the shell printed before we arrived
    if (tcflush(this->fd, TCIOFLUSH) == -1) {
        throw system_error("tcflush failed");
    }
}

void SerialTransport::write_line(const std::string& text) {
    std::string out = text + "\n";
    size_t written = 0;
    while (written < out.size()) {
        ssize_t n = ::write(this->fd, out.data() + written, out.size() - written);
        if (n == -1) {
            if (errno == EINTR) continue;
            throw system_error("Serial write failed");
        }
        written += static_cast<size_t>(n);
    }
    while (tcdrain(this->fd) == -1) {
        if (errno != EINTR) throw system_error("tcdrain failed");
    }
}

bool SerialTransport::take_pending_line(std::string& line) {
    size_t newline = pending.find('\n');
    if (newline == std::string::npos) return false;

    line = pending.substr(0, newline);
    pending.erase(0, newline + 1);
    while (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

bool SerialTransport::read_line(std::string& line) {
    while (!take_pending_line(line)) {
        struct pollfd pfd;
        pfd.fd = this->fd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ready = ::poll(&pfd, 1, config.read_timeout_ms);
        if (ready == -1) {
            if (errno == EINTR) continue;
            throw system_error("Serial poll failed");
        }
        if (ready == 0) {
            // Timeout: whatever is buffered is a partial line (usually the
            // shell prompt); it ends the response.
            pending.clear();
            return false;
        }

        char buffer[512];
        ssize_t n = ::read(this->fd, buffer, sizeof(buffer));
        if (n == -1) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw system_error("Serial read failed");
        }
        if (n == 0) {
            pending.clear();
            return false;
        }
        pending.append(buffer, static_cast<size_t>(n));
    }
    return true;
}
