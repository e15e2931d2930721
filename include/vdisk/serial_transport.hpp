#pragma once
#include "vdisk/console_transport.hpp"
#include <string>

struct SerialConfig {
    unsigned int baud_rate = 115200;
    int read_timeout_ms = 100;
};

// ConsoleTransport over a POSIX tty (raw 8N1).
class SerialTransport : public ConsoleTransport {
private:
    int fd;
    SerialConfig config;
    std::string pending; // bytes received after the last complete line

    void configure_port();
    bool take_pending_line(std::string& line);

public:
    SerialTransport(const std::string& device, const SerialConfig& config = SerialConfig());
    ~SerialTransport() override;

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    void write_line(const std::string& text) override;
    bool read_line(std::string& line) override;
};
