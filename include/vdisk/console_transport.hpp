#pragma once
#include <string>

// A line-oriented duplex text stream to a bootloader shell.
// There is no framing: a response ends when no line arrives within the
// transport's read timeout.
class ConsoleTransport {
public:
    virtual ~ConsoleTransport() = default;

    // Sends `text` followed by a newline.
    virtual void write_line(const std::string& text) = 0;

    // Returns false if no complete line arrived before the timeout.
    // On success `line` holds the text without its trailing "\r\n".
    virtual bool read_line(std::string& line) = 0;
};
