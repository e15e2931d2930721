#pragma once
#include <stdexcept>
#include <string>

// Root of every error raised by the virtual disk.
class VdiskError : public std::runtime_error {
public:
    explicit VdiskError(const std::string& what) : std::runtime_error(what) {}
};

// Block size or partition table could not be recovered from the console.
class InitializationError : public VdiskError {
public:
    explicit InitializationError(const std::string& what) : VdiskError(what) {}
};

// Console output no longer lines up with what was asked for.
class ProtocolError : public VdiskError {
public:
    explicit ProtocolError(const std::string& what) : VdiskError(what) {}
};

// Filesystem-facing failure; carries the errno the host should report.
class FsError : public VdiskError {
private:
    int code;

public:
    FsError(int error_code, const std::string& what) : VdiskError(what), code(error_code) {}

    int error_code() const { return code; }
};
