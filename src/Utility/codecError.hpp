#ifndef CODECERROR_HPP
#define CODECERROR_HPP

#include <string>
#include <cstdint>
#include <stdexcept>
#include <iostream>

enum class ErrorKind : uint8_t {
    Io = 1,       // Short read, failed write, underlying source error
    Decode = 2    // Malformed varint, invalid charset bytes, unknown tag
};

/**
 * @brief Error value returned by the public ChunkHeader entry points.
 *
 * Mirrors the Result structure used elsewhere: a kind for the caller to branch on
 * and a descriptive message. Errors are never retried inside the codec.
 */
struct CodecError {
    ErrorKind kind;
    std::string message;

    bool isIo() const { return kind == ErrorKind::Io; }
    bool isDecode() const { return kind == ErrorKind::Decode; }
};

// Thrown by the byte sources, sinks and inputs
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& message) : std::runtime_error(message) {}
};

// Thrown by varint, charset and tag decoding
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& message) : std::runtime_error(message) {}
};

std::string errorKindToString(ErrorKind kind);

std::ostream& operator<<(std::ostream& os, const CodecError& error);

#endif
