#ifndef BYTESINK_HPP
#define BYTESINK_HPP

#include <cstdint>
#include <cstddef>
#include <ostream>
#include <span>

/**
 * @brief Append-only byte sink.
 *
 * Writes either succeed completely or throw IoError.
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual void write(const uint8_t* data, size_t length) = 0;
    virtual uint64_t bytesWritten() const = 0;

    void writeByte(uint8_t value) { write(&value, sizeof(value)); }
    void write(std::span<const uint8_t> bytes) { write(bytes.data(), bytes.size()); }
};

/* =============== StreamSink =============== */

// Growable sink over an output stream
class StreamSink : public ByteSink {
private:
    std::ostream& out;
    uint64_t written = 0;

public:
    explicit StreamSink(std::ostream& out) : out(out) {}

    void write(const uint8_t* data, size_t length) override;
    uint64_t bytesWritten() const override { return written; }

    using ByteSink::write;
};

/* =============== FixedBufferSink =============== */

// Sink over a buffer the caller has already sized. Writing past the end fails.
class FixedBufferSink : public ByteSink {
private:
    std::span<uint8_t> buffer;
    size_t cursor = 0;

public:
    explicit FixedBufferSink(std::span<uint8_t> buffer) : buffer(buffer) {}

    void write(const uint8_t* data, size_t length) override;
    uint64_t bytesWritten() const override { return cursor; }

    size_t remaining() const { return buffer.size() - cursor; }

    using ByteSink::write;
};

#endif
