#ifndef BYTESOURCE_HPP
#define BYTESOURCE_HPP

#include <cstdint>
#include <cstddef>
#include <istream>
#include <span>
#include <vector>

/**
 * @brief Sequential byte source.
 *
 * Every read is exact: fewer bytes than requested is reported by throwing IoError,
 * never by returning a short buffer. Implementations must not read ahead of what
 * the caller asked for, so a source can be handed back to the file reader
 * positioned exactly after the last consumed field.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual void readExact(uint8_t* dest, size_t length) = 0;
    virtual void skip(size_t length) = 0;

    // Bytes consumed since construction
    virtual uint64_t position() const = 0;

    uint8_t readByte();
    std::vector<uint8_t> readExact(size_t length);
};

/* =============== StreamSource =============== */

class StreamSource : public ByteSource {
private:
    std::istream& in;
    uint64_t consumed = 0;

public:
    explicit StreamSource(std::istream& in) : in(in) {}

    void readExact(uint8_t* dest, size_t length) override;
    void skip(size_t length) override;
    uint64_t position() const override { return consumed; }

    using ByteSource::readExact;
};

/* =============== BufferSource =============== */

// Read cursor over a caller-owned byte region
class BufferSource : public ByteSource {
private:
    std::span<const uint8_t> buffer;
    size_t cursor = 0;

public:
    explicit BufferSource(std::span<const uint8_t> buffer) : buffer(buffer) {}

    void readExact(uint8_t* dest, size_t length) override;
    void skip(size_t length) override;
    uint64_t position() const override { return cursor; }

    size_t remaining() const { return buffer.size() - cursor; }

    using ByteSource::readExact;
};

#endif
