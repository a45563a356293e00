#ifndef RANDOMACCESSINPUT_HPP
#define RANDOMACCESSINPUT_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Byte input addressed by absolute offset.
 *
 * read() returns up to length bytes starting at offset. Fewer bytes are returned
 * only when the input ends before offset + length; an offset past the end yields
 * an empty vector. Underlying failures throw IoError.
 *
 * Implementations in this library support concurrent positioned reads.
 */
class RandomAccessInput {
public:
    virtual ~RandomAccessInput() = default;

    virtual std::vector<uint8_t> read(uint64_t offset, size_t length) = 0;
    virtual uint64_t size() const = 0;
};

/* =============== FileInput =============== */

class FileInput : public RandomAccessInput {
private:
    std::string filePath;
    std::ifstream fileStream;
    uint64_t fileSize = 0;

    // Serialises seek + read pairs on the shared stream
    std::mutex streamMutex;

public:
    explicit FileInput(const std::string& path);

    std::vector<uint8_t> read(uint64_t offset, size_t length) override;
    uint64_t size() const override { return fileSize; }
};

/* =============== MemoryInput =============== */

class MemoryInput : public RandomAccessInput {
private:
    std::vector<uint8_t> bytes;

public:
    explicit MemoryInput(std::vector<uint8_t> bytes) : bytes(std::move(bytes)) {}

    std::vector<uint8_t> read(uint64_t offset, size_t length) override;
    uint64_t size() const override { return bytes.size(); }
};

#endif
