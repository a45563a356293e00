#ifndef COMPRESSIONTYPE_HPP
#define COMPRESSIONTYPE_HPP

#include <string>
#include <optional>
#include <array>
#include <cstdint>
#include <iostream>

enum class CompressionType : uint8_t {
    UNCOMPRESSED = 0,  // No compression
    SNAPPY = 1,
    GZIP = 2,
    LZO = 3,
    SDT = 4,           // Swinging door trending (lossy)
    PAA = 5,           // Piecewise aggregate approximation (lossy)
    PLA = 6,           // Piecewise linear approximation (lossy)
    LZ4 = 7,
    ZSTD = 8,
    LZMA2 = 9
};

const std::array<CompressionType, 10> validCompressions = {
    CompressionType::UNCOMPRESSED,
    CompressionType::SNAPPY,
    CompressionType::GZIP,
    CompressionType::LZO,
    CompressionType::SDT,
    CompressionType::PAA,
    CompressionType::PLA,
    CompressionType::LZ4,
    CompressionType::ZSTD,
    CompressionType::LZMA2
};

// Compression conversion utilities
std::optional<CompressionType> stringToCompression(const std::string& str);
std::string compressionToString(CompressionType compression);

// nullopt for a tag value outside validCompressions
std::optional<CompressionType> decodeCompressionType(uint8_t compression);

uint8_t encodeCompression(CompressionType compression);

std::ostream& operator<<(std::ostream& os, CompressionType compression);

#endif
