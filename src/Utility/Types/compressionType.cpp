#include "compressionType.hpp"
#include "typeNames.hpp"

std::optional<CompressionType> stringToCompression(const std::string& str) {
    std::string s = toUpperName(str);
    if (s == "UNCOMPRESSED" || s == "NONE") {
        return CompressionType::UNCOMPRESSED;
    }
    for (auto c : validCompressions) {
        if (compressionToString(c) == s) {
            return c;
        }
    }
    return std::nullopt;
}

std::string compressionToString(CompressionType compression) {
    switch (compression) {
        case CompressionType::UNCOMPRESSED:
            return "UNCOMPRESSED";
        case CompressionType::SNAPPY:
            return "SNAPPY";
        case CompressionType::GZIP:
            return "GZIP";
        case CompressionType::LZO:
            return "LZO";
        case CompressionType::SDT:
            return "SDT";
        case CompressionType::PAA:
            return "PAA";
        case CompressionType::PLA:
            return "PLA";
        case CompressionType::LZ4:
            return "LZ4";
        case CompressionType::ZSTD:
            return "ZSTD";
        case CompressionType::LZMA2:
            return "LZMA2";
        default:
            return "UNKNOWN";
    }
}

std::optional<CompressionType> decodeCompressionType(uint8_t compression) {
    for (auto c : validCompressions) {
        if (static_cast<uint8_t>(c) == compression) {
            return c;
        }
    }
    return std::nullopt;
}

uint8_t encodeCompression(CompressionType compression) {
    return static_cast<uint8_t>(compression);
}

std::ostream& operator<<(std::ostream& os, CompressionType compression) {
    return os << compressionToString(compression);
}
