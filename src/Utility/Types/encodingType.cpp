#include "encodingType.hpp"
#include "typeNames.hpp"

std::optional<EncodingType> stringToEncoding(const std::string& str) {
    std::string s = toUpperName(str);
    for (auto e : validEncodings) {
        if (encodingToString(e) == s) {
            return e;
        }
    }
    return std::nullopt;
}

std::string encodingToString(EncodingType encoding) {
    switch (encoding) {
        case EncodingType::PLAIN:      return "PLAIN";
        case EncodingType::DICTIONARY: return "DICTIONARY";
        case EncodingType::RLE:        return "RLE";
        case EncodingType::DIFF:       return "DIFF";
        case EncodingType::TS_2DIFF:   return "TS_2DIFF";
        case EncodingType::BITMAP:     return "BITMAP";
        case EncodingType::GORILLA_V1: return "GORILLA_V1";
        case EncodingType::REGULAR:    return "REGULAR";
        case EncodingType::GORILLA:    return "GORILLA";
        case EncodingType::ZIGZAG:     return "ZIGZAG";
        case EncodingType::FREQ:       return "FREQ";
        case EncodingType::CHIMP:      return "CHIMP";
        case EncodingType::SPRINTZ:    return "SPRINTZ";
        case EncodingType::RLBE:       return "RLBE";
        default:                       return "UNKNOWN";
    }
}

std::optional<EncodingType> decodeEncodingType(uint8_t encoding) {
    for (auto e : validEncodings) {
        if (static_cast<uint8_t>(e) == encoding) {
            return e;
        }
    }
    return std::nullopt;
}

uint8_t encodeEncoding(EncodingType encoding) {
    return static_cast<uint8_t>(encoding);
}

std::ostream& operator<<(std::ostream& os, EncodingType encoding) {
    return os << encodingToString(encoding);
}
