#ifndef ENCODINGTYPE_HPP
#define ENCODINGTYPE_HPP

#include <string>
#include <optional>
#include <array>
#include <cstdint>
#include <iostream>

// Value encoding applied to a column before compression
enum class EncodingType : uint8_t {
    PLAIN = 0,
    DICTIONARY = 1,
    RLE = 2,
    DIFF = 3,
    TS_2DIFF = 4,
    BITMAP = 5,
    GORILLA_V1 = 6,
    REGULAR = 7,
    GORILLA = 8,
    ZIGZAG = 9,
    FREQ = 10,
    CHIMP = 11,
    SPRINTZ = 12,
    RLBE = 13
};

const std::array<EncodingType, 14> validEncodings = {
    EncodingType::PLAIN,
    EncodingType::DICTIONARY,
    EncodingType::RLE,
    EncodingType::DIFF,
    EncodingType::TS_2DIFF,
    EncodingType::BITMAP,
    EncodingType::GORILLA_V1,
    EncodingType::REGULAR,
    EncodingType::GORILLA,
    EncodingType::ZIGZAG,
    EncodingType::FREQ,
    EncodingType::CHIMP,
    EncodingType::SPRINTZ,
    EncodingType::RLBE
};

std::optional<EncodingType> stringToEncoding(const std::string& str);
std::string encodingToString(EncodingType encoding);

std::optional<EncodingType> decodeEncodingType(uint8_t encoding);
uint8_t encodeEncoding(EncodingType encoding);

std::ostream& operator<<(std::ostream& os, EncodingType encoding);

#endif
