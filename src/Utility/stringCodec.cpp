#include "stringCodec.hpp"
#include "codecError.hpp"
#include "Types/typeNames.hpp"

using namespace std;

namespace {

// Decode one UTF-8 sequence starting at pos. Returns the code point and advances pos.
// Overlong forms, surrogates and values above U+10FFFF are rejected.
optional<uint32_t> nextCodePoint(span<const uint8_t> bytes, size_t& pos) {
    uint8_t lead = bytes[pos];

    if (lead < 0x80) {
        pos += 1;
        return lead;
    }

    size_t extra;
    uint32_t codePoint;
    uint32_t minimum;

    if ((lead & 0xE0) == 0xC0) {
        extra = 1; codePoint = lead & 0x1F; minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2; codePoint = lead & 0x0F; minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3; codePoint = lead & 0x07; minimum = 0x10000;
    } else {
        return nullopt;
    }

    // Truncated sequence
    if (pos + extra >= bytes.size()) return nullopt;

    for (size_t i = 1; i <= extra; ++i) {
        uint8_t b = bytes[pos + i];
        if ((b & 0xC0) != 0x80) return nullopt;
        codePoint = (codePoint << 6) | (b & 0x3F);
    }

    if (codePoint < minimum || codePoint > 0x10FFFF) return nullopt;
    if (codePoint >= 0xD800 && codePoint <= 0xDFFF) return nullopt;

    pos += extra + 1;
    return codePoint;
}

void appendUtf8(uint32_t codePoint, string& out) {
    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else {
        // Only ISO-8859-1 input reaches here, so two bytes are enough
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

span<const uint8_t> asBytes(const string& str) {
    return span<const uint8_t>(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

}

optional<Charset> stringToCharset(const string& name) {
    string s = toUpperName(name);
    if (s == "UTF_8" || s == "UTF8") return Charset::UTF8;
    if (s == "US_ASCII" || s == "ASCII") return Charset::ASCII;
    if (s == "ISO_8859_1" || s == "LATIN1" || s == "LATIN_1") return Charset::ISO_8859_1;
    return nullopt;
}

string charsetToString(Charset charset) {
    switch (charset) {
        case Charset::UTF8:       return "UTF-8";
        case Charset::ASCII:      return "US-ASCII";
        case Charset::ISO_8859_1: return "ISO-8859-1";
        default:                  return "UNKNOWN";
    }
}

bool isValidUtf8(span<const uint8_t> bytes) {
    size_t pos = 0;
    while (pos < bytes.size()) {
        if (!nextCodePoint(bytes, pos)) return false;
    }
    return true;
}

vector<uint8_t> encodeString(const string& utf8, Charset charset) {
    span<const uint8_t> bytes = asBytes(utf8);

    if (charset == Charset::UTF8) {
        if (!isValidUtf8(bytes)) {
            throw DecodeError("String is not valid UTF-8");
        }
        return vector<uint8_t>(bytes.begin(), bytes.end());
    }

    uint32_t limit = charset == Charset::ASCII ? 0x7F : 0xFF;

    vector<uint8_t> out;
    out.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        auto codePoint = nextCodePoint(bytes, pos);
        if (!codePoint) {
            throw DecodeError("String is not valid UTF-8");
        }
        if (*codePoint > limit) {
            throw DecodeError("Code point " + to_string(*codePoint) +
                              " cannot be represented in " + charsetToString(charset));
        }
        out.push_back(static_cast<uint8_t>(*codePoint));
    }
    return out;
}

string decodeString(span<const uint8_t> bytes, Charset charset) {
    switch (charset) {
        case Charset::UTF8:
            if (!isValidUtf8(bytes)) {
                throw DecodeError("Invalid UTF-8 byte sequence");
            }
            return string(reinterpret_cast<const char*>(bytes.data()), bytes.size());

        case Charset::ASCII:
            for (uint8_t b : bytes) {
                if (b > 0x7F) {
                    throw DecodeError("Invalid US-ASCII byte: " + to_string(b));
                }
            }
            return string(reinterpret_cast<const char*>(bytes.data()), bytes.size());

        case Charset::ISO_8859_1: {
            string out;
            out.reserve(bytes.size());
            for (uint8_t b : bytes) {
                appendUtf8(b, out);
            }
            return out;
        }

        default:
            throw DecodeError("Unsupported charset");
    }
}

size_t encodedLength(const string& utf8, Charset charset) {
    if (charset == Charset::UTF8) {
        if (!isValidUtf8(asBytes(utf8))) {
            throw DecodeError("String is not valid UTF-8");
        }
        return utf8.size();
    }
    return encodeString(utf8, charset).size();
}
