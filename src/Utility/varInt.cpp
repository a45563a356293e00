#include "varInt.hpp"
#include "codecError.hpp"

#include <array>

using namespace std;

int uVarIntSize(uint32_t value) {
    int size = 1;
    while ((value & 0xFFFFFF80u) != 0) {
        value >>= 7;
        size++;
    }
    return size;
}

int varIntSize(int32_t value) {
    return uVarIntSize(zigZagEncode(value));
}

uint32_t zigZagEncode(int32_t value) {
    return (static_cast<uint32_t>(value) << 1) ^ static_cast<uint32_t>(value >> 31);
}

int32_t zigZagDecode(uint32_t value) {
    return static_cast<int32_t>((value >> 1) ^ (0u - (value & 1u)));
}

/* ================ WRITE FUNCTIONS ================ */

void encodeUnsignedVarInt(uint32_t value, vector<uint8_t>& out) {
    while ((value & 0xFFFFFF80u) != 0) {
        out.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value & 0x7F));
}

int writeUnsignedVarInt(uint32_t value, ByteSink& sink) {
    array<uint8_t, MAX_VAR_INT_SIZE> bytes{};
    int length = 0;

    while ((value & 0xFFFFFF80u) != 0) {
        bytes[length++] = static_cast<uint8_t>((value & 0x7F) | 0x80);
        value >>= 7;
    }
    bytes[length++] = static_cast<uint8_t>(value & 0x7F);

    sink.write(bytes.data(), static_cast<size_t>(length));
    return length;
}

int writeVarInt(int32_t value, ByteSink& sink) {
    return writeUnsignedVarInt(zigZagEncode(value), sink);
}

/* ================ READ FUNCTIONS ================ */

uint32_t readUnsignedVarInt(ByteSource& source) {
    uint32_t value = 0;

    for (int i = 0; i < MAX_VAR_INT_SIZE; ++i) {
        uint8_t b = source.readByte();
        int shift = 7 * i;

        if (i == MAX_VAR_INT_SIZE - 1) {
            // Only the low 4 bits of the fifth byte fit in 32 bits
            if ((b & 0xF0) != 0) {
                throw DecodeError("Variable length quantity is too long");
            }
        }

        value |= static_cast<uint32_t>(b & 0x7F) << shift;
        if ((b & 0x80) == 0) {
            return value;
        }
    }

    throw DecodeError("Variable length quantity is too long");
}

int32_t readVarInt(ByteSource& source) {
    return zigZagDecode(readUnsignedVarInt(source));
}
