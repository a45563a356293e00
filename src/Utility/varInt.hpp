#ifndef VARINT_HPP
#define VARINT_HPP

#include <cstdint>
#include <vector>

#include "../IO/byteSource.hpp"
#include "../IO/byteSink.hpp"

/*
 * Variable-width integers as used by the file format.
 *
 * Unsigned values are LEB128: 7 payload bits per byte, least significant group
 * first, high bit set on every byte except the last. Signed values are zig-zag
 * mapped onto unsigned first ((v << 1) ^ (v >> 31)), so -1 encodes as 0x01.
 *
 * All values are 32-bit; an encoding never exceeds MAX_VAR_INT_SIZE bytes.
 */

inline constexpr int MAX_VAR_INT_SIZE = 5;

int uVarIntSize(uint32_t value);
int varIntSize(int32_t value);

uint32_t zigZagEncode(int32_t value);
int32_t zigZagDecode(uint32_t value);

// Return the number of bytes written
int writeUnsignedVarInt(uint32_t value, ByteSink& sink);
int writeVarInt(int32_t value, ByteSink& sink);

void encodeUnsignedVarInt(uint32_t value, std::vector<uint8_t>& out);

// Throw IoError on short input, DecodeError on an overlong encoding
uint32_t readUnsignedVarInt(ByteSource& source);
int32_t readVarInt(ByteSource& source);

#endif
