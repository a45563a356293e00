#ifndef STRINGCODEC_HPP
#define STRINGCODEC_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <span>

// Charset of string bytes on disk. In memory, strings are always UTF-8.
enum class Charset : uint8_t {
    UTF8 = 0,
    ASCII = 1,
    ISO_8859_1 = 2
};

std::optional<Charset> stringToCharset(const std::string& name);
std::string charsetToString(Charset charset);

/**
 * @brief Convert an in-memory UTF-8 string to its on-disk bytes.
 * @throws DecodeError if the input is not valid UTF-8 or a code point cannot be
 *         represented in the target charset
 */
std::vector<uint8_t> encodeString(const std::string& utf8, Charset charset);

/**
 * @brief Convert on-disk bytes back to a UTF-8 string.
 * @throws DecodeError on byte sequences that are invalid in the source charset
 */
std::string decodeString(std::span<const uint8_t> bytes, Charset charset);

// Length of encodeString(utf8, charset); throws DecodeError where encodeString would
size_t encodedLength(const std::string& utf8, Charset charset);

bool isValidUtf8(std::span<const uint8_t> bytes);

#endif
