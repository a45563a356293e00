#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <cstdint>
#include <ostream>
#include <span>

// Space separated lowercase hex, e.g. "05 06 73 31"
std::string toHexString(std::span<const uint8_t> bytes);

// False if the stream cannot report a write position
bool getCurrentFilePosition(std::ostream& out, uint64_t& offset);

#endif
