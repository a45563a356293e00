#include "byteSink.hpp"
#include "../Utility/codecError.hpp"

#include <cstring>
#include <string>

using namespace std;

void StreamSink::write(const uint8_t* data, size_t length) {
    if (length == 0) return;

    if (!out.write(reinterpret_cast<const char*>(data), static_cast<streamsize>(length))) {
        throw IoError("Failed to write " + to_string(length) + " bytes to output stream");
    }
    written += length;
}

void FixedBufferSink::write(const uint8_t* data, size_t length) {
    if (length > remaining()) {
        throw IoError("Buffer overflow: writing " + to_string(length) + " bytes with " +
                      to_string(remaining()) + " remaining");
    }
    if (length == 0) return;

    memcpy(buffer.data() + cursor, data, length);
    cursor += length;
}
