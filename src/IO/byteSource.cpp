#include "byteSource.hpp"
#include "../Utility/codecError.hpp"

#include <cstring>
#include <string>

using namespace std;

uint8_t ByteSource::readByte() {
    uint8_t value = 0;
    readExact(&value, sizeof(value));
    return value;
}

vector<uint8_t> ByteSource::readExact(size_t length) {
    vector<uint8_t> bytes(length);
    if (length > 0) {
        readExact(bytes.data(), length);
    }
    return bytes;
}

/* ================ StreamSource ================ */

void StreamSource::readExact(uint8_t* dest, size_t length) {
    if (length == 0) return;

    in.read(reinterpret_cast<char*>(dest), static_cast<streamsize>(length));
    size_t got = static_cast<size_t>(in.gcount());
    consumed += got;

    if (got != length) {
        throw IoError("Unexpected end of stream: needed " + to_string(length) +
                      " bytes, got " + to_string(got));
    }
}

void StreamSource::skip(size_t length) {
    if (length == 0) return;

    in.ignore(static_cast<streamsize>(length));
    size_t got = static_cast<size_t>(in.gcount());
    consumed += got;

    if (got != length) {
        throw IoError("Unexpected end of stream while skipping " + to_string(length) + " bytes");
    }
}

/* ================ BufferSource ================ */

void BufferSource::readExact(uint8_t* dest, size_t length) {
    if (length > remaining()) {
        throw IoError("Buffer underflow: needed " + to_string(length) +
                      " bytes, " + to_string(remaining()) + " remaining");
    }
    if (length == 0) return;

    memcpy(dest, buffer.data() + cursor, length);
    cursor += length;
}

void BufferSource::skip(size_t length) {
    if (length > remaining()) {
        throw IoError("Buffer underflow while skipping " + to_string(length) + " bytes");
    }
    cursor += length;
}
