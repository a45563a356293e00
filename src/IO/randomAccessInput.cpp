#include "randomAccessInput.hpp"
#include "../Utility/codecError.hpp"

#include <algorithm>

using namespace std;

FileInput::FileInput(const string& path) : filePath(path) {
    fileStream.open(path, ios::in | ios::binary);
    if (!fileStream.is_open()) {
        throw IoError("Failed to open file: " + path);
    }

    fileStream.seekg(0, ios::end);
    streampos end = fileStream.tellg();
    if (end == streampos(-1)) {
        throw IoError("Failed to determine size of file: " + path);
    }
    fileSize = static_cast<uint64_t>(end);
    fileStream.seekg(0, ios::beg);
}

vector<uint8_t> FileInput::read(uint64_t offset, size_t length) {
    if (offset >= fileSize || length == 0) {
        return {};
    }

    size_t available = static_cast<size_t>(min<uint64_t>(length, fileSize - offset));
    vector<uint8_t> buffer(available);

    lock_guard<mutex> lock(streamMutex);

    fileStream.clear();
    fileStream.seekg(static_cast<streamoff>(offset), ios::beg);
    fileStream.read(reinterpret_cast<char*>(buffer.data()), static_cast<streamsize>(available));

    if (static_cast<size_t>(fileStream.gcount()) != available) {
        throw IoError("Failed to read " + to_string(available) + " bytes at offset " +
                      to_string(offset) + " from " + filePath);
    }

    return buffer;
}

vector<uint8_t> MemoryInput::read(uint64_t offset, size_t length) {
    if (offset >= bytes.size()) {
        return {};
    }

    size_t available = static_cast<size_t>(min<uint64_t>(length, bytes.size() - offset));
    auto first = bytes.begin() + static_cast<ptrdiff_t>(offset);
    return vector<uint8_t>(first, first + static_cast<ptrdiff_t>(available));
}
