#include "chunkType.hpp"

#include <iomanip>

using namespace std;

ChunkType ChunkType::fromPageCount(int32_t numOfPages, uint8_t mask) {
    uint8_t marker = numOfPages <= 1 ? ONLY_ONE_PAGE_CHUNK_HEADER : CHUNK_HEADER;
    return ChunkType(static_cast<uint8_t>(marker | mask));
}

ostream& operator<<(ostream& os, ChunkType type) {
    ios::fmtflags flags = os.flags();
    char fill = os.fill();
    os << "0x" << hex << setw(2) << setfill('0') << static_cast<int>(type.raw());
    os.flags(flags);
    os.fill(fill);

    if (type.hasPageStatistics()) {
        os << " (multi-page";
    } else if (type.isSinglePage()) {
        os << " (single-page";
    } else {
        os << " (marker " << static_cast<int>(type.marker());
    }
    if (type.isTimeColumn()) os << ", time column";
    if (type.isValueColumn()) os << ", value column";
    return os << ")";
}
