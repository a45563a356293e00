#ifndef CHUNKTYPE_HPP
#define CHUNKTYPE_HPP

#include <cstdint>
#include <iostream>

/**
 * @brief Leading byte of a chunk header.
 *
 * The byte carries three independent facets:
 * - low 6 bits: structural marker. CHUNK_HEADER (1) means the chunk has more than
 *   one page and every page carries its own statistics; ONLY_ONE_PAGE_CHUNK_HEADER
 *   (5) means a single page with no page statistics.
 * - bit 0x80: the chunk is the time column of a vector (aligned) series.
 * - bit 0x40: the chunk is a value column of a vector series.
 */
class ChunkType {
private:
    uint8_t value = 0;

public:
    static constexpr uint8_t CHUNK_HEADER = 1;
    static constexpr uint8_t ONLY_ONE_PAGE_CHUNK_HEADER = 5;

    static constexpr uint8_t TIME_COLUMN_MASK = 0x80;
    static constexpr uint8_t VALUE_COLUMN_MASK = 0x40;
    static constexpr uint8_t MARKER_MASK = 0x3F;

    constexpr ChunkType() = default;
    constexpr explicit ChunkType(uint8_t raw) : value(raw) {}

    // Marker derived from the page count, with the flag mask OR-ed on top
    static ChunkType fromPageCount(int32_t numOfPages, uint8_t mask = 0);

    constexpr uint8_t raw() const { return value; }
    constexpr uint8_t marker() const { return value & MARKER_MASK; }

    constexpr bool isTimeColumn() const { return (value & TIME_COLUMN_MASK) != 0; }
    constexpr bool isValueColumn() const { return (value & VALUE_COLUMN_MASK) != 0; }
    constexpr bool hasPageStatistics() const { return marker() == CHUNK_HEADER; }
    constexpr bool isSinglePage() const { return marker() == ONLY_ONE_PAGE_CHUNK_HEADER; }
    constexpr bool isChunkHeader() const { return hasPageStatistics() || isSinglePage(); }

    ChunkType withMask(uint8_t mask) const { return ChunkType(static_cast<uint8_t>(value | mask)); }

    friend constexpr bool operator==(ChunkType lhs, ChunkType rhs) { return lhs.value == rhs.value; }
    friend constexpr bool operator!=(ChunkType lhs, ChunkType rhs) { return !(lhs == rhs); }

    friend std::ostream& operator<<(std::ostream& os, ChunkType type);
};

#endif
