#include <catch2/catch_all.hpp>
#include "Chunk/chunkType.hpp"

#include <sstream>

TEST_CASE("ChunkType marker derivation", "[chunkType]") {

    SECTION("One page or fewer gives the single-page marker") {
        REQUIRE(ChunkType::fromPageCount(0).raw() == ChunkType::ONLY_ONE_PAGE_CHUNK_HEADER);
        REQUIRE(ChunkType::fromPageCount(1).raw() == ChunkType::ONLY_ONE_PAGE_CHUNK_HEADER);
        REQUIRE(ChunkType::fromPageCount(1).isSinglePage());
        REQUIRE_FALSE(ChunkType::fromPageCount(1).hasPageStatistics());
    }

    SECTION("More pages gives the multi-page marker") {
        ChunkType type = ChunkType::fromPageCount(5);
        REQUIRE(type.raw() == ChunkType::CHUNK_HEADER);
        REQUIRE(type.hasPageStatistics());
        REQUIRE_FALSE(type.isSinglePage());
    }

    SECTION("Flag bits are OR-ed onto either marker") {
        ChunkType timeSingle = ChunkType::fromPageCount(1, ChunkType::TIME_COLUMN_MASK);
        REQUIRE(timeSingle.raw() == 0x85);
        REQUIRE(timeSingle.isTimeColumn());
        REQUIRE_FALSE(timeSingle.isValueColumn());
        REQUIRE(timeSingle.isSinglePage());

        ChunkType valueMulti = ChunkType::fromPageCount(5, ChunkType::VALUE_COLUMN_MASK);
        REQUIRE(valueMulti.raw() == 0x41);
        REQUIRE(valueMulti.isValueColumn());
        REQUIRE_FALSE(valueMulti.isTimeColumn());
        REQUIRE(valueMulti.hasPageStatistics());
    }
}

TEST_CASE("ChunkType facets are independent", "[chunkType]") {

    SECTION("Marker ignores the flag bits") {
        ChunkType type(0xC5);
        REQUIRE(type.marker() == ChunkType::ONLY_ONE_PAGE_CHUNK_HEADER);
        REQUIRE(type.isTimeColumn());
        REQUIRE(type.isValueColumn());
        REQUIRE(type.isChunkHeader());
    }

    SECTION("Other markers are not chunk headers") {
        REQUIRE_FALSE(ChunkType(0).isChunkHeader());
        REQUIRE_FALSE(ChunkType(2).isChunkHeader());
    }

    SECTION("withMask keeps existing bits") {
        ChunkType type = ChunkType::fromPageCount(3).withMask(ChunkType::TIME_COLUMN_MASK);
        REQUIRE(type == ChunkType(0x81));
        REQUIRE(type != ChunkType(0x01));
    }

    SECTION("Stream output names the facets") {
        std::ostringstream oss;
        oss << ChunkType(0x85);
        REQUIRE(oss.str() == "0x85 (single-page, time column)");
    }
}
