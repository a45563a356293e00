#include <catch2/catch_all.hpp>
#include "Chunk/chunkHeader.hpp"
#include "IO/randomAccessInput.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

struct WrittenChunk {
    uint64_t offset;
    ChunkHeader header;
    uint32_t payloadSize;
};

// Writes headers back to back, each followed by its payload, as a chunk group would be laid out
static std::string writeChunkFile(const std::string& relPath, std::vector<WrittenChunk>& chunks) {
    fs::path p = fs::path("build/tests_tmp") / relPath;
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    REQUIRE(out.good());

    out << "TSCHUNK1";
    for (auto& chunk : chunks) {
        chunk.offset = static_cast<uint64_t>(out.tellp());
        auto written = chunk.header.serializeTo(out);
        REQUIRE(written.has_value());
        std::vector<char> payload(chunk.payloadSize, 'x');
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    }
    out.close();
    return p.string();
}

TEST_CASE("Chunk headers decode from a file at their offsets", "[integration][file]") {

    std::vector<WrittenChunk> chunks = {
        {0, ChunkHeader("", 16, DataType::INT64, CompressionType::LZ4, EncodingType::TS_2DIFF, 1,
                        ChunkType::TIME_COLUMN_MASK), 16},
        {0, ChunkHeader("root.sg.d1.s1", 300, DataType::DOUBLE, CompressionType::SNAPPY,
                        EncodingType::GORILLA, 3, ChunkType::VALUE_COLUMN_MASK), 300},
        {0, ChunkHeader(std::nullopt, 2, DataType::BOOLEAN, CompressionType::UNCOMPRESSED,
                        EncodingType::PLAIN, 1), 2},
        {0, ChunkHeader("s\xC3\xA9", 5, DataType::TEXT, CompressionType::GZIP, EncodingType::DICTIONARY, 1), 5}
    };

    std::string path = writeChunkFile("integration/chunks.bin", chunks);
    FileInput input(path);

    SECTION("Every header matches what was written") {
        for (const auto& chunk : chunks) {
            auto decoded = ChunkHeader::deserializeFrom(input, chunk.offset);
            REQUIRE(decoded.has_value());
            REQUIRE(decoded->getChunkType() == chunk.header.getChunkType());
            REQUIRE(decoded->getMeasurementId() == chunk.header.getMeasurementId());
            REQUIRE(decoded->getDataSize() == chunk.payloadSize);
            REQUIRE(decoded->getDataType() == chunk.header.getDataType());
            REQUIRE(decoded->getCompressionType() == chunk.header.getCompressionType());
            REQUIRE(decoded->getEncodingType() == chunk.header.getEncodingType());
            REQUIRE(decoded->getSerializedSize() == chunk.header.getSerializedSize());
        }
    }

    SECTION("Walking the file by header and payload sizes visits every chunk") {
        uint64_t offset = 8;
        size_t visited = 0;
        while (offset < input.size()) {
            auto decoded = ChunkHeader::deserializeFrom(input, offset);
            REQUIRE(decoded.has_value());
            REQUIRE(offset == chunks[visited].offset);
            offset += decoded->getSerializedSize() + decoded->getDataSize();
            ++visited;
        }
        REQUIRE(visited == chunks.size());
        REQUIRE(offset == input.size());
    }

    SECTION("I/O volume is reported per header") {
        uint64_t total = 0;
        for (const auto& chunk : chunks) {
            auto decoded = ChunkHeader::deserializeFrom(input, chunk.offset, [&](uint64_t bytes) {
                total += bytes;
            });
            REQUIRE(decoded.has_value());
        }
        // 0 + 13 + 0 + 3 id bytes, each header with the first read, widest dataSize and tags
        REQUIRE(total == 4 * (6 + 5 + 3) + 16);
    }
}

TEST_CASE("Concurrent decodes share one file input", "[integration][file][concurrency]") {

    std::vector<WrittenChunk> chunks;
    for (uint32_t i = 0; i < 8; ++i) {
        std::string id = "root.sg.d" + std::to_string(i) + ".s" + std::to_string(i * 37);
        uint32_t payloadSize = 50 + i * 400;
        int32_t pages = static_cast<int32_t>(i % 3) + 1;
        chunks.push_back({0, ChunkHeader(id, payloadSize, validDataTypes[i], validCompressions[i],
                                         validEncodings[i], pages), payloadSize});
    }

    std::string path = writeChunkFile("integration/concurrent.bin", chunks);
    FileInput input(path);

    constexpr int rounds = 200;
    std::vector<int> mismatches(chunks.size(), 0);
    std::vector<int> failures(chunks.size(), 0);

    // Catch2 assertions are not thread safe, so each thread only counts and the checks run after join
    std::vector<std::thread> workers;
    for (size_t t = 0; t < chunks.size(); ++t) {
        workers.emplace_back([&, t]() {
            const WrittenChunk& expected = chunks[t];
            for (int round = 0; round < rounds; ++round) {
                auto decoded = ChunkHeader::deserializeFrom(input, expected.offset);
                if (!decoded) {
                    ++failures[t];
                    continue;
                }
                if (decoded->getMeasurementId() != expected.header.getMeasurementId() ||
                    decoded->getChunkType() != expected.header.getChunkType() ||
                    decoded->getDataSize() != expected.payloadSize ||
                    decoded->getDataType() != expected.header.getDataType() ||
                    decoded->getCompressionType() != expected.header.getCompressionType() ||
                    decoded->getEncodingType() != expected.header.getEncodingType() ||
                    decoded->getSerializedSize() != expected.header.getSerializedSize()) {
                    ++mismatches[t];
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (size_t t = 0; t < chunks.size(); ++t) {
        INFO("chunk " << t << " at offset " << chunks[t].offset);
        REQUIRE(failures[t] == 0);
        REQUIRE(mismatches[t] == 0);
    }
}

TEST_CASE("Missing file is an I/O error", "[integration][file]") {
    REQUIRE_THROWS_AS(FileInput("build/tests_tmp/integration/missing.bin"), IoError);
}
