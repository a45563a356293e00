#include <catch2/catch_all.hpp>
#include "Utility/Types/dataType.hpp"
#include "Utility/Types/compressionType.hpp"
#include "Utility/Types/encodingType.hpp"
#include "Utility/codecError.hpp"

#include <sstream>

TEST_CASE("Data type tags", "[types][dataType]") {

    SECTION("Wire values") {
        REQUIRE(encodeDataType(DataType::BOOLEAN) == 0);
        REQUIRE(encodeDataType(DataType::INT64) == 2);
        REQUIRE(encodeDataType(DataType::STRING) == 11);
    }

    SECTION("Every valid tag decodes to itself") {
        for (auto type : validDataTypes) {
            REQUIRE(decodeDataType(encodeDataType(type)) == type);
            REQUIRE(stringToDataType(dataTypeToString(type)) == type);
        }
        REQUIRE_FALSE(decodeDataType(12).has_value());
        REQUIRE_FALSE(decodeDataType(0xFF).has_value());
    }

    SECTION("Names are case-insensitive") {
        REQUIRE(stringToDataType("int32") == DataType::INT32);
        REQUIRE_FALSE(stringToDataType("int128").has_value());
    }
}

TEST_CASE("Compression tags", "[types][compression]") {

    SECTION("Wire values") {
        REQUIRE(encodeCompression(CompressionType::UNCOMPRESSED) == 0);
        REQUIRE(encodeCompression(CompressionType::SNAPPY) == 1);
        REQUIRE(encodeCompression(CompressionType::LZMA2) == 9);
    }

    SECTION("Decode and names") {
        for (auto c : validCompressions) {
            REQUIRE(decodeCompressionType(encodeCompression(c)) == c);
        }
        REQUIRE_FALSE(decodeCompressionType(10).has_value());
        REQUIRE(stringToCompression("none") == CompressionType::UNCOMPRESSED);
        REQUIRE(stringToCompression("zstd") == CompressionType::ZSTD);
    }
}

TEST_CASE("Encoding tags", "[types][encoding]") {

    SECTION("Wire values") {
        REQUIRE(encodeEncoding(EncodingType::PLAIN) == 0);
        REQUIRE(encodeEncoding(EncodingType::TS_2DIFF) == 4);
        REQUIRE(encodeEncoding(EncodingType::RLBE) == 13);
    }

    SECTION("Decode and names") {
        for (auto e : validEncodings) {
            REQUIRE(decodeEncodingType(encodeEncoding(e)) == e);
        }
        REQUIRE_FALSE(decodeEncodingType(14).has_value());
        REQUIRE(stringToEncoding("ts-2diff") == EncodingType::TS_2DIFF);
    }

    SECTION("Stream output uses the name") {
        std::ostringstream oss;
        oss << EncodingType::GORILLA << " " << CompressionType::LZ4 << " " << DataType::VECTOR;
        REQUIRE(oss.str() == "GORILLA LZ4 VECTOR");
    }
}

TEST_CASE("Codec error display", "[types][error]") {
    CodecError io{ErrorKind::Io, "short read"};
    CodecError decode{ErrorKind::Decode, "bad tag"};

    REQUIRE(io.isIo());
    REQUIRE_FALSE(io.isDecode());
    REQUIRE(decode.isDecode());

    std::ostringstream oss;
    oss << io << "; " << decode;
    REQUIRE(oss.str() == "IO error: short read; DECODE error: bad tag");
}
