#include "chunkHeader.hpp"
#include "../Utility/stringCodec.hpp"
#include "../Utility/codecConfig.hpp"

#include <string>
#include <vector>

using namespace std;

namespace {

// Runs a decode or encode step, turning the typed I/O and decode exceptions into
// a CodecError. Anything else propagates.
template <typename T, typename Fn>
expected<T, CodecError> guarded(Fn&& fn) {
    try {
        return fn();
    } catch (const IoError& e) {
        return unexpected(CodecError{ErrorKind::Io, e.what()});
    } catch (const DecodeError& e) {
        return unexpected(CodecError{ErrorKind::Decode, e.what()});
    }
}

uint32_t measurementIdByteLength(const optional<string>& measurementId) {
    if (!measurementId) return 0;
    return static_cast<uint32_t>(encodedLength(*measurementId, CodecConfig::current().stringCharset));
}

}

/* ================ CONSTRUCTORS ================ */

ChunkHeader::ChunkHeader(
    optional<string> measurementId,
    uint32_t dataSize,
    DataType dataType,
    CompressionType compressionType,
    EncodingType encoding,
    int32_t numOfPages,
    uint8_t mask)
    : ChunkHeader(
        ChunkType::fromPageCount(numOfPages, mask),
        std::move(measurementId),
        dataSize,
        dataType,
        compressionType,
        encoding) {
    this->numOfPages = numOfPages;
}

ChunkHeader::ChunkHeader(
    ChunkType chunkType,
    optional<string> measurementId,
    uint32_t dataSize,
    DataType dataType,
    CompressionType compressionType,
    EncodingType encoding)
    : chunkType(chunkType),
      measurementId(std::move(measurementId)),
      dataSize(dataSize),
      dataType(dataType),
      compressionType(compressionType),
      encodingType(encoding) {
    serializedSize = exactSize(this->measurementId, dataSize);
}

ChunkHeader::ChunkHeader(
    ChunkType chunkType,
    optional<string> measurementId,
    uint32_t dataSize,
    uint32_t headerSize,
    DataType dataType,
    CompressionType compressionType,
    EncodingType encoding)
    : chunkType(chunkType),
      measurementId(std::move(measurementId)),
      dataSize(dataSize),
      dataType(dataType),
      compressionType(compressionType),
      encodingType(encoding),
      serializedSize(headerSize) {}

/* ================ SIZES ================ */

uint32_t ChunkHeader::exactSize(const optional<string>& measurementId, uint32_t dataSize) {
    uint32_t idLength = measurementIdByteLength(measurementId);
    int32_t lengthPrefix = measurementId ? static_cast<int32_t>(idLength) : -1;

    return 1                                         // chunkType
        + static_cast<uint32_t>(varIntSize(lengthPrefix))
        + idLength
        + static_cast<uint32_t>(uVarIntSize(dataSize))
        + TAGS_SIZE;                                 // dataType, compression, encoding
}

uint32_t ChunkHeader::estimatedSize(const optional<string>& measurementId) {
    uint32_t idLength = measurementIdByteLength(measurementId);
    int32_t lengthPrefix = measurementId ? static_cast<int32_t>(idLength) : -1;

    return 1
        + static_cast<uint32_t>(varIntSize(lengthPrefix))
        + idLength
        + MAX_VAR_INT_SIZE                           // dataSize at its widest
        + TAGS_SIZE;
}

/* ================ WRITE FUNCTIONS ================ */

expected<uint32_t, CodecError> ChunkHeader::serializeTo(ByteSink& sink) const {
    return guarded<uint32_t>([&]() {
        uint32_t length = 0;

        sink.writeByte(chunkType.raw());
        length += 1;

        if (measurementId) {
            vector<uint8_t> idBytes = encodeString(*measurementId, CodecConfig::current().stringCharset);
            length += writeVarInt(static_cast<int32_t>(idBytes.size()), sink);
            sink.write(idBytes);
            length += static_cast<uint32_t>(idBytes.size());
        } else {
            length += writeVarInt(-1, sink);
        }

        length += writeUnsignedVarInt(dataSize, sink);

        sink.writeByte(encodeDataType(dataType));
        sink.writeByte(encodeCompression(compressionType));
        sink.writeByte(encodeEncoding(encodingType));
        length += TAGS_SIZE;

        return length;
    });
}

expected<uint32_t, CodecError> ChunkHeader::serializeTo(ostream& out) const {
    StreamSink sink(out);
    return serializeTo(sink);
}

expected<uint32_t, CodecError> ChunkHeader::serializeTo(span<uint8_t> buffer) const {
    FixedBufferSink sink(buffer);
    return serializeTo(sink);
}

expected<uint32_t, CodecError> ChunkHeader::serializeTo(vector<uint8_t>& out) const {
    size_t start = out.size();

    auto required = guarded<uint32_t>([&]() { return exactSize(measurementId, dataSize); });
    if (!required) return required;

    out.resize(start + *required);
    auto written = serializeTo(span<uint8_t>(out).subspan(start));
    out.resize(written ? start + *written : start);
    return written;
}

/* ================ READ FUNCTIONS ================ */

void ChunkHeader::checkMeasurementIdLength(int32_t length) {
    if (length < -1) {
        throw DecodeError("Invalid measurement id length: " + to_string(length));
    }
    uint32_t maxLength = CodecConfig::current().maxMeasurementIdLength;
    if (length > 0 && static_cast<uint32_t>(length) > maxLength) {
        throw DecodeError("Measurement id length " + to_string(length) +
                          " exceeds limit of " + to_string(maxLength));
    }
}

optional<string> ChunkHeader::readMeasurementId(ByteSource& source, int32_t length) {
    checkMeasurementIdLength(length);
    if (length == -1) {
        return nullopt;
    }

    vector<uint8_t> bytes = source.readExact(static_cast<size_t>(length));
    return decodeString(bytes, CodecConfig::current().stringCharset);
}

DataType ChunkHeader::readDataType(ByteSource& source) {
    uint8_t tag = source.readByte();
    auto type = decodeDataType(tag);
    if (!type) throw DecodeError("Unknown data type tag: " + to_string(tag));
    return *type;
}

CompressionType ChunkHeader::readCompressionType(ByteSource& source) {
    uint8_t tag = source.readByte();
    auto type = decodeCompressionType(tag);
    if (!type) throw DecodeError("Unknown compression type tag: " + to_string(tag));
    return *type;
}

EncodingType ChunkHeader::readEncodingType(ByteSource& source) {
    uint8_t tag = source.readByte();
    auto type = decodeEncodingType(tag);
    if (!type) throw DecodeError("Unknown encoding tag: " + to_string(tag));
    return *type;
}

expected<ChunkHeader, CodecError> ChunkHeader::deserializeFrom(ByteSource& source, ChunkType chunkType) {
    return guarded<ChunkHeader>([&]() {
        int32_t idLength = readVarInt(source);
        optional<string> id = readMeasurementId(source, idLength);
        uint32_t size = readUnsignedVarInt(source);
        DataType type = readDataType(source);
        CompressionType compression = readCompressionType(source);
        EncodingType encoding = readEncodingType(source);

        return ChunkHeader(chunkType, std::move(id), size, type, compression, encoding);
    });
}

expected<ChunkHeader, CodecError> ChunkHeader::deserializeFrom(istream& in, ChunkType chunkType) {
    StreamSource source(in);
    return deserializeFrom(source, chunkType);
}

expected<ChunkHeader, CodecError> ChunkHeader::deserializeFrom(
    RandomAccessInput& input, uint64_t offset, const IoSizeRecorder& ioSizeRecorder) {

    return guarded<ChunkHeader>([&]() {
        // Phase 1: marker and id length. Only a few bytes, accounted with phase 2.
        vector<uint8_t> probe = input.read(offset, HEADER_PROBE_SIZE);
        BufferSource probeSource(probe);

        ChunkType chunkType(probeSource.readByte());
        int32_t idLength = readVarInt(probeSource);
        checkMeasurementIdLength(idLength);
        uint64_t headBytes = probeSource.position();

        // Phase 2: everything else, dataSize at its widest
        size_t idBytes = idLength > 0 ? static_cast<size_t>(idLength) : 0;
        size_t remainingBytes = idBytes + MAX_VAR_INT_SIZE + TAGS_SIZE;

        if (ioSizeRecorder) {
            ioSizeRecorder(HEADER_PROBE_SIZE + remainingBytes);
        }

        vector<uint8_t> window = input.read(offset + headBytes, remainingBytes);
        BufferSource windowSource(window);

        optional<string> id = readMeasurementId(windowSource, idLength);
        uint32_t size = readUnsignedVarInt(windowSource);
        DataType type = readDataType(windowSource);
        CompressionType compression = readCompressionType(windowSource);
        EncodingType encoding = readEncodingType(windowSource);

        uint32_t headerSize = static_cast<uint32_t>(headBytes + windowSource.position());
        return ChunkHeader(chunkType, std::move(id), size, headerSize, type, compression, encoding);
    });
}

expected<pair<CompressionType, EncodingType>, CodecError>
ChunkHeader::deserializeCompressionTypeAndEncoding(ByteSource& source) {
    return guarded<pair<CompressionType, EncodingType>>([&]() {
        readUnsignedVarInt(source);     // dataSize
        source.skip(1);                 // dataType
        CompressionType compression = readCompressionType(source);
        EncodingType encoding = readEncodingType(source);
        return make_pair(compression, encoding);
    });
}

/* ================ COUNTERS ================ */

void ChunkHeader::mergeChunkHeader(const ChunkHeader& other) {
    dataSize += other.dataSize;
    numOfPages += other.numOfPages;
}

/* ================ ACCESSORS ================ */

void ChunkHeader::setMeasurementId(optional<string> id) {
    uint32_t size = exactSize(id, dataSize);
    measurementId = std::move(id);
    serializedSize = size;
}

/* ================ DISPLAY ================ */

size_t ChunkHeader::ramBytesUsed() const {
    size_t size = sizeof(ChunkHeader);
    if (measurementId) {
        size += measurementId->capacity();
    }
    return size;
}

nlohmann::json ChunkHeader::toJson() const {
    nlohmann::json j;
    j["chunk_type"] = chunkType.raw();
    j["time_column"] = chunkType.isTimeColumn();
    j["value_column"] = chunkType.isValueColumn();
    j["page_statistics"] = chunkType.hasPageStatistics();
    if (measurementId) {
        j["measurement_id"] = *measurementId;
    } else {
        j["measurement_id"] = nullptr;
    }
    j["data_size"] = dataSize;
    j["data_type"] = dataTypeToString(dataType);
    j["compression_type"] = compressionToString(compressionType);
    j["encoding_type"] = encodingToString(encodingType);
    j["num_of_pages"] = numOfPages;
    j["serialized_size"] = serializedSize;
    return j;
}

ostream& operator<<(ostream& os, const ChunkHeader& header) {
    os << "CHUNK_HEADER{"
       << "measurementID='" << header.measurementId.value_or("null") << "'"
       << ", dataSize=" << header.dataSize
       << ", dataType=" << header.dataType
       << ", compressionType=" << header.compressionType
       << ", encodingType=" << header.encodingType
       << ", numOfPages=" << header.numOfPages
       << ", serializedSize=" << header.serializedSize
       << "}";
    return os;
}
