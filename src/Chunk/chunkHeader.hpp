#ifndef CHUNKHEADER_HPP
#define CHUNKHEADER_HPP

#include <cstdint>
#include <string>
#include <optional>
#include <expected>
#include <functional>
#include <utility>
#include <span>
#include <vector>
#include <iostream>
#include <nlohmann/json.hpp>

#include "chunkType.hpp"
#include "../IO/byteSource.hpp"
#include "../IO/byteSink.hpp"
#include "../IO/randomAccessInput.hpp"
#include "../Utility/varInt.hpp"
#include "../Utility/codecError.hpp"
#include "../Utility/Types/dataType.hpp"
#include "../Utility/Types/compressionType.hpp"
#include "../Utility/Types/encodingType.hpp"

// Receives the number of bytes fetched from a RandomAccessInput
using IoSizeRecorder = std::function<void(uint64_t)>;

/**
 * @brief Header record preceding every chunk of a column.
 *
 * Binary layout:
 *
 *   [1 byte]  chunkType (marker + vector flags, see ChunkType)
 *   [varint]  measurement id byte length, zig-zag signed, -1 for a null id
 *   [N bytes] measurement id in the configured charset
 *   [uvarint] dataSize, byte length of the chunk payload that follows
 *   [1 byte]  dataType
 *   [1 byte]  compressionType
 *   [1 byte]  encodingType
 *
 * Identity fields are fixed at construction. dataSize and numOfPages are counters
 * updated while pages are appended or headers are merged. numOfPages and
 * serializedSize are never written to disk; a decoded header reports zero pages.
 */
class ChunkHeader {
private:
    ChunkType chunkType;
    std::optional<std::string> measurementId;

    uint32_t dataSize = 0;
    DataType dataType;
    CompressionType compressionType;
    EncodingType encodingType;

    // Not serialized
    int32_t numOfPages = 0;
    uint32_t serializedSize = 0;

    static std::optional<std::string> readMeasurementId(ByteSource& source, int32_t length);
    static void checkMeasurementIdLength(int32_t length);

    static DataType readDataType(ByteSource& source);
    static CompressionType readCompressionType(ByteSource& source);
    static EncodingType readEncodingType(ByteSource& source);

public:
    // Marker byte + widest varint; enough to hold chunkType and the id length
    static constexpr size_t HEADER_PROBE_SIZE = 1 + MAX_VAR_INT_SIZE;

    // dataType + compressionType + encodingType
    static constexpr uint32_t TAGS_SIZE = 3;

    /**
     * @brief Encoder-side constructor.
     *
     * The marker is derived from numOfPages (single page for <= 1) and mask is OR-ed
     * onto it. serializedSize is the exact encoded length.
     *
     * @throws DecodeError if the id cannot be represented in the configured charset
     */
    ChunkHeader(
        std::optional<std::string> measurementId,
        uint32_t dataSize,
        DataType dataType,
        CompressionType compressionType,
        EncodingType encoding,
        int32_t numOfPages,
        uint8_t mask = 0);

    // Decoder-side constructor, the marker is kept verbatim
    ChunkHeader(
        ChunkType chunkType,
        std::optional<std::string> measurementId,
        uint32_t dataSize,
        DataType dataType,
        CompressionType compressionType,
        EncodingType encoding);

    // Decoder-side constructor for a header whose encoded length was measured
    ChunkHeader(
        ChunkType chunkType,
        std::optional<std::string> measurementId,
        uint32_t dataSize,
        uint32_t headerSize,
        DataType dataType,
        CompressionType compressionType,
        EncodingType encoding);

    /* =============== Sizes =============== */

    /**
     * @brief Exact encoded length of a header with this id and data size.
     *
     * A null id counts as zero bytes. The id is measured in bytes of the configured
     * charset, not in characters.
     */
    static uint32_t exactSize(const std::optional<std::string>& measurementId, uint32_t dataSize);

    /**
     * @brief Upper bound of the encoded length when dataSize is not yet known.
     *
     * Assumes dataSize takes the widest 32-bit encoding, so the result is never
     * smaller than exactSize(measurementId, s) for any s. Space reserved with this
     * size has to be trimmed once the real header is written.
     */
    static uint32_t estimatedSize(const std::optional<std::string>& measurementId);

    uint32_t getSerializedSize() const { return serializedSize; }

    /* =============== Serialization =============== */

    /**
     * @brief Write the header to a sink.
     * @return number of bytes written, equal to getSerializedSize() for headers
     *         built by the exact-size constructors
     */
    std::expected<uint32_t, CodecError> serializeTo(ByteSink& sink) const;
    std::expected<uint32_t, CodecError> serializeTo(std::ostream& out) const;

    // Into a caller-sized buffer; fails with an I/O error if the buffer is too small
    std::expected<uint32_t, CodecError> serializeTo(std::span<uint8_t> buffer) const;

    // Appends to out; out is left unchanged on failure
    std::expected<uint32_t, CodecError> serializeTo(std::vector<uint8_t>& out) const;

    /* =============== Deserialization =============== */

    /**
     * @brief Decode from a sequential source whose marker byte was already read.
     *
     * Reads exactly the bytes of the remaining fields. serializedSize is computed
     * from the decoded values.
     */
    static std::expected<ChunkHeader, CodecError> deserializeFrom(ByteSource& source, ChunkType chunkType);
    static std::expected<ChunkHeader, CodecError> deserializeFrom(std::istream& in, ChunkType chunkType);

    /**
     * @brief Decode the header starting at offset, marker included.
     *
     * The length is unknown up front, so two reads are issued:
     *   1. HEADER_PROBE_SIZE bytes at offset, holding the marker and the id length;
     *   2. idLength + MAX_VAR_INT_SIZE + TAGS_SIZE bytes right after the consumed
     *      probe bytes, holding everything else with dataSize at its widest.
     * serializedSize of the result is the true encoded length, so payload starts
     * at offset + getSerializedSize().
     *
     * @param ioSizeRecorder if set, called once with the bytes requested by both reads
     */
    static std::expected<ChunkHeader, CodecError> deserializeFrom(
        RandomAccessInput& input, uint64_t offset, const IoSizeRecorder& ioSizeRecorder = nullptr);

    /**
     * @brief Decode only the compression type and encoding.
     *
     * The source must sit on the dataSize field, i.e. the caller has consumed the
     * marker and the measurement id. dataSize is read and discarded and the data
     * type byte skipped, so the source ends up exactly where a full decode leaves it.
     */
    static std::expected<std::pair<CompressionType, EncodingType>, CodecError>
        deserializeCompressionTypeAndEncoding(ByteSource& source);

    /* =============== Counters =============== */

    // Folds an adjacent chunk of the same column into this one; no compatibility check
    void mergeChunkHeader(const ChunkHeader& other);

    void setDataSize(uint32_t size) { dataSize = size; }
    void increasePageNums(int32_t count) { numOfPages += count; }

    /* =============== Accessors =============== */

    ChunkType getChunkType() const { return chunkType; }
    // The marker is always one byte, so the serialized size is unchanged
    void setChunkType(ChunkType type) { chunkType = type; }

    const std::optional<std::string>& getMeasurementId() const { return measurementId; }
    // Recomputes serializedSize; throws DecodeError if the id is not representable
    void setMeasurementId(std::optional<std::string> id);

    uint32_t getDataSize() const { return dataSize; }
    DataType getDataType() const { return dataType; }
    CompressionType getCompressionType() const { return compressionType; }
    EncodingType getEncodingType() const { return encodingType; }
    int32_t getNumOfPages() const { return numOfPages; }

    // Approximate heap + object footprint, for memory-bounded caches
    size_t ramBytesUsed() const;

    nlohmann::json toJson() const;

    friend std::ostream& operator<<(std::ostream& os, const ChunkHeader& header);
};

#endif
