#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <optional>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "Chunk/chunkHeader.hpp"
#include "Chunk/chunkType.hpp"
#include "IO/randomAccessInput.hpp"
#include "Utility/codecConfig.hpp"
#include "Utility/utils.hpp"

using namespace std;

struct EncodeOptions {
    string outputFile;
    string measurementId;
    bool nullId = false;
    uint32_t dataSize = 0;
    string dataType = "INT64";
    string compression = "UNCOMPRESSED";
    string encoding = "PLAIN";
    int32_t numOfPages = 1;
    bool timeColumn = false;
    bool valueColumn = false;
    uint64_t offset = 0;
};

struct DecodeOptions {
    string inputFile;
    uint64_t offset = 0;
    bool json = false;
    bool verbose = false;
};

struct SizeOptions {
    string measurementId;
    optional<uint32_t> dataSize;
};

/* -------------------------- DECLARATIONS -------------------------- */
void addEncodeOptions(CLI::App* encodeCmd, EncodeOptions& options);
void addDecodeOptions(CLI::App* decodeCmd, DecodeOptions& options);
void addSizeOptions(CLI::App* sizeCmd, SizeOptions& options);
int runEncode(const EncodeOptions& options);
int runDecode(const DecodeOptions& options);
int runSize(const SizeOptions& options);

/* -------------------------- MAIN FUNCTION -------------------------- */

int main(int argc, char** argv) {

    CLI::App app{"tschunk - chunk header codec tool\nEncode, decode and measure the header records that precede column chunks."};

    string configFile;
    app.add_option("--config", configFile, "Codec config JSON file (charset, limits)");

    EncodeOptions encodeOptions;
    DecodeOptions decodeOptions;
    SizeOptions sizeOptions;

    // ENCODE subcommand
    CLI::App* encodeCmd = app.add_subcommand("encode", "Write a chunk header to a file");
    addEncodeOptions(encodeCmd, encodeOptions);

    // DECODE subcommand
    CLI::App* decodeCmd = app.add_subcommand("decode", "Read the chunk header at an offset of a file");
    addDecodeOptions(decodeCmd, decodeOptions);

    // SIZE subcommand
    CLI::App* sizeCmd = app.add_subcommand("size", "Print exact and estimated header sizes");
    addSizeOptions(sizeCmd, sizeOptions);

    // Require that one subcommand is given
    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    if (!configFile.empty()) {
        auto config = CodecConfig::loadFromFile(configFile);
        if (!config) {
            cerr << "Failed to load config: " << config.error() << endl;
            return 1;
        }
        CodecConfig::setCurrent(*config);
    }

    if (*encodeCmd) return runEncode(encodeOptions);
    if (*decodeCmd) return runDecode(decodeOptions);
    if (*sizeCmd) return runSize(sizeOptions);

    return 0;
}

/* -------------------------- HELPER FUNCTIONS -------------------------- */

void addEncodeOptions(CLI::App* encodeCmd, EncodeOptions& options) {

    encodeCmd->add_option("-o,--output", options.outputFile, "Output file")->required();
    encodeCmd->add_option("-m,--measurement", options.measurementId, "Measurement id");
    encodeCmd->add_flag("--null-id", options.nullId, "Write a null measurement id");
    encodeCmd->add_option("-s,--size", options.dataSize, "Payload size in bytes");
    encodeCmd->add_option("-t,--type", options.dataType, "Data type (default: INT64)");
    encodeCmd->add_option("-c,--compression", options.compression, "Compression (default: UNCOMPRESSED)");
    encodeCmd->add_option("-e,--encoding", options.encoding, "Encoding (default: PLAIN)");
    encodeCmd->add_option("-p,--pages", options.numOfPages, "Number of pages (default: 1)");
    encodeCmd->add_option("--offset", options.offset, "Zero bytes written before the header");

    auto timeFlag = encodeCmd->add_flag("--time", options.timeColumn, "Mark as the time column of a vector");
    auto valueFlag = encodeCmd->add_flag("--value", options.valueColumn, "Mark as a value column of a vector");
    timeFlag->excludes(valueFlag);
}

void addDecodeOptions(CLI::App* decodeCmd, DecodeOptions& options) {

    decodeCmd->add_option("-i,--input", options.inputFile, "Input file")->required();
    decodeCmd->add_option("--offset", options.offset, "Byte offset of the header (default: 0)");
    decodeCmd->add_flag("--json", options.json, "Print the header as JSON");
    decodeCmd->add_flag("-v,--verbose", options.verbose, "Report the bytes fetched from the file");
}

void addSizeOptions(CLI::App* sizeCmd, SizeOptions& options) {

    sizeCmd->add_option("-m,--measurement", options.measurementId, "Measurement id")->required();
    sizeCmd->add_option("-s,--size", options.dataSize, "Payload size in bytes (exact size only)");
}

int runEncode(const EncodeOptions& options) {

    auto dataType = stringToDataType(options.dataType);
    auto compression = stringToCompression(options.compression);
    auto encoding = stringToEncoding(options.encoding);

    if (!dataType) { cerr << "Unknown data type: " << options.dataType << endl; return 1; }
    if (!compression) { cerr << "Unknown compression: " << options.compression << endl; return 1; }
    if (!encoding) { cerr << "Unknown encoding: " << options.encoding << endl; return 1; }

    uint8_t mask = 0;
    if (options.timeColumn) mask |= ChunkType::TIME_COLUMN_MASK;
    if (options.valueColumn) mask |= ChunkType::VALUE_COLUMN_MASK;

    optional<string> id;
    if (!options.nullId) id = options.measurementId;

    try {
        ChunkHeader header(id, options.dataSize, *dataType, *compression, *encoding, options.numOfPages, mask);

        ofstream out(options.outputFile, ios::binary | ios::trunc);
        if (!out.is_open()) {
            cerr << "Failed to open output file: " << options.outputFile << endl;
            return 1;
        }

        vector<char> padding(options.offset, 0);
        out.write(padding.data(), static_cast<streamsize>(padding.size()));

        uint64_t headerOffset = 0;
        if (!getCurrentFilePosition(out, headerOffset)) {
            cerr << "Failed to determine output position" << endl;
            return 1;
        }

        vector<uint8_t> bytes(header.getSerializedSize());
        auto written = header.serializeTo(span<uint8_t>(bytes));
        if (!written) {
            cerr << "Failed to encode header: " << written.error() << endl;
            return 1;
        }

        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<streamsize>(*written));
        if (!out.good()) {
            cerr << "Failed to write header to " << options.outputFile << endl;
            return 1;
        }

        cout << header << "\n";
        cout << "Chunk type: " << header.getChunkType() << "\n";
        cout << "Wrote " << *written << " bytes at offset " << headerOffset << ": "
             << toHexString(span<const uint8_t>(bytes.data(), *written)) << endl;
    } catch (const DecodeError& e) {
        cerr << "Cannot encode measurement id: " << e.what() << endl;
        return 1;
    }

    return 0;
}

int runDecode(const DecodeOptions& options) {

    try {
        FileInput input(options.inputFile);

        uint64_t fetched = 0;
        auto header = ChunkHeader::deserializeFrom(input, options.offset, [&](uint64_t bytes) {
            fetched += bytes;
        });

        if (!header) {
            cerr << "Failed to decode header at offset " << options.offset << ": " << header.error() << endl;
            return 1;
        }

        if (options.json) {
            cout << header->toJson().dump(2) << endl;
        } else {
            cout << *header << "\n";
            cout << "Chunk type: " << header->getChunkType() << "\n";
            cout << "Payload starts at offset " << options.offset + header->getSerializedSize() << endl;
        }

        if (options.verbose) {
            cerr << "Fetched " << fetched << " bytes for a " << header->getSerializedSize()
                 << " byte header (" << input.size() << " byte file)" << endl;
        }
    } catch (const IoError& e) {
        cerr << e.what() << endl;
        return 1;
    }

    return 0;
}

int runSize(const SizeOptions& options) {

    try {
        cout << "Estimated size: " << ChunkHeader::estimatedSize(options.measurementId) << "\n";
        if (options.dataSize) {
            cout << "Exact size:     " << ChunkHeader::exactSize(options.measurementId, *options.dataSize) << "\n";
        }
    } catch (const DecodeError& e) {
        cerr << "Cannot measure measurement id: " << e.what() << endl;
        return 1;
    }

    cout << "Charset:        " << charsetToString(CodecConfig::current().stringCharset) << endl;
    return 0;
}
