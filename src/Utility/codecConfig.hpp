#ifndef CODECCONFIG_HPP
#define CODECCONFIG_HPP

#include <string>
#include <cstdint>
#include <expected>
#include <nlohmann/json.hpp>

#include "stringCodec.hpp"

/**
 * @brief Codec settings shared by every header encode and decode.
 *
 * Loaded from a JSON file such as:
 *
 *   {
 *     "string_charset": "UTF-8",
 *     "max_measurement_id_length": 65535
 *   }
 *
 * Missing keys keep their defaults. The process-wide instance is replaced with
 * setCurrent() during start-up, before any concurrent encode or decode runs.
 */
struct CodecConfig {
    Charset stringCharset = Charset::UTF8;

    // Decoding rejects ids whose declared byte length exceeds this
    uint32_t maxMeasurementIdLength = 65535;

    static std::expected<CodecConfig, std::string> fromJson(const nlohmann::json& j);
    static std::expected<CodecConfig, std::string> loadFromFile(const std::string& path);

    nlohmann::json toJson() const;

    static const CodecConfig& current();
    static void setCurrent(const CodecConfig& config);
};

#endif
