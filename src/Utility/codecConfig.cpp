#include "codecConfig.hpp"

#include <fstream>

using namespace std;

static CodecConfig globalConfig;

expected<CodecConfig, string> CodecConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return unexpected("Codec config must be a JSON object");
    }

    CodecConfig config;

    if (j.contains("string_charset")) {
        if (!j["string_charset"].is_string()) {
            return unexpected("'string_charset' must be a string");
        }
        string name = j["string_charset"].get<string>();
        auto charset = stringToCharset(name);
        if (!charset) {
            return unexpected("Unsupported string_charset: " + name);
        }
        config.stringCharset = *charset;
    }

    if (j.contains("max_measurement_id_length")) {
        const auto& value = j["max_measurement_id_length"];
        if (!value.is_number_unsigned()) {
            return unexpected("'max_measurement_id_length' must be a non-negative integer");
        }
        uint64_t length = value.get<uint64_t>();
        if (length > static_cast<uint64_t>(INT32_MAX)) {
            return unexpected("'max_measurement_id_length' is out of range");
        }
        config.maxMeasurementIdLength = static_cast<uint32_t>(length);
    }

    return config;
}

expected<CodecConfig, string> CodecConfig::loadFromFile(const string& path) {
    ifstream file(path);
    if (!file.is_open()) {
        return unexpected("Failed to open codec config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        return unexpected("Failed to parse codec config " + path + ": " + string(e.what()));
    }

    return fromJson(j);
}

nlohmann::json CodecConfig::toJson() const {
    return {
        {"string_charset", charsetToString(stringCharset)},
        {"max_measurement_id_length", maxMeasurementIdLength}
    };
}

const CodecConfig& CodecConfig::current() {
    return globalConfig;
}

void CodecConfig::setCurrent(const CodecConfig& config) {
    globalConfig = config;
}
