#include "dataType.hpp"
#include "typeNames.hpp"

std::optional<DataType> stringToDataType(const std::string& str) {
    std::string s = toUpperName(str);
    for (auto t : validDataTypes) {
        if (dataTypeToString(t) == s) {
            return t;
        }
    }
    return std::nullopt;
}

std::string dataTypeToString(DataType type) {
    switch (type) {
        case DataType::BOOLEAN:   return "BOOLEAN";
        case DataType::INT32:     return "INT32";
        case DataType::INT64:     return "INT64";
        case DataType::FLOAT:     return "FLOAT";
        case DataType::DOUBLE:    return "DOUBLE";
        case DataType::TEXT:      return "TEXT";
        case DataType::VECTOR:    return "VECTOR";
        case DataType::UNKNOWN:   return "UNKNOWN";
        case DataType::TIMESTAMP: return "TIMESTAMP";
        case DataType::DATE:      return "DATE";
        case DataType::BLOB:      return "BLOB";
        case DataType::STRING:    return "STRING";
        default:                  return "UNKNOWN";
    }
}

std::optional<DataType> decodeDataType(uint8_t type) {
    for (auto t : validDataTypes) {
        if (static_cast<uint8_t>(t) == type) {
            return t;
        }
    }
    return std::nullopt;
}

uint8_t encodeDataType(DataType type) {
    return static_cast<uint8_t>(type);
}

std::ostream& operator<<(std::ostream& os, DataType type) {
    return os << dataTypeToString(type);
}
