#ifndef DATATYPE_HPP
#define DATATYPE_HPP

#include <string>
#include <optional>
#include <array>
#include <cstdint>
#include <iostream>

// Logical value type of a column
enum class DataType : uint8_t {
    BOOLEAN = 0,
    INT32 = 1,
    INT64 = 2,
    FLOAT = 3,
    DOUBLE = 4,
    TEXT = 5,
    VECTOR = 6,
    UNKNOWN = 7,
    TIMESTAMP = 8,
    DATE = 9,
    BLOB = 10,
    STRING = 11
};

const std::array<DataType, 12> validDataTypes = {
    DataType::BOOLEAN,
    DataType::INT32,
    DataType::INT64,
    DataType::FLOAT,
    DataType::DOUBLE,
    DataType::TEXT,
    DataType::VECTOR,
    DataType::UNKNOWN,
    DataType::TIMESTAMP,
    DataType::DATE,
    DataType::BLOB,
    DataType::STRING
};

std::optional<DataType> stringToDataType(const std::string& str);
std::string dataTypeToString(DataType type);

std::optional<DataType> decodeDataType(uint8_t type);
uint8_t encodeDataType(DataType type);

std::ostream& operator<<(std::ostream& os, DataType type);

#endif
