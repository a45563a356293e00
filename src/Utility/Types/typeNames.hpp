#ifndef TYPENAMES_HPP
#define TYPENAMES_HPP

#include <string>
#include <algorithm>
#include <cctype>

// Tag names are matched case-insensitively, with '-' accepted for '_'
inline std::string toUpperName(const std::string& str) {
    std::string s = str;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::toupper(c));
    });
    return s;
}

#endif
