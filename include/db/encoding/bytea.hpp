#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace km::db::encoding {

inline std::string to_hex_bytea(const std::vector<uint8_t>& v) {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(2 * v.size() + 2);
    out += "\\x";
    for (uint8_t b : v) {
        out.push_back(hex[b >> 4]);
        out.push_back(hex[b & 0xF]);
    }
    return out;
}

inline std::vector<uint8_t> from_hex_bytea(const std::string& s) {
    if (s.size() < 2 || s[0] != '\\' || s[1] != 'x') throw std::invalid_argument("Invalid hex bytea format");
    if ((s.size() - 2) % 2 != 0) throw std::invalid_argument("Hex bytea has invalid length");
    std::vector<uint8_t> out;
    out.reserve((s.size() - 2) / 2);
    for (size_t i = 2; i + 1 < s.size(); i += 2) {
        uint8_t byte = 0;
        for (size_t j = 0; j < 2; ++j) {
            const char c = s[i + j];
            byte <<= 4;
            if (c >= '0' && c <= '9') byte |= (c - '0');
            else if (c >= 'a' && c <= 'f') byte |= (c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') byte |= (c - 'A' + 10);
            else throw std::invalid_argument("Invalid character in hex bytea");
        }
        out.push_back(byte);
    }
    return out;
}

// Postgres array literal for BIGINT[] parameters, e.g. {1,2,3}.
inline std::string to_bigint_array(const std::vector<int64_t>& v) {
    std::string out = "{";
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += ',';
        out += std::to_string(v[i]);
    }
    out += '}';
    return out;
}

inline std::vector<int64_t> from_bigint_array(const std::string& s) {
    if (s.size() < 2 || s.front() != '{' || s.back() != '}') throw std::invalid_argument("Invalid BIGINT[] literal");
    std::vector<int64_t> out;
    size_t pos = 1;
    while (pos < s.size() - 1) {
        const auto next = s.find(',', pos);
        const auto end = next == std::string::npos ? s.size() - 1 : next;
        out.push_back(std::stoll(s.substr(pos, end - pos)));
        pos = end + 1;
    }
    return out;
}

}
