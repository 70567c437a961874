// SECPCORE - Hex Encoding/Decoding Implementation
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#include "secpcore/core/hex.h"

#include <stdexcept>

namespace secpcore {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int NibbleValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string BytesToHex(const HexByte* data, size_t len) {
    std::string out(len * 2, '0');
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = HEX_DIGITS[data[i] >> 4];
        out[2 * i + 1] = HEX_DIGITS[data[i] & 0x0F];
    }
    return out;
}

std::string BytesToHex(const std::vector<HexByte>& data) {
    return BytesToHex(data.data(), data.size());
}

std::vector<HexByte> HexToBytes(const std::string& hex) {
    size_t pos = HasHexPrefix(hex) ? 2 : 0;
    size_t digits = hex.length() - pos;

    std::vector<HexByte> out((digits + 1) / 2, 0);

    // Fill from the least significant digit so an odd count pads on the left
    size_t nibble = 0;
    for (size_t i = hex.length(); i > pos; --i, ++nibble) {
        int value = NibbleValue(hex[i - 1]);
        if (value < 0) {
            throw std::invalid_argument("Invalid hex character in '" + hex + "'");
        }
        HexByte& byte = out[out.size() - 1 - nibble / 2];
        byte |= static_cast<HexByte>(nibble % 2 ? value << 4 : value);
    }

    return out;
}

bool IsHexDigits(const std::string& str) {
    if (str.empty()) {
        return false;
    }
    for (char c : str) {
        if (NibbleValue(c) < 0) {
            return false;
        }
    }
    return true;
}

bool HasHexPrefix(const std::string& str) {
    return str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
}

std::string StripHexPrefix(const std::string& str) {
    return HasHexPrefix(str) ? str.substr(2) : str;
}

} // namespace secpcore
