// SECPCORE - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 SECPCORE Developers
// MIT License

#ifndef SECPCORE_CORE_HEX_H
#define SECPCORE_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace secpcore {

using HexByte = uint8_t;

/// Lower-case hex, two digits per byte
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Big-endian bytes of a hex string. An optional "0x" prefix is skipped and
/// an odd digit count is read as if a leading '0' were present.
/// Throws std::invalid_argument on a non-hex character.
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Non-empty run of hex digits, any length, no prefix
bool IsHexDigits(const std::string& str);

/// "0x" or "0X"
bool HasHexPrefix(const std::string& str);
std::string StripHexPrefix(const std::string& str);

} // namespace secpcore

#endif // SECPCORE_CORE_HEX_H
