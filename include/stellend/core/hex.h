// STELLEND - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 STELLEND Developers
// MIT License

#ifndef STELLEND_CORE_HEX_H
#define STELLEND_CORE_HEX_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace stellend {

// Use uint8_t directly to avoid circular dependency with types.h
using HexByte = uint8_t;

/// Convert bytes to lowercase hex string
std::string BytesToHex(const HexByte* data, size_t len);
std::string BytesToHex(const std::vector<HexByte>& data);

/// Convert hex string to bytes; throws std::invalid_argument on bad input
std::vector<HexByte> HexToBytes(const std::string& hex);

/// Check if string is valid, non-empty, even-length hex
bool IsValidHex(const std::string& str);

/// Fixed-width (16 digit) hex rendering of a 64-bit id, used in storage keys
std::string U64ToHex(uint64_t value);

} // namespace stellend

#endif // STELLEND_CORE_HEX_H
