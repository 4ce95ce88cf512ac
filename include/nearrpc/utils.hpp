// SPDX-License-Identifier: MIT
// nearrpc - Utility Functions
// Copyright (c) 2024-2026 nearrpc Contributors

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace nearrpc
{

/// Decode a Base58 string (Bitcoin alphabet) to raw bytes
/// @param text Base58 encoded text (e.g., a NEAR block hash)
/// @return Decoded bytes, leading '1' characters become zero bytes
/// @throws std::invalid_argument on characters outside the alphabet
std::vector<uint8_t> base58_decode (std::string_view text);

/// Encode raw bytes as Base58 (Bitcoin alphabet)
/// @param data Pointer to byte data
/// @param len Number of bytes
/// @return Base58 text
std::string base58_encode (const uint8_t *data, size_t len);

/// Encode raw bytes as standard padded Base64
/// @param data Pointer to byte data
/// @param len Number of bytes
/// @return Base64 text
std::string base64_encode (const uint8_t *data, size_t len);

/// Check that a header value can be sent verbatim
/// @param value Candidate value
/// @return false if it contains control characters (CR, LF, NUL, ...)
bool is_header_value_safe (std::string_view value);

/// Check that a header name is a valid HTTP token
bool is_header_name_valid (std::string_view name);

} // namespace nearrpc
