// SPDX-License-Identifier: MIT
// nearrpc - Utility Functions Implementation
// Copyright (c) 2024-2026 nearrpc Contributors

#include "nearrpc/utils.hpp"
#include <algorithm>
#include <cstring>
#include <openssl/evp.h>
#include <stdexcept>

namespace nearrpc
{

namespace
{
const char *const BASE58_ALPHABET
    = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

std::vector<uint8_t>
base58_decode (std::string_view text)
{
  size_t zeros = 0;
  while (zeros < text.length () && text[zeros] == '1')
    ++zeros;

  // Big-endian accumulator, grown as digits are folded in
  std::vector<uint8_t> decoded;
  decoded.reserve (text.length ());

  for (size_t i = zeros; i < text.length (); ++i)
    {
      const char *p = std::strchr (BASE58_ALPHABET, text[i]);
      if (!p || text[i] == '\0')
        throw std::invalid_argument ("invalid base58 character");

      int carry = static_cast<int> (p - BASE58_ALPHABET);
      for (auto it = decoded.rbegin (); it != decoded.rend (); ++it)
        {
          carry += 58 * (*it);
          *it = static_cast<uint8_t> (carry % 256);
          carry /= 256;
        }
      while (carry > 0)
        {
          decoded.insert (decoded.begin (), static_cast<uint8_t> (carry % 256));
          carry /= 256;
        }
    }

  decoded.insert (decoded.begin (), zeros, 0);
  return decoded;
}

std::string
base58_encode (const uint8_t *data, size_t len)
{
  size_t zeros = 0;
  while (zeros < len && data[zeros] == 0)
    ++zeros;

  // Little-endian base58 digits
  std::vector<uint8_t> digits;
  digits.reserve (len * 138 / 100 + 1);

  for (size_t i = zeros; i < len; ++i)
    {
      int carry = data[i];
      for (auto &digit : digits)
        {
          carry += 256 * digit;
          digit = static_cast<uint8_t> (carry % 58);
          carry /= 58;
        }
      while (carry > 0)
        {
          digits.push_back (static_cast<uint8_t> (carry % 58));
          carry /= 58;
        }
    }

  std::string result (zeros, '1');
  result.reserve (zeros + digits.size ());
  for (auto it = digits.rbegin (); it != digits.rend (); ++it)
    {
      result.push_back (BASE58_ALPHABET[*it]);
    }
  return result;
}

std::string
base64_encode (const uint8_t *data, size_t len)
{
  if (len == 0)
    return {};

  // EVP_EncodeBlock also writes a terminating NUL
  std::vector<unsigned char> out (4 * ((len + 2) / 3) + 1);
  int written = EVP_EncodeBlock (out.data (), data, static_cast<int> (len));
  return std::string (out.begin (), out.begin () + written);
}

bool
is_header_value_safe (std::string_view value)
{
  return std::none_of (value.begin (), value.end (), [] (char c) {
    auto u = static_cast<unsigned char> (c);
    return (u < 0x20 && c != '\t') || u == 0x7f;
  });
}

bool
is_header_name_valid (std::string_view name)
{
  static const char *const separators = "()<>@,;:\\\"/[]?={} \t";
  if (name.empty ())
    return false;
  return std::all_of (name.begin (), name.end (), [] (char c) {
    auto u = static_cast<unsigned char> (c);
    return u > 0x20 && u < 0x7f && std::strchr (separators, c) == nullptr;
  });
}

} // namespace nearrpc
