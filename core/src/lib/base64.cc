/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2000-2011 Free Software Foundation Europe e.V.
   Copyright (C) 2013-2026 Bareos GmbH & Co. KG

   This program is Free Software; you can redistribute it and/or
   modify it under the terms of version three of the GNU Affero General Public
   License as published by the Free Software Foundation and included
   in the file LICENSE.

   This program is distributed in the hope that it will be useful, but
   WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
   Affero General Public License for more details.

   You should have received a copy of the GNU Affero General Public License
   along with this program; if not, write to the Free Software
   Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
   02110-1301, USA.
*/
/*
 * Written by Kern E. Sibbald, March MM.
 */
/**
 * @file
 * Generic base 64 input and output routines
 */

#include "include/metakeep.h"
#include "lib/base64.h"

#include <array>

static const char base64_digits[64]
    = {'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M',
       'N', 'O', 'P', 'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z',
       'a', 'b', 'c', 'd', 'e', 'f', 'g', 'h', 'i', 'j', 'k', 'l', 'm',
       'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v', 'w', 'x', 'y', 'z',
       '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'};

static constexpr uint8_t kInvalid = 0xff;

/* Reverse map of base64_digits, kInvalid for any other character */
static const std::array<uint8_t, 256>& Base64Map()
{
  static const std::array<uint8_t, 256> map = [] {
    std::array<uint8_t, 256> m{};
    m.fill(kInvalid);
    for (int i = 0; i < 64; i++) { m[(uint8_t)base64_digits[i]] = i; }
    return m;
  }();
  return map;
}

/*
 * Encode binary data in bin of binlen bytes as padded base64 characters.
 */
std::string BinToBase64(const char* bin, std::size_t binlen)
{
  std::string buf;
  std::size_t i;

  buf.reserve(BASE64_SIZE(binlen));
  for (i = 0; i + 2 < binlen; i += 3) {
    uint32_t reg = ((uint8_t)bin[i] << 16) | ((uint8_t)bin[i + 1] << 8)
                   | (uint8_t)bin[i + 2];
    buf.push_back(base64_digits[(reg >> 18) & 0x3f]);
    buf.push_back(base64_digits[(reg >> 12) & 0x3f]);
    buf.push_back(base64_digits[(reg >> 6) & 0x3f]);
    buf.push_back(base64_digits[reg & 0x3f]);
  }

  switch (binlen - i) {
    case 1: {
      uint32_t reg = (uint8_t)bin[i] << 16;
      buf.push_back(base64_digits[(reg >> 18) & 0x3f]);
      buf.push_back(base64_digits[(reg >> 12) & 0x3f]);
      buf.append("==");
      break;
    }
    case 2: {
      uint32_t reg = ((uint8_t)bin[i] << 16) | ((uint8_t)bin[i + 1] << 8);
      buf.push_back(base64_digits[(reg >> 18) & 0x3f]);
      buf.push_back(base64_digits[(reg >> 12) & 0x3f]);
      buf.push_back(base64_digits[(reg >> 6) & 0x3f]);
      buf.push_back('=');
      break;
    }
    default:
      break;
  }

  return buf;
}

/*
 * Decode padded base64 characters in src into dest.
 *
 * Returns false when src is not a valid padded base64 encoding, dest is
 * left empty in that case.
 */
bool Base64ToBin(std::string_view src, std::vector<char>& dest)
{
  const auto& map = Base64Map();

  dest.clear();
  if (src.size() % 4 != 0) { return false; }
  dest.reserve(src.size() / 4 * 3);

  for (std::size_t i = 0; i < src.size(); i += 4) {
    bool last = (i + 4 == src.size());
    int padding = 0;
    uint32_t reg = 0;

    for (std::size_t j = 0; j < 4; j++) {
      char c = src[i + j];
      if (c == '=') {
        // padding only in the last two positions of the last quantum
        if (!last || j < 2) { goto bail_out; }
        padding++;
        reg <<= 6;
        continue;
      }
      if (padding > 0) { goto bail_out; }
      uint8_t v = map[(uint8_t)c];
      if (v == kInvalid) { goto bail_out; }
      reg = (reg << 6) | v;
    }

    dest.push_back((char)((reg >> 16) & 0xff));
    if (padding < 2) { dest.push_back((char)((reg >> 8) & 0xff)); }
    if (padding < 1) { dest.push_back((char)(reg & 0xff)); }
  }

  return true;

bail_out:
  dest.clear();
  return false;
}
