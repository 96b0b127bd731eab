/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2000-2012 Free Software Foundation Europe e.V.
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
 * Miscellaneous metakeep memory and string routines
 */

#include "include/metakeep.h"
#include "lib/bsys.h"

#include <cctype>

/*
 * Guarantee that the string is properly terminated
 */
char* bstrncpy(char* dest, const char* src, int maxlen)
{
  std::string tmp;

  if ((src == nullptr) || (maxlen <= 1)) {
    dest[0] = 0;
    return dest;
  }

  if ((dest <= src) && ((dest + (maxlen - 1) * sizeof(char)) >= src)) {
    Dmsg0(100, "Overlapping strings found, using copy.\n");
    tmp.assign(src);
    src = tmp.c_str();
  }

  strncpy(dest, src, maxlen - 1);
  dest[maxlen - 1] = 0;
  return dest;
}

std::string JoinStrings(const std::vector<std::string>& parts,
                        std::string_view separator)
{
  std::string joined;

  for (const auto& part : parts) {
    if (part.empty()) { continue; }
    if (!joined.empty()) { joined.append(separator); }
    joined.append(part);
  }
  return joined;
}

std::string PrintablePreview(const std::vector<char>& value,
                             std::size_t max_len)
{
  std::string preview;

  for (std::size_t i = 0; i < value.size() && i < max_len; i++) {
    unsigned char c = static_cast<unsigned char>(value[i]);
    preview.push_back(isprint(c) ? static_cast<char>(c) : '.');
  }
  if (value.size() > max_len) { preview.append("..."); }
  return preview;
}

std::string HexPreview(const std::vector<char>& value, std::size_t max_len)
{
  static const char digits[] = "0123456789abcdef";
  std::string hex;

  for (std::size_t i = 0; i < value.size() && i < max_len; i++) {
    unsigned char c = static_cast<unsigned char>(value[i]);
    if (i > 0) { hex.push_back(' '); }
    hex.push_back(digits[c >> 4]);
    hex.push_back(digits[c & 0x0f]);
  }
  if (value.size() > max_len) { hex.append(" ..."); }
  return hex;
}
