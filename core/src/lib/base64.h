/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2000-2009 Free Software Foundation Europe e.V.
   Copyright (C) 2016-2026 Bareos GmbH & Co. KG

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

#ifndef METAKEEP_LIB_BASE64_H_
#define METAKEEP_LIB_BASE64_H_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/* Size of len bytes after padded base64 encoding */
#define BASE64_SIZE(len) ((((len) + 2) / 3) * 4)

/*
 * Standard (RFC 4648) base64 with '=' padding, as used by the rest of the
 * world.
 */
std::string BinToBase64(const char* bin, std::size_t binlen);
bool Base64ToBin(std::string_view src, std::vector<char>& dest);

#endif  // METAKEEP_LIB_BASE64_H_
