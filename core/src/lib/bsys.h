/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2018-2026 Bareos GmbH & Co. KG

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

#ifndef METAKEEP_LIB_BSYS_H_
#define METAKEEP_LIB_BSYS_H_

#include <string>
#include <string_view>
#include <vector>

char* bstrncpy(char* dest, const char* src, int maxlen);

// Join the non empty parts with separator, e.g. for aggregated errors.
std::string JoinStrings(const std::vector<std::string>& parts,
                        std::string_view separator);

// Printable preview of a binary value, non printable bytes become '.'.
std::string PrintablePreview(const std::vector<char>& value,
                             std::size_t max_len);

// Lower case hex dump, at most max_len bytes.
std::string HexPreview(const std::vector<char>& value, std::size_t max_len);

#endif  // METAKEEP_LIB_BSYS_H_
