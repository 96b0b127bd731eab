/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2025-2026 Bareos GmbH & Co. KG

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
/**
 * @file
 * Windows extended attributes in the FILE_FULL_EA_INFORMATION buffer format
 * used by NtQueryEaFile and NtSetEaFile.
 *
 * Every record is
 *
 *   uint32 next_entry_offset   (0 for the last record)
 *   uint8  flags
 *   uint8  name_length
 *   uint16 value_length
 *   name, a 0 byte, value
 *   zero padding up to the next multiple of 4
 *
 * with all integers in little endian byte order.
 */

#ifndef METAKEEP_FINDLIB_EA_CODEC_H_
#define METAKEEP_FINDLIB_EA_CODEC_H_

#include "findlib/os_result.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace metakeep {

struct EaEntry {
  std::string name;
  std::vector<char> value;
  uint8_t flags{0};

  bool operator==(const EaEntry& other) const
  {
    return name == other.name && value == other.value && flags == other.flags;
  }
};

enum class EaCodecError
{
  kOk,
  kInvalidBuffer,
  kNameTooLarge,
  kValueTooLarge
};

const char* EaCodecErrorToString(EaCodecError error);

inline constexpr std::size_t kEaHeaderSize = 8;
inline constexpr std::size_t kEaMaxNameLength = 255;
inline constexpr std::size_t kEaMaxValueLength = 65535;
inline constexpr std::size_t kEaInitialQueryBufferSize = 1024;

/*
 * On error out is left empty, a partially encoded buffer is never returned.
 */
EaCodecError EncodeExtendedAttributes(const std::vector<EaEntry>& entries,
                                      std::vector<char>& out);
EaCodecError DecodeExtendedAttributes(const char* buf,
                                      std::size_t len,
                                      std::vector<EaEntry>& out);

/*
 * One call of the OS query primitive. It fills buffer and stores the number
 * of bytes it wrote in written.
 */
using EaQueryFunction
    = std::function<OsResult(std::vector<char>& buffer, std::size_t& written)>;

/*
 * Run the query with a growing buffer, starting at 1 KiB and doubling as
 * long as the OS reports the buffer is too small. "No EAs on file" is an
 * empty result. On error the message is put into errmsg.
 */
BattrExitCode QueryExtendedAttributes(const EaQueryFunction& query,
                                      std::vector<EaEntry>& entries,
                                      std::string& errmsg);

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_EA_CODEC_H_
