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

#include "include/metakeep.h"
#include "findlib/ea_codec.h"
#include "lib/byte_order.h"
#include "lib/message.h"

namespace metakeep {

using byte_order::LoadLittle;
using byte_order::StoreLittle;

const char* EaCodecErrorToString(EaCodecError error)
{
  switch (error) {
    case EaCodecError::kOk:
      return "ok";
    case EaCodecError::kInvalidBuffer:
      return "invalid extended attribute buffer";
    case EaCodecError::kNameTooLarge:
      return "extended attribute name too large";
    case EaCodecError::kValueTooLarge:
      return "extended attribute value too large";
    default:
      return "unknown extended attribute codec error";
  }
}

static std::size_t PaddedEntrySize(std::size_t entry_size)
{
  return (entry_size + 3) & ~std::size_t{3};
}

EaCodecError EncodeExtendedAttributes(const std::vector<EaEntry>& entries,
                                      std::vector<char>& out)
{
  out.clear();

  // Validate everything first so no partial buffer is produced.
  for (const auto& entry : entries) {
    if (entry.name.size() > kEaMaxNameLength) {
      return EaCodecError::kNameTooLarge;
    }
    if (entry.value.size() > kEaMaxValueLength) {
      return EaCodecError::kValueTooLarge;
    }
  }

  for (std::size_t i = 0; i < entries.size(); i++) {
    const EaEntry& entry = entries[i];
    bool last = (i + 1 == entries.size());
    std::size_t entry_size
        = kEaHeaderSize + entry.name.size() + 1 + entry.value.size();
    std::size_t with_padding = PaddedEntrySize(entry_size);
    std::size_t offset = out.size();

    out.resize(offset + with_padding, 0);
    char* p = out.data() + offset;

    StoreLittle<uint32_t>(p, last ? 0 : static_cast<uint32_t>(with_padding));
    StoreLittle<uint8_t>(p + 4, entry.flags);
    StoreLittle<uint8_t>(p + 5, static_cast<uint8_t>(entry.name.size()));
    StoreLittle<uint16_t>(p + 6, static_cast<uint16_t>(entry.value.size()));
    p += kEaHeaderSize;

    memcpy(p, entry.name.data(), entry.name.size());
    p += entry.name.size();
    *p++ = '\0';
    if (!entry.value.empty()) {
      memcpy(p, entry.value.data(), entry.value.size());
    }
  }

  return EaCodecError::kOk;
}

EaCodecError DecodeExtendedAttributes(const char* buf,
                                      std::size_t len,
                                      std::vector<EaEntry>& out)
{
  out.clear();

  while (len != 0) {
    if (len < kEaHeaderSize) { goto bail_out; }

    {
      uint32_t next_offset = LoadLittle<uint32_t>(buf);
      uint8_t flags = LoadLittle<uint8_t>(buf + 4);
      std::size_t name_length = LoadLittle<uint8_t>(buf + 5);
      std::size_t value_length = LoadLittle<uint16_t>(buf + 6);
      std::size_t name_offset = kEaHeaderSize;
      std::size_t value_offset = name_offset + name_length + 1;

      if (value_offset + value_length > len || next_offset > len) {
        goto bail_out;
      }

      EaEntry entry;
      entry.name.assign(buf + name_offset, name_length);
      entry.value.assign(buf + value_offset,
                         buf + value_offset + value_length);
      entry.flags = flags;
      out.push_back(std::move(entry));

      if (next_offset == 0) { break; }
      buf += next_offset;
      len -= next_offset;
    }
  }

  return EaCodecError::kOk;

bail_out:
  out.clear();
  return EaCodecError::kInvalidBuffer;
}

BattrExitCode QueryExtendedAttributes(const EaQueryFunction& query,
                                      std::vector<EaEntry>& entries,
                                      std::string& errmsg)
{
  std::vector<char> buffer(kEaInitialQueryBufferSize);
  std::size_t written = 0;

  entries.clear();
  while (1) {
    written = 0;
    OsResult result = query(buffer, written);

    if (result.ok()) { break; }

    switch (result.code) {
      case OsResultCode::kNoData:
        Dmsg0(200, "No extended attributes present\n");
        return BattrExitCode::kSuccess;
      case OsResultCode::kNotSupported:
        Dmsg1(200, "Extended attributes not supported: %s\n",
              result.message.c_str());
        return BattrExitCode::kSuccess;
      case OsResultCode::kInsufficientBuffer:
        Dfmt(200, "EA buffer of {} bytes too small, doubling", buffer.size());
        buffer.assign(buffer.size() * 2, 0);
        continue;
      default:
        Mmsg(errmsg, T_("get file EA failed with: %s\n"),
             result.message.c_str());
        Dmsg1(100, "get file EA failed with: %s\n", result.message.c_str());
        return BattrExitCode::kError;
    }
  }

  if (written > buffer.size()) { written = buffer.size(); }

  EaCodecError err = DecodeExtendedAttributes(buffer.data(), written, entries);
  if (err != EaCodecError::kOk) {
    Mmsg(errmsg, T_("decoding extended attributes failed: %s\n"),
         EaCodecErrorToString(err));
    return BattrExitCode::kError;
  }

  return BattrExitCode::kSuccess;
}

}  // namespace metakeep
