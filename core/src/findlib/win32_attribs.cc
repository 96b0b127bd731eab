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
/**
 * @file
 * Restore of the Windows specific file attributes.
 */

#include "include/metakeep.h"
#include "findlib/win32_attribs.h"
#include "lib/byte_order.h"

namespace metakeep {

using byte_order::LoadLittle;
using byte_order::StoreLittle;

GenericAttribute MakeFileAttributesAttribute(uint32_t file_attributes)
{
  GenericAttribute attribute{generic_attribute_type::kFileAttributes,
                             std::vector<char>(4)};
  StoreLittle<uint32_t>(attribute.value.data(), file_attributes);
  return attribute;
}

GenericAttribute MakeCreationTimeAttribute(const Filetime& creation_time)
{
  GenericAttribute attribute{generic_attribute_type::kCreationTime,
                             std::vector<char>(8)};
  StoreLittle<uint32_t>(attribute.value.data(), creation_time.low);
  StoreLittle<uint32_t>(attribute.value.data() + 4, creation_time.high);
  return attribute;
}

bool DecodeFileAttributes(const std::vector<char>& value,
                          uint32_t& file_attributes)
{
  if (value.size() != 4) { return false; }
  file_attributes = LoadLittle<uint32_t>(value.data());
  return true;
}

bool DecodeCreationTime(const std::vector<char>& value,
                        Filetime& creation_time)
{
  if (value.size() != 8) { return false; }
  creation_time.low = LoadLittle<uint32_t>(value.data());
  creation_time.high = LoadLittle<uint32_t>(value.data() + 4);
  return true;
}

// The value SetFileAttributes gets for the wanted bits.
static uint32_t SettableAttributes(uint32_t attributes)
{
  uint32_t settable = attributes & win32::kSettableFileAttributes;
  if (settable == 0) { settable = win32::kFileAttributeNormal; }
  return settable;
}

BattrExitCode ReconcileEncryption(Win32FileApi& api,
                                  const std::string& path,
                                  uint32_t desired,
                                  uint32_t current,
                                  std::string& errmsg)
{
  bool want_encrypted = (desired & win32::kFileAttributeEncrypted) != 0;
  bool is_encrypted = (current & win32::kFileAttributeEncrypted) != 0;

  if (want_encrypted == is_encrypted) { return BattrExitCode::kSuccess; }

  const char* what = want_encrypted ? "encrypt" : "decrypt";
  auto toggle = [&api, &path, want_encrypted]() {
    return want_encrypted ? api.Encrypt(path) : api.Decrypt(path);
  };

  OsResult result = toggle();
  if (result.code == OsResultCode::kAccessDenied) {
    // the system bit prevents this, clear it and try once more
    Dmsg2(100, "%s of %s denied, clearing system attribute\n", what,
          path.c_str());
    OsResult cleared = api.SetAttributes(
        path, SettableAttributes(current & ~win32::kFileAttributeSystem));
    if (!cleared.ok()) {
      Dmsg2(100, "clearing system attribute of %s failed: %s\n", path.c_str(),
            cleared.message.c_str());
    }
    result = toggle();
  }

  if (!result.ok()) {
    Mmsg(errmsg, T_("failed to %s file \"%s\": ERR=%s\n"), what, path.c_str(),
         result.message.c_str());
    Dmsg3(100, "failed to %s file %s: %s\n", what, path.c_str(),
          result.message.c_str());
    return BattrExitCode::kError;
  }

  return BattrExitCode::kSuccess;
}

BattrExitCode RestoreFileAttributes(Win32FileApi& api,
                                    const std::string& path,
                                    uint32_t desired,
                                    std::string& errmsg)
{
  std::vector<std::string> errors;
  uint32_t current = 0;

  OsResult result = api.GetAttributes(path, current);
  if (result.ok()) {
    std::string reconcile_errmsg;
    if (ReconcileEncryption(api, path, desired, current, reconcile_errmsg)
        != BattrExitCode::kSuccess) {
      errors.push_back(reconcile_errmsg);
    }
  } else {
    std::string msg;
    Mmsg(msg, T_("failed to get file attributes of \"%s\": ERR=%s\n"),
         path.c_str(), result.message.c_str());
    errors.push_back(msg);
  }

  result = api.SetAttributes(path, SettableAttributes(desired));
  if (!result.ok()) {
    std::string msg;
    Mmsg(msg, T_("failed to set file attributes of \"%s\": ERR=%s\n"),
         path.c_str(), result.message.c_str());
    errors.push_back(msg);
  }

  if (errors.empty()) { return BattrExitCode::kSuccess; }

  for (auto& msg : errors) {
    while (!msg.empty() && msg.back() == '\n') { msg.pop_back(); }
  }
  errmsg = JoinStrings(errors, "; ");
  Dmsg1(100, "%s\n", errmsg.c_str());
  return BattrExitCode::kError;
}

BattrExitCode RestoreCreationTime(Win32FileApi& api,
                                  const std::string& path,
                                  const Filetime& creation_time,
                                  std::string& errmsg)
{
  OsResult result = api.SetCreationTime(path, creation_time);

  if (!result.ok()) {
    Mmsg(errmsg, T_("failed to set creation time of \"%s\": ERR=%s\n"),
         path.c_str(), result.message.c_str());
    Dmsg2(100, "SetFileTime error file=%s ERR=%s\n", path.c_str(),
          result.message.c_str());
    return BattrExitCode::kError;
  }
  return BattrExitCode::kSuccess;
}

BattrExitCode RestoreWin32SymlinkTimestamps(Win32FileApi& api,
                                            const std::string& path,
                                            const Timespec& atime,
                                            const Timespec& mtime,
                                            std::string& errmsg)
{
  OsResult result = api.SetSymlinkTimes(path, FiletimeFromTimespec(atime),
                                        FiletimeFromTimespec(mtime));

  if (!result.ok()) {
    Mmsg(errmsg, T_("failed to set symlink times of \"%s\": ERR=%s\n"),
         path.c_str(), result.message.c_str());
    Dmsg2(100, "SetFileTime error file=%s ERR=%s\n", path.c_str(),
          result.message.c_str());
    return BattrExitCode::kError;
  }
  return BattrExitCode::kSuccess;
}

static bool IsWin32Separator(char c) { return c == '\\' || c == '/'; }

bool IsWin32PseudoPath(const std::string& path)
{
  std::string cleaned(path);

  while (cleaned.size() > 1 && IsWin32Separator(cleaned.back())) {
    cleaned.pop_back();
  }

  // \\server\share is the root of a network share
  if (cleaned.size() > 2 && IsWin32Separator(cleaned[0])
      && IsWin32Separator(cleaned[1]) && cleaned[2] != '?'
      && cleaned[2] != '.') {
    std::size_t server_end = cleaned.find_first_of("\\/", 2);
    if (server_end != std::string::npos
        && cleaned.find_first_of("\\/", server_end + 1) == std::string::npos) {
      return true;
    }
  }

  std::size_t last_separator = cleaned.find_last_of("\\/");
  std::string base = (last_separator == std::string::npos)
                         ? cleaned
                         : cleaned.substr(last_separator + 1);

  return base.find(':') != std::string::npos;
}

}  // namespace metakeep
