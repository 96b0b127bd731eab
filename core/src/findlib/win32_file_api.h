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
 * The Win32 file primitives the Windows metadata handling is built on.
 *
 * The interface only uses portable types, so everything above it compiles
 * and is tested on all platforms. The real binding only exists on Windows.
 */

#ifndef METAKEEP_FINDLIB_WIN32_FILE_API_H_
#define METAKEEP_FINDLIB_WIN32_FILE_API_H_

#include "include/config.h"
#include "findlib/os_result.h"
#include "findlib/stat_view.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace metakeep {

namespace win32 {
// File attribute bits
inline constexpr uint32_t kFileAttributeReadonly = 0x00000001;
inline constexpr uint32_t kFileAttributeHidden = 0x00000002;
inline constexpr uint32_t kFileAttributeSystem = 0x00000004;
inline constexpr uint32_t kFileAttributeDirectory = 0x00000010;
inline constexpr uint32_t kFileAttributeArchive = 0x00000020;
inline constexpr uint32_t kFileAttributeNormal = 0x00000080;
inline constexpr uint32_t kFileAttributeTemporary = 0x00000100;
inline constexpr uint32_t kFileAttributeSparseFile = 0x00000200;
inline constexpr uint32_t kFileAttributeReparsePoint = 0x00000400;
inline constexpr uint32_t kFileAttributeCompressed = 0x00000800;
inline constexpr uint32_t kFileAttributeOffline = 0x00001000;
inline constexpr uint32_t kFileAttributeNotContentIndexed = 0x00002000;
inline constexpr uint32_t kFileAttributeEncrypted = 0x00004000;

// The bits SetFileAttributes accepts, everything else is owned by the OS.
inline constexpr uint32_t kSettableFileAttributes
    = kFileAttributeReadonly | kFileAttributeHidden | kFileAttributeSystem
      | kFileAttributeArchive | kFileAttributeNormal | kFileAttributeTemporary
      | kFileAttributeOffline | kFileAttributeNotContentIndexed;

// SECURITY_INFORMATION bits
inline constexpr uint32_t kOwnerSecurityInformation = 0x00000001;
inline constexpr uint32_t kGroupSecurityInformation = 0x00000002;
inline constexpr uint32_t kDaclSecurityInformation = 0x00000004;
inline constexpr uint32_t kSaclSecurityInformation = 0x00000008;
}  // namespace win32

class Win32FileApi {
 public:
  virtual ~Win32FileApi() = default;

  virtual OsResult GetAttributeData(const std::string& path,
                                    Win32FileAttributeData& data)
      = 0;
  virtual OsResult GetAttributes(const std::string& path, uint32_t& attributes)
      = 0;
  virtual OsResult SetAttributes(const std::string& path, uint32_t attributes)
      = 0;

  virtual OsResult Encrypt(const std::string& path) = 0;
  virtual OsResult Decrypt(const std::string& path) = 0;

  // Only the creation time, access and write time are left alone.
  virtual OsResult SetCreationTime(const std::string& path,
                                   const Filetime& creation)
      = 0;
  // Opens the link itself, not its target.
  virtual OsResult SetSymlinkTimes(const std::string& path,
                                   const Filetime& access,
                                   const Filetime& write)
      = 0;

  // Self relative security descriptor, information is a SECURITY_INFORMATION.
  virtual OsResult GetSecurity(const std::string& path,
                               uint32_t information,
                               std::vector<char>& descriptor)
      = 0;
  virtual OsResult SetSecurity(const std::string& path,
                               uint32_t information,
                               const std::vector<char>& descriptor)
      = 0;

  // One NtQueryEaFile call into buffer, NTSTATUS mapped with
  // OsResultFromNtStatus.
  virtual OsResult QueryEa(const std::string& path,
                           std::vector<char>& buffer,
                           std::size_t& written)
      = 0;
  virtual OsResult SetEa(const std::string& path,
                         const std::vector<char>& buffer)
      = 0;
};

#if defined(HAVE_WIN32)
std::unique_ptr<Win32FileApi> CreateSystemWin32FileApi();

// "C:\foo" becomes "\\?\C:\foo", "\\server\share" becomes
// "\\?\UNC\server\share".
std::wstring MakeLongPath(const std::string& utf8_path);
#endif

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_WIN32_FILE_API_H_
