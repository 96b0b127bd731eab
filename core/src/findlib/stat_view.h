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
 * Cross platform view on the native stat information of a file.
 *
 * Every platform converts its own representation, the conversions are pure
 * and can not fail.
 */

#ifndef METAKEEP_FINDLIB_STAT_VIEW_H_
#define METAKEEP_FINDLIB_STAT_VIEW_H_

#include "findlib/node.h"
#include "findlib/os_result.h"

#include <cstdint>
#include <string>

struct stat;

namespace metakeep {

// 100 nanosecond ticks since 1601-01-01, split into two dwords.
struct Filetime {
  uint32_t low{0};
  uint32_t high{0};

  uint64_t ticks() const { return (uint64_t{high} << 32) | low; }
  bool operator==(const Filetime& other) const
  {
    return low == other.low && high == other.high;
  }
};

// Ticks between 1601-01-01 and 1970-01-01.
inline constexpr int64_t kFiletimeUnixEpochOffset = 116444736000000000LL;

// Portable copy of WIN32_FILE_ATTRIBUTE_DATA.
struct Win32FileAttributeData {
  uint32_t file_attributes{0};
  Filetime creation_time;
  Filetime last_access_time;
  Filetime last_write_time;
  uint32_t file_size_high{0};
  uint32_t file_size_low{0};
};

struct StatView {
  uint64_t dev{0};
  uint64_t ino{0};
  uint64_t nlink{0};
  uint32_t uid{0};
  uint32_t gid{0};
  uint64_t rdev{0};
  int64_t size{0};
  uint32_t mode{0};
  Timespec atim;
  Timespec mtim;
  Timespec ctim;

  // Only filled on Windows
  bool has_win32_data{false};
  uint32_t file_attributes{0};
  Filetime creation_time;
};

Timespec TimespecFromNarrowNsec(int64_t sec, int32_t nsec);
Timespec TimespecFromFiletime(const Filetime& ft);
Filetime FiletimeFromTimespec(const Timespec& ts);

StatView StatViewFromStat(const struct stat& st);
StatView StatViewFromWin32AttributeData(const Win32FileAttributeData& data);

// Name, type, mode and the three timestamps of node.
void FillNodeFromStatView(const std::string& name,
                          const StatView& view,
                          Node& node);

/*
 * Set access and modification time of a symlink itself using
 * utimensat(AT_SYMLINK_NOFOLLOW). A no-op on platforms that can not do this.
 */
BattrExitCode PosixRestoreSymlinkTimestamps(const std::string& path,
                                            const Timespec& atime,
                                            const Timespec& mtime,
                                            std::string& errmsg);

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_STAT_VIEW_H_
