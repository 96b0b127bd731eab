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
#include "findlib/stat_view.h"
#include "findlib/win32_file_api.h"
#include "lib/berrno.h"

#include <fcntl.h>

namespace metakeep {

static constexpr int64_t kNsecPerSec = 1000000000;
static constexpr int64_t kNsecPerTick = 100;
static constexpr int64_t kTicksPerSec = kNsecPerSec / kNsecPerTick;

Timespec TimespecFromNarrowNsec(int64_t sec, int32_t nsec)
{
  return Timespec{sec, static_cast<int64_t>(nsec)};
}

// Floor division so times before 1970 still get nsec in [0, 1e9).
Timespec TimespecFromFiletime(const Filetime& ft)
{
  int64_t ticks = static_cast<int64_t>(ft.ticks()) - kFiletimeUnixEpochOffset;
  int64_t sec = ticks / kTicksPerSec;
  int64_t rem = ticks % kTicksPerSec;

  if (rem < 0) {
    rem += kTicksPerSec;
    sec -= 1;
  }
  return Timespec{sec, rem * kNsecPerTick};
}

Filetime FiletimeFromTimespec(const Timespec& ts)
{
  int64_t ticks = ts.sec * kTicksPerSec + ts.nsec / kNsecPerTick
                  + kFiletimeUnixEpochOffset;
  if (ticks < 0) { ticks = 0; }

  uint64_t u = static_cast<uint64_t>(ticks);
  return Filetime{static_cast<uint32_t>(u & 0xffffffff),
                  static_cast<uint32_t>(u >> 32)};
}

#if defined(HAVE_DARWIN_OS) || defined(HAVE_NETBSD_OS) \
    || defined(HAVE_OPENBSD_OS)
static Timespec ToTimespec(const struct timespec& ts)
{
  return Timespec{static_cast<int64_t>(ts.tv_sec),
                  static_cast<int64_t>(ts.tv_nsec)};
}
#  define STAT_ATIM(st) ToTimespec((st).st_atimespec)
#  define STAT_MTIM(st) ToTimespec((st).st_mtimespec)
#  define STAT_CTIM(st) ToTimespec((st).st_ctimespec)
#elif defined(HAVE_AIX_OS)
// AIX keeps the nanoseconds in a 32 bit field
#  define STAT_ATIM(st) \
    TimespecFromNarrowNsec((st).st_atim.tv_sec, (st).st_atim.tv_nsec)
#  define STAT_MTIM(st) \
    TimespecFromNarrowNsec((st).st_mtim.tv_sec, (st).st_mtim.tv_nsec)
#  define STAT_CTIM(st) \
    TimespecFromNarrowNsec((st).st_ctim.tv_sec, (st).st_ctim.tv_nsec)
#elif defined(HAVE_WIN32)
#  define STAT_ATIM(st) Timespec{static_cast<int64_t>((st).st_atime), 0}
#  define STAT_MTIM(st) Timespec{static_cast<int64_t>((st).st_mtime), 0}
#  define STAT_CTIM(st) Timespec{static_cast<int64_t>((st).st_mtime), 0}
#else
static Timespec ToTimespec(const struct timespec& ts)
{
  return Timespec{static_cast<int64_t>(ts.tv_sec),
                  static_cast<int64_t>(ts.tv_nsec)};
}
#  define STAT_ATIM(st) ToTimespec((st).st_atim)
#  define STAT_MTIM(st) ToTimespec((st).st_mtim)
#  define STAT_CTIM(st) ToTimespec((st).st_ctim)
#endif

StatView StatViewFromStat(const struct stat& st)
{
  StatView view;

  view.dev = static_cast<uint64_t>(st.st_dev);
  view.ino = static_cast<uint64_t>(st.st_ino);
  view.nlink = static_cast<uint64_t>(st.st_nlink);
  view.uid = static_cast<uint32_t>(st.st_uid);
  view.gid = static_cast<uint32_t>(st.st_gid);
  view.rdev = static_cast<uint64_t>(st.st_rdev);
  view.size = static_cast<int64_t>(st.st_size);
  view.mode = static_cast<uint32_t>(st.st_mode);
  view.atim = STAT_ATIM(st);
  view.mtim = STAT_MTIM(st);
  view.ctim = STAT_CTIM(st);

  return view;
}

/*
 * Windows has no change time in the unix sense, ctim is the last write
 * time. Device, inode, link count and owner are not available.
 */
StatView StatViewFromWin32AttributeData(const Win32FileAttributeData& data)
{
  StatView view;

  view.size = static_cast<int64_t>((uint64_t{data.file_size_high} << 32)
                                   | data.file_size_low);
  view.atim = TimespecFromFiletime(data.last_access_time);
  view.mtim = TimespecFromFiletime(data.last_write_time);
  view.ctim = view.mtim;
  view.has_win32_data = true;
  view.file_attributes = data.file_attributes;
  view.creation_time = data.creation_time;

  return view;
}

void FillNodeFromStatView(const std::string& name,
                          const StatView& view,
                          Node& node)
{
  node.name = name;
  node.mode = view.mode;
  node.atime = view.atim;
  node.mtime = view.mtim;
  node.ctime = view.ctim;

  if (view.has_win32_data && view.mode == 0) {
    if (view.file_attributes & win32::kFileAttributeReparsePoint) {
      node.type = NodeType::kSymlink;
    } else if (view.file_attributes & win32::kFileAttributeDirectory) {
      node.type = NodeType::kDir;
    } else {
      node.type = NodeType::kFile;
    }
  } else {
    node.type = NodeTypeFromMode(view.mode);
  }
}

BattrExitCode PosixRestoreSymlinkTimestamps(const std::string& path,
                                            const Timespec& atime,
                                            const Timespec& mtime,
                                            std::string& errmsg)
{
#if defined(HAVE_UTIMENSAT) && !defined(HAVE_WIN32)
  struct timespec times[2];

  times[0].tv_sec = static_cast<time_t>(atime.sec);
  times[0].tv_nsec = static_cast<long>(atime.nsec);
  times[1].tv_sec = static_cast<time_t>(mtime.sec);
  times[1].tv_nsec = static_cast<long>(mtime.nsec);

  if (utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
    BErrNo be;

    Mmsg(errmsg, T_("utimensat error on file \"%s\": ERR=%s\n"), path.c_str(),
         be.bstrerror());
    Dmsg2(100, "utimensat error file=%s ERR=%s\n", path.c_str(),
          be.bstrerror());
    return BattrExitCode::kError;
  }
#else
  (void)path;
  (void)atime;
  (void)mtime;
  (void)errmsg;
  Dmsg0(200, "Symlink timestamps can not be restored on this platform\n");
#endif
  return BattrExitCode::kSuccess;
}

}  // namespace metakeep
