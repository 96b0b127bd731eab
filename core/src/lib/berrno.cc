/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2004-2011 Free Software Foundation Europe e.V.
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
// Kern Sibbald, July MMIV
/**
 * @file
 * metakeep errno handler
 *
 * BErrNo is a simplistic errno handler that works for
 * Unix and Win32.
 *
 * See berrno.h for how to use BErrNo.
 */

#include "include/metakeep.h"
#include "lib/berrno.h"

#include <cctype>

namespace {
// strerror_r comes in two flavours, pick the result of either one.
[[maybe_unused]] const char* StrerrorResult(int rc, const char* buf)
{
  return rc == 0 ? buf : nullptr;
}
[[maybe_unused]] const char* StrerrorResult(const char* msg, const char*)
{
  return msg;
}
}  // namespace

const char* BErrNo::bstrerror()
{
  buf_.clear();

  if (berrno_ & b_errno_win32) {
    FormatWin32Message();
    return buf_.c_str();
  }

  char msgbuf[1024];
#ifdef HAVE_WIN32
  const char* msg = (strerror_s(msgbuf, sizeof(msgbuf), berrno_) == 0)
                        ? msgbuf
                        : nullptr;
#else
  const char* msg
      = StrerrorResult(strerror_r(berrno_, msgbuf, sizeof(msgbuf)), msgbuf);
#endif
  if (!msg) { return T_("Invalid errno. No error message possible."); }

  buf_.assign(msg);
  return buf_.c_str();
}

void BErrNo::FormatWin32Message()
{
  int windows_error_code = berrno_ & ~b_errno_win32;

#ifdef HAVE_WIN32
  char* msg = nullptr;

  if (auto len = FormatMessageA(
          FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM
              | FORMAT_MESSAGE_IGNORE_INSERTS,
          NULL, windows_error_code, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
          (LPSTR)&msg, 0, NULL);
      len != 0) {
    // the formated message often ends in .\r\n
    // we want to trim this since our own error messages already append
    // '.\n' to the end.
    while (len > 0 && isspace(msg[len - 1])) { len -= 1; }

    if (len > 0 && msg[len - 1] == '.') { len -= 1; }

    msg[len] = '\0';

    Mmsg(buf_, "%s (0x%08X)", msg, windows_error_code);
  } else {
    Mmsg(buf_, "Unknown windows error (0x%08X)", windows_error_code);
  }
  if (msg) { LocalFree(msg); }
#else
  Mmsg(buf_, "Windows error (0x%08X)", windows_error_code);
#endif
}
