/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2004-2010 Free Software Foundation Europe e.V.
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
 * Kern Sibbald, July MMIV
 */
/**
 * @file
 * BErrNo header file
 */

#ifndef METAKEEP_LIB_BERRNO_H_
#define METAKEEP_LIB_BERRNO_H_

#include <cerrno>
#include <string>

/**
 * Extra bit set to interpret the errno value as a Win32 error code
 */
#define b_errno_win32 (1 << 29) /* user reserved bit */

/**
 * A more generalized way of handling errno that works with Unix and Windows.
 *
 * It works by picking up errno and creating a string buffer
 *  for editing the message. strerror_r() does the actual editing, and
 *  it is thread safe.
 *
 * If bit 29 in berrno_ is set then it is a Win32 error code (as returned by
 *  GetLastError()) and is formatted with FormatMessage on Windows.
 * If bit 29 in berrno_ is not set, then it is a Unix errno.
 */
class BErrNo {
  std::string buf_;
  int berrno_;
  void FormatWin32Message();

 public:
  BErrNo();
  const char* bstrerror();
  const char* bstrerror(int errnum);
  void SetErrno(int errnum) { berrno_ = errnum; }
  int code() const { return berrno_ & ~b_errno_win32; }
};

/* Constructor */
inline BErrNo::BErrNo()
{
  berrno_ = errno;
  errno = berrno_;
}

inline const char* BErrNo::bstrerror(int errnum)
{
  berrno_ = errnum;
  return BErrNo::bstrerror();
}

#endif  // METAKEEP_LIB_BERRNO_H_
