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
#include "findlib/os_result.h"
#include "lib/berrno.h"

#if !defined(ENOATTR)
#  define ENOATTR ENODATA
#endif

namespace metakeep {

const char* OsResultCodeToString(OsResultCode code)
{
  switch (code) {
    case OsResultCode::kOk:
      return "ok";
    case OsResultCode::kNotSupported:
      return "not supported";
    case OsResultCode::kNoData:
      return "no data";
    case OsResultCode::kInsufficientBuffer:
      return "insufficient buffer";
    case OsResultCode::kAccessDenied:
      return "access denied";
    default:
      return "error";
  }
}

OsResult OsResultFromErrno(int errnum)
{
  BErrNo be;
  OsResultCode code;

  switch (errnum) {
    case 0:
      return OsResult::Ok();
#if defined(ENOTSUP) && defined(EOPNOTSUPP) && (ENOTSUP != EOPNOTSUPP)
    case ENOTSUP:
#endif
    case EOPNOTSUPP:
      code = OsResultCode::kNotSupported;
      break;
#if defined(ENODATA) && (ENODATA != ENOATTR)
    case ENODATA:
#endif
    case ENOATTR:
      code = OsResultCode::kNoData;
      break;
    case ERANGE:
      code = OsResultCode::kInsufficientBuffer;
      break;
    case EACCES:
    case EPERM:
      code = OsResultCode::kAccessDenied;
      break;
    default:
      code = OsResultCode::kError;
      break;
  }

  return OsResult::Failed(code, static_cast<uint32_t>(errnum),
                          be.bstrerror(errnum));
}

OsResult OsResultFromWin32Error(uint32_t error)
{
  BErrNo be;
  OsResultCode code;

  switch (error) {
    case 0:
      return OsResult::Ok();
    case win32::kErrorNotSupported:
      code = OsResultCode::kNotSupported;
      break;
    case win32::kErrorInsufficientBuffer:
    case win32::kErrorMoreData:
      code = OsResultCode::kInsufficientBuffer;
      break;
    case win32::kErrorAccessDenied:
    case win32::kErrorPrivilegeNotHeld:
      code = OsResultCode::kAccessDenied;
      break;
    default:
      code = OsResultCode::kError;
      break;
  }

  return OsResult::Failed(code, error,
                          be.bstrerror(static_cast<int>(error) | b_errno_win32));
}

// Warning and error values have the high bit set, everything else is Ok.
OsResult OsResultFromNtStatus(uint32_t status)
{
  OsResultCode code;
  std::string message;

  if ((status & 0x80000000) == 0) { return OsResult::Ok(); }

  switch (status) {
    case win32::kStatusNoEasOnFile:
      code = OsResultCode::kNoData;
      break;
    case win32::kStatusBufferOverflow:
    case win32::kStatusBufferTooSmall:
      code = OsResultCode::kInsufficientBuffer;
      break;
    case win32::kStatusAccessDenied:
    case win32::kStatusPrivilegeNotHeld:
      code = OsResultCode::kAccessDenied;
      break;
    case win32::kStatusEasNotSupported:
    case win32::kStatusNotSupported:
      code = OsResultCode::kNotSupported;
      break;
    default:
      code = OsResultCode::kError;
      break;
  }

  Mmsg(message, "NTSTATUS 0x%08X", status);
  return OsResult::Failed(code, status, message);
}

}  // namespace metakeep
