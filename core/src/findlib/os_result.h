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
 * Normalized results of operating system calls.
 */

#ifndef METAKEEP_FINDLIB_OS_RESULT_H_
#define METAKEEP_FINDLIB_OS_RESULT_H_

#include <cstdint>
#include <string>

namespace metakeep {

// Return codes from the attribute subroutines.
enum class BattrExitCode
{
  kError,
  kWarning,
  kSuccess
};

enum class OsResultCode
{
  kOk,
  kNotSupported,
  kNoData,
  kInsufficientBuffer,
  kAccessDenied,
  kError
};

const char* OsResultCodeToString(OsResultCode code);

/*
 * The outcome of one OS call. native_error holds the errno, the Win32 error
 * code or the NTSTATUS the call failed with.
 */
struct OsResult {
  OsResultCode code{OsResultCode::kOk};
  uint32_t native_error{0};
  std::string message;

  bool ok() const { return code == OsResultCode::kOk; }

  static OsResult Ok() { return OsResult{}; }
  static OsResult Failed(OsResultCode t_code,
                         uint32_t t_native_error,
                         std::string t_message)
  {
    return OsResult{t_code, t_native_error, std::move(t_message)};
  }
};

OsResult OsResultFromErrno(int errnum);
OsResult OsResultFromWin32Error(uint32_t error);
OsResult OsResultFromNtStatus(uint32_t status);

namespace win32 {
// Win32 error codes
inline constexpr uint32_t kErrorFileNotFound = 2;
inline constexpr uint32_t kErrorAccessDenied = 5;
inline constexpr uint32_t kErrorNotSupported = 50;
inline constexpr uint32_t kErrorInvalidParameter = 87;
inline constexpr uint32_t kErrorInsufficientBuffer = 122;
inline constexpr uint32_t kErrorMoreData = 234;
inline constexpr uint32_t kErrorPrivilegeNotHeld = 1314;

// NTSTATUS values
inline constexpr uint32_t kStatusSuccess = 0x00000000;
inline constexpr uint32_t kStatusBufferOverflow = 0x80000005;
inline constexpr uint32_t kStatusBufferTooSmall = 0xC0000023;
inline constexpr uint32_t kStatusAccessDenied = 0xC0000022;
inline constexpr uint32_t kStatusEasNotSupported = 0xC000004F;
inline constexpr uint32_t kStatusNoEasOnFile = 0xC0000052;
inline constexpr uint32_t kStatusNotSupported = 0xC00000BB;
inline constexpr uint32_t kStatusPrivilegeNotHeld = 0xC0000061;
}  // namespace win32

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_OS_RESULT_H_
