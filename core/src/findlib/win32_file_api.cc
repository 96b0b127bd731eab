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
 * Win32 binding of the Win32FileApi, only built on Windows.
 */

#include "include/metakeep.h"
#include "findlib/win32_file_api.h"

#include <winternl.h>

namespace metakeep {

namespace {

struct handle_closer {
  std::string path;

  void operator()(HANDLE hndl) const
  {
    if (!CloseHandle(hndl)) {
      OsResult result = OsResultFromWin32Error(GetLastError());
      Dmsg2(100, "Error closing file handle for %s: %s\n", path.c_str(),
            result.message.c_str());
    }
  }
};

using handle_ptr = std::unique_ptr<void, handle_closer>;

using NtQueryEaFileFunc = NTSTATUS(NTAPI*)(HANDLE FileHandle,
                                           PIO_STATUS_BLOCK IoStatusBlock,
                                           PVOID Buffer,
                                           ULONG Length,
                                           BOOLEAN ReturnSingleEntry,
                                           PVOID EaList,
                                           ULONG EaListLength,
                                           PULONG EaIndex,
                                           BOOLEAN RestartScan);
using NtSetEaFileFunc = NTSTATUS(NTAPI*)(HANDLE FileHandle,
                                         PIO_STATUS_BLOCK IoStatusBlock,
                                         PVOID Buffer,
                                         ULONG Length);

template <typename F> F LookupNtdll(const char* name)
{
  HMODULE ntdll = GetModuleHandleW(L"ntdll.dll");
  if (!ntdll) { return nullptr; }
  return reinterpret_cast<F>(GetProcAddress(ntdll, name));
}

std::wstring Utf8ToWide(const std::string& utf8)
{
  if (utf8.empty()) { return {}; }

  int len = MultiByteToWideChar(CP_UTF8, 0, utf8.data(),
                                static_cast<int>(utf8.size()), nullptr, 0);
  if (len <= 0) { return {}; }

  std::wstring wide(len, L'\0');
  MultiByteToWideChar(CP_UTF8, 0, utf8.data(), static_cast<int>(utf8.size()),
                      wide.data(), len);
  return wide;
}

FILETIME ToFILETIME(const Filetime& ft)
{
  FILETIME result;
  result.dwLowDateTime = ft.low;
  result.dwHighDateTime = ft.high;
  return result;
}

Filetime FromFILETIME(const FILETIME& ft)
{
  return Filetime{ft.dwLowDateTime, ft.dwHighDateTime};
}

OsResult LastError() { return OsResultFromWin32Error(GetLastError()); }

class SystemWin32FileApi : public Win32FileApi {
 public:
  OsResult GetAttributeData(const std::string& path,
                            Win32FileAttributeData& data) override
  {
    WIN32_FILE_ATTRIBUTE_DATA info;

    if (!GetFileAttributesExW(MakeLongPath(path).c_str(), GetFileExInfoStandard,
                              &info)) {
      return LastError();
    }
    data.file_attributes = info.dwFileAttributes;
    data.creation_time = FromFILETIME(info.ftCreationTime);
    data.last_access_time = FromFILETIME(info.ftLastAccessTime);
    data.last_write_time = FromFILETIME(info.ftLastWriteTime);
    data.file_size_high = info.nFileSizeHigh;
    data.file_size_low = info.nFileSizeLow;
    return OsResult::Ok();
  }

  OsResult GetAttributes(const std::string& path, uint32_t& attributes) override
  {
    DWORD attrs = GetFileAttributesW(MakeLongPath(path).c_str());
    if (attrs == INVALID_FILE_ATTRIBUTES) { return LastError(); }
    attributes = attrs;
    return OsResult::Ok();
  }

  OsResult SetAttributes(const std::string& path, uint32_t attributes) override
  {
    if (!SetFileAttributesW(MakeLongPath(path).c_str(), attributes)) {
      return LastError();
    }
    return OsResult::Ok();
  }

  OsResult Encrypt(const std::string& path) override
  {
    if (!EncryptFileW(MakeLongPath(path).c_str())) { return LastError(); }
    return OsResult::Ok();
  }

  OsResult Decrypt(const std::string& path) override
  {
    if (!DecryptFileW(MakeLongPath(path).c_str(), 0)) { return LastError(); }
    return OsResult::Ok();
  }

  OsResult SetCreationTime(const std::string& path,
                           const Filetime& creation) override
  {
    handle_ptr hndl;
    if (OsResult result
        = Open(path, FILE_WRITE_ATTRIBUTES, FILE_FLAG_BACKUP_SEMANTICS, hndl);
        !result.ok()) {
      return result;
    }

    FILETIME ft = ToFILETIME(creation);
    if (!SetFileTime(hndl.get(), &ft, nullptr, nullptr)) { return LastError(); }
    return OsResult::Ok();
  }

  OsResult SetSymlinkTimes(const std::string& path,
                           const Filetime& access,
                           const Filetime& write) override
  {
    handle_ptr hndl;
    if (OsResult result
        = Open(path, FILE_WRITE_ATTRIBUTES,
               FILE_FLAG_BACKUP_SEMANTICS | FILE_FLAG_OPEN_REPARSE_POINT, hndl);
        !result.ok()) {
      return result;
    }

    FILETIME a = ToFILETIME(access);
    FILETIME w = ToFILETIME(write);
    if (!SetFileTime(hndl.get(), nullptr, &a, &w)) { return LastError(); }
    return OsResult::Ok();
  }

  OsResult GetSecurity(const std::string& path,
                       uint32_t information,
                       std::vector<char>& descriptor) override
  {
    std::wstring wpath = MakeLongPath(path);
    DWORD needed = 0;

    descriptor.assign(512, 0);
    while (!GetFileSecurityW(
        wpath.c_str(), information,
        reinterpret_cast<PSECURITY_DESCRIPTOR>(descriptor.data()),
        static_cast<DWORD>(descriptor.size()), &needed)) {
      DWORD error = GetLastError();
      if (error != ERROR_INSUFFICIENT_BUFFER || needed <= descriptor.size()) {
        descriptor.clear();
        return OsResultFromWin32Error(error);
      }
      descriptor.assign(needed, 0);
    }
    descriptor.resize(GetSecurityDescriptorLength(
        reinterpret_cast<PSECURITY_DESCRIPTOR>(descriptor.data())));
    return OsResult::Ok();
  }

  OsResult SetSecurity(const std::string& path,
                       uint32_t information,
                       const std::vector<char>& descriptor) override
  {
    std::vector<char> sd(descriptor);

    if (!IsValidSecurityDescriptor(
            reinterpret_cast<PSECURITY_DESCRIPTOR>(sd.data()))) {
      return OsResultFromWin32Error(ERROR_INVALID_SECURITY_DESCR);
    }
    if (!SetFileSecurityW(MakeLongPath(path).c_str(), information,
                          reinterpret_cast<PSECURITY_DESCRIPTOR>(sd.data()))) {
      return LastError();
    }
    return OsResult::Ok();
  }

  OsResult QueryEa(const std::string& path,
                   std::vector<char>& buffer,
                   std::size_t& written) override
  {
    static const auto query
        = LookupNtdll<NtQueryEaFileFunc>("NtQueryEaFile");
    if (!query) { return OsResultFromWin32Error(ERROR_NOT_SUPPORTED); }

    handle_ptr hndl;
    if (OsResult result = Open(path, FILE_READ_EA, FILE_FLAG_BACKUP_SEMANTICS,
                               hndl);
        !result.ok()) {
      return result;
    }

    IO_STATUS_BLOCK iosb{};
    NTSTATUS status = query(hndl.get(), &iosb, buffer.data(),
                            static_cast<ULONG>(buffer.size()), FALSE, nullptr,
                            0, nullptr, TRUE);
    written = static_cast<std::size_t>(iosb.Information);
    return OsResultFromNtStatus(static_cast<uint32_t>(status));
  }

  OsResult SetEa(const std::string& path,
                 const std::vector<char>& buffer) override
  {
    static const auto set = LookupNtdll<NtSetEaFileFunc>("NtSetEaFile");
    if (!set) { return OsResultFromWin32Error(ERROR_NOT_SUPPORTED); }

    handle_ptr hndl;
    if (OsResult result = Open(path, FILE_WRITE_EA, FILE_FLAG_BACKUP_SEMANTICS,
                               hndl);
        !result.ok()) {
      return result;
    }

    std::vector<char> copy(buffer);
    IO_STATUS_BLOCK iosb{};
    NTSTATUS status = set(hndl.get(), &iosb, copy.data(),
                          static_cast<ULONG>(copy.size()));
    return OsResultFromNtStatus(static_cast<uint32_t>(status));
  }

 private:
  static OsResult Open(const std::string& path,
                       DWORD access,
                       DWORD flags,
                       handle_ptr& hndl)
  {
    HANDLE h = CreateFileW(MakeLongPath(path).c_str(), access,
                           FILE_SHARE_READ | FILE_SHARE_WRITE, nullptr,
                           OPEN_EXISTING, flags, nullptr);
    if (h == INVALID_HANDLE_VALUE) { return LastError(); }
    hndl = handle_ptr{h, handle_closer{path}};
    return OsResult::Ok();
  }
};

}  // namespace

std::wstring MakeLongPath(const std::string& utf8_path)
{
  std::string path(utf8_path);

  for (auto& c : path) {
    if (c == '/') { c = '\\'; }
  }

  if (path.rfind("\\\\?\\", 0) == 0) { return Utf8ToWide(path); }
  if (path.rfind("\\\\", 0) == 0) {
    return L"\\\\?\\UNC\\" + Utf8ToWide(path.substr(2));
  }
  if (path.size() >= 2 && path[1] == ':') {
    return L"\\\\?\\" + Utf8ToWide(path);
  }
  // relative paths can not take the prefix
  return Utf8ToWide(path);
}

std::unique_ptr<Win32FileApi> CreateSystemWin32FileApi()
{
  return std::make_unique<SystemWin32FileApi>();
}

}  // namespace metakeep
