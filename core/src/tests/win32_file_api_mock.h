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
 * Mock and in memory fake of the Win32 file primitives
 */

#ifndef METAKEEP_TESTS_WIN32_FILE_API_MOCK_H_
#define METAKEEP_TESTS_WIN32_FILE_API_MOCK_H_

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "findlib/ea_codec.h"
#include "findlib/win32_file_api.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <vector>

#ifdef __GNUC__
#  ifndef __clang__
/* ignore the suggest-override warnings caused by MOCK_METHODx */
#    pragma GCC diagnostic push
#    pragma GCC diagnostic ignored "-Wsuggest-override"
#  endif
#endif

class Win32FileApiMock : public metakeep::Win32FileApi {
 public:
  MOCK_METHOD2(GetAttributeData,
               metakeep::OsResult(const std::string&,
                                  metakeep::Win32FileAttributeData&));
  MOCK_METHOD2(GetAttributes, metakeep::OsResult(const std::string&, uint32_t&));
  MOCK_METHOD2(SetAttributes, metakeep::OsResult(const std::string&, uint32_t));
  MOCK_METHOD1(Encrypt, metakeep::OsResult(const std::string&));
  MOCK_METHOD1(Decrypt, metakeep::OsResult(const std::string&));
  MOCK_METHOD2(SetCreationTime,
               metakeep::OsResult(const std::string&,
                                  const metakeep::Filetime&));
  MOCK_METHOD3(SetSymlinkTimes,
               metakeep::OsResult(const std::string&,
                                  const metakeep::Filetime&,
                                  const metakeep::Filetime&));
  MOCK_METHOD3(GetSecurity,
               metakeep::OsResult(const std::string&,
                                  uint32_t,
                                  std::vector<char>&));
  MOCK_METHOD3(SetSecurity,
               metakeep::OsResult(const std::string&,
                                  uint32_t,
                                  const std::vector<char>&));
  MOCK_METHOD3(QueryEa,
               metakeep::OsResult(const std::string&,
                                  std::vector<char>&,
                                  std::size_t&));
  MOCK_METHOD2(SetEa,
               metakeep::OsResult(const std::string&,
                                  const std::vector<char>&));
};

#ifdef __GNUC__
#  ifndef __clang__
#    pragma GCC diagnostic pop
#  endif
#endif

/*
 * Keeps the state of a few files in memory and behaves like NTFS where it
 * matters: EncryptFile and DecryptFile refuse system files, EA names are
 * upper cased, reading the SACL and writing the owner need privileges.
 */
class FakeWin32FileApi : public metakeep::Win32FileApi {
 public:
  struct File {
    uint32_t attributes{metakeep::win32::kFileAttributeArchive};
    metakeep::Filetime creation_time;
    metakeep::Filetime access_time;
    metakeep::Filetime write_time;
    std::vector<char> descriptor;
    uint32_t descriptor_information{0};
    std::vector<metakeep::EaEntry> eas;
  };

  std::map<std::string, File> files;
  bool sacl_privilege{true};
  bool owner_privilege{true};
  bool eas_supported{true};

  File& Add(const std::string& path) { return files[path]; }

  metakeep::OsResult GetAttributeData(
      const std::string& path,
      metakeep::Win32FileAttributeData& data) override
  {
    File* file = Lookup(path);
    if (!file) { return NotFound(); }
    data.file_attributes = ReportedAttributes(*file);
    data.creation_time = file->creation_time;
    data.last_access_time = file->access_time;
    data.last_write_time = file->write_time;
    return metakeep::OsResult::Ok();
  }

  metakeep::OsResult GetAttributes(const std::string& path,
                                   uint32_t& attributes) override
  {
    File* file = Lookup(path);
    if (!file) { return NotFound(); }
    attributes = ReportedAttributes(*file);
    return metakeep::OsResult::Ok();
  }

  metakeep::OsResult SetAttributes(const std::string& path,
                                   uint32_t attributes) override
  {
    using namespace metakeep::win32;
    File* file = Lookup(path);
    if (!file) { return NotFound(); }
    if (attributes & ~kSettableFileAttributes) {
      return metakeep::OsResultFromWin32Error(kErrorInvalidParameter);
    }
    if (attributes == kFileAttributeNormal) { attributes = 0; }
    file->attributes
        = (file->attributes & ~kSettableFileAttributes) | attributes;
    return metakeep::OsResult::Ok();
  }

  metakeep::OsResult Encrypt(const std::string& path) override
  {
    return SetEncrypted(path, true);
  }

  metakeep::OsResult Decrypt(const std::string& path) override
  {
    return SetEncrypted(path, false);
  }

  metakeep::OsResult SetCreationTime(
      const std::string& path,
      const metakeep::Filetime& creation) override
  {
    File* file = Lookup(path);
    if (!file) { return NotFound(); }
    file->creation_time = creation;
    return metakeep::OsResult::Ok();
  }

  metakeep::OsResult SetSymlinkTimes(const std::string& path,
                                     const metakeep::Filetime& access,
                                     const metakeep::Filetime& write) override
  {
    File* file = Lookup(path);
    if (!file) { return NotFound(); }
    file->access_time = access;
    file->write_time = write;
    return metakeep::OsResult::Ok();
  }

  metakeep::OsResult GetSecurity(const std::string& path,
                                 uint32_t information,
                                 std::vector<char>& descriptor) override
  {
    File* file = Lookup(path);
    if (!file) { return NotFound(); }
    if ((information & metakeep::win32::kSaclSecurityInformation)
        && !sacl_privilege) {
      return metakeep::OsResultFromWin32Error(
          metakeep::win32::kErrorPrivilegeNotHeld);
    }
    descriptor = file->descriptor;
    return metakeep::OsResult::Ok();
  }

  metakeep::OsResult SetSecurity(const std::string& path,
                                 uint32_t information,
                                 const std::vector<char>& descriptor) override
  {
    File* file = Lookup(path);
    if (!file) { return NotFound(); }
    if ((information & metakeep::win32::kOwnerSecurityInformation)
        && !owner_privilege) {
      return metakeep::OsResultFromWin32Error(
          metakeep::win32::kErrorAccessDenied);
    }
    file->descriptor = descriptor;
    file->descriptor_information = information;
    return metakeep::OsResult::Ok();
  }

  metakeep::OsResult QueryEa(const std::string& path,
                             std::vector<char>& buffer,
                             std::size_t& written) override
  {
    File* file = Lookup(path);
    if (!file) { return NotFound(); }
    if (!eas_supported) {
      return metakeep::OsResultFromNtStatus(
          metakeep::win32::kStatusEasNotSupported);
    }
    if (file->eas.empty()) {
      return metakeep::OsResultFromNtStatus(
          metakeep::win32::kStatusNoEasOnFile);
    }

    std::vector<char> encoded;
    metakeep::EncodeExtendedAttributes(file->eas, encoded);
    if (encoded.size() > buffer.size()) {
      return metakeep::OsResultFromNtStatus(
          metakeep::win32::kStatusBufferOverflow);
    }
    std::copy(encoded.begin(), encoded.end(), buffer.begin());
    written = encoded.size();
    return metakeep::OsResult::Ok();
  }

  metakeep::OsResult SetEa(const std::string& path,
                           const std::vector<char>& buffer) override
  {
    File* file = Lookup(path);
    if (!file) { return NotFound(); }
    if (!eas_supported) {
      return metakeep::OsResultFromNtStatus(
          metakeep::win32::kStatusEasNotSupported);
    }

    std::vector<metakeep::EaEntry> entries;
    if (metakeep::DecodeExtendedAttributes(buffer.data(), buffer.size(),
                                           entries)
        != metakeep::EaCodecError::kOk) {
      return metakeep::OsResultFromNtStatus(0xC000000D);
    }

    for (auto& entry : entries) {
      std::transform(entry.name.begin(), entry.name.end(), entry.name.begin(),
                     [](unsigned char c) { return std::toupper(c); });
      auto it = std::find_if(file->eas.begin(), file->eas.end(),
                             [&entry](const metakeep::EaEntry& existing) {
                               return existing.name == entry.name;
                             });
      if (it != file->eas.end()) { file->eas.erase(it); }
      // an empty value removes the EA
      if (!entry.value.empty()) { file->eas.push_back(std::move(entry)); }
    }
    return metakeep::OsResult::Ok();
  }

 private:
  File* Lookup(const std::string& path)
  {
    auto it = files.find(path);
    return it == files.end() ? nullptr : &it->second;
  }

  static metakeep::OsResult NotFound()
  {
    return metakeep::OsResultFromWin32Error(
        metakeep::win32::kErrorFileNotFound);
  }

  static uint32_t ReportedAttributes(const File& file)
  {
    return file.attributes ? file.attributes
                           : metakeep::win32::kFileAttributeNormal;
  }

  metakeep::OsResult SetEncrypted(const std::string& path, bool encrypted)
  {
    using namespace metakeep::win32;
    File* file = Lookup(path);
    if (!file) { return NotFound(); }
    if (file->attributes & (kFileAttributeSystem | kFileAttributeReadonly)) {
      return metakeep::OsResultFromWin32Error(kErrorAccessDenied);
    }
    if (encrypted) {
      file->attributes |= kFileAttributeEncrypted;
    } else {
      file->attributes &= ~kFileAttributeEncrypted;
    }
    return metakeep::OsResult::Ok();
  }
};

#endif  // METAKEEP_TESTS_WIN32_FILE_API_MOCK_H_
