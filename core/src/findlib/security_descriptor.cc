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
/**
 * @file
 * Windows security descriptors, stored opaque and base64 encoded.
 */

#include "include/metakeep.h"
#include "findlib/security_descriptor.h"
#include "lib/base64.h"

#include <string_view>

namespace metakeep {

static constexpr uint32_t kFullSecurityInformation
    = win32::kOwnerSecurityInformation | win32::kGroupSecurityInformation
      | win32::kDaclSecurityInformation | win32::kSaclSecurityInformation;

static constexpr uint32_t kNoSaclSecurityInformation
    = kFullSecurityInformation & ~win32::kSaclSecurityInformation;

BattrExitCode GetSecurityDescriptorAttribute(Win32FileApi& api,
                                             const std::string& path,
                                             GenericAttribute& attribute,
                                             std::string& errmsg)
{
  std::vector<char> descriptor;
  std::string encoded;

  OsResult result = api.GetSecurity(path, kFullSecurityInformation, descriptor);
  if (result.code == OsResultCode::kAccessDenied) {
    Dmsg1(100, "no privilege to read the SACL of %s, retrying without it\n",
          path.c_str());
    descriptor.clear();
    result = api.GetSecurity(path, kNoSaclSecurityInformation, descriptor);
  }

  if (!result.ok()) {
    Mmsg(errmsg, T_("failed to get security descriptor of \"%s\": ERR=%s\n"),
         path.c_str(), result.message.c_str());
    Dmsg2(100, "GetFileSecurity error file=%s ERR=%s\n", path.c_str(),
          result.message.c_str());
    return BattrExitCode::kError;
  }

  encoded = BinToBase64(descriptor.data(), descriptor.size());
  attribute.type = generic_attribute_type::kSecurityDescriptor;
  attribute.value.assign(encoded.begin(), encoded.end());
  return BattrExitCode::kSuccess;
}

BattrExitCode RestoreSecurityDescriptor(Win32FileApi& api,
                                        const std::string& path,
                                        const std::vector<char>& value,
                                        std::string& errmsg)
{
  std::vector<char> descriptor;

  if (!Base64ToBin(std::string_view(value.data(), value.size()), descriptor)
      || descriptor.empty()) {
    Mmsg(errmsg, T_("invalid security descriptor encoding for \"%s\"\n"),
         path.c_str());
    return BattrExitCode::kError;
  }

  OsResult result = api.SetSecurity(path, kFullSecurityInformation, descriptor);
  if (result.code == OsResultCode::kAccessDenied) {
    Dmsg1(100, "cannot set owner and SACL of %s, setting the DACL only\n",
          path.c_str());
    result = api.SetSecurity(path, win32::kDaclSecurityInformation, descriptor);
  }

  if (!result.ok()) {
    Mmsg(errmsg, T_("failed to set security descriptor of \"%s\": ERR=%s\n"),
         path.c_str(), result.message.c_str());
    Dmsg2(100, "SetFileSecurity error file=%s ERR=%s\n", path.c_str(),
          result.message.c_str());
    return BattrExitCode::kError;
  }
  return BattrExitCode::kSuccess;
}

}  // namespace metakeep
