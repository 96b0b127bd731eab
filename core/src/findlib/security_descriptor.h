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
 * Capture and restore of Windows security descriptors as base64 text.
 */

#ifndef METAKEEP_FINDLIB_SECURITY_DESCRIPTOR_H_
#define METAKEEP_FINDLIB_SECURITY_DESCRIPTOR_H_

#include "findlib/node.h"
#include "findlib/os_result.h"
#include "findlib/win32_file_api.h"

#include <string>
#include <vector>

namespace metakeep {

/*
 * Read the descriptor of path. Reading the SACL needs a privilege, when that
 * is denied the descriptor is read again without it.
 */
BattrExitCode GetSecurityDescriptorAttribute(Win32FileApi& api,
                                             const std::string& path,
                                             GenericAttribute& attribute,
                                             std::string& errmsg);

/*
 * Write a descriptor captured by GetSecurityDescriptorAttribute. Falls back
 * to the DACL alone when owner, group or SACL cannot be written.
 */
BattrExitCode RestoreSecurityDescriptor(Win32FileApi& api,
                                        const std::string& path,
                                        const std::vector<char>& value,
                                        std::string& errmsg);

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_SECURITY_DESCRIPTOR_H_
