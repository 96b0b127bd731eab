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
 * Windows file attribute bits, creation time and encryption state.
 */

#ifndef METAKEEP_FINDLIB_WIN32_ATTRIBS_H_
#define METAKEEP_FINDLIB_WIN32_ATTRIBS_H_

#include "findlib/node.h"
#include "findlib/os_result.h"
#include "findlib/stat_view.h"
#include "findlib/win32_file_api.h"

#include <string>
#include <vector>

namespace metakeep {

GenericAttribute MakeFileAttributesAttribute(uint32_t file_attributes);
GenericAttribute MakeCreationTimeAttribute(const Filetime& creation_time);

bool DecodeFileAttributes(const std::vector<char>& value,
                          uint32_t& file_attributes);
bool DecodeCreationTime(const std::vector<char>& value,
                        Filetime& creation_time);

/*
 * Bring the encrypted state of path in line with the encrypted bit in
 * desired. EncryptFile and DecryptFile refuse files with the system bit, so
 * on access denied the system bit is cleared and the call retried once.
 */
BattrExitCode ReconcileEncryption(Win32FileApi& api,
                                  const std::string& path,
                                  uint32_t desired,
                                  uint32_t current,
                                  std::string& errmsg);

/*
 * Reconcile the encryption state first, then set the settable bits of
 * desired. The final set always runs so a system bit cleared for the
 * encryption is put back.
 */
BattrExitCode RestoreFileAttributes(Win32FileApi& api,
                                    const std::string& path,
                                    uint32_t desired,
                                    std::string& errmsg);

BattrExitCode RestoreCreationTime(Win32FileApi& api,
                                  const std::string& path,
                                  const Filetime& creation_time,
                                  std::string& errmsg);

BattrExitCode RestoreWin32SymlinkTimestamps(Win32FileApi& api,
                                            const std::string& path,
                                            const Timespec& atime,
                                            const Timespec& mtime,
                                            std::string& errmsg);

/*
 * A drive root like "C:\" or a name with a ':' (alternate data stream or
 * drive designator) gets neither generic nor extended attributes.
 */
bool IsWin32PseudoPath(const std::string& path);

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_WIN32_ATTRIBS_H_
