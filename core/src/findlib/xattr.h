/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2004-2010 Free Software Foundation Europe e.V.
   Copyright (C) 2011-2012 Planets Communications B.V.
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

#ifndef METAKEEP_FINDLIB_XATTR_H_
#define METAKEEP_FINDLIB_XATTR_H_

#include "findlib/node.h"
#include "findlib/os_result.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace metakeep {

#define BXATTR_FLAG_SAVE_NATIVE 0x01
#define BXATTR_FLAG_RESTORE_NATIVE 0x02

/*
 * Tracks per filesystem whether native xattrs work. Once a filesystem
 * reports it does not support them, further calls for entries on the same
 * device are skipped until the device changes.
 */
struct XattrState {
  uint32_t flags{BXATTR_FLAG_SAVE_NATIVE | BXATTR_FLAG_RESTORE_NATIVE};
  uint64_t current_dev{0};
  bool first_dev{true};

  void ChangeDevice(uint64_t dev);
};

/*
 * The extended attribute primitives of the OS. Symlinks are never
 * followed.
 */
class XattrOps {
 public:
  virtual ~XattrOps() = default;
  virtual OsResult List(const std::string& path,
                        std::vector<std::string>& names)
      = 0;
  virtual OsResult Get(const std::string& path,
                       const std::string& name,
                       std::vector<char>& value)
      = 0;
  virtual OsResult Set(const std::string& path,
                       const std::string& name,
                       const std::vector<char>& value)
      = 0;
};

// llistxattr and friends, every call reports kNotSupported without xattrs.
XattrOps& SystemXattrOps();

bool XattrNameIsSkipped(const std::string& name);

/*
 * Enumerate and fetch all extended attributes of path. Not supported or no
 * data when enumerating is an empty result. A failing fetch skips that
 * attribute, any other enumeration failure is an error.
 */
BattrExitCode FillExtendedAttributes(XattrOps& ops,
                                     const std::string& path,
                                     std::vector<ExtendedAttribute>& attrs,
                                     std::string& errmsg,
                                     XattrState* state = nullptr);

/*
 * Set the attributes in order. Not supported is a no-op, other failures
 * stop at the first failing attribute.
 */
BattrExitCode RestoreExtendedAttributes(
    XattrOps& ops,
    const std::string& path,
    const std::vector<ExtendedAttribute>& attrs,
    std::string& errmsg,
    XattrState* state = nullptr);

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_XATTR_H_
