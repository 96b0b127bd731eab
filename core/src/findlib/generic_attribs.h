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
 * Dispatch of generic attributes to the handlers a platform understands.
 */

#ifndef METAKEEP_FINDLIB_GENERIC_ATTRIBS_H_
#define METAKEEP_FINDLIB_GENERIC_ATTRIBS_H_

#include "findlib/node.h"
#include "findlib/os_result.h"
#include "findlib/unknown_attribute_types.h"

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace metakeep {

using GenericAttributeHandler
    = std::function<BattrExitCode(const std::string& path,
                                  const std::vector<char>& value,
                                  std::string& errmsg)>;

class GenericAttributeHandlers {
 public:
  void Register(std::string type, GenericAttributeHandler handler);
  bool IsKnown(std::string_view type) const;
  const GenericAttributeHandler* Find(std::string_view type) const;
  std::size_t size() const { return handlers_.size(); }

 private:
  std::map<std::string, GenericAttributeHandler, std::less<>> handlers_;
};

/*
 * Restore every attribute with its handler. A failing handler does not stop
 * the others, all failures are joined into errmsg. Types without a handler
 * go to the unknown type registry and are not an error.
 */
BattrExitCode RestoreGenericAttributes(
    const GenericAttributeHandlers& handlers,
    UnknownAttributeTypeRegistry& unknown_types,
    const std::string& path,
    const std::vector<GenericAttribute>& attributes,
    std::string& errmsg);

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_GENERIC_ATTRIBS_H_
