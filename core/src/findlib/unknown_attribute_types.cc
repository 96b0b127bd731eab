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
#include "findlib/unknown_attribute_types.h"

namespace metakeep {

static void WarnUnknownType(const std::string& type)
{
  Emsg1(M_WARNING, 0,
        T_("Found an unrecognised generic attribute \"%s\", it is ignored. "
           "It may have been created by a newer version.\n"),
        type.c_str());
}

UnknownAttributeTypeRegistry::UnknownAttributeTypeRegistry()
    : warn_(WarnUnknownType)
{
}

UnknownAttributeTypeRegistry::UnknownAttributeTypeRegistry(WarnCallback warn)
    : warn_(std::move(warn))
{
}

bool UnknownAttributeTypeRegistry::HandleUnknownType(const std::string& type)
{
  if (types_.rlock()->count(type) > 0) { return false; }

  bool inserted = types_.wlock()->insert(type).second;
  if (inserted) {
    Dmsg1(100, "Unknown generic attribute type %s\n", type.c_str());
    if (warn_) { warn_(type); }
  }
  return inserted;
}

bool UnknownAttributeTypeRegistry::Contains(const std::string& type) const
{
  return types_.rlock()->count(type) > 0;
}

std::size_t UnknownAttributeTypeRegistry::size() const
{
  return types_.rlock()->size();
}

}  // namespace metakeep
