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
#include "findlib/generic_attribs.h"

namespace metakeep {

void GenericAttributeHandlers::Register(std::string type,
                                        GenericAttributeHandler handler)
{
  handlers_[std::move(type)] = std::move(handler);
}

bool GenericAttributeHandlers::IsKnown(std::string_view type) const
{
  return handlers_.find(type) != handlers_.end();
}

const GenericAttributeHandler* GenericAttributeHandlers::Find(
    std::string_view type) const
{
  auto it = handlers_.find(type);
  if (it == handlers_.end()) { return nullptr; }
  return &it->second;
}

BattrExitCode RestoreGenericAttributes(
    const GenericAttributeHandlers& handlers,
    UnknownAttributeTypeRegistry& unknown_types,
    const std::string& path,
    const std::vector<GenericAttribute>& attributes,
    std::string& errmsg)
{
  std::vector<std::string> errors;

  for (const auto& attribute : attributes) {
    const GenericAttributeHandler* handler = handlers.Find(attribute.type);

    if (!handler) {
      unknown_types.HandleUnknownType(attribute.type);
      continue;
    }

    std::string attr_errmsg;
    if ((*handler)(path, attribute.value, attr_errmsg)
        == BattrExitCode::kError) {
      std::string msg;

      Mmsg(msg, T_("Error restoring generic attribute %s for: %s : %s"),
           attribute.type.c_str(), path.c_str(), attr_errmsg.c_str());
      // errmsg texts end with a newline, the joined message must not
      while (!msg.empty() && msg.back() == '\n') { msg.pop_back(); }
      Dmsg1(100, "%s\n", msg.c_str());
      errors.push_back(std::move(msg));
    }
  }

  if (errors.empty()) { return BattrExitCode::kSuccess; }

  errmsg = JoinStrings(errors, "; ");
  return BattrExitCode::kError;
}

}  // namespace metakeep
