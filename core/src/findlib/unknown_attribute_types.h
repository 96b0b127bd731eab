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

#ifndef METAKEEP_FINDLIB_UNKNOWN_ATTRIBUTE_TYPES_H_
#define METAKEEP_FINDLIB_UNKNOWN_ATTRIBUTE_TYPES_H_

#include "lib/thread_util.h"

#include <cstddef>
#include <functional>
#include <set>
#include <string>

namespace metakeep {

/*
 * Set of generic attribute types that were found on restore but have no
 * handler on this platform. Every type is reported exactly once, even when
 * many restore threads hit it at the same time.
 */
class UnknownAttributeTypeRegistry {
 public:
  using WarnCallback = std::function<void(const std::string& type)>;

  // Reports with an M_WARNING message.
  UnknownAttributeTypeRegistry();
  explicit UnknownAttributeTypeRegistry(WarnCallback warn);

  /*
   * Remember the type. Returns true and reports it when this call inserted
   * it, false when it was already known.
   */
  bool HandleUnknownType(const std::string& type);

  bool Contains(const std::string& type) const;
  std::size_t size() const;

 private:
  WarnCallback warn_;
  rw_synchronized<std::set<std::string>> types_;
};

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_UNKNOWN_ATTRIBUTE_TYPES_H_
