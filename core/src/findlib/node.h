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
 * Node metadata as captured from and restored to a filesystem entry.
 */

#ifndef METAKEEP_FINDLIB_NODE_H_
#define METAKEEP_FINDLIB_NODE_H_

#include <cstdint>
#include <string>
#include <vector>

namespace metakeep {

enum class NodeType
{
  kFile,
  kDir,
  kSymlink,
  kDev,
  kCharDev,
  kFifo,
  kSocket,
  kIrregular,
  kOther
};

const char* NodeTypeToString(NodeType type);
NodeType NodeTypeFromMode(uint32_t mode);

// Seconds and nanoseconds since the unix epoch, nsec is in [0, 1e9).
struct Timespec {
  int64_t sec{0};
  int64_t nsec{0};

  bool operator==(const Timespec& other) const
  {
    return sec == other.sec && nsec == other.nsec;
  }
  bool operator!=(const Timespec& other) const { return !(*this == other); }
};

struct ExtendedAttribute {
  std::string name;
  std::vector<char> value;

  bool operator==(const ExtendedAttribute& other) const
  {
    return name == other.name && value == other.value;
  }
};

/*
 * A typed attribute, the type is a namespaced tag like
 * "windows.creation_time". Unknown types are kept as is.
 */
struct GenericAttribute {
  std::string type;
  std::vector<char> value;

  bool operator==(const GenericAttribute& other) const
  {
    return type == other.type && value == other.value;
  }
};

namespace generic_attribute_type {
// 4 bytes, little endian file attribute bits
inline constexpr const char* kFileAttributes = "windows.file_attributes";
// 8 bytes, little endian FILETIME low and high dword
inline constexpr const char* kCreationTime = "windows.creation_time";
// base64 encoded self relative security descriptor
inline constexpr const char* kSecurityDescriptor
    = "windows.security_descriptor";
}  // namespace generic_attribute_type

struct Node {
  std::string name;
  NodeType type{NodeType::kOther};
  uint32_t mode{0};
  Timespec mtime;
  Timespec atime;
  Timespec ctime;
  std::vector<ExtendedAttribute> extended_attributes;
  std::vector<GenericAttribute> generic_attributes;
};

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_NODE_H_
