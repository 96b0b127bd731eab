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
 * Per platform capture and restore of the metadata of a node.
 *
 * Which adapter is used is decided by the build configuration:
 *
 *   XattrMetadataAdapter     Linux, Darwin and FreeBSD
 *   WindowsMetadataAdapter   Windows
 *   NoopMetadataAdapter      everything else
 */

#ifndef METAKEEP_FINDLIB_METADATA_ADAPTER_H_
#define METAKEEP_FINDLIB_METADATA_ADAPTER_H_

#include "include/fileopts.h"
#include "findlib/generic_attribs.h"
#include "findlib/node.h"
#include "findlib/os_result.h"
#include "findlib/stat_view.h"
#include "findlib/unknown_attribute_types.h"
#include "findlib/win32_file_api.h"
#include "findlib/xattr.h"

#include <memory>
#include <string>
#include <vector>

namespace metakeep {

class MetadataAdapter {
 public:
  MetadataAdapter(UnknownAttributeTypeRegistry& unknown_types,
                  const MetadataOptions& options)
      : unknown_types_(unknown_types), options_(options)
  {
  }
  virtual ~MetadataAdapter() = default;

  virtual const char* Name() const = 0;

  virtual BattrExitCode FillExtendedAttributes(
      const std::string& path,
      std::vector<ExtendedAttribute>& attrs,
      std::string& errmsg)
      = 0;
  virtual BattrExitCode RestoreExtendedAttributes(
      const std::string& path,
      const std::vector<ExtendedAttribute>& attrs,
      std::string& errmsg)
      = 0;

  /*
   * allow_extended is set to false for entries that must not get any
   * extended or generic attributes, this is not an error.
   */
  virtual BattrExitCode FillGenericAttributes(
      const std::string& path,
      NodeType type,
      const StatView& view,
      bool& allow_extended,
      std::vector<GenericAttribute>& attrs,
      std::string& errmsg)
      = 0;
  virtual BattrExitCode RestoreGenericAttributes(
      const std::string& path,
      const std::vector<GenericAttribute>& attrs,
      std::string& errmsg);

  virtual BattrExitCode RestoreSymlinkTimestamps(const std::string& path,
                                                 const Timespec& atime,
                                                 const Timespec& mtime,
                                                 std::string& errmsg);

  /*
   * Generic attributes first, the extended attributes only when the generic
   * step allows it. Honors FO_GENERIC and FO_XATTR.
   */
  BattrExitCode FillNodeMetadata(const std::string& path,
                                 const StatView& view,
                                 Node& node,
                                 std::string& errmsg);

  /*
   * Extended attributes, then generic attributes. The second step runs even
   * when the first one failed, the messages are combined.
   */
  BattrExitCode RestoreNodeMetadata(const Node& node,
                                    const std::string& path,
                                    std::string& errmsg);

  const GenericAttributeHandlers& handlers() const { return handlers_; }
  const MetadataOptions& options() const { return options_; }

 protected:
  UnknownAttributeTypeRegistry& unknown_types_;
  MetadataOptions options_;
  GenericAttributeHandlers handlers_;
};

// Platforms with the llistxattr family (or extattr on FreeBSD).
class XattrMetadataAdapter : public MetadataAdapter {
 public:
  /*
   * state is optional, when given it is updated on every call and must not
   * be shared between threads.
   */
  XattrMetadataAdapter(XattrOps& ops,
                       UnknownAttributeTypeRegistry& unknown_types,
                       const MetadataOptions& options = MetadataOptions(),
                       XattrState* state = nullptr);

  const char* Name() const override { return "xattr"; }

  BattrExitCode FillExtendedAttributes(const std::string& path,
                                       std::vector<ExtendedAttribute>& attrs,
                                       std::string& errmsg) override;
  BattrExitCode RestoreExtendedAttributes(
      const std::string& path,
      const std::vector<ExtendedAttribute>& attrs,
      std::string& errmsg) override;
  BattrExitCode FillGenericAttributes(const std::string& path,
                                      NodeType type,
                                      const StatView& view,
                                      bool& allow_extended,
                                      std::vector<GenericAttribute>& attrs,
                                      std::string& errmsg) override;

 private:
  XattrOps& ops_;
  XattrState* state_;
};

class WindowsMetadataAdapter : public MetadataAdapter {
 public:
  WindowsMetadataAdapter(Win32FileApi& api,
                         UnknownAttributeTypeRegistry& unknown_types,
                         const MetadataOptions& options = MetadataOptions());
  WindowsMetadataAdapter(std::unique_ptr<Win32FileApi> api,
                         UnknownAttributeTypeRegistry& unknown_types,
                         const MetadataOptions& options = MetadataOptions());

  const char* Name() const override { return "windows"; }

  BattrExitCode FillExtendedAttributes(const std::string& path,
                                       std::vector<ExtendedAttribute>& attrs,
                                       std::string& errmsg) override;
  BattrExitCode RestoreExtendedAttributes(
      const std::string& path,
      const std::vector<ExtendedAttribute>& attrs,
      std::string& errmsg) override;
  BattrExitCode FillGenericAttributes(const std::string& path,
                                      NodeType type,
                                      const StatView& view,
                                      bool& allow_extended,
                                      std::vector<GenericAttribute>& attrs,
                                      std::string& errmsg) override;
  BattrExitCode RestoreSymlinkTimestamps(const std::string& path,
                                         const Timespec& atime,
                                         const Timespec& mtime,
                                         std::string& errmsg) override;

 private:
  void RegisterHandlers();

  std::unique_ptr<Win32FileApi> owned_api_;
  Win32FileApi& api_;
};

// AIX, OpenBSD, NetBSD, Solaris and others without a supported xattr API.
class NoopMetadataAdapter : public MetadataAdapter {
 public:
  explicit NoopMetadataAdapter(
      UnknownAttributeTypeRegistry& unknown_types,
      const MetadataOptions& options = MetadataOptions())
      : MetadataAdapter(unknown_types, options)
  {
  }

  const char* Name() const override { return "noop"; }

  BattrExitCode FillExtendedAttributes(const std::string& path,
                                       std::vector<ExtendedAttribute>& attrs,
                                       std::string& errmsg) override;
  BattrExitCode RestoreExtendedAttributes(
      const std::string& path,
      const std::vector<ExtendedAttribute>& attrs,
      std::string& errmsg) override;
  BattrExitCode FillGenericAttributes(const std::string& path,
                                      NodeType type,
                                      const StatView& view,
                                      bool& allow_extended,
                                      std::vector<GenericAttribute>& attrs,
                                      std::string& errmsg) override;

  // Symlink timestamps are left alone on these platforms.
  BattrExitCode RestoreSymlinkTimestamps(const std::string& path,
                                         const Timespec& atime,
                                         const Timespec& mtime,
                                         std::string& errmsg) override;
};

std::unique_ptr<MetadataAdapter> CreatePlatformMetadataAdapter(
    UnknownAttributeTypeRegistry& unknown_types,
    const MetadataOptions& options = MetadataOptions());

}  // namespace metakeep

#endif  // METAKEEP_FINDLIB_METADATA_ADAPTER_H_
