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
#include "findlib/metadata_adapter.h"
#include "findlib/ea_codec.h"
#include "findlib/security_descriptor.h"
#include "findlib/win32_attribs.h"

namespace metakeep {

static void TrimTrailingNewlines(std::string& msg)
{
  while (!msg.empty() && msg.back() == '\n') { msg.pop_back(); }
}

static BattrExitCode CombineErrors(std::vector<std::string>& errors,
                                   std::string& errmsg)
{
  if (errors.empty()) { return BattrExitCode::kSuccess; }

  for (auto& msg : errors) { TrimTrailingNewlines(msg); }
  errmsg = JoinStrings(errors, "; ");
  return BattrExitCode::kError;
}

BattrExitCode MetadataAdapter::RestoreGenericAttributes(
    const std::string& path,
    const std::vector<GenericAttribute>& attrs,
    std::string& errmsg)
{
  return metakeep::RestoreGenericAttributes(handlers_, unknown_types_, path,
                                            attrs, errmsg);
}

BattrExitCode MetadataAdapter::RestoreSymlinkTimestamps(const std::string& path,
                                                        const Timespec& atime,
                                                        const Timespec& mtime,
                                                        std::string& errmsg)
{
  return PosixRestoreSymlinkTimestamps(path, atime, mtime, errmsg);
}

BattrExitCode MetadataAdapter::FillNodeMetadata(const std::string& path,
                                                const StatView& view,
                                                Node& node,
                                                std::string& errmsg)
{
  std::vector<std::string> errors;
  std::string msg;
  bool allow_extended = true;

  node.generic_attributes.clear();
  node.extended_attributes.clear();

  if (options_.IsSet(FO_GENERIC)) {
    if (FillGenericAttributes(path, node.type, view, allow_extended,
                              node.generic_attributes, msg)
        != BattrExitCode::kSuccess) {
      errors.push_back(msg);
    }
  }

  if (!allow_extended) {
    Dmsg1(200, "skipping extended attributes of %s\n", path.c_str());
    node.generic_attributes.clear();
  } else if (options_.IsSet(FO_XATTR)) {
    msg.clear();
    if (FillExtendedAttributes(path, node.extended_attributes, msg)
        != BattrExitCode::kSuccess) {
      errors.push_back(msg);
    }
  }

  return CombineErrors(errors, errmsg);
}

BattrExitCode MetadataAdapter::RestoreNodeMetadata(const Node& node,
                                                   const std::string& path,
                                                   std::string& errmsg)
{
  std::vector<std::string> errors;
  std::string msg;

  if (options_.IsSet(FO_XATTR) && !node.extended_attributes.empty()) {
    if (RestoreExtendedAttributes(path, node.extended_attributes, msg)
        != BattrExitCode::kSuccess) {
      errors.push_back(msg);
    }
  }

  if (options_.IsSet(FO_GENERIC) && !node.generic_attributes.empty()) {
    msg.clear();
    if (RestoreGenericAttributes(path, node.generic_attributes, msg)
        != BattrExitCode::kSuccess) {
      errors.push_back(msg);
    }
  }

  if (!errors.empty()) {
    Dmsg2(100, "restoring metadata of %s failed: %zu errors\n", path.c_str(),
          errors.size());
  }
  return CombineErrors(errors, errmsg);
}

/* XattrMetadataAdapter */

XattrMetadataAdapter::XattrMetadataAdapter(
    XattrOps& ops,
    UnknownAttributeTypeRegistry& unknown_types,
    const MetadataOptions& options,
    XattrState* state)
    : MetadataAdapter(unknown_types, options), ops_(ops), state_(state)
{
}

BattrExitCode XattrMetadataAdapter::FillExtendedAttributes(
    const std::string& path,
    std::vector<ExtendedAttribute>& attrs,
    std::string& errmsg)
{
  return metakeep::FillExtendedAttributes(ops_, path, attrs, errmsg, state_);
}

BattrExitCode XattrMetadataAdapter::RestoreExtendedAttributes(
    const std::string& path,
    const std::vector<ExtendedAttribute>& attrs,
    std::string& errmsg)
{
  return metakeep::RestoreExtendedAttributes(ops_, path, attrs, errmsg,
                                             state_);
}

BattrExitCode XattrMetadataAdapter::FillGenericAttributes(
    const std::string&,
    NodeType,
    const StatView&,
    bool& allow_extended,
    std::vector<GenericAttribute>&,
    std::string&)
{
  allow_extended = true;
  return BattrExitCode::kSuccess;
}

/* NoopMetadataAdapter */

BattrExitCode NoopMetadataAdapter::FillExtendedAttributes(
    const std::string&,
    std::vector<ExtendedAttribute>& attrs,
    std::string&)
{
  attrs.clear();
  return BattrExitCode::kSuccess;
}

BattrExitCode NoopMetadataAdapter::RestoreExtendedAttributes(
    const std::string& path,
    const std::vector<ExtendedAttribute>& attrs,
    std::string&)
{
  if (!attrs.empty()) {
    Dmsg2(200, "dropping %zu extended attributes of %s\n", attrs.size(),
          path.c_str());
  }
  return BattrExitCode::kSuccess;
}

BattrExitCode NoopMetadataAdapter::FillGenericAttributes(
    const std::string&,
    NodeType,
    const StatView&,
    bool& allow_extended,
    std::vector<GenericAttribute>&,
    std::string&)
{
  allow_extended = true;
  return BattrExitCode::kSuccess;
}

BattrExitCode NoopMetadataAdapter::RestoreSymlinkTimestamps(
    const std::string& path,
    const Timespec&,
    const Timespec&,
    std::string&)
{
  Dmsg1(200, "not restoring symlink timestamps of %s\n", path.c_str());
  return BattrExitCode::kSuccess;
}

/* WindowsMetadataAdapter */

WindowsMetadataAdapter::WindowsMetadataAdapter(
    Win32FileApi& api,
    UnknownAttributeTypeRegistry& unknown_types,
    const MetadataOptions& options)
    : MetadataAdapter(unknown_types, options), api_(api)
{
  RegisterHandlers();
}

WindowsMetadataAdapter::WindowsMetadataAdapter(
    std::unique_ptr<Win32FileApi> api,
    UnknownAttributeTypeRegistry& unknown_types,
    const MetadataOptions& options)
    : MetadataAdapter(unknown_types, options)
    , owned_api_(std::move(api))
    , api_(*owned_api_)
{
  RegisterHandlers();
}

void WindowsMetadataAdapter::RegisterHandlers()
{
  handlers_.Register(
      generic_attribute_type::kFileAttributes,
      [this](const std::string& path, const std::vector<char>& value,
             std::string& errmsg) {
        uint32_t attributes = 0;
        if (!DecodeFileAttributes(value, attributes)) {
          Mmsg(errmsg, T_("invalid file attributes value of size %zu\n"),
               value.size());
          return BattrExitCode::kError;
        }
        return RestoreFileAttributes(api_, path, attributes, errmsg);
      });

  handlers_.Register(
      generic_attribute_type::kCreationTime,
      [this](const std::string& path, const std::vector<char>& value,
             std::string& errmsg) {
        Filetime creation_time;
        if (!DecodeCreationTime(value, creation_time)) {
          Mmsg(errmsg, T_("invalid creation time value of size %zu\n"),
               value.size());
          return BattrExitCode::kError;
        }
        return RestoreCreationTime(api_, path, creation_time, errmsg);
      });

  handlers_.Register(
      generic_attribute_type::kSecurityDescriptor,
      [this](const std::string& path, const std::vector<char>& value,
             std::string& errmsg) {
        if (!options_.IsSet(FO_SECURITY_DESCRIPTOR)) {
          Dmsg1(200, "not restoring security descriptor of %s\n",
                path.c_str());
          return BattrExitCode::kSuccess;
        }
        return RestoreSecurityDescriptor(api_, path, value, errmsg);
      });
}

BattrExitCode WindowsMetadataAdapter::FillExtendedAttributes(
    const std::string& path,
    std::vector<ExtendedAttribute>& attrs,
    std::string& errmsg)
{
  std::vector<EaEntry> entries;

  attrs.clear();
  if (IsWin32PseudoPath(path)) { return BattrExitCode::kSuccess; }

  BattrExitCode retval = QueryExtendedAttributes(
      [this, &path](std::vector<char>& buffer, std::size_t& written) {
        return api_.QueryEa(path, buffer, written);
      },
      entries, errmsg);
  if (retval != BattrExitCode::kSuccess) { return retval; }

  attrs.reserve(entries.size());
  for (auto& entry : entries) {
    attrs.push_back(ExtendedAttribute{std::move(entry.name),
                                      std::move(entry.value)});
  }
  return BattrExitCode::kSuccess;
}

BattrExitCode WindowsMetadataAdapter::RestoreExtendedAttributes(
    const std::string& path,
    const std::vector<ExtendedAttribute>& attrs,
    std::string& errmsg)
{
  std::vector<EaEntry> entries;
  std::vector<char> buffer;

  if (attrs.empty()) { return BattrExitCode::kSuccess; }

  entries.reserve(attrs.size());
  for (const auto& attr : attrs) {
    entries.push_back(EaEntry{attr.name, attr.value, 0});
  }

  EaCodecError error = EncodeExtendedAttributes(entries, buffer);
  if (error != EaCodecError::kOk) {
    Mmsg(errmsg, T_("cannot encode extended attributes of \"%s\": %s\n"),
         path.c_str(), EaCodecErrorToString(error));
    return BattrExitCode::kError;
  }

  OsResult result = api_.SetEa(path, buffer);
  switch (result.code) {
    case OsResultCode::kOk:
      break;
    case OsResultCode::kNotSupported:
      Dmsg1(200, "extended attributes not supported on %s\n", path.c_str());
      break;
    default:
      Mmsg(errmsg, T_("set file EA failed with: %s\n"),
           result.message.c_str());
      Dmsg2(100, "NtSetEaFile error file=%s ERR=%s\n", path.c_str(),
            result.message.c_str());
      return BattrExitCode::kError;
  }
  return BattrExitCode::kSuccess;
}

BattrExitCode WindowsMetadataAdapter::FillGenericAttributes(
    const std::string& path,
    NodeType type,
    const StatView& view,
    bool& allow_extended,
    std::vector<GenericAttribute>& attrs,
    std::string& errmsg)
{
  uint32_t file_attributes = view.file_attributes;
  Filetime creation_time = view.creation_time;

  if (IsWin32PseudoPath(path)) {
    allow_extended = false;
    return BattrExitCode::kSuccess;
  }
  allow_extended = true;

  if (!view.has_win32_data) {
    Win32FileAttributeData data;
    OsResult result = api_.GetAttributeData(path, data);
    if (!result.ok()) {
      Mmsg(errmsg, T_("failed to get attributes of \"%s\": ERR=%s\n"),
           path.c_str(), result.message.c_str());
      return BattrExitCode::kError;
    }
    file_attributes = data.file_attributes;
    creation_time = data.creation_time;
  }

  attrs.push_back(MakeFileAttributesAttribute(file_attributes));
  attrs.push_back(MakeCreationTimeAttribute(creation_time));

  if ((type == NodeType::kFile || type == NodeType::kDir)
      && options_.IsSet(FO_SECURITY_DESCRIPTOR)) {
    GenericAttribute descriptor;
    std::string msg;

    if (GetSecurityDescriptorAttribute(api_, path, descriptor, msg)
        == BattrExitCode::kSuccess) {
      attrs.push_back(std::move(descriptor));
    } else {
      Dmsg1(100, "%s", msg.c_str());
    }
  }

  return BattrExitCode::kSuccess;
}

BattrExitCode WindowsMetadataAdapter::RestoreSymlinkTimestamps(
    const std::string& path,
    const Timespec& atime,
    const Timespec& mtime,
    std::string& errmsg)
{
  return RestoreWin32SymlinkTimestamps(api_, path, atime, mtime, errmsg);
}

std::unique_ptr<MetadataAdapter> CreatePlatformMetadataAdapter(
    UnknownAttributeTypeRegistry& unknown_types,
    const MetadataOptions& options)
{
#if defined(HAVE_WIN32)
  return std::make_unique<WindowsMetadataAdapter>(CreateSystemWin32FileApi(),
                                                  unknown_types, options);
#elif defined(HAVE_XATTR) || defined(HAVE_EXTATTR)
  return std::make_unique<XattrMetadataAdapter>(SystemXattrOps(),
                                                unknown_types, options);
#else
  return std::make_unique<NoopMetadataAdapter>(unknown_types, options);
#endif
}

}  // namespace metakeep
