/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2022-2026 Bareos GmbH & Co. KG

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
 * Show the metadata captured for files and replay it onto another file
 */

#include "include/metakeep.h"
#include "include/exit_codes.h"
#include "include/fileopts.h"
#include "findlib/metadata_adapter.h"
#include "findlib/stat_view.h"
#include "findlib/unknown_attribute_types.h"
#include "lib/berrno.h"
#include "lib/cli.h"
#include "lib/message.h"

#include <clocale>
#include <iostream>

using namespace metakeep;

static constexpr std::size_t kPreviewLength = 32;

static bool StatPath(const std::string& path, StatView& view)
{
  struct stat st;

#if defined(HAVE_WIN32)
  if (stat(path.c_str(), &st) != 0) {
#else
  if (lstat(path.c_str(), &st) != 0) {
#endif
    BErrNo be;
    Pmsg2(0, T_("Cannot stat \"%s\": ERR=%s\n"), path.c_str(),
          be.bstrerror());
    return false;
  }
  view = StatViewFromStat(st);
  return true;
}

static bool CaptureNode(MetadataAdapter& adapter,
                        const std::string& path,
                        Node& node)
{
  StatView view;
  std::string errmsg;

  if (!StatPath(path, view)) { return false; }
  FillNodeFromStatView(path, view, node);

  if (adapter.FillNodeMetadata(path, view, node, errmsg)
      != BattrExitCode::kSuccess) {
    Pmsg2(0, T_("Capture of \"%s\" failed: %s\n"), path.c_str(),
          errmsg.c_str());
    return false;
  }
  return true;
}

static void PrintNode(const Node& node)
{
  std::cout << node.name << " (" << NodeTypeToString(node.type) << ")\n";
  if (verbose) {
    std::cout << "  mode:  " << std::oct << node.mode << std::dec << "\n"
              << "  mtime: " << node.mtime.sec << "." << node.mtime.nsec
              << "\n"
              << "  atime: " << node.atime.sec << "." << node.atime.nsec
              << "\n"
              << "  ctime: " << node.ctime.sec << "." << node.ctime.nsec
              << "\n";
  }

  std::cout << "  extended attributes: " << node.extended_attributes.size()
            << "\n";
  for (const auto& attr : node.extended_attributes) {
    std::cout << "    " << attr.name << " [" << attr.value.size() << "] \""
              << PrintablePreview(attr.value, kPreviewLength) << "\"";
    if (verbose) {
      std::cout << " " << HexPreview(attr.value, kPreviewLength);
    }
    std::cout << "\n";
  }

  std::cout << "  generic attributes: " << node.generic_attributes.size()
            << "\n";
  for (const auto& attr : node.generic_attributes) {
    std::cout << "    " << attr.type << " [" << attr.value.size() << "] "
              << HexPreview(attr.value, kPreviewLength) << "\n";
  }
}

static bool RestoreNode(MetadataAdapter& adapter,
                        const Node& node,
                        const std::string& target)
{
  std::string errmsg;
  bool ok = true;

  if (adapter.RestoreNodeMetadata(node, target, errmsg)
      != BattrExitCode::kSuccess) {
    Pmsg2(0, T_("Restore onto \"%s\" failed: %s\n"), target.c_str(),
          errmsg.c_str());
    ok = false;
  }

  if (node.type == NodeType::kSymlink) {
    errmsg.clear();
    if (adapter.RestoreSymlinkTimestamps(target, node.atime, node.mtime,
                                         errmsg)
        != BattrExitCode::kSuccess) {
      Pmsg2(0, T_("Restore of symlink times of \"%s\" failed: %s"),
            target.c_str(), errmsg.c_str());
      ok = false;
    }
  }

  return ok;
}

int main(int argc, char** argv)
{
  setlocale(LC_ALL, "");
  MyNameIs(argc, argv, "testattr");

  CLI::App testattr_app;
  InitCLIApp(testattr_app, "The Metakeep Testattr Tool.", 2025);

  AddDebugOptions(testattr_app);
  AddVerboseOption(testattr_app);

  bool no_xattr = false;
  testattr_app.add_flag("--no-xattr", no_xattr,
                        "Do not capture or restore extended attributes.");

  bool no_generic = false;
  testattr_app.add_flag("--no-generic", no_generic,
                        "Do not capture or restore generic attributes.");

  std::string restore_to;
  testattr_app
      .add_option("--restore-to", restore_to,
                  "Replay the metadata of the given path onto <path>.")
      ->check(CLI::ExistingPath)
      ->type_name("<path>");

  std::vector<std::string> paths;
  testattr_app.add_option("paths", paths, "Files to examine.")
      ->required()
      ->type_name("<path>");

  ParseMetakeepApp(testattr_app, argc, argv);

  if (!restore_to.empty() && paths.size() != 1) {
    Pmsg0(0, T_("--restore-to needs exactly one source path\n"));
    return MKEXIT_CLI_PARSING_ERROR;
  }

  MetadataOptions options;
  if (no_xattr) { ClearBit(FO_XATTR, options.flags); }
  if (no_generic) { ClearBit(FO_GENERIC, options.flags); }

  UnknownAttributeTypeRegistry unknown_types;
  std::unique_ptr<MetadataAdapter> adapter
      = CreatePlatformMetadataAdapter(unknown_types, options);
  Dmsg1(50, "using %s metadata adapter\n", adapter->Name());

  int retval = MKEXIT_SUCCESS;
  for (const auto& path : paths) {
    Node node;

    if (!CaptureNode(*adapter, path, node)) {
      retval = MKEXIT_FAILURE;
      continue;
    }
    PrintNode(node);

    if (restore_to.empty()) { continue; }

    if (!RestoreNode(*adapter, node, restore_to)) { retval = MKEXIT_FAILURE; }

    Node restored;
    if (!CaptureNode(*adapter, restore_to, restored)) {
      retval = MKEXIT_FAILURE;
      continue;
    }
    std::cout << "\nRestored:\n";
    PrintNode(restored);
  }

  return retval;
}
