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

#if defined(HAVE_MINGW)
#  include "include/metakeep.h"
#  include "gtest/gtest.h"
#  include "gmock/gmock.h"
#else
#  include "gtest/gtest.h"
#  include "gmock/gmock.h"
#  include "include/metakeep.h"
#endif


#include "findlib/metadata_adapter.h"
#include "findlib/win32_attribs.h"
#include "tests/win32_file_api_mock.h"

using namespace metakeep;
using namespace metakeep::win32;

namespace {
std::vector<char> Bytes(const std::string& s)
{
  return std::vector<char>(s.begin(), s.end());
}

const GenericAttribute* FindGeneric(const Node& node, const char* type)
{
  for (const auto& attr : node.generic_attributes) {
    if (attr.type == type) { return &attr; }
  }
  return nullptr;
}

class WindowsAdapter : public testing::Test {
 protected:
  WindowsAdapter()
      : unknown_types([this](const std::string& type) {
        warned.push_back(type);
      })
      , adapter(api, unknown_types)
  {
  }

  Node Capture(const std::string& path, NodeType type = NodeType::kFile)
  {
    Node node;
    node.type = type;
    std::string errmsg;
    EXPECT_EQ(adapter.FillNodeMetadata(path, StatView(), node, errmsg),
              BattrExitCode::kSuccess)
        << errmsg;
    return node;
  }

  FakeWin32FileApi api;
  std::vector<std::string> warned;
  UnknownAttributeTypeRegistry unknown_types;
  WindowsMetadataAdapter adapter;
};
}  // namespace

TEST_F(WindowsAdapter, knows_the_windows_attribute_types)
{
  EXPECT_TRUE(adapter.handlers().IsKnown(generic_attribute_type::kFileAttributes));
  EXPECT_TRUE(adapter.handlers().IsKnown(generic_attribute_type::kCreationTime));
  EXPECT_TRUE(
      adapter.handlers().IsKnown(generic_attribute_type::kSecurityDescriptor));
  EXPECT_FALSE(adapter.handlers().IsKnown("vendor.experimental"));
  EXPECT_STREQ(adapter.Name(), "windows");
}

TEST_F(WindowsAdapter, captures_attributes_creation_time_and_descriptor)
{
  auto& file = api.Add("C:\\data\\f");
  file.attributes = kFileAttributeHidden | kFileAttributeArchive;
  file.creation_time = Filetime{0x01020304, 0x05060708};
  file.descriptor = {0x01, 0x00, 0x04, 0x00};

  Node node = Capture("C:\\data\\f");

  ASSERT_EQ(node.generic_attributes.size(), 3u);
  EXPECT_EQ(node.generic_attributes[0].type,
            generic_attribute_type::kFileAttributes);
  EXPECT_EQ(node.generic_attributes[1].type,
            generic_attribute_type::kCreationTime);
  EXPECT_EQ(node.generic_attributes[2].type,
            generic_attribute_type::kSecurityDescriptor);
  EXPECT_TRUE(node.extended_attributes.empty());
}

TEST_F(WindowsAdapter, symlinks_get_no_descriptor)
{
  api.Add("C:\\link");

  Node node = Capture("C:\\link", NodeType::kSymlink);

  EXPECT_EQ(node.generic_attributes.size(), 2u);
  EXPECT_EQ(FindGeneric(node, generic_attribute_type::kSecurityDescriptor),
            nullptr);
}

TEST_F(WindowsAdapter, descriptor_failure_is_not_fatal)
{
  Win32FileApiMock failing;
  UnknownAttributeTypeRegistry registry;
  WindowsMetadataAdapter mocked(failing, registry);
  Win32FileAttributeData data;
  data.file_attributes = kFileAttributeArchive;

  EXPECT_CALL(failing, GetAttributeData("C:\\f", testing::_))
      .WillOnce(testing::DoAll(testing::SetArgReferee<1>(data),
                               testing::Return(OsResult::Ok())));
  EXPECT_CALL(failing, GetSecurity("C:\\f", testing::_, testing::_))
      .WillRepeatedly(
          testing::Return(OsResultFromWin32Error(kErrorAccessDenied)));
  EXPECT_CALL(failing, QueryEa("C:\\f", testing::_, testing::_))
      .WillOnce(testing::Return(OsResultFromNtStatus(kStatusNoEasOnFile)));

  Node node;
  node.type = NodeType::kFile;
  std::string errmsg;
  EXPECT_EQ(mocked.FillNodeMetadata("C:\\f", StatView(), node, errmsg),
            BattrExitCode::kSuccess);
  EXPECT_EQ(node.generic_attributes.size(), 2u);
}

TEST_F(WindowsAdapter, pseudo_paths_get_nothing)
{
  api.Add("C:\\");
  api.Add("C:\\f:stream").eas.push_back(EaEntry{"NAME", Bytes("v"), 0});

  Node root = Capture("C:\\", NodeType::kDir);
  Node stream = Capture("C:\\f:stream");

  EXPECT_TRUE(root.generic_attributes.empty());
  EXPECT_TRUE(root.extended_attributes.empty());
  EXPECT_TRUE(stream.generic_attributes.empty());
  EXPECT_TRUE(stream.extended_attributes.empty());
}

TEST_F(WindowsAdapter, stat_view_data_is_used_when_present)
{
  Win32FileApiMock mock;
  UnknownAttributeTypeRegistry registry;
  MetadataOptions options;
  ClearBit(FO_SECURITY_DESCRIPTOR, options.flags);
  WindowsMetadataAdapter mocked(mock, registry, options);
  StatView view;
  view.has_win32_data = true;
  view.file_attributes = kFileAttributeReadonly;
  view.creation_time = Filetime{7, 8};

  EXPECT_CALL(mock, GetAttributeData(testing::_, testing::_)).Times(0);
  EXPECT_CALL(mock, GetSecurity(testing::_, testing::_, testing::_)).Times(0);

  bool allow_extended = false;
  std::vector<GenericAttribute> attrs;
  std::string errmsg;
  EXPECT_EQ(mocked.FillGenericAttributes("C:\\f", NodeType::kFile, view,
                                         allow_extended, attrs, errmsg),
            BattrExitCode::kSuccess);
  EXPECT_TRUE(allow_extended);
  ASSERT_EQ(attrs.size(), 2u);
  EXPECT_EQ(attrs[0], MakeFileAttributesAttribute(kFileAttributeReadonly));
  EXPECT_EQ(attrs[1], MakeCreationTimeAttribute(Filetime{7, 8}));
}

TEST_F(WindowsAdapter, creation_time_survives_restore_and_recapture)
{
  api.Add("C:\\new");
  Node node;
  node.type = NodeType::kFile;
  node.generic_attributes.push_back(GenericAttribute{
      generic_attribute_type::kCreationTime,
      {0x04, 0x03, 0x02, 0x01, 0x08, 0x07, 0x06, 0x05}});
  std::string errmsg;

  ASSERT_EQ(adapter.RestoreNodeMetadata(node, "C:\\new", errmsg),
            BattrExitCode::kSuccess)
      << errmsg;

  Node recaptured = Capture("C:\\new");
  const GenericAttribute* creation
      = FindGeneric(recaptured, generic_attribute_type::kCreationTime);
  ASSERT_NE(creation, nullptr);
  EXPECT_EQ(creation->value, (std::vector<char>{0x04, 0x03, 0x02, 0x01, 0x08,
                                                0x07, 0x06, 0x05}));
}

TEST_F(WindowsAdapter, round_trip_to_a_fresh_file)
{
  auto& source = api.Add("C:\\src");
  source.attributes = kFileAttributeHidden | kFileAttributeSystem
                      | kFileAttributeEncrypted;
  source.creation_time = Filetime{0xdeadbeef, 0x01d00000};
  source.descriptor = {0x01, 0x00, 0x04, static_cast<char>(0x80)};
  source.eas.push_back(EaEntry{"USER.FOO", Bytes("bar"), 0});
  api.Add("C:\\dst");

  Node captured = Capture("C:\\src");
  std::string errmsg;
  ASSERT_EQ(adapter.RestoreNodeMetadata(captured, "C:\\dst", errmsg),
            BattrExitCode::kSuccess)
      << errmsg;
  Node recaptured = Capture("C:\\dst");

  EXPECT_EQ(recaptured.extended_attributes, captured.extended_attributes);
  EXPECT_EQ(recaptured.generic_attributes, captured.generic_attributes);
  EXPECT_EQ(api.files["C:\\dst"].attributes, source.attributes);
}

TEST_F(WindowsAdapter, extended_attribute_names_come_back_upper_cased)
{
  api.Add("C:\\a");
  Node node;
  node.type = NodeType::kFile;
  node.extended_attributes.push_back(
      ExtendedAttribute{"user.foo", Bytes("bar")});
  std::string errmsg;

  ASSERT_EQ(adapter.RestoreNodeMetadata(node, "C:\\a", errmsg),
            BattrExitCode::kSuccess);
  Node recaptured = Capture("C:\\a");

  ASSERT_EQ(recaptured.extended_attributes.size(), 1u);
  EXPECT_EQ(recaptured.extended_attributes[0].name, "USER.FOO");
  EXPECT_EQ(recaptured.extended_attributes[0].value, Bytes("bar"));
}

TEST_F(WindowsAdapter, unsupported_eas_are_ignored)
{
  api.Add("C:\\fat");
  api.eas_supported = false;
  Node node;
  node.type = NodeType::kFile;
  node.extended_attributes.push_back(ExtendedAttribute{"A", Bytes("1")});
  std::string errmsg;

  EXPECT_EQ(adapter.RestoreNodeMetadata(node, "C:\\fat", errmsg),
            BattrExitCode::kSuccess);
  Node recaptured = Capture("C:\\fat");
  EXPECT_TRUE(recaptured.extended_attributes.empty());
}

TEST_F(WindowsAdapter, unknown_types_do_not_stop_the_known_ones)
{
  api.Add("C:\\f");
  Node node;
  node.type = NodeType::kFile;
  node.generic_attributes.push_back(
      GenericAttribute{"vendor.experimental", Bytes("??")});
  node.generic_attributes.push_back(
      MakeFileAttributesAttribute(kFileAttributeReadonly));
  std::string errmsg;

  EXPECT_EQ(adapter.RestoreNodeMetadata(node, "C:\\f", errmsg),
            BattrExitCode::kSuccess);
  EXPECT_EQ(api.files["C:\\f"].attributes, kFileAttributeReadonly);
  EXPECT_THAT(warned, testing::ElementsAre("vendor.experimental"));
}

TEST_F(WindowsAdapter, all_errors_of_a_node_are_reported)
{
  Node node;
  node.type = NodeType::kFile;
  node.extended_attributes.push_back(ExtendedAttribute{"A", Bytes("1")});
  node.generic_attributes.push_back(
      GenericAttribute{generic_attribute_type::kCreationTime, Bytes("short")});
  node.generic_attributes.push_back(
      MakeFileAttributesAttribute(kFileAttributeHidden));
  std::string errmsg;

  EXPECT_EQ(adapter.RestoreNodeMetadata(node, "C:\\missing", errmsg),
            BattrExitCode::kError);
  EXPECT_THAT(errmsg, testing::HasSubstr("set file EA failed"));
  EXPECT_THAT(errmsg, testing::HasSubstr("invalid creation time value"));
  EXPECT_THAT(errmsg, testing::HasSubstr("failed to set file attributes"));
}

TEST_F(WindowsAdapter, symlink_timestamps_use_the_link_itself)
{
  api.Add("C:\\link");
  std::string errmsg;

  EXPECT_EQ(adapter.RestoreSymlinkTimestamps("C:\\link", Timespec{1, 0},
                                             Timespec{2, 0}, errmsg),
            BattrExitCode::kSuccess);
  EXPECT_EQ(api.files["C:\\link"].write_time,
            FiletimeFromTimespec(Timespec{2, 0}));
}

TEST(NoopAdapter, captures_nothing_and_tolerates_everything)
{
  std::vector<std::string> warned;
  UnknownAttributeTypeRegistry registry(
      [&warned](const std::string& type) { warned.push_back(type); });
  NoopMetadataAdapter adapter(registry);
  Node node;
  std::string errmsg;

  EXPECT_EQ(adapter.FillNodeMetadata("/f", StatView(), node, errmsg),
            BattrExitCode::kSuccess);
  EXPECT_TRUE(node.extended_attributes.empty());
  EXPECT_TRUE(node.generic_attributes.empty());

  node.extended_attributes.push_back(ExtendedAttribute{"user.a", Bytes("1")});
  node.generic_attributes.push_back(
      MakeCreationTimeAttribute(Filetime{1, 2}));
  EXPECT_EQ(adapter.RestoreNodeMetadata(node, "/f", errmsg),
            BattrExitCode::kSuccess);
  EXPECT_THAT(warned, testing::ElementsAre(generic_attribute_type::kCreationTime));
}

TEST(NoopAdapter, symlink_timestamps_are_left_alone)
{
  UnknownAttributeTypeRegistry registry;
  NoopMetadataAdapter adapter(registry);
  std::string errmsg;

  EXPECT_EQ(adapter.RestoreSymlinkTimestamps(
                "/nonexistent/metakeep/link", Timespec{1, 0}, Timespec{2, 0},
                errmsg),
            BattrExitCode::kSuccess);
  EXPECT_TRUE(errmsg.empty());
}

TEST(PlatformAdapter, matches_the_build_configuration)
{
  UnknownAttributeTypeRegistry registry;
  std::unique_ptr<MetadataAdapter> adapter
      = CreatePlatformMetadataAdapter(registry);

  ASSERT_NE(adapter, nullptr);
#if defined(HAVE_WIN32)
  EXPECT_STREQ(adapter->Name(), "windows");
#elif defined(HAVE_XATTR) || defined(HAVE_EXTATTR)
  EXPECT_STREQ(adapter->Name(), "xattr");
#else
  EXPECT_STREQ(adapter->Name(), "noop");
#endif
}

TEST(PlatformAdapter, options_disable_capture)
{
  UnknownAttributeTypeRegistry registry;
  FakeWin32FileApi api;
  api.Add("C:\\f").eas.push_back(EaEntry{"A", Bytes("1"), 0});
  MetadataOptions options;
  ClearBit(FO_XATTR, options.flags);
  ClearBit(FO_GENERIC, options.flags);
  WindowsMetadataAdapter adapter(api, registry, options);
  Node node;
  node.type = NodeType::kFile;
  std::string errmsg;

  EXPECT_EQ(adapter.FillNodeMetadata("C:\\f", StatView(), node, errmsg),
            BattrExitCode::kSuccess);
  EXPECT_TRUE(node.extended_attributes.empty());
  EXPECT_TRUE(node.generic_attributes.empty());
}
