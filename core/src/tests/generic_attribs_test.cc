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


#include "findlib/generic_attribs.h"

#include <vector>

using namespace metakeep;

namespace {
std::vector<char> Bytes(const std::string& s)
{
  return std::vector<char>(s.begin(), s.end());
}

class GenericAttribs : public testing::Test {
 protected:
  void SetUp() override
  {
    handlers.Register("test.ok",
                      [this](const std::string& path,
                             const std::vector<char>& value, std::string&) {
                        restored.push_back(path + "="
                                           + std::string(value.begin(),
                                                         value.end()));
                        return BattrExitCode::kSuccess;
                      });
    handlers.Register("test.fail", [](const std::string&,
                                      const std::vector<char>&,
                                      std::string& errmsg) {
      errmsg = "it broke\n";
      return BattrExitCode::kError;
    });
  }

  GenericAttributeHandlers handlers;
  std::vector<std::string> warned;
  UnknownAttributeTypeRegistry unknown_types{
      [this](const std::string& type) { warned.push_back(type); }};
  std::vector<std::string> restored;
};
}  // namespace

TEST_F(GenericAttribs, handlers_are_found_by_type)
{
  EXPECT_TRUE(handlers.IsKnown("test.ok"));
  EXPECT_FALSE(handlers.IsKnown("test.missing"));
  EXPECT_NE(handlers.Find("test.fail"), nullptr);
  EXPECT_EQ(handlers.Find("test.missing"), nullptr);
  EXPECT_EQ(handlers.size(), 2u);
}

TEST_F(GenericAttribs, unknown_type_is_tolerated)
{
  std::string errmsg;
  std::vector<GenericAttribute> attributes{
      {"vendor.experimental", Bytes("???")}, {"test.ok", Bytes("1")}};

  EXPECT_EQ(RestoreGenericAttributes(handlers, unknown_types, "/f",
                                     attributes, errmsg),
            BattrExitCode::kSuccess);
  EXPECT_TRUE(errmsg.empty());
  EXPECT_THAT(restored, testing::ElementsAre("/f=1"));
  EXPECT_THAT(warned, testing::ElementsAre("vendor.experimental"));
}

TEST_F(GenericAttribs, unknown_type_warns_once_across_nodes)
{
  std::string errmsg;
  std::vector<GenericAttribute> attributes{
      {"vendor.experimental", Bytes("1")}};

  RestoreGenericAttributes(handlers, unknown_types, "/a", attributes, errmsg);
  RestoreGenericAttributes(handlers, unknown_types, "/b", attributes, errmsg);

  EXPECT_EQ(warned.size(), 1u);
}

TEST_F(GenericAttribs, failures_are_collected_and_processing_continues)
{
  std::string errmsg;
  std::vector<GenericAttribute> attributes{{"test.fail", Bytes("x")},
                                           {"test.ok", Bytes("2")},
                                           {"test.fail", Bytes("y")}};

  EXPECT_EQ(RestoreGenericAttributes(handlers, unknown_types, "/f",
                                     attributes, errmsg),
            BattrExitCode::kError);
  EXPECT_THAT(restored, testing::ElementsAre("/f=2"));
  EXPECT_EQ(errmsg,
            "Error restoring generic attribute test.fail for: /f : it broke; "
            "Error restoring generic attribute test.fail for: /f : it broke");
}

TEST_F(GenericAttribs, empty_list_is_success)
{
  std::string errmsg;

  EXPECT_EQ(
      RestoreGenericAttributes(handlers, unknown_types, "/f", {}, errmsg),
      BattrExitCode::kSuccess);
  EXPECT_TRUE(warned.empty());
}
