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


#include "findlib/xattr.h"
#include "lib/message.h"

#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace metakeep;
using testing::_;
using testing::DoAll;
using testing::Return;
using testing::SetArgReferee;

#ifdef __GNUC__
#  ifndef __clang__
#    pragma GCC diagnostic push
#    pragma GCC diagnostic ignored "-Wsuggest-override"
#  endif
#endif

class XattrOpsMock : public XattrOps {
 public:
  MOCK_METHOD2(List, OsResult(const std::string&, std::vector<std::string>&));
  MOCK_METHOD3(Get,
               OsResult(const std::string&,
                        const std::string&,
                        std::vector<char>&));
  MOCK_METHOD3(Set,
               OsResult(const std::string&,
                        const std::string&,
                        const std::vector<char>&));
};

#ifdef __GNUC__
#  ifndef __clang__
#    pragma GCC diagnostic pop
#  endif
#endif

namespace {
std::vector<char> Bytes(const std::string& s)
{
  return std::vector<char>(s.begin(), s.end());
}

class TemporaryFile {
 public:
  explicit TemporaryFile(const char* tag)
  {
    path_ = testing::TempDir() + "metakeep_" + tag + "_"
            + std::to_string(getpid());
    std::ofstream out(path_);
    out << "data";
  }
  ~TemporaryFile() { remove(path_.c_str()); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};
}  // namespace

TEST(xattr, not_supported_enumeration_is_empty_result)
{
  XattrOpsMock ops;
  std::vector<ExtendedAttribute> attrs;
  std::string errmsg;

  EXPECT_CALL(ops, List("f", _))
      .WillOnce(Return(OsResultFromErrno(EOPNOTSUPP)));
  EXPECT_CALL(ops, Get(_, _, _)).Times(0);

  EXPECT_EQ(FillExtendedAttributes(ops, "f", attrs, errmsg),
            BattrExitCode::kSuccess);
  EXPECT_TRUE(attrs.empty());
  EXPECT_TRUE(errmsg.empty());
}

TEST(xattr, other_enumeration_failure_is_an_error)
{
  XattrOpsMock ops;
  std::vector<ExtendedAttribute> attrs;
  std::string errmsg;

  EXPECT_CALL(ops, List("f", _)).WillOnce(Return(OsResultFromErrno(EIO)));

  EXPECT_EQ(FillExtendedAttributes(ops, "f", attrs, errmsg),
            BattrExitCode::kError);
  EXPECT_THAT(errmsg, testing::HasSubstr("llistxattr error on file \"f\""));
}

TEST(xattr, failing_fetch_skips_only_that_attribute)
{
  XattrOpsMock ops;
  std::vector<ExtendedAttribute> attrs;
  std::string errmsg;
  std::vector<std::string> names{"user.a", "user.broken", "user.c"};

  EXPECT_CALL(ops, List("f", _))
      .WillOnce(DoAll(SetArgReferee<1>(names), Return(OsResult::Ok())));
  EXPECT_CALL(ops, Get("f", "user.a", _))
      .WillOnce(DoAll(SetArgReferee<2>(Bytes("1")), Return(OsResult::Ok())));
  EXPECT_CALL(ops, Get("f", "user.broken", _))
      .WillOnce(Return(OsResultFromErrno(EACCES)));
  EXPECT_CALL(ops, Get("f", "user.c", _))
      .WillOnce(DoAll(SetArgReferee<2>(Bytes("3")), Return(OsResult::Ok())));

  std::vector<std::pair<int, std::string>> messages;
  RegisterMessageCallback([&messages](int type, const char* msg) {
    messages.emplace_back(type, msg);
  });
  BattrExitCode retval = FillExtendedAttributes(ops, "f", attrs, errmsg);
  RegisterMessageCallback(nullptr);

  EXPECT_EQ(retval, BattrExitCode::kSuccess);
  EXPECT_EQ(attrs, (std::vector<ExtendedAttribute>{{"user.a", Bytes("1")},
                                                   {"user.c", Bytes("3")}}));
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].first, M_WARNING);
  EXPECT_THAT(messages[0].second, testing::HasSubstr(
                                      "can not obtain extended attribute "
                                      "user.broken"));
}

TEST(xattr, large_attribute_sets_are_captured_completely)
{
  XattrOpsMock ops;
  std::vector<ExtendedAttribute> attrs;
  std::string errmsg;
  std::vector<std::string> names;

  for (int i = 0; i < 17; i++) {
    names.push_back("user.v" + std::to_string(i));
  }

  EXPECT_CALL(ops, List("f", _))
      .WillOnce(DoAll(SetArgReferee<1>(names), Return(OsResult::Ok())));
  EXPECT_CALL(ops, Get("f", _, _))
      .Times(17)
      .WillRepeatedly(DoAll(SetArgReferee<2>(std::vector<char>(65000, 'x')),
                            Return(OsResult::Ok())));

  EXPECT_EQ(FillExtendedAttributes(ops, "f", attrs, errmsg),
            BattrExitCode::kSuccess);
  EXPECT_EQ(attrs.size(), 17u);
  EXPECT_TRUE(errmsg.empty());
}

TEST(xattr, restore_not_supported_is_a_noop)
{
  XattrOpsMock ops;
  std::string errmsg;

  EXPECT_CALL(ops, Set("f", "user.a", _))
      .WillOnce(Return(OsResultFromErrno(EOPNOTSUPP)));
  EXPECT_CALL(ops, Set("f", "user.b", _))
      .WillOnce(Return(OsResultFromErrno(EOPNOTSUPP)));

  EXPECT_EQ(RestoreExtendedAttributes(
                ops, "f", {{"user.a", Bytes("1")}, {"user.b", Bytes("2")}},
                errmsg),
            BattrExitCode::kSuccess);
}

TEST(xattr, restore_continues_after_unsupported_namespace)
{
  XattrOpsMock ops;
  XattrState state;
  std::string errmsg;

  EXPECT_CALL(ops, Set("f", "trusted.x", _))
      .WillOnce(Return(OsResultFromErrno(EOPNOTSUPP)));
  EXPECT_CALL(ops, Set("f", "user.foo", _)).WillOnce(Return(OsResult::Ok()));

  EXPECT_EQ(RestoreExtendedAttributes(
                ops, "f",
                {{"trusted.x", Bytes("1")}, {"user.foo", Bytes("bar")}},
                errmsg, &state),
            BattrExitCode::kSuccess);
  EXPECT_TRUE(state.flags & BXATTR_FLAG_RESTORE_NATIVE);
}

TEST(xattr, restore_disabled_when_nothing_could_be_set)
{
  XattrOpsMock ops;
  XattrState state;
  std::string errmsg;

  state.ChangeDevice(1);
  EXPECT_CALL(ops, Set("a", _, _))
      .Times(2)
      .WillRepeatedly(Return(OsResultFromErrno(EOPNOTSUPP)));

  EXPECT_EQ(RestoreExtendedAttributes(
                ops, "a", {{"user.a", Bytes("1")}, {"user.b", Bytes("2")}},
                errmsg, &state),
            BattrExitCode::kSuccess);
  EXPECT_FALSE(state.flags & BXATTR_FLAG_RESTORE_NATIVE);

  EXPECT_EQ(RestoreExtendedAttributes(ops, "b", {{"user.c", Bytes("3")}},
                                      errmsg, &state),
            BattrExitCode::kSuccess);
}

TEST(xattr, restore_stops_at_first_failure)
{
  XattrOpsMock ops;
  std::string errmsg;

  EXPECT_CALL(ops, Set("f", "user.a", _))
      .WillOnce(Return(OsResultFromErrno(EPERM)));
  EXPECT_CALL(ops, Set("f", "user.b", _)).Times(0);

  EXPECT_EQ(RestoreExtendedAttributes(
                ops, "f", {{"user.a", Bytes("1")}, {"user.b", Bytes("2")}},
                errmsg),
            BattrExitCode::kError);
  EXPECT_THAT(errmsg, testing::HasSubstr("lsetxattr error on file \"f\""));
}

TEST(xattr, unsupported_filesystem_is_remembered_until_device_changes)
{
  XattrOpsMock ops;
  XattrState state;
  std::vector<ExtendedAttribute> attrs;
  std::string errmsg;

  state.ChangeDevice(1);
  EXPECT_CALL(ops, List(_, _))
      .Times(2)
      .WillRepeatedly(Return(OsResultFromErrno(EOPNOTSUPP)));

  EXPECT_EQ(FillExtendedAttributes(ops, "a", attrs, errmsg, &state),
            BattrExitCode::kSuccess);
  EXPECT_EQ(FillExtendedAttributes(ops, "b", attrs, errmsg, &state),
            BattrExitCode::kSuccess);
  EXPECT_FALSE(state.flags & BXATTR_FLAG_SAVE_NATIVE);

  state.ChangeDevice(2);
  EXPECT_TRUE(state.flags & BXATTR_FLAG_SAVE_NATIVE);
  EXPECT_EQ(FillExtendedAttributes(ops, "c", attrs, errmsg, &state),
            BattrExitCode::kSuccess);
}

TEST(xattr, skipped_names)
{
  EXPECT_TRUE(XattrNameIsSkipped(""));
  EXPECT_FALSE(XattrNameIsSkipped("user.foo"));
#if defined(HAVE_LINUX_OS)
  EXPECT_TRUE(XattrNameIsSkipped("ceph.dir.entries"));
#endif
}

#if defined(HAVE_XATTR) || defined(HAVE_EXTATTR)
TEST(xattr, user_attribute_round_trip_on_the_filesystem)
{
  TemporaryFile source("xattr_src");
  TemporaryFile target("xattr_dst");
  XattrOps& ops = SystemXattrOps();
  std::string errmsg;

  OsResult result = ops.Set(source.path(), "user.foo", Bytes("bar"));
  if (result.code == OsResultCode::kNotSupported
      || result.code == OsResultCode::kAccessDenied) {
    GTEST_SKIP() << "user xattrs not supported in " << testing::TempDir();
  }
  ASSERT_TRUE(result.ok()) << result.message;

  std::vector<ExtendedAttribute> captured;
  ASSERT_EQ(FillExtendedAttributes(ops, source.path(), captured, errmsg),
            BattrExitCode::kSuccess)
      << errmsg;
  ASSERT_EQ(RestoreExtendedAttributes(ops, target.path(), captured, errmsg),
            BattrExitCode::kSuccess)
      << errmsg;

  std::vector<ExtendedAttribute> recaptured;
  ASSERT_EQ(FillExtendedAttributes(ops, target.path(), recaptured, errmsg),
            BattrExitCode::kSuccess)
      << errmsg;

  std::vector<ExtendedAttribute> user_attrs;
  for (const auto& attr : recaptured) {
    if (attr.name.find("foo") != std::string::npos) {
      user_attrs.push_back(attr);
    }
  }
  ASSERT_EQ(user_attrs.size(), 1u);
  EXPECT_EQ(user_attrs[0].value, Bytes("bar"));
}
#endif
