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


#include "lib/message.h"

#include <vector>

TEST(message, mmsg_formats_into_string)
{
  std::string buf{"old content"};

  EXPECT_EQ(Mmsg(buf, "%s=%d", "value", 42), 8);
  EXPECT_EQ(buf, "value=42");

  std::string big(1000, 'x');
  Mmsg(buf, "<%s>", big.c_str());
  EXPECT_EQ(buf.size(), 1002u);
}

TEST(message, basename_keeps_last_two_components)
{
  EXPECT_STREQ(get_basename("/src/core/src/findlib/xattr.cc"),
               "findlib/xattr.cc");
  EXPECT_STREQ(get_basename("xattr.cc"), "xattr.cc");
}

TEST(message, debug_messages_depend_on_level)
{
  int saved_level = debug_level;
  debug_level = 100;

  testing::internal::CaptureStdout();
  Dmsg1(100, "shown %d\n", 1);
  Dmsg1(101, "hidden %d\n", 2);
  Dfmt(50, "formatted {}", "text");
  std::string output = testing::internal::GetCapturedStdout();

  debug_level = saved_level;

  EXPECT_THAT(output, testing::HasSubstr("shown 1"));
  EXPECT_THAT(output, testing::Not(testing::HasSubstr("hidden")));
  EXPECT_THAT(output, testing::HasSubstr("formatted text"));
  EXPECT_THAT(output, testing::HasSubstr("message_test.cc:"));
}

TEST(message, print_messages_ignore_the_debug_level)
{
  int saved_level = debug_level;
  debug_level = 0;

  testing::internal::CaptureStdout();
  Pmsg1(0, "with location %d\n", 1);
  Pmsg1(-1, "without location %d\n", 2);
  std::string output = testing::internal::GetCapturedStdout();

  debug_level = saved_level;

  EXPECT_THAT(output, testing::HasSubstr("message_test.cc:"));
  EXPECT_THAT(output, testing::HasSubstr("with location 1"));
  EXPECT_THAT(output, testing::HasSubstr("\nwithout location 2\n"));
}

TEST(message, errors_go_to_the_registered_callback)
{
  std::vector<std::pair<int, std::string>> messages;
  RegisterMessageCallback([&messages](int type, const char* msg) {
    messages.emplace_back(type, msg);
  });

  Emsg1(M_ERROR, 0, "something failed: %s\n", "reason");
  Emsg0(M_WARNING, 0, "careful\n");

  RegisterMessageCallback(nullptr);

  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].first, M_ERROR);
  EXPECT_THAT(messages[0].second,
              testing::HasSubstr("something failed: reason"));
  EXPECT_EQ(messages[1].first, M_WARNING);
  EXPECT_THAT(messages[1].second, testing::HasSubstr("Warning: careful"));
}
