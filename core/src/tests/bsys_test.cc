/*
   BAREOS® - Backup Archiving REcovery Open Sourced

   Copyright (C) 2019-2026 Bareos GmbH & Co. KG

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


#include "lib/bsys.h"

TEST(bstrncpy, src_NULL)
{
  char dest[] = "DESTDESTDEST";
  char* src = NULL;

  bstrncpy(dest, src, 10);

  EXPECT_STREQ(dest, "");
}

TEST(bstrncpy, truncates)
{
  char dest[] = "DESTDESTDEST";
  char src[] = "SRCSRC";

  bstrncpy(dest, src, 4);

  EXPECT_STREQ(dest, "SRC");
}

TEST(bstrncpy, maxlen0)
{
  char dest[] = "DESTDESTDEST";
  char src[] = "SRCSRC";

  bstrncpy(dest, src, 0);

  EXPECT_STREQ(dest, "");
}

TEST(JoinStrings, skips_empty_parts)
{
  EXPECT_EQ(JoinStrings({"a", "", "b"}, "; "), "a; b");
  EXPECT_EQ(JoinStrings({}, "; "), "");
  EXPECT_EQ(JoinStrings({"only"}, ", "), "only");
}

TEST(PrintablePreview, replaces_binary_bytes)
{
  std::vector<char> value{'a', 0x00, 'b', '\n'};

  EXPECT_EQ(PrintablePreview(value, 10), "a.b.");
}

TEST(HexPreview, lower_case_and_truncated)
{
  std::vector<char> value{0x0a, static_cast<char>(0xff), 0x10};

  EXPECT_EQ(HexPreview(value, 10), "0a ff 10");
  EXPECT_EQ(HexPreview(value, 2), "0a ff ...");
}
